#pragma once

#include "server/wire_protocol.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pgsession {

class SessionError;

// Maps an engine failure to the fields of a wire ErrorResponse.
// No socket involved: the gateway only writes the resulting bytes.
class ErrorTranslator {
public:
    static constexpr const char* SEVERITY = "ERROR";

    [[nodiscard]] static ErrorFields to_fields(
        std::string_view message, const std::optional<std::string>& code);

    [[nodiscard]] static ErrorFields to_fields(const SessionError& error);

    // ErrorResponse followed by ReadyForQuery('E')
    [[nodiscard]] static std::vector<uint8_t> to_frames(const ErrorFields& fields);
};

} // namespace pgsession
