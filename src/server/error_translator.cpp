#include "server/error_translator.hpp"
#include "core/error.hpp"

namespace pgsession {

ErrorFields ErrorTranslator::to_fields(
    std::string_view message, const std::optional<std::string>& code) {
    ErrorFields fields;
    fields.severity = SEVERITY;
    fields.code = (code && !code->empty()) ? *code : wire::SQLSTATE_INTERNAL_ERROR;
    fields.message = message.empty() ? "engine execution failed" : std::string(message);
    return fields;
}

ErrorFields ErrorTranslator::to_fields(const SessionError& error) {
    return to_fields(error.what(), error.code());
}

std::vector<uint8_t> ErrorTranslator::to_frames(const ErrorFields& fields) {
    auto out = WireWriter::error_response(
        fields.severity, fields.code, fields.message, fields.detail);
    const auto rfq = WireWriter::ready_for_query(wire::TX_ERROR);
    out.insert(out.end(), rfq.begin(), rfq.end());
    return out;
}

} // namespace pgsession
