#pragma once

#include "supervisor/backend.hpp"
#include "engine/embedded_engine.hpp"
#include "server/gateway_server.hpp"

#include <functional>
#include <memory>

namespace pgsession {

// Opens the engine store at a location; throws SessionError(INITIALIZATION_FAILURE)
using EngineStarter = std::function<std::shared_ptr<IEmbeddedEngine>(const std::string&)>;

// Embedded engine behind a GatewayServer
class EmbeddedBackend : public IBackend {
public:
    EmbeddedBackend(SessionConfig config, EngineStarter starter, GatewayOptions options);
    ~EmbeddedBackend() override;

    [[nodiscard]] Endpoint start() override;
    void stop() override;
    [[nodiscard]] BackendMode mode() const override { return BackendMode::EMBEDDED; }

    [[nodiscard]] GatewayServer* gateway() const { return gateway_.get(); }
    [[nodiscard]] std::shared_ptr<IEmbeddedEngine> engine() const { return engine_; }

private:
    SessionConfig config_;
    EngineStarter starter_;
    GatewayOptions options_;

    std::shared_ptr<IEmbeddedEngine> engine_;
    std::unique_ptr<GatewayServer> gateway_;
};

} // namespace pgsession
