#include "supervisor/embedded_backend.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgsession {

EmbeddedBackend::EmbeddedBackend(SessionConfig config, EngineStarter starter, GatewayOptions options)
    : config_(std::move(config)),
      starter_(std::move(starter)),
      options_(std::move(options)) {}

EmbeddedBackend::~EmbeddedBackend() {
    stop();
}

Endpoint EmbeddedBackend::start() {
    engine_ = starter_(config_.storage_location());

    gateway_ = std::make_unique<GatewayServer>(engine_, options_, config_.host(), config_.port());
    gateway_->start();

    engine_->await_ready();
    utils::log::info(std::format("Embedded: {} ready on {}:{}",
        config_.storage_location(), config_.host(), gateway_->port()));

    return Endpoint{BackendMode::EMBEDDED, config_.host(), gateway_->port(),
                    config_.db_name(), config_.storage_location()};
}

void EmbeddedBackend::stop() {
    if (gateway_) {
        gateway_->stop();
    }
    if (engine_) {
        engine_->close();
    }
}

} // namespace pgsession
