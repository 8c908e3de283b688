#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace cloudmock {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing");

    store_ = std::make_unique<store::MemoryStore>();
    if (!seed_store(error)) {
        return false;
    }

    api_ = std::make_unique<http::CloudApi>(config_.cloudapi.account, *store_);
    router_ = std::make_unique<http::Router>(api_->build_router());

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *router_);
    if (!http_server_->start(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::seed_store(std::string &error) {
    for (const auto &image : config_.seed.images) {
        store_->add_image(image);
    }
    for (const auto &pkg : config_.seed.packages) {
        store_->add_package(pkg);
    }
    for (const auto &network : config_.seed.networks) {
        store_->add_network(network);
    }
    for (const auto &key : config_.seed.keys) {
        model::Key created;
        if (!store_->create_key(key.name, key.key, created, error)) {
            error = "Failed to seed key '" + key.name + "': " + error;
            return false;
        }
    }

    LOG_INFO("[Runtime] Store seeded: " << config_.seed.images.size() << " image(s), "
                                        << config_.seed.packages.size() << " package(s), "
                                        << config_.seed.networks.size() << " network(s), "
                                        << config_.seed.keys.size() << " key(s)");
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Serving account '" << config_.cloudapi.account << "' on port " << http_port());
    LOG_INFO("[Runtime] Press Ctrl+C to exit");
    running_ = true;

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Shutdown requested ("
                     << SignalHandler::signal_name(SignalHandler::received_signal()) << ")");
            running_ = false;
        }
    }

    shutdown();
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }
}

}  // namespace runtime
}  // namespace cloudmock
