#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/cloud_api.hpp"
#include "http/router.hpp"
#include "http/server.hpp"
#include "store/memory_store.hpp"

namespace cloudmock {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Build store, seed it, build routes, start HTTP
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or SIGINT/SIGTERM
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    store::MemoryStore &get_store() { return *store_; }
    int http_port() const { return http_server_ ? http_server_->port() : 0; }

private:
    bool seed_store(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<store::MemoryStore> store_;
    std::unique_ptr<http::CloudApi> api_;
    std::unique_ptr<http::Router> router_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace cloudmock
