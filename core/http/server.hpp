#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>

#include "reply.hpp"
#include "router.hpp"
#include "runtime/config.hpp"

namespace cloudmock {
namespace http {

/**
 * @brief HTTP transport for the CloudAPI double
 *
 * Every request, whatever its method or path, is handed to the Router; the
 * resulting Reply is written back verbatim. Routing decisions (404/400/405)
 * are made by the Router and handlers, never by cpp-httplib.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - The Router is immutable; the store does its own locking
 *
 * Lifecycle:
 * - start() binds to the configured port and spawns the server thread
 * - stop() signals shutdown and joins the server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, const Router &router);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Start HTTP server
     *
     * Port 0 binds an ephemeral port; port() reports the one chosen.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server. Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    int port() const { return port_; }

private:
    void setup_routes();
    void handle_request(const httplib::Request &req, httplib::Response &res) const;

    runtime::HttpConfig config_;
    const Router &router_;
    int port_ = 0;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

// Copy a Reply onto an httplib response: status, Reply::wire_headers(), body
void write_reply(const Reply &reply, httplib::Response &res);

}  // namespace http
}  // namespace cloudmock
