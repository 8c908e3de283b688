#include "server.hpp"

#include "logging/logger.hpp"

namespace cloudmock {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
// Every path goes to the Router, which owns all routing decisions
constexpr const char *kAnyPath = R"(.*)";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const Router &router) : config_(config), router_(router) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // Handlers convert their own failures into Replies; anything escaping
    // them still gets the CloudAPI 500 envelope
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown exception";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
        } catch (...) {
            msg = "Unknown exception";
        }
        LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << msg);
        write_reply(internal_error(msg), res);
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind.c_str());
        if (port_ <= 0) {
            error = "Failed to bind to " + config_.bind + " on an ephemeral port";
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    auto handler = [this](const httplib::Request &req, httplib::Response &res) { handle_request(req, res); };

    // GET handlers also serve HEAD
    server_->Get(kAnyPath, handler);
    server_->Post(kAnyPath, handler);
    server_->Put(kAnyPath, handler);
    server_->Delete(kAnyPath, handler);
    server_->Patch(kAnyPath, handler);
    server_->Options(kAnyPath, handler);
}

void HttpServer::handle_request(const httplib::Request &req, httplib::Response &res) const {
    const Reply reply = router_.dispatch(req);
    write_reply(reply, res);
    LOG_DEBUG("[HTTP] " << req.method << " " << req.target << " -> " << reply.status);
}

void write_reply(const Reply &reply, httplib::Response &res) {
    res.status = reply.status;
    res.body = reply.body;
    for (const auto &[name, value] : reply.wire_headers()) {
        // cpp-httplib frames non-empty bodies with its own Content-Length;
        // a second one here would be emitted twice
        if (name == kHeaderContentLength && !reply.body.empty()) {
            continue;
        }
        res.headers.erase(name);
        res.set_header(name, value);
    }
}

}  // namespace http
}  // namespace cloudmock
