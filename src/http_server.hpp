#pragma once

#include "log_query.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace logwindow {

// Bridges HTTP requests onto LogQuery. Every route calls one query
// operation and serializes the result as JSON or server-sent events.
class HttpServer {
public:
    HttpServer(const LogQuery& query, uint16_t port = 5000);
    ~HttpServer();

    void start();
    void stop();
    bool is_running() const { return running_; }
    uint16_t port() const { return port_; }

private:
    void setup_routes();

    // Runs a handler, mapping InvalidRequest to 400 and other errors to 500
    template <typename Handler>
    void respond(httplib::Response& res, Handler&& handler);

    static QueryParams to_params(const httplib::Request& req);

    const LogQuery& query_;
    std::unique_ptr<httplib::Server> server_;
    uint16_t port_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> stream_counter_{0};
};

} // namespace logwindow
