#include "http_server.hpp"
#include "engine_log.hpp"
#include <chrono>
#include <sstream>

namespace logwindow {

namespace {

void set_json(httplib::Response& res, const nlohmann::json& body) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

} // namespace

HttpServer::HttpServer(const LogQuery& query, uint16_t port)
    : query_(query)
    , server_(std::make_unique<httplib::Server>())
    , port_(port)
{
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

QueryParams HttpServer::to_params(const httplib::Request& req) {
    return QueryParams(req.params.begin(), req.params.end());
}

template <typename Handler>
void HttpServer::respond(httplib::Response& res, Handler&& handler) {
    try {
        set_json(res, handler());
    } catch (const InvalidRequest& e) {
        res.status = 400;
        set_json(res, {{"error", e.what()}});
    } catch (const std::exception& e) {
        EngineLog::error("HTTP", std::string("Request failed: ") + e.what());
        res.status = 500;
        set_json(res, {{"error", e.what()}});
    }
}

void HttpServer::setup_routes() {
    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        std::stringstream msg;
        msg << res.status << " " << req.method << " " << req.path << " from " << req.remote_addr;
        EngineLog::info("HTTP", msg.str());
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    server_->Get("/logger/api/logs", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&]() {
            return query_.get_logs(parse_logs_request(to_params(req))).to_json();
        });
    });

    server_->Get("/logger/api/modules", [this](const httplib::Request&, httplib::Response& res) {
        respond(res, [&]() {
            return nlohmann::json{{"hierarchy", hierarchy_to_json(query_.module_hierarchy())}};
        });
    });

    server_->Get("/logger/api/stats", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&]() {
            return query_.stats(parse_filter(to_params(req))).to_json();
        });
    });

    server_->Get("/logger/api/updates", [this](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&]() {
            auto last_id = parse_optional_id(to_params(req), "last_log_id");
            return query_.changes_since(last_id.value_or(kNoEntry)).to_json();
        });
    });

    server_->Get("/logger/api/stream", [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<EntryId> last_id;
        try {
            last_id = parse_optional_id(to_params(req), "last_log_id");
        } catch (const InvalidRequest& e) {
            res.status = 400;
            set_json(res, {{"error", e.what()}});
            return;
        }

        std::string stream_id = "stream_" + std::to_string(++stream_counter_);
        EngineLog::info("HTTP", "Stream opened: " + stream_id + " from " + req.remote_addr);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_header("Access-Control-Allow-Origin", "*");

        auto stream = std::make_shared<LogStream>(query_.open_stream(last_id));

        res.set_chunked_content_provider(
            "text/event-stream",
            [this, stream, stream_id](size_t, httplib::DataSink& sink) -> bool {
                stream->run(
                    [&sink](const StreamEvent& event) {
                        std::string frame = event.to_sse();
                        return sink.is_writable() && sink.write(frame.data(), frame.size());
                    },
                    [this]() { return !running_; });

                EngineLog::info("HTTP", "Stream closed: " + stream_id);
                return false;
            });
    });
}

void HttpServer::start() {
    if (running_) return;
    running_ = true;

    thread_ = std::thread([this]() {
        EngineLog::info("HTTP", "Server starting on port " + std::to_string(port_));
        if (!server_->listen("0.0.0.0", port_)) {
            EngineLog::error("HTTP", "Failed to listen on port " + std::to_string(port_));
            running_ = false;
        }
    });

    // Give server time to start
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

void HttpServer::stop() {
    if (!running_ && !thread_.joinable()) return;
    running_ = false;
    server_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace logwindow
