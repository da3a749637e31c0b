#include "engine_config.hpp"
#include "engine_log.hpp"
#include "entry_cache.hpp"
#include "file_tailer.hpp"
#include "http_server.hpp"
#include "log_query.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <string>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <chrono>

using namespace logwindow;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

void print_usage(const char* program) {
    std::cout << "logwindow - follows a JSON-lines log file and serves a window of recent entries\n\n";
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -m, --monitoring-file PATH  Log file to follow (default: application.log)\n";
    std::cout << "  -c, --cache-limit N         Entries kept in memory, 0 for no limit (default: 10000)\n";
    std::cout << "  -p, --port PORT             HTTP port (default: 5000)\n";
    std::cout << "      --min-poll-ms N         Fastest poll interval (default: 100)\n";
    std::cout << "      --max-poll-ms N         Slowest poll interval when idle (default: 10000)\n";
    std::cout << "  -v, --verbose               Debug output\n";
    std::cout << "  -h, --help                  Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " -m /var/log/app.jsonl -c 5000 -p 8080\n";
}

long long parse_number(const std::string& option, const std::string& value) {
    try {
        size_t pos = 0;
        long long number = std::stoll(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return number;
    } catch (const std::exception&) {
        throw std::invalid_argument("Option " + option + " expects a number, got '" + value + "'");
    }
}

int main(int argc, char* argv[]) {
    EngineConfig config;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            else if ((arg == "--monitoring-file" || arg == "-m") && has_value) {
                config.tailer.path = argv[++i];
            }
            else if ((arg == "--cache-limit" || arg == "-c") && has_value) {
                config.capacity = parse_number(arg, argv[++i]);
            }
            else if ((arg == "--port" || arg == "-p") && has_value) {
                long long port = parse_number(arg, argv[++i]);
                if (port <= 0 || port > 65535) {
                    throw std::invalid_argument("Port out of range: " + std::to_string(port));
                }
                config.http_port = static_cast<uint16_t>(port);
            }
            else if (arg == "--min-poll-ms" && has_value) {
                config.tailer.min_poll_interval = std::chrono::milliseconds(parse_number(arg, argv[++i]));
            }
            else if (arg == "--max-poll-ms" && has_value) {
                config.tailer.max_poll_interval = std::chrono::milliseconds(parse_number(arg, argv[++i]));
            }
            else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (config.verbose) {
        EngineLog::set_level(LogLevel::Debug);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        EngineLog::info("Main", "Following " + config.tailer.path + " (cache limit " +
                        std::to_string(config.capacity) + ")");

        EntryCache cache(static_cast<size_t>(config.capacity), config.schema);
        FileTailer tailer(cache, config.tailer);
        LogQuery query(cache, config.stream);
        HttpServer http(query, config.http_port);

        tailer.start();
        http.start();

        EngineLog::info("Main", "Viewer API: http://localhost:" + std::to_string(config.http_port) +
                        "/logger/api/logs");

        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        EngineLog::info("Main", "Shutting down...");
        http.stop();
        tailer.stop();

        EngineLog::info("Main", "Shutdown complete. Resident entries: " + std::to_string(cache.size()));

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
