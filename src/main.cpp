#include "config.h"
#include "gate_service.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace gate_sentry {

static std::atomic<bool> g_interrupted{false};
static std::mutex g_console_mutex;

// Closing stdin ends the blocking getline; main() then shuts the service down
void signal_handler(int signal) {
    (void)signal;
    g_interrupted = true;
    close(STDIN_FILENO);
}

static void print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << line << std::endl;
}

static void print_help() {
    print_line("Commands:\n"
               "  /profile        show the current visitor profile\n"
               "  /image <path>   submit a camera image for analysis\n"
               "  /logs           show the threat log for this session\n"
               "  /new            end this session and start another\n"
               "  /health         service status\n"
               "  /quit           exit");
}

static Result<std::string> read_file_base64(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("Cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return utils::base64_encode(buffer.str());
}

static int console_loop(GateService& service) {
    auto session = service.start_session();
    if (!session) {
        Logger::error("Failed to start session: " + session.error().to_string());
        return 1;
    }
    std::string session_id = session.value();
    print_line("Session " + session_id + " started. Type /help for commands.");

    std::string line;
    while (!g_interrupted && std::getline(std::cin, line)) {
        if (g_interrupted) break;
        std::string input = utils::trim_copy(line);

        if (input == "/quit") {
            break;
        } else if (input == "/help") {
            print_help();
        } else if (input == "/profile") {
            auto snapshot = service.profile_snapshot(session_id);
            print_line(snapshot ? snapshot.value().dump(2) : snapshot.error().to_string());
        } else if (input == "/logs") {
            auto logs = service.threat_logs(session_id);
            if (!logs) {
                print_line(logs.error().to_string());
            } else {
                print_line(std::to_string(logs.value().size()) + " log entries");
                for (const auto& entry : logs.value()) {
                    print_line(entry.dump());
                }
            }
        } else if (input == "/health") {
            print_line(service.health().dump());
        } else if (input == "/new") {
            auto ended = service.end_session(session_id);
            if (!ended) {
                Logger::warn(ended.error().to_string());
            }
            session = service.start_session();
            if (!session) {
                Logger::error("Failed to start session: " + session.error().to_string());
                return 1;
            }
            session_id = session.value();
            print_line("Session " + session_id + " started.");
        } else if (utils::istarts_with(input, "/image ")) {
            auto encoded = read_file_base64(utils::trim_copy(input.substr(7)));
            if (!encoded) {
                print_line(encoded.error().to_string());
                continue;
            }
            auto frame = service.upload_image(session_id, encoded.value());
            print_line(frame ? "Queued frame " + std::to_string(frame.value()) : frame.error().to_string());
        } else {
            auto turn = service.send_message(session_id, input);
            if (!turn) {
                if (turn.error().type == ErrorType::SessionNotFound) {
                    print_line(turn.error().to_string());
                } else {
                    // Session was reset underneath the turn; the reset already prompted the visitor
                    Logger::warn(turn.error().to_string());
                }
                continue;
            }
            const TurnResult& result = turn.value();
            print_line("Agent: " + result.response);
            if (result.session_complete) {
                print_line(std::string("[decision] ") + decision_name(result.decision) +
                           " (confidence " + std::to_string(result.confidence) + ")");
            }
        }
    }
    return 0;
}

} // namespace gate_sentry

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config/config.json";
    gate_sentry::Config config = gate_sentry::Config::load_from_file(config_path);

    gate_sentry::Logger::initialize(gate_sentry::parse_log_level(config.logging.level), config.logging.file);

    std::string problem = config.validate();
    if (!problem.empty()) {
        gate_sentry::Logger::error("Invalid config " + config_path + ": " + problem);
        gate_sentry::Logger::shutdown();
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    gate_sentry::GateService service(config);
    if (!service.initialize()) {
        curl_global_cleanup();
        gate_sentry::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, gate_sentry::signal_handler);
    std::signal(SIGTERM, gate_sentry::signal_handler);

    service.set_event_sink([](const gate_sentry::GateEvent& event) {
        gate_sentry::print_line(std::string("[") + gate_sentry::event_type_name(event.type) + "] " + event.message);
    });

    std::thread event_loop([&service]() {
        gate_sentry::set_thread_log_tag("events");
        service.run();
    });

    int result = gate_sentry::console_loop(service);
    if (gate_sentry::g_interrupted) {
        gate_sentry::Logger::info("Interrupted, shutting down");
    }

    service.shutdown();
    if (event_loop.joinable()) {
        event_loop.join();
    }

    curl_global_cleanup();
    gate_sentry::Logger::shutdown();
    return result;
}
