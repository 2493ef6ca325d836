// Vibium session runner
// Launches (or attaches to) a clicker server, optionally sends one command

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "session/session.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: vibium-session [OPTIONS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH     Path to YAML config file\n";
    std::cerr << "  --url=WS_URL      Attach to a running server instead of launching clicker\n";
    std::cerr << "  --send=METHOD     Send one command, print its result and exit\n";
    std::cerr << "  --params=JSON     Params for --send (default: {})\n";
    std::cerr << "  --help, -h        Show this help\n";
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path;
    std::string url;
    std::string method;
    std::string params_text = "{}";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg.rfind("--url=", 0) == 0) {
            url = arg.substr(6);
        } else if (arg.rfind("--send=", 0) == 0) {
            method = arg.substr(7);
        } else if (arg.rfind("--params=", 0) == 0) {
            params_text = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    vibium::runtime::SessionConfig config;
    std::string error;

    if (!config_path.empty()) {
        if (!std::filesystem::exists(config_path)) {
            // Using cerr here as logger might not be configured yet
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            return 1;
        }
        LOG_INFO("Loading config: " << config_path);
        if (!vibium::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    if (!url.empty()) {
        config.connection.url = url;
    }

    if (!vibium::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid config: " << error);
        return 1;
    }

    vibium::logging::Logger::set_level(vibium::logging::string_to_level(config.logging.level));

    nlohmann::json params = nlohmann::json::parse(params_text, nullptr, false);
    if (params.is_discarded() || !params.is_object()) {
        LOG_ERROR("--params must be a JSON object");
        return 1;
    }

    vibium::runtime::SignalHandler::install();

    std::unique_ptr<vibium::session::Session> session;
    try {
        vibium::session::LaunchOptions options = vibium::runtime::make_launch_options(config);
        if (config.connection.url.empty()) {
            // Launched from main thread, which outlives the session
            session = vibium::session::Session::launch(options);
        } else {
            session = vibium::session::Session::connect(config.connection.url, options.client);
        }
    } catch (const vibium::ResolutionError &e) {
        LOG_ERROR("Session start failed: " << e.what());
        if (!e.remediation().empty()) {
            std::cerr << e.remediation() << "\n";
        }
        return 1;
    } catch (const vibium::VibiumError &e) {
        LOG_ERROR("Session start failed [" << vibium::error_kind_to_string(e.kind()) << "]: " << e.what());
        return 1;
    }

    int exit_code = 0;
    if (!method.empty()) {
        try {
            nlohmann::json result = session->client().send(method, params);
            std::cout << result.dump(2) << std::endl;
        } catch (const vibium::ProtocolError &e) {
            LOG_ERROR(method << " failed: " << e.code() << ": " << e.remote_message());
            exit_code = 1;
        } catch (const vibium::VibiumError &e) {
            LOG_ERROR(method << " failed [" << vibium::error_kind_to_string(e.kind()) << "]: " << e.what());
            exit_code = 1;
        }
    } else {
        session->client().on_event([](const vibium::protocol::Event &event) {
            std::cout << nlohmann::json{{"method", event.method}, {"params", event.params}}.dump() << std::endl;
        });

        LOG_INFO("Session ready on " << session->url() << " (Ctrl+C to stop)");
        while (!vibium::runtime::SignalHandler::is_shutdown_requested()) {
            if (!session->is_connected()) {
                LOG_ERROR("Connection lost");
                exit_code = 1;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    session->close();
    LOG_INFO("Shutdown complete");
    return exit_code;
}
