#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace vibium {
namespace runtime {

namespace {

constexpr int kMinTimeoutMs = 100;

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &known) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool found = false;
        for (const auto &valid_key : known) {
            if (key == valid_key) {
                found = true;
                break;
            }
        }
        if (!found) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

}  // namespace

bool validate_config(const SessionConfig &config, std::string &error) {
    // Validate launch settings
    if (config.launch.port < 0 || config.launch.port > 65535) {
        error = "launch.port must be between 0 and 65535";
        return false;
    }
    if (config.launch.start_timeout_ms < kMinTimeoutMs) {
        error = "launch.start_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.launch.stop_timeout_ms < kMinTimeoutMs) {
        error = "launch.stop_timeout_ms must be >= 100ms";
        return false;
    }

    // Validate connection settings
    if (!config.connection.url.empty() && config.connection.url.rfind("ws://", 0) != 0) {
        error = "connection.url must start with ws://";
        return false;
    }
    if (config.connection.connect_timeout_ms < kMinTimeoutMs) {
        error = "connection.connect_timeout_ms must be >= 100ms";
        return false;
    }

    // Validate protocol settings
    if (config.protocol.command_timeout_ms < kMinTimeoutMs) {
        error = "protocol.command_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.protocol.event_queue_size < 1) {
        error = "protocol.event_queue_size must be at least 1";
        return false;
    }

    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, SessionConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (yaml.IsNull()) {
            LOG_WARN("[Config] " << config_path << " is empty, using defaults");
            return true;
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"launch", "connection", "protocol", "logging"});

        // Load launch config
        if (const YAML::Node launch = yaml["launch"]) {
            warn_unknown_keys(launch, "launch",
                              {"headless", "port", "executable_path", "start_timeout_ms", "stop_timeout_ms"});
            if (launch["headless"]) {
                config.launch.headless = launch["headless"].as<bool>();
            }
            if (launch["port"]) {
                config.launch.port = launch["port"].as<int>();
            }
            if (launch["executable_path"]) {
                config.launch.executable_path = launch["executable_path"].as<std::string>();
            }
            if (launch["start_timeout_ms"]) {
                config.launch.start_timeout_ms = launch["start_timeout_ms"].as<int>();
            }
            if (launch["stop_timeout_ms"]) {
                config.launch.stop_timeout_ms = launch["stop_timeout_ms"].as<int>();
            }
        }

        // Load connection config
        if (const YAML::Node connection = yaml["connection"]) {
            warn_unknown_keys(connection, "connection", {"url", "connect_timeout_ms"});
            if (connection["url"]) {
                config.connection.url = connection["url"].as<std::string>();
            }
            if (connection["connect_timeout_ms"]) {
                config.connection.connect_timeout_ms = connection["connect_timeout_ms"].as<int>();
            }
        }

        // Load protocol config
        if (const YAML::Node protocol = yaml["protocol"]) {
            warn_unknown_keys(protocol, "protocol", {"command_timeout_ms", "event_queue_size"});
            if (protocol["command_timeout_ms"]) {
                config.protocol.command_timeout_ms = protocol["command_timeout_ms"].as<int>();
            }
            if (protocol["event_queue_size"]) {
                int size = protocol["event_queue_size"].as<int>();
                if (size < 1) {
                    error = "protocol.event_queue_size must be at least 1";
                    return false;
                }
                config.protocol.event_queue_size = static_cast<size_t>(size);
            }
        }

        // Load logging config
        if (const YAML::Node logging_node = yaml["logging"]) {
            warn_unknown_keys(logging_node, "logging", {"level"});
            if (logging_node["level"]) {
                config.logging.level = logging_node["level"].as<std::string>();
            }
        }

        std::stringstream launch_msg;
        if (config.connection.url.empty()) {
            launch_msg << "[Config] Launch: " << (config.launch.headless ? "headless" : "headed") << ", port "
                       << (config.launch.port > 0 ? std::to_string(config.launch.port) : "auto") << ", binary "
                       << (config.launch.executable_path.empty() ? "resolved" : config.launch.executable_path);
        } else {
            launch_msg << "[Config] Attach: " << config.connection.url;
        }
        LOG_INFO(launch_msg.str());
        LOG_INFO("[Config] Command timeout: " << config.protocol.command_timeout_ms << "ms");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

session::LaunchOptions make_launch_options(const SessionConfig &config) {
    session::LaunchOptions options;
    options.process.headless = config.launch.headless;
    if (config.launch.port > 0) {
        options.process.port = config.launch.port;
    }
    options.process.executable_path = config.launch.executable_path;
    options.process.start_timeout_ms = config.launch.start_timeout_ms;
    options.process.stop_timeout_ms = config.launch.stop_timeout_ms;

    options.client.command_timeout_ms = config.protocol.command_timeout_ms;
    options.client.event_queue_size = config.protocol.event_queue_size;
    options.client.connect.connect_timeout_ms = config.connection.connect_timeout_ms;
    return options;
}

}  // namespace runtime
}  // namespace vibium
