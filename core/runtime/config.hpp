#pragma once

#include <cstddef>
#include <string>

#include "session/session.hpp"

namespace vibium {
namespace runtime {

// Launch section (launch: in YAML)
struct LaunchConfig {
    bool headless = true;
    int port = 0;                 // 0 = clicker picks a free port
    std::string executable_path;  // Empty = BinaryResolver search
    int start_timeout_ms = 10000;
    int stop_timeout_ms = 3000;
};

struct ConnectionConfig {
    std::string url;  // Non-empty = attach to a running server instead of launching
    int connect_timeout_ms = 10000;
};

struct ProtocolConfig {
    int command_timeout_ms = 30000;
    size_t event_queue_size = 1000;
};

struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error, none
};

struct SessionConfig {
    LaunchConfig launch;
    ConnectionConfig connection;
    ProtocolConfig protocol;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, SessionConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const SessionConfig &config, std::string &error);

// Options for Session::launch() / Session::connect() derived from config
session::LaunchOptions make_launch_options(const SessionConfig &config);

}  // namespace runtime
}  // namespace vibium
