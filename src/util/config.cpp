#include "metacache/util/config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace metacache::util {

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parse_bool(const std::string& s) {
    return s == "true" || s == "1" || s == "on";
}

uint16_t parse_port(const std::string& s) {
    int port = std::stoi(s);
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("port out of range: " + s);
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = parse_port(value);
        } else if (key == "timeout_seconds") {
            config.timeout_seconds = std::stoi(value);
        } else if (key == "quiet") {
            config.quiet = parse_bool(value);
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        } else {
            LOG_WARN("config: ignoring unknown key '" + key + "'");
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  -c, --config FILE          Config file path\n"
                      << "  -H, --host HOST            Server host (default: 127.0.0.1)\n"
                      << "  -p, --port PORT            Server port (default: 11211)\n"
                      << "  -t, --timeout SEC          Socket timeout seconds (default: 30)\n"
                      << "  -q, --quiet                Send commands in quiet mode\n"
                      << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
                      << "  -h, --help                 Show this help\n";
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = parse_port(argv[++i]);
        } else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            config.timeout_seconds = std::stoi(argv[++i]);
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = parse_log_level(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // config file handled separately in main
            ++i;
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    return config;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;
    // file overrides defaults
    if (file_config.host != defaults.host) result.host = file_config.host;
    if (file_config.port != defaults.port) result.port = file_config.port;
    if (file_config.timeout_seconds != defaults.timeout_seconds) result.timeout_seconds = file_config.timeout_seconds;
    if (file_config.quiet != defaults.quiet) result.quiet = file_config.quiet;
    if (file_config.log_level != defaults.log_level) result.log_level = file_config.log_level;

    // CLI overrides file
    if (cli_config.host != defaults.host) result.host = cli_config.host;
    if (cli_config.port != defaults.port) result.port = cli_config.port;
    if (cli_config.timeout_seconds != defaults.timeout_seconds) result.timeout_seconds = cli_config.timeout_seconds;
    if (cli_config.quiet != defaults.quiet) result.quiet = cli_config.quiet;
    if (cli_config.log_level != defaults.log_level) result.log_level = cli_config.log_level;

    return result;
}

ClientOptions Config::client_options() const {
    ClientOptions options;
    options.host = host;
    options.port = port;
    options.timeout_seconds = timeout_seconds;
    return options;
}

}  // namespace metacache::util
