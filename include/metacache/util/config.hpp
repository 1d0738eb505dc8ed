#ifndef METACACHE_UTIL_CONFIG_HPP
#define METACACHE_UTIL_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "metacache/client.hpp"
#include "metacache/util/logger.hpp"

namespace metacache::util {

struct Config {
    // connection
    std::string host = "127.0.0.1";
    uint16_t port = 11211;
    int timeout_seconds = 30;

    // request defaults
    bool quiet = false;

    // logging
    LogLevel log_level = LogLevel::Info;

    // Load from file (key = value, '#' comments)
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file, file overrides defaults
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);

    [[nodiscard]] ClientOptions client_options() const;
};

}  // namespace metacache::util

#endif
