#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "metacache/client.hpp"
#include "metacache/meta/errors.hpp"
#include "metacache/util/config.hpp"

using namespace metacache;

namespace {

std::optional<std::filesystem::path> find_config_path(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            return std::filesystem::path(argv[i + 1]);
        }
    }
    return std::nullopt;
}

std::vector<std::string> rest_of(std::istringstream& iss) {
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

void print_value(const std::optional<meta::MetaValue>& value) {
    if (!value) {
        std::cout << "OK" << std::endl;
        return;
    }

    std::cout << meta::status_to_string(value->status);
    if (value->key) std::cout << " key=" << *value->key;
    if (value->cas) std::cout << " cas=" << *value->cas;
    if (value->client_flags) std::cout << " flags=" << *value->client_flags;
    if (value->ttl_remaining) std::cout << " ttl=" << *value->ttl_remaining;
    if (value->size) std::cout << " size=" << *value->size;
    if (value->hit_before) std::cout << " hit=" << (*value->hit_before ? 1 : 0);
    if (value->last_accessed) std::cout << " last_access=" << *value->last_accessed;
    if (value->opaque) std::cout << " opaque=" << *value->opaque;
    if (value->win) std::cout << " W";
    if (value->stale) std::cout << " X";
    if (value->already_won) std::cout << " Z";
    std::cout << std::endl;
    if (value->data) {
        std::cout << *value->data << std::endl;
    }
}

std::optional<meta::StoreMode> store_mode_for(const std::string& cmd) {
    if (cmd == "SET") return meta::StoreMode::Set;
    if (cmd == "ADD") return meta::StoreMode::Add;
    if (cmd == "REPLACE") return meta::StoreMode::Replace;
    if (cmd == "APPEND") return meta::StoreMode::Append;
    if (cmd == "PREPEND") return meta::StoreMode::Prepend;
    return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[]) {
    util::Config defaults;
    util::Config config;

    try {
        auto cli_config = util::Config::parse_args(argc, argv);
        if (!cli_config) {
            return 0;
        }

        util::Config file_config;
        if (auto path = find_config_path(argc, argv)) {
            auto loaded = util::Config::load_file(*path);
            if (!loaded) {
                std::cerr << "Cannot read config file: " << path->string() << std::endl;
                return 1;
            }
            file_config = *loaded;
        }

        config = util::Config::merge(file_config, *cli_config, defaults);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << std::endl;
        return 1;
    }

    util::Logger::instance().set_level(config.log_level);

    ClientOptions opts = config.client_options();
    Client client(opts);

    try {
        client.connect();
        std::cout << "Connected to " << opts.host << ":" << opts.port << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Connection failed: " << e.what() << std::endl;
        return 1;
    }

    bool quiet = config.quiet;
    std::optional<std::string> opaque;

    std::string line;
    std::cout << "> ";

    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            std::cout << "> ";
            continue;
        }

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        for (char& c : cmd) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        try {
            if (auto mode = store_mode_for(cmd)) {
                std::string key;
                std::string value;
                iss >> key >> value;

                if (key.empty() || value.empty()) {
                    std::cout << "ERROR usage: " << cmd << " key value [flag...]" << std::endl;
                } else {
                    print_value(client.meta_set(key, value, quiet, opaque, rest_of(iss), *mode));
                }

            } else if (cmd == "GET" || cmd == "MG") {
                std::string key;
                iss >> key;

                if (key.empty()) {
                    std::cout << "ERROR usage: GET key [flag...]" << std::endl;
                } else {
                    auto value = client.meta_get(key, quiet, opaque, rest_of(iss));
                    if (value) {
                        print_value(value);
                    } else {
                        std::cout << "NOT_FOUND" << std::endl;
                    }
                }

            } else if (cmd == "DEL" || cmd == "DELETE" || cmd == "MD") {
                std::string key;
                iss >> key;

                if (key.empty()) {
                    std::cout << "ERROR usage: DEL key [flag...]" << std::endl;
                } else {
                    print_value(client.meta_delete(key, quiet, opaque, rest_of(iss)));
                }

            } else if (cmd == "INCR" || cmd == "DECR") {
                std::string key;
                iss >> key;
                auto flags = rest_of(iss);

                std::optional<uint64_t> delta;
                if (!flags.empty() && is_number(flags.front())) {
                    delta = std::stoull(flags.front());
                    flags.erase(flags.begin());
                }

                if (key.empty()) {
                    std::cout << "ERROR usage: " << cmd << " key [delta] [flag...]" << std::endl;
                } else if (cmd == "INCR") {
                    print_value(client.meta_increment(key, quiet, opaque, delta, flags));
                } else {
                    print_value(client.meta_decrement(key, quiet, opaque, delta, flags));
                }

            } else if (cmd == "NOOP" || cmd == "MN" || cmd == "PING") {
                if (client.noop()) {
                    std::cout << "OK MN" << std::endl;
                } else {
                    std::cout << "ERROR noop failed" << std::endl;
                }

            } else if (cmd == "QUIET") {
                std::string arg;
                iss >> arg;
                quiet = (arg == "on" || arg == "1" || arg == "true");
                std::cout << "OK quiet " << (quiet ? "on" : "off") << std::endl;

            } else if (cmd == "OPAQUE") {
                std::string arg;
                iss >> arg;
                if (arg.empty() || arg == "off") {
                    opaque.reset();
                    std::cout << "OK opaque off" << std::endl;
                } else {
                    opaque = arg;
                    std::cout << "OK opaque " << arg << std::endl;
                }

            } else if (cmd == "QUIT" || cmd == "EXIT") {
                std::cout << "BYE" << std::endl;
                break;

            } else if (cmd == "HELP") {
                std::cout << "Commands: GET, SET, ADD, REPLACE, APPEND, PREPEND, DEL, INCR, DECR, "
                             "NOOP, QUIET on|off, OPAQUE token|off, QUIT"
                          << std::endl;

            } else {
                std::cout << "ERROR unknown command: " << cmd << std::endl;
            }

        } catch (const meta::ConflictError& e) {
            std::cout << "EXISTS " << e.what() << std::endl;
        } catch (const std::exception& e) {
            std::cout << "ERROR " << e.what() << std::endl;
        }

        // the client closes the connection after transport or parse failures
        if (!client.connected()) {
            try {
                client.connect();
                std::cout << "Reconnected" << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "Reconnection failed, exiting: " << e.what() << std::endl;
                return 1;
            }
        }

        std::cout << "> ";
    }

    client.disconnect();
    return 0;
}
