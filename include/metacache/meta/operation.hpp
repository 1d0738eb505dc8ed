#ifndef METACACHE_META_OPERATION_HPP
#define METACACHE_META_OPERATION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "metacache/meta/types.hpp"

namespace metacache::meta {

struct Fetch {
    std::string key;
    bool quiet = false;
    std::optional<std::string> opaque;
    std::vector<std::string> flags;
};

struct Store {
    std::string key;
    std::string value;
    bool quiet = false;
    std::optional<std::string> opaque;
    std::vector<std::string> flags;
    StoreMode mode = StoreMode::Set;
};

struct Remove {
    std::string key;
    bool quiet = false;
    std::optional<std::string> opaque;
    std::vector<std::string> flags;
};

struct Increment {
    std::string key;
    bool quiet = false;
    std::optional<std::string> opaque;
    std::optional<uint64_t> delta;
    std::vector<std::string> flags;
};

struct Decrement {
    std::string key;
    bool quiet = false;
    std::optional<std::string> opaque;
    std::optional<uint64_t> delta;
    std::vector<std::string> flags;
};

using Operation = std::variant<Fetch, Store, Remove, Increment, Decrement>;

[[nodiscard]] CommandFamily family_of(const Operation& op);
[[nodiscard]] bool is_quiet(const Operation& op);
[[nodiscard]] const std::string& key_of(const Operation& op);

}  // namespace metacache::meta

#endif
