#ifndef METACACHE_META_TYPES_HPP
#define METACACHE_META_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace metacache::meta {

inline constexpr std::size_t kMaxKeyLength = 250;
inline constexpr std::size_t kMaxOpaqueLength = 32;

inline constexpr std::string_view kCrlf = "\r\n";
inline constexpr std::string_view kNoOpCommand = "mn\r\n";

// verb families, each with its own response grammar and success statuses
enum class CommandFamily : uint8_t {
    Get = 0,
    Set = 1,
    Delete = 2,
    Arithmetic = 3,
};

// ms storage modes, Set is the server default and never written
enum class StoreMode : uint8_t {
    Set = 0,
    Add = 1,
    Replace = 2,
    Append = 3,
    Prepend = 4,
};

enum class Status : uint8_t {
    Value = 0,        // VA
    Hit = 1,          // HD on mg
    Stored = 2,       // HD on ms / ma
    Deleted = 3,      // HD on md
    NotStored = 4,    // NS
    Exists = 5,       // EX
    NotFound = 6,     // EN / NF
    NoOp = 7,         // MN
    Error = 8,        // ERROR
    ClientError = 9,  // CLIENT_ERROR <msg>
    ServerError = 10, // SERVER_ERROR <msg>
};

// metadata and data returned for one request. only the fields for flags the
// request asked for are populated
struct MetaValue {
    Status status = Status::Hit;
    std::optional<std::string> key;
    std::optional<std::string> data;
    std::optional<uint64_t> cas;
    std::optional<uint32_t> client_flags;
    std::optional<int64_t> ttl_remaining;  // -1 means no expiry
    std::optional<uint64_t> size;
    std::optional<bool> hit_before;
    std::optional<uint64_t> last_accessed;
    std::optional<std::string> opaque;
    bool base64_key = false;
    bool win = false;
    bool stale = false;
    bool already_won = false;
};

// one classified response: a bare status, or a status with returned records
struct MetaResponse {
    Status status = Status::NoOp;
    std::vector<MetaValue> values;
    std::string message;

    [[nodiscard]] bool has_values() const noexcept {
        return !values.empty();
    }

    // single-key requests yield at most one logical record, callers must not
    // rely on anything past index 0
    [[nodiscard]] const MetaValue& first() const {
        return values.front();
    }

    static MetaResponse of(Status status) {
        return {status, {}, ""};
    }

    static MetaResponse with_value(MetaValue value) {
        MetaResponse resp;
        resp.status = value.status;
        resp.values.push_back(std::move(value));
        return resp;
    }

    static MetaResponse error(Status status, std::string message) {
        return {status, {}, std::move(message)};
    }
};

[[nodiscard]] std::string_view status_to_string(Status status);
[[nodiscard]] std::string_view family_to_string(CommandFamily family);

// mode token written after 'M', empty for the default Set mode
[[nodiscard]] std::string_view store_mode_token(StoreMode mode);

}  // namespace metacache::meta

#endif
