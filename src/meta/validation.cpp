#include "metacache/meta/validation.hpp"

#include <algorithm>

#include "metacache/meta/errors.hpp"
#include "metacache/meta/types.hpp"

namespace metacache::meta {

namespace {

bool is_unsafe_byte(char c) {
    auto b = static_cast<unsigned char>(c);
    return b <= 0x20 || b == 0x7f;
}

bool has_base64_flag(const std::vector<std::string>& flags) {
    return std::any_of(flags.begin(), flags.end(),
                       [](const std::string& flag) { return flag == "b"; });
}

}  // namespace

void validate_key(std::string_view key, const std::vector<std::string>& flags) {
    if (key.empty()) {
        throw ValidationError("key is empty");
    }
    if (key.size() > kMaxKeyLength) {
        throw ValidationError("key length " + std::to_string(key.size()) +
                              " exceeds maximum of " + std::to_string(kMaxKeyLength) + " bytes");
    }
    if (!has_base64_flag(flags) && std::any_of(key.begin(), key.end(), is_unsafe_byte)) {
        throw ValidationError("key contains whitespace or control characters");
    }
}

void validate_opaque(const std::optional<std::string>& opaque) {
    if (opaque && opaque->size() > kMaxOpaqueLength) {
        throw ValidationError("opaque length " + std::to_string(opaque->size()) +
                              " exceeds maximum of " + std::to_string(kMaxOpaqueLength) +
                              " bytes");
    }
}

void validate_flags(const std::vector<std::string>& flags) {
    for (const auto& flag : flags) {
        if (std::any_of(flag.begin(), flag.end(), is_unsafe_byte)) {
            throw ValidationError("flag '" + flag + "' contains whitespace or control characters");
        }
    }
}

}  // namespace metacache::meta
