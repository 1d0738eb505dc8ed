#ifndef METACACHE_META_VALIDATION_HPP
#define METACACHE_META_VALIDATION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metacache::meta {

// All checks throw ValidationError.

// 1..250 bytes; whitespace and control bytes only allowed when the key is
// sent base64 encoded ("b" among the flags)
void validate_key(std::string_view key, const std::vector<std::string>& flags);

// at most 32 bytes
void validate_opaque(const std::optional<std::string>& opaque);

// tokens are written verbatim, so they must not break the command line
void validate_flags(const std::vector<std::string>& flags);

}  // namespace metacache::meta

#endif
