#ifndef METACACHE_META_FLAGS_HPP
#define METACACHE_META_FLAGS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metacache::meta {

struct FlagRequest {
    // operation mode token without the leading 'M' ("D" for decrement)
    std::string_view mode;
    std::optional<std::string> opaque;
    // only set by arithmetic operations
    std::optional<uint64_t> delta;
    bool quiet = false;
    std::vector<std::string> flags;
};

/*
    Typed parameters win over free-form flags that mean the same thing:
        - M<mode> first, caller 'M' flags always dropped (mode follows the verb)
        - O<opaque> when given, caller 'O' flags dropped
        - D<delta> when given and != 1, caller 'D' flags dropped whenever delta is given
        - caller 'q' flags always dropped, quiet is the typed parameter only
        - remaining caller flags in order
        - q last
*/
class FlagNegotiator {
   public:
    [[nodiscard]] static std::vector<std::string> negotiate(const FlagRequest& request);

    // negotiated tokens each prefixed by a space, ready to follow the key
    [[nodiscard]] static std::string render(const FlagRequest& request);
};

}  // namespace metacache::meta

#endif
