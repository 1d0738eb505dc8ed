#ifndef METACACHE_META_ENCODER_HPP
#define METACACHE_META_ENCODER_HPP

#include <string>

#include "metacache/meta/operation.hpp"

namespace metacache::meta {

class Encoder {
   public:
    // Full wire bytes for one operation, the quiet sentinel included.
    // Throws ValidationError before producing anything.
    [[nodiscard]] static std::string encode(const Operation& op);

    [[nodiscard]] static std::string encode_fetch(const Fetch& op);
    [[nodiscard]] static std::string encode_store(const Store& op);
    [[nodiscard]] static std::string encode_remove(const Remove& op);
    [[nodiscard]] static std::string encode_increment(const Increment& op);
    [[nodiscard]] static std::string encode_decrement(const Decrement& op);
};

}  // namespace metacache::meta

#endif
