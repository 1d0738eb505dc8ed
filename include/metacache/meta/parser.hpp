#ifndef METACACHE_META_PARSER_HPP
#define METACACHE_META_PARSER_HPP

#include <string_view>

#include "metacache/meta/types.hpp"
#include "metacache/net/connection.hpp"

namespace metacache::meta {

class ResponseParser {
   public:
    // Reads exactly one response (status line plus data block for VA).
    // Throws TransportError when the connection fails, ParseError on bytes
    // outside the meta grammar.
    [[nodiscard]] static MetaResponse read(net::IConnection& conn, CommandFamily family);

    // Applies one returned flag token ("c123", "k", "W") to a record.
    // Unknown flags are ignored.
    static void apply_flag(std::string_view token, MetaValue& value);
};

}  // namespace metacache::meta

#endif
