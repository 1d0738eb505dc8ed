#ifndef METACACHE_META_PIPELINE_HPP
#define METACACHE_META_PIPELINE_HPP

#include <string>

#include "metacache/meta/types.hpp"
#include "metacache/net/connection.hpp"

namespace metacache::meta {

/*
    Quiet mode makes the server skip "nothing to report" replies (a miss on mg,
    HD on ms/md/ma). An mn is sent right behind the command; its MN reply
    always arrives, so the read side waits for that instead of hanging.
*/
class QuietPipeliner {
   public:
    static void append_sentinel(std::string& command, bool quiet);

    // Reads the operation's response. Under quiet mode the result is the first
    // reply that is not MN (or the MN itself), and reading continues until
    // the sentinel has been consumed. ERROR / CLIENT_ERROR stop the drain.
    [[nodiscard]] static MetaResponse receive(net::IConnection& conn, CommandFamily family,
                                              bool quiet);
};

}  // namespace metacache::meta

#endif
