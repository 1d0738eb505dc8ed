#include "metacache/meta/pipeline.hpp"

#include "metacache/meta/errors.hpp"
#include "metacache/meta/parser.hpp"
#include "metacache/util/logger.hpp"

namespace metacache::meta {

void QuietPipeliner::append_sentinel(std::string& command, bool quiet) {
    if (quiet) {
        command += kNoOpCommand;
    }
}

MetaResponse QuietPipeliner::receive(net::IConnection& conn, CommandFamily family, bool quiet) {
    MetaResponse response = ResponseParser::read(conn, family);
    if (!quiet || response.status == Status::NoOp || should_close_connection(response.status)) {
        return response;
    }

    while (true) {
        MetaResponse extra = ResponseParser::read(conn, family);
        if (extra.status == Status::NoOp) {
            break;
        }
        LOG_WARN("discarding unexpected " + std::string(status_to_string(extra.status)) +
                 " before " + std::string(family_to_string(family)) + " sentinel");
        if (should_close_connection(extra.status)) {
            break;
        }
    }
    return response;
}

}  // namespace metacache::meta
