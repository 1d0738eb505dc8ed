#include "metacache/meta/flags.hpp"

namespace metacache::meta {

namespace {

bool suppressed(const std::string& flag, const FlagRequest& request) {
    switch (flag.front()) {
        case 'M':
        case 'q':
            return true;
        case 'O':
            return request.opaque.has_value();
        case 'D':
            return request.delta.has_value();
        default:
            return false;
    }
}

}  // namespace

std::vector<std::string> FlagNegotiator::negotiate(const FlagRequest& request) {
    std::vector<std::string> tokens;

    if (!request.mode.empty()) {
        tokens.push_back("M" + std::string(request.mode));
    }

    if (request.opaque) {
        tokens.push_back("O" + *request.opaque);
    }

    // D1 is the server default
    if (request.delta && *request.delta != 1) {
        tokens.push_back("D" + std::to_string(*request.delta));
    }

    for (const auto& flag : request.flags) {
        if (flag.empty() || suppressed(flag, request)) {
            continue;
        }
        tokens.push_back(flag);
    }

    if (request.quiet) {
        tokens.emplace_back("q");
    }

    return tokens;
}

std::string FlagNegotiator::render(const FlagRequest& request) {
    std::string out;
    for (const auto& token : negotiate(request)) {
        out += ' ';
        out += token;
    }
    return out;
}

}  // namespace metacache::meta
