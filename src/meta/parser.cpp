#include "metacache/meta/parser.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "metacache/meta/errors.hpp"
#include "metacache/util/logger.hpp"

namespace metacache::meta {

namespace {

std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t start = line.find_first_not_of(' ', pos);
        if (start == std::string_view::npos) {
            break;
        }
        size_t end = line.find(' ', start);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        tokens.push_back(line.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

bool cut_prefix(std::string_view line, std::string_view prefix, std::string& rest) {
    if (line == prefix) {
        rest.clear();
        return true;
    }
    if (line.size() > prefix.size() && line.substr(0, prefix.size()) == prefix &&
        line[prefix.size()] == ' ') {
        rest = std::string(line.substr(prefix.size() + 1));
        return true;
    }
    return false;
}

uint64_t parse_unsigned(std::string_view token, std::string_view what) {
    if (token.empty() || token.front() == '-' || token.front() == '+') {
        throw ParseError("invalid " + std::string(what) + ": '" + std::string(token) + "'");
    }
    try {
        size_t used = 0;
        uint64_t value = std::stoull(std::string(token), &used);
        if (used != token.size()) {
            throw ParseError("invalid " + std::string(what) + ": '" + std::string(token) + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ParseError("invalid " + std::string(what) + ": '" + std::string(token) + "'");
    }
}

int64_t parse_signed(std::string_view token, std::string_view what) {
    try {
        size_t used = 0;
        int64_t value = std::stoll(std::string(token), &used);
        if (used != token.size()) {
            throw ParseError("invalid " + std::string(what) + ": '" + std::string(token) + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ParseError("invalid " + std::string(what) + ": '" + std::string(token) + "'");
    }
}

Status hit_status(CommandFamily family) {
    switch (family) {
        case CommandFamily::Get:
            return Status::Hit;
        case CommandFamily::Delete:
            return Status::Deleted;
        case CommandFamily::Set:
        case CommandFamily::Arithmetic:
            return Status::Stored;
    }
    return Status::Stored;
}

MetaValue value_from_flags(Status status, const std::vector<std::string_view>& tokens,
                           size_t first_flag) {
    MetaValue value;
    value.status = status;
    for (size_t i = first_flag; i < tokens.size(); ++i) {
        ResponseParser::apply_flag(tokens[i], value);
    }
    return value;
}

}  // namespace

void ResponseParser::apply_flag(std::string_view token, MetaValue& value) {
    if (token.empty()) {
        return;
    }

    std::string_view arg = token.substr(1);
    switch (token.front()) {
        case 'c':
            value.cas = parse_unsigned(arg, "cas");
            break;
        case 'f': {
            uint64_t flags = parse_unsigned(arg, "client flags");
            if (flags > std::numeric_limits<uint32_t>::max()) {
                throw ParseError("client flags out of range: '" + std::string(arg) + "'");
            }
            value.client_flags = static_cast<uint32_t>(flags);
            break;
        }
        case 't':
            value.ttl_remaining = parse_signed(arg, "ttl");
            break;
        case 's':
            value.size = parse_unsigned(arg, "size");
            break;
        case 'h':
            if (arg != "0" && arg != "1") {
                throw ParseError("invalid hit flag: '" + std::string(arg) + "'");
            }
            value.hit_before = (arg == "1");
            break;
        case 'l':
            value.last_accessed = parse_unsigned(arg, "last access");
            break;
        case 'k':
            value.key = std::string(arg);
            break;
        case 'O':
            value.opaque = std::string(arg);
            break;
        case 'b':
            value.base64_key = true;
            break;
        case 'W':
            value.win = true;
            break;
        case 'X':
            value.stale = true;
            break;
        case 'Z':
            value.already_won = true;
            break;
        default:
            LOG_DEBUG("ignoring returned flag '" + std::string(token) + "'");
            break;
    }
}

MetaResponse ResponseParser::read(net::IConnection& conn, CommandFamily family) {
    auto line = conn.read_line();
    if (!line) {
        throw TransportError("connection closed while reading response");
    }

    std::string rest;
    if (cut_prefix(*line, "CLIENT_ERROR", rest)) {
        return MetaResponse::error(Status::ClientError, rest);
    }
    if (cut_prefix(*line, "SERVER_ERROR", rest)) {
        return MetaResponse::error(Status::ServerError, rest);
    }
    if (cut_prefix(*line, "ERROR", rest)) {
        return MetaResponse::error(Status::Error, rest);
    }

    auto tokens = split(*line);
    if (tokens.empty()) {
        throw ParseError("empty response line");
    }

    std::string_view code = tokens[0];

    if (code == "VA") {
        if (tokens.size() < 2) {
            throw ParseError("VA response missing size");
        }
        uint64_t size = parse_unsigned(tokens[1], "VA size");

        if (size > std::numeric_limits<size_t>::max() - kCrlf.size()) {
            throw ParseError("VA size out of range: " + std::string(tokens[1]));
        }

        MetaValue value = value_from_flags(Status::Value, tokens, 2);

        size_t total = static_cast<size_t>(size) + kCrlf.size();
        auto block = conn.read_exact(total);
        if (!block) {
            throw TransportError("connection closed while reading data block");
        }
        if (block->size() != total ||
            std::string_view(*block).substr(static_cast<size_t>(size)) != kCrlf) {
            throw ParseError("data block not terminated by CRLF");
        }
        block->resize(size);
        value.data = std::move(*block);
        return MetaResponse::with_value(std::move(value));
    }

    if (code == "HD") {
        Status status = hit_status(family);
        // a bare HD is a hit on mg but only a status for the mutating verbs
        if (family != CommandFamily::Get && tokens.size() == 1) {
            return MetaResponse::of(status);
        }
        return MetaResponse::with_value(value_from_flags(status, tokens, 1));
    }

    if (code == "EN" || code == "NF") {
        return MetaResponse::of(Status::NotFound);
    }
    if (code == "NS") {
        return MetaResponse::of(Status::NotStored);
    }
    if (code == "EX") {
        return MetaResponse::of(Status::Exists);
    }
    if (code == "MN") {
        return MetaResponse::of(Status::NoOp);
    }

    throw ParseError("unknown response: '" + *line + "'");
}

}  // namespace metacache::meta
