#include "metacache/meta/encoder.hpp"

#include <string_view>
#include <variant>

#include "metacache/meta/flags.hpp"
#include "metacache/meta/pipeline.hpp"
#include "metacache/meta/validation.hpp"

namespace metacache::meta {

namespace {

void validate(std::string_view key, const std::optional<std::string>& opaque,
              const std::vector<std::string>& flags) {
    validate_key(key, flags);
    validate_opaque(opaque);
    validate_flags(flags);
}

// ma shares one layout, decrement only differs by its mode flag
std::string encode_arithmetic(std::string_view mode, const std::string& key, bool quiet,
                              const std::optional<std::string>& opaque,
                              const std::optional<uint64_t>& delta,
                              const std::vector<std::string>& flags) {
    validate(key, opaque, flags);

    std::string line = "ma " + key;
    line += FlagNegotiator::render({mode, opaque, delta, quiet, flags});
    line += kCrlf;
    QuietPipeliner::append_sentinel(line, quiet);
    return line;
}

}  // namespace

std::string Encoder::encode(const Operation& op) {
    struct Visitor {
        std::string operator()(const Fetch& o) const {
            return Encoder::encode_fetch(o);
        }
        std::string operator()(const Store& o) const {
            return Encoder::encode_store(o);
        }
        std::string operator()(const Remove& o) const {
            return Encoder::encode_remove(o);
        }
        std::string operator()(const Increment& o) const {
            return Encoder::encode_increment(o);
        }
        std::string operator()(const Decrement& o) const {
            return Encoder::encode_decrement(o);
        }
    };
    return std::visit(Visitor{}, op);
}

std::string Encoder::encode_fetch(const Fetch& op) {
    validate(op.key, op.opaque, op.flags);

    std::string line = "mg " + op.key;
    line += FlagNegotiator::render({"", op.opaque, std::nullopt, op.quiet, op.flags});
    line += kCrlf;
    QuietPipeliner::append_sentinel(line, op.quiet);
    return line;
}

std::string Encoder::encode_store(const Store& op) {
    validate(op.key, op.opaque, op.flags);

    std::string line = "ms " + op.key + " " + std::to_string(op.value.size());
    line += FlagNegotiator::render(
        {store_mode_token(op.mode), op.opaque, std::nullopt, op.quiet, op.flags});
    line += kCrlf;
    line += op.value;
    line += kCrlf;
    QuietPipeliner::append_sentinel(line, op.quiet);
    return line;
}

std::string Encoder::encode_remove(const Remove& op) {
    validate(op.key, op.opaque, op.flags);

    std::string line = "md " + op.key;
    line += FlagNegotiator::render({"", op.opaque, std::nullopt, op.quiet, op.flags});
    line += kCrlf;
    QuietPipeliner::append_sentinel(line, op.quiet);
    return line;
}

// increment is the server default mode, "MI" is never written
std::string Encoder::encode_increment(const Increment& op) {
    return encode_arithmetic("", op.key, op.quiet, op.opaque, op.delta, op.flags);
}

std::string Encoder::encode_decrement(const Decrement& op) {
    return encode_arithmetic("D", op.key, op.quiet, op.opaque, op.delta, op.flags);
}

}  // namespace metacache::meta
