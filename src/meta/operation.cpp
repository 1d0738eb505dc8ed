#include "metacache/meta/operation.hpp"

namespace metacache::meta {

namespace {

struct FamilyVisitor {
    CommandFamily operator()(const Fetch&) const {
        return CommandFamily::Get;
    }
    CommandFamily operator()(const Store&) const {
        return CommandFamily::Set;
    }
    CommandFamily operator()(const Remove&) const {
        return CommandFamily::Delete;
    }
    CommandFamily operator()(const Increment&) const {
        return CommandFamily::Arithmetic;
    }
    CommandFamily operator()(const Decrement&) const {
        return CommandFamily::Arithmetic;
    }
};

}  // namespace

CommandFamily family_of(const Operation& op) {
    return std::visit(FamilyVisitor{}, op);
}

bool is_quiet(const Operation& op) {
    return std::visit([](const auto& o) { return o.quiet; }, op);
}

const std::string& key_of(const Operation& op) {
    return std::visit([](const auto& o) -> const std::string& { return o.key; }, op);
}

}  // namespace metacache::meta
