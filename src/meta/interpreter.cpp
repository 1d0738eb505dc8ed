#include "metacache/meta/interpreter.hpp"

#include "metacache/meta/errors.hpp"

namespace metacache::meta {

bool ResponseInterpreter::is_empty_success(CommandFamily family, Status status) noexcept {
    if (status == Status::NoOp) {
        return true;
    }
    switch (family) {
        case CommandFamily::Get:
            return status == Status::NotFound;
        case CommandFamily::Set:
        case CommandFamily::Arithmetic:
            return status == Status::Stored;
        case CommandFamily::Delete:
            return status == Status::Deleted;
    }
    return false;
}

std::optional<MetaValue> ResponseInterpreter::interpret(CommandFamily family,
                                                        const MetaResponse& response) {
    if (response.has_values()) {
        return response.first();
    }

    if (is_empty_success(family, response.status)) {
        return std::nullopt;
    }

    if (family == CommandFamily::Delete && response.status == Status::Exists) {
        throw ConflictError("md: cas mismatch");
    }

    throw to_error(response.status, response.message);
}

}  // namespace metacache::meta
