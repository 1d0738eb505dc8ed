#include "metacache/meta/types.hpp"

namespace metacache::meta {

std::string_view status_to_string(Status status) {
    switch (status) {
        case Status::Value:
            return "VALUE";
        case Status::Hit:
            return "HIT";
        case Status::Stored:
            return "STORED";
        case Status::Deleted:
            return "DELETED";
        case Status::NotStored:
            return "NOT_STORED";
        case Status::Exists:
            return "EXISTS";
        case Status::NotFound:
            return "NOT_FOUND";
        case Status::NoOp:
            return "NOOP";
        case Status::Error:
            return "ERROR";
        case Status::ClientError:
            return "CLIENT_ERROR";
        case Status::ServerError:
            return "SERVER_ERROR";
    }
    return "UNKNOWN";
}

std::string_view family_to_string(CommandFamily family) {
    switch (family) {
        case CommandFamily::Get:
            return "mg";
        case CommandFamily::Set:
            return "ms";
        case CommandFamily::Delete:
            return "md";
        case CommandFamily::Arithmetic:
            return "ma";
    }
    return "??";
}

std::string_view store_mode_token(StoreMode mode) {
    switch (mode) {
        case StoreMode::Set:
            return "";
        case StoreMode::Add:
            return "E";
        case StoreMode::Replace:
            return "R";
        case StoreMode::Append:
            return "A";
        case StoreMode::Prepend:
            return "P";
    }
    return "";
}

}  // namespace metacache::meta
