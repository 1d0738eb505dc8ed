#ifndef METACACHE_META_ERRORS_HPP
#define METACACHE_META_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "metacache/meta/types.hpp"

namespace metacache::meta {

class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// input rejected before any byte reached the connection
class ValidationError : public Error {
   public:
    using Error::Error;
};

// connect/write/flush/read failed, the connection must be discarded
class TransportError : public Error {
   public:
    using Error::Error;
};

// response bytes did not follow the meta grammar
class ParseError : public Error {
   public:
    using Error::Error;
};

class ProtocolError : public Error {
   public:
    ProtocolError(Status status, const std::string& message);

    [[nodiscard]] Status status() const noexcept {
        return status_;
    }

   private:
    Status status_;
};

// EX on md: the CAS token did not match
class ConflictError : public ProtocolError {
   public:
    explicit ConflictError(const std::string& message);
};

[[nodiscard]] ProtocolError to_error(Status status, const std::string& detail = "");

// ERROR and CLIENT_ERROR leave the stream in an unknown state
[[nodiscard]] bool should_close_connection(Status status) noexcept;

}  // namespace metacache::meta

#endif
