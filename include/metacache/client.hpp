#ifndef METACACHE_CLIENT_HPP
#define METACACHE_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "metacache/meta/operation.hpp"
#include "metacache/meta/types.hpp"
#include "metacache/net/connection.hpp"

namespace metacache {

struct ClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 11211;
    int timeout_seconds = 30;
};

/*
    Blocking meta protocol client over a single connection. One request is in
    flight at a time: every call writes its command (plus the mn sentinel in
    quiet mode) and reads until its response is fully consumed. Not thread
    safe, give each thread its own client.

    Errors are exceptions from metacache/meta/errors.hpp. After a
    TransportError, ParseError or an ERROR / CLIENT_ERROR reply the connection
    is closed; call connect() again before the next request.
*/
class Client {
   public:
    explicit Client(const ClientOptions& options = {});
    explicit Client(std::unique_ptr<net::IConnection> connection);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void connect();
    void disconnect();
    [[nodiscard]] bool connected() const noexcept;

    // mg <key> <flags>*
    [[nodiscard]] std::optional<meta::MetaValue> meta_get(
        std::string_view key, bool quiet = false,
        std::optional<std::string> opaque = std::nullopt,
        std::vector<std::string> flags = {});

    // ms <key> <datalen> <flags>*, value sent as the data block
    [[nodiscard]] std::optional<meta::MetaValue> meta_set(
        std::string_view key, std::string_view value, bool quiet = false,
        std::optional<std::string> opaque = std::nullopt,
        std::vector<std::string> flags = {},
        meta::StoreMode mode = meta::StoreMode::Set);

    // md <key> <flags>*, throws ConflictError on a cas mismatch
    [[nodiscard]] std::optional<meta::MetaValue> meta_delete(
        std::string_view key, bool quiet = false,
        std::optional<std::string> opaque = std::nullopt,
        std::vector<std::string> flags = {});

    // ma <key> <flags>*; "M", "D", "O" and "q" belong to the typed parameters
    [[nodiscard]] std::optional<meta::MetaValue> meta_increment(
        std::string_view key, bool quiet = false,
        std::optional<std::string> opaque = std::nullopt,
        std::optional<uint64_t> delta = std::nullopt,
        std::vector<std::string> flags = {});

    // ma <key> MD <flags>*
    [[nodiscard]] std::optional<meta::MetaValue> meta_decrement(
        std::string_view key, bool quiet = false,
        std::optional<std::string> opaque = std::nullopt,
        std::optional<uint64_t> delta = std::nullopt,
        std::vector<std::string> flags = {});

    [[nodiscard]] std::optional<meta::MetaValue> execute(const meta::Operation& op);

    // health check: mn must come back as MN
    [[nodiscard]] bool noop();

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace metacache

#endif
