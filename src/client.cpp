#include "metacache/client.hpp"

#include "metacache/meta/encoder.hpp"
#include "metacache/meta/errors.hpp"
#include "metacache/meta/interpreter.hpp"
#include "metacache/meta/parser.hpp"
#include "metacache/meta/pipeline.hpp"
#include "metacache/util/logger.hpp"

namespace metacache {

namespace {

std::string escape(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        if (c == '\r') {
            out += "\\r";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out += c;
        }
    }
    return out;
}

}  // namespace

class Client::Impl {
   public:
    explicit Impl(std::unique_ptr<net::IConnection> connection)
        : connection_(std::move(connection)) {}

    ~Impl() {
        disconnect();
    }

    void connect() {
        connection_->connect();
    }

    void disconnect() {
        connection_->close();
    }

    [[nodiscard]] bool connected() const noexcept {
        return connection_->is_open();
    }

    /*
        the whole command is encoded before the first write, so a validation
        error never leaves a partial command on the wire
    */
    std::optional<meta::MetaValue> execute(const meta::Operation& op) {
        std::string command = meta::Encoder::encode(op);
        meta::CommandFamily family = meta::family_of(op);

        send(command);

        meta::MetaResponse response;
        try {
            response = meta::QuietPipeliner::receive(*connection_, family, meta::is_quiet(op));
        } catch (const meta::TransportError& e) {
            discard(e.what());
            throw;
        } catch (const meta::ParseError& e) {
            discard(e.what());
            throw;
        }

        if (meta::should_close_connection(response.status)) {
            discard(std::string(meta::status_to_string(response.status)) + " " + response.message);
        }

        return meta::ResponseInterpreter::interpret(family, response);
    }

    [[nodiscard]] bool noop() {
        try {
            send(std::string(meta::kNoOpCommand));
            auto response = meta::ResponseParser::read(*connection_, meta::CommandFamily::Get);
            if (response.status != meta::Status::NoOp) {
                // anything but MN means the stream is out of step with our requests
                discard(std::string("noop answered with ") +
                        std::string(meta::status_to_string(response.status)));
                return false;
            }
            return true;
        } catch (const meta::TransportError& e) {
            discard(e.what());
            return false;
        } catch (const meta::ParseError& e) {
            discard(e.what());
            return false;
        }
    }

   private:
    void send(const std::string& command) {
        if (!connection_->is_open()) {
            throw meta::TransportError("not connected");
        }

        LOG_DEBUG("send: " + escape(command));

        if (!connection_->write(command) || !connection_->flush()) {
            discard("write failed");
            throw meta::TransportError("failed to send request");
        }
    }

    // the stream position is unknown after this, never reuse it
    void discard(const std::string& reason) {
        LOG_WARN("closing connection: " + reason);
        connection_->close();
    }

    std::unique_ptr<net::IConnection> connection_;
};

// PIMPL INTERFACE ------------------------------------------------------------------------
Client::Client(const ClientOptions& options)
    : impl_(std::make_unique<Impl>(std::make_unique<net::TcpConnection>(
          options.host, options.port, options.timeout_seconds))) {}
Client::Client(std::unique_ptr<net::IConnection> connection)
    : impl_(std::make_unique<Impl>(std::move(connection))) {}
Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;
void Client::connect() {
    impl_->connect();
}
void Client::disconnect() {
    impl_->disconnect();
}
bool Client::connected() const noexcept {
    return impl_->connected();
}
std::optional<meta::MetaValue> Client::meta_get(std::string_view key, bool quiet,
                                                std::optional<std::string> opaque,
                                                std::vector<std::string> flags) {
    return impl_->execute(
        meta::Fetch{std::string(key), quiet, std::move(opaque), std::move(flags)});
}
std::optional<meta::MetaValue> Client::meta_set(std::string_view key, std::string_view value,
                                                bool quiet, std::optional<std::string> opaque,
                                                std::vector<std::string> flags,
                                                meta::StoreMode mode) {
    return impl_->execute(meta::Store{std::string(key), std::string(value), quiet,
                                      std::move(opaque), std::move(flags), mode});
}
std::optional<meta::MetaValue> Client::meta_delete(std::string_view key, bool quiet,
                                                   std::optional<std::string> opaque,
                                                   std::vector<std::string> flags) {
    return impl_->execute(
        meta::Remove{std::string(key), quiet, std::move(opaque), std::move(flags)});
}
std::optional<meta::MetaValue> Client::meta_increment(std::string_view key, bool quiet,
                                                      std::optional<std::string> opaque,
                                                      std::optional<uint64_t> delta,
                                                      std::vector<std::string> flags) {
    return impl_->execute(
        meta::Increment{std::string(key), quiet, std::move(opaque), delta, std::move(flags)});
}
std::optional<meta::MetaValue> Client::meta_decrement(std::string_view key, bool quiet,
                                                      std::optional<std::string> opaque,
                                                      std::optional<uint64_t> delta,
                                                      std::vector<std::string> flags) {
    return impl_->execute(
        meta::Decrement{std::string(key), quiet, std::move(opaque), delta, std::move(flags)});
}
std::optional<meta::MetaValue> Client::execute(const meta::Operation& op) {
    return impl_->execute(op);
}
bool Client::noop() {
    return impl_->noop();
}
}  // namespace metacache
