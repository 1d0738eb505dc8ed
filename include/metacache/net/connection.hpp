#ifndef METACACHE_NET_CONNECTION_HPP
#define METACACHE_NET_CONNECTION_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace metacache::net {

// ordered byte stream to one server. a false/nullopt return means the
// transport is broken and the connection must not be reused
class IConnection {
public:
    virtual ~IConnection() = default;

    virtual void connect() = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    [[nodiscard]] virtual bool write(std::string_view bytes) = 0;
    [[nodiscard]] virtual bool flush() = 0;

    // next line without its terminator
    [[nodiscard]] virtual std::optional<std::string> read_line() = 0;
    [[nodiscard]] virtual std::optional<std::string> read_exact(std::size_t n) = 0;
};

class TcpConnection : public IConnection {
public:
    TcpConnection(std::string host, uint16_t port, int timeout_seconds);
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    // throws TransportError
    void connect() override;
    void close() override;
    [[nodiscard]] bool is_open() const noexcept override;

    [[nodiscard]] bool write(std::string_view bytes) override;
    [[nodiscard]] bool flush() override;

    [[nodiscard]] std::optional<std::string> read_line() override;
    [[nodiscard]] std::optional<std::string> read_exact(std::size_t n) override;

private:
    bool fill();

    std::string host_;
    uint16_t port_;
    int timeout_seconds_;
    int socket_fd_ = -1;
    std::string write_buffer_;
    std::string read_buffer_;
};

}  // namespace metacache::net

#endif
