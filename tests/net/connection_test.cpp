#include "metacache/net/connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "metacache/client.hpp"
#include "metacache/meta/errors.hpp"

namespace metacache::net::test {

// accepts one connection, waits for the expected request bytes, answers with
// a canned reply and closes
class ScriptedServer {
   public:
    ScriptedServer() {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(listen_fd_, 1);

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~ScriptedServer() {
        // wakes a serve thread still blocked in accept()
        shutdown(listen_fd_, SHUT_RDWR);
        if (thread_.joinable()) {
            thread_.join();
        }
        close(listen_fd_);
    }

    void serve(std::string expected, std::string reply) {
        thread_ = std::thread([this, expected = std::move(expected), reply = std::move(reply)] {
            int fd = accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                return;
            }
            char buf[1024];
            while (received_.size() < expected.size()) {
                ssize_t n = recv(fd, buf, sizeof(buf), 0);
                if (n <= 0) {
                    break;
                }
                received_.append(buf, static_cast<size_t>(n));
            }
            // split the reply so the client has to reassemble it
            size_t half = reply.size() / 2;
            send(fd, reply.data(), half, 0);
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            send(fd, reply.data() + half, reply.size() - half, 0);
            close(fd);
        });
    }

    [[nodiscard]] uint16_t port() const {
        return port_;
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] const std::string& received() const {
        return received_;
    }

   private:
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::string received_;
};

TEST(TcpConnectionTest, IdleServerShutsDownWithoutClient) {
    auto start = std::chrono::steady_clock::now();
    {
        ScriptedServer server;
        server.serve("mn\r\n", "MN\r\n");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(TcpConnectionTest, ConnectRefusedIsTransportError) {
    uint16_t port = 0;
    {
        ScriptedServer closed;
        port = closed.port();
    }
    TcpConnection conn("127.0.0.1", port, 1);
    EXPECT_THROW(conn.connect(), meta::TransportError);
    EXPECT_FALSE(conn.is_open());
}

TEST(TcpConnectionTest, InvalidAddressIsTransportError) {
    TcpConnection conn("not-an-ip", 11211, 1);
    EXPECT_THROW(conn.connect(), meta::TransportError);
}

TEST(TcpConnectionTest, WriteBeforeConnectFails) {
    TcpConnection conn("127.0.0.1", 11211, 1);
    EXPECT_FALSE(conn.write("mn\r\n"));
    EXPECT_FALSE(conn.flush());
    EXPECT_FALSE(conn.read_line().has_value());
}

TEST(TcpConnectionTest, LinesAndBlocks) {
    ScriptedServer server;
    server.serve("mg foo v\r\n", "VA 3 c5\r\nbar\r\nEN\r\n");

    TcpConnection conn("127.0.0.1", server.port(), 5);
    conn.connect();
    ASSERT_TRUE(conn.is_open());

    ASSERT_TRUE(conn.write("mg foo"));
    ASSERT_TRUE(conn.write(" v\r\n"));
    ASSERT_TRUE(conn.flush());

    EXPECT_EQ(conn.read_line(), "VA 3 c5");
    EXPECT_EQ(conn.read_exact(5), "bar\r\n");
    EXPECT_EQ(conn.read_line(), "EN");
    EXPECT_FALSE(conn.read_line().has_value());

    server.join();
    EXPECT_EQ(server.received(), "mg foo v\r\n");
}

TEST(TcpConnectionTest, ClientOverSocket) {
    ScriptedServer server;
    server.serve("ma ctr D5 v q\r\nmn\r\n", "VA 1\r\n5\r\nMN\r\n");

    ClientOptions opts;
    opts.port = server.port();
    opts.timeout_seconds = 5;
    Client client(opts);
    client.connect();

    auto value = client.meta_increment("ctr", true, std::nullopt, 5, {"v"});
    server.join();

    EXPECT_EQ(server.received(), "ma ctr D5 v q\r\nmn\r\n");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->data, "5");
}

}  // namespace metacache::net::test
