#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <thread>
#include <mutex>
#include <atomic>
#include <cstring>
#include <stdexcept>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace udpfetch {
    // IPv4 地址 + 端口
    class SocketAddress {
    public:
        SocketAddress() {
            memset(&addr_, 0, sizeof(addr_));
            addr_.sin_family = AF_INET;
        }

        // ip 无效时抛 std::runtime_error
        SocketAddress(const std::string &ip, uint16_t port) {
            memset(&addr_, 0, sizeof(addr_));
            addr_.sin_family = AF_INET;
            addr_.sin_port = htons(port);
            if (inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) != 1) {
                throw std::runtime_error("Invalid IP address: " + ip);
            }
        }

        explicit SocketAddress(const sockaddr_in &addr) : addr_(addr) {
        }

        const sockaddr_in &raw() const { return addr_; }

        std::string ip() const {
            char buffer[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &addr_.sin_addr, buffer, sizeof(buffer));
            return std::string(buffer);
        }

        uint16_t port() const { return ntohs(addr_.sin_port); }

        std::string toString() const { return ip() + ":" + std::to_string(port()); }

        bool operator==(const SocketAddress &other) const {
            return addr_.sin_addr.s_addr == other.addr_.sin_addr.s_addr &&
                   addr_.sin_port == other.addr_.sin_port;
        }

        bool operator!=(const SocketAddress &other) const { return !(*this == other); }

    private:
        sockaddr_in addr_;
    };

    // 一个数据报socket，析构时关闭
    class UdpSocket {
    public:
        UdpSocket();

        ~UdpSocket();

        UdpSocket(const UdpSocket &) = delete;

        UdpSocket &operator=(const UdpSocket &) = delete;

        // port 为 0 时由系统分配临时端口
        bool bind(uint16_t port, const std::string &bindIP = "0.0.0.0");

        ssize_t sendTo(const void *data, size_t length, const SocketAddress &address);

        // 超时返回 -1 且 errno 为 EAGAIN/EWOULDBLOCK
        ssize_t recvFrom(void *buffer, size_t length, SocketAddress &sender);

        bool setRecvTimeout(int timeoutMs);

        bool setRecvBufferSize(int size);

        bool setReuseAddress(bool reuse);

        uint16_t getLocalPort() const { return localAddr_.port(); }

    private:
        int fd_ = -1;
        SocketAddress localAddr_;
        int recvTimeoutMs_ = -1;
    };

    // 服务器端：一个线程在绑定的socket上收包，按到达顺序回调；发送可在任意线程
    class UdpServer {
    public:
        using PacketHandler = std::function<void(const uint8_t *data, size_t len,
                                                 const SocketAddress &sender)>;

        UdpServer() = default;

        ~UdpServer();

        bool start(uint16_t port, const std::string &bindIP = "0.0.0.0");

        // 停止收包线程；socket 保持打开直到析构，工作线程仍可发送
        void stop();

        void setPacketHandler(PacketHandler handler);

        bool sendTo(const uint8_t *data, size_t len, const SocketAddress &addr);

        uint16_t port() const;

    private:
        void receiveLoop();

        static constexpr int POLL_INTERVAL_MS = 200;
        static constexpr int RECV_BUFFER_BYTES = 4 * 1024 * 1024;

        std::thread thread_;
        std::unique_ptr<UdpSocket> socket_;
        PacketHandler packetHandler_;
        std::atomic<bool> running_{false};
        std::mutex handlerMutex_;
        std::mutex sendMutex_;
    };
} // namespace udpfetch
