#include "socket.h"
#include "protocol.h"
#include "utils.h"

#include <cerrno>
#include <algorithm>
#include <sys/time.h>

namespace udpfetch {
    UdpSocket::UdpSocket() {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (fd_ < 0) {
            throw std::runtime_error(std::string("Socket creation failed: ") + std::strerror(errno));
        }
    }

    UdpSocket::~UdpSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    bool UdpSocket::bind(uint16_t port, const std::string &bindIP) {
        sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, bindIP.c_str(), &addr.sin_addr) != 1) {
            Log::error("Invalid bind address: " + bindIP);
            return false;
        }

        if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
            Log::error("Bind failed on " + bindIP + ":" + std::to_string(port) + ": " + std::strerror(errno));
            return false;
        }

        // 端口 0 时取回系统分配的端口
        socklen_t len = sizeof(addr);
        if (getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
            Log::error(std::string("getsockname failed: ") + std::strerror(errno));
            return false;
        }

        localAddr_ = SocketAddress(addr);
        return true;
    }

    ssize_t UdpSocket::sendTo(const void *data, size_t length, const SocketAddress &address) {
        const sockaddr_in &addr = address.raw();
        return ::sendto(fd_, data, length, 0, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
    }

    ssize_t UdpSocket::recvFrom(void *buffer, size_t length, SocketAddress &sender) {
        sockaddr_in addr;
        socklen_t addrLen = sizeof(addr);
        memset(&addr, 0, sizeof(addr));

        ssize_t received = ::recvfrom(fd_, buffer, length, 0, reinterpret_cast<sockaddr *>(&addr), &addrLen);
        if (received >= 0) {
            sender = SocketAddress(addr);
        }
        return received;
    }

    bool UdpSocket::setRecvTimeout(int timeoutMs) {
        if (timeoutMs == recvTimeoutMs_) {
            return true;
        }
        // 0 会被内核当作永不超时
        int effective = std::max(timeoutMs, 1);

        struct timeval timeout;
        timeout.tv_sec = effective / 1000;
        timeout.tv_usec = (effective % 1000) * 1000;
        if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0) {
            return false;
        }
        recvTimeoutMs_ = timeoutMs;
        return true;
    }

    bool UdpSocket::setRecvBufferSize(int size) {
        return setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)) == 0;
    }

    bool UdpSocket::setReuseAddress(bool reuse) {
        int opt = reuse ? 1 : 0;
        return setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == 0;
    }

    // UdpServer 实现
    UdpServer::~UdpServer() {
        stop();
    }

    bool UdpServer::start(uint16_t port, const std::string &bindIP) {
        if (running_) {
            return false;
        }

        auto socket = std::make_unique<UdpSocket>();
        if (!socket->setReuseAddress(true)) {
            Log::warn("Failed to set SO_REUSEADDR");
        }

        if (!socket->bind(port, bindIP)) {
            return false;
        }

        if (!socket->setRecvBufferSize(RECV_BUFFER_BYTES)) {
            Log::warn("Failed to set receive buffer size");
        }

        // 周期性超时，用于检查 running_
        if (!socket->setRecvTimeout(POLL_INTERVAL_MS)) {
            Log::error(std::string("Failed to set receive timeout: ") + std::strerror(errno));
            return false;
        }

        socket_ = std::move(socket);
        running_ = true;
        thread_ = std::thread(&UdpServer::receiveLoop, this);
        return true;
    }

    void UdpServer::stop() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void UdpServer::receiveLoop() {
        std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
        SocketAddress sender;

        while (running_) {
            ssize_t received = socket_->recvFrom(buffer.data(), buffer.size(), sender);

            if (received < 0) {
                if (errno != EWOULDBLOCK && errno != EAGAIN && errno != EINTR && errno != ECONNREFUSED) {
                    Log::error(std::string("recvfrom failed: ") + std::strerror(errno));
                    if (errno == EBADF) {
                        running_ = false;
                    }
                }
                continue;
            }

            PacketHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlerMutex_);
                handler = packetHandler_;
            }
            if (!handler) {
                continue;
            }

            try {
                handler(buffer.data(), static_cast<size_t>(received), sender);
            } catch (const std::exception &e) {
                Log::error("Handler failed for datagram from " + sender.toString() + ": " + e.what());
            }
        }
    }

    void UdpServer::setPacketHandler(PacketHandler handler) {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        packetHandler_ = std::move(handler);
    }

    bool UdpServer::sendTo(const uint8_t *data, size_t len, const SocketAddress &addr) {
        if (!socket_) {
            return false;
        }

        std::lock_guard<std::mutex> lock(sendMutex_);
        return socket_->sendTo(data, len, addr) == static_cast<ssize_t>(len);
    }

    uint16_t UdpServer::port() const {
        return socket_ ? socket_->getLocalPort() : 0;
    }
} // namespace udpfetch
