#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "protocol.h"
#include "socket.h"

namespace udpfetch {
    // 一条不可靠的包通道。可靠性协议只依赖这两个操作
    class PacketChannel {
    public:
        virtual ~PacketChannel() = default;

        // 发送失败返回 false（数据报语义，不重试）
        virtual bool send(const Packet &packet) = 0;

        // 在 timeout 内收到一个可解码的包返回 true；坏包丢弃后继续等待
        virtual bool receive(Packet &packet, std::chrono::milliseconds timeout) = 0;
    };

    // 客户端通道：独占一个UDP socket，只接受来自服务器地址的包
    class UdpChannel : public PacketChannel {
    public:
        UdpChannel(const SocketAddress &server, bool declareClientPort);

        bool send(const Packet &packet) override;

        bool receive(Packet &packet, std::chrono::milliseconds timeout) override;

        uint16_t localPort() const { return socket_.getLocalPort(); }

    private:
        UdpSocket socket_;
        SocketAddress server_;
        bool declareClientPort_;
        std::vector<uint8_t> buffer_;
    };
} // namespace udpfetch
