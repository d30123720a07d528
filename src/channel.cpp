#include "channel.h"
#include "utils.h"

#include <cerrno>

namespace udpfetch {
    UdpChannel::UdpChannel(const SocketAddress &server, bool declareClientPort)
        : server_(server)
          , declareClientPort_(declareClientPort)
          , buffer_(MAX_DATAGRAM_SIZE) {
        if (!socket_.bind(0)) {
            throw std::runtime_error("Failed to bind client socket");
        }
        if (!socket_.setRecvBufferSize(1024 * 1024)) {
            Log::debug("Failed to enlarge receive buffer on port " + std::to_string(socket_.getLocalPort()));
        }
    }

    bool UdpChannel::send(const Packet &packet) {
        std::vector<uint8_t> bytes;
        if (declareClientPort_ && !packet.clientPort) {
            Packet stamped = packet;
            stamped.clientPort = socket_.getLocalPort();
            bytes = stamped.serialize();
        } else {
            bytes = packet.serialize();
        }

        ssize_t sent = socket_.sendTo(bytes.data(), bytes.size(), server_);
        if (sent != static_cast<ssize_t>(bytes.size())) {
            Log::warn("sendto " + server_.toString() + " failed: " + std::strerror(errno));
            return false;
        }
        return true;
    }

    bool UdpChannel::receive(Packet &packet, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return false;
            }

            if (!socket_.setRecvTimeout(static_cast<int>(remaining.count()))) {
                Log::error(std::string("Failed to set receive timeout: ") + std::strerror(errno));
                return false;
            }

            SocketAddress sender;
            ssize_t received = socket_.recvFrom(buffer_.data(), buffer_.size(), sender);
            if (received <= 0) {
                if (received < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    Log::warn(std::string("recvfrom failed: ") + std::strerror(errno));
                }
                continue;
            }

            if (sender != server_) {
                Log::debug("Dropping datagram from unexpected peer " + sender.toString());
                continue;
            }

            try {
                packet = Packet::deserialize(buffer_.data(), static_cast<size_t>(received));
                return true;
            } catch (const ProtocolError &e) {
                Log::warn(std::string("Dropping malformed packet: ") + e.what());
            }
        }
    }
} // namespace udpfetch
