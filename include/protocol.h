#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>

namespace udpfetch {
    // 控制帧保留序号
    constexpr int64_t START_SEQUENCE = -1;
    // END 单独用 -2，不与 START 共用 -1，迟到的 START ACK 不会被当成 END ACK
    constexpr int64_t END_SEQUENCE = -2;

    // IPv4 UDP最大载荷
    constexpr size_t MAX_DATAGRAM_SIZE = 65507;

    // 服务器拒绝不存在文件时 ERROR.message 的前缀
    constexpr const char *NOT_FOUND_MESSAGE = "File not found";

    // base64后的DATA包必须能装进一个数据报
    constexpr uint32_t MAX_CHUNK_SIZE = 32768;

    enum class PacketType : uint8_t {
        LIST,
        DOWNLOAD,
        START,
        DATA,
        END,
        ACK,
        NACK,
        ERROR
    };

    const char *packetTypeName(PacketType type);

    // 解码/编码失败，调用方丢弃该包继续
    class ProtocolError : public std::runtime_error {
    public:
        explicit ProtocolError(const std::string &what) : std::runtime_error(what) {
        }
    };

    // 线上数据包。每种类型只携带它合法的字段，deserialize 时按类型校验
    class Packet {
    public:
        PacketType type = PacketType::ERROR;
        std::string fileName;
        int64_t sequence = START_SEQUENCE;

        std::optional<uint64_t> transferId;
        std::optional<uint64_t> offset;
        std::optional<uint64_t> length;
        std::optional<uint32_t> totalChunks;
        std::optional<std::vector<uint8_t> > payload;
        std::optional<std::string> checksum;
        std::optional<uint16_t> clientPort;

        std::string message; // ERROR
        std::map<std::string, uint64_t> files; // LIST 应答

        static Packet makeList();

        static Packet makeListReply(const std::map<std::string, uint64_t> &files);

        static Packet makeDownload(const std::string &fileName, uint64_t offset, uint64_t length);

        static Packet makeStart(const std::string &fileName, uint64_t transferId, uint32_t totalChunks,
                                uint64_t offset, uint64_t length);

        // 计算载荷校验和
        static Packet makeData(const std::string &fileName, uint64_t transferId, uint32_t sequence,
                               uint64_t offset, std::vector<uint8_t> payload);

        static Packet makeEnd(const std::string &fileName, uint64_t transferId);

        static Packet makeAck(const std::string &fileName, int64_t sequence,
                              std::optional<uint64_t> transferId = std::nullopt);

        static Packet makeNack(const std::string &fileName, int64_t sequence,
                               std::optional<uint64_t> transferId = std::nullopt);

        static Packet makeError(const std::string &fileName, const std::string &message,
                                std::optional<uint64_t> transferId = std::nullopt);

        bool isControlFrame() const {
            return sequence == START_SEQUENCE || sequence == END_SEQUENCE;
        }

        // 编码为JSON文本，违反字段约束时抛 ProtocolError
        std::vector<uint8_t> serialize() const;

        static Packet deserialize(const uint8_t *buffer, size_t length);

        static Packet deserialize(const std::vector<uint8_t> &buffer) {
            return deserialize(buffer.data(), buffer.size());
        }
    };

    // BLAKE3-256，小写十六进制
    std::string computeChecksum(const uint8_t *data, size_t length);

    inline std::string computeChecksum(const std::vector<uint8_t> &data) {
        return computeChecksum(data.data(), data.size());
    }

    bool verifyChecksum(const std::vector<uint8_t> &payload, const std::string &checksum);

    std::string encodeBase64(const std::vector<uint8_t> &data);

    std::vector<uint8_t> decodeBase64(const std::string &text);

    // ceil(length / chunkSize)，块数超出 uint32 序号范围时抛 std::invalid_argument
    inline uint32_t chunkCount(uint64_t length, uint32_t chunkSize) {
        if (chunkSize == 0) {
            throw std::invalid_argument("chunk size must be positive");
        }
        uint64_t count = length / chunkSize + (length % chunkSize != 0 ? 1 : 0);
        if (count > UINT32_MAX) {
            throw std::invalid_argument(std::to_string(length) + " bytes need " + std::to_string(count) +
                                        " chunks of " + std::to_string(chunkSize) + " bytes, more than " +
                                        std::to_string(UINT32_MAX));
        }
        return static_cast<uint32_t>(count);
    }
} // namespace udpfetch
