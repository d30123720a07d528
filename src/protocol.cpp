#include "protocol.h"

#include <iomanip>
#include <limits>
#include <sstream>

#include <blake3.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

using json = nlohmann::json;

namespace udpfetch {
    namespace {
        const char *const TYPE_NAMES[] = {
            "LIST", "DOWNLOAD", "START", "DATA", "END", "ACK", "NACK", "ERROR"
        };

        PacketType parseType(const std::string &name) {
            for (uint8_t i = 0; i <= static_cast<uint8_t>(PacketType::ERROR); ++i) {
                if (name == TYPE_NAMES[i]) {
                    return static_cast<PacketType>(i);
                }
            }
            throw ProtocolError("Unknown packet type: " + name);
        }

        bool needsFileName(PacketType type) {
            switch (type) {
                case PacketType::DOWNLOAD:
                case PacketType::START:
                case PacketType::DATA:
                case PacketType::END:
                case PacketType::ACK:
                case PacketType::NACK:
                    return true;
                default:
                    return false;
            }
        }

        // 编解码两侧共用的字段约束
        void validate(const Packet &packet) {
            if (needsFileName(packet.type) && packet.fileName.empty()) {
                throw ProtocolError(std::string(packetTypeName(packet.type)) + " packet without file_name");
            }

            if (packet.type == PacketType::DATA) {
                if (packet.payload.has_value() != packet.checksum.has_value()) {
                    throw ProtocolError("DATA payload and checksum must be sent together");
                }
                if (!packet.payload) {
                    throw ProtocolError("DATA packet without payload");
                }
                if (packet.sequence < 0) {
                    throw ProtocolError("DATA packet with negative sequence");
                }
            } else if (packet.payload || packet.checksum) {
                throw ProtocolError(std::string("payload/checksum not allowed on ") +
                                    packetTypeName(packet.type));
            }

            if (packet.type == PacketType::START && !packet.totalChunks) {
                throw ProtocolError("START packet without total_chunks");
            }

            if ((packet.type == PacketType::ACK || packet.type == PacketType::NACK) &&
                packet.sequence < END_SEQUENCE) {
                throw ProtocolError("Invalid acknowledgement sequence");
            }
        }

        uint64_t unsignedField(const json &j, const char *key, uint64_t maxValue) {
            const json &value = j.at(key);
            if (!value.is_number_unsigned()) {
                throw ProtocolError(std::string("Field '") + key + "' must be a non-negative integer");
            }
            uint64_t v = value.get<uint64_t>();
            if (v > maxValue) {
                throw ProtocolError(std::string("Field '") + key + "' out of range");
            }
            return v;
        }

        std::string stringField(const json &j, const char *key) {
            const json &value = j.at(key);
            if (!value.is_string()) {
                throw ProtocolError(std::string("Field '") + key + "' must be a string");
            }
            return value.get<std::string>();
        }

        bool has(const json &j, const char *key) {
            auto it = j.find(key);
            return it != j.end() && !it->is_null();
        }
    } // namespace

    const char *packetTypeName(PacketType type) {
        auto index = static_cast<uint8_t>(type);
        if (index > static_cast<uint8_t>(PacketType::ERROR)) {
            return "UNKNOWN";
        }
        return TYPE_NAMES[index];
    }

    Packet Packet::makeList() {
        Packet p;
        p.type = PacketType::LIST;
        return p;
    }

    Packet Packet::makeListReply(const std::map<std::string, uint64_t> &files) {
        Packet p;
        p.type = PacketType::LIST;
        p.files = files;
        return p;
    }

    Packet Packet::makeDownload(const std::string &fileName, uint64_t offset, uint64_t length) {
        Packet p;
        p.type = PacketType::DOWNLOAD;
        p.fileName = fileName;
        p.offset = offset;
        p.length = length;
        return p;
    }

    Packet Packet::makeStart(const std::string &fileName, uint64_t transferId, uint32_t totalChunks,
                             uint64_t offset, uint64_t length) {
        Packet p;
        p.type = PacketType::START;
        p.fileName = fileName;
        p.sequence = START_SEQUENCE;
        p.transferId = transferId;
        p.totalChunks = totalChunks;
        p.offset = offset;
        p.length = length;
        return p;
    }

    Packet Packet::makeData(const std::string &fileName, uint64_t transferId, uint32_t sequence,
                            uint64_t offset, std::vector<uint8_t> payload) {
        Packet p;
        p.type = PacketType::DATA;
        p.fileName = fileName;
        p.sequence = sequence;
        p.transferId = transferId;
        p.offset = offset;
        p.checksum = computeChecksum(payload);
        p.payload = std::move(payload);
        return p;
    }

    Packet Packet::makeEnd(const std::string &fileName, uint64_t transferId) {
        Packet p;
        p.type = PacketType::END;
        p.fileName = fileName;
        p.sequence = END_SEQUENCE;
        p.transferId = transferId;
        return p;
    }

    Packet Packet::makeAck(const std::string &fileName, int64_t sequence,
                           std::optional<uint64_t> transferId) {
        Packet p;
        p.type = PacketType::ACK;
        p.fileName = fileName;
        p.sequence = sequence;
        p.transferId = transferId;
        return p;
    }

    Packet Packet::makeNack(const std::string &fileName, int64_t sequence,
                            std::optional<uint64_t> transferId) {
        Packet p = makeAck(fileName, sequence, transferId);
        p.type = PacketType::NACK;
        return p;
    }

    Packet Packet::makeError(const std::string &fileName, const std::string &message,
                             std::optional<uint64_t> transferId) {
        Packet p;
        p.type = PacketType::ERROR;
        p.fileName = fileName;
        p.message = message;
        p.transferId = transferId;
        return p;
    }

    std::vector<uint8_t> Packet::serialize() const {
        validate(*this);

        json j;
        j["type"] = packetTypeName(type);
        j["sequence"] = sequence;
        if (!fileName.empty()) j["file_name"] = fileName;
        if (transferId) j["transfer_id"] = *transferId;
        if (offset) j["offset"] = *offset;
        if (length) j["length"] = *length;
        if (totalChunks) j["total_chunks"] = *totalChunks;
        if (payload) j["payload"] = encodeBase64(*payload);
        if (checksum) j["checksum"] = *checksum;
        if (clientPort) j["client_port"] = *clientPort;
        if (!message.empty()) j["message"] = message;
        if (type == PacketType::LIST && !files.empty()) {
            j["files"] = files;
        }

        std::string text;
        try {
            text = j.dump();
        } catch (const json::exception &e) {
            // 非UTF-8文件名
            throw ProtocolError(std::string("Cannot encode packet: ") + e.what());
        }

        if (text.size() > MAX_DATAGRAM_SIZE) {
            throw ProtocolError("Encoded packet exceeds datagram size: " + std::to_string(text.size()));
        }
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    Packet Packet::deserialize(const uint8_t *buffer, size_t length) {
        if (buffer == nullptr || length == 0) {
            throw ProtocolError("Empty datagram");
        }

        json j;
        try {
            j = json::parse(buffer, buffer + length);
        } catch (const json::parse_error &e) {
            throw ProtocolError(std::string("Malformed packet: ") + e.what());
        }

        if (!j.is_object()) {
            throw ProtocolError("Packet is not a JSON object");
        }

        Packet packet;
        try {
            packet.type = parseType(stringField(j, "type"));

            if (has(j, "file_name")) packet.fileName = stringField(j, "file_name");

            if (has(j, "sequence")) {
                const json &seq = j.at("sequence");
                if (!seq.is_number_integer()) {
                    throw ProtocolError("Field 'sequence' must be an integer");
                }
                packet.sequence = seq.get<int64_t>();
            }

            const uint64_t u64max = std::numeric_limits<uint64_t>::max();
            if (has(j, "transfer_id")) packet.transferId = unsignedField(j, "transfer_id", u64max);
            if (has(j, "offset")) packet.offset = unsignedField(j, "offset", u64max);
            if (has(j, "length")) packet.length = unsignedField(j, "length", u64max);
            if (has(j, "total_chunks")) {
                packet.totalChunks = static_cast<uint32_t>(
                    unsignedField(j, "total_chunks", std::numeric_limits<uint32_t>::max()));
            }
            if (has(j, "client_port")) {
                packet.clientPort = static_cast<uint16_t>(
                    unsignedField(j, "client_port", std::numeric_limits<uint16_t>::max()));
            }
            if (has(j, "checksum")) packet.checksum = stringField(j, "checksum");
            if (has(j, "payload")) packet.payload = decodeBase64(stringField(j, "payload"));
            if (has(j, "message")) packet.message = stringField(j, "message");

            if (packet.type == PacketType::LIST && has(j, "files")) {
                const json &files = j.at("files");
                if (!files.is_object()) {
                    throw ProtocolError("Field 'files' must be an object");
                }
                for (auto it = files.begin(); it != files.end(); ++it) {
                    if (!it.value().is_number_unsigned()) {
                        throw ProtocolError("Invalid size for file " + it.key());
                    }
                    packet.files[it.key()] = it.value().get<uint64_t>();
                }
            }
        } catch (const json::exception &e) {
            throw ProtocolError(std::string("Invalid packet field: ") + e.what());
        }

        validate(packet);
        return packet;
    }

    std::string computeChecksum(const uint8_t *data, size_t length) {
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, data, length);

        uint8_t hash[BLAKE3_OUT_LEN];
        blake3_hasher_finalize(&hasher, hash, BLAKE3_OUT_LEN);

        std::stringstream ss;
        for (size_t i = 0; i < BLAKE3_OUT_LEN; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(hash[i]);
        }
        return ss.str();
    }

    bool verifyChecksum(const std::vector<uint8_t> &payload, const std::string &checksum) {
        return computeChecksum(payload) == checksum;
    }

    std::string encodeBase64(const std::vector<uint8_t> &data) {
        if (data.empty()) {
            return std::string();
        }

        std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                      data.data(), static_cast<int>(data.size()));
        if (written < 0) {
            throw ProtocolError("base64 encoding failed");
        }
        out.resize(static_cast<size_t>(written));
        return out;
    }

    std::vector<uint8_t> decodeBase64(const std::string &text) {
        if (text.empty()) {
            return {};
        }
        if (text.size() % 4 != 0) {
            throw ProtocolError("Invalid base64 length");
        }

        std::vector<uint8_t> out(text.size() / 4 * 3);
        int decoded = EVP_DecodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char *>(text.data()),
                                      static_cast<int>(text.size()));
        if (decoded < 0) {
            throw ProtocolError("Invalid base64 payload");
        }

        // EVP_DecodeBlock 会把填充位也算进长度
        size_t padding = 0;
        if (text[text.size() - 1] == '=') ++padding;
        if (text[text.size() - 2] == '=') ++padding;

        out.resize(static_cast<size_t>(decoded) - padding);
        return out;
    }
} // namespace udpfetch
