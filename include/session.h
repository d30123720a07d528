#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>

#include "channel.h"
#include "protocol.h"

namespace udpfetch {

class SessionConfig {
public:
    uint32_t chunkSize = 8192;         // bytes
    uint32_t ackTimeoutMs = 1000;      // ms
    uint32_t maxRetries = 5;
    uint32_t maxIdleTimeouts = 10;     // 接收方连续超时上限
    uint32_t lingerMs = 1000;          // ms

    std::chrono::milliseconds ackTimeout() const {
        return std::chrono::milliseconds(ackTimeoutMs);
    }
};

enum class FailureReason {
    NONE,
    TIMEOUT,
    NOT_FOUND,
    INCOMPLETE,
    REMOTE_ERROR,
    IO_ERROR,
    SHUTDOWN
};

const char* failureReasonName(FailureReason reason);

// 已发送块的缓存，NACK 时原样重发
struct ChunkRecord {
    uint32_t sequence = 0;
    uint64_t offset = 0;
    std::vector<uint8_t> payload;
    std::string checksum;
};

class ChunkCache {
public:
    virtual ~ChunkCache() = default;

    virtual void put(const ChunkRecord& record) = 0;

    virtual bool get(uint32_t sequence, ChunkRecord& record) const = 0;
};

class MemoryChunkCache : public ChunkCache {
public:
    void put(const ChunkRecord& record) override;
    bool get(uint32_t sequence, ChunkRecord& record) const override;
    size_t size() const;

private:
    std::map<uint32_t, ChunkRecord> records_;
    mutable std::mutex mutex_;
};

// 停等式发送方：START -> DATA* -> END，每一步等待确认
class ChunkSender {
public:
    enum class State {
        IDLE,
        AWAIT_START_ACK,
        STREAMING_CHUNK,
        AWAIT_CHUNK_ACK,
        AWAIT_END_ACK,
        DONE,
        FAILED
    };

    // 读取 [offset, offset+length)，失败时抛异常
    using ChunkReader = std::function<std::vector<uint8_t>(uint64_t offset, size_t length)>;
    using StateCallback = std::function<void(State state, uint32_t sequence, uint32_t retransmits)>;

    ChunkSender(PacketChannel& channel, ChunkCache& cache, const SessionConfig& config,
                const std::string& fileName, uint64_t transferId,
                uint64_t offset, uint64_t length, ChunkReader reader);

    void setStateCallback(StateCallback callback) { stateCallback_ = std::move(callback); }
    void setStopFlag(const std::atomic<bool>* stopFlag) { stopFlag_ = stopFlag; }

    // 阻塞直到 DONE 或 FAILED
    bool run();

    State state() const { return state_; }
    FailureReason failure() const { return failure_; }
    const std::string& error() const { return error_; }

    uint32_t totalChunks() const { return totalChunks_; }
    uint32_t currentSequence() const { return currentSequence_; }
    uint32_t retransmits() const { return retransmits_; }

private:
    enum class WaitResult {
        ACKED,
        NACKED,
        TIMED_OUT,
        ABORTED,
        STOPPED
    };

    bool sendAndAwait(const Packet& packet, int64_t sequence, const char* what);
    WaitResult awaitAck(int64_t sequence, std::chrono::steady_clock::time_point deadline);
    bool resend(const Packet& packet, int64_t sequence);
    void resendCached(uint32_t sequence);
    Packet packetFromRecord(const ChunkRecord& record) const;
    void setState(State state);
    void fail(FailureReason reason, const std::string& message, bool notifyPeer);
    bool stopRequested() const { return stopFlag_ && stopFlag_->load(); }

    PacketChannel& channel_;
    ChunkCache& cache_;
    SessionConfig config_;
    std::string fileName_;
    uint64_t transferId_;
    uint64_t offset_;
    uint64_t length_;
    ChunkReader reader_;

    StateCallback stateCallback_;
    const std::atomic<bool>* stopFlag_ = nullptr;

    State state_ = State::IDLE;
    FailureReason failure_ = FailureReason::NONE;
    std::string error_;
    std::string peerError_;
    uint32_t totalChunks_ = 0;
    uint32_t currentSequence_ = 0;
    uint32_t retransmits_ = 0;
};

// 接收方：AWAIT_START -> RECEIVING -> REASSEMBLED | INCOMPLETE
class ChunkReceiver {
public:
    enum class State {
        AWAIT_START,
        RECEIVING,
        REASSEMBLED,
        INCOMPLETE
    };

    using ProgressCallback = std::function<void(size_t newBytes)>;

    ChunkReceiver(PacketChannel& channel, const SessionConfig& config,
                  const std::string& fileName, uint64_t offset, uint64_t length);

    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }
    void setStopFlag(const std::atomic<bool>* stopFlag) { stopFlag_ = stopFlag; }

    // 发送 DOWNLOAD 并驱动状态机直到终态
    bool run();

    // REASSEMBLED 之后保留通道 lingerMs，对重复的 END 再次确认
    void linger();

    // 处理一个入站包（可能通过通道回复 ACK/NACK）
    void handlePacket(const Packet& packet);

    State state() const { return state_; }
    FailureReason failure() const { return failure_; }
    const std::string& error() const { return error_; }

    uint32_t totalChunks() const { return totalChunks_; }
    size_t storedChunks() const { return chunks_.size(); }
    bool hasChunk(uint32_t sequence) const { return chunks_.count(sequence) != 0; }
    uint64_t receivedBytes() const { return receivedBytes_; }
    std::optional<uint64_t> transferId() const { return transferId_; }

    // 按序号升序拼接
    std::vector<uint8_t> assemble() const;

private:
    void onStart(const Packet& packet);
    void onData(const Packet& packet);
    void onEnd(const Packet& packet);
    void onError(const Packet& packet);
    void reply(const Packet& packet);
    void finish(State state, FailureReason reason, const std::string& message);
    bool isTerminal() const { return state_ == State::REASSEMBLED || state_ == State::INCOMPLETE; }
    bool stopRequested() const { return stopFlag_ && stopFlag_->load(); }

    PacketChannel& channel_;
    SessionConfig config_;
    std::string fileName_;
    uint64_t offset_;
    uint64_t length_;

    ProgressCallback progressCallback_;
    const std::atomic<bool>* stopFlag_ = nullptr;

    State state_ = State::AWAIT_START;
    FailureReason failure_ = FailureReason::NONE;
    std::string error_;
    std::optional<uint64_t> transferId_;
    uint32_t totalChunks_ = 0;
    uint64_t receivedBytes_ = 0;
    std::map<uint32_t, std::vector<uint8_t>> chunks_;
};

} // namespace udpfetch
