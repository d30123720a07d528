#include "session.h"
#include "utils.h"

#include <algorithm>

namespace udpfetch {

const char* failureReasonName(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "none";
        case FailureReason::TIMEOUT: return "timeout";
        case FailureReason::NOT_FOUND: return "not found";
        case FailureReason::INCOMPLETE: return "incomplete";
        case FailureReason::REMOTE_ERROR: return "remote error";
        case FailureReason::IO_ERROR: return "I/O error";
        case FailureReason::SHUTDOWN: return "shutdown";
    }
    return "unknown";
}

// MemoryChunkCache 实现
void MemoryChunkCache::put(const ChunkRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.sequence] = record;
}

bool MemoryChunkCache::get(uint32_t sequence, ChunkRecord& record) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(sequence);
    if (it == records_.end()) {
        return false;
    }
    record = it->second;
    return true;
}

size_t MemoryChunkCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ChunkSender 实现
ChunkSender::ChunkSender(PacketChannel& channel, ChunkCache& cache, const SessionConfig& config,
                         const std::string& fileName, uint64_t transferId,
                         uint64_t offset, uint64_t length, ChunkReader reader)
    : channel_(channel)
    , cache_(cache)
    , config_(config)
    , fileName_(fileName)
    , transferId_(transferId)
    , offset_(offset)
    , length_(length)
    , reader_(std::move(reader)) {
    totalChunks_ = chunkCount(length_, config_.chunkSize);
}

bool ChunkSender::run() {
    setState(State::AWAIT_START_ACK);

    Packet start = Packet::makeStart(fileName_, transferId_, totalChunks_, offset_, length_);
    if (!sendAndAwait(start, START_SEQUENCE, "START")) {
        return false;
    }

    for (uint32_t seq = 0; seq < totalChunks_; ++seq) {
        currentSequence_ = seq;
        setState(State::STREAMING_CHUNK);

        uint64_t chunkOffset = offset_ + static_cast<uint64_t>(seq) * config_.chunkSize;
        size_t chunkLength = static_cast<size_t>(
            std::min<uint64_t>(config_.chunkSize, offset_ + length_ - chunkOffset));

        std::vector<uint8_t> bytes;
        try {
            bytes = reader_(chunkOffset, chunkLength);
        } catch (const std::exception& e) {
            fail(FailureReason::IO_ERROR, std::string("Read failed: ") + e.what(), true);
            return false;
        }

        if (bytes.size() != chunkLength) {
            fail(FailureReason::IO_ERROR, "Short read at offset " + std::to_string(chunkOffset), true);
            return false;
        }

        Packet data = Packet::makeData(fileName_, transferId_, seq, chunkOffset, std::move(bytes));

        ChunkRecord record;
        record.sequence = seq;
        record.offset = chunkOffset;
        record.payload = *data.payload;
        record.checksum = *data.checksum;
        cache_.put(record);

        setState(State::AWAIT_CHUNK_ACK);
        if (!sendAndAwait(data, seq, "DATA")) {
            return false;
        }
    }

    setState(State::AWAIT_END_ACK);
    if (!sendAndAwait(Packet::makeEnd(fileName_, transferId_), END_SEQUENCE, "END")) {
        return false;
    }

    setState(State::DONE);
    return true;
}

bool ChunkSender::sendAndAwait(const Packet& packet, int64_t sequence, const char* what) {
    if (!channel_.send(packet)) {
        Log::debug(std::string("Initial ") + what + " send failed, waiting for retry");
    }

    uint32_t retries = 0;
    while (true) {
        auto deadline = std::chrono::steady_clock::now() + config_.ackTimeout();
        WaitResult result = awaitAck(sequence, deadline);

        switch (result) {
            case WaitResult::ACKED:
                return true;

            case WaitResult::ABORTED:
                fail(FailureReason::REMOTE_ERROR, "Peer aborted transfer: " + peerError_, false);
                return false;

            case WaitResult::STOPPED:
                fail(FailureReason::SHUTDOWN, "Server shutting down", true);
                return false;

            case WaitResult::NACKED:
            case WaitResult::TIMED_OUT:
                break;
        }

        if (retries >= config_.maxRetries) {
            std::string target = sequence >= 0 ? "chunk " + std::to_string(sequence) : std::string(what);
            fail(FailureReason::TIMEOUT,
                 "No acknowledgement for " + target + " after " + std::to_string(retries) + " retries",
                 true);
            return false;
        }

        ++retries;
        ++retransmits_;
        Log::debug(std::string("Retransmitting ") + what + " seq=" + std::to_string(sequence) +
                   " of " + fileName_ + " (" + (result == WaitResult::NACKED ? "NACK" : "timeout") +
                   ", retry " + std::to_string(retries) + ")");

        resend(packet, sequence);
        if (stateCallback_) {
            stateCallback_(state_, currentSequence_, retransmits_);
        }
    }
}

ChunkSender::WaitResult ChunkSender::awaitAck(int64_t sequence,
                                              std::chrono::steady_clock::time_point deadline) {
    // 分片等待，便于及时响应停止信号
    const auto slice = std::chrono::milliseconds(200);

    while (true) {
        if (stopRequested()) {
            return WaitResult::STOPPED;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return WaitResult::TIMED_OUT;
        }

        Packet packet;
        if (!channel_.receive(packet, std::min(remaining, slice))) {
            continue;
        }

        if (packet.transferId && *packet.transferId != transferId_) {
            Log::debug("Ignoring packet for transfer " + std::to_string(*packet.transferId));
            continue;
        }

        switch (packet.type) {
            case PacketType::ACK:
                if (packet.sequence == sequence) {
                    return WaitResult::ACKED;
                }
                // 迟到的重复确认
                break;

            case PacketType::NACK:
                if (packet.sequence == sequence) {
                    return WaitResult::NACKED;
                }
                if (packet.sequence >= 0) {
                    resendCached(static_cast<uint32_t>(packet.sequence));
                }
                break;

            case PacketType::ERROR:
                peerError_ = packet.message;
                return WaitResult::ABORTED;

            default:
                Log::debug(std::string("Unexpected ") + packetTypeName(packet.type) +
                           " while awaiting acknowledgement");
                break;
        }
    }
}

bool ChunkSender::resend(const Packet& packet, int64_t sequence) {
    if (packet.type == PacketType::DATA) {
        ChunkRecord record;
        if (cache_.get(static_cast<uint32_t>(sequence), record)) {
            return channel_.send(packetFromRecord(record));
        }
        Log::warn("Chunk " + std::to_string(sequence) + " of " + fileName_ +
                  " missing from cache, resending in-flight copy");
    }
    return channel_.send(packet);
}

void ChunkSender::resendCached(uint32_t sequence) {
    ChunkRecord record;
    if (!cache_.get(sequence, record)) {
        Log::warn("NACK for uncached chunk " + std::to_string(sequence) + " of " + fileName_ + " ignored");
        return;
    }
    ++retransmits_;
    channel_.send(packetFromRecord(record));
}

Packet ChunkSender::packetFromRecord(const ChunkRecord& record) const {
    Packet p;
    p.type = PacketType::DATA;
    p.fileName = fileName_;
    p.sequence = record.sequence;
    p.transferId = transferId_;
    p.offset = record.offset;
    p.payload = record.payload;
    p.checksum = record.checksum;
    return p;
}

void ChunkSender::setState(State state) {
    state_ = state;
    if (stateCallback_) {
        stateCallback_(state_, currentSequence_, retransmits_);
    }
}

void ChunkSender::fail(FailureReason reason, const std::string& message, bool notifyPeer) {
    failure_ = reason;
    error_ = message;
    Log::warn("Transfer " + std::to_string(transferId_) + " (" + fileName_ + ") failed: " + message);

    // ERROR 只发一次，不重试
    if (notifyPeer) {
        channel_.send(Packet::makeError(fileName_, message, transferId_));
    }
    setState(State::FAILED);
}

// ChunkReceiver 实现
ChunkReceiver::ChunkReceiver(PacketChannel& channel, const SessionConfig& config,
                             const std::string& fileName, uint64_t offset, uint64_t length)
    : channel_(channel)
    , config_(config)
    , fileName_(fileName)
    , offset_(offset)
    , length_(length) {
}

bool ChunkReceiver::run() {
    Packet request = Packet::makeDownload(fileName_, offset_, length_);
    channel_.send(request);

    uint32_t idleTimeouts = 0;
    while (!isTerminal()) {
        if (stopRequested()) {
            channel_.send(Packet::makeError(fileName_, "Client shutting down", transferId_));
            finish(State::INCOMPLETE, FailureReason::SHUTDOWN, "Download cancelled");
            break;
        }

        Packet packet;
        if (!channel_.receive(packet, config_.ackTimeout())) {
            ++idleTimeouts;
            if (idleTimeouts > config_.maxIdleTimeouts) {
                finish(State::INCOMPLETE, FailureReason::TIMEOUT,
                       "No packet from server after " + std::to_string(idleTimeouts) + " timeouts (" +
                       std::to_string(chunks_.size()) + "/" + std::to_string(totalChunks_) + " chunks)");
                break;
            }
            // 请求或 START 丢失
            if (state_ == State::AWAIT_START) {
                Log::debug("Resending DOWNLOAD for " + fileName_ + " @" + std::to_string(offset_));
                channel_.send(request);
            }
            continue;
        }

        idleTimeouts = 0;
        handlePacket(packet);
    }

    return state_ == State::REASSEMBLED;
}

void ChunkReceiver::handlePacket(const Packet& packet) {
    if (!packet.fileName.empty() && packet.fileName != fileName_) {
        Log::debug("Ignoring packet for " + packet.fileName);
        return;
    }

    // 锁定第一个 START 的 transfer_id，其他传输的包一律忽略
    if (transferId_ && packet.transferId && *packet.transferId != *transferId_) {
        Log::debug("Ignoring " + std::string(packetTypeName(packet.type)) +
                   " from stale transfer " + std::to_string(*packet.transferId));
        return;
    }

    switch (packet.type) {
        case PacketType::START:
            onStart(packet);
            break;
        case PacketType::DATA:
            onData(packet);
            break;
        case PacketType::END:
            onEnd(packet);
            break;
        case PacketType::ERROR:
            onError(packet);
            break;
        default:
            Log::debug(std::string("Receiver ignoring ") + packetTypeName(packet.type));
            break;
    }
}

void ChunkReceiver::onStart(const Packet& packet) {
    if (state_ == State::INCOMPLETE) {
        return;
    }

    if (state_ == State::AWAIT_START) {
        transferId_ = packet.transferId;
        totalChunks_ = packet.totalChunks.value_or(0);
        state_ = State::RECEIVING;
        Log::debug("Transfer " + (transferId_ ? std::to_string(*transferId_) : std::string("?")) +
                   " for " + fileName_ + " started: " + std::to_string(totalChunks_) + " chunks");
    }

    // 重复的 START 再确认一次，不重置状态
    reply(Packet::makeAck(fileName_, START_SEQUENCE, transferId_));
}

void ChunkReceiver::onData(const Packet& packet) {
    if (state_ != State::RECEIVING && state_ != State::REASSEMBLED) {
        return;
    }

    if (packet.sequence < 0 || packet.sequence >= static_cast<int64_t>(totalChunks_)) {
        Log::warn("Dropping DATA with out-of-range sequence " + std::to_string(packet.sequence));
        return;
    }

    auto seq = static_cast<uint32_t>(packet.sequence);
    if (!verifyChecksum(*packet.payload, *packet.checksum)) {
        Log::debug("Checksum mismatch on chunk " + std::to_string(seq) + " of " + fileName_);
        reply(Packet::makeNack(fileName_, seq, transferId_));
        return;
    }

    if (chunks_.find(seq) == chunks_.end()) {
        size_t bytes = packet.payload->size();
        chunks_.emplace(seq, *packet.payload);
        receivedBytes_ += bytes;
        if (progressCallback_) {
            progressCallback_(bytes);
        }
    }

    reply(Packet::makeAck(fileName_, seq, transferId_));
}

void ChunkReceiver::onEnd(const Packet&) {
    if (state_ == State::AWAIT_START || state_ == State::INCOMPLETE) {
        return;
    }

    reply(Packet::makeAck(fileName_, END_SEQUENCE, transferId_));

    if (state_ == State::RECEIVING) {
        if (chunks_.size() == totalChunks_) {
            finish(State::REASSEMBLED, FailureReason::NONE, "");
        } else {
            finish(State::INCOMPLETE, FailureReason::INCOMPLETE,
                   "Received " + std::to_string(chunks_.size()) + " of " +
                   std::to_string(totalChunks_) + " chunks");
        }
    }
}

void ChunkReceiver::onError(const Packet& packet) {
    if (isTerminal()) {
        return;
    }

    FailureReason reason = FailureReason::REMOTE_ERROR;
    if (state_ == State::AWAIT_START && packet.message.rfind(NOT_FOUND_MESSAGE, 0) == 0) {
        reason = FailureReason::NOT_FOUND;
    }
    finish(State::INCOMPLETE, reason, "Server error: " + packet.message);
}

void ChunkReceiver::reply(const Packet& packet) {
    if (!channel_.send(packet)) {
        Log::debug(std::string("Failed to send ") + packetTypeName(packet.type));
    }
}

void ChunkReceiver::finish(State state, FailureReason reason, const std::string& message) {
    state_ = state;
    failure_ = reason;
    error_ = message;
}

void ChunkReceiver::linger() {
    Timer timer;
    while (!stopRequested() && timer.elapsed() < static_cast<int64_t>(config_.lingerMs)) {
        auto remaining = std::chrono::milliseconds(config_.lingerMs - timer.elapsed());
        Packet packet;
        if (channel_.receive(packet, remaining)) {
            handlePacket(packet);
        }
    }
}

std::vector<uint8_t> ChunkReceiver::assemble() const {
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(receivedBytes_));
    for (const auto& entry : chunks_) {
        out.insert(out.end(), entry.second.begin(), entry.second.end());
    }
    return out;
}

} // namespace udpfetch
