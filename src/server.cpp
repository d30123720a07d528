#include "server.h"
#include "file_mapper.h"

#include <algorithm>

namespace udpfetch {
    const char *transferStatusName(TransferStatus status) {
        switch (status) {
            case TransferStatus::STARTING: return "Starting";
            case TransferStatus::IN_PROGRESS: return "InProgress";
            case TransferStatus::COMPLETED: return "Completed";
            case TransferStatus::ERROR: return "Error";
        }
        return "Unknown";
    }

    // 传输工作线程看到的通道：收件箱由会话线程投递，发送走服务器socket
    class FileServer::TransferChannel : public PacketChannel {
    public:
        TransferChannel(FileServer &server, std::shared_ptr<Transfer> transfer)
            : server_(server), transfer_(std::move(transfer)) {
        }

        bool send(const Packet &packet) override {
            return server_.sendPacket(packet, transfer_->replyAddr);
        }

        bool receive(Packet &packet, std::chrono::milliseconds timeout) override {
            return transfer_->inbox.pop(packet, timeout);
        }

    private:
        FileServer &server_;
        std::shared_ptr<Transfer> transfer_;
    };

    // 服务器块缓存中属于一个传输的视图
    class FileServer::TransferCache : public ChunkCache {
    public:
        TransferCache(FileServer &server, uint64_t transferId)
            : server_(server), transferId_(transferId) {
        }

        void put(const ChunkRecord &record) override {
            std::lock_guard<std::mutex> lock(server_.mutex_);
            server_.chunkCache_[transferId_][record.sequence] = record;
        }

        bool get(uint32_t sequence, ChunkRecord &record) const override {
            std::lock_guard<std::mutex> lock(server_.mutex_);
            auto t = server_.chunkCache_.find(transferId_);
            if (t == server_.chunkCache_.end()) {
                return false;
            }
            auto it = t->second.find(sequence);
            if (it == t->second.end()) {
                return false;
            }
            record = it->second;
            return true;
        }

    private:
        FileServer &server_;
        uint64_t transferId_;
    };

    FileServer::FileServer(const ServerConfig &config, FileCatalog &catalog)
        : config_(config), catalog_(catalog) {
    }

    FileServer::~FileServer() {
        stop();
    }

    bool FileServer::start() {
        stopping_ = false;

        udpServer_.setPacketHandler([this](const uint8_t *data, size_t len, const SocketAddress &sender) {
            onDatagram(data, len, sender);
        });

        if (!udpServer_.start(config_.port, config_.bindIP)) {
            return false;
        }

        sweeper_ = std::thread(&FileServer::sweepLoop, this);

        Log::info("Server listening on " + config_.bindIP + ":" + std::to_string(udpServer_.port()) +
                  " serving " + std::to_string(catalog_.size()) + " files from " + catalog_.rootDir());
        return true;
    }

    void FileServer::stop() {
        if (stopping_.exchange(true)) {
            return;
        }

        udpServer_.stop();
        sweepCv_.notify_all();
        if (sweeper_.joinable()) {
            sweeper_.join();
        }

        std::vector<std::shared_ptr<Session> > sessions;
        std::vector<std::shared_ptr<Transfer> > transfers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &entry: sessions_) {
                sessions.push_back(entry.second);
            }
            for (auto &entry: transfers_) {
                transfers.push_back(entry.second);
            }
        }

        for (auto &s: sessions) {
            s->queue.close();
            if (s->worker.joinable()) {
                s->worker.join();
            }
        }

        // 发送方在下一个等待边界看到 stopping_
        for (auto &t: transfers) {
            if (t->worker.joinable()) {
                t->worker.join();
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
        transfers_.clear();
        routes_.clear();
        chunkCache_.clear();
    }

    std::string FileServer::clientKey(const Packet &packet, const SocketAddress &sender) {
        uint16_t port = packet.clientPort ? *packet.clientPort : sender.port();
        return sender.ip() + ":" + std::to_string(port);
    }

    void FileServer::onDatagram(const uint8_t *data, size_t len, const SocketAddress &sender) {
        Inbound in;
        try {
            in.packet = Packet::deserialize(data, len);
        } catch (const ProtocolError &e) {
            Log::warn("Dropping malformed packet from " + sender.toString() + ": " + e.what());
            return;
        }
        in.from = sender;

        std::string key = clientKey(in.packet, sender);

        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }

        auto it = sessions_.find(key);
        if (it == sessions_.end()) {
            auto session = std::make_shared<Session>();
            session->key = key;
            session->worker = std::thread(&FileServer::sessionLoop, this, session);
            it = sessions_.emplace(key, session).first;
            Log::debug("New session " + key);
        }

        it->second->lastActivity = std::chrono::steady_clock::now();
        it->second->queue.push(std::move(in));
    }

    void FileServer::sessionLoop(std::shared_ptr<Session> session) {
        const auto pollInterval = std::chrono::milliseconds(200);

        while (!stopping_) {
            Inbound in;
            if (!session->queue.pop(in, pollInterval)) {
                if (session->queue.closed()) {
                    break;
                }
                continue;
            }

            try {
                switch (in.packet.type) {
                    case PacketType::LIST:
                        handleList(in);
                        break;
                    case PacketType::DOWNLOAD:
                        handleDownload(*session, in);
                        break;
                    case PacketType::ACK:
                    case PacketType::NACK:
                    case PacketType::ERROR:
                        routeControl(*session, in);
                        break;
                    default:
                        Log::debug(std::string("Session ") + session->key + " ignoring " +
                                   packetTypeName(in.packet.type));
                        break;
                }
            } catch (const std::exception &e) {
                Log::error("Session " + session->key + ": " + e.what());
            }
        }

        Log::debug("Session " + session->key + " closed");
    }

    void FileServer::handleList(const Inbound &in) {
        Log::info("LIST from " + in.from.toString());
        sendPacket(Packet::makeListReply(catalog_.files()), in.from);
    }

    void FileServer::handleDownload(Session &session, const Inbound &in) {
        const Packet &request = in.packet;
        auto size = catalog_.lookup(request.fileName);
        if (!size) {
            Log::warn("DOWNLOAD of unknown file " + request.fileName + " from " + session.key);
            sendPacket(Packet::makeError(request.fileName,
                                         std::string(NOT_FOUND_MESSAGE) + ": " + request.fileName),
                       in.from);
            return;
        }

        uint64_t offset = request.offset.value_or(0);
        if (offset > *size) {
            Log::warn("DOWNLOAD of " + request.fileName + " with offset " + std::to_string(offset) +
                      " beyond " + std::to_string(*size) + " bytes");
            sendPacket(Packet::makeError(request.fileName, "Invalid offset"), in.from);
            return;
        }
        uint64_t length = std::min(request.length.value_or(*size - offset), *size - offset);

        uint32_t totalChunks = 0;
        try {
            totalChunks = chunkCount(length, config_.session.chunkSize);
        } catch (const std::invalid_argument &e) {
            Log::warn("DOWNLOAD of " + request.fileName + " refused: " + e.what());
            sendPacket(Packet::makeError(request.fileName, "Range too large"), in.from);
            return;
        }

        auto transfer = std::make_shared<Transfer>();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }

            // 客户端在收到 START 前重发的 DOWNLOAD，不再另开传输
            auto route = routes_.find(std::make_pair(session.key, request.fileName));
            if (route != routes_.end()) {
                auto existing = transfers_.find(route->second);
                if (existing != transfers_.end()) {
                    const TransferInfo &info = existing->second->info;
                    if (info.status == TransferStatus::STARTING &&
                        info.offset == offset && info.length == length) {
                        Log::debug("Duplicate DOWNLOAD for transfer " + std::to_string(info.id));
                        return;
                    }
                }
            }

            TransferInfo &info = transfer->info;
            info.id = nextTransferId_++;
            info.clientKey = session.key;
            info.fileName = request.fileName;
            info.path = catalog_.path(request.fileName);
            info.offset = offset;
            info.length = length;
            info.chunkSize = config_.session.chunkSize;
            info.totalChunks = totalChunks;
            info.status = TransferStatus::STARTING;
            transfer->replyAddr = in.from;

            transfers_[info.id] = transfer;
            routes_[std::make_pair(session.key, request.fileName)] = info.id;
            transfer->worker = std::thread(&FileServer::runTransfer, this, transfer);
        }

        Log::info("Transfer " + std::to_string(transfer->info.id) + ": " + request.fileName +
                  " [" + std::to_string(offset) + ", " + std::to_string(offset + length) + ") to " +
                  session.key);
    }

    void FileServer::routeControl(Session &session, const Inbound &in) {
        const Packet &packet = in.packet;

        std::shared_ptr<Transfer> target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (packet.transferId) {
                auto it = transfers_.find(*packet.transferId);
                if (it != transfers_.end() && it->second->info.clientKey == session.key) {
                    target = it->second;
                }
            } else {
                auto route = routes_.find(std::make_pair(session.key, packet.fileName));
                if (route != routes_.end()) {
                    auto it = transfers_.find(route->second);
                    if (it != transfers_.end()) {
                        target = it->second;
                    }
                }
            }

            // 已结束的传输在宽限期内仍响应 NACK
            if (target && target->finished) {
                if (packet.type == PacketType::NACK && packet.sequence >= 0) {
                    auto cache = chunkCache_.find(target->info.id);
                    if (cache != chunkCache_.end()) {
                        auto rec = cache->second.find(static_cast<uint32_t>(packet.sequence));
                        if (rec != cache->second.end()) {
                            Packet data;
                            data.type = PacketType::DATA;
                            data.fileName = target->info.fileName;
                            data.sequence = rec->second.sequence;
                            data.transferId = target->info.id;
                            data.offset = rec->second.offset;
                            data.payload = rec->second.payload;
                            data.checksum = rec->second.checksum;
                            sendPacket(data, target->replyAddr);
                            return;
                        }
                    }
                    Log::warn("NACK for chunk " + std::to_string(packet.sequence) +
                              " of finished transfer " + std::to_string(target->info.id) + " not cached");
                }
                return;
            }
        }

        if (!target) {
            Log::debug(std::string(packetTypeName(packet.type)) + " from " + session.key + " for " +
                       packet.fileName + " matches no active transfer");
            return;
        }

        if (!target->inbox.push(packet)) {
            Log::debug("Transfer " + std::to_string(target->info.id) + " no longer accepts packets");
        }
    }

    void FileServer::runTransfer(std::shared_ptr<Transfer> transfer) {
        const TransferInfo info = transfer->info;

        FileMapper file;
        if (!file.openForRead(info.path)) {
            std::string message = "Cannot open " + info.fileName;
            sendPacket(Packet::makeError(info.fileName, message, info.id), transfer->replyAddr);
            finishTransfer(*transfer, false, message);
            return;
        }

        TransferChannel channel(*this, transfer);
        TransferCache cache(*this, info.id);

        ChunkSender sender(channel, cache, config_.session, info.fileName, info.id,
                           info.offset, info.length,
                           [&file](uint64_t offset, size_t length) {
                               return file.readAt(offset, length);
                           });
        sender.setStopFlag(&stopping_);
        sender.setStateCallback([this, &transfer](ChunkSender::State state, uint32_t sequence,
                                                  uint32_t retransmits) {
            std::lock_guard<std::mutex> lock(mutex_);
            TransferInfo &live = transfer->info;
            live.currentSequence = sequence;
            live.retransmits = retransmits;
            if (state == ChunkSender::State::STREAMING_CHUNK ||
                state == ChunkSender::State::AWAIT_CHUNK_ACK ||
                state == ChunkSender::State::AWAIT_END_ACK) {
                live.status = TransferStatus::IN_PROGRESS;
            }
        });

        bool ok = false;
        std::string error;
        try {
            ok = sender.run();
            error = sender.error();
        } catch (const std::exception &e) {
            error = e.what();
            Log::error("Transfer " + std::to_string(info.id) + " aborted: " + error);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            transfer->info.retransmits = sender.retransmits();
        }
        finishTransfer(*transfer, ok, error);

        if (ok) {
            Log::info("Transfer " + std::to_string(info.id) + " completed: " + info.fileName + " " +
                      ProgressBar::formatBytes(info.length) + " in " + std::to_string(info.totalChunks) +
                      " chunks, " + std::to_string(sender.retransmits()) + " retransmits");
        }
    }

    void FileServer::finishTransfer(Transfer &transfer, bool ok, const std::string &error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transfer.info.status = ok ? TransferStatus::COMPLETED : TransferStatus::ERROR;
            transfer.info.error = error;
            transfer.finished = true;
            transfer.finishedAt = std::chrono::steady_clock::now();
        }
        transfer.inbox.close();
    }

    void FileServer::sweepLoop() {
        const auto interval = std::chrono::milliseconds(config_.sweepIntervalMs);
        const auto evictionDelay = std::chrono::milliseconds(config_.evictionDelayMs);
        const auto idleExpiry = std::chrono::milliseconds(config_.sessionIdleMs);

        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            sweepCv_.wait_for(lock, interval, [this]() { return stopping_.load(); });
            if (stopping_) {
                break;
            }

            auto now = std::chrono::steady_clock::now();
            std::vector<std::shared_ptr<Transfer> > evicted;
            std::vector<std::shared_ptr<Session> > expired;

            for (auto it = transfers_.begin(); it != transfers_.end();) {
                auto &t = it->second;
                if (t->finished && now - t->finishedAt >= evictionDelay) {
                    auto route = routes_.find(std::make_pair(t->info.clientKey, t->info.fileName));
                    if (route != routes_.end() && route->second == t->info.id) {
                        routes_.erase(route);
                    }
                    chunkCache_.erase(t->info.id);
                    evicted.push_back(t);
                    it = transfers_.erase(it);
                } else {
                    ++it;
                }
            }

            for (auto it = sessions_.begin(); it != sessions_.end();) {
                auto &s = it->second;
                bool hasTransfer = std::any_of(transfers_.begin(), transfers_.end(),
                                               [&s](const std::pair<const uint64_t, std::shared_ptr<Transfer> > &t) {
                                                   return t.second->info.clientKey == s->key;
                                               });
                if (!hasTransfer && s->queue.size() == 0 && now - s->lastActivity >= idleExpiry) {
                    s->queue.close();
                    expired.push_back(s);
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }

            if (evicted.empty() && expired.empty()) {
                continue;
            }

            // 在锁外等待线程退出
            lock.unlock();
            for (auto &t: evicted) {
                if (t->worker.joinable()) {
                    t->worker.join();
                }
                Log::debug("Evicted transfer " + std::to_string(t->info.id));
            }
            for (auto &s: expired) {
                if (s->worker.joinable()) {
                    s->worker.join();
                }
                Log::debug("Expired idle session " + s->key);
            }
            lock.lock();
        }
    }

    bool FileServer::sendPacket(const Packet &packet, const SocketAddress &to) {
        std::vector<uint8_t> bytes;
        try {
            bytes = packet.serialize();
        } catch (const ProtocolError &e) {
            Log::error(std::string("Cannot encode ") + packetTypeName(packet.type) + ": " + e.what());
            return false;
        }

        if (!udpServer_.sendTo(bytes.data(), bytes.size(), to)) {
            Log::warn(std::string("Failed to send ") + packetTypeName(packet.type) + " to " + to.toString());
            return false;
        }
        return true;
    }

    std::vector<TransferInfo> FileServer::transfers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TransferInfo> out;
        out.reserve(transfers_.size());
        for (const auto &entry: transfers_) {
            out.push_back(entry.second->info);
        }
        return out;
    }

    std::optional<TransferInfo> FileServer::transfer(uint64_t id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end()) {
            return std::nullopt;
        }
        return it->second->info;
    }

    size_t FileServer::sessionCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    size_t FileServer::cachedChunks(uint64_t transferId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = chunkCache_.find(transferId);
        return it == chunkCache_.end() ? 0 : it->second.size();
    }
} // namespace udpfetch
