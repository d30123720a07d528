#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <optional>
#include <condition_variable>

#include "catalog.h"
#include "protocol.h"
#include "session.h"
#include "socket.h"
#include "utils.h"

namespace udpfetch {
    struct ServerConfig {
        uint16_t port = 5000;
        std::string bindIP = "0.0.0.0";
        std::string catalogFile = "file_list.txt";
        std::string rootDir = "server_files";
        uint32_t evictionDelayMs = 5000; // 完成后保留传输记录的时间
        uint32_t sessionIdleMs = 60000; // 空闲会话回收
        uint32_t sweepIntervalMs = 1000;
        bool verbose = false;
        SessionConfig session;
    };

    enum class TransferStatus {
        STARTING,
        IN_PROGRESS,
        COMPLETED,
        ERROR
    };

    const char *transferStatusName(TransferStatus status);

    // 传输状态快照
    struct TransferInfo {
        uint64_t id = 0;
        std::string clientKey;
        std::string fileName;
        std::string path;
        uint64_t offset = 0;
        uint64_t length = 0;
        uint32_t chunkSize = 0;
        uint32_t totalChunks = 0;
        uint32_t currentSequence = 0;
        uint32_t retransmits = 0;
        TransferStatus status = TransferStatus::STARTING;
        std::string error;
    };

    class FileServer {
    public:
        FileServer(const ServerConfig &config, FileCatalog &catalog);

        ~FileServer();

        FileServer(const FileServer &) = delete;

        FileServer &operator=(const FileServer &) = delete;

        bool start();

        // 停止收包，通知所有工作线程并等待退出
        void stop();

        uint16_t port() const { return udpServer_.port(); }

        std::vector<TransferInfo> transfers() const;

        std::optional<TransferInfo> transfer(uint64_t id) const;

        size_t sessionCount() const;

        size_t cachedChunks(uint64_t transferId) const;

    private:
        struct Inbound {
            Packet packet;
            SocketAddress from;
        };

        struct Session {
            std::string key;
            BlockingQueue<Inbound> queue;
            std::thread worker;
            std::chrono::steady_clock::time_point lastActivity;
        };

        struct Transfer {
            TransferInfo info;
            SocketAddress replyAddr;
            BlockingQueue<Packet> inbox;
            std::thread worker;
            bool finished = false;
            std::chrono::steady_clock::time_point finishedAt;
        };

        class TransferChannel;
        class TransferCache;

        void onDatagram(const uint8_t *data, size_t len, const SocketAddress &sender);

        void sessionLoop(std::shared_ptr<Session> session);

        void handleList(const Inbound &in);

        void handleDownload(Session &session, const Inbound &in);

        void routeControl(Session &session, const Inbound &in);

        void runTransfer(std::shared_ptr<Transfer> transfer);

        void finishTransfer(Transfer &transfer, bool ok, const std::string &error);

        void sweepLoop();

        bool sendPacket(const Packet &packet, const SocketAddress &to);

        static std::string clientKey(const Packet &packet, const SocketAddress &sender);

        ServerConfig config_;
        FileCatalog &catalog_;
        UdpServer udpServer_;

        std::atomic<bool> stopping_{false};
        std::thread sweeper_;
        std::condition_variable sweepCv_;

        // 会话表、传输表、路由表和块缓存共用一把锁
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<Session> > sessions_;
        std::map<uint64_t, std::shared_ptr<Transfer> > transfers_;
        std::map<std::pair<std::string, std::string>, uint64_t> routes_;
        std::map<uint64_t, std::map<uint32_t, ChunkRecord> > chunkCache_;
        uint64_t nextTransferId_ = 1;
    };
} // namespace udpfetch
