#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <functional>
#include <condition_variable>

#include "channel.h"
#include "session.h"
#include "socket.h"

namespace udpfetch {
    // 每个文件最多并行的分段数
    constexpr uint32_t MAX_PARTS = 4;

    // 下载中的临时文件后缀
    constexpr const char *TEMP_SUFFIX = ".udpfetch_tmp";

    struct ClientConfig {
        std::string serverIP = "127.0.0.1";
        uint16_t serverPort = 5000;
        uint32_t maxParts = MAX_PARTS;
        std::string inputFile = "input.txt";
        std::string downloadDir = "downloads";
        uint32_t scanIntervalMs = 5000;
        uint32_t progressIntervalMs = 200;
        bool declareClientPort = false;
        bool showProgress = true;
        bool verbose = false;
        SessionConfig session;
    };

    struct PartRange {
        uint32_t index = 0;
        uint64_t offset = 0;
        uint64_t length = 0;
    };

    // 把 [0, size) 切成 numParts 段，最后一段吸收余数
    std::vector<PartRange> computePartRanges(uint64_t size, uint32_t numParts);

    // input.txt：每行一个文件名，# 开头为注释，重复的名字只保留第一次
    std::vector<std::string> readInputFile(const std::string &path);

    struct PartProgress {
        uint64_t receivedBytes = 0;
        uint64_t totalBytes = 0;
        bool complete = false;
        bool failed = false;
        std::string error;
    };

    // 一个文件所有分段共享的进度表
    class ProgressBoard {
    public:
        void reset(const std::vector<PartRange> &ranges);

        void addBytes(uint32_t part, uint64_t bytes);

        void markComplete(uint32_t part);

        void markFailed(uint32_t part, const std::string &error);

        std::map<uint32_t, PartProgress> snapshot() const;

        uint64_t receivedBytes() const;

        uint64_t totalBytes() const;

        bool allDone() const;

        // 等到所有分段结束或超时，返回是否全部结束
        bool waitFor(std::chrono::milliseconds timeout) const;

    private:
        bool allDoneLocked() const;

        std::map<uint32_t, PartProgress> parts_;
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
    };

    struct DownloadResult {
        bool ok = false;
        FailureReason reason = FailureReason::NONE;
        std::string error;
        uint64_t bytes = 0;
        std::string path;
    };

    // 一个文件 -> N 个并行分段，每段独立的通道和接收状态机，直接写入预分配的输出文件
    class PartCoordinator {
    public:
        using ChannelFactory = std::function<std::unique_ptr<PacketChannel>(uint32_t partIndex)>;

        PartCoordinator(const SessionConfig &config, ChannelFactory factory, ProgressBoard &board);

        void setStopFlag(const std::atomic<bool> *stopFlag) { stopFlag_ = stopFlag; }

        // 写入 outputPath + TEMP_SUFFIX，全部分段完成且大小一致后改名为 outputPath
        DownloadResult download(const std::string &fileName, uint64_t size, uint32_t numParts,
                                const std::string &outputPath);

    private:
        SessionConfig config_;
        ChannelFactory factory_;
        ProgressBoard &board_;
        const std::atomic<bool> *stopFlag_ = nullptr;
    };

    class FileClient {
    public:
        explicit FileClient(const ClientConfig &config);

        void setStopFlag(const std::atomic<bool> *stopFlag) { stopFlag_ = stopFlag; }

        // LIST，超时重发；无应答返回 nullopt
        std::optional<std::map<std::string, uint64_t> > fetchCatalog();

        DownloadResult downloadFile(const std::string &fileName, uint64_t size);

        // 输入文件中尚未完成的文件名
        std::vector<std::string> pendingFiles() const;

        // 扫描输入文件并下载，直到收到停止信号
        int run();

        bool isCompleted(const std::string &fileName) const { return completed_.count(fileName) != 0; }

        const std::set<std::string> &completed() const { return completed_; }

    private:
        void renderProgress(const std::string &fileName, uint64_t size, const ProgressBoard &board,
                            const std::atomic<bool> &done) const;

        bool stopRequested() const { return stopFlag_ && stopFlag_->load(); }

        void sleepInterruptible(std::chrono::milliseconds duration) const;

        ClientConfig config_;
        SocketAddress server_;
        const std::atomic<bool> *stopFlag_ = nullptr;
        std::set<std::string> completed_;
        std::set<std::string> reportedMissing_;
    };
} // namespace udpfetch
