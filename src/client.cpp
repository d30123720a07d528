#include "client.h"
#include "file_mapper.h"
#include "utils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace udpfetch {
    std::vector<PartRange> computePartRanges(uint64_t size, uint32_t numParts) {
        if (numParts == 0) {
            throw std::invalid_argument("number of parts must be positive");
        }

        std::vector<PartRange> ranges;
        ranges.reserve(numParts);

        uint64_t partSize = size / numParts;
        for (uint32_t i = 0; i < numParts; ++i) {
            PartRange range;
            range.index = i;
            range.offset = partSize * i;
            range.length = (i + 1 == numParts) ? size - range.offset : partSize;
            ranges.push_back(range);
        }
        return ranges;
    }

    std::vector<std::string> readInputFile(const std::string &path) {
        std::vector<std::string> names;
        std::ifstream in(path);
        if (!in) {
            return names;
        }

        std::string line;
        while (std::getline(in, line)) {
            auto begin = line.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) {
                continue;
            }
            auto end = line.find_last_not_of(" \t\r\n");
            std::string name = line.substr(begin, end - begin + 1);
            if (name[0] == '#') {
                continue;
            }
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(name);
            }
        }
        return names;
    }

    // ProgressBoard 实现
    void ProgressBoard::reset(const std::vector<PartRange> &ranges) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            parts_.clear();
            for (const auto &range: ranges) {
                PartProgress progress;
                progress.totalBytes = range.length;
                parts_[range.index] = progress;
            }
        }
        cv_.notify_all();
    }

    void ProgressBoard::addBytes(uint32_t part, uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        parts_[part].receivedBytes += bytes;
    }

    void ProgressBoard::markComplete(uint32_t part) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            PartProgress &p = parts_[part];
            p.complete = true;
            p.receivedBytes = p.totalBytes;
        }
        cv_.notify_all();
    }

    void ProgressBoard::markFailed(uint32_t part, const std::string &error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            PartProgress &p = parts_[part];
            p.failed = true;
            p.error = error;
        }
        cv_.notify_all();
    }

    std::map<uint32_t, PartProgress> ProgressBoard::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return parts_;
    }

    uint64_t ProgressBoard::receivedBytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t total = 0;
        for (const auto &entry: parts_) {
            total += entry.second.receivedBytes;
        }
        return total;
    }

    uint64_t ProgressBoard::totalBytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t total = 0;
        for (const auto &entry: parts_) {
            total += entry.second.totalBytes;
        }
        return total;
    }

    bool ProgressBoard::allDone() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return allDoneLocked();
    }

    bool ProgressBoard::waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return allDoneLocked(); });
    }

    bool ProgressBoard::allDoneLocked() const {
        if (parts_.empty()) {
            return false;
        }
        return std::all_of(parts_.begin(), parts_.end(), [](const std::pair<const uint32_t, PartProgress> &p) {
            return p.second.complete || p.second.failed;
        });
    }

    // PartCoordinator 实现
    PartCoordinator::PartCoordinator(const SessionConfig &config, ChannelFactory factory, ProgressBoard &board)
        : config_(config), factory_(std::move(factory)), board_(board) {
    }

    DownloadResult PartCoordinator::download(const std::string &fileName, uint64_t size, uint32_t numParts,
                                             const std::string &outputPath) {
        DownloadResult result;
        result.path = outputPath;

        std::vector<PartRange> ranges = computePartRanges(size, numParts);
        board_.reset(ranges);

        std::string tempPath = outputPath + TEMP_SUFFIX;
        FileMapper output;
        if (!output.openForWrite(tempPath, size)) {
            result.reason = FailureReason::IO_ERROR;
            result.error = "Cannot create " + tempPath;
            for (const auto &range: ranges) {
                board_.markFailed(range.index, result.error);
            }
            return result;
        }

        // 每个线程只写自己的槽位
        std::vector<FailureReason> reasons(ranges.size(), FailureReason::NONE);
        std::vector<std::string> errors(ranges.size());
        std::vector<std::thread> workers;

        for (const auto &range: ranges) {
            if (range.length == 0) {
                board_.markComplete(range.index);
                continue;
            }

            workers.emplace_back([this, range, &fileName, &output, &reasons, &errors]() {
                try {
                    std::unique_ptr<PacketChannel> channel = factory_(range.index);
                    ChunkReceiver receiver(*channel, config_, fileName, range.offset, range.length);
                    receiver.setStopFlag(stopFlag_);
                    receiver.setProgressCallback([this, &range](size_t bytes) {
                        board_.addBytes(range.index, bytes);
                    });

                    if (!receiver.run()) {
                        reasons[range.index] = receiver.failure();
                        errors[range.index] = receiver.error();
                        board_.markFailed(range.index, receiver.error());
                        return;
                    }

                    std::vector<uint8_t> bytes = receiver.assemble();
                    if (bytes.size() != range.length) {
                        reasons[range.index] = FailureReason::INCOMPLETE;
                        errors[range.index] = "Part " + std::to_string(range.index) + " assembled " +
                                              std::to_string(bytes.size()) + " of " +
                                              std::to_string(range.length) + " bytes";
                        board_.markFailed(range.index, errors[range.index]);
                        return;
                    }

                    if (!output.writeAt(range.offset, bytes)) {
                        reasons[range.index] = FailureReason::IO_ERROR;
                        errors[range.index] = "Write failed at offset " + std::to_string(range.offset);
                        board_.markFailed(range.index, errors[range.index]);
                        return;
                    }

                    board_.markComplete(range.index);
                    receiver.linger();
                } catch (const std::exception &e) {
                    reasons[range.index] = FailureReason::IO_ERROR;
                    errors[range.index] = e.what();
                    board_.markFailed(range.index, e.what());
                }
            });
        }

        for (auto &worker: workers) {
            worker.join();
        }

        for (size_t i = 0; i < ranges.size(); ++i) {
            if (reasons[i] == FailureReason::NONE) {
                continue;
            }
            Log::warn("Part " + std::to_string(i) + " of " + fileName + " failed (" +
                      failureReasonName(reasons[i]) + "): " + errors[i]);
            // NOT_FOUND 优先于其他原因
            if (result.reason == FailureReason::NONE || reasons[i] == FailureReason::NOT_FOUND) {
                result.reason = reasons[i];
                result.error = errors[i];
            }
        }

        bool synced = output.sync();
        output.close();

        std::error_code ec;
        if (result.reason == FailureReason::NONE) {
            if (!synced) {
                result.reason = FailureReason::IO_ERROR;
                result.error = "fsync failed on " + tempPath;
            } else if (fs::file_size(tempPath, ec) != size || ec) {
                result.reason = FailureReason::INCOMPLETE;
                result.error = "Size mismatch on " + tempPath;
            } else {
                fs::rename(tempPath, outputPath, ec);
                if (ec) {
                    result.reason = FailureReason::IO_ERROR;
                    result.error = "Rename to " + outputPath + " failed: " + ec.message();
                }
            }
        }

        if (result.reason != FailureReason::NONE) {
            fs::remove(tempPath, ec);
            return result;
        }

        result.ok = true;
        result.bytes = size;
        return result;
    }

    // FileClient 实现
    FileClient::FileClient(const ClientConfig &config)
        : config_(config), server_(config.serverIP, config.serverPort) {
    }

    std::optional<std::map<std::string, uint64_t> > FileClient::fetchCatalog() {
        UdpChannel channel(server_, config_.declareClientPort);

        for (uint32_t attempt = 0; attempt <= config_.session.maxRetries && !stopRequested(); ++attempt) {
            channel.send(Packet::makeList());

            auto deadline = std::chrono::steady_clock::now() + config_.session.ackTimeout();
            while (true) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    break;
                }

                Packet reply;
                if (!channel.receive(reply, remaining)) {
                    break;
                }
                if (reply.type == PacketType::LIST) {
                    return reply.files;
                }
                if (reply.type == PacketType::ERROR) {
                    Log::error("Server refused LIST: " + reply.message);
                    return std::nullopt;
                }
            }

            Log::debug("No LIST reply from " + server_.toString() + ", attempt " + std::to_string(attempt + 1));
        }

        return std::nullopt;
    }

    DownloadResult FileClient::downloadFile(const std::string &fileName, uint64_t size) {
        uint32_t numParts = std::max<uint32_t>(1, std::min(config_.maxParts, MAX_PARTS));
        std::string outputPath = (fs::path(config_.downloadDir) / fileName).string();

        ProgressBoard board;
        PartCoordinator coordinator(config_.session, [this](uint32_t) {
            return std::unique_ptr<PacketChannel>(std::make_unique<UdpChannel>(server_, config_.declareClientPort));
        }, board);
        coordinator.setStopFlag(stopFlag_);

        Log::info("Downloading " + fileName + " (" + ProgressBar::formatBytes(size) + ") in " +
                  std::to_string(numParts) + " parts");

        std::atomic<bool> done{false};
        std::thread renderer;
        if (config_.showProgress) {
            renderer = std::thread(&FileClient::renderProgress, this, fileName, size, std::cref(board),
                                   std::cref(done));
        }

        Timer timer;
        DownloadResult result = coordinator.download(fileName, size, numParts, outputPath);

        done = true;
        if (renderer.joinable()) {
            renderer.join();
        }

        if (result.ok) {
            double seconds = timer.elapsed() / 1000.0;
            std::stringstream ss;
            ss << std::fixed << std::setprecision(2) << seconds;
            Log::info("Saved " + outputPath + " (" + ProgressBar::formatBytes(size) + ") in " + ss.str() + " s");
        } else {
            Log::error("Download of " + fileName + " failed (" + failureReasonName(result.reason) + "): " +
                       result.error);
        }
        return result;
    }

    void FileClient::renderProgress(const std::string &fileName, uint64_t size, const ProgressBoard &board,
                                    const std::atomic<bool> &done) const {
        ProgressBar bar(size);
        auto interval = std::chrono::milliseconds(config_.progressIntervalMs);

        while (!done) {
            bool finished = board.waitFor(interval);

            auto parts = board.snapshot();
            size_t complete = 0;
            size_t failed = 0;
            for (const auto &entry: parts) {
                if (entry.second.complete) ++complete;
                if (entry.second.failed) ++failed;
            }

            std::string suffix = fileName + " parts " + std::to_string(complete) + "/" +
                                 std::to_string(parts.size());
            if (failed > 0) {
                suffix += " (" + std::to_string(failed) + " failed)";
            }
            bar.setSuffix(suffix);
            bar.update(board.receivedBytes());

            if (finished) {
                break;
            }
        }
        bar.finish();
    }

    std::vector<std::string> FileClient::pendingFiles() const {
        std::vector<std::string> pending;
        for (const auto &name: readInputFile(config_.inputFile)) {
            if (!isCompleted(name)) {
                pending.push_back(name);
            }
        }
        return pending;
    }

    void FileClient::sleepInterruptible(std::chrono::milliseconds duration) const {
        Timer timer;
        while (!stopRequested() && timer.elapsed() < duration.count()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    int FileClient::run() {
        std::error_code ec;
        fs::create_directories(config_.downloadDir, ec);
        if (ec) {
            Log::error("Cannot create download directory " + config_.downloadDir + ": " + ec.message());
            return 1;
        }

        if (!fs::exists(config_.inputFile)) {
            std::ofstream out(config_.inputFile);
            out << "# Add files to download, one per line" << std::endl;
            Log::info("Created " + config_.inputFile);
        }

        std::optional<std::map<std::string, uint64_t> > catalog;
        const auto scanInterval = std::chrono::milliseconds(config_.scanIntervalMs);

        while (!stopRequested()) {
            if (!catalog) {
                catalog = fetchCatalog();
                if (!catalog) {
                    Log::warn("No file list from " + server_.toString() + ", retrying");
                    sleepInterruptible(scanInterval);
                    continue;
                }

                Log::info("Available files on server:");
                for (const auto &entry: *catalog) {
                    Log::info("  " + entry.first + " - " + ProgressBar::formatBytes(entry.second));
                }
            }

            for (const auto &name: pendingFiles()) {
                if (stopRequested()) {
                    break;
                }

                auto it = catalog->find(name);
                if (it == catalog->end()) {
                    if (reportedMissing_.insert(name).second) {
                        Log::warn("File not available on server: " + name);
                    }
                    continue;
                }

                DownloadResult result = downloadFile(name, it->second);
                if (result.ok) {
                    completed_.insert(name);
                } else if (result.reason == FailureReason::NOT_FOUND) {
                    // 目录已过期，下一轮重新获取
                    catalog.reset();
                    reportedMissing_.clear();
                    break;
                }
            }

            sleepInterruptible(scanInterval);
        }

        Log::info("Client shutting down, " + std::to_string(completed_.size()) + " files downloaded");
        return 0;
    }
} // namespace udpfetch
