#include "client.h"
#include "test_support.h"
#include <iostream>
#include <cassert>
#include <thread>

using namespace udpfetch;

namespace {
    // 内存中的"服务器"：每个分段一个发送线程
    class FakeServer {
    public:
        FakeServer(const std::vector<uint8_t> &source, const SessionConfig &config)
            : source_(source), config_(config) {
        }

        ~FakeServer() {
            for (auto &t: threads_) {
                if (t.joinable()) {
                    t.join();
                }
            }
        }

        // 该分段的请求直接回 ERROR
        void refusePart(uint32_t index, const std::string &message) {
            refused_[index] = message;
        }

        PartCoordinator::ChannelFactory factory() {
            return [this](uint32_t index) {
                auto channels = test::makeChannelPair();
                test::MemoryChannel *serverSide = channels.second.get();

                std::lock_guard<std::mutex> lock(mutex_);
                serverChannels_.push_back(std::move(channels.second));
                threads_.emplace_back([this, serverSide, index]() { serve(*serverSide, index); });
                return std::unique_ptr<PacketChannel>(std::move(channels.first));
            };
        }

    private:
        void serve(test::MemoryChannel &channel, uint32_t index) {
            Packet request;
            if (!channel.receive(request, std::chrono::milliseconds(2000)) ||
                request.type != PacketType::DOWNLOAD) {
                return;
            }

            auto refused = refused_.find(index);
            if (refused != refused_.end()) {
                channel.send(Packet::makeError(request.fileName, refused->second));
                return;
            }

            uint64_t offset = request.offset.value_or(0);
            uint64_t length = request.length.value_or(source_.size() - offset);
            MemoryChunkCache cache;
            ChunkSender sender(channel, cache, config_, request.fileName, 100 + index, offset, length,
                               [this](uint64_t off, size_t len) {
                                   return std::vector<uint8_t>(source_.begin() + static_cast<long>(off),
                                                               source_.begin() + static_cast<long>(off + len));
                               });
            sender.run();
        }

        const std::vector<uint8_t> &source_;
        SessionConfig config_;
        std::map<uint32_t, std::string> refused_;
        std::mutex mutex_;
        std::vector<std::unique_ptr<test::MemoryChannel> > serverChannels_;
        std::vector<std::thread> threads_;
    };

    SessionConfig fastConfig() {
        SessionConfig config;
        config.chunkSize = 16;
        config.ackTimeoutMs = 50;
        config.maxRetries = 5;
        config.maxIdleTimeouts = 20;
        config.lingerMs = 50;
        return config;
    }
}

void test_part_ranges() {
    std::cout << "Testing part ranges..." << std::endl;

    const uint64_t sizes[] = {0, 1, 3, 4, 5, 10, 1023, 1024, 1025, 1ULL << 33};
    for (uint64_t size: sizes) {
        for (uint32_t parts = 1; parts <= 8; ++parts) {
            auto ranges = computePartRanges(size, parts);
            assert(ranges.size() == parts);

            // 连续、不重叠、恰好覆盖 [0, size)
            uint64_t next = 0;
            for (uint32_t i = 0; i < parts; ++i) {
                assert(ranges[i].index == i);
                assert(ranges[i].offset == next);
                next += ranges[i].length;
            }
            assert(next == size);

            // 前面的分段一样长，最后一段吸收余数
            for (uint32_t i = 0; i + 1 < parts; ++i) {
                assert(ranges[i].length == size / parts);
            }
            assert(ranges.back().length == size / parts + size % parts);
        }
    }

    auto ten = computePartRanges(10, 2);
    assert(ten[0].offset == 0 && ten[0].length == 5);
    assert(ten[1].offset == 5 && ten[1].length == 5);

    try {
        computePartRanges(10, 0);
        assert(false && "Should have thrown");
    } catch (const std::invalid_argument &) {
    }

    std::cout << "Part range tests passed!" << std::endl;
}

void test_input_file() {
    std::cout << "Testing input file..." << std::endl;

    test::TempDir dir("input");
    dir.writeText("input.txt",
                  "# Add files to download, one per line\n"
                  "100MB.zip\n"
                  "\n"
                  "  spaced name.txt  \r\n"
                  "#commented.zip\n"
                  "100MB.zip\n"
                  "5MB.zip\n");

    auto names = readInputFile(dir.file("input.txt"));
    assert(names.size() == 3);
    assert(names[0] == "100MB.zip");
    assert(names[1] == "spaced name.txt");
    assert(names[2] == "5MB.zip");

    assert(readInputFile(dir.file("missing.txt")).empty());

    ClientConfig config;
    config.inputFile = dir.file("input.txt");
    FileClient client(config);
    assert(client.pendingFiles().size() == 3);
    assert(!client.isCompleted("5MB.zip"));

    std::cout << "Input file tests passed!" << std::endl;
}

void test_progress_board() {
    std::cout << "Testing progress board..." << std::endl;

    ProgressBoard board;
    assert(!board.allDone());

    board.reset(computePartRanges(100, 4));
    assert(board.totalBytes() == 100);
    assert(board.receivedBytes() == 0);
    assert(!board.waitFor(std::chrono::milliseconds(10)));

    board.addBytes(0, 10);
    board.addBytes(0, 15);
    board.markComplete(1);
    board.markFailed(2, "timeout");

    auto snapshot = board.snapshot();
    assert(snapshot.size() == 4);
    assert(snapshot[0].receivedBytes == 25);
    assert(snapshot[1].complete && snapshot[1].receivedBytes == 25);
    assert(snapshot[2].failed && snapshot[2].error == "timeout");
    assert(!snapshot[3].complete && !snapshot[3].failed);
    assert(board.receivedBytes() == 50);
    assert(!board.allDone());

    // 另一个线程结束最后两段时唤醒等待者
    std::thread finisher([&board]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        board.markComplete(0);
        board.markComplete(3);
    });
    assert(board.waitFor(std::chrono::milliseconds(5000)));
    finisher.join();
    assert(board.allDone());

    std::cout << "Progress board tests passed!" << std::endl;
}

void test_coordinator_download() {
    std::cout << "Testing coordinator download..." << std::endl;

    test::TempDir dir("coordinator");
    std::vector<uint8_t> source = test::patternBytes(1000, 5);
    SessionConfig config = fastConfig();

    FakeServer server(source, config);
    ProgressBoard board;
    PartCoordinator coordinator(config, server.factory(), board);

    std::string output = dir.file("data.bin");
    DownloadResult result = coordinator.download("data.bin", source.size(), 4, output);

    assert(result.ok);
    assert(result.reason == FailureReason::NONE);
    assert(result.bytes == source.size());
    assert(dir.read("data.bin") == source);
    assert(!std::filesystem::exists(output + TEMP_SUFFIX));

    assert(board.allDone());
    assert(board.receivedBytes() == source.size());
    for (const auto &entry: board.snapshot()) {
        assert(entry.second.complete);
    }

    std::cout << "Coordinator download tests passed!" << std::endl;
}

void test_coordinator_small_file() {
    std::cout << "Testing parts smaller than part count..." << std::endl;

    test::TempDir dir("coordinator_small");
    std::vector<uint8_t> source = {42, 43};
    SessionConfig config = fastConfig();

    // 前三段长度为0，本地直接完成，不开网络传输
    FakeServer server(source, config);
    ProgressBoard board;
    PartCoordinator coordinator(config, server.factory(), board);

    DownloadResult result = coordinator.download("tiny.bin", source.size(), 4, dir.file("tiny.bin"));
    assert(result.ok);
    assert(dir.read("tiny.bin") == source);
    assert(board.snapshot().size() == 4);

    DownloadResult empty = coordinator.download("empty.bin", 0, 4, dir.file("empty.bin"));
    assert(empty.ok);
    assert(std::filesystem::file_size(dir.file("empty.bin")) == 0);

    std::cout << "Small file tests passed!" << std::endl;
}

void test_coordinator_failure() {
    std::cout << "Testing coordinator failure..." << std::endl;

    test::TempDir dir("coordinator_fail");
    std::vector<uint8_t> source = test::patternBytes(200, 7);
    SessionConfig config = fastConfig();

    FakeServer server(source, config);
    server.refusePart(1, std::string(NOT_FOUND_MESSAGE) + ": data.bin");
    ProgressBoard board;
    PartCoordinator coordinator(config, server.factory(), board);

    std::string output = dir.file("data.bin");
    DownloadResult result = coordinator.download("data.bin", source.size(), 2, output);

    assert(!result.ok);
    assert(result.reason == FailureReason::NOT_FOUND);
    assert(!std::filesystem::exists(output));
    assert(!std::filesystem::exists(output + TEMP_SUFFIX));

    auto snapshot = board.snapshot();
    assert(snapshot[0].complete);
    assert(snapshot[1].failed);

    std::cout << "Coordinator failure tests passed!" << std::endl;
}

int main() {
    std::cout << "Running udpfetch client tests..." << std::endl;
    std::cout << "================================" << std::endl;

    try {
        test_part_ranges();
        test_input_file();
        test_progress_board();
        test_coordinator_download();
        test_coordinator_small_file();
        test_coordinator_failure();

        std::cout << std::endl;
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
