#include "client.h"
#include "server.h"
#include "test_support.h"
#include <iostream>
#include <cassert>
#include <thread>

using namespace udpfetch;

namespace {
    const std::string LOOPBACK = "127.0.0.1";

    SessionConfig serverSession() {
        SessionConfig config;
        config.chunkSize = 1024;
        config.ackTimeoutMs = 300;
        config.maxRetries = 5;
        return config;
    }

    SessionConfig clientSession() {
        SessionConfig config;
        config.ackTimeoutMs = 300;
        config.maxRetries = 5;
        config.maxIdleTimeouts = 20;
        config.lingerMs = 300;
        return config;
    }

    // 服务器根目录 + 目录，文件直接登记
    struct Fixture {
        explicit Fixture(const std::string &tag)
            : dir(tag), catalog(dir.path()) {
            ten = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};
            big = test::patternBytes(200000, 11);
            dir.write("ten.bin", ten);
            dir.write("big.bin", big);
            assert(catalog.addFile("ten.bin"));
            assert(catalog.addFile("big.bin"));
        }

        test::TempDir dir;
        FileCatalog catalog;
        std::vector<uint8_t> ten;
        std::vector<uint8_t> big;
    };

    ServerConfig loopbackConfig() {
        ServerConfig config;
        config.port = 0;
        config.bindIP = LOOPBACK;
        config.session = serverSession();
        return config;
    }

    // 等待条件成立，最多 timeoutMs
    template<typename Predicate>
    bool waitUntil(Predicate predicate, int timeoutMs = 5000) {
        Timer timer;
        while (timer.elapsed() < timeoutMs) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return predicate();
    }

    bool allCompleted(const FileServer &server, size_t expected) {
        auto transfers = server.transfers();
        if (transfers.size() != expected) {
            return false;
        }
        for (const auto &t: transfers) {
            if (t.status != TransferStatus::COMPLETED) {
                return false;
            }
        }
        return true;
    }
}

void test_list_and_errors() {
    std::cout << "Testing LIST and request errors..." << std::endl;

    Fixture fixture("transfer_errors");
    FileServer server(loopbackConfig(), fixture.catalog);
    assert(server.start());
    SocketAddress address(LOOPBACK, server.port());

    UdpChannel channel(address, false);
    assert(channel.send(Packet::makeList()));
    Packet reply;
    assert(channel.receive(reply, std::chrono::milliseconds(2000)));
    assert(reply.type == PacketType::LIST);
    assert(reply.files.size() == 2);
    assert(reply.files["ten.bin"] == 10);
    assert(reply.files["big.bin"] == 200000);

    // 不存在的文件不创建传输
    assert(channel.send(Packet::makeDownload("nope.bin", 0, 100)));
    assert(channel.receive(reply, std::chrono::milliseconds(2000)));
    assert(reply.type == PacketType::ERROR);
    assert(reply.fileName == "nope.bin");
    assert(reply.message.rfind(NOT_FOUND_MESSAGE, 0) == 0);

    assert(channel.send(Packet::makeDownload("ten.bin", 11, 1)));
    assert(channel.receive(reply, std::chrono::milliseconds(2000)));
    assert(reply.type == PacketType::ERROR);
    assert(reply.message == "Invalid offset");
    assert(server.transfers().empty());

    UdpChannel partChannel(address, false);
    ChunkReceiver receiver(partChannel, clientSession(), "nope.bin", 0, 100);
    assert(!receiver.run());
    assert(receiver.failure() == FailureReason::NOT_FOUND);
    assert(server.transfers().empty());

    // 声明 client_port 的通道按声明的端口归入会话
    UdpChannel declared(address, true);
    assert(declared.localPort() != 0);
    assert(declared.send(Packet::makeDownload("ten.bin", 0, 10)));
    Packet start;
    assert(declared.receive(start, std::chrono::milliseconds(2000)));
    assert(start.type == PacketType::START);
    auto transfers = server.transfers();
    assert(transfers.size() == 1);
    assert(transfers[0].clientKey == LOOPBACK + ":" + std::to_string(declared.localPort()));

    server.stop();
    std::cout << "LIST and request error tests passed!" << std::endl;
}

void test_range_too_large() {
    std::cout << "Testing range with too many chunks..." << std::endl;

    Fixture fixture("transfer_huge");
    // 稀疏文件，4 GiB + 1 字节，按 1 字节分块超出 uint32 序号
    std::filesystem::resize_file(fixture.dir.file("ten.bin"), static_cast<uint64_t>(UINT32_MAX) + 2);
    FileCatalog catalog(fixture.dir.path());
    assert(catalog.addFile("ten.bin"));

    ServerConfig config = loopbackConfig();
    config.session.chunkSize = 1;
    FileServer server(config, catalog);
    assert(server.start());

    UdpChannel channel(SocketAddress(LOOPBACK, server.port()), false);
    assert(channel.send(Packet::makeDownload("ten.bin", 0, static_cast<uint64_t>(UINT32_MAX) + 2)));
    Packet reply;
    assert(channel.receive(reply, std::chrono::milliseconds(2000)));
    assert(reply.type == PacketType::ERROR);
    assert(reply.message == "Range too large");
    assert(server.transfers().empty());

    // 缩小到范围内的请求照常开始
    assert(channel.send(Packet::makeDownload("ten.bin", 0, 100)));
    assert(channel.receive(reply, std::chrono::milliseconds(2000)));
    assert(reply.type == PacketType::START);
    assert(reply.totalChunks && *reply.totalChunks == 100);

    server.stop();
    std::cout << "Range too large tests passed!" << std::endl;
}

void test_lossy_parts() {
    std::cout << "Testing two parts with a lost DATA..." << std::endl;

    Fixture fixture("transfer_lossy");
    FileServer server(loopbackConfig(), fixture.catalog);
    assert(server.start());
    SocketAddress address(LOOPBACK, server.port());

    // 只丢弃分段0的第一个 DATA
    auto dropped = std::make_shared<std::atomic<bool> >(false);
    PartCoordinator::ChannelFactory factory = [address, dropped](uint32_t index) {
        std::unique_ptr<PacketChannel> inner = std::make_unique<UdpChannel>(address, false);
        if (index != 0) {
            return inner;
        }
        std::unique_ptr<PacketChannel> lossy = std::make_unique<test::DroppingChannel>(
            std::move(inner), [dropped](const Packet &packet) {
                return packet.type == PacketType::DATA && !dropped->exchange(true);
            });
        return lossy;
    };

    ProgressBoard board;
    PartCoordinator coordinator(clientSession(), factory, board);
    std::string output = fixture.dir.file("ten.out");
    DownloadResult result = coordinator.download("ten.bin", 10, 2, output);

    assert(result.ok);
    assert(dropped->load());
    assert(fixture.dir.read("ten.out") == fixture.ten);
    assert(!std::filesystem::exists(output + TEMP_SUFFIX));

    // 接收方发出最后的 ACK 时服务器可能还没结束
    assert(waitUntil([&server]() { return allCompleted(server, 2); }));

    auto transfers = server.transfers();
    assert(transfers[0].id != transfers[1].id);
    for (const auto &t: transfers) {
        assert(t.fileName == "ten.bin");
        assert(t.length == 5);
        assert(t.totalChunks == 1);
        assert(server.cachedChunks(t.id) == 1);
        // 只有分段0的块0被重发，且恰好一次
        if (t.offset == 0) {
            assert(t.retransmits == 1);
        } else {
            assert(t.offset == 5);
            assert(t.retransmits == 0);
        }
    }
    // 两个分段来自不同端口，是两个会话
    assert(server.sessionCount() == 2);

    server.stop();
    std::cout << "Lossy part tests passed!" << std::endl;
}

void test_file_client() {
    std::cout << "Testing FileClient download..." << std::endl;

    Fixture fixture("transfer_client");
    FileServer server(loopbackConfig(), fixture.catalog);
    assert(server.start());

    ClientConfig config;
    config.serverIP = LOOPBACK;
    config.serverPort = server.port();
    config.downloadDir = fixture.dir.file("downloads");
    config.inputFile = fixture.dir.file("input.txt");
    config.showProgress = false;
    config.scanIntervalMs = 100;
    config.session = clientSession();
    std::filesystem::create_directories(config.downloadDir);

    FileClient client(config);
    auto catalog = client.fetchCatalog();
    assert(catalog);
    assert(catalog->size() == 2);
    assert(catalog->at("big.bin") == 200000);

    DownloadResult result = client.downloadFile("big.bin", 200000);
    assert(result.ok);
    assert(result.bytes == 200000);
    assert(fixture.dir.read("downloads/big.bin") == fixture.big);

    // 服务器为每个分段各开一个传输，按偏移覆盖整个文件
    assert(waitUntil([&server]() { return allCompleted(server, MAX_PARTS); }));
    std::set<uint64_t> offsets;
    for (const auto &t: server.transfers()) {
        assert(t.length == 50000);
        assert(t.totalChunks == 49);
        offsets.insert(t.offset);
    }
    assert(offsets == (std::set<uint64_t>{0, 50000, 100000, 150000}));

    server.stop();
    std::cout << "FileClient download tests passed!" << std::endl;
}

void test_client_loop() {
    std::cout << "Testing client scan loop..." << std::endl;

    Fixture fixture("transfer_loop");
    FileServer server(loopbackConfig(), fixture.catalog);
    assert(server.start());

    ClientConfig config;
    config.serverIP = LOOPBACK;
    config.serverPort = server.port();
    config.downloadDir = fixture.dir.file("downloads");
    config.inputFile = fixture.dir.file("input.txt");
    config.showProgress = false;
    config.scanIntervalMs = 100;
    config.session = clientSession();
    fixture.dir.writeText("input.txt", "# wanted\nten.bin\nmissing.bin\n");

    std::atomic<bool> stop{false};
    FileClient client(config);
    client.setStopFlag(&stop);

    int exitCode = -1;
    std::thread runner([&client, &exitCode]() { exitCode = client.run(); });

    std::string output = fixture.dir.file("downloads/ten.bin");
    bool saved = waitUntil([&output]() { return std::filesystem::exists(output); }, 10000);

    stop = true;
    runner.join();

    assert(saved);
    assert(exitCode == 0);
    assert(fixture.dir.read("downloads/ten.bin") == fixture.ten);
    assert(client.isCompleted("ten.bin"));
    assert(!client.isCompleted("missing.bin"));
    assert(client.pendingFiles() == std::vector<std::string>{"missing.bin"});

    server.stop();
    std::cout << "Client scan loop tests passed!" << std::endl;
}

void test_eviction_and_idle() {
    std::cout << "Testing eviction and idle expiry..." << std::endl;

    Fixture fixture("transfer_evict");
    ServerConfig config = loopbackConfig();
    config.evictionDelayMs = 200;
    config.sweepIntervalMs = 50;
    config.sessionIdleMs = 300;
    FileServer server(config, fixture.catalog);
    assert(server.start());
    SocketAddress address(LOOPBACK, server.port());

    ProgressBoard board;
    PartCoordinator coordinator(clientSession(), [address](uint32_t) {
        return std::unique_ptr<PacketChannel>(std::make_unique<UdpChannel>(address, false));
    }, board);
    DownloadResult result = coordinator.download("ten.bin", 10, 1, fixture.dir.file("ten.out"));
    assert(result.ok);

    // 传输记录和块缓存在延迟后移除，随后空闲会话过期
    assert(waitUntil([&server]() { return server.transfers().empty() && server.sessionCount() == 0; }));
    assert(server.cachedChunks(1) == 0);

    server.stop();
    std::cout << "Eviction and idle expiry tests passed!" << std::endl;
}

void test_stop_during_transfer() {
    std::cout << "Testing stop during an active transfer..." << std::endl;

    Fixture fixture("transfer_stop");
    FileServer server(loopbackConfig(), fixture.catalog);
    assert(server.start());
    SocketAddress address(LOOPBACK, server.port());

    // 收到 START 后不再应答，发送方处于重传等待中
    UdpChannel channel(address, false);
    assert(channel.send(Packet::makeDownload("big.bin", 0, 200000)));
    Packet start;
    assert(channel.receive(start, std::chrono::milliseconds(2000)));
    assert(start.type == PacketType::START);
    assert(start.transferId);
    assert(start.totalChunks && *start.totalChunks == 196);

    Timer timer;
    server.stop();
    assert(timer.elapsed() < 1500);
    assert(server.transfers().empty());
    assert(server.sessionCount() == 0);

    std::cout << "Stop during transfer tests passed!" << std::endl;
}

int main() {
    std::cout << "Running udpfetch transfer tests..." << std::endl;
    std::cout << "==================================" << std::endl;

    try {
        test_list_and_errors();
        test_range_too_large();
        test_lossy_parts();
        test_file_client();
        test_client_loop();
        test_eviction_and_idle();
        test_stop_during_transfer();

        std::cout << std::endl;
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
