#include "cli.h"
#include "utils.h"

#include <iostream>
#include <getopt.h>
#include <filesystem>

namespace udpfetch {
    namespace {
        // 数字参数解析失败抛出 invalid_argument/out_of_range
        uint32_t parseNumber(const char *text, const char *name) {
            std::string value(text);
            size_t pos = 0;
            unsigned long parsed = std::stoul(value, &pos);
            if (pos != value.size() || parsed > UINT32_MAX) {
                throw std::invalid_argument(std::string("bad value for ") + name + ": " + value);
            }
            return static_cast<uint32_t>(parsed);
        }

        uint16_t parsePort(const char *text) {
            uint32_t port = parseNumber(text, "port");
            if (port > 65535) {
                throw std::invalid_argument("port out of range: " + std::string(text));
            }
            return static_cast<uint16_t>(port);
        }
    }

    bool validateSessionConfig(const SessionConfig &config) {
        if (config.chunkSize < 1 || config.chunkSize > MAX_CHUNK_SIZE) {
            std::cerr << "Error: Chunk size must be between 1 and " << MAX_CHUNK_SIZE << " bytes" << std::endl;
            return false;
        }

        if (config.ackTimeoutMs < 10 || config.ackTimeoutMs > 60000) {
            std::cerr << "Error: ACK timeout must be between 10 and 60000 ms" << std::endl;
            return false;
        }

        if (config.maxRetries > 100) {
            std::cerr << "Error: Retry count must be at most 100" << std::endl;
            return false;
        }

        if (config.maxIdleTimeouts < 1) {
            std::cerr << "Error: Idle timeout count must be at least 1" << std::endl;
            return false;
        }

        return true;
    }

    bool parseServerCommandLine(int argc, char *argv[], ServerConfig &config) {
        optind = 1;
        int opt;
        try {
            while ((opt = getopt(argc, argv, "p:b:l:d:c:t:r:e:i:vh")) != -1) {
                switch (opt) {
                    case 'p':
                        config.port = parsePort(optarg);
                        break;
                    case 'b':
                        config.bindIP = optarg;
                        break;
                    case 'l':
                        config.catalogFile = optarg;
                        break;
                    case 'd':
                        config.rootDir = optarg;
                        break;
                    case 'c':
                        config.session.chunkSize = parseNumber(optarg, "chunk size");
                        break;
                    case 't':
                        config.session.ackTimeoutMs = parseNumber(optarg, "timeout");
                        break;
                    case 'r':
                        config.session.maxRetries = parseNumber(optarg, "retries");
                        break;
                    case 'e':
                        config.evictionDelayMs = parseNumber(optarg, "eviction delay");
                        break;
                    case 'i':
                        config.sessionIdleMs = parseNumber(optarg, "session idle");
                        break;
                    case 'v':
                        config.verbose = true;
                        break;
                    case 'h':
                    default:
                        return false;
                }
            }
        } catch (const std::exception &e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return false;
        }

        if (optind < argc) {
            std::cerr << "Error: Unexpected argument: " << argv[optind] << std::endl;
            return false;
        }

        if (!validateSessionConfig(config.session)) {
            return false;
        }

        if (config.evictionDelayMs < config.session.ackTimeoutMs) {
            std::cerr << "Error: Eviction delay must not be shorter than the ACK timeout" << std::endl;
            return false;
        }

        if (!std::filesystem::is_directory(config.rootDir)) {
            std::cerr << "Error: File directory does not exist: " << config.rootDir << std::endl;
            return false;
        }

        return true;
    }

    bool parseClientCommandLine(int argc, char *argv[], ClientConfig &config) {
        optind = 1;
        int opt;
        try {
            while ((opt = getopt(argc, argv, "s:p:n:f:o:t:r:i:Pqvh")) != -1) {
                switch (opt) {
                    case 's':
                        config.serverIP = optarg;
                        break;
                    case 'p':
                        config.serverPort = parsePort(optarg);
                        break;
                    case 'n':
                        config.maxParts = parseNumber(optarg, "parts");
                        break;
                    case 'f':
                        config.inputFile = optarg;
                        break;
                    case 'o':
                        config.downloadDir = optarg;
                        break;
                    case 't':
                        config.session.ackTimeoutMs = parseNumber(optarg, "timeout");
                        config.session.lingerMs = config.session.ackTimeoutMs;
                        break;
                    case 'r':
                        config.session.maxIdleTimeouts = parseNumber(optarg, "idle timeouts");
                        break;
                    case 'i':
                        config.scanIntervalMs = parseNumber(optarg, "scan interval");
                        break;
                    case 'P':
                        config.declareClientPort = true;
                        break;
                    case 'q':
                        config.showProgress = false;
                        break;
                    case 'v':
                        config.verbose = true;
                        break;
                    case 'h':
                    default:
                        return false;
                }
            }
        } catch (const std::exception &e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return false;
        }

        if (optind < argc) {
            std::cerr << "Error: Unexpected argument: " << argv[optind] << std::endl;
            return false;
        }

        if (config.maxParts < 1 || config.maxParts > MAX_PARTS) {
            std::cerr << "Error: Parts must be between 1 and " << MAX_PARTS << std::endl;
            return false;
        }

        if (config.scanIntervalMs < 100) {
            std::cerr << "Error: Scan interval must be at least 100 ms" << std::endl;
            return false;
        }

        try {
            SocketAddress probe(config.serverIP, config.serverPort);
        } catch (const std::exception &e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return false;
        }

        return validateSessionConfig(config.session);
    }

    void printServerUsage() {
        std::cout << "Usage: udpfetch-server [options]" << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  -p <port>       Listen port (default: 5000)" << std::endl;
        std::cout << "  -b <address>    Bind address (default: 0.0.0.0)" << std::endl;
        std::cout << "  -l <file>       File list (default: file_list.txt)" << std::endl;
        std::cout << "  -d <dir>        Directory holding the files (default: server_files)" << std::endl;
        std::cout << "  -c <bytes>      Chunk size (default: 8192, max: " << MAX_CHUNK_SIZE << ")" << std::endl;
        std::cout << "  -t <ms>         ACK timeout (default: 1000)" << std::endl;
        std::cout << "  -r <count>      Retries per packet (default: 5)" << std::endl;
        std::cout << "  -e <ms>         Keep finished transfers for (default: 5000)" << std::endl;
        std::cout << "  -i <ms>         Close idle sessions after (default: 60000)" << std::endl;
        std::cout << "  -v              Verbose packet logging" << std::endl;
        std::cout << std::endl;
        std::cout << "File list format: one \"<name> <size>\" per line, size in bytes or with KB/MB/GB" << std::endl;
    }

    void printClientUsage() {
        std::cout << "Usage: udpfetch-client -s <server> [options]" << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  -s <address>    Server IP address (default: 127.0.0.1)" << std::endl;
        std::cout << "  -p <port>       Server port (default: 5000)" << std::endl;
        std::cout << "  -n <parts>      Parallel parts per file (default: 4, max: 4)" << std::endl;
        std::cout << "  -f <file>       Input file with names to fetch (default: input.txt)" << std::endl;
        std::cout << "  -o <dir>        Download directory (default: downloads)" << std::endl;
        std::cout << "  -t <ms>         Receive timeout (default: 1000)" << std::endl;
        std::cout << "  -r <count>      Consecutive timeouts before giving up (default: 10)" << std::endl;
        std::cout << "  -i <ms>         Input scan interval (default: 5000)" << std::endl;
        std::cout << "  -P              Declare client_port in requests" << std::endl;
        std::cout << "  -q              Do not draw progress bars" << std::endl;
        std::cout << "  -v              Verbose packet logging" << std::endl;
        std::cout << std::endl;
        std::cout << "Examples:" << std::endl;
        std::cout << "  udpfetch-client -s 192.168.1.100 -n 4" << std::endl;
    }
} // namespace udpfetch
