#include <iostream>
#include <thread>
#include <chrono>

#include "cli.h"
#include "server.h"
#include "utils.h"

using namespace udpfetch;

int main(int argc, char *argv[]) {
    ServerConfig config;
    if (!parseServerCommandLine(argc, argv, config)) {
        printServerUsage();
        return 1;
    }

    Log::setVerbose(config.verbose);

    std::atomic<bool> stop{false};
    Platform::installSignalHandlers(stop);

    try {
        FileCatalog catalog(config.rootDir);
        if (!catalog.load(config.catalogFile)) {
            return 1;
        }
        if (catalog.size() == 0) {
            Log::warn("Catalog is empty, every DOWNLOAD will be refused");
        }

        FileServer server(config, catalog);
        if (!server.start()) {
            Log::error("Failed to start server on port " + std::to_string(config.port));
            return 1;
        }

        while (!stop) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        Log::info("Shutting down...");
        server.stop();
    } catch (const std::exception &e) {
        Log::error(e.what());
        return 1;
    }

    return 0;
}
