#include <iostream>

#include "cli.h"
#include "client.h"
#include "utils.h"

using namespace udpfetch;

int main(int argc, char *argv[]) {
    ClientConfig config;
    if (!parseClientCommandLine(argc, argv, config)) {
        printClientUsage();
        return 1;
    }

    Log::setVerbose(config.verbose);

    std::atomic<bool> stop{false};
    Platform::installSignalHandlers(stop);

    try {
        FileClient client(config);
        client.setStopFlag(&stop);
        return client.run();
    } catch (const std::exception &e) {
        Log::error(e.what());
        return 1;
    }
}
