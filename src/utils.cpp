#include "utils.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <csignal>

namespace udpfetch {
    namespace Log {
        namespace {
            std::mutex logMutex;
            std::atomic<bool> verboseEnabled{false};

            void write(std::ostream &out, const char *level, const std::string &message) {
                std::string line = std::string("[") + level + "] " +
                                   Platform::getCurrentTimeString() + " " + message;
                std::lock_guard<std::mutex> lock(logMutex);
                out << line << std::endl;
            }
        }

        void setVerbose(bool verbose) {
            verboseEnabled = verbose;
        }

        void debug(const std::string &message) {
            if (verboseEnabled) {
                write(std::cout, "DEBUG", message);
            }
        }

        void info(const std::string &message) {
            write(std::cout, "INFO", message);
        }

        void warn(const std::string &message) {
            write(std::cerr, "WARNING", message);
        }

        void error(const std::string &message) {
            write(std::cerr, "ERROR", message);
        }
    } // namespace Log

    namespace Platform {
        namespace {
            std::atomic<bool> *signalTarget = nullptr;

            void onStopSignal(int) {
                if (signalTarget) {
                    signalTarget->store(true);
                }
            }
        }

        std::string getCurrentTimeString() {
            auto now = std::chrono::system_clock::now();
            auto in_time_t = std::chrono::system_clock::to_time_t(now);

            std::tm local{};
            localtime_r(&in_time_t, &local);

            std::stringstream ss;
            ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return ss.str();
        }

        void installSignalHandlers(std::atomic<bool> &stopFlag) {
            signalTarget = &stopFlag;
            std::signal(SIGINT, onStopSignal);
            std::signal(SIGTERM, onStopSignal);
        }
    } // namespace Platform
} // namespace udpfetch
