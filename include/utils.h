#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <deque>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <atomic>
#include <mutex>
#include <condition_variable>

namespace udpfetch {
    class Timer {
    public:
        Timer() : start_(std::chrono::steady_clock::now()) {
        }

        void reset() { start_ = std::chrono::steady_clock::now(); }

        template<typename Duration = std::chrono::milliseconds>
        int64_t elapsed() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration_cast<Duration>(now - start_).count();
        }

    private:
        std::chrono::steady_clock::time_point start_;
    };

    // 多生产者/多消费者阻塞队列，close() 之后 pop 立即返回 false
    template<typename T>
    class BlockingQueue {
    public:
        bool push(T item) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return false;
                }
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
            return true;
        }

        bool pop(T &item, std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); })) {
                return false;
            }
            if (items_.empty()) {
                return false;
            }
            item = std::move(items_.front());
            items_.pop_front();
            return true;
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

    private:
        std::deque<T> items_;
        bool closed_ = false;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };

    class ProgressBar {
    public:
        ProgressBar(uint64_t total) : total_(total), current_(0) {
        }

        void update(uint64_t current) {
            current_ = current;
            print();
        }

        void setSuffix(const std::string &suffix) { suffix_ = suffix; }

        void print() {
            double percentage = total_ == 0 ? 100.0 : static_cast<double>(current_) / total_ * 100;
            int barWidth = 40;
            int pos = static_cast<int>(barWidth * percentage / 100);

            std::cout << "\r[";
            for (int i = 0; i < barWidth; ++i) {
                if (i < pos) std::cout << "=";
                else if (i == pos) std::cout << ">";
                else std::cout << " ";
            }
            std::cout << "] " << std::fixed << std::setprecision(1)
                    << percentage << "% "
                    << formatBytes(current_) << " / " << formatBytes(total_);
            if (!suffix_.empty()) {
                std::cout << " " << suffix_;
            }
            std::cout.flush();
        }

        void finish() {
            print();
            std::cout << std::endl;
        }

        static std::string formatBytes(uint64_t bytes) {
            const char *units[] = {"B", "KB", "MB", "GB", "TB"};
            int unitIndex = 0;
            double value = static_cast<double>(bytes);

            while (value >= 1024 && unitIndex < 4) {
                value /= 1024;
                ++unitIndex;
            }

            std::stringstream ss;
            ss << std::fixed << std::setprecision(2) << value << " " << units[unitIndex];
            return ss.str();
        }

    private:
        uint64_t total_;
        uint64_t current_;
        std::string suffix_;
    };

    // 控制台日志：[LEVEL] 时间 消息，多线程下整行输出
    namespace Log {
        void setVerbose(bool verbose);

        void debug(const std::string &message);

        void info(const std::string &message);

        void warn(const std::string &message);

        void error(const std::string &message);
    }

    // 平台工具函数
    namespace Platform {
        std::string getCurrentTimeString();

        // 进程级停止信号（SIGINT/SIGTERM）
        void installSignalHandlers(std::atomic<bool> &stopFlag);
    }
} // namespace udpfetch
