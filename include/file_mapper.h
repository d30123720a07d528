#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace udpfetch {
    // 按偏移随机读写的文件句柄，多个线程可以并发写不重叠的区间
    class FileMapper {
    public:
        FileMapper() = default;

        ~FileMapper();

        FileMapper(const FileMapper &) = delete;

        FileMapper &operator=(const FileMapper &) = delete;

        // 打开文件用于读取
        bool openForRead(const std::string &filename);

        // 创建或截断文件并预分配到 fileSize
        bool openForWrite(const std::string &filename, uint64_t fileSize);

        // 读取 [offset, offset+length)，返回实际读到的字节
        std::vector<uint8_t> readAt(uint64_t offset, size_t length) const;

        // 完整写入返回 true
        bool writeAt(uint64_t offset, const uint8_t *data, size_t length);

        bool writeAt(uint64_t offset, const std::vector<uint8_t> &data) {
            return writeAt(offset, data.data(), data.size());
        }

        // 同步数据到磁盘
        bool sync();

        // 获取文件大小
        uint64_t size() const { return fileSize_; }

        const std::string &filename() const { return filename_; }

        bool isOpen() const { return fileDescriptor_ >= 0; }

        void close();

    private:
        std::string filename_;
        uint64_t fileSize_ = 0;
        int fileDescriptor_ = -1;
    };
} // namespace udpfetch
