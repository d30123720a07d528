#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace udpfetch {
    // 解析 "100MB" / "512KB" / "1GB" / "4096"，单位按1024计。无法解析返回 nullopt
    std::optional<uint64_t> parseSize(const std::string &text);

    // 服务器文件目录：名称 -> 字节数，文件位于 rootDir 下
    class FileCatalog {
    public:
        explicit FileCatalog(const std::string &rootDir);

        // 读取目录文件，每行 "<name> <size>"，空行和 # 注释跳过。
        // 磁盘上存在的文件以实际大小为准，不存在的条目跳过
        bool load(const std::string &listFile);

        // 直接登记一个已存在的文件，使用磁盘大小
        bool addFile(const std::string &name);

        std::optional<uint64_t> lookup(const std::string &name) const;

        std::map<std::string, uint64_t> files() const;

        std::string path(const std::string &name) const;

        const std::string &rootDir() const { return rootDir_; }

        size_t size() const;

    private:
        std::string rootDir_;
        std::map<std::string, uint64_t> entries_;
        mutable std::mutex mutex_;
    };
} // namespace udpfetch
