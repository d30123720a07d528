#include "file_mapper.h"
#include "utils.h"

#include <cerrno>
#include <cstring>

namespace udpfetch {
    FileMapper::~FileMapper() {
        close();
    }

    bool FileMapper::openForRead(const std::string &filename) {
        if (isOpen()) {
            close();
        }

        filename_ = filename;

        fileDescriptor_ = ::open(filename.c_str(), O_RDONLY);
        if (fileDescriptor_ < 0) {
            return false;
        }

        struct stat st;
        if (fstat(fileDescriptor_, &st) < 0) {
            ::close(fileDescriptor_);
            fileDescriptor_ = -1;
            return false;
        }

        fileSize_ = static_cast<uint64_t>(st.st_size);
        return true;
    }

    bool FileMapper::openForWrite(const std::string &filename, uint64_t fileSize) {
        if (isOpen()) {
            close();
        }

        filename_ = filename;
        fileSize_ = fileSize;

        fileDescriptor_ = ::open(filename.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
        if (fileDescriptor_ < 0) {
            return false;
        }

        // 设置文件大小
        if (ftruncate(fileDescriptor_, static_cast<off_t>(fileSize)) < 0) {
            Log::error("ftruncate " + filename + " failed: " + std::strerror(errno));
            ::close(fileDescriptor_);
            fileDescriptor_ = -1;
            return false;
        }

        return true;
    }

    std::vector<uint8_t> FileMapper::readAt(uint64_t offset, size_t length) const {
        std::vector<uint8_t> buffer(length);
        if (!isOpen()) {
            buffer.clear();
            return buffer;
        }

        size_t done = 0;
        while (done < length) {
            ssize_t r = pread(fileDescriptor_, buffer.data() + done, length - done,
                              static_cast<off_t>(offset + done));
            if (r < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (r == 0) {
                break; // EOF
            }
            done += static_cast<size_t>(r);
        }

        buffer.resize(done);
        return buffer;
    }

    bool FileMapper::writeAt(uint64_t offset, const uint8_t *data, size_t length) {
        if (!isOpen()) {
            return false;
        }

        size_t done = 0;
        while (done < length) {
            ssize_t w = pwrite(fileDescriptor_, data + done, length - done,
                               static_cast<off_t>(offset + done));
            if (w < 0) {
                if (errno == EINTR) {
                    continue;
                }
                Log::error("pwrite " + filename_ + " failed: " + std::strerror(errno));
                return false;
            }
            done += static_cast<size_t>(w);
        }
        return true;
    }

    bool FileMapper::sync() {
        if (!isOpen()) {
            return false;
        }
        return fsync(fileDescriptor_) == 0;
    }

    void FileMapper::close() {
        if (fileDescriptor_ >= 0) {
            ::close(fileDescriptor_);
            fileDescriptor_ = -1;
        }

        fileSize_ = 0;
        filename_.clear();
    }
} // namespace udpfetch
