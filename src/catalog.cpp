#include "catalog.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace udpfetch {
    std::optional<uint64_t> parseSize(const std::string &text) {
        std::string s;
        for (char c: text) {
            s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }

        uint64_t multiplier = 1;
        if (s.size() > 2 && s.compare(s.size() - 2, 2, "GB") == 0) {
            multiplier = 1024ULL * 1024 * 1024;
            s.resize(s.size() - 2);
        } else if (s.size() > 2 && s.compare(s.size() - 2, 2, "MB") == 0) {
            multiplier = 1024ULL * 1024;
            s.resize(s.size() - 2);
        } else if (s.size() > 2 && s.compare(s.size() - 2, 2, "KB") == 0) {
            multiplier = 1024ULL;
            s.resize(s.size() - 2);
        } else if (s.size() > 1 && s.back() == 'B') {
            s.pop_back();
        }

        if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
            return std::nullopt;
        }

        uint64_t value = 0;
        try {
            value = static_cast<uint64_t>(std::stoull(s));
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
        if (value > UINT64_MAX / multiplier) {
            return std::nullopt;
        }
        return value * multiplier;
    }

    FileCatalog::FileCatalog(const std::string &rootDir) : rootDir_(rootDir) {
    }

    bool FileCatalog::load(const std::string &listFile) {
        std::ifstream in(listFile);
        if (!in) {
            Log::error("Cannot open catalog file: " + listFile);
            return false;
        }

        std::map<std::string, uint64_t> loaded;
        std::string line;
        int lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            std::istringstream iss(line);
            std::vector<std::string> words;
            std::string word;
            while (iss >> word) {
                words.push_back(word);
            }
            if (words.empty() || words[0][0] == '#') {
                continue;
            }
            if (words.size() < 2) {
                Log::warn(listFile + ":" + std::to_string(lineNo) + ": missing size, skipped");
                continue;
            }

            // 名称可以含空格，最后一列是大小
            std::string name = words[0];
            for (size_t i = 1; i + 1 < words.size(); ++i) {
                name += " " + words[i];
            }

            auto declared = parseSize(words.back());
            if (!declared) {
                Log::warn(listFile + ":" + std::to_string(lineNo) + ": bad size '" + words.back() + "'");
                continue;
            }

            std::error_code ec;
            fs::path p = fs::path(rootDir_) / name;
            if (!fs::is_regular_file(p, ec)) {
                Log::warn("Catalog entry " + name + " has no file under " + rootDir_ + ", skipped");
                continue;
            }

            uint64_t actual = fs::file_size(p, ec);
            if (ec) {
                Log::warn("Cannot stat " + p.string() + ": " + ec.message());
                continue;
            }
            if (actual != *declared) {
                Log::warn("Catalog size of " + name + " is " + ProgressBar::formatBytes(*declared) +
                          " but file is " + std::to_string(actual) + " bytes, using actual size");
            }
            loaded[name] = actual;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = std::move(loaded);
        Log::info("Loaded " + std::to_string(entries_.size()) + " catalog entries from " + listFile);
        return true;
    }

    bool FileCatalog::addFile(const std::string &name) {
        std::error_code ec;
        fs::path p = fs::path(rootDir_) / name;
        uint64_t size = fs::file_size(p, ec);
        if (ec) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        entries_[name] = size;
        return true;
    }

    std::optional<uint64_t> FileCatalog::lookup(const std::string &name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, uint64_t> FileCatalog::files() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::string FileCatalog::path(const std::string &name) const {
        return (fs::path(rootDir_) / name).string();
    }

    size_t FileCatalog::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }
} // namespace udpfetch
