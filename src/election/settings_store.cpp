/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: settings_store.cpp

    Description:
        In-memory and file-backed coordination stores.

        File format: a single JSON object of string values, e.g.
            {"LeaderHeartbeat":"1760884335123","LeaderId":"web-1:8080"}

        Setting a key to the empty string removes it.

*******************************************************************************/

#include "election/settings_store.h"
#include "common/json.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dss {

//==============================================================================
// IN-MEMORY STORE
//==============================================================================

std::string InMemorySettingsStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return it == values_.end() ? std::string() : it->second;
}

void InMemorySettingsStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value.empty()) {
        values_.erase(key);
    } else {
        values_[key] = value;
    }
}

bool InMemorySettingsStore::compare_and_set(const std::string& key,
                                            const std::string& desired,
                                            const Condition& condition) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    std::string current = it == values_.end() ? std::string() : it->second;
    if (!condition(current)) return false;

    if (desired.empty()) {
        values_.erase(key);
    } else {
        values_[key] = desired;
    }
    return true;
}

//==============================================================================
// FILE STORE
//==============================================================================

namespace {

// Holds an exclusive flock for the lifetime of the object.
class FileLock {
private:
    int fd_;

public:
    explicit FileLock(const std::string& lock_path) : fd_(-1) {
        fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw StoreError("Cannot open store lock " + lock_path + ": " + std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            throw StoreError("Cannot lock store " + lock_path + ": " + std::strerror(err));
        }
    }

    ~FileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
};

} // namespace

FileSettingsStore::FileSettingsStore(const std::string& path)
    : path_(path), lock_path_(path + ".lock") {}

template <typename Fn>
auto FileSettingsStore::with_lock(Fn&& fn) -> decltype(fn()) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_path_);
    return fn();
}

std::map<std::string, std::string> FileSettingsStore::read_all() const {
    std::map<std::string, std::string> values;

    struct stat st;
    if (::stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT) return values;  // fresh store
        throw StoreError("Cannot open store " + path_ + ": " + std::strerror(errno));
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw StoreError("Cannot open store " + path_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    if (content.empty()) return values;

    try {
        JsonValue json = JsonValue::parse(content);
        for (const auto& [key, value] : json.as_object()) {
            values[key] = value.as_string();
        }
    } catch (const JsonParseError& e) {
        throw StoreError("Store " + path_ + " is corrupted: " + e.what());
    }
    return values;
}

void FileSettingsStore::write_all(const std::map<std::string, std::string>& values) const {
    JsonValue json = JsonValue::object();
    for (const auto& [key, value] : values) {
        json[key] = value;
    }
    std::string content = json.dump();

    std::string temp_path = path_ + ".tmp." + std::to_string(::getpid());
    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StoreError("Cannot write store " + temp_path + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(temp_path.c_str());
            throw StoreError("Cannot write store " + temp_path + ": " + std::strerror(err));
        }
        written += static_cast<size_t>(n);
    }

    // The descriptor is closed whether or not the sync succeeded.
    int err = ::fsync(fd) != 0 ? errno : 0;
    if (::close(fd) != 0 && err == 0) {
        err = errno;
    }
    if (err != 0) {
        ::unlink(temp_path.c_str());
        throw StoreError("Cannot sync store " + temp_path + ": " + std::strerror(err));
    }

    if (::rename(temp_path.c_str(), path_.c_str()) != 0) {
        err = errno;
        ::unlink(temp_path.c_str());
        throw StoreError("Cannot replace store " + path_ + ": " + std::strerror(err));
    }
}

std::string FileSettingsStore::get(const std::string& key) {
    return with_lock([&]() {
        auto values = read_all();
        auto it = values.find(key);
        return it == values.end() ? std::string() : it->second;
    });
}

void FileSettingsStore::set(const std::string& key, const std::string& value) {
    with_lock([&]() {
        auto values = read_all();
        if (value.empty()) {
            values.erase(key);
        } else {
            values[key] = value;
        }
        write_all(values);
    });
}

bool FileSettingsStore::compare_and_set(const std::string& key,
                                        const std::string& desired,
                                        const Condition& condition) {
    return with_lock([&]() {
        auto values = read_all();
        auto it = values.find(key);
        std::string current = it == values.end() ? std::string() : it->second;
        if (!condition(current)) return false;

        if (desired.empty()) {
            values.erase(key);
        } else {
            values[key] = desired;
        }
        write_all(values);
        return true;
    });
}

} // namespace dss
