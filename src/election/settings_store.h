/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: settings_store.h

    Description:
        Shared key/value coordination store used for leader election. Every
        instance of a scale-out deployment points at the same store.

        Keys:
        - LeaderId:        instance id ("host:port") of the lease holder. It is
                           also the directory entry followers use to address
                           the leader.
        - LeaderHeartbeat: milliseconds since the Unix epoch of the holder's
                           last renewal.

        Implementations:
        - InMemorySettingsStore: one process (tests, single-instance mode)
        - FileSettingsStore:     a file on storage reachable by all instances,
                                 serialized with flock(2) on "<path>.lock" and
                                 replaced atomically with rename(2)

    Error Handling:
        Every operation throws StoreError when the store cannot be read or
        written. Callers treat that as "leadership unknown".

*******************************************************************************/

#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace dss {

constexpr const char* kLeaderIdKey = "LeaderId";
constexpr const char* kLeaderHeartbeatKey = "LeaderHeartbeat";

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

class SettingsStore {
public:
    // Receives the current value (empty when absent); returns true to write.
    using Condition = std::function<bool(const std::string& current)>;

    virtual ~SettingsStore() = default;

    // Empty string when the key is absent.
    virtual std::string get(const std::string& key) = 0;

    virtual void set(const std::string& key, const std::string& value) = 0;

    // Atomically writes `desired` if `condition(current)` holds. Returns
    // whether the write happened.
    virtual bool compare_and_set(const std::string& key,
                                 const std::string& desired,
                                 const Condition& condition) = 0;
};

class InMemorySettingsStore : public SettingsStore {
private:
    std::map<std::string, std::string> values_;
    std::mutex mutex_;

public:
    std::string get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool compare_and_set(const std::string& key,
                         const std::string& desired,
                         const Condition& condition) override;
};

class FileSettingsStore : public SettingsStore {
private:
    std::string path_;
    std::string lock_path_;
    std::mutex mutex_;      // serializes threads of this process; flock covers other processes

    std::map<std::string, std::string> read_all() const;
    void write_all(const std::map<std::string, std::string>& values) const;

    template <typename Fn>
    auto with_lock(Fn&& fn) -> decltype(fn());

public:
    explicit FileSettingsStore(const std::string& path);

    const std::string& path() const { return path_; }

    std::string get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool compare_and_set(const std::string& key,
                         const std::string& desired,
                         const Condition& condition) override;
};

} // namespace dss

#endif // SETTINGS_STORE_H
