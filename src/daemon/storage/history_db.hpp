#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string device_id;
    std::string args;
    double duration;
    std::optional<int> exit_code;
    std::string end_reason;
};

// Persistent record of finished mirroring sessions.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const std::string& device_id, const std::vector<std::string>& args,
                double duration, std::optional<int> exit_code, const std::string& end_reason);

    // Newest first. An empty device_id means every device.
    std::vector<HistoryEntry> recent(int limit = 10, const std::string& device_id = {});

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
