#pragma once

#include <ulid/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ulid {

struct IdEntry {
    std::string id;      // 26-character text form
    std::string label;
};

// Labelled identifiers in a SQLite database. Ids are stored as 16-byte BLOBs,
// so SQLite's memcmp ordering is ULID time ordering.
class IdStore {
public:
    IdStore();
    ~IdStore();
    IdStore(IdStore&&) noexcept;
    IdStore& operator=(IdStore&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    static std::string default_store_path();

    // Generates a fresh id, stores it and returns its text form.
    Result<std::string> insert(const std::string& label);
    // Stores a caller-supplied id. Duplicate if it is already present.
    Status insert(const std::string& id, const std::string& label);

    Result<IdEntry> lookup(const std::string& id);
    Status remove(const std::string& id);
    Result<std::vector<IdEntry>> list();
    Result<int64_t> count();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ulid
