#pragma once

#include <string>
#include "database.hpp"

// Replaces a file in one step: data goes to a temporary file in the same
// directory, which is flushed to disk and renamed over the target on commit().
// Until commit() succeeds the target keeps its previous content. An
// uncommitted temporary is removed on destruction.
class AtomicFileWriter {
public:
    explicit AtomicFileWriter(const std::string& target_path);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    // Create the temporary, write data and fsync it
    bool write(const std::string& data);

    // Rename the temporary over the target
    bool commit();

    const std::string& temp_path() const { return temp_path_; }
    const std::string& error() const { return error_; }

private:
    std::string target_path_;
    std::string temp_path_;
    std::string error_;
    bool committed_ = false;

    bool fail(const std::string& what);
};

// Persistence of the navigation database
class DurableStore {
public:
    explicit DurableStore(const std::string& path) : path_(path) {}

    // Missing file yields an empty database; anything unreadable throws DatabaseError
    Database load() const;

    // Atomic replace; failures are logged and reported as false
    bool save(const Database& db) const;

    const std::string& path() const { return path_; }

    static Database parse(const std::string& text);
    static std::string serialize(const Database& db);

private:
    std::string path_;
};
