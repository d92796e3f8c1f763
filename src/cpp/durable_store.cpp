#include "durable_store.hpp"
#include "debug.hpp"
#include <yaml-cpp/yaml.h>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace {

constexpr std::size_t DOUBLE_PRECISION = 17;

std::string parent_directory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

// Accepts an absent collection (null) or a mapping
void expect_map(const YAML::Node& node, const std::string& key) {
    if (!node.IsNull() && !node.IsMap()) {
        throw DatabaseError("collection '" + key + "' is not a mapping");
    }
}

double as_number(const YAML::Node& node, const std::string& key, const std::string& directory) {
    double value = 0.0;
    try {
        value = node.as<double>();
    } catch (const YAML::BadConversion&) {
        throw DatabaseError("non-numeric " + key + " value for '" + directory + "'");
    }
    if (!std::isfinite(value)) {
        throw DatabaseError("non-finite " + key + " value for '" + directory + "'");
    }
    return value;
}

} // namespace

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::string& target_path)
    : target_path_(target_path) {}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_ && !temp_path_.empty()) {
        std::remove(temp_path_.c_str());
    }
}

bool AtomicFileWriter::fail(const std::string& what) {
    error_ = what + ": " + std::strerror(errno);
    return false;
}

bool AtomicFileWriter::write(const std::string& data) {
    std::string name = std::filesystem::path(target_path_).filename().string();
    std::string pattern = parent_directory(target_path_) + "/." + name + ".XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemp(buffer.data());
    if (fd == -1) {
        return fail("Failed to create temporary file " + pattern);
    }
    temp_path_ = buffer.data();

    const char* cursor = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            bool result = fail("Failed to write " + temp_path_);
            close(fd);
            return result;
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }

    // mkstemp creates the file 0600; the database is a private file anyway
    if (fsync(fd) != 0) {
        bool result = fail("Failed to sync " + temp_path_);
        close(fd);
        return result;
    }

    if (close(fd) != 0) {
        return fail("Failed to close " + temp_path_);
    }

    return true;
}

bool AtomicFileWriter::commit() {
    if (temp_path_.empty()) {
        errno = ENOENT;
        return fail("Nothing written for " + target_path_);
    }

    if (std::rename(temp_path_.c_str(), target_path_.c_str()) != 0) {
        return fail("Failed to rename " + temp_path_ + " to " + target_path_);
    }
    committed_ = true;

    // Make the rename itself durable; failure here does not undo the replace
    int dir_fd = open(parent_directory(target_path_).c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd != -1) {
        fsync(dir_fd);
        close(dir_fd);
    }

    return true;
}

// DurableStore implementation
Database DurableStore::parse(const std::string& text) {
    Database db;

    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw DatabaseError(std::string("malformed database: ") + e.what());
    }

    if (root.IsNull()) {
        return db;
    }
    if (!root.IsMap()) {
        throw DatabaseError("database root is not a mapping");
    }

    try {
        for (const auto& section : root) {
            std::string key = section.first.as<std::string>();
            const YAML::Node& node = section.second;
            expect_map(node, key);

            if (key == DatabaseKeys::MARKS) {
                for (const auto& entry : node) {
                    db.marks[entry.first.as<std::string>()] = entry.second.as<std::string>();
                }
            } else if (key == DatabaseKeys::FREQUENCY) {
                for (const auto& entry : node) {
                    std::string directory = entry.first.as<std::string>();
                    double value = as_number(entry.second, key, directory);
                    if (value < 0.0) {
                        throw DatabaseError("negative count for '" + directory + "'");
                    }
                    db.frequency[directory] = value;
                }
            } else if (key == DatabaseKeys::IGNORED) {
                for (const auto& entry : node) {
                    db.ignored.insert(entry.first.as<std::string>());
                }
            } else if (key == DatabaseKeys::LAST_VISIT) {
                for (const auto& entry : node) {
                    std::string directory = entry.first.as<std::string>();
                    db.last_visit[directory] = as_number(entry.second, key, directory);
                }
            } else {
                throw DatabaseError("unknown top-level key '" + key + "'");
            }
        }
    } catch (const YAML::Exception& e) {
        throw DatabaseError(std::string("malformed database: ") + e.what());
    }

    // Older files could carry scores for ignored directories
    for (const auto& directory : db.ignored) {
        if (db.frequency.erase(directory) + db.last_visit.erase(directory) > 0) {
            DEBUG_LOGLN << "Dropped score of ignored directory " << directory;
        }
    }

    return db;
}

std::string DurableStore::serialize(const Database& db) {
    YAML::Emitter out;
    out.SetDoublePrecision(DOUBLE_PRECISION);

    out << YAML::BeginMap;

    out << YAML::Key << DatabaseKeys::MARKS << YAML::Value << YAML::BeginMap;
    for (const auto& mark : db.marks) {
        out << YAML::Key << mark.first << YAML::Value << mark.second;
    }
    out << YAML::EndMap;

    out << YAML::Key << DatabaseKeys::FREQUENCY << YAML::Value << YAML::BeginMap;
    for (const auto& entry : db.frequency) {
        out << YAML::Key << entry.first << YAML::Value << entry.second;
    }
    out << YAML::EndMap;

    out << YAML::Key << DatabaseKeys::IGNORED << YAML::Value << YAML::BeginMap;
    for (const auto& directory : db.ignored) {
        out << YAML::Key << directory << YAML::Value << 1;
    }
    out << YAML::EndMap;

    out << YAML::Key << DatabaseKeys::LAST_VISIT << YAML::Value << YAML::BeginMap;
    for (const auto& entry : db.last_visit) {
        out << YAML::Key << entry.first << YAML::Value << entry.second;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::string text = out.c_str();
    text += "\n";
    return text;
}

Database DurableStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        DEBUG_LOGLN << "Creating new database " << path_;
        return Database();
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw DatabaseError("cannot open " + path_ + ": " + std::strerror(errno));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    Database db = parse(buffer.str());
    DEBUG_LOGLN << "Loaded file " << path_;
    return db;
}

bool DurableStore::save(const Database& db) const {
    AtomicFileWriter writer(path_);
    if (!writer.write(serialize(db)) || !writer.commit()) {
        ERROR_LOG("Failed to write data to " << path_ << " (" << writer.error() << ")");
        return false;
    }

    DEBUG_LOGLN << "Successfully wrote data to " << path_;
    return true;
}
