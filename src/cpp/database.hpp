#pragma once

#include <map>
#include <set>
#include <string>
#include <stdexcept>

// Raised when the database file exists but cannot be understood
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& what) : std::runtime_error(what) {}
};

// Top-level keys of the persisted record
namespace DatabaseKeys {
    constexpr const char* MARKS = "mark";
    constexpr const char* FREQUENCY = "count";
    constexpr const char* IGNORED = "ignore";
    constexpr const char* LAST_VISIT = "time";
}

// In-memory form of the navigation database.
// Ordered containers keep listings and tie-breaking deterministic.
struct Database {
    std::map<std::string, std::string> marks;       // mark name -> directory
    std::map<std::string, double> frequency;        // directory -> decaying visit count
    std::set<std::string> ignored;                  // directories excluded from scoring
    std::map<std::string, double> last_visit;       // directory -> epoch seconds

    bool empty() const {
        return marks.empty() && frequency.empty() && ignored.empty() && last_visit.empty();
    }

    bool is_ignored(const std::string& directory) const {
        return ignored.count(directory) > 0;
    }

    // True while no ignored directory carries a visit record
    bool ignore_exclusive() const {
        for (const auto& directory : ignored) {
            if (frequency.count(directory) || last_visit.count(directory)) {
                return false;
            }
        }
        return true;
    }

    bool operator==(const Database& other) const {
        return marks == other.marks && frequency == other.frequency &&
               ignored == other.ignored && last_visit == other.last_visit;
    }
};
