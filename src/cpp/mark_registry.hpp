#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "database.hpp"

enum class MarkStatus {
    Set,
    Removed,
    NotFound
};

enum class IgnoreStatus {
    Ignored,
    Unignored,
    NotIgnored
};

// Bookmarks and the ignore set, both stored inside the Database.
// Every mutation keeps ignored directories out of the score maps.
class MarkRegistry {
public:
    explicit MarkRegistry(Database& db) : db_(db) {}

    // Overwrites any existing mark of that name
    MarkStatus set_mark(const std::string& name, const std::string& directory);
    MarkStatus remove_mark(const std::string& name);
    std::optional<std::string> find_mark(const std::string& name) const;

    // Marks that could have been meant by a name that did not match:
    // marks that are a prefix of it, marks that extend it, and other
    // members of its numbered series ("proj3" -> "proj1", "proj12").
    // Sorted by mark name.
    std::vector<std::pair<std::string, std::string>> suggest_marks(const std::string& requested) const;

    IgnoreStatus ignore(const std::string& directory);
    IgnoreStatus unignore(const std::string& directory);

private:
    Database& db_;
};
