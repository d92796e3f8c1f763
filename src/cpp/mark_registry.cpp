#include "mark_registry.hpp"
#include "debug.hpp"
#include <cctype>

MarkStatus MarkRegistry::set_mark(const std::string& name, const std::string& directory) {
    db_.marks[name] = directory;
    DEBUG_LOGLN << "Added mark " << name << " for " << directory;
    return MarkStatus::Set;
}

MarkStatus MarkRegistry::remove_mark(const std::string& name) {
    auto it = db_.marks.find(name);
    if (it == db_.marks.end()) {
        return MarkStatus::NotFound;
    }

    DEBUG_LOGLN << "Removed mark " << name << " for directory " << it->second;
    db_.marks.erase(it);
    return MarkStatus::Removed;
}

std::optional<std::string> MarkRegistry::find_mark(const std::string& name) const {
    auto it = db_.marks.find(name);
    if (it == db_.marks.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

// Name without its trailing digits: "proj12" -> "proj"
std::string series_name(const std::string& name) {
    size_t end = name.find_last_not_of("0123456789");
    return end == std::string::npos ? std::string() : name.substr(0, end + 1);
}

bool ends_in_digit(const std::string& name) {
    return !name.empty() && std::isdigit(static_cast<unsigned char>(name.back()));
}

} // namespace

std::vector<std::pair<std::string, std::string>>
MarkRegistry::suggest_marks(const std::string& requested) const {
    std::vector<std::pair<std::string, std::string>> suggestions;
    if (requested.empty()) {
        return suggestions;
    }

    std::string series = ends_in_digit(requested) ? series_name(requested) : std::string();

    for (const auto& mark : db_.marks) {
        const std::string& name = mark.first;
        bool is_prefix_of_requested = !name.empty() && requested.compare(0, name.size(), name) == 0;
        bool extends_requested = name.compare(0, requested.size(), requested) == 0;
        bool same_series = !series.empty() && ends_in_digit(name) && series_name(name) == series;
        if (is_prefix_of_requested || extends_requested || same_series) {
            suggestions.emplace_back(name, mark.second);
        }
    }

    return suggestions;
}

IgnoreStatus MarkRegistry::ignore(const std::string& directory) {
    db_.ignored.insert(directory);
    db_.frequency.erase(directory);
    db_.last_visit.erase(directory);
    DEBUG_LOGLN << "Ignoring directory " << directory;
    return IgnoreStatus::Ignored;
}

IgnoreStatus MarkRegistry::unignore(const std::string& directory) {
    if (db_.ignored.erase(directory) == 0) {
        return IgnoreStatus::NotIgnored;
    }

    DEBUG_LOGLN << "Removed directory " << directory << " from ignore";
    return IgnoreStatus::Unignored;
}
