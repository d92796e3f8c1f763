#include "interactive_menu.hpp"
#include "debug.hpp"
#include "frecency.hpp"
#include <iostream>
#include <vector>

InteractiveMenu::InteractiveMenu(const Database& db, const Theme& theme, int max_choices)
    : db_(db)
    , theme_(theme)
    , max_choices_(max_choices)
{}

int InteractiveMenu::render_list(std::ostream& out, const std::string& title,
                                 const std::vector<std::string>& ranked, int next_index) {
    out << theme_.heading(title) << "\n";

    int shown = 0;
    for (const auto& directory : ranked) {
        if (shown >= max_choices_) {
            break;
        }
        out << "  (" << next_index << ") " << directory << "\n";
        options_[std::to_string(next_index)] = directory;
        ++next_index;
        ++shown;
    }

    return next_index;
}

void InteractiveMenu::render(std::ostream& out) {
    options_.clear();

    int index = render_list(out, "Most Frequent Directories:", ranked_by_frequency(db_), 0);
    render_list(out, "Most Recent Directories:", ranked_by_recency(db_), index);

    out << theme_.heading("Other options:") << "\n";
    out << "  (" << LIST_IGNORED << ") List ignored directories\n";
    out << "  (" << LIST_MARKS << ") List all marks\n";
    out << std::flush;
}

void InteractiveMenu::list_ignored(std::ostream& out) const {
    out << "Ignored directories:\n";
    for (const auto& directory : db_.ignored) {
        out << "  " << directory << "\n";
    }
}

void InteractiveMenu::list_marks(std::ostream& out) const {
    out << "Marked directories:\n";
    for (const auto& mark : db_.marks) {
        out << "  " << theme_.mark(mark.first) << " " << mark.second << "\n";
    }
}

MenuSelection InteractiveMenu::select(const std::string& reply, std::ostream& out) const {
    MenuSelection selection;

    // Trim whitespace
    std::string trimmed = reply;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);

    auto it = options_.find(trimmed);
    if (it != options_.end()) {
        DEBUG_LOGLN << "Selection " << trimmed << " maps to " << it->second;
        selection.outcome = MenuOutcome::Selected;
        selection.directory = it->second;
        return selection;
    }

    if (trimmed.size() == 1 && trimmed[0] == LIST_IGNORED) {
        list_ignored(out);
        selection.outcome = MenuOutcome::ListedIgnored;
    } else if (trimmed.size() == 1 && trimmed[0] == LIST_MARKS) {
        list_marks(out);
        selection.outcome = MenuOutcome::ListedMarks;
    } else {
        ERROR_LOG("Invalid option: " << trimmed);
    }

    return selection;
}

MenuSelection InteractiveMenu::run(std::istream& in, std::ostream& out) {
    render(out);

    std::string reply;
    if (!std::getline(in, reply)) {
        ERROR_LOG("No selection read");
        return MenuSelection();
    }

    return select(reply, out);
}
