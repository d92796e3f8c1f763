#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <vector>
#include "color_theme.hpp"
#include "database.hpp"

enum class MenuOutcome {
    Selected,           // reply matched a rendered index
    ListedIgnored,      // 'i': ignored directories printed
    ListedMarks,        // 'm': marks printed
    Invalid             // anything else, including end of input
};

struct MenuSelection {
    MenuOutcome outcome = MenuOutcome::Invalid;
    std::string directory;
};

// Numbered shortlist of the most frequent and most recent directories.
// Everything is written to the diagnostic stream; stdout belongs to the
// resolved path.
class InteractiveMenu {
public:
    static constexpr char LIST_IGNORED = 'i';
    static constexpr char LIST_MARKS = 'm';

    InteractiveMenu(const Database& db, const Theme& theme, int max_choices);

    // Print both lists and the informational commands, numbering entries
    // with one zero-based index shared by the two lists
    void render(std::ostream& out);

    // Map one reply to a directory or an informational listing
    MenuSelection select(const std::string& reply, std::ostream& out) const;

    // render, block for one line of input, select
    MenuSelection run(std::istream& in, std::ostream& out);

    // Index label -> directory, filled by render()
    const std::map<std::string, std::string>& options() const { return options_; }

private:
    const Database& db_;
    const Theme& theme_;
    int max_choices_;
    std::map<std::string, std::string> options_;

    int render_list(std::ostream& out, const std::string& title,
                    const std::vector<std::string>& ranked, int next_index);
    void list_ignored(std::ostream& out) const;
    void list_marks(std::ostream& out) const;
};
