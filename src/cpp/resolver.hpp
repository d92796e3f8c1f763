#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "config_loader.hpp"
#include "database.hpp"

// Invalid invocation (unknown option, bad search type)
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// The one operation an invocation performs, in precedence order
enum class Operation {
    SetMark,
    RemoveMark,
    Ignore,
    Unignore,
    JumpToMark,
    AddVisit,
    Menu,
    Search
};

// Parsed command line
struct NavigateRequest {
    std::vector<std::string> positional;
    std::optional<std::string> mark;                 // -m NAME
    std::optional<std::string> jump;                 // -j NAME
    std::optional<std::string> add;                  // -a DIR
    std::optional<std::string> current_directory;    // -c DIR
    std::optional<std::string> config_file;          // --config FILE
    bool remove = false;                             // -d
    bool ignore = false;                             // -i
    bool verbose = false;                            // -v
    bool help = false;                               // -h

    Operation operation() const;
};

enum class SearchOrder {
    Frequency,   // "f"
    Recency      // "r"
};

enum class UnresolvedReason {
    MutationOnly,       // mark/ignore/add: database changed, nothing to enter
    MarkNotFound,
    NoMatch,
    MenuListing,        // 'i' or 'm' answered from the menu
    InvalidSelection
};

// Outcome of one invocation: a directory, or why there is none
struct Resolution {
    std::optional<std::string> directory;
    UnresolvedReason reason = UnresolvedReason::NoMatch;
    std::vector<std::pair<std::string, std::string>> suggestions;   // mark misses only

    static Resolution resolved_to(const std::string& directory) {
        Resolution r;
        r.directory = directory;
        return r;
    }

    static Resolution unresolved(UnresolvedReason reason) {
        Resolution r;
        r.reason = reason;
        return r;
    }

    bool resolved() const { return directory.has_value(); }
};

// Side effects of resolving, injectable for tests
struct ResolverEnvironment {
    // Directory mark/ignore operations apply to; relative paths resolve against it
    std::string current_directory;
    double now = 0.0;
    std::istream* input = nullptr;
    std::ostream* diagnostics = nullptr;

    // Enter a directory; returns the absolute path entered, or nullopt on failure
    std::function<std::optional<std::string>(const std::string&)> change_directory;

    // Real process: stdin/stderr, wall clock and chdir
    static ResolverEnvironment process(const std::string& current_directory);
};

// path made absolute against base (when relative and base is set) and
// lexically normalized; symlinks are not resolved
std::string absolute_against(const std::string& base, const std::string& path);

// chdir into path; returns the normalized absolute path on success
std::optional<std::string> change_process_directory(const std::string& path);

// "f" or "r"; anything else throws UsageError
SearchOrder parse_search_order(const std::string& prefix);

// First directory, in the given descending order, containing every term
std::optional<std::string> find_match(const Database& db, SearchOrder order,
                                      const std::vector<std::string>& terms);

// Turns one request into at most one directory, mutating the database
// according to the request.
class Resolver {
public:
    Resolver(Database& db, const NavigateConfig& config);

    Resolution resolve(const NavigateRequest& request, ResolverEnvironment& env);

private:
    Database& db_;
    const NavigateConfig& config_;

    Resolution set_mark(const NavigateRequest& request, ResolverEnvironment& env);
    Resolution toggle_ignore(const NavigateRequest& request, ResolverEnvironment& env);
    Resolution jump_to_mark(const std::string& name, ResolverEnvironment& env);
    Resolution add_visit(const std::string& directory, ResolverEnvironment& env);
    Resolution run_menu(ResolverEnvironment& env);
    Resolution search(const std::vector<std::string>& arguments, ResolverEnvironment& env);

    // Enter the resolved directory and count the visit if that worked
    Resolution enter(const std::string& directory, ResolverEnvironment& env);
};
