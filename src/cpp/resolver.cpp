#include "resolver.hpp"
#include "debug.hpp"
#include "frecency.hpp"
#include "interactive_menu.hpp"
#include "mark_registry.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace {

std::ostream& diagnostics(const ResolverEnvironment& env) {
    return env.diagnostics ? *env.diagnostics : DebugLog::stream();
}

bool given(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

std::string join(const std::vector<std::string>& terms, size_t first) {
    std::string joined;
    for (size_t i = first; i < terms.size(); ++i) {
        if (!joined.empty()) {
            joined += " ";
        }
        joined += terms[i];
    }
    return joined;
}

bool contains_all(const std::string& directory, const std::vector<std::string>& terms) {
    for (const auto& term : terms) {
        if (directory.find(term) == std::string::npos) {
            return false;
        }
    }
    return true;
}

} // namespace

Operation NavigateRequest::operation() const {
    if (given(mark)) {
        return remove ? Operation::RemoveMark : Operation::SetMark;
    }
    if (ignore) {
        return remove ? Operation::Unignore : Operation::Ignore;
    }
    if (given(jump)) {
        return Operation::JumpToMark;
    }
    if (given(add)) {
        return Operation::AddVisit;
    }
    if (positional.empty()) {
        return Operation::Menu;
    }
    return Operation::Search;
}

ResolverEnvironment ResolverEnvironment::process(const std::string& current_directory) {
    ResolverEnvironment env;
    env.current_directory = current_directory;
    env.now = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    env.input = &std::cin;
    env.diagnostics = &std::cerr;
    env.change_directory = change_process_directory;
    return env;
}

std::string absolute_against(const std::string& base, const std::string& path) {
    std::filesystem::path target(path);
    if (target.is_relative() && !base.empty()) {
        target = std::filesystem::path(base) / target;
    }

    // Keep symlinks as given; only drop "." / ".." and a trailing separator
    target = target.lexically_normal();
    if (!target.has_filename() && target.has_parent_path() && target != target.root_path()) {
        target = target.parent_path();
    }
    return target.string();
}

std::optional<std::string> change_process_directory(const std::string& path) {
    std::error_code ec;
    std::filesystem::path target = std::filesystem::absolute(path, ec);
    if (ec) {
        return std::nullopt;
    }
    std::string normalized = absolute_against("", target.string());

    std::filesystem::current_path(normalized, ec);
    if (ec) {
        DEBUG_LOGLN << "Cannot enter " << normalized << ": " << ec.message();
        return std::nullopt;
    }
    return normalized;
}

SearchOrder parse_search_order(const std::string& prefix) {
    if (prefix == "f") {
        return SearchOrder::Frequency;
    }
    if (prefix == "r") {
        return SearchOrder::Recency;
    }
    throw UsageError("'" + prefix + "' is an invalid search type. "
                     "Use 'r' for recent and 'f' for frequent.");
}

std::optional<std::string> find_match(const Database& db, SearchOrder order,
                                      const std::vector<std::string>& terms) {
    std::vector<std::string> candidates =
        order == SearchOrder::Frequency ? ranked_by_frequency(db) : ranked_by_recency(db);

    for (const auto& directory : candidates) {
        if (db.is_ignored(directory)) {
            continue;
        }
        if (contains_all(directory, terms)) {
            return directory;
        }
    }
    return std::nullopt;
}

Resolver::Resolver(Database& db, const NavigateConfig& config)
    : db_(db)
    , config_(config)
{}

Resolution Resolver::resolve(const NavigateRequest& request, ResolverEnvironment& env) {
    Resolution resolution;

    switch (request.operation()) {
        case Operation::SetMark:
        case Operation::RemoveMark:
            resolution = set_mark(request, env);
            break;
        case Operation::Ignore:
        case Operation::Unignore:
            resolution = toggle_ignore(request, env);
            break;
        case Operation::JumpToMark:
            resolution = jump_to_mark(*request.jump, env);
            break;
        case Operation::AddVisit:
            resolution = add_visit(*request.add, env);
            break;
        case Operation::Menu:
            resolution = run_menu(env);
            break;
        case Operation::Search:
            resolution = search(request.positional, env);
            break;
    }

    return resolution;
}

Resolution Resolver::set_mark(const NavigateRequest& request, ResolverEnvironment& env) {
    MarkRegistry registry(db_);
    const std::string& name = *request.mark;

    if (request.remove) {
        if (registry.remove_mark(name) == MarkStatus::NotFound) {
            diagnostics(env) << "Mark " << config_.theme.mark(name) << " does not exist.\n";
        }
    } else {
        registry.set_mark(name, env.current_directory);
    }

    return Resolution::unresolved(UnresolvedReason::MutationOnly);
}

Resolution Resolver::toggle_ignore(const NavigateRequest& request, ResolverEnvironment& env) {
    MarkRegistry registry(db_);

    if (request.remove) {
        if (registry.unignore(env.current_directory) == IgnoreStatus::NotIgnored) {
            diagnostics(env) << "Directory '" << env.current_directory << "' was not being ignored.\n";
        }
    } else {
        registry.ignore(env.current_directory);
    }

    return Resolution::unresolved(UnresolvedReason::MutationOnly);
}

Resolution Resolver::jump_to_mark(const std::string& name, ResolverEnvironment& env) {
    MarkRegistry registry(db_);

    if (auto target = registry.find_mark(name)) {
        DEBUG_LOGLN << "Mark " << name << " maps to " << *target;
        return Resolution::resolved_to(*target);
    }

    Resolution resolution = Resolution::unresolved(UnresolvedReason::MarkNotFound);
    resolution.suggestions = registry.suggest_marks(name);

    std::ostream& out = diagnostics(env);
    out << "Mark " << config_.theme.mark(name) << " does not exist.\n";
    if (!resolution.suggestions.empty()) {
        out << "Did you mean one of these marks?\n";
        for (const auto& suggestion : resolution.suggestions) {
            out << "  " << config_.theme.mark(suggestion.first) << " " << suggestion.second << "\n";
        }
    }

    return resolution;
}

Resolution Resolver::add_visit(const std::string& directory, ResolverEnvironment& env) {
    std::string normalized = absolute_against(env.current_directory, directory);

    if (db_.is_ignored(normalized)) {
        DEBUG_LOGLN << "Not counting ignored directory " << normalized;
    } else {
        visit(db_, normalized, env.now, config_.frecency);
    }

    return Resolution::unresolved(UnresolvedReason::MutationOnly);
}

Resolution Resolver::run_menu(ResolverEnvironment& env) {
    InteractiveMenu menu(db_, config_.theme, config_.max_choices);

    if (!env.input) {
        return Resolution::unresolved(UnresolvedReason::InvalidSelection);
    }

    MenuSelection selection = menu.run(*env.input, diagnostics(env));
    switch (selection.outcome) {
        case MenuOutcome::Selected:
            return enter(selection.directory, env);
        case MenuOutcome::ListedIgnored:
        case MenuOutcome::ListedMarks:
            return Resolution::unresolved(UnresolvedReason::MenuListing);
        case MenuOutcome::Invalid:
            break;
    }
    return Resolution::unresolved(UnresolvedReason::InvalidSelection);
}

Resolution Resolver::search(const std::vector<std::string>& arguments, ResolverEnvironment& env) {
    DEBUG_LOGLN << "Search arguments: " << join(arguments, 0);

    if (arguments.size() == 1) {
        return enter(arguments[0], env);
    }

    SearchOrder order = parse_search_order(arguments[0]);
    std::vector<std::string> terms(arguments.begin() + 1, arguments.end());

    if (auto match = find_match(db_, order, terms)) {
        return enter(*match, env);
    }

    diagnostics(env) << "Could not find a directory that matches '" << join(arguments, 1) << "'\n";
    return Resolution::unresolved(UnresolvedReason::NoMatch);
}

Resolution Resolver::enter(const std::string& directory, ResolverEnvironment& env) {
    // Relative paths start from the logical current directory, not the kernel's
    std::string target = absolute_against(env.current_directory, directory);

    std::optional<std::string> entered;
    if (env.change_directory) {
        entered = env.change_directory(target);
    }

    if (!entered) {
        // The calling shell reports its own error; statistics stay untouched
        DEBUG_LOGLN << "Could not enter " << directory << ", visit not recorded";
        return Resolution::resolved_to(directory);
    }

    if (db_.is_ignored(*entered)) {
        DEBUG_LOGLN << "Directory " << *entered << " is ignored, visit not recorded";
    } else {
        visit(db_, *entered, env.now, config_.frecency);
    }

    return Resolution::resolved_to(directory);
}
