// test_navigate_app.cpp - Whole invocations: exit codes, stdout and the saved file

#include "test_framework.hpp"
#include "../src/cpp/navigate_app.hpp"
#include "../src/cpp/debug.hpp"
#include "../src/cpp/durable_store.hpp"
#include <fstream>
#include <optional>

struct RunResult {
    int code;
    std::string output;
    std::string diagnostics;
};

static std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

// Data directory and working directory of one simulated shell session
struct Session {
    TempDir data;
    TempDir work;
    std::optional<std::string> data_directory;
    std::optional<std::string> working_directory;

    Session() : data_directory(data.path()), working_directory(work.path()) {}

    RunResult run(std::vector<std::string> arguments, const std::string& reply = "") {
        // Keep the user's own config file out of the run
        arguments.push_back("--config");
        arguments.push_back(data.file("config.yaml"));

        std::stringstream input(reply);
        std::stringstream output;
        std::stringstream diagnostics;

        Invocation invocation;
        invocation.arguments = arguments;
        invocation.data_directory = data_directory;
        invocation.working_directory = working_directory;
        invocation.input = &input;
        invocation.output = &output;

        std::filesystem::path saved = std::filesystem::current_path();
        DebugLog::set_stream(diagnostics);
        int code = run_navigate(invocation);
        DebugLog::set_stream(std::cerr);
        DebugLog::set_enabled(false);
        std::filesystem::current_path(saved);

        return {code, output.str(), diagnostics.str()};
    }

    std::string database_file() const { return data.file("navigate.yaml"); }
    Database database() const { return DurableStore(database_file()).load(); }
};

TEST(missing_data_directory_is_configuration_error) {
    Session session;
    session.data_directory.reset();

    RunResult result = session.run({"-m", "proj"});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_CONFIG));
    ASSERT_TRUE(result.output.empty());
    ASSERT_CONTAINS(result.diagnostics, "Need to set NAVIGATE_DATA environment variable.");
    ASSERT_FALSE(std::filesystem::exists(session.database_file()));
}

TEST(help_exits_zero_without_stdout) {
    Session session;

    RunResult result = session.run({"--help"});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_RESOLVED));
    ASSERT_TRUE(result.output.empty());
    ASSERT_CONTAINS(result.diagnostics, "Usage:");
    ASSERT_FALSE(std::filesystem::exists(session.database_file()));
}

TEST(unknown_option_is_usage_error) {
    Session session;

    RunResult result = session.run({"--bogus"});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_USAGE));
    ASSERT_CONTAINS(result.diagnostics, "Unknown option: --bogus");
    ASSERT_FALSE(std::filesystem::exists(session.database_file()));
}

TEST(bad_search_prefix_is_usage_error_and_saves_nothing) {
    Session session;
    ASSERT_EQ(session.run({"-m", "proj"}).code, static_cast<int>(EXIT_UNRESOLVED));
    std::string before = read_file(session.database_file());

    RunResult result = session.run({"x", "proj"});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_USAGE));
    ASSERT_TRUE(result.output.empty());
    ASSERT_CONTAINS(result.diagnostics, "'x' is an invalid search type.");
    ASSERT_EQ(read_file(session.database_file()), before);
}

TEST(mark_set_and_remove_persist_but_exit_unresolved) {
    Session session;

    RunResult set = session.run({"-m", "proj"});
    ASSERT_EQ(set.code, static_cast<int>(EXIT_UNRESOLVED));
    ASSERT_TRUE(set.output.empty());
    ASSERT_EQ(session.database().marks["proj"], session.work.path());

    RunResult removed = session.run({"-d", "-m", "proj"});
    ASSERT_EQ(removed.code, static_cast<int>(EXIT_UNRESOLVED));
    ASSERT_TRUE(removed.output.empty());
    ASSERT_TRUE(session.database().marks.empty());
}

TEST(ignore_toggle_persists_but_exits_unresolved) {
    Session session;

    RunResult ignored = session.run({"-i", "-c", "/srv/here"});
    ASSERT_EQ(ignored.code, static_cast<int>(EXIT_UNRESOLVED));
    ASSERT_TRUE(ignored.output.empty());
    ASSERT_EQ(session.database().ignored.count("/srv/here"), 1u);

    RunResult unignored = session.run({"-d", "-i", "-c", "/srv/here"});
    ASSERT_EQ(unignored.code, static_cast<int>(EXIT_UNRESOLVED));
    ASSERT_TRUE(session.database().ignored.empty());
}

TEST(resolved_directory_is_the_only_stdout_line) {
    Session session;
    std::string target = session.work.file("target");
    std::filesystem::create_directory(target);

    RunResult result = session.run({target});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_RESOLVED));
    ASSERT_EQ(result.output, target + "\n");
    ASSERT_NEAR(session.database().frequency[target], 1.0, 1e-12);
}

TEST(mark_jump_prints_target) {
    Session session;
    session.run({"-m", "proj", "-c", "/srv/proj"});

    RunResult result = session.run({"-j", "proj"});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_RESOLVED));
    ASSERT_EQ(result.output, std::string("/srv/proj\n"));
}

TEST(unresolved_search_prints_nothing_and_still_saves) {
    Session session;

    RunResult result = session.run({"f", "nothing"});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_UNRESOLVED));
    ASSERT_TRUE(result.output.empty());
    ASSERT_CONTAINS(result.diagnostics, "Could not find a directory that matches 'nothing'");
    ASSERT_TRUE(std::filesystem::exists(session.database_file()));
}

TEST(menu_listing_prints_nothing_on_stdout) {
    Session session;
    session.run({"-m", "proj", "-c", "/srv/proj"});

    RunResult result = session.run({}, "m\n");

    ASSERT_EQ(result.code, static_cast<int>(EXIT_UNRESOLVED));
    ASSERT_TRUE(result.output.empty());
    ASSERT_CONTAINS(result.diagnostics, "Marked directories:");
}

TEST(unknown_working_directory_changes_nothing) {
    Session session;
    session.working_directory.reset();

    RunResult marked = session.run({"-m", "proj"});
    ASSERT_EQ(marked.code, static_cast<int>(EXIT_CONFIG));
    ASSERT_CONTAINS(marked.diagnostics, "Cannot determine the current directory");

    ASSERT_EQ(session.run({"-i"}).code, static_cast<int>(EXIT_CONFIG));
    ASSERT_FALSE(std::filesystem::exists(session.database_file()));

    // An explicit -c still works
    ASSERT_EQ(session.run({"-m", "proj", "-c", "/srv/proj"}).code, static_cast<int>(EXIT_UNRESOLVED));
    ASSERT_EQ(session.database().marks["proj"], std::string("/srv/proj"));
}

TEST(malformed_database_exits_with_load_error_and_is_kept) {
    Session session;
    {
        std::ofstream out(session.database_file());
        out << "[1, 2";
    }

    RunResult result = session.run({"-m", "proj"});

    ASSERT_EQ(result.code, static_cast<int>(EXIT_DATABASE));
    ASSERT_CONTAINS(result.diagnostics, "Cannot load");
    ASSERT_EQ(read_file(session.database_file()), std::string("[1, 2"));
}

int main() {
    return run_all_tests();
}
