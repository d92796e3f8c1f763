#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

// Process exit codes; the calling shell only distinguishes zero from non-zero
enum ExitCode {
    EXIT_RESOLVED = 0,
    EXIT_UNRESOLVED = 1,
    EXIT_USAGE = 2,
    EXIT_CONFIG = 3,
    EXIT_DATABASE = 4
};

// Everything one run takes from its process. main() fills it from the real
// one; diagnostics go to DebugLog::stream().
struct Invocation {
    std::string program = "navigate";
    std::vector<std::string> arguments;             // argv without the program name
    std::optional<std::string> data_directory;      // $NAVIGATE_DATA
    std::optional<std::string> working_directory;   // nullopt when the OS cannot tell
    std::istream* input = nullptr;                   // menu replies
    std::ostream* output = nullptr;                  // the resolved directory only
    bool color_terminal = false;
};

// Parse, load, resolve and save once; returns the process exit code
int run_navigate(const Invocation& invocation);
