#include "config_loader.hpp"
#include "navigate_app.hpp"
#include <iostream>
#include <filesystem>
#include <optional>
#include <unistd.h>

// OS working directory; nullopt when it was removed or is unreadable
static std::optional<std::string> process_working_directory() {
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        return std::nullopt;
    }
    return cwd.string();
}

int main(int argc, char** argv) {
    Invocation invocation;
    invocation.program = argv[0];
    for (int i = 1; i < argc; i++) {
        invocation.arguments.emplace_back(argv[i]);
    }
    invocation.data_directory = NavigateConfig::data_directory();
    invocation.working_directory = process_working_directory();
    invocation.input = &std::cin;
    invocation.output = &std::cout;
    invocation.color_terminal = isatty(STDERR_FILENO);

    return run_navigate(invocation);
}
