#include "cli_options.hpp"
#include "config_loader.hpp"
#include <iostream>

namespace {

// Options taking a value, long and short spelling
struct ValueOption {
    const char* long_name;
    char short_name;
    std::optional<std::string> NavigateRequest::*field;
};

const ValueOption VALUE_OPTIONS[] = {
    {"--mark", 'm', &NavigateRequest::mark},
    {"--jump", 'j', &NavigateRequest::jump},
    {"--add", 'a', &NavigateRequest::add},
    {"--current_directory", 'c', &NavigateRequest::current_directory},
    {"--config", '\0', &NavigateRequest::config_file},
};

const ValueOption* find_value_option(const std::string& arg) {
    for (const auto& option : VALUE_OPTIONS) {
        if (arg == option.long_name) {
            return &option;
        }
        if (option.short_name != '\0' && arg.size() == 2 && arg[0] == '-' && arg[1] == option.short_name) {
            return &option;
        }
    }
    return nullptr;
}

// Boolean flag by short letter; false if unknown
bool set_flag(NavigateRequest& request, char letter) {
    switch (letter) {
        case 'd': request.remove = true; return true;
        case 'i': request.ignore = true; return true;
        case 'v': request.verbose = true; return true;
        case 'h': request.help = true; return true;
        default: return false;
    }
}

bool set_long_flag(NavigateRequest& request, const std::string& arg) {
    if (arg == "--delete") return set_flag(request, 'd');
    if (arg == "--ignore") return set_flag(request, 'i');
    if (arg == "--verbose") return set_flag(request, 'v');
    if (arg == "--help") return set_flag(request, 'h');
    return false;
}

} // namespace

NavigateRequest parse_arguments(const std::vector<std::string>& args) {
    NavigateRequest request;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            request.positional.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        // --name=value
        size_t equals = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && equals != std::string::npos) {
            const ValueOption* option = find_value_option(arg.substr(0, equals));
            if (!option) {
                throw UsageError("Unknown option: " + arg.substr(0, equals));
            }
            request.*(option->field) = arg.substr(equals + 1);
            continue;
        }

        if (const ValueOption* option = find_value_option(arg)) {
            if (i + 1 >= args.size()) {
                throw UsageError("Option " + arg + " requires a value");
            }
            request.*(option->field) = args[++i];
            continue;
        }

        if (arg.compare(0, 2, "--") == 0) {
            if (!set_long_flag(request, arg)) {
                throw UsageError("Unknown option: " + arg);
            }
            continue;
        }

        // Cluster of short flags, e.g. -di
        for (size_t j = 1; j < arg.size(); j++) {
            if (!set_flag(request, arg[j])) {
                throw UsageError("Unknown option: -" + std::string(1, arg[j]));
            }
        }
    }

    return request;
}

NavigateRequest parse_arguments(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }
    return parse_arguments(args);
}

void print_usage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [OPTIONS] [DIRECTORY | f|r TERM...]\n"
        << "\n"
        << "Efficient directory navigation. Prints the chosen directory for the\n"
        << "calling shell to change into.\n"
        << "\n"
        << "Positional arguments:\n"
        << "  DIRECTORY         Change to this directory\n"
        << "  f TERM...         Most frequent directory containing every TERM\n"
        << "  r TERM...         Most recent directory containing every TERM\n"
        << "  (none)            Show the selection menu\n"
        << "\n"
        << "Options:\n"
        << "  -m, --mark NAME   Mark the current directory with NAME\n"
        << "  -j, --jump NAME   Jump to the directory marked NAME\n"
        << "  -i, --ignore      Ignore the current directory for all purposes\n"
        << "  -d, --delete      With -m or -i, remove the mark or the ignore\n"
        << "  -a, --add DIR     Count a visit to DIR\n"
        << "  -c, --current_directory DIR\n"
        << "                    Use DIR as the current directory\n"
        << "  --config FILE     Use this YAML config file\n"
        << "  -v, --verbose     Debug output on stderr\n"
        << "  -h, --help        Show this help message\n"
        << "\n"
        << "Environment:\n"
        << "  " << NavigateConfig::DATA_ENV << "     Directory holding the database (required)\n"
        << "\n"
        << "Config file: ~/.config/navigate/config.yaml\n";
}
