#include "navigate_app.hpp"
#include "cli_options.hpp"
#include "config_loader.hpp"
#include "debug.hpp"
#include "durable_store.hpp"
#include "resolver.hpp"
#include <iostream>

namespace {

// Current directory for mark/ignore operations: -c, else the OS working directory
std::optional<std::string> current_directory(const NavigateRequest& request, const Invocation& invocation) {
    if (request.current_directory && !request.current_directory->empty()) {
        return *request.current_directory;
    }
    return invocation.working_directory;
}

// Config from --config, or the default location when present
NavigateConfig load_config(const NavigateRequest& request, const std::string& data_directory) {
    std::string config_file = request.config_file ? *request.config_file
                                                  : NavigateConfig::default_config_path();
    return NavigateConfig::from_yaml(config_file, data_directory);
}

} // namespace

int run_navigate(const Invocation& invocation) {
    NavigateRequest request;
    try {
        request = parse_arguments(invocation.arguments);
    } catch (const UsageError& e) {
        ERROR_LOG(e.what());
        INFO_LOG("Try --help for more information.");
        return EXIT_USAGE;
    }

    if (request.help) {
        print_usage(DebugLog::stream(), invocation.program);
        return EXIT_RESOLVED;
    }

    DebugLog::set_enabled(request.verbose);

    if (!invocation.data_directory || invocation.data_directory->empty()) {
        ERROR_LOG("Need to set " << NavigateConfig::DATA_ENV << " environment variable.");
        return EXIT_CONFIG;
    }
    const std::string& data_directory = *invocation.data_directory;

    NavigateConfig config = load_config(request, data_directory);
    if (!config.validate()) {
        ERROR_LOG("Invalid configuration");
        return EXIT_CONFIG;
    }
    if (config.debug) {
        DebugLog::set_enabled(true);
    }
    if (!invocation.color_terminal) {
        config.theme.enabled = false;
    }

    std::optional<std::string> cwd = current_directory(request, invocation);
    if (!cwd) {
        ERROR_LOG("Cannot determine the current directory; pass it with -c.");
        return EXIT_CONFIG;
    }

    DurableStore store(config.database_path(data_directory));

    Database db;
    try {
        db = store.load();
    } catch (const DatabaseError& e) {
        ERROR_LOG("Cannot load " << store.path() << ": " << e.what());
        return EXIT_DATABASE;
    }

    ResolverEnvironment env = ResolverEnvironment::process(*cwd);
    if (invocation.input) {
        env.input = invocation.input;
    }
    env.diagnostics = &DebugLog::stream();
    DEBUG_LOGLN << "Current directory is " << env.current_directory;

    Resolution resolution;
    try {
        Resolver resolver(db, config);
        resolution = resolver.resolve(request, env);
    } catch (const UsageError& e) {
        ERROR_LOG(e.what());
        return EXIT_USAGE;
    }

    // Exactly one save per invocation; failures are logged by the store
    store.save(db);

    if (!resolution.resolved()) {
        return EXIT_UNRESOLVED;
    }

    std::ostream& out = invocation.output ? *invocation.output : std::cout;
    out << *resolution.directory << std::endl;
    return EXIT_RESOLVED;
}
