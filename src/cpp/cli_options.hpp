#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include "resolver.hpp"

// Parse argv into a request; throws UsageError on unknown options or
// missing option values
NavigateRequest parse_arguments(const std::vector<std::string>& args);
NavigateRequest parse_arguments(int argc, char** argv);

void print_usage(std::ostream& out, const std::string& program);
