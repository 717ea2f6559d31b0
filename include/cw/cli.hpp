#pragma once

#include <istream>
#include <string>
#include <vector>

#include "cw/options.hpp"

namespace cw
{
enum class ParseStatus { Ok, Help, Error };

void print_usage(const char *prog);

// Fills opt from argv. Diagnostics for Error go to stderr; Help prints usage.
ParseStatus parse_args(int argc, char **argv, Options &opt);

// One host per line; '#' starts a comment line. Blank lines are kept out.
std::vector<std::string> read_hosts(std::istream &in);

// Appends hosts from opt.hosts_file ("-" = stdin) to opt.hosts.
// Returns false and sets err when the file cannot be read.
bool load_hosts_file(Options &opt, std::string &err);
} // namespace cw
