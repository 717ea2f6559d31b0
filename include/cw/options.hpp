#pragma once

#include <string>
#include <vector>

namespace cw
{
enum class OutputFormat { Text, Json, Ndjson, Csv };

struct Options
{
    std::vector<std::string> hosts; // raw positionals, normalized later
    std::string hosts_file;         // one host per line, "-" = stdin
    int port = 443;
    int warn_days = 15;
    int workers = 10;               // max concurrent probes
    int timeout_ms = 5000;          // per-probe connect+handshake budget
    OutputFormat format = OutputFormat::Text;
    std::string output;             // export path, empty = stdout
    std::vector<int> pctl;          // latency percentiles (0..100)
    bool progress = false;          // progress fraction on stderr
    bool dedup = true;              // fold duplicate hosts
    int verbosity = 0;              // 0=warn 1=info 2=debug
};
} // namespace cw
