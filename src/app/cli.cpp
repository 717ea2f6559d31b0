#include "cw/cli.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;

namespace cw {

namespace {

// Matches "--name V" (consuming argv[i+1]) and "--name=V".
// Returns false when `a` is not this option; sets bad when the value is missing.
bool take_value(std::string_view a, std::string_view name, int &i, int argc,
                char **argv, std::string &val, bool &bad)
{
    if (a == name)
    {
        if (i + 1 >= argc)
        {
            std::cerr << "missing value for " << name << '\n';
            bad = true;
            return true;
        }
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() && a.starts_with(name) && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    return false;
}

bool to_int(const std::string &s, int &out)
{
    const char *first = s.data();
    const char *last = s.data() + s.size();
    auto [p, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && p == last;
}

bool parse_int_option(std::string_view name, const std::string &val, int lo,
                      int hi, int &out)
{
    int v = 0;
    if (!to_int(val, v))
    {
        std::cerr << "invalid " << name << " value: " << val << '\n';
        return false;
    }
    if (v < lo || v > hi)
    {
        std::cerr << name << " out of range [" << lo << ", " << hi << "]: " << v << '\n';
        return false;
    }
    out = v;
    return true;
}

bool parse_pctl(const std::string &val, std::vector<int> &out)
{
    std::vector<int> list;
    size_t start = 0;
    while (start <= val.size())
    {
        size_t comma = val.find(',', start);
        if (comma == std::string::npos) comma = val.size();
        const std::string item = val.substr(start, comma - start);
        if (!item.empty())
        {
            int p = 0;
            if (!to_int(item, p))
            {
                std::cerr << "invalid percentile: " << item << '\n';
                return false;
            }
            if (p < 0 || p > 100)
            {
                std::cerr << "percentile out of range: " << p << '\n';
                return false;
            }
            list.push_back(p);
        }
        start = comma + 1;
    }
    std::ranges::sort(list);
    list.erase(std::ranges::unique(list).begin(), list.end());
    out = std::move(list);
    return true;
}

} // namespace

void print_usage(const char *prog)
{
    std::cout
        << "TLS certificate expiry checker\n"
        << "Usage: " << prog << " [options] [host ...]\n"
        << "Options:\n"
        << "  --port N           TCP port shared by all hosts (default: 443)\n"
        << "  --warn-days N      WARNING when days left <= N (default: 15)\n"
        << "  --workers K        Max concurrent checks (default: 10)\n"
        << "  --concurrency K    Alias of --workers\n"
        << "  --parallel K       Alias of --workers\n"
        << "  --timeout MS       Connect+handshake timeout per host (default: 5000)\n"
        << "  -f, --file PATH    Read hosts from PATH, one per line ('-' = stdin)\n"
        << "  --json             Output the full result as one JSON object\n"
        << "  --ndjson           Output one JSON line per host as it completes\n"
        << "  --csv              Output the result table as CSV\n"
        << "  -o, --output PATH  Write output to PATH instead of stdout\n"
        << "  --pctl LIST        Comma-separated latency percentiles (e.g., 50,90,99)\n"
        << "  --progress         Show progress on stderr\n"
        << "  --keep-duplicates  Check repeated hosts once per occurrence\n"
        << "  -v, --verbose      Log batch progress to stderr\n"
        << "  --debug            Log every probe to stderr\n"
        << "  -h, --help         Show this help\n"
        << "\n"
        << "Exit status: 0 all OK, 1 warnings, 2 errors or interrupted,\n"
        << "             64 usage error, 74 file I/O error.\n"
        << "\n"
        << "Examples:\n"
        << "  " << prog << " example.com\n"
        << "  " << prog << " --warn-days 30 --workers 20 -f hosts.txt --csv -o expiry.csv\n";
}

ParseStatus parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        bool bad = false;

        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return ParseStatus::Help;
        }
        if (a == "--json"sv)
        {
            opt.format = OutputFormat::Json;
        }
        else if (a == "--ndjson"sv)
        {
            opt.format = OutputFormat::Ndjson;
        }
        else if (a == "--csv"sv)
        {
            opt.format = OutputFormat::Csv;
        }
        else if (a == "--progress"sv)
        {
            opt.progress = true;
        }
        else if (a == "--keep-duplicates"sv)
        {
            opt.dedup = false;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbosity = std::max(opt.verbosity, 1);
        }
        else if (a == "-vv"sv || a == "--debug"sv)
        {
            opt.verbosity = 2;
        }
        else if (take_value(a, "--port"sv, i, argc, argv, val, bad))
        {
            if (bad || !parse_int_option("--port"sv, val, 1, 65535, opt.port))
                return ParseStatus::Error;
        }
        else if (take_value(a, "--warn-days"sv, i, argc, argv, val, bad))
        {
            if (bad || !parse_int_option("--warn-days"sv, val, 0, 1000000, opt.warn_days))
                return ParseStatus::Error;
        }
        else if (take_value(a, "--workers"sv, i, argc, argv, val, bad) ||
                 take_value(a, "--concurrency"sv, i, argc, argv, val, bad) ||
                 take_value(a, "--parallel"sv, i, argc, argv, val, bad))
        {
            if (bad || !parse_int_option("--workers"sv, val, 1, 1024, opt.workers))
                return ParseStatus::Error;
        }
        else if (take_value(a, "--timeout"sv, i, argc, argv, val, bad))
        {
            if (bad || !parse_int_option("--timeout"sv, val, 1, 600000, opt.timeout_ms))
                return ParseStatus::Error;
        }
        else if (take_value(a, "--file"sv, i, argc, argv, val, bad) ||
                 take_value(a, "-f"sv, i, argc, argv, val, bad))
        {
            if (bad) return ParseStatus::Error;
            opt.hosts_file = std::move(val);
        }
        else if (take_value(a, "--output"sv, i, argc, argv, val, bad) ||
                 take_value(a, "-o"sv, i, argc, argv, val, bad))
        {
            if (bad) return ParseStatus::Error;
            opt.output = std::move(val);
        }
        else if (take_value(a, "--pctl"sv, i, argc, argv, val, bad))
        {
            if (bad || !parse_pctl(val, opt.pctl)) return ParseStatus::Error;
        }
        else if (a.size() > 1 && a[0] == '-')
        {
            std::cerr << "unknown option: " << a << '\n';
            return ParseStatus::Error;
        }
        else
        {
            opt.hosts.emplace_back(a);
        }
    }
    return ParseStatus::Ok;
}

std::vector<std::string> read_hosts(std::istream &in)
{
    std::vector<std::string> hosts;
    std::string line;
    while (std::getline(in, line))
    {
        const auto b = line.find_first_not_of(" \t\r\n");
        if (b == std::string::npos || line[b] == '#') continue;
        hosts.push_back(line);
    }
    return hosts;
}

bool load_hosts_file(Options &opt, std::string &err)
{
    if (opt.hosts_file.empty()) return true;

    std::vector<std::string> hosts;
    if (opt.hosts_file == "-")
    {
        hosts = read_hosts(std::cin);
    }
    else
    {
        std::ifstream ifs(opt.hosts_file);
        if (!ifs.is_open())
        {
            err = "cannot open host file: " + opt.hosts_file;
            return false;
        }
        hosts = read_hosts(ifs);
        if (ifs.bad())
        {
            err = "error reading host file: " + opt.hosts_file;
            return false;
        }
    }
    opt.hosts.insert(opt.hosts.end(), hosts.begin(), hosts.end());
    return true;
}

} // namespace cw
