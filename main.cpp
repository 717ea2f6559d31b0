// TLS certificate expiry checker (C++23)
// Build:
//   cmake -S . -B build && cmake --build build

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#include "cw/cli.hpp"
#include "cw/concurrency.hpp"
#include "cw/log.hpp"
#include "cw/options.hpp"
#include "cw/output.hpp"
#include "cw/prober.hpp"
#include "cw/usecases.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitWarning = 1;
constexpr int kExitError = 2;
constexpr int kExitUsage = 64;
constexpr int kExitIo = 74;

cw::Cancellation g_cancel;

// First Ctrl-C stops dispatch and prints what finished; second one kills.
void on_sigint(int)
{
    g_cancel.cancel();
    std::signal(SIGINT, SIG_DFL);
}

int exit_code_for(const cw::Summary& s)
{
    if (s.error > 0) return kExitError;
    if (s.warning > 0) return kExitWarning;
    return kExitOk;
}

} // namespace

int main(int argc, char **argv)
{
    // a peer resetting mid-handshake must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    cw::Options opt{};
    switch (cw::parse_args(argc, argv, opt))
    {
        case cw::ParseStatus::Help: return kExitOk;
        case cw::ParseStatus::Error:
            std::cerr << "try '" << argv[0] << " --help'\n";
            return kExitUsage;
        case cw::ParseStatus::Ok: break;
    }

    switch (opt.verbosity)
    {
        case 0: cw::set_log_level(cw::LogLevel::Warn); break;
        case 1: cw::set_log_level(cw::LogLevel::Info); break;
        default: cw::set_log_level(cw::LogLevel::Debug); break;
    }

    if (std::string err; !cw::load_hosts_file(opt, err))
    {
        cw::log_error(err);
        return kExitIo;
    }
    if (cw::normalize_hosts(opt.hosts, opt.dedup).empty())
    {
        std::cerr << "no hosts given\n";
        std::cerr << "try '" << argv[0] << " --help'\n";
        return kExitUsage;
    }

    std::ofstream file;
    if (!opt.output.empty())
    {
        file.open(opt.output, std::ios::out | std::ios::trunc);
        if (!file.is_open())
        {
            cw::log_error("cannot open output file: " + opt.output);
            return kExitIo;
        }
    }
    std::ostream &out = opt.output.empty() ? std::cout : file;

    cw::BatchRequest req{};
    req.hosts = opt.hosts;
    req.port = opt.port;
    req.warn_days = opt.warn_days;
    req.workers = opt.workers;
    req.timeout = std::chrono::milliseconds(opt.timeout_ms);
    req.now = cw::now_seconds();
    req.percentiles = opt.pctl;
    req.dedup = opt.dedup;

    cw::ProgressCallback on_progress;
    if (opt.progress)
    {
        on_progress = [](const cw::Progress &p)
        {
            std::lock_guard<std::mutex> lk(cw::print_mutex());
            std::cerr << cw::format_progress_text(p) << std::flush;
        };
    }

    cw::OutcomeCallback on_outcome;
    if (opt.format == cw::OutputFormat::Ndjson)
    {
        on_outcome = [&out](const cw::ProbeOutcome &o)
        {
            std::lock_guard<std::mutex> lk(cw::print_mutex());
            out << cw::build_ndjson_outcome(o) << '\n' << std::flush;
        };
    }

    std::signal(SIGINT, on_sigint);
    const cw::BatchResult result =
        cw::run_batch(req, cw::probe_tls_once, on_progress, on_outcome, &g_cancel);
    std::signal(SIGINT, SIG_DFL);

    if (opt.progress) std::cerr << '\n';

    switch (opt.format)
    {
        case cw::OutputFormat::Text:
            out << cw::format_header_text(result) << '\n'
                << cw::format_results_text(result) << '\n'
                << cw::format_summary_text(result.summary)
                << cw::format_buckets_text(result.buckets)
                << cw::format_latency_text(result.latency, result.outcomes.size());
            break;
        case cw::OutputFormat::Json:
            out << cw::build_final_json(result) << '\n';
            break;
        case cw::OutputFormat::Csv:
            out << cw::build_csv(result);
            break;
        case cw::OutputFormat::Ndjson:
            break; // already streamed
    }

    out.flush();
    if (!out)
    {
        cw::log_error("failed writing output");
        return kExitIo;
    }
    if (result.cancelled) return kExitError;
    return exit_code_for(result.summary);
}
