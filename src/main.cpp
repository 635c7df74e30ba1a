#include "batchsync/submitter.hpp"
#include "batchsync/transfer_run.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/run_config.hpp"
#include "util/time_window.hpp"

#include <cstdio>
#include <getopt.h>
#include <memory>
#include <string>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/batchsync/batchsync.json";

using batchsync::kExitOk;
using batchsync::kExitUsage;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s <yesterday|current-month|previous-month|archive-and-transfer> [-c <config>] [--dry-run] [-v]\n"
        "\n"
        "Commands:\n"
        "  yesterday              Files modified during the previous calendar day\n"
        "  current-month          Files modified since the first of this month\n"
        "  previous-month         Files modified during the previous calendar month\n"
        "  archive-and-transfer   window_start..window_end from the config, else yesterday\n"
        "\n"
        "Options:\n"
        "  -c, --config           Configuration file (default %s)\n"
        "      --dry-run          Scan, classify and log the manifest; stage and submit nothing\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv, kDefaultConfigPath);
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    bool dry_run_cli = false;
    bool verbose = false;

    enum { kOptDryRun = 1000 };
    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"dry-run", no_argument, nullptr, kOptDryRun},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'c':
                config_path = optarg;
                break;

            case kOptDryRun:
                dry_run_cli = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    const auto policy = batchsync::ParseWindowPolicy(argv[optind]);
    if (!policy) {
        std::fprintf(stderr, "ERROR: unknown command: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    batchsync::config::RunConfig cfg;
    if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", r.message().c_str());
        return kExitUsage;
    }
    if (dry_run_cli) {
        cfg.dry_run = true;
    }
    if (auto r = cfg.Validate(); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: invalid config %s: %s\n", config_path.c_str(), r.message().c_str());
        return kExitUsage;
    }

    auto &logger = batchsync::Logger::Instance();
    logger.SetLevel(verbose ? batchsync::LogLevel::Debug : cfg.log_level);
    if (!cfg.log_file.empty() && !logger.SetLogFile(cfg.log_file)) {
        std::fprintf(stderr, "WARN: cannot open log file %s, logging to stderr only\n", cfg.log_file.c_str());
    }

    auto window = batchsync::ResolveWindow(*policy, batchsync::Clock::now(), cfg.window_start, cfg.window_end);
    if (!window) {
        LogError("cannot resolve %s window: %s", batchsync::WindowPolicyName(*policy), window.error().c_str());
        return kExitUsage;
    }

    batchsync::InstallSignalHandlers();

    auto opt = batchsync::RunOptions::FromConfig(cfg);
    opt.cancel = &batchsync::g_cancel;

    std::shared_ptr<batchsync::ITransferSubmitter> submitter;
    if (!cfg.dry_run) {
        submitter = std::make_shared<batchsync::OutboxSubmitter>(cfg.outbox_dir);
    }

    batchsync::TransferRun run(std::move(opt), std::move(*window), std::move(submitter));
    const auto summary = run.Execute();

    return batchsync::ExitCodeFor(summary);
}
