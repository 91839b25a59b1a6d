#include <atomic>
#include <csignal>
#include <functional>
#include <memory>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header

#include "batch_orchestrator.hpp"
#include "checksum.hpp"
#include "config.hpp"
#include "console_progress_sink.hpp"
#include "format_utils.hpp"
#include "logging.hpp"
#include "manifest.hpp"

namespace
{
    constexpr const char *VERSION = "1.0.0";

    /**
     * Waits for a stop signal on its own thread and runs the handler once.
     * The signals must already be blocked in every thread.
     */
    class SignalWatcher
    {
    public:
        SignalWatcher(const sigset_t &signals, std::function<void()> onSignal)
            : signals_(signals), onSignal_(std::move(onSignal))
        {
            thread_ = std::thread([this]()
            {
                int signal = 0;
                if (sigwait(&signals_, &signal) == 0 && !finished_.load())
                {
                    onSignal_();
                }
            });
        }

        ~SignalWatcher()
        {
            // Wake sigwait with one of its own signals so the thread can exit
            finished_.store(true);
            pthread_kill(thread_.native_handle(), SIGTERM);
            thread_.join();
        }

        SignalWatcher(const SignalWatcher &) = delete;
        SignalWatcher &operator=(const SignalWatcher &) = delete;

    private:
        sigset_t signals_;
        std::function<void()> onSignal_;
        std::atomic<bool> finished_{false};
        std::thread thread_;
    };

    // Build the transfer list from positional pairs and the manifest
    std::vector<TransferSpec> collectSpecs(const CliConfig &config)
    {
        std::vector<TransferSpec> specs;

        if (config.manifestPath)
        {
            specs = loadManifest(*config.manifestPath);
        }

        if (config.pairs.size() % 2 != 0)
        {
            throw std::runtime_error("Positional arguments must be URL DEST pairs");
        }
        for (std::size_t i = 0; i < config.pairs.size(); i += 2)
        {
            TransferSpec spec;
            spec.sourceUrl = config.pairs[i];
            spec.destinationPath = config.pairs[i + 1];
            if (!isSupportedUrl(spec.sourceUrl))
            {
                throw std::runtime_error(
                    fmt::format("URL must start with http:// or https://: {}", spec.sourceUrl));
            }
            specs.push_back(std::move(spec));
        }

        if (config.expectedChecksum)
        {
            if (specs.size() != 1)
            {
                throw std::runtime_error("--checksum applies to a single transfer; use a manifest for batches");
            }
            auto [algorithm, hexHash] = ChecksumVerifier::parseChecksum(*config.expectedChecksum);
            specs.front().digestAlgorithm = algorithm;
            specs.front().expectedDigest = hexHash;
        }

        return specs;
    }
}

int main(int argc, char *argv[])
{
    // Create CLI11 app
    CLI::App app{"Batch Downloader - concurrent resumable HTTP downloads"};

    // Configuration struct to be populated
    CliConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("transfers", config.pairs, "URL DEST pairs to download");

    app.add_option("-i,--input", config.manifestPath,
                   "Manifest file: one 'URL DEST [algorithm:hexhash]' per line")
        ->check(CLI::ExistingFile);

    app.add_option("-j,--concurrency", config.engine.maxConcurrency,
                   "Maximum simultaneous downloads")
        ->check(CLI::Range(1, 256))
        ->default_val(16);

    app.add_option("-r,--retries,--max-retries", config.engine.maxRetries,
                   "Attempts per download (transient errors are retried)")
        ->check(CLI::Range(1, 10))
        ->default_val(3);

    app.add_option("-t,--timeout", config.engine.timeoutSeconds,
                   "Overall timeout per request in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);

    app.add_option("--stall-timeout", config.engine.stallTimeoutSeconds,
                   "Abort a request when no data arrives for this many seconds")
        ->check(CLI::NonNegativeNumber)
        ->default_val(30);

    app.add_option("--connect-timeout", config.engine.connectTimeoutSeconds,
                   "Connection timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->default_val(10);

    app.add_option("--proxy", config.engine.proxy, "Proxy URL (e.g. http://127.0.0.1:8080)");

    app.add_option("--user-agent", config.engine.userAgent, "User-Agent header")
        ->default_val(config.engine.userAgent);

    bool insecure = false;
    app.add_flag("-k,--insecure", insecure, "Skip TLS certificate verification");

    app.add_option("--chunk-size", config.engine.chunkSize, "I/O chunk size in bytes")
        ->check(CLI::Range(std::size_t{1024}, std::size_t{16 * 1024 * 1024}))
        ->default_val(64 * 1024);

    app.add_option("-c,--checksum", config.expectedChecksum,
                   "Expected checksum in format 'algorithm:hexhash' (single transfer only)")
        ->check([](const std::string &cs) -> std::string {
            try {
                ChecksumVerifier::parseChecksum(cs);
                return ""; // Valid
            } catch (const std::exception &e) {
                return std::string("Invalid checksum format: ") + e.what();
            }
        });

    app.add_flag("-q,--quiet", config.quiet, "Headless mode: no progress output, warnings and errors only");
    app.add_flag("--verbose", config.verbose, "Log debug details");
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        // CLI11 automatically generates help/error messages
        return app.exit(e);
    }

    if (config.showVersion)
    {
        fmt::print("Batch Downloader v{}\n", VERSION);
        fmt::print("Built with:\n");
        fmt::print("  - libcurl: HTTP/HTTPS support\n");
        fmt::print("  - OpenSSL: checksum verification\n");
        fmt::print("  - CLI11: Command-line parsing\n");
        fmt::print("  - fmt: Modern string formatting\n");
        return 0;
    }

    config.engine.verifyTls = !insecure;

    if (config.verbose)
    {
        setLogLevel(LogLevel::Debug);
    }
    else if (config.quiet)
    {
        setLogLevel(LogLevel::Warning);
    }

    std::vector<TransferSpec> specs;
    try
    {
        specs = collectSpecs(config);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 2;
    }

    if (specs.empty())
    {
        fmt::print(stderr, "Nothing to download. Pass URL DEST pairs or --input.\n");
        return 2;
    }

    // ====================================================================
    // DISPLAY CONFIGURATION
    // ====================================================================

    if (!config.quiet)
    {
        fmt::print("Batch Downloader v{}\n", VERSION);
        fmt::print("====================================\n\n");
        fmt::print("Configuration:\n");
        fmt::print("  Transfers:   {}\n", specs.size());
        fmt::print("  Concurrency: {}\n", config.engine.maxConcurrency);
        fmt::print("  Max Retries: {}\n", config.engine.maxRetries);
        fmt::print("  Chunk Size:  {}\n", formatBytes(config.engine.chunkSize));
        if (config.engine.proxy)
        {
            fmt::print("  Proxy:       {}\n", *config.engine.proxy);
        }
        if (insecure)
        {
            fmt::print("  TLS:         verification disabled\n");
        }
        fmt::print("\n");
    }

    // ====================================================================
    // PERFORM DOWNLOADS
    // ====================================================================

    // Route SIGINT/SIGTERM to a watcher thread; every thread started below inherits the mask
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    try
    {
        BatchOrchestrator orchestrator(config.engine);
        if (!config.quiet)
        {
            orchestrator.setProgressSink(std::make_shared<ConsoleProgressSink>());
        }

        BatchResult result;
        {
            SignalWatcher watcher(stopSignals, [&orchestrator]()
                                  { orchestrator.cancelAll(); });
            result = orchestrator.run(specs);
        }

        if (!config.quiet)
        {
            fmt::print("\nSummary\n");
            fmt::print("  Total Files: {}\n", specs.size());
            fmt::print("  Success:     {}\n", result.succeededCount);
            fmt::print("  Failed:      {}\n", result.failedCount);
            for (const TransferResult &transfer : result.transfers)
            {
                if (!transfer.succeeded())
                {
                    fmt::print("    ✗ {} [{}]: {}\n", transfer.label,
                               transferStateName(transfer.state), transfer.error);
                }
            }
        }

        return result.failedCount == 0 ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
