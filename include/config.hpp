#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * Engine configuration shared by every transfer in a batch.
 * A batch takes a snapshot at start; later changes apply to future operations.
 */
struct EngineConfig
{
    // Admission control
    std::size_t maxConcurrency = 16;

    // Retry policy: total attempts per transfer, linear backoff unit
    int maxRetries = 3;
    std::chrono::milliseconds backoffUnit{2000};

    // Network settings
    int timeoutSeconds = 0;       // Overall per-request limit, 0 = none
    int stallTimeoutSeconds = 30; // Abort when no byte arrives for this long
    int connectTimeoutSeconds = 10;
    std::optional<std::string> proxy;
    std::string userAgent = "BatchDownloader/1.0";
    bool verifyTls = true;
    bool followRedirects = true;
    long maxRedirects = 5;

    // I/O granularity for network reads, file writes and hashing
    std::size_t chunkSize = 64 * 1024;

    /**
     * Reject values the engine cannot run with.
     * @throws std::invalid_argument describing the first invalid field
     */
    void validate() const;
};

/**
 * Configuration for the command-line tool.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct CliConfig
{
    // "URL DEST" pairs given positionally
    std::vector<std::string> pairs;

    // Manifest file with one transfer per line
    std::optional<std::string> manifestPath;

    // Checksum for a single transfer, format "algorithm:hexhash"
    std::optional<std::string> expectedChecksum;

    EngineConfig engine;

    bool quiet = false;
    bool verbose = false;
    bool showVersion = false;
};
