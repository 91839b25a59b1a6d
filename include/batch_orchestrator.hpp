#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "concurrency_gate.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "progress_sink.hpp"
#include "transfer_spec.hpp"
#include "transfer_state_machine.hpp"

/**
 * Aggregate outcome of one batch. succeededCount + failedCount always
 * equals the number of submitted specs.
 */
struct BatchResult
{
    std::size_t succeededCount = 0;
    std::size_t failedCount = 0;

    // One entry per spec, in completion order
    std::vector<TransferResult> transfers;
};

/**
 * Runs a batch of transfers concurrently behind one shared ConcurrencyGate
 * and one shared HTTP client configuration.
 *
 * Every spec gets its own thread and TransferStateMachine. Specs that
 * sanitize to the same destination are rejected after the first, so one
 * working file never has two writers. Failures stay local to their task;
 * run() returns only after every task is terminal.
 */
class BatchOrchestrator
{
public:
    using TransportFactory = std::function<std::unique_ptr<HttpTransport>(const HttpClientOptions &)>;

    /**
     * Use the libcurl transport.
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit BatchOrchestrator(EngineConfig config = EngineConfig());

    /**
     * Use a custom transport (e.g. an in-memory fake in tests).
     */
    BatchOrchestrator(EngineConfig config, TransportFactory transportFactory);

    BatchOrchestrator(const BatchOrchestrator &) = delete;
    BatchOrchestrator &operator=(const BatchOrchestrator &) = delete;

    /**
     * Install or clear (nullptr) the progress receiver for future batches.
     * Events are delivered on a separate thread and dropped if the sink falls behind.
     */
    void setProgressSink(std::shared_ptr<ProgressSink> sink);

    /**
     * Dynamically update network settings for future batches.
     */
    void setNetworkConfig(std::optional<std::string> proxy = std::nullopt,
                          std::optional<std::string> userAgent = std::nullopt,
                          std::optional<int> timeoutSeconds = std::nullopt);

    /**
     * Dynamically update runtime settings. A concurrency change also applies
     * to future acquisitions of a batch that is already running.
     * @throws std::invalid_argument if a value is invalid
     */
    void setRuntimeConfig(std::optional<std::size_t> maxConcurrency = std::nullopt,
                          std::optional<std::size_t> chunkSize = std::nullopt);

    EngineConfig config() const;

    /**
     * Signal every running and waiting task to cancel.
     */
    void cancelAll();

    bool isCancelled() const { return cancel_.isCancelled(); }

    /**
     * Replace the backoff wait used by every state machine (tests).
     */
    void setSleeper(TransferStateMachine::Sleeper sleeper);

    /**
     * Download every spec and wait for all of them to finish.
     * Clears a previous cancellation before starting.
     * @throws std::runtime_error if the HTTP transport cannot be created
     */
    BatchResult run(const std::vector<TransferSpec> &specs);

private:
    mutable std::mutex configMutex_;
    EngineConfig config_;
    TransportFactory transportFactory_;
    std::shared_ptr<ProgressSink> sink_;
    TransferStateMachine::Sleeper sleeper_;

    // Gate of the batch currently running, if any
    ConcurrencyGate *activeGate_ = nullptr;

    CancellationToken cancel_;
};
