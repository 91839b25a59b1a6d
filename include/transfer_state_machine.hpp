#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "cancellation.hpp"
#include "concurrency_gate.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "progress_sink.hpp"
#include "transfer_spec.hpp"

enum class TransferState
{
    Pending,
    Connecting,
    Streaming,
    Verifying,
    Finalizing,
    Done,
    Failed,
    Cancelled
};

std::string transferStateName(TransferState state);

bool isTerminal(TransferState state);

/**
 * Classification of one attempt.
 * Retryable failures consume an attempt and back off; Fatal and Cancelled
 * end the transfer immediately.
 */
enum class AttemptOutcome
{
    Success,
    Retryable,
    Fatal,
    Cancelled
};

/**
 * Bookkeeping for a single attempt (one per retry iteration).
 */
struct TransferAttempt
{
    int attemptIndex = 0;
    std::uint64_t bytesAlreadyOnDisk = 0;
    std::optional<std::uint64_t> expectedTotalBytes;
    AttemptOutcome outcome = AttemptOutcome::Retryable;
    std::string error;
};

/**
 * Terminal report of one transfer.
 */
struct TransferResult
{
    std::string label;
    std::filesystem::path destination;
    TransferState state = TransferState::Pending;
    int attempts = 0;
    std::uint64_t bytesWritten = 0; // Bytes written to the working file across all attempts
    std::string error;              // Last error, empty on success

    bool succeeded() const { return state == TransferState::Done; }
};

/**
 * Drives one TransferSpec through
 * Pending → Connecting → Streaming → Verifying → Finalizing → Done,
 * retrying recoverable failures with linear backoff. Failed and Cancelled
 * are reachable from every non-terminal state.
 *
 * The working file (destination + ".part") is only ever touched by this
 * machine's sequential attempts. It survives between attempts so the next
 * one can resume, and is deleted whenever the machine ends without success.
 */
class TransferStateMachine
{
public:
    /**
     * Backoff wait. Returns true if the wait was interrupted by cancellation.
     */
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    /**
     * @param spec Transfer to perform (destination is sanitized here)
     * @param config Retry policy, chunk size
     * @param transport Shared HTTP transport
     * @param gate Admission control shared by the batch
     * @param cancel Batch-wide cancellation signal
     * @param sink Progress receiver, may be null (headless)
     */
    TransferStateMachine(const TransferSpec &spec,
                         const EngineConfig &config,
                         HttpTransport &transport,
                         ConcurrencyGate &gate,
                         const CancellationToken &cancel,
                         ProgressSink *sink = nullptr);

    /**
     * Replace the backoff wait (default: interruptible wait on the token).
     */
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    /**
     * Run to a terminal state. Never throws for transfer failures.
     */
    TransferResult run();

    TransferState state() const { return state_; }

    const std::string &label() const { return label_; }

    const std::filesystem::path &destination() const { return destination_; }

    const std::filesystem::path &workingPath() const { return workingPath_; }

private:
    AttemptOutcome runAttempt(TransferAttempt &attempt);
    AttemptOutcome classifyTransportFailure(const TransportResult &result, TransferAttempt &attempt) const;
    AttemptOutcome verifyWorkingFile(TransferAttempt &attempt);
    AttemptOutcome finalize(TransferAttempt &attempt);

    void setState(TransferState state);
    void reportPhase(const std::string &phaseLabel) const;
    TransferResult finish(TransferState terminal);

    TransferSpec spec_;
    EngineConfig config_;
    HttpTransport &transport_;
    ConcurrencyGate &gate_;
    const CancellationToken &cancel_;
    ProgressSink *sink_;
    Sleeper sleeper_;

    std::filesystem::path destination_;
    std::filesystem::path workingPath_;
    std::string label_;

    TransferState state_ = TransferState::Pending;
    int attemptsMade_ = 0;
    std::uint64_t bytesWritten_ = 0;
    std::string lastError_;
};
