#include "transfer_state_machine.hpp"
#include "checksum.hpp"
#include "file_ops.hpp"
#include "format_utils.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include <fmt/core.h>

namespace
{
    constexpr long HTTP_OK = 200;
    constexpr long HTTP_PARTIAL_CONTENT = 206;
    constexpr long HTTP_RANGE_NOT_SATISFIABLE = 416;

    // Statuses meaning the resource will never become available; retrying is futile
    bool isFatalStatus(long code)
    {
        return code == 403 || code == 404;
    }

    // First byte offset of a "Content-Range: bytes S-E/T" header
    std::optional<std::uint64_t> contentRangeStart(const std::string &value)
    {
        const std::string prefix = "bytes ";
        if (value.rfind(prefix, 0) != 0)
        {
            return std::nullopt;
        }

        const char *begin = value.c_str() + prefix.size();
        char *end = nullptr;
        unsigned long long start = std::strtoull(begin, &end, 10);
        if (end == begin || *end != '-')
        {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(start);
    }

    /**
     * Receives one HTTP response and streams its body into the working file.
     * Decides append vs truncate from the status code and stops on cancellation.
     */
    class AttemptStream : public HttpResponseHandler
    {
    public:
        AttemptStream(const std::filesystem::path &workingPath,
                      std::uint64_t resumeOffset,
                      std::size_t chunkSize,
                      const CancellationToken &cancel,
                      ProgressSink *sink,
                      const std::string &label,
                      std::function<void()> onStreaming)
            : workingPath_(workingPath),
              resumeOffset_(resumeOffset),
              chunkSize_(chunkSize),
              cancel_(cancel),
              sink_(sink),
              label_(label),
              onStreaming_(std::move(onStreaming))
        {
        }

        bool onResponseHead(const HttpResponseHead &head) override
        {
            statusCode_ = head.statusCode;

            if (statusCode_ == HTTP_RANGE_NOT_SATISFIABLE)
            {
                rangeNotSatisfiable_ = true;
                return false;
            }
            if (statusCode_ != HTTP_OK && statusCode_ != HTTP_PARTIAL_CONTENT)
            {
                statusRejected_ = true;
                return false;
            }

            resumed_ = statusCode_ == HTTP_PARTIAL_CONTENT;
            if (resumed_)
            {
                // The server must continue exactly where the partial file ends
                auto contentRange = head.headers.find("content-range");
                if (contentRange != head.headers.end())
                {
                    auto start = contentRangeStart(contentRange->second);
                    if (start && *start != resumeOffset_)
                    {
                        rangeMismatch_ = true;
                        return false;
                    }
                }
            }
            else if (resumeOffset_ > 0)
            {
                // Server sent status 200 instead of 206 = doesn't support ranges
                logInfo("Server doesn't support resume for {}. Restarting download from beginning...", label_);
            }

            if (head.contentLength)
            {
                totalBytes_ = *head.contentLength + (resumed_ ? resumeOffset_ : 0);

                if (!hasDiskSpaceFor(workingPath_, *head.contentLength))
                {
                    noSpace_ = true;
                    return false;
                }
            }

            // Open .part file: APPEND when the server resumed, TRUNCATE otherwise
            std::ios::openmode mode = std::ios::binary | (resumed_ ? std::ios::app : std::ios::trunc);
            file_.open(workingPath_, mode);
            if (!file_)
            {
                writeFailed_ = true;
                error_ = fmt::format("Cannot open file for writing: {}", workingPath_.string());
                return false;
            }

            onStreaming_();

            // Bytes kept from earlier attempts count towards this task's progress
            if (resumed_ && resumeOffset_ > 0 && sink_)
            {
                sink_->onByteProgress(label_, resumeOffset_, totalBytes_);
            }

            return !cancel_.isCancelled();
        }

        bool onBodyChunk(const char *data, std::size_t size) override
        {
            std::size_t offset = 0;
            while (offset < size)
            {
                std::size_t length = std::min(chunkSize_, size - offset);
                file_.write(data + offset, static_cast<std::streamsize>(length));
                if (!file_.good())
                {
                    writeFailed_ = true;
                    error_ = fmt::format("Write failed: {}", workingPath_.string());
                    return false;
                }

                offset += length;
                bytesWritten_ += length;

                if (sink_)
                {
                    sink_->onByteProgress(label_, length, totalBytes_);
                }
                if (cancel_.isCancelled())
                {
                    return false;
                }
            }
            return true;
        }

        bool shouldAbort() const override
        {
            return cancel_.isCancelled();
        }

        /**
         * Flush and close the working file.
         * @return false if buffered data could not be written
         */
        bool close()
        {
            if (!file_.is_open())
            {
                return true;
            }
            file_.close();
            if (file_.fail())
            {
                writeFailed_ = true;
                error_ = fmt::format("Failed to flush {}", workingPath_.string());
                return false;
            }
            return true;
        }

        long statusCode() const { return statusCode_; }
        bool rangeNotSatisfiable() const { return rangeNotSatisfiable_; }
        bool rangeMismatch() const { return rangeMismatch_; }
        bool statusRejected() const { return statusRejected_; }
        bool writeFailed() const { return writeFailed_; }
        bool noSpace() const { return noSpace_; }
        const std::optional<std::uint64_t> &totalBytes() const { return totalBytes_; }
        std::uint64_t bytesWritten() const { return bytesWritten_; }
        const std::string &error() const { return error_; }

    private:
        const std::filesystem::path &workingPath_;
        std::uint64_t resumeOffset_;
        std::size_t chunkSize_;
        const CancellationToken &cancel_;
        ProgressSink *sink_;
        const std::string &label_;
        std::function<void()> onStreaming_;

        std::ofstream file_;
        long statusCode_ = 0;
        bool resumed_ = false;
        bool rangeNotSatisfiable_ = false;
        bool rangeMismatch_ = false;
        bool statusRejected_ = false;
        bool writeFailed_ = false;
        bool noSpace_ = false;
        std::optional<std::uint64_t> totalBytes_;
        std::uint64_t bytesWritten_ = 0;
        std::string error_;
    };
}

std::string transferStateName(TransferState state)
{
    switch (state)
    {
    case TransferState::Pending:
        return "Pending";
    case TransferState::Connecting:
        return "Connecting";
    case TransferState::Streaming:
        return "Downloading";
    case TransferState::Verifying:
        return "Verifying";
    case TransferState::Finalizing:
        return "Finalizing";
    case TransferState::Done:
        return "Done";
    case TransferState::Failed:
        return "Failed";
    case TransferState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool isTerminal(TransferState state)
{
    return state == TransferState::Done || state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

TransferStateMachine::TransferStateMachine(const TransferSpec &spec,
                                           const EngineConfig &config,
                                           HttpTransport &transport,
                                           ConcurrencyGate &gate,
                                           const CancellationToken &cancel,
                                           ProgressSink *sink)
    : spec_(spec),
      config_(config),
      transport_(transport),
      gate_(gate),
      cancel_(cancel),
      sink_(sink)
{
    config_.validate();

    destination_ = sanitizeDestination(spec_.destinationPath);
    workingPath_ = workingPathFor(destination_);
    label_ = taskLabelFor(spec_);

    sleeper_ = [this](std::chrono::milliseconds duration)
    {
        return cancel_.waitFor(duration);
    };
}

TransferResult TransferStateMachine::run()
{
    setState(TransferState::Pending);

    // A malformed expected digest can never match; fail before touching the network
    if (spec_.expectedDigest)
    {
        try
        {
            std::string normalized = ChecksumVerifier::normalizeHex(*spec_.expectedDigest);
            std::size_t expectedLength = ChecksumVerifier::hexLength(spec_.digestAlgorithm);
            if (normalized.length() != expectedLength)
            {
                lastError_ = fmt::format("Invalid {} digest length. Expected {} hex characters, got {}",
                                         ChecksumVerifier::algorithmName(spec_.digestAlgorithm),
                                         expectedLength, normalized.length());
                return finish(TransferState::Failed);
            }
        }
        catch (const std::runtime_error &e)
        {
            lastError_ = e.what();
            return finish(TransferState::Failed);
        }
    }

    ConcurrencyGate::Slot slot(gate_);
    if (!slot.acquired())
    {
        lastError_ = "Cancelled before start";
        return finish(TransferState::Cancelled);
    }

    for (int attemptIndex = 0; attemptIndex < config_.maxRetries; ++attemptIndex)
    {
        if (cancel_.isCancelled())
        {
            lastError_ = "Cancelled";
            return finish(TransferState::Cancelled);
        }

        TransferAttempt attempt;
        attempt.attemptIndex = attemptIndex;
        ++attemptsMade_;

        attempt.outcome = runAttempt(attempt);
        switch (attempt.outcome)
        {
        case AttemptOutcome::Success:
            return finish(TransferState::Done);
        case AttemptOutcome::Cancelled:
            lastError_ = "Cancelled";
            return finish(TransferState::Cancelled);
        case AttemptOutcome::Fatal:
            lastError_ = attempt.error;
            return finish(TransferState::Failed);
        case AttemptOutcome::Retryable:
            lastError_ = attempt.error;
            break;
        }

        if (attemptIndex + 1 < config_.maxRetries)
        {
            // Linear backoff: 1x, 2x, 3x the unit
            std::chrono::milliseconds wait = config_.backoffUnit * (attemptIndex + 1);
            double waitSeconds = std::chrono::duration<double>(wait).count();

            logInfo("Retry {}/{} for {} in {:.1f}s: {}",
                    attemptIndex + 1, config_.maxRetries, label_, waitSeconds, attempt.error);
            reportPhase(fmt::format("Waiting {:.1f}s", waitSeconds));

            if (sleeper_(wait))
            {
                lastError_ = "Cancelled";
                return finish(TransferState::Cancelled);
            }
        }
    }

    lastError_ = fmt::format("{} (after {} attempts)", lastError_, attemptsMade_);
    return finish(TransferState::Failed);
}

AttemptOutcome TransferStateMachine::runAttempt(TransferAttempt &attempt)
{
    setState(TransferState::Connecting);

    // Resume probe: size of the partial file left by an earlier attempt or run
    std::uint64_t offset = 0;
    try
    {
        ensureParentDirectory(destination_);

        offset = existingFileSize(workingPath_);
        if (offset == 0 && std::filesystem::exists(workingPath_))
        {
            // Empty .part file, remove it and start fresh
            std::filesystem::remove(workingPath_);
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        attempt.error = fmt::format("Cannot prepare {}: {}", workingPath_.string(), e.what());
        return AttemptOutcome::Retryable;
    }

    if (offset > 0)
    {
        logInfo("Found existing partial download of {} ({} already downloaded). Attempting to resume...",
                label_, formatBytes(offset));
    }

    bool rangeReset = false;
    while (true)
    {
        attempt.bytesAlreadyOnDisk = offset;

        HttpRequest request;
        request.url = spec_.sourceUrl;
        if (offset > 0)
        {
            // Format: "bytes=N-" means "from byte N to end of file"
            request.headers["Range"] = fmt::format("bytes={}-", offset);
        }

        AttemptStream stream(workingPath_, offset, config_.chunkSize, cancel_, sink_, label_,
                             [this]()
                             { setState(TransferState::Streaming); });

        TransportResult result = transport_.get(request, stream);
        stream.close();
        bytesWritten_ += stream.bytesWritten();
        attempt.expectedTotalBytes = stream.totalBytes();

        if (cancel_.isCancelled())
        {
            attempt.error = "Cancelled";
            return AttemptOutcome::Cancelled;
        }

        // Range-reset: the partial no longer fits the resource, start over unranged
        if (stream.rangeNotSatisfiable() && offset > 0 && !rangeReset)
        {
            logInfo("Server rejected range for {} at byte {}. Restarting from the beginning...", label_, offset);
            if (!removeQuietly(workingPath_))
            {
                attempt.error = fmt::format("Cannot discard stale partial file {}", workingPath_.string());
                return AttemptOutcome::Retryable;
            }
            offset = 0;
            rangeReset = true;
            continue;
        }

        if (stream.writeFailed())
        {
            attempt.error = stream.error();
            return AttemptOutcome::Retryable;
        }
        if (stream.noSpace())
        {
            attempt.error = "Insufficient disk space";
            return AttemptOutcome::Fatal;
        }
        if (stream.rangeMismatch())
        {
            removeQuietly(workingPath_);
            attempt.error = "Server resumed at a different offset than requested";
            return AttemptOutcome::Retryable;
        }
        if (stream.rangeNotSatisfiable() || stream.statusRejected())
        {
            long code = stream.statusCode();
            attempt.error = fmt::format("HTTP error {}: {}", code, httpStatusText(code));
            return isFatalStatus(code) ? AttemptOutcome::Fatal : AttemptOutcome::Retryable;
        }
        if (!result.ok())
        {
            return classifyTransportFailure(result, attempt);
        }
        if (stream.statusCode() == 0)
        {
            attempt.error = "No response received";
            return AttemptOutcome::Retryable;
        }
        break;
    }

    // Verify file size against the declared length
    if (attempt.expectedTotalBytes)
    {
        try
        {
            std::uint64_t finalSize = existingFileSize(workingPath_);
            if (finalSize != *attempt.expectedTotalBytes)
            {
                attempt.error = fmt::format("File size mismatch: expected {} but got {}",
                                            formatBytes(*attempt.expectedTotalBytes),
                                            formatBytes(finalSize));
                return AttemptOutcome::Retryable;
            }
        }
        catch (const std::filesystem::filesystem_error &e)
        {
            attempt.error = fmt::format("Could not verify file size: {}", e.what());
            return AttemptOutcome::Retryable;
        }
    }

    if (spec_.expectedDigest)
    {
        AttemptOutcome verified = verifyWorkingFile(attempt);
        if (verified != AttemptOutcome::Success)
        {
            return verified;
        }
    }

    if (cancel_.isCancelled())
    {
        attempt.error = "Cancelled";
        return AttemptOutcome::Cancelled;
    }

    return finalize(attempt);
}

AttemptOutcome TransferStateMachine::classifyTransportFailure(const TransportResult &result,
                                                              TransferAttempt &attempt) const
{
    attempt.error = fmt::format("{}: {}", transportStatusName(result.status), result.message);

    switch (result.status)
    {
    case TransportStatus::InvalidRequest:
        // Malformed URL or unsupported protocol - retrying won't help
        return AttemptOutcome::Fatal;
    case TransportStatus::Aborted:
        if (cancel_.isCancelled())
        {
            return AttemptOutcome::Cancelled;
        }
        return AttemptOutcome::Retryable;
    default:
        return AttemptOutcome::Retryable;
    }
}

AttemptOutcome TransferStateMachine::verifyWorkingFile(TransferAttempt &attempt)
{
    setState(TransferState::Verifying);

    try
    {
        bool matches = ChecksumVerifier::verify(workingPath_, spec_.digestAlgorithm, *spec_.expectedDigest,
                                                config_.chunkSize, &cancel_);
        if (!matches)
        {
            logWarning("Hash mismatch for {}. Retrying...", label_);
            removeQuietly(workingPath_);
            attempt.error = fmt::format("{} checksum mismatch",
                                        ChecksumVerifier::algorithmName(spec_.digestAlgorithm));
            return AttemptOutcome::Retryable;
        }
    }
    catch (const OperationCancelled &)
    {
        attempt.error = "Cancelled";
        return AttemptOutcome::Cancelled;
    }
    catch (const std::runtime_error &e)
    {
        attempt.error = fmt::format("Checksum verification error: {}", e.what());
        return AttemptOutcome::Retryable;
    }

    return AttemptOutcome::Success;
}

AttemptOutcome TransferStateMachine::finalize(TransferAttempt &attempt)
{
    setState(TransferState::Finalizing);

    try
    {
        replaceFile(workingPath_, destination_);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        attempt.error = fmt::format("Download succeeded but failed to rename {} to {}: {}",
                                    workingPath_.string(), destination_.string(), e.what());
        return AttemptOutcome::Fatal;
    }

    return AttemptOutcome::Success;
}

void TransferStateMachine::setState(TransferState state)
{
    state_ = state;
    logDebug("{}: {}", label_, transferStateName(state));
    reportPhase(transferStateName(state));
}

void TransferStateMachine::reportPhase(const std::string &phaseLabel) const
{
    if (sink_)
    {
        sink_->onTaskStatus(label_, phaseLabel);
    }
}

TransferResult TransferStateMachine::finish(TransferState terminal)
{
    setState(terminal);

    // No partial may outlive a task that did not succeed
    if (terminal != TransferState::Done)
    {
        std::error_code ec;
        if (std::filesystem::exists(workingPath_, ec))
        {
            removeQuietly(workingPath_);
        }
    }

    if (terminal == TransferState::Failed)
    {
        logError("Failed to download {} ({}): {}", label_, destination_.string(), lastError_);
    }
    else if (terminal == TransferState::Cancelled)
    {
        logInfo("Cancelled {}", label_);
    }

    TransferResult result;
    result.label = label_;
    result.destination = destination_;
    result.state = terminal;
    result.attempts = attemptsMade_;
    result.bytesWritten = bytesWritten_;
    if (terminal != TransferState::Done)
    {
        result.error = lastError_;
    }
    return result;
}
