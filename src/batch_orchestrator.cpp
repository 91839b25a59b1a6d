#include "batch_orchestrator.hpp"
#include "file_ops.hpp"
#include "http_client.hpp"
#include "logging.hpp"

#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>

namespace
{
    /**
     * Single coordinating point for results posted by concurrent tasks.
     */
    class ResultCollector
    {
    public:
        ResultCollector(std::size_t total, ProgressSink *sink) : total_(total), sink_(sink) {}

        void post(TransferResult result)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (result.succeeded())
            {
                ++batch_.succeededCount;
            }
            else
            {
                ++batch_.failedCount;
            }
            batch_.transfers.push_back(std::move(result));

            if (sink_)
            {
                sink_->onBatchProgress(batch_.transfers.size(), total_);
            }
        }

        BatchResult take()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return std::move(batch_);
        }

    private:
        std::size_t total_;
        ProgressSink *sink_;
        std::mutex mutex_;
        BatchResult batch_;
    };
}

BatchOrchestrator::BatchOrchestrator(EngineConfig config)
    : BatchOrchestrator(std::move(config), [](const HttpClientOptions &options)
                        { return std::make_unique<HttpClient>(options); })
{
}

BatchOrchestrator::BatchOrchestrator(EngineConfig config, TransportFactory transportFactory)
    : config_(std::move(config)), transportFactory_(std::move(transportFactory))
{
    config_.validate();
}

void BatchOrchestrator::setProgressSink(std::shared_ptr<ProgressSink> sink)
{
    std::lock_guard<std::mutex> lock(configMutex_);
    sink_ = std::move(sink);
}

void BatchOrchestrator::setNetworkConfig(std::optional<std::string> proxy,
                                         std::optional<std::string> userAgent,
                                         std::optional<int> timeoutSeconds)
{
    std::lock_guard<std::mutex> lock(configMutex_);
    EngineConfig updated = config_;
    if (proxy)
        updated.proxy = std::move(*proxy);
    if (userAgent)
        updated.userAgent = std::move(*userAgent);
    if (timeoutSeconds)
        updated.timeoutSeconds = *timeoutSeconds;
    updated.validate();
    config_ = std::move(updated);

    logInfo("Network config updated. UA: {}", config_.userAgent);
}

void BatchOrchestrator::setRuntimeConfig(std::optional<std::size_t> maxConcurrency,
                                         std::optional<std::size_t> chunkSize)
{
    std::lock_guard<std::mutex> lock(configMutex_);
    EngineConfig updated = config_;
    if (maxConcurrency)
        updated.maxConcurrency = *maxConcurrency;
    if (chunkSize)
        updated.chunkSize = *chunkSize;
    updated.validate();
    config_ = std::move(updated);

    if (maxConcurrency && activeGate_)
    {
        activeGate_->setCapacity(*maxConcurrency);
    }
}

EngineConfig BatchOrchestrator::config() const
{
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void BatchOrchestrator::cancelAll()
{
    cancel_.cancel();
    logWarning("Cancellation signal received.");
}

void BatchOrchestrator::setSleeper(TransferStateMachine::Sleeper sleeper)
{
    std::lock_guard<std::mutex> lock(configMutex_);
    sleeper_ = std::move(sleeper);
}

BatchResult BatchOrchestrator::run(const std::vector<TransferSpec> &specs)
{
    cancel_.reset();

    // Snapshot: later config changes only affect future batches
    EngineConfig config;
    std::shared_ptr<ProgressSink> userSink;
    TransferStateMachine::Sleeper sleeper;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config = config_;
        userSink = sink_;
        sleeper = sleeper_;
    }

    logInfo("Batch started. Batch size: {}", specs.size());

    // Prepare folders
    for (const TransferSpec &spec : specs)
    {
        try
        {
            ensureParentDirectory(sanitizeDestination(spec.destinationPath));
        }
        catch (const std::filesystem::filesystem_error &e)
        {
            // The task retries directory creation itself and reports the failure
            logWarning("Could not create directory for {}: {}", spec.destinationPath.string(), e.what());
        }
    }

    std::unique_ptr<HttpTransport> transport = transportFactory_(HttpClientOptions::fromConfig(config));

    std::unique_ptr<AsyncProgressSink> sink;
    if (userSink)
    {
        sink = std::make_unique<AsyncProgressSink>(userSink);
    }

    ConcurrencyGate gate(config.maxConcurrency, cancel_);
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        activeGate_ = &gate;
    }

    ResultCollector collector(specs.size(), sink.get());

    auto runTask = [&](const TransferSpec &spec)
    {
        TransferResult result;
        try
        {
            TransferStateMachine machine(spec, config, *transport, gate, cancel_, sink.get());
            if (sleeper)
            {
                machine.setSleeper(sleeper);
            }
            result = machine.run();
        }
        catch (const std::exception &e)
        {
            result.label = taskLabelFor(spec);
            result.destination = sanitizeDestination(spec.destinationPath);
            result.state = TransferState::Failed;
            result.error = e.what();
            logError("Failed to download {}: {}", result.label, result.error);
        }
        collector.post(std::move(result));
    };

    // Two specs that sanitize to the same file would share one working file.
    // The first one claims the destination; later ones fail without running.
    std::map<std::filesystem::path, std::string> claimed;

    // One thread per spec: a very large batch parks that many threads on the gate
    std::vector<std::thread> workers;
    workers.reserve(specs.size());
    for (const TransferSpec &spec : specs)
    {
        std::filesystem::path destination = sanitizeDestination(spec.destinationPath).lexically_normal();
        auto [owner, inserted] = claimed.emplace(destination, spec.sourceUrl);
        if (!inserted)
        {
            TransferResult duplicate;
            duplicate.label = taskLabelFor(spec);
            duplicate.destination = sanitizeDestination(spec.destinationPath);
            duplicate.state = TransferState::Failed;
            duplicate.error = fmt::format("Destination {} is already used by {} in this batch",
                                          destination.string(), owner->second);
            logError("Failed to download {}: {}", duplicate.label, duplicate.error);
            collector.post(std::move(duplicate));
            continue;
        }

        try
        {
            workers.emplace_back(runTask, std::cref(spec));
        }
        catch (const std::system_error &e)
        {
            // Out of threads: run this one on the calling thread instead
            logWarning("Could not start a thread for {} ({}); running it inline", taskLabelFor(spec), e.what());
            runTask(spec);
        }
    }

    for (std::thread &worker : workers)
    {
        worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        activeGate_ = nullptr;
    }

    // Deliver every queued event before reporting
    if (sink)
    {
        sink->flush();
    }

    BatchResult result = collector.take();
    logInfo("Batch completed. Success: {}, Failed: {}", result.succeededCount, result.failedCount);
    return result;
}
