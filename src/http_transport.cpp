#include "http_transport.hpp"
#include "config.hpp"

HttpClientOptions HttpClientOptions::fromConfig(const EngineConfig &config)
{
    HttpClientOptions options;
    options.timeoutSeconds = config.timeoutSeconds;
    options.stallTimeoutSeconds = config.stallTimeoutSeconds;
    options.connectTimeoutSeconds = config.connectTimeoutSeconds;
    options.proxy = config.proxy;
    options.userAgent = config.userAgent;
    options.verifyTls = config.verifyTls;
    options.followRedirects = config.followRedirects;
    options.maxRedirects = config.maxRedirects;
    options.bufferSize = config.chunkSize;
    options.maxConnections = config.maxConcurrency;
    return options;
}

std::string transportStatusName(TransportStatus status)
{
    switch (status)
    {
    case TransportStatus::Ok:
        return "ok";
    case TransportStatus::Aborted:
        return "aborted";
    case TransportStatus::TimedOut:
        return "timed out";
    case TransportStatus::ConnectionFailed:
        return "connection failed";
    case TransportStatus::TransferFailed:
        return "transfer failed";
    case TransportStatus::TlsFailed:
        return "TLS failure";
    case TransportStatus::InvalidRequest:
        return "invalid request";
    }
    return "unknown";
}
