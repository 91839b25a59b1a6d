#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

struct EngineConfig;

/**
 * Client settings shared by every request of a batch.
 */
struct HttpClientOptions
{
    int timeoutSeconds = 0;
    int stallTimeoutSeconds = 30;
    int connectTimeoutSeconds = 10;
    std::optional<std::string> proxy;
    std::string userAgent;
    bool verifyTls = true;
    bool followRedirects = true;
    long maxRedirects = 5;

    // Upper bound for one body chunk handed to the response handler
    std::size_t bufferSize = 64 * 1024;

    // Idle keep-alive connections kept in the shared pool
    std::size_t maxConnections = 16;

    static HttpClientOptions fromConfig(const EngineConfig &config);
};

struct HttpRequest
{
    std::string url;
    std::map<std::string, std::string> headers;
};

/**
 * Status line and headers of the final (post-redirect) response.
 */
struct HttpResponseHead
{
    long statusCode = 0;

    // Absent when the server did not send Content-Length
    std::optional<std::uint64_t> contentLength;

    // Header names are lower-cased
    std::map<std::string, std::string> headers;
};

/**
 * Receives one streamed response. Returning false from either callback
 * aborts the request; the transport then reports TransportStatus::Aborted.
 */
class HttpResponseHandler
{
public:
    virtual ~HttpResponseHandler() = default;

    // Called once, before the first body chunk
    virtual bool onResponseHead(const HttpResponseHead &head) = 0;

    // Called for each body chunk, never larger than the configured buffer size
    virtual bool onBodyChunk(const char *data, std::size_t size) = 0;

    // Polled while waiting on the network (connect, headers, slow bodies)
    virtual bool shouldAbort() const { return false; }
};

enum class TransportStatus
{
    Ok,
    Aborted,          // Handler asked to stop
    TimedOut,         // Connect, stall or overall timeout
    ConnectionFailed, // DNS, proxy or TCP connect failure
    TransferFailed,   // Connection broke mid-exchange
    TlsFailed,        // Handshake or certificate verification
    InvalidRequest    // Malformed URL or unsupported protocol
};

struct TransportResult
{
    TransportStatus status = TransportStatus::Ok;
    std::string message;

    bool ok() const { return status == TransportStatus::Ok; }
};

std::string transportStatusName(TransportStatus status);

/**
 * Streaming HTTP GET. Implementations must allow concurrent get() calls
 * from different threads.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual TransportResult get(const HttpRequest &request, HttpResponseHandler &handler) = 0;
};
