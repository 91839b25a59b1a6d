#include "http_client.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

// Per-request state handed to the libcurl callbacks
struct HttpClient::RequestContext
{
    CURL *handle = nullptr;
    HttpResponseHandler *handler = nullptr;

    HttpResponseHead head;
    bool headDelivered = false;
    bool handlerStopped = false;

    /**
     * Hand the final response head to the handler once.
     * Redirect responses are skipped because their headers were reset
     * by the next status line.
     */
    bool deliverHead()
    {
        if (headDelivered)
        {
            return !handlerStopped;
        }
        headDelivered = true;

        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &head.statusCode);

        curl_off_t contentLength = -1;
        if (curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength) == CURLE_OK &&
            contentLength >= 0)
        {
            head.contentLength = static_cast<std::uint64_t>(contentLength);
        }

        if (!handler->onResponseHead(head))
        {
            handlerStopped = true;
        }
        return !handlerStopped;
    }
};

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)), share_(nullptr, curl_share_cleanup)
{
    // Thread-safe since libcurl 7.84; earlier versions need this before any thread starts
    static const CURLcode globalInit = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (globalInit != CURLE_OK)
    {
        throw std::runtime_error(
            fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(globalInit)));
    }

    share_.reset(curl_share_init());
    if (!share_)
    {
        throw std::runtime_error("Failed to create CURL share handle (out of memory or library error)");
    }

    curl_share_setopt(share_.get(), CURLSHOPT_LOCKFUNC, lockShared);
    curl_share_setopt(share_.get(), CURLSHOPT_UNLOCKFUNC, unlockShared);
    curl_share_setopt(share_.get(), CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

void HttpClient::lockShared(CURL *handle, curl_lock_data data, curl_lock_access access, void *userptr)
{
    (void)handle;
    (void)access;
    static_cast<HttpClient *>(userptr)->shareLocks_[static_cast<std::size_t>(data)].lock();
}

void HttpClient::unlockShared(CURL *handle, curl_lock_data data, void *userptr)
{
    (void)handle;
    static_cast<HttpClient *>(userptr)->shareLocks_[static_cast<std::size_t>(data)].unlock();
}

void HttpClient::applyOptions(CURL *handle) const
{
    curl_easy_setopt(handle, CURLOPT_SHARE, share_.get());
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.userAgent.c_str());

    // HTTPS settings
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, options_.verifyTls ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, options_.verifyTls ? 2L : 0L);

    // Follow HTTP redirects (e.g., http://example.com -> https://example.com)
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, options_.followRedirects ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, options_.maxRedirects);

    if (options_.proxy && !options_.proxy->empty())
    {
        curl_easy_setopt(handle, CURLOPT_PROXY, options_.proxy->c_str());
    }

    // Timeouts: connect, overall, and stall (no bytes for stallTimeoutSeconds)
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connectTimeoutSeconds));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options_.timeoutSeconds));
    if (options_.stallTimeoutSeconds > 0)
    {
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stallTimeoutSeconds));
    }

    // Connection pool and chunk bound
    curl_easy_setopt(handle, CURLOPT_MAXCONNECTS, static_cast<long>(options_.maxConnections));
    curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, static_cast<long>(options_.bufferSize));

    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
}

TransportResult HttpClient::get(const HttpRequest &request, HttpResponseHandler &handler)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
    {
        return {TransportStatus::TransferFailed, "Failed to initialize CURL (out of memory or library error)"};
    }

    applyOptions(curl.get());
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(nullptr, curl_slist_free_all);
    for (const auto &[name, value] : request.headers)
    {
        std::string line = fmt::format("{}: {}", name, value);
        curl_slist *appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended)
        {
            return {TransportStatus::TransferFailed, "Failed to build request headers"};
        }
        headerList.release();
        headerList.reset(appended);
    }
    if (headerList)
    {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    }

    RequestContext context;
    context.handle = curl.get();
    context.handler = &handler;

    // Set callbacks and pass the request context
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &context);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &context);

    logDebug("GET {}", request.url);
    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_OK)
    {
        // Bodiless responses (e.g. 416, 404 with no content) never reached writeCallback
        if (!context.deliverHead())
        {
            return {TransportStatus::Aborted, "Response rejected by handler"};
        }
        return {};
    }

    if (context.handlerStopped)
    {
        return {TransportStatus::Aborted, "Transfer stopped by handler"};
    }

    return {classifyError(res), curl_easy_strerror(res)};
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *context = static_cast<RequestContext *>(userdata);
    size_t totalSize = size * nmemb;

    if (!context->deliverHead())
    {
        return 0;
    }

    if (!context->handler->onBodyChunk(ptr, totalSize))
    {
        context->handlerStopped = true;
        return 0; // Any value other than totalSize makes libcurl abort
    }

    return totalSize;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto *context = static_cast<RequestContext *>(userdata);
    size_t totalSize = size * nitems;
    std::string line(buffer, totalSize);

    // A new status line starts a new response (redirect hop): forget the previous headers
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->head.headers.clear();
        return totalSize;
    }

    size_t colonPos = line.find(':');
    if (colonPos == std::string::npos)
    {
        return totalSize;
    }

    std::string name = line.substr(0, colonPos);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });

    std::string value = line.substr(colonPos + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t\r\n");
    value = (first == std::string::npos) ? std::string() : value.substr(first, last - first + 1);

    context->head.headers[name] = value;
    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *context = static_cast<RequestContext *>(clientp);
    if (context->handler->shouldAbort())
    {
        context->handlerStopped = true;
        return 1;
    }
    return 0;
}

// Classify a CURL error so callers can decide whether to retry
TransportStatus HttpClient::classifyError(CURLcode code)
{
    switch (code)
    {
    case CURLE_OK:
        return TransportStatus::Ok;

    case CURLE_WRITE_ERROR:
    case CURLE_ABORTED_BY_CALLBACK:
        return TransportStatus::Aborted;

    case CURLE_OPERATION_TIMEDOUT: // Server didn't respond in time
        return TransportStatus::TimedOut;

    case CURLE_COULDNT_RESOLVE_HOST:  // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_RESOLVE_PROXY: // Proxy lookup failed
    case CURLE_COULDNT_CONNECT:       // Connection refused (server might be restarting)
        return TransportStatus::ConnectionFailed;

    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CACERT_BADFILE:
        return TransportStatus::TlsFailed;

    case CURLE_URL_MALFORMAT:        // Invalid URL syntax
    case CURLE_UNSUPPORTED_PROTOCOL: // Protocol not supported
        return TransportStatus::InvalidRequest;

    // Everything else (partial file, recv/send errors, empty reply) is worth another attempt
    default:
        return TransportStatus::TransferFailed;
    }
}
