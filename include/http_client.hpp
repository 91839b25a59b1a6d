#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "http_transport.hpp"

/**
 * HTTP transport backed by libcurl.
 * Each request runs on its own easy handle; handles share one connection
 * and DNS cache so keep-alive connections are reused across transfers.
 */
class HttpClient : public HttpTransport
{
public:
    explicit HttpClient(HttpClientOptions options);
    ~HttpClient() override;

    // Delete copy operations (the share handle isn't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    /**
     * Perform a streaming GET and feed the handler.
     *
     * @param request URL and extra headers (e.g. Range)
     * @param handler Receives the response head and body chunks
     * @return Transport-level outcome; HTTP error statuses are not transport errors
     */
    TransportResult get(const HttpRequest &request, HttpResponseHandler &handler) override;

    const HttpClientOptions &options() const { return options_; }

private:
    struct RequestContext;

    /**
     * Static callback for libcurl to write downloaded data.
     * libcurl is C library, so callbacks must be static or free functions.
     *
     * @param ptr Pointer to downloaded data chunk
     * @param size Size of each element (usually 1)
     * @param nmemb Number of elements
     * @param userdata User-provided pointer (we pass RequestContext*)
     * @return Number of bytes consumed (anything else aborts the transfer)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static callback for libcurl to deliver one header line.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Static progress callback for libcurl, used only to poll for aborts.
     *
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    static void lockShared(CURL *handle, curl_lock_data data, curl_lock_access access, void *userptr);
    static void unlockShared(CURL *handle, curl_lock_data data, void *userptr);

    /**
     * Map a CURL error to a transport status.
     */
    static TransportStatus classifyError(CURLcode code);

    void applyOptions(CURL *handle) const;

    HttpClientOptions options_;

    // Share handle with custom deleter (RAII pattern)
    std::unique_ptr<CURLSH, decltype(&curl_share_cleanup)> share_;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> shareLocks_;
};
