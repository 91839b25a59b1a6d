#include "http_client.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "test_support.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace testing_support;

namespace
{
    /**
     * One-request-per-connection HTTP server on 127.0.0.1.
     * Each path maps to a raw response written verbatim.
     */
    class LoopbackServer
    {
    public:
        LoopbackServer()
        {
            listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listenFd_ < 0)
            {
                throw std::runtime_error("socket() failed");
            }
            int reuse = 1;
            ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

            sockaddr_in address{};
            address.sin_family = AF_INET;
            address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            address.sin_port = 0;
            socklen_t length = sizeof(address);
            if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&address), length) != 0 ||
                ::listen(listenFd_, 16) != 0 ||
                ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&address), &length) != 0)
            {
                ::close(listenFd_);
                throw std::runtime_error("Cannot listen on 127.0.0.1");
            }
            port_ = ntohs(address.sin_port);

            thread_ = std::thread([this]()
                                  { serve(); });
        }

        ~LoopbackServer()
        {
            stop_ = true;
            thread_.join();
            ::close(listenFd_);
        }

        LoopbackServer(const LoopbackServer &) = delete;
        LoopbackServer &operator=(const LoopbackServer &) = delete;

        void route(const std::string &path, const std::string &rawResponse)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            routes_[path] = rawResponse;
        }

        std::string url(const std::string &path) const
        {
            return fmt::format("http://127.0.0.1:{}{}", port_, path);
        }

        std::uint16_t port() const { return port_; }

        // Raw request heads in arrival order
        std::vector<std::string> requests() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

    private:
        void serve()
        {
            while (!stop_)
            {
                pollfd waiting{listenFd_, POLLIN, 0};
                if (::poll(&waiting, 1, 50) <= 0)
                {
                    continue;
                }
                int client = ::accept(listenFd_, nullptr, nullptr);
                if (client < 0)
                {
                    continue;
                }
                answer(client);
                ::close(client);
            }
        }

        void answer(int client)
        {
            std::string request;
            char buffer[1024];
            while (request.find("\r\n\r\n") == std::string::npos)
            {
                ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
                if (received <= 0)
                {
                    return;
                }
                request.append(buffer, static_cast<std::size_t>(received));
            }

            std::size_t pathStart = request.find(' ') + 1;
            std::string path = request.substr(pathStart, request.find(' ', pathStart) - pathStart);

            std::string response = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
                auto found = routes_.find(path);
                if (found != routes_.end())
                {
                    response = found->second;
                }
            }

            std::size_t sent = 0;
            while (sent < response.size())
            {
                ssize_t written = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (written <= 0)
                {
                    return;
                }
                sent += static_cast<std::size_t>(written);
            }
        }

        int listenFd_ = -1;
        std::uint16_t port_ = 0;
        std::atomic<bool> stop_{false};
        std::thread thread_;

        mutable std::mutex mutex_;
        std::map<std::string, std::string> routes_;
        std::vector<std::string> requests_;
    };

    class RecordingHandler : public HttpResponseHandler
    {
    public:
        bool onResponseHead(const HttpResponseHead &head) override
        {
            ++headCount;
            this->head = head;
            return acceptHead;
        }

        bool onBodyChunk(const char *data, std::size_t size) override
        {
            body.append(data, size);
            return true;
        }

        bool acceptHead = true;
        int headCount = 0;
        HttpResponseHead head;
        std::string body;
    };

    std::string response(const std::string &statusLine, const std::string &headers, const std::string &body)
    {
        return fmt::format("HTTP/1.1 {}\r\n{}Content-Length: {}\r\nConnection: close\r\n\r\n{}",
                           statusLine, headers, body.size(), body);
    }

    HttpClient makeClient()
    {
        EngineConfig config;
        config.userAgent = "Loopback/1.0";
        config.connectTimeoutSeconds = 5;
        config.timeoutSeconds = 10;
        return HttpClient(HttpClientOptions::fromConfig(config));
    }

    void test_options_come_from_config(TestContext &t)
    {
        EngineConfig config;
        config.userAgent = "Mirror/7";
        config.maxConcurrency = 6;
        config.chunkSize = 8192;
        config.verifyTls = false;

        HttpClient client(HttpClientOptions::fromConfig(config));
        t.check(client.options().userAgent == "Mirror/7", "user agent carried over");
        t.check(client.options().maxConnections == 6, "pool sized by the concurrency limit");
        t.check(client.options().bufferSize == 8192, "buffer sized by the chunk size");
        t.check(!client.options().verifyTls, "TLS verification flag carried over");
    }

    void test_unusable_urls_are_invalid_requests(TestContext &t)
    {
        HttpClient client = makeClient();
        for (const std::string url : {"htp://x", "http://"})
        {
            RecordingHandler handler;
            TransportResult result = client.get({url, {}}, handler);
            t.check(result.status == TransportStatus::InvalidRequest,
                    fmt::format("'{}' is an invalid request (got {}: {})", url,
                                transportStatusName(result.status), result.message));
            t.check(handler.headCount == 0, fmt::format("'{}' never produces a response", url));
        }
    }

    void test_streams_body_and_lowercases_headers(TestContext &t)
    {
        LoopbackServer server;
        std::string body = makePayload(40000, 7);
        server.route("/data.bin", response("206 Partial Content",
                                           "Content-Range: bytes 5-40004/40005\r\nX-Mirror-Id: north\r\n", body));

        HttpClient client = makeClient();
        RecordingHandler handler;
        TransportResult result = client.get({server.url("/data.bin"), {{"Range", "bytes=5-"}}}, handler);

        t.check(result.status == TransportStatus::Ok, fmt::format("transfer succeeds ({})", result.message));
        t.check(handler.headCount == 1, "head delivered once");
        t.check(handler.head.statusCode == 206, "status code read from the response");
        t.check(handler.head.contentLength == std::optional<std::uint64_t>(body.size()), "content length parsed");
        t.check(handler.head.headers["content-range"] == "bytes 5-40004/40005", "header names are lower-cased");
        t.check(handler.head.headers["x-mirror-id"] == "north", "header values are trimmed");
        t.check(handler.body == body, "body delivered intact");

        auto requests = server.requests();
        t.check(requests.size() == 1, "one request sent");
        if (!requests.empty())
        {
            t.checkContains(requests[0], "Range: bytes=5-", "extra headers reach the server");
            t.checkContains(requests[0], "User-Agent: Loopback/1.0", "user agent reaches the server");
        }
    }

    void test_redirect_hop_headers_are_dropped(TestContext &t)
    {
        LoopbackServer server;
        server.route("/old", response("302 Found",
                                      fmt::format("Location: {}\r\nX-Hop: first\r\n", server.url("/new")), ""));
        server.route("/new", response("200 OK", "X-Final: yes\r\n", "payload"));

        HttpClient client = makeClient();
        RecordingHandler handler;
        TransportResult result = client.get({server.url("/old"), {}}, handler);

        t.check(result.status == TransportStatus::Ok, fmt::format("redirect followed ({})", result.message));
        t.check(handler.head.statusCode == 200, "head describes the final response");
        t.check(handler.head.headers.count("x-hop") == 0, "redirect headers are not kept");
        t.check(handler.head.headers["x-final"] == "yes", "final headers are kept");
        t.check(handler.body == "payload", "final body delivered");
        t.check(server.requests().size() == 2, "two hops");
    }

    void test_bodiless_response_still_delivers_head(TestContext &t)
    {
        LoopbackServer server;
        server.route("/gone.bin", response("416 Range Not Satisfiable", "Content-Range: bytes */10\r\n", ""));

        HttpClient client = makeClient();
        RecordingHandler handler;
        TransportResult result = client.get({server.url("/gone.bin"), {{"Range", "bytes=10-"}}}, handler);

        t.check(result.status == TransportStatus::Ok, "an HTTP error status is not a transport error");
        t.check(handler.headCount == 1, "head delivered once without a body");
        t.check(handler.head.statusCode == 416, "416 reported");
        t.check(handler.head.headers["content-range"] == "bytes */10", "headers of the bodiless response kept");
        t.check(handler.body.empty(), "no body chunks");
    }

    void test_rejected_head_aborts(TestContext &t)
    {
        LoopbackServer server;
        server.route("/file.bin", response("200 OK", "", makePayload(20000)));

        HttpClient client = makeClient();
        RecordingHandler handler;
        handler.acceptHead = false;
        TransportResult result = client.get({server.url("/file.bin"), {}}, handler);

        t.check(result.status == TransportStatus::Aborted, "handler rejection is reported as Aborted");
        t.check(handler.body.empty(), "no body after rejection");
    }

    void test_refused_connection(TestContext &t)
    {
        std::uint16_t closedPort = 0;
        {
            LoopbackServer server;
            closedPort = server.port();
        }

        HttpClient client = makeClient();
        RecordingHandler handler;
        TransportResult result = client.get({fmt::format("http://127.0.0.1:{}/x", closedPort), {}}, handler);
        t.check(result.status == TransportStatus::ConnectionFailed,
                fmt::format("closed port is a connection failure (got {})", transportStatusName(result.status)));
    }
}

int main()
{
    setLogLevel(LogLevel::Error);
    // Loopback requests must not be sent to a proxy from the environment
    ::setenv("no_proxy", "127.0.0.1,localhost", 1);
    ::setenv("NO_PROXY", "127.0.0.1,localhost", 1);

    TestContext t;
    test_options_come_from_config(t);
    test_unusable_urls_are_invalid_requests(t);
    test_streams_body_and_lowercases_headers(t);
    test_redirect_hop_headers_are_dropped(t);
    test_bodiless_response_still_delivers_head(t);
    test_rejected_head_aborts(t);
    test_refused_connection(t);
    return t.finish("http_client_tests");
}
