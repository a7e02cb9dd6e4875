#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "config/Config.h"
#include "hashing/HashResponse.h"
#include "net/ConnectionTaskQueue.h"
#include "net/HashServer.h"

#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace
{
    // server on an ephemeral loopback port for the duration of one test
    class ServerFixture
    {
    protected:
        HashServer server;
        int port;
        std::thread listener;

    public:
        ServerFixture()
        {
            port = server.bindToAnyPort("127.0.0.1");
            if (port > 0)
            {
                listener = std::thread([this]()
                                       { server.run(); });
                server.waitUntilReady();
            }
        }

        ~ServerFixture()
        {
            server.stop();
            if (listener.joinable())
                listener.join();
        }

        httplib::Client client() const
        {
            return httplib::Client("127.0.0.1", port);
        }
    };

    uint64_t nowMs()
    {
        return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // writes raw bytes on a fresh connection and returns what comes back up to
    // the end of the response head
    std::string rawExchange(int port, const std::string &bytes)
    {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            return "";

        timeval tv{5, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons((uint16_t)port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        std::string reply;
        if (::connect(fd, (sockaddr *)&addr, sizeof(addr)) == 0 &&
            ::send(fd, bytes.data(), bytes.size(), 0) == (ssize_t)bytes.size())
        {
            char buf[1024];
            while (reply.find("\r\n\r\n") == std::string::npos)
            {
                ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
                if (n <= 0)
                    break;
                reply.append(buf, (std::size_t)n);
            }
        }

        ::close(fd);
        return reply;
    }

    void requireValidHashBody(const std::string &body)
    {
        auto j = nlohmann::json::parse(body);
        REQUIRE(j.is_object());
        REQUIRE(j.size() == 3);
        REQUIRE(j.contains("hash"));
        REQUIRE(j.contains("timestamp"));
        REQUIRE(j.contains("source"));
        REQUIRE(HashResponse::isValidHash(j["hash"].get<std::string>()));
        REQUIRE(j["timestamp"].is_number_unsigned());
        REQUIRE(j["source"] == SOURCE_LABEL);
    }
}

TEST_CASE_METHOD(ServerFixture, "health answers OK", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();

    auto res = cli.Get("/health");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->body == "OK");
    REQUIRE(res->get_header_value("Content-Type") == "text/plain");
}

TEST_CASE_METHOD(ServerFixture, "unknown paths answer 404 Not Found", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();

    for (const char *path : {"/", "/missing", "/hash/", "/healthz", "/HASH"})
    {
        auto res = cli.Get(path);
        REQUIRE(res);
        REQUIRE(res->status == 404);
        REQUIRE(res->body == "Not Found");
    }
}

TEST_CASE_METHOD(ServerFixture, "query string does not affect dispatch", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();

    auto res = cli.Get("/health?probe=1");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->body == "OK");
}

TEST_CASE_METHOD(ServerFixture, "every method is dispatched on the path alone", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();

    auto post = cli.Post("/health", "ignored", "text/plain");
    REQUIRE(post);
    REQUIRE(post->status == 200);
    REQUIRE(post->body == "OK");

    auto put = cli.Put("/hash", "", "text/plain");
    REQUIRE(put);
    REQUIRE(put->status == 200);
    requireValidHashBody(put->body);

    auto del = cli.Delete("/nowhere");
    REQUIRE(del);
    REQUIRE(del->status == 404);
    REQUIRE(del->body == "Not Found");

    auto head = cli.Head("/health");
    REQUIRE(head);
    REQUIRE(head->status == 200);
}

TEST_CASE_METHOD(ServerFixture, "methods without a route of their own are dispatched too", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();

    for (const char *method : {"TRACE", "OPTIONS"})
    {
        httplib::Request req;
        req.method = method;
        req.path = "/health";

        auto res = cli.send(req);
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(res->body == "OK");
    }

    httplib::Request trace;
    trace.method = "TRACE";
    trace.path = "/elsewhere";
    auto missing = cli.send(trace);
    REQUIRE(missing);
    REQUIRE(missing->status == 404);
    REQUIRE(missing->body == "Not Found");
}

TEST_CASE_METHOD(ServerFixture, "percent-encoded paths are matched after decoding", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();
    cli.set_url_encode(false);

    auto res = cli.Get("/h%61sh");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    requireValidHashBody(res->body);
}

TEST_CASE_METHOD(ServerFixture, "malformed request gets 400 and the server keeps serving", "[server]")
{
    REQUIRE(port > 0);

    std::string reply = rawExchange(port, "NOT A REQUEST\r\n\r\n");
    REQUIRE(reply.compare(0, 12, "HTTP/1.1 400") == 0);

    auto cli = client();
    auto res = cli.Get("/health");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->body == "OK");
}

TEST_CASE_METHOD(ServerFixture, "hash returns a well formed JSON body", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();

    uint64_t before = nowMs();
    auto res = cli.Get("/hash");
    uint64_t after = nowMs();

    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->get_header_value("Content-Type") == "application/json");
    requireValidHashBody(res->body);

    uint64_t ts = nlohmann::json::parse(res->body)["timestamp"].get<uint64_t>();
    REQUIRE(ts >= before);
    REQUIRE(ts <= after);
}

TEST_CASE_METHOD(ServerFixture, "sequential hash calls differ and timestamps never go back", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();

    std::set<std::string> seen;
    uint64_t last = 0;
    for (int i = 0; i < 10; i++)
    {
        auto res = cli.Get("/hash");
        REQUIRE(res);
        REQUIRE(res->status == 200);

        auto j = nlohmann::json::parse(res->body);
        uint64_t ts = j["timestamp"].get<uint64_t>();
        REQUIRE(ts >= last);
        last = ts;

        REQUIRE(seen.insert(j["hash"].get<std::string>()).second);
    }
}

TEST_CASE_METHOD(ServerFixture, "keep-alive connection serves several requests", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();
    cli.set_keep_alive(true);

    for (int i = 0; i < 5; i++)
    {
        auto res = cli.Get(i % 2 ? "/health" : "/hash");
        REQUIRE(res);
        REQUIRE(res->status == 200);
    }

    // the body is consumed, not read as the next request
    auto post = cli.Post("/health", "some body bytes", "text/plain");
    REQUIRE(post);
    REQUIRE(post->status == 200);

    auto after = cli.Get("/health");
    REQUIRE(after);
    REQUIRE(after->status == 200);
    REQUIRE(after->body == "OK");

    REQUIRE(server.acceptedConnections() == 1);
}

TEST_CASE_METHOD(ServerFixture, "a keep-alive connection is never retired by request count", "[server]")
{
    REQUIRE(port > 0);
    auto cli = client();
    cli.set_keep_alive(true);

    for (int i = 0; i < 250; i++)
    {
        auto res = cli.Get("/health");
        REQUIRE(res);
        REQUIRE(res->status == 200);
    }

    REQUIRE(server.acceptedConnections() == 1);
}

TEST_CASE_METHOD(ServerFixture, "64 concurrent hash requests all succeed", "[server][concurrency]")
{
    REQUIRE(port > 0);

    const int n = 64;
    std::vector<int> statuses(n, 0);
    std::vector<std::string> bodies(n);
    std::vector<std::thread> clients;

    // each thread only writes its own slot
    for (int i = 0; i < n; i++)
    {
        clients.emplace_back([this, i, &statuses, &bodies]()
                             {
            auto cli = client();
            auto res = cli.Get("/hash");
            if (res) {
                statuses[i] = res->status;
                bodies[i] = res->body;
            } });
    }
    for (auto &t : clients)
        t.join();

    for (int i = 0; i < n; i++)
    {
        REQUIRE(statuses[i] == 200);
        requireValidHashBody(bodies[i]);
    }
}

TEST_CASE("task queue runs every task and drains on shutdown", "[task_queue]")
{
    std::atomic<std::size_t> accepted(0);
    ConnectionTaskQueue queue(accepted);
    std::atomic<int> ran(0);

    for (int i = 0; i < 100; i++)
    {
        REQUIRE(queue.enqueue([&ran]()
                              {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ran++; }));
    }

    queue.shutdown();
    REQUIRE(ran.load() == 100);
    REQUIRE(queue.activeConnections() == 0);
    REQUIRE(accepted.load() == 100);
}
