#include "HashServer.h"
#include "ConnectionTaskQueue.h"
#include "../config/Config.h"
#include "../router/Router.h"
#include <exception>
#include <iostream>
#include <limits>

// a body left unread would be parsed as the next request on a keep-alive connection
static bool carriesBody(const httplib::Request &req)
{
    if (req.has_header("Transfer-Encoding"))
        return true;
    return req.has_header("Content-Length") && req.get_header_value("Content-Length") != "0";
}

HashServer::HashServer() : accepted(0)
{
    server.new_task_queue = [this]
    { return new ConnectionTaskQueue(accepted); };

    // a connection lives until the client closes it or the server stops
    server.set_keep_alive_max_count(std::numeric_limits<size_t>::max());
    server.set_keep_alive_timeout(CONNECTION_TIMEOUT_SEC);
    server.set_read_timeout(CONNECTION_TIMEOUT_SEC, 0);
    server.set_write_timeout(CONNECTION_TIMEOUT_SEC, 0);

    // every method is routed the same way, on the path alone
    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        if (carriesBody(req))
            return httplib::Server::HandlerResponse::Unhandled;

        Router::dispatch(req, res);
        return httplib::Server::HandlerResponse::Handled; });

    // requests with a body land here once httplib has read (and we ignore) it
    auto dispatch = [](const httplib::Request &req, httplib::Response &res)
    { Router::dispatch(req, res); };

    server.Get(R"(.*)", dispatch);
    server.Post(R"(.*)", dispatch);
    server.Put(R"(.*)", dispatch);
    server.Patch(R"(.*)", dispatch);
    server.Delete(R"(.*)", dispatch);

    server.set_error_handler([this](const httplib::Request &req, httplib::Response &res)
                             {
        // 404 is an ordinary answer from the router
        if (res.status != 404)
            logError(req, res);

        return httplib::Server::HandlerResponse::Unhandled; });

    server.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                 {
        std::string what;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            what = e.what();
        } catch (...) {
            what = "unknown exception";
        }

        std::cerr << "[server] handler failed for " << req.method << " " << req.path << ": " << what << std::endl;

        res.status = 500;
        res.set_content("Internal Server Error", "text/plain"); });
}

void HashServer::logError(const httplib::Request &req, const httplib::Response &res)
{
    std::cerr << "[server] error serving connection: " << res.status;
    if (!req.method.empty())
        std::cerr << " " << req.method << " " << req.path;
    std::cerr << std::endl;
}

bool HashServer::bind(const std::string &host, int port)
{
    return server.bind_to_port(host, port);
}

int HashServer::bindToAnyPort(const std::string &host)
{
    return server.bind_to_any_port(host);
}

bool HashServer::run()
{
    return server.listen_after_bind();
}

void HashServer::stop()
{
    server.stop();
}

bool HashServer::isRunning() const
{
    return server.is_running();
}

void HashServer::waitUntilReady() const
{
    server.wait_until_ready();
}

std::size_t HashServer::acceptedConnections() const
{
    return accepted.load();
}
