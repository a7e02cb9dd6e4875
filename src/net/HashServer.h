#ifndef HASH_SERVER_H
#define HASH_SERVER_H

#include <atomic>
#include <cstddef>
#include <string>
#include <httplib.h>

class HashServer
{
private:
    httplib::Server server;
    std::atomic<std::size_t> accepted;

    void logError(const httplib::Request &req, const httplib::Response &res);

public:
    HashServer();

    bool bind(const std::string &host, int port);

    // binds an ephemeral port, returns it or -1
    int bindToAnyPort(const std::string &host);

    // accept loop; returns when stop() is called or the socket fails
    bool run();

    void stop();
    bool isRunning() const;
    void waitUntilReady() const;

    // TCP connections handed to a connection thread so far
    std::size_t acceptedConnections() const;
};

#endif
