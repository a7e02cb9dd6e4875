#include <iostream>
#include "./config/Config.h"
#include "./net/HashServer.h"

int main()
{
    HashServer server;

    if (!server.bind(BIND_HOST, BIND_PORT))
    {
        std::cerr << "[server] failed to bind " << BIND_HOST << ":" << BIND_PORT << std::endl;
        return 1;
    }

    std::cout << "Server running on http://" << BIND_HOST << ":" << BIND_PORT << std::endl;

    if (!server.run())
    {
        std::cerr << "[server] listener stopped unexpectedly" << std::endl;
        return 1;
    }

    return 0;
}
