#ifndef ROUTER_H
#define ROUTER_H

#include <string>
#include <httplib.h>

enum class Route
{
    HASH,
    HEALTH,
    NOT_FOUND
};

class Router
{
public:
    // exact match on the path only; method and query are ignored
    static Route resolve(const std::string &path);

    static void dispatch(const httplib::Request &req, httplib::Response &res);
};

#endif
