#ifndef HANDLERS_H
#define HANDLERS_H

#include <httplib.h>

class Handlers
{
public:
    // 200 application/json {"hash","timestamp","source"}
    static void hash(httplib::Response &res);

    // 200 "OK"
    static void health(httplib::Response &res);

    // 404 "Not Found"
    static void notFound(httplib::Response &res);
};

#endif
