#include "Handlers.h"
#include "../hashing/HashResponse.h"

void Handlers::hash(httplib::Response &res)
{
    HashResponse response = HashResponse::compute();

    res.status = 200;
    res.set_content(response.toJSON().dump(), "application/json");
}

void Handlers::health(httplib::Response &res)
{
    res.status = 200;
    res.set_content("OK", "text/plain");
}

void Handlers::notFound(httplib::Response &res)
{
    res.status = 404;
    res.set_content("Not Found", "text/plain");
}
