#include "Router.h"
#include "../handlers/Handlers.h"

Route Router::resolve(const std::string &path)
{
    if (path == "/hash")
        return Route::HASH;
    if (path == "/health")
        return Route::HEALTH;
    return Route::NOT_FOUND;
}

void Router::dispatch(const httplib::Request &req, httplib::Response &res)
{
    switch (resolve(req.path))
    {
    case Route::HASH:
        Handlers::hash(res);
        break;
    case Route::HEALTH:
        Handlers::health(res);
        break;
    case Route::NOT_FOUND:
        Handlers::notFound(res);
        break;
    }
}
