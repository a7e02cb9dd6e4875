#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>

// listener
static constexpr const char *BIND_HOST = "0.0.0.0";
static constexpr int BIND_PORT = 8080;

// read, write and keep-alive idle timeouts. 24 days is the most httplib can wait
// on a socket, its poll timeout is an int of milliseconds
static constexpr long CONNECTION_TIMEOUT_SEC = 24L * 24 * 60 * 60;

// hashbench_load never opens more connections than this
static constexpr std::size_t LOAD_MAX_CONCURRENCY = 10000;

// label reported in every /hash response
static constexpr const char *SOURCE_LABEL = "cpp";

// total digest computations per /hash request (first digest + re-hashes)
static constexpr int HASH_ITERATIONS = 100;

// seed prefix, the request time in nanoseconds is appended
static constexpr const char *HASH_SEED_PREFIX = "input-";

// hashbench_load defaults
static constexpr const char *LOAD_DEFAULT_HOST = "127.0.0.1";
static constexpr std::size_t LOAD_DEFAULT_REQUESTS = 1000;
static constexpr std::size_t LOAD_DEFAULT_CONCURRENCY = 50;

#endif
