#ifndef LOAD_GENERATOR_H
#define LOAD_GENERATOR_H

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

struct LoadOptions
{
    std::string host;
    int port;
    std::size_t requests;
    std::size_t concurrency;
    std::string expectedSource;
};

struct LoadReport
{
    std::size_t requests = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;          // answered, but a check failed
    std::size_t transportErrors = 0; // no response at all
    double elapsedMs = 0;

    // latency of answered requests, ms
    double minMs = 0;
    double avgMs = 0;
    double p50Ms = 0;
    double p99Ms = 0;
    double maxMs = 0;

    double requestsPerSecond() const;
    bool ok() const;
    void print(std::ostream &out) const;
};

class LoadGenerator
{
private:
    LoadOptions options;

public:
    explicit LoadGenerator(const LoadOptions &opts);

    // blocks until the whole request budget is spent
    LoadReport run();

    // [host] [port] [requests] [concurrency]; on failure options is left untouched
    static bool parseArgs(const std::vector<std::string> &args, LoadOptions &options, std::string &error);

    // status is 200, body is a HashResponse with a valid hash and the expected source
    static bool checkResponse(int status, const std::string &body, const std::string &expectedSource);

    // nearest-rank percentile over sorted samples, p in (0, 1]
    static double percentile(const std::vector<double> &sorted, double p);
};

#endif
