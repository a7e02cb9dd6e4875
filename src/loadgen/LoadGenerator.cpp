#include "LoadGenerator.h"
#include "../config/Config.h"
#include "../hashing/HashResponse.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <httplib.h>

namespace
{
    // per-worker tallies, merged after join
    struct WorkerStats
    {
        std::size_t passed = 0;
        std::size_t failed = 0;
        std::size_t transportErrors = 0;
        std::vector<double> latencies;
    };

    // digits only, so "-1" cannot wrap around to a huge count
    bool parseCount(const std::string &text, unsigned long long &out)
    {
        if (text.empty())
            return false;
        for (char c : text)
            if (c < '0' || c > '9')
                return false;

        try
        {
            out = std::stoull(text);
        }
        catch (const std::out_of_range &)
        {
            return false;
        }
        return true;
    }

    double elapsedMsSince(std::chrono::steady_clock::time_point start)
    {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    }
}

double LoadReport::requestsPerSecond() const
{
    if (elapsedMs <= 0)
        return 0;
    return (double)requests / (elapsedMs / 1000.0);
}

bool LoadReport::ok() const
{
    return failed == 0 && transportErrors == 0 && passed == requests;
}

void LoadReport::print(std::ostream &out) const
{
    out << std::fixed << std::setprecision(2);
    out << "requests:         " << requests << "\n";
    out << "passed:           " << passed << "\n";
    out << "failed checks:    " << failed << "\n";
    out << "transport errors: " << transportErrors << "\n";
    out << "elapsed:          " << elapsedMs << " ms\n";
    out << "throughput:       " << requestsPerSecond() << " req/s\n";
    out << "latency ms:       min " << minMs << "  avg " << avgMs << "  p50 " << p50Ms
        << "  p99 " << p99Ms << "  max " << maxMs << "\n";
}

LoadGenerator::LoadGenerator(const LoadOptions &opts) : options(opts) {}

bool LoadGenerator::checkResponse(int status, const std::string &body, const std::string &expectedSource)
{
    if (status != 200)
        return false;

    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || j.size() != 3)
        return false;

    try
    {
        HashResponse response = HashResponse::fromJSON(j);
        return HashResponse::isValidHash(response.hash) && response.source == expectedSource;
    }
    catch (const nlohmann::json::exception &)
    {
        return false;
    }
}

double LoadGenerator::percentile(const std::vector<double> &sorted, double p)
{
    if (sorted.empty())
        return 0;

    std::size_t rank = (std::size_t)std::ceil(p * sorted.size());
    if (rank == 0)
        rank = 1;
    return sorted[std::min(rank, sorted.size()) - 1];
}

bool LoadGenerator::parseArgs(const std::vector<std::string> &args, LoadOptions &options, std::string &error)
{
    if (args.size() > 4)
    {
        error = "too many arguments";
        return false;
    }

    // applied to options only if every field parses
    LoadOptions parsed = options;

    if (args.size() > 0)
        parsed.host = args[0];

    unsigned long long value = 0;
    if (args.size() > 1)
    {
        if (!parseCount(args[1], value) || value == 0 || value > 65535)
        {
            error = "port must be 1-65535: " + args[1];
            return false;
        }
        parsed.port = (int)value;
    }

    if (args.size() > 2)
    {
        if (!parseCount(args[2], value))
        {
            error = "requests must be a non-negative integer: " + args[2];
            return false;
        }
        parsed.requests = (std::size_t)value;
    }

    if (args.size() > 3)
    {
        if (!parseCount(args[3], value) || value == 0 || value > LOAD_MAX_CONCURRENCY)
        {
            error = "concurrency must be 1-" + std::to_string(LOAD_MAX_CONCURRENCY) + ": " + args[3];
            return false;
        }
        parsed.concurrency = (std::size_t)value;
    }

    options = parsed;
    return true;
}

LoadReport LoadGenerator::run()
{
    std::atomic<std::size_t> next(0);
    std::vector<WorkerStats> stats(options.concurrency);
    std::vector<std::thread> workers;

    auto start = std::chrono::steady_clock::now();

    for (std::size_t w = 0; w < options.concurrency; w++)
    {
        try
        {
            workers.emplace_back([this, &next, &stats, w]()
                                 {
                WorkerStats &mine = stats[w];
                httplib::Client cli(options.host, options.port);
                cli.set_keep_alive(true);

                while (next.fetch_add(1) < options.requests) {
                    auto sent = std::chrono::steady_clock::now();
                    auto res = cli.Get("/hash");

                    if (!res) {
                        mine.transportErrors++;
                        std::cerr << "[loadgen] request failed: " << httplib::to_string(res.error()) << std::endl;
                        continue;
                    }

                    mine.latencies.push_back(elapsedMsSince(sent));

                    if (checkResponse(res->status, res->body, options.expectedSource))
                        mine.passed++;
                    else
                        mine.failed++;
                } });
        }
        catch (const std::system_error &e)
        {
            // the workers already running share the whole budget
            std::cerr << "[loadgen] started " << workers.size() << " of " << options.concurrency
                      << " workers: " << e.what() << std::endl;
            break;
        }
    }

    for (auto &t : workers)
        t.join();

    LoadReport report;
    report.requests = options.requests;
    report.elapsedMs = elapsedMsSince(start);

    std::vector<double> latencies;
    for (auto &s : stats)
    {
        report.passed += s.passed;
        report.failed += s.failed;
        report.transportErrors += s.transportErrors;
        latencies.insert(latencies.end(), s.latencies.begin(), s.latencies.end());
    }

    // no worker ever ran, nothing was sent
    if (workers.empty())
        report.transportErrors = options.requests;

    if (!latencies.empty())
    {
        std::sort(latencies.begin(), latencies.end());

        double total = 0;
        for (double l : latencies)
            total += l;

        report.minMs = latencies.front();
        report.maxMs = latencies.back();
        report.avgMs = total / latencies.size();
        report.p50Ms = percentile(latencies, 0.50);
        report.p99Ms = percentile(latencies, 0.99);
    }

    return report;
}
