#include <iostream>
#include <string>
#include <vector>
#include "./config/Config.h"
#include "./loadgen/LoadGenerator.h"

static void printUsage(const char *prog)
{
    std::cerr << "Usage: " << prog << " [host] [port] [requests] [concurrency]\n"
              << "  defaults: " << LOAD_DEFAULT_HOST << " " << BIND_PORT << " "
              << LOAD_DEFAULT_REQUESTS << " " << LOAD_DEFAULT_CONCURRENCY << std::endl;
}

int main(int argc, char **argv)
{
    LoadOptions options;
    options.host = LOAD_DEFAULT_HOST;
    options.port = BIND_PORT;
    options.requests = LOAD_DEFAULT_REQUESTS;
    options.concurrency = LOAD_DEFAULT_CONCURRENCY;
    options.expectedSource = SOURCE_LABEL;

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;
    if (!LoadGenerator::parseArgs(args, options, error))
    {
        std::cerr << "[loadgen] bad argument: " << error << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    std::cout << "[loadgen] " << options.requests << " requests to http://" << options.host << ":"
              << options.port << "/hash with " << options.concurrency << " connections" << std::endl;

    LoadReport report = LoadGenerator(options).run();
    report.print(std::cout);

    return report.ok() ? 0 : 1;
}
