#ifndef CONNECTION_TASK_QUEUE_H
#define CONNECTION_TASK_QUEUE_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <httplib.h>

// Runs every accepted connection on its own detached thread. There is no pool
// and no upper bound on the number of live connections.
class ConnectionTaskQueue : public httplib::TaskQueue
{
private:
    std::mutex mutex;
    std::condition_variable drained;
    std::size_t active;
    std::atomic<std::size_t> &accepted; // owned by the server, survives the queue

    void finished();

public:
    explicit ConnectionTaskQueue(std::atomic<std::size_t> &acceptedCounter);

    bool enqueue(std::function<void()> fn) override;

    // blocks until every connection thread has returned
    void shutdown() override;

    std::size_t activeConnections();
};

#endif
