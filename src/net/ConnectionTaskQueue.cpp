#include "ConnectionTaskQueue.h"
#include <iostream>
#include <system_error>
#include <thread>

ConnectionTaskQueue::ConnectionTaskQueue(std::atomic<std::size_t> &acceptedCounter)
    : active(0), accepted(acceptedCounter) {}

bool ConnectionTaskQueue::enqueue(std::function<void()> fn)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        active++;
    }
    accepted++;

    try
    {
        std::thread([this, fn]()
                    {
            fn();
            finished(); })
            .detach();
    }
    catch (const std::system_error &e)
    {
        // returning false makes the server close the socket
        std::cerr << "[server] could not start connection thread: " << e.what() << std::endl;
        finished();
        return false;
    }

    return true;
}

void ConnectionTaskQueue::finished()
{
    // notify while holding the lock so shutdown() cannot return (and the queue
    // be destroyed) before this thread is done touching it
    std::lock_guard<std::mutex> lock(mutex);
    active--;
    drained.notify_all();
}

void ConnectionTaskQueue::shutdown()
{
    std::unique_lock<std::mutex> lock(mutex);
    drained.wait(lock, [this]
                 { return active == 0; });
}

std::size_t ConnectionTaskQueue::activeConnections()
{
    std::lock_guard<std::mutex> lock(mutex);
    return active;
}
