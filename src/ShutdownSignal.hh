#pragma once

#include <atomic>
#include <thread>

#include <asio.hpp>

#include "CancellationToken.hh"

/*
Watches SIGINT / SIGTERM on a background io_context and cancels the run's token.
The io_context thread lives as long as this object.
*/
class ShutdownSignal
{
public:
    explicit ShutdownSignal(CancellationToken &token);
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal &) = delete;
    ShutdownSignal &operator=(const ShutdownSignal &) = delete;

    // Signal number that triggered cancellation, 0 if none
    int receivedSignal() const { return received.load(); }

private:
    CancellationToken &token;
    asio::io_context io_context;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard;
    asio::signal_set signals;
    atomic<int> received{0};
    std::thread worker_thread;

    void arm();
};
