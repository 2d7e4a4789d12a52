#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

using namespace std;

/*
Fixed-size pool; each worker runs one job at a time to completion.
The orchestrator queues one job per account, so the pool size is the account concurrency bound.
*/
class ThreadPool
{
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    void enqueue(function<void()> job);

    // Block until every queued job has finished
    void waitAll();

    size_t size() const { return workers.size(); }

private:
    // List of worker threads
    vector<thread> workers;
    // Queued jobs
    queue<function<void()>> jobs;
    mutex queue_mutex;
    condition_variable cv;

    // queued + running
    size_t pending = 0;
    condition_variable allDoneCV;

    // Stop flag
    bool stop = false;

    void workerLoop();
};
