#include "thread_pool.hh"
#include "Logger.hh"

ThreadPool::ThreadPool(size_t numThreads)
{
    if (numThreads == 0)
        numThreads = 1;

    for (size_t i = 0; i < numThreads; ++i)
        workers.emplace_back([this]()
                             { workerLoop(); });
}

void ThreadPool::workerLoop()
{
    while (true)
    {
        function<void()> job;

        {
            unique_lock lock(queue_mutex);
            cv.wait(lock, [this]()
                    { return stop || !jobs.empty(); });

            // Stopped and nothing left -> exit thread
            if (stop && jobs.empty())
                return;

            job = std::move(jobs.front());
            jobs.pop();
        }

        try
        {
            job();
        }
        catch (const exception &e)
        {
            // Jobs handle their own failures; this only keeps the worker alive
            Logger::log(LogLevel::Error, "ThreadPool", string("job threw: ") + e.what(), 0, 0);
        }

        {
            lock_guard lock(queue_mutex);
            --pending;
            if (pending == 0)
                allDoneCV.notify_all();
        }
    }
}

void ThreadPool::enqueue(function<void()> job)
{
    {
        lock_guard lock(queue_mutex);
        jobs.emplace(std::move(job));
        ++pending;
    }

    cv.notify_one(); // wake up an idle worker
}

void ThreadPool::waitAll()
{
    unique_lock lock(queue_mutex);
    allDoneCV.wait(lock, [this]()
                   { return pending == 0; });
}

ThreadPool::~ThreadPool()
{
    {
        lock_guard lock(queue_mutex);
        stop = true;
    }

    cv.notify_all();

    for (thread &worker : workers)
    {
        if (worker.joinable())
            worker.join();
    }
}
