#include "Logger.hh"

#include <cctype>
#include <iomanip> // put_time
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static string formatTime(chrono::system_clock::time_point tp)
{
    time_t t = chrono::system_clock::to_time_t(tp);
    tm tm;

#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    ostringstream oss;
    oss << put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::start(const string &filename, bool truncate)
{
    if (running)
        stop();

    // Must open the file before the worker can write to it
    {
        lock_guard<mutex> lock(logMutex);
        ios_base::openmode mode = truncate ? (ios::out | ios::trunc) : (ios::out | ios::app);

        logFile.open(filename, mode);

        if (!logFile.is_open())
            throw runtime_error("Cannot open log file: " + filename);
    }

    {
        lock_guard<mutex> lock(countMutex);
        counts.clear();
    }

    stopFlag = false;
    isReady = false;
    running = true;
    worker = thread(&Logger::workerThread);

    // Wait for the worker so nothing logged right after start() is lost
    {
        unique_lock<mutex> lock(queueMutex);
        cv.wait(lock, []
                { return isReady.load(); });
    }

    dualSafeLog("=== Run started at " + formatTime(chrono::system_clock::now()));
}

void Logger::stop()
{
    {
        lock_guard<mutex> lock(queueMutex);
        stopFlag = true;
    }

    cv.notify_all();

    if (worker.joinable())
        worker.join();

    running = false;

    lock_guard<mutex> lock(logMutex);
    if (logFile.is_open())
        logFile.close();
}

Logger::~Logger()
{
    stop();
}

string Logger::timestamps()
{
    return "[" + formatTime(chrono::system_clock::now()) + "]";
}

void Logger::log(LogLevel level, const string &event, const string &status, int latency, int attempt)
{
    if (level < minLevel.load())
        return;

    {
        lock_guard<mutex> lock(countMutex);
        counts[level]++;
    }

    LogMessage msg{event,
                   status,
                   latency,
                   attempt,
                   level,
                   this_thread::get_id(),
                   chrono::system_clock::now()};

    if (!running)
    {
        lock_guard<mutex> lock(coutMutex);
        cout << "[" << formatTime(msg.timestamp) << "]  "
             << "[" << logLevelToString(level) << "]  "
             << "[" << event << "]  "
             << "[" << status << "]  "
             << "latency = " << latency << "ms  "
             << "attempt = " << attempt << "\n";
        return;
    }

    {
        lock_guard<mutex> lock(queueMutex);
        messageQueue.push(std::move(msg));
        ++inFlight;
    }

    cv.notify_one();
}

void Logger::dualSafeLog(const string &message)
{
    string full = timestamps() + "  ===  " + message;

    {
        lock_guard<mutex> lock(coutMutex);
        cout << full << endl;
    }

    lock_guard<mutex> fileLock(logMutex);

    if (!running || !logFile.is_open())
        return;

    logFile << full << endl;
}

void Logger::flush()
{
    if (running)
    {
        unique_lock<mutex> lock(queueMutex);
        drainedCv.wait(lock, []
                       { return inFlight == 0 || !running.load(); });
    }

    lock_guard<mutex> lock(logMutex);
    if (logFile.is_open())
        logFile.flush();
}

void Logger::workerThread()
{
    {
        lock_guard<mutex> lock(queueMutex);
        isReady = true;
    }
    cv.notify_all();

    while (true)
    {
        unique_lock<mutex> lock(queueMutex);

        cv.wait(lock, []
                { return !messageQueue.empty() || stopFlag.load(); });

        // Drain everything before honoring stop
        if (stopFlag.load() && messageQueue.empty())
            break;

        LogMessage msg = std::move(messageQueue.front());
        messageQueue.pop();
        lock.unlock(); // let producers push while we format

        string line = toJSONLine(msg);

        {
            lock_guard<mutex> fileLock(logMutex);

            if (logFile.is_open())
                logFile << line << "\n";
        }

        lock.lock();
        --inFlight;
        if (inFlight == 0)
            drainedCv.notify_all();
    }

    lock_guard<mutex> fileLock(logMutex);
    if (logFile.is_open())
        logFile.flush();
}

string Logger::toJSONLine(const LogMessage &msg)
{
    json j;
    j["timestamp"] = formatTime(msg.timestamp);
    j["thread_id"] = "thread#" + to_string(threadIndex(msg.threadId));
    j["level"] = logLevelToString(msg.level);
    j["event"] = msg.event;
    j["status"] = msg.status;
    j["latency_ms"] = msg.latency;
    j["attempt"] = msg.attempt;

    // Replace invalid UTF-8 rather than throwing from the worker
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

int Logger::threadIndex(thread::id id)
{
    lock_guard<mutex> lock(threadMapMutex);
    auto it = threadIdMap.find(id);

    if (it != threadIdMap.end())
        return it->second;

    int index = threadCounter++;
    threadIdMap[id] = index;
    return index;
}

string Logger::logLevelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";

    case LogLevel::Info:
        return "INFO";

    case LogLevel::Warn:
        return "WARN";

    case LogLevel::Error:
        return "ERROR";
    }

    return "UNKNOWN";
}

optional<LogLevel> Logger::logLevelFromString(const string &name)
{
    string upper;
    for (char c : name)
        upper += static_cast<char>(toupper(static_cast<unsigned char>(c)));

    if (upper == "DEBUG")
        return LogLevel::Debug;

    if (upper == "INFO")
        return LogLevel::Info;

    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warn;

    if (upper == "ERROR")
        return LogLevel::Error;

    return nullopt;
}

int Logger::levelCount(LogLevel level)
{
    lock_guard<mutex> lock(countMutex);
    auto it = counts.find(level);
    return it == counts.end() ? 0 : it->second;
}
