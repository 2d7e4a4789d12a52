#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>

using namespace std;

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

struct LogMessage
{
    string event, status;
    int latency, attempt;
    LogLevel level;
    thread::id threadId;
    chrono::system_clock::time_point timestamp;
};

/*
Process-wide asynchronous logger.

log() only pushes onto a queue; a background thread turns each message into one JSON line
in the log file. dualSafeLog() writes a timestamped human line to both console and file.
Before start() (and after stop()) messages go to the console only.
*/
class Logger
{
public:
    static Logger &instance();

    void start(const string &filename, bool truncate = true);
    void stop();

    static bool isRunning() { return running.load(); }

    static string timestamps();

    static void log(LogLevel level, const string &event, const string &status, int latency, int attempt);

    static void dualSafeLog(const string &message);

    // Wait until the queue is drained, then push the file buffer to disk
    static void flush();

    static string logLevelToString(LogLevel level);
    static optional<LogLevel> logLevelFromString(const string &name);

    static void setMinLevel(LogLevel level) { minLevel = level; }
    static LogLevel getMinLevel() { return minLevel.load(); }

    // Number of messages accepted at each level since start()
    static int levelCount(LogLevel level);

    // Serialized stdout, shared with code that prints reports
    inline static mutex coutMutex;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    static void workerThread();
    static string toJSONLine(const LogMessage &msg);
    static int threadIndex(thread::id id);

    inline static queue<LogMessage> messageQueue; // intermediate buffer
    inline static mutex queueMutex;
    inline static condition_variable cv;
    inline static condition_variable drainedCv;
    inline static size_t inFlight = 0; // queued or being written, guarded by queueMutex
    inline static atomic<bool> stopFlag = false;
    inline static atomic<bool> isReady = false;
    inline static atomic<bool> running = false;
    inline static atomic<LogLevel> minLevel{LogLevel::Info};

    inline static thread worker;

    // Only one log file per process
    inline static ofstream logFile;
    inline static mutex logMutex;

    inline static unordered_map<LogLevel, int> counts;
    inline static mutex countMutex;

    // thread::id -> small readable index
    inline static unordered_map<thread::id, int> threadIdMap;
    inline static atomic<int> threadCounter{1}; // start from 1 for easier reading than thread #0
    inline static mutex threadMapMutex;
};
