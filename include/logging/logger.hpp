#pragma once

#include <string>

#include "model/types.hpp"

class ResourcePool;
class CategoryQueues;

/**
 * @brief Dedicated logger writing text lines to a file descriptor.
 */
class Logger {
public:
    /** @brief Default constructor leaves fd closed. */
    Logger();

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Open or create the log file (append mode).
     * @param path file path.
     * @return true on success, false on failure.
     */
    bool openFile(const std::string& path);

    bool isOpen() const { return fd != -1; }

    /**
     * @brief Write one log line; a newline is appended.
     * @param line text to write.
     * @return false if the fd is closed or write failed.
     */
    bool logLine(const std::string& line);

    /**
     * @brief Close the file descriptor if open.
     */
    void closeFile();

private:
    int fd;
};

/**
 * @brief Department load appended to every log line.
 *
 * Null pointers are printed as 0/0.
 */
struct LogMetricsContext {
    const ResourcePool* nursePool;
    const ResourcePool* doctorPool;
    const ResourcePool* cubiclePool;
    const ResourcePool* bedPool;
    const CategoryQueues* queues;
};

/**
 * @brief Install the logger that logEvent writes to (nullptr detaches).
 *
 * The logger must outlive every logEvent call made while it is installed.
 */
void setLogSink(Logger* logger);

/**
 * @brief Set the context used by logEvent to append pool and queue load.
 */
void setLogMetricsContext(const LogMetricsContext& context);

/** @brief Drop the metrics context; lines are written without load. */
void clearLogMetricsContext();

/**
 * @brief Format "simTime;load;role;text" and write it to the installed sink.
 * @param role sender role.
 * @param simTime simulated time minutes.
 * @param text text payload.
 * @return true if written, false when no sink is installed or the write failed.
 */
bool logEvent(Role role, double simTime, const std::string& text);

/** @brief Render the current load context ("nurse=1/2;doc=..."). */
std::string formatLoadContext();
