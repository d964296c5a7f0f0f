#include "logging/logger.hpp"

#include "roles/category_queues.hpp"
#include "sim/resource_pool.hpp"
#include "util/error.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cstdio>

Logger::Logger() : fd(-1) {}

Logger::~Logger() {
    closeFile();
}

bool Logger::openFile(const std::string& path) {
    if (fd != -1) {
        closeFile();
    }
    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) {
        logErrno("open log file failed: " + path);
        return false;
    }
    return true;
}

bool Logger::logLine(const std::string& line) {
    if (fd == -1) {
        return false;
    }
    std::string withNewline = line;
    withNewline.push_back('\n');
    ssize_t written = ::write(fd, withNewline.data(), withNewline.size());
    if (written == -1) {
        logErrno("write failed");
        return false;
    }
    return true;
}

void Logger::closeFile() {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

namespace {
Logger* g_logSink = nullptr;
LogMetricsContext g_logMetricsContext{};
bool g_metricsContextSet = false;

std::string poolLoad(const char* label, const ResourcePool* pool) {
    std::string out = label;
    out += "=";
    if (pool) {
        out += std::to_string(pool->held()) + "/" + std::to_string(pool->capacity());
    } else {
        out += "0/0";
    }
    return out;
}

std::string formatTime(double simTime) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", simTime);
    return buf;
}
} // namespace

void setLogSink(Logger* logger) {
    g_logSink = logger;
}

void setLogMetricsContext(const LogMetricsContext& context) {
    g_logMetricsContext = context;
    g_metricsContextSet = true;
}

void clearLogMetricsContext() {
    g_logMetricsContext = LogMetricsContext{};
    g_metricsContextSet = false;
}

std::string formatLoadContext() {
    if (!g_metricsContextSet) {
        return "-";
    }
    std::string out = poolLoad("nurse", g_logMetricsContext.nursePool) + ";"
                    + poolLoad("doc", g_logMetricsContext.doctorPool) + ";"
                    + poolLoad("cub", g_logMetricsContext.cubiclePool) + ";"
                    + poolLoad("bed", g_logMetricsContext.bedPool) + ";q=";
    for (int i = 0; i < kCategoryCount; ++i) {
        if (i > 0) out += "/";
        int len = g_logMetricsContext.queues
                      ? g_logMetricsContext.queues->size(categoryFromIndex(i))
                      : 0;
        out += std::to_string(len);
    }
    return out;
}

bool logEvent(Role role, double simTime, const std::string& text) {
    if (!g_logSink || !g_logSink->isOpen()) {
        return false;
    }
    // Semicolon-separated line for easy parsing/CSV import:
    // simTime;nurse;doc;cub;bed;q;who;text
    std::string line = formatTime(simTime) + ";"
                     + formatLoadContext() + ";"
                     + roleLabel(role) + ";"
                     + text;
    return g_logSink->logLine(line);
}
