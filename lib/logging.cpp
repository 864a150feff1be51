/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of logging related utility functions.
 *
 * Copyright (c) 2024 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <ovnpolicy/logging.h>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <algorithm>
#include <fstream>
#include <memory>
#include <mutex>

#include <syslog.h>

namespace ovnpolicy {

LogLevel logLevel = INFO;

/**
 * Log sink to write log messages to a standard output stream, such as
 * standard output or file stream.
 */
class OStreamLogSink : public LogSink {
public:
    /**
     * Constructor that accepts the output stream to write logs to.
     * @param outStream The stream to send messages to.
     */
    explicit OStreamLogSink(std::ostream& outStream) : out(&outStream) {}

    /**
     * Constructor that accepts the name of a file where log messages will be
     * appended.
     * @param fileName The filename to send log messages to.
     */
    explicit OStreamLogSink(const std::string& fileName) :
        fileStream(fileName.c_str(), std::ios_base::out | std::ios_base::app) {
        if (!fileStream.good()) {
            out = &std::cout;
            std::cerr << "Unable to open log file: " << fileName << std::endl;
        } else {
            out = &fileStream;
        }
    }

    virtual
    void write(LogLevel level, const char *filename, int lineno,
               const char *functionName, const std::string& message) {
        const char *levelStr = "debug";
        switch (level) {
        case DEBUG:   levelStr = "debug"; break;
        case INFO:    levelStr = "info"; break;
        case WARNING: levelStr = "warning"; break;
        case ERROR:   levelStr = "error"; break;
        case FATAL:   levelStr = "fatal"; break;
        }
        std::lock_guard<std::mutex> lock(logMtx);
        (*out) << "[" << boost::posix_time::microsec_clock::local_time()
            << "] [" << levelStr << "] [" << filename << ":" << lineno << ":"
            << functionName << "] " << message << std::endl;
    }

private:
    std::fstream fileStream;
    std::ostream *out;
    std::mutex logMtx;
};

/**
 * Log sink to write log messages to syslog.
 */
class SyslogLogSink : public LogSink {
public:
    explicit SyslogLogSink(const std::string& name) : syslog_name(name) {
        openlog(syslog_name.c_str(), LOG_CONS | LOG_PID, LOG_DAEMON);
    }
    ~SyslogLogSink() {
        closelog();
    }

    void write(LogLevel level, const char *filename, int lineno,
               const char *functionName, const std::string& message) {
        int priority = LOG_DEBUG;
        switch (level) {
        case DEBUG:   priority = LOG_DEBUG; break;
        case INFO:    priority = LOG_INFO; break;
        case WARNING: priority = LOG_WARNING; break;
        case ERROR:   priority = LOG_ERR; break;
        case FATAL:   priority = LOG_CRIT; break;
        }
        syslog(priority,
               "[%s:%d:%s] %s",
               filename, lineno, functionName, message.c_str());
    }

private:
    std::string syslog_name;
};

static OStreamLogSink consoleLogSink(std::cout);
static std::unique_ptr<LogSink> ownedLogSink;
static LogSink * currentLogSink = &consoleLogSink;

LogSink * getLogSink() {
    return currentLogSink;
}

void setLogSink(LogSink* sink) {
    currentLogSink = sink ? sink : &consoleLogSink;
}

void initLogging(const std::string& levelstr,
                 bool toSyslog,
                 const std::string& log_file,
                 const std::string& syslog_name) {
    if (toSyslog) {
        ownedLogSink.reset(new SyslogLogSink(syslog_name));
        currentLogSink = ownedLogSink.get();
    } else if (!log_file.empty()) {
        ownedLogSink.reset(new OStreamLogSink(log_file));
        currentLogSink = ownedLogSink.get();
    }

    setLoggingLevel(levelstr);
}

void setLoggingLevel(const std::string& newLevelstr) {
    std::string levelstr = newLevelstr;
    std::transform(levelstr.begin(), levelstr.end(),
                   levelstr.begin(), ::tolower);

    if (levelstr == "debug" || levelstr == "trace") {
        logLevel = DEBUG;
    } else if (levelstr == "warning") {
        logLevel = WARNING;
    } else if (levelstr == "error") {
        logLevel = ERROR;
    } else if (levelstr == "fatal") {
        logLevel = FATAL;
    } else {
        logLevel = INFO;
    }
}

} /* namespace ovnpolicy */
