// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 1998 Bernie Bright - bbright@c031.aone.net.au

/**
 * @file
 * @brief Stream based logging mechanism.
 */

#pragma once

#include <memory>
#include <sstream>
#include <string>

#include <metgear/debug/debug_types.h>

namespace metgear
{
class LogCallback;
}

/**
 * Class to manage the debug logging stream.
 *
 * Messages are filtered globally by class and priority, then handed to
 * every registered callback, which may apply its own filter. Logging is
 * safe from any thread.
 */
class logstream
{
public:
    ~logstream();

    /**
     * Set the global log class and priority level.
     * @param c debug class
     * @param p priority
     */
    void setLogLevels(mgDebugClass c, mgDebugPriority p);

    bool would_log(mgDebugClass c, mgDebugPriority p) const;

    mgDebugClass get_log_classes() const;

    mgDebugPriority get_log_priority() const;

    /**
     * the default (stderr) callback is installed on construction; disable it
     * for tools that want to keep stderr clean, or for tests.
     */
    void setStderrLogging(bool enabled);

    /**
     * Register a callback. The logstream does not take ownership; the
     * callback must be removed before it is destroyed.
     */
    void addCallback(metgear::LogCallback* cb);

    void removeCallback(metgear::LogCallback* cb);

    void log(mgDebugClass c, mgDebugPriority p,
             const char* fileName, int line, const char* function,
             const std::string& msg);

    /**
     * \relates logstream
     * Return the one and only logstream instance.
     */
    friend logstream& mglog();

private:
    logstream();

    class LogStreamPrivate;
    std::unique_ptr<LogStreamPrivate> d;
};

logstream& mglog();


/**
 * Log a message.
 * @param C debug class
 * @param P priority
 * @param M message
 */
#define MG_LOGX(C,P,M) \
    do { if(mglog().would_log(C,P)) {                         \
        std::ostringstream os; os << M;                       \
        mglog().log(C, P, __FILE__, __LINE__, __func__, os.str()); \
    } } while(0)

#define MG_LOG(C,P,M) MG_LOGX(C,P,M)
