// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 1998 Bernie Bright - bbright@c031.aone.net.au

/**
 * @file
 * @brief Stream based logging mechanism.
 */

#include <metgear_config.h>

#include "logstream.hxx"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

#include <metgear/debug/LogCallback.hxx>
#include <metgear/debug/LogEntry.hxx>

using metgear::LogCallback;
using metgear::LogEntry;
using metgear::StderrLogCallback;

class logstream::LogStreamPrivate
{
public:
    LogStreamPrivate() :
        m_logClass(MG_ALL),
        m_logPriority(MG_WARN),
        m_stderrCallback(new StderrLogCallback(MG_ALL, MG_BULK))
    {
    }

    std::atomic<unsigned int> m_logClass;
    std::atomic<int> m_logPriority;

    std::mutex m_lock;
    std::vector<LogCallback*> m_callbacks;
    std::unique_ptr<StderrLogCallback> m_stderrCallback;
    bool m_stderrEnabled = true;
};

logstream::logstream() :
    d(new LogStreamPrivate)
{
}

logstream::~logstream() = default;

void logstream::setLogLevels(mgDebugClass c, mgDebugPriority p)
{
    d->m_logClass = c;
    d->m_logPriority = p;
}

bool logstream::would_log(mgDebugClass c, mgDebugPriority p) const
{
    if (p == MG_MANDATORY_INFO)
        return true;
    return (c & d->m_logClass) != 0 && p >= d->m_logPriority;
}

mgDebugClass logstream::get_log_classes() const
{
    return static_cast<mgDebugClass>(d->m_logClass.load());
}

mgDebugPriority logstream::get_log_priority() const
{
    return static_cast<mgDebugPriority>(d->m_logPriority.load());
}

void logstream::setStderrLogging(bool enabled)
{
    std::lock_guard<std::mutex> g(d->m_lock);
    d->m_stderrEnabled = enabled;
}

void logstream::addCallback(LogCallback* cb)
{
    std::lock_guard<std::mutex> g(d->m_lock);
    if (std::find(d->m_callbacks.begin(), d->m_callbacks.end(), cb) == d->m_callbacks.end())
        d->m_callbacks.push_back(cb);
}

void logstream::removeCallback(LogCallback* cb)
{
    std::lock_guard<std::mutex> g(d->m_lock);
    d->m_callbacks.erase(std::remove(d->m_callbacks.begin(), d->m_callbacks.end(), cb),
                         d->m_callbacks.end());
}

void logstream::log(mgDebugClass c, mgDebugPriority p,
                    const char* fileName, int line, const char* function,
                    const std::string& msg)
{
    const LogEntry entry(c, p, fileName, line, function, msg);

    std::lock_guard<std::mutex> g(d->m_lock);
    if (d->m_stderrEnabled)
        d->m_stderrCallback->processEntry(entry);
    for (auto cb : d->m_callbacks)
        cb->processEntry(entry);
}

logstream& mglog()
{
    // Meyers singleton; construction is thread-safe since C++11
    static logstream global_logstream;
    return global_logstream;
}
