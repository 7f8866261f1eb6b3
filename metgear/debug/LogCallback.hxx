// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2020 James Turner

/**
 * @file
 * @brief Base class for log callbacks
 */

#pragma once

#include <string>

#include "LogEntry.hxx"
#include "debug_types.h"

namespace metgear {

class LogCallback
{
public:
    virtual ~LogCallback() = default;

    // return true if you handled the message, otherwise the
    // formatted-line API below will be called
    virtual bool doProcessEntry(const LogEntry& e);

    // receives the entry already formatted as a single line
    virtual void operator()(mgDebugClass c, mgDebugPriority p,
                            const char* file, int line, const std::string& aMessage);

    void setLogLevels(mgDebugClass c, mgDebugPriority p);

    void processEntry(const LogEntry& e);

    static const char* debugClassToString(mgDebugClass c);
    static const char* debugPriorityToString(mgDebugPriority p);

    /**
     * Parse a priority name ("bulk", "debug", "info", "warn", "alert",
     * "popup"), as used by the --log-level option.
     *
     * @throw mg_range_exception for unknown names
     */
    static mgDebugPriority parsePriority(const std::string& s);

protected:
    LogCallback(mgDebugClass c, mgDebugPriority p);

    bool shouldLog(mgDebugClass c, mgDebugPriority p) const;
private:
    mgDebugClass m_class;
    mgDebugPriority m_priority;
};

/**
 * Writes every accepted entry as one line to std::cerr.
 */
class StderrLogCallback : public LogCallback
{
public:
    StderrLogCallback(mgDebugClass c, mgDebugPriority p);

    bool doProcessEntry(const LogEntry& e) override;
};

} // namespace metgear
