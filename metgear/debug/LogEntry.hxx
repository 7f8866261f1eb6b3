// SPDX-License-Identifier: LGPL-2.1-or-later

#pragma once

#include <string>

#include "debug_types.h"

namespace metgear {
/**
 * storage of a single log entry. The logstream builds one of these per
 * message and hands it to every registered callback, so callbacks may keep
 * a copy beyond the lifetime of the MG_LOG statement.
 */
class LogEntry final
{
public:
    LogEntry(mgDebugClass c, mgDebugPriority p,
             const char* file, int line, const char* function,
             const std::string& msg)
    :
    debugClass(c),
    debugPriority(p),
    file(file ? file : ""),
    line(line),
    function(function ? function : ""),
    message(msg)
    {
    }

    LogEntry(const LogEntry& c) = default;
    LogEntry& operator=(const LogEntry& c) = delete;

    ~LogEntry() = default;    // non-virtual is intentional

    /// file name with the directory part removed
    std::string shortFile() const;

    const mgDebugClass debugClass;
    const mgDebugPriority debugPriority;
    const std::string file;
    const int line;
    const std::string function;
    const std::string message;
};

} // namespace metgear
