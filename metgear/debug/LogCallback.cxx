// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2020 James Turner

/**
 * @file
 * @brief Base class for log callbacks
 */

#include <metgear_config.h>

#include "LogCallback.hxx"

#include <iostream>

#include <boost/algorithm/string/case_conv.hpp>

#include <metgear/structure/exception.hxx>

using namespace metgear;

LogCallback::LogCallback(mgDebugClass c, mgDebugPriority p) : m_class(c),
                                                              m_priority(p)
{
}

void LogCallback::operator()(mgDebugClass c, mgDebugPriority p,
                             const char* file, int line, const std::string& aMessage)
{
    // override me
}

bool LogCallback::doProcessEntry(const LogEntry& e)
{
    return false;
}

void LogCallback::processEntry(const LogEntry& e)
{
    if (doProcessEntry(e))
        return; // derived class used the entry API

    (*this)(e.debugClass, e.debugPriority, e.file.c_str(), e.line, e.message);
}


bool LogCallback::shouldLog(mgDebugClass c, mgDebugPriority p) const
{
    if (p == MG_MANDATORY_INFO)
        return true;
    return (c & m_class) != 0 && p >= m_priority;
}

void LogCallback::setLogLevels(mgDebugClass c, mgDebugPriority p)
{
    m_priority = p;
    m_class = c;
}

const char* LogCallback::debugClassToString(mgDebugClass c)
{
    switch (c) {
    case MG_NONE:        return "none";
    case MG_GENERAL:     return "general";
    case MG_ENVIRONMENT: return "environment";
    case MG_IO:          return "io";
    case MG_NETWORK:     return "network";
    case MG_UNDEFD:      return "undefined";
    case MG_ALL:         return "all";
    }
    return "unknown";
}

const char* LogCallback::debugPriorityToString(mgDebugPriority p)
{
    switch (p) {
    case MG_BULK:           return "BULK";
    case MG_DEBUG:          return "DBUG";
    case MG_INFO:           return "INFO";
    case MG_WARN:           return "WARN";
    case MG_ALERT:          return "ALRT";
    case MG_POPUP:          return "POPU";
    case MG_MANDATORY_INFO: return "MAND";
    }
    return "UNKN";
}

mgDebugPriority LogCallback::parsePriority(const std::string& s)
{
    const std::string level = boost::algorithm::to_lower_copy(s);
    if (level == "bulk")
        return MG_BULK;
    if (level == "debug")
        return MG_DEBUG;
    if (level == "info")
        return MG_INFO;
    if (level == "warn")
        return MG_WARN;
    if (level == "alert")
        return MG_ALERT;
    if (level == "popup")
        return MG_POPUP;

    throw mg_range_exception("unknown log level: " + s, "LogCallback::parsePriority");
}

StderrLogCallback::StderrLogCallback(mgDebugClass c, mgDebugPriority p) :
    LogCallback(c, p)
{
}

bool StderrLogCallback::doProcessEntry(const LogEntry& e)
{
    if (!shouldLog(e.debugClass, e.debugPriority))
        return true;

    std::cerr << "[" << debugPriorityToString(e.debugPriority) << "]:"
              << debugClassToString(e.debugClass) << " "
              << e.shortFile() << ":" << e.line << ": "
              << e.message << std::endl;
    return true;
}
