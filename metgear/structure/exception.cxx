// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2001 David Megginson <david@megginson.com>

#include <metgear_config.h>

#include "exception.hxx"

#include <sstream>

////////////////////////////////////////////////////////////////////////
// Implementation of mg_location class.
////////////////////////////////////////////////////////////////////////

mg_location::mg_location()
    : _line(-1),
      _column(-1),
      _byte(-1)
{
}

mg_location::mg_location(const std::string& path, int line, int column)
    : _path(path),
      _line(line),
      _column(column),
      _byte(-1)
{
}

mg_location::mg_location(const char* path, int line, int column)
    : _path(path ? path : ""),
      _line(line),
      _column(column),
      _byte(-1)
{
}

std::string mg_location::asString() const
{
    std::ostringstream out;
    if (!_path.empty()) {
        out << _path;
        if (_line != -1 || _column != -1)
            out << ",\n";
    }
    if (_line != -1) {
        out << "line " << _line;
        if (_column != -1)
            out << ", ";
    }
    if (_column != -1) {
        out << "column " << _column;
    }
    if (_byte != -1) {
        out << " (byte " << _byte << ")";
    }
    return out.str();
}

bool mg_location::isValid() const
{
    return !_path.empty() || _line != -1 || _column != -1 || _byte != -1;
}


////////////////////////////////////////////////////////////////////////
// Implementation of mg_exception and subclasses.
////////////////////////////////////////////////////////////////////////

mg_exception::mg_exception()
{
}

mg_exception::mg_exception(const std::string& message, const std::string& origin,
                           const mg_location& loc)
    : _message(message),
      _origin(origin),
      _location(loc)
{
    _what = getFormattedMessage();
}

void mg_exception::setMessage(const std::string& message)
{
    _message = message;
    _what = getFormattedMessage();
}

void mg_exception::setLocation(const mg_location& location)
{
    _location = location;
    _what = getFormattedMessage();
}

std::string mg_exception::getFormattedMessage() const
{
    std::string ret = _message;
    if (_location.isValid()) {
        ret += "\n at ";
        ret += _location.asString();
    }
    return ret;
}

const char* mg_exception::what() const noexcept
{
    return _what.c_str();
}


mg_io_exception::mg_io_exception(const std::string& message, const std::string& origin,
                                 const mg_location& loc)
    : mg_exception(message, origin, loc)
{
}

mg_io_exception::mg_io_exception(const std::string& message, const mg_location& location,
                                 const std::string& origin)
    : mg_exception(message, origin, location)
{
}


mg_format_exception::mg_format_exception(const std::string& message, const std::string& text,
                                         const std::string& origin, const mg_location& loc)
    : mg_exception(message, origin, loc),
      _text(text)
{
}


mg_range_exception::mg_range_exception(const std::string& message, const std::string& origin)
    : mg_exception(message, origin)
{
}
