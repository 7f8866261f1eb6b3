// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2001 David Megginson <david@megginson.com>

/**
 * @file
 * @brief Interface definition for MetGear base exceptions.
 */

#pragma once

#include <exception>
#include <string>

/**
 * Information encapsulating a single location in an external resource
 *
 * A position in the resource my optionally be provided, either by
 * line number, line number and column number, or byte offset from the
 * beginning of the resource. For a METAR the resource is the report text
 * itself and the column is the 1-based offset of the offending group.
 */
class mg_location
{
public:
    mg_location();
    explicit mg_location(const std::string& path, int line = -1, int column = -1);
    explicit mg_location(const char* path, int line = -1, int column = -1);

    virtual ~mg_location() = default;

    const std::string& getPath() const { return _path; }
    void setPath(const std::string& path) { _path = path; }
    int getLine() const { return _line; }
    void setLine(int line) { _line = line; }
    int getColumn() const { return _column; }
    void setColumn(int column) { _column = column; }
    int getByte() const { return _byte; }
    void setByte(int byte) { _byte = byte; }

    std::string asString() const;
    bool isValid() const;

private:
    std::string _path;
    int _line;
    int _column;
    int _byte;
};


/**
 * Abstract base class for all MetGear exceptions.
 */
class mg_exception : public std::exception
{
public:
    mg_exception();
    mg_exception(const std::string& message, const std::string& origin = {},
                 const mg_location& loc = {});
    virtual ~mg_exception() noexcept = default;

    const std::string& getMessage() const { return _message; }
    void setMessage(const std::string& message);
    const std::string& getOrigin() const { return _origin; }
    void setOrigin(const std::string& origin) { _origin = origin; }
    const mg_location& getLocation() const { return _location; }
    void setLocation(const mg_location& location);

    /**
     * message plus the location, if any
     */
    virtual std::string getFormattedMessage() const;

    const char* what() const noexcept override;

private:
    std::string _message;
    std::string _origin;
    mg_location _location;
    std::string _what;
};


/**
 * An I/O-related MetGear exception.
 *
 * MetGear-based code should throw this exception only when it
 * encounters a problem reading or fetching data from outside the
 * process.
 */
class mg_io_exception : public mg_exception
{
public:
    mg_io_exception() = default;
    mg_io_exception(const std::string& message, const std::string& origin = {},
                    const mg_location& loc = {});
    mg_io_exception(const std::string& message, const mg_location& location,
                    const std::string& origin = {});
};


/**
 * A format-related MetGear exception.
 *
 * MetGear-based code should throw this exception when a string
 * does not appear in the expected format (for example, a report
 * without a valid station group).
 */
class mg_format_exception : public mg_exception
{
public:
    mg_format_exception() = default;
    mg_format_exception(const std::string& message, const std::string& text,
                        const std::string& origin = {}, const mg_location& loc = {});

    const std::string& getText() const { return _text; }
    void setText(const std::string& text) { _text = text; }

private:
    std::string _text;
};


/**
 * A range-related MetGear exception.
 *
 * MetGear-based code should throw this exception when a value is out
 * of the range permitted for it, such as an unknown option value.
 */
class mg_range_exception : public mg_exception
{
public:
    mg_range_exception() = default;
    mg_range_exception(const std::string& message, const std::string& origin = {});
};
