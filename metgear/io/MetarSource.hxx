// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Interface for anything that can supply raw METAR reports.
 */

#pragma once

#include <string>

#include <metgear/structure/exception.hxx>

/**
 * Thrown when a report cannot be obtained for a station.
 */
class MGFetchException : public mg_io_exception
{
public:
    enum Reason {
        NOT_FOUND,      ///< the source has no current report for the station
        NETWORK,        ///< transport or HTTP level failure
        BAD_STATION     ///< the station id is not 4 alphanumeric characters
    };

    MGFetchException(Reason reason, const std::string& message,
                     const std::string& station, const std::string& origin = {});

    Reason getReason() const { return _reason; }
    const std::string& getStation() const { return _station; }

    static const char* getReasonString(Reason r);

private:
    Reason _reason;
    std::string _station;
};


namespace metgear
{

class MetarSource
{
public:
    virtual ~MetarSource() = default;

    /**
     * Retrieve the latest raw report for a station. The decoder never calls
     * this itself; callers hand the returned string to MGMetar.
     *
     * @throw MGFetchException
     */
    virtual std::string fetch(const std::string& station) = 0;
};

} // namespace metgear
