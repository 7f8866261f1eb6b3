// SPDX-License-Identifier: LGPL-2.1-or-later

#include <metgear_config.h>

#include "MetarSource.hxx"

using std::string;

MGFetchException::MGFetchException(Reason reason, const string& message,
                                   const string& station, const string& origin) :
    mg_io_exception(message, origin),
    _reason(reason),
    _station(station)
{
}

const char* MGFetchException::getReasonString(Reason r)
{
    switch (r) {
    case NOT_FOUND:   return "NotFound";
    case NETWORK:     return "Network";
    case BAD_STATION: return "BadStation";
    }
    return "Unknown";
}
