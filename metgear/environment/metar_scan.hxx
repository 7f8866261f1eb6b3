// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Group scanners for METAR decoding.
 *
 * Every scanner looks at one group (a whitespace delimited token) and
 * either returns the decoded value or nothing. None of them keep state,
 * so each can be used on its own.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "metar.hxx"

namespace metgear {
namespace metar {

typedef std::vector<std::string> TokenList;

/**
 * Split a report into its non-empty whitespace delimited groups.
 * @param offsets if given, receives the offset of each group in the report
 */
TokenList tokenize(const std::string& report,
                   std::vector<std::size_t>* offsets = nullptr);

// header groups

/// \d{4}/\d\d/\d\d
bool scanPreambleDate(const std::string& token, int& year, int& month, int& day);
/// \d\d:\d\d
bool scanPreambleTime(const std::string& token, int& hour, int& minute);
/// [A-Za-z0-9]{4}
bool scanId(const std::string& token);
/// \d{6}Z, with day 01-31, hour 00-23 and minute 00-59
bool scanDate(const std::string& token, int& day, int& hour, int& minute);
/// (AUTO|COR|CC[A-B]|RTD), NIL is handled by the caller
bool scanModifier(const std::string& token, MGMetar::ReportType& type);

// body groups

/// (\d{3}|VRB)\d{2,3}(G(\d{2,3}|//))?KT
std::optional<MGMetarWind> scanWind(const std::string& token);

struct WindRange {
    int from;
    int to;
};

/// \d{3}V\d{3}
std::optional<WindRange> scanVariability(const std::string& token);

/// [MP]?(\d{1,2}|\d{1,2}/\d{1,2})SM
std::optional<MGMetarVisibility> scanVisibility(const std::string& token);

/// \d{1,2} followed by \d/\d{1,2}SM, the "1 1/2SM" form split over two groups
std::optional<MGMetarVisibility> scanVisibility(const std::string& whole,
                                                const std::string& fraction);

/// NSW | [-+]?(VC)?(descriptor)?(phenomenon)*
std::optional<MGMetarWeather> scanWeather(const std::string& token);

/// (CLR|SKC|NSC|NCD) | (FEW|SCT|BKN|OVC)\d{3}(type)?(///)? | VV(\d{3}|///)
std::optional<MGMetarCloud> scanSkyCondition(const std::string& token);

/// M?\d{1,2}/(M?\d\d|//)?, so a stray fraction like "1/2" is not a temperature
std::optional<MGMetarTemperature> scanTemperature(const std::string& token);

/// A\d{4}
std::optional<MGMetarPressure> scanPressure(const std::string& token);

/// 16-point compass abbreviation for a bearing in degrees
const char* azimuthName(double d);
/// as azimuthName(), spelled out ("north-northeast")
const char* azimuthLongName(double d);

/**
 * The outcome of classifying the group at a given position: which field
 * it belongs to, the decoded value for that field, and how many groups
 * were used.
 */
struct MetarGroup
{
    enum Kind {
        UNRECOGNIZED,
        WIND,
        WIND_VARIABILITY,
        VISIBILITY,
        WEATHER,
        SKY_CONDITION,
        TEMPERATURE,
        PRESSURE
    };

    Kind kind = UNRECOGNIZED;
    std::size_t consumed = 1;

    std::optional<MGMetarWind> wind;
    std::optional<WindRange> range;
    std::optional<MGMetarVisibility> visibility;
    std::optional<MGMetarWeather> weather;
    std::optional<MGMetarCloud> cloud;
    std::optional<MGMetarTemperature> temperature;
    std::optional<MGMetarPressure> pressure;
};

/**
 * Match the group at tokens[pos] against the body patterns in order: wind,
 * wind variability, visibility, weather, sky condition, temperature,
 * pressure. The first match wins. Only the split visibility form looks at
 * tokens[pos + 1].
 */
MetarGroup classify(const TokenList& tokens, std::size_t pos);

const char* getKindString(MetarGroup::Kind kind);

} // namespace metar
} // namespace metgear
