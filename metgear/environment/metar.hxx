// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Interface for encoded Meteorological Aerodrome Reports (METAR).
 *
 * A report is decoded once, on construction of an MGMetar, into immutable
 * values. Optional groups that are missing or unreadable leave the
 * corresponding field empty; only a report without the station and
 * timestamp groups is rejected.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <metgear/structure/exception.hxx>


/**
 * The surface wind group, e.g. 36008KT, 27012G20KT, VRB03KT or 00000KT,
 * optionally followed by a variability group like 240V300.
 */
class MGMetarWind
{
public:
    enum { VARIABLE = -1, NO_RANGE = -1 };

    MGMetarWind(int dir, int speed, std::optional<int> gust = std::nullopt,
                int range_from = NO_RANGE, int range_to = NO_RANGE);

    /// direction in degrees [0, 360], or VARIABLE
    int getDirection() const { return _direction; }
    int getSpeed_kt() const { return _speed; }
    const std::optional<int>& getGust_kt() const { return _gust; }
    double getSpeed_mps() const;

    bool isVariable() const { return _direction == VARIABLE; }
    bool isCalm() const { return _direction == 0 && _speed == 0; }

    bool hasRange() const { return _range_from != NO_RANGE && _range_to != NO_RANGE; }
    int getRangeFrom() const { return _range_from; }
    int getRangeTo() const { return _range_to; }

    /// copy of this wind with the variable direction sector set
    MGMetarWind withRange(int from, int to) const;

    /// 16-point compass label ("N", "NNE", ...), empty for variable wind
    std::string getCompassPoint() const;

    /// e.g. "from the north at 8 knots", "variable at 3 knots", "calm"
    std::string getDescription() const;

    bool operator==(const MGMetarWind& o) const;
    bool operator!=(const MGMetarWind& o) const { return !(*this == o); }

private:
    int _direction;
    int _speed;
    std::optional<int> _gust;
    int _range_from;
    int _range_to;
};


/**
 * Prevailing visibility in statute miles (10SM, 3SM, 1/2SM, 1 1/2SM,
 * M1/4SM, P6SM).
 */
class MGMetarVisibility
{
public:
    enum Modifier {
        EQUALS,
        LESS_THAN,
        GREATER_THAN
    };

    MGMetarVisibility(double distance_sm, Modifier modifier, const std::string& text);

    double getVisibility_sm() const { return _distance; }
    double getVisibility_m() const;
    Modifier getModifier() const { return _modifier; }

    /// the reported distance without unit, as written ("1 1/2")
    const std::string& getText() const { return _text; }

    /// reports of 10SM and more stand for "10 statute miles or greater"
    bool isTenOrMore() const;

    /// e.g. "10+ miles visibility", "1/2 mile visibility"
    std::string getDescription() const;

    bool operator==(const MGMetarVisibility& o) const;
    bool operator!=(const MGMetarVisibility& o) const { return !(*this == o); }

private:
    double _distance;
    Modifier _modifier;
    std::string _text;
};


/**
 * One present-weather group, e.g. -RA, +TSRA, VCSH, FZFG, -SHRASN.
 *
 * Codes are kept as they appear in the report; stacked phenomena of one
 * group stay together in a single entry.
 */
class MGMetarWeather
{
public:
    enum Intensity {
        MODERATE,   // no prefix
        LIGHT,      // '-'
        HEAVY       // '+'
    };

    MGMetarWeather(const std::string& code, Intensity intensity, bool vicinity,
                   const std::string& descriptor,
                   const std::vector<std::string>& phenomena,
                   const std::string& description);

    /// the group as reported, e.g. "+TSRA"
    const std::string& getCode() const { return _code; }
    Intensity getIntensity() const { return _intensity; }
    bool isVicinity() const { return _vicinity; }

    /// descriptor code ("TS", "SH", ...), empty if none. "VC" is never
    /// returned here, see isVicinity().
    const std::string& getDescriptor() const { return _descriptor; }
    bool hasDescriptor() const { return !_descriptor.empty(); }

    /// two-letter phenomenon codes in report order
    const std::vector<std::string>& getPhenomena() const { return _phenomena; }

    /// e.g. "heavy thunderstorm rain", "showers in the vicinity"
    const std::string& getDescription() const { return _description; }

    static const char* getIntensityString(Intensity i);

    bool operator==(const MGMetarWeather& o) const;
    bool operator!=(const MGMetarWeather& o) const { return !(*this == o); }

private:
    std::string _code;
    Intensity _intensity;
    bool _vicinity;
    std::string _descriptor;
    std::vector<std::string> _phenomena;
    std::string _description;
};


/**
 * One sky condition group (CLR, SKC, FEW015, BKN025CB, OVC008, VV003).
 */
class MGMetarCloud
{
public:
    enum Coverage {
        COVERAGE_NIL = -1,
        COVERAGE_CLEAR = 0,
        COVERAGE_FEW = 1,
        COVERAGE_SCATTERED = 2,
        COVERAGE_BROKEN = 3,
        COVERAGE_OVERCAST = 4,
        COVERAGE_VERTICAL_VISIBILITY = 5
    };

    static const char* COVERAGE_NIL_STRING;
    static const char* COVERAGE_CLEAR_STRING;
    static const char* COVERAGE_FEW_STRING;
    static const char* COVERAGE_SCATTERED_STRING;
    static const char* COVERAGE_BROKEN_STRING;
    static const char* COVERAGE_OVERCAST_STRING;
    static const char* COVERAGE_VERTICAL_VISIBILITY_STRING;

    MGMetarCloud(const std::string& code, Coverage coverage,
                 std::optional<int> altitude_hundreds_ft = std::nullopt,
                 const std::string& type = {}, const std::string& type_long = {});

    /// the coverage code as reported ("CLR", "BKN", "VV", ...)
    const std::string& getCode() const { return _code; }
    Coverage getCoverage() const { return _coverage; }

    /// base (or, for VV, obscuration height) in hundreds of feet
    const std::optional<int>& getAltitude() const { return _altitude; }
    std::optional<int> getAltitude_ft() const;

    /// "CB", "TCU", ... or empty
    const std::string& getTypeString() const { return _type; }
    const std::string& getTypeLongString() const { return _type_long; }

    bool isObscured() const { return _coverage == COVERAGE_VERTICAL_VISIBILITY; }

    /// e.g. "clear skies", "broken clouds at 2500 feet (cumulonimbus)"
    std::string getDescription() const;

    static Coverage getCoverage(const std::string& coverage);
    static const char* getCoverageString(Coverage coverage);

    bool operator==(const MGMetarCloud& o) const;
    bool operator!=(const MGMetarCloud& o) const { return !(*this == o); }

private:
    std::string _code;
    Coverage _coverage;
    std::optional<int> _altitude;
    std::string _type;
    std::string _type_long;
};


/**
 * Temperature and dewpoint group, e.g. 21/M01 or M05/.
 */
class MGMetarTemperature
{
public:
    MGMetarTemperature(int temp_c, std::optional<int> dewp_c);

    int getTemperature_C() const { return _temp; }
    int getTemperature_F() const;
    const std::optional<int>& getDewpoint_C() const { return _dewp; }
    std::optional<int> getDewpoint_F() const;
    bool hasDewpoint() const { return _dewp.has_value(); }

    /// relative humidity in percent, if the dewpoint is known
    std::optional<double> getRelHumidity() const;

    /// "70°F (21°C)"
    std::string getTemperatureDescription() const;
    /// "dewpoint 30°F (-1°C)" or "dewpoint not reported"
    std::string getDewpointDescription() const;

    /// Celsius to Fahrenheit, rounded to the nearest whole degree
    static int toFahrenheit(int celsius);

    bool operator==(const MGMetarTemperature& o) const;
    bool operator!=(const MGMetarTemperature& o) const { return !(*this == o); }

private:
    int _temp;
    std::optional<int> _dewp;
};


/**
 * Altimeter setting (A3012), kept as hundredths of an inch of mercury so
 * that the reported value survives exactly.
 */
class MGMetarPressure
{
public:
    explicit MGMetarPressure(int hundredths_inhg);

    int getHundredths_inHg() const { return _hundredths; }
    double getPressure_inHg() const;
    double getPressure_hPa() const;

    /// "30.12"
    std::string str() const;
    /// "30.12 inHg"
    std::string getDescription() const;

    bool operator==(const MGMetarPressure& o) const { return _hundredths == o._hundredths; }
    bool operator!=(const MGMetarPressure& o) const { return !(*this == o); }

private:
    int _hundredths;
};


/**
 * Thrown when a report cannot be decoded at all.
 */
class MGMetarException : public mg_format_exception
{
public:
    enum Reason {
        MALFORMED_REPORT,
        INVALID_STATION_ID,
        INVALID_TIMESTAMP
    };

    MGMetarException(Reason reason, const std::string& message,
                     const std::string& token, const mg_location& loc = {});

    Reason getReason() const { return _reason; }
    /// the offending group, empty for an empty report
    const std::string& getToken() const { return getText(); }

    static const char* getReasonString(Reason r);

private:
    Reason _reason;
};


/**
 * A decoded METAR.
 *
 * @par Examples:
 * @code
 * MGMetar m("KHIO 051953Z 36008KT 10SM CLR 21/M01 A3012", "KHIO");
 * int t = m.getTemperature()->getTemperature_F();
 * @endcode
 */
class MGMetar
{
public:
    enum ReportType {
        NONE = -1,
        AUTO = 0,
        COR,
        RTD
    };

    /**
     * Decode a report.
     *
     * @param m             the raw report, optionally preceded by the NOAA
     *                      date/time preamble and the METAR keyword
     * @param station_hint  the station the report was requested for; used
     *                      for cross-checking only
     * @throw MGMetarException if the report is empty, too short, or its
     *                      station or timestamp group is invalid
     */
    explicit MGMetar(const std::string& m, const std::string& station_hint = {});

    const std::string& getData() const { return _data; }
    const std::string& getId() const { return _icao; }
    const std::string& getStationHint() const { return _station_hint; }
    /// true unless a non-empty hint names a different station
    bool stationMatchesHint() const;

    ReportType getReportType() const { return _report_type; }
    bool isNil() const { return _nil; }

    int getYear() const { return _year; }
    int getMonth() const { return _month; }
    int getDay() const { return _day; }
    int getHour() const { return _hour; }
    int getMinute() const { return _minute; }

    const std::optional<MGMetarWind>& getWind() const { return _wind; }
    const std::optional<MGMetarVisibility>& getVisibility() const { return _visibility; }
    const std::vector<MGMetarWeather>& getWeather() const { return _weather; }
    const std::vector<MGMetarCloud>& getClouds() const { return _clouds; }
    const std::optional<MGMetarTemperature>& getTemperature() const { return _temperature; }
    const std::optional<MGMetarPressure>& getPressure() const { return _pressure; }

    /// text following RMK, empty if none
    const std::string& getRemarks() const { return _remarks; }
    /// groups that were not decoded into any field
    const std::vector<std::string>& getUnparsedTokens() const { return _unparsed; }

    /// "Observed at 19:53Z on day 05"
    std::string getTimeDescription() const;
    std::string getWindDescription() const;
    std::string getVisibilityDescription() const;

    /**
     * Multi-line table of all fields; absent fields are shown as
     * "not reported".
     *
     * @param tabstops  0 separates columns with tab characters, otherwise
     *                  spaces are used to align to multiples of tabstops
     */
    std::string getDescription(int tabstops = 0) const;

    /// one line: weather (or sky condition), temperature, wind
    std::string getSummary() const;

    bool operator==(const MGMetar& o) const;
    bool operator!=(const MGMetar& o) const { return !(*this == o); }

private:
    void decode(const std::string& station_hint);
    /// @param offset position of the token in the report, npos if none
    void fail(MGMetarException::Reason reason, const std::string& message,
              const std::string& token, std::size_t offset) const;

    std::string _data;
    std::string _icao;
    std::string _station_hint;
    ReportType _report_type;
    bool _nil;

    int _year;
    int _month;
    int _day;
    int _hour;
    int _minute;

    std::optional<MGMetarWind> _wind;
    std::optional<MGMetarVisibility> _visibility;
    std::vector<MGMetarWeather> _weather;
    std::vector<MGMetarCloud> _clouds;
    std::optional<MGMetarTemperature> _temperature;
    std::optional<MGMetarPressure> _pressure;

    std::string _remarks;
    std::vector<std::string> _unparsed;
};


namespace metgear {
namespace metar {

/**
 * Decode a report; equivalent to constructing an MGMetar.
 *
 * @throw MGMetarException
 */
MGMetar decode(const std::string& raw_report, const std::string& station_hint = {});

} // namespace metar
} // namespace metgear
