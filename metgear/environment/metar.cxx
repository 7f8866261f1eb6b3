// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Interface for encoded Meteorological Aerodrome Reports (METAR).
 *
 * @see WMO-49
 * Technical Regulations, Basic Documents No. 2 (WMO No. 49)
 * Volume II - Meteorological Service for International Air Navigation
 * http://library.wmo.int/pmb_ged/wmo_49-v2_2013_en.pdf
 *
 * For general information:
 * World Meteorological Organization http://library.wmo.int
 */

#include <metgear_config.h>

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <metgear/constants.h>
#include <metgear/debug/logstream.hxx>

#include "metar.hxx"
#include "metar_scan.hxx"

using std::string;
using std::vector;

using namespace metgear::metar;

namespace {

// round double to 10^g
double rnd(double r, int g = 0)
{
    double f = pow(10.0, g);
    return f * floor(r / f + 0.5);
}


/* A manipulator that can use spaces to emulate tab characters. */
struct Tab
{
    /* If <stops> is 0, we simply insert tab characters. Otherwise we insert
    spaces to align with the next column at multiple of <stops>. */
    explicit Tab(int stops)
    :
    _stops(stops)
    {}
    int _stops;
};

std::ostream& operator << (std::ostream& out, const Tab& t)
{
    if (t._stops == 0) {
        return out << '\t';
    }

    // column tracking needs the text written so far
    auto out2 = dynamic_cast<std::ostringstream*>(&out);
    if (!out2) {
        return out << ' ';
    }
    std::string s = out2->str();

    if (t._stops < 0) {
        if (!s.size() || s[s.size()-1] != ' ') {
            out << ' ';
        }
        return out;
    }

    auto nl = s.rfind('\n');
    if (nl == std::string::npos) nl = 0;
    else nl += 1;
    int column = 0;
    for (auto i = nl; i != s.size(); ++i) {
        if (s[i] == '\t')
            column = (column + t._stops) / t._stops * t._stops;
        else if ((s[i] & 0xc0) != 0x80)     // count UTF-8 lead bytes only
            column += 1;
    }
    int column2 = (column + t._stops) / t._stops * t._stops;
    for (int i=column; i<column2; ++i) {
        out << ' ';
    }
    return out;
}

// label, padded with tabs to the value column
void field(std::ostream& out, const Tab& tab, const char* label, int tabs)
{
    out << label;
    for (int i = 0; i < tabs; ++i)
        out << tab;
}

const char* NOT_REPORTED = "not reported";

} // anonymous namespace


////////////////////////////////////////////////////////////////////////
// MGMetarWind
////////////////////////////////////////////////////////////////////////

MGMetarWind::MGMetarWind(int dir, int speed, std::optional<int> gust,
                         int range_from, int range_to) :
    _direction(dir),
    _speed(speed < 0 ? 0 : speed),
    _gust(gust),
    _range_from(range_from),
    _range_to(range_to)
{
}

double MGMetarWind::getSpeed_mps() const
{
    return _speed * MG_KT_TO_MPS;
}

MGMetarWind MGMetarWind::withRange(int from, int to) const
{
    return MGMetarWind(_direction, _speed, _gust, from, to);
}

std::string MGMetarWind::getCompassPoint() const
{
    if (isVariable())
        return {};
    return azimuthName(_direction);
}

std::string MGMetarWind::getDescription() const
{
    if (isCalm())
        return "calm";

    std::ostringstream out;
    if (isVariable())
        out << "variable";
    else
        out << "from the " << azimuthLongName(_direction);
    out << " at " << _speed << (_speed == 1 ? " knot" : " knots");

    if (_gust)
        out << " gusting to " << *_gust << " knots";
    if (hasRange()) {
        out << ", varying between " << azimuthName(_range_from)
            << " and " << azimuthName(_range_to);
    }
    return out.str();
}

bool MGMetarWind::operator==(const MGMetarWind& o) const
{
    return _direction == o._direction && _speed == o._speed && _gust == o._gust
        && _range_from == o._range_from && _range_to == o._range_to;
}


////////////////////////////////////////////////////////////////////////
// MGMetarVisibility
////////////////////////////////////////////////////////////////////////

MGMetarVisibility::MGMetarVisibility(double distance_sm, Modifier modifier,
                                     const std::string& text) :
    _distance(distance_sm),
    _modifier(modifier),
    _text(text)
{
}

double MGMetarVisibility::getVisibility_m() const
{
    return _distance * MG_SM_TO_METER;
}

bool MGMetarVisibility::isTenOrMore() const
{
    return _modifier != LESS_THAN && _distance >= 10.0;
}

std::string MGMetarVisibility::getDescription() const
{
    if (isTenOrMore())
        return "10+ miles visibility";

    const char* unit = _distance > 1.0 ? " miles" : " mile";
    if (_modifier == LESS_THAN)
        return "less than " + _text + unit + " visibility";
    if (_modifier == GREATER_THAN)
        return "more than " + _text + unit + " visibility";
    return _text + unit + " visibility";
}

bool MGMetarVisibility::operator==(const MGMetarVisibility& o) const
{
    return _distance == o._distance && _modifier == o._modifier && _text == o._text;
}


////////////////////////////////////////////////////////////////////////
// MGMetarWeather
////////////////////////////////////////////////////////////////////////

MGMetarWeather::MGMetarWeather(const std::string& code, Intensity intensity, bool vicinity,
                               const std::string& descriptor,
                               const std::vector<std::string>& phenomena,
                               const std::string& description) :
    _code(code),
    _intensity(intensity),
    _vicinity(vicinity),
    _descriptor(descriptor),
    _phenomena(phenomena),
    _description(description)
{
}

const char* MGMetarWeather::getIntensityString(Intensity i)
{
    switch (i) {
    case LIGHT:    return "light";
    case HEAVY:    return "heavy";
    case MODERATE: return "moderate";
    }
    return "";
}

bool MGMetarWeather::operator==(const MGMetarWeather& o) const
{
    return _code == o._code && _intensity == o._intensity && _vicinity == o._vicinity
        && _descriptor == o._descriptor && _phenomena == o._phenomena
        && _description == o._description;
}


////////////////////////////////////////////////////////////////////////
// MGMetarCloud
////////////////////////////////////////////////////////////////////////

const char * MGMetarCloud::COVERAGE_NIL_STRING = "nil";
const char * MGMetarCloud::COVERAGE_CLEAR_STRING = "clear";
const char * MGMetarCloud::COVERAGE_FEW_STRING = "few";
const char * MGMetarCloud::COVERAGE_SCATTERED_STRING = "scattered";
const char * MGMetarCloud::COVERAGE_BROKEN_STRING = "broken";
const char * MGMetarCloud::COVERAGE_OVERCAST_STRING = "overcast";
const char * MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY_STRING = "obscured";

MGMetarCloud::MGMetarCloud(const std::string& code, Coverage coverage,
                           std::optional<int> altitude_hundreds_ft,
                           const std::string& type, const std::string& type_long) :
    _code(code),
    _coverage(coverage),
    _altitude(altitude_hundreds_ft),
    _type(type),
    _type_long(type_long)
{
}

std::optional<int> MGMetarCloud::getAltitude_ft() const
{
    if (!_altitude)
        return std::nullopt;
    return *_altitude * 100;
}

std::string MGMetarCloud::getDescription() const
{
    if (_code == "CLR")
        return "clear skies";
    if (_code == "SKC")
        return "sky clear";
    if (_code == "NSC")
        return "no significant clouds";
    if (_code == "NCD")
        return "no clouds detected";

    std::ostringstream out;
    if (_coverage == COVERAGE_VERTICAL_VISIBILITY) {
        out << "sky obscured, vertical visibility ";
        if (_altitude)
            out << *getAltitude_ft() << " feet";
        else
            out << "unknown";
        return out.str();
    }

    const char* coverage_string[5] = {
        "clear skies", "few clouds", "scattered clouds", "broken clouds", "overcast"
    };
    if (_coverage >= COVERAGE_CLEAR && _coverage <= COVERAGE_OVERCAST)
        out << coverage_string[_coverage];
    if (_altitude)
        out << " at " << *getAltitude_ft() << " feet";
    if (!_type_long.empty())
        out << " (" << _type_long << ')';
    return out.str();
}

MGMetarCloud::Coverage MGMetarCloud::getCoverage( const std::string & coverage )
{
    if( coverage == "clear" ) return COVERAGE_CLEAR;
    if( coverage == "few" ) return COVERAGE_FEW;
    if( coverage == "scattered" ) return COVERAGE_SCATTERED;
    if( coverage == "broken" ) return COVERAGE_BROKEN;
    if( coverage == "overcast" ) return COVERAGE_OVERCAST;
    if( coverage == "obscured" ) return COVERAGE_VERTICAL_VISIBILITY;
    return COVERAGE_NIL;
}

const char* MGMetarCloud::getCoverageString(Coverage coverage)
{
    switch (coverage) {
    case COVERAGE_NIL:                 return COVERAGE_NIL_STRING;
    case COVERAGE_CLEAR:               return COVERAGE_CLEAR_STRING;
    case COVERAGE_FEW:                 return COVERAGE_FEW_STRING;
    case COVERAGE_SCATTERED:           return COVERAGE_SCATTERED_STRING;
    case COVERAGE_BROKEN:              return COVERAGE_BROKEN_STRING;
    case COVERAGE_OVERCAST:            return COVERAGE_OVERCAST_STRING;
    case COVERAGE_VERTICAL_VISIBILITY: return COVERAGE_VERTICAL_VISIBILITY_STRING;
    }
    return COVERAGE_NIL_STRING;
}

bool MGMetarCloud::operator==(const MGMetarCloud& o) const
{
    return _code == o._code && _coverage == o._coverage && _altitude == o._altitude
        && _type == o._type && _type_long == o._type_long;
}


////////////////////////////////////////////////////////////////////////
// MGMetarTemperature
////////////////////////////////////////////////////////////////////////

MGMetarTemperature::MGMetarTemperature(int temp_c, std::optional<int> dewp_c) :
    _temp(temp_c),
    _dewp(dewp_c)
{
}

int MGMetarTemperature::toFahrenheit(int celsius)
{
    return static_cast<int>(std::lround(celsius * 9.0 / 5.0 + 32.0));
}

int MGMetarTemperature::getTemperature_F() const
{
    return toFahrenheit(_temp);
}

std::optional<int> MGMetarTemperature::getDewpoint_F() const
{
    if (!_dewp)
        return std::nullopt;
    return toFahrenheit(*_dewp);
}

std::optional<double> MGMetarTemperature::getRelHumidity() const
{
    if (!_dewp)
        return std::nullopt;
    double dewp = pow(10.0, 7.5 * *_dewp / (237.7 + *_dewp));
    double temp = pow(10.0, 7.5 * _temp / (237.7 + _temp));
    return dewp * 100 / temp;
}

std::string MGMetarTemperature::getTemperatureDescription() const
{
    std::ostringstream out;
    out << getTemperature_F() << "°F (" << _temp << "°C)";
    return out.str();
}

std::string MGMetarTemperature::getDewpointDescription() const
{
    if (!_dewp)
        return "dewpoint not reported";
    std::ostringstream out;
    out << "dewpoint " << *getDewpoint_F() << "°F (" << *_dewp << "°C)";
    return out.str();
}

bool MGMetarTemperature::operator==(const MGMetarTemperature& o) const
{
    return _temp == o._temp && _dewp == o._dewp;
}


////////////////////////////////////////////////////////////////////////
// MGMetarPressure
////////////////////////////////////////////////////////////////////////

MGMetarPressure::MGMetarPressure(int hundredths_inhg) :
    _hundredths(hundredths_inhg)
{
}

double MGMetarPressure::getPressure_inHg() const
{
    return _hundredths / 100.0;
}

double MGMetarPressure::getPressure_hPa() const
{
    return _hundredths * MG_INHG_TO_PA / 10000.0;
}

std::string MGMetarPressure::str() const
{
    std::ostringstream out;
    out << _hundredths / 100 << '.' << std::setw(2) << std::setfill('0') << _hundredths % 100;
    return out.str();
}

std::string MGMetarPressure::getDescription() const
{
    return str() + " inHg";
}


////////////////////////////////////////////////////////////////////////
// MGMetarException
////////////////////////////////////////////////////////////////////////

MGMetarException::MGMetarException(Reason reason, const std::string& message,
                                   const std::string& token, const mg_location& loc) :
    mg_format_exception(message, token, "MGMetar", loc),
    _reason(reason)
{
}

const char* MGMetarException::getReasonString(Reason r)
{
    switch (r) {
    case MALFORMED_REPORT:   return "MalformedReport";
    case INVALID_STATION_ID: return "InvalidStationId";
    case INVALID_TIMESTAMP:  return "InvalidTimestamp";
    }
    return "Unknown";
}


////////////////////////////////////////////////////////////////////////
// MGMetar
////////////////////////////////////////////////////////////////////////

/**
 * The constructor takes a METAR string and decodes it in a single pass.
 * The constructor throws MGMetarException on failure. The NOAA date/time
 * preamble and the "METAR" keyword are accepted and can be left away.
 *
 * @param m             METAR string
 * @param station_hint  station the report was requested for, or empty
 *
 * @par Examples:
 * @code
 * MGMetar m("METAR KSFO 061656Z 19004KT 9SM SCT100 OVC200 08/03 A3013");
 * int t = m.getTemperature()->getTemperature_F();
 * @endcode
 */
MGMetar::MGMetar(const string& m, const string& station_hint) :
    _data(m),
    _report_type(NONE),
    _nil(false),
    _year(-1),
    _month(-1),
    _day(-1),
    _hour(-1),
    _minute(-1)
{
    decode(station_hint);
}


void MGMetar::fail(MGMetarException::Reason reason, const string& message,
                   const string& token, std::size_t offset) const
{
    mg_location loc("METAR");
    if (offset != string::npos)
        loc.setColumn(static_cast<int>(offset) + 1);

    MG_LOG(MG_ENVIRONMENT, MG_WARN, "metar: " << message << " in '" << _data << "'");
    throw MGMetarException(reason, message, token, loc);
}


void MGMetar::decode(const string& station_hint)
{
    std::vector<std::size_t> offsets;
    const TokenList tokens = tokenize(_data, &offsets);
    size_t pos = 0;

    // NOAA preamble
    int day, hour, minute;
    if (pos < tokens.size() && scanPreambleDate(tokens[pos], _year, _month, day)) {
        pos++;
        if (pos < tokens.size() && scanPreambleTime(tokens[pos], hour, minute))
            pos++;
    }

    // METAR header
    if (pos < tokens.size() && tokens[pos] == "METAR")
        pos++;

    // station, timestamp, wind and at least one further group; a missing
    // report ("KXYZ 051953Z NIL") is the only shorter form
    const bool nil_report = tokens.size() == pos + 3 && tokens[pos + 2] == "NIL";
    if (tokens.size() < pos + 4 && !nil_report) {
        if (tokens.empty())
            fail(MGMetarException::MALFORMED_REPORT, "empty report", string(), string::npos);
        fail(MGMetarException::MALFORMED_REPORT,
             "report too short (" + std::to_string(tokens.size() - pos)
                 + " groups) after '" + tokens.back() + "'",
             tokens.back(), offsets.back());
    }

    if (!scanId(tokens[pos]))
        fail(MGMetarException::INVALID_STATION_ID,
             "invalid station id '" + tokens[pos] + "'", tokens[pos], offsets[pos]);
    _icao = boost::algorithm::to_upper_copy(tokens[pos++]);

    if (!scanDate(tokens[pos], _day, _hour, _minute))
        fail(MGMetarException::INVALID_TIMESTAMP,
             "invalid observation time '" + tokens[pos] + "'", tokens[pos], offsets[pos]);
    pos++;

    _station_hint = boost::algorithm::to_upper_copy(station_hint);
    if (!stationMatchesHint()) {
        MG_LOG(MG_ENVIRONMENT, MG_WARN, "metar: requested station " << _station_hint
               << " but report is for " << _icao);
    }

    ReportType type;
    for (; pos < tokens.size(); pos++) {
        if (tokens[pos] == "NIL") {
            _nil = true;
            _unparsed.assign(tokens.begin() + pos + 1, tokens.end());
            return;
        }
        if (!scanModifier(tokens[pos], type))
            break;
        _report_type = type;
    }

    // base set
    bool trend = false;
    while (pos < tokens.size()) {
        const string& token = tokens[pos];

        if (token == "RMK") {
            _remarks = boost::algorithm::join(
                vector<string>(tokens.begin() + pos + 1, tokens.end()), " ");
            break;
        }
        if (token == "TEMPO" || token == "BECMG" || token == "NOSIG")
            trend = true;
        if (trend) {
            _unparsed.push_back(token);
            pos++;
            continue;
        }

        const MetarGroup g = classify(tokens, pos);
        bool used = true;
        switch (g.kind) {
        case MetarGroup::WIND:
            if (_wind)
                used = false;
            else
                _wind = g.wind;
            break;
        case MetarGroup::WIND_VARIABILITY:
            if (!_wind || _wind->hasRange())
                used = false;
            else
                _wind = _wind->withRange(g.range->from, g.range->to);
            break;
        case MetarGroup::VISIBILITY:
            if (_visibility)
                used = false;
            else
                _visibility = g.visibility;
            break;
        case MetarGroup::WEATHER:
            _weather.push_back(*g.weather);
            break;
        case MetarGroup::SKY_CONDITION:
            _clouds.push_back(*g.cloud);
            break;
        case MetarGroup::TEMPERATURE:
            if (_temperature)
                used = false;
            else
                _temperature = g.temperature;
            break;
        case MetarGroup::PRESSURE:
            if (_pressure)
                used = false;
            else
                _pressure = g.pressure;
            break;
        case MetarGroup::UNRECOGNIZED:
            MG_LOG(MG_ENVIRONMENT, MG_DEBUG, "metar: skipping unrecognised group '"
                   << token << "'");
            _unparsed.push_back(token);
            break;
        }

        if (!used) {
            MG_LOG(MG_ENVIRONMENT, MG_INFO, "metar: ignoring repeated "
                   << getKindString(g.kind) << " group '" << token << "'");
            for (size_t i = 0; i < g.consumed; i++)
                _unparsed.push_back(tokens[pos + i]);
        }
        pos += g.consumed;
    }
}


bool MGMetar::stationMatchesHint() const
{
    return _station_hint.empty() || boost::algorithm::iequals(_station_hint, _icao);
}


std::string MGMetar::getTimeDescription() const
{
    std::ostringstream out;
    out << "Observed at " << std::setfill('0') << std::setw(2) << _hour << ':'
        << std::setw(2) << _minute << "Z on day " << std::setw(2) << _day;
    if (_year != -1 && _month != -1)
        out << " (" << _year << '/' << std::setw(2) << _month << ')';
    return out.str();
}


std::string MGMetar::getWindDescription() const
{
    if (!_wind)
        return NOT_REPORTED;
    return _wind->getDescription();
}


std::string MGMetar::getVisibilityDescription() const
{
    if (!_visibility)
        return "visibility unknown";
    return _visibility->getDescription();
}


std::string MGMetar::getDescription(int tabstops) const
{
    std::ostringstream out;
    Tab tab(tabstops);

    if (_report_type == MGMetar::AUTO)
        out << "(METAR automatically generated)\n";
    else if (_report_type == MGMetar::COR)
        out << "(METAR manually corrected)\n";
    else if (_report_type == MGMetar::RTD)
        out << "(METAR routine delayed)\n";

    field(out, tab, "Airport-Id:", 2);
    out << _icao << "\n";

    field(out, tab, "Report time:", 2);
    out << getTimeDescription() << "\n";

    if (_nil) {
        out << "(report missing)\n";
        return out.str();
    }

    // wind
    field(out, tab, "Wind:", 3);
    if (!_wind) {
        out << NOT_REPORTED << "\n";
    } else {
        out << _wind->getDescription();
        if (!_wind->isVariable() && !_wind->isCalm())
            out << " (" << _wind->getDirection() << " deg " << _wind->getCompassPoint() << ")";
        out << tab << tab << rnd(_wind->getSpeed_mps(), -1) << " m/s" << "\n";
    }

    // visibility
    field(out, tab, "Visibility:", 2);
    out << getVisibilityDescription();
    if (_visibility)
        out << tab << tab << rnd(_visibility->getVisibility_m(), 1) << " m";
    out << "\n";

    // weather phenomena
    field(out, tab, "Weather:", 2);
    if (_weather.empty()) {
        out << "none\n";
    } else {
        int i = 0;
        for (const auto& w : _weather)
            out << (i++ ? ", " : "") << w.getDescription();
        out << "\n";
    }

    // cloud layers
    field(out, tab, "Sky condition:", 2);
    if (_clouds.empty())
        out << NOT_REPORTED << "\n";
    for (size_t lineno = 0; lineno < _clouds.size(); lineno++) {
        if (lineno)
            field(out, tab, "", 3);
        const MGMetarCloud& cloud = _clouds[lineno];
        out << cloud.getDescription();
        if (auto ft = cloud.getAltitude_ft())
            out << tab << tab << rnd(*ft * MG_FEET_TO_METER) << " m";
        out << "\n";
    }

    // temperature/humidity/air pressure
    field(out, tab, "Temperature:", 2);
    if (!_temperature) {
        out << NOT_REPORTED << "\n";
    } else {
        out << _temperature->getTemperatureDescription() << "\n";
        field(out, tab, "Dewpoint:", 2);
        out << _temperature->getDewpointDescription() << "\n";
        if (auto rh = _temperature->getRelHumidity()) {
            field(out, tab, "Rel. Humidity:", 2);
            out << rnd(*rh) << " %" << "\n";
        }
    }

    field(out, tab, "Pressure:", 2);
    if (!_pressure)
        out << NOT_REPORTED << "\n";
    else
        out << _pressure->getDescription() << tab << tab << rnd(_pressure->getPressure_hPa()) << " hPa" << "\n";

    if (!_remarks.empty()) {
        field(out, tab, "Remarks:", 2);
        out << _remarks << "\n";
    }

    return out.str();
}


std::string MGMetar::getSummary() const
{
    vector<string> parts;

    // active weather first, otherwise the sky condition
    if (!_weather.empty()) {
        vector<string> wx;
        for (const auto& w : _weather)
            wx.push_back(w.getDescription());
        parts.push_back(boost::algorithm::join(wx, ", "));
    } else if (!_clouds.empty()) {
        vector<string> sky;
        for (const auto& c : _clouds)
            sky.push_back(c.getDescription());
        parts.push_back(boost::algorithm::join(sky, ", "));
    }

    if (_temperature)
        parts.push_back(_temperature->getTemperatureDescription());

    if (_wind)
        parts.push_back("wind " + _wind->getDescription());

    if (parts.empty())
        return "no weather data reported";
    return boost::algorithm::join(parts, ", ");
}


bool MGMetar::operator==(const MGMetar& o) const
{
    return _data == o._data && _icao == o._icao && _station_hint == o._station_hint
        && _report_type == o._report_type && _nil == o._nil
        && _year == o._year && _month == o._month && _day == o._day
        && _hour == o._hour && _minute == o._minute
        && _wind == o._wind && _visibility == o._visibility
        && _weather == o._weather && _clouds == o._clouds
        && _temperature == o._temperature && _pressure == o._pressure
        && _remarks == o._remarks && _unparsed == o._unparsed;
}


namespace metgear {
namespace metar {

MGMetar decode(const std::string& raw_report, const std::string& station_hint)
{
    return MGMetar(raw_report, station_hint);
}

} // namespace metar
} // namespace metgear
