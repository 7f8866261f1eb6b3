// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Group scanners for METAR decoding.
 *
 * @see WMO-49
 * Technical Regulations, Basic Documents No. 2 (WMO No. 49)
 * Volume II - Meteorological Service for International Air Navigation
 * http://library.wmo.int/pmb_ged/wmo_49-v2_2013_en.pdf
 *
 * Refer to Table A3-2 (Template for METAR and SPECI) following page 78.
 * Units follow the US practice: knots, statute miles, inches of mercury.
 */

#include <metgear_config.h>

#include "metar_scan.hxx"

#include <cctype>
#include <cstring>

#include <boost/algorithm/string/join.hpp>
#include <boost/tokenizer.hpp>

namespace metgear {
namespace metar {

namespace {

struct Token {
    const char* id;
    const char* text;
};


// descriptors have a second text for groups that carry no phenomenon ("VCSH")
struct Descriptor {
    const char* id;
    const char* text;
    const char* alone;
};


const struct Descriptor description[] = {
    { "SH", "showers of",   "showers" },
    { "TS", "thunderstorm", "thunderstorm" },
    { "BC", "patches of",   "patches" },
    { "BL", "blowing",      "blowing" },
    { "DR", "low drifting", "low drifting" },
    { "FZ", "freezing",     "freezing" },
    { "MI", "shallow",      "shallow" },
    { "PR", "partial",      "partial" },
    { "RE", "recent",       "recent" },
    { 0, 0, 0 }
};


const struct Token phenomenon[] = {
    { "DZ", "drizzle" },
    { "GR", "hail" },
    { "GS", "small hail and/or snow pellets" },
    { "IC", "ice crystals" },
    { "PE", "ice pellets" },
    { "PL", "ice pellets" },
    { "RA", "rain" },
    { "SG", "snow grains" },
    { "SN", "snow" },
    { "UP", "unknown precipitation" },
    { "BR", "mist" },
    { "DU", "widespread dust" },
    { "FG", "fog" },
    { "FU", "smoke" },
    { "HZ", "haze" },
    { "PY", "spray" },
    { "SA", "sand" },
    { "VA", "volcanic ash" },
    { "DS", "dust storm" },
    { "FC", "funnel cloud/tornado waterspout" },
    { "PO", "well-developed dust/sand whirls" },
    { "SQ", "squalls" },
    { "SS", "sandstorm" },
    { 0, 0 }
};


const struct Token cloud_types[] = {
    { "AC",    "altocumulus" },
    { "ACC",   "altocumulus castellanus" },
    { "ACSL",  "altocumulus standing lenticular" },
    { "AS",    "altostratus" },
    { "CB",    "cumulonimbus" },
    { "CBMAM", "cumulonimbus mammatus" },
    { "CC",    "cirrocumulus" },
    { "CCSL",  "cirrocumulus standing lenticular" },
    { "CI",    "cirrus" },
    { "CS",    "cirrostratus" },
    { "CU",    "cumulus" },
    { "CUFRA", "cumulus fractus" },
    { "NS",    "nimbostratus" },
    { "SAC",   "stratoaltocumulus" },		// guessed
    { "SC",    "stratocumulus" },
    { "SCSL",  "stratocumulus standing lenticular" },
    { "ST",    "stratus" },
    { "STFRA", "stratus fractus" },
    { "TCU",   "towering cumulus" },
    { 0, 0 }
};


// reads at least min and at most max digits; returns the number of digits
// read, or 0 (leaving *src untouched) if fewer than min were found
int scanNumber(const char** src, int* num, int min, int max = 0)
{
    int i;
    const char* s = *src;
    *num = 0;
    for (i = 0; i < min; i++) {
        if (!isdigit(static_cast<unsigned char>(*s)))
            return 0;
        else
            *num = *num * 10 + *s++ - '0';
    }
    for (; i < max && isdigit(static_cast<unsigned char>(*s)); i++)
        *num = *num * 10 + *s++ - '0';
    *src = s;
    return i;
}


// find longest match of str in list
const struct Token* scanToken(const char** str, const struct Token* list)
{
    const struct Token* longest = 0;
    int maxlen = 0, len;
    const char* s;
    for (int i = 0; (s = list[i].id); i++) {
        len = strlen(s);
        if (!strncmp(s, *str, len) && len > maxlen) {
            maxlen = len;
            longest = &list[i];
        }
    }
    *str += maxlen;
    return longest;
}


const struct Descriptor* scanDescriptor(const char** str)
{
    for (int i = 0; description[i].id; i++) {
        if (!strncmp(description[i].id, *str, 2)) {
            *str += 2;
            return &description[i];
        }
    }
    return 0;
}


const struct Token* findPhenomenon(const std::string& code)
{
    for (int i = 0; phenomenon[i].id; i++) {
        if (code == phenomenon[i].id)
            return &phenomenon[i];
    }
    return 0;
}


inline bool isUpper(char c)
{
    return c >= 'A' && c <= 'Z';
}

} // anonymous namespace


TokenList tokenize(const std::string& report, std::vector<std::size_t>* offsets)
{
    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    const boost::char_separator<char> sep(" \t\r\n\v\f");

    TokenList tokens;
    const tokenizer groups(report, sep);
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        std::string token = *it;
        // base() sits just past the group
        const std::size_t offset = (it.base() - report.begin()) - token.size();

        // end-of-report marker
        while (!token.empty() && token.back() == '=')
            token.pop_back();
        if (token.empty())
            continue;

        tokens.push_back(token);
        if (offsets)
            offsets->push_back(offset);
    }
    return tokens;
}


// \d{4}/\d\d/\d\d
bool scanPreambleDate(const std::string& token, int& year, int& month, int& day)
{
    const char* m = token.c_str();
    int y, mo, d;
    if (!scanNumber(&m, &y, 4))
        return false;
    if (*m++ != '/')
        return false;
    if (!scanNumber(&m, &mo, 2))
        return false;
    if (*m++ != '/')
        return false;
    if (!scanNumber(&m, &d, 2))
        return false;
    if (*m)
        return false;
    year = y;
    month = mo;
    day = d;
    return true;
}


// \d\d:\d\d
bool scanPreambleTime(const std::string& token, int& hour, int& minute)
{
    const char* m = token.c_str();
    int h, mi;
    if (!scanNumber(&m, &h, 2))
        return false;
    if (*m++ != ':')
        return false;
    if (!scanNumber(&m, &mi, 2))
        return false;
    if (*m)
        return false;
    hour = h;
    minute = mi;
    return true;
}


// [A-Za-z0-9]{4}
bool scanId(const std::string& token)
{
    if (token.size() != 4)
        return false;
    for (char c : token) {
        if (!isalnum(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}


// \d{6}Z
bool scanDate(const std::string& token, int& day, int& hour, int& minute)
{
    const char* m = token.c_str();
    int d, h, mi;

    if (!scanNumber(&m, &d, 2))
        return false;
    if (!scanNumber(&m, &h, 2))
        return false;
    if (!scanNumber(&m, &mi, 2))
        return false;
    if (*m++ != 'Z')
        return false;
    if (*m)
        return false;

    if (d < 1 || d > 31 || h > 23 || mi > 59)
        return false;

    day = d;
    hour = h;
    minute = mi;
    return true;
}


// (AUTO|COR|CC[A-B]|RTD)
bool scanModifier(const std::string& token, MGMetar::ReportType& type)
{
    if (token == "AUTO")                        // automatically generated
        type = MGMetar::AUTO;
    else if (token == "COR")                    // manually corrected
        type = MGMetar::COR;
    else if (token == "CCA" || token == "CCB")  // correction
        type = MGMetar::COR;
    else if (token == "RTD")                    // routine delayed
        type = MGMetar::RTD;
    else
        return false;
    return true;
}


// (\d{3}|VRB)\d{2,3}(G(\d{2,3}|//))?KT
std::optional<MGMetarWind> scanWind(const std::string& token)
{
    const char* m = token.c_str();
    int dir;

    if (!strncmp(m, "VRB", 3))
        m += 3, dir = MGMetarWind::VARIABLE;
    else if (!scanNumber(&m, &dir, 3))
        return std::nullopt;
    else if (dir > 360)
        return std::nullopt;

    int speed;
    if (!scanNumber(&m, &speed, 2, 3))
        return std::nullopt;

    std::optional<int> gust;
    if (*m == 'G') {
        m++;
        int i;
        if (!strncmp(m, "//", 2))   // gust not measurable
            m += 2;
        else if (!scanNumber(&m, &i, 2, 3))
            return std::nullopt;
        else
            gust = i;
    }

    // KMH and MPS are not supported
    if (strcmp(m, "KT"))
        return std::nullopt;

    return MGMetarWind(dir, speed, gust);
}


// \d{3}V\d{3}
std::optional<WindRange> scanVariability(const std::string& token)
{
    const char* m = token.c_str();
    int from, to;

    if (!scanNumber(&m, &from, 3))
        return std::nullopt;
    if (*m++ != 'V')
        return std::nullopt;
    if (!scanNumber(&m, &to, 3))
        return std::nullopt;
    if (*m)
        return std::nullopt;
    if (from > 360 || to > 360)
        return std::nullopt;

    return WindRange{from, to};
}


// [MP]?(\d{1,3}|\d{1,2}/\d{1,2})SM
std::optional<MGMetarVisibility> scanVisibility(const std::string& token)
{
    const char* m = token.c_str();
    MGMetarVisibility::Modifier modifier = MGMetarVisibility::EQUALS;

    if (*m == 'M')
        m++, modifier = MGMetarVisibility::LESS_THAN;
    else if (*m == 'P')
        m++, modifier = MGMetarVisibility::GREATER_THAN;

    const char* start = m;
    int i;
    if (!scanNumber(&m, &i, 1, 3))
        return std::nullopt;
    double distance = i;

    if (*m == '/') {
        m++;
        int denom;
        if (!scanNumber(&m, &denom, 1, 2) || denom == 0)
            return std::nullopt;
        distance /= denom;
    }
    const std::string text(start, m);

    if (strcmp(m, "SM"))
        return std::nullopt;

    return MGMetarVisibility(distance, modifier, text);
}


// \d{1,2} \d/\d{1,2}SM
std::optional<MGMetarVisibility> scanVisibility(const std::string& whole,
                                                const std::string& fraction)
{
    const char* m = whole.c_str();
    int i;
    if (!scanNumber(&m, &i, 1, 2) || *m)
        return std::nullopt;

    const char* f = fraction.c_str();
    const char* start = f;
    int num, denom;
    if (!scanNumber(&f, &num, 1))
        return std::nullopt;
    if (*f++ != '/')
        return std::nullopt;
    if (!scanNumber(&f, &denom, 1, 2))
        return std::nullopt;
    if (denom == 0 || num >= denom)
        return std::nullopt;
    const std::string text(start, f);
    if (strcmp(f, "SM"))
        return std::nullopt;

    return MGMetarVisibility(i + double(num) / denom, MGMetarVisibility::EQUALS,
                             whole + " " + text);
}


// (+|-)?(VC)?(MI|PR|BC|DR|BL|SH|TS|FZ|RE)?([A-Z]{2})*
std::optional<MGMetarWeather> scanWeather(const std::string& token)
{
    if (token == "NSW") {
        return MGMetarWeather(token, MGMetarWeather::MODERATE, false, {}, {},
                              "no significant weather");
    }

    const char* m = token.c_str();
    MGMetarWeather::Intensity intensity = MGMetarWeather::MODERATE;
    bool vicinity = false;

    if (*m == '-')
        m++, intensity = MGMetarWeather::LIGHT;
    else if (*m == '+')
        m++, intensity = MGMetarWeather::HEAVY;

    if (!strncmp(m, "VC", 2))
        m += 2, vicinity = true;

    const struct Descriptor* desc = scanDescriptor(&m);

    std::vector<std::string> codes;
    std::vector<std::string> texts;
    int known = desc ? 1 : 0;
    while (*m) {
        if (!isUpper(m[0]) || !isUpper(m[1]))
            return std::nullopt;
        const std::string code(m, 2);
        m += 2;

        const struct Token* a = findPhenomenon(code);
        if (a) {
            known++;
            texts.push_back(a->text);
        } else {
            texts.push_back("(unknown phenomenon)");
        }
        codes.push_back(code);
    }

    // a group made of unknown codes only is not a weather group
    if (!known)
        return std::nullopt;

    std::vector<std::string> words;
    if (intensity != MGMetarWeather::MODERATE)
        words.push_back(MGMetarWeather::getIntensityString(intensity));
    if (desc)
        words.push_back(texts.empty() ? desc->alone : desc->text);
    if (!texts.empty())
        words.push_back(boost::algorithm::join(texts, " and "));
    if (vicinity)
        words.push_back("in the vicinity");

    return MGMetarWeather(token, intensity, vicinity, desc ? desc->id : "",
                          codes, boost::algorithm::join(words, " "));
}


// (CLR|SKC|NSC|NCD) | (FEW|SCT|BKN|OVC)\d{3}[:cloud_type:]?(///)? | VV(\d{3}|///)
std::optional<MGMetarCloud> scanSkyCondition(const std::string& token)
{
    if (token == "CLR"              // clear below 12,000 ft
            || token == "SKC"       // sky clear
            || token == "NSC"       // no significant clouds
            || token == "NCD") {    // nil cloud detected
        return MGMetarCloud(token, MGMetarCloud::COVERAGE_CLEAR);
    }

    const char* m = token.c_str();
    int i;

    if (!strncmp(m, "VV", 2)) {             // vertical visibility
        m += 2;
        std::optional<int> height;
        if (!strncmp(m, "///", 3))          // not measurable
            m += 3;
        else if (scanNumber(&m, &i, 3))
            height = i;
        else
            return std::nullopt;
        if (*m)
            return std::nullopt;
        return MGMetarCloud("VV", MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY, height);
    }

    MGMetarCloud::Coverage coverage;
    if (!strncmp(m, "FEW", 3))
        coverage = MGMetarCloud::COVERAGE_FEW;
    else if (!strncmp(m, "SCT", 3))
        coverage = MGMetarCloud::COVERAGE_SCATTERED;
    else if (!strncmp(m, "BKN", 3))
        coverage = MGMetarCloud::COVERAGE_BROKEN;
    else if (!strncmp(m, "OVC", 3))
        coverage = MGMetarCloud::COVERAGE_OVERCAST;
    else
        return std::nullopt;
    const std::string code(m, 3);
    m += 3;

    if (!scanNumber(&m, &i, 3))
        return std::nullopt;

    std::string type, type_long;
    const struct Token* a;
    if ((a = scanToken(&m, cloud_types))) {
        type = a->id;
        type_long = a->text;
    }

    // @see WMO-49 Section 4.5.4.5
    // Denotes temporary failure of sensor and covers cases like FEW045///
    if (!strncmp(m, "///", 3))
        m += 3;
    if (*m)
        return std::nullopt;

    return MGMetarCloud(code, coverage, i, type, type_long);
}


// M?[0-9]{1,2}/(M?[0-9]{2}|//)?
std::optional<MGMetarTemperature> scanTemperature(const std::string& token)
{
    const char* m = token.c_str();
    int sign = 1, temp, dew;

    if (*m == 'M')
        m++, sign = -1;
    if (!scanNumber(&m, &temp, 1, 2))
        return std::nullopt;
    temp *= sign;

    if (*m++ != '/')
        return std::nullopt;

    std::optional<int> dewpoint;
    if (!strcmp(m, "//") || !*m) {     // dewpoint missing or sensor failure
        return MGMetarTemperature(temp, dewpoint);
    }

    sign = 1;
    if (*m == 'M')
        m++, sign = -1;
    if (!scanNumber(&m, &dew, 2))
        return std::nullopt;
    if (*m)
        return std::nullopt;
    dewpoint = sign * dew;

    return MGMetarTemperature(temp, dewpoint);
}


// A\d{4}
std::optional<MGMetarPressure> scanPressure(const std::string& token)
{
    const char* m = token.c_str();
    int press;

    // Q (hPa) groups are not supported
    if (*m++ != 'A')
        return std::nullopt;
    if (!scanNumber(&m, &press, 4))
        return std::nullopt;
    if (*m)
        return std::nullopt;

    return MGMetarPressure(press);
}


const char* azimuthName(double d)
{
    const char* dir[] = {
        "N", "NNE", "NE", "ENE",
        "E", "ESE", "SE", "SSE",
        "S", "SSW", "SW", "WSW",
        "W", "WNW", "NW", "NNW"
    };
    d += 11.25;
    while (d < 0)
        d += 360;
    while (d >= 360)
        d -= 360;
    return dir[int(d / 22.5)];
}


const char* azimuthLongName(double d)
{
    const char* dir[] = {
        "north", "north-northeast", "northeast", "east-northeast",
        "east", "east-southeast", "southeast", "south-southeast",
        "south", "south-southwest", "southwest", "west-southwest",
        "west", "west-northwest", "northwest", "north-northwest"
    };
    d += 11.25;
    while (d < 0)
        d += 360;
    while (d >= 360)
        d -= 360;
    return dir[int(d / 22.5)];
}


MetarGroup classify(const TokenList& tokens, std::size_t pos)
{
    MetarGroup g;
    if (pos >= tokens.size())
        return g;
    const std::string& token = tokens[pos];

    if ((g.wind = scanWind(token))) {
        g.kind = MetarGroup::WIND;
    } else if ((g.range = scanVariability(token))) {
        g.kind = MetarGroup::WIND_VARIABILITY;
    } else if (pos + 1 < tokens.size()
               && (g.visibility = scanVisibility(token, tokens[pos + 1]))) {
        g.kind = MetarGroup::VISIBILITY;
        g.consumed = 2;
    } else if ((g.visibility = scanVisibility(token))) {
        g.kind = MetarGroup::VISIBILITY;
    } else if ((g.weather = scanWeather(token))) {
        g.kind = MetarGroup::WEATHER;
    } else if ((g.cloud = scanSkyCondition(token))) {
        g.kind = MetarGroup::SKY_CONDITION;
    } else if ((g.temperature = scanTemperature(token))) {
        g.kind = MetarGroup::TEMPERATURE;
    } else if ((g.pressure = scanPressure(token))) {
        g.kind = MetarGroup::PRESSURE;
    }
    return g;
}


const char* getKindString(MetarGroup::Kind kind)
{
    switch (kind) {
    case MetarGroup::UNRECOGNIZED:     return "unrecognized";
    case MetarGroup::WIND:             return "wind";
    case MetarGroup::WIND_VARIABILITY: return "wind variability";
    case MetarGroup::VISIBILITY:       return "visibility";
    case MetarGroup::WEATHER:          return "weather";
    case MetarGroup::SKY_CONDITION:    return "sky condition";
    case MetarGroup::TEMPERATURE:      return "temperature";
    case MetarGroup::PRESSURE:         return "pressure";
    }
    return "unknown";
}

} // namespace metar
} // namespace metgear
