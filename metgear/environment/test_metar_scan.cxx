// SPDX-License-Identifier: LGPL-2.1-or-later

#include <metgear_config.h>

#include <metgear/misc/test_macros.hxx>

#include <iostream>
#include <string>

#include <metgear/structure/exception.hxx>

#include "metar.hxx"
#include "metar_scan.hxx"

using std::string;
using namespace metgear::metar;

const double TEST_EPSILON = 1e-9;

void test_tokenize()
{
    TokenList t = tokenize("  KHIO   051953Z\t36008KT\n10SM=  ");
    MG_CHECK_EQUAL(t.size(), 4);
    MG_CHECK_EQUAL(t[0], "KHIO");
    MG_CHECK_EQUAL(t[1], "051953Z");
    MG_CHECK_EQUAL(t[2], "36008KT");
    MG_CHECK_EQUAL(t[3], "10SM");

    MG_VERIFY(tokenize("").empty());
    MG_VERIFY(tokenize(" \t \n").empty());
    MG_VERIFY(tokenize("=").empty());

    std::vector<std::size_t> offsets;
    t = tokenize(" KHIO\tKHIO  36008KT=", &offsets);
    MG_CHECK_EQUAL(t.size(), 3);
    MG_CHECK_EQUAL(offsets.size(), 3);
    MG_CHECK_EQUAL(offsets[0], 1);
    MG_CHECK_EQUAL(offsets[1], 6);
    MG_CHECK_EQUAL(offsets[2], 12);
    MG_CHECK_EQUAL(t[2], "36008KT");
}

void test_header()
{
    MG_VERIFY(scanId("KHIO"));
    MG_VERIFY(scanId("K1O2"));
    MG_VERIFY(scanId("khio"));
    MG_VERIFY(scanId("Eham"));
    MG_VERIFY(!scanId("KHI"));
    MG_VERIFY(!scanId("KHIOX"));
    MG_VERIFY(!scanId("K-IO"));

    int day = 0, hour = 0, minute = 0;
    MG_VERIFY(scanDate("051953Z", day, hour, minute));
    MG_CHECK_EQUAL(day, 5);
    MG_CHECK_EQUAL(hour, 19);
    MG_CHECK_EQUAL(minute, 53);

    MG_VERIFY(!scanDate("0519Z", day, hour, minute));
    MG_VERIFY(!scanDate("051953", day, hour, minute));
    MG_VERIFY(!scanDate("051953ZZ", day, hour, minute));
    MG_VERIFY(!scanDate("321953Z", day, hour, minute));
    MG_VERIFY(!scanDate("002000Z", day, hour, minute));
    MG_VERIFY(!scanDate("052400Z", day, hour, minute));
    MG_VERIFY(!scanDate("051960Z", day, hour, minute));
    // a failed scan leaves the outputs alone
    MG_CHECK_EQUAL(day, 5);

    int year = -1, month = -1;
    MG_VERIFY(scanPreambleDate("2011/10/20", year, month, day));
    MG_CHECK_EQUAL(year, 2011);
    MG_CHECK_EQUAL(month, 10);
    MG_CHECK_EQUAL(day, 20);
    MG_VERIFY(!scanPreambleDate("2011-10-20", year, month, day));
    MG_VERIFY(scanPreambleTime("11:25", hour, minute));
    MG_CHECK_EQUAL(hour, 11);
    MG_CHECK_EQUAL(minute, 25);
    MG_VERIFY(!scanPreambleTime("1125", hour, minute));

    MGMetar::ReportType type = MGMetar::NONE;
    MG_VERIFY(scanModifier("AUTO", type));
    MG_CHECK_EQUAL(type, MGMetar::AUTO);
    MG_VERIFY(scanModifier("CCA", type));
    MG_CHECK_EQUAL(type, MGMetar::COR);
    MG_VERIFY(scanModifier("RTD", type));
    MG_CHECK_EQUAL(type, MGMetar::RTD);
    MG_VERIFY(!scanModifier("NIL", type));
    MG_VERIFY(!scanModifier("36008KT", type));
}

void test_wind()
{
    auto w = scanWind("36008KT");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDirection(), 360);
    MG_CHECK_EQUAL(w->getSpeed_kt(), 8);
    MG_VERIFY(!w->getGust_kt());
    MG_CHECK_EQUAL(w->getCompassPoint(), "N");
    MG_CHECK_EQUAL(w->getDescription(), "from the north at 8 knots");
    MG_CHECK_EQUAL_EP2(w->getSpeed_mps(), 8 * 0.514444, 1e-3);

    w = scanWind("27012G20KT");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDirection(), 270);
    MG_CHECK_EQUAL(w->getSpeed_kt(), 12);
    MG_VERIFY(w->getGust_kt());
    MG_CHECK_EQUAL(*w->getGust_kt(), 20);
    MG_CHECK_EQUAL(w->getCompassPoint(), "W");
    MG_CHECK_EQUAL(w->getDescription(), "from the west at 12 knots gusting to 20 knots");

    w = scanWind("VRB03KT");
    MG_VERIFY(w);
    MG_VERIFY(w->isVariable());
    MG_CHECK_EQUAL(w->getSpeed_kt(), 3);
    MG_CHECK_EQUAL(w->getCompassPoint(), "");
    MG_CHECK_EQUAL(w->getDescription(), "variable at 3 knots");

    w = scanWind("00000KT");
    MG_VERIFY(w);
    MG_VERIFY(w->isCalm());
    MG_CHECK_EQUAL(w->getDescription(), "calm");

    // direction 000 with wind is kept as a northerly
    w = scanWind("00005KT");
    MG_VERIFY(w);
    MG_VERIFY(!w->isCalm());
    MG_CHECK_EQUAL(w->getDirection(), 0);
    MG_CHECK_EQUAL(w->getCompassPoint(), "N");

    // three digit speed and gust
    w = scanWind("090105G130KT");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getSpeed_kt(), 105);
    MG_CHECK_EQUAL(*w->getGust_kt(), 130);

    // gust sensor failure
    w = scanWind("14040G//KT");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDirection(), 140);
    MG_CHECK_EQUAL(w->getSpeed_kt(), 40);
    MG_VERIFY(!w->getGust_kt());

    MG_VERIFY(!scanWind("36008MPS"));
    MG_VERIFY(!scanWind("36008KMH"));
    MG_VERIFY(!scanWind("36008"));
    MG_VERIFY(!scanWind("37008KT"));
    MG_VERIFY(!scanWind("150KT"));
    MG_VERIFY(!scanWind("/////KT"));
    MG_VERIFY(!scanWind("36008GKT"));
}

void test_wind_variability()
{
    auto r = scanVariability("240V300");
    MG_VERIFY(r);
    MG_CHECK_EQUAL(r->from, 240);
    MG_CHECK_EQUAL(r->to, 300);

    MG_VERIFY(!scanVariability("240V30"));
    MG_VERIFY(!scanVariability("240300"));
    MG_VERIFY(!scanVariability("400V300"));

    MGMetarWind w = scanWind("27012KT")->withRange(240, 300);
    MG_VERIFY(w.hasRange());
    MG_CHECK_EQUAL(w.getRangeFrom(), 240);
    MG_CHECK_EQUAL(w.getRangeTo(), 300);
    MG_CHECK_EQUAL(w.getDescription(),
                   "from the west at 12 knots, varying between WSW and WNW");
    MG_VERIFY(w != *scanWind("27012KT"));
    MG_CHECK_NE(w.getDescription(), scanWind("27012KT")->getDescription());
}

void test_compass()
{
    // every sector is 22.5 degrees wide and centred on its point
    MG_CHECK_EQUAL(string(azimuthName(0)), "N");
    MG_CHECK_EQUAL(string(azimuthName(360)), "N");
    MG_CHECK_EQUAL(string(azimuthName(11.2)), "N");
    MG_CHECK_EQUAL(string(azimuthName(348.75)), "N");
    MG_CHECK_EQUAL(string(azimuthName(22.5)), "NNE");
    MG_CHECK_EQUAL(string(azimuthName(45)), "NE");
    MG_CHECK_EQUAL(string(azimuthName(90)), "E");
    MG_CHECK_EQUAL(string(azimuthName(180)), "S");
    MG_CHECK_EQUAL(string(azimuthName(200)), "SSW");
    MG_CHECK_EQUAL(string(azimuthName(270)), "W");
    MG_CHECK_EQUAL(string(azimuthName(337.5)), "NNW");
    MG_CHECK_EQUAL(string(azimuthLongName(22.5)), "north-northeast");

    // boundaries go to the point with the higher bearing
    MG_CHECK_EQUAL(string(azimuthName(11.25)), "NNE");
    MG_CHECK_EQUAL(string(azimuthName(33.75)), "NE");
    MG_CHECK_EQUAL(string(azimuthName(191.25)), "SSW");
    MG_CHECK_EQUAL(string(azimuthName(326.25)), "NNW");

    // every whole degree maps to one of the 16 points, the same one each time
    const char* points[] = {
        "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
        "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"
    };
    for (int d = 0; d <= 360; d++) {
        const string name = azimuthName(d);
        bool found = false;
        for (const char* p : points)
            found = found || name == p;
        MG_VERIFY(found);
        MG_CHECK_EQUAL(name, azimuthName(d));
    }
}

void test_visibility()
{
    auto v = scanVisibility("10SM");
    MG_VERIFY(v);
    MG_CHECK_EQUAL_EP2(v->getVisibility_sm(), 10.0, TEST_EPSILON);
    MG_VERIFY(v->isTenOrMore());
    MG_CHECK_EQUAL(v->getDescription(), "10+ miles visibility");

    v = scanVisibility("15SM");
    MG_VERIFY(v);
    MG_VERIFY(v->isTenOrMore());

    v = scanVisibility("3SM");
    MG_VERIFY(v);
    MG_VERIFY(!v->isTenOrMore());
    MG_CHECK_EQUAL(v->getDescription(), "3 miles visibility");
    MG_CHECK_EQUAL_EP2(v->getVisibility_m(), 3 * 1609.3412, 1e-6);

    v = scanVisibility("1/2SM");
    MG_VERIFY(v);
    MG_CHECK_EQUAL_EP2(v->getVisibility_sm(), 0.5, TEST_EPSILON);
    MG_CHECK_EQUAL(v->getText(), "1/2");
    MG_CHECK_EQUAL(v->getDescription(), "1/2 mile visibility");

    v = scanVisibility("M1/4SM");
    MG_VERIFY(v);
    MG_CHECK_EQUAL(v->getModifier(), MGMetarVisibility::LESS_THAN);
    MG_CHECK_EQUAL_EP2(v->getVisibility_sm(), 0.25, TEST_EPSILON);
    MG_CHECK_EQUAL(v->getDescription(), "less than 1/4 mile visibility");

    v = scanVisibility("P6SM");
    MG_VERIFY(v);
    MG_CHECK_EQUAL(v->getModifier(), MGMetarVisibility::GREATER_THAN);
    MG_CHECK_EQUAL(v->getDescription(), "more than 6 miles visibility");

    // mixed numbers span two groups
    v = scanVisibility("1", "1/2SM");
    MG_VERIFY(v);
    MG_CHECK_EQUAL_EP2(v->getVisibility_sm(), 1.5, TEST_EPSILON);
    MG_CHECK_EQUAL(v->getText(), "1 1/2");
    MG_CHECK_EQUAL(v->getDescription(), "1 1/2 miles visibility");

    MG_VERIFY(!scanVisibility("1", "BR"));
    MG_VERIFY(!scanVisibility("1/2SM", "BR"));
    MG_VERIFY(!scanVisibility("2", "3/2SM"));

    MG_VERIFY(!scanVisibility("9999"));
    MG_VERIFY(!scanVisibility("10"));
    MG_VERIFY(!scanVisibility("1/0SM"));
    MG_VERIFY(!scanVisibility("SM"));
    MG_VERIFY(!scanVisibility("CAVOK"));
}

void test_weather()
{
    auto w = scanWeather("+TSRA");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getIntensity(), MGMetarWeather::HEAVY);
    MG_CHECK_EQUAL(w->getDescriptor(), "TS");
    MG_CHECK_EQUAL(w->getPhenomena().size(), 1);
    MG_CHECK_EQUAL(w->getPhenomena()[0], "RA");
    MG_CHECK_EQUAL(w->getCode(), "+TSRA");
    MG_CHECK_EQUAL(w->getDescription(), "heavy thunderstorm rain");

    w = scanWeather("-RA");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getIntensity(), MGMetarWeather::LIGHT);
    MG_VERIFY(!w->hasDescriptor());
    MG_CHECK_EQUAL(w->getDescription(), "light rain");

    w = scanWeather("BR");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getIntensity(), MGMetarWeather::MODERATE);
    MG_CHECK_EQUAL(w->getDescription(), "mist");

    w = scanWeather("-SHRASN");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDescriptor(), "SH");
    MG_CHECK_EQUAL(w->getPhenomena().size(), 2);
    MG_CHECK_EQUAL(w->getDescription(), "light showers of rain and snow");

    w = scanWeather("VCSH");
    MG_VERIFY(w);
    MG_VERIFY(w->isVicinity());
    MG_VERIFY(w->getPhenomena().empty());
    MG_CHECK_EQUAL(w->getDescription(), "showers in the vicinity");

    w = scanWeather("VCFG");
    MG_VERIFY(w);
    MG_VERIFY(w->isVicinity());
    MG_VERIFY(!w->hasDescriptor());
    MG_CHECK_EQUAL(w->getDescriptor(), "");
    MG_CHECK_EQUAL(w->getPhenomena().size(), 1);
    MG_CHECK_EQUAL(w->getPhenomena()[0], "FG");
    MG_CHECK_EQUAL(w->getDescription(), "fog in the vicinity");

    w = scanWeather("FZFG");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDescription(), "freezing fog");

    w = scanWeather("TS");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDescription(), "thunderstorm");

    w = scanWeather("RERA");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDescription(), "recent rain");

    w = scanWeather("NSW");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getDescription(), "no significant weather");

    // an unknown code does not spoil the group
    w = scanWeather("RAXX");
    MG_VERIFY(w);
    MG_CHECK_EQUAL(w->getPhenomena().size(), 2);
    MG_CHECK_EQUAL(w->getPhenomena()[1], "XX");
    MG_CHECK_EQUAL(w->getDescription(), "rain and (unknown phenomenon)");

    MG_VERIFY(!scanWeather("XXYY"));
    MG_VERIFY(!scanWeather("AUTO"));
    MG_VERIFY(!scanWeather("RMK"));
    MG_VERIFY(!scanWeather("CLR"));
    MG_VERIFY(!scanWeather("-"));
    MG_VERIFY(!scanWeather("VC"));
    MG_VERIFY(!scanWeather("//"));
    MG_VERIFY(!scanWeather("-ra"));
    MG_VERIFY(!scanWeather("RAS"));
}

void test_sky_condition()
{
    auto c = scanSkyCondition("CLR");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getCoverage(), MGMetarCloud::COVERAGE_CLEAR);
    MG_VERIFY(!c->getAltitude());
    MG_VERIFY(!c->getAltitude_ft());
    MG_CHECK_EQUAL(c->getDescription(), "clear skies");

    c = scanSkyCondition("SKC");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getCoverage(), MGMetarCloud::COVERAGE_CLEAR);
    MG_CHECK_EQUAL(c->getDescription(), "sky clear");

    c = scanSkyCondition("NSC");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getCoverage(), MGMetarCloud::COVERAGE_CLEAR);

    c = scanSkyCondition("BKN025");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getCoverage(), MGMetarCloud::COVERAGE_BROKEN);
    MG_CHECK_EQUAL(*c->getAltitude(), 25);
    MG_CHECK_EQUAL(*c->getAltitude_ft(), 2500);
    MG_CHECK_EQUAL(c->getDescription(), "broken clouds at 2500 feet");

    c = scanSkyCondition("FEW015");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getDescription(), "few clouds at 1500 feet");

    c = scanSkyCondition("OVC008");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getCoverage(), MGMetarCloud::COVERAGE_OVERCAST);
    MG_CHECK_EQUAL(c->getDescription(), "overcast at 800 feet");

    c = scanSkyCondition("SCT030CB");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getTypeString(), "CB");
    MG_CHECK_EQUAL(c->getTypeLongString(), "cumulonimbus");
    MG_CHECK_EQUAL(c->getDescription(), "scattered clouds at 3000 feet (cumulonimbus)");

    c = scanSkyCondition("SCT050TCU");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(c->getTypeString(), "TCU");

    // sensor failure marker
    c = scanSkyCondition("FEW045///");
    MG_VERIFY(c);
    MG_CHECK_EQUAL(*c->getAltitude_ft(), 4500);

    c = scanSkyCondition("VV003");
    MG_VERIFY(c);
    MG_VERIFY(c->isObscured());
    MG_CHECK_EQUAL(c->getCoverage(), MGMetarCloud::COVERAGE_VERTICAL_VISIBILITY);
    MG_CHECK_EQUAL(*c->getAltitude_ft(), 300);
    MG_CHECK_EQUAL(c->getDescription(), "sky obscured, vertical visibility 300 feet");

    c = scanSkyCondition("VV///");
    MG_VERIFY(c);
    MG_VERIFY(!c->getAltitude());

    MG_VERIFY(!scanSkyCondition("BKN"));
    MG_VERIFY(!scanSkyCondition("BKN02"));
    MG_VERIFY(!scanSkyCondition("BKN025XYZ"));
    MG_VERIFY(!scanSkyCondition("//////TCU"));
    MG_VERIFY(!scanSkyCondition("VV"));

    MG_CHECK_EQUAL(MGMetarCloud::getCoverage("broken"), MGMetarCloud::COVERAGE_BROKEN);
    MG_CHECK_EQUAL(MGMetarCloud::getCoverage("bogus"), MGMetarCloud::COVERAGE_NIL);
    MG_CHECK_EQUAL(string(MGMetarCloud::getCoverageString(MGMetarCloud::COVERAGE_OVERCAST)),
                   MGMetarCloud::COVERAGE_OVERCAST_STRING);
}

void test_temperature()
{
    auto t = scanTemperature("M05/M10");
    MG_VERIFY(t);
    MG_CHECK_EQUAL(t->getTemperature_C(), -5);
    MG_CHECK_EQUAL(t->getTemperature_F(), 23);
    MG_CHECK_EQUAL(*t->getDewpoint_C(), -10);
    MG_CHECK_EQUAL(*t->getDewpoint_F(), 14);

    t = scanTemperature("21/M01");
    MG_VERIFY(t);
    MG_CHECK_EQUAL(t->getTemperature_C(), 21);
    MG_CHECK_EQUAL(t->getTemperature_F(), 70);
    MG_CHECK_EQUAL(*t->getDewpoint_C(), -1);
    MG_CHECK_EQUAL(*t->getDewpoint_F(), 30);
    MG_CHECK_EQUAL(t->getTemperatureDescription(), "70°F (21°C)");
    MG_CHECK_EQUAL(t->getDewpointDescription(), "dewpoint 30°F (-1°C)");

    // missing dewpoint
    t = scanTemperature("21/");
    MG_VERIFY(t);
    MG_VERIFY(!t->hasDewpoint());
    MG_VERIFY(!t->getRelHumidity());
    MG_CHECK_EQUAL(t->getDewpointDescription(), "dewpoint not reported");

    t = scanTemperature("41///");
    MG_VERIFY(t);
    MG_CHECK_EQUAL(t->getTemperature_C(), 41);
    MG_VERIFY(!t->hasDewpoint());

    t = scanTemperature("20/20");
    MG_VERIFY(t);
    MG_CHECK_EQUAL_EP2(*t->getRelHumidity(), 100.0, 1e-9);

    t = scanTemperature("2/09");
    MG_VERIFY(t);
    MG_CHECK_EQUAL(t->getTemperature_C(), 2);
    MG_CHECK_EQUAL(*t->getDewpoint_C(), 9);

    t = scanTemperature("M2/M09");
    MG_VERIFY(t);
    MG_CHECK_EQUAL(t->getTemperature_C(), -2);
    MG_CHECK_EQUAL(*t->getDewpoint_C(), -9);

    // the dewpoint always has two digits
    MG_VERIFY(!scanTemperature("1/2"));
    MG_VERIFY(!scanTemperature("21/5"));
    MG_VERIFY(!scanTemperature("21/M5"));
    MG_VERIFY(!scanTemperature("21/123"));

    MG_VERIFY(!scanTemperature("21"));
    MG_VERIFY(!scanTemperature("1/2SM"));
    MG_VERIFY(!scanTemperature("060/2KT"));
    MG_VERIFY(!scanTemperature("M/05"));
    MG_VERIFY(!scanTemperature("21/M"));

    MG_CHECK_EQUAL(MGMetarTemperature::toFahrenheit(0), 32);
    MG_CHECK_EQUAL(MGMetarTemperature::toFahrenheit(100), 212);
    MG_CHECK_EQUAL(MGMetarTemperature::toFahrenheit(-40), -40);
    MG_CHECK_EQUAL(MGMetarTemperature::toFahrenheit(-1), 30);
}

void test_pressure()
{
    auto p = scanPressure("A3012");
    MG_VERIFY(p);
    MG_CHECK_EQUAL(p->getHundredths_inHg(), 3012);
    MG_CHECK_EQUAL(p->str(), "30.12");
    MG_CHECK_EQUAL(p->getDescription(), "30.12 inHg");
    MG_CHECK_EQUAL_EP(p->getPressure_inHg(), 30.12);

    p = scanPressure("A2992");
    MG_VERIFY(p);
    MG_CHECK_EQUAL_EP2(p->getPressure_hPa(), 1013.2, 0.05);

    MG_CHECK_GT(p->getPressure_hPa(), scanPressure("A2905")->getPressure_hPa());
    MG_CHECK_LT(scanPressure("A2905")->getHundredths_inHg(), 2992);

    p = scanPressure("A2905");
    MG_VERIFY(p);
    MG_CHECK_EQUAL(p->str(), "29.05");

    MG_VERIFY(!scanPressure("Q1013"));
    MG_VERIFY(!scanPressure("A301"));
    MG_VERIFY(!scanPressure("A30122"));
    MG_VERIFY(!scanPressure("A////"));
}

void test_classify()
{
    const TokenList tokens = tokenize("36008KT 240V300 1 1/2SM -RA BKN008 10/09 A2990 RMK");

    MetarGroup g = classify(tokens, 0);
    MG_CHECK_EQUAL(g.kind, MetarGroup::WIND);
    MG_CHECK_EQUAL(g.consumed, 1);
    MG_VERIFY(g.wind);

    g = classify(tokens, 1);
    MG_CHECK_EQUAL(g.kind, MetarGroup::WIND_VARIABILITY);

    g = classify(tokens, 2);
    MG_CHECK_EQUAL(g.kind, MetarGroup::VISIBILITY);
    MG_CHECK_EQUAL(g.consumed, 2);
    MG_CHECK_EQUAL_EP2(g.visibility->getVisibility_sm(), 1.5, TEST_EPSILON);

    MG_CHECK_EQUAL(classify(tokens, 4).kind, MetarGroup::WEATHER);
    MG_CHECK_EQUAL(classify(tokens, 5).kind, MetarGroup::SKY_CONDITION);
    MG_CHECK_EQUAL(classify(tokens, 6).kind, MetarGroup::TEMPERATURE);
    MG_CHECK_EQUAL(classify(tokens, 7).kind, MetarGroup::PRESSURE);
    MG_CHECK_EQUAL(classify(tokens, 8).kind, MetarGroup::UNRECOGNIZED);
    MG_CHECK_EQUAL(classify(tokens, 9).kind, MetarGroup::UNRECOGNIZED);

    // a lone number at the end is not a visibility
    const TokenList last = tokenize("1");
    MG_CHECK_EQUAL(classify(last, 0).kind, MetarGroup::UNRECOGNIZED);

    MG_CHECK_EQUAL(string(getKindString(MetarGroup::SKY_CONDITION)), "sky condition");
}

int main(int argc, char* argv[])
{
    try {
        test_tokenize();
        test_header();
        test_wind();
        test_wind_variability();
        test_compass();
        test_visibility();
        test_weather();
        test_sky_condition();
        test_temperature();
        test_pressure();
        test_classify();
    } catch (mg_exception& e) {
        std::cerr << "Exception: " << e.getMessage() << std::endl;
        return -1;
    }

    std::cout << "all tests passed" << std::endl;
    return 0;
}
