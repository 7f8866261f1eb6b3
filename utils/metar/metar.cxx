// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Decode a METAR given on the command line, on stdin, or fetched
 * for a station.
 */

#include <metgear_config.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <getopt.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <metgear/debug/LogCallback.hxx>
#include <metgear/debug/logstream.hxx>
#include <metgear/environment/metar.hxx>
#include <metgear/io/HTTPMetarClient.hxx>
#include <metgear/structure/exception.hxx>

using std::cerr;
using std::cout;
using std::endl;
using std::string;

namespace {

enum {
    EXIT_DECODE_ERROR = 1,
    EXIT_USAGE = 2
};

enum {
    OPT_SUMMARY = 1000,
    OPT_TABS
};

void usage(std::ostream& out, const char* prog)
{
    out << "Usage: " << prog << " [options] <report | station | ->\n"
        << "\n"
        << "A 4 character argument is taken as a station and its latest report\n"
        << "is fetched; '-' reads one report per line from standard input;\n"
        << "anything else is decoded as the report itself.\n"
        << "\n"
        << "Options:\n"
        << "  -s, --station <id>       station the report is expected for\n"
        << "  -u, --url <base>         report source (default " METGEAR_DEFAULT_METAR_URL ")\n"
        << "  -t, --timeout <seconds>  fetch timeout (default 10)\n"
        << "  -l, --log-level <level>  bulk, debug, info, warn or alert\n"
        << "                           (default $METGEAR_LOG_LEVEL, else warn)\n"
        << "      --summary            print a one line summary\n"
        << "      --tabs <n>           align the description with spaces at\n"
        << "                           multiples of n (default: tab characters)\n"
        << "  -V, --version            print the version and exit\n"
        << "  -h, --help               print this help and exit\n";
}

struct Settings
{
    string station_hint;
    metgear::HTTP::MetarClient::Options client;
    bool summary = false;
    int tabs = 0;
};

bool parseInt(const char* s, long& value)
{
    char* end = nullptr;
    value = std::strtol(s, &end, 10);
    return end != s && *end == '\0';
}

int decodeAndPrint(const string& report, const string& hint, const Settings& settings)
{
    try {
        const MGMetar metar(report, hint);
        if (settings.summary)
            cout << metar.getId() << ": " << metar.getSummary() << endl;
        else
            cout << metar.getDescription(settings.tabs) << endl;
    } catch (const MGMetarException& e) {
        cerr << "error: " << MGMetarException::getReasonString(e.getReason())
             << ": " << e.getFormattedMessage() << endl;
        return EXIT_DECODE_ERROR;
    }
    return EXIT_SUCCESS;
}

} // anonymous namespace


int main(int argc, char* argv[])
{
    Settings settings;

    mgDebugPriority priority = MG_WARN;
    try {
        if (const char* env = std::getenv("METGEAR_LOG_LEVEL"))
            priority = metgear::LogCallback::parsePriority(env);
    } catch (const mg_range_exception& e) {
        cerr << "ignoring METGEAR_LOG_LEVEL: " << e.getMessage() << endl;
    }

    const option long_opts[] = {
        {"station",   required_argument, nullptr, 's'},
        {"url",       required_argument, nullptr, 'u'},
        {"timeout",   required_argument, nullptr, 't'},
        {"log-level", required_argument, nullptr, 'l'},
        {"summary",   no_argument,       nullptr, OPT_SUMMARY},
        {"tabs",      required_argument, nullptr, OPT_TABS},
        {"version",   no_argument,       nullptr, 'V'},
        {"help",      no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    long value;
    while ((opt = getopt_long(argc, argv, "s:u:t:l:Vh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 's':
            settings.station_hint = optarg;
            break;
        case 'u':
            settings.client.baseURL = optarg;
            break;
        case 't':
            if (!parseInt(optarg, value) || value <= 0) {
                cerr << argv[0] << ": invalid timeout '" << optarg << "'" << endl;
                return EXIT_USAGE;
            }
            settings.client.timeout = value;
            break;
        case 'l':
            try {
                priority = metgear::LogCallback::parsePriority(optarg);
            } catch (const mg_range_exception& e) {
                cerr << argv[0] << ": " << e.getMessage() << endl;
                return EXIT_USAGE;
            }
            break;
        case OPT_SUMMARY:
            settings.summary = true;
            break;
        case OPT_TABS:
            if (!parseInt(optarg, value) || value < 0) {
                cerr << argv[0] << ": invalid tab width '" << optarg << "'" << endl;
                return EXIT_USAGE;
            }
            settings.tabs = static_cast<int>(value);
            break;
        case 'V':
            cout << "metar (MetGear) " << METGEAR_VERSION << endl;
            return EXIT_SUCCESS;
        case 'h':
            usage(cout, argv[0]);
            return EXIT_SUCCESS;
        default:
            usage(cerr, argv[0]);
            return EXIT_USAGE;
        }
    }

    mglog().setLogLevels(MG_ALL, priority);

    if (optind >= argc) {
        usage(cerr, argv[0]);
        return EXIT_USAGE;
    }

    // an unquoted report arrives as several arguments
    const std::vector<string> args(argv + optind, argv + argc);
    const string input = boost::algorithm::join(args, " ");

    if (input == "-") {
        int status = EXIT_SUCCESS;
        string line;
        while (std::getline(std::cin, line)) {
            boost::algorithm::trim(line);
            if (line.empty())
                continue;
            if (decodeAndPrint(line, settings.station_hint, settings) != EXIT_SUCCESS)
                status = EXIT_DECODE_ERROR;
        }
        return status;
    }

    if (args.size() == 1 && input.size() == 4) {
        string report;
        string hint = settings.station_hint;
        try {
            metgear::HTTP::MetarClient client(settings.client);
            const string station = metgear::HTTP::MetarClient::normalizeStation(input);
            if (hint.empty())
                hint = station;
            report = client.fetch(station);
        } catch (const MGFetchException& e) {
            cerr << "error: " << MGFetchException::getReasonString(e.getReason())
                 << ": " << e.getFormattedMessage() << endl;
            return EXIT_DECODE_ERROR;
        }
        MG_LOG(MG_GENERAL, MG_INFO, "decoding fetched report '" << report << "'");
        return decodeAndPrint(report, hint, settings);
    }

    return decodeAndPrint(input, settings.station_hint, settings);
}
