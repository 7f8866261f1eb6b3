// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief METAR report source using the aviationweather.gov data API.
 */

#include <metgear_config.h>

#include "HTTPMetarClient.hxx"

#include <memory>
#include <sstream>

#include <curl/curl.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <metgear/debug/logstream.hxx>

using std::string;

namespace metgear::HTTP
{

namespace {

struct CurlDeleter
{
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

typedef std::unique_ptr<CURL, CurlDeleter> CurlHandle;

const char* ORIGIN = "HTTP::MetarClient";

} // anonymous namespace

MetarClient::Options::Options() :
    baseURL(METGEAR_DEFAULT_METAR_URL),
    timeout(10),
    userAgent("MetGear/" METGEAR_VERSION)
{
}

MetarClient::MetarClient() :
    MetarClient(Options())
{
}

MetarClient::MetarClient(const Options& options) :
    _options(options)
{
    static const CURLcode globalInit = curl_global_init(CURL_GLOBAL_ALL);
    if (globalInit != CURLE_OK) {
        MG_LOG(MG_IO, MG_ALERT, "HTTP: curl_global_init failed: "
               << curl_easy_strerror(globalInit));
    }
}

MetarClient::~MetarClient() = default;

string MetarClient::normalizeStation(const string& station)
{
    const string id = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(station));
    bool ok = id.size() == 4;
    for (char c : id) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')))
            ok = false;
    }
    if (!ok) {
        throw MGFetchException(MGFetchException::BAD_STATION,
                               "invalid station id '" + station + "'", station, ORIGIN);
    }
    return id;
}

string MetarClient::requestURL(const string& station) const
{
    return _options.baseURL + station;
}

string MetarClient::extractReport(const string& body, const string& station)
{
    const string trimmed = boost::algorithm::trim_copy(body);
    if (trimmed.empty() || boost::algorithm::istarts_with(trimmed, "no metar")) {
        throw MGFetchException(MGFetchException::NOT_FOUND,
                               "no METAR available for " + station, station, ORIGIN);
    }

    std::istringstream lines(trimmed);
    string line;
    while (std::getline(lines, line)) {
        boost::algorithm::trim(line);
        if (!line.empty())
            return line;
    }
    return trimmed;
}

size_t MetarClient::requestWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    const size_t byteSize = size * nmemb;
    static_cast<string*>(userdata)->append(ptr, byteSize);
    return byteSize;
}

string MetarClient::fetch(const string& station)
{
    const string id = normalizeStation(station);
    const string url = requestURL(id);

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw MGFetchException(MGFetchException::NETWORK,
                               "curl_easy_init() failed", id, ORIGIN);
    }

    string body;
    char errorBuffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, _options.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, _options.timeout);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, requestWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    MG_LOG(MG_NETWORK, MG_DEBUG, "HTTP: requesting " << url);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        const string reason = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        MG_LOG(MG_NETWORK, MG_WARN, "HTTP: request for " << url << " failed: " << reason);
        throw MGFetchException(MGFetchException::NETWORK,
                               "fetching METAR for " + id + " failed: " + reason, id, ORIGIN);
    }

    long responseCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);
    MG_LOG(MG_NETWORK, MG_INFO, "HTTP: " << url << " returned " << responseCode
           << ", " << body.size() << " bytes");

    // the API answers 204 No Content for stations without a report
    if (responseCode == 204 || responseCode == 404) {
        throw MGFetchException(MGFetchException::NOT_FOUND,
                               "no METAR available for " + id, id, ORIGIN);
    }
    if (responseCode != 200) {
        std::ostringstream msg;
        msg << "fetching METAR for " << id << " failed: HTTP status " << responseCode;
        throw MGFetchException(MGFetchException::NETWORK, msg.str(), id, ORIGIN);
    }

    return extractReport(body, id);
}

} // of namespace metgear::HTTP
