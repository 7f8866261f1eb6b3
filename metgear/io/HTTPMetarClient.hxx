// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief METAR report source using the aviationweather.gov data API.
 */

#pragma once

#include <string>

#include <metgear/io/MetarSource.hxx>

namespace metgear::HTTP
{

class MetarClient final : public MetarSource
{
public:
    struct Options
    {
        Options();

        /// the station id is appended to this
        std::string baseURL;
        /// whole request, in seconds
        long timeout;
        std::string userAgent;
    };

    MetarClient();
    explicit MetarClient(const Options& options);
    ~MetarClient() override;

    MetarClient(const MetarClient&) = delete;
    MetarClient& operator=(const MetarClient&) = delete;

    const Options& options() const { return _options; }

    /**
     * Blocking fetch of the latest report.
     *
     * @throw MGFetchException BAD_STATION for an invalid id, NETWORK for
     *        transport and HTTP errors, NOT_FOUND if the API returns no report
     */
    std::string fetch(const std::string& station) override;

    /// upper-cased station id
    /// @throw MGFetchException BAD_STATION unless 4 characters [A-Z0-9]
    static std::string normalizeStation(const std::string& station);

    /// the URL fetch() requests for an already normalized station
    std::string requestURL(const std::string& station) const;

    /**
     * First non-empty line of a response body.
     * @throw MGFetchException NOT_FOUND for an empty body or a "no METAR" reply
     */
    static std::string extractReport(const std::string& body, const std::string& station);

private:
    static size_t requestWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata);

    Options _options;
};

} // of namespace metgear::HTTP
