// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2013 James Turner <zakalawe@mac.com>

/**
 * @file
 * @brief Buffer certain log messages permanently for later retrieval and display
 */

#ifndef MG_DEBUG_BUFFEREDLOGCALLBACK_HXX
#define MG_DEBUG_BUFFEREDLOGCALLBACK_HXX

#include <string>
#include <vector>
#include <memory> // for std::unique_ptr

#include <metgear/debug/LogCallback.hxx>

namespace metgear
{

class BufferedLogCallback : public LogCallback
{
public:
    BufferedLogCallback(mgDebugClass c, mgDebugPriority p);
    virtual ~BufferedLogCallback();

    /// truncate messages longer than a certain length.
    void truncateAt(unsigned int);

    void operator()(mgDebugClass c, mgDebugPriority p,
        const char* file, int line, const std::string& aMessage) override;

    /**
     * read the stamp value associated with the log buffer. This is
     * incremented whenever the log contents change, so can be used
     * to poll for changes.
     */
    unsigned int stamp() const;

    typedef std::vector<std::string> vector_string;

    /**
     * copy the buffered log data into the provided output list
     * (which will be cleared first). This method is safe to call from
     * any thread.
     *
     * returns the stamp value of the copied data
     */
    unsigned int threadsafeCopy(vector_string& aOutput) const;

    /// drop everything buffered so far; the stamp keeps counting
    void clear();
private:
    class BufferedLogCallbackPrivate;
    std::unique_ptr<BufferedLogCallbackPrivate> d;
};


} // of namespace metgear

#endif // of MG_DEBUG_BUFFEREDLOGCALLBACK_HXX
