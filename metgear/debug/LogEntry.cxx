// SPDX-License-Identifier: LGPL-2.1-or-later

#include <metgear_config.h>

#include "LogEntry.hxx"

namespace metgear {

std::string LogEntry::shortFile() const
{
    const auto slash = file.find_last_of("/\\");
    if (slash == std::string::npos)
        return file;
    return file.substr(slash + 1);
}

} // namespace metgear
