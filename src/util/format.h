// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_UTIL_FORMAT_H
#define PAIRMINT_UTIL_FORMAT_H

#include <tinyformat.h>

#include <string>

#ifndef strprintf
/** Format arguments printf-style and return the resulting string */
template <typename... Args>
std::string strprintf(const char* fmt, const Args&... args)
{
    return tfm::format(fmt, args...);
}
#endif

#endif // PAIRMINT_UTIL_FORMAT_H
