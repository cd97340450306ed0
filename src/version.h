// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_VERSION_H
#define PAIRMINT_VERSION_H

#include <string>

/**
 * client versioning
 */
static const int CLIENT_VERSION_MAJOR = 1;
static const int CLIENT_VERSION_MINOR = 0;
static const int CLIENT_VERSION_REVISION = 0;

static const int CLIENT_VERSION =
    1000000 * CLIENT_VERSION_MAJOR
    + 10000 * CLIENT_VERSION_MINOR
    + 100 * CLIENT_VERSION_REVISION;

/**
 * State database layout version.
 *
 * History:
 *   1 = Initial layout (balances, collectibles, pairs, roles, events)
 *
 * Opening a database written with a different layout fails; there is no
 * in-place migration.
 */
static const int DB_SCHEMA_VERSION = 1;

std::string FormatFullVersion();

#endif // PAIRMINT_VERSION_H
