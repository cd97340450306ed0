// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_SYNC_H
#define PAIRMINT_SYNC_H

#include <mutex>
#include <type_traits>

/**
 * Wrapped mutex: supports recursive locking, but no waiting.
 * A thread that re-enters a locked section (e.g. through a collaborator
 * calling back) gets the lock again; entry-point guards decide whether
 * that is allowed.
 */
typedef std::recursive_mutex RecursiveMutex;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::unique_lock<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // PAIRMINT_SYNC_H
