// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_INIT_H
#define PAIRMINT_INIT_H

#include "account.h"
#include "amount.h"

#include <string>

struct NodeContext;
class CValidationState;

static const bool DEFAULT_PRINTTOCONSOLE = false;
static const bool DEFAULT_STARTPAUSED = false;
static const bool DEFAULT_SHRINKDEBUGFILE = true;
//! Default number of entries returned by getevents
static const int64_t DEFAULT_EVENT_COUNT = 100;

/** Fixed addresses of the deployed components */
CAccountID EngineAddress();
CAccountID PairLedgerAddress();
CAccountID RegistryAddress();
CAccountID StablecoinAddress();

/** Help for the options shared by every executable */
std::string HelpMessage();

/** Configure the logger from -debug, -printtoconsole and -logtimestamps */
void InitLogging();

/** Read -pairfee; false if it does not parse as an amount */
bool GetPairFee(CAmount& nFee, std::string& strError);

/**
 * Build the component objects over an already opened node.statedb.
 */
void LoadComponents(NodeContext& node, CAmount nFee);

/**
 * First-run bootstrap of a deployment.
 *
 * Grants admin the administrative roles of every component (admin, pauser,
 * plus emergency on the engine, urisetter on the registry and minter on the
 * stablecoin) and gives the engine minter, burner and transfer on the pair
 * ledger and the registry. A deployment marker makes a second call a no-op.
 */
bool DeployPairSystem(NodeContext& node, const CAccountID& admin, CValidationState& state);

/**
 * Open the state database in the data directory (or in memory), load the
 * components and bootstrap with -admin if the deployment is new.
 */
bool AppInitMain(NodeContext& node, bool fMemory, std::string& strError);

void Shutdown(NodeContext& node);

#endif // PAIRMINT_INIT_H
