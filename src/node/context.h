// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_NODE_CONTEXT_H
#define PAIRMINT_NODE_CONTEXT_H

#include "pairs/pairengine.h"
#include "state/statedb.h"
#include "token/collectibles.h"
#include "token/tokenledger.h"

#include <memory>

/**
 * NodeContext - everything one deployment owns
 *
 * Passed by reference to init, RPC handlers and tests; there are no
 * global component instances. Members are declared so that the engine is
 * destroyed before the components it references, and the database last.
 */
struct NodeContext
{
    std::unique_ptr<CStateDB> statedb;
    std::unique_ptr<CTokenLedger> stablecoin;
    std::unique_ptr<CTokenLedger> pairledger;
    std::unique_ptr<CCollectibleRegistry> registry;
    std::unique_ptr<CPairEngine> engine;

    bool IsLoaded() const { return engine != nullptr; }

    void Reset()
    {
        engine.reset();
        registry.reset();
        pairledger.reset();
        stablecoin.reset();
        statedb.reset();
    }
};

#endif // PAIRMINT_NODE_CONTEXT_H
