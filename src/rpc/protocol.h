// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_RPC_PROTOCOL_H
#define PAIRMINT_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS = -32602,
    RPC_INTERNAL_ERROR = -32603,
    RPC_PARSE_ERROR = -32700,

    //! General application defined errors
    RPC_MISC_ERROR = -1,               //!< std::exception thrown in command handling
    RPC_TYPE_ERROR = -3,               //!< Unexpected type was passed as parameter
    RPC_INVALID_ADDRESS_OR_KEY = -5,   //!< Invalid account or identifier
    RPC_INVALID_PARAMETER = -8,        //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR = -20,          //!< Database error
    RPC_DESERIALIZATION_ERROR = -22,   //!< Error parsing or validating structure in raw format

    //! Pairing engine errors, one per reject category
    RPC_PAIR_REJECTED = -40,           //!< Operation rejected as malformed
    RPC_PAIR_UNAUTHORIZED = -41,       //!< Missing role or not the owner
    RPC_PAIR_INSUFFICIENT = -42,       //!< Balance or allowance too low
    RPC_PAIR_INVARIANT = -43,          //!< Unknown or unpaired identifier
    RPC_PAIR_PAUSED = -44,             //!< Component is paused
    RPC_PAIR_NOT_DEPLOYED = -45,       //!< Deployment has not been bootstrapped
};

UniValue JSONRPCError(int code, const std::string& message);

#endif // PAIRMINT_RPC_PROTOCOL_H
