// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PAIRMINT_CONSENSUS_VALIDATION_H
#define PAIRMINT_CONSENSUS_VALIDATION_H

#include <string>

/**
 * "reject" codes, one per failure category.
 *
 * Every rejected operation leaves no state behind; the code tells the caller
 * which class of precondition failed, the reason string which one.
 */
static const unsigned char REJECT_INVALID = 0x10;       //!< malformed input (zero address, bad pointer, zero amount)
static const unsigned char REJECT_UNAUTHORIZED = 0x20;  //!< missing role or not the asset owner
static const unsigned char REJECT_INSUFFICIENT = 0x30;  //!< balance or allowance too low
static const unsigned char REJECT_INVARIANT = 0x40;     //!< unknown or already unpaired identifier, broken pairing
static const unsigned char REJECT_PAUSED = 0x50;        //!< component is paused
static const unsigned char REJECT_INTERNAL = 0x60;      //!< storage failure

/** Human readable name of a reject code */
inline std::string GetRejectCategory(unsigned char code)
{
    switch (code) {
    case REJECT_INVALID: return "invalid";
    case REJECT_UNAUTHORIZED: return "unauthorized";
    case REJECT_INSUFFICIENT: return "insufficient";
    case REJECT_INVARIANT: return "invariant";
    case REJECT_PAUSED: return "paused";
    case REJECT_INTERNAL: return "internal";
    }
    return "unknown";
}

/** Capture information about operation validation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< operation rejected, nothing applied
        MODE_ERROR,   //!< run-time error
    } mode;
    std::string strRejectReason;
    unsigned int chRejectCode;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool Invalid(bool ret = false,
                 unsigned int _chRejectCode = 0,
                 const std::string& _strRejectReason = "",
                 const std::string& _strDebugMessage = "")
    {
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        strDebugMessage = _strDebugMessage;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        chRejectCode = REJECT_INTERNAL;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CValidationState to a human-readable message for logging */
inline std::string FormatStateMessage(const CValidationState& state)
{
    std::string str = state.GetRejectReason();
    if (!state.GetDebugMessage().empty())
        str += ", " + state.GetDebugMessage();
    str += " (code " + std::to_string(state.GetRejectCode()) + ")";
    return str;
}

#endif // PAIRMINT_CONSENSUS_VALIDATION_H
