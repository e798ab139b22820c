// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PIGGY_VALIDATIONSTATE_H
#define PIGGY_VALIDATIONSTATE_H

#include <string>

/** Error classes reported through CValidationState */
enum class VaultError {
    NONE = 0,
    //! Bad amount, plan, caller or ownership. Rejected before any mutation.
    VALIDATION,
    //! Already withdrawn, not matured, position already finalized.
    STATE_CONFLICT,
    //! A finite resource cannot cover the request.
    RESOURCE_EXHAUSTED,
    //! Token Ledger transfer failed. The whole operation was rolled back.
    COLLABORATOR_FAILURE,
};

std::string VaultErrorToString(VaultError err);

/** Capture information about an operation's validation result */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< request was rejected
        MODE_ERROR,   //!< run-time error
    } mode;
    VaultError nErrorClass;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), nErrorClass(VaultError::NONE) {}

    bool Invalid(bool ret = false,
                 VaultError errorClass = VaultError::VALIDATION,
                 const std::string& strRejectReasonIn = "",
                 const std::string& strDebugMessageIn = "")
    {
        nErrorClass = errorClass;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }

    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }
    bool IsError() const { return mode == MODE_ERROR; }

    VaultError GetErrorClass() const { return nErrorClass; }
    const std::string& GetRejectReason() const { return strRejectReason; }
    const std::string& GetDebugMessage() const { return strDebugMessage; }

    /** "reason-code (debug message)" for logs and CLI output */
    std::string ToString() const;
};

#endif // PIGGY_VALIDATIONSTATE_H
