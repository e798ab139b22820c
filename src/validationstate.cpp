// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "validationstate.h"

std::string VaultErrorToString(VaultError err)
{
    switch (err) {
    case VaultError::NONE: return "none";
    case VaultError::VALIDATION: return "validation-error";
    case VaultError::STATE_CONFLICT: return "state-conflict";
    case VaultError::RESOURCE_EXHAUSTED: return "resource-exhausted";
    case VaultError::COLLABORATOR_FAILURE: return "collaborator-failure";
    }
    return "unknown";
}

std::string CValidationState::ToString() const
{
    if (IsValid()) {
        return "Valid";
    }
    if (strDebugMessage.empty()) {
        return strRejectReason;
    }
    return strRejectReason + " (" + strDebugMessage + ")";
}
