// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <registry/registry_status.h>

#include <sstream>

const char* RegistryErrorToString(RegistryError error) {
    switch (error) {
        case RegistryError::NONE: return "none";
        case RegistryError::AUTHORIZATION: return "authorization";
        case RegistryError::STATE_CONFLICT: return "state-conflict";
        case RegistryError::VALIDATION_FAILURE: return "validation-failure";
        case RegistryError::DUPLICATE_CONTENT: return "duplicate-content";
        case RegistryError::EXTERNAL_FAILURE: return "external-failure";
        case RegistryError::REENTRANCY_REJECTED: return "reentrancy-rejected";
    }
    return "unknown";
}

std::string CRangeViolation::ToString() const {
    std::ostringstream oss;
    oss << "index=" << nIndex
        << " min=" << static_cast<int>(nMin)
        << " value=" << static_cast<int>(nValue)
        << " max=" << static_cast<int>(nMax);
    return oss.str();
}

bool CRegistryStatus::Invalid(RegistryError error, const std::string& reason, const std::string& detail) {
    m_error = error;
    m_reason = reason;
    m_detail = detail;
    return false;
}

bool CRegistryStatus::InvalidRange(const CRangeViolation& violation, const std::string& detail) {
    m_violation = violation;
    return Invalid(RegistryError::VALIDATION_FAILURE, "code-out-of-range",
                   detail.empty() ? violation.ToString() : detail);
}

void CRegistryStatus::Clear() {
    m_error = RegistryError::NONE;
    m_reason.clear();
    m_detail.clear();
    m_violation = CRangeViolation();
}

std::string CRegistryStatus::ToString() const {
    if (IsValid()) {
        return "valid";
    }
    std::string result = std::string(RegistryErrorToString(m_error)) + ": " + m_reason;
    if (!m_detail.empty()) {
        result += " (" + m_detail + ")";
    }
    return result;
}
