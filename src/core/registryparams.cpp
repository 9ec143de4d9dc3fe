// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <core/registryparams.h>
#include <util/config.h>
#include <util/strencodings.h>

#include <algorithm>

namespace Seedline {

RegistryParams RegistryParams::Standard() {
    RegistryParams params;
    params.profile = STANDARD;
    params.codeLength = 256;
    params.founderSlots = 32;
    params.derivationFee = 0;
    params.registryAccount.fill(0xff);
    params.releaseOnReconsolidate = false;
    params.generatorExclusive = true;
    params.mintingOpen = true;
    return params;
}

RegistryParams RegistryParams::Extended() {
    RegistryParams params = Standard();
    params.profile = EXTENDED;
    params.codeLength = 300;
    return params;
}

bool ParseAccount(const std::string& hex, Account& account) {
    std::vector<uint8_t> bytes = ParseHex(hex);
    if (bytes.size() != account.size()) {
        return false;
    }
    std::copy(bytes.begin(), bytes.end(), account.begin());
    return true;
}

bool RegistryParams::FromConfig(const CConfigParser& config, RegistryParams& params, std::string& error) {
    std::string profile = config.GetString("profile", "standard");
    if (profile == "standard") {
        params = Standard();
    } else if (profile == "extended") {
        params = Extended();
    } else {
        error = "unknown profile '" + profile + "'";
        return false;
    }

    int64_t codeLength = params.codeLength;
    if (!config.GetInt64Strict("codelength", codeLength)) {
        error = "codelength is not an integer";
        return false;
    }
    if (codeLength < 1 || codeLength > MAX_CODE_LENGTH) {
        error = "codelength must be in [1, " + std::to_string(MAX_CODE_LENGTH) + "]";
        return false;
    }
    params.codeLength = static_cast<uint32_t>(codeLength);

    int64_t founderSlots = params.founderSlots;
    if (!config.GetInt64Strict("founderslots", founderSlots)) {
        error = "founderslots is not an integer";
        return false;
    }
    if (founderSlots < 1 || founderSlots > UINT32_MAX) {
        error = "founderslots must be in [1, " + std::to_string(UINT32_MAX) + "]";
        return false;
    }
    params.founderSlots = static_cast<uint32_t>(founderSlots);

    int64_t derivationFee = params.derivationFee;
    if (!config.GetInt64Strict("derivationfee", derivationFee)) {
        error = "derivationfee is not an integer";
        return false;
    }
    if (!MoneyRange(derivationFee)) {
        error = "derivationfee out of range";
        return false;
    }
    params.derivationFee = derivationFee;

    if (config.HasKey("registryaccount")) {
        if (!ParseAccount(config.GetString("registryaccount"), params.registryAccount)) {
            error = "registryaccount must be 40 hex characters";
            return false;
        }
    }

    params.releaseOnReconsolidate = config.GetBool("releaseonreconsolidate", params.releaseOnReconsolidate);
    params.generatorExclusive = config.GetBool("generatorexclusive", params.generatorExclusive);
    params.mintingOpen = config.GetBool("mintingopen", params.mintingOpen);

    return true;
}

} // namespace Seedline
