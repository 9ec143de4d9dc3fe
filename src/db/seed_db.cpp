// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <db/seed_db.h>
#include <db/db_errors.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <leveldb/write_batch.h>

#include <cstring>
#include <set>

const std::string CSeedDB::SEED_PREFIX = "seed:";
const std::string CSeedDB::HASH_PREFIX = "hash:";
const std::string CSeedDB::META_KEY = "meta";

namespace {

// Fixed-width fields are stored little-endian (host order on supported targets)
template <typename T>
void WriteField(std::string& out, const T& value) {
    char buf[sizeof(T)];
    std::memcpy(buf, &value, sizeof(T));
    out.append(buf, sizeof(T));
}

template <typename T>
bool ReadField(const std::string& in, size_t& offset, T& value) {
    if (in.size() < offset + sizeof(T)) {
        return false;
    }
    std::memcpy(&value, in.data() + offset, sizeof(T));
    offset += sizeof(T);
    return true;
}

bool ReadBytes(const std::string& in, size_t& offset, uint8_t* dest, size_t len) {
    if (in.size() < offset + len) {
        return false;
    }
    std::memcpy(dest, in.data() + offset, len);
    offset += len;
    return true;
}

enum MetaFlags : uint8_t {
    META_INITIALIZED = (1 << 0),
    META_MINTING_OPEN = (1 << 1),
    META_ERA_COMPLETE = (1 << 2),
    META_GATE_OPEN = (1 << 3),
    META_GENERATOR_INSTALLED = (1 << 4),
    META_SUCCESSION_PENDING = (1 << 5)
};

bool StartsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

CSeedDB::CSeedDB() {}

CSeedDB::~CSeedDB() {
    Close();
}

// ============================================================================
// Keys and serialization
// ============================================================================

std::string CSeedDB::MakeSeedKey(SeedId id) {
    // Big-endian hex so LevelDB iterates records in id order
    uint8_t bytes[8];
    for (int i = 0; i < 8; i++) {
        bytes[i] = static_cast<uint8_t>(id >> (56 - 8 * i));
    }
    return SEED_PREFIX + HexStr(bytes, sizeof(bytes));
}

std::string CSeedDB::MakeHashKey(const uint256& hash) {
    return HASH_PREFIX + hash.GetHex();
}

bool CSeedDB::IsRegistryKey(const std::string& key) {
    return key == META_KEY || StartsWith(key, SEED_PREFIX) || StartsWith(key, HASH_PREFIX);
}

std::string CSeedDB::SerializeSeed(const CSeed& seed) {
    // nId (8) + kind (1) + nMutations (4) + fAllowUnsignedMutation (1) +
    // nCreated (8) + nUpdated (8) + nBreedingFee (8) + hashContent (32) +
    // code length (4) + code
    std::string value;
    value.reserve(74 + seed.code.size());

    WriteField(value, seed.nId);
    WriteField(value, static_cast<uint8_t>(seed.kind));
    WriteField(value, seed.nMutations);
    WriteField(value, static_cast<uint8_t>(seed.fAllowUnsignedMutation ? 1 : 0));
    WriteField(value, seed.nCreated);
    WriteField(value, seed.nUpdated);
    WriteField(value, seed.nBreedingFee);
    value.append(reinterpret_cast<const char*>(seed.hashContent.begin()), 32);
    WriteField(value, static_cast<uint32_t>(seed.code.size()));
    if (!seed.code.empty()) {
        value.append(reinterpret_cast<const char*>(seed.code.Values().data()), seed.code.size());
    }
    return value;
}

bool CSeedDB::DeserializeSeed(const std::string& value, CSeed& seed) {
    seed.SetNull();

    size_t offset = 0;
    uint8_t kind = 0;
    uint8_t fAllow = 0;
    uint32_t nCodeLen = 0;

    if (!ReadField(value, offset, seed.nId) ||
        !ReadField(value, offset, kind) ||
        !ReadField(value, offset, seed.nMutations) ||
        !ReadField(value, offset, fAllow) ||
        !ReadField(value, offset, seed.nCreated) ||
        !ReadField(value, offset, seed.nUpdated) ||
        !ReadField(value, offset, seed.nBreedingFee) ||
        !ReadBytes(value, offset, seed.hashContent.begin(), 32) ||
        !ReadField(value, offset, nCodeLen)) {
        return false;
    }

    if (kind > static_cast<uint8_t>(SeedKind::DERIVED) || fAllow > 1) {
        return false;
    }
    if (value.size() - offset != nCodeLen) {
        return false;
    }

    seed.kind = static_cast<SeedKind>(kind);
    seed.fAllowUnsignedMutation = fAllow != 0;

    std::vector<uint8_t> code(value.begin() + offset, value.end());
    seed.code = CSeedCode(code);
    return true;
}

std::string CSeedDB::SerializeMeta(const CRegistryState& state) {
    uint8_t flags = 0;
    if (state.fInitialized) flags |= META_INITIALIZED;
    if (state.fMintingOpen) flags |= META_MINTING_OPEN;
    if (state.fFoundingEraComplete) flags |= META_ERA_COMPLETE;
    if (state.fGateOpen) flags |= META_GATE_OPEN;
    if (state.fGeneratorInstalled) flags |= META_GENERATOR_INSTALLED;
    if (state.fSuccessionPending) flags |= META_SUCCESSION_PENDING;

    std::string value;
    WriteField(value, DB_VERSION);
    WriteField(value, flags);
    WriteField(value, state.nFounderSlots);
    WriteField(value, state.nLastId);
    WriteField(value, state.nLastMarker);
    value.append(reinterpret_cast<const char*>(state.authority.data()), state.authority.size());
    value.append(reinterpret_cast<const char*>(state.previousAuthority.data()),
                 state.previousAuthority.size());
    WriteField(value, state.nAccruedBalance);
    return value;
}

bool CSeedDB::DeserializeMeta(const std::string& value, CRegistryState& state) {
    size_t offset = 0;
    uint32_t nVersion = 0;
    uint8_t flags = 0;

    if (!ReadField(value, offset, nVersion) || nVersion != DB_VERSION) {
        return false;
    }
    if (!ReadField(value, offset, flags) ||
        !ReadField(value, offset, state.nFounderSlots) ||
        !ReadField(value, offset, state.nLastId) ||
        !ReadField(value, offset, state.nLastMarker) ||
        !ReadBytes(value, offset, state.authority.data(), state.authority.size()) ||
        !ReadBytes(value, offset, state.previousAuthority.data(), state.previousAuthority.size()) ||
        !ReadField(value, offset, state.nAccruedBalance)) {
        return false;
    }
    if (offset != value.size()) {
        return false;
    }

    state.fInitialized = (flags & META_INITIALIZED) != 0;
    state.fMintingOpen = (flags & META_MINTING_OPEN) != 0;
    state.fFoundingEraComplete = (flags & META_ERA_COMPLETE) != 0;
    state.fGateOpen = (flags & META_GATE_OPEN) != 0;
    state.fGeneratorInstalled = (flags & META_GENERATOR_INSTALLED) != 0;
    state.fSuccessionPending = (flags & META_SUCCESSION_PENDING) != 0;
    return true;
}

// ============================================================================
// Open / Close
// ============================================================================

bool CSeedDB::Open(const std::string& path, bool fCreate) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        return true;  // Already open
    }

    leveldb::Options options;
    options.create_if_missing = fCreate;
    options.write_buffer_size = 4 * 1024 * 1024;
    options.max_open_files = 100;

    leveldb::DB* db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &db);
    if (!status.ok()) {
        LogPrintDB(ERROR, "Failed to open registry database at %s: %s", path.c_str(),
                   GetDBErrorMessage(status, ClassifyDBError(status)).c_str());
        return false;
    }

    m_db.reset(db);
    m_path = path;

    LogPrintDB(INFO, "Registry database opened: %s", path.c_str());
    return true;
}

void CSeedDB::Close() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_db) {
        m_db.reset();
        LogPrintDB(INFO, "Registry database closed: %s", m_path.c_str());
    }
}

bool CSeedDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

// ============================================================================
// State
// ============================================================================

bool CSeedDB::WriteState(const CRegistryState& state) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        LogPrintDB(ERROR, "WriteState: database not open");
        return false;
    }

    leveldb::WriteBatch batch;

    // Deletes first; a later Put for the same key in this batch wins
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (IsRegistryKey(key)) {
            batch.Delete(key);
        }
    }
    if (!it->status().ok()) {
        LogPrintDB(ERROR, "WriteState: iterator error: %s", it->status().ToString().c_str());
        return false;
    }
    it.reset();

    for (const auto& entry : state.mapSeeds) {
        batch.Put(MakeSeedKey(entry.first), SerializeSeed(entry.second));
    }
    for (const uint256& hash : state.hashIndex.GetAll()) {
        batch.Put(MakeHashKey(hash), std::string());
    }
    batch.Put(META_KEY, SerializeMeta(state));

    leveldb::WriteOptions write_options;
    write_options.sync = true;
    leveldb::Status status = m_db->Write(write_options, &batch);
    if (!status.ok()) {
        LogPrintDB(ERROR, "WriteState: %s", GetDBErrorMessage(status, ClassifyDBError(status)).c_str());
        return false;
    }

    LogPrintDB(DEBUG, "Wrote registry snapshot: %zu records, %zu fingerprints",
               state.mapSeeds.size(), state.hashIndex.Size());
    return true;
}

bool CSeedDB::ReadState(CRegistryState& state, std::string& error) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    state.SetNull();
    if (!m_db) {
        error = "database not open";
        return false;
    }

    std::string metaValue;
    leveldb::Status status = m_db->Get(leveldb::ReadOptions(), META_KEY, &metaValue);
    bool fHaveMeta = status.ok();
    if (!fHaveMeta && !status.IsNotFound()) {
        error = GetDBErrorMessage(status, ClassifyDBError(status));
        return false;
    }
    if (fHaveMeta && !DeserializeMeta(metaValue, state)) {
        error = "malformed metadata record";
        return false;
    }

    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();

        if (StartsWith(key, HASH_PREFIX)) {
            uint256 hash;
            if (!hash.SetHex(key.substr(HASH_PREFIX.size()))) {
                error = "malformed fingerprint key: " + key;
                return false;
            }
            state.hashIndex.Reserve(hash);
            continue;
        }

        if (!StartsWith(key, SEED_PREFIX)) {
            continue;
        }

        CSeed seed;
        if (!DeserializeSeed(it->value().ToString(), seed)) {
            error = "malformed record under " + key;
            return false;
        }
        if (MakeSeedKey(seed.nId) != key) {
            error = "record id does not match key " + key;
            return false;
        }
        state.mapSeeds[seed.nId] = seed;
    }
    if (!it->status().ok()) {
        error = GetDBErrorMessage(it->status(), ClassifyDBError(it->status()));
        return false;
    }

    if (!fHaveMeta) {
        if (!state.mapSeeds.empty() || state.hashIndex.Size() != 0) {
            error = "records present without metadata";
            state.SetNull();
            return false;
        }
        return true;
    }

    // Cross-check records against the metadata and the fingerprint set
    for (const auto& entry : state.mapSeeds) {
        const CSeed& seed = entry.second;
        std::string label = "record " + std::to_string(entry.first);

        if (seed.nId == NULL_SEED_ID || seed.nId > state.nLastId) {
            error = label + " lies outside the allocated id range";
            state.SetNull();
            return false;
        }
        if ((seed.kind == SeedKind::DERIVED) == state.IsFounderSlot(seed.nId)) {
            error = label + " has kind " + SeedKindToString(seed.kind) + " outside its id range";
            state.SetNull();
            return false;
        }
        if (!MoneyRange(seed.nBreedingFee)) {
            error = label + " has an out-of-range breeding fee";
            state.SetNull();
            return false;
        }
        if (!seed.HasCode()) {
            if (!seed.code.empty() || !seed.hashContent.IsNull()) {
                error = label + " is pending but carries code";
                state.SetNull();
                return false;
            }
            continue;
        }
        if (seed.code.empty() || seed.code.GetHash() != seed.hashContent) {
            error = label + " fingerprint does not match its code";
            state.SetNull();
            return false;
        }
        if (!state.hashIndex.Contains(seed.hashContent)) {
            error = label + " fingerprint is not reserved";
            state.SetNull();
            return false;
        }
    }

    LogPrintDB(INFO, "Read registry snapshot: %zu records, %zu fingerprints",
               state.mapSeeds.size(), state.hashIndex.Size());
    return true;
}

bool CSeedDB::Clear() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_db) {
        LogPrintDB(ERROR, "Clear: database not open");
        return false;
    }

    LogPrintDB(WARN, "Clearing registry database %s", m_path.c_str());

    leveldb::WriteBatch batch;
    std::unique_ptr<leveldb::Iterator> it(m_db->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (IsRegistryKey(key)) {
            batch.Delete(key);
        }
    }
    if (!it->status().ok()) {
        LogPrintDB(ERROR, "Clear: iterator error: %s", it->status().ToString().c_str());
        return false;
    }
    it.reset();

    leveldb::WriteOptions write_options;
    write_options.sync = true;
    leveldb::Status status = m_db->Write(write_options, &batch);
    if (!status.ok()) {
        LogPrintDB(ERROR, "Clear: %s", GetDBErrorMessage(status, ClassifyDBError(status)).c_str());
        return false;
    }
    return true;
}
