// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#ifndef SEEDLINE_DB_SEED_DB_H
#define SEEDLINE_DB_SEED_DB_H

/**
 * Seed Registry Database
 *
 * LevelDB snapshot of a CRegistryState so a registry survives restarts.
 * Owners are not stored; they belong to the ownership ledger.
 *
 * Key formats:
 *   "seed:" + 16 hex id digits      → serialized record (see SerializeSeed)
 *   "hash:" + 64 hex fingerprint    → empty (reserved fingerprint)
 *   "meta"                          → flags, counters, authority, balance
 */

#include <registry/registry_state.h>

#include <leveldb/db.h>

#include <memory>
#include <mutex>
#include <string>

class CSeedDB {
public:
    CSeedDB();
    ~CSeedDB();

    // Prevent copying
    CSeedDB(const CSeedDB&) = delete;
    CSeedDB& operator=(const CSeedDB&) = delete;

    /**
     * Open or create the database
     * @param path Directory for LevelDB files
     * @param fCreate Create the database if it does not exist
     */
    bool Open(const std::string& path, bool fCreate = true);
    void Close();
    bool IsOpen() const;

    /**
     * Replace the stored snapshot with `state`
     *
     * Written as a single synced WriteBatch: either the whole snapshot
     * lands or the previous one stays.
     */
    bool WriteState(const CRegistryState& state);

    /**
     * Load the stored snapshot
     *
     * An empty database yields a null (uninitialized) state. Fails if any
     * record does not deserialize, a stored fingerprint does not match its
     * code, a record's fingerprint is not reserved, or a record id lies
     * beyond the stored last id.
     */
    bool ReadState(CRegistryState& state, std::string& error) const;

    /** Drop every registry key */
    bool Clear();

    static constexpr uint32_t DB_VERSION = 1;

private:
    static const std::string SEED_PREFIX;
    static const std::string HASH_PREFIX;
    static const std::string META_KEY;

    static std::string MakeSeedKey(SeedId id);
    static std::string MakeHashKey(const uint256& hash);

    static std::string SerializeSeed(const CSeed& seed);
    static bool DeserializeSeed(const std::string& value, CSeed& seed);

    static std::string SerializeMeta(const CRegistryState& state);
    static bool DeserializeMeta(const std::string& value, CRegistryState& state);

    static bool IsRegistryKey(const std::string& key);

    std::unique_ptr<leveldb::DB> m_db;
    std::string m_path;
    mutable std::mutex m_mutex;
};

#endif // SEEDLINE_DB_SEED_DB_H
