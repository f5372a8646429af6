#ifndef PRIVACYGUARD_STORAGE_RESTORATION_VAULT_HPP
#define PRIVACYGUARD_STORAGE_RESTORATION_VAULT_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include <zlib.h>
#include "core/errors.hpp"
#include "core/restoration_table.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace privacyguard {
namespace storage {

/*
  RestorationVault
  --------------------------------
  Keeps restoration tables in a SQLite file so that sanitized text can be
  restored later, in another process.

  - One row per document id. The id hashes the sanitized text together
    with its table, so two originals that sanitize to the same text still
    get separate rows.
  - The table is stored as its JSON form, zlib-compressed.
  - Store() never overwrites a different table: an existing id with the
    same payload is a no-op, with another payload a VaultError.
    Tables are never merged.
  - Every SQLite or zlib failure throws VaultError.
  - The connection stays open for the lifetime of the object; calls are
    serialized with a mutex.
*/

class RestorationVault {
  public:
    explicit RestorationVault(const std::string& dbFilePath) : m_dbFilePath(dbFilePath), m_db(nullptr, &sqlite3_close) {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open(m_dbFilePath.c_str(), &raw);
        m_db.reset(raw);
        if (rc != SQLITE_OK) {
            std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
            throw VaultError("RestorationVault: cannot open " + m_dbFilePath + ": " + msg);
        }
        initDatabaseSchema();
        util::logger::debug("[RestorationVault] Opened " + m_dbFilePath);
    }

    // Document id for one anonymization result. The NUL separator keeps the
    // text/table boundary unambiguous.
    static std::string DocumentId(const std::string& sanitizedText, const core::RestorationTable& table) {
        return util::hashing::sha256Hex(sanitizedText + '\0' + core::tableToJson(table));
    }

    void Store(const std::string& documentId, const core::RestorationTable& table) {
        std::lock_guard<std::mutex> lock(m_mutex);

        const std::string json = core::tableToJson(table);
        auto existing = loadJson(documentId);
        if (existing) {
            if (*existing == json) {
                util::logger::debug("[RestorationVault] Table " + documentId + " already stored");
                return;
            }
            util::logger::error("[RestorationVault] Refusing to overwrite table " + documentId);
            throw VaultError("RestorationVault: a different table is already stored under " + documentId);
        }

        std::vector<unsigned char> compressed = compressPayload(json);

        Statement stmt = prepare("INSERT INTO restoration_tables "
                                 "(document_id, entry_count, raw_size, payload) VALUES (?, ?, ?, ?);");
        check(sqlite3_bind_text(stmt.get(), 1, documentId.c_str(), -1, SQLITE_TRANSIENT), "bind id");
        check(sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(table.size())), "bind count");
        check(sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(json.size())), "bind size");
        check(sqlite3_bind_blob(stmt.get(), 4, compressed.data(), static_cast<int>(compressed.size()),
                                SQLITE_TRANSIENT),
              "bind payload");

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            fail("store");
        }
        util::logger::info("[RestorationVault] Stored table " + documentId + " (" +
                           std::to_string(table.size()) + " entries)");
    }

    std::optional<core::RestorationTable> Load(const std::string& documentId) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto json = loadJson(documentId);
        if (!json) {
            util::logger::warn("[RestorationVault] No table for " + documentId);
            return std::nullopt;
        }
        try {
            return core::tableFromJson(*json);
        } catch (const JsonError& ex) {
            throw VaultError("RestorationVault: corrupt payload for " + documentId + ": " + ex.what());
        }
    }

    // Returns true if a row was deleted.
    bool Remove(const std::string& documentId) {
        std::lock_guard<std::mutex> lock(m_mutex);

        Statement stmt = prepare("DELETE FROM restoration_tables WHERE document_id = ?;");
        check(sqlite3_bind_text(stmt.get(), 1, documentId.c_str(), -1, SQLITE_TRANSIENT), "bind id");
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            fail("remove");
        }
        return sqlite3_changes(m_db.get()) > 0;
    }

    size_t Count() {
        std::lock_guard<std::mutex> lock(m_mutex);

        Statement stmt = prepare("SELECT COUNT(*) FROM restoration_tables;");
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            fail("count");
        }
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

  private:
    using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    void initDatabaseSchema() {
        const char* ddl = "CREATE TABLE IF NOT EXISTS restoration_tables ("
                          " document_id TEXT PRIMARY KEY,"
                          " entry_count INTEGER NOT NULL,"
                          " raw_size INTEGER NOT NULL,"
                          " payload BLOB NOT NULL,"
                          " created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                          ");";

        char* errMsg = nullptr;
        int rc = sqlite3_exec(m_db.get(), ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string msg = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw VaultError("RestorationVault: schema init failed: " + msg);
        }
    }

    // Decompressed payload of a row, nullopt if there is none. Caller holds m_mutex.
    std::optional<std::string> loadJson(const std::string& documentId) {
        Statement stmt = prepare("SELECT raw_size, payload FROM restoration_tables WHERE document_id = ?;");
        check(sqlite3_bind_text(stmt.get(), 1, documentId.c_str(), -1, SQLITE_TRANSIENT), "bind id");

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            fail("load");
        }

        sqlite3_int64 rawSize = sqlite3_column_int64(stmt.get(), 0);
        const void* blob = sqlite3_column_blob(stmt.get(), 1);
        int blobLen = sqlite3_column_bytes(stmt.get(), 1);
        if (rawSize < 0 || blobLen < 0 || (blobLen > 0 && blob == nullptr)) {
            throw VaultError("RestorationVault: corrupt row for " + documentId);
        }

        return decompressPayload(static_cast<const unsigned char*>(blob),
                                 static_cast<size_t>(blobLen),
                                 static_cast<size_t>(rawSize));
    }

    Statement prepare(const char* sql) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(m_db.get(), sql, -1, &raw, nullptr) != SQLITE_OK || !raw) {
            sqlite3_finalize(raw);
            fail("prepare");
        }
        return Statement(raw, &sqlite3_finalize);
    }

    void check(int rc, const char* what) {
        if (rc != SQLITE_OK) {
            fail(what);
        }
    }

    [[noreturn]] void fail(const std::string& what) {
        std::string msg = "RestorationVault: " + what + " failed: " + sqlite3_errmsg(m_db.get());
        util::logger::error("[RestorationVault] " + what + " failed on " + m_dbFilePath);
        throw VaultError(msg);
    }

    static std::vector<unsigned char> compressPayload(const std::string& json) {
        uLongf outSize = compressBound(static_cast<uLong>(json.size()));
        std::vector<unsigned char> out(outSize);
        if (compress2(out.data(), &outSize, reinterpret_cast<const Bytef*>(json.data()),
                      static_cast<uLong>(json.size()), Z_BEST_COMPRESSION) != Z_OK) {
            throw VaultError("RestorationVault: compression failed");
        }
        out.resize(outSize);
        return out;
    }

    static std::string decompressPayload(const unsigned char* data, size_t len, size_t rawSize) {
        // The smallest payload is "{}".
        if (rawSize == 0) {
            throw VaultError("RestorationVault: empty payload");
        }
        std::string out(rawSize, '\0');
        uLongf outSize = static_cast<uLongf>(rawSize);
        int rc = uncompress(reinterpret_cast<Bytef*>(&out[0]), &outSize, data, static_cast<uLong>(len));
        if (rc != Z_OK || outSize != rawSize) {
            throw VaultError("RestorationVault: decompression failed (zlib code " + std::to_string(rc) + ")");
        }
        return out;
    }

  private:
    std::string m_dbFilePath;
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> m_db;
    std::mutex m_mutex;
};

} // namespace storage
} // namespace privacyguard

#endif // PRIVACYGUARD_STORAGE_RESTORATION_VAULT_HPP
