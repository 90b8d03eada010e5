#include "sqlite_archive.hpp"
#include "record_json.hpp"
#include "vector.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <cstdio>
#include <filesystem>
#include <iostream>

namespace taleweave {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// RAII wrapper for sqlite3 connection
struct DbGuard {
    sqlite3* db = nullptr;
    ~DbGuard() { if (db) sqlite3_close(db); }
};

constexpr const char* kCreateTable =
    "CREATE TABLE memories ("
    "  position     INTEGER PRIMARY KEY,"
    "  id           TEXT,"
    "  kind         TEXT,"
    "  text         TEXT,"
    "  owner_id     TEXT,"
    "  created_at   TEXT,"
    "  importance   REAL,"
    "  emotion      TEXT,"
    "  location     TEXT,"
    "  participants TEXT,"
    "  decay_rate   REAL,"
    "  fact_type    TEXT,"
    "  subject      TEXT,"
    "  confidence   REAL,"
    "  source       TEXT,"
    "  embedding    BLOB"
    ");";

constexpr const char* kInsert =
    "INSERT INTO memories (position, id, kind, text, owner_id, created_at,"
    " importance, emotion, location, participants, decay_rate,"
    " fact_type, subject, confidence, source, embedding)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

constexpr const char* kSelect =
    "SELECT id, kind, text, owner_id, created_at,"
    " importance, emotion, location, participants, decay_rate,"
    " fact_type, subject, confidence, source, embedding"
    " FROM memories ORDER BY position;";

void bind_text(sqlite3_stmt* stmt, int col, const std::string& value) {
    sqlite3_bind_text(stmt, col, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void remove_quietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

bool exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[archive] sqlite: " << (err ? err : "unknown error")
                  << " (" << sql << ")\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool insert_records(sqlite3* db, const std::vector<MemoryRecord>& records,
                    bool include_embeddings) {
    StmtGuard g;
    if (sqlite3_prepare_v2(db, kInsert, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[archive] sqlite prepare failed: " << sqlite3_errmsg(db) << "\n";
        return false;
    }

    int64_t position = 0;
    for (const auto& record : records) {
        sqlite3_reset(g.stmt);
        sqlite3_clear_bindings(g.stmt);

        sqlite3_bind_int64(g.stmt, 1, position++);
        bind_text(g.stmt, 2, record.id);
        bind_text(g.stmt, 3, kind_to_string(record.kind()));
        bind_text(g.stmt, 4, record.text);
        bind_text(g.stmt, 5, record.owner_id);
        bind_text(g.stmt, 6, format_iso8601(record.created_at));

        if (const auto* ep = record.episodic()) {
            sqlite3_bind_double(g.stmt, 7, ep->importance);
            bind_text(g.stmt, 8, emotion_to_string(ep->emotion));
            bind_text(g.stmt, 9, ep->location);
            bind_text(g.stmt, 10, nlohmann::json(ep->participants)
                                      .dump(-1, ' ', false,
                                            nlohmann::json::error_handler_t::replace));
            sqlite3_bind_double(g.stmt, 11, ep->decay_rate);
        } else if (const auto* sem = record.semantic()) {
            bind_text(g.stmt, 12, fact_type_to_string(sem->fact_type));
            bind_text(g.stmt, 13, sem->subject);
            sqlite3_bind_double(g.stmt, 14, sem->confidence);
            bind_text(g.stmt, 15, sem->source);
        }

        std::string blob;
        if (include_embeddings && !record.embedding.empty()) {
            blob = embedding_to_blob(record.embedding);
            sqlite3_bind_blob(g.stmt, 16, blob.data(), static_cast<int>(blob.size()),
                              SQLITE_TRANSIENT);
        }

        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            std::cerr << "[archive] sqlite insert of " << record.id << " failed: "
                      << sqlite3_errmsg(db) << "\n";
            return false;
        }
    }
    return true;
}

// Rebuild a row as the JSON shape record_from_json() validates.
// NULL columns are left out so that required-field checks apply.
nlohmann::json row_to_json(sqlite3_stmt* stmt) {
    static const char* const kColumns[] = {
        "id", "kind", "text", "owner_id", "created_at",
        "importance", "emotion", "location", "participants", "decay_rate",
        "fact_type", "subject", "confidence", "source"
    };

    nlohmann::json item = nlohmann::json::object();
    for (int col = 0; col < 14; col++) {
        int type = sqlite3_column_type(stmt, col);
        if (type == SQLITE_NULL) continue;

        const char* name = kColumns[col];
        if (type == SQLITE_INTEGER || type == SQLITE_FLOAT) {
            item[name] = sqlite3_column_double(stmt, col);
        } else if (auto* v = sqlite3_column_text(stmt, col)) {
            item[name] = std::string(reinterpret_cast<const char*>(v));
        }
    }

    if (item.contains("participants")) {
        auto parsed = nlohmann::json::parse(item["participants"].get<std::string>(),
                                            nullptr, false);
        if (parsed.is_array()) {
            item["participants"] = std::move(parsed);
        } else {
            item.erase("participants");
        }
    }

    if (sqlite3_column_type(stmt, 14) == SQLITE_BLOB) {
        auto vec = embedding_from_blob(sqlite3_column_blob(stmt, 14),
                                       static_cast<size_t>(sqlite3_column_bytes(stmt, 14)));
        if (!vec.empty()) item["embedding"] = vec;
    }
    return item;
}

} // namespace

bool SqliteArchive::write(const std::vector<MemoryRecord>& records, bool include_embeddings) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[archive] Cannot create directory " << parent.string()
                      << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::string tmp = path_ + ".tmp";
    remove_quietly(tmp);
    remove_quietly(tmp + "-journal");

    bool ok = false;
    {
        DbGuard g;
        if (sqlite3_open_v2(tmp.c_str(), &g.db,
                            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
            std::cerr << "[archive] Cannot create " << tmp << ": "
                      << (g.db ? sqlite3_errmsg(g.db) : "out of memory") << "\n";
        } else {
            ok = exec(g.db, "PRAGMA synchronous=FULL;") &&
                 exec(g.db, "PRAGMA user_version=1;") &&
                 exec(g.db, "BEGIN;") &&
                 exec(g.db, kCreateTable) &&
                 insert_records(g.db, records, include_embeddings) &&
                 exec(g.db, "COMMIT;");
        }
    }

    if (!ok) {
        remove_quietly(tmp);
        remove_quietly(tmp + "-journal");
        return false;
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        std::cerr << "[archive] Rename " << tmp << " -> " << path_ << " failed\n";
        remove_quietly(tmp);
        return false;
    }
    return true;
}

ArchiveSnapshot SqliteArchive::read() {
    ArchiveSnapshot snapshot;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return snapshot;

    DbGuard db;
    if (sqlite3_open_v2(path_.c_str(), &db.db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::string err = db.db ? sqlite3_errmsg(db.db) : "out of memory";
        throw ArchiveError("sqlite archive " + path_ + " cannot be opened: " + err);
    }

    StmtGuard g;
    if (sqlite3_prepare_v2(db.db, kSelect, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw ArchiveError("sqlite archive " + path_ + " is unreadable: " +
                           sqlite3_errmsg(db.db));
    }

    size_t index = 0;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        std::string error;
        auto record = record_from_json(row_to_json(g.stmt), error);
        if (record) {
            snapshot.records.push_back(std::move(*record));
        } else {
            snapshot.skipped++;
            snapshot.diagnostics.push_back("record " + std::to_string(index) + ": " + error);
        }
        index++;
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw ArchiveError("sqlite archive " + path_ + " read failed: " +
                           sqlite3_errmsg(db.db));
    }
    return snapshot;
}

} // namespace taleweave
