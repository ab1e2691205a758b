#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_schema.hpp"

namespace usagestat::db::sqlite {

using usagestat::db::ErrorCode;
using usagestat::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindOptionalU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
    if (v) {
        BindU64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static std::optional<uint64_t> ColOptionalU64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColU64(st, col);
}

static bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

// Reads sql::USAGESTAT_USAGE_COLUMNS starting at column `first`.
static model::UsageRecord ReadUsage(sqlite3_stmt* st, int first) {
    model::UsageRecord r;
    r.name = ColText(st, first + 0);
    r.kind = ColText(st, first + 1);
    r.call_count = ColU64(st, first + 2);
    r.last_accessed = ColText(st, first + 3);
    r.created_at = ColText(st, first + 4);
    r.total_input_tokens = ColU64(st, first + 5);
    r.total_output_tokens = ColU64(st, first + 6);
    r.total_response_chars = ColU64(st, first + 7);
    r.estimated_tokens = ColU64(st, first + 8);
    r.total_duration_ms = ColU64(st, first + 9);
    r.min_duration_ms = ColOptionalU64(st, first + 10);
    r.max_duration_ms = ColOptionalU64(st, first + 11);
    return r;
}

// name,tags,short_description,full_description,schema_version,updated_at
static model::MetadataRecord ReadMetadata(sqlite3_stmt* st, int first) {
    model::MetadataRecord r;
    r.name = ColText(st, first + 0);
    r.tags = ColText(st, first + 1);
    r.short_description = ColText(st, first + 2);
    r.full_description = ColText(st, first + 3);
    r.schema_version = static_cast<uint32_t>(sqlite3_column_int64(st, first + 4));
    r.updated_at = ColText(st, first + 5);
    return r;
}

static constexpr int kMetadataColumnCount = 6;

static void ThrowStepError(sqlite3* db, int rc, const char* what) {
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

SqliteRepository::SqliteRepository(std::string path, int busy_timeout_ms)
    : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms) {}

void SqliteRepository::EnsureSchema() {
    const std::filesystem::path db_path(path_);
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            throw util::StorageError("create storage directory " + db_path.parent_path().string() + ": " + ec.message());
        }
    }

    try {
        SqliteDB db(path_, busy_timeout_ms_);
        SchemaManager(db).Apply();
    } catch (const util::StorageError&) {
        throw;
    } catch (const std::exception& ex) {
        throw util::StorageError("initialize schema at " + path_ + ": " + ex.what());
    }
}

uint32_t SqliteRepository::SchemaVersion(Transaction& t) {
    return SchemaManager(TX(t).DB()).AppliedVersion();
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(std::make_shared<SqliteDB>(path_, busy_timeout_ms_));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::ReadOnly, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Usage
// ------------------------------------------------------------------

Result SqliteRepository::UpsertUsage(Transaction& t, const model::UsageDelta& d) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_USAGE, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, d.name);
    BindText(raw, 2, d.kind);
    BindText(raw, 3, d.accessed_at);
    BindU64(raw, 4, d.input_tokens);
    BindU64(raw, 5, d.output_tokens);
    BindU64(raw, 6, d.response_chars);
    BindU64(raw, 7, d.estimated_tokens);
    BindU64(raw, 8, d.duration_ms.value_or(0));
    BindOptionalU64(raw, 9, d.duration_ms);

    return Translate(db, sqlite3_step(raw));
}

Result SqliteRepository::AddTokens(Transaction& t, const std::string& name, uint64_t input_tokens,
                                   uint64_t output_tokens) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::ADD_TOKENS, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindU64(raw, 1, input_tokens);
    BindU64(raw, 2, output_tokens);
    BindText(raw, 3, name);

    const auto result = Translate(db, sqlite3_step(raw));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "no usage row for " + name);
    return result;
}

std::optional<model::UsageRecord>
SqliteRepository::GetUsage(Transaction& t, const std::string& name) {
    auto st = TX(t).DB().Prepare(sql::SELECT_USAGE);
    BindText(st.get(), 1, name);

    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW)
        return ReadUsage(st.get(), 0);

    ThrowStepError(TX(t).Handle(), rc, "select usage");
    return std::nullopt;
}

std::vector<model::UsageWithMetadata>
SqliteRepository::ListUsage(Transaction& t, const UsageFilter& filter) {
    std::string query = sql::SELECT_USAGE_WITH_METADATA;

    std::vector<std::string> conditions;
    if (filter.kind)
        conditions.emplace_back("u.kind = ?");
    if (!filter.include_zero)
        conditions.emplace_back("u.call_count > 0");

    for (std::size_t i = 0; i < conditions.size(); ++i) {
        query += i == 0 ? " WHERE " : " AND ";
        query += conditions[i];
    }

    query += sql::ORDER_USAGE;
    if (filter.limit > 0)
        query += " LIMIT ?";
    query += ";";

    auto st = TX(t).DB().Prepare(query);

    int idx = 1;
    if (filter.kind)
        BindText(st.get(), idx++, *filter.kind);
    if (filter.limit > 0)
        BindU64(st.get(), idx++, filter.limit);

    std::vector<model::UsageWithMetadata> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::UsageWithMetadata row;
        row.usage = ReadUsage(st.get(), 0);
        if (!ColIsNull(st.get(), sql::USAGE_COLUMN_COUNT))
            row.metadata = ReadMetadata(st.get(), sql::USAGE_COLUMN_COUNT);
        out.push_back(std::move(row));
    }
    ThrowStepError(TX(t).Handle(), rc, "list usage");

    return out;
}

Result SqliteRepository::DeleteToolUsage(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_TOOL_USAGE, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, name);
    return Translate(db, sqlite3_step(raw));
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_METADATA, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.name);
    BindText(raw, 2, r.tags);
    BindText(raw, 3, r.short_description);
    BindText(raw, 4, r.full_description);
    BindU64(raw, 5, r.schema_version);
    BindText(raw, 6, r.updated_at);

    return Translate(db, sqlite3_step(raw));
}

std::optional<model::MetadataRecord>
SqliteRepository::GetMetadata(Transaction& t, const std::string& name) {
    auto st = TX(t).DB().Prepare(sql::SELECT_METADATA);
    BindText(st.get(), 1, name);

    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW)
        return ReadMetadata(st.get(), 0);

    ThrowStepError(TX(t).Handle(), rc, "select metadata");
    return std::nullopt;
}

std::vector<model::MetadataRecord> SqliteRepository::ListMetadata(Transaction& t) {
    auto st = TX(t).DB().Prepare(sql::SELECT_ALL_METADATA);

    std::vector<model::MetadataRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW)
        out.push_back(ReadMetadata(st.get(), 0));
    ThrowStepError(TX(t).Handle(), rc, "list metadata");

    return out;
}

std::vector<model::MetadataWithUsage> SqliteRepository::ListCatalog(Transaction& t) {
    auto st = TX(t).DB().Prepare(sql::SELECT_CATALOG);

    std::vector<model::MetadataWithUsage> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::MetadataWithUsage row;
        row.metadata = ReadMetadata(st.get(), 0);
        if (!ColIsNull(st.get(), kMetadataColumnCount))
            row.usage = ReadUsage(st.get(), kMetadataColumnCount);
        out.push_back(std::move(row));
    }
    ThrowStepError(TX(t).Handle(), rc, "list catalog");

    return out;
}

Result SqliteRepository::DeleteMetadata(Transaction& t, const std::string& name) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_METADATA, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, name);
    return Translate(db, sqlite3_step(raw));
}

} // namespace usagestat::db::sqlite
