#pragma once

namespace usagestat::db::sql {

/*
  Canonical SQL for the sqlite backend.

  The usage column order (name .. max_duration_ms) is relied upon by the row readers.
*/

// schema

static constexpr const char* CREATE_USAGE_TABLE =
    "CREATE TABLE IF NOT EXISTS usage_stats ("
    " name TEXT PRIMARY KEY,"
    " kind TEXT NOT NULL DEFAULT 'tool',"
    " call_count INTEGER NOT NULL DEFAULT 0,"
    " last_accessed TEXT NOT NULL,"
    " created_at TEXT NOT NULL,"
    " total_input_tokens INTEGER NOT NULL DEFAULT 0,"
    " total_output_tokens INTEGER NOT NULL DEFAULT 0,"
    " total_response_chars INTEGER NOT NULL DEFAULT 0,"
    " estimated_tokens INTEGER NOT NULL DEFAULT 0,"
    " total_duration_ms INTEGER NOT NULL DEFAULT 0,"
    " min_duration_ms INTEGER,"
    " max_duration_ms INTEGER);";

static constexpr const char* CREATE_METADATA_TABLE =
    "CREATE TABLE IF NOT EXISTS usage_metadata ("
    " name TEXT PRIMARY KEY,"
    " tags TEXT NOT NULL DEFAULT '',"
    " short_description TEXT NOT NULL DEFAULT '',"
    " full_description TEXT DEFAULT '',"
    " schema_version INTEGER NOT NULL DEFAULT 1,"
    " updated_at TEXT NOT NULL);";

static constexpr const char* CREATE_MIGRATIONS_TABLE =
    "CREATE TABLE IF NOT EXISTS usage_schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at TEXT NOT NULL);";

static constexpr const char* CREATE_KIND_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_usage_stats_kind ON usage_stats(kind);";

static constexpr const char* CREATE_CALL_COUNT_INDEX =
    "CREATE INDEX IF NOT EXISTS idx_usage_stats_call_count ON usage_stats(call_count DESC);";

static constexpr const char* MARK_MIGRATION_APPLIED =
    "INSERT OR IGNORE INTO usage_schema_migrations(version,applied_at) VALUES(?,?);";

static constexpr const char* SELECT_SCHEMA_VERSION =
    "SELECT COALESCE(MAX(version),0) FROM usage_schema_migrations;";

// usage

static constexpr int USAGE_COLUMN_COUNT = 12;

// ?1 name ?2 kind ?3 accessed_at ?4 input ?5 output ?6 chars ?7 estimated
// ?8 duration (0 when absent) ?9 duration (NULL when absent)
// Sums saturate at INT64_MAX instead of overflowing to REAL.
static constexpr const char* UPSERT_USAGE =
    "INSERT INTO usage_stats(name,kind,call_count,last_accessed,created_at,total_input_tokens,"
    "total_output_tokens,total_response_chars,estimated_tokens,total_duration_ms,min_duration_ms,max_duration_ms)"
    " VALUES(?1,?2,1,?3,?3,?4,?5,?6,?7,?8,?9,?9)"
    " ON CONFLICT(name) DO UPDATE SET"
    " kind=excluded.kind,"
    " call_count=usage_stats.call_count+1,"
    " last_accessed=excluded.last_accessed,"
    " total_input_tokens=MIN(usage_stats.total_input_tokens+excluded.total_input_tokens,9223372036854775807),"
    " total_output_tokens=MIN(usage_stats.total_output_tokens+excluded.total_output_tokens,9223372036854775807),"
    " total_response_chars=MIN(usage_stats.total_response_chars+excluded.total_response_chars,9223372036854775807),"
    " estimated_tokens=MIN(usage_stats.estimated_tokens+excluded.estimated_tokens,9223372036854775807),"
    " total_duration_ms=MIN(usage_stats.total_duration_ms+excluded.total_duration_ms,9223372036854775807),"
    " min_duration_ms=CASE"
    "  WHEN excluded.min_duration_ms IS NULL THEN usage_stats.min_duration_ms"
    "  WHEN usage_stats.min_duration_ms IS NULL THEN excluded.min_duration_ms"
    "  ELSE MIN(usage_stats.min_duration_ms,excluded.min_duration_ms) END,"
    " max_duration_ms=CASE"
    "  WHEN excluded.max_duration_ms IS NULL THEN usage_stats.max_duration_ms"
    "  WHEN usage_stats.max_duration_ms IS NULL THEN excluded.max_duration_ms"
    "  ELSE MAX(usage_stats.max_duration_ms,excluded.max_duration_ms) END;";

static constexpr const char* ADD_TOKENS =
    "UPDATE usage_stats SET"
    " total_input_tokens=MIN(total_input_tokens+?1,9223372036854775807),"
    " total_output_tokens=MIN(total_output_tokens+?2,9223372036854775807)"
    " WHERE name=?3;";

static constexpr const char* SELECT_USAGE =
    "SELECT name,kind,call_count,last_accessed,created_at,total_input_tokens,total_output_tokens,"
    "total_response_chars,estimated_tokens,total_duration_ms,min_duration_ms,max_duration_ms"
    " FROM usage_stats WHERE name=?;";

// filters and LIMIT are appended by the repository
static constexpr const char* SELECT_USAGE_WITH_METADATA =
    "SELECT u.name,u.kind,u.call_count,u.last_accessed,u.created_at,u.total_input_tokens,u.total_output_tokens,"
    "u.total_response_chars,u.estimated_tokens,u.total_duration_ms,u.min_duration_ms,u.max_duration_ms,"
    " m.name,m.tags,m.short_description,m.full_description,m.schema_version,m.updated_at"
    " FROM usage_stats u LEFT JOIN usage_metadata m ON u.name=m.name";

static constexpr const char* ORDER_USAGE =
    " ORDER BY u.call_count DESC, u.last_accessed DESC";

static constexpr const char* DELETE_TOOL_USAGE =
    "DELETE FROM usage_stats WHERE name=? AND kind='tool';";

// metadata

static constexpr const char* UPSERT_METADATA =
    "INSERT INTO usage_metadata(name,tags,short_description,full_description,schema_version,updated_at)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(name) DO UPDATE SET"
    " tags=excluded.tags,"
    " short_description=excluded.short_description,"
    " full_description=excluded.full_description,"
    " schema_version=excluded.schema_version,"
    " updated_at=excluded.updated_at;";

static constexpr const char* SELECT_METADATA =
    "SELECT name,tags,short_description,full_description,schema_version,updated_at"
    " FROM usage_metadata WHERE name=?;";

static constexpr const char* SELECT_ALL_METADATA =
    "SELECT name,tags,short_description,full_description,schema_version,updated_at"
    " FROM usage_metadata ORDER BY name;";

static constexpr const char* SELECT_CATALOG =
    "SELECT m.name,m.tags,m.short_description,m.full_description,m.schema_version,m.updated_at,"
    " u.name,u.kind,u.call_count,u.last_accessed,u.created_at,u.total_input_tokens,u.total_output_tokens,"
    "u.total_response_chars,u.estimated_tokens,u.total_duration_ms,u.min_duration_ms,u.max_duration_ms"
    " FROM usage_metadata m LEFT JOIN usage_stats u ON m.name=u.name;";

static constexpr const char* DELETE_METADATA =
    "DELETE FROM usage_metadata WHERE name=?;";

}
