#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace prefixid::db::sql {

/*
  SQL flavours the counter statements are rendered for.

  Postgres: $1 $2 $3, row locks via FOR UPDATE
  SQLite:   ? ? ?,    writers serialized by BEGIN IMMEDIATE
*/
enum class Dialect {
  kSqlite,
  kPostgres,
};

// [A-Za-z_][A-Za-z0-9_]*
bool IsValidIdentifier(std::string_view name);

/*
  Physical layout of one counter table plus the canonical statements
  run against it. Names are validated on construction so they can be
  spliced into SQL text; values are always bound as parameters.
*/
class CounterTable {
 public:
  static constexpr const char*   kDefaultTableName     = "id_sequences";
  static constexpr const char*   kDefaultSegmentColumn = "sequence_name";
  static constexpr std::uint32_t kDefaultSegmentLength = 255;
  static constexpr const char*   kDefaultValueColumn   = "next_val";

  CounterTable();

  // Throws util::ConfigurationError on invalid names or a zero length.
  // table_name may be schema-qualified ("schema.table").
  CounterTable(std::string table_name, std::string segment_column, std::uint32_t segment_length, std::string value_column);

  const std::string& TableName() const {
    return table_name_;
  }
  const std::string& SegmentColumn() const {
    return segment_column_;
  }
  std::uint32_t SegmentLength() const {
    return segment_length_;
  }
  const std::string& ValueColumn() const {
    return value_column_;
  }

  // SELECT value FROM t WHERE segment=? [FOR UPDATE]
  std::string SelectSql(Dialect dialect) const;

  // INSERT ... ON CONFLICT(segment) DO NOTHING
  std::string InsertSql(Dialect dialect) const;

  // UPDATE t SET value=? WHERE value=? AND segment=?
  std::string UpdateSql(Dialect dialect) const;

  std::string ListSql(Dialect dialect) const;

  std::string CreateTableSql() const;

 private:
  std::string   table_name_;
  std::string   segment_column_;
  std::uint32_t segment_length_;
  std::string   value_column_;
};

} // namespace prefixid::db::sql
