#include "internal/db/sql/counter_table.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace prefixid::db::sql {

namespace {

bool IsIdentStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool IsIdentChar(char c) {
  return IsIdentStart(c) || (c >= '0' && c <= '9');
}

bool IsValidTableName(std::string_view name) {
  const auto dot = name.find('.');
  if (dot == std::string_view::npos) {
    return IsValidIdentifier(name);
  }
  return IsValidIdentifier(name.substr(0, dot)) && IsValidIdentifier(name.substr(dot + 1));
}

std::string Placeholder(Dialect dialect, int index) {
  if (dialect == Dialect::kPostgres) {
    return "$" + std::to_string(index);
  }
  return "?";
}

} // namespace

bool IsValidIdentifier(std::string_view name) {
  if (name.empty() || !IsIdentStart(name.front())) {
    return false;
  }
  for (char c : name) {
    if (!IsIdentChar(c)) {
      return false;
    }
  }
  return true;
}

CounterTable::CounterTable()
    : table_name_(kDefaultTableName),
      segment_column_(kDefaultSegmentColumn),
      segment_length_(kDefaultSegmentLength),
      value_column_(kDefaultValueColumn) {
}

CounterTable::CounterTable(std::string table_name, std::string segment_column, std::uint32_t segment_length, std::string value_column)
    : table_name_(std::move(table_name)),
      segment_column_(std::move(segment_column)),
      segment_length_(segment_length),
      value_column_(std::move(value_column)) {
  if (!IsValidTableName(table_name_)) {
    throw util::ConfigurationError("counter table: invalid table name '" + table_name_ + "'");
  }
  if (!IsValidIdentifier(segment_column_)) {
    throw util::ConfigurationError("counter table: invalid segment column name '" + segment_column_ + "'");
  }
  if (!IsValidIdentifier(value_column_)) {
    throw util::ConfigurationError("counter table: invalid value column name '" + value_column_ + "'");
  }
  if (segment_column_ == value_column_) {
    throw util::ConfigurationError("counter table: segment and value columns must differ");
  }
  if (segment_length_ == 0) {
    throw util::ConfigurationError("counter table: segment value length must be positive");
  }
}

std::string CounterTable::SelectSql(Dialect dialect) const {
  std::string sql = "SELECT tbl." + value_column_ + " FROM " + table_name_ + " tbl WHERE tbl." + segment_column_ + "=" +
                    Placeholder(dialect, 1);
  if (dialect == Dialect::kPostgres) {
    sql += " FOR UPDATE";
  }
  return sql + ";";
}

std::string CounterTable::InsertSql(Dialect dialect) const {
  return "INSERT INTO " + table_name_ + " (" + segment_column_ + "," + value_column_ + ") VALUES(" + Placeholder(dialect, 1) + "," +
         Placeholder(dialect, 2) + ") ON CONFLICT(" + segment_column_ + ") DO NOTHING;";
}

std::string CounterTable::UpdateSql(Dialect dialect) const {
  return "UPDATE " + table_name_ + " SET " + value_column_ + "=" + Placeholder(dialect, 1) + " WHERE " + value_column_ + "=" +
         Placeholder(dialect, 2) + " AND " + segment_column_ + "=" + Placeholder(dialect, 3) + ";";
}

std::string CounterTable::ListSql(Dialect dialect) const {
  std::string order = segment_column_;
  if (dialect == Dialect::kPostgres) {
    // byte order, independent of the database locale
    order += " COLLATE \"C\"";
  }
  return "SELECT " + segment_column_ + "," + value_column_ + " FROM " + table_name_ + " ORDER BY " + order + ";";
}

std::string CounterTable::CreateTableSql() const {
  return "CREATE TABLE IF NOT EXISTS " + table_name_ + " (" + segment_column_ + " VARCHAR(" + std::to_string(segment_length_) +
         ") NOT NULL, " + value_column_ + " BIGINT, PRIMARY KEY (" + segment_column_ + "));";
}

} // namespace prefixid::db::sql
