#pragma once

#include <string>

#include "internal/core/number_format.hpp"
#include "internal/core/segment_allocator.hpp"
#include "internal/db/sql/counter_table.hpp"

namespace prefixid::runtime::config {
class GeneratorConfig;
}

namespace prefixid::core {

/*
  GeneratorSettings

  Validated form of one configured generator. Defaults for unset fields:

    table_name            id_sequences
    segment_column_name   sequence_name
    segment_value_length  255
    value_column_name     next_val
    initial_value         1
    increment_size        1
    optimizer             none for increment 1, pooled otherwise
    number_format         %05d
    max_attempts          1000 (0 = unbounded)
    discriminator         "" (kinds with equal prefixes share a counter)
*/
struct GeneratorSettings {
  std::string       name;
  db::sql::CounterTable table;
  AllocatorSettings allocator;
  NumberFormat      number_format;
  std::string       discriminator;
};

// Throws util::ConfigurationError.
GeneratorSettings ResolveGeneratorSettings(const runtime::config::GeneratorConfig& config);

} // namespace prefixid::core
