#include "internal/core/generator_settings.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace prefixid::core {

GeneratorSettings ResolveGeneratorSettings(const runtime::config::GeneratorConfig& config) {
  if (config.name().empty()) {
    throw util::ConfigurationError("generator: name is required");
  }
  const std::string where = "generator '" + config.name() + "': ";

  GeneratorSettings settings;
  settings.name = config.name();

  try {
    settings.table = db::sql::CounterTable(
        config.has_table_name() ? config.table_name() : std::string(db::sql::CounterTable::kDefaultTableName),
        config.has_segment_column_name() ? config.segment_column_name() : std::string(db::sql::CounterTable::kDefaultSegmentColumn),
        config.has_segment_value_length() ? config.segment_value_length() : db::sql::CounterTable::kDefaultSegmentLength,
        config.has_value_column_name() ? config.value_column_name() : std::string(db::sql::CounterTable::kDefaultValueColumn));
  } catch (const util::ConfigurationError& e) {
    throw util::ConfigurationError(where + e.what());
  }

  auto& allocator = settings.allocator;
  if (config.has_initial_value()) {
    allocator.initial_value = config.initial_value();
  }
  if (config.has_increment_size()) {
    allocator.increment_size = config.increment_size();
  }
  if (allocator.increment_size < 1) {
    throw util::ConfigurationError(where + "increment_size must be at least 1");
  }

  if (config.has_optimizer() && !config.optimizer().empty()) {
    const auto strategy = ParseOptimizerStrategy(config.optimizer());
    if (!strategy) {
      throw util::ConfigurationError(where + "unknown optimizer '" + config.optimizer() + "' (expected none or pooled)");
    }
    allocator.optimizer = *strategy;
  } else {
    allocator.optimizer = ImplicitOptimizerStrategy(allocator.increment_size);
  }
  if (allocator.optimizer == OptimizerStrategy::kNone && allocator.increment_size != 1) {
    throw util::ConfigurationError(where + "optimizer none requires increment_size 1");
  }

  if (config.has_max_attempts()) {
    allocator.max_attempts = config.max_attempts();
  }
  allocator.segment_value_length = settings.table.SegmentLength();

  if (config.has_number_format()) {
    try {
      settings.number_format = NumberFormat::Parse(config.number_format());
    } catch (const util::ConfigurationError& e) {
      throw util::ConfigurationError(where + e.what());
    }
  }

  if (config.has_discriminator()) {
    settings.discriminator = config.discriminator();
  }

  return settings;
}

} // namespace prefixid::core
