#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/generator_settings.hpp"
#include "internal/core/prefixed_id_generator.hpp"
#include "internal/db/api/counter_repository.hpp"

namespace prefixid::factory {

/*
  Runtime

  Owns every long-lived object built from one RuntimeConfig.
  Generators are keyed by their configured name.
*/
struct Runtime {
  std::map<std::string, std::shared_ptr<core::PrefixedIdGenerator>> generators;

  // Repository serving each generator, keyed by generator name.
  std::map<std::string, std::shared_ptr<db::CounterRepository>> repositories;

  // Throws util::ConfigurationError for unknown names.
  core::PrefixedIdGenerator& Generator(const std::string& name) const;
  db::CounterRepository&     Repository(const std::string& generator_name) const;
};

std::shared_ptr<core::PrefixedIdGenerator> BuildGenerator(const core::GeneratorSettings& settings,
                                                          std::shared_ptr<db::CounterRepository> repository);

/*
  Build

  Composition root: the ONLY place that knows concrete DB types.
  Creates every configured counter table that does not exist yet before
  returning. Throws util::ConfigurationError for invalid configuration.
*/
Runtime Build(const prefixid::runtime::config::RuntimeConfig& config);

} // namespace prefixid::factory
