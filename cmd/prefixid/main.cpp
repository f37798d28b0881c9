#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/model/counter_record.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using prefixid::observability::StringField;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  prefixid --config <config.yaml> next <generator> <prefix> [count]\n"
            << "  prefixid --config <config.yaml> list <generator>\n";
}

static bool ParseCount(const std::string& text, int64_t& count) {
  if (text.empty() || text.size() > 9) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  count = std::stoll(text);
  return count > 0;
}

static int RunNext(const prefixid::factory::Runtime& runtime, const std::string& generator_name, const std::string& prefix,
                   int64_t count) {
  auto& generator = runtime.Generator(generator_name);
  for (int64_t i = 0; i < count; ++i) {
    std::cout << generator.Generate(prefix).identifier << "\n";
  }
  std::cout.flush();
  return 0;
}

static int RunList(const prefixid::factory::Runtime& runtime, const std::string& generator_name) {
  auto& repository = runtime.Repository(generator_name);

  auto                                        tx = repository.Begin();
  std::vector<prefixid::db::model::CounterRecord> rows;
  if (auto r = repository.ListCounters(*tx, rows); !r) {
    throw prefixid::util::StorageFailure("list counters: " + r.message, r.code);
  }
  tx->Commit();

  for (const auto& row : rows) {
    std::cout << row.segment_key << "\t" << row.value << "\n";
  }
  std::cout.flush();
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 5 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string command     = argv[3];
  const std::string generator   = argv[4];

  int64_t     count = 1;
  std::string prefix;
  if (command == "next") {
    if (argc < 6 || argc > 7) {
      Usage();
      return 1;
    }
    prefix = argv[5];
    if (argc == 7 && !ParseCount(argv[6], count)) {
      std::cerr << "invalid count: " << argv[6] << "\n";
      return 1;
    }
  } else if (command == "list") {
    if (argc != 5) {
      Usage();
      return 1;
    }
  } else {
    Usage();
    return 1;
  }

  // env overrides apply until the config file is loaded
  prefixid::observability::InitializeLogging(prefixid::runtime::config::RuntimeConfig{});

  int rc = 0;
  try {
    auto config = prefixid::config::ConfigLoader::LoadFromYaml(config_path);
    prefixid::observability::InitializeLogging(config);

    auto runtime = prefixid::factory::Build(config);

    if (command == "next") {
      rc = RunNext(runtime, generator, prefix, count);
    } else {
      rc = RunList(runtime, generator);
    }
  } catch (const std::exception& e) {
    PREFIXID_LOG_ERROR("Fatal error", {StringField("command", command), StringField("error", e.what())});
    rc = 2;
  }

  prefixid::observability::ShutdownLogging();
  return rc;
}
