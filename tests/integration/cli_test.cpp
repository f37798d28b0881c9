#include <sys/wait.h>

#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

// Drives the prefixid binary end to end against a throwaway SQLite file.
// argv[1] is the path of the binary under test.

namespace {

struct CommandResult {
  int         exit_code = -1;
  std::string out;
};

CommandResult Run(const std::string& binary, const std::string& args) {
  // stderr carries the log lines; only identifiers and rows are compared
  const std::string command = "'" + binary + "' " + args + " 2>/dev/null";

  CommandResult result;
  FILE*         pipe = popen(command.c_str(), "r");
  assert(pipe != nullptr);

  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result.out += buffer;
  }

  const int status = pclose(pipe);
  assert(status != -1);
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  }
  return result;
}

std::filesystem::path PrepareWorkDir() {
  const auto dir = std::filesystem::temp_directory_path() / ("prefixid_cli_tests_" + std::to_string(getpid()));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string WriteConfig(const std::filesystem::path& dir) {
  const auto    config_path = dir / "prefixid.yaml";
  std::ofstream out(config_path);
  out << "logging:\n"
      << "  level: info\n"
      << "database:\n"
      << "  sqlite:\n"
      << "    path: \"" << (dir / "ids.db").string() << "\"\n"
      << "generators:\n"
      << "  - name: invoice\n"
      << "    table_name: id_sequences\n";
  out.close();
  return config_path.string();
}

void TestNextThenList(const std::string& binary, const std::string& config) {
  auto first = Run(binary, "--config '" + config + "' next invoice INV");
  assert(first.exit_code == 0);
  assert(first.out == "INV-00001\n");

  auto batch = Run(binary, "--config '" + config + "' next invoice INV 2");
  assert(batch.exit_code == 0);
  assert(batch.out == "INV-00002\nINV-00003\n");

  auto listed = Run(binary, "--config '" + config + "' list invoice");
  assert(listed.exit_code == 0);
  assert(listed.out.find("INV\t4\n") != std::string::npos);
}

void TestUsageErrorsExitWithOne(const std::string& binary, const std::string& config) {
  assert(Run(binary, "").exit_code == 1);
  assert(Run(binary, "--cfg '" + config + "' next invoice INV").exit_code == 1);
  assert(Run(binary, "--config '" + config + "' next invoice").exit_code == 1);
  assert(Run(binary, "--config '" + config + "' next invoice INV 0").exit_code == 1);
  assert(Run(binary, "--config '" + config + "' next invoice INV abc").exit_code == 1);
  assert(Run(binary, "--config '" + config + "' list invoice extra").exit_code == 1);
  assert(Run(binary, "--config '" + config + "' peek invoice").exit_code == 1);
}

void TestRuntimeFailuresExitWithTwo(const std::string& binary, const std::string& config) {
  auto unknown = Run(binary, "--config '" + config + "' next shipment SHP");
  assert(unknown.exit_code == 2);
  assert(unknown.out.empty());

  assert(Run(binary, "--config '/nonexistent/prefixid.yaml' list invoice").exit_code == 2);
}

} // namespace

int main(int argc, char** argv) {
  assert(argc == 2 && "usage: prefixid_integration_cli <path-to-prefixid>");
  const std::string binary = argv[1];

  const auto        dir    = PrepareWorkDir();
  const std::string config = WriteConfig(dir);

  TestNextThenList(binary, config);
  TestUsageErrorsExitWithOne(binary, config);
  TestRuntimeFailuresExitWithTwo(binary, config);

  std::filesystem::remove_all(dir);

  std::cout << "prefixid_integration_cli: pass\n";
  return 0;
}
