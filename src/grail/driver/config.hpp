#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "grail/common/diagnostic.hpp"

namespace grail::driver {

struct ProjectConfig {
  bool verify = false;
  std::vector<std::string> dump_after;  // Pass names, validated on load
  std::string format = "text";          // "text" or "json"

  // Directory where grail.toml was found
  std::filesystem::path root_dir;
};

// Search for grail.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse grail.toml file. All sections are optional.
// Returns error Diagnostic on parse errors, wrongly typed values, unknown pass
// names or an unknown output format.
auto LoadConfig(const std::filesystem::path& config_path)
    -> grail::Result<ProjectConfig>;

}  // namespace grail::driver
