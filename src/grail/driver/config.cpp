#include "config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "grail/common/diagnostic.hpp"
#include "grail/lowering/pipeline.hpp"

namespace grail::driver {

namespace fs = std::filesystem;

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "grail.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> grail::Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [lowering] section (optional)
  if (auto lowering = tbl["lowering"]) {
    if (auto verify = lowering["verify"]) {
      auto value = verify.value<bool>();
      if (!value) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'lowering.verify' must be a boolean",
                    config_path.string())));
      }
      config.verify = *value;
    }

    if (auto dump_after = lowering["dump_after"]) {
      auto* arr = dump_after.as_array();
      if (arr == nullptr) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'lowering.dump_after' must be an array of pass names",
                    config_path.string())));
      }
      for (const auto& elem : *arr) {
        auto name = elem.value<std::string>();
        if (!name || !lowering::ParsePassName(*name)) {
          return std::unexpected(
              Diagnostic::HostError(
                  fmt::format(
                      "{}: unknown pass '{}' in 'lowering.dump_after'",
                      config_path.string(), name.value_or("<non-string>")))
                  .WithNote("run 'grail passes' to list the pass names"));
        }
        config.dump_after.push_back(*name);
      }
    }
  }

  // [output] section (optional)
  if (auto output = tbl["output"]) {
    if (auto format_node = output["format"]) {
      auto format = format_node.value<std::string>();
      if (!format) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'output.format' must be a string",
                    config_path.string())));
      }
      if (*format != "text" && *format != "json") {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: unknown output format '{}', use 'text' or 'json'",
                    config_path.string(), *format)));
      }
      config.format = *format;
    }
  }

  return config;
}

}  // namespace grail::driver
