#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "config.hpp"
#include "grail/lowering/pipeline.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

auto LoadOptionalConfig() -> std::optional<grail::driver::ProjectConfig> {
  auto config_path = grail::driver::FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  auto config = grail::driver::LoadConfig(*config_path);
  if (!config) {
    throw grail::DiagnosticException(std::move(config.error()));
  }
  return *config;
}

auto ParseFormat(const std::string& text)
    -> std::optional<grail::driver::OutputFormat> {
  if (text == "text") {
    return grail::driver::OutputFormat::kText;
  }
  if (text == "json") {
    return grail::driver::OutputFormat::kJson;
  }
  return std::nullopt;
}

// Reads the input file argument and grail.toml, if one is found.
auto BuildInput(const argparse::ArgumentParser& cmd, int verbose)
    -> std::optional<grail::driver::CommandInput> {
  std::optional<grail::driver::ProjectConfig> config;
  try {
    config = LoadOptionalConfig();
  } catch (const grail::DiagnosticException& e) {
    grail::driver::PrintDiagnostic(e.GetDiagnostic());
    return std::nullopt;
  }

  grail::driver::CommandInput input;
  input.file = cmd.get<std::string>("file");
  input.verbose = verbose;

  if (config) {
    input.verify = config->verify;
    for (const auto& name : config->dump_after) {
      input.dump_after.push_back(*grail::lowering::ParsePassName(name));
    }
    input.format = *ParseFormat(config->format);
  }
  return input;
}

// Applies `lower` flags over the configured values. Scalars from the CLI win;
// --dump-after replaces the configured list.
auto ApplyLowerFlags(
    const argparse::ArgumentParser& cmd, grail::driver::CommandInput& input)
    -> bool {
  if (cmd.get<bool>("--verify")) {
    input.verify = true;
  }

  if (auto names = cmd.present<std::vector<std::string>>("--dump-after")) {
    input.dump_after.clear();
    for (const auto& name : *names) {
      auto pass = grail::lowering::ParsePassName(name);
      if (!pass) {
        grail::driver::PrintError(
            fmt::format(
                "unknown pass '{}', run 'grail passes' to list them", name));
        return false;
      }
      input.dump_after.push_back(*pass);
    }
  }

  if (auto text = cmd.present<std::string>("--format")) {
    auto format = ParseFormat(*text);
    if (!format) {
      grail::driver::PrintError(
          fmt::format("unknown format '{}', use 'text' or 'json'", *text));
      return false;
    }
    input.format = *format;
  }
  return true;
}

void AddVerboseFlag(argparse::ArgumentParser& cmd, int& verbose) {
  cmd.add_argument("-v", "--verbose")
      .action([&verbose](const auto&) { ++verbose; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Log phases to stderr (repeat for more detail)");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  int verbose = 0;

  argparse::ArgumentParser program("grail", "0.1.0");
  program.add_description("Lowering pipeline for compiled graph queries");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: lower
  argparse::ArgumentParser lower_cmd("lower");
  lower_cmd.add_description("Lower a compiled query and print the result");
  lower_cmd.add_argument("file").help("Query document (JSON)");
  lower_cmd.add_argument("--dump-after")
      .append()
      .help("Also print the IR after the named pass (repeatable)");
  lower_cmd.add_argument("--format").help("Output format: text or json");
  lower_cmd.add_argument("--verify")
      .default_value(false)
      .implicit_value(true)
      .help("Verify the IR shape before and after lowering");
  AddVerboseFlag(lower_cmd, verbose);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Load a compiled query and verify its shape");
  check_cmd.add_argument("file").help("Query document (JSON)");
  AddVerboseFlag(check_cmd, verbose);

  // Subcommand: passes
  argparse::ArgumentParser passes_cmd("passes");
  passes_cmd.add_description("List lowering passes in pipeline order");

  program.add_subparser(lower_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(passes_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    grail::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      grail::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  // Logs share stderr with the phase timer; stdout carries the IR.
  spdlog::set_default_logger(spdlog::stderr_color_st("grail"));
  spdlog::set_pattern("[grail][%H:%M:%S][%l] %v");
  spdlog::set_level(verbose > 0 ? spdlog::level::debug : spdlog::level::warn);

  if (program.is_subcommand_used("lower")) {
    auto input = BuildInput(lower_cmd, verbose);
    if (!input || !ApplyLowerFlags(lower_cmd, *input)) {
      return 1;
    }
    return grail::driver::Lower(*input);
  }

  if (program.is_subcommand_used("check")) {
    auto input = BuildInput(check_cmd, verbose);
    if (!input) {
      return 1;
    }
    return grail::driver::Check(*input);
  }

  if (program.is_subcommand_used("passes")) {
    return grail::driver::ListPasses();
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
