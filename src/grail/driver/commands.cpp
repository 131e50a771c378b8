#include "commands.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "grail/common/internal_error.hpp"
#include "grail/ir/dumper.hpp"
#include "grail/ir/json.hpp"
#include "grail/ir/query.hpp"
#include "grail/ir/verify.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace grail::driver {

namespace {

auto LoadInput(const CommandInput& input, VerboseLogger& vlog)
    -> std::optional<ir::Query> {
  PhaseTimer timer(vlog, "load");
  auto query = ir::LoadQuery(input.file);
  if (!query) {
    PrintDiagnostic(query.error());
    return std::nullopt;
  }
  vlog.Detail(
      "load", fmt::format(
                  "{} blocks, {} locations", query->blocks.size(),
                  query->metadata.RegisteredLocations().size()));
  return std::move(*query);
}

void PrintBlocks(
    const ir::BlockList& blocks, OutputFormat format,
    std::optional<lowering::PassId> after_pass) {
  if (format == OutputFormat::kJson) {
    nlohmann::json out = {{"blocks", ir::ToJson(blocks)}};
    if (after_pass) {
      out["pass"] = std::string(lowering::PassName(*after_pass));
    }
    std::cout << out.dump(2) << "\n";
    return;
  }
  if (after_pass) {
    std::cout << fmt::format("; after {}\n", lowering::PassName(*after_pass));
  }
  ir::Dumper dumper(&std::cout);
  dumper.Dump(blocks);
}

}  // namespace

auto Lower(const CommandInput& input) -> int {
  VerboseLogger vlog(input.verbose);

  auto query = LoadInput(input, vlog);
  if (!query) {
    return 1;
  }

  // Input of the pass currently running, reported if that pass faults.
  ir::BlockList pass_input = query->blocks;

  lowering::LoweringOptions options{
      .verify = input.verify,
      .after_pass =
          [&](lowering::PassId pass, const ir::BlockList& blocks) {
            vlog.Detail(
                "lower", fmt::format(
                             "{}: {} blocks", lowering::PassName(pass),
                             blocks.size()));
            if (std::ranges::find(input.dump_after, pass) !=
                input.dump_after.end()) {
              PrintBlocks(blocks, input.format, pass);
            }
            pass_input = blocks;
          },
  };

  ir::BlockList lowered;
  try {
    PhaseTimer timer(vlog, "lower");
    lowered = lowering::LowerIr(query->blocks, query->metadata, options);
  } catch (const common::InternalError& e) {
    PrintInternalError(e);
    if (vlog.Enabled(1)) {
      std::cerr << "while lowering:\n";
      ir::Dumper dumper(&std::cerr);
      dumper.Dump(pass_input);
    }
    return 1;
  }

  PrintBlocks(lowered, input.format, std::nullopt);
  return 0;
}

auto Check(const CommandInput& input) -> int {
  VerboseLogger vlog(input.verbose);

  auto query = LoadInput(input, vlog);
  if (!query) {
    return 1;
  }

  try {
    PhaseTimer timer(vlog, "verify");
    ir::VerifyBlocks(query->blocks, input.file);
  } catch (const common::InternalError& e) {
    PrintInternalError(e);
    return 1;
  }

  std::cout << fmt::format(
      "{}: ok ({} blocks, {} locations, {} revisits)\n", input.file,
      query->blocks.size(), query->metadata.RegisteredLocations().size(),
      query->metadata.RevisitOrigins().size());
  return 0;
}

auto ListPasses() -> int {
  for (lowering::PassId pass : lowering::kPassOrder) {
    std::cout << lowering::PassName(pass) << "\n";
  }
  return 0;
}

}  // namespace grail::driver
