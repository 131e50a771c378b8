#pragma once

#include <string>
#include <vector>

#include "grail/lowering/pipeline.hpp"

namespace grail::driver {

enum class OutputFormat {
  kText,
  kJson,
};

// Everything a command needs, after CLI flags were merged over grail.toml.
struct CommandInput {
  std::string file;
  bool verify = false;
  std::vector<lowering::PassId> dump_after;
  OutputFormat format = OutputFormat::kText;
  int verbose = 0;
};

// Lowers the query in input.file and prints the result to stdout.
auto Lower(const CommandInput& input) -> int;

// Loads the query in input.file and runs the structural verifier on it.
auto Check(const CommandInput& input) -> int;

// Prints the pass names in pipeline order.
auto ListPasses() -> int;

}  // namespace grail::driver
