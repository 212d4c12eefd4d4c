#pragma once
#include <string>
#include <vector>

#include "csv_source.hpp"
#include "sheet_engine.hpp"

namespace labelsheet {

struct CliOptions {
  enum class Action { Run, Help, UsageError };
  Action action=Action::Run;
  InputSpec input;
  RenderOptions render;
  std::string output;     // empty: derived from the inputs
  bool quiet=false;
  std::string error;      // set with UsageError
};

/* args exclude the program name */
CliOptions parse_args(const std::vector<std::string>& args);

/* output/<stem>.pdf for one input, output/tasso_barcodes.pdf for several */
std::string default_output(const std::vector<std::string>& files);

void usage(const char* argv0);

/* Resolves and reads every input before the output is opened.
 * Returns 0 on success, 2 on any failure (reported through ui::fail). */
int run(const CliOptions& opts);

/* whole command: 0 ok / help, 1 usage error, 2 run failure */
int run_cli(int argc, char** argv);

}
