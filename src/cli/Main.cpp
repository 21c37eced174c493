#include "tool/Tool.h"
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "pymarshal/exceptions/marshal_exception.h"
#include <exception>
#include <iostream>
#include <string>
/***
 * Name: pymarshal::main
 * Purpose: CLI entry point for the pymarshal tool.
 * Inputs:
 *   - argv, PYMARSHAL_MAX_DEPTH
 * Outputs:
 *   - Exit status: 0 success, 1 failure, 2 usage error
 * Theory of Operation:
 *   Apply environment, parse args, then invoke Tool::run.
 */
int main(const int argc, char** argv) {
  try {
    pymarshal::cli::Options opts;
    std::string envErr;
    if (!pymarshal::cli::ApplyEnvironment(opts, envErr)) {
      std::cerr << "pymarshal: " << envErr << "\n";
      return 2;
    }
    if (!pymarshal::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "pymarshal: argument parse error\n";
      std::cerr << pymarshal::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << pymarshal::cli::Usage();
      return 0;
    }
    if (opts.inputs.empty()) {
      std::cerr << "pymarshal: no input files\n";
      std::cerr << pymarshal::cli::Usage();
      return 2;
    }
    return pymarshal::Tool::run(opts);
  } catch (const pymarshal::exceptions::MarshalException& e) {
    std::cerr << "pymarshal: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "pymarshal: unhandled exception: " << e.what() << "\n";
    return 1;
  }
}
