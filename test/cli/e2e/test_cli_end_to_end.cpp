/***
 * Name: test_cli_end_to_end
 * Purpose: Run the pymarshal binary and check exit codes and stdout.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace {

struct RunResult {
  int exitCode{-1};
  std::string out;
};

RunResult runTool(const std::string& args) {
  const fs::path outPath = fs::temp_directory_path() / "pymarshal_e2e_stdout.txt";
  const std::string cmd = std::string(PYMARSHAL_BINARY) + " " + args + " > " + outPath.string() + " 2>/dev/null";
  const int status = std::system(cmd.c_str());
  RunResult result;
  if (status != -1 && WIFEXITED(status)) { result.exitCode = WEXITSTATUS(status); }
  std::ifstream in(outPath);
  std::string line;
  while (std::getline(in, line)) { result.out += line; result.out += '\n'; }
  return result;
}

std::string writeSharedTuple() {
  const fs::path path = fs::temp_directory_path() / "pymarshal_e2e_shared.bin";
  const unsigned char data[] = {0x29, 0x02, 0xDA, 0x03, 'a', 'b', 'c', 0x72, 0x00, 0x00, 0x00, 0x00};
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char*>(data), sizeof(data));
  return path.string();
}

}  // namespace

TEST(CLI_E2E, HelpExitsZero) {
  const RunResult res = runTool("--help");
  EXPECT_EQ(res.exitCode, 0);
  EXPECT_NE(res.out.find("pymarshal [options] file..."), std::string::npos);
}

TEST(CLI_E2E, NoInputsIsUsageError) {
  EXPECT_EQ(runTool("").exitCode, 2);
}

TEST(CLI_E2E, UnknownOptionIsUsageError) {
  EXPECT_EQ(runTool("--frobnicate x.pyc").exitCode, 2);
}

TEST(CLI_E2E, DumpRawStream) {
  const std::string input = writeSharedTuple();
  const RunResult res = runTool("--dump --py-version=3.11 " + input);
  EXPECT_EQ(res.exitCode, 0);
  EXPECT_NE(res.out.find("Tuple len=2 small"), std::string::npos);
  EXPECT_NE(res.out.find("== refs =="), std::string::npos);
}

TEST(CLI_E2E, MetricsJsonAfterVerify) {
  const std::string input = writeSharedTuple();
  const RunResult res = runTool("--verify --metrics-json --py-version=3.12 " + input);
  EXPECT_EQ(res.exitCode, 0);
  EXPECT_NE(res.out.find("durations_ms"), std::string::npos);
}

TEST(CLI_E2E, DecodeFailureExitsOne) {
  const RunResult res = runTool("--py-version=3.11 " + (fs::temp_directory_path() / "pymarshal_e2e_absent.bin").string());
  EXPECT_EQ(res.exitCode, 1);
}
