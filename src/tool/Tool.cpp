/***
 * Name: pymarshal::Tool::run
 * Purpose: Execute the decode / rewrite / dump / verify / encode pipeline per input.
 */
#include "tool/Tool.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "observability/Geometry.h"
#include "observability/Metrics.h"
#include "observability/ObjectPrinter.h"
#include "pymarshal/codec/marshal.h"
#include "pymarshal/exceptions/errors.h"
#include "pymarshal/pyc/pyc_file.h"
#include "pymarshal/refs/analysis.h"
#include "pymarshal/refs/prune_unused_refs.h"
#include "pymarshal/refs/resolve_refs.h"
#include "pymarshal/support/fs.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace pymarshal {

namespace {

// One decoded input: raw marshal stream or .pyc (header kept for re-encoding).
struct Loaded {
  bool isPyc{false};
  pyc::PycHeader header{};
  object::Object object{};
  object::ReferenceTable refs{};
  version::PyVersion version{};
  std::size_t encodedSize{0};  // header + marshal bytes that made up the value
};

struct LogSink {
  bool enabled{false};
  std::string dir{};
  std::string prefix{};
};

bool wantsPyc(const cli::Options& opts, const std::string& path) {
  if (opts.forcePyc) { return true; }
  return std::filesystem::path(path).extension() == ".pyc";
}

Loaded load(const std::vector<std::uint8_t>& bytes, const std::string& path, const cli::Options& opts) {
  codec::DecodeOptions decodeOpts;
  decodeOpts.maxDepth = opts.maxDepth;
  decodeOpts.allowTrailingBytes = opts.allowTrailing;

  Loaded loaded;
  if (wantsPyc(opts, path)) {
    pyc::PycFile file = pyc::LoadPyc(bytes, decodeOpts);
    loaded.isPyc = true;
    loaded.header = file.header;
    loaded.version = file.header.version;
    loaded.encodedSize = file.header.payloadOffset + file.payloadSize;
    loaded.object = std::move(file.object);
    loaded.refs = std::move(file.refs);
    return loaded;
  }
  if (!opts.pyVersion) {
    throw exceptions::ConfigError("--py-version is required for raw marshal input");
  }
  codec::DecodeResult decoded = codec::Decode(bytes, *opts.pyVersion, decodeOpts);
  loaded.version = *opts.pyVersion;
  loaded.encodedSize = decoded.consumed;
  loaded.object = std::move(decoded.object);
  loaded.refs = std::move(decoded.refs);
  return loaded;
}

std::vector<std::uint8_t> encode(const Loaded& loaded, const cli::Options& opts) {
  codec::EncodeOptions encodeOpts;
  encodeOpts.maxDepth = opts.maxDepth;
  if (!loaded.isPyc) { return codec::Encode(loaded.object, loaded.refs, loaded.version, encodeOpts); }
  pyc::PycFile file;
  file.header = loaded.header;
  file.object = loaded.object;
  file.refs = loaded.refs;
  return pyc::DumpPyc(file, encodeOpts);
}

std::string timestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
  localtime_r(&tsTime, &tmBuf);
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

LogSink openLogs(const cli::Options& opts) {
  LogSink sink;
  if (opts.logPath.empty()) { return sink; }
  std::error_code errCode;
  namespace fs = std::filesystem;
  if (!fs::exists(opts.logPath, errCode)) {
    if (!fs::create_directories(opts.logPath, errCode) && !fs::exists(opts.logPath, errCode)) {
      std::cerr << "pymarshal: failed to create log directory '" << opts.logPath << "': " << errCode.message() << "\n";
      return sink;
    }
  }
  sink.enabled = true;
  sink.dir = opts.logPath;
  sink.prefix = timestampPrefix();
  return sink;
}

void writeLog(const LogSink& sink, const std::string& name, const std::string& text) {
  if (!sink.enabled) { return; }
  std::string err;
  if (!support::WriteTextFile(sink.dir + "/" + sink.prefix + name, text, err)) {
    std::cerr << "pymarshal: " << err << "\n";
  }
}

// Runs the selected reference pass in place; returns whether the tree changed shape.
bool runPasses(Loaded& loaded, const cli::Options& opts, obs::Metrics& metrics) {
  std::unique_ptr<refs::Pass> pass;
  if (opts.pruneRefs) { pass = std::make_unique<refs::PruneUnusedRefs>(opts.maxDepth); }
  if (opts.resolveRefs) { pass = std::make_unique<refs::ResolveRefs>(opts.maxDepth); }
  if (!pass) { return false; }

  metrics.start("Passes");
  const auto changes = pass->run(loaded.object, loaded.refs);
  metrics.stop("Passes");
  for (const auto& [key, value] : pass->stats()) { metrics.setPassStat(pass->name(), key, value); }
  metrics.setCounter("passes.changes", static_cast<std::uint64_t>(changes));
  return true;
}

bool verifyRoundTrip(const Loaded& loaded, const std::vector<std::uint8_t>& input,
                     const std::vector<std::uint8_t>& encoded, bool rewritten, const cli::Options& opts) {
  if (!rewritten) {
    if (encoded.size() != loaded.encodedSize) { return false; }
    return std::equal(encoded.begin(), encoded.end(), input.begin());
  }
  // Rewritten trees cannot match the input bytes; compare against a fresh decode instead.
  codec::DecodeOptions decodeOpts;
  decodeOpts.maxDepth = opts.maxDepth;
  if (loaded.isPyc) {
    const pyc::PycFile again = pyc::LoadPyc(encoded, decodeOpts);
    return again.object == loaded.object;
  }
  const codec::DecodeResult again = codec::Decode(encoded, loaded.version, decodeOpts);
  return again.object == loaded.object;
}

void processInput(const std::string& input, const cli::Options& opts, const LogSink& sink, obs::Metrics& metrics) {
  metrics.start("Read");
  std::vector<std::uint8_t> bytes;
  std::string readErr;
  const bool readOk = support::ReadFile(input, bytes, readErr);
  metrics.stop("Read");
  if (!readOk) { throw exceptions::FileReadError(readErr); }
  metrics.incCounter("input.bytes", static_cast<std::uint64_t>(bytes.size()));

  metrics.start("Decode");
  Loaded loaded = load(bytes, input, opts);
  metrics.stop("Decode");
  metrics.incCounter("decode.inputs");
  metrics.setGauge("refs.table", static_cast<std::uint64_t>(loaded.refs.size()));
  metrics.setGauge("refs.recursive", static_cast<std::uint64_t>(refs::FindRecursiveRefs(loaded.object, loaded.refs).size()));
  metrics.setGeometry(obs::ComputeGeometry(loaded.object));

  const std::string stem = std::filesystem::path(input).stem().string();
  if (opts.logDecode) {
    obs::ObjectPrinter printer(opts.maxDepth);
    writeLog(sink, stem + ".decode.log", printer.print(loaded.object));
  }

  const bool rewritten = runPasses(loaded, opts, metrics);

  if (opts.logRefs) {
    obs::ObjectPrinter printer(opts.maxDepth);
    writeLog(sink, stem + ".refs.log", printer.printRefs(loaded.refs));
  }

  if (opts.dump) {
    obs::ObjectPrinter printer(opts.maxDepth);
    std::cout << "== " << input << " (python " << version::to_string(loaded.version) << ") ==\n";
    std::cout << printer.print(loaded.object);
    std::cout << "== refs ==\n" << printer.printRefs(loaded.refs);
  }

  if (!opts.verify && opts.outputFile.empty()) { return; }

  metrics.start("Encode");
  const std::vector<std::uint8_t> encoded = encode(loaded, opts);
  metrics.stop("Encode");
  metrics.incCounter("output.bytes", static_cast<std::uint64_t>(encoded.size()));

  if (opts.verify) {
    metrics.start("Verify");
    const bool same = verifyRoundTrip(loaded, bytes, encoded, rewritten, opts);
    metrics.stop("Verify");
    if (!same) {
      metrics.incCounter("verify.mismatch");
      throw exceptions::InvalidObjectError("round trip mismatch");
    }
    metrics.incCounter("verify.ok");
  }

  if (!opts.outputFile.empty()) {
    std::string writeErr;
    if (!support::WriteFile(opts.outputFile, encoded, writeErr)) { throw exceptions::FileWriteError(writeErr); }
  }
}

} // namespace

int Tool::run(const cli::Options& opts) {
  if (opts.inputs.empty()) {
    std::cerr << "pymarshal: no input files provided\n";
    return 2;
  }

  bool color = false;
  if (opts.color == cli::ColorMode::Always) { color = true; }
  else if (opts.color == cli::ColorMode::Never) { color = false; }
  else { constexpr int kStderrFd = 2; color = (isatty(kStderrFd) != 0) || use_env_color(); }

  const LogSink sink = openLogs(opts);
  obs::Metrics metrics;
  int status = 0;
  for (const auto& input : opts.inputs) {
    try {
      processInput(input, opts, sink, metrics);
    } catch (const exceptions::MarshalException& ex) {
      metrics.incCounter("errors");
      print_error(input, ex.what(), color);
      status = 1;
    }
  }

  // Emit metrics at end of run:
  // - With --metrics-json: JSON only
  // - With --metrics: include human-readable text, then JSON for tool consumption
  if (opts.metricsJson) {
    std::cout << metrics.summaryJson();
  } else if (opts.metrics) {
    std::cout << metrics.summaryText();
    std::cout << metrics.summaryJson();
  }
  if ((opts.metrics || opts.metricsJson) && sink.enabled) {
    writeLog(sink, "metrics.json", metrics.summaryJson());
  }
  return status;
}

} // namespace pymarshal
