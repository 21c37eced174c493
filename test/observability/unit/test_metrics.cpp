/***
 * Name: test_metrics
 * Purpose: Metrics text/JSON summaries, geometry and derived hints.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "observability/Geometry.h"
#include "observability/Metrics.h"
#include "pymarshal/codec/marshal.h"

#include "../../util/Fixtures.h"

using namespace pymarshal;
using testutil::bytes;

TEST(Geometry, CountsNodesAndReferences) {
  const auto decoded =
      codec::Decode(bytes({0x29, 0x02, 0xDA, 0x03, 'a', 'b', 'c', 0x72, 0x00, 0x00, 0x00, 0x00}), {3, 11});
  const obs::ObjectGeometry geom = obs::ComputeGeometry(decoded.object);
  EXPECT_EQ(geom.nodes, 4u);
  EXPECT_EQ(geom.maxDepth, 1u);
  EXPECT_EQ(geom.storeRefs, 1u);
  EXPECT_EQ(geom.loadRefs, 1u);
  EXPECT_EQ(obs::ComputeGeometry(object::Object::None()).maxDepth, 0u);
}

TEST(Metrics, JsonSections) {
  obs::Metrics metrics;
  metrics.start("Decode");
  metrics.stop("Decode");
  metrics.setGeometry({4, 1, 1, 1});
  metrics.incCounter("decode.inputs");
  metrics.setGauge("refs.table", 1);
  metrics.setPassStat("prune-refs", "refs.after", 3);
  const std::string json = metrics.summaryJson();
  EXPECT_NE(json.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(json.find("\"decode\""), std::string::npos);
  EXPECT_NE(json.find("\"object\": { \"nodes\": 4, \"max_depth\": 1"), std::string::npos);
  EXPECT_NE(json.find("\"decode.inputs\": 1"), std::string::npos);
  EXPECT_NE(json.find("\"refs.table\": 1"), std::string::npos);
  EXPECT_NE(json.find("\"prune-refs\": {"), std::string::npos);
  EXPECT_EQ(json.find("\"hints\""), std::string::npos);
}

TEST(Metrics, TextSummary) {
  obs::Metrics metrics;
  metrics.start("Read");
  metrics.stop("Read");
  metrics.stop("Never");
  metrics.setCounter("input.bytes", 12);
  const std::string text = metrics.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0u);
  EXPECT_NE(text.find("  Read: "), std::string::npos);
  EXPECT_NE(text.find("  input.bytes=12\n"), std::string::npos);
  EXPECT_EQ(metrics.durations().count("Never"), 0u);
}

TEST(Metrics, Hints) {
  obs::Metrics metrics;
  EXPECT_TRUE(metrics.hints().empty());
  metrics.setGauge("refs.recursive", 2);
  metrics.incCounter("verify.mismatch");
  metrics.setGeometry({10, 1500, 0, 0});
  const auto hints = metrics.hints();
  EXPECT_NE(std::find(hints.begin(), hints.end(), "cyclic_refs_present"), hints.end());
  EXPECT_NE(std::find(hints.begin(), hints.end(), "roundtrip_mismatch"), hints.end());
  EXPECT_NE(std::find(hints.begin(), hints.end(), "deep_nesting"), hints.end());
  EXPECT_NE(metrics.summaryJson().find("\"hints\": ["), std::string::npos);
}
