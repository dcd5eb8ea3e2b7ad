#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "TestDb.hpp"
#include "core/db/SessionManager.hpp"
#include "services/manifest/Manifest.hpp"

using namespace pjt;
using pjt::testing::TempDb;

namespace {

const char* kManifest = R"({
  "input_dir": "/data/in",
  "images": [
    {"path": "2024-01-01/a.jpg", "width": 640, "height": 480,
     "detections": [{"class_id": 1, "box": [10, 20, 110, 220], "confidence": 0.75}]},
    {"path": "2024-01-01/b.jpg", "width": 640, "height": 480}
  ]
})";

} // namespace

TEST(Manifest, ParsesImagesAndDetections) {
  Manifest m = Manifest::parse(kManifest);
  ASSERT_EQ(m.entries().size(), 2u);
  EXPECT_EQ(m.entries()[0].image.path, "/data/in/2024-01-01/a.jpg");
  EXPECT_EQ(m.entries()[0].image.width, 640);
  ASSERT_EQ(m.entries()[0].detections.size(), 1u);
  EXPECT_EQ(m.entries()[0].detections[0].class_id, 1);
  EXPECT_FLOAT_EQ(m.entries()[0].detections[0].x2, 110.0f);
  EXPECT_FLOAT_EQ(m.entries()[0].detections[0].confidence, 0.75f);
  EXPECT_TRUE(m.entries()[1].detections.empty());
}

TEST(Manifest, SourceAndDetectorWalkTheEntries) {
  Manifest m = Manifest::parse(kManifest);
  ManifestImageSource src(m);
  ManifestDetector det(m);

  auto a = src.next();
  ASSERT_TRUE(a);
  EXPECT_EQ(det.detect(*a).size(), 1u);
  auto b = src.next();
  ASSERT_TRUE(b);
  EXPECT_TRUE(det.detect(*b).empty());
  EXPECT_FALSE(src.next());

  EXPECT_THROW(det.detect(ImageItem{"/elsewhere/2024-01-01/c.jpg", 1, 1}), std::runtime_error);
}

TEST(Manifest, RejectsMalformedInput) {
  EXPECT_THROW(Manifest::parse("[]"), std::invalid_argument);
  EXPECT_THROW(Manifest::parse("{\"images\": [{}]}"), std::invalid_argument);
  EXPECT_THROW(Manifest::parse(R"({"images": [{"path": "x/y.jpg", "detections": [{"box": [1, 2]}]}]})"),
               std::invalid_argument);
  EXPECT_THROW(Manifest::parse("{"), std::invalid_argument);
}

namespace {

class ManifestRunTest : public ::testing::Test {
protected:
  TempDb db;
  std::unique_ptr<SessionManager> sm = SessionManager::create(db.config());
  JobStateStore store;
  std::string manifestPath = db.path() + ".manifest.json";

  ~ManifestRunTest() override {
    std::error_code ec;
    std::filesystem::remove(manifestPath, ec);
  }

  RunSummary run() {
    BatchRunRecorder recorder(RunMetadata{"run-7", "2024-01-01 10:00:00", "best.pt", true},
                              sm.get(), store);
    OrchestratorOptions opts;
    opts.customer   = "acme";
    opts.run_id     = "run-7";
    opts.model      = "best.pt";
    opts.start_time = "2024-01-01 10:00:00";
    return run_manifest(manifestPath, recorder, *sm, store, opts);
  }

  std::vector<BatchRunRecord> runs() {
    return sm->unitOfWork([&](Session& s) { return store.batchRuns(s, "run-7"); });
  }
};

} // namespace

TEST_F(ManifestRunTest, MissingManifestLeavesOneFailureRow) {
  EXPECT_THROW(run(), std::runtime_error);

  auto rows = runs();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_FALSE(rows[0].success);
  ASSERT_TRUE(rows[0].error_code.has_value());
  EXPECT_NE(rows[0].error_code->find("Cannot open manifest"), std::string::npos);
}

TEST_F(ManifestRunTest, MalformedManifestLeavesOneFailureRow) {
  { std::ofstream out(manifestPath); out << "{\"images\": 3}"; }
  EXPECT_THROW(run(), std::invalid_argument);

  auto rows = runs();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_FALSE(rows[0].success);
}

TEST_F(ManifestRunTest, ValidManifestRecordsTheRun) {
  { std::ofstream out(manifestPath); out << kManifest; }
  RunSummary summary = run();
  EXPECT_EQ(summary.processed, 2u);
  EXPECT_EQ(summary.positives, 1u);
  EXPECT_EQ(summary.negatives, 1u);

  auto rows = runs();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_TRUE(rows[0].success);
}
