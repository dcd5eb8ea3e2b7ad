#include <gtest/gtest.h>

#include <stdexcept>

#include "TestDb.hpp"
#include "core/Errors.hpp"
#include "core/db/SessionManager.hpp"
#include "core/jobs/BatchRunRecorder.hpp"

using namespace pjt;
using pjt::testing::TempDb;

namespace {

struct JobFailure : std::runtime_error {
  explicit JobFailure(const std::string& what) : std::runtime_error(what) {}
};

class BatchRunRecorderTest : public ::testing::Test {
protected:
  TempDb db;
  std::unique_ptr<SessionManager> sm = SessionManager::create(db.config());
  JobStateStore store;

  RunMetadata meta(bool required = true) {
    return RunMetadata{"run-42", "2024-01-01 10:00:00", "best.pt", required};
  }

  std::vector<BatchRunRecord> runs(const std::string& id = "run-42") {
    return sm->unitOfWork([&](Session& s) { return store.batchRuns(s, id); });
  }
};

} // namespace

TEST_F(BatchRunRecorderTest, SuccessForwardsResultAndWritesNothing) {
  BatchRunRecorder recorder(meta(), sm.get(), store);
  int result = recorder.run([] { return 17; });
  EXPECT_EQ(result, 17);
  EXPECT_TRUE(runs().empty());
}

TEST_F(BatchRunRecorderTest, VoidJobsAreSupported) {
  BatchRunRecorder recorder(meta(), sm.get(), store);
  bool ran = false;
  recorder.run([&] { ran = true; });
  EXPECT_TRUE(ran);
}

TEST_F(BatchRunRecorderTest, FailureWritesOneRowAndRethrowsOriginal) {
  BatchRunRecorder recorder(meta(), sm.get(), store);
  EXPECT_THROW(recorder.run([]() -> int { throw JobFailure("model file corrupt"); }), JobFailure);

  auto rows = runs();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_FALSE(rows[0].success);
  EXPECT_EQ(rows[0].error_code, "model file corrupt");
  EXPECT_EQ(rows[0].start_time, "2024-01-01 10:00:00");
  EXPECT_EQ(rows[0].model, "best.pt");
  EXPECT_FALSE(rows[0].end_time.empty());
}

TEST_F(BatchRunRecorderTest, FailedAuditWriteNeverMasksTheJobError) {
  BatchRunRecorder recorder(meta(), sm.get(), store);
  sm->dispose();  // every unit of work now fails with ConnectionError

  try {
    recorder.run([] { throw JobFailure("disk full"); });
    FAIL() << "expected JobFailure";
  } catch (const JobFailure& e) {
    EXPECT_STREQ(e.what(), "disk full");
  }
}

TEST_F(BatchRunRecorderTest, NonStandardExceptionsAreRecordedAndRethrown) {
  BatchRunRecorder recorder(meta(), sm.get(), store);
  EXPECT_THROW(recorder.run([] { throw 5; }), int);
  auto rows = runs();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].error_code, "unknown error");
}

TEST_F(BatchRunRecorderTest, ReplayedRunIdWritesASecondRow) {
  BatchRunRecorder recorder(meta(), sm.get(), store);
  EXPECT_THROW(recorder.run([] { throw JobFailure("first"); }), JobFailure);
  EXPECT_THROW(recorder.run([] { throw JobFailure("second"); }), JobFailure);
  EXPECT_EQ(runs().size(), 2u);
}

TEST_F(BatchRunRecorderTest, RequiredReportingWithoutSessionsFailsBeforeTheJob) {
  bool ran = false;
  EXPECT_THROW({
    BatchRunRecorder recorder(meta(true), nullptr, store);
    recorder.run([&] { ran = true; });
  }, ConfigurationError);
  EXPECT_FALSE(ran);
}

TEST_F(BatchRunRecorderTest, OptionalReportingWithoutSessionsJustPropagates) {
  BatchRunRecorder recorder(meta(false), nullptr, store);
  EXPECT_FALSE(recorder.reporting());
  EXPECT_THROW(recorder.run([] { throw JobFailure("boom"); }), JobFailure);
  EXPECT_TRUE(runs().empty());
}

TEST_F(BatchRunRecorderTest, ReportingNeedsAnExplicitRunId) {
  RunMetadata m = meta();
  m.run_id.clear();
  EXPECT_THROW((BatchRunRecorder{m, sm.get(), store}), ConfigurationError);
}
