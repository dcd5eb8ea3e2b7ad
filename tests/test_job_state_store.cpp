#include <gtest/gtest.h>

#include "TestDb.hpp"
#include "core/Errors.hpp"
#include "core/db/SessionManager.hpp"
#include "core/jobs/JobStateStore.hpp"

using namespace pjt;
using pjt::testing::TempDb;
using pjt::testing::count_rows;

namespace {

class JobStateStoreTest : public ::testing::Test {
protected:
  TempDb db;
  std::unique_ptr<SessionManager> sm = SessionManager::create(db.config());
  JobStateStore store;

  template <typename Fn>
  auto tx(Fn&& fn) { return sm->unitOfWork(std::forward<Fn>(fn)); }

  int64_t count(const std::string& sql) {
    return tx([&](Session& s) { return count_rows(s, sql); });
  }

  std::optional<ProcessingStatus> statusOf(const ImageKey& k) {
    return tx([&](Session& s) { return store.status(s, k); });
  }
};

const ImageKey kImg{"acme", "2024-01-01", "img1.jpg"};

} // namespace

TEST_F(JobStateStoreTest, UnclaimedImageHasNoRow) {
  EXPECT_FALSE(statusOf(kImg).has_value());
}

TEST_F(JobStateStoreTest, ClaimCompleteQueryScenario) {
  tx([&](Session& s) { store.claim(s, kImg); });
  EXPECT_EQ(statusOf(kImg), ProcessingStatus::InProgress);

  tx([&](Session& s) { store.complete(s, kImg); });
  EXPECT_EQ(statusOf(kImg), ProcessingStatus::Processed);

  auto done = tx([&](Session& s) {
    return store.queryCompleted(s, "acme", {ProcessingStatus::Processed});
  });
  ASSERT_EQ(done.size(), 1u);
  EXPECT_EQ(done[0], (CompletedImage{"2024-01-01", "img1.jpg"}));
}

TEST_F(JobStateStoreTest, CompleteIsIdempotent) {
  tx([&](Session& s) { store.claim(s, kImg); });
  tx([&](Session& s) { store.complete(s, kImg); });
  tx([&](Session& s) { store.complete(s, kImg); });

  EXPECT_EQ(count("SELECT COUNT(*) FROM image_processing_status"), 1);
  EXPECT_EQ(statusOf(kImg), ProcessingStatus::Processed);
}

TEST_F(JobStateStoreTest, CompleteWithoutClaimInsertsProcessed) {
  tx([&](Session& s) { store.complete(s, kImg); });
  EXPECT_EQ(statusOf(kImg), ProcessingStatus::Processed);
}

TEST_F(JobStateStoreTest, QueryCompletedFiltersByCustomerAndStatus) {
  tx([&](Session& s) {
    store.complete(s, {"acme", "2024-01-02", "b.jpg"});
    store.complete(s, {"acme", "2024-01-01", "a.jpg"});
    store.claim(s, {"acme", "2024-01-01", "pending.jpg"});
    store.complete(s, {"globex", "2024-01-01", "a.jpg"});
  });

  auto processed = tx([&](Session& s) {
    return store.queryCompleted(s, "acme", {ProcessingStatus::Processed});
  });
  ASSERT_EQ(processed.size(), 2u);
  EXPECT_EQ(processed[0], (CompletedImage{"2024-01-01", "a.jpg"}));
  EXPECT_EQ(processed[1], (CompletedImage{"2024-01-02", "b.jpg"}));

  auto any = tx([&](Session& s) {
    return store.queryCompleted(s, "acme", {ProcessingStatus::Processed, ProcessingStatus::InProgress});
  });
  EXPECT_EQ(any.size(), 3u);

  auto none = tx([&](Session& s) { return store.queryCompleted(s, "acme", {}); });
  EXPECT_TRUE(none.empty());
}

TEST_F(JobStateStoreTest, LastWriteWinsAllowsDoubleClaim) {
  tx([&](Session& s) { store.claim(s, kImg); });
  EXPECT_NO_THROW(tx([&](Session& s) { store.claim(s, kImg); }));
  EXPECT_EQ(count("SELECT COUNT(*) FROM image_processing_status"), 1);
}

TEST_F(JobStateStoreTest, ExclusivePolicyRefusesSecondClaim) {
  const JobStateStore strict(ClaimPolicy::Exclusive);
  tx([&](Session& s) { strict.claim(s, kImg); });
  EXPECT_THROW(tx([&](Session& s) { strict.claim(s, kImg); }), ClaimConflictError);
  EXPECT_EQ(statusOf(kImg), ProcessingStatus::InProgress);

  // A processed image may be claimed again, e.g. for reprocessing.
  tx([&](Session& s) { strict.complete(s, kImg); });
  EXPECT_NO_THROW(tx([&](Session& s) { strict.claim(s, kImg); }));
  EXPECT_EQ(statusOf(kImg), ProcessingStatus::InProgress);
}

TEST_F(JobStateStoreTest, NegativeOutcomeIsOneRowWithNullGeometry) {
  size_t n = tx([&](Session& s) { return store.recordDetections(s, kImg, "run-1", {}); });
  EXPECT_EQ(n, 1u);

  auto rows = tx([&](Session& s) { return store.detectionsFor(s, kImg, "run-1"); });
  ASSERT_EQ(rows.size(), 1u);
  const StoredDetection& r = rows[0];
  EXPECT_FALSE(r.has_detection);
  EXPECT_FALSE(r.class_id);
  EXPECT_FALSE(r.x_norm);
  EXPECT_FALSE(r.y_norm);
  EXPECT_FALSE(r.w_norm);
  EXPECT_FALSE(r.h_norm);
  EXPECT_FALSE(r.image_width);
  EXPECT_FALSE(r.image_height);
  EXPECT_EQ(r.run_id, "run-1");
}

TEST_F(JobStateStoreTest, PositiveOutcomeIsOneRowPerDetection) {
  std::vector<DetectionRecord> dets(3);
  for (int i = 0; i < 3; ++i) {
    dets[i].class_id = i;
    dets[i].x_norm = 0.1 * (i + 1);
    dets[i].y_norm = 0.5;
    dets[i].w_norm = 0.05;
    dets[i].h_norm = 0.02;
    dets[i].image_width = 4000;
    dets[i].image_height = 2000;
  }
  EXPECT_EQ(tx([&](Session& s) { return store.recordDetections(s, kImg, "run-1", dets); }), 3u);

  auto rows = tx([&](Session& s) { return store.detectionsFor(s, kImg, "run-1"); });
  ASSERT_EQ(rows.size(), 3u);
  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(rows[i].has_detection);
    EXPECT_EQ(rows[i].class_id, i);
    EXPECT_DOUBLE_EQ(*rows[i].x_norm, 0.1 * (i + 1));
    EXPECT_EQ(rows[i].image_width, 4000);
  }
  EXPECT_TRUE(tx([&](Session& s) { return store.detectionsFor(s, kImg, "run-2"); }).empty());
}

TEST_F(JobStateStoreTest, DetectionsNeedRunId) {
  EXPECT_THROW(tx([&](Session& s) { store.recordDetections(s, kImg, "", {}); }), std::invalid_argument);
}

TEST_F(JobStateStoreTest, WritesInOneUnitOfWorkAreAtomic) {
  EXPECT_THROW(tx([&](Session& s) {
    store.claim(s, kImg);
    store.recordDetections(s, kImg, "run-1", {});
    store.complete(s, kImg);
    throw std::runtime_error("inference crashed");
  }), std::runtime_error);

  EXPECT_FALSE(statusOf(kImg).has_value());
  EXPECT_EQ(count("SELECT COUNT(*) FROM detection_information"), 0);
}

TEST_F(JobStateStoreTest, BatchRunRowsAreAppendOnly) {
  BatchRunRecord ok{"run-1", "2024-01-01 10:00:00", "2024-01-01 11:00:00", "best.pt", true, std::nullopt};
  BatchRunRecord failed{"run-1", "2024-01-01 10:00:00", "2024-01-01 12:00:00", "best.pt", false,
                        std::string("CUDA out of memory")};
  tx([&](Session& s) { store.recordBatchRun(s, ok); });
  tx([&](Session& s) { store.recordBatchRun(s, failed); });

  auto runs = tx([&](Session& s) { return store.batchRuns(s, "run-1"); });
  ASSERT_EQ(runs.size(), 2u);
  EXPECT_TRUE(runs[0].success);
  EXPECT_FALSE(runs[0].error_code);
  EXPECT_FALSE(runs[1].success);
  EXPECT_EQ(runs[1].error_code, "CUDA out of memory");
  EXPECT_EQ(runs[1].model, "best.pt");
}

TEST_F(JobStateStoreTest, BatchRunErrorCodeMustMatchOutcome) {
  BatchRunRecord bad{"run-1", "", "2024-01-01 11:00:00", "best.pt", true, std::string("oops")};
  EXPECT_THROW(tx([&](Session& s) { store.recordBatchRun(s, bad); }), std::invalid_argument);
  bad.success = false;
  bad.error_code.reset();
  EXPECT_THROW(tx([&](Session& s) { store.recordBatchRun(s, bad); }), std::invalid_argument);
}

TEST(ProcessingStatusNames, RoundTripAndReject) {
  EXPECT_STREQ(to_string(ProcessingStatus::InProgress), "in_progress");
  EXPECT_STREQ(to_string(ProcessingStatus::Processed), "processed");
  EXPECT_THROW(parse_processing_status("inprogress"), std::invalid_argument);
  EXPECT_EQ(parse_claim_policy(""), ClaimPolicy::LastWriteWins);
  EXPECT_EQ(parse_claim_policy("exclusive"), ClaimPolicy::Exclusive);
  EXPECT_THROW(parse_claim_policy("strict"), ConfigurationError);
}
