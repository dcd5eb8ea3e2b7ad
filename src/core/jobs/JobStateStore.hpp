#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pjt {

class Session;

// Identity of one customer image.
struct ImageKey {
  std::string customer_name;
  std::string upload_date;  // YYYY-MM-DD
  std::string filename;
};

enum class ProcessingStatus { InProgress, Processed };

const char* to_string(ProcessingStatus s);
ProcessingStatus parse_processing_status(const std::string& s);

// How claim() treats a key that is already in_progress.
enum class ClaimPolicy {
  LastWriteWins,  // no lock, no lease: concurrent claims overwrite each other
  Exclusive,      // refuse with ClaimConflictError
};

const char* to_string(ClaimPolicy p);
ClaimPolicy parse_claim_policy(const std::string& s);

// One positive detection, box normalized to the image (centre x/y, width/height).
struct DetectionRecord {
  int class_id = 0;
  double x_norm = 0, y_norm = 0, w_norm = 0, h_norm = 0;
  int image_width = 0;
  int image_height = 0;
};

// A detection_information row as stored; geometry is null on negative rows.
struct StoredDetection {
  int64_t id = 0;
  bool has_detection = false;
  std::optional<int> class_id;
  std::optional<double> x_norm, y_norm, w_norm, h_norm;
  std::optional<int> image_width, image_height;
  std::string run_id;
};

struct CompletedImage {
  std::string upload_date;
  std::string filename;

  bool operator==(const CompletedImage& o) const {
    return upload_date == o.upload_date && filename == o.filename;
  }
  bool operator<(const CompletedImage& o) const {
    return upload_date != o.upload_date ? upload_date < o.upload_date : filename < o.filename;
  }
};

struct BatchRunRecord {
  std::string run_id;
  std::string start_time;
  std::string end_time;
  std::string model;
  bool success = false;
  std::optional<std::string> error_code;  // null iff success
};

// Persistent job-state operations. Every call runs on a session lent by
// SessionManager::unitOfWork; the store never opens or commits a transaction.
// SQL failures throw TransactionError.
class JobStateStore {
public:
  explicit JobStateStore(ClaimPolicy policy = ClaimPolicy::LastWriteWins) : policy_(policy) {}

  ClaimPolicy policy() const { return policy_; }

  // Upsert status=in_progress. Under Exclusive, throws ClaimConflictError if
  // the key is already in_progress.
  void claim(Session& s, const ImageKey& key) const;

  // Upsert status=processed. Idempotent.
  void complete(Session& s, const ImageKey& key) const;

  std::optional<ProcessingStatus> status(Session& s, const ImageKey& key) const;

  // (date, filename) pairs of `customer` whose status is in `statuses`, ordered.
  std::vector<CompletedImage> queryCompleted(Session& s,
                                             const std::string& customer,
                                             const std::vector<ProcessingStatus>& statuses) const;

  // One row per detection, or exactly one has_detection=false row with null
  // geometry when `detections` is empty. Returns the number of rows inserted.
  size_t recordDetections(Session& s,
                          const ImageKey& key,
                          const std::string& runId,
                          const std::vector<DetectionRecord>& detections) const;

  std::vector<StoredDetection> detectionsFor(Session& s, const ImageKey& key, const std::string& runId) const;

  // Append-only; nothing stops a replayed run from writing a second row.
  void recordBatchRun(Session& s, const BatchRunRecord& r) const;
  std::vector<BatchRunRecord> batchRuns(Session& s, const std::string& runId) const;

private:
  void upsertStatus(Session& s, const ImageKey& key, ProcessingStatus st) const;
  void insertDetection(Session& s, const ImageKey& key, const std::string& runId,
                       const DetectionRecord* d) const;

  ClaimPolicy policy_;
};

} // namespace pjt
