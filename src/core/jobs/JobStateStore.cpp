#include "JobStateStore.hpp"

#include <sqlite3.h>

#include "core/Errors.hpp"
#include "core/db/Session.hpp"

namespace pjt {

static void bind_key(sqlite3_stmt* st, int& i, const ImageKey& key) {
  sqlite3_bind_text(st, i++, key.customer_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, key.upload_date.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, key.filename.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int col) {
  const unsigned char* p = sqlite3_column_text(st, col);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

static std::optional<int> column_opt_int(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col);
}

static std::optional<double> column_opt_double(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

static std::string describe_key(const ImageKey& k) {
  return k.customer_name + "/" + k.upload_date + "/" + k.filename;
}

// ---------- enums ----------

const char* to_string(ProcessingStatus s) {
  switch (s) {
    case ProcessingStatus::InProgress: return "in_progress";
    case ProcessingStatus::Processed:  return "processed";
  }
  return "unknown";
}

ProcessingStatus parse_processing_status(const std::string& s) {
  if (s == "in_progress") return ProcessingStatus::InProgress;
  if (s == "processed") return ProcessingStatus::Processed;
  throw std::invalid_argument("unknown processing status: " + s);
}

const char* to_string(ClaimPolicy p) {
  switch (p) {
    case ClaimPolicy::LastWriteWins: return "last_write_wins";
    case ClaimPolicy::Exclusive:     return "exclusive";
  }
  return "unknown";
}

ClaimPolicy parse_claim_policy(const std::string& s) {
  if (s.empty() || s == "last_write_wins") return ClaimPolicy::LastWriteWins;
  if (s == "exclusive") return ClaimPolicy::Exclusive;
  throw ConfigurationError("unknown claim policy: " + s);
}

// ---------- status ----------

void JobStateStore::upsertStatus(Session& s, const ImageKey& key, ProcessingStatus st) const {
  const char* sql = R"SQL(
    INSERT INTO image_processing_status (customer_name, upload_date, filename, status)
    VALUES (?,?,?,?)
    ON CONFLICT (customer_name, upload_date, filename) DO UPDATE SET status = excluded.status
  )SQL";
  Statement stmt = s.prepare(sql);
  int i = 1;
  bind_key(stmt.get(), i, key);
  sqlite3_bind_text(stmt.get(), i++, to_string(st), -1, SQLITE_STATIC);
  stmt.step(st == ProcessingStatus::InProgress ? "claim" : "complete");
}

void JobStateStore::claim(Session& s, const ImageKey& key) const {
  if (policy_ == ClaimPolicy::LastWriteWins) {
    upsertStatus(s, key, ProcessingStatus::InProgress);
    return;
  }

  // Conditional upsert: an existing in_progress row is left alone and reported.
  const char* sql = R"SQL(
    INSERT INTO image_processing_status (customer_name, upload_date, filename, status)
    VALUES (?,?,?,'in_progress')
    ON CONFLICT (customer_name, upload_date, filename) DO UPDATE SET status = excluded.status
      WHERE image_processing_status.status <> 'in_progress'
  )SQL";
  Statement stmt = s.prepare(sql);
  int i = 1;
  bind_key(stmt.get(), i, key);
  stmt.step("claim");
  if (s.changes() == 0) {
    throw ClaimConflictError("image already claimed: " + describe_key(key));
  }
}

void JobStateStore::complete(Session& s, const ImageKey& key) const {
  upsertStatus(s, key, ProcessingStatus::Processed);
}

std::optional<ProcessingStatus> JobStateStore::status(Session& s, const ImageKey& key) const {
  const char* sql = R"SQL(
    SELECT status FROM image_processing_status
    WHERE customer_name = ? AND upload_date = ? AND filename = ?
  )SQL";
  Statement stmt = s.prepare(sql);
  int i = 1;
  bind_key(stmt.get(), i, key);
  if (!stmt.step("status")) return std::nullopt;
  return parse_processing_status(column_text(stmt.get(), 0));
}

std::vector<CompletedImage> JobStateStore::queryCompleted(Session& s,
                                                          const std::string& customer,
                                                          const std::vector<ProcessingStatus>& statuses) const {
  std::vector<CompletedImage> out;
  if (statuses.empty()) return out;

  std::string sql =
    "SELECT upload_date, filename FROM image_processing_status "
    "WHERE customer_name = ? AND status IN (";
  for (size_t n = 0; n < statuses.size(); ++n) sql += n ? ",?" : "?";
  sql += ") ORDER BY upload_date, filename";

  Statement stmt = s.prepare(sql.c_str());
  int i = 1;
  sqlite3_bind_text(stmt.get(), i++, customer.c_str(), -1, SQLITE_TRANSIENT);
  for (ProcessingStatus st : statuses) {
    sqlite3_bind_text(stmt.get(), i++, to_string(st), -1, SQLITE_STATIC);
  }
  while (stmt.step("queryCompleted")) {
    out.push_back({column_text(stmt.get(), 0), column_text(stmt.get(), 1)});
  }
  return out;
}

// ---------- detections ----------

void JobStateStore::insertDetection(Session& s, const ImageKey& key, const std::string& runId,
                                    const DetectionRecord* d) const {
  const char* sql = R"SQL(
    INSERT INTO detection_information
      (customer_name, upload_date, filename, has_detection, class_id,
       x_norm, y_norm, w_norm, h_norm, image_width, image_height, run_id)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?)
  )SQL";
  Statement stmt = s.prepare(sql);
  sqlite3_stmt* st = stmt.get();
  int i = 1;
  bind_key(st, i, key);
  sqlite3_bind_int(st, i++, d ? 1 : 0);
  if (d) {
    sqlite3_bind_int(st, i++, d->class_id);
    sqlite3_bind_double(st, i++, d->x_norm);
    sqlite3_bind_double(st, i++, d->y_norm);
    sqlite3_bind_double(st, i++, d->w_norm);
    sqlite3_bind_double(st, i++, d->h_norm);
    sqlite3_bind_int(st, i++, d->image_width);
    sqlite3_bind_int(st, i++, d->image_height);
  } else {
    for (int n = 0; n < 7; ++n) sqlite3_bind_null(st, i++);
  }
  sqlite3_bind_text(st, i++, runId.c_str(), -1, SQLITE_TRANSIENT);
  stmt.step("recordDetection");
}

size_t JobStateStore::recordDetections(Session& s,
                                       const ImageKey& key,
                                       const std::string& runId,
                                       const std::vector<DetectionRecord>& detections) const {
  if (runId.empty()) throw std::invalid_argument("recordDetections: run_id is required");
  if (detections.empty()) {
    insertDetection(s, key, runId, nullptr);
    return 1;
  }
  for (const DetectionRecord& d : detections) insertDetection(s, key, runId, &d);
  return detections.size();
}

std::vector<StoredDetection> JobStateStore::detectionsFor(Session& s, const ImageKey& key,
                                                          const std::string& runId) const {
  const char* sql = R"SQL(
    SELECT id, has_detection, class_id, x_norm, y_norm, w_norm, h_norm,
           image_width, image_height, run_id
    FROM detection_information
    WHERE customer_name = ? AND upload_date = ? AND filename = ? AND run_id = ?
    ORDER BY id
  )SQL";
  Statement stmt = s.prepare(sql);
  sqlite3_stmt* st = stmt.get();
  int i = 1;
  bind_key(st, i, key);
  sqlite3_bind_text(st, i++, runId.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<StoredDetection> out;
  while (stmt.step("detectionsFor")) {
    StoredDetection d;
    d.id            = sqlite3_column_int64(st, 0);
    d.has_detection = sqlite3_column_int(st, 1) != 0;
    d.class_id      = column_opt_int(st, 2);
    d.x_norm        = column_opt_double(st, 3);
    d.y_norm        = column_opt_double(st, 4);
    d.w_norm        = column_opt_double(st, 5);
    d.h_norm        = column_opt_double(st, 6);
    d.image_width   = column_opt_int(st, 7);
    d.image_height  = column_opt_int(st, 8);
    d.run_id        = column_text(st, 9);
    out.push_back(std::move(d));
  }
  return out;
}

// ---------- batch runs ----------

void JobStateStore::recordBatchRun(Session& s, const BatchRunRecord& r) const {
  if (r.run_id.empty()) throw std::invalid_argument("recordBatchRun: run_id is required");
  if (r.success == r.error_code.has_value()) {
    throw std::invalid_argument("recordBatchRun: error_code must be set iff the run failed");
  }
  const char* sql = R"SQL(
    INSERT INTO batch_run_information (run_id, start_time, end_time, model, success, error_code)
    VALUES (?,?,?,?,?,?)
  )SQL";
  Statement stmt = s.prepare(sql);
  sqlite3_stmt* st = stmt.get();
  int i = 1;
  sqlite3_bind_text(st, i++, r.run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.start_time.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.end_time.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.model.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(st, i++, r.success ? 1 : 0);
  if (r.error_code) sqlite3_bind_text(st, i++, r.error_code->c_str(), -1, SQLITE_TRANSIENT);
  else sqlite3_bind_null(st, i++);
  stmt.step("recordBatchRun");
}

std::vector<BatchRunRecord> JobStateStore::batchRuns(Session& s, const std::string& runId) const {
  const char* sql = R"SQL(
    SELECT run_id, start_time, end_time, model, success, error_code
    FROM batch_run_information WHERE run_id = ? ORDER BY rowid
  )SQL";
  Statement stmt = s.prepare(sql);
  sqlite3_stmt* st = stmt.get();
  sqlite3_bind_text(st, 1, runId.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<BatchRunRecord> out;
  while (stmt.step("batchRuns")) {
    BatchRunRecord r;
    r.run_id     = column_text(st, 0);
    r.start_time = column_text(st, 1);
    r.end_time   = column_text(st, 2);
    r.model      = column_text(st, 3);
    r.success    = sqlite3_column_int(st, 4) != 0;
    if (sqlite3_column_type(st, 5) != SQLITE_NULL) r.error_code = column_text(st, 5);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace pjt
