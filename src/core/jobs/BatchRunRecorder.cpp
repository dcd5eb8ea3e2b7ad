#include "BatchRunRecorder.hpp"

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/db/SessionManager.hpp"
#include "core/util/Time.hpp"

namespace pjt {

BatchRunRecorder::BatchRunRecorder(RunMetadata meta, SessionManager* sessions, const JobStateStore& store)
  : meta_(std::move(meta)), sessions_(sessions), store_(store) {
  if (meta_.reporting_required && !sessions_) {
    throw ConfigurationError("Please provide database credentials: run reporting is required");
  }
  if (sessions_ && meta_.run_id.empty()) {
    throw ConfigurationError("run reporting needs an explicit run_id");
  }
}

void BatchRunRecorder::recordFailure(const std::string& error) noexcept {
  spdlog::error("Run '{}' failed: {}", meta_.run_id, error);
  if (!sessions_) return;

  try {
    BatchRunRecord rec;
    rec.run_id     = meta_.run_id;
    rec.start_time = meta_.start_time;
    rec.end_time   = current_timestamp();
    rec.model      = meta_.model;
    rec.success    = false;
    rec.error_code = error;
    sessions_->unitOfWork([&](Session& s) { store_.recordBatchRun(s, rec); });
  } catch (const std::exception& e) {
    const RecordingError err("could not record failure of run '" + meta_.run_id + "': " + e.what());
    spdlog::error("{}", err.what());
  } catch (...) {
    spdlog::error("could not record failure of run '{}': non-standard exception", meta_.run_id);
  }
}

} // namespace pjt
