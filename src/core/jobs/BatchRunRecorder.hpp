#pragma once
#include <string>
#include <type_traits>

#include "JobStateStore.hpp"

namespace pjt {

class SessionManager;

// Structured metadata of one run; nothing is sniffed from the job itself.
struct RunMetadata {
  std::string run_id;
  std::string start_time;
  std::string model;
  bool reporting_required = false;
};

// Wraps a run so that a failure leaves a terminal audit row.
//
// run(job) returns the job's result unchanged; the success row is the
// orchestrator's to write. When the job throws and reporting is available
// (a SessionManager was given), one unit of work writes
// batch_run_information{success=false, error_code=what()} and the original
// exception is rethrown. If that write fails it is logged as a RecordingError
// and dropped: the caller always sees the job's own exception.
//
// RUNNING -> SUCCESS | FAILED. Replaying a run_id can write a second terminal
// row; nothing here prevents it.
class BatchRunRecorder {
public:
  // Throws ConfigurationError when reporting is required but `sessions` is
  // null, or when reporting is possible and run_id is empty.
  BatchRunRecorder(RunMetadata meta, SessionManager* sessions, const JobStateStore& store);

  template <typename Fn>
  auto run(Fn&& job) -> std::invoke_result_t<Fn&>;

  const RunMetadata& metadata() const { return meta_; }
  bool reporting() const { return sessions_ != nullptr; }

private:
  void recordFailure(const std::string& error) noexcept;

  RunMetadata meta_;
  SessionManager* sessions_;
  const JobStateStore& store_;
};

template <typename Fn>
auto BatchRunRecorder::run(Fn&& job) -> std::invoke_result_t<Fn&> {
  try {
    return job();
  } catch (const std::exception& e) {
    recordFailure(e.what());
    throw;
  } catch (...) {
    recordFailure("unknown error");
    throw;
  }
}

} // namespace pjt
