#include "Orchestrator.hpp"

#include <set>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "ImagePath.hpp"
#include "core/Errors.hpp"
#include "core/db/SessionManager.hpp"
#include "core/util/Time.hpp"

namespace pjt {

std::vector<DetectionRecord> to_detection_records(const std::vector<Detection>& detections,
                                                  int imageWidth, int imageHeight) {
  std::vector<DetectionRecord> out;
  out.reserve(detections.size());
  for (const Detection& d : detections) {
    const float w = d.x2 - d.x1;
    const float h = d.y2 - d.y1;
    if (w <= 0 || h <= 0) {
      spdlog::debug("Area of detection is 0, skipped (class {})", d.class_id);
      continue;
    }
    if (imageWidth <= 0 || imageHeight <= 0) {
      throw std::invalid_argument("detections need a positive image size to normalize boxes");
    }
    DetectionRecord r;
    r.class_id     = d.class_id;
    r.x_norm       = (d.x1 + w / 2.0) / imageWidth;
    r.y_norm       = (d.y1 + h / 2.0) / imageHeight;
    r.w_norm       = static_cast<double>(w) / imageWidth;
    r.h_norm       = static_cast<double>(h) / imageHeight;
    r.image_width  = imageWidth;
    r.image_height = imageHeight;
    out.push_back(r);
  }
  return out;
}

Orchestrator::Orchestrator(SessionManager& sessions, const JobStateStore& store, OrchestratorOptions opts)
  : sessions_(sessions), store_(store), opts_(std::move(opts)) {
  if (opts_.customer.empty()) throw ConfigurationError("orchestrator: customer is required");
  if (opts_.run_id.empty()) throw ConfigurationError("orchestrator: run_id is required");
}

RunSummary Orchestrator::run(ImageSource& images, Detector& detector) {
  RunSummary summary;

  std::set<CompletedImage> done;
  if (opts_.resumable) {
    auto completed = sessions_.unitOfWork([&](Session& s) {
      return store_.queryCompleted(s, opts_.customer, {ProcessingStatus::Processed});
    });
    done.insert(completed.begin(), completed.end());
    spdlog::info("Customer '{}': {} images already processed", opts_.customer, done.size());
  }

  while (std::optional<ImageItem> item = images.next()) {
    ++summary.seen;
    const ImageKey key = image_key_for(opts_.customer, item->path);
    if (done.count(CompletedImage{key.upload_date, key.filename})) {
      ++summary.skipped;
      continue;
    }
    processImage(*item, key, detector, summary);
  }

  if (opts_.report_run) {
    BatchRunRecord rec;
    rec.run_id     = opts_.run_id;
    rec.start_time = opts_.start_time;
    rec.end_time   = current_timestamp();
    rec.model      = opts_.model;
    rec.success    = true;
    sessions_.unitOfWork([&](Session& s) { store_.recordBatchRun(s, rec); });
  }

  spdlog::info("Run '{}' finished: seen={} skipped={} conflicts={} processed={} detections={} empty={}",
               opts_.run_id, summary.seen, summary.skipped, summary.conflicts,
               summary.processed, summary.positives, summary.negatives);
  return summary;
}

void Orchestrator::processImage(const ImageItem& item, const ImageKey& key, Detector& detector,
                                RunSummary& summary) {
  if (opts_.resumable) {
    try {
      sessions_.unitOfWork([&](Session& s) { store_.claim(s, key); });
    } catch (const ClaimConflictError& e) {
      spdlog::warn("{}", e.what());
      ++summary.conflicts;
      return;
    }
  }

  const std::vector<DetectionRecord> records =
    to_detection_records(detector.detect(item), item.width, item.height);

  sessions_.unitOfWork([&](Session& s) {
    store_.recordDetections(s, key, opts_.run_id, records);
    if (opts_.resumable) store_.complete(s, key);
  });

  ++summary.processed;
  if (records.empty()) ++summary.negatives;
  else summary.positives += records.size();
}

} // namespace pjt
