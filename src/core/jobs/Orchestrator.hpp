#pragma once
#include <optional>
#include <string>
#include <vector>

#include "JobStateStore.hpp"

namespace pjt {

class SessionManager;

// One image handed out by the dataset collaborator.
struct ImageItem {
  std::string path;  // <input_dir>/<YYYY-MM-DD>/<filename>
  int width = 0;
  int height = 0;
};

// Pixel-space detection from the inference collaborator.
struct Detection {
  int class_id = 0;
  float x1 = 0, y1 = 0, x2 = 0, y2 = 0;
  float confidence = 0;
};

// Lazy, finite sequence of images. nullopt ends the sequence.
class ImageSource {
public:
  virtual ~ImageSource() = default;
  virtual std::optional<ImageItem> next() = 0;
};

// An empty vector means "nothing found"; failures are reported by throwing.
class Detector {
public:
  virtual ~Detector() = default;
  virtual std::vector<Detection> detect(const ImageItem& image) = 0;
};

struct OrchestratorOptions {
  std::string customer;
  std::string run_id;
  std::string model;
  std::string start_time;
  bool resumable = true;   // claim/complete status rows, skip processed images
  bool report_run = true;  // write the success batch_run_information row
};

struct RunSummary {
  size_t seen = 0;
  size_t skipped = 0;     // already processed
  size_t conflicts = 0;   // claimed elsewhere (exclusive policy)
  size_t processed = 0;
  size_t positives = 0;   // detection rows written
  size_t negatives = 0;   // images without detections
};

// Pixel boxes -> normalized centre boxes. Boxes with non-positive area are dropped.
std::vector<DetectionRecord> to_detection_records(const std::vector<Detection>& detections,
                                                  int imageWidth, int imageHeight);

// Drives claim -> infer -> record -> complete for each image, sequentially.
//
// The claim commits on its own so other workers can see it; inference runs
// outside any transaction; detections and completion commit together. A crash
// after the claim leaves the image in_progress (there is no lease expiry).
class Orchestrator {
public:
  Orchestrator(SessionManager& sessions, const JobStateStore& store, OrchestratorOptions opts);

  RunSummary run(ImageSource& images, Detector& detector);

private:
  void processImage(const ImageItem& item, const ImageKey& key, Detector& detector, RunSummary& summary);

  SessionManager& sessions_;
  const JobStateStore& store_;
  OrchestratorOptions opts_;
};

} // namespace pjt
