#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/jobs/BatchRunRecorder.hpp"
#include "core/jobs/Orchestrator.hpp"

namespace pjt {

// Images plus precomputed detections, read from JSON:
//
//   { "input_dir": "/data/blurring",
//     "images": [ { "path": "2024-01-01/img1.jpg", "width": 4000, "height": 2000,
//                   "detections": [ { "class_id": 0, "box": [x1, y1, x2, y2],
//                                     "confidence": 0.91 } ] } ] }
//
// Stands in for the dataset and inference collaborators when running from the CLI.
struct ManifestEntry {
  ImageItem image;
  std::vector<Detection> detections;
};

class Manifest {
public:
  static Manifest load(const std::string& path);
  static Manifest parse(const std::string& text);

  const std::vector<ManifestEntry>& entries() const { return entries_; }
  const ManifestEntry* find(const std::string& imagePath) const;

private:
  std::vector<ManifestEntry> entries_;
  std::map<std::string, size_t> byPath_;
};

class ManifestImageSource : public ImageSource {
public:
  explicit ManifestImageSource(const Manifest& m) : manifest_(m) {}
  std::optional<ImageItem> next() override;

private:
  const Manifest& manifest_;
  size_t pos_ = 0;
};

class ManifestDetector : public Detector {
public:
  explicit ManifestDetector(const Manifest& m) : manifest_(m) {}
  std::vector<Detection> detect(const ImageItem& image) override;

private:
  const Manifest& manifest_;
};

// One recorded run over the manifest at `path`. Loading happens inside
// recorder.run, so a missing or malformed manifest also leaves a failure row
// when reporting is on.
RunSummary run_manifest(const std::string& path, BatchRunRecorder& recorder,
                        SessionManager& sessions, const JobStateStore& store,
                        const OrchestratorOptions& opts);

} // namespace pjt
