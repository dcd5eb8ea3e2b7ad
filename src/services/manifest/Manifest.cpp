#include "Manifest.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace pjt {

static Detection parse_detection(const json& d) {
  if (!d.is_object() || !d.contains("box") || !d["box"].is_array() || d["box"].size() != 4) {
    throw std::invalid_argument("manifest: detection needs a 4-element box");
  }
  Detection det;
  det.class_id   = d.value("class_id", 0);
  det.x1         = d["box"][0].get<float>();
  det.y1         = d["box"][1].get<float>();
  det.x2         = d["box"][2].get<float>();
  det.y2         = d["box"][3].get<float>();
  det.confidence = d.value("confidence", 0.0f);
  return det;
}

Manifest Manifest::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open manifest: " + path);
  std::ostringstream buf; buf << in.rdbuf();
  return parse(buf.str());
}

Manifest Manifest::parse(const std::string& text) {
  json j;
  try { j = json::parse(text); }
  catch (const json::exception& e) {
    throw std::invalid_argument(std::string("manifest: invalid JSON: ") + e.what());
  }
  if (!j.is_object() || !j.contains("images") || !j["images"].is_array()) {
    throw std::invalid_argument("manifest: expected an object with an 'images' array");
  }

  const std::filesystem::path inputDir = j.value("input_dir", std::string());
  Manifest m;
  for (const json& img : j["images"]) {
    if (!img.contains("path") || !img["path"].is_string()) {
      throw std::invalid_argument("manifest: every image needs a 'path'");
    }
    ManifestEntry e;
    const std::string rel = img["path"].get<std::string>();
    e.image.path   = inputDir.empty() ? rel : (inputDir / rel).string();
    e.image.width  = img.value("width", 0);
    e.image.height = img.value("height", 0);
    if (img.contains("detections")) {
      for (const json& d : img["detections"]) e.detections.push_back(parse_detection(d));
    }
    m.byPath_[e.image.path] = m.entries_.size();
    m.entries_.push_back(std::move(e));
  }
  return m;
}

const ManifestEntry* Manifest::find(const std::string& imagePath) const {
  auto it = byPath_.find(imagePath);
  return it == byPath_.end() ? nullptr : &entries_[it->second];
}

std::optional<ImageItem> ManifestImageSource::next() {
  if (pos_ >= manifest_.entries().size()) return std::nullopt;
  return manifest_.entries()[pos_++].image;
}

std::vector<Detection> ManifestDetector::detect(const ImageItem& image) {
  const ManifestEntry* e = manifest_.find(image.path);
  if (!e) throw std::runtime_error("no inference result for " + image.path);
  return e->detections;
}

RunSummary run_manifest(const std::string& path, BatchRunRecorder& recorder,
                        SessionManager& sessions, const JobStateStore& store,
                        const OrchestratorOptions& opts) {
  return recorder.run([&] {
    const Manifest manifest = Manifest::load(path);
    Orchestrator orchestrator(sessions, store, opts);
    ManifestImageSource images(manifest);
    ManifestDetector detector(manifest);
    return orchestrator.run(images, detector);
  });
}

} // namespace pjt
