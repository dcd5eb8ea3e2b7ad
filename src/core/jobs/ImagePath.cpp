#include "ImagePath.hpp"

#include <filesystem>
#include <stdexcept>

#include "core/util/Time.hpp"

namespace pjt {

ImageLocation extract_upload_date(const std::string& imagePath) {
  namespace fs = std::filesystem;
  const fs::path p(imagePath);
  ImageLocation loc;
  loc.filename = p.filename().string();
  loc.upload_date = p.parent_path().filename().string();
  if (loc.filename.empty()) {
    throw std::invalid_argument("image path has no filename: " + imagePath);
  }
  if (!is_iso_date(loc.upload_date)) {
    throw std::invalid_argument("image path has no YYYY-MM-DD upload directory: " + imagePath);
  }
  return loc;
}

ImageKey image_key_for(const std::string& customer, const std::string& imagePath) {
  ImageLocation loc = extract_upload_date(imagePath);
  return ImageKey{customer, std::move(loc.upload_date), std::move(loc.filename)};
}

std::string model_name_from_weights(const std::string& weightsPath) {
  return std::filesystem::path(weightsPath).filename().string();
}

} // namespace pjt
