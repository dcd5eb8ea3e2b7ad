#pragma once
#include <string>

#include "JobStateStore.hpp"

namespace pjt {

struct ImageLocation {
  std::string filename;
  std::string upload_date;
};

// "<input_dir>/<YYYY-MM-DD>/<filename>" -> {filename, upload_date}.
// Throws std::invalid_argument when the parent directory is not a date.
ImageLocation extract_upload_date(const std::string& imagePath);

ImageKey image_key_for(const std::string& customer, const std::string& imagePath);

// Model identifier stored with a run: basename of the weights file.
std::string model_name_from_weights(const std::string& weightsPath);

} // namespace pjt
