#pragma once

#include <absl/status/statusor.h>

#include <ConfigManager.hpp>

#include "UploadOptions.hpp"

namespace ResumableUpload {

/**
 * @brief Builds UploadOptions from the loaded configuration.
 *
 * Unset options keep their defaults. Values that cannot be parsed, and
 * options rejected by UploadOptions::validate(), yield InvalidArgument.
 */
absl::StatusOr<UploadOptions> optionsFromConfig(ConfigManager& config);

}  // namespace ResumableUpload
