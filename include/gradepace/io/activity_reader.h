#pragma once
/**
 * @file activity_reader.h
 * @brief Format dispatch from raw activity bytes to the normalized Activity.
 */

#include "gradepace/common/activity_types.h"

#include <stdexcept>
#include <string>

namespace gradepace::io {

// File-level failure: malformed content, unsupported format or no usable points.
class ActivityReadError : public std::runtime_error {
public:
  explicit ActivityReadError(const std::string& msg) : std::runtime_error(msg) {}
};

// Dispatches on the lower-cased filename extension (.gpx / .fit).
// @throws ActivityReadError
Activity ReadActivity(const ActivityFile& file);

// Loads a file from disk; the filename keeps only the final path component.
// @throws std::runtime_error when the file cannot be read.
ActivityFile LoadActivityFile(const std::string& path);

// Per-file statistics. Device session values win over values derived from the points.
ActivityInfo SummarizeActivity(const Activity& activity);

} // namespace gradepace::io
