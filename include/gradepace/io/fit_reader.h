#pragma once
/**
 * @file fit_reader.h
 * @brief Minimal FIT (Flexible and Interoperable Data Transfer) activity decoder.
 *
 * Decodes definition/data messages (normal and compressed-timestamp headers,
 * both architectures) and keeps record (20) and session (18) messages.
 * Developer fields are skipped. The trailing file CRC is not verified.
 */

#include "gradepace/common/activity_types.h"

#include <cstdint>
#include <string>

namespace gradepace::io {

namespace fit {
constexpr std::uint16_t kMesgSession = 18;
constexpr std::uint16_t kMesgRecord = 20;

// Seconds between the Unix epoch and the FIT epoch (1989-12-31T00:00:00Z).
constexpr double kFitEpochOffsetS = 631065600.0;

// 2^31 semicircles == 180 degrees.
constexpr double kDegreesPerSemicircle = 180.0 / 2147483648.0;
}  // namespace fit

// @throws ActivityReadError on a bad header, truncated data or undefined local messages.
Activity ReadFit(const std::string& bytes, const std::string& filename);

} // namespace gradepace::io
