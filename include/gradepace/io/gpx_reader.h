#pragma once

#include "gradepace/common/activity_types.h"

#include <string>

namespace gradepace::io {

// Points of the first track (every segment, in order), else of the first route.
// Elements are matched by local name so namespaced GPX 1.0/1.1 files both work.
// @throws ActivityReadError on malformed XML or when no point is found.
Activity ReadGpx(const std::string& bytes, const std::string& filename);

} // namespace gradepace::io
