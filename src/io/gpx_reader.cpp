#include "gradepace/io/gpx_reader.h"

#include "gradepace/config/xml_utils.h"
#include "gradepace/io/activity_reader.h"
#include "gradepace/io/iso_time.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <libxml/tree.h>

namespace gradepace::io {
namespace {

namespace xmlu = gradepace::cfg::xmlu;

bool is_element(const xmlNode* n, const char* local_name) {
  return n && n->type == XML_ELEMENT_NODE && xmlStrEqual(n->name, BAD_CAST local_name);
}

const xmlNode* first_child(const xmlNode* parent, const char* local_name) {
  for (const xmlNode* n = parent ? parent->children : nullptr; n; n = n->next) {
    if (is_element(n, local_name)) return n;
  }
  return nullptr;
}

// Depth-first search below `parent` (used for extension payloads of unknown nesting).
const xmlNode* find_descendant(const xmlNode* parent, const char* local_name) {
  for (const xmlNode* n = parent ? parent->children : nullptr; n; n = n->next) {
    if (n->type != XML_ELEMENT_NODE) continue;
    if (is_element(n, local_name)) return n;
    if (const xmlNode* d = find_descendant(n, local_name)) return d;
  }
  return nullptr;
}

std::string text_of(const xmlNode* n) {
  if (!n) return "";
  xmlChar* content = xmlNodeGetContent(n);
  if (!content) return "";
  std::string s(reinterpret_cast<const char*>(content));
  xmlFree(content);
  auto l = s.find_first_not_of(" \t\r\n");
  auto r = s.find_last_not_of(" \t\r\n");
  if (l == std::string::npos) return "";
  return s.substr(l, r - l + 1);
}

std::string attr_of(const xmlNode* n, const char* name) {
  xmlChar* v = xmlGetProp(n, BAD_CAST name);
  if (!v) return "";
  std::string s(reinterpret_cast<const char*>(v));
  xmlFree(v);
  return s;
}

std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
  return v;
}

std::optional<int> parse_positive_int(const std::string& s) {
  auto v = parse_double(s);
  if (!v || !std::isfinite(*v) || *v <= 0.0 || *v > 1000.0) return std::nullopt;
  return static_cast<int>(std::lround(*v));
}

Point read_point(const xmlNode* pt) {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

  Point p;
  p.lat = parse_double(attr_of(pt, "lat")).value_or(kNaN);
  p.lon = parse_double(attr_of(pt, "lon")).value_or(kNaN);

  const auto ele = parse_double(text_of(first_child(pt, "ele")));
  p.elevation_m = (ele && std::isfinite(*ele)) ? *ele : 0.0;

  if (const xmlNode* t = first_child(pt, "time")) {
    p.time_s = ParseIso8601(text_of(t));
  }

  if (const xmlNode* ext = first_child(pt, "extensions")) {
    p.heart_rate_bpm = parse_positive_int(text_of(find_descendant(ext, "hr")));
    p.cadence_rpm = parse_positive_int(text_of(find_descendant(ext, "cad")));
    if (const auto speed = parse_double(text_of(find_descendant(ext, "speed")))) {
      if (std::isfinite(*speed) && *speed >= 0.0) p.speed_mps = *speed;
    }
  }
  return p;
}

void append_points(const xmlNode* parent, const char* point_name, PointSequence& out) {
  for (const xmlNode* n = parent->children; n; n = n->next) {
    if (is_element(n, point_name)) out.push_back(read_point(n));
  }
}

} // namespace

Activity ReadGpx(const std::string& bytes, const std::string& filename) {
  void* raw = nullptr;
  try {
    raw = xmlu::ReadXmlMemoryOrThrow(bytes, filename);
  } catch (const std::runtime_error& e) {
    throw ActivityReadError(std::string("GPX parsing failed: ") + e.what());
  }
  xmlu::DocGuard doc(raw);

  const xmlNode* root = xmlDocGetRootElement(reinterpret_cast<xmlDocPtr>(doc.get()));
  if (!is_element(root, "gpx")) {
    throw ActivityReadError("GPX parsing failed: root element is not <gpx> in " + filename);
  }

  Activity a;
  a.filename = filename;
  a.file_type = ActivityFileType::GPX;

  if (const xmlNode* trk = first_child(root, "trk")) {
    for (const xmlNode* seg = trk->children; seg; seg = seg->next) {
      if (is_element(seg, "trkseg")) append_points(seg, "trkpt", a.points);
    }
  }
  if (a.points.empty()) {
    if (const xmlNode* rte = first_child(root, "rte")) {
      append_points(rte, "rtept", a.points);
    }
  }

  if (a.points.empty()) {
    throw ActivityReadError("No track data found");
  }
  return a;
}

} // namespace gradepace::io
