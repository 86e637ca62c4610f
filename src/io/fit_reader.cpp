#include "gradepace/io/fit_reader.h"

#include "gradepace/io/activity_reader.h"

#include <array>
#include <cmath>
#include <cstring>
#include <optional>
#include <vector>

namespace gradepace::io {
namespace {

constexpr std::uint8_t kFieldTimestamp = 253;

// Base type numbers (low five bits of the base type byte).
enum BaseType : std::uint8_t {
  kEnum = 0x00, kSint8 = 0x01, kUint8 = 0x02, kSint16 = 0x03, kUint16 = 0x04,
  kSint32 = 0x05, kUint32 = 0x06, kString = 0x07, kFloat32 = 0x08, kFloat64 = 0x09,
  kUint8z = 0x0A, kUint16z = 0x0B, kUint32z = 0x0C, kByte = 0x0D,
  kSint64 = 0x0E, kUint64 = 0x0F, kUint64z = 0x10
};

struct FieldDef {
  std::uint8_t num = 0;
  std::uint8_t size = 0;
  std::uint8_t base_type = 0;
};

struct MessageDef {
  bool defined = false;
  bool big_endian = false;
  std::uint16_t global_num = 0;
  std::vector<FieldDef> fields;
  std::size_t dev_data_size = 0;
};

// Decoded scalar; `valid` is false for the base type's invalid sentinel.
struct FieldValue {
  bool valid = false;
  double value = 0.0;
};

class ByteCursor {
public:
  ByteCursor(const std::string& bytes, std::size_t pos, std::size_t end)
    : data_(reinterpret_cast<const unsigned char*>(bytes.data())), pos_(pos), end_(end) {}

  bool done() const { return pos_ >= end_; }

  const unsigned char* take(std::size_t n) {
    if (n > end_ - pos_) throw ActivityReadError("FIT parsing failed: truncated data");
    const unsigned char* p = data_ + pos_;
    pos_ += n;
    return p;
  }

  std::uint8_t u8() { return *take(1); }

private:
  const unsigned char* data_;
  std::size_t pos_;
  std::size_t end_;
};

std::uint64_t read_uint(const unsigned char* p, std::size_t n, bool big_endian) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t idx = big_endian ? i : (n - 1 - i);
    v = (v << 8) | p[idx];
  }
  return v;
}

std::size_t base_type_size(std::uint8_t bt) {
  switch (bt & 0x1F) {
    case kSint16: case kUint16: case kUint16z: return 2;
    case kSint32: case kUint32: case kUint32z: case kFloat32: return 4;
    case kSint64: case kUint64: case kUint64z: case kFloat64: return 8;
    default: return 1;
  }
}

FieldValue decode(const unsigned char* p, const FieldDef& f, bool big_endian) {
  FieldValue out;
  const std::uint8_t bt = f.base_type & 0x1F;
  const std::size_t n = base_type_size(bt);
  if (f.size < n || bt == kString || bt == kByte) return out;

  const std::uint64_t raw = read_uint(p, n, big_endian);
  switch (bt) {
    case kEnum: case kUint8:
      out.valid = raw != 0xFF; out.value = static_cast<double>(raw); break;
    case kSint8:
      out.valid = raw != 0x7F; out.value = static_cast<double>(static_cast<std::int8_t>(raw)); break;
    case kUint16:
      out.valid = raw != 0xFFFF; out.value = static_cast<double>(raw); break;
    case kSint16:
      out.valid = raw != 0x7FFF; out.value = static_cast<double>(static_cast<std::int16_t>(raw)); break;
    case kUint32:
      out.valid = raw != 0xFFFFFFFFULL; out.value = static_cast<double>(raw); break;
    case kSint32:
      out.valid = raw != 0x7FFFFFFFULL;
      out.value = static_cast<double>(static_cast<std::int32_t>(static_cast<std::uint32_t>(raw)));
      break;
    case kUint8z: case kUint16z: case kUint32z: case kUint64z:
      out.valid = raw != 0; out.value = static_cast<double>(raw); break;
    case kUint64:
      out.valid = raw != 0xFFFFFFFFFFFFFFFFULL; out.value = static_cast<double>(raw); break;
    case kSint64:
      out.valid = raw != 0x7FFFFFFFFFFFFFFFULL;
      out.value = static_cast<double>(static_cast<std::int64_t>(raw));
      break;
    case kFloat32: {
      const std::uint32_t bits = static_cast<std::uint32_t>(raw);
      float fv = 0.0f;
      std::memcpy(&fv, &bits, sizeof(fv));
      out.valid = bits != 0xFFFFFFFFU && std::isfinite(fv);
      out.value = fv;
      break;
    }
    case kFloat64: {
      double dv = 0.0;
      std::memcpy(&dv, &raw, sizeof(dv));
      out.valid = raw != 0xFFFFFFFFFFFFFFFFULL && std::isfinite(dv);
      out.value = dv;
      break;
    }
    default:
      break;
  }
  return out;
}

const char* sport_name(int sport) {
  switch (sport) {
    case 0:  return "generic";
    case 1:  return "running";
    case 2:  return "cycling";
    case 5:  return "swimming";
    case 11: return "walking";
    case 17: return "hiking";
    default: return "unknown";
  }
}

// Collects the fields of one data message keyed by field number.
struct DataFields {
  std::array<FieldValue, 256> by_num{};

  std::optional<double> get(std::uint8_t num) const {
    const FieldValue& v = by_num[num];
    return v.valid ? std::optional<double>(v.value) : std::nullopt;
  }
};

void apply_record(const DataFields& f, double timestamp_fit, bool has_timestamp, PointSequence& out) {
  const auto lat = f.get(0);
  const auto lon = f.get(1);
  if (!lat || !lon) return;

  Point p;
  p.lat = *lat * fit::kDegreesPerSemicircle;
  p.lon = *lon * fit::kDegreesPerSemicircle;

  if (const auto ea = f.get(78)) {
    p.elevation_m = *ea / 5.0 - 500.0;
  } else if (const auto alt = f.get(2)) {
    p.elevation_m = *alt / 5.0 - 500.0;
  }

  if (has_timestamp) p.time_s = timestamp_fit + fit::kFitEpochOffsetS;

  if (const auto hr = f.get(3); hr && *hr > 0) p.heart_rate_bpm = static_cast<int>(*hr);
  if (const auto cad = f.get(4)) p.cadence_rpm = static_cast<int>(*cad);

  if (const auto es = f.get(73)) {
    p.speed_mps = *es / 1000.0;
  } else if (const auto s = f.get(6)) {
    p.speed_mps = *s / 1000.0;
  }
  out.push_back(p);
}

void apply_session(const DataFields& f, SessionInfo& s) {
  if (const auto v = f.get(2)) s.start_time_s = *v + fit::kFitEpochOffsetS;
  if (const auto v = f.get(5)) s.sport = sport_name(static_cast<int>(*v));
  if (const auto v = f.get(8)) s.total_timer_time_s = *v / 1000.0;
  else if (const auto el = f.get(7)) s.total_timer_time_s = *el / 1000.0;
  if (const auto v = f.get(9)) s.total_distance_m = *v / 100.0;
  if (const auto v = f.get(11)) s.total_calories = static_cast<int>(*v);
  if (const auto v = f.get(124)) s.avg_speed_mps = *v / 1000.0;
  else if (const auto sp = f.get(14)) s.avg_speed_mps = *sp / 1000.0;
  if (const auto v = f.get(125)) s.max_speed_mps = *v / 1000.0;
  else if (const auto sp = f.get(15)) s.max_speed_mps = *sp / 1000.0;
  if (const auto v = f.get(16)) s.avg_heart_rate_bpm = static_cast<int>(*v);
  if (const auto v = f.get(17)) s.max_heart_rate_bpm = static_cast<int>(*v);
  if (const auto v = f.get(18)) s.avg_cadence_rpm = static_cast<int>(*v);
  if (const auto v = f.get(22)) s.total_ascent_m = *v;
}

} // namespace

Activity ReadFit(const std::string& bytes, const std::string& filename) {
  if (bytes.size() < 12) {
    throw ActivityReadError("FIT parsing failed: file too short");
  }
  const auto* b = reinterpret_cast<const unsigned char*>(bytes.data());
  const std::size_t header_size = b[0];
  if ((header_size != 12 && header_size != 14) || bytes.size() < header_size) {
    throw ActivityReadError("FIT parsing failed: bad header size");
  }
  if (std::memcmp(b + 8, ".FIT", 4) != 0) {
    throw ActivityReadError("FIT parsing failed: missing .FIT signature");
  }
  const std::size_t data_size = static_cast<std::size_t>(read_uint(b + 4, 4, false));
  if (data_size > bytes.size() - header_size) {
    throw ActivityReadError("FIT parsing failed: truncated data");
  }

  Activity a;
  a.filename = filename;
  a.file_type = ActivityFileType::FIT;

  std::array<MessageDef, 16> defs{};
  std::uint32_t last_timestamp = 0;

  ByteCursor cur(bytes, header_size, header_size + data_size);
  while (!cur.done()) {
    const std::uint8_t hdr = cur.u8();

    // Definition message
    if ((hdr & 0x80) == 0 && (hdr & 0x40) != 0) {
      MessageDef& d = defs[hdr & 0x0F];
      d = MessageDef{};
      d.defined = true;
      cur.u8();  // reserved
      d.big_endian = cur.u8() == 1;
      d.global_num = static_cast<std::uint16_t>(read_uint(cur.take(2), 2, d.big_endian));
      const std::uint8_t nfields = cur.u8();
      d.fields.reserve(nfields);
      for (std::uint8_t i = 0; i < nfields; ++i) {
        const unsigned char* f = cur.take(3);
        d.fields.push_back(FieldDef{f[0], f[1], f[2]});
      }
      if (hdr & 0x20) {
        const std::uint8_t ndev = cur.u8();
        for (std::uint8_t i = 0; i < ndev; ++i) d.dev_data_size += cur.take(3)[1];
      }
      continue;
    }

    // Data message (normal or compressed timestamp header)
    const bool compressed = (hdr & 0x80) != 0;
    const std::size_t local = compressed ? ((hdr >> 5) & 0x03) : (hdr & 0x0F);
    const MessageDef& d = defs[local];
    if (!d.defined) {
      throw ActivityReadError("FIT parsing failed: data message for undefined local type " +
                              std::to_string(local));
    }

    if (compressed) {
      const std::uint32_t offset = hdr & 0x1F;
      std::uint32_t ts = (last_timestamp & ~0x1FU) + offset;
      if (offset < (last_timestamp & 0x1FU)) ts += 0x20;
      last_timestamp = ts;
    }

    DataFields fields;
    for (const FieldDef& f : d.fields) {
      const unsigned char* p = cur.take(f.size);
      fields.by_num[f.num] = decode(p, f, d.big_endian);
    }
    cur.take(d.dev_data_size);

    bool stamped = compressed;
    if (const auto ts = fields.get(kFieldTimestamp)) {
      last_timestamp = static_cast<std::uint32_t>(*ts);
      stamped = true;
    }

    if (d.global_num == fit::kMesgRecord) {
      apply_record(fields, static_cast<double>(last_timestamp), stamped, a.points);
    } else if (d.global_num == fit::kMesgSession && !a.session) {
      SessionInfo s;
      apply_session(fields, s);
      a.session = s;
    }
  }

  if (a.points.empty()) {
    throw ActivityReadError("No track data found");
  }
  return a;
}

} // namespace gradepace::io
