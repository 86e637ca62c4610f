#include "gradepace/config/path_utils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace gradepace::cfg::pathu {

std::string Dirname(const std::string& path) {
  const fs::path parent = fs::path(path).parent_path();
  return parent.empty() ? "." : parent.string();
}

std::string Basename(const std::string& path) {
  return fs::path(path).filename().string();
}

std::string LowerExtension(const std::string& path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

std::string Join(const std::string& a, const std::string& b) {
  return (fs::path(a) / b).string();
}

std::string Normalize(const std::string& p) {
  return fs::path(p).lexically_normal().string();
}

std::string ResolveHref(const std::string& owner_xml_path,
                        const std::string& base_dir,
                        const std::string& href) {
  if (fs::path(href).is_absolute()) return Normalize(href);

  // baseDir hangs off the owner's directory; without it href is owner-relative.
  fs::path anchor = Dirname(owner_xml_path);
  if (!base_dir.empty()) anchor /= base_dir;
  return Normalize((anchor / href).string());
}

} // namespace gradepace::cfg::pathu
