#pragma once
#include <string>

namespace gradepace::cfg::pathu {

// Absolute hrefs are kept; others resolve against <dir of owner>/<base_dir>.
std::string ResolveHref(const std::string& owner_xml_path,
                        const std::string& base_dir,
                        const std::string& href);

// Parent directory, "." when there is none.
std::string Dirname(const std::string& path);

// Final path component ("run.gpx" for "/data/run.gpx").
std::string Basename(const std::string& path);

// Lower-cased extension including the dot, or empty.
std::string LowerExtension(const std::string& path);

std::string Join(const std::string& a, const std::string& b);

// Lexical normalization only; the file need not exist.
std::string Normalize(const std::string& p);

} // namespace gradepace::cfg::pathu
