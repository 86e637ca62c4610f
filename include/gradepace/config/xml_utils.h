#pragma once

#include <optional>
#include <string>
#include <vector>

/*
 * Thin libxml2 helpers. Documents and nodes travel as void* so libxml headers stay out of the
 * public include tree. Paths look like "Refs/AnalysisProfiles"; a leading segment naming the
 * starting element itself is ignored. Missing elements read as empty text.
 */
namespace gradepace::cfg::xmlu {

// Parse a file with network access disabled. Throws std::runtime_error naming the file.
void* ReadXmlDocOrThrow(const std::string& xml_path);

// Same for an in-memory buffer; `name_for_errors` labels messages.
void* ReadXmlMemoryOrThrow(const std::string& bytes, const std::string& name_for_errors);

void FreeXmlDoc(void* doc);

// Scoped owner for a parsed document.
class DocGuard {
public:
  explicit DocGuard(void* doc) : doc_(doc) {}
  ~DocGuard() { FreeXmlDoc(doc_); }
  DocGuard(const DocGuard&) = delete;
  DocGuard& operator=(const DocGuard&) = delete;

  void* get() const { return doc_; }

private:
  void* doc_;
};

std::string RootName(void* doc);

// Throws when the schema cannot be loaded or the document does not conform.
void ValidateOrThrow(void* doc, const std::string& xsd_path, const std::string& xml_path_for_errors);

// Document-rooted lookups. Empty text yields the default; malformed text throws
// std::runtime_error prefixed with the path.
std::string GetAttr(void* doc, const std::string& path, const std::string& attr);
double GetDouble(void* doc, const std::string& path, double default_val);
int GetInt(void* doc, const std::string& path, int default_val);
bool GetBoolText(void* doc, const std::string& path, bool default_val);

// Every element matching the last path segment under its parent, e.g. "AnalysisProfiles/Profile".
std::vector<void*> FindNodes(void* doc, const std::string& path);

// Node-rooted lookups.
std::string NodeGetAttr(void* node, const std::string& attr);
std::string NodeGetTextChild(void* node, const std::string& child_name);
double NodeGetDoubleChild(void* node, const std::string& child_name, double default_val);
std::string NodeGetAttrPath(void* node, const std::string& path, const std::string& attr);
double NodeGetDoublePath(void* node, const std::string& path, double default_val);
bool NodeGetBoolPath(void* node, const std::string& path, bool default_val);

// Empty text -> nullopt; malformed -> std::runtime_error prefixed with `what`.
std::optional<double> ParseOptionalDouble(const std::string& s, const std::string& what);
std::optional<int> ParseOptionalInt(const std::string& s, const std::string& what);

} // namespace gradepace::cfg::xmlu
