#include "gradepace/config/xml_utils.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlschemas.h>

namespace {

void EnsureParserReady() {
  static const bool ready = [] {
    xmlInitParser();
    return true;
  }();
  (void)ready;
}

xmlDocPtr as_doc(void* doc) { return static_cast<xmlDocPtr>(doc); }
xmlNode* as_node(void* node) { return static_cast<xmlNode*>(node); }

bool is_element(const xmlNode* n, const std::string& name) {
  return n->type == XML_ELEMENT_NODE && name == reinterpret_cast<const char*>(n->name);
}

// "A/B/C" -> {A, B, C}; empty segments are dropped.
std::vector<std::string> path_segments(const std::string& path) {
  std::vector<std::string> out;
  std::istringstream in(path);
  std::string seg;
  while (std::getline(in, seg, '/')) {
    if (!seg.empty()) out.push_back(seg);
  }
  return out;
}

xmlNode* first_child(xmlNode* parent, const std::string& name) {
  if (!parent) return nullptr;
  for (xmlNode* c = parent->children; c; c = c->next) {
    if (is_element(c, name)) return c;
  }
  return nullptr;
}

// Walks `path` below `from`. A leading segment equal to `from`'s own name is skipped,
// so both "SystemConfig/Refs" and "Refs" work from the root.
xmlNode* descend(xmlNode* from, std::vector<std::string> segs) {
  if (!from) return nullptr;
  if (!segs.empty() && is_element(from, segs.front())) segs.erase(segs.begin());
  xmlNode* n = from;
  for (const std::string& s : segs) {
    n = first_child(n, s);
    if (!n) break;
  }
  return n;
}

xmlNode* doc_root(void* doc) {
  return doc ? xmlDocGetRootElement(as_doc(doc)) : nullptr;
}

struct XmlFree {
  void operator()(xmlChar* p) const { xmlFree(p); }
};
using XmlString = std::unique_ptr<xmlChar, XmlFree>;

std::string to_string(const XmlString& s) {
  return s ? std::string(reinterpret_cast<const char*>(s.get())) : std::string();
}

std::string trimmed(const std::string& s) {
  const char* ws = " \t\r\n";
  const auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) return "";
  return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string text_of(xmlNode* n) {
  if (!n) return "";
  return trimmed(to_string(XmlString(xmlNodeGetContent(n))));
}

std::string attr_of(xmlNode* n, const std::string& attr) {
  if (!n) return "";
  return to_string(XmlString(xmlGetProp(n, reinterpret_cast<const xmlChar*>(attr.c_str()))));
}

double parse_double(const std::string& s) {
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) {
    throw std::runtime_error("Invalid number '" + s + "'");
  }
  return v;
}

int parse_int(const std::string& s) {
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
    throw std::runtime_error("Invalid integer '" + s + "'");
  }
  return static_cast<int>(v);
}

bool parse_bool(const std::string& s) {
  if (s == "true" || s == "TRUE" || s == "1") return true;
  if (s == "false" || s == "FALSE" || s == "0") return false;
  throw std::runtime_error("Invalid boolean '" + s + "'");
}

// Empty text keeps the default; parse failures are prefixed with `context`.
template <typename T, typename Parse>
T parse_or(const std::string& text, T default_val, const std::string& context, Parse parse) {
  if (text.empty()) return default_val;
  try {
    return parse(text);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(context + ": " + e.what());
  }
}

struct SchemaParserFree {
  void operator()(xmlSchemaParserCtxtPtr p) const { xmlSchemaFreeParserCtxt(p); }
};
struct SchemaFree {
  void operator()(xmlSchemaPtr p) const { xmlSchemaFree(p); }
};
struct SchemaValidFree {
  void operator()(xmlSchemaValidCtxtPtr p) const { xmlSchemaFreeValidCtxt(p); }
};

} // namespace

namespace gradepace::cfg::xmlu {

void* ReadXmlDocOrThrow(const std::string& xml_path) {
  EnsureParserReady();
  xmlDocPtr doc = xmlReadFile(xml_path.c_str(), nullptr, XML_PARSE_NONET);
  if (!doc) {
    throw std::runtime_error("Failed to parse XML: " + xml_path);
  }
  return doc;
}

void* ReadXmlMemoryOrThrow(const std::string& bytes, const std::string& name_for_errors) {
  EnsureParserReady();
  if (bytes.size() > static_cast<std::size_t>(INT_MAX)) {
    throw std::runtime_error("XML buffer too large: " + name_for_errors);
  }
  xmlDocPtr doc = xmlReadMemory(bytes.data(), static_cast<int>(bytes.size()),
                                name_for_errors.c_str(), nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
  if (!doc) {
    throw std::runtime_error("Failed to parse XML: " + name_for_errors);
  }
  return doc;
}

void FreeXmlDoc(void* doc) {
  if (doc) xmlFreeDoc(as_doc(doc));
}

std::string RootName(void* doc) {
  const xmlNode* r = doc_root(doc);
  return r ? reinterpret_cast<const char*>(r->name) : "";
}

void ValidateOrThrow(void* doc, const std::string& xsd_path, const std::string& xml_path_for_errors) {
  std::unique_ptr<xmlSchemaParserCtxt, SchemaParserFree> parser(xmlSchemaNewParserCtxt(xsd_path.c_str()));
  if (!parser) {
    throw std::runtime_error("Failed to create XSD parser context: " + xsd_path);
  }
  std::unique_ptr<xmlSchema, SchemaFree> schema(xmlSchemaParse(parser.get()));
  if (!schema) {
    throw std::runtime_error("Failed to parse XSD: " + xsd_path);
  }
  std::unique_ptr<xmlSchemaValidCtxt, SchemaValidFree> validator(xmlSchemaNewValidCtxt(schema.get()));
  if (!validator) {
    throw std::runtime_error("Failed to create XSD validation context: " + xsd_path);
  }

  const int rc = xmlSchemaValidateDoc(validator.get(), as_doc(doc));
  if (rc != 0) {
    std::ostringstream oss;
    oss << "XSD validation failed for " << xml_path_for_errors << " using schema " << xsd_path
        << " (rc=" << rc << ")";
    throw std::runtime_error(oss.str());
  }
}

std::string GetAttr(void* doc, const std::string& path, const std::string& attr) {
  return attr_of(descend(doc_root(doc), path_segments(path)), attr);
}

double GetDouble(void* doc, const std::string& path, double default_val) {
  return parse_or(text_of(descend(doc_root(doc), path_segments(path))), default_val, path, parse_double);
}

int GetInt(void* doc, const std::string& path, int default_val) {
  return parse_or(text_of(descend(doc_root(doc), path_segments(path))), default_val, path, parse_int);
}

bool GetBoolText(void* doc, const std::string& path, bool default_val) {
  return parse_or(text_of(descend(doc_root(doc), path_segments(path))), default_val, path, parse_bool);
}

std::vector<void*> FindNodes(void* doc, const std::string& path) {
  std::vector<std::string> segs = path_segments(path);
  xmlNode* r = doc_root(doc);
  if (!r) return {};
  if (!segs.empty() && is_element(r, segs.front())) segs.erase(segs.begin());
  if (segs.empty()) return {};

  const std::string leaf = segs.back();
  segs.pop_back();
  xmlNode* parent = descend(r, segs);

  std::vector<void*> out;
  if (!parent) return out;
  for (xmlNode* c = parent->children; c; c = c->next) {
    if (is_element(c, leaf)) out.push_back(c);
  }
  return out;
}

std::string NodeGetAttr(void* node, const std::string& attr) {
  return attr_of(as_node(node), attr);
}

std::string NodeGetTextChild(void* node, const std::string& child_name) {
  return text_of(first_child(as_node(node), child_name));
}

double NodeGetDoubleChild(void* node, const std::string& child_name, double default_val) {
  return parse_or(NodeGetTextChild(node, child_name), default_val, child_name, parse_double);
}

std::string NodeGetAttrPath(void* node, const std::string& path, const std::string& attr) {
  return attr_of(descend(as_node(node), path_segments(path)), attr);
}

double NodeGetDoublePath(void* node, const std::string& path, double default_val) {
  return parse_or(text_of(descend(as_node(node), path_segments(path))), default_val, path, parse_double);
}

bool NodeGetBoolPath(void* node, const std::string& path, bool default_val) {
  return parse_or(text_of(descend(as_node(node), path_segments(path))), default_val, path, parse_bool);
}

std::optional<double> ParseOptionalDouble(const std::string& s, const std::string& what) {
  if (s.empty()) return std::nullopt;
  return parse_or(s, 0.0, what, parse_double);
}

std::optional<int> ParseOptionalInt(const std::string& s, const std::string& what) {
  if (s.empty()) return std::nullopt;
  return parse_or(s, 0, what, parse_int);
}

} // namespace gradepace::cfg::xmlu
