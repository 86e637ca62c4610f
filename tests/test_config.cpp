#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "gradepace/config/config_loader.h"
#include "gradepace/config/path_utils.h"

using namespace gradepace;

namespace fs = std::filesystem;

static const std::string kConfigDir = std::string(GRADEPACE_SOURCE_DIR) + "/config";

static std::string load_error(const std::string& system_xml, const std::string& xsd_dir = "",
                              const std::string& profile = "") {
  try {
    cfg::ConfigLoader::Load(system_xml, xsd_dir, profile);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return "";
}

static void write_file(const fs::path& p, const std::string& text) {
  std::ofstream out(p);
  out << text;
}

// Scratch config tree: system.xml referencing profiles.xml in the same directory.
static fs::path scratch_config(const std::string& name, const std::string& profiles_xml) {
  const fs::path dir = fs::temp_directory_path() / ("gradepace_test_config_" + name);
  fs::create_directories(dir);
  write_file(dir / "system.xml",
             "<SystemConfig><Active><AnalysisProfile id=\"p\"/></Active>"
             "<Refs><AnalysisProfiles href=\"profiles.xml\"/></Refs></SystemConfig>");
  write_file(dir / "profiles.xml", profiles_xml);
  return dir / "system.xml";
}

void test_load_shipped_config() {
  const cfg::ConfigBundle b = cfg::ConfigLoader::Load(kConfigDir + "/system.xml");
  assert(b.system.active.analysis_profile_id == "default");
  assert(b.analysis.id == "default");
  assert(b.analysis.bin_length_m == 50.0);
  assert(b.analysis.grade_model.type == "quadratic");
  assert(!b.analysis.reliability.enabled);
  assert(b.profiles.by_id.size() == 3);
  assert(b.has_batch_runtime);
  assert(b.batch_runtime.max_files == 50);
  assert(b.batch_runtime.max_file_bytes == 52428800LL);
  assert(b.system.diagnostics.print_run_summaries);
  assert(cfg::pathu::Basename(b.paths.analysis_profiles_xml) == "analysis_profiles.xml");
  assert(b.paths.analysis_profiles_xml.find("profiles") != std::string::npos);
  printf("PASS: test_load_shipped_config\n");
}

void test_load_with_schemas_and_override() {
  const cfg::ConfigBundle b = cfg::ConfigLoader::Load(kConfigDir + "/system.xml", kConfigDir + "/schemas", "trail");
  assert(b.analysis.id == "trail");
  assert(b.analysis.bin_length_m == 100.0);
  assert(b.analysis.reference_velocity_mps && *b.analysis.reference_velocity_mps == 3.0);
  assert(b.analysis.grade_model.type == "quartic");
  assert(b.analysis.grade_model.has_coefficients);
  assert(b.analysis.grade_model.coefficients.e == 1.0);
  assert(b.analysis.reliability.enabled);
  assert(b.analysis.adjustment_statistic == "median");

  const cfg::ConfigBundle z = cfg::ConfigLoader::Load(kConfigDir + "/system.xml", kConfigDir + "/schemas", "zone2");
  assert(z.analysis.heart_rate.min_bpm && *z.analysis.heart_rate.min_bpm == 120);
  assert(z.analysis.heart_rate.max_bpm && *z.analysis.heart_rate.max_bpm == 150);
  printf("PASS: test_load_with_schemas_and_override\n");
}

void test_unknown_profile() {
  const std::string err = load_error(kConfigDir + "/system.xml", "", "nope");
  assert(err.find("Active AnalysisProfile id not found: nope") != std::string::npos);
  printf("PASS: test_unknown_profile\n");
}

void test_invalid_profiles() {
  std::string err = load_error(scratch_config("binlen",
      "<AnalysisProfiles><Profile id=\"p\"><BinLengthMeters>0</BinLengthMeters></Profile></AnalysisProfiles>").string());
  assert(err.find("invalid BinLengthMeters") != std::string::npos);
  assert(err.find("profiles.xml") != std::string::npos);

  err = load_error(scratch_config("model",
      "<AnalysisProfiles><Profile id=\"p\"><GradeModel type=\"cubic\"/></Profile></AnalysisProfiles>").string());
  assert(err.find("unknown GradeModel type") != std::string::npos);

  err = load_error(scratch_config("coeffs",
      "<AnalysisProfiles><Profile id=\"p\"><GradeModel type=\"quartic\">"
      "<Coefficients a=\"0\" b=\"0\"/></GradeModel></Profile></AnalysisProfiles>").string());
  assert(err.find("needs all of a..e") != std::string::npos);

  err = load_error(scratch_config("number",
      "<AnalysisProfiles><Profile id=\"p\"><BinLengthMeters>fifty</BinLengthMeters></Profile></AnalysisProfiles>").string());
  assert(!err.empty());

  err = load_error(scratch_config("stat",
      "<AnalysisProfiles><Profile id=\"p\"><AdjustmentView statistic=\"mode\"/></Profile></AnalysisProfiles>").string());
  assert(err.find("statistic") != std::string::npos);

  // Minimal valid profile: defaults fill the rest and no batch runtime file is referenced.
  const cfg::ConfigBundle b = cfg::ConfigLoader::Load(scratch_config("minimal",
      "<AnalysisProfiles><Profile id=\"p\"/></AnalysisProfiles>").string());
  assert(b.analysis.bin_length_m == 50.0);
  assert(!b.has_batch_runtime);
  assert(b.batch_runtime.max_files == 50);
  printf("PASS: test_invalid_profiles\n");
}

void test_missing_files() {
  assert(!load_error(kConfigDir + "/does_not_exist.xml").empty());
  // Wrong root element.
  assert(load_error(kConfigDir + "/profiles/batch_runtime.xml").find("Expected root element") != std::string::npos);
  printf("PASS: test_missing_files\n");
}

void test_defaults() {
  const cfg::ConfigBundle b = cfg::ConfigLoader::Defaults();
  assert(b.analysis.id == "default");
  assert(b.analysis.bin_length_m == 50.0);
  assert(b.analysis.grade_model.type == "quadratic");
  assert(b.profiles.by_id.count("default") == 1);
  printf("PASS: test_defaults\n");
}

void test_path_utils() {
  using namespace cfg::pathu;
  assert(LowerExtension("a/B.GPX") == ".gpx");
  assert(LowerExtension("README").empty());
  assert(Basename("/x/y/run.fit") == "run.fit");
  assert(Dirname("/x/y/run.fit") == "/x/y");
  assert(ResolveHref("/cfg/system.xml", "profiles", "a.xml") == "/cfg/profiles/a.xml");
  assert(ResolveHref("/cfg/system.xml", "", "/abs/a.xml") == "/abs/a.xml");
  printf("PASS: test_path_utils\n");
}

int main() {
  test_load_shipped_config();
  test_load_with_schemas_and_override();
  test_unknown_profile();
  test_invalid_profiles();
  test_missing_files();
  test_defaults();
  test_path_utils();
  printf("All config tests passed.\n");
  return 0;
}
