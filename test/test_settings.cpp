#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "lensbridge/enum_translator.hpp"
#include "lensbridge/errors.hpp"
#include "lensbridge/redshift.hpp"
#include "lensbridge/settings.hpp"

using namespace lensbridge_interface;

static SettingsMap default_settings()
{
  return SettingsMap{
    {"snonlinear", std::string("smith03_revised")},
    {"stransfer",  std::string("eisenhu")},
    {"sgrowth",    std::string("growth_de")},
    {"sde_param",  std::string("linder")},
    {"normmode",   std::string("norm_s8")},
    {"stomo",      std::string("tomo_all")},
    {"sreduced",   std::string("none")},
    {"q_mag_size", 1.0}
  };
}

static bool report(const bool passed)
{
  std::cout << "  Result: " << (passed ? "PASS" : "FAIL") << std::endl;
  return passed;
}

// ============================================================================
// Test 1: a complete mapping resolves to the expected enumerators
// ============================================================================
bool test_resolve_defaults()
{
  std::cout << "\n=== Test 1: Resolve complete settings ===" << std::endl;
  SettingsMap settings = default_settings();
  settings["snonlinear"] = std::string("coyote13");
  settings["stransfer"] = std::string("be84");
  settings["sgrowth"] = std::string("heath");
  settings["sde_param"] = std::string("poly_DE");
  settings["normmode"] = std::string("norm_as");
  settings["stomo"] = std::string("tomo_cross_only");
  settings["sreduced"] = std::string("reduced_K10");
  settings["q_mag_size"] = 0.25;
  settings["unused_key"] = std::string("ignored");

  const Settings s = resolve_settings(settings);
  const bool passed = 
    s.nonlinear == NonlinearType::coyote13 &&
    s.transfer == TransferType::be84 &&
    s.growth == GrowthType::heath &&
    s.de_param == DarkEnergyParam::poly_DE &&
    s.norm == NormMode::norm_as &&
    s.tomo == TomoType::tomo_cross_only &&
    s.reduced == ReducedShear::reduced_K10 &&
    s.q_mag_size == 0.25;
  std::cout << "  " << describe(s) << std::endl;
  return report(passed);
}

// ============================================================================
// Test 2: every enumerated key rejects an unknown value, naming the key
// ============================================================================
bool test_unrecognized_option_per_key()
{
  std::cout << "\n=== Test 2: Unrecognized option names the key ===" << std::endl;
  const std::vector<std::string> keys = {
    "snonlinear", "stransfer", "sgrowth", "sde_param", 
    "normmode", "stomo", "sreduced"
  };
  bool passed = true;
  for (const auto& key : keys) {
    SettingsMap settings = default_settings();
    settings[key] = std::string("not_an_option");
    try {
      resolve_settings(settings);
      std::cout << "  " << key << ": no exception" << std::endl;
      passed = false;
    }
    catch (const UnrecognizedOption& e) {
      if (e.key() != key || e.option() != "not_an_option") {
        std::cout << "  " << key << ": wrong key reported (" << e.key() << ")" 
                  << std::endl;
        passed = false;
      }
    }
  }
  return report(passed);
}

// ============================================================================
// Test 3: exact matching only
// ============================================================================
bool test_exact_match()
{
  std::cout << "\n=== Test 3: No partial or case-insensitive match ===" << std::endl;
  bool passed = true;
  passed &= (translate(nonlinear_vocabulary, "linear") == 0);
  passed &= (translate(nonlinear_vocabulary, "smith03_revised") == 7);
  passed &= (translate(nonlinear_vocabulary, "Linear") == -1);
  passed &= (translate(nonlinear_vocabulary, "line") == -1);
  passed &= (translate(nonlinear_vocabulary, "linear ") == -1);
  passed &= (translate(tomo_vocabulary, "tomo_auto_only") == 1);
  passed &= (translate(nofz_vocabulary, "single") == 5);
  try {
    translate_or_throw(de_param_vocabulary, std::string("earlyde"));
    passed = false;
  }
  catch (const UnrecognizedOption& e) {
    passed &= (e.option() == "earlyde");
  }
  return report(passed);
}

// ============================================================================
// Test 4: missing keys, first failure in key order is reported
// ============================================================================
bool test_missing_and_order()
{
  std::cout << "\n=== Test 4: Missing settings and failure order ===" << std::endl;
  bool passed = true;
  {
    SettingsMap settings = default_settings();
    settings.erase("sreduced");
    try {
      resolve_settings(settings);
      passed = false;
    }
    catch (const MissingSetting& e) {
      passed &= (e.key() == "sreduced");
    }
  }
  {
    SettingsMap settings = default_settings();
    settings.erase("q_mag_size");
    try {
      resolve_settings(settings);
      passed = false;
    }
    catch (const MissingSetting& e) {
      passed &= (e.key() == "q_mag_size");
    }
  }
  { // bad stomo and missing stransfer: stransfer comes first
    SettingsMap settings = default_settings();
    settings["stomo"] = std::string("tomo_none");
    settings.erase("stransfer");
    try {
      resolve_settings(settings);
      passed = false;
    }
    catch (const MissingSetting& e) {
      passed &= (e.key() == "stransfer");
    }
    catch (const Error&) {
      passed = false;
    }
  }
  { // bad snonlinear and bad sreduced: snonlinear comes first
    SettingsMap settings = default_settings();
    settings["snonlinear"] = std::string("halofit");
    settings["sreduced"] = std::string("K10");
    try {
      resolve_settings(settings);
      passed = false;
    }
    catch (const UnrecognizedOption& e) {
      passed &= (e.key() == "snonlinear");
    }
  }
  return report(passed);
}

// ============================================================================
// Test 5: value types
// ============================================================================
bool test_type_mismatch()
{
  std::cout << "\n=== Test 5: Type mismatches ===" << std::endl;
  bool passed = true;
  {
    SettingsMap settings = default_settings();
    settings["sgrowth"] = 2.0;
    try {
      resolve_settings(settings);
      passed = false;
    }
    catch (const TypeMismatch& e) {
      passed &= (e.key() == "sgrowth");
    }
  }
  {
    SettingsMap settings = default_settings();
    settings["q_mag_size"] = std::string("large");
    try {
      resolve_settings(settings);
      passed = false;
    }
    catch (const TypeMismatch& e) {
      passed &= (e.key() == "q_mag_size");
    }
  }
  {
    SettingsMap settings = default_settings();
    settings["q_mag_size"] = std::string("0.5");
    passed &= (resolve_settings(settings).q_mag_size == 0.5);
    settings["q_mag_size"] = 2L;
    passed &= (resolve_settings(settings).q_mag_size == 2.0);
  }
  return report(passed);
}

// ============================================================================
// Test 6: vocabularies
// ============================================================================
bool test_options()
{
  std::cout << "\n=== Test 6: Vocabularies ===" << std::endl;
  bool passed = true;
  const std::vector<std::string> tomo = {
    "tomo_all", "tomo_auto_only", "tomo_cross_only"
  };
  passed &= (options("stomo") == tomo);
  passed &= (options("snonlinear").size() == 8);
  passed &= (options("stransfer").size() == 4);
  passed &= (options("sgrowth").size() == 2);
  passed &= (options("sde_param").size() == 4);
  passed &= (options("normmode").size() == 2);
  passed &= (options("sreduced").front() == "none");
  passed &= (options("nofz").size() == 6 && options("nofz").front() == "ludo");
  try {
    options("q_mag_size");
    passed = false;
  }
  catch (const UnrecognizedOption&) {}
  return report(passed);
}

int main()
{
  std::cout << "Running settings tests..." << std::endl;
  bool all_passed = true;
  all_passed &= test_resolve_defaults();
  all_passed &= test_unrecognized_option_per_key();
  all_passed &= test_exact_match();
  all_passed &= test_missing_and_order();
  all_passed &= test_type_mismatch();
  all_passed &= test_options();

  std::cout << "\n=== Summary ===" << std::endl;
  if (all_passed) {
    std::cout << "All tests PASSED!" << std::endl;
    return 0;
  }
  std::cout << "Some tests FAILED!" << std::endl;
  return 1;
}
