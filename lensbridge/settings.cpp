#include <string>
#include <string_view>
#include <variant>
#include <vector>
using namespace std::literals; // enables "sv" literal

// SPDLOG
#include <spdlog/spdlog.h>

// boost library
#include <boost/lexical_cast.hpp>

#include "lensbridge/settings.hpp"
#include "lensbridge/redshift.hpp"

static constexpr std::string_view errbegins = "Begins Execution"sv;
static constexpr std::string_view errends = "Ends Execution"sv;
static constexpr std::string_view debugsel = "{}: {} = {} selected."sv;

using spdlog::debug;

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// AUX FUNCTIONS (PRIVATE)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

namespace
{

const SettingValue& find_setting(const SettingsMap& settings, std::string_view key)
{
  auto it = settings.find(std::string(key));
  if (it == settings.end()) {
    throw MissingSetting(std::string(key));
  }
  return it->second;
}

template <typename T, std::size_t N>
T resolve_enum_setting(
    const SettingsMap& settings, 
    std::string_view key, 
    const Vocabulary<T,N>& dictionary
  )
{
  static constexpr std::string_view fname = "resolve_enum_setting"sv;
  const SettingValue& value = find_setting(settings, key);
  const std::string* option = std::get_if<std::string>(&value);
  if (nullptr == option) {
    throw TypeMismatch(std::string(key), "string");
  }
  const T result = translate_or_throw(dictionary, *option, std::string(key));
  debug(debugsel, fname, key, *option);
  return result;
}

double resolve_scalar_setting(const SettingsMap& settings, std::string_view key)
{
  static constexpr std::string_view fname = "resolve_scalar_setting"sv;
  const SettingValue& value = find_setting(settings, key);
  double result = 0.0;
  if (const double* x = std::get_if<double>(&value)) {
    result = *x;
  }
  else if (const long* n = std::get_if<long>(&value)) {
    result = static_cast<double>(*n);
  }
  else {
    try {
      result = boost::lexical_cast<double>(std::get<std::string>(value));
    }
    catch (const boost::bad_lexical_cast&) {
      throw TypeMismatch(std::string(key), "float");
    }
  }
  debug(debugsel, fname, key, result);
  return result;
}

template <typename T, std::size_t N>
std::vector<std::string> tokens(const Vocabulary<T,N>& dictionary)
{
  std::vector<std::string> result;
  result.reserve(N);
  for (const auto& entry : dictionary) {
    result.emplace_back(entry.first);
  }
  return result;
}

} // namespace

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

Settings resolve_settings(const SettingsMap& settings)
{
  static constexpr std::string_view fname = "resolve_settings"sv;
  debug("{}: {}", fname, errbegins);
  Settings result{};
  result.nonlinear = resolve_enum_setting(settings, key_nonlinear, nonlinear_vocabulary);
  result.transfer = resolve_enum_setting(settings, key_transfer, transfer_vocabulary);
  result.growth = resolve_enum_setting(settings, key_growth, growth_vocabulary);
  result.de_param = resolve_enum_setting(settings, key_de_param, de_param_vocabulary);
  result.norm = resolve_enum_setting(settings, key_norm, norm_vocabulary);
  result.tomo = resolve_enum_setting(settings, key_tomo, tomo_vocabulary);
  result.reduced = resolve_enum_setting(settings, key_reduced, reduced_vocabulary);
  result.q_mag_size = resolve_scalar_setting(settings, key_q_mag_size);
  debug("{}: {}", fname, errends);
  return result;
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

TomoType resolve_tomography(const std::string& stomo)
{
  return translate_or_throw(tomo_vocabulary, stomo, std::string(key_tomo));
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

std::vector<std::string> options(const std::string& key)
{
  if (key == key_nonlinear) return tokens(nonlinear_vocabulary);
  if (key == key_transfer)  return tokens(transfer_vocabulary);
  if (key == key_growth)    return tokens(growth_vocabulary);
  if (key == key_de_param)  return tokens(de_param_vocabulary);
  if (key == key_norm)      return tokens(norm_vocabulary);
  if (key == key_tomo)      return tokens(tomo_vocabulary);
  if (key == key_reduced)   return tokens(reduced_vocabulary);
  if (key == "nofz")        return tokens(nofz_vocabulary);
  throw UnrecognizedOption("", key);
}

// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

std::string describe(const Settings& settings)
{
  std::string result;
  result += std::string(key_nonlinear) + "=";
  result += to_string(nonlinear_vocabulary, settings.nonlinear);
  result += " " + std::string(key_transfer) + "=";
  result += to_string(transfer_vocabulary, settings.transfer);
  result += " " + std::string(key_growth) + "=";
  result += to_string(growth_vocabulary, settings.growth);
  result += " " + std::string(key_de_param) + "=";
  result += to_string(de_param_vocabulary, settings.de_param);
  result += " " + std::string(key_norm) + "=";
  result += to_string(norm_vocabulary, settings.norm);
  result += " " + std::string(key_tomo) + "=";
  result += to_string(tomo_vocabulary, settings.tomo);
  result += " " + std::string(key_reduced) + "=";
  result += to_string(reduced_vocabulary, settings.reduced);
  result += " " + std::string(key_q_mag_size) + "=";
  result += std::to_string(settings.q_mag_size);
  return result;
}

} // end namespace lensbridge_interface
