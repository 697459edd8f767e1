#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
using namespace std::literals; // enables "sv" literal

#include "lensbridge/enum_translator.hpp"

#ifndef __LENSBRIDGE_SETTINGS_HPP
#define __LENSBRIDGE_SETTINGS_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Computation settings (nonlinear model, transfer function, growth, ...)
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

enum class NonlinearType {
  linear, pd96, smith03, smith03_de, coyote10, coyote13, halodm, smith03_revised
};

enum class TransferType { bbks, eisenhu, eisenhu_osc, be84 };

enum class GrowthType { heath, growth_de };

enum class DarkEnergyParam { jassal, linder, earlyDE, poly_DE };

enum class NormMode { norm_s8, norm_as };

enum class TomoType { tomo_all, tomo_auto_only, tomo_cross_only };

enum class ReducedShear { none, reduced_K10 };

inline constexpr Vocabulary<NonlinearType,8> nonlinear_vocabulary = {{
  {"linear"sv,          NonlinearType::linear},
  {"pd96"sv,            NonlinearType::pd96},
  {"smith03"sv,         NonlinearType::smith03},
  {"smith03_de"sv,      NonlinearType::smith03_de},
  {"coyote10"sv,        NonlinearType::coyote10},
  {"coyote13"sv,        NonlinearType::coyote13},
  {"halodm"sv,          NonlinearType::halodm},
  {"smith03_revised"sv, NonlinearType::smith03_revised}
}};

inline constexpr Vocabulary<TransferType,4> transfer_vocabulary = {{
  {"bbks"sv,        TransferType::bbks},
  {"eisenhu"sv,     TransferType::eisenhu},
  {"eisenhu_osc"sv, TransferType::eisenhu_osc},
  {"be84"sv,        TransferType::be84}
}};

inline constexpr Vocabulary<GrowthType,2> growth_vocabulary = {{
  {"heath"sv,     GrowthType::heath},
  {"growth_de"sv, GrowthType::growth_de}
}};

inline constexpr Vocabulary<DarkEnergyParam,4> de_param_vocabulary = {{
  {"jassal"sv,  DarkEnergyParam::jassal},
  {"linder"sv,  DarkEnergyParam::linder},
  {"earlyDE"sv, DarkEnergyParam::earlyDE},
  {"poly_DE"sv, DarkEnergyParam::poly_DE}
}};

inline constexpr Vocabulary<NormMode,2> norm_vocabulary = {{
  {"norm_s8"sv, NormMode::norm_s8},
  {"norm_as"sv, NormMode::norm_as}
}};

inline constexpr Vocabulary<TomoType,3> tomo_vocabulary = {{
  {"tomo_all"sv,        TomoType::tomo_all},
  {"tomo_auto_only"sv,  TomoType::tomo_auto_only},
  {"tomo_cross_only"sv, TomoType::tomo_cross_only}
}};

inline constexpr Vocabulary<ReducedShear,2> reduced_vocabulary = {{
  {"none"sv,        ReducedShear::none},
  {"reduced_K10"sv, ReducedShear::reduced_K10}
}};

// Keys of the settings mapping, in resolution order
inline constexpr std::string_view key_nonlinear = "snonlinear"sv;
inline constexpr std::string_view key_transfer = "stransfer"sv;
inline constexpr std::string_view key_growth = "sgrowth"sv;
inline constexpr std::string_view key_de_param = "sde_param"sv;
inline constexpr std::string_view key_norm = "normmode"sv;
inline constexpr std::string_view key_tomo = "stomo"sv;
inline constexpr std::string_view key_reduced = "sreduced"sv;
inline constexpr std::string_view key_q_mag_size = "q_mag_size"sv;

// Python dict -> std::map through pybind11/stl.h
using SettingValue = std::variant<std::string, double, long>;
using SettingsMap = std::map<std::string, SettingValue>;

struct Settings
{
  NonlinearType nonlinear;
  TransferType transfer;
  GrowthType growth;
  DarkEnergyParam de_param;
  NormMode norm;
  TomoType tomo;
  ReducedShear reduced;
  double q_mag_size;
};

// Keys are resolved in the order snonlinear, stransfer, sgrowth, sde_param,
// normmode, stomo, sreduced, q_mag_size: the first failure is the one thrown.
Settings resolve_settings(const SettingsMap& settings);

TomoType resolve_tomography(const std::string& stomo);

// Recognized values of a settings key ("nofz" for the distribution types)
std::vector<std::string> options(const std::string& key);

std::string describe(const Settings& settings);

}  // namespace lensbridge_interface
#endif // HEADER GUARD
