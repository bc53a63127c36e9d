#pragma once
// Conversion.hpp – Unit conversion for physical quantities in SYNOP reports.
//
// Supported families (units are UCUM-style strings as used in Observation):
//   temperature  Cel, K, degF
//   speed        m/s, KT, km/h
//   length       mm, cm, dm, m, dam, hm, km, ft
//   pressure     Pa, hPa, kPa, mbar
//   time         s, min, h, day

#include <stdexcept>
#include <string_view>

namespace synop {

class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Convert `value` from unit `from` to unit `to`.  Identical units pass through.
// Throws ConversionError when either unit is unknown or the families differ.
[[nodiscard]] double convert(double value, std::string_view from, std::string_view to);

// True when `unit` is one of the supported unit strings.
[[nodiscard]] bool isKnownUnit(std::string_view unit) noexcept;

} // namespace synop
