// Conversion.cpp – Unit conversion between the units used in SYNOP reports.

#include "SynopCodec/Conversion.hpp"

#include <fmt/format.h>

#include <array>

namespace synop {

namespace {

enum class Family { Temperature, Speed, Length, Pressure, Time };

// Linear units: value_in_base = value × factor
struct LinearUnit {
    std::string_view name;
    Family           family;
    double           factor;
};

constexpr std::array<LinearUnit, 20> kUnits = {{
    {"m/s",  Family::Speed,    1.0},
    {"KT",   Family::Speed,    0.514444},
    {"km/h", Family::Speed,    1.0 / 3.6},

    {"mm",   Family::Length,   0.001},
    {"cm",   Family::Length,   0.01},
    {"dm",   Family::Length,   0.1},
    {"m",    Family::Length,   1.0},
    {"dam",  Family::Length,   10.0},
    {"hm",   Family::Length,   100.0},
    {"km",   Family::Length,   1000.0},
    {"ft",   Family::Length,   0.3048},

    {"Pa",   Family::Pressure, 1.0},
    {"hPa",  Family::Pressure, 100.0},
    {"kPa",  Family::Pressure, 1000.0},
    {"mbar", Family::Pressure, 100.0},

    {"s",    Family::Time,     1.0},
    {"min",  Family::Time,     60.0},
    {"h",    Family::Time,     3600.0},
    {"day",  Family::Time,     86400.0},

    {"Cel",  Family::Temperature, 1.0}, // handled separately
}};

const LinearUnit* findUnit(std::string_view u) noexcept {
    if (u == "K" || u == "degF") return &kUnits.back();
    for (const auto& lu : kUnits)
        if (lu.name == u) return &lu;
    return nullptr;
}

double toCelsius(double v, std::string_view u) {
    if (u == "K")    return v - 273.15;
    if (u == "degF") return (v - 32.0) * 5.0 / 9.0;
    return v;
}

double fromCelsius(double v, std::string_view u) {
    if (u == "K")    return v + 273.15;
    if (u == "degF") return v * 9.0 / 5.0 + 32.0;
    return v;
}

} // namespace

bool isKnownUnit(std::string_view unit) noexcept {
    return findUnit(unit) != nullptr;
}

double convert(double value, std::string_view from, std::string_view to) {
    if (from == to) return value;

    const LinearUnit* a = findUnit(from);
    const LinearUnit* b = findUnit(to);
    if (!a || !b || a->family != b->family)
        throw ConversionError(fmt::format("Cannot convert {} from {} to {}", value, from, to));

    if (a->family == Family::Temperature)
        return fromCelsius(toCelsius(value, from), to);

    return value * a->factor / b->factor;
}

} // namespace synop
