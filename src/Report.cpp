// Report.cpp – Observation / Report accessors and the field name registry.

#include "SynopCodec/Types.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace synop {

// ─── Observation ──────────────────────────────────────────────────────────────

const Observation* Observation::component(std::string_view name) const {
    for (const auto& c : components)
        if (c.name == name) return &c.obs;
    return nullptr;
}

Observation* Observation::component(std::string_view name) {
    for (auto& c : components)
        if (c.name == name) return &c.obs;
    return nullptr;
}

Observation& Observation::setComponent(std::string name, Observation obs) {
    if (Observation* existing = component(name)) {
        *existing = std::move(obs);
        return *existing;
    }
    components.push_back(Component{std::move(name), std::move(obs)});
    return components.back().obs;
}

bool Observation::flag(std::string_view name) const {
    auto it = flags.find(std::string(name));
    return it != flags.end() && it->second;
}

bool Observation::sameAs(const Observation& other) const {
    if (available != other.available || value != other.value || text != other.text ||
        min != other.min || max != other.max || quantifier != other.quantifier ||
        unit != other.unit || table != other.table || code != other.code ||
        flags != other.flags || components.size() != other.components.size() ||
        items.size() != other.items.size())
        return false;
    for (size_t i = 0; i < components.size(); ++i) {
        if (components[i].name != other.components[i].name ||
            !components[i].obs.sameAs(other.components[i].obs))
            return false;
    }
    for (size_t i = 0; i < items.size(); ++i)
        if (!items[i].sameAs(other.items[i])) return false;
    return true;
}

// ─── Field names ──────────────────────────────────────────────────────────────

namespace {

constexpr std::array<std::pair<Field, std::string_view>, 69> kFieldNames = {{
    {Field::StationType,              "station_type"},
    {Field::Callsign,                 "callsign"},
    {Field::Region,                   "region"},
    {Field::ObsTime,                  "obs_time"},
    {Field::WindIndicator,            "wind_indicator"},
    {Field::StationId,                "station_id"},
    {Field::StationPosition,          "station_position"},
    {Field::PrecipitationIndicator,   "precipitation_indicator"},
    {Field::WeatherIndicator,         "weather_indicator"},
    {Field::LowestCloudBase,          "lowest_cloud_base"},
    {Field::Visibility,               "visibility"},
    {Field::CloudCover,               "cloud_cover"},
    {Field::SurfaceWind,              "surface_wind"},
    {Field::AirTemperature,           "air_temperature"},
    {Field::DewpointTemperature,      "dewpoint_temperature"},
    {Field::RelativeHumidity,         "relative_humidity"},
    {Field::StationPressure,          "station_pressure"},
    {Field::SeaLevelPressure,         "sea_level_pressure"},
    {Field::GeopotentialSurface,      "geopotential_surface"},
    {Field::GeopotentialHeight,       "geopotential_height"},
    {Field::PressureTendency,         "pressure_tendency"},
    {Field::PrecipitationS1,          "precipitation_s1"},
    {Field::PresentWeather,           "present_weather"},
    {Field::PastWeather,              "past_weather"},
    {Field::CloudTypes,               "cloud_types"},
    {Field::ExactObservationTime,     "exact_observation_time"},
    {Field::Displacement,             "displacement"},
    {Field::SeaSurfaceTemperature,    "sea_surface_temperature"},
    {Field::WindWaves,                "wind_waves"},
    {Field::SwellWaves,               "swell_waves"},
    {Field::IceAccretion,             "ice_accretion"},
    {Field::WetBulbTemperature,       "wet_bulb_temperature"},
    {Field::SeaLandIce,               "sea_land_ice"},
    {Field::GroundMinimumTemperature, "ground_minimum_temperature"},
    {Field::LocalPrecipitation,       "local_precipitation"},
    {Field::MaxWind,                  "max_wind"},
    {Field::MaximumTemperature,       "maximum_temperature"},
    {Field::MinimumTemperature,       "minimum_temperature"},
    {Field::GroundState,              "ground_state"},
    {Field::GroundStateSnow,          "ground_state_snow"},
    {Field::Evapotranspiration,       "evapotranspiration"},
    {Field::Sunshine,                 "sunshine"},
    {Field::CloudDriftDirection,      "cloud_drift_direction"},
    {Field::CloudElevation,           "cloud_elevation"},
    {Field::PressureChange,           "pressure_change"},
    {Field::PrecipitationS3,          "precipitation_s3"},
    {Field::CloudLayer,               "cloud_layer"},
    {Field::WeatherTime,              "weather_time"},
    {Field::TimeOfEnding,             "time_of_ending"},
    {Field::PrecipitationTime,        "precipitation_time"},
    {Field::HighestGust,              "highest_gust"},
    {Field::SeaState,                 "sea_state"},
    {Field::FrozenDeposit,            "frozen_deposit"},
    {Field::SnowCoverRegularity,      "snow_cover_regularity"},
    {Field::DriftSnow,                "drift_snow"},
    {Field::SnowFall,                 "snow_fall"},
    {Field::DepositDiameter,          "deposit_diameter"},
    {Field::CloudEvolution,           "cloud_evolution"},
    {Field::MaxLowCloud,              "max_low_cloud"},
    {Field::MountainCloud,            "mountain_cloud"},
    {Field::ValleyClouds,             "valley_clouds"},
    {Field::VisibilityDirection,      "visibility_direction"},
    {Field::OpticalPhenomena,         "optical_phenomena"},
    {Field::Mirage,                   "mirage"},
    {Field::CondensationTrails,       "condensation_trails"},
    {Field::SpecialClouds,            "special_clouds"},
    {Field::DayDarkness,              "day_darkness"},
    {Field::SuddenTemperatureChange,  "sudden_temperature_change"},
    {Field::SuddenHumidityChange,     "sudden_humidity_change"},
}};

} // namespace

std::string_view fieldName(Field f) {
    for (const auto& [field, name] : kFieldNames)
        if (field == f) return name;
    return "unknown";
}

std::optional<Field> fieldFromName(std::string_view name) {
    for (const auto& [field, n] : kFieldNames)
        if (n == name) return field;
    return std::nullopt;
}

// ─── Report ───────────────────────────────────────────────────────────────────

bool Report::has(Field f) const {
    return fields.count(f) != 0 || lists.count(f) != 0;
}

const Observation* Report::get(Field f) const {
    auto it = fields.find(f);
    return it == fields.end() ? nullptr : &it->second;
}

const Observation& Report::at(Field f) const {
    auto it = fields.find(f);
    if (it == fields.end())
        throw std::out_of_range("Report has no field '" + std::string(fieldName(f)) + "'");
    return it->second;
}

const std::vector<Observation>* Report::list(Field f) const {
    auto it = lists.find(f);
    return it == lists.end() ? nullptr : &it->second;
}

void Report::set(Field f, Observation obs) {
    fields[f] = std::move(obs);
}

void Report::append(Field f, Observation obs) {
    lists[f].push_back(std::move(obs));
}

} // namespace synop
