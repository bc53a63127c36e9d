#pragma once
// Types.hpp – Core metadata and decoded-value types for the SYNOP codec.
// All FM-12 report data flows through these structures.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace synop {

// ─── Qualifier attached to an open-ended or bounded value ─────────────────────
enum class Quantifier {
    None,
    IsLess,           // value < stated value
    IsGreater,        // value > stated value
    IsGreaterOrEqual, // value >= stated value
};

struct Component;

// ─── One decoded field (or sub-field) of a report ─────────────────────────────
// An Observation is the unit of both decode output and encode input.  A field
// that is present in the telegram but coded with "/" has available == false.
// Composite groups keep their parts in `components`, in slice order.
struct Observation {
    std::string raw;                 // Source characters, "/" markers included
    bool        available{false};

    std::optional<double>      value; // Numeric meaning
    std::optional<std::string> text;  // Textual meaning (callsign, compass point…)
    std::optional<double>      min;   // Bucket lower bound (range tables)
    std::optional<double>      max;   // Bucket upper bound (range tables)
    Quantifier  quantifier{Quantifier::None};
    std::string unit;                 // "Cel", "hPa", "m", "KT", …

    // Provenance: which code table produced the value and from which code.
    // Encoders prefer `code` when set so that re-encoding is exact.
    std::string        table;
    std::optional<int> code;

    std::map<std::string, bool> flags;   // e.g. "use90", "estimated", "trace"
    std::vector<Component>      components;
    std::vector<Observation>    items;   // attached repeated sub-groups

    // Component access (nullptr when absent)
    const Observation* component(std::string_view name) const;
    Observation*       component(std::string_view name);
    // Insert or replace a named component; returns the stored copy.
    Observation& setComponent(std::string name, Observation obs);

    // Returns false when the flag is absent.
    bool flag(std::string_view name) const;

    // Semantic equality: every member except `raw`.
    bool sameAs(const Observation& other) const;
};

struct Component {
    std::string name;
    Observation obs;
};

// ─── Known report fields ──────────────────────────────────────────────────────
enum class Field {
    // Section 0
    StationType,
    Callsign,
    Region,
    ObsTime,
    WindIndicator,
    StationId,
    StationPosition,

    // Section 1
    PrecipitationIndicator,
    WeatherIndicator,
    LowestCloudBase,
    Visibility,
    CloudCover,
    SurfaceWind,
    AirTemperature,
    DewpointTemperature,
    RelativeHumidity,
    StationPressure,
    SeaLevelPressure,
    GeopotentialSurface,
    GeopotentialHeight,
    PressureTendency,
    PrecipitationS1,
    PresentWeather,
    PastWeather,          // list
    CloudTypes,
    ExactObservationTime,

    // Section 2
    Displacement,
    SeaSurfaceTemperature,
    WindWaves,            // list
    SwellWaves,           // list
    IceAccretion,
    WetBulbTemperature,
    SeaLandIce,

    // Section 3
    GroundMinimumTemperature,
    LocalPrecipitation,
    MaxWind,
    MaximumTemperature,
    MinimumTemperature,
    GroundState,
    GroundStateSnow,
    Evapotranspiration,
    Sunshine,             // list
    CloudDriftDirection,
    CloudElevation,
    PressureChange,
    PrecipitationS3,      // list
    CloudLayer,           // list
    WeatherTime,
    TimeOfEnding,
    PrecipitationTime,
    HighestGust,          // list
    SeaState,
    FrozenDeposit,
    SnowCoverRegularity,
    DriftSnow,
    SnowFall,
    DepositDiameter,      // list
    CloudEvolution,
    MaxLowCloud,
    MountainCloud,
    ValleyClouds,
    VisibilityDirection,  // list
    OpticalPhenomena,
    Mirage,
    CondensationTrails,
    SpecialClouds,
    DayDarkness,
    SuddenTemperatureChange,
    SuddenHumidityChange,
};

// snake_case name of a field, e.g. "air_temperature"
std::string_view fieldName(Field f);

// Reverse of fieldName(); std::nullopt for an unknown name.
std::optional<Field> fieldFromName(std::string_view name);

// ─── A decoded SYNOP report ───────────────────────────────────────────────────
// Absent keys mean "group not present"; a present Observation with
// available == false means "group present, value coded as missing".
struct Report {
    std::map<Field, Observation>              fields;
    std::map<Field, std::vector<Observation>> lists;  // repeatable groups

    std::vector<std::string> section4;        // verbatim groups after 444
    std::vector<std::string> section5;        // verbatim groups after 555
    std::vector<std::string> not_implemented; // raw groups not decoded
    std::vector<std::string> warnings;        // recoverable problems
    bool                     nil{false};      // "NIL" followed Section 0

    bool has(Field f) const;
    const Observation* get(Field f) const;
    const Observation& at(Field f) const;    // throws std::out_of_range
    const std::vector<Observation>* list(Field f) const;

    void set(Field f, Observation obs);
    void append(Field f, Observation obs);
};

// ─── Static code table definition (loaded from XML) ───────────────────────────
enum class TableKind {
    Simple,  // code in [min_code, max_code] decodes to itself
    Lookup,  // code → number or text
    Range,   // code → [min, max) bucket, optional quantifier
    Flags,   // code → named booleans
};

struct TableEntry {
    int                   code{0};
    std::optional<double> number;
    std::string           text;
    std::optional<double> min;
    std::optional<double> max;
    Quantifier            quantifier{Quantifier::None};
    std::map<std::string, bool> flags;
};

struct TableDef {
    std::string id;           // WMO table number, e.g. "0500"
    std::string name;
    TableKind   kind{TableKind::Simple};
    uint16_t    width{1};     // characters per code
    std::string unit;
    int         min_code{0};  // Simple tables only
    int         max_code{9};
    bool        decode_only{false};
    std::map<int, TableEntry> entries;
};

// ─── One fixed-width slice of a data-driven group ─────────────────────────────
struct ElementDef {
    std::string name;
    uint16_t    width{1};

    // Either a table reference…
    std::string table;

    // …or a plain number: value = scale × code  [unit]
    double      scale{1.0};
    std::string unit;              // "wind" = use the report's wind-speed unit
    std::optional<int> min_code;
    std::optional<int> max_code;
};

// ─── A group whose layout is fully described by its element list ─────────────
struct GroupDef {
    std::string header;            // Leading characters, e.g. "927"
    int         section{1};
    Field       field{Field::StationType};
    std::string name;
    std::vector<ElementDef> elements; // widths sum to 5 - header.size()
};

// ─── Everything loaded from one code book file ────────────────────────────────
struct CodeBook {
    std::string edition;
    std::string date;

    std::map<std::string, TableDef, std::less<>> tables;

    // Keyed by section number then header
    std::map<int, std::map<std::string, GroupDef, std::less<>>> groups;
};

// ─── Per-call options ─────────────────────────────────────────────────────────
struct DecodeOptions {
    std::string country;           // "RU" enables iR = 6/7/8 routing
};

struct EncodeOptions {
    std::optional<bool> use90_visibility;
    std::optional<bool> use90_cloud_height;
};

} // namespace synop
