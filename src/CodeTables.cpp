// CodeTables.cpp – Built-in algorithmic code tables and XML table lookup.

#include "SynopCodec/CodeTables.hpp"
#include "SynopCodec/Conversion.hpp"
#include "SynopCodec/Errors.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace synop {

// ─────────────────────────────────────────────────────────────────────────────
//  Formatting helpers
// ─────────────────────────────────────────────────────────────────────────────

std::string pad(long v, int width, std::string_view what) {
    long limit = 1;
    for (int i = 0; i < width; ++i) limit *= 10;
    if (v < 0 || v >= limit)
        throw EncodeError(fmt::format("{} does not fit in {} digit(s) for {}", v, width, what));
    return fmt::format("{:0{}d}", v, width);
}

std::string slashes(size_t width) { return std::string(width, '/'); }

bool isMissing(std::string_view raw) noexcept {
    return raw.find_first_not_of('/') == std::string_view::npos;
}

std::optional<int> parseCode(std::string_view raw) noexcept {
    if (raw.empty() || raw.front() < '0' || raw.front() > '9') return std::nullopt;
    int v = 0;
    auto [p, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), v);
    if (ec != std::errc{} || p != raw.data() + raw.size()) return std::nullopt;
    return v;
}

// Value of `o` expressed in `unit` (converted when the units differ).
static double valueIn(const Observation& o, std::string_view unit, std::string_view table) {
    if (!o.value)
        throw EncodeError(fmt::format("no value to encode with code table {}", table));
    if (unit.empty() || o.unit.empty() || o.unit == unit) return *o.value;
    try {
        return convert(*o.value, o.unit, unit);
    } catch (const ConversionError& e) {
        throw EncodeError(e.what());
    }
}

static bool hasFalseFlag(const Observation& o, const char* name) {
    auto it = o.flags.find(name);
    return it != o.flags.end() && !it->second;
}

[[noreturn]] static void noMatch(const Observation& o, std::string_view table) {
    if (o.value)
        throw EncodeError(fmt::format("cannot encode {} {} with code table {}", *o.value, o.unit, table));
    if (o.text)
        throw EncodeError(fmt::format("cannot encode \"{}\" with code table {}", *o.text, table));
    throw EncodeError(fmt::format("nothing to encode with code table {}", table));
}

// ─────────────────────────────────────────────────────────────────────────────
//  Built-in tables
// ─────────────────────────────────────────────────────────────────────────────

static constexpr std::array<const char*, 10> kCompass = {
    nullptr, "NE", "E", "SE", "S", "SW", "W", "NW", "N", nullptr};

static constexpr double kInf = std::numeric_limits<double>::infinity();

// Fine-resolution band shared by visibility (4377) and cloud height (1677)
struct Band { double lo; double hi; };
static constexpr std::array<Band, 10> kVisibility90 = {{
    {0, 50}, {50, 200}, {200, 500}, {500, 1000}, {1000, 2000},
    {2000, 4000}, {4000, 10000}, {10000, 20000}, {20000, 50000}, {50000, kInf}}};
static constexpr std::array<Band, 10> kCloudHeight90 = {{
    {0, 50}, {50, 100}, {100, 200}, {200, 300}, {300, 600},
    {600, 1000}, {1000, 1500}, {1500, 2000}, {2000, 2500}, {2500, kInf}}};

static int compassIndex(const Observation& o) {
    if (o.text) {
        for (int i = 1; i <= 8; ++i)
            if (*o.text == kCompass[i]) return i;
    }
    return -1;
}

// ── 0161 WMO Regional Association of a buoy or platform ─────────────────────
static Observation decode0161(int c, std::string_view raw) {
    static constexpr std::array<const char*, 8> regions = {
        nullptr, "I", "II", "III", "IV", "V", "VI", "Antarctic"};
    static constexpr std::array<int, 8> maxSub = {0, 7, 6, 4, 8, 6, 6, 4};
    const int area = c / 10, sub = c % 10;
    if (area < 1 || area > 7 || sub < 1 || sub > maxSub[area])
        throw InvalidCode(raw, "code table 0161");
    Observation o;
    o.text = regions[area];
    return o;
}

// ── 0700 Direction in one figure ────────────────────────────────────────────
static Observation decode0700(int d, std::string_view) {
    Observation o;
    if (kCompass[d]) o.text = kCompass[d];
    o.flags["isCalmOrStationary"] = d == 0;
    o.flags["allDirections"]      = d == 9;
    return o;
}
static int encode0700(const Observation& o, const TableHints&) {
    if (int i = compassIndex(o); i > 0) return i;
    if (o.flag("isCalmOrStationary")) return 0;
    if (o.flag("allDirections")) return 9;
    noMatch(o, "0700");
}

// ── 0739 True bearing of principal ice edge ─────────────────────────────────
static Observation decode0739(int d, std::string_view) {
    Observation o;
    if (kCompass[d]) o.text = kCompass[d];
    o.flags["in_shore"] = d == 0;
    o.flags["in_ice"]   = d == 9;
    return o;
}
static int encode0739(const Observation& o, const TableHints&) {
    if (int i = compassIndex(o); i > 0) return i;
    if (o.flag("in_shore")) return 0;
    if (o.flag("in_ice")) return 9;
    noMatch(o, "0739");
}

// ── 0877 Wind direction in tens of degrees ──────────────────────────────────
static Observation decode0877(int dd, std::string_view raw) {
    Observation o;
    if (dd >= 1 && dd <= 36) {
        o.value = dd * 10;
        o.unit  = "deg";
    } else if (dd != 0 && dd != 99) {
        throw InvalidCode(raw, "code table 0877");
    }
    o.flags["calm"]          = dd == 0;
    o.flags["varAllUnknown"] = dd == 99;
    return o;
}
static int encode0877(const Observation& o, const TableHints&) {
    if (o.flag("calm")) return 0;
    if (o.flag("varAllUnknown")) return 99;
    const long dd = std::lround(valueIn(o, "deg", "0877") / 10.0);
    if (dd < 1 || dd > 36) noMatch(o, "0877");
    return static_cast<int>(dd);
}

// ── 1004 Elevation angle of cloud top ───────────────────────────────────────
static constexpr std::array<int, 10> kAngles = {0, 45, 30, 20, 15, 12, 9, 7, 6, 5};

static Observation decode1004(int e, std::string_view) {
    Observation o;
    o.flags["visible"] = e != 0;
    if (e == 0) return o;
    o.value = kAngles[e];
    o.unit  = "deg";
    if (e == 1) o.quantifier = Quantifier::IsGreater;
    if (e == 9) o.quantifier = Quantifier::IsLess;
    return o;
}
static int encode1004(const Observation& o, const TableHints&) {
    if (hasFalseFlag(o, "visible")) return 0;
    const long v = std::lround(valueIn(o, "deg", "1004"));
    for (int i = 1; i <= 9; ++i)
        if (kAngles[i] == v) return i;
    noMatch(o, "1004");
}

// ── 1677 Height of base of cloud layer ──────────────────────────────────────
static Observation decode1677(int hh, std::string_view raw) {
    Observation o;
    o.unit = "m";
    if (hh == 0) {
        o.value = 30;
        o.quantifier = Quantifier::IsLess;
    } else if (hh <= 50) {
        o.value = hh * 30;
    } else if (hh <= 55) {
        throw InvalidCode(raw, "code table 1677");
    } else if (hh <= 80) {
        o.value = (hh - 50) * 300;
    } else if (hh <= 88) {
        o.value = (hh - 80) * 1500 + 9000;
    } else if (hh == 89) {
        o.value = 21000;
        o.quantifier = Quantifier::IsGreater;
    } else if (hh <= 98) {
        o.min = kCloudHeight90[hh - 90].lo;
        o.max = kCloudHeight90[hh - 90].hi;
    } else {
        o.value = kCloudHeight90[9].lo;
        o.quantifier = Quantifier::IsGreater;
    }
    o.flags["use90"] = hh >= 90;
    return o;
}
static int encode1677(const Observation& o, const TableHints& hints) {
    if (hints.use90) {
        if (o.min && !o.value) {
            for (size_t i = 0; i < kCloudHeight90.size(); ++i)
                if (kCloudHeight90[i].lo == *o.min) return static_cast<int>(90 + i);
            noMatch(o, "1677");
        }
        const double v = valueIn(o, "m", "1677");
        for (size_t i = 0; i < kCloudHeight90.size(); ++i)
            if (kCloudHeight90[i].lo <= v && v < kCloudHeight90[i].hi) return static_cast<int>(90 + i);
        noMatch(o, "1677");
    }
    const double v = valueIn(o, "m", "1677");
    if (v < 30 || (v <= 30 && o.quantifier == Quantifier::IsLess)) return 0;
    if (v <= 1500) return static_cast<int>(std::lround(v / 30.0));
    if (v <= 9000) return static_cast<int>(std::lround(v / 300.0)) + 50;
    if (v <= 21000 && o.quantifier == Quantifier::None)
        return static_cast<int>(std::lround((v - 9000) / 1500.0)) + 80;
    return 89;
}

// ── 2700 Total cloud cover ──────────────────────────────────────────────────
static Observation decode2700(int n, std::string_view) {
    Observation o;
    o.unit = "okta";
    if (n != 9) o.value = n;
    o.flags["obscured"] = n == 9;
    return o;
}
static int encode2700(const Observation& o, const TableHints&) {
    if (o.flag("obscured")) return 9;
    const long n = std::lround(valueIn(o, "okta", "2700"));
    if (n < 0 || n > 8) noMatch(o, "2700");
    return static_cast<int>(n);
}

// ── 3570 Precipitation amount or diameter of deposit ────────────────────────
static Observation decode3570(int rr, std::string_view) {
    Observation o;
    o.unit = "mm";
    if (rr <= 55)      o.value = rr;
    else if (rr <= 90) o.value = (rr - 50) * 10;
    else if (rr <= 96) o.value = (rr - 90) / 10.0;
    else if (rr == 98) { o.value = 400; o.quantifier = Quantifier::IsGreater; }
    o.flags["non_measurable"] = rr == 97;
    o.flags["impossible"]     = rr == 99;
    return o;
}
static int encode3570(const Observation& o, const TableHints&) {
    if (o.flag("non_measurable")) return 97;
    if (o.flag("impossible")) return 99;
    const double v = valueIn(o, "mm", "3570");
    if (o.quantifier == Quantifier::IsGreater && v >= 400) return 98;
    if (v > 0 && v < 1) {
        const long c = std::lround(v * 10) + 90;
        if (c <= 96) return static_cast<int>(c);
    } else if (v <= 55) {
        return static_cast<int>(std::lround(v));
    } else if (v <= 400) {
        return static_cast<int>(std::lround(v / 10.0)) + 50;
    }
    noMatch(o, "3570");
}

// ── 3590 Amount of precipitation (RRR) ──────────────────────────────────────
static Observation decode3590(int rrr, std::string_view) {
    Observation o;
    o.unit = "mm";
    if (rrr <= 988) {
        o.value = rrr;
    } else if (rrr == 989) {
        o.value = rrr;
        o.quantifier = Quantifier::IsGreaterOrEqual;
    } else if (rrr == 990) {
        o.value = 0;
    } else {
        o.value = (rrr - 990) / 10.0;
    }
    o.flags["trace"] = rrr == 990;
    return o;
}
static int encode3590(const Observation& o, const TableHints&) {
    if (o.flag("trace")) return 990;
    const double v = valueIn(o, "mm", "3590");
    if (o.quantifier == Quantifier::IsGreaterOrEqual && v >= 989) return 989;
    if (v > 0 && v < 1) return static_cast<int>(std::lround(v * 10)) + 990;
    const long c = std::lround(v);
    if (c < 0 || c > 988) noMatch(o, "3590");
    return static_cast<int>(c);
}

// ── 3590A Amount of precipitation over 24 hours (RRRR) ──────────────────────
static Observation decode3590A(int rrrr, std::string_view) {
    Observation o;
    o.unit = "mm";
    if (rrrr <= 9997) {
        o.value = rrrr / 10.0;
    } else if (rrrr == 9998) {
        o.value = 999.8;
        o.quantifier = Quantifier::IsGreaterOrEqual;
    } else {
        o.value = 0;
    }
    o.flags["trace"] = rrrr == 9999;
    return o;
}
static int encode3590A(const Observation& o, const TableHints&) {
    if (o.flag("trace")) return 9999;
    if (o.quantifier == Quantifier::IsGreaterOrEqual) return 9998;
    const long c = std::lround(valueIn(o, "mm", "3590A") * 10);
    if (c < 0 || c > 9997) noMatch(o, "3590A");
    return static_cast<int>(c);
}

// ── 3850 Sign and type of sea-surface temperature measurement ───────────────
static constexpr std::array<const char*, 4> kSstMethods = {
    "Intake", "Bucket", "Hull contact sensor", "Other"};

static Observation decode3850(int s, std::string_view raw) {
    if (s > 7) throw InvalidCode(raw, "code table 3850");
    Observation o;
    o.text = kSstMethods[s >> 1];
    o.flags["negative"] = (s % 2) == 1;
    return o;
}
static int encode3850(const Observation& o, const TableHints&) {
    int m = 3;
    if (o.text) {
        for (int i = 0; i < 4; ++i)
            if (*o.text == kSstMethods[i]) m = i;
    }
    return 2 * m + (o.flag("negative") ? 1 : 0);
}

// ── 3855 Sign and type of wet-bulb temperature ──────────────────────────────
static Observation decode3855(int s, std::string_view raw) {
    if (s == 3 || s == 4 || s > 7) throw InvalidCode(raw, "code table 3855");
    Observation o;
    o.flags["measured"] = s < 3;
    o.flags["iced"]     = s == 2 || s == 7;
    o.flags["negative"] = s == 1 || s == 6 || s == 2 || s == 7;
    return o;
}
static int encode3855(const Observation& o, const TableHints&) {
    const bool measured = o.flag("measured");
    if (o.flag("iced")) return measured ? 2 : 7;
    return (measured ? 0 : 5) + (o.flag("negative") ? 1 : 0);
}

// ── 3870 Depth of newly fallen snow ─────────────────────────────────────────
static Observation decode3870(int ss, std::string_view) {
    Observation o;
    o.unit = "mm";
    if (ss <= 55)      o.value = ss * 10;
    else if (ss <= 90) o.value = (ss - 50) * 100;
    else if (ss <= 96) o.value = ss - 90;
    else if (ss == 97) { o.value = 1; o.quantifier = Quantifier::IsLess; }
    else if (ss == 98) { o.value = 4000; o.quantifier = Quantifier::IsGreater; }
    o.flags["inaccurate"] = ss == 99;
    return o;
}
static int encode3870(const Observation& o, const TableHints&) {
    if (o.flag("inaccurate")) return 99;
    const double v = valueIn(o, "mm", "3870");
    if (o.quantifier == Quantifier::IsLess && v <= 1) return 97;
    if (o.quantifier == Quantifier::IsGreater && v >= 4000) return 98;
    if (v >= 1 && v < 10) return static_cast<int>(std::lround(v)) + 90;
    if (v <= 550) return static_cast<int>(std::lround(v / 10.0));
    if (v <= 4000) return static_cast<int>(std::lround(v / 100.0)) + 50;
    noMatch(o, "3870");
}

// ── 3889 Total depth of snow ────────────────────────────────────────────────
static Observation decode3889(int sss, std::string_view raw) {
    if (sss == 0) throw InvalidCode(raw, "code table 3889");
    Observation o;
    o.unit = "cm";
    if (sss <= 996) {
        o.value = sss;
    } else if (sss == 997) {
        o.value = 0.5;
        o.quantifier = Quantifier::IsLess;
    }
    o.flags["continuous"] = sss != 998;
    o.flags["impossible"] = sss == 999;
    return o;
}
static int encode3889(const Observation& o, const TableHints&) {
    if (o.flag("impossible")) return 999;
    if (hasFalseFlag(o, "continuous")) return 998;
    const double v = valueIn(o, "cm", "3889");
    if (v < 1 && (o.quantifier == Quantifier::IsLess || v == 0.5)) return 997;
    const long c = std::lround(v);
    if (c < 1 || c > 996) noMatch(o, "3889");
    return static_cast<int>(c);
}

// ── 4077 Time before observation (tt) / variation of phenomenon (zz) ────────
static Observation decode4077T(int t, std::string_view raw) {
    Observation o;
    if (t <= 60) {
        o.value = 6 * t;
        o.unit  = "min";
    } else if (t <= 66) {
        o.min  = t - 55;
        o.max  = t - 54;
        o.unit = "h";
    } else {
        throw InvalidCode(raw, "code table 4077");
    }
    return o;
}
static int encode4077T(const Observation& o, const TableHints&) {
    if (o.min && o.max && !o.value) {
        Observation lower;
        lower.value = o.min;
        lower.unit  = o.unit.empty() ? "h" : o.unit;
        const long t = std::lround(valueIn(lower, "h", "4077")) + 55;
        if (t >= 61 && t <= 66) return static_cast<int>(t);
        noMatch(o, "4077");
    }
    const double minutes = valueIn(o, "min", "4077");
    if (std::fmod(minutes, 6.0) != 0.0 || minutes < 0 || minutes > 360) noMatch(o, "4077");
    return static_cast<int>(std::lround(minutes / 6.0));
}

static Observation decode4077Z(int z, std::string_view raw) {
    if (z < 76) throw InvalidCode(raw, "code table 4077");
    Observation o;
    o.value = z;
    return o;
}
static int encode4077Z(const Observation& o, const TableHints&) {
    const long z = std::lround(valueIn(o, "", "4077"));
    if (z < 76 || z > 99) noMatch(o, "4077");
    return static_cast<int>(z);
}

// ── 4377 Horizontal visibility at surface ───────────────────────────────────
static Observation decode4377(int vv, std::string_view raw) {
    static constexpr std::array<int, 8> fine = {50, 200, 500, 1000, 2000, 4000, 10000, 20000};
    if (vv >= 51 && vv <= 55) throw InvalidCode(raw, "code table 4377");

    Observation o;
    o.unit = "m";
    if (vv == 0) {
        o.value = 100;
        o.quantifier = Quantifier::IsLess;
    } else if (vv <= 50) {
        o.value = vv * 100;
    } else if (vv <= 80) {
        o.value = (vv - 50) * 1000;
    } else if (vv <= 88) {
        o.value = (vv - 74) * 5000;
    } else if (vv == 89) {
        o.value = 70000;
        o.quantifier = Quantifier::IsGreater;
    } else if (vv == 90) {
        o.value = 50;
        o.quantifier = Quantifier::IsLess;
    } else if (vv <= 98) {
        o.value = fine[vv - 91];
    } else {
        o.value = 50000;
        o.quantifier = Quantifier::IsGreaterOrEqual;
    }
    o.flags["use90"] = vv >= 90;
    return o;
}
static int encode4377(const Observation& o, const TableHints& hints) {
    const double v = valueIn(o, "m", "4377");
    if (hints.use90) {
        if (o.quantifier == Quantifier::IsLess && v <= 50) return 90;
        for (size_t i = 0; i < kVisibility90.size(); ++i)
            if (kVisibility90[i].lo <= v && v < kVisibility90[i].hi) return static_cast<int>(90 + i);
        noMatch(o, "4377");
    }
    if (v < 100 || (v <= 100 && o.quantifier == Quantifier::IsLess)) return 0;
    if (v <= 5000) return static_cast<int>(std::lround(v / 100.0));
    if (v <= 30000) return static_cast<int>(std::lround(v / 1000.0)) + 50;
    if (v <= 70000 && o.quantifier == Quantifier::None)
        return static_cast<int>(std::lround(v / 5000.0)) + 74;
    return 89;
}

// ── 4451 Ship's average speed made good ─────────────────────────────────────
static constexpr std::array<Band, 9> kSpeedKt  = {{
    {0, 0}, {1, 5}, {6, 10}, {11, 15}, {16, 20}, {21, 25}, {26, 30}, {31, 35}, {36, 40}}};
static constexpr std::array<Band, 9> kSpeedKmh = {{
    {0, 0}, {1, 10}, {11, 19}, {20, 28}, {29, 37}, {38, 47}, {48, 56}, {57, 65}, {66, 75}}};

static Observation decode4451(int vs, std::string_view) {
    auto speed = [vs](const std::array<Band, 9>& bands, const char* unit) {
        Observation s;
        s.available = true;
        s.unit = unit;
        if (vs == 9) {
            s.min = bands[8].hi;
            s.quantifier = Quantifier::IsGreater;
        } else {
            s.min = bands[vs].lo;
            s.max = bands[vs].hi;
        }
        return s;
    };
    Observation o;
    o.items.push_back(speed(kSpeedKt, "KT"));
    o.items.push_back(speed(kSpeedKmh, "km/h"));
    return o;
}
static int encode4451(const Observation& o, const TableHints&) {
    const Observation& ref = o.items.empty() ? o : o.items.front();
    const auto& bands = ref.unit == "km/h" ? kSpeedKmh : kSpeedKt;
    if (ref.min && !ref.value) {
        if (ref.quantifier == Quantifier::IsGreater && *ref.min >= bands[8].hi) return 9;
        for (size_t i = 0; i < bands.size(); ++i)
            if (bands[i].lo == *ref.min && ref.max && bands[i].hi == *ref.max) return static_cast<int>(i);
        noMatch(ref, "4451");
    }
    const double v = valueIn(ref, ref.unit.empty() ? "KT" : ref.unit, "4451");
    for (size_t i = 0; i < bands.size(); ++i)
        if (bands[i].lo <= v && v <= bands[i].hi) return static_cast<int>(i);
    if (v > bands[8].hi) return 9;
    noMatch(ref, "4451");
}

// ── Registry ────────────────────────────────────────────────────────────────
using DecodeFn = Observation (*)(int, std::string_view);
using EncodeFn = int (*)(const Observation&, const TableHints&);

struct BuiltinTable {
    std::string_view id;
    uint16_t         width;
    DecodeFn         decode;
    EncodeFn         encode;
};

static constexpr std::array<BuiltinTable, 18> kBuiltins = {{
    {"0161",  2, decode0161,  nullptr},   // decode-only
    {"0700",  1, decode0700,  encode0700},
    {"0739",  1, decode0739,  encode0739},
    {"0877",  2, decode0877,  encode0877},
    {"1004",  1, decode1004,  encode1004},
    {"1677",  2, decode1677,  encode1677},
    {"2700",  1, decode2700,  encode2700},
    {"3570",  2, decode3570,  encode3570},
    {"3590",  3, decode3590,  encode3590},
    {"3590A", 4, decode3590A, encode3590A},
    {"3850",  1, decode3850,  encode3850},
    {"3855",  1, decode3855,  encode3855},
    {"3870",  2, decode3870,  encode3870},
    {"3889",  3, decode3889,  encode3889},
    {"4077T", 2, decode4077T, encode4077T},
    {"4077Z", 2, decode4077Z, encode4077Z},
    {"4377",  2, decode4377,  encode4377},
    {"4451",  1, decode4451,  encode4451},
}};

static const BuiltinTable* findBuiltin(std::string_view id) noexcept {
    for (const auto& b : kBuiltins)
        if (b.id == id) return &b;
    return nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
//  CodeTables
// ─────────────────────────────────────────────────────────────────────────────

bool CodeTables::isBuiltin(std::string_view id) noexcept {
    return findBuiltin(id) != nullptr;
}

bool CodeTables::decodeOnly(std::string_view id) const {
    if (const auto* b = findBuiltin(id)) return b->encode == nullptr;
    return def(id).decode_only;
}

bool CodeTables::contains(std::string_view id) const noexcept {
    return isBuiltin(id) || book_->tables.find(id) != book_->tables.end();
}

const TableDef& CodeTables::def(std::string_view id) const {
    auto it = book_->tables.find(id);
    if (it == book_->tables.end())
        throw std::runtime_error(fmt::format("Code table {} not registered", id));
    return it->second;
}

uint16_t CodeTables::width(std::string_view id) const {
    if (const auto* b = findBuiltin(id)) return b->width;
    return def(id).width;
}

Observation CodeTables::decode(std::string_view id, std::string_view raw) const {
    const BuiltinTable* b = findBuiltin(id);
    const TableDef*     t = b ? nullptr : &def(id);
    const uint16_t      w = b ? b->width : t->width;

    Observation o;
    if (raw.size() == w && isMissing(raw)) {
        o.raw   = std::string(raw);
        o.table = std::string(id);
        return o;
    }

    const auto code = raw.size() == w ? parseCode(raw) : std::nullopt;
    if (!code) throw InvalidCode(raw, fmt::format("code table {}", id));

    o = b ? b->decode(*code, raw) : decodeDef(*t, *code, raw);
    o.raw       = std::string(raw);
    o.available = true;
    o.table     = std::string(id);
    o.code      = *code;
    return o;
}

std::string CodeTables::encode(std::string_view id, const Observation& obs,
                               const TableHints& hints) const {
    const BuiltinTable* b = findBuiltin(id);
    const TableDef*     t = b ? nullptr : &def(id);
    const uint16_t      w = b ? b->width : t->width;

    if (!obs.available) return slashes(w);
    if (obs.code) return pad(*obs.code, w, fmt::format("code table {}", id));
    if (b ? !b->encode : t->decode_only)
        throw EncodeError(fmt::format("code table {} is decode-only; the stored code is required", id));

    const int code = b ? b->encode(obs, hints) : encodeDef(*t, obs);
    return pad(code, w, fmt::format("code table {}", id));
}

// ── XML-defined tables ──────────────────────────────────────────────────────

Observation CodeTables::decodeDef(const TableDef& t, int code, std::string_view raw) const {
    Observation o;
    o.unit = t.unit;

    if (t.kind == TableKind::Simple) {
        if (code < t.min_code || code > t.max_code)
            throw InvalidCode(raw, fmt::format("code table {}", t.id));
        o.value = code;
        return o;
    }

    auto it = t.entries.find(code);
    if (it == t.entries.end())
        throw InvalidCode(raw, fmt::format("code table {}", t.id));
    const TableEntry& e = it->second;

    if (e.number) o.value = e.number;
    if (!e.text.empty()) o.text = e.text;
    o.min        = e.min;
    o.max        = e.max;
    o.quantifier = e.quantifier;
    o.flags      = e.flags;
    return o;
}

int CodeTables::encodeDef(const TableDef& t, const Observation& obs) const {
    if (t.kind == TableKind::Simple) {
        const long c = std::lround(valueIn(obs, t.unit, t.id));
        if (c < t.min_code || c > t.max_code) noMatch(obs, t.id);
        return static_cast<int>(c);
    }

    // Text meanings are unique per table; match them first.
    if (obs.text) {
        for (const auto& [code, e] : t.entries)
            if (e.text == *obs.text) return code;
        noMatch(obs, t.id);
    }

    if (t.kind == TableKind::Range) {
        if (obs.min && !obs.value) {
            for (const auto& [code, e] : t.entries)
                if (e.min == obs.min && e.max == obs.max) return code;
            noMatch(obs, t.id);
        }
        if (obs.value) {
            const double v = valueIn(obs, t.unit, t.id);
            for (const auto& [code, e] : t.entries) {
                if (!e.min) continue;
                if (*e.min <= v && (!e.max || v < *e.max)) return code;
            }
            noMatch(obs, t.id);
        }
    } else if (obs.value) {
        const double v = valueIn(obs, t.unit, t.id);
        for (const auto& [code, e] : t.entries)
            if (e.number && *e.number == v) return code;
        noMatch(obs, t.id);
    }

    // Flag-only meanings (1751 ice accretion source, "unknown" buckets…)
    if (!obs.flags.empty()) {
        for (const auto& [code, e] : t.entries) {
            if (e.flags.empty() || e.min || e.number || !e.text.empty()) continue;
            bool match = true;
            for (const auto& [name, v] : e.flags) {
                auto f = obs.flags.find(name);
                if (f == obs.flags.end() || f->second != v) { match = false; break; }
            }
            if (match) return code;
        }
    }
    noMatch(obs, t.id);
}

} // namespace synop
