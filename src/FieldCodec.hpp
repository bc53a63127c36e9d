#pragma once
// FieldCodec.hpp – Per-call context and the decode / encode primitives shared
// by the section codecs.  Internal to the library.

#include "SynopCodec/CodeTables.hpp"
#include "SynopCodec/Codec.hpp"
#include "SynopCodec/Errors.hpp"
#include "SynopCodec/GroupStream.hpp"
#include "SynopCodec/Types.hpp"

#include <climits>
#include <string>
#include <string_view>

namespace synop::detail {

// ─────────────────────────────────────────────────────────────────────────────
//  Context
// ─────────────────────────────────────────────────────────────────────────────
// Everything below lives for exactly one decode() / encode() call.

struct DecodeContext {
    Report&                      report;
    const Codec::WarningHandler& on_warning;
    DecodeOptions                options;

    std::string station_type;            // AAXX / BBXX / OOXX
    std::string region;                  // WMO region; empty when unknown
    std::string wind_unit;               // "m/s", "KT" or empty
    bool        precip_in_group_1{true}; // iR routing
    bool        precip_in_group_3{true};
    int         weather_ix{0};           // 0 = not reported
    int         obs_hour{-1};

    // Time before observation announced by 907tt, applied to 911ff / 931ss
    std::optional<Observation> time_before;
    std::string                pending_907; // 907tt with no consumer yet

    void warn(std::string msg);
    void notImplemented(std::string_view group, std::string_view why);

    bool isShip() const noexcept { return station_type != "AAXX"; }
    bool automatic() const noexcept { return weather_ix >= 4; }
    Observation timeBefore() const;
};

struct EncodeContext {
    const Report& report;
    EncodeOptions options;

    std::string station_type;
    std::string region;
    std::string wind_unit;
    int         weather_ix{0};
    int         obs_hour{-1};
    bool        use90_visibility{false};
    bool        use90_cloud_height{false};

    Observation time_before;             // last value emitted via 907tt

    bool isShip() const noexcept { return station_type != "AAXX"; }
    bool automatic() const noexcept { return weather_ix >= 4; }
};

// Period covered by W1W2 and by 9-groups without a 907tt: 6 h at main
// synoptic hours, 3 h at intermediate hours, otherwise 1 h.
Observation defaultTimeBefore(int obs_hour);

// NIL, ICE, 333, 444 and 555 end the current section.  222Dv does so only
// while Section 2 is still ahead; inside later sections it is a data group.
bool isSectionMarker(std::string_view group, bool section2_ahead) noexcept;

// Run `fn`; an InvalidCode it raises becomes a warning and the field it was
// building is simply not stored.
template <typename Fn>
void recover(DecodeContext& ctx, std::string_view group, Fn&& fn) {
    try {
        fn();
    } catch (const InvalidCode& e) {
        ctx.warn(std::string(e.what()) + " (group " + std::string(group) + "); field omitted");
    }
}

// A composite is available when any of its parts is.
void settle(Observation& composite);

// use90 band for a 4377 / 1677 code: the observation's own provenance, else
// the per-report default.
inline TableHints use90Hints(const Observation* o, bool fallback) {
    if (o) {
        if (auto it = o->flags.find("use90"); it != o->flags.end()) return TableHints{it->second};
    }
    return TableHints{fallback};
}

// 00fff: wind speed of 100 units or more following an ff of 99
inline bool isSpeedExtension(std::string_view g) noexcept {
    return g.size() == 5 && g.substr(0, 2) == "00" &&
           g.substr(2).find_first_not_of("0123456789") == std::string_view::npos;
}

// Leading digit of a five-character group, or -1 for anything else.
inline int headerOf(std::string_view g) noexcept {
    if (g.size() != 5 || g[0] < '0' || g[0] > '9') return -1;
    return g[0] - '0';
}

// ─────────────────────────────────────────────────────────────────────────────
//  FieldCodec
// ─────────────────────────────────────────────────────────────────────────────
// Stateless helpers bound to one code book.

class FieldCodec {
public:
    explicit FieldCodec(const CodeBook& book) noexcept : book_(book), tables_(book) {}

    [[nodiscard]] const CodeTables& tables() const noexcept { return tables_; }

    // Data-driven layout registered for `header` in `section`, or nullptr.
    [[nodiscard]] const GroupDef* layout(int section, std::string_view header) const;

    // ── Decode primitives ────────────────────────────────────────────────────

    [[nodiscard]] Observation table(std::string_view id, std::string_view raw) const {
        return tables_.decode(id, raw);
    }

    // value = code × scale; code must lie in [lo, hi]
    [[nodiscard]] Observation number(std::string_view raw, double scale, std::string_view unit,
                                     std::string_view desc, int lo = 0, int hi = INT_MAX) const;

    // sTTT with s = 0 (positive) / 1 (negative), TTT in tenths of a degree
    [[nodiscard]] Observation signedTemperature(char sign, std::string_view ttt,
                                                std::string_view desc) const;

    [[nodiscard]] Observation decodeLayout(const GroupDef& def, std::string_view group,
                                           const DecodeContext& ctx) const;

    // ── Encode primitives ────────────────────────────────────────────────────

    // nullptr encodes as "/"-fill
    [[nodiscard]] std::string table(std::string_view id, const Observation* obs,
                                    const TableHints& hints = {}) const;

    [[nodiscard]] std::string number(const Observation* obs, int width, double scale,
                                     std::string_view unit, std::string_view desc) const;

    [[nodiscard]] std::string signedTemperature(const Observation* obs, std::string_view desc) const;

    [[nodiscard]] std::string encodeLayout(const GroupDef& def, const Observation& obs,
                                           const EncodeContext& ctx) const;

private:
    const CodeBook& book_;
    CodeTables      tables_;
};

// Value of `obs` in `unit`, converting if needed.  Throws EncodeError.
double valueIn(const Observation& obs, std::string_view unit, std::string_view desc);

// Field that encode cannot do without.  Throws EncodeError when absent.
const Observation& required(const Report& report, Field f);

// ─── Section entry points ─────────────────────────────────────────────────────

void decodeSection0(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc);
void decodeSection1(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc);
void decodeSection2(std::string_view header, GroupReader& in, DecodeContext& ctx, const FieldCodec& fc);
void decodeSeaLandIce(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc);
void decodeSection3(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc);

void encodeSection0(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc);
bool hasSection1(const Report& report);
void encodeSection1(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc);
void encodeSection2(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc);
void encodeSection3(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc);

} // namespace synop::detail
