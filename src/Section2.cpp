// Section2.cpp – Section 2: maritime data (222Dsvs 0..8) and the ICE block.

#include "FieldCodec.hpp"

#include <fmt/format.h>

#include <array>
#include <cmath>
#include <sstream>

namespace synop::detail {

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

// Temperature whose sign comes from an indicator table (3850, 3855)
static Observation signedByIndicator(const FieldCodec& fc, const char* table, std::string_view s,
                                     std::string_view ttt, std::string_view desc) {
    Observation indicator = fc.table(table, s);
    Observation t = fc.number(ttt, 0.1, "Cel", desc);
    t.raw = std::string(s) + std::string(ttt);
    if (!indicator.available) {
        t.available = false;
        t.value.reset();
    } else if (t.available && indicator.flag("negative")) {
        t.value = -*t.value;
    }
    return t;
}

static Observation waveTrain(const FieldCodec& fc, std::string_view g, bool instrumental) {
    Observation w;
    w.raw = std::string(g);
    Observation period = fc.number(g.substr(1, 2), 1, "s", "wave period");
    const bool confused = period.available && *period.value == 99;
    if (confused) {
        period.available = false;
        period.value.reset();
    }
    w.components.push_back({"period", std::move(period)});
    w.components.push_back({"height", fc.number(g.substr(3, 2), 0.5, "m", "wave height")});
    w.flags["instrumental"] = instrumental;
    w.flags["accurate"]     = false;
    w.flags["confused"]     = confused;
    settle(w);
    return w;
}

// Swell groups arrive split over 3dddd / 4PPHH / 5PPHH; entries are built once
// the section is complete.
struct SwellState {
    bool                                      directions{false};
    std::array<Observation, 2>                direction;
    std::array<std::optional<Observation>, 2> train;

    void flush(DecodeContext& ctx) const {
        const bool second = train[1] || (directions && direction[1].available);
        const bool first  = second || train[0] || (directions && direction[0].available);
        for (size_t i = 0; i < 2; ++i) {
            if (!(i == 0 ? first : second)) continue;
            Observation e;
            if (directions) e.components.push_back({"direction", direction[i]});
            if (train[i]) {
                e.raw = train[i]->raw;
                for (const auto& c : train[i]->components) e.components.push_back(c);
            }
            settle(e);
            ctx.report.append(Field::SwellWaves, std::move(e));
        }
    }
};

static void decodeDisplacement(std::string_view header, DecodeContext& ctx, const FieldCodec& fc) {
    Observation d;
    d.raw = std::string(header.substr(3));
    d.components.push_back({"direction", fc.table("0700", header.substr(3, 1))});
    d.components.push_back({"speed", fc.table("4451", header.substr(4, 1))});
    settle(d);
    ctx.report.set(Field::Displacement, std::move(d));
}

static void decodeGroup(int header, const std::string& g, SwellState& swell, DecodeContext& ctx,
                        const FieldCodec& fc) {
    const std::string_view v(g);
    switch (header) {
    case 0: {
        Observation sst = signedByIndicator(fc, "3850", v.substr(1, 1), v.substr(2), "sea surface temperature");
        sst.components.push_back({"measurement_type", fc.table("3850", v.substr(1, 1))});
        ctx.report.set(Field::SeaSurfaceTemperature, std::move(sst));
        break;
    }
    case 1:
    case 2:
        ctx.report.append(Field::WindWaves, waveTrain(fc, v, header == 1));
        break;
    case 3:
        swell.directions   = true;
        swell.direction[0] = fc.table("0877", v.substr(1, 2));
        swell.direction[1] = fc.table("0877", v.substr(3, 2));
        break;
    case 4:
    case 5: {
        Observation t;
        t.raw = g;
        t.components.push_back({"period", fc.number(v.substr(1, 2), 1, "s", "swell period")});
        t.components.push_back({"height", fc.number(v.substr(3, 2), 0.5, "m", "swell height")});
        swell.train[header - 4] = std::move(t);
        break;
    }
    case 6:
        if (const GroupDef* def = fc.layout(2, "6"))
            ctx.report.set(def->field, fc.decodeLayout(*def, g, ctx));
        else
            ctx.notImplemented(g, "no layout registered for section 2 header 6");
        break;
    case 7: {
        if (g[1] != '0') {
            ctx.notImplemented(g, "wave height group must start with 70");
            break;
        }
        Observation w;
        w.raw = g;
        w.components.push_back({"height", fc.number(v.substr(2), 0.1, "m", "wave height")});
        w.flags["instrumental"] = true;
        w.flags["accurate"]     = true;
        w.flags["confused"]     = false;
        settle(w);
        ctx.report.append(Field::WindWaves, std::move(w));
        break;
    }
    case 8: {
        Observation status = fc.table("3855", v.substr(1, 1));
        Observation wb = signedByIndicator(fc, "3855", v.substr(1, 1), v.substr(2), "wet bulb temperature");
        for (const auto& [name, on] : status.flags) wb.flags[name] = on;
        wb.components.push_back({"status", std::move(status)});
        ctx.report.set(Field::WetBulbTemperature, std::move(wb));
        break;
    }
    default:
        ctx.notImplemented(g, "unknown section 2 group");
        break;
    }
}

void decodeSection2(std::string_view header, GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    if (!ctx.isShip()) {
        ctx.notImplemented(header, "section 2 reported by a land station");
        while (auto peeked = in.peek()) {
            if (isSectionMarker(*peeked, false)) break;
            ctx.notImplemented(in.next(), "section 2 reported by a land station");
        }
        return;
    }

    recover(ctx, header, [&] { decodeDisplacement(header, ctx, fc); });

    SwellState swell;
    int last = -1;
    while (auto peeked = in.peek()) {
        if (isSectionMarker(*peeked, false)) break;
        const std::string g = in.next();
        const int h = headerOf(g);
        if (h < 0) {
            ctx.notImplemented(g, "malformed section 2 group");
            continue;
        }
        if (h <= last) {
            ctx.notImplemented(g, fmt::format("header {} out of order after {}", h, last));
            continue;
        }
        last = h;
        recover(ctx, g, [&] { decodeGroup(h, g, swell, ctx, fc); });
    }
    swell.flush(ctx);
}

void decodeSeaLandIce(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    std::vector<std::string> groups;
    while (auto peeked = in.peek()) {
        if (isSectionMarker(*peeked, false)) break;
        groups.push_back(in.next());
    }

    Observation ice;
    for (const auto& g : groups) ice.raw += (ice.raw.empty() ? "" : " ") + g;
    if (groups.empty()) {
        ctx.warn("ICE block without content");
        ctx.report.set(Field::SeaLandIce, std::move(ice));
        return;
    }

    // ciSibiDizi when the block is one coded group, plain language otherwise
    const std::string& first = groups.front();
    const bool coded = groups.size() == 1 && first.size() == 5 &&
                       first.find_first_not_of("0123456789/") == std::string::npos;
    if (!coded) {
        ice.available = true;
        ice.text      = ice.raw;
        ctx.report.set(Field::SeaLandIce, std::move(ice));
        return;
    }

    recover(ctx, first, [&] {
        const std::string_view v(first);
        ice.components.push_back({"concentration",   fc.table("0639", v.substr(0, 1))});
        ice.components.push_back({"development",     fc.table("3739", v.substr(1, 1))});
        ice.components.push_back({"land_origin",     fc.table("0439", v.substr(2, 1))});
        ice.components.push_back({"direction",       fc.table("0739", v.substr(3, 1))});
        ice.components.push_back({"condition_trend", fc.table("5239", v.substr(4, 1))});
        settle(ice);
        ctx.report.set(Field::SeaLandIce, std::move(ice));
    });
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

static std::string signedByIndicator(const FieldCodec& fc, const char* table, const Observation& t,
                                     const Observation* indicator, std::string_view desc) {
    std::string s;
    if (indicator) {
        s = fc.table(table, indicator);
    } else if (!t.available) {
        s = "/";
    } else {
        Observation derived;
        derived.available = true;
        derived.flags     = t.flags;
        derived.flags["negative"] = std::signbit(valueIn(t, "Cel", desc));
        s = fc.table(table, &derived);
    }
    std::string ttt = "///";
    if (t.available)
        ttt = pad(std::lround(std::fabs(valueIn(t, "Cel", desc)) * 10.0), 3, desc);
    return s + ttt;
}

static std::string waveTrain(const FieldCodec& fc, const Observation& w) {
    std::string pp = w.flag("confused") ? "99" : fc.number(w.component("period"), 2, 1, "s", "wave period");
    return pp + fc.number(w.component("height"), 2, 0.5, "m", "wave height");
}

static bool hasSection2(const Report& r) {
    for (int f = static_cast<int>(Field::Displacement); f <= static_cast<int>(Field::WetBulbTemperature); ++f)
        if (r.has(static_cast<Field>(f))) return true;
    return false;
}

static void encodeSeaLandIce(GroupWriter& out, const Observation& ice, const FieldCodec& fc) {
    out.put("ICE");
    if (!ice.components.empty()) {
        out.put(fc.table("0639", ice.component("concentration")) +
                fc.table("3739", ice.component("development")) +
                fc.table("0439", ice.component("land_origin")) +
                fc.table("0739", ice.component("direction")) +
                fc.table("5239", ice.component("condition_trend")));
        return;
    }
    if (!ice.text || ice.text->empty()) {
        out.put("/////");
        return;
    }
    std::istringstream words(*ice.text);
    for (std::string w; words >> w;) out.put(std::move(w));
}

void encodeSection2(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc) {
    const Report& r = ctx.report;

    if (ctx.isShip() && hasSection2(r)) {
        const Observation* d = r.get(Field::Displacement);
        out.put("222" + fc.table("0700", d ? d->component("direction") : nullptr) +
                fc.table("4451", d ? d->component("speed") : nullptr));

        if (const Observation* sst = r.get(Field::SeaSurfaceTemperature))
            out.put("0" + signedByIndicator(fc, "3850", *sst, sst->component("measurement_type"),
                                            "sea surface temperature"));

        const auto* waves = r.list(Field::WindWaves);
        const auto pick = [waves](auto pred) -> const Observation* {
            if (!waves) return nullptr;
            for (const auto& w : *waves)
                if (pred(w)) return &w;
            return nullptr;
        };
        if (const Observation* w = pick([](const Observation& o) {
                return o.flag("instrumental") && !o.flag("accurate");
            }))
            out.put("1" + waveTrain(fc, *w));
        if (const Observation* w = pick([](const Observation& o) { return !o.flag("instrumental"); }))
            out.put("2" + waveTrain(fc, *w));

        if (const auto* swell = r.list(Field::SwellWaves); swell && !swell->empty()) {
            bool directions = false;
            for (const auto& s : *swell)
                if (s.component("direction")) directions = true;
            if (directions) {
                std::string g = "3";
                for (size_t i = 0; i < 2; ++i)
                    g += fc.table("0877", i < swell->size() ? (*swell)[i].component("direction") : nullptr);
                out.put(g);
            }
            for (size_t i = 0; i < swell->size() && i < 2; ++i) {
                const Observation& s = (*swell)[i];
                if (!s.component("period") && !s.component("height")) continue;
                out.put(std::to_string(4 + i) +
                        fc.number(s.component("period"), 2, 1, "s", "swell period") +
                        fc.number(s.component("height"), 2, 0.5, "m", "swell height"));
            }
        }

        if (const Observation* ice = r.get(Field::IceAccretion)) {
            const GroupDef* def = fc.layout(2, "6");
            if (!def) throw EncodeError("no layout registered for section 2 group 6");
            out.put(fc.encodeLayout(*def, *ice, ctx));
        }

        if (const Observation* w = pick([](const Observation& o) { return o.flag("accurate"); }))
            out.put("70" + fc.number(w->component("height"), 3, 0.1, "m", "wave height"));

        if (const Observation* wb = r.get(Field::WetBulbTemperature))
            out.put("8" + signedByIndicator(fc, "3855", *wb, wb->component("status"), "wet bulb temperature"));
    }

    if (const Observation* ice = r.get(Field::SeaLandIce))
        encodeSeaLandIce(out, *ice, fc);
}

} // namespace synop::detail
