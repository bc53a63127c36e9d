// Section3.cpp – Section 3: climatological and regional data (333 0..9).

#include "FieldCodec.hpp"

#include <fmt/format.h>

#include <array>
#include <cmath>

namespace synop::detail {

static constexpr std::array<const char*, 7> kRadiationTypes = {
    "positive net radiation", "negative net radiation", "global solar radiation",
    "diffused solar radiation", "downward long-wave radiation", "upward long-wave radiation",
    "short-wave radiation"};

// 933–937: diameter of deposit
static constexpr std::array<const char*, 5> kDepositTypes = {
    "solid", "glaze", "rime", "compound", "wet_snow"};

static Observation quantity(double value, const char* unit) {
    Observation o;
    o.available = true;
    o.value     = value;
    o.unit      = unit;
    return o;
}

static Observation typed(const char* text, int code) {
    Observation o;
    o.raw       = std::to_string(code);
    o.available = true;
    o.text      = text;
    o.code      = code;
    return o;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

static void decodeRegional(const std::string& g, DecodeContext& ctx, const FieldCodec& fc) {
    const std::string_view v(g);
    if (ctx.region == "I") {
        Observation tg = fc.number(v.substr(1, 2), 1, "Cel", "ground minimum temperature");
        if (tg.available && *tg.value >= 50) tg.value = 50 - *tg.value;
        ctx.report.set(Field::GroundMinimumTemperature, std::move(tg));

        Observation local;
        local.raw = g.substr(3);
        local.components.push_back({"character", fc.table("167", v.substr(3, 1))});
        local.components.push_back({"time", fc.table("168", v.substr(4, 1))});
        settle(local);
        ctx.report.set(Field::LocalPrecipitation, std::move(local));
    } else if (ctx.region == "Antarctic") {
        Observation wind;
        wind.raw = g.substr(1);
        wind.components.push_back({"direction", fc.table("0877", v.substr(1, 2))});
        wind.components.push_back({"speed", fc.number(v.substr(3, 2), 1, ctx.wind_unit, "maximum wind speed")});
        settle(wind);
        ctx.report.set(Field::MaxWind, std::move(wind));
    } else {
        ctx.notImplemented(g, fmt::format("group 0 is not defined for region {}",
                                          ctx.region.empty() ? "unknown" : ctx.region));
    }
}

static void decodeGroundState(const std::string& g, DecodeContext& ctx, const FieldCodec& fc) {
    const std::string_view v(g);
    Observation state = fc.table("0901", v.substr(1, 1));

    Observation t = fc.number(v.substr(3), 1, "Cel", "ground temperature");
    t.raw = g.substr(2);
    if (g[2] == '/') {
        t.available = false;
        t.value.reset();
    } else if (g[2] != '0' && g[2] != '1') {
        throw InvalidCode(g.substr(2, 1), "ground temperature sign");
    } else if (t.available && g[2] == '1') {
        t.value = -*t.value;
    }

    Observation gs;
    gs.raw = g;
    gs.components.push_back({"state", std::move(state)});
    gs.components.push_back({"temperature", std::move(t)});
    settle(gs);
    ctx.report.set(Field::GroundState, std::move(gs));
}

static void decodeSunshine(const std::string& g, GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    const std::string_view v(g);
    Observation entry;
    entry.raw = g;

    int duration = 24;
    Observation amount;
    if (g[2] == '/') {
        amount = fc.number(v.substr(2), 0.1, "h", "sunshine");
    } else if (g[2] <= '2') {
        amount = fc.number(v.substr(2), 0.1, "h", "sunshine", 0, 240);
    } else if (g[2] == '3') {
        duration = 1;
        amount   = fc.number(v.substr(3), 0.1, "h", "sunshine", 0, 10);
    } else if (g[2] == '4' || g[2] == '5') {
        ctx.notImplemented(g, "sunshine group variant");
        return;
    } else {
        throw InvalidCode(g, "sunshine");
    }
    entry.components.push_back({"amount", std::move(amount)});
    entry.components.push_back({"duration", quantity(duration, "h")});
    settle(entry);

    // jFFFF radiation groups, j strictly increasing
    const char* unit = duration == 24 ? "J/cm2" : "kJ/m2";
    int last = -1;
    const auto isRadiation = [&](std::string_view n) {
        const int j = headerOf(n);
        if (j <= last || j > 6) return false;
        if (j == 5 && (n[1] < '0' || n[1] > '4')) return false;
        if (j == 6 && ctx.precip_in_group_3) return false;
        return true;
    };
    while (auto r = in.nextIf(isRadiation)) {
        last = (*r)[0] - '0';
        Observation item;
        item.raw = *r;
        item.components.push_back({"type", typed(kRadiationTypes[last], last)});
        item.components.push_back({"amount", fc.number(std::string_view(*r).substr(1), 1, unit, "radiation")});
        settle(item);
        entry.items.push_back(std::move(item));
    }
    ctx.report.append(Field::Sunshine, std::move(entry));
}

static void decodeFive(const std::string& g, GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    const std::string_view v(g);
    const char j1 = g[1];
    if (j1 >= '0' && j1 <= '3') {
        Observation e;
        e.raw = g;
        e.components.push_back({"amount", fc.number(v.substr(1, 3), 0.1, "mm", "evapotranspiration")});
        e.components.push_back({"type", fc.table("1806", v.substr(4, 1))});
        settle(e);
        ctx.report.set(Field::Evapotranspiration, std::move(e));
    } else if (j1 == '4') {
        ctx.notImplemented(g, "temperature change group");
    } else if (j1 == '5') {
        decodeSunshine(g, in, ctx, fc);
    } else if (j1 == '8' || j1 == '9') {
        if (ctx.report.has(Field::PressureChange)) {
            ctx.notImplemented(g, "second 24-hour pressure change");
            return;
        }
        Observation change = fc.number(v.substr(2), 0.1, "hPa", "pressure change");
        change.raw  = g.substr(1);
        change.code = j1 - '0';
        if (change.available && j1 == '9') change.value = -*change.value;
        ctx.report.set(Field::PressureChange, std::move(change));
    } else if (const GroupDef* def = fc.layout(3, v.substr(0, 2))) {
        ctx.report.set(def->field, fc.decodeLayout(*def, g, ctx));
    } else {
        ctx.notImplemented(g, "unknown group 5 variant");
    }
}

static Observation gustSpeed(const std::string& g, GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    std::optional<std::string> extension;
    if (g.compare(3, 2, "99") == 0) extension = in.nextIf(isSpeedExtension);
    if (!extension) return fc.number(std::string_view(g).substr(3), 1, ctx.wind_unit, "highest gust");
    Observation speed = fc.number(std::string_view(*extension).substr(2), 1, ctx.wind_unit, "highest gust");
    speed.raw = g.substr(3) + " " + *extension;
    speed.flags["extended"] = true;
    return speed;
}

static void decodeNine(const std::string& g, GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    const std::string_view v(g);
    const auto sub = parseCode(v.substr(1, 2));
    if (!sub) {
        ctx.notImplemented(g, "malformed group 9");
        return;
    }

    switch (*sub) {
    case 0: {
        const auto tt = parseCode(v.substr(3));
        ctx.report.set(Field::WeatherTime, fc.table(tt && *tt >= 76 ? "4077Z" : "4077T", v.substr(3)));
        return;
    }
    case 1:
        ctx.report.set(Field::TimeOfEnding, fc.table("4077T", v.substr(3)));
        return;
    case 7:
        if (!ctx.pending_907.empty())
            ctx.notImplemented(ctx.pending_907, "time before observation with no group to apply to");
        ctx.pending_907.clear();
        ctx.time_before = fc.table("4077T", v.substr(3));
        ctx.pending_907 = g;
        return;
    case 10:
    case 11: {
        Observation gust;
        gust.raw = g;
        gust.components.push_back({"speed", gustSpeed(g, in, ctx, fc)});
        if (auto dir = in.nextIf([](std::string_view n) { return n.size() == 5 && n.substr(0, 3) == "915"; })) {
            gust.raw += " " + *dir;
            gust.components.push_back({"direction", fc.table("0877", std::string_view(*dir).substr(3))});
        }
        if (*sub == 10) {
            gust.components.push_back({"measure_period", quantity(10, "min")});
        } else {
            gust.components.push_back({"time_before_obs", ctx.timeBefore()});
            ctx.pending_907.clear();
        }
        settle(gust);
        ctx.report.append(Field::HighestGust, std::move(gust));
        return;
    }
    case 31: {
        Observation snow;
        snow.raw = g;
        snow.components.push_back({"amount", fc.table("3870", v.substr(3))});
        snow.components.push_back({"time_before_obs", ctx.timeBefore()});
        ctx.pending_907.clear();
        settle(snow);
        ctx.report.set(Field::SnowFall, std::move(snow));
        return;
    }
    case 33: case 34: case 35: case 36: case 37: {
        Observation deposit;
        deposit.raw = g;
        deposit.components.push_back({"type", typed(kDepositTypes[*sub - 33], *sub - 30)});
        deposit.components.push_back({"diameter", fc.table("3570", v.substr(3))});
        settle(deposit);
        ctx.report.append(Field::DepositDiameter, std::move(deposit));
        return;
    }
    case 96: case 97: case 98: case 99: {
        const bool humidity = *sub >= 98;
        Observation change = fc.number(v.substr(3), 1, humidity ? "%" : "Cel",
                                       humidity ? "sudden humidity change" : "sudden temperature change");
        change.raw  = g.substr(2);
        change.code = *sub % 10;
        if (change.available && (*sub == 97 || *sub == 99)) change.value = -*change.value;
        ctx.report.set(humidity ? Field::SuddenHumidityChange : Field::SuddenTemperatureChange, std::move(change));
        return;
    }
    default:
        break;
    }

    if (*sub >= 80 && *sub <= 88) {
        Observation direction = fc.table("0700", v.substr(2, 1));
        if (direction.available) direction.flags["towards_sea"] = *direction.code == 0;
        Observation vis;
        vis.raw = g;
        vis.components.push_back({"direction", std::move(direction)});
        vis.components.push_back({"visibility", fc.table("4377", v.substr(3))});
        settle(vis);
        ctx.report.append(Field::VisibilityDirection, std::move(vis));
        return;
    }

    if (const GroupDef* def = fc.layout(3, v.substr(0, 3)))
        ctx.report.set(def->field, fc.decodeLayout(*def, g, ctx));
    else
        ctx.notImplemented(g, fmt::format("group 9{:02d} is not supported", *sub));
}

// Rank of a 9-group in the ascending sub-header order.  Members of one family
// (910/911, 933-937, 980-988, 996/997, 998/999) share a rank; 907tt has none
// since it may stand ahead of any group it scopes.
static std::optional<int> nineRank(std::string_view g) {
    const auto sub = parseCode(g.substr(1, 2));
    if (!sub || *sub == 7) return std::nullopt;
    if (*sub == 10 || *sub == 11) return 10;
    if (*sub >= 33 && *sub <= 37) return 33;
    if (*sub >= 80 && *sub <= 88) return 80;
    if (*sub == 96 || *sub == 97) return 96;
    if (*sub == 98 || *sub == 99) return 98;
    return sub;
}

static void decodeGroup(int header, const std::string& g, GroupReader& in, DecodeContext& ctx,
                        const FieldCodec& fc) {
    const std::string_view v(g);
    switch (header) {
    case 0:
        decodeRegional(g, ctx, fc);
        break;
    case 1:
        ctx.report.set(Field::MaximumTemperature, fc.signedTemperature(g[1], v.substr(2), "maximum temperature"));
        break;
    case 2:
        ctx.report.set(Field::MinimumTemperature, fc.signedTemperature(g[1], v.substr(2), "minimum temperature"));
        break;
    case 3:
    case 4:
        if (ctx.isShip()) {
            ctx.notImplemented(g, "ground state is not reported by sea stations");
        } else if (header == 3) {
            decodeGroundState(g, ctx, fc);
        } else if (const GroupDef* def = fc.layout(3, "4")) {
            ctx.report.set(def->field, fc.decodeLayout(*def, g, ctx));
        } else {
            ctx.notImplemented(g, "no layout registered for section 3 header 4");
        }
        break;
    case 5:
        decodeFive(g, in, ctx, fc);
        break;
    case 6: {
        if (!ctx.precip_in_group_3)
            ctx.warn(fmt::format("precipitation group {} present but not announced by iR", g));
        Observation p;
        p.raw = g;
        p.components.push_back({"amount", fc.table("3590", v.substr(1, 3))});
        p.components.push_back({"time_before_obs", fc.table("4019", v.substr(4, 1))});
        settle(p);
        ctx.report.append(Field::PrecipitationS3, std::move(p));
        break;
    }
    case 7: {
        Observation p;
        p.raw = g;
        p.components.push_back({"amount", fc.table("3590A", v.substr(1))});
        p.components.push_back({"time_before_obs", quantity(24, "h")});
        settle(p);
        ctx.report.append(Field::PrecipitationS3, std::move(p));
        break;
    }
    case 8: {
        Observation layer;
        layer.raw = g;
        layer.components.push_back({"cloud_cover", fc.table("2700", v.substr(1, 1))});
        layer.components.push_back({"cloud_genus", fc.table("0500", v.substr(2, 1))});
        layer.components.push_back({"cloud_height", fc.table("1677", v.substr(3))});
        settle(layer);
        ctx.report.append(Field::CloudLayer, std::move(layer));
        break;
    }
    case 9:
        decodeNine(g, in, ctx, fc);
        break;
    default:
        break;
    }
}

void decodeSection3(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    int last = -1;
    int last_nine = -1;
    while (auto peeked = in.peek()) {
        if (isSectionMarker(*peeked, false)) break;
        const std::string g = in.next();
        const int h = headerOf(g);
        if (h < 0) {
            ctx.notImplemented(g, "malformed section 3 group");
            continue;
        }
        const bool repeatable = h == 5 || h == 8 || h == 9;
        if (h < last || (h == last && !repeatable)) {
            ctx.notImplemented(g, fmt::format("header {} out of order after {}", h, last));
            continue;
        }
        if (h == 9) {
            if (const auto rank = nineRank(g)) {
                if (*rank < last_nine) {
                    ctx.notImplemented(g, fmt::format("group 9{} out of order", g.substr(1, 2)));
                    continue;
                }
                last_nine = *rank;
            }
        }
        last = h;
        recover(ctx, g, [&] { decodeGroup(h, g, in, ctx, fc); });
    }
    if (!ctx.pending_907.empty()) {
        ctx.notImplemented(ctx.pending_907, "time before observation with no group to apply to");
        ctx.pending_907.clear();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

static bool hasSection3(const Report& r) {
    for (int f = static_cast<int>(Field::GroundMinimumTemperature);
         f <= static_cast<int>(Field::SuddenHumidityChange); ++f)
        if (r.has(static_cast<Field>(f))) return true;
    return false;
}

// Code from provenance, else from the first matching text
template <size_t N>
static int typeCode(const Observation* o, const std::array<const char*, N>& names, int offset,
                    std::string_view desc) {
    if (o && o->code) return *o->code;
    if (o && o->text)
        for (size_t i = 0; i < N; ++i)
            if (*o->text == names[i]) return static_cast<int>(i) + offset;
    throw EncodeError(fmt::format("{} has no type", desc));
}

// Signed value whose sign is carried by a header digit
static std::string signedByHeader(const Observation& o, int width, double scale, std::string_view unit,
                                  int positive, int negative, std::string_view desc) {
    std::string digits = slashes(static_cast<size_t>(width));
    int sign = o.code ? *o.code : positive;
    if (o.available) {
        const double v = valueIn(o, unit, desc);
        digits = pad(std::lround(std::fabs(v) / scale), width, desc);
        if (!o.code) sign = std::signbit(v) ? negative : positive;
    }
    return std::to_string(sign) + digits;
}

static std::string gustSpeed(const Observation* speed, const EncodeContext& ctx, std::string& extension) {
    if (!speed || !speed->available) return "//";
    const long v = std::lround(valueIn(*speed, ctx.wind_unit, "highest gust"));
    if (v < 100 && !speed->flag("extended")) return pad(v, 2, "highest gust");
    extension = "00" + pad(v, 3, "highest gust");
    return "99";
}

void encodeSection3(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc) {
    const Report& r = ctx.report;
    if (!hasSection3(r)) return;
    const bool region_one = r.has(Field::GroundMinimumTemperature) || r.has(Field::LocalPrecipitation);
    if ((region_one && ctx.region != "I") || (r.has(Field::MaxWind) && ctx.region != "Antarctic"))
        throw EncodeError(fmt::format("section 3 group 0 is not defined for region {}",
                                      ctx.region.empty() ? "unknown" : ctx.region));
    out.put("333");

    // 0
    if (ctx.region == "I") {
        const Observation* tg    = r.get(Field::GroundMinimumTemperature);
        const Observation* local = r.get(Field::LocalPrecipitation);
        if (tg || local) {
            std::string tt = "//";
            if (tg && tg->available) {
                const long v = std::lround(valueIn(*tg, "Cel", "ground minimum temperature"));
                tt = pad(v < 0 ? 50 - v : v, 2, "ground minimum temperature");
            }
            out.put("0" + tt + fc.table("167", local ? local->component("character") : nullptr) +
                    fc.table("168", local ? local->component("time") : nullptr));
        }
    } else if (ctx.region == "Antarctic") {
        if (const Observation* w = r.get(Field::MaxWind))
            out.put("0" + fc.table("0877", w->component("direction")) +
                    fc.number(w->component("speed"), 2, 1, ctx.wind_unit, "maximum wind speed"));
    }

    // 1, 2
    if (const Observation* t = r.get(Field::MaximumTemperature))
        out.put("1", fc.signedTemperature(t, "maximum temperature"));
    if (const Observation* t = r.get(Field::MinimumTemperature))
        out.put("2", fc.signedTemperature(t, "minimum temperature"));

    // 3, 4
    if (const Observation* gs = r.get(Field::GroundState)) {
        const Observation* t = gs->component("temperature");
        std::string stt = "///";
        if (t && t->available) {
            const double v = valueIn(*t, "Cel", "ground temperature");
            stt = (std::signbit(v) ? "1" : "0") + pad(std::lround(std::fabs(v)), 2, "ground temperature");
        }
        out.put("3" + fc.table("0901", gs->component("state")) + stt);
    }
    if (const Observation* gs = r.get(Field::GroundStateSnow)) {
        const GroupDef* def = fc.layout(3, "4");
        if (!def) throw EncodeError("no layout registered for section 3 group 4");
        out.put(fc.encodeLayout(*def, *gs, ctx));
    }

    // 5
    if (const Observation* e = r.get(Field::Evapotranspiration))
        out.put("5" + fc.number(e->component("amount"), 3, 0.1, "mm", "evapotranspiration") +
                fc.table("1806", e->component("type")));

    if (const auto* sunshine = r.list(Field::Sunshine)) {
        for (const auto& s : *sunshine) {
            const Observation* duration = s.component("duration");
            const bool hourly = duration && duration->available &&
                                std::lround(valueIn(*duration, "h", "sunshine duration")) == 1;
            const Observation* amount = s.component("amount");
            out.put(hourly ? "553" + fc.number(amount, 2, 0.1, "h", "sunshine")
                           : "55" + fc.number(amount, 3, 0.1, "h", "sunshine"));
            const char* unit = hourly ? "kJ/m2" : "J/cm2";
            for (const auto& item : s.items) {
                const int j = typeCode(item.component("type"), kRadiationTypes, 0, "radiation");
                out.put(std::to_string(j) + fc.number(item.component("amount"), 4, 1, unit, "radiation"));
            }
        }
    }

    for (const char* header : {"56", "57"}) {
        const GroupDef* def = fc.layout(3, header);
        if (!def) continue;
        if (const Observation* o = r.get(def->field)) out.put(fc.encodeLayout(*def, *o, ctx));
    }

    if (const Observation* p = r.get(Field::PressureChange))
        out.put("5" + signedByHeader(*p, 3, 0.1, "hPa", 8, 9, "pressure change"));

    // 6, 7
    if (const auto* precipitation = r.list(Field::PrecipitationS3)) {
        const auto isDaily = [](const Observation& p) {
            const Observation* t = p.component("time_before_obs");
            return t && !t->code && t->value && std::lround(valueIn(*t, "h", "precipitation period")) == 24;
        };
        for (const auto& p : *precipitation)
            if (!isDaily(p))
                out.put("6" + fc.table("3590", p.component("amount")) +
                        fc.table("4019", p.component("time_before_obs")));
        for (const auto& p : *precipitation)
            if (isDaily(p)) out.put("7" + fc.table("3590A", p.component("amount")));
    }

    // 8
    if (const auto* layers = r.list(Field::CloudLayer)) {
        for (const auto& l : *layers)
            out.put("8" + fc.table("2700", l.component("cloud_cover")) +
                    fc.table("0500", l.component("cloud_genus")) +
                    fc.table("1677", l.component("cloud_height"),
                             use90Hints(l.component("cloud_height"), ctx.use90_cloud_height)));
    }

    // 9
    const auto layoutGroup = [&](std::string_view header) {
        const GroupDef* def = fc.layout(3, header);
        if (!def) return;
        if (const Observation* o = r.get(def->field)) out.put(fc.encodeLayout(*def, *o, ctx));
    };
    const auto timeBefore = [&](const Observation& tb) {
        if (tb.sameAs(ctx.time_before)) return;
        out.put("907" + fc.table("4077T", &tb));
        ctx.time_before = tb;
    };

    if (const Observation* t = r.get(Field::WeatherTime))
        out.put("900" + fc.table(t->table.empty() ? "4077T" : t->table, t));
    if (const Observation* t = r.get(Field::TimeOfEnding))
        out.put("901" + fc.table("4077T", t));

    const auto* gusts = r.list(Field::HighestGust);
    const Observation* snow = r.get(Field::SnowFall);
    {
        // 907tt sits in its own slot ahead of 909 for the first group it applies to
        const Observation* first = nullptr;
        if (gusts)
            for (const auto& gst : *gusts)
                if (!first) first = gst.component("time_before_obs");
        if (!first && snow) first = snow->component("time_before_obs");
        if (first) timeBefore(*first);
    }

    layoutGroup("909");

    if (gusts) {
        for (const auto& gst : *gusts) {
            std::string header = "911";
            if (const Observation* mp = gst.component("measure_period")) {
                if (!mp->value || std::lround(valueIn(*mp, "min", "gust measuring period")) != 10)
                    throw EncodeError("highest gust measuring period must be 10 minutes");
                header = "910";
            } else if (const Observation* tb = gst.component("time_before_obs")) {
                timeBefore(*tb);
            }
            std::string extension;
            out.put(header + gustSpeed(gst.component("speed"), ctx, extension));
            if (!extension.empty()) out.put(extension);
            if (const Observation* dir = gst.component("direction"))
                out.put("915" + fc.table("0877", dir));
        }
    }

    for (const char* header : {"924", "927", "928", "929"}) layoutGroup(header);

    if (snow) {
        if (const Observation* tb = snow->component("time_before_obs")) timeBefore(*tb);
        out.put("931" + fc.table("3870", snow->component("amount")));
    }

    if (const auto* deposits = r.list(Field::DepositDiameter)) {
        for (const auto& d : *deposits) {
            const int type = typeCode(d.component("type"), kDepositTypes, 3, "deposit");
            out.put("93" + pad(type, 1, "deposit type") + fc.table("3570", d.component("diameter")));
        }
    }

    for (const char* header : {"940", "944", "950", "951"}) layoutGroup(header);

    if (const auto* vis = r.list(Field::VisibilityDirection)) {
        for (const auto& v : *vis)
            out.put("98" + fc.table("0700", v.component("direction")) +
                    fc.table("4377", v.component("visibility"),
                             use90Hints(v.component("visibility"), ctx.use90_visibility)));
    }

    for (const char* header : {"990", "991", "992", "993", "994"}) layoutGroup(header);

    if (const Observation* t = r.get(Field::SuddenTemperatureChange))
        out.put("99" + signedByHeader(*t, 2, 1, "Cel", 6, 7, "sudden temperature change"));
    if (const Observation* u = r.get(Field::SuddenHumidityChange))
        out.put("99" + signedByHeader(*u, 2, 1, "%", 8, 9, "sudden humidity change"));
}

} // namespace synop::detail
