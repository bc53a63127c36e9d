// Section1.cpp – Section 1: data for global exchange (iRixhVV Nddff 1..9).

#include "FieldCodec.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cmath>
#include <utility>

namespace synop::detail {

// iR → (group 6 in section 1, group 6 in section 3)
static std::optional<std::pair<bool, bool>> precipitationRouting(int ir, bool russian) {
    switch (ir) {
    case 0: return std::pair{true, true};
    case 1: return std::pair{true, false};
    case 2: return std::pair{false, true};
    case 3:
    case 4: return std::pair{false, false};
    default: break;
    }
    if (russian) {
        if (ir == 6) return std::pair{true, false};
        if (ir == 7) return std::pair{false, true};
        if (ir == 8) return std::pair{false, false};
    }
    return std::nullopt;
}

static Observation indicator(std::string_view raw) {
    Observation o;
    o.raw = std::string(raw);
    if (raw != "/") {
        o.available = true;
        o.value     = raw[0] - '0';
        o.code      = raw[0] - '0';
    }
    return o;
}

// PPPP in tenths of a hectopascal; the thousands digit is dropped
static Observation pressure(std::string_view pppp, std::string_view desc) {
    Observation o;
    o.raw  = std::string(pppp);
    o.unit = "hPa";
    if (isMissing(pppp)) return o;

    std::string digits(pppp);
    if (digits.back() == '/') digits.back() = '0';
    const auto v = parseCode(digits);
    if (!v) throw InvalidCode(pppp, desc);

    o.available = true;
    o.value     = *v / 10.0 + (*v > 5000 ? 0 : 1000);
    return o;
}

static std::string pressure(const Observation* o, std::string_view desc) {
    if (!o || !o->available) return "////";
    long v = std::lround(valueIn(*o, "hPa", desc) * 10.0);
    if (v >= 10000) v -= 10000;
    return pad(v, 4, desc);
}

// hhh → geopotential metres, depending on the isobaric surface code a
static double geopotentialHeight(int a, int hhh) {
    switch (a) {
    case 2: return hhh + (hhh < 300 ? 1000 : 0);
    case 7: return hhh + (hhh < 500 ? 3000 : 2000);
    case 8: return hhh + 1000;
    default: return hhh;
    }
}

static long geopotentialCode(int a, long height) {
    switch (a) {
    case 2: return height - (height >= 1000 ? 1000 : 0);
    case 7: return height - (height >= 3000 ? 3000 : 2000);
    case 8: return height - 1000;
    default: return height;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

static void decodeIndicators(const std::string& g, DecodeContext& ctx, const FieldCodec& fc) {
    if (g.size() != 5)
        throw DecodeError(fmt::format("{} is not a valid iRixhVV group", g));

    recover(ctx, g, [&] {
        Observation ir = indicator(g.substr(0, 1));
        if (ir.available) {
            const auto route = precipitationRouting(*ir.code, ctx.options.country == "RU");
            if (!route || !std::isdigit(static_cast<unsigned char>(g[0])))
                throw InvalidCode(g.substr(0, 1), "precipitation indicator");
            ctx.precip_in_group_1 = route->first;
            ctx.precip_in_group_3 = route->second;
        }
        ir.flags["in_group_1"] = ctx.precip_in_group_1;
        ir.flags["in_group_3"] = ctx.precip_in_group_3;
        ctx.report.set(Field::PrecipitationIndicator, std::move(ir));
    });
    recover(ctx, g, [&] {
        Observation ix = indicator(g.substr(1, 1));
        if (ix.available) {
            if (*ix.code < 1 || *ix.code > 7) throw InvalidCode(g.substr(1, 1), "weather indicator");
            ctx.weather_ix = *ix.code;
            ix.flags["automatic"] = ctx.automatic();
        }
        ctx.report.set(Field::WeatherIndicator, std::move(ix));
    });
    recover(ctx, g, [&] { ctx.report.set(Field::LowestCloudBase, fc.table("1600", g.substr(2, 1))); });
    recover(ctx, g, [&] { ctx.report.set(Field::Visibility, fc.table("4377", g.substr(3, 2))); });
}

static void decodeWind(const std::string& g, GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    if (g.size() != 5)
        throw DecodeError(fmt::format("{} is not a valid Nddff group", g));

    recover(ctx, g, [&] { ctx.report.set(Field::CloudCover, fc.table("2700", g.substr(0, 1))); });

    std::optional<std::string> extension;
    if (g.compare(3, 2, "99") == 0) extension = in.nextIf(isSpeedExtension);

    recover(ctx, g, [&] {
        Observation wind;
        wind.raw = g.substr(1);
        Observation direction = fc.table("0877", g.substr(1, 2));
        Observation speed = extension
            ? fc.number(std::string_view(*extension).substr(2), 1, ctx.wind_unit, "wind speed")
            : fc.number(g.substr(3, 2), 1, ctx.wind_unit, "wind speed");
        if (extension) {
            wind.raw += " " + *extension;
            speed.flags["extended"] = true;
        }

        if (direction.flag("calm") && speed.available && *speed.value > 0) {
            ctx.warn(fmt::format("wind group {} is calm with a speed of {}; speed dropped", g, *speed.value));
            speed.available = false;
            speed.value.reset();
        }
        wind.components.push_back({"direction", std::move(direction)});
        wind.components.push_back({"speed", std::move(speed)});
        settle(wind);
        ctx.report.set(Field::SurfaceWind, std::move(wind));
    });
}

static void decodeCloudTypes(const std::string& g, DecodeContext& ctx, const FieldCodec& fc) {
    Observation amount = fc.table("2700", g.substr(1, 1));
    Observation low    = fc.table("0513", g.substr(2, 1));
    Observation middle = fc.table("0515", g.substr(3, 1));
    Observation high   = fc.table("0509", g.substr(4, 1));

    // Nh refers to the CL clouds, or to the CM clouds when there are none
    std::string target = "cloud_amount";
    if (low.available && *low.value >= 1)
        target = "low_cloud_amount";
    else if (middle.available)
        target = "middle_cloud_amount";
    else if (amount.available)
        ctx.warn(fmt::format("cloud group {} gives an amount but no cloud type", g));

    Observation types;
    types.raw = g;
    types.components.push_back({target, std::move(amount)});
    types.components.push_back({"low_cloud_type", std::move(low)});
    types.components.push_back({"middle_cloud_type", std::move(middle)});
    types.components.push_back({"high_cloud_type", std::move(high)});
    settle(types);
    ctx.report.set(Field::CloudTypes, std::move(types));
}

static void decodeGroup(int header, const std::string& g, DecodeContext& ctx, const FieldCodec& fc) {
    const std::string_view v(g);
    switch (header) {
    case 1:
        ctx.report.set(Field::AirTemperature, fc.signedTemperature(g[1], v.substr(2), "air temperature"));
        break;
    case 2:
        if (g[1] == '9')
            ctx.report.set(Field::RelativeHumidity, fc.number(v.substr(2), 1, "%", "relative humidity", 0, 100));
        else
            ctx.report.set(Field::DewpointTemperature,
                           fc.signedTemperature(g[1], v.substr(2), "dewpoint temperature"));
        break;
    case 3:
        ctx.report.set(Field::StationPressure, pressure(v.substr(1), "station pressure"));
        break;
    case 4:
        if (g[1] == '0' || g[1] == '9' || g == "4////") {
            ctx.report.set(Field::SeaLevelPressure, pressure(v.substr(1), "sea level pressure"));
        } else {
            Observation surface = fc.table("0264", v.substr(1, 1));
            Observation height  = fc.number(v.substr(2), 1, "gpm", "geopotential height");
            if (height.available) height.value = geopotentialHeight(g[1] - '0', static_cast<int>(*height.value));
            ctx.report.set(Field::GeopotentialSurface, std::move(surface));
            ctx.report.set(Field::GeopotentialHeight, std::move(height));
        }
        break;
    case 5: {
        Observation tendency = fc.table("0200", v.substr(1, 1));
        Observation change   = fc.number(v.substr(2), 0.1, "hPa", "pressure change");
        if (change.available && tendency.available && *tendency.code >= 5)
            change.value = -*change.value;
        Observation t;
        t.raw = g;
        t.components.push_back({"tendency", std::move(tendency)});
        t.components.push_back({"change", std::move(change)});
        settle(t);
        ctx.report.set(Field::PressureTendency, std::move(t));
        break;
    }
    case 6: {
        if (!ctx.precip_in_group_1)
            ctx.warn(fmt::format("precipitation group {} present but not announced by iR", g));
        Observation p;
        p.raw = g;
        p.components.push_back({"amount", fc.table("3590", v.substr(1, 3))});
        p.components.push_back({"time_before_obs", fc.table("4019", v.substr(4, 1))});
        settle(p);
        ctx.report.set(Field::PrecipitationS1, std::move(p));
        break;
    }
    case 7: {
        const char* present = ctx.automatic() ? "4680" : "4677";
        const char* past    = ctx.automatic() ? "4531" : "4561";
        Observation ww = fc.table(present, v.substr(1, 2));
        Observation w1 = fc.table(past, v.substr(3, 1));
        Observation w2 = fc.table(past, v.substr(4, 1));
        ww.components.push_back({"time_before_obs", ctx.timeBefore()});
        ctx.report.set(Field::PresentWeather, std::move(ww));
        ctx.report.append(Field::PastWeather, std::move(w1));
        ctx.report.append(Field::PastWeather, std::move(w2));
        break;
    }
    case 8:
        decodeCloudTypes(g, ctx, fc);
        break;
    case 9:
        if (const GroupDef* def = fc.layout(1, "9"))
            ctx.report.set(def->field, fc.decodeLayout(*def, g, ctx));
        else
            ctx.notImplemented(g, "no layout registered for header 9");
        break;
    default:
        ctx.notImplemented(g, "unknown section 1 group");
        break;
    }
}

void decodeSection1(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    decodeIndicators(in.next(), ctx, fc);
    decodeWind(in.next(), in, ctx, fc);

    int last = 0;
    while (auto peeked = in.peek()) {
        if (isSectionMarker(*peeked, true)) return;
        const std::string g = in.next();
        const int header = headerOf(g);
        if (header < 0) {
            ctx.notImplemented(g, "malformed section 1 group");
            continue;
        }
        if (header <= last) {
            ctx.notImplemented(g, fmt::format("header {} out of order after {}", header, last));
            continue;
        }
        last = header;
        recover(ctx, g, [&] { decodeGroup(header, g, ctx, fc); });
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

bool hasSection1(const Report& report) {
    for (int f = static_cast<int>(Field::PrecipitationIndicator);
         f <= static_cast<int>(Field::ExactObservationTime); ++f)
        if (report.has(static_cast<Field>(f))) return true;
    return false;
}

static std::string indicatorCode(const Observation* o, std::string_view desc) {
    if (!o || !o->available) return "/";
    if (o->code) return pad(*o->code, 1, desc);
    return pad(std::lround(valueIn(*o, "", desc)), 1, desc);
}

static std::string precipitationIndicator(const Observation* o) {
    if (o && o->available && !o->code) {
        const bool g1 = o->flag("in_group_1"), g3 = o->flag("in_group_3");
        return g1 ? (g3 ? "0" : "1") : (g3 ? "2" : "3");
    }
    return indicatorCode(o, "precipitation indicator");
}

static void encodeWind(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc) {
    const Report& r = ctx.report;
    const Observation* wind      = r.get(Field::SurfaceWind);
    const Observation* direction = wind ? wind->component("direction") : nullptr;
    const Observation* speed     = wind ? wind->component("speed") : nullptr;

    std::string ff = "//";
    std::optional<std::string> extension;
    if (speed && speed->available) {
        const long v = std::lround(valueIn(*speed, ctx.wind_unit, "wind speed"));
        if (v >= 100 || speed->flag("extended")) {
            ff = "99";
            extension = "00" + pad(v, 3, "wind speed");
        } else {
            ff = pad(v, 2, "wind speed");
        }
    }
    out.put(fc.table("2700", r.get(Field::CloudCover)) + fc.table("0877", direction) + ff);
    if (extension) out.put(*extension);
}

static std::string tableOf(const Observation& o, const char* fallback) {
    return o.table.empty() ? fallback : o.table;
}

void encodeSection1(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc) {
    const Report& r = ctx.report;

    if (const Observation* ix = r.get(Field::WeatherIndicator); ix && ix->available)
        ctx.weather_ix = static_cast<int>(ix->code ? *ix->code : std::lround(*ix->value));

    out.put(precipitationIndicator(r.get(Field::PrecipitationIndicator)) +
            indicatorCode(r.get(Field::WeatherIndicator), "weather indicator") +
            fc.table("1600", r.get(Field::LowestCloudBase)) +
            fc.table("4377", r.get(Field::Visibility),
                     use90Hints(r.get(Field::Visibility), ctx.use90_visibility)));
    encodeWind(out, ctx, fc);

    if (const Observation* t = r.get(Field::AirTemperature))
        out.put("1", fc.signedTemperature(t, "air temperature"));

    if (const Observation* td = r.get(Field::DewpointTemperature))
        out.put("2", fc.signedTemperature(td, "dewpoint temperature"));
    else if (const Observation* rh = r.get(Field::RelativeHumidity))
        out.put("29", fc.number(rh, 3, 1, "%", "relative humidity"));

    if (const Observation* p = r.get(Field::StationPressure))
        out.put("3", pressure(p, "station pressure"));

    if (const Observation* p = r.get(Field::SeaLevelPressure)) {
        out.put("4", pressure(p, "sea level pressure"));
    } else if (const Observation* surface = r.get(Field::GeopotentialSurface)) {
        const std::string a = fc.table("0264", surface);
        const Observation* height = r.get(Field::GeopotentialHeight);
        std::string hhh = "///";
        if (height && height->available && a != "/")
            hhh = pad(geopotentialCode(a[0] - '0', std::lround(valueIn(*height, "gpm", "geopotential height"))),
                      3, "geopotential height");
        out.put("4" + a + hhh);
    }

    if (const Observation* t = r.get(Field::PressureTendency)) {
        const Observation* change = t->component("change");
        std::string ppp = "///";
        if (change && change->available)
            ppp = pad(std::lround(std::fabs(valueIn(*change, "hPa", "pressure change")) * 10.0), 3,
                      "pressure change");
        out.put("5" + fc.table("0200", t->component("tendency")) + ppp);
    }

    if (const Observation* p = r.get(Field::PrecipitationS1))
        out.put("6" + fc.table("3590", p->component("amount")) +
                fc.table("4019", p->component("time_before_obs")));

    const Observation* ww = r.get(Field::PresentWeather);
    const auto* past      = r.list(Field::PastWeather);
    if (ww || past) {
        const char* present_id = ctx.automatic() ? "4680" : "4677";
        const char* past_id    = ctx.automatic() ? "4531" : "4561";
        std::string g = "7";
        g += ww ? fc.table(tableOf(*ww, present_id), ww) : "//";
        for (size_t i = 0; i < 2; ++i) {
            const Observation* w = past && i < past->size() ? &(*past)[i] : nullptr;
            g += w ? fc.table(tableOf(*w, past_id), w) : "/";
        }
        out.put(g);
    }

    if (const Observation* c = r.get(Field::CloudTypes)) {
        const Observation* amount = c->component("low_cloud_amount");
        if (!amount) amount = c->component("middle_cloud_amount");
        if (!amount) amount = c->component("cloud_amount");
        out.put("8" + fc.table("2700", amount) + fc.table("0513", c->component("low_cloud_type")) +
                fc.table("0515", c->component("middle_cloud_type")) +
                fc.table("0509", c->component("high_cloud_type")));
    }

    if (const Observation* t = r.get(Field::ExactObservationTime)) {
        const GroupDef* def = fc.layout(1, "9");
        if (!def) throw EncodeError("no layout registered for section 1 group 9");
        out.put(fc.encodeLayout(*def, *t, ctx));
    }
}

} // namespace synop::detail
