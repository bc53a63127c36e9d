// Section0.cpp – Identification section: station type, callsign, time,
// station index (land) or position (sea / mobile).

#include "FieldCodec.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cmath>

namespace synop::detail {

// ─── WMO block ranges → Regional Association ──────────────────────────────────

struct BlockRange {
    int         lo;
    int         hi;
    const char* region;
};

static constexpr std::array<BlockRange, 22> kBlocks = {{
    {60000, 69998, "I"},
    {20000, 20099, "II"}, {20200, 21998, "II"}, {23001, 25998, "II"},
    {28001, 32998, "II"}, {35001, 36998, "II"}, {38001, 39998, "II"},
    {40350, 48599, "II"}, {48800, 49998, "II"}, {50001, 59998, "II"},
    {80001, 88998, "III"},
    {70001, 79998, "IV"},
    {48600, 48799, "V"},  {90001, 98998, "V"},
    {1,     19998, "VI"}, {20100, 20199, "VI"}, {22001, 22998, "VI"},
    {26001, 27998, "VI"}, {33001, 34998, "VI"}, {37001, 37998, "VI"},
    {40001, 40349, "VI"},
    {89001, 89998, "Antarctic"},
}};

static const char* regionOf(int index) noexcept {
    for (const auto& b : kBlocks)
        if (b.lo <= index && index <= b.hi) return b.region;
    return nullptr;
}

// im: 1–4 metres, 5–8 feet; confidence indexed by im % 4
static constexpr std::array<const char*, 4> kConfidence = {"Poor", "Excellent", "Good", "Fair"};

static Observation textObs(std::string raw, std::string text) {
    Observation o;
    o.raw       = std::move(raw);
    o.available = true;
    o.text      = std::move(text);
    return o;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

static void decodeStationType(const std::string& g, DecodeContext& ctx) {
    if (g != "AAXX" && g != "BBXX" && g != "OOXX")
        throw DecodeError(fmt::format("{} is not a valid station type", g));
    ctx.station_type = g;
    ctx.report.set(Field::StationType, textObs(g, g));
}

static void decodeCallsign(const std::string& g, DecodeContext& ctx, const FieldCodec& fc) {
    // A1bwnbnbnb: five-digit buoy number whose first two digits locate it
    if (g.size() == 5 && parseCode(g)) {
        try {
            Observation region = fc.table("0161", std::string_view(g).substr(0, 2));
            ctx.region = *region.text;
            ctx.report.set(Field::Region, std::move(region));
        } catch (const InvalidCode&) {
            // Not a buoy number: kept below as an ordinary callsign
        }
    }

    bool alnum = g.size() >= 3;
    for (char c : g)
        if (!std::isalnum(static_cast<unsigned char>(c))) alnum = false;
    if (!alnum)
        throw DecodeError(fmt::format("{} is not a valid callsign", g));

    std::string upper = g;
    for (char& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    ctx.report.set(Field::Callsign, textObs(g, upper));
}

static void decodeTime(const std::string& g, DecodeContext& ctx) {
    if (g.size() != 5)
        throw DecodeError(fmt::format("{} is not a valid YYGGiw group", g));

    const auto day  = parseCode(std::string_view(g).substr(0, 2));
    const auto hour = parseCode(std::string_view(g).substr(2, 2));
    if (!day || *day < 1 || *day > 31)
        throw DecodeError(fmt::format("{} is not a valid day of month", g.substr(0, 2)));
    if (!hour || *hour > 24)
        throw DecodeError(fmt::format("{} is not a valid observation hour", g.substr(2, 2)));

    Observation time;
    time.raw       = g.substr(0, 4);
    time.available = true;
    Observation d;
    d.raw = g.substr(0, 2); d.available = true; d.value = *day;
    Observation h;
    h.raw = g.substr(2, 2); h.available = true; h.value = *hour; h.unit = "h";
    time.components.push_back({"day", std::move(d)});
    time.components.push_back({"hour", std::move(h)});
    ctx.report.set(Field::ObsTime, std::move(time));
    ctx.obs_hour = *hour;

    const char iw = g[4];
    Observation wind;
    wind.raw = std::string(1, iw);
    if (iw != '/') {
        if (iw != '0' && iw != '1' && iw != '3' && iw != '4')
            throw DecodeError(fmt::format("{} is not a valid wind indicator", iw));
        const int code = iw - '0';
        wind.available = true;
        wind.value     = code;
        wind.code      = code;
        wind.unit      = code < 2 ? "m/s" : "KT";
        wind.flags["estimated"] = code == 0 || code == 3;
        ctx.wind_unit = wind.unit;
    }
    ctx.report.set(Field::WindIndicator, std::move(wind));
}

static void decodeStationId(const std::string& g, DecodeContext& ctx) {
    const auto index = g.size() == 5 ? parseCode(g) : std::nullopt;
    if (!index)
        throw DecodeError(fmt::format("{} is not a valid station index", g));
    const char* region = regionOf(*index);
    if (!region)
        throw DecodeError(fmt::format("station index {} belongs to no WMO region", g));

    ctx.report.set(Field::StationId, textObs(g, g));
    ctx.region = region;
    ctx.report.set(Field::Region, textObs(g.substr(0, 2), region));
}

static Observation coordinate(std::string_view raw, int limit, const char* what) {
    Observation o;
    o.raw  = std::string(raw);
    o.unit = "deg";
    if (isMissing(raw)) return o;
    const auto v = parseCode(raw);
    if (!v || *v > limit)
        throw DecodeError(fmt::format("{} is not a valid {}", raw, what));
    o.available = true;
    o.value     = *v / 10.0;
    return o;
}

static void decodePosition(GroupReader& in, DecodeContext& ctx) {
    const std::string la = in.next();
    const std::string lo = in.next();
    if (la.size() != 5 || la.compare(0, 2, "99") != 0)
        throw DecodeError(fmt::format("{} is not a valid 99LaLaLa group", la));
    if (lo.size() != 5)
        throw DecodeError(fmt::format("{} is not a valid QcLoLoLoLo group", lo));

    Observation lat = coordinate(std::string_view(la).substr(2), 900, "latitude");
    Observation lon = coordinate(std::string_view(lo).substr(1), 1800, "longitude");

    const char qc = lo[0];
    if (qc != '/' && qc != '1' && qc != '3' && qc != '5' && qc != '7')
        throw DecodeError(fmt::format("{} is not a valid quadrant of the globe", qc));
    if (lat.available && (qc == '3' || qc == '5')) lat.value = -*lat.value;
    if (lon.available && (qc == '5' || qc == '7')) lon.value = -*lon.value;

    Observation pos;
    pos.raw = la + " " + lo;
    pos.components.push_back({"latitude", lat});
    pos.components.push_back({"longitude", lon});

    if (ctx.station_type == "OOXX") {
        const std::string mm   = in.next();
        const std::string elev = in.next();
        if (mm.size() != 5 || elev.size() != 5)
            throw DecodeError(fmt::format("{} {} are not valid OOXX position groups", mm, elev));
        pos.raw += " " + mm + " " + elev;

        Observation square;
        square.raw = mm.substr(0, 3);
        if (!isMissing(square.raw)) {
            const auto m = parseCode(square.raw);
            if (!m || *m < 1 || (*m > 623 && *m < 901) || *m > 936)
                throw DecodeError(fmt::format("{} is not a valid Marsden square", square.raw));
            square.available = true;
            square.value     = *m;

            const auto unitDigit = [](const Observation& c) {
                return static_cast<int>(std::fabs(*c.value)) % 10;
            };
            const auto ula = parseCode(std::string_view(mm).substr(3, 1));
            const auto ulo = parseCode(std::string_view(mm).substr(4, 1));
            if ((lat.available && ula && *ula != unitDigit(lat)) ||
                (lon.available && ulo && *ulo != unitDigit(lon)))
                ctx.warn(fmt::format("Marsden square group {} disagrees with position {}", mm, lo));
        }
        pos.components.push_back({"marsden_square", std::move(square)});

        const char im = elev[4];
        Observation height;
        height.raw = elev.substr(0, 4);
        Observation confidence;
        confidence.raw = std::string(1, im);
        if (im != '/') {
            if (im < '1' || im > '8')
                throw DecodeError(fmt::format("{} is not a valid elevation indicator", im));
            const int code = im - '0';
            confidence.available = true;
            confidence.text      = kConfidence[code % 4];
            confidence.code      = code;
            height.unit          = code <= 4 ? "m" : "ft";
        } else {
            height.unit = "m";
        }
        if (!isMissing(height.raw)) {
            const auto h = parseCode(height.raw);
            if (!h) throw DecodeError(fmt::format("{} is not a valid elevation", height.raw));
            height.available = true;
            height.value     = *h;
        }
        pos.components.push_back({"elevation", std::move(height)});
        pos.components.push_back({"confidence", std::move(confidence)});
    }

    settle(pos);
    ctx.report.set(Field::StationPosition, std::move(pos));
}

void decodeSection0(GroupReader& in, DecodeContext& ctx, const FieldCodec& fc) {
    try {
        decodeStationType(in.next(), ctx);
        if (ctx.isShip()) decodeCallsign(in.next(), ctx, fc);
        decodeTime(in.next(), ctx);
        if (ctx.isShip())
            decodePosition(in, ctx);
        else
            decodeStationId(in.next(), ctx);
    } catch (const InvalidCode& e) {
        throw DecodeError(e.what());
    } catch (const EndOfGroups&) {
        throw DecodeError("report ends inside section 0");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

static std::string windIndicator(const Observation* w) {
    if (!w || !w->available) return "/";
    if (w->code) return std::to_string(*w->code);
    if (w->unit != "m/s" && w->unit != "KT")
        throw EncodeError(fmt::format("wind indicator unit {} has no code", w->unit));
    const int base = w->unit == "m/s" ? 0 : 3;
    return std::to_string(base + (w->flag("estimated") ? 0 : 1));
}

static std::string tenths(const Observation* c, int width, const char* what) {
    if (!c || !c->available) return slashes(static_cast<size_t>(width));
    return pad(std::lround(std::fabs(valueIn(*c, "deg", what)) * 10.0), width, what);
}

static void encodePosition(GroupWriter& out, const EncodeContext& ctx) {
    const Observation* pos = ctx.report.get(Field::StationPosition);
    const Observation* lat = pos ? pos->component("latitude") : nullptr;
    const Observation* lon = pos ? pos->component("longitude") : nullptr;
    const bool hasLat = lat && lat->available;
    const bool hasLon = lon && lon->available;

    char qc = '/';
    if (hasLat && hasLon) {
        const bool south = std::signbit(valueIn(*lat, "deg", "latitude"));
        const bool west  = std::signbit(valueIn(*lon, "deg", "longitude"));
        qc = south ? (west ? '5' : '3') : (west ? '7' : '1');
    }
    out.put("99", tenths(lat, 3, "latitude"));
    out.put(std::string(1, qc), tenths(lon, 4, "longitude"));

    if (ctx.station_type != "OOXX") return;

    const Observation* square = pos ? pos->component("marsden_square") : nullptr;
    std::string mm = square && square->available
                         ? pad(std::lround(*square->value), 3, "Marsden square")
                         : slashes(3);
    const auto unitDigit = [](const Observation& c, const char* what) {
        return std::to_string(static_cast<long>(std::fabs(valueIn(c, "deg", what))) % 10);
    };
    mm += hasLat ? unitDigit(*lat, "latitude") : "/";
    mm += hasLon ? unitDigit(*lon, "longitude") : "/";
    out.put(mm);

    const Observation* height     = pos ? pos->component("elevation") : nullptr;
    const Observation* confidence = pos ? pos->component("confidence") : nullptr;
    std::string im = "/";
    std::string unit = height && !height->unit.empty() ? height->unit : "m";
    if (confidence && confidence->available) {
        if (confidence->code) {
            im = std::to_string(*confidence->code);
        } else {
            int code = -1;
            for (int i = 0; i < 4; ++i)
                if (confidence->text && *confidence->text == kConfidence[i]) code = i == 0 ? 4 : i;
            if (code < 0)
                throw EncodeError("station position confidence has no code");
            im = std::to_string(code + (unit == "ft" ? 4 : 0));
        }
        unit = im[0] <= '4' ? "m" : "ft";
    }
    std::string hhhh = slashes(4);
    if (height && height->available)
        hhhh = pad(std::lround(valueIn(*height, unit, "elevation")), 4, "elevation");
    out.put(hhhh + im);
}

// Region of a report that carries none: from the station index, or from the
// deployment area of a five-digit buoy number.
static std::string derivedRegion(const EncodeContext& ctx, const FieldCodec& fc) {
    const Field source = ctx.isShip() ? Field::Callsign : Field::StationId;
    const Observation* id = ctx.report.get(source);
    if (!id || !id->text || id->text->size() != 5) return {};
    const auto number = parseCode(*id->text);
    if (!number) return {};
    if (!ctx.isShip()) {
        const char* region = regionOf(*number);
        return region ? region : "";
    }
    try {
        Observation region = fc.table("0161", std::string_view(*id->text).substr(0, 2));
        return region.text.value_or("");
    } catch (const InvalidCode&) {
        return {};
    }
}

void encodeSection0(GroupWriter& out, EncodeContext& ctx, const FieldCodec& fc) {
    const Observation& type = required(ctx.report, Field::StationType);
    ctx.station_type = type.text.value_or("");
    if (ctx.station_type != "AAXX" && ctx.station_type != "BBXX" && ctx.station_type != "OOXX")
        throw EncodeError(fmt::format("{} is not a valid station type", ctx.station_type));
    out.put(ctx.station_type);

    if (ctx.isShip()) {
        const Observation& cs = required(ctx.report, Field::Callsign);
        if (!cs.text || cs.text->empty())
            throw EncodeError("callsign has no text");
        out.put(*cs.text);
    }

    if (const Observation* region = ctx.report.get(Field::Region); region && region->text)
        ctx.region = *region->text;
    else
        ctx.region = derivedRegion(ctx, fc);

    const Observation& time = required(ctx.report, Field::ObsTime);
    const Observation* day  = time.component("day");
    const Observation* hour = time.component("hour");
    if (!day || !day->value || !hour || !hour->value)
        throw EncodeError("observation time needs a day and an hour");
    ctx.obs_hour = static_cast<int>(std::lround(*hour->value));

    const Observation* wind = ctx.report.get(Field::WindIndicator);
    if (wind && wind->available) ctx.wind_unit = wind->unit;
    out.put(pad(std::lround(*day->value), 2, "day") + pad(ctx.obs_hour, 2, "hour") +
            windIndicator(wind));

    if (ctx.isShip()) {
        encodePosition(out, ctx);
    } else {
        const Observation& id = required(ctx.report, Field::StationId);
        if (!id.text || id.text->size() != 5)
            throw EncodeError("station index must have five digits");
        out.put(*id.text);
    }
}

} // namespace synop::detail
