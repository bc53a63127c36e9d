// FieldCodec.cpp – Shared field-level decode / encode primitives.

#include "FieldCodec.hpp"
#include "SynopCodec/Conversion.hpp"

#include <fmt/format.h>

#include <cmath>

namespace synop::detail {

// ─── Context ──────────────────────────────────────────────────────────────────

void DecodeContext::warn(std::string msg) {
    if (on_warning) on_warning(msg);
    report.warnings.push_back(std::move(msg));
}

void DecodeContext::notImplemented(std::string_view group, std::string_view why) {
    report.not_implemented.emplace_back(group);
    warn(fmt::format("group {} not decoded: {}", group, why));
}

Observation DecodeContext::timeBefore() const {
    return time_before ? *time_before : defaultTimeBefore(obs_hour);
}

Observation defaultTimeBefore(int obs_hour) {
    Observation o;
    o.available = true;
    o.unit      = "h";
    if (obs_hour >= 0 && obs_hour % 6 == 0)      o.value = 6;
    else if (obs_hour >= 0 && obs_hour % 3 == 0) o.value = 3;
    else if (obs_hour >= 0)                      o.value = 1;
    else                                         o.value = 6;
    return o;
}

bool isSectionMarker(std::string_view g, bool section2_ahead) noexcept {
    return g == "NIL" || g == "ICE" || g == "333" || g == "444" || g == "555" ||
           (section2_ahead && g.size() == 5 && g.substr(0, 3) == "222");
}

void settle(Observation& composite) {
    composite.available = false;
    for (const auto& c : composite.components)
        if (c.obs.available) composite.available = true;
}

double valueIn(const Observation& obs, std::string_view unit, std::string_view desc) {
    if (!obs.value)
        throw EncodeError(fmt::format("{} has no value", desc));
    if (unit.empty() || obs.unit.empty() || obs.unit == unit) return *obs.value;
    try {
        return convert(*obs.value, obs.unit, unit);
    } catch (const ConversionError& e) {
        throw EncodeError(fmt::format("{}: {}", desc, e.what()));
    }
}

const Observation& required(const Report& report, Field f) {
    const Observation* o = report.get(f);
    if (!o) throw EncodeError(fmt::format("required field {} is missing", fieldName(f)));
    return *o;
}

// ─── Decode primitives ────────────────────────────────────────────────────────

const GroupDef* FieldCodec::layout(int section, std::string_view header) const {
    auto s = book_.groups.find(section);
    if (s == book_.groups.end()) return nullptr;
    auto g = s->second.find(header);
    return g == s->second.end() ? nullptr : &g->second;
}

Observation FieldCodec::number(std::string_view raw, double scale, std::string_view unit,
                               std::string_view desc, int lo, int hi) const {
    Observation o;
    o.raw  = std::string(raw);
    o.unit = std::string(unit);
    if (isMissing(raw)) return o;

    const auto code = parseCode(raw);
    if (!code || *code < lo || *code > hi) throw InvalidCode(raw, desc);

    o.available = true;
    // Divide for fractional scales so 94 × 0.1 yields exactly 9.4
    o.value = scale < 1.0 ? *code / std::round(1.0 / scale) : *code * scale;
    return o;
}

Observation FieldCodec::signedTemperature(char sign, std::string_view ttt,
                                          std::string_view desc) const {
    Observation o;
    o.raw  = std::string(1, sign) + std::string(ttt);
    o.unit = "Cel";
    if (sign == '/' || isMissing(ttt)) return o;
    if (sign != '0' && sign != '1') throw InvalidCode(o.raw, desc);

    // A trailing "/" stands for an unreported tenths digit
    std::string digits(ttt);
    if (!digits.empty() && digits.back() == '/') digits.back() = '0';
    const auto v = parseCode(digits);
    if (!v) throw InvalidCode(o.raw, desc);

    o.available = true;
    o.value     = *v / (sign == '0' ? 10.0 : -10.0);
    return o;
}

Observation FieldCodec::decodeLayout(const GroupDef& def, std::string_view group,
                                     const DecodeContext& ctx) const {
    Observation o;
    o.raw = std::string(group);

    size_t pos = def.header.size();
    for (const auto& e : def.elements) {
        const std::string_view slice = group.substr(pos, e.width);
        pos += e.width;

        if (!e.table.empty()) {
            o.components.push_back({e.name, tables_.decode(e.table, slice)});
        } else {
            const std::string unit = e.unit == "wind" ? ctx.wind_unit : e.unit;
            o.components.push_back({e.name, number(slice, e.scale, unit,
                                                   fmt::format("{} {}", def.name, e.name),
                                                   e.min_code.value_or(0),
                                                   e.max_code.value_or(INT_MAX))});
        }
    }
    settle(o);
    return o;
}

// ─── Encode primitives ────────────────────────────────────────────────────────

std::string FieldCodec::table(std::string_view id, const Observation* obs,
                              const TableHints& hints) const {
    if (!obs) return slashes(tables_.width(id));
    return tables_.encode(id, *obs, hints);
}

std::string FieldCodec::number(const Observation* obs, int width, double scale,
                               std::string_view unit, std::string_view desc) const {
    if (!obs || !obs->available) return slashes(static_cast<size_t>(width));
    const double v = valueIn(*obs, unit, desc);
    return pad(std::lround(v / scale), width, desc);
}

std::string FieldCodec::signedTemperature(const Observation* obs, std::string_view desc) const {
    if (!obs || !obs->available) return "////";
    const double v = valueIn(*obs, "Cel", desc);
    return fmt::format("{}{}", std::signbit(v) ? 1 : 0,
                       pad(std::lround(std::fabs(v) * 10.0), 3, desc));
}

std::string FieldCodec::encodeLayout(const GroupDef& def, const Observation& obs,
                                     const EncodeContext& ctx) const {
    std::string out = def.header;
    for (const auto& e : def.elements) {
        const Observation* c = obs.component(e.name);
        if (!e.table.empty()) {
            out += table(e.table, c);
        } else {
            const std::string unit = e.unit == "wind" ? ctx.wind_unit : e.unit;
            out += number(c, e.width, e.scale, unit, fmt::format("{} {}", def.name, e.name));
        }
    }
    return out;
}

} // namespace synop::detail
