// Codec.cpp – SYNOP report state machine: section walk on decode, section
// assembly on encode.
//
// Report layout reminder:
//   Section 0   MMMM [D....D] YYGGiw  IIiii | 99LaLaLa QcLoLoLoLo [...]
//   Section 1   iRixhVV Nddff [00fff] 1snTTT 2snTdTdTd 3PoPoPoPo 4PPPP …
//   Section 2   222Dsvs 0snTwTwTw 1PwaPwaHwaHwa …          (sea stations)
//   ICE         ciSibiDizi | free text
//   Section 3   333 0.... 1snTxTxTx … 9SpSpspsp
//   Section 4   444 …                                     (kept verbatim)
//   Section 5   555 …                                     (kept verbatim)
//
// A "NIL" directly after Section 0 ends the report; it is written back only
// when the decoded report carried it.

#include "SynopCodec/Codec.hpp"
#include "FieldCodec.hpp"

#include <fmt/format.h>

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace synop {

using namespace detail;

// ─────────────────────────────────────────────────────────────────────────────
//  Code book registry
// ─────────────────────────────────────────────────────────────────────────────

void Codec::registerCodeBook(CodeBook book) {
    book_ = std::move(book);
}

const CodeBook& Codec::codeBook() const {
    if (!book_)
        throw std::runtime_error("No code book registered");
    return *book_;
}

void Codec::setWarningHandler(WarningHandler handler) {
    on_warning_ = std::move(handler);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

// Position of a section marker in the report; -1 for anything else.
static int markerRank(std::string_view g) noexcept {
    if (g.size() == 5 && g.substr(0, 3) == "222") return 0;
    if (g == "ICE") return 1;
    if (g == "333") return 2;
    if (g == "444") return 3;
    if (g == "555") return 4;
    return -1;
}

static void copyVerbatim(GroupReader& in, std::vector<std::string>& out, bool to_end) {
    while (auto peeked = in.peek()) {
        if (!to_end && isSectionMarker(*peeked, false)) break;
        out.push_back(in.next());
    }
}

Report Codec::decode(std::string_view message, const DecodeOptions& options) const {
    const CodeBook& book = codeBook();
    const FieldCodec fc(book);

    GroupReader in(message);
    Report report;
    DecodeContext ctx{report, on_warning_, options};

    decodeSection0(in, ctx, fc);

    try {
        if (auto peeked = in.peek(); peeked && *peeked == "NIL") {
            in.next();
            report.nil = true;
            while (!in.atEnd())
                ctx.notImplemented(in.next(), "group after NIL");
            return report;
        }

        if (auto peeked = in.peek(); peeked && !isSectionMarker(*peeked, false))
            decodeSection1(in, ctx, fc);

        int last = -1;
        while (!in.atEnd()) {
            const std::string marker = in.next();
            const int rank = markerRank(marker);
            if (rank < 0) {
                ctx.notImplemented(marker, "unexpected group between sections");
                continue;
            }
            if (rank <= last)
                throw DecodeError(fmt::format("section {} out of order", marker.substr(0, 3)));
            last = rank;

            switch (rank) {
            case 0: decodeSection2(marker, in, ctx, fc);          break;
            case 1: decodeSeaLandIce(in, ctx, fc);                break;
            case 2: decodeSection3(in, ctx, fc);                  break;
            case 3: copyVerbatim(in, report.section4, false);     break;
            case 4: copyVerbatim(in, report.section5, true);      break;
            default: break;
            }
        }
    } catch (const EndOfGroups&) {
        ctx.warn("report ends inside a section; remaining fields not decoded");
    }
    return report;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

// First explicit use90 provenance among `candidates`, else the option, else
// the ordinary band.
static bool resolveUse90(std::initializer_list<const Observation*> candidates,
                         const std::optional<bool>& option) {
    for (const Observation* o : candidates) {
        if (!o) continue;
        if (auto it = o->flags.find("use90"); it != o->flags.end()) return it->second;
    }
    return option.value_or(false);
}

std::string Codec::encode(const Report& report, const EncodeOptions& options) const {
    const CodeBook& book = codeBook();
    const FieldCodec fc(book);

    EncodeContext ctx{report, options};

    const Observation* vis_direction = nullptr;
    if (const auto* list = report.list(Field::VisibilityDirection); list && !list->empty())
        vis_direction = list->front().component("visibility");
    ctx.use90_visibility =
        resolveUse90({report.get(Field::Visibility), vis_direction}, options.use90_visibility);

    const Observation* layer_height = nullptr;
    if (const auto* list = report.list(Field::CloudLayer); list && !list->empty())
        layer_height = list->front().component("cloud_height");
    ctx.use90_cloud_height = resolveUse90({layer_height}, options.use90_cloud_height);

    GroupWriter out;
    encodeSection0(out, ctx, fc);
    ctx.time_before = defaultTimeBefore(ctx.obs_hour);

    const size_t after_section0 = out.size();
    if (hasSection1(report)) encodeSection1(out, ctx, fc);
    encodeSection2(out, ctx, fc);
    encodeSection3(out, ctx, fc);

    if (!report.section4.empty()) {
        out.put("444");
        for (const auto& g : report.section4) out.put(g);
    }
    if (!report.section5.empty()) {
        out.put("555");
        for (const auto& g : report.section5) out.put(g);
    }

    if (report.nil && out.size() == after_section0) out.put("NIL");
    return out.str();
}

} // namespace synop
