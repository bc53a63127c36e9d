#pragma once
// CodeTables.hpp – WMO code table lookup (decode) and reverse lookup (encode).
//
// Two sources of tables are served through one interface:
//   • static tables loaded from the XML code book (TableKind Simple, Lookup,
//     Range, Flags);
//   • algorithmic tables compiled into the library (piecewise visibility and
//     cloud height, precipitation amounts, signed indicators…).
//
// Every decode of an available code records the table id and the integer
// code on the returned Observation so that encode can reproduce it exactly.

#include "Types.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace synop {

// Context an encoder cannot infer from the value alone.
struct TableHints {
    bool use90{false}; // 4377 / 1677: encode into the 90–99 band
};

class CodeTables {
public:
    explicit CodeTables(const CodeBook& book) noexcept : book_(&book) {}

    // True for tables implemented in code rather than loaded from XML.
    [[nodiscard]] static bool isBuiltin(std::string_view id) noexcept;

    // True when `id` can be decoded (built in or present in the code book).
    [[nodiscard]] bool contains(std::string_view id) const noexcept;

    // True when table `id` has no reverse lookup; encode then needs the
    // code recorded on the Observation.
    [[nodiscard]] bool decodeOnly(std::string_view id) const;

    // Number of characters one code of table `id` occupies.
    [[nodiscard]] uint16_t width(std::string_view id) const;

    // Decode `raw` (exactly width(id) characters) through table `id`.
    // All-"/" input yields an unavailable Observation.
    // Throws InvalidCode when the code is outside the table's domain and
    // std::runtime_error when the table is unknown.
    [[nodiscard]] Observation decode(std::string_view id, std::string_view raw) const;

    // Encode an Observation back into width(id) characters.
    // Unavailable observations become "/"-filled; an explicit provenance
    // code is reused as is.  Throws EncodeError when nothing matches or the
    // table is decode-only.
    [[nodiscard]] std::string encode(std::string_view id, const Observation& obs,
                                     const TableHints& hints = {}) const;

private:
    const CodeBook* book_;

    [[nodiscard]] const TableDef& def(std::string_view id) const;
    [[nodiscard]] Observation decodeDef(const TableDef& t, int code, std::string_view raw) const;
    [[nodiscard]] int         encodeDef(const TableDef& t, const Observation& obs) const;
};

// Zero-padded decimal rendering; throws EncodeError when `v` does not fit.
[[nodiscard]] std::string pad(long v, int width, std::string_view what);

// "/" repeated `width` times.
[[nodiscard]] std::string slashes(size_t width);

// True when every character of `raw` is "/".  Empty input counts as missing.
[[nodiscard]] bool isMissing(std::string_view raw) noexcept;

// Parse an all-digit string; std::nullopt on any other character.
[[nodiscard]] std::optional<int> parseCode(std::string_view raw) noexcept;

} // namespace synop
