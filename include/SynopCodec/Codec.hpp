#pragma once
// Codec.hpp – Public SYNOP (FM-12) encode / decode API.
//
// Usage example:
//   Codec codec;
//   codec.registerCodeBook(loadSpec("specs/FM12_tables.xml"));
//
//   // Decode a telegram:
//   Report r = codec.decode("AAXX 01004 88889 12782 61506 10094 20047");
//
//   // Access fields:
//   double t = *r.at(Field::AirTemperature).value;   // 9.4 (Cel)
//
//   // Re-encode:
//   std::string text = codec.encode(r);

#include "Types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace synop {

class Codec {
public:
    using WarningHandler = std::function<void(std::string_view)>;

    // Register the code book (loaded from XML via loadSpec()).  Replaces any
    // previously registered one.
    void registerCodeBook(CodeBook book);

    // Return the registered code book (throws if none).
    const CodeBook& codeBook() const;

    // Called once per recoverable problem, in addition to Report::warnings.
    void setWarningHandler(WarningHandler handler);

    // ── Decode ───────────────────────────────────────────────────────────────
    // Decode one whitespace-delimited telegram.  Throws DecodeError for an
    // unparseable Section 0 or out-of-order sections; everything else is
    // recorded in Report::warnings / Report::not_implemented.
    [[nodiscard]] Report decode(std::string_view message, const DecodeOptions& options = {}) const;

    // ── Encode ───────────────────────────────────────────────────────────────
    // Rebuild the telegram text from a report.  Throws EncodeError when a
    // required field is missing or a value has no code.
    [[nodiscard]] std::string encode(const Report& report, const EncodeOptions& options = {}) const;

private:
    std::optional<CodeBook> book_;
    WarningHandler          on_warning_;
};

} // namespace synop
