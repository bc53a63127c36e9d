#pragma once
// GroupStream.hpp – Group-level I/O for SYNOP telegrams.
//
// Telegram layout rules:
//   • Groups are separated by any run of whitespace (spaces, CR, LF).
//   • Most groups are exactly five characters; the station type, callsign
//     and ICE free text are the exceptions.
//   • "/" marks a character whose value was not observed.
//   • Reading is single-pass: one group may be inspected ahead of time but
//     never pushed back.

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace synop {

// Thrown by GroupReader::next() once the telegram is exhausted.  The report
// state machine treats this as "end of report", never as a failure.
class EndOfGroups : public std::out_of_range {
public:
    EndOfGroups() : std::out_of_range("GroupReader: no more groups") {}
};

// ─────────────────────────────────────────────────────────────────────────────
//  GroupReader
// ─────────────────────────────────────────────────────────────────────────────
// Splits a telegram into groups and hands them out left to right.
//
// Example – "AAXX 01004 88889":
//   next() → "AAXX"   peek() → "01004"   next() → "01004"
class GroupReader {
public:
    explicit GroupReader(std::string_view message) {
        size_t i = 0;
        while (i < message.size()) {
            while (i < message.size() && std::isspace(static_cast<unsigned char>(message[i]))) ++i;
            const size_t start = i;
            while (i < message.size() && !std::isspace(static_cast<unsigned char>(message[i]))) ++i;
            if (i > start) groups_.emplace_back(message.substr(start, i - start));
        }
    }

    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= groups_.size(); }

    // ── Fundamental read operations ──────────────────────────────────────────

    // Return the next group and advance.  Throws EndOfGroups when exhausted.
    std::string next() {
        if (atEnd()) throw EndOfGroups{};
        return groups_[pos_++];
    }

    // Look at the next group without consuming it.
    [[nodiscard]] std::optional<std::string_view> peek() const noexcept {
        if (atEnd()) return std::nullopt;
        return std::string_view{groups_[pos_]};
    }

    // Consume the next group only if `accept` returns true for it.
    template <typename Pred>
    std::optional<std::string> nextIf(Pred accept) {
        if (atEnd() || !accept(std::string_view{groups_[pos_]})) return std::nullopt;
        return groups_[pos_++];
    }

private:
    std::vector<std::string> groups_;
    size_t pos_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
//  GroupWriter
// ─────────────────────────────────────────────────────────────────────────────
// Collects encoded groups and joins them with single spaces.
class GroupWriter {
public:
    GroupWriter() = default;

    void put(std::string group) {
        if (group.empty())
            throw std::invalid_argument("GroupWriter: empty group");
        groups_.push_back(std::move(group));
    }

    // Concatenate header and payload into one group.
    void put(std::string_view header, std::string_view payload) {
        put(std::string(header) + std::string(payload));
    }

    // Number of groups written so far
    [[nodiscard]] size_t size() const noexcept { return groups_.size(); }

    [[nodiscard]] std::string str() const {
        std::string out;
        for (const auto& g : groups_) {
            if (!out.empty()) out += ' ';
            out += g;
        }
        return out;
    }

private:
    std::vector<std::string> groups_;
};

} // namespace synop
