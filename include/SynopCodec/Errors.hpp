#pragma once
// Errors.hpp – Exception types raised by the SYNOP codec.

#include <stdexcept>
#include <string>
#include <string_view>

namespace synop {

// Report-fatal decode problem: malformed mandatory group, bad station index…
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Report-fatal encode problem: required field missing or value not encodable.
class EncodeError : public std::runtime_error {
public:
    explicit EncodeError(const std::string& msg)
        : std::runtime_error("encoding error: " + msg) {}
};

// A single code is outside the domain of its table.  Recovered per field.
class InvalidCode : public std::runtime_error {
public:
    InvalidCode(std::string_view code, std::string_view desc)
        : std::runtime_error(std::string(code) + " is not a valid code for " + std::string(desc)),
          code_(code), desc_(desc) {}

    const std::string& code() const noexcept { return code_; }
    const std::string& description() const noexcept { return desc_; }

private:
    std::string code_;
    std::string desc_;
};

} // namespace synop
