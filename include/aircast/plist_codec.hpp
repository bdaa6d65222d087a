// plist_codec.hpp
// Decoders for the two body formats a receiver sends back: "key: value" text
// (text/parameters) and XML property lists (text/x-apple-plist+xml).
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace aircast {

class PlistValue;

using PlistArray = std::vector<PlistValue>;
using PlistDict = std::map<std::string, PlistValue>;

// Ordered "key: value" pairs, values left as strings.
using Parameters = std::vector<std::pair<std::string, std::string>>;

class PlistValue {
public:
    using Storage = std::variant<std::string, std::int64_t, double, bool, PlistArray, PlistDict>;

    PlistValue() : value_(std::string()) {}
    PlistValue(std::string v) : value_(std::move(v)) {}
    PlistValue(const char *v) : value_(std::string(v)) {}
    PlistValue(std::int64_t v) : value_(v) {}
    PlistValue(int v) : value_(static_cast<std::int64_t>(v)) {}
    PlistValue(double v) : value_(v) {}
    PlistValue(bool v) : value_(v) {}
    PlistValue(PlistArray v) : value_(std::move(v)) {}
    PlistValue(PlistDict v) : value_(std::move(v)) {}

    bool is_string() const { return std::holds_alternative<std::string>(value_); }
    bool is_integer() const { return std::holds_alternative<std::int64_t>(value_); }
    bool is_real() const { return std::holds_alternative<double>(value_); }
    bool is_bool() const { return std::holds_alternative<bool>(value_); }
    bool is_array() const { return std::holds_alternative<PlistArray>(value_); }
    bool is_dict() const { return std::holds_alternative<PlistDict>(value_); }

    // Throw ParseError when the value holds another type.
    const std::string &as_string() const;
    std::int64_t as_integer() const;
    bool as_bool() const;
    const PlistArray &as_array() const;
    const PlistDict &as_dict() const;

    // Integers widen to double.
    double as_real() const;

    const Storage &storage() const { return value_; }

    bool operator==(const PlistValue &other) const { return value_ == other.value_; }
    bool operator!=(const PlistValue &other) const { return !(*this == other); }

private:
    Storage value_;
};

// Decode a text/parameters body. Lines may end in CRLF or LF.
Parameters parse_parameters(std::string_view text);

// Value of `key` in a parameters body, if present.
std::optional<std::string> find_parameter(const Parameters &params, std::string_view key);

// Decode an XML property list whose root is a dict. Throws ParseError on
// malformed input and UnsupportedOperationError for binary plists.
PlistDict parse_plist(std::string_view bytes);

// Encode `dict` as an XML property list document.
std::string encode_plist(const PlistDict &dict);

// String value of `key` if present and a string.
std::optional<std::string> find_string(const PlistDict &dict, const std::string &key);

} // namespace aircast
