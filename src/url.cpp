#include "aircast/url.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace aircast {

namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == '~';
}

void append_escape(std::string &out, unsigned char c) {
    out += '%';
    out += "0123456789ABCDEF"[(c >> 4) & 0xF];
    out += "0123456789ABCDEF"[c & 0xF];
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string url_encode_path(std::string_view text) {
    std::string encoded;
    encoded.reserve(text.size());
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c) || c == '/') {
            encoded += ch;
        } else {
            append_escape(encoded, c);
        }
    }
    return encoded;
}

std::string url_encode_query(std::string_view text) {
    std::string encoded;
    encoded.reserve(text.size());
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (c == ' ') {
            encoded += '+';
        } else if (is_unreserved(c)) {
            encoded += ch;
        } else {
            append_escape(encoded, c);
        }
    }
    return encoded;
}

std::string build_query(const QueryParams &params) {
    std::string query;
    for (const auto &[key, value] : params) {
        if (!query.empty()) query += '&';
        query += url_encode_query(key);
        query += '=';
        query += url_encode_query(value);
    }
    return query;
}

std::string url_decode(std::string_view text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += text[i];
    }
    return decoded;
}

std::string format_decimal(double value) {
    if (!std::isfinite(value)) {
        if (std::isnan(value)) return "nan";
        return value > 0 ? "inf" : "-inf";
    }
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(15) << value;
    std::string text = out.str();
    if (text.find_first_of(".e") == std::string::npos) text += ".0";
    return text;
}

} // namespace aircast
