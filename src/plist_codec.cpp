#include "aircast/plist_codec.hpp"
#include "aircast/errors.hpp"
#include "aircast/url.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <locale>
#include <sstream>

namespace aircast {

namespace pt = boost::property_tree;

namespace {

const char *const xml_attributes = "<xmlattr>";

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

std::int64_t parse_integer(std::string_view text) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw ParseError("Invalid plist integer: '" + std::string(text) + "'");
    }
    return value;
}

double parse_real(std::string_view text) {
    text = trim(text);
    std::istringstream in{std::string(text)};
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    if (in.fail() || !in.eof()) {
        throw ParseError("Invalid plist real: '" + std::string(text) + "'");
    }
    return value;
}

PlistDict decode_dict(const pt::ptree &node);

PlistValue decode_value(const std::string &tag, const pt::ptree &node) {
    if (tag == "string") return PlistValue(node.data());
    if (tag == "integer") return PlistValue(parse_integer(node.data()));
    if (tag == "real") return PlistValue(parse_real(node.data()));
    if (tag == "true") return PlistValue(true);
    if (tag == "false") return PlistValue(false);
    if (tag == "date" || tag == "data") return PlistValue(std::string(trim(node.data())));
    if (tag == "dict") return PlistValue(decode_dict(node));
    if (tag == "array") {
        PlistArray items;
        for (const auto &[child_tag, child] : node) {
            if (child_tag == xml_attributes) continue;
            items.push_back(decode_value(child_tag, child));
        }
        return PlistValue(std::move(items));
    }
    throw ParseError("Unknown plist element <" + tag + ">");
}

PlistDict decode_dict(const pt::ptree &node) {
    PlistDict dict;
    std::optional<std::string> key;
    for (const auto &[tag, child] : node) {
        if (tag == xml_attributes) continue;
        if (!key) {
            if (tag != "key") throw ParseError("Expected <key> in plist dict, got <" + tag + ">");
            key = child.data();
            continue;
        }
        if (tag == "key") throw ParseError("Plist key '" + *key + "' has no value");
        dict[*key] = decode_value(tag, child);
        key.reset();
    }
    if (key) throw ParseError("Plist key '" + *key + "' has no value");
    return dict;
}

void escape_into(std::string &out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out += c;
        }
    }
}

void encode_value(std::string &out, const PlistValue &value, int depth);

void indent(std::string &out, int depth) {
    out.append(static_cast<size_t>(depth), '\t');
}

void encode_dict(std::string &out, const PlistDict &dict, int depth) {
    if (dict.empty()) {
        out += "<dict/>\n";
        return;
    }
    out += "<dict>\n";
    for (const auto &[key, value] : dict) {
        indent(out, depth + 1);
        out += "<key>";
        escape_into(out, key);
        out += "</key>\n";
        indent(out, depth + 1);
        encode_value(out, value, depth + 1);
    }
    indent(out, depth);
    out += "</dict>\n";
}

void encode_value(std::string &out, const PlistValue &value, int depth) {
    const auto &storage = value.storage();
    if (auto s = std::get_if<std::string>(&storage)) {
        out += "<string>";
        escape_into(out, *s);
        out += "</string>\n";
    } else if (auto i = std::get_if<std::int64_t>(&storage)) {
        out += "<integer>" + std::to_string(*i) + "</integer>\n";
    } else if (auto r = std::get_if<double>(&storage)) {
        out += "<real>" + format_decimal(*r) + "</real>\n";
    } else if (auto b = std::get_if<bool>(&storage)) {
        out += *b ? "<true/>\n" : "<false/>\n";
    } else if (auto a = std::get_if<PlistArray>(&storage)) {
        if (a->empty()) {
            out += "<array/>\n";
            return;
        }
        out += "<array>\n";
        for (const auto &item : *a) {
            indent(out, depth + 1);
            encode_value(out, item, depth + 1);
        }
        indent(out, depth);
        out += "</array>\n";
    } else {
        encode_dict(out, std::get<PlistDict>(storage), depth);
    }
}

[[noreturn]] void wrong_type(const char *wanted) {
    throw ParseError(std::string("Plist value is not a ") + wanted);
}

} // namespace

const std::string &PlistValue::as_string() const {
    if (auto v = std::get_if<std::string>(&value_)) return *v;
    wrong_type("string");
}

std::int64_t PlistValue::as_integer() const {
    if (auto v = std::get_if<std::int64_t>(&value_)) return *v;
    wrong_type("integer");
}

double PlistValue::as_real() const {
    if (auto v = std::get_if<double>(&value_)) return *v;
    if (auto v = std::get_if<std::int64_t>(&value_)) return static_cast<double>(*v);
    wrong_type("real");
}

bool PlistValue::as_bool() const {
    if (auto v = std::get_if<bool>(&value_)) return *v;
    wrong_type("boolean");
}

const PlistArray &PlistValue::as_array() const {
    if (auto v = std::get_if<PlistArray>(&value_)) return *v;
    wrong_type("array");
}

const PlistDict &PlistValue::as_dict() const {
    if (auto v = std::get_if<PlistDict>(&value_)) return *v;
    wrong_type("dict");
}

Parameters parse_parameters(std::string_view text) {
    Parameters params;
    while (!text.empty()) {
        size_t eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view() : text.substr(eol + 1);

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (trim(line).empty()) break;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        params.emplace_back(std::string(trim(line.substr(0, colon))),
                            std::string(trim(line.substr(colon + 1))));
    }
    return params;
}

std::optional<std::string> find_parameter(const Parameters &params, std::string_view key) {
    auto it = std::find_if(params.begin(), params.end(),
                           [&](const auto &kv) { return kv.first == key; });
    if (it == params.end()) return std::nullopt;
    return it->second;
}

PlistDict parse_plist(std::string_view bytes) {
    if (bytes.substr(0, 6) == "bplist") {
        throw UnsupportedOperationError("Binary property lists are not supported");
    }

    pt::ptree doc;
    try {
        std::istringstream in{std::string(bytes)};
        pt::read_xml(in, doc, pt::xml_parser::no_comments);
    } catch (const pt::xml_parser_error &e) {
        throw ParseError(std::string("Malformed plist XML: ") + e.what());
    }

    auto root = doc.get_child_optional("plist");
    if (!root) throw ParseError("Missing <plist> root element");

    const pt::ptree *value = nullptr;
    std::string tag;
    for (const auto &[child_tag, child] : *root) {
        if (child_tag == xml_attributes) continue;
        if (value) throw ParseError("Plist has more than one root value");
        value = &child;
        tag = child_tag;
    }
    if (!value) throw ParseError("Plist is empty");
    if (tag != "dict") throw ParseError("Plist root is <" + tag + ">, expected <dict>");

    return decode_dict(*value);
}

std::string encode_plist(const PlistDict &dict) {
    std::string out =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
        "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
        "<plist version=\"1.0\">\n";
    encode_dict(out, dict, 0);
    out += "</plist>\n";
    return out;
}

std::optional<std::string> find_string(const PlistDict &dict, const std::string &key) {
    auto it = dict.find(key);
    if (it == dict.end() || !it->second.is_string()) return std::nullopt;
    return it->second.as_string();
}

} // namespace aircast
