#include "preflight/jsonlite.hpp"

// Strict recursive-descent parser and deterministic serializer.
//
// DETERMINISM:
//   - Keys are emitted in std::map order.
//   - format_double() emits the shortest "%.15g"/"%.17g" form that reads back
//     to the same double; integers never pass through double.
//
// The parser refuses NaN/Infinity, duplicate keys and trailing data. \uXXXX
// escapes (including surrogate pairs) are decoded to UTF-8.

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace preflight::jsonlite {

namespace {

void append_utf8(std::string& o, std::uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }
  void fail(const std::string& msg) { if (!err) err = JsonError{"json_parse_error", msg}; }

  bool parse_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) { fail("truncated unicode escape"); return false; }
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else { fail("invalid unicode escape"); return false; }
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) { fail("control character in string"); return {}; }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case '/': o += '/'; break;
        case '\\': o += '\\'; break;
        case '"': o += '"'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!parse_hex4(cp)) return {};
          if (cp >= 0xDC00 && cp <= 0xDFFF) { fail("unpaired low surrogate"); return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (i + 6 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
              fail("unpaired high surrogate");
              return {};
            }
            i += 2;
            std::uint32_t lo = 0;
            if (!parse_hex4(lo)) return {};
            if (lo < 0xDC00 || lo > 0xDFFF) { fail("unpaired high surrogate"); return {}; }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail(std::string("invalid escape \\") + n);
          return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    const size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      fail("NaN/Infinity unsupported");
      return false;
    }
    bool negative = false;
    if (i < s.size() && s[i] == '-') { negative = true; ++i; }
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    if (s[i] == '0' && i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
      fail("leading zero in number");
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) { fail("invalid number format"); return false; }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) { fail("invalid exponent"); return false; }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    if (!is_float) {
      if (negative) {
        const long long n = std::strtoll(num.c_str(), &end, 10);
        if (errno == 0) { out_val = Value{static_cast<std::int64_t>(n)}; return true; }
      } else {
        const unsigned long long n = std::strtoull(num.c_str(), &end, 10);
        if (errno == 0) { out_val = Value{static_cast<std::uint64_t>(n)}; return true; }
      }
      // Out of integer range: keep the magnitude as a double.
      errno = 0;
    }
    const double d = std::strtod(num.c_str(), &end);
    if (errno == ERANGE) { fail("number out of range"); return false; }
    out_val = Value{d};
    return true;
  }

  Value parse_any() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num;
    if (parse_number(num)) return num;
    fail("unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.count(k) != 0) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_any();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_any());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }
};

std::string format_double(double d) {
  char buf[64];
  // Shortest of %.15g / %.17g that reads back to the same double.
  int n = std::snprintf(buf, sizeof(buf), "%.15g", d);
  if (n > 0 && n < static_cast<int>(sizeof(buf)) && std::strtod(buf, nullptr) != d) {
    n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  }
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0";
  std::string out(buf, static_cast<size_t>(n));
  // Keep the literal a JSON float so it parses back as double.
  if (out.find_first_of(".eE") == std::string::npos) out += ".0";
  return out;
}

void newline(std::ostringstream& oss, int indent, int depth) {
  if (indent <= 0) return;
  oss << '\n' << std::string(static_cast<size_t>(indent * depth), ' ');
}

void write_value(std::ostringstream& oss, const Value& v, int indent, int depth) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) { oss << "null"; return; }
  if (std::holds_alternative<bool>(v.v)) { oss << (std::get<bool>(v.v) ? "true" : "false"); return; }
  if (std::holds_alternative<std::string>(v.v)) { oss << '"' << escape(std::get<std::string>(v.v)) << '"'; return; }
  if (std::holds_alternative<std::uint64_t>(v.v)) { oss << std::get<std::uint64_t>(v.v); return; }
  if (std::holds_alternative<std::int64_t>(v.v)) { oss << std::get<std::int64_t>(v.v); return; }
  if (std::holds_alternative<double>(v.v)) { oss << format_double(std::get<double>(v.v)); return; }

  if (std::holds_alternative<Object>(v.v)) {
    const auto& obj = std::get<Object>(v.v);
    if (obj.empty()) { oss << "{}"; return; }
    oss << '{';
    bool first = true;
    for (const auto& [k, vv] : obj) {
      if (!first) oss << ',';
      first = false;
      newline(oss, indent, depth + 1);
      oss << '"' << escape(k) << "\":";
      if (indent > 0) oss << ' ';
      write_value(oss, vv, indent, depth + 1);
    }
    newline(oss, indent, depth);
    oss << '}';
    return;
  }

  const auto& arr = std::get<Array>(v.v);
  if (arr.empty()) { oss << "[]"; return; }
  oss << '[';
  bool first = true;
  for (const auto& vv : arr) {
    if (!first) oss << ',';
    first = false;
    newline(oss, indent, depth + 1);
    write_value(oss, vv, indent, depth + 1);
  }
  newline(oss, indent, depth);
  oss << ']';
}

}  // namespace

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_any();
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  auto v = parse_value(text, &err);
  if (!err && !v.is_object()) err = JsonError{"json_parse_error", "document root is not an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string serialize(const Value& value, int indent) {
  std::ostringstream oss;
  write_value(oss, value, indent, 0);
  return oss.str();
}

std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (const char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

Object* find_object(Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_object()) return nullptr;
  return &std::get<Object>(it->second.v);
}

const Object* find_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_object()) return nullptr;
  return &std::get<Object>(it->second.v);
}

const std::string* find_string(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_string()) return nullptr;
  return &std::get<std::string>(it->second.v);
}

const Array* find_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_array()) return nullptr;
  return &std::get<Array>(it->second.v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = find_string(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_bool()) return def;
  return std::get<bool>(it->second.v);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const auto* arr = find_array(obj, key);
  if (!arr) return out;
  for (const auto& item : *arr) {
    if (item.is_string()) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

}  // namespace preflight::jsonlite
