#include "aerojudge/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace aerojudge::json {
namespace {

// Nesting limit for untrusted documents (participant plans arrive as JSON).
constexpr int kMaxDepth = 256;

struct Parser {
  const std::string& s;
  std::size_t i{0};
  int depth{0};

  char peek() const { return i < s.size() ? s[i] : '\0'; }
  char get() { return i < s.size() ? s[i++] : '\0'; }

  void skip_ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    const std::size_t pos = std::min(i, s.size());
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < pos; ++k) {
      if (s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream ss;
    ss << "JSON parse error at " << pos << " (line " << line << ", col " << col << "): " << msg;
    throw std::runtime_error(ss.str());
  }

  bool consume(char c) {
    skip_ws();
    if (peek() == c) {
      ++i;
      return true;
    }
    return false;
  }

  void expect(char c) {
    skip_ws();
    if (get() != c) fail(std::string("expected '") + c + "'");
  }

  unsigned parse_hex4() {
    if (i + 4 > s.size()) fail("bad unicode escape");
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = get();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code += static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code += static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code += static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad unicode hex");
      }
    }
    return code;
  }

  static void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  Value parse_value() {
    skip_ws();
    const char c = peek();
    if (c == 'n') return parse_literal("null", nullptr);
    if (c == 't') return parse_literal("true", true);
    if (c == 'f') return parse_literal("false", false);
    if (c == '"') return parse_string();
    if (c == '[') return parse_array();
    if (c == '{') return parse_object();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
    fail("unexpected character");
  }

  Value parse_literal(const char* lit, Value v) {
    for (const char* p = lit; *p; ++p) {
      if (get() != *p) fail("invalid literal");
    }
    return v;
  }

  void digits() {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
  }

  Value parse_number() {
    const std::size_t start = i;
    if (peek() == '-') ++i;
    if (peek() == '0') {
      ++i;
    } else {
      digits();
    }
    if (peek() == '.') {
      ++i;
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      digits();
    }
    const std::string num = s.substr(start, i - start);
    try {
      return std::stod(num);
    } catch (const std::out_of_range&) {
      fail("number out of range");
    } catch (const std::invalid_argument&) {
      fail("failed to parse number");
    }
  }

  std::string parse_raw_string() {
    expect('"');
    std::string out;
    for (;;) {
      if (i >= s.size()) fail("unterminated string");
      const char c = get();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = get();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          const unsigned hi = parse_hex4();
          if (hi >= 0xD800 && hi <= 0xDBFF) {
            if (get() != '\\' || get() != 'u') fail("expected low surrogate");
            const unsigned lo = parse_hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            append_utf8(0x10000u + (((hi - 0xD800u) << 10u) | (lo - 0xDC00u)), out);
          } else if (hi >= 0xDC00 && hi <= 0xDFFF) {
            fail("unexpected low surrogate");
          } else {
            append_utf8(hi, out);
          }
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value parse_string() { return parse_raw_string(); }

  void enter() {
    if (++depth > kMaxDepth) fail("nesting too deep");
  }

  Value parse_array() {
    expect('[');
    enter();
    Array arr;
    if (!consume(']')) {
      for (;;) {
        arr.push_back(parse_value());
        if (consume(']')) break;
        expect(',');
      }
    }
    --depth;
    return arr;
  }

  Value parse_object() {
    expect('{');
    enter();
    Object obj;
    if (!consume('}')) {
      for (;;) {
        skip_ws();
        if (peek() != '"') fail("expected string key");
        std::string key = parse_raw_string();
        expect(':');
        obj[std::move(key)] = parse_value();
        if (consume('}')) break;
        expect(',');
      }
    }
    --depth;
    return obj;
  }
};

void write_escaped(const std::string& in, std::ostringstream& out) {
  out << '"';
  for (const char c : in) {
    switch (c) {
      case '"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out << buf;
        } else {
          out << c;
        }
    }
  }
  out << '"';
}

void write_number(double d, std::ostringstream& out) {
  if (!std::isfinite(d)) {
    // JSON has no spelling for inf/nan.
    out << "null";
    return;
  }
  if (std::fabs(d) < 9.0e15 && d == std::floor(d)) {
    out << static_cast<std::int64_t>(d);
    return;
  }
  // 17 significant digits round-trip every double exactly; checkpoints and
  // audit records must reload bit-identical.
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%.17g", d);
  out << buf;
}

void stringify_impl(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto newline_pad = [&](int d) {
    if (indent <= 0) return;
    out << '\n';
    for (int k = 0; k < d * indent; ++k) out << ' ';
  };

  if (v.is_null()) {
    out << "null";
  } else if (const bool* b = v.as_bool()) {
    out << (*b ? "true" : "false");
  } else if (const double* d = v.as_number()) {
    write_number(*d, out);
  } else if (const std::string* str = v.as_string()) {
    write_escaped(*str, out);
  } else if (const Array* a = v.as_array()) {
    out << '[';
    for (std::size_t k = 0; k < a->size(); ++k) {
      newline_pad(depth + 1);
      stringify_impl((*a)[k], out, indent, depth + 1);
      if (k + 1 < a->size()) out << ',';
    }
    if (!a->empty()) newline_pad(depth);
    out << ']';
  } else {
    const Object& o = v.object();
    std::vector<const std::string*> keys;
    keys.reserve(o.size());
    for (const auto& kv : o) keys.push_back(&kv.first);
    std::sort(keys.begin(), keys.end(), [](const std::string* x, const std::string* y) { return *x < *y; });

    out << '{';
    for (std::size_t k = 0; k < keys.size(); ++k) {
      newline_pad(depth + 1);
      write_escaped(*keys[k], out);
      out << ':';
      if (indent > 0) out << ' ';
      stringify_impl(o.at(*keys[k]), out, indent, depth + 1);
      if (k + 1 < keys.size()) out << ',';
    }
    if (!keys.empty()) newline_pad(depth);
    out << '}';
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const Value* v = find(key);
  if (!v) {
    if (!is_object()) throw std::runtime_error("JSON value is not an object");
    throw std::runtime_error("JSON object missing key: " + key);
  }
  return *v;
}

const Value& Value::at(std::size_t index) const {
  const Array& a = array();
  if (index >= a.size()) throw std::runtime_error("JSON array index out of range");
  return a[index];
}

const Value* Value::find(const std::string& key) const {
  const auto* o = as_object();
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  if (const auto* p = as_bool()) return *p;
  return def;
}

double Value::number_value(double def) const {
  if (const auto* p = as_number()) return *p;
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  if (const auto* p = as_number()) {
    if (!std::isfinite(*p)) return def;
    return static_cast<std::int64_t>(*p);
  }
  return def;
}

std::string Value::string_value(const std::string& def) const {
  if (const auto* p = as_string()) return *p;
  return def;
}

const Object& Value::object() const {
  const auto* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const auto* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) {
  Parser p{text};
  // Tolerate a UTF-8 BOM.
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    p.i = 3;
  }
  Value v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing characters after JSON");
  return v;
}

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  stringify_impl(v, out, indent, 0);
  return out.str();
}

} // namespace aerojudge::json
