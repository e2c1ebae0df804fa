#include "slingnet/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace slingnet::json {
namespace {

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {
    // Tolerate a UTF-8 BOM.
    if (s_.size() >= 3 && static_cast<unsigned char>(s_[0]) == 0xEF &&
        static_cast<unsigned char>(s_[1]) == 0xBB && static_cast<unsigned char>(s_[2]) == 0xBF) {
      pos_ = 3;
    }
  }

  Value document() {
    Value v = value(0);
    skip_ws();
    if (pos_ != s_.size()) fail("trailing characters after JSON value");
    return v;
  }

 private:
  static constexpr int kMaxDepth = 256;

  [[noreturn]] void fail(const std::string& msg) const {
    std::ostringstream ss;
    ss << "JSON parse error (line " << line_ << ", col " << col_ << "): " << msg;
    throw std::runtime_error(ss.str());
  }

  bool eof() const { return pos_ >= s_.size(); }
  char peek() const { return eof() ? '\0' : s_[pos_]; }

  char next() {
    if (eof()) fail("unexpected end of input");
    const char c = s_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  void skip_ws() {
    while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) next();
  }

  void expect(char c) {
    skip_ws();
    if (eof() || peek() != c) fail(std::string("expected '") + c + "'");
    next();
  }

  Value value(int depth) {
    if (depth > kMaxDepth) fail("nesting too deep");
    skip_ws();
    switch (peek()) {
      case '{': return object_value(depth);
      case '[': return array_value(depth);
      case '"': return string_value();
      case 't': keyword("true"); return true;
      case 'f': keyword("false"); return false;
      case 'n': keyword("null"); return nullptr;
      default: break;
    }
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number_value();
    if (eof()) fail("unexpected end of input");
    fail(std::string("unexpected character '") + peek() + "'");
  }

  void keyword(const char* word) {
    for (const char* p = word; *p; ++p) {
      if (eof() || peek() != *p) fail(std::string("invalid literal, expected '") + word + "'");
      next();
    }
  }

  void digits() {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected digit");
    while (std::isdigit(static_cast<unsigned char>(peek()))) next();
  }

  Value number_value() {
    const std::size_t start = pos_;
    if (peek() == '-') next();
    if (peek() == '0') {
      next();
    } else {
      digits();
    }
    if (peek() == '.') {
      next();
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      next();
      if (peek() == '+' || peek() == '-') next();
      digits();
    }
    const std::string token = s_.substr(start, pos_ - start);
    char* end = nullptr;
    const double d = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || !std::isfinite(d)) fail("number out of range: " + token);
    return d;
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = next();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("invalid hex digit in \\u escape");
      }
    }
    return code;
  }

  static void put_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string raw_string() {
    expect('"');
    std::string out;
    for (;;) {
      const char c = next();
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = next();
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
          std::uint32_t cp = hex4();
          if (cp >= 0xDC00 && cp <= 0xDFFF) fail("unpaired low surrogate");
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (next() != '\\' || next() != 'u') fail("expected low surrogate");
            const std::uint32_t lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
          }
          put_utf8(cp, out);
          break;
        }
        default: fail(std::string("unknown escape '\\") + e + "'");
      }
    }
  }

  Value string_value() { return raw_string(); }

  Value array_value(int depth) {
    expect('[');
    Array arr;
    skip_ws();
    if (peek() == ']') {
      next();
      return arr;
    }
    for (;;) {
      arr.push_back(value(depth + 1));
      skip_ws();
      if (peek() == ']') {
        next();
        return arr;
      }
      expect(',');
    }
  }

  Value object_value(int depth) {
    expect('{');
    Object obj;
    skip_ws();
    if (peek() == '}') {
      next();
      return obj;
    }
    for (;;) {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = raw_string();
      expect(':');
      obj[std::move(key)] = value(depth + 1);
      skip_ws();
      if (peek() == '}') {
        next();
        return obj;
      }
      expect(',');
    }
  }

  const std::string& s_;
  std::size_t pos_{0};
  int line_{1};
  int col_{1};
};

void write_string(const std::string& in, std::string& out) {
  out.push_back('"');
  for (const char c : in) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

// Shortest representation that parses back to the same double.
void write_number(double d, std::string& out) {
  if (!std::isfinite(d)) {
    out += "null";
    return;
  }
  if (d == std::floor(d) && std::fabs(d) < 9.0e15) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
    out += buf;
    return;
  }
  char buf[40];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    if (std::strtod(buf, nullptr) == d) break;
  }
  out += buf;
}

class Writer {
 public:
  Writer(std::string& out, int indent) : out_(out), indent_(indent > 0 ? indent : 0) {}

  void write(const Value& v, int depth) {
    if (v.is_null()) {
      out_ += "null";
    } else if (const bool* b = v.as_bool()) {
      out_ += *b ? "true" : "false";
    } else if (const double* d = v.as_number()) {
      write_number(*d, out_);
    } else if (const std::string* s = v.as_string()) {
      write_string(*s, out_);
    } else if (const Array* a = v.as_array()) {
      write_array(*a, depth);
    } else {
      write_object(v.object(), depth);
    }
  }

 private:
  void newline(int depth) {
    if (indent_ == 0) return;
    out_.push_back('\n');
    out_.append(static_cast<std::size_t>(depth * indent_), ' ');
  }

  void write_array(const Array& a, int depth) {
    out_.push_back('[');
    for (std::size_t i = 0; i < a.size(); ++i) {
      if (i > 0) out_.push_back(',');
      newline(depth + 1);
      write(a[i], depth + 1);
    }
    if (!a.empty()) newline(depth);
    out_.push_back(']');
  }

  void write_object(const Object& o, int depth) {
    std::vector<const std::string*> keys;
    keys.reserve(o.size());
    for (const auto& kv : o) keys.push_back(&kv.first);
    std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

    out_.push_back('{');
    bool first = true;
    for (const std::string* k : keys) {
      if (!first) out_.push_back(',');
      first = false;
      newline(depth + 1);
      write_string(*k, out_);
      out_.push_back(':');
      if (indent_ > 0) out_.push_back(' ');
      write(o.at(*k), depth + 1);
    }
    if (!keys.empty()) newline(depth);
    out_.push_back('}');
  }

  std::string& out_;
  int indent_;
};

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

Array* Value::as_array() { return std::get_if<Array>(this); }
Object* Value::as_object() { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const Value* v = find(key);
  if (!v) {
    if (!is_object()) throw std::runtime_error("JSON value is not an object (looking up '" + key + "')");
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
  const Object* o = as_object();
  if (!o) return nullptr;
  auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  const bool* p = as_bool();
  return p ? *p : def;
}

double Value::number_value(double def) const {
  const double* p = as_number();
  return p ? *p : def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  const double* p = as_number();
  return p ? static_cast<std::int64_t>(*p) : def;
}

std::string Value::string_value(const std::string& def) const {
  const std::string* p = as_string();
  return p ? *p : def;
}

const Object& Value::object() const {
  const Object* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const Array* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  std::string out;
  Writer(out, indent).write(v, 0);
  return out;
}

Value object(Object o) { return Value(std::move(o)); }
Value array(Array a) { return Value(std::move(a)); }

} // namespace slingnet::json
