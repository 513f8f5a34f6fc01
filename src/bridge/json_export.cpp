#include "foa_codec/json_bridge.hpp"
#include "foa_codec/decoder.hpp"
#include "foa_codec/errors.hpp"

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace foa {

std::string json_quote(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 2);
  o.push_back('"');
  for (char c : s) {
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(c));
          o += tmp;
        } else {
          o.push_back(c);
        }
        break;
    }
  }
  o.push_back('"');
  return o;
}

static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

bool is_json_number(std::string_view s) noexcept {
  std::size_t i = 0, n = s.size();
  if (i < n && s[i] == '-') ++i;
  if (i >= n) return false;
  if (s[i] == '0') {
    ++i;
  } else if (is_digit(s[i])) {
    while (i < n && is_digit(s[i])) ++i;
  } else {
    return false;
  }
  if (i < n && s[i] == '.') {
    ++i;
    if (i >= n || !is_digit(s[i])) return false;
    while (i < n && is_digit(s[i])) ++i;
  }
  if (i < n && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
    if (i >= n || !is_digit(s[i])) return false;
    while (i < n && is_digit(s[i])) ++i;
  }
  return i == n;
}

namespace {

struct Frame {
  EntityKind kind;   // StartObject or StartArray
  std::size_t line;  // where it was opened
  bool first;
};

class JsonWriter {
public:
  explicit JsonWriter(const JsonExportConfig& cfg) : cfg_(cfg) {}

  bool feed(const Entity& e) {
    switch (e.kind) {
      case EntityKind::StartObject:
      case EntityKind::StartArray:
        if (!begin_member(e)) return false;
        cur_.push_back(e.kind == EntityKind::StartObject ? '{' : '[');
        stack_.push_back(Frame{e.kind, e.line, true});
        return true;

      case EntityKind::EndObject:
      case EntityKind::EndArray: {
        const EntityKind opener = (e.kind == EntityKind::EndObject) ? EntityKind::StartObject
                                                                    : EntityKind::StartArray;
        if (stack_.empty()) return fail(e, std::string("unexpected '") + structural_char(e.kind) + "'");
        if (stack_.back().kind != opener) {
          return fail(e, std::string("'") + structural_char(e.kind) + "' closes '" +
                         structural_char(stack_.back().kind) + "' opened at line " +
                         std::to_string(stack_.back().line));
        }
        stack_.pop_back();
        cur_.push_back(e.kind == EntityKind::EndObject ? '}' : ']');
        if (stack_.empty()) flush_root();
        return true;
      }

      case EntityKind::Data:
        if (!begin_member(e)) return false;
        write_scalar(e.data);
        if (stack_.empty()) flush_root();
        return true;
    }
    return true;
  }

  bool finish(std::ostream& out) {
    if (!stack_.empty()) {
      err_ = std::string("unterminated '") + structural_char(stack_.back().kind) +
             "' opened at line " + std::to_string(stack_.back().line);
      return false;
    }
    if (roots_.size() == 1) {
      out << roots_.front();
    } else {
      out << '[';
      for (std::size_t i = 0; i < roots_.size(); ++i) {
        if (i) out << ',';
        out << roots_[i];
      }
      out << ']';
    }
    out << '\n';
    return true;
  }

  const std::string& error() const { return err_; }

private:
  bool begin_member(const Entity& e) {
    if (stack_.empty()) return true;
    Frame& top = stack_.back();
    if (!top.first) cur_.push_back(',');
    top.first = false;
    if (top.kind == EntityKind::StartObject) {
      if (!e.name) return fail(e, "unnamed member inside object opened at line " + std::to_string(top.line));
      cur_ += json_quote(*e.name);
      cur_.push_back(':');
    }
    return true;
  }

  void write_scalar(const std::string& v) {
    if (cfg_.infer_scalars &&
        (v == "true" || v == "false" || v == "null" || is_json_number(v))) {
      cur_ += v;
    } else {
      cur_ += json_quote(v);
    }
  }

  void flush_root() {
    roots_.push_back(std::move(cur_));
    cur_.clear();
  }

  bool fail(const Entity& e, const std::string& what) {
    err_ = "line " + std::to_string(e.line) + ": " + what;
    return false;
  }

  JsonExportConfig cfg_;
  std::vector<Frame> stack_;
  std::vector<std::string> roots_;
  std::string cur_;
  std::string err_;
};

}

bool foa_to_json(Decoder& dec, std::ostream& out, const JsonExportConfig& cfg, std::string* err_out) {
  JsonWriter w(cfg);
  try {
    Entity e;
    while (dec.next(e)) {
      if (!w.feed(e)) {
        if (err_out) *err_out = w.error();
        return false;
      }
    }
  } catch (const SourceError&) {
    throw;
  } catch (const Error& ex) {
    if (err_out) *err_out = ex.what();
    return false;
  }
  if (!w.finish(out)) {
    if (err_out) *err_out = w.error();
    return false;
  }
  return true;
}

}
