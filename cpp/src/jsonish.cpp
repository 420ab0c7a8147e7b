#include "llm_typed.hpp"

#include <cctype>

namespace llm_typed {

// ---------------- JSON-ish prefix parser ----------------

static std::optional<size_t> find_ci(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return 0;
  if (haystack.size() < needle.size()) return std::nullopt;
  for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    bool ok = true;
    for (size_t j = 0; j < needle.size(); ++j) {
      char a = static_cast<char>(std::tolower(static_cast<unsigned char>(haystack[i + j])));
      char b = static_cast<char>(std::tolower(static_cast<unsigned char>(needle[j])));
      if (a != b) {
        ok = false;
        break;
      }
    }
    if (ok) return i;
  }
  return std::nullopt;
}

static std::string fix_smart_quotes(std::string s) {
  // Replace common Unicode “ ” ‘ ’ with ASCII quotes.
  auto rep = [&](const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
      s.replace(pos, from.size(), to);
      pos += to.size();
    }
  };
  rep("\xE2\x80\x9C", "\"");
  rep("\xE2\x80\x9D", "\"");
  rep("\xE2\x80\x98", "'");
  rep("\xE2\x80\x99", "'");
  return s;
}

static void append_utf8(std::string& out, uint32_t cp) {
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

static bool is_number_text(const std::string& t) {
  size_t i = 0;
  if (i < t.size() && (t[i] == '-' || t[i] == '+')) ++i;
  size_t digits = 0;
  while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) {
    ++i;
    ++digits;
  }
  if (i < t.size() && t[i] == '.') {
    ++i;
    while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) {
      ++i;
      ++digits;
    }
  }
  if (digits == 0) return false;
  if (i < t.size() && (t[i] == 'e' || t[i] == 'E')) {
    ++i;
    if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
    size_t exp_digits = 0;
    while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) return false;
  }
  return i == t.size();
}

static std::string trim_copy(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

const JsonishNode* JsonishNode::find(const std::string& key) const {
  for (const auto& kv : fields) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

struct PrefixParser {
  static constexpr int kMaxDepth = 256;

  const std::string& s;
  size_t i{0};
  bool eof{false};
  const RepairConfig& repair;

  PrefixParser(const std::string& in, bool end_of_input, const RepairConfig& repair_)
      : s(in), eof(end_of_input), repair(repair_) {}

  bool at_end() const { return i >= s.size(); }

  void skip_ws() {
    while (i < s.size()) {
      char c = s[i];
      if (std::isspace(static_cast<unsigned char>(c))) {
        ++i;
        continue;
      }
      if (repair.strip_json_comments && c == '/' && i + 1 < s.size()) {
        if (s[i + 1] == '/') {
          size_t nl = s.find('\n', i + 2);
          i = (nl == std::string::npos) ? s.size() : nl + 1;
          continue;
        }
        if (s[i + 1] == '*') {
          size_t close = s.find("*/", i + 2);
          i = (close == std::string::npos) ? s.size() : close + 2;
          continue;
        }
      }
      break;
    }
  }

  bool is_quote(char c) const { return c == '"' || (c == '\'' && repair.allow_single_quotes); }

  std::optional<uint32_t> parse_hex4(size_t at) const {
    if (at + 4 > s.size()) return std::nullopt;
    uint32_t cp = 0;
    for (size_t k = 0; k < 4; ++k) {
      char h = s[at + k];
      cp <<= 4;
      if (h >= '0' && h <= '9') {
        cp |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        cp |= static_cast<uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        cp |= static_cast<uint32_t>(h - 'A' + 10);
      } else {
        return std::nullopt;
      }
    }
    return cp;
  }

  std::optional<JsonishNode> parse_value(int depth, bool in_container) {
    skip_ws();
    if (at_end()) return std::nullopt;
    if (depth > kMaxDepth) {
      i = s.size();
      return std::nullopt;
    }
    char c = s[i];
    if (c == '{') return parse_object(depth);
    if (c == '[') return parse_array(depth);
    if (is_quote(c)) return parse_string();
    return parse_bare(in_container);
  }

  JsonishNode parse_string() {
    JsonishNode node;
    node.type = JsonishNode::Type::String;
    node.quoted = true;
    char q = s[i++];
    while (i < s.size()) {
      char c = s[i++];
      if (c == q) {
        node.complete = true;
        return node;
      }
      if (c != '\\') {
        node.text.push_back(c);
        continue;
      }
      if (i >= s.size()) break;
      char e = s[i++];
      switch (e) {
        case 'b': node.text.push_back('\b'); break;
        case 'f': node.text.push_back('\f'); break;
        case 'n': node.text.push_back('\n'); break;
        case 'r': node.text.push_back('\r'); break;
        case 't': node.text.push_back('\t'); break;
        case 'u': {
          if (i + 4 > s.size()) {
            i = s.size();
            break;
          }
          std::optional<uint32_t> cp = parse_hex4(i);
          if (!cp) {
            node.text += "\\u";
            break;
          }
          i += 4;
          if (*cp >= 0xD800 && *cp <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            std::optional<uint32_t> lo = parse_hex4(i + 2);
            if (lo && *lo >= 0xDC00 && *lo <= 0xDFFF) {
              *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*lo - 0xDC00);
              i += 6;
            }
          }
          append_utf8(node.text, *cp);
          break;
        }
        default:
          // Minimal: keep unknown escapes as-is (covers \" \\ \/ and quote-of-the-other-kind).
          node.text.push_back(e);
      }
    }
    // Ran out of input inside the literal; closing is implied only at end of input.
    node.complete = eof;
    return node;
  }

  std::optional<JsonishNode> parse_bare(bool in_container) {
    size_t start = i;
    bool terminated = false;
    while (i < s.size()) {
      char c = s[i];
      if (in_container && (c == ',' || c == '}' || c == ']' || c == '\n')) {
        terminated = true;
        break;
      }
      // "1 // note" ends the token; "http://host" does not.
      if (repair.strip_json_comments && c == '/' && i + 1 < s.size() && (s[i + 1] == '/' || s[i + 1] == '*') &&
          (i == start || std::isspace(static_cast<unsigned char>(s[i - 1])))) {
        terminated = true;
        break;
      }
      ++i;
    }
    std::string token = trim_copy(s.substr(start, i - start));
    if (token.empty()) return std::nullopt;

    JsonishNode node;
    node.complete = terminated || eof;
    node.text = token;
    if (token == "true" || token == "false") {
      node.type = JsonishNode::Type::Bool;
    } else if (token == "null") {
      node.type = JsonishNode::Type::Null;
    } else if (repair.replace_python_literals && (token == "True" || token == "False")) {
      node.type = JsonishNode::Type::Bool;
      node.text = (token == "True") ? "true" : "false";
    } else if (repair.replace_python_literals && token == "None") {
      node.type = JsonishNode::Type::Null;
      node.text = "null";
    } else if (is_number_text(token)) {
      node.type = JsonishNode::Type::Number;
    } else {
      if (!repair.allow_bare_values) return std::nullopt;
      node.type = JsonishNode::Type::String;
    }
    return node;
  }

  std::optional<std::string> parse_key(bool& truncated) {
    char c = s[i];
    if (is_quote(c)) {
      JsonishNode k = parse_string();
      if (!k.complete) {
        truncated = true;
        return std::nullopt;
      }
      return k.text;
    }
    if (!repair.allow_unquoted_keys) {
      ++i;
      return std::nullopt;
    }
    size_t start = i;
    while (i < s.size()) {
      char k = s[i];
      if (std::isalnum(static_cast<unsigned char>(k)) || k == '_' || k == '$' || k == '-' || k == '.') {
        ++i;
        continue;
      }
      break;
    }
    if (i == start) {
      ++i;  // stray character
      return std::nullopt;
    }
    if (at_end() && !eof) {
      truncated = true;
      return std::nullopt;
    }
    return s.substr(start, i - start);
  }

  JsonishNode parse_object(int depth) {
    JsonishNode node;
    node.type = JsonishNode::Type::Object;
    ++i;  // '{'
    while (true) {
      skip_ws();
      if (at_end()) {
        node.complete = eof;
        return node;
      }
      char c = s[i];
      if (c == '}') {
        ++i;
        node.complete = true;
        return node;
      }
      if (c == ']') {
        // Mismatched bracket closes this object; the enclosing array consumes it.
        node.complete = true;
        return node;
      }
      if (c == ',') {
        ++i;
        continue;
      }

      bool truncated = false;
      std::optional<std::string> key = parse_key(truncated);
      if (truncated) {
        node.complete = eof;
        return node;
      }
      if (!key) continue;

      skip_ws();
      if (at_end()) {
        node.complete = eof;
        return node;
      }
      if (s[i] != ':') continue;
      ++i;

      std::optional<JsonishNode> value = parse_value(depth + 1, true);
      if (!value) {
        if (at_end()) {
          node.complete = eof;
          return node;
        }
        continue;
      }
      bool value_complete = value->complete;
      node.fields.emplace_back(std::move(*key), std::move(*value));
      if (!value_complete) return node;
    }
  }

  JsonishNode parse_array(int depth) {
    JsonishNode node;
    node.type = JsonishNode::Type::Array;
    ++i;  // '['
    while (true) {
      skip_ws();
      if (at_end()) {
        node.complete = eof;
        return node;
      }
      char c = s[i];
      if (c == ']') {
        ++i;
        node.complete = true;
        return node;
      }
      if (c == '}') {
        node.complete = true;
        return node;
      }
      if (c == ',') {
        ++i;
        continue;
      }
      std::optional<JsonishNode> value = parse_value(depth + 1, true);
      if (!value) {
        if (at_end()) {
          node.complete = eof;
          return node;
        }
        continue;
      }
      bool value_complete = value->complete;
      node.items.push_back(std::move(*value));
      if (!value_complete) return node;
    }
  }
};

std::optional<JsonCandidate> locate_json_candidate(const std::string& text, const RepairConfig& repair,
                                                  const std::string& openers) {
  size_t brace = text.find_first_of(openers);

  if (repair.extract_from_fence) {
    auto fence = find_ci(text, "```json");
    if (fence && (brace == std::string::npos || *fence < brace)) {
      size_t body_start = text.find('\n', *fence);
      if (body_start == std::string::npos) return std::nullopt;  // fence header still arriving
      body_start += 1;
      JsonCandidate cand;
      cand.start = body_start;
      cand.from_fence = true;
      size_t close = text.find("```", body_start);
      if (close != std::string::npos) cand.end = close;
      return cand;
    }
    // "```js" may still grow into "```json" before any brace shows up.
    if (brace == std::string::npos) return std::nullopt;
  }

  if (brace == std::string::npos) return std::nullopt;
  JsonCandidate cand;
  cand.start = brace;
  return cand;
}

std::optional<JsonishNode> parse_jsonish_prefix(const std::string& text, bool end_of_input, const RepairConfig& repair) {
  std::string fixed = repair.fix_smart_quotes ? fix_smart_quotes(text) : text;
  PrefixParser p(fixed, end_of_input, repair);
  return p.parse_value(0, false);
}

}  // namespace llm_typed
