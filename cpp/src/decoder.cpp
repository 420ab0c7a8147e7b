#include "llm_typed.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace llm_typed {

// ---------------- Paths ----------------

std::string format_path(const std::string& path) { return path.empty() ? "<root>" : path; }

static std::string field_path(const std::string& base, const std::string& name) {
  return base.empty() ? name : base + "." + name;
}

static std::string index_path(const std::string& base, size_t idx) { return base + "[" + std::to_string(idx) + "]"; }

static std::string key_path(const std::string& base, const std::string& key) { return base + "[" + key + "]"; }

const char* to_string(DecodeState state) {
  switch (state) {
    case DecodeState::Empty: return "empty";
    case DecodeState::Accumulating: return "accumulating";
    case DecodeState::Finalizing: return "finalizing";
    case DecodeState::Completed: return "completed";
    case DecodeState::Failed: return "failed";
  }
  return "unknown";
}

static LoggerPtr decoder_log() {
  static LoggerPtr log = get_logger("llm_typed.decoder");
  return log;
}

// ---------------- Leaf helpers ----------------

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

// Decimal notation only; strtod alone would also take hex, inf and nan.
static bool looks_numeric(const std::string& t) {
  if (t.empty() || t.find_first_not_of("0123456789+-.eE") != std::string::npos) return false;
  char* end = nullptr;
  errno = 0;
  std::strtod(t.c_str(), &end);
  return errno == 0 && end == t.c_str() + t.size() && t.find_first_of("0123456789") != std::string::npos;
}

static std::optional<double> parse_double(const std::string& t) {
  if (!looks_numeric(t)) return std::nullopt;
  double d = std::strtod(t.c_str(), nullptr);
  if (!std::isfinite(d)) return std::nullopt;
  return d;
}

// Integral text parses exactly; "3.0" and "1e3" are accepted when they are whole numbers.
static std::optional<int64_t> parse_int(const std::string& t, std::string& why) {
  if (!looks_numeric(t)) {
    why = "not a number";
    return std::nullopt;
  }
  if (t.find_first_of(".eE") == std::string::npos) {
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE) {
      why = "out of range for int";
      return std::nullopt;
    }
    if (end != t.c_str() + t.size()) {
      why = "not an integer";
      return std::nullopt;
    }
    return static_cast<int64_t>(n);
  }
  double d = std::strtod(t.c_str(), nullptr);
  if (!std::isfinite(d) || std::floor(d) != d) {
    why = "not an integer";
    return std::nullopt;
  }
  if (d < -9.2233720368547758e18 || d >= 9.2233720368547758e18) {
    why = "out of range for int";
    return std::nullopt;
  }
  return static_cast<int64_t>(d);
}

static bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

static bool contains_word(const std::string& text, const std::string& word) {
  if (word.empty()) return false;
  size_t pos = 0;
  while ((pos = text.find(word, pos)) != std::string::npos) {
    bool left = pos == 0 || !is_word_char(text[pos - 1]);
    size_t after = pos + word.size();
    bool right = after >= text.size() || !is_word_char(text[after]);
    if (left && right) return true;
    ++pos;
  }
  return false;
}

static const char* node_kind(const JsonishNode& n) {
  switch (n.type) {
    case JsonishNode::Type::Null: return "null";
    case JsonishNode::Type::Bool: return "bool";
    case JsonishNode::Type::Number: return "number";
    case JsonishNode::Type::String: return "string";
    case JsonishNode::Type::Array: return "array";
    case JsonishNode::Type::Object: return "object";
  }
  return "value";
}

static bool is_scalar_node(const JsonishNode& n) {
  return n.type != JsonishNode::Type::Array && n.type != JsonishNode::Type::Object;
}

// Class, list, map and media targets are located inside surrounding prose; scalars use the whole text.
static bool needs_candidate(const TypeRef& t) {
  switch (t.kind()) {
    case TypeRef::Kind::Class:
    case TypeRef::Kind::List:
    case TypeRef::Kind::Map:
    case TypeRef::Kind::Media:
      return true;
    case TypeRef::Kind::Optional:
      return needs_candidate(t.inner());
    case TypeRef::Kind::Union:
      return std::any_of(t.args().begin(), t.args().end(), [](const TypeRef& m) { return needs_candidate(m); });
    default:
      return false;
  }
}

// Brackets that can open a value of type `t`.
static std::string candidate_openers(const TypeRef& t, bool wrap_single) {
  switch (t.kind()) {
    case TypeRef::Kind::Class:
    case TypeRef::Kind::Map:
    case TypeRef::Kind::Media:
      return "{";
    case TypeRef::Kind::List:
      return wrap_single ? "[" + candidate_openers(t.inner(), wrap_single) : "[";
    case TypeRef::Kind::Optional:
      return candidate_openers(t.inner(), wrap_single);
    case TypeRef::Kind::Union: {
      std::string out;
      for (const auto& m : t.args()) out += candidate_openers(m, wrap_single);
      return out;
    }
    default:
      return "";
  }
}

// ---------------- Coercion ----------------

namespace {

struct Coercer {
  const SchemaSnapshot& schema;
  const DecoderConfig& config;
  bool final_mode;
  const std::set<std::string>& sticky;
  // Null during a union trial: failures are only counted.
  std::set<std::string>* failed_paths;
  std::vector<LocalFailure>* failures;
  std::vector<UnresolvedPath>* unresolved;
  size_t trial_failures{0};

  std::optional<Value> fail(const std::string& path, const std::string& reason, bool hard = false) {
    if (!failed_paths) {
      ++trial_failures;
      return std::nullopt;
    }
    if (failed_paths->insert(path).second) {
      failures->push_back(LocalFailure{path, reason, hard});
      decoder_log()->debug("local failure at {}: {}", format_path(path), reason);
    }
    return std::nullopt;
  }

  void mark_unresolved(const std::string& path) {
    if (!unresolved) {
      ++trial_failures;
      return;
    }
    std::string reason = "missing";
    if (failures) {
      for (const auto& f : *failures) {
        if (f.path == path) {
          reason = f.reason;
          break;
        }
      }
    }
    unresolved->push_back(UnresolvedPath{path, reason});
  }

  std::optional<Value> coerce(const JsonishNode* node, const TypeRef& type, const std::string& path) {
    if (sticky.count(path)) return std::nullopt;
    if (!node) return std::nullopt;

    switch (type.kind()) {
      case TypeRef::Kind::Optional:
        if (node->type == JsonishNode::Type::Null) {
          if (!node->complete) return std::nullopt;
          return Value(nullptr);
        }
        return coerce(node, type.inner(), path);
      case TypeRef::Kind::Null:
        if (!node->complete) return std::nullopt;
        if (node->type == JsonishNode::Type::Null) return Value(nullptr);
        return fail(path, std::string("expected null, got ") + node_kind(*node));
      case TypeRef::Kind::String:
        return coerce_string(*node, path);
      case TypeRef::Kind::Int:
        return coerce_int(*node, path);
      case TypeRef::Kind::Float:
        return coerce_float(*node, path);
      case TypeRef::Kind::Bool:
        return coerce_bool(*node, path);
      case TypeRef::Kind::Enum:
        return coerce_enum(*node, type.name(), path);
      case TypeRef::Kind::Media:
        return coerce_media(*node, type.media_kind(), path);
      case TypeRef::Kind::Class:
        return coerce_class(*node, type.name(), path);
      case TypeRef::Kind::List:
        return coerce_list(*node, type.inner(), path);
      case TypeRef::Kind::Map:
        return coerce_map(*node, type.key(), type.value(), path);
      case TypeRef::Kind::Union:
        return coerce_union(*node, type, path);
    }
    return std::nullopt;
  }

  std::optional<Value> coerce_string(const JsonishNode& n, const std::string& path) {
    if (!n.complete) return std::nullopt;
    if (n.type == JsonishNode::Type::String) return Value(n.text);
    if ((n.type == JsonishNode::Type::Number || n.type == JsonishNode::Type::Bool) && config.coerce_scalars_to_string) {
      return Value(n.text);
    }
    return fail(path, std::string("expected string, got ") + node_kind(n));
  }

  std::optional<Value> coerce_int(const JsonishNode& n, const std::string& path) {
    if (!n.complete) return std::nullopt;
    bool numeric = n.type == JsonishNode::Type::Number ||
                   (n.type == JsonishNode::Type::String && config.coerce_numeric_strings);
    if (!numeric) return fail(path, std::string("expected int, got ") + node_kind(n));
    std::string why;
    auto v = parse_int(trim(n.text), why);
    if (!v) return fail(path, "expected int: " + why);
    return Value(*v);
  }

  std::optional<Value> coerce_float(const JsonishNode& n, const std::string& path) {
    if (!n.complete) return std::nullopt;
    bool numeric = n.type == JsonishNode::Type::Number ||
                   (n.type == JsonishNode::Type::String && config.coerce_numeric_strings);
    if (!numeric) return fail(path, std::string("expected float, got ") + node_kind(n));
    auto v = parse_double(trim(n.text));
    if (!v) return fail(path, "expected float: not a number");
    return Value(*v);
  }

  std::optional<Value> coerce_bool(const JsonishNode& n, const std::string& path) {
    if (!n.complete) return std::nullopt;
    if (n.type == JsonishNode::Type::Bool) return Value(n.text == "true");
    if (n.type == JsonishNode::Type::String && config.coerce_numeric_strings) {
      std::string t = to_lower(trim(n.text));
      if (t == "true") return Value(true);
      if (t == "false") return Value(false);
    }
    return fail(path, std::string("expected bool, got ") + node_kind(n));
  }

  std::optional<Value> coerce_enum(const JsonishNode& n, const std::string& enum_name, const std::string& path) {
    if (!n.complete) return std::nullopt;
    const EnumDef* def = schema.find_enum(enum_name);
    if (!def) return fail(path, "unknown enum " + enum_name);
    if (!is_scalar_node(n) || n.type == JsonishNode::Type::Null) {
      return fail(path, std::string("expected ") + enum_name + ", got " + node_kind(n));
    }
    std::string why;
    bool ambiguous = false;
    auto member = match_enum(*def, trim(n.text), why, ambiguous);
    if (!member) return fail(path, why, ambiguous);
    return Value(EnumMember{def->name, *member});
  }

  std::optional<std::string> match_enum(const EnumDef& def, const std::string& text, std::string& why,
                                        bool& ambiguous) const {
    if (const EnumValueDef* v = def.find_value(text)) return v->name;
    for (const auto& v : def.values) {
      auto alias = v.alias();
      if (alias && *alias == text) return v.name;
    }

    if (config.case_insensitive_enums) {
      std::string lower = to_lower(text);
      std::vector<std::string> hits;
      for (const auto& v : def.values) {
        auto alias = v.alias();
        if (to_lower(v.name) == lower || (alias && to_lower(*alias) == lower)) hits.push_back(v.name);
      }
      if (hits.size() == 1) return hits[0];
      if (hits.size() > 1) {
        why = "ambiguous " + def.name + " value '" + text + "'";
        ambiguous = true;
        return std::nullopt;
      }
    }

    if (config.enum_phrase_match) {
      std::string hay = config.case_insensitive_enums ? to_lower(text) : text;
      std::vector<std::string> hits;
      for (const auto& v : def.values) {
        std::vector<std::string> words{v.name};
        if (auto alias = v.alias()) words.push_back(*alias);
        for (auto w : words) {
          if (config.case_insensitive_enums) w = to_lower(w);
          if (contains_word(hay, w)) {
            hits.push_back(v.name);
            break;
          }
        }
      }
      if (hits.size() == 1) return hits[0];
    }

    why = "'" + text + "' is not a " + def.name + " value";
    return std::nullopt;
  }

  std::optional<Value> coerce_media(const JsonishNode& n, MediaKind kind, const std::string& path) {
    if (!n.complete) return std::nullopt;
    if (n.type == JsonishNode::Type::Object) {
      auto text_of = [&](const char* key) -> std::optional<std::string> {
        const JsonishNode* f = n.find(key);
        if (!f || f->type != JsonishNode::Type::String) return std::nullopt;
        return f->text;
      };
      auto media_type = text_of("media_type");
      if (auto url = text_of("url")) return Value(Media::from_url(kind, *url, media_type));
      auto data = text_of("base64");
      if (!data) data = text_of("data");
      if (data && media_type) return Value(Media::from_base64(kind, *data, *media_type));
      return fail(path, "malformed media object");
    }
    if (n.type != JsonishNode::Type::String) {
      return fail(path, std::string("expected ") + to_string(kind) + ", got " + node_kind(n));
    }
    std::string s = trim(n.text);
    if (s.rfind("data:", 0) == 0) {
      size_t semi = s.find(";base64,");
      if (semi == std::string::npos || semi <= 5) return fail(path, "malformed data URI");
      return Value(Media::from_base64(kind, s.substr(semi + 8), s.substr(5, semi - 5)));
    }
    if (s.find("://") != std::string::npos) return Value(Media::from_url(kind, s));
    return fail(path, "malformed media reference");
  }

  const JsonishNode* find_field(const JsonishNode& obj, const PropertyDef& prop) const {
    auto alias = prop.alias();
    std::string lname = to_lower(prop.name);
    std::string lalias = alias ? to_lower(*alias) : std::string();
    // Earliest matching key wins so a later duplicate never replaces a resolved field.
    for (const auto& kv : obj.fields) {
      const std::string& key = kv.first;
      if ((alias && key == *alias) || key == prop.name) return &kv.second;
      std::string lkey = to_lower(key);
      if (lkey == lname || (alias && lkey == lalias)) return &kv.second;
    }
    return nullptr;
  }

  std::optional<Value> coerce_class(const JsonishNode& n, const std::string& class_name, const std::string& path) {
    if (n.type != JsonishNode::Type::Object) {
      if (!n.complete) return std::nullopt;
      return fail(path, "expected " + class_name + ", got " + node_kind(n));
    }
    const ClassDef* def = schema.find_class(class_name);
    if (!def) return fail(path, "unknown class " + class_name);

    ClassInstance out;
    out.class_name = def->name;
    for (const auto& prop : def->properties) {
      std::string p = field_path(path, prop.name);
      auto v = coerce(find_field(n, prop), *prop.type, p);
      if (v) {
        out.fields.emplace_back(prop.name, std::move(*v));
      } else if (final_mode && !prop.type->is_optional()) {
        mark_unresolved(p);
      }
    }
    return Value(std::move(out));
  }

  std::optional<Value> coerce_list(const JsonishNode& n, const TypeRef& inner, const std::string& path) {
    if (n.type != JsonishNode::Type::Array) {
      if (!n.complete) return std::nullopt;
      if (!config.wrap_single_into_list) return fail(path, std::string("expected list, got ") + node_kind(n));
      auto v = coerce(&n, inner, index_path(path, 0));
      if (!v) {
        if (final_mode) mark_unresolved(index_path(path, 0));
        return std::nullopt;
      }
      return Value(ValueList{std::move(*v)});
    }

    ValueList out;
    for (size_t i = 0; i < n.items.size(); ++i) {
      const JsonishNode& item = n.items[i];
      std::string p = index_path(path, i);
      if (!final_mode && !item.complete) break;
      auto v = coerce(&item, inner, p);
      if (v) {
        out.push_back(std::move(*v));
        continue;
      }
      if (!final_mode) break;
      if (inner.is_optional()) {
        out.emplace_back(nullptr);
      } else {
        mark_unresolved(p);
      }
    }
    return Value(std::move(out));
  }

  std::optional<Value> coerce_map(const JsonishNode& n, const TypeRef& key_type, const TypeRef& value_type,
                                  const std::string& path) {
    if (n.type != JsonishNode::Type::Object) {
      if (!n.complete) return std::nullopt;
      return fail(path, std::string("expected map, got ") + node_kind(n));
    }
    const EnumDef* key_enum = nullptr;
    if (key_type.kind() == TypeRef::Kind::Enum) key_enum = schema.find_enum(key_type.name());

    ValueMap out;
    std::set<std::string> seen;
    for (const auto& kv : n.fields) {
      std::string p = key_path(path, kv.first);
      if (!final_mode && !kv.second.complete) continue;
      std::string key = kv.first;
      if (key_enum) {
        if (sticky.count(p)) continue;
        std::string why;
        bool ambiguous = false;
        auto member = match_enum(*key_enum, trim(key), why, ambiguous);
        if (!member) {
          fail(p, why, ambiguous);
          continue;
        }
        key = *member;
      }
      if (!seen.insert(key).second) continue;
      auto v = coerce(&kv.second, value_type, p);
      if (v) {
        out.entries.emplace_back(key, std::move(*v));
      } else if (final_mode && !value_type.is_optional()) {
        mark_unresolved(p);
      }
    }
    return Value(std::move(out));
  }

  std::optional<Value> coerce_union(const JsonishNode& n, const TypeRef& type, const std::string& path) {
    if (!n.complete) return std::nullopt;
    for (const auto& member : type.args()) {
      std::vector<UnresolvedPath> trial_unresolved;
      // The node is complete, so members are judged with end-of-input rules.
      Coercer trial{schema, config, true, sticky, nullptr, nullptr, &trial_unresolved};
      auto v = trial.coerce(&n, member, path);
      if (v && trial.trial_failures == 0 && trial_unresolved.empty()) return coerce(&n, member, path);
    }
    return fail(path, "no member of " + type.to_string() + " matches " + node_kind(n));
  }
};

}  // namespace

// ---------------- IncrementalDecoder ----------------

static StreamLocation compute_location_from_buffer(const std::string& buf) {
  StreamLocation loc;
  loc.offset = buf.size();
  int line = 1;
  int col = 1;
  for (char c : buf) {
    if (c == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  loc.line = line;
  loc.col = col;
  return loc;
}

IncrementalDecoder::IncrementalDecoder(std::shared_ptr<const SchemaSnapshot> schema, TypeRef target,
                                       DecoderConfig config)
    : schema_(std::move(schema)), target_(std::move(target)), config_(config) {
  if (!schema_) throw Error("decoder requires a schema snapshot", "invalid_argument");
  auto missing = schema_->missing_references(target_);
  if (!missing.empty()) throw UnresolvedTypeReference(missing);
}

StreamLocation IncrementalDecoder::location() const { return compute_location_from_buffer(buf_); }

std::optional<Value> IncrementalDecoder::feed(const std::string& chunk) {
  if (state_ == DecodeState::Finalizing || state_ == DecodeState::Completed || state_ == DecodeState::Failed) {
    throw StreamClosed(std::string("feed() on a ") + to_string(state_) + " decoder");
  }
  buf_ += chunk;
  if (buf_.empty()) return std::nullopt;
  state_ = DecodeState::Accumulating;

  if (config_.max_buffer_bytes > 0 && buf_.size() > config_.max_buffer_bytes) {
    state_ = DecodeState::Failed;
    throw LimitExceeded(buf_.size(), config_.max_buffer_bytes);
  }

  auto v = decode_buffer(false, nullptr);
  if (!v) return std::nullopt;
  if (last_emitted_ && *last_emitted_ == *v) return std::nullopt;
  last_emitted_ = v;
  decoder_log()->debug("partial {} at offset {}", dumps_value(*v), buf_.size());
  return v;
}

Value IncrementalDecoder::finalize() {
  if (state_ == DecodeState::Finalizing || state_ == DecodeState::Completed || state_ == DecodeState::Failed) {
    throw StreamClosed(std::string("finalize() on a ") + to_string(state_) + " decoder");
  }
  state_ = DecodeState::Finalizing;

  std::vector<UnresolvedPath> unresolved;
  auto v = decode_buffer(true, &unresolved);
  if (!unresolved.empty()) {
    state_ = DecodeState::Failed;
    decoder_log()->debug("{} unresolved path(s) for {}", unresolved.size(), target_.to_string());
    throw IncompleteValue(target_.to_string(), std::move(unresolved));
  }
  state_ = DecodeState::Completed;
  return *v;
}

std::optional<Value> IncrementalDecoder::decode_buffer(bool end_of_input, std::vector<UnresolvedPath>* unresolved) {
  std::optional<JsonishNode> root;
  if (needs_candidate(target_)) {
    if (!candidate_) {
      candidate_ = locate_json_candidate(buf_, config_.repair, candidate_openers(target_, config_.wrap_single_into_list));
    }
    if (candidate_) {
      if (candidate_->from_fence && candidate_->end == std::string::npos) {
        size_t close = buf_.find("```", candidate_->start);
        if (close != std::string::npos) candidate_->end = close;
      }
      bool closed = candidate_->end != std::string::npos;
      std::string body = closed ? buf_.substr(candidate_->start, candidate_->end - candidate_->start)
                                : buf_.substr(candidate_->start);
      root = parse_jsonish_prefix(body, end_of_input || closed, config_.repair);
    } else if (end_of_input) {
      root = parse_jsonish_prefix(trim(buf_), true, config_.repair);
    }
  } else {
    root = parse_jsonish_prefix(trim(buf_), end_of_input, config_.repair);
  }

  Coercer c{*schema_, config_, end_of_input, failed_paths_, &failed_paths_, &failures_, unresolved};
  auto v = c.coerce(root ? &*root : nullptr, target_, "");
  if (!v && end_of_input) {
    if (target_.is_optional() && !failed_paths_.count("")) return Value(nullptr);
    c.mark_unresolved("");
  }
  if (end_of_input) {
    for (const auto& f : failures_) {
      if (!f.hard) continue;
      bool listed = std::any_of(unresolved->begin(), unresolved->end(),
                                [&](const UnresolvedPath& u) { return u.path == f.path; });
      if (!listed) unresolved->push_back(UnresolvedPath{f.path, f.reason});
    }
  }
  return v;
}

}  // namespace llm_typed
