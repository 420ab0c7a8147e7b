#include "llm_typed.hpp"

#include "logging.hpp"

#include <spdlog/cfg/env.h>

#include <cmath>
#include <sstream>

namespace llm_typed {

// ---------------- Errors ----------------

static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

DuplicateDefinition::DuplicateDefinition(std::string name_)
    : Error("'" + name_ + "' is already defined", "duplicate_definition"), name(std::move(name_)) {}

DuplicateProperty::DuplicateProperty(std::string owner_, std::string name_)
    : Error("class '" + owner_ + "' already has property '" + name_ + "'", "duplicate_property"),
      owner(std::move(owner_)),
      name(std::move(name_)) {}

DuplicateEnumValue::DuplicateEnumValue(std::string owner_, std::string name_)
    : Error("enum '" + owner_ + "' already has value '" + name_ + "'", "duplicate_enum_value"),
      owner(std::move(owner_)),
      name(std::move(name_)) {}

UnsupportedMetadataKey::UnsupportedMetadataKey(std::string key_)
    : Error("unsupported metadata key '" + key_ + "' (expected alias | description)", "unsupported_metadata_key"),
      key(std::move(key_)) {}

UnknownTypeReference::UnknownTypeReference(std::string name_, const std::string& why)
    : Error("unknown type reference '" + name_ + "': " + why, "unknown_type_reference"), name(std::move(name_)) {}

UnresolvedTypeReference::UnresolvedTypeReference(std::vector<std::string> references_)
    : Error("unresolved type references: " + join(references_, "; "), "unresolved_type_reference"),
      references(std::move(references_)) {}

InfiniteRecursion::InfiniteRecursion(std::vector<std::string> cycle_)
    : Error("required fields form an infinite cycle: " + join(cycle_, " -> "), "infinite_recursion"),
      cycle(std::move(cycle_)) {}

UnknownOperation::UnknownOperation(std::string operation_)
    : Error("unknown operation '" + operation_ + "'", "unknown_operation"), operation(std::move(operation_)) {}

UnknownVersion::UnknownVersion(std::string operation_, std::string version_)
    : Error("operation '" + operation_ + "' has no version '" + version_ + "'", "unknown_version"),
      operation(std::move(operation_)),
      version(std::move(version_)) {}

DuplicateVersion::DuplicateVersion(std::string operation_, std::string version_)
    : Error("operation '" + operation_ + "' already has version '" + version_ + "'", "duplicate_version"),
      operation(std::move(operation_)),
      version(std::move(version_)) {}

InvalidArgument::InvalidArgument(std::string operation_, std::string path_, const std::string& message)
    : Error(operation_ + ": " + path_ + ": " + message, "invalid_argument"),
      operation(std::move(operation_)),
      path(std::move(path_)) {}

static std::string describe_unresolved(const std::vector<UnresolvedPath>& unresolved) {
  std::vector<std::string> parts;
  parts.reserve(unresolved.size());
  for (const auto& u : unresolved) parts.push_back(format_path(u.path) + " (" + u.reason + ")");
  return join(parts, ", ");
}

IncompleteValue::IncompleteValue(std::string target_, std::vector<UnresolvedPath> unresolved_)
    : Error("incomplete " + target_ + ": " + describe_unresolved(unresolved_), "incomplete_value"),
      target(std::move(target_)),
      unresolved(std::move(unresolved_)) {}

LimitExceeded::LimitExceeded(size_t size_, size_t max_)
    : Error("decode buffer exceeded max_buffer_bytes (size=" + std::to_string(size_) +
                ", max=" + std::to_string(max_) + ")",
            "limit_exceeded"),
      size(size_),
      max(max_) {}

DecodeFailure::DecodeFailure(std::string target_, std::vector<std::string> paths_, std::string detail_)
    : Error("failed to decode " + target_ + ": " + detail_, "decode_failure"),
      target(std::move(target_)),
      paths(std::move(paths_)),
      detail(std::move(detail_)) {}

ConvergenceViolation::ConvergenceViolation(std::string path_, const std::string& message)
    : std::logic_error("convergence violation at " + format_path(path_) + ": " + message), path(std::move(path_)) {}

// ---------------- Json helpers ----------------

bool Json::is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
bool Json::is_bool() const { return std::holds_alternative<bool>(value); }
bool Json::is_number() const { return std::holds_alternative<double>(value); }
bool Json::is_string() const { return std::holds_alternative<std::string>(value); }
bool Json::is_array() const { return std::holds_alternative<JsonArray>(value); }
bool Json::is_object() const { return std::holds_alternative<JsonObject>(value); }

const bool& Json::as_bool() const { return std::get<bool>(value); }
const double& Json::as_number() const { return std::get<double>(value); }
const std::string& Json::as_string() const { return std::get<std::string>(value); }
const JsonArray& Json::as_array() const { return std::get<JsonArray>(value); }
const JsonObject& Json::as_object() const { return std::get<JsonObject>(value); }

JsonArray& Json::as_array() { return std::get<JsonArray>(value); }
JsonObject& Json::as_object() { return std::get<JsonObject>(value); }

static std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::ostringstream oss;
          oss << "\\u";
          oss.setf(std::ios::hex, std::ios::basefield);
          oss.width(4);
          oss.fill('0');
          oss << (static_cast<int>(static_cast<unsigned char>(c)));
          out += oss.str();
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

std::string dumps_json(const Json& value) {
  if (value.is_null()) return "null";
  if (value.is_bool()) return value.as_bool() ? "true" : "false";
  if (value.is_number()) {
    double n = value.as_number();
    if (std::isfinite(n)) {
      // Prefer integer formatting when exact.
      double intpart;
      if (std::modf(n, &intpart) == 0.0) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(0);
        oss << n;
        return oss.str();
      }
      std::ostringstream oss;
      oss.precision(15);
      oss << n;
      return oss.str();
    }
    return "null";
  }
  if (value.is_string()) return "\"" + json_escape(value.as_string()) + "\"";
  if (value.is_array()) {
    std::string out = "[";
    const auto& arr = value.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",";
      out += dumps_json(arr[i]);
    }
    out += "]";
    return out;
  }
  const auto& obj = value.as_object();
  std::string out = "{";
  bool first = true;
  for (const auto& kv : obj) {
    if (!first) out += ",";
    first = false;
    out += "\"" + json_escape(kv.first) + "\":" + dumps_json(kv.second);
  }
  out += "}";
  return out;
}

// ---------------- Logging ----------------

LoggerPtr get_logger(const std::string& name) {
  if (auto logger = spdlog::get(name)) return logger;

  auto logger = spdlog::default_logger()->clone(name);
  try {
    // Registers the logger and applies any level loaded from SPDLOG_LEVEL.
    spdlog::initialize_logger(logger);
  } catch (const spdlog::spdlog_ex&) {
    // Another thread registered the same name first.
    if (auto existing = spdlog::get(name)) return existing;
    throw;
  }
  return logger;
}

void load_log_levels_from_env() { spdlog::cfg::load_env_levels(); }

// ---------------- Media ----------------

const char* to_string(MediaKind kind) {
  switch (kind) {
    case MediaKind::Image: return "image";
    case MediaKind::Audio: return "audio";
  }
  return "image";
}

Media::Media(MediaKind kind, std::string content, bool is_url, std::optional<std::string> media_type)
    : kind_(kind), content_(std::move(content)), is_url_(is_url), media_type_(std::move(media_type)) {}

Media Media::from_url(MediaKind kind, std::string url, std::optional<std::string> media_type) {
  if (url.empty()) throw Error("media url must not be empty", "media");
  return Media(kind, std::move(url), true, std::move(media_type));
}

Media Media::from_base64(MediaKind kind, std::string base64, std::string media_type) {
  if (base64.empty()) throw Error("media base64 payload must not be empty", "media");
  return Media(kind, std::move(base64), false, std::move(media_type));
}

const std::string& Media::url() const {
  if (!is_url_) throw Error("media is not a url", "media");
  return content_;
}

const std::string& Media::base64() const {
  if (is_url_) throw Error("media is not base64", "media");
  return content_;
}

Json Media::to_json() const {
  JsonObject o;
  o["kind"] = std::string(llm_typed::to_string(kind_));
  o[is_url_ ? "url" : "base64"] = content_;
  if (media_type_) o["media_type"] = *media_type_;
  return Json(std::move(o));
}

Media Media::from_json(const Json& json) {
  if (!json.is_object()) throw Error("media must be an object", "media");
  const auto& o = json.as_object();

  auto str_field = [&](const char* key) -> std::optional<std::string> {
    auto it = o.find(key);
    if (it == o.end() || it->second.is_null()) return std::nullopt;
    if (!it->second.is_string()) throw Error(std::string("media field '") + key + "' must be a string", "media");
    return it->second.as_string();
  };

  auto kind_name = str_field("kind");
  if (!kind_name) throw Error("media is missing 'kind'", "media");
  MediaKind kind;
  if (*kind_name == "image") {
    kind = MediaKind::Image;
  } else if (*kind_name == "audio") {
    kind = MediaKind::Audio;
  } else {
    throw Error("unknown media kind '" + *kind_name + "'", "media");
  }

  auto media_type = str_field("media_type");
  if (auto url = str_field("url")) return from_url(kind, std::move(*url), std::move(media_type));
  if (auto b64 = str_field("base64")) {
    if (!media_type) throw Error("base64 media requires 'media_type'", "media");
    return from_base64(kind, std::move(*b64), std::move(*media_type));
  }
  throw Error("media needs either 'url' or 'base64'", "media");
}

bool Media::operator==(const Media& other) const {
  return kind_ == other.kind_ && is_url_ == other.is_url_ && content_ == other.content_ &&
         media_type_ == other.media_type_;
}

// ---------------- Values ----------------

bool operator==(const EnumMember& a, const EnumMember& b) { return a.enum_name == b.enum_name && a.value == b.value; }
bool operator==(const ValueMap& a, const ValueMap& b) { return a.entries == b.entries; }
bool operator==(const ClassInstance& a, const ClassInstance& b) {
  return a.class_name == b.class_name && a.fields == b.fields;
}
bool operator==(const Value& a, const Value& b) { return a.data == b.data; }

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(data); }
bool Value::is_bool() const { return std::holds_alternative<bool>(data); }
bool Value::is_int() const { return std::holds_alternative<int64_t>(data); }
bool Value::is_float() const { return std::holds_alternative<double>(data); }
bool Value::is_string() const { return std::holds_alternative<std::string>(data); }
bool Value::is_enum() const { return std::holds_alternative<EnumMember>(data); }
bool Value::is_media() const { return std::holds_alternative<Media>(data); }
bool Value::is_list() const { return std::holds_alternative<ValueList>(data); }
bool Value::is_map() const { return std::holds_alternative<ValueMap>(data); }
bool Value::is_class() const { return std::holds_alternative<ClassInstance>(data); }

const bool& Value::as_bool() const { return std::get<bool>(data); }
const int64_t& Value::as_int() const { return std::get<int64_t>(data); }
const double& Value::as_float() const { return std::get<double>(data); }
const std::string& Value::as_string() const { return std::get<std::string>(data); }
const EnumMember& Value::as_enum() const { return std::get<EnumMember>(data); }
const Media& Value::as_media() const { return std::get<Media>(data); }
const ValueList& Value::as_list() const { return std::get<ValueList>(data); }
const ValueMap& Value::as_map() const { return std::get<ValueMap>(data); }
const ClassInstance& Value::as_class() const { return std::get<ClassInstance>(data); }

static const Value* find_entry(const ValueEntries& entries, const std::string& key) {
  for (const auto& kv : entries) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

const Value* Value::get(const std::string& key) const {
  if (is_class()) return find_entry(as_class().fields, key);
  if (is_map()) return find_entry(as_map().entries, key);
  return nullptr;
}

Json to_json(const Value& value) {
  if (value.is_null()) return Json(nullptr);
  if (value.is_bool()) return Json(value.as_bool());
  if (value.is_int()) return Json(value.as_int());
  if (value.is_float()) return Json(value.as_float());
  if (value.is_string()) return Json(value.as_string());
  if (value.is_enum()) return Json(value.as_enum().value);
  if (value.is_media()) return value.as_media().to_json();
  if (value.is_list()) {
    JsonArray arr;
    arr.reserve(value.as_list().size());
    for (const auto& item : value.as_list()) arr.push_back(to_json(item));
    return Json(std::move(arr));
  }
  const ValueEntries& entries = value.is_map() ? value.as_map().entries : value.as_class().fields;
  JsonObject obj;
  for (const auto& kv : entries) obj.emplace(kv.first, to_json(kv.second));
  return Json(std::move(obj));
}

std::string dumps_value(const Value& value) { return dumps_json(to_json(value)); }

}  // namespace llm_typed
