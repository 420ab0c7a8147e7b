#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace llm_typed {

// ---------------- Errors ----------------

struct Error : public std::runtime_error {
  std::string kind;
  Error(const std::string& message, std::string kind_) : std::runtime_error(message), kind(std::move(kind_)) {}
};

struct DuplicateDefinition : public Error {
  std::string name;
  explicit DuplicateDefinition(std::string name_);
};

struct DuplicateProperty : public Error {
  std::string owner;
  std::string name;
  DuplicateProperty(std::string owner_, std::string name_);
};

struct DuplicateEnumValue : public Error {
  std::string owner;
  std::string name;
  DuplicateEnumValue(std::string owner_, std::string name_);
};

struct UnsupportedMetadataKey : public Error {
  std::string key;
  explicit UnsupportedMetadataKey(std::string key_);
};

struct UnknownTypeReference : public Error {
  std::string name;
  UnknownTypeReference(std::string name_, const std::string& why);
};

// Raised by snapshot(); `references` holds one "Owner.member: Type" entry per dangling reference.
struct UnresolvedTypeReference : public Error {
  std::vector<std::string> references;
  explicit UnresolvedTypeReference(std::vector<std::string> references_);
};

// A class cycle made only of required fields: no finite value can satisfy it.
struct InfiniteRecursion : public Error {
  std::vector<std::string> cycle;
  explicit InfiniteRecursion(std::vector<std::string> cycle_);
};

struct UnknownOperation : public Error {
  std::string operation;
  explicit UnknownOperation(std::string operation_);
};

struct UnknownVersion : public Error {
  std::string operation;
  std::string version;
  UnknownVersion(std::string operation_, std::string version_);
};

struct DuplicateVersion : public Error {
  std::string operation;
  std::string version;
  DuplicateVersion(std::string operation_, std::string version_);
};

struct InvalidArgument : public Error {
  std::string operation;
  std::string path;
  InvalidArgument(std::string operation_, std::string path_, const std::string& message);
};

struct UnresolvedPath {
  std::string path;
  std::string reason;
};

// Finalization found required leaves that never resolved.
struct IncompleteValue : public Error {
  std::string target;
  std::vector<UnresolvedPath> unresolved;
  IncompleteValue(std::string target_, std::vector<UnresolvedPath> unresolved_);
};

struct LimitExceeded : public Error {
  size_t size;
  size_t max;
  LimitExceeded(size_t size_, size_t max_);
};

// Operation-boundary wrapper for every decode-side failure.
struct DecodeFailure : public Error {
  std::string target;
  std::vector<std::string> paths;
  std::string detail;
  DecodeFailure(std::string target_, std::vector<std::string> paths_, std::string detail_);
};

struct StreamClosed : public Error {
  explicit StreamClosed(const std::string& message) : Error(message, "stream_closed") {}
};

// Internal defect: a partial value retracted or changed a resolved leaf.
struct ConvergenceViolation : public std::logic_error {
  std::string path;
  ConvergenceViolation(std::string path_, const std::string& message);
};

// ---------------- Json ----------------

struct Json;
using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

struct Json {
  using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;
  Value value;

  Json() : value(nullptr) {}
  Json(std::nullptr_t) : value(nullptr) {}
  Json(bool b) : value(b) {}
  Json(double n) : value(n) {}
  Json(int n) : value(static_cast<double>(n)) {}
  Json(int64_t n) : value(static_cast<double>(n)) {}
  Json(std::string s) : value(std::move(s)) {}
  Json(const char* s) : value(std::string(s)) {}
  Json(JsonArray a) : value(std::move(a)) {}
  Json(JsonObject o) : value(std::move(o)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool& as_bool() const;
  const double& as_number() const;
  const std::string& as_string() const;
  const JsonArray& as_array() const;
  const JsonObject& as_object() const;

  JsonArray& as_array();
  JsonObject& as_object();
};

std::string dumps_json(const Json& value);

// ---------------- Logging ----------------

// Applies SPDLOG_LEVEL (e.g. "info,llm_typed.decoder=debug") to the library loggers.
void load_log_levels_from_env();

// ---------------- Media ----------------

enum class MediaKind { Image, Audio };

const char* to_string(MediaKind kind);

// Opaque image/audio reference, either a URL or an inline base64 payload.
class Media {
 public:
  static Media from_url(MediaKind kind, std::string url, std::optional<std::string> media_type = std::nullopt);
  static Media from_base64(MediaKind kind, std::string base64, std::string media_type);
  // Inverse of to_json(); throws Error{kind="media"} on malformed input.
  static Media from_json(const Json& json);

  MediaKind kind() const { return kind_; }
  bool is_url() const { return is_url_; }
  const std::string& url() const;
  const std::string& base64() const;
  const std::optional<std::string>& media_type() const { return media_type_; }

  Json to_json() const;

  bool operator==(const Media& other) const;
  bool operator!=(const Media& other) const { return !(*this == other); }

 private:
  Media(MediaKind kind, std::string content, bool is_url, std::optional<std::string> media_type);

  MediaKind kind_;
  std::string content_;
  bool is_url_;
  std::optional<std::string> media_type_;
};

// ---------------- Types ----------------

class TypeRef {
 public:
  enum class Kind { String, Int, Float, Bool, Null, Media, Class, Enum, Optional, List, Map, Union };

  TypeRef() = default;

  static TypeRef string();
  static TypeRef int_();
  static TypeRef float_();
  static TypeRef bool_();
  static TypeRef null();
  static TypeRef media(MediaKind kind);
  static TypeRef image() { return media(MediaKind::Image); }
  static TypeRef audio() { return media(MediaKind::Audio); }
  static TypeRef class_(std::string name);
  static TypeRef enum_(std::string name);
  static TypeRef optional_of(TypeRef inner);
  static TypeRef list_of(TypeRef inner);
  static TypeRef map_of(TypeRef key, TypeRef value);
  static TypeRef union_of(std::vector<TypeRef> members);

  TypeRef optional() const { return optional_of(*this); }
  TypeRef list() const { return list_of(*this); }

  Kind kind() const { return kind_; }
  const std::string& name() const { return name_; }
  MediaKind media_kind() const { return media_kind_; }
  const std::vector<TypeRef>& args() const { return args_; }
  const TypeRef& inner() const { return args_.at(0); }
  const TypeRef& key() const { return args_.at(0); }
  const TypeRef& value() const { return args_.at(1); }

  // True for T?, null, and unions that admit null.
  bool is_optional() const;
  bool is_primitive() const;

  std::string to_string() const;

  bool operator==(const TypeRef& other) const;
  bool operator!=(const TypeRef& other) const { return !(*this == other); }

 private:
  Kind kind_{Kind::Null};
  std::string name_;
  MediaKind media_kind_{MediaKind::Image};
  std::vector<TypeRef> args_;
};

// ---------------- Schema ----------------

// Ordered key/value pairs; only "alias" and "description" are accepted.
using Metadata = std::vector<std::pair<std::string, std::string>>;

std::optional<std::string> metadata_get(const Metadata& meta, const std::string& key);

struct PropertyDef {
  std::string name;
  std::optional<TypeRef> type;
  Metadata meta;

  std::optional<std::string> alias() const { return metadata_get(meta, "alias"); }
  std::optional<std::string> description() const { return metadata_get(meta, "description"); }
};

struct ClassDef {
  std::string name;
  std::vector<PropertyDef> properties;
  Metadata meta;

  const PropertyDef* find_property(const std::string& property) const;
};

struct EnumValueDef {
  std::string name;
  Metadata meta;

  std::optional<std::string> alias() const { return metadata_get(meta, "alias"); }
  std::optional<std::string> description() const { return metadata_get(meta, "description"); }
};

struct EnumDef {
  std::string name;
  std::vector<EnumValueDef> values;
  Metadata meta;

  const EnumValueDef* find_value(const std::string& value) const;
};

class SchemaRegistry;

class PropertyBuilder {
 public:
  PropertyBuilder& type(TypeRef type);
  PropertyBuilder& with_meta(const std::string& key, std::string value);
  PropertyBuilder& alias(std::string value) { return with_meta("alias", std::move(value)); }
  PropertyBuilder& description(std::string value) { return with_meta("description", std::move(value)); }

  const PropertyDef& def() const;

 private:
  friend class ClassBuilder;
  PropertyBuilder(SchemaRegistry* registry, size_t class_index, size_t property_index)
      : registry_(registry), class_index_(class_index), property_index_(property_index) {}
  PropertyDef& mutable_def() const;

  SchemaRegistry* registry_;
  size_t class_index_;
  size_t property_index_;
};

class ClassBuilder {
 public:
  PropertyBuilder property(const std::string& name);
  // Builder for a property this class already has; UnknownTypeReference otherwise.
  PropertyBuilder existing_property(const std::string& name);
  ClassBuilder& with_meta(const std::string& key, std::string value);
  ClassBuilder& alias(std::string value) { return with_meta("alias", std::move(value)); }
  ClassBuilder& description(std::string value) { return with_meta("description", std::move(value)); }

  const std::string& name() const;
  TypeRef type() const { return TypeRef::class_(name()); }
  std::vector<std::string> property_names() const;

 private:
  friend class SchemaRegistry;
  ClassBuilder(SchemaRegistry* registry, size_t class_index) : registry_(registry), class_index_(class_index) {}
  ClassDef& mutable_def() const;

  SchemaRegistry* registry_;
  size_t class_index_;
};

class EnumValueBuilder {
 public:
  EnumValueBuilder& with_meta(const std::string& key, std::string value);
  EnumValueBuilder& alias(std::string value) { return with_meta("alias", std::move(value)); }
  EnumValueBuilder& description(std::string value) { return with_meta("description", std::move(value)); }

  const EnumValueDef& def() const;

 private:
  friend class EnumBuilder;
  EnumValueBuilder(SchemaRegistry* registry, size_t enum_index, size_t value_index)
      : registry_(registry), enum_index_(enum_index), value_index_(value_index) {}
  EnumValueDef& mutable_def() const;

  SchemaRegistry* registry_;
  size_t enum_index_;
  size_t value_index_;
};

class EnumBuilder {
 public:
  EnumValueBuilder value(const std::string& name);
  EnumBuilder& with_meta(const std::string& key, std::string value);
  EnumBuilder& alias(std::string value) { return with_meta("alias", std::move(value)); }
  EnumBuilder& description(std::string value) { return with_meta("description", std::move(value)); }

  const std::string& name() const;
  TypeRef type() const { return TypeRef::enum_(name()); }
  std::vector<std::string> value_names() const;

 private:
  friend class SchemaRegistry;
  EnumBuilder(SchemaRegistry* registry, size_t enum_index) : registry_(registry), enum_index_(enum_index) {}
  EnumDef& mutable_def() const;

  SchemaRegistry* registry_;
  size_t enum_index_;
};

// Immutable, validated view of a SchemaRegistry. Safe to share across threads.
class SchemaSnapshot {
  struct Key {};

 public:
  // Only SchemaRegistry::snapshot() can name Key.
  SchemaSnapshot(Key, std::vector<ClassDef> classes, std::vector<EnumDef> enums);

  const ClassDef* find_class(const std::string& name) const;
  const EnumDef* find_enum(const std::string& name) const;
  const std::vector<ClassDef>& classes() const { return classes_; }
  const std::vector<EnumDef>& enums() const { return enums_; }

  // Every class/enum name `type` mentions that this snapshot does not define.
  std::vector<std::string> missing_references(const TypeRef& type) const;

  std::string describe() const;

 private:
  friend class SchemaRegistry;

  std::vector<ClassDef> classes_;
  std::vector<EnumDef> enums_;
  std::map<std::string, size_t> class_index_;
  std::map<std::string, size_t> enum_index_;
};

class SchemaRegistry {
 public:
  ClassBuilder define_class(const std::string& name);
  ClassBuilder extend_class(const std::string& name);
  EnumBuilder define_enum(const std::string& name);
  EnumBuilder extend_enum(const std::string& name);

  bool has_class(const std::string& name) const { return class_index_.count(name) != 0; }
  bool has_enum(const std::string& name) const { return enum_index_.count(name) != 0; }

  // Validates every reference and returns a deep copy. Later mutation never affects it.
  std::shared_ptr<const SchemaSnapshot> snapshot() const;

  // Deterministic rendering of the current (possibly incomplete) definitions.
  std::string describe() const;

 private:
  friend class ClassBuilder;
  friend class PropertyBuilder;
  friend class EnumBuilder;
  friend class EnumValueBuilder;

  void check_name_free(const std::string& name) const;
  void check_type_shape(const TypeRef& type) const;

  std::vector<ClassDef> classes_;
  std::vector<EnumDef> enums_;
  std::map<std::string, size_t> class_index_;
  std::map<std::string, size_t> enum_index_;
};

// ---------------- Values ----------------

struct Value;
using ValueList = std::vector<Value>;
using ValueEntries = std::vector<std::pair<std::string, Value>>;

struct EnumMember {
  std::string enum_name;
  std::string value;
};

struct ValueMap {
  ValueEntries entries;
};

// Present fields only, in declaration order.
struct ClassInstance {
  std::string class_name;
  ValueEntries fields;
};

bool operator==(const EnumMember& a, const EnumMember& b);
bool operator==(const ValueMap& a, const ValueMap& b);
bool operator==(const ClassInstance& a, const ClassInstance& b);

struct Value {
  using Data = std::variant<std::nullptr_t, bool, int64_t, double, std::string, EnumMember, Media, ValueList, ValueMap,
                            ClassInstance>;
  Data data;

  Value() : data(nullptr) {}
  Value(std::nullptr_t) : data(nullptr) {}
  Value(bool b) : data(b) {}
  Value(int n) : data(static_cast<int64_t>(n)) {}
  Value(int64_t n) : data(n) {}
  Value(double n) : data(n) {}
  Value(std::string s) : data(std::move(s)) {}
  Value(const char* s) : data(std::string(s)) {}
  Value(EnumMember e) : data(std::move(e)) {}
  Value(Media m) : data(std::move(m)) {}
  Value(ValueList l) : data(std::move(l)) {}
  Value(ValueMap m) : data(std::move(m)) {}
  Value(ClassInstance c) : data(std::move(c)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_int() const;
  bool is_float() const;
  bool is_string() const;
  bool is_enum() const;
  bool is_media() const;
  bool is_list() const;
  bool is_map() const;
  bool is_class() const;

  const bool& as_bool() const;
  const int64_t& as_int() const;
  const double& as_float() const;
  const std::string& as_string() const;
  const EnumMember& as_enum() const;
  const Media& as_media() const;
  const ValueList& as_list() const;
  const ValueMap& as_map() const;
  const ClassInstance& as_class() const;

  // Field of a class instance or entry of a map; nullptr when absent.
  const Value* get(const std::string& key) const;
  bool has(const std::string& key) const { return get(key) != nullptr; }
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Enum members become their value name; class instances become objects.
Json to_json(const Value& value);
std::string dumps_value(const Value& value);

// ---------------- Configuration ----------------

struct RepairConfig {
  bool fix_smart_quotes{true};
  bool strip_json_comments{true};
  bool replace_python_literals{true};
  bool allow_unquoted_keys{true};
  // Unquoted scalar runs such as {status: ACTIVE} or {name: Alice Smith}.
  bool allow_bare_values{true};
  bool allow_single_quotes{true};
  // Prefer the body of a ```json fence over the first brace in the text.
  bool extract_from_fence{true};
};

struct DecoderConfig {
  RepairConfig repair{};
  // 0 disables the limit.
  size_t max_buffer_bytes{0};
  // "42" -> 42 for int/float targets, "true" -> true for bool targets.
  bool coerce_numeric_strings{true};
  // Numbers and booleans accepted for string targets using their raw text.
  bool coerce_scalars_to_string{true};
  bool case_insensitive_enums{true};
  // "I'd say ACTIVE." -> ACTIVE when exactly one value/alias appears as a word.
  bool enum_phrase_match{true};
  // A lone complete value for a list target becomes a one-element list.
  bool wrap_single_into_list{true};
};

// ---------------- JSON-ish prefix parsing ----------------

// Parse tree of a possibly truncated, possibly malformed JSON-ish text.
// `complete` is true once a node can no longer change as more text arrives.
struct JsonishNode {
  enum class Type { Null, Bool, Number, String, Array, Object };
  Type type{Type::Null};
  bool complete{false};
  bool quoted{false};
  std::string text;
  std::vector<JsonishNode> items;
  std::vector<std::pair<std::string, JsonishNode>> fields;

  const JsonishNode* find(const std::string& key) const;
};

struct JsonCandidate {
  size_t start{0};
  // npos while a ```json fence is still open.
  size_t end{std::string::npos};
  bool from_fence{false};
};

// Locates where the structured value starts: a ```json fence body or the first of `openers`.
std::optional<JsonCandidate> locate_json_candidate(const std::string& text, const RepairConfig& repair = RepairConfig{},
                                                  const std::string& openers = "{[");

// Parses the value at the start of `text`. With end_of_input=false, truncated strings, tokens and
// containers stay incomplete; with end_of_input=true they are closed.
std::optional<JsonishNode> parse_jsonish_prefix(const std::string& text, bool end_of_input,
                                                const RepairConfig& repair = RepairConfig{});

// ---------------- Incremental decoding ----------------

enum class DecodeState { Empty, Accumulating, Finalizing, Completed, Failed };

const char* to_string(DecodeState state);

struct LocalFailure {
  std::string path;
  std::string reason;
  // Ambiguous enum tokens fail the decode at finalize even under an optional.
  bool hard{false};
};

struct StreamLocation {
  size_t offset{0};  // byte offset within the accumulated buffer
  int line{1};       // 1-based
  int col{1};        // 1-based
};

std::string format_path(const std::string& path);

class IncrementalDecoder {
 public:
  IncrementalDecoder(std::shared_ptr<const SchemaSnapshot> schema, TypeRef target, DecoderConfig config = DecoderConfig{});

  // Appends a raw increment. Returns a new partial value only when it differs from the previous one.
  std::optional<Value> feed(const std::string& chunk);

  // End-of-input. Throws IncompleteValue when a required leaf never resolved.
  Value finalize();

  DecodeState state() const { return state_; }
  const TypeRef& target() const { return target_; }
  const std::vector<LocalFailure>& local_failures() const { return failures_; }
  const std::optional<Value>& last_partial() const { return last_emitted_; }
  StreamLocation location() const;

 private:
  std::optional<Value> decode_buffer(bool end_of_input, std::vector<UnresolvedPath>* unresolved);

  std::shared_ptr<const SchemaSnapshot> schema_;
  TypeRef target_;
  DecoderConfig config_;
  std::string buf_;
  DecodeState state_{DecodeState::Empty};
  std::optional<JsonCandidate> candidate_;
  std::set<std::string> failed_paths_;
  std::vector<LocalFailure> failures_;
  std::optional<Value> last_emitted_;
};

// ---------------- Convergence ----------------

// Flattens a value into path -> scalar leaf.
std::map<std::string, Value> collect_leaves(const Value& value);

class ConvergenceTracker {
 public:
  void observe_partial(const Value& partial);
  void observe_final(const Value& final_value);

  size_t partial_count() const { return partials_; }
  bool finalized() const { return finalized_; }

 private:
  void check_retained(const std::map<std::string, Value>& next, const char* stage) const;

  std::map<std::string, Value> last_leaves_;
  size_t partials_{0};
  bool finalized_{false};
};

// One decode with its convergence checks; what the operation registry drives.
class DecodeSession {
 public:
  DecodeSession(std::shared_ptr<const SchemaSnapshot> schema, TypeRef target, DecoderConfig config = DecoderConfig{});

  std::optional<Value> feed(const std::string& chunk);
  Value finalize();

  const IncrementalDecoder& decoder() const { return decoder_; }
  const ConvergenceTracker& tracker() const { return tracker_; }

 private:
  IncrementalDecoder decoder_;
  ConvergenceTracker tracker_;
};

// ---------------- Operations ----------------

// Raw payload producer owned by an external collaborator. nullopt signals end of input.
class PayloadSource {
 public:
  virtual ~PayloadSource() = default;
  virtual std::optional<std::string> next() = 0;
};

class ChunkedPayloadSource : public PayloadSource {
 public:
  explicit ChunkedPayloadSource(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}
  std::optional<std::string> next() override;

 private:
  std::vector<std::string> chunks_;
  size_t pos_{0};
};

using PayloadSourceFactory = std::function<std::unique_ptr<PayloadSource>(const JsonArray& args)>;

struct ImplementationBinding {
  std::string version;
  TypeRef target;
  PayloadSourceFactory open;
};

struct ParameterDef {
  std::string name;
  TypeRef type;
};

struct OperationSpec {
  std::string name;
  std::optional<std::vector<ParameterDef>> params;
  std::vector<ImplementationBinding> bindings;
};

struct StreamEvent {
  bool is_final{false};
  Value value;
};

// Single-use: yields partial values, then exactly one final value, then nothing.
class StreamHandle {
 public:
  StreamHandle(StreamHandle&& other);
  StreamHandle& operator=(StreamHandle&& other);

  std::optional<StreamEvent> next();
  // Drains the stream; returns the final value even if next() already delivered it.
  Value final_value();
  // Stops pulling increments and drops the session. No final value is produced.
  void cancel();

  bool done() const { return done_; }
  const std::string& operation() const { return operation_; }
  const std::string& version() const { return version_; }

 private:
  friend class OperationRegistry;
  StreamHandle(std::string operation, std::string version, std::unique_ptr<PayloadSource> source,
               std::unique_ptr<DecodeSession> session);

  std::string operation_;
  std::string version_;
  std::unique_ptr<PayloadSource> source_;
  std::unique_ptr<DecodeSession> session_;
  std::optional<Value> final_;
  bool done_{false};
  bool cancelled_{false};
};

class OperationRegistry {
 public:
  explicit OperationRegistry(std::shared_ptr<const SchemaSnapshot> schema, DecoderConfig config = DecoderConfig{});

  void define_operation(const std::string& name, std::vector<ParameterDef> params);
  void register_binding(const std::string& operation, const std::string& version, TypeRef target,
                        PayloadSourceFactory open);

  // Explicit version: exact match. Omitted: the first registered binding.
  const ImplementationBinding& resolve(const std::string& operation,
                                       const std::optional<std::string>& version = std::nullopt) const;
  std::vector<std::string> versions(const std::string& operation) const;
  bool has_operation(const std::string& operation) const { return index_.count(operation) != 0; }

  Value call(const std::string& operation, const JsonArray& args,
             const std::optional<std::string>& version = std::nullopt) const;
  StreamHandle stream(const std::string& operation, const JsonArray& args,
                      const std::optional<std::string>& version = std::nullopt) const;

  const SchemaSnapshot& schema() const { return *schema_; }

 private:
  const OperationSpec& find(const std::string& operation) const;
  void check_arguments(const OperationSpec& spec, const JsonArray& args) const;

  std::shared_ptr<const SchemaSnapshot> schema_;
  DecoderConfig config_;
  std::vector<OperationSpec> operations_;
  std::map<std::string, size_t> index_;
};

}  // namespace llm_typed
