#include "llm_typed.hpp"

#include "logging.hpp"

#include <algorithm>

namespace llm_typed {

static LoggerPtr schema_log() {
  static LoggerPtr log = get_logger("llm_typed.schema");
  return log;
}

// ---------------- TypeRef ----------------

TypeRef TypeRef::string() {
  TypeRef t;
  t.kind_ = Kind::String;
  return t;
}

TypeRef TypeRef::int_() {
  TypeRef t;
  t.kind_ = Kind::Int;
  return t;
}

TypeRef TypeRef::float_() {
  TypeRef t;
  t.kind_ = Kind::Float;
  return t;
}

TypeRef TypeRef::bool_() {
  TypeRef t;
  t.kind_ = Kind::Bool;
  return t;
}

TypeRef TypeRef::null() { return TypeRef(); }

TypeRef TypeRef::media(MediaKind kind) {
  TypeRef t;
  t.kind_ = Kind::Media;
  t.media_kind_ = kind;
  return t;
}

TypeRef TypeRef::class_(std::string name) {
  TypeRef t;
  t.kind_ = Kind::Class;
  t.name_ = std::move(name);
  return t;
}

TypeRef TypeRef::enum_(std::string name) {
  TypeRef t;
  t.kind_ = Kind::Enum;
  t.name_ = std::move(name);
  return t;
}

TypeRef TypeRef::optional_of(TypeRef inner) {
  // T?? is T?
  if (inner.kind_ == Kind::Optional) return inner;
  TypeRef t;
  t.kind_ = Kind::Optional;
  t.args_.push_back(std::move(inner));
  return t;
}

TypeRef TypeRef::list_of(TypeRef inner) {
  TypeRef t;
  t.kind_ = Kind::List;
  t.args_.push_back(std::move(inner));
  return t;
}

TypeRef TypeRef::map_of(TypeRef key, TypeRef value) {
  TypeRef t;
  t.kind_ = Kind::Map;
  t.args_.push_back(std::move(key));
  t.args_.push_back(std::move(value));
  return t;
}

TypeRef TypeRef::union_of(std::vector<TypeRef> members) {
  TypeRef t;
  t.kind_ = Kind::Union;
  t.args_ = std::move(members);
  return t;
}

bool TypeRef::is_optional() const {
  switch (kind_) {
    case Kind::Optional:
    case Kind::Null:
      return true;
    case Kind::Union:
      return std::any_of(args_.begin(), args_.end(), [](const TypeRef& m) { return m.is_optional(); });
    default:
      return false;
  }
}

bool TypeRef::is_primitive() const {
  return kind_ == Kind::String || kind_ == Kind::Int || kind_ == Kind::Float || kind_ == Kind::Bool ||
         kind_ == Kind::Null;
}

std::string TypeRef::to_string() const {
  switch (kind_) {
    case Kind::String: return "string";
    case Kind::Int: return "int";
    case Kind::Float: return "float";
    case Kind::Bool: return "bool";
    case Kind::Null: return "null";
    case Kind::Media: return llm_typed::to_string(media_kind_);
    case Kind::Class:
    case Kind::Enum:
      return name_;
    case Kind::Optional:
    case Kind::List: {
      std::string in = inner().to_string();
      if (inner().kind_ == Kind::Union) in = "(" + in + ")";
      return in + (kind_ == Kind::Optional ? "?" : "[]");
    }
    case Kind::Map:
      return "map<" + key().to_string() + ", " + value().to_string() + ">";
    case Kind::Union: {
      std::string out;
      for (size_t i = 0; i < args_.size(); ++i) {
        if (i) out += " | ";
        out += args_[i].to_string();
      }
      return out;
    }
  }
  return "null";
}

bool TypeRef::operator==(const TypeRef& other) const {
  if (kind_ != other.kind_) return false;
  if (kind_ == Kind::Media && media_kind_ != other.media_kind_) return false;
  return name_ == other.name_ && args_ == other.args_;
}

// ---------------- Definitions ----------------

std::optional<std::string> metadata_get(const Metadata& meta, const std::string& key) {
  for (const auto& kv : meta) {
    if (kv.first == key) return kv.second;
  }
  return std::nullopt;
}

static void metadata_set(Metadata& meta, const std::string& key, std::string value) {
  if (key != "alias" && key != "description") throw UnsupportedMetadataKey(key);
  for (auto& kv : meta) {
    if (kv.first == key) {
      kv.second = std::move(value);
      return;
    }
  }
  meta.emplace_back(key, std::move(value));
}

const PropertyDef* ClassDef::find_property(const std::string& property) const {
  for (const auto& p : properties) {
    if (p.name == property) return &p;
  }
  return nullptr;
}

const EnumValueDef* EnumDef::find_value(const std::string& value) const {
  for (const auto& v : values) {
    if (v.name == value) return &v;
  }
  return nullptr;
}

// ---------------- Builders ----------------

PropertyDef& PropertyBuilder::mutable_def() const {
  return registry_->classes_.at(class_index_).properties.at(property_index_);
}

const PropertyDef& PropertyBuilder::def() const { return mutable_def(); }

PropertyBuilder& PropertyBuilder::type(TypeRef type) {
  registry_->check_type_shape(type);
  mutable_def().type = std::move(type);
  return *this;
}

PropertyBuilder& PropertyBuilder::with_meta(const std::string& key, std::string value) {
  metadata_set(mutable_def().meta, key, std::move(value));
  return *this;
}

ClassDef& ClassBuilder::mutable_def() const { return registry_->classes_.at(class_index_); }

const std::string& ClassBuilder::name() const { return mutable_def().name; }

PropertyBuilder ClassBuilder::property(const std::string& name) {
  ClassDef& cls = mutable_def();
  if (name.empty()) throw Error("property name must not be empty", "invalid_name");
  if (cls.find_property(name)) throw DuplicateProperty(cls.name, name);
  cls.properties.push_back(PropertyDef{name, std::nullopt, {}});
  return PropertyBuilder(registry_, class_index_, cls.properties.size() - 1);
}

PropertyBuilder ClassBuilder::existing_property(const std::string& name) {
  const ClassDef& cls = mutable_def();
  for (size_t i = 0; i < cls.properties.size(); ++i) {
    if (cls.properties[i].name == name) return PropertyBuilder(registry_, class_index_, i);
  }
  throw UnknownTypeReference(cls.name + "." + name, "class has no such property");
}

ClassBuilder& ClassBuilder::with_meta(const std::string& key, std::string value) {
  metadata_set(mutable_def().meta, key, std::move(value));
  return *this;
}

std::vector<std::string> ClassBuilder::property_names() const {
  std::vector<std::string> out;
  for (const auto& p : mutable_def().properties) out.push_back(p.name);
  return out;
}

EnumValueDef& EnumValueBuilder::mutable_def() const {
  return registry_->enums_.at(enum_index_).values.at(value_index_);
}

const EnumValueDef& EnumValueBuilder::def() const { return mutable_def(); }

EnumValueBuilder& EnumValueBuilder::with_meta(const std::string& key, std::string value) {
  metadata_set(mutable_def().meta, key, std::move(value));
  return *this;
}

EnumDef& EnumBuilder::mutable_def() const { return registry_->enums_.at(enum_index_); }

const std::string& EnumBuilder::name() const { return mutable_def().name; }

EnumValueBuilder EnumBuilder::value(const std::string& name) {
  EnumDef& e = mutable_def();
  if (name.empty()) throw Error("enum value name must not be empty", "invalid_name");
  if (e.find_value(name)) throw DuplicateEnumValue(e.name, name);
  e.values.push_back(EnumValueDef{name, {}});
  return EnumValueBuilder(registry_, enum_index_, e.values.size() - 1);
}

EnumBuilder& EnumBuilder::with_meta(const std::string& key, std::string value) {
  metadata_set(mutable_def().meta, key, std::move(value));
  return *this;
}

std::vector<std::string> EnumBuilder::value_names() const {
  std::vector<std::string> out;
  for (const auto& v : mutable_def().values) out.push_back(v.name);
  return out;
}

// ---------------- Registry ----------------

void SchemaRegistry::check_name_free(const std::string& name) const {
  if (name.empty()) throw Error("type name must not be empty", "invalid_name");
  if (has_class(name) || has_enum(name)) throw DuplicateDefinition(name);
}

void SchemaRegistry::check_type_shape(const TypeRef& type) const {
  switch (type.kind()) {
    case TypeRef::Kind::Class:
      if (type.name().empty()) throw UnknownTypeReference("", "class reference without a name");
      if (has_enum(type.name())) throw UnknownTypeReference(type.name(), "defined as an enum, not a class");
      return;
    case TypeRef::Kind::Enum:
      if (type.name().empty()) throw UnknownTypeReference("", "enum reference without a name");
      if (has_class(type.name())) throw UnknownTypeReference(type.name(), "defined as a class, not an enum");
      return;
    case TypeRef::Kind::Map:
      if (type.key().kind() != TypeRef::Kind::String && type.key().kind() != TypeRef::Kind::Enum) {
        throw UnknownTypeReference(type.to_string(), "map keys must be string or an enum");
      }
      break;
    case TypeRef::Kind::Union:
      if (type.args().empty()) throw UnknownTypeReference("union", "a union needs at least one member");
      break;
    default:
      break;
  }
  for (const auto& arg : type.args()) check_type_shape(arg);
}

ClassBuilder SchemaRegistry::define_class(const std::string& name) {
  check_name_free(name);
  classes_.push_back(ClassDef{name, {}, {}});
  class_index_[name] = classes_.size() - 1;
  return ClassBuilder(this, classes_.size() - 1);
}

ClassBuilder SchemaRegistry::extend_class(const std::string& name) {
  auto it = class_index_.find(name);
  if (it == class_index_.end()) throw UnknownTypeReference(name, "no class with this name");
  return ClassBuilder(this, it->second);
}

EnumBuilder SchemaRegistry::define_enum(const std::string& name) {
  check_name_free(name);
  enums_.push_back(EnumDef{name, {}, {}});
  enum_index_[name] = enums_.size() - 1;
  return EnumBuilder(this, enums_.size() - 1);
}

EnumBuilder SchemaRegistry::extend_enum(const std::string& name) {
  auto it = enum_index_.find(name);
  if (it == enum_index_.end()) throw UnknownTypeReference(name, "no enum with this name");
  return EnumBuilder(this, it->second);
}

// Classes a value of `type` cannot exist without. Optionals, unions and collections end recursion.
static void required_class_deps(const TypeRef& type, std::vector<std::string>& out) {
  if (type.kind() == TypeRef::Kind::Class) out.push_back(type.name());
}

static bool find_cycle_from(const std::string& cls, const std::map<std::string, std::vector<std::string>>& graph,
                            std::map<std::string, int>& color, std::vector<std::string>& stack,
                            std::vector<std::string>& cycle) {
  color[cls] = 1;
  stack.push_back(cls);
  auto it = graph.find(cls);
  if (it != graph.end()) {
    for (const auto& dep : it->second) {
      int c = color[dep];
      if (c == 1) {
        auto start = std::find(stack.begin(), stack.end(), dep);
        cycle.assign(start, stack.end());
        cycle.push_back(dep);
        return true;
      }
      if (c == 0 && find_cycle_from(dep, graph, color, stack, cycle)) return true;
    }
  }
  stack.pop_back();
  color[cls] = 2;
  return false;
}

std::shared_ptr<const SchemaSnapshot> SchemaRegistry::snapshot() const {
  std::vector<std::string> dangling;
  std::map<std::string, std::vector<std::string>> graph;

  // Draft snapshot used only for reference lookups.
  SchemaSnapshot draft(SchemaSnapshot::Key{}, classes_, enums_);
  for (const auto& cls : classes_) {
    auto& deps = graph[cls.name];
    for (const auto& prop : cls.properties) {
      if (!prop.type) {
        dangling.push_back(cls.name + "." + prop.name + ": type not set");
        continue;
      }
      for (const auto& missing : draft.missing_references(*prop.type)) {
        dangling.push_back(cls.name + "." + prop.name + ": " + missing);
      }
      required_class_deps(*prop.type, deps);
    }
  }
  if (!dangling.empty()) throw UnresolvedTypeReference(std::move(dangling));

  std::map<std::string, int> color;
  for (const auto& cls : classes_) {
    if (color[cls.name] != 0) continue;
    std::vector<std::string> stack;
    std::vector<std::string> cycle;
    if (find_cycle_from(cls.name, graph, color, stack, cycle)) throw InfiniteRecursion(std::move(cycle));
  }

  schema_log()->debug("schema snapshot: {} classes, {} enums", classes_.size(), enums_.size());
  return std::make_shared<const SchemaSnapshot>(SchemaSnapshot::Key{}, classes_, enums_);
}

// ---------------- Snapshot ----------------

SchemaSnapshot::SchemaSnapshot(Key, std::vector<ClassDef> classes, std::vector<EnumDef> enums)
    : classes_(std::move(classes)), enums_(std::move(enums)) {
  for (size_t i = 0; i < classes_.size(); ++i) class_index_[classes_[i].name] = i;
  for (size_t i = 0; i < enums_.size(); ++i) enum_index_[enums_[i].name] = i;
}

const ClassDef* SchemaSnapshot::find_class(const std::string& name) const {
  auto it = class_index_.find(name);
  return it == class_index_.end() ? nullptr : &classes_[it->second];
}

const EnumDef* SchemaSnapshot::find_enum(const std::string& name) const {
  auto it = enum_index_.find(name);
  return it == enum_index_.end() ? nullptr : &enums_[it->second];
}

std::vector<std::string> SchemaSnapshot::missing_references(const TypeRef& type) const {
  std::vector<std::string> out;
  if (type.kind() == TypeRef::Kind::Class && !find_class(type.name())) out.push_back(type.name());
  if (type.kind() == TypeRef::Kind::Enum && !find_enum(type.name())) out.push_back(type.name());
  for (const auto& arg : type.args()) {
    for (auto& m : missing_references(arg)) out.push_back(std::move(m));
  }
  return out;
}

// ---------------- Description ----------------

static std::string render_meta(const Metadata& meta) {
  if (meta.empty()) return "";
  std::string out = " (";
  for (size_t i = 0; i < meta.size(); ++i) {
    if (i) out += ", ";
    out += meta[i].first + "='" + meta[i].second + "'";
  }
  out += ")";
  return out;
}

static std::string describe_schema(const std::vector<ClassDef>& classes, const std::vector<EnumDef>& enums) {
  std::string out = "TypeBuilder(";

  if (!classes.empty()) {
    out += "\n  Classes: [";
    for (size_t i = 0; i < classes.size(); ++i) {
      const auto& cls = classes[i];
      if (i) out += ",";
      out += "\n    " + cls.name + render_meta(cls.meta) + " {";
      if (cls.properties.empty()) {
        out += " }";
        continue;
      }
      for (size_t j = 0; j < cls.properties.size(); ++j) {
        const auto& p = cls.properties[j];
        if (j) out += ",";
        out += "\n      " + p.name + " " + (p.type ? p.type->to_string() : "unset") + render_meta(p.meta);
      }
      out += "\n    }";
    }
    out += "\n  ]";
  }

  if (!enums.empty()) {
    if (!classes.empty()) out += ",";
    out += "\n  Enums: [";
    for (size_t i = 0; i < enums.size(); ++i) {
      const auto& e = enums[i];
      if (i) out += ",";
      out += "\n    " + e.name + render_meta(e.meta) + " {";
      if (e.values.empty()) {
        out += " }";
        continue;
      }
      for (size_t j = 0; j < e.values.size(); ++j) {
        if (j) out += ",";
        out += "\n      " + e.values[j].name + render_meta(e.values[j].meta);
      }
      out += "\n    }";
    }
    out += "\n  ]";
  }

  out += "\n)";
  return out;
}

std::string SchemaRegistry::describe() const { return describe_schema(classes_, enums_); }

std::string SchemaSnapshot::describe() const { return describe_schema(classes_, enums_); }

}  // namespace llm_typed
