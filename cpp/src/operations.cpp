#include "llm_typed.hpp"

#include "logging.hpp"

#include <cmath>

namespace llm_typed {

static LoggerPtr ops_log() {
  static LoggerPtr log = get_logger("llm_typed.ops");
  return log;
}

// ---------------- Argument checking ----------------

static void check_json(const std::string& op, const SchemaSnapshot& schema, const Json& arg, const TypeRef& type,
                       const std::string& path) {
  auto reject = [&](const std::string& what) { throw InvalidArgument(op, path, "expected " + what); };

  switch (type.kind()) {
    case TypeRef::Kind::String:
      if (!arg.is_string()) reject("string");
      return;
    case TypeRef::Kind::Int:
      if (!arg.is_number() || std::floor(arg.as_number()) != arg.as_number()) reject("int");
      return;
    case TypeRef::Kind::Float:
      if (!arg.is_number()) reject("float");
      return;
    case TypeRef::Kind::Bool:
      if (!arg.is_bool()) reject("bool");
      return;
    case TypeRef::Kind::Null:
      if (!arg.is_null()) reject("null");
      return;
    case TypeRef::Kind::Optional:
      if (!arg.is_null()) check_json(op, schema, arg, type.inner(), path);
      return;
    case TypeRef::Kind::Media: {
      if (!arg.is_object()) reject(to_string(type.media_kind()));
      const auto& o = arg.as_object();
      auto has_string = [&](const char* key) {
        auto it = o.find(key);
        return it != o.end() && it->second.is_string();
      };
      if (!has_string("url") && !(has_string("base64") && has_string("media_type"))) {
        reject(std::string(to_string(type.media_kind())) + " with 'url' or 'base64' and 'media_type'");
      }
      return;
    }
    case TypeRef::Kind::Enum: {
      if (!arg.is_string()) reject(type.name());
      const EnumDef* def = schema.find_enum(type.name());
      if (!def || !def->find_value(arg.as_string())) reject(type.name() + " value, got '" + arg.as_string() + "'");
      return;
    }
    case TypeRef::Kind::Class: {
      if (!arg.is_object()) reject(type.name());
      const ClassDef* def = schema.find_class(type.name());
      if (!def) reject(type.name());
      const auto& o = arg.as_object();
      for (const auto& prop : def->properties) {
        auto it = o.find(prop.name);
        if (it == o.end()) {
          auto alias = prop.alias();
          if (alias) it = o.find(*alias);
        }
        std::string p = path + "." + prop.name;
        if (it == o.end()) {
          if (!prop.type->is_optional()) throw InvalidArgument(op, p, "missing required field");
          continue;
        }
        check_json(op, schema, it->second, *prop.type, p);
      }
      return;
    }
    case TypeRef::Kind::List: {
      if (!arg.is_array()) reject("list");
      const auto& a = arg.as_array();
      for (size_t i = 0; i < a.size(); ++i) {
        check_json(op, schema, a[i], type.inner(), path + "[" + std::to_string(i) + "]");
      }
      return;
    }
    case TypeRef::Kind::Map: {
      if (!arg.is_object()) reject("map");
      const EnumDef* key_enum = nullptr;
      if (type.key().kind() == TypeRef::Kind::Enum) key_enum = schema.find_enum(type.key().name());
      for (const auto& kv : arg.as_object()) {
        std::string p = path + "[" + kv.first + "]";
        if (key_enum && !key_enum->find_value(kv.first)) {
          throw InvalidArgument(op, p, "key is not a " + key_enum->name + " value");
        }
        check_json(op, schema, kv.second, type.value(), p);
      }
      return;
    }
    case TypeRef::Kind::Union: {
      for (const auto& member : type.args()) {
        try {
          check_json(op, schema, arg, member, path);
          return;
        } catch (const InvalidArgument&) {
          // try the next member
        }
      }
      reject(type.to_string());
      return;
    }
  }
}

// ---------------- Payload sources ----------------

std::optional<std::string> ChunkedPayloadSource::next() {
  if (pos_ >= chunks_.size()) return std::nullopt;
  return chunks_[pos_++];
}

// Runs one decode step, turning decode-side failures into DecodeFailure.
template <typename Fn>
static auto decode_step(const std::string& operation, const TypeRef& target, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const IncompleteValue& e) {
    std::vector<std::string> paths;
    paths.reserve(e.unresolved.size());
    for (const auto& u : e.unresolved) paths.push_back(u.path);
    ops_log()->warn("{}: {}", operation, e.what());
    throw DecodeFailure(target.to_string(), std::move(paths), e.what());
  } catch (const LimitExceeded& e) {
    ops_log()->warn("{}: {}", operation, e.what());
    throw DecodeFailure(target.to_string(), {}, e.what());
  }
}

// ---------------- StreamHandle ----------------

StreamHandle::StreamHandle(std::string operation, std::string version, std::unique_ptr<PayloadSource> source,
                           std::unique_ptr<DecodeSession> session)
    : operation_(std::move(operation)),
      version_(std::move(version)),
      source_(std::move(source)),
      session_(std::move(session)) {}

StreamHandle::StreamHandle(StreamHandle&& other)
    : operation_(std::move(other.operation_)),
      version_(std::move(other.version_)),
      source_(std::move(other.source_)),
      session_(std::move(other.session_)),
      final_(std::move(other.final_)),
      done_(other.done_),
      cancelled_(other.cancelled_) {
  // The moved-from handle yields nothing.
  other.done_ = true;
}

StreamHandle& StreamHandle::operator=(StreamHandle&& other) {
  if (this == &other) return *this;
  operation_ = std::move(other.operation_);
  version_ = std::move(other.version_);
  source_ = std::move(other.source_);
  session_ = std::move(other.session_);
  final_ = std::move(other.final_);
  done_ = other.done_;
  cancelled_ = other.cancelled_;
  other.done_ = true;
  return *this;
}

std::optional<StreamEvent> StreamHandle::next() {
  if (done_) return std::nullopt;

  const TypeRef target = session_->decoder().target();
  while (true) {
    auto chunk = source_->next();
    if (!chunk) break;
    std::optional<Value> partial;
    try {
      partial = decode_step(operation_, target, [&] { return session_->feed(*chunk); });
    } catch (...) {
      done_ = true;
      session_.reset();
      source_.reset();
      throw;
    }
    if (partial) return StreamEvent{false, std::move(*partial)};
  }

  Value result;
  try {
    result = decode_step(operation_, target, [&] { return session_->finalize(); });
  } catch (...) {
    done_ = true;
    session_.reset();
    source_.reset();
    throw;
  }
  done_ = true;
  session_.reset();
  source_.reset();
  final_ = result;
  return StreamEvent{true, std::move(result)};
}

Value StreamHandle::final_value() {
  if (cancelled_) throw StreamClosed("stream of '" + operation_ + "' was cancelled");
  while (!done_) next();
  if (!final_) throw StreamClosed("stream of '" + operation_ + "' ended without a final value");
  return *final_;
}

void StreamHandle::cancel() {
  if (done_) return;
  cancelled_ = true;
  done_ = true;
  session_.reset();
  source_.reset();
  ops_log()->debug("{}@{}: stream cancelled", operation_, version_);
}

// ---------------- OperationRegistry ----------------

OperationRegistry::OperationRegistry(std::shared_ptr<const SchemaSnapshot> schema, DecoderConfig config)
    : schema_(std::move(schema)), config_(config) {
  if (!schema_) throw Error("operation registry requires a schema snapshot", "invalid_argument");
}

void OperationRegistry::define_operation(const std::string& name, std::vector<ParameterDef> params) {
  if (index_.count(name)) throw DuplicateDefinition(name);
  std::vector<std::string> missing;
  for (const auto& p : params) {
    for (const auto& m : schema_->missing_references(p.type)) missing.push_back(name + "(" + p.name + "): " + m);
  }
  if (!missing.empty()) throw UnresolvedTypeReference(missing);

  OperationSpec spec;
  spec.name = name;
  spec.params = std::move(params);
  index_[name] = operations_.size();
  operations_.push_back(std::move(spec));
}

void OperationRegistry::register_binding(const std::string& operation, const std::string& version, TypeRef target,
                                         PayloadSourceFactory open) {
  auto it = index_.find(operation);
  if (it != index_.end()) {
    for (const auto& b : operations_[it->second].bindings) {
      if (b.version == version) throw DuplicateVersion(operation, version);
    }
  }
  auto missing = schema_->missing_references(target);
  if (!missing.empty()) throw UnresolvedTypeReference(missing);

  if (it == index_.end()) {
    OperationSpec spec;
    spec.name = operation;
    it = index_.emplace(operation, operations_.size()).first;
    operations_.push_back(std::move(spec));
  }
  operations_[it->second].bindings.push_back(ImplementationBinding{version, std::move(target), std::move(open)});
}

const OperationSpec& OperationRegistry::find(const std::string& operation) const {
  auto it = index_.find(operation);
  if (it == index_.end()) throw UnknownOperation(operation);
  return operations_[it->second];
}

const ImplementationBinding& OperationRegistry::resolve(const std::string& operation,
                                                        const std::optional<std::string>& version) const {
  const OperationSpec& spec = find(operation);
  if (spec.bindings.empty()) throw UnknownOperation(operation);
  if (!version) return spec.bindings.front();
  for (const auto& b : spec.bindings) {
    if (b.version == *version) return b;
  }
  throw UnknownVersion(operation, *version);
}

std::vector<std::string> OperationRegistry::versions(const std::string& operation) const {
  std::vector<std::string> out;
  for (const auto& b : find(operation).bindings) out.push_back(b.version);
  return out;
}

void OperationRegistry::check_arguments(const OperationSpec& spec, const JsonArray& args) const {
  if (!spec.params) return;
  const auto& params = *spec.params;
  if (args.size() != params.size()) {
    throw InvalidArgument(spec.name, "args",
                          "expected " + std::to_string(params.size()) + " argument(s), got " +
                              std::to_string(args.size()));
  }
  for (size_t i = 0; i < params.size(); ++i) {
    check_json(spec.name, *schema_, args[i], params[i].type, "args[" + std::to_string(i) + "]");
  }
}

Value OperationRegistry::call(const std::string& operation, const JsonArray& args,
                              const std::optional<std::string>& version) const {
  StreamHandle handle = stream(operation, args, version);
  return handle.final_value();
}

StreamHandle OperationRegistry::stream(const std::string& operation, const JsonArray& args,
                                       const std::optional<std::string>& version) const {
  check_arguments(find(operation), args);
  const ImplementationBinding& binding = resolve(operation, version);
  ops_log()->debug("{}: dispatching to version {} ({})", operation, binding.version, binding.target.to_string());

  std::unique_ptr<PayloadSource> source;
  if (binding.open) source = binding.open(args);
  if (!source) throw Error("operation '" + operation + "' version '" + binding.version + "' opened no payload", "payload");
  auto session = std::make_unique<DecodeSession>(schema_, binding.target, config_);
  return StreamHandle(operation, binding.version, std::move(source), std::move(session));
}

}  // namespace llm_typed
