#include "llm_typed.hpp"

#include "logging.hpp"

namespace llm_typed {

static LoggerPtr session_log() {
  static LoggerPtr log = get_logger("llm_typed.decoder");
  return log;
}

// ---------------- Convergence ----------------

static void collect_into(const Value& v, const std::string& path, std::map<std::string, Value>& out) {
  if (v.is_class()) {
    for (const auto& kv : v.as_class().fields) collect_into(kv.second, path.empty() ? kv.first : path + "." + kv.first, out);
    return;
  }
  if (v.is_map()) {
    for (const auto& kv : v.as_map().entries) collect_into(kv.second, path + "[" + kv.first + "]", out);
    return;
  }
  if (v.is_list()) {
    const auto& items = v.as_list();
    for (size_t i = 0; i < items.size(); ++i) collect_into(items[i], path + "[" + std::to_string(i) + "]", out);
    return;
  }
  out.emplace(path, v);
}

std::map<std::string, Value> collect_leaves(const Value& value) {
  std::map<std::string, Value> out;
  collect_into(value, "", out);
  return out;
}

void ConvergenceTracker::check_retained(const std::map<std::string, Value>& next, const char* stage) const {
  for (const auto& kv : last_leaves_) {
    auto it = next.find(kv.first);
    if (it == next.end()) {
      throw ConvergenceViolation(kv.first, std::string(stage) + " dropped resolved leaf " + dumps_value(kv.second));
    }
    if (it->second != kv.second) {
      throw ConvergenceViolation(kv.first, std::string(stage) + " changed resolved leaf " + dumps_value(kv.second) +
                                               " to " + dumps_value(it->second));
    }
  }
}

void ConvergenceTracker::observe_partial(const Value& partial) {
  if (finalized_) throw ConvergenceViolation("", "partial value observed after the final value");
  auto leaves = collect_leaves(partial);
  check_retained(leaves, "partial");
  last_leaves_ = std::move(leaves);
  ++partials_;
}

void ConvergenceTracker::observe_final(const Value& final_value) {
  if (finalized_) throw ConvergenceViolation("", "second final value");
  check_retained(collect_leaves(final_value), "final");
  finalized_ = true;
}

// ---------------- DecodeSession ----------------

DecodeSession::DecodeSession(std::shared_ptr<const SchemaSnapshot> schema, TypeRef target, DecoderConfig config)
    : decoder_(std::move(schema), std::move(target), config) {}

std::optional<Value> DecodeSession::feed(const std::string& chunk) {
  auto v = decoder_.feed(chunk);
  if (v) tracker_.observe_partial(*v);
  return v;
}

Value DecodeSession::finalize() {
  Value v = decoder_.finalize();
  tracker_.observe_final(v);
  session_log()->debug("{} converged after {} partial(s)", decoder_.target().to_string(), tracker_.partial_count());
  return v;
}

}  // namespace llm_typed
