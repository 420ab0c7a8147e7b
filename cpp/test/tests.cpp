#include "llm_typed.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace llm_typed;

static std::shared_ptr<const SchemaSnapshot> user_schema() {
  SchemaRegistry reg;
  auto user = reg.define_class("User");
  user.property("name").type(TypeRef::string());
  user.property("age").type(TypeRef::int_().optional());
  return reg.snapshot();
}

static std::shared_ptr<const SchemaSnapshot> account_schema() {
  SchemaRegistry reg;
  auto status = reg.define_enum("Status");
  status.value("ACTIVE");
  status.value("INACTIVE").alias("off");
  reg.define_class("Account").property("status").type(status.type());
  return reg.snapshot();
}

static PayloadSourceFactory chunks(std::vector<std::string> parts) {
  return [parts](const JsonArray&) { return std::unique_ptr<PayloadSource>(new ChunkedPayloadSource(parts)); };
}

static void test_describe_lists_definitions() {
  SchemaRegistry reg;
  auto user = reg.define_class("User");
  user.property("name").type(TypeRef::string()).alias("full_name").description("Full legal name");
  user.property("age").type(TypeRef::int_().optional());
  auto status = reg.define_enum("Status");
  status.value("ACTIVE");
  status.value("INACTIVE").alias("off");

  const std::string expected =
      "TypeBuilder(\n"
      "  Classes: [\n"
      "    User {\n"
      "      name string (alias='full_name', description='Full legal name'),\n"
      "      age int?\n"
      "    }\n"
      "  ],\n"
      "  Enums: [\n"
      "    Status {\n"
      "      ACTIVE,\n"
      "      INACTIVE (alias='off')\n"
      "    }\n"
      "  ]\n"
      ")";
  assert(reg.describe() == expected);
  assert(reg.snapshot()->describe() == expected);

  SchemaRegistry empty;
  assert(empty.describe() == "TypeBuilder(\n)");
}

static void test_duplicate_definitions() {
  SchemaRegistry reg;
  auto user = reg.define_class("User");
  user.property("name").type(TypeRef::string());

  try {
    (void)reg.define_class("User");
    assert(false && "expected DuplicateDefinition");
  } catch (const DuplicateDefinition& e) {
    assert(e.name == "User");
    assert(e.kind == "duplicate_definition");
  }

  // Classes and enums share one namespace.
  try {
    (void)reg.define_enum("User");
    assert(false && "expected DuplicateDefinition");
  } catch (const DuplicateDefinition& e) {
    assert(e.name == "User");
  }

  try {
    (void)reg.extend_class("User").property("name");
    assert(false && "expected DuplicateProperty");
  } catch (const DuplicateProperty& e) {
    assert(e.owner == "User");
    assert(e.name == "name");
  }

  auto color = reg.define_enum("Color");
  color.value("RED");
  try {
    (void)reg.extend_enum("Color").value("RED");
    assert(false && "expected DuplicateEnumValue");
  } catch (const DuplicateEnumValue& e) {
    assert(e.owner == "Color");
    assert(e.name == "RED");
  }
}

static void test_metadata_keys() {
  SchemaRegistry reg;
  auto user = reg.define_class("User");
  auto name = user.property("name").type(TypeRef::string());
  name.alias("a1");
  name.alias("a2");
  assert(name.def().alias().value() == "a2");
  assert(name.def().meta.size() == 1);

  try {
    name.with_meta("color", "blue");
    assert(false && "expected UnsupportedMetadataKey");
  } catch (const UnsupportedMetadataKey& e) {
    assert(e.key == "color");
    assert(e.kind == "unsupported_metadata_key");
  }

  // extend_class reaches the same definition.
  reg.extend_class("User").existing_property("name").description("d");
  assert(reg.snapshot()->find_class("User")->find_property("name")->description().value() == "d");

  try {
    (void)reg.extend_class("User").existing_property("nope");
    assert(false && "expected UnknownTypeReference");
  } catch (const UnknownTypeReference&) {
  }
}

static void test_snapshot_rejects_dangling_references() {
  SchemaRegistry reg;
  auto user = reg.define_class("User");
  user.property("friend").type(TypeRef::class_("Missing"));
  user.property("nick");

  try {
    (void)reg.snapshot();
    assert(false && "expected UnresolvedTypeReference");
  } catch (const UnresolvedTypeReference& e) {
    assert(e.references.size() == 2);
    assert(e.references[0] == "User.friend: Missing");
    assert(e.references[1] == "User.nick: type not set");
  }

  // Defining the missing class later makes the schema whole.
  reg.define_class("Missing").property("x").type(TypeRef::int_());
  reg.extend_class("User").existing_property("nick").type(TypeRef::string());
  auto snap = reg.snapshot();
  assert(snap->find_class("Missing") != nullptr);
}

static void test_snapshot_rejects_required_cycles() {
  {
    SchemaRegistry reg;
    reg.define_class("Node").property("next").type(TypeRef::class_("Node"));
    try {
      (void)reg.snapshot();
      assert(false && "expected InfiniteRecursion");
    } catch (const InfiniteRecursion& e) {
      assert(e.cycle.size() == 2);
      assert(e.cycle[0] == "Node");
      assert(e.cycle[1] == "Node");
    }
  }

  // Optional and list edges terminate the recursion.
  {
    SchemaRegistry reg;
    auto node = reg.define_class("Node");
    node.property("next").type(TypeRef::class_("Node").optional());
    node.property("children").type(TypeRef::class_("Node").list());
    auto snap = reg.snapshot();
    assert(snap->classes().size() == 1);
  }
}

static void test_snapshot_is_isolated_from_later_mutation() {
  SchemaRegistry reg;
  reg.define_class("User").property("name").type(TypeRef::string());
  auto snap = reg.snapshot();
  reg.extend_class("User").property("email").type(TypeRef::string());
  assert(snap->find_class("User")->properties.size() == 1);
  assert(reg.snapshot()->find_class("User")->properties.size() == 2);
}

static void test_type_ref_rendering() {
  assert(TypeRef::int_().optional().to_string() == "int?");
  assert(TypeRef::int_().optional().optional() == TypeRef::int_().optional());
  assert(TypeRef::string().list().to_string() == "string[]");
  assert(TypeRef::map_of(TypeRef::string(), TypeRef::float_()).to_string() == "map<string, float>");
  assert(TypeRef::union_of({TypeRef::int_(), TypeRef::string()}).list().to_string() == "(int | string)[]");
  assert(TypeRef::image().to_string() == "image");

  SchemaRegistry reg;
  reg.define_enum("Color").value("RED");
  try {
    reg.define_class("Bad").property("c").type(TypeRef::class_("Color"));
    assert(false && "expected UnknownTypeReference");
  } catch (const UnknownTypeReference&) {
  }
}

static void test_decode_user_partials() {
  IncrementalDecoder dec(user_schema(), TypeRef::class_("User"));
  assert(dec.state() == DecodeState::Empty);

  auto p1 = dec.feed("{\"name\": \"Al");
  assert(p1.has_value());
  assert(p1->is_class());
  assert(p1->as_class().class_name == "User");
  assert(p1->as_class().fields.empty());
  assert(dec.state() == DecodeState::Accumulating);

  auto p2 = dec.feed("ice\"");
  assert(p2.has_value());
  assert(p2->get("name")->as_string() == "Alice");
  assert(!p2->has("age"));

  // Nothing new resolved.
  auto p3 = dec.feed("}");
  assert(!p3.has_value());

  Value v = dec.finalize();
  assert(dec.state() == DecodeState::Completed);
  assert(v.get("name")->as_string() == "Alice");
  assert(!v.has("age"));
  assert(dumps_value(v) == "{\"name\":\"Alice\"}");
}

static void test_decode_numbers_wait_for_delimiter() {
  IncrementalDecoder dec(user_schema(), TypeRef::class_("User"));
  auto p1 = dec.feed("{\"name\": \"Bo\", \"age\": 3");
  assert(p1.has_value());
  assert(!p1->has("age"));
  auto p2 = dec.feed("0");
  assert(!p2.has_value());
  auto p3 = dec.feed("}");
  assert(p3.has_value());
  assert(p3->get("age")->as_int() == 30);
}

static void test_decode_missing_required_field() {
  IncrementalDecoder dec(user_schema(), TypeRef::class_("User"));
  (void)dec.feed("{\"age\": 4}");
  try {
    (void)dec.finalize();
    assert(false && "expected IncompleteValue");
  } catch (const IncompleteValue& e) {
    assert(e.target == "User");
    assert(e.unresolved.size() == 1);
    assert(e.unresolved[0].path == "name");
    assert(e.unresolved[0].reason == "missing");
  }
  assert(dec.state() == DecodeState::Failed);

  try {
    (void)dec.feed("x");
    assert(false && "expected StreamClosed");
  } catch (const StreamClosed&) {
  }
}

static void test_decode_tolerates_prose_and_repairs() {
  DecodeSession session(user_schema(), TypeRef::class_("User"));
  (void)session.feed("Sure! Here you go:\n```json\n{name: 'Ann', // comment\n age: \"41\",}\n```\nAnything else?");
  Value v = session.finalize();
  assert(v.get("name")->as_string() == "Ann");
  assert(v.get("age")->as_int() == 41);
}

static void test_decode_enum_matching() {
  auto snap = account_schema();

  auto decode_status = [&](const std::string& text) {
    IncrementalDecoder dec(snap, TypeRef::enum_("Status"));
    (void)dec.feed(text);
    return dec.finalize().as_enum().value;
  };

  assert(decode_status("ACTIVE") == "ACTIVE");
  assert(decode_status("off") == "INACTIVE");
  assert(decode_status("  inactive ") == "INACTIVE");
  assert(decode_status("\"active\"") == "ACTIVE");
  assert(decode_status("I would say the account is INACTIVE.") == "INACTIVE");

  // A quoted token is complete as soon as the quote closes.
  IncrementalDecoder dec(snap, TypeRef::enum_("Status"));
  auto p = dec.feed("\"ACTIVE\"");
  assert(p.has_value());
  assert(p->as_enum().enum_name == "Status");
  assert(p->as_enum().value == "ACTIVE");

  // A bare token is only complete at end of input.
  IncrementalDecoder bare(snap, TypeRef::enum_("Status"));
  auto pending = bare.feed("ACTIVE");
  assert(!pending.has_value());
  assert(bare.finalize().as_enum().value == "ACTIVE");
}

static void test_decode_ambiguous_enum_is_local_failure() {
  SchemaRegistry reg;
  auto answer = reg.define_enum("Answer");
  answer.value("Yes");
  answer.value("YES");
  auto snap = reg.snapshot();

  IncrementalDecoder dec(snap, TypeRef::enum_("Answer"));
  (void)dec.feed("yes");
  try {
    (void)dec.finalize();
    assert(false && "expected IncompleteValue");
  } catch (const IncompleteValue& e) {
    assert(e.unresolved.size() == 1);
    assert(e.unresolved[0].path.empty());
    assert(e.unresolved[0].reason.find("ambiguous") != std::string::npos);
  }
  assert(dec.local_failures().size() == 1);
  assert(format_path(dec.local_failures()[0].path) == "<root>");
}

static void test_decode_ambiguous_optional_enum_fails() {
  SchemaRegistry reg;
  auto answer = reg.define_enum("Answer");
  answer.value("Yes");
  answer.value("YES");
  reg.define_class("Reply").property("answer").type(answer.type().optional());
  auto snap = reg.snapshot();

  IncrementalDecoder dec(snap, TypeRef::class_("Reply"));
  (void)dec.feed("{\"answer\": \"yes\"}");
  try {
    (void)dec.finalize();
    assert(false && "expected IncompleteValue");
  } catch (const IncompleteValue& e) {
    assert(e.unresolved.size() == 1);
    assert(e.unresolved[0].path == "answer");
    assert(e.unresolved[0].reason.find("ambiguous") != std::string::npos);
  }
  assert(dec.state() == DecodeState::Failed);
  assert(dec.local_failures().size() == 1);
  assert(dec.local_failures()[0].hard);

  // A plain mismatch on the same optional field still resolves to absent.
  IncrementalDecoder soft(snap, TypeRef::class_("Reply"));
  (void)soft.feed("{\"answer\": \"maybe\"}");
  Value v = soft.finalize();
  assert(!v.has("answer"));
  assert(!soft.local_failures()[0].hard);

  OperationRegistry ops(snap);
  ops.register_binding("ask", "v1", TypeRef::class_("Reply"), chunks({"{\"answer\": ", "\"yes\"}"}));
  try {
    (void)ops.call("ask", {});
    assert(false && "expected DecodeFailure");
  } catch (const DecodeFailure& e) {
    assert(e.paths.size() == 1);
    assert(e.paths[0] == "answer");
  }
}

static void test_decode_numeric_strings_are_decimal_only() {
  auto snap = user_schema();
  auto decode_age = [&](const std::string& age) {
    IncrementalDecoder dec(snap, TypeRef::class_("User"));
    (void)dec.feed("{\"name\": \"x\", \"age\": \"" + age + "\"}");
    Value v = dec.finalize();
    assert(v.get("name")->as_string() == "x");
    return v;
  };

  assert(decode_age("12").get("age")->as_int() == 12);
  assert(decode_age("1e3").get("age")->as_int() == 1000);
  assert(!decode_age("0x1A").has("age"));
  assert(!decode_age("0x1E").has("age"));
  assert(!decode_age("inf").has("age"));

  IncrementalDecoder dec(snap, TypeRef::class_("User"));
  (void)dec.feed("{\"name\": \"x\", \"age\": \"0x1A\"}");
  (void)dec.finalize();
  assert(dec.local_failures().size() == 1);
  assert(dec.local_failures()[0].path == "age");
}

static void test_decode_lists_omit_trailing_element() {
  auto snap = user_schema();
  IncrementalDecoder dec(snap, TypeRef::int_().list());

  auto p1 = dec.feed("[1, 2");
  assert(p1.has_value());
  assert(p1->as_list().size() == 1);

  auto p2 = dec.feed(", 3");
  assert(p2.has_value());
  assert(p2->as_list().size() == 2);

  auto p3 = dec.feed("]");
  assert(p3.has_value());
  assert(p3->as_list().size() == 3);
  assert(p3->as_list()[2].as_int() == 3);

  Value v = dec.finalize();
  assert(v == *p3);
}

static void test_decode_list_of_classes() {
  IncrementalDecoder dec(user_schema(), TypeRef::class_("User").list());
  auto p1 = dec.feed("[{\"name\": \"A\"}, {\"name\": \"B");
  assert(p1.has_value());
  assert(p1->as_list().size() == 1);
  assert(p1->as_list()[0].get("name")->as_string() == "A");

  (void)dec.feed("\"}]");
  Value v = dec.finalize();
  assert(v.as_list().size() == 2);
  assert(v.as_list()[1].get("name")->as_string() == "B");
}

static void test_decode_optional_list_elements_become_null() {
  IncrementalDecoder dec(user_schema(), TypeRef::int_().optional().list());
  auto p = dec.feed("[1, \"x\", 3]");
  assert(p.has_value());
  assert(p->as_list().size() == 1);

  Value v = dec.finalize();
  const auto& items = v.as_list();
  assert(items.size() == 3);
  assert(items[0].as_int() == 1);
  assert(items[1].is_null());
  assert(items[2].as_int() == 3);
  assert(dec.local_failures().size() == 1);
  assert(dec.local_failures()[0].path == "[1]");
}

static void test_decode_local_failure_is_sticky() {
  IncrementalDecoder dec(user_schema(), TypeRef::int_().list());
  (void)dec.feed("[4.5, 2]");
  assert(dec.local_failures().size() == 1);
  assert(dec.local_failures()[0].path == "[0]");
  (void)dec.feed(" ");
  assert(dec.local_failures().size() == 1);

  try {
    (void)dec.finalize();
    assert(false && "expected IncompleteValue");
  } catch (const IncompleteValue& e) {
    assert(e.unresolved.size() == 1);
    assert(e.unresolved[0].path == "[0]");
    assert(e.unresolved[0].reason.find("not an integer") != std::string::npos);
  }
}

static void test_decode_single_value_wraps_into_list() {
  DecodeSession session(user_schema(), TypeRef::string().list());
  (void)session.feed("\"solo\"");
  Value v = session.finalize();
  assert(v.as_list().size() == 1);
  assert(v.as_list()[0].as_string() == "solo");

  DecoderConfig cfg;
  cfg.wrap_single_into_list = false;
  IncrementalDecoder strict(user_schema(), TypeRef::string().list(), cfg);
  (void)strict.feed("\"solo\"");
  try {
    (void)strict.finalize();
    assert(false && "expected IncompleteValue");
  } catch (const IncompleteValue&) {
  }
}

static void test_decode_maps_and_scalar_coercion() {
  SchemaRegistry reg;
  auto stats = reg.define_class("Stats");
  stats.property("label").type(TypeRef::string());
  stats.property("scores").type(TypeRef::map_of(TypeRef::string(), TypeRef::float_()));
  stats.property("ok").type(TypeRef::bool_());
  auto snap = reg.snapshot();

  IncrementalDecoder dec(snap, TypeRef::class_("Stats"));
  auto p = dec.feed("{\"label\": 12, \"scores\": {\"a\": 1.5, \"b\": 2");
  assert(p.has_value());
  assert(p->get("label")->as_string() == "12");
  const auto& entries = p->get("scores")->as_map().entries;
  assert(entries.size() == 1);
  assert(entries[0].first == "a");
  assert(entries[0].second.as_float() == 1.5);

  (void)dec.feed("}, \"ok\": \"true\"}");
  Value v = dec.finalize();
  assert(v.get("scores")->as_map().entries.size() == 2);
  assert(v.get("scores")->as_map().entries[1].second.as_float() == 2.0);
  assert(v.get("ok")->as_bool());
}

static void test_decode_duplicate_keys_keep_first() {
  IncrementalDecoder dec(user_schema(), TypeRef::class_("User"));
  (void)dec.feed("{\"name\": \"first\", \"Name\": \"second\", \"name\": \"third\"}");
  Value v = dec.finalize();
  assert(v.get("name")->as_string() == "first");
}

static void test_decode_alias_and_case_insensitive_keys() {
  SchemaRegistry reg;
  auto user = reg.define_class("User");
  user.property("name").type(TypeRef::string()).alias("full_name");
  user.property("age").type(TypeRef::int_());
  auto snap = reg.snapshot();

  IncrementalDecoder dec(snap, TypeRef::class_("User"));
  (void)dec.feed("{\"full_name\": \"Ada\", \"AGE\": 36}");
  Value v = dec.finalize();
  assert(v.get("name")->as_string() == "Ada");
  assert(v.get("age")->as_int() == 36);
}

static void test_decode_unions_resolve_when_complete() {
  SchemaRegistry reg;
  reg.define_class("Cat").property("meow").type(TypeRef::bool_());
  reg.define_class("Dog").property("bark").type(TypeRef::bool_());
  reg.define_class("Owner").property("pet").type(TypeRef::union_of({TypeRef::class_("Cat"), TypeRef::class_("Dog")}));
  auto snap = reg.snapshot();

  IncrementalDecoder dec(snap, TypeRef::class_("Owner"));
  auto p1 = dec.feed("{\"pet\": {\"bark\": tr");
  assert(p1.has_value());
  assert(!p1->has("pet"));

  auto p2 = dec.feed("ue}");
  assert(p2.has_value());
  assert(p2->get("pet")->as_class().class_name == "Dog");
  assert(p2->get("pet")->get("bark")->as_bool());
}

static void test_decode_media() {
  SchemaRegistry reg;
  auto photo = reg.define_class("Photo");
  photo.property("img").type(TypeRef::image());
  photo.property("thumb").type(TypeRef::image().optional());
  auto snap = reg.snapshot();

  IncrementalDecoder dec(snap, TypeRef::class_("Photo"));
  (void)dec.feed("{\"img\": {\"url\": \"https://example.com/a.png\"}, \"thumb\": \"data:image/png;base64,AAAA\"}");
  Value v = dec.finalize();
  assert(v.get("img")->as_media() == Media::from_url(MediaKind::Image, "https://example.com/a.png"));
  assert(v.get("thumb")->as_media() == Media::from_base64(MediaKind::Image, "AAAA", "image/png"));

  Media audio = Media::from_base64(MediaKind::Audio, "UklGR", "audio/wav");
  assert(Media::from_json(audio.to_json()) == audio);
  assert(audio != Media::from_url(MediaKind::Audio, "https://example.com/a.wav"));
  assert(dumps_json(audio.to_json()) == "{\"base64\":\"UklGR\",\"kind\":\"audio\",\"media_type\":\"audio/wav\"}");

  try {
    (void)Media::from_json(Json(JsonObject{{"kind", "video"}, {"url", "x"}}));
    assert(false && "expected Error");
  } catch (const Error& e) {
    assert(e.kind == "media");
  }
}

static void test_decode_buffer_limit() {
  DecoderConfig cfg;
  cfg.max_buffer_bytes = 8;
  IncrementalDecoder dec(user_schema(), TypeRef::class_("User"), cfg);
  (void)dec.feed("{\"name\"");
  try {
    (void)dec.feed(": \"too long\"}");
    assert(false && "expected LimitExceeded");
  } catch (const LimitExceeded& e) {
    assert(e.max == 8);
    assert(e.size == 20);
    assert(e.kind == "limit_exceeded");
  }
  assert(dec.state() == DecodeState::Failed);
}

static void test_decoder_location() {
  IncrementalDecoder dec(user_schema(), TypeRef::class_("User"));
  (void)dec.feed("{\n  \"name\": \"X\"");
  StreamLocation loc = dec.location();
  assert(loc.offset == 15);
  assert(loc.line == 2);
  assert(loc.col == 14);
}

static void test_convergence_char_by_char() {
  SchemaRegistry reg;
  auto status = reg.define_enum("Status");
  status.value("ACTIVE");
  status.value("INACTIVE");
  auto profile = reg.define_class("Profile");
  profile.property("name").type(TypeRef::string());
  profile.property("tags").type(TypeRef::string().list());
  profile.property("status").type(status.type());
  profile.property("scores").type(TypeRef::map_of(TypeRef::string(), TypeRef::float_()));
  profile.property("bio").type(TypeRef::string().optional());
  auto snap = reg.snapshot();

  const std::string text =
      "Sure! Here it is:\n```json\n"
      "{\"name\": \"Bob\", \"tags\": [\"a\", \"b\"], \"status\": \"active\", \"scores\": {\"x\": 1.5, \"y\": -2}}\n"
      "```\nDone.";

  DecodeSession session(snap, TypeRef::class_("Profile"));
  std::vector<Value> partials;
  for (char c : text) {
    auto p = session.feed(std::string(1, c));
    if (p) partials.push_back(*p);
  }
  Value v = session.finalize();

  assert(!partials.empty());
  assert(session.tracker().partial_count() == partials.size());
  assert(session.tracker().finalized());
  for (size_t i = 1; i < partials.size(); ++i) assert(partials[i] != partials[i - 1]);

  auto final_leaves = collect_leaves(v);
  for (const auto& p : partials) {
    for (const auto& kv : collect_leaves(p)) {
      auto it = final_leaves.find(kv.first);
      assert(it != final_leaves.end());
      assert(it->second == kv.second);
    }
  }

  assert(v.get("name")->as_string() == "Bob");
  assert(v.get("tags")->as_list().size() == 2);
  assert(v.get("status")->as_enum().value == "ACTIVE");
  assert(final_leaves.at("scores[y]").as_float() == -2.0);
  assert(!v.has("bio"));
}

static void test_convergence_tracker_detects_retraction() {
  ConvergenceTracker tracker;
  tracker.observe_partial(Value(ClassInstance{"User", {{"name", Value("A")}}}));
  try {
    tracker.observe_partial(Value(ClassInstance{"User", {{"name", Value("B")}}}));
    assert(false && "expected ConvergenceViolation");
  } catch (const ConvergenceViolation& e) {
    assert(e.path == "name");
  }
  try {
    tracker.observe_final(Value(ClassInstance{"User", {}}));
    assert(false && "expected ConvergenceViolation");
  } catch (const ConvergenceViolation& e) {
    assert(e.path == "name");
  }

  auto leaves = collect_leaves(Value(ValueList{Value(1), Value(ClassInstance{"P", {{"x", Value(true)}}})}));
  assert(leaves.size() == 2);
  assert(leaves.at("[0]").as_int() == 1);
  assert(leaves.at("[1].x").as_bool());
}

static void test_jsonish_prefix_parser() {
  auto node = parse_jsonish_prefix("{\"a\": [1, 2", false);
  assert(node.has_value());
  assert(node->type == JsonishNode::Type::Object);
  assert(!node->complete);
  const JsonishNode* a = node->find("a");
  assert(a != nullptr);
  assert(a->type == JsonishNode::Type::Array);
  assert(a->items.size() == 2);
  assert(a->items[0].complete);
  assert(a->items[0].type == JsonishNode::Type::Number);
  assert(!a->items[1].complete);

  auto closed = parse_jsonish_prefix("{\"a\": [1, 2", true);
  assert(closed->complete);
  assert(closed->find("a")->items[1].complete);

  auto repaired = parse_jsonish_prefix("{name: 'Bob', active: True, note: None, /* c */ n: 5,}", false);
  assert(repaired->complete);
  assert(repaired->fields.size() == 4);
  assert(repaired->find("name")->text == "Bob");
  assert(repaired->find("name")->quoted);
  assert(repaired->find("active")->type == JsonishNode::Type::Bool);
  assert(repaired->find("active")->text == "true");
  assert(repaired->find("note")->type == JsonishNode::Type::Null);
  assert(repaired->find("n")->text == "5");

  auto smart = parse_jsonish_prefix("{\xE2\x80\x9Cq\xE2\x80\x9D: \xE2\x80\x9Chi\\u00e9\xE2\x80\x9D}", false);
  assert(smart->find("q")->text == "hi\xC3\xA9");

  auto bare = parse_jsonish_prefix("{\"url\": http://example.com/x, \"n\": 1 // one\n}", false);
  assert(bare->find("url")->text == "http://example.com/x");
  assert(bare->find("n")->type == JsonishNode::Type::Number);

  assert(!parse_jsonish_prefix("   ", false).has_value());
}

static void test_decode_skips_brackets_in_prose() {
  DecodeSession session(user_schema(), TypeRef::class_("User"));
  (void)session.feed("See [1] below: ");
  (void)session.feed("{\"name\": \"x\"}");
  Value v = session.finalize();
  assert(v.get("name")->as_string() == "x");

  IncrementalDecoder list(user_schema(), TypeRef::int_().list());
  (void)list.feed("Counts {as requested}: [1, 2]");
  Value items = list.finalize();
  assert(items.as_list().size() == 2);
  assert(items.as_list()[1].as_int() == 2);

  auto cand = locate_json_candidate("See [1] below: {", RepairConfig{}, "{");
  assert(cand.has_value());
  assert(cand->start == 15);
  assert(!locate_json_candidate("See [1] below", RepairConfig{}, "{").has_value());
}

static void test_locate_json_candidate() {
  const std::string text = "intro {not this}\n```json\n{\"a\": 1}\n```";
  auto fenced = locate_json_candidate("Here:\n```json\n{\"a\": 1}\n```");
  assert(fenced.has_value());
  assert(fenced->from_fence);
  assert(fenced->start == 14);
  assert(fenced->end == 23);

  auto brace = locate_json_candidate(text);
  assert(brace.has_value());
  assert(!brace->from_fence);
  assert(brace->start == 6);

  assert(!locate_json_candidate("nothing yet ```json").has_value());
  assert(!locate_json_candidate("no structure").has_value());
}

static void test_operations_call_and_versions() {
  auto snap = user_schema();
  OperationRegistry ops(snap);
  ops.register_binding("extract_user", "v2", TypeRef::class_("User"), chunks({"{\"name\": \"Two\"}"}));
  ops.register_binding("extract_user", "v1", TypeRef::class_("User"), chunks({"{\"name\": \"One\"}"}));

  assert(ops.has_operation("extract_user"));
  assert(ops.versions("extract_user") == (std::vector<std::string>{"v2", "v1"}));
  assert(ops.resolve("extract_user").version == "v2");
  Value latest = ops.call("extract_user", {});
  assert(latest.get("name")->as_string() == "Two");
  Value pinned = ops.call("extract_user", {}, std::string("v1"));
  assert(pinned.get("name")->as_string() == "One");

  try {
    (void)ops.call("extract_user", {}, std::string("v3"));
    assert(false && "expected UnknownVersion");
  } catch (const UnknownVersion& e) {
    assert(e.operation == "extract_user");
    assert(e.version == "v3");
  }

  try {
    (void)ops.resolve("nope");
    assert(false && "expected UnknownOperation");
  } catch (const UnknownOperation& e) {
    assert(e.operation == "nope");
  }

  try {
    ops.register_binding("extract_user", "v1", TypeRef::class_("User"), chunks({}));
    assert(false && "expected DuplicateVersion");
  } catch (const DuplicateVersion& e) {
    assert(e.version == "v1");
  }

  try {
    ops.register_binding("extract_pet", "v1", TypeRef::class_("Pet"), chunks({}));
    assert(false && "expected UnresolvedTypeReference");
  } catch (const UnresolvedTypeReference& e) {
    assert(e.references.size() == 1);
    assert(e.references[0] == "Pet");
  }
  assert(!ops.has_operation("extract_pet"));
}

static void test_operations_decode_failure() {
  OperationRegistry ops(account_schema());
  ops.register_binding("get_account", "v1", TypeRef::class_("Account"),
                       chunks({"{\"status\": \"unk", "nown\"}"}));
  try {
    (void)ops.call("get_account", {});
    assert(false && "expected DecodeFailure");
  } catch (const DecodeFailure& e) {
    assert(e.kind == "decode_failure");
    assert(e.target == "Account");
    assert(e.paths.size() == 1);
    assert(e.paths[0] == "status");
  }

  DecoderConfig cfg;
  cfg.max_buffer_bytes = 4;
  OperationRegistry limited(account_schema(), cfg);
  limited.register_binding("get_account", "v1", TypeRef::class_("Account"), chunks({"{\"status\": \"off\"}"}));
  try {
    (void)limited.call("get_account", {});
    assert(false && "expected DecodeFailure");
  } catch (const DecodeFailure& e) {
    assert(e.paths.empty());
    assert(e.detail.find("max_buffer_bytes") != std::string::npos);
  }
}

static void test_operations_check_arguments() {
  OperationRegistry ops(user_schema());
  ops.define_operation("greet", {ParameterDef{"user", TypeRef::class_("User")}, ParameterDef{"times", TypeRef::int_()}});
  ops.register_binding("greet", "v1", TypeRef::string(), [](const JsonArray& args) {
    const std::string name = args[0].as_object().at("name").as_string();
    return std::unique_ptr<PayloadSource>(new ChunkedPayloadSource({"\"Hello, " + name + "\""}));
  });

  Value v = ops.call("greet", {Json(JsonObject{{"name", "Ada"}}), Json(2)});
  assert(v.as_string() == "Hello, Ada");

  try {
    (void)ops.call("greet", {Json(JsonObject{{"age", 3}}), Json(2)});
    assert(false && "expected InvalidArgument");
  } catch (const InvalidArgument& e) {
    assert(e.path == "args[0].name");
  }

  try {
    (void)ops.call("greet", {Json(JsonObject{{"name", "Ada"}}), Json(2.5)});
    assert(false && "expected InvalidArgument");
  } catch (const InvalidArgument& e) {
    assert(e.path == "args[1]");
  }

  try {
    (void)ops.call("greet", {});
    assert(false && "expected InvalidArgument");
  } catch (const InvalidArgument& e) {
    assert(e.path == "args");
  }

  try {
    ops.define_operation("greet", {});
    assert(false && "expected DuplicateDefinition");
  } catch (const DuplicateDefinition&) {
  }
}

static void test_stream_handle_is_single_use() {
  OperationRegistry ops(user_schema());
  ops.register_binding("extract_user", "v1", TypeRef::class_("User"),
                       chunks({"{\"name\": \"Al", "ice\", \"age\": 3", "0}"}));

  StreamHandle h = ops.stream("extract_user", {});
  assert(h.operation() == "extract_user");
  assert(h.version() == "v1");

  std::vector<StreamEvent> events;
  while (auto ev = h.next()) events.push_back(*ev);
  assert(h.done());
  assert(events.size() == 4);
  assert(!events[0].is_final);
  assert(events[0].value.as_class().fields.empty());
  assert(events[1].value.get("name")->as_string() == "Alice");
  assert(!events[1].value.has("age"));
  assert(events[2].value.get("age")->as_int() == 30);
  assert(events[3].is_final);
  assert(events[3].value == events[2].value);

  auto after = h.next();
  assert(!after.has_value());
  Value final_value = h.final_value();
  assert(final_value == events[3].value);
}

static void test_stream_handle_move_leaves_source_done() {
  OperationRegistry ops(user_schema());
  ops.register_binding("extract_user", "v1", TypeRef::class_("User"), chunks({"{\"name\": \"Bea\"}"}));

  StreamHandle h = ops.stream("extract_user", {});
  StreamHandle moved(std::move(h));
  assert(h.done());
  auto nothing = h.next();
  assert(!nothing.has_value());

  StreamHandle assigned = ops.stream("extract_user", {});
  assigned = std::move(moved);
  assert(moved.done());
  Value v = assigned.final_value();
  assert(v.get("name")->as_string() == "Bea");
}

static void test_stream_handle_cancel() {
  OperationRegistry ops(user_schema());
  ops.register_binding("extract_user", "v1", TypeRef::class_("User"), chunks({"{\"name\": \"A\"", ", \"age\": 1}"}));

  StreamHandle h = ops.stream("extract_user", {});
  auto first = h.next();
  assert(first.has_value());
  assert(!first->is_final);
  h.cancel();
  assert(h.done());
  auto after = h.next();
  assert(!after.has_value());
  try {
    (void)h.final_value();
    assert(false && "expected StreamClosed");
  } catch (const StreamClosed& e) {
    assert(e.kind == "stream_closed");
  }
}

int main() {
  load_log_levels_from_env();

  auto run = [](const char* name, void (*fn)()) {
    try {
      fn();
      std::cout << "PASS: " << name << "\n";
    } catch (const std::exception& e) {
      std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
      throw;
    }
  };

  try {
    run("describe_lists_definitions", test_describe_lists_definitions);
    run("duplicate_definitions", test_duplicate_definitions);
    run("metadata_keys", test_metadata_keys);
    run("snapshot_rejects_dangling_references", test_snapshot_rejects_dangling_references);
    run("snapshot_rejects_required_cycles", test_snapshot_rejects_required_cycles);
    run("snapshot_is_isolated_from_later_mutation", test_snapshot_is_isolated_from_later_mutation);
    run("type_ref_rendering", test_type_ref_rendering);
    run("decode_user_partials", test_decode_user_partials);
    run("decode_numbers_wait_for_delimiter", test_decode_numbers_wait_for_delimiter);
    run("decode_missing_required_field", test_decode_missing_required_field);
    run("decode_tolerates_prose_and_repairs", test_decode_tolerates_prose_and_repairs);
    run("decode_enum_matching", test_decode_enum_matching);
    run("decode_ambiguous_enum_is_local_failure", test_decode_ambiguous_enum_is_local_failure);
    run("decode_ambiguous_optional_enum_fails", test_decode_ambiguous_optional_enum_fails);
    run("decode_numeric_strings_are_decimal_only", test_decode_numeric_strings_are_decimal_only);
    run("decode_lists_omit_trailing_element", test_decode_lists_omit_trailing_element);
    run("decode_list_of_classes", test_decode_list_of_classes);
    run("decode_optional_list_elements_become_null", test_decode_optional_list_elements_become_null);
    run("decode_local_failure_is_sticky", test_decode_local_failure_is_sticky);
    run("decode_single_value_wraps_into_list", test_decode_single_value_wraps_into_list);
    run("decode_maps_and_scalar_coercion", test_decode_maps_and_scalar_coercion);
    run("decode_duplicate_keys_keep_first", test_decode_duplicate_keys_keep_first);
    run("decode_alias_and_case_insensitive_keys", test_decode_alias_and_case_insensitive_keys);
    run("decode_unions_resolve_when_complete", test_decode_unions_resolve_when_complete);
    run("decode_media", test_decode_media);
    run("decode_buffer_limit", test_decode_buffer_limit);
    run("decoder_location", test_decoder_location);
    run("convergence_char_by_char", test_convergence_char_by_char);
    run("convergence_tracker_detects_retraction", test_convergence_tracker_detects_retraction);
    run("jsonish_prefix_parser", test_jsonish_prefix_parser);
    run("decode_skips_brackets_in_prose", test_decode_skips_brackets_in_prose);
    run("locate_json_candidate", test_locate_json_candidate);
    run("operations_call_and_versions", test_operations_call_and_versions);
    run("operations_decode_failure", test_operations_decode_failure);
    run("operations_check_arguments", test_operations_check_arguments);
    run("stream_handle_is_single_use", test_stream_handle_is_single_use);
    run("stream_handle_move_leaves_source_done", test_stream_handle_move_leaves_source_done);
    run("stream_handle_cancel", test_stream_handle_cancel);
    std::cout << "OK\n";
    return 0;
  } catch (...) {
    return 1;
  }
}
