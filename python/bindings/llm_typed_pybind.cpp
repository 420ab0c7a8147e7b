#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llm_typed.hpp"

namespace py = pybind11;

using llm_typed::ClassBuilder;
using llm_typed::DecodeSession;
using llm_typed::DecoderConfig;
using llm_typed::EnumBuilder;
using llm_typed::Json;
using llm_typed::JsonArray;
using llm_typed::JsonObject;
using llm_typed::PropertyBuilder;
using llm_typed::RepairConfig;
using llm_typed::SchemaRegistry;
using llm_typed::SchemaSnapshot;
using llm_typed::StreamLocation;
using llm_typed::TypeRef;
using llm_typed::Value;

static py::object ToPy(const Json& v);

static py::object ToPyObject(const JsonObject& o) {
  py::dict d;
  for (const auto& kv : o) {
    d[py::str(kv.first)] = ToPy(kv.second);
  }
  return std::move(d);
}

static py::object ToPyArray(const JsonArray& a) {
  py::list out;
  for (const auto& el : a) {
    out.append(ToPy(el));
  }
  return std::move(out);
}

static py::object ToPyNumber(double n) {
  if (std::isfinite(n)) {
    const double ip = std::trunc(n);
    if (ip == n && ip >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        ip <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return py::int_(static_cast<int64_t>(ip));
    }
  }
  return py::float_(n);
}

static py::object ToPy(const Json& v) {
  if (v.is_null()) return py::none();
  if (v.is_bool()) return py::bool_(v.as_bool());
  if (v.is_number()) return ToPyNumber(v.as_number());
  if (v.is_string()) return py::str(v.as_string());
  if (v.is_array()) return ToPyArray(v.as_array());
  return ToPyObject(v.as_object());
}

// Decoded values cross the boundary as plain dict/list/str; enum members become their value name.
static py::object ValueToPy(const Value& v) {
  if (v.is_int()) return py::int_(v.as_int());
  return ToPy(llm_typed::to_json(v));
}

static py::object ErrorType;

static void TranslateError(const llm_typed::Error& e) {
  py::object exc = ErrorType(py::str(e.what()));
  exc.attr("message") = py::str(e.what());
  exc.attr("kind") = py::str(e.kind);
  if (auto* d = dynamic_cast<const llm_typed::DecodeFailure*>(&e)) {
    exc.attr("target") = py::str(d->target);
    exc.attr("paths") = py::cast(d->paths);
  } else if (auto* iv = dynamic_cast<const llm_typed::IncompleteValue*>(&e)) {
    py::list paths;
    for (const auto& u : iv->unresolved) paths.append(py::str(u.path));
    exc.attr("target") = py::str(iv->target);
    exc.attr("paths") = std::move(paths);
  } else if (auto* ia = dynamic_cast<const llm_typed::InvalidArgument*>(&e)) {
    exc.attr("path") = py::str(ia->path);
  } else if (auto* le = dynamic_cast<const llm_typed::LimitExceeded*>(&e)) {
    py::dict lim;
    lim["kind"] = "maxBufferBytes";
    lim["current"] = py::int_(le->size);
    lim["max"] = py::int_(le->max);
    exc.attr("limit") = lim;
  }
  PyErr_SetObject(ErrorType.ptr(), exc.ptr());
}

static RepairConfig RepairConfigFromPy(const py::dict& d) {
  RepairConfig cfg;
  auto set_bool = [&](const char* key, bool& field) {
    if (d.contains(key)) field = d[key].cast<bool>();
  };
  set_bool("fixSmartQuotes", cfg.fix_smart_quotes);
  set_bool("stripJsonComments", cfg.strip_json_comments);
  set_bool("replacePythonLiterals", cfg.replace_python_literals);
  set_bool("allowUnquotedKeys", cfg.allow_unquoted_keys);
  set_bool("allowBareValues", cfg.allow_bare_values);
  set_bool("allowSingleQuotes", cfg.allow_single_quotes);
  set_bool("extractFromFence", cfg.extract_from_fence);
  return cfg;
}

static DecoderConfig DecoderConfigFromPy(py::object o) {
  DecoderConfig cfg;
  if (o.is_none()) return cfg;
  py::dict d = o.cast<py::dict>();
  auto set_bool = [&](const char* key, bool& field) {
    if (d.contains(key)) field = d[key].cast<bool>();
  };
  if (d.contains("repair")) cfg.repair = RepairConfigFromPy(d["repair"].cast<py::dict>());
  if (d.contains("maxBufferBytes")) cfg.max_buffer_bytes = d["maxBufferBytes"].cast<size_t>();
  set_bool("coerceNumericStrings", cfg.coerce_numeric_strings);
  set_bool("coerceScalarsToString", cfg.coerce_scalars_to_string);
  set_bool("caseInsensitiveEnums", cfg.case_insensitive_enums);
  set_bool("enumPhraseMatch", cfg.enum_phrase_match);
  set_bool("wrapSingleIntoList", cfg.wrap_single_into_list);
  return cfg;
}

static py::dict StreamLocationToPy(const StreamLocation& loc) {
  py::dict d;
  d["offset"] = py::int_(loc.offset);
  d["line"] = py::int_(loc.line);
  d["col"] = py::int_(loc.col);
  return d;
}

// Python holds snapshots through a non-const holder; the library never hands out mutable access.
static std::shared_ptr<SchemaSnapshot> Unconst(std::shared_ptr<const SchemaSnapshot> s) {
  return std::const_pointer_cast<SchemaSnapshot>(std::move(s));
}

PYBIND11_MODULE(_native, m) {
  m.doc() = "C++17-backed typed decoding of streamed LLM output (pybind11)";

  ErrorType = py::reinterpret_steal<py::object>(PyErr_NewException("llm_typed.Error", PyExc_Exception, nullptr));
  m.attr("Error") = ErrorType;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const llm_typed::Error& e) {
      TranslateError(e);
    } catch (const llm_typed::ConvergenceViolation& e) {
      PyErr_SetString(PyExc_AssertionError, e.what());
    }
  });

  m.def("load_log_levels_from_env", &llm_typed::load_log_levels_from_env);

  py::class_<TypeRef>(m, "TypeRef")
      .def_static("string", &TypeRef::string)
      .def_static("int_", &TypeRef::int_)
      .def_static("float_", &TypeRef::float_)
      .def_static("bool_", &TypeRef::bool_)
      .def_static("null", &TypeRef::null)
      .def_static("image", &TypeRef::image)
      .def_static("audio", &TypeRef::audio)
      .def_static("class_", &TypeRef::class_)
      .def_static("enum_", &TypeRef::enum_)
      .def_static("map_of", &TypeRef::map_of)
      .def_static("union_of", &TypeRef::union_of)
      .def("optional", &TypeRef::optional)
      .def("list", &TypeRef::list)
      .def("__str__", [](const TypeRef& t) { return t.to_string(); })
      .def("__repr__", [](const TypeRef& t) { return "TypeRef(" + t.to_string() + ")"; })
      .def("__eq__", [](const TypeRef& a, const TypeRef& b) { return a == b; });

  py::class_<PropertyBuilder>(m, "PropertyBuilder")
      .def("type", [](PropertyBuilder& self, TypeRef t) { return self.type(std::move(t)); }, py::keep_alive<0, 1>())
      .def("alias", [](PropertyBuilder& self, std::string v) { return self.alias(std::move(v)); },
           py::keep_alive<0, 1>())
      .def("description", [](PropertyBuilder& self, std::string v) { return self.description(std::move(v)); },
           py::keep_alive<0, 1>())
      .def("with_meta", [](PropertyBuilder& self, const std::string& k, std::string v) {
        return self.with_meta(k, std::move(v));
      }, py::keep_alive<0, 1>());

  py::class_<ClassBuilder>(m, "ClassBuilder")
      .def("property", &ClassBuilder::property, py::keep_alive<0, 1>())
      .def("existing_property", &ClassBuilder::existing_property, py::keep_alive<0, 1>())
      .def("alias", [](ClassBuilder& self, std::string v) { return self.alias(std::move(v)); }, py::keep_alive<0, 1>())
      .def("description", [](ClassBuilder& self, std::string v) { return self.description(std::move(v)); },
           py::keep_alive<0, 1>())
      .def("type", &ClassBuilder::type)
      .def("property_names", &ClassBuilder::property_names);

  py::class_<EnumBuilder>(m, "EnumBuilder")
      .def("value", [](EnumBuilder& self, const std::string& name, py::object alias, py::object description) {
        auto v = self.value(name);
        if (!alias.is_none()) v.alias(alias.cast<std::string>());
        if (!description.is_none()) v.description(description.cast<std::string>());
        return self;
      }, py::arg("name"), py::arg("alias") = py::none(), py::arg("description") = py::none(), py::keep_alive<0, 1>())
      .def("alias", [](EnumBuilder& self, std::string v) { return self.alias(std::move(v)); }, py::keep_alive<0, 1>())
      .def("description", [](EnumBuilder& self, std::string v) { return self.description(std::move(v)); },
           py::keep_alive<0, 1>())
      .def("type", &EnumBuilder::type)
      .def("value_names", &EnumBuilder::value_names);

  py::class_<SchemaSnapshot, std::shared_ptr<SchemaSnapshot>>(m, "SchemaSnapshot")
      .def("describe", &SchemaSnapshot::describe)
      .def("class_names", [](const SchemaSnapshot& s) {
        std::vector<std::string> out;
        for (const auto& c : s.classes()) out.push_back(c.name);
        return out;
      })
      .def("enum_names", [](const SchemaSnapshot& s) {
        std::vector<std::string> out;
        for (const auto& e : s.enums()) out.push_back(e.name);
        return out;
      });

  py::class_<SchemaRegistry>(m, "SchemaRegistry")
      .def(py::init<>())
      .def("define_class", &SchemaRegistry::define_class, py::keep_alive<0, 1>())
      .def("extend_class", &SchemaRegistry::extend_class, py::keep_alive<0, 1>())
      .def("define_enum", &SchemaRegistry::define_enum, py::keep_alive<0, 1>())
      .def("extend_enum", &SchemaRegistry::extend_enum, py::keep_alive<0, 1>())
      .def("has_class", &SchemaRegistry::has_class)
      .def("has_enum", &SchemaRegistry::has_enum)
      .def("snapshot", [](const SchemaRegistry& self) { return Unconst(self.snapshot()); })
      .def("describe", &SchemaRegistry::describe);

  py::class_<DecodeSession>(m, "DecodeSession")
      .def(py::init([](std::shared_ptr<SchemaSnapshot> schema, TypeRef target, py::object config) {
        return new DecodeSession(std::move(schema), std::move(target), DecoderConfigFromPy(std::move(config)));
      }), py::arg("schema"), py::arg("target"), py::arg("config") = py::none())
      .def("feed", [](DecodeSession& self, const std::string& chunk) -> py::object {
        auto v = self.feed(chunk);
        if (!v) return py::none();
        return ValueToPy(*v);
      })
      .def("finalize", [](DecodeSession& self) { return ValueToPy(self.finalize()); })
      .def("state", [](const DecodeSession& self) { return std::string(llm_typed::to_string(self.decoder().state())); })
      .def("local_failures", [](const DecodeSession& self) {
        py::list out;
        for (const auto& f : self.decoder().local_failures()) {
          py::dict d;
          d["path"] = f.path;
          d["reason"] = f.reason;
          d["hard"] = f.hard;
          out.append(std::move(d));
        }
        return out;
      })
      .def("location", [](const DecodeSession& self) { return StreamLocationToPy(self.decoder().location()); });
}
