#include <pybind11/pybind11.h>

#include <cctype>
#include <string>
#include <utility>

#include "json_sanitizer.hpp"

namespace py = pybind11;

using json_sanitizer::SanitizeConfig;
using json_sanitizer::SanitizeError;
using json_sanitizer::SanitizeMetadata;

static py::object SanitizeErrorType;

static void TranslateSanitizeError(const SanitizeError& e) {
  py::object exc = SanitizeErrorType(py::str(e.what()));
  exc.attr("message") = py::str(e.message);
  exc.attr("kind") = py::str(e.kind);
  exc.attr("offset") = py::int_(e.offset);
  exc.attr("maxDepth") = py::int_(e.max_depth);
  PyErr_SetObject(SanitizeErrorType.ptr(), exc.ptr());
}

static SanitizeConfig SanitizeConfigFromPy(py::object o) {
  SanitizeConfig cfg;
  if (o.is_none()) return cfg;
  py::dict d = o.cast<py::dict>();

  if (d.contains("maxNestingDepth")) cfg.max_nesting_depth = d["maxNestingDepth"].cast<int>();

  if (d.contains("depthLimitPolicy")) {
    const std::string raw = py::cast<std::string>(d["depthLimitPolicy"]);
    std::string s;
    s.reserve(raw.size());
    for (char c : raw) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (s == "error") {
      cfg.depth_limit_policy = SanitizeConfig::DepthLimitPolicy::Error;
    } else if (s == "truncate") {
      cfg.depth_limit_policy = SanitizeConfig::DepthLimitPolicy::Truncate;
    } else {
      throw std::runtime_error("depthLimitPolicy must be one of: error | truncate");
    }
  }
  return cfg;
}

static py::dict SanitizeMetadataToPy(const SanitizeMetadata& m) {
  py::dict d;
  d["modified"] = m.modified;
  d["truncated"] = m.truncated;
  d["depthLimited"] = m.depth_limited;
  d["closedBrackets"] = m.closed_brackets;
  d["maxDepth"] = m.max_depth;
  d["effectiveMaxNestingDepth"] = m.effective_max_nesting_depth;
  d["editCount"] = py::int_(m.edit_count);
  return d;
}

PYBIND11_MODULE(_native, m) {
  m.doc() = "C++17-backed JSON-ish sanitizer (pybind11)";

  SanitizeErrorType =
      py::reinterpret_steal<py::object>(PyErr_NewException("json_sanitizer.SanitizeError", PyExc_Exception, nullptr));
  m.attr("SanitizeError") = SanitizeErrorType;
  m.attr("DEFAULT_NESTING_DEPTH") = json_sanitizer::kDefaultNestingDepth;
  m.attr("MAXIMUM_NESTING_DEPTH") = json_sanitizer::kMaximumNestingDepth;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const SanitizeError& e) {
      TranslateSanitizeError(e);
    }
  });

  m.def("sanitize", [](std::string text, int max_nesting_depth) {
    return json_sanitizer::sanitize(std::move(text), max_nesting_depth);
  }, py::arg("text"), py::arg("max_nesting_depth") = json_sanitizer::kDefaultNestingDepth);

  m.def("sanitize_ex", [](std::string text, py::object config) {
    SanitizeConfig cfg = SanitizeConfigFromPy(std::move(config));
    auto r = json_sanitizer::sanitize_ex(std::move(text), cfg);
    py::dict out;
    out["text"] = r.text;
    out["metadata"] = SanitizeMetadataToPy(r.metadata);
    return out;
  }, py::arg("text"), py::arg("config") = py::none());

  m.def("escape", [](const std::string& text) { return json_sanitizer::escape(text); }, py::arg("text"));
}
