#include <node_api.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "json_sanitizer.hpp"

using json_sanitizer::SanitizeConfig;
using json_sanitizer::SanitizeError;
using json_sanitizer::SanitizeMetadata;

static void ThrowTypeError(napi_env env, const char* msg) { napi_throw_type_error(env, nullptr, msg); }

static napi_value MakeString(napi_env env, const std::string& s) {
  napi_value out;
  napi_create_string_utf8(env, s.c_str(), s.size(), &out);
  return out;
}

static void ThrowError(napi_env env, const std::string& msg) { napi_throw_error(env, nullptr, msg.c_str()); }

static void ThrowSanitizeError(napi_env env, const SanitizeError& e) {
  napi_value msg = MakeString(env, e.what());

  napi_value err;
  napi_create_error(env, nullptr, msg, &err);

  // Ensure `err.message` is present and readable.
  napi_set_named_property(env, err, "message", msg);
  napi_set_named_property(env, err, "name", MakeString(env, "SanitizeError"));
  napi_set_named_property(env, err, "kind", MakeString(env, e.kind));

  napi_value n;
  napi_create_double(env, static_cast<double>(e.offset), &n);
  napi_set_named_property(env, err, "offset", n);
  napi_create_int32(env, e.max_depth, &n);
  napi_set_named_property(env, err, "maxDepth", n);

  napi_throw(env, err);
}

static bool GetStringUtf8(napi_env env, napi_value v, std::string& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_string) return false;

  size_t len = 0;
  if (napi_get_value_string_utf8(env, v, nullptr, 0, &len) != napi_ok) return false;

  out.resize(len);
  size_t written = 0;
  if (napi_get_value_string_utf8(env, v, out.data(), out.size() + 1, &written) != napi_ok) return false;
  out.resize(written);
  return true;
}

static bool GetInt32(napi_env env, napi_value v, int& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_number) {
    ThrowTypeError(env, "maxNestingDepth must be a number");
    return false;
  }
  int32_t i = 0;
  if (napi_get_value_int32(env, v, &i) != napi_ok) return false;
  out = i;
  return true;
}

static bool SanitizeConfigFromNapi(napi_env env, napi_value v, SanitizeConfig& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t == napi_null || t == napi_undefined) return true;
  if (t != napi_object) {
    ThrowTypeError(env, "sanitize config must be an object");
    return false;
  }

  bool has = false;
  if (napi_has_named_property(env, v, "maxNestingDepth", &has) != napi_ok) return false;
  if (has) {
    napi_value depth;
    if (napi_get_named_property(env, v, "maxNestingDepth", &depth) != napi_ok) return false;
    if (!GetInt32(env, depth, out.max_nesting_depth)) return false;
  }

  if (napi_has_named_property(env, v, "depthLimitPolicy", &has) != napi_ok) return false;
  if (has) {
    napi_value pol;
    if (napi_get_named_property(env, v, "depthLimitPolicy", &pol) != napi_ok) return false;
    std::string s;
    if (!GetStringUtf8(env, pol, s)) {
      ThrowTypeError(env, "depthLimitPolicy must be a string");
      return false;
    }
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "error") {
      out.depth_limit_policy = SanitizeConfig::DepthLimitPolicy::Error;
    } else if (s == "truncate") {
      out.depth_limit_policy = SanitizeConfig::DepthLimitPolicy::Truncate;
    } else {
      ThrowTypeError(env, "depthLimitPolicy must be one of: error | truncate");
      return false;
    }
  }
  return true;
}

static napi_value SanitizeMetadataToNapi(napi_env env, const SanitizeMetadata& m) {
  napi_value obj;
  napi_create_object(env, &obj);
  napi_value v;
  napi_get_boolean(env, m.modified, &v);
  napi_set_named_property(env, obj, "modified", v);
  napi_get_boolean(env, m.truncated, &v);
  napi_set_named_property(env, obj, "truncated", v);
  napi_get_boolean(env, m.depth_limited, &v);
  napi_set_named_property(env, obj, "depthLimited", v);
  napi_create_int32(env, m.closed_brackets, &v);
  napi_set_named_property(env, obj, "closedBrackets", v);
  napi_create_int32(env, m.max_depth, &v);
  napi_set_named_property(env, obj, "maxDepth", v);
  napi_create_int32(env, m.effective_max_nesting_depth, &v);
  napi_set_named_property(env, obj, "effectiveMaxNestingDepth", v);
  napi_create_double(env, static_cast<double>(m.edit_count), &v);
  napi_set_named_property(env, obj, "editCount", v);
  return obj;
}

static napi_value Sanitize(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc < 1 || argc > 2) {
    ThrowTypeError(env, "sanitize(text, maxNestingDepth?) expects 1-2 arguments");
    return nullptr;
  }

  std::string text;
  if (!GetStringUtf8(env, argv[0], text)) {
    ThrowTypeError(env, "sanitize(text, maxNestingDepth?) expects text as string");
    return nullptr;
  }

  int depth = json_sanitizer::kDefaultNestingDepth;
  if (argc >= 2) {
    napi_valuetype t;
    if (napi_typeof(env, argv[1], &t) != napi_ok) return nullptr;
    if (t != napi_undefined && !GetInt32(env, argv[1], depth)) return nullptr;
  }

  try {
    return MakeString(env, json_sanitizer::sanitize(std::move(text), depth));
  } catch (const SanitizeError& e) {
    ThrowSanitizeError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowError(env, e.what());
    return nullptr;
  }
}

static napi_value SanitizeEx(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc < 1 || argc > 2) {
    ThrowTypeError(env, "sanitizeEx(text, config?) expects 1-2 arguments");
    return nullptr;
  }

  std::string text;
  if (!GetStringUtf8(env, argv[0], text)) {
    ThrowTypeError(env, "sanitizeEx(text, config?) expects text as string");
    return nullptr;
  }

  SanitizeConfig config;
  if (argc >= 2) {
    if (!SanitizeConfigFromNapi(env, argv[1], config)) return nullptr;
  }

  try {
    auto r = json_sanitizer::sanitize_ex(std::move(text), config);
    napi_value obj;
    napi_create_object(env, &obj);
    napi_set_named_property(env, obj, "text", MakeString(env, r.text));
    napi_set_named_property(env, obj, "metadata", SanitizeMetadataToNapi(env, r.metadata));
    return obj;
  } catch (const SanitizeError& e) {
    ThrowSanitizeError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowError(env, e.what());
    return nullptr;
  }
}

static napi_value Escape(napi_env env, napi_callback_info info) {
  size_t argc = 1;
  napi_value argv[1];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc != 1) {
    ThrowTypeError(env, "escape(text) expects 1 argument");
    return nullptr;
  }

  std::string text;
  if (!GetStringUtf8(env, argv[0], text)) {
    ThrowTypeError(env, "escape(text) expects text as string");
    return nullptr;
  }
  return MakeString(env, json_sanitizer::escape(text));
}

static napi_value Init(napi_env env, napi_value exports) {
  napi_property_descriptor props[] = {
      {"sanitize", nullptr, Sanitize, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"sanitizeEx", nullptr, SanitizeEx, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"escape", nullptr, Escape, nullptr, nullptr, nullptr, napi_default, nullptr},
  };

  napi_define_properties(env, exports, sizeof(props) / sizeof(props[0]), props);
  return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)
