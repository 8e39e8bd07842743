#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace json_sanitizer {

// Nesting depth used when the caller does not pick one.
constexpr int kDefaultNestingDepth = 64;
// Upper bound on any requested nesting depth.
constexpr int kMaximumNestingDepth = 4096;

struct SanitizeError : public std::runtime_error {
  std::string message;
  std::string kind;  // limit
  size_t offset{0};
  int max_depth{0};
  explicit SanitizeError(std::string message, size_t offset_ = 0, int max_depth_ = 0, std::string kind_ = "limit")
      : std::runtime_error(message), message(std::move(message)), kind(std::move(kind_)), offset(offset_), max_depth(max_depth_) {}

  const char* what() const noexcept override { return message.c_str(); }
};

// ---------------- Sanitizer ----------------

struct SanitizeConfig {
  // Clamped to [1, kMaximumNestingDepth].
  int max_nesting_depth{kDefaultNestingDepth};

  enum class DepthLimitPolicy {
    // Throw SanitizeError at the bracket that would exceed the limit.
    Error,
    // Drop everything from that bracket on and close what is open.
    Truncate,
  };

  DepthLimitPolicy depth_limit_policy{DepthLimitPolicy::Error};
};

struct SanitizeMetadata {
  // False means the returned text is the input, untouched.
  bool modified{false};
  // Input was cut short (unbracketed comma, stray closer, or depth truncation).
  bool truncated{false};
  bool depth_limited{false};

  // Containers still open at end of input that had to be closed.
  int closed_brackets{0};
  // Deepest nesting seen.
  int max_depth{0};
  int effective_max_nesting_depth{kDefaultNestingDepth};

  size_t edit_count{0};
};

struct SanitizeResult {
  std::string text;
  SanitizeMetadata metadata;
};

int clamp_nesting_depth(int max_nesting_depth);

// Repairs JSON-ish text into valid JSON that is also safe to embed in HTML
// <script> blocks, XML CDATA sections and JS string contexts.
//
// The text is taken by value: when nothing needs repairing, the same buffer is
// moved back out, so `sanitize(std::move(s))` does not copy valid input.
// Throws SanitizeError if the nesting limit is hit under DepthLimitPolicy::Error.
std::string sanitize(std::string text, int max_nesting_depth = kDefaultNestingDepth);

std::string sanitize(std::string text, const SanitizeConfig& config);

// Like sanitize(), but also reports what was repaired.
SanitizeResult sanitize_ex(std::string text, const SanitizeConfig& config = SanitizeConfig{});

// ---------------- Escaping ----------------

// Escapes a raw string value for embedding between JSON double quotes
// (RFC 8259 plus <, >, U+2028, U+2029 and lone surrogates). No repair is done.
std::string escape(std::string_view text);

}  // namespace json_sanitizer
