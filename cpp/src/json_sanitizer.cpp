#include "json_sanitizer.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace json_sanitizer {

// ---------------- Character helpers ----------------

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static bool is_oct(char c) { return c >= '0' && c <= '7'; }

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool is_hex(char c) { return hex_val(c) >= 0; }

static void append_hex(std::string& out, uint32_t value, int digits) {
  static const char kHex[] = "0123456789abcdef";
  for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
    out.push_back(kHex[(value >> shift) & 0xF]);
  }
}

static std::string unicode_escape(uint32_t value) {
  std::string out = "\\u";
  append_hex(out, value, 4);
  return out;
}

// Characters that may appear in an unquoted keyword, number or property name.
static bool is_run_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) || c == '+' || c == '-' || c == '.' ||
         c == '_' || c == '$' || c == '`';
}

static bool is_json_special(char c) {
  if (static_cast<unsigned char>(c) <= ' ') return true;
  switch (c) {
    case '"': case ',': case ':': case '[': case ']': case '{': case '}':
      return true;
    default:
      return false;
  }
}

static bool is_line_or_paragraph_separator(std::string_view s, size_t i) {
  return i + 2 < s.size() && static_cast<unsigned char>(s[i]) == 0xE2 && static_cast<unsigned char>(s[i + 1]) == 0x80 &&
         (static_cast<unsigned char>(s[i + 2]) == 0xA8 || static_cast<unsigned char>(s[i + 2]) == 0xA9);
}

struct Utf8Char {
  uint32_t value{0};
  size_t width{0};  // 0 when the bytes at pos are not well-formed UTF-8
};

// Decodes one scalar starting at pos without reading at or past end.
// Encoded surrogates (ED A0..BF xx) decode to their code unit so callers can escape them.
static Utf8Char decode_utf8(std::string_view s, size_t pos, size_t end) {
  const auto b0 = static_cast<unsigned char>(s[pos]);
  if (b0 < 0x80) return {b0, 1};

  size_t trail = 0;
  uint32_t cp = 0;
  uint32_t min = 0;
  if ((b0 & 0xE0) == 0xC0) {
    trail = 1;
    cp = b0 & 0x1F;
    min = 0x80;
  } else if ((b0 & 0xF0) == 0xE0) {
    trail = 2;
    cp = b0 & 0x0F;
    min = 0x800;
  } else if ((b0 & 0xF8) == 0xF0) {
    trail = 3;
    cp = b0 & 0x07;
    min = 0x10000;
  } else {
    return {};
  }
  if (pos + trail >= end) return {};

  for (size_t k = 1; k <= trail; ++k) {
    const auto b = static_cast<unsigned char>(s[pos + k]);
    if ((b & 0xC0) != 0x80) return {};
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF) return {};
  return {cp, trail + 1};
}

// ---------------- Lookaround ----------------

struct LogicalChar {
  uint32_t value{0};
  size_t width{0};  // raw bytes the character occupies in the input
};

// Length of the run of backslashes that ends just before `end`.
static size_t backslash_run(std::string_view s, size_t end) {
  size_t left = end;
  while (left > 0 && s[left - 1] == '\\') --left;
  return end - left;
}

// The character at `left` as a JS string literal would see it: escape
// sequences are decoded so that e.g. "\x3c" reads as '<'.
static LogicalChar logical_char_at(std::string_view s, size_t left) {
  const size_t n = s.size();
  if (left >= n) return {};
  const char c = s[left];
  if (c != '\\') return {static_cast<unsigned char>(c), 1};
  if (left + 1 == n) return {0, 1};

  const char nc = s[left + 1];
  switch (nc) {
    case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
      const size_t octal_start = left + 1;
      size_t octal_end = octal_start + 1;
      if (octal_end < n && is_oct(s[octal_end])) {
        ++octal_end;
        if (nc <= '3' && octal_end < n && is_oct(s[octal_end])) ++octal_end;
      }
      uint32_t value = 0;
      for (size_t j = octal_start; j < octal_end; ++j) value = (value << 3) | static_cast<uint32_t>(s[j] - '0');
      return {value, octal_end - left};
    }
    case 'x':
      if (left + 3 < n) {
        const int d0 = hex_val(s[left + 2]);
        const int d1 = hex_val(s[left + 3]);
        if (d0 >= 0 && d1 >= 0) return {static_cast<uint32_t>((d0 << 4) | d1), 4};
      }
      break;
    case 'u':
      if (left + 5 < n) {
        uint32_t value = 0;
        bool ok = true;
        for (size_t j = left + 2; j < left + 6; ++j) {
          const int d = hex_val(s[j]);
          if (d < 0) {
            ok = false;
            break;
          }
          value = (value << 4) | static_cast<uint32_t>(d);
        }
        if (ok) return {value, 6};
      }
      break;
    case 'b':
      return {'\b', 2};
    case 'f':
      return {'\f', 2};
    case 'n':
      return {'\n', 2};
    case 'r':
      return {'\r', 2};
    case 't':
      return {'\t', 2};
    case 'v':
      return {0x08, 2};
    default:
      break;
  }
  return {static_cast<unsigned char>(nc), 2};
}

// The logical character whose last raw byte is at end - 1.
static LogicalChar logical_char_before(std::string_view s, size_t end) {
  if (end == 0) return {};
  const size_t last = end - 1;
  // The longest escape, \uXXXX, is six bytes.
  for (size_t i = 1; i < 6 && i <= last; ++i) {
    const size_t left = last - i;
    if (s[left] == '\\') {
      if ((backslash_run(s, left + 1) & 1) == 1) {
        const LogicalChar c = logical_char_at(s, left);
        if (c.width == i + 1) return c;
      }
      break;
    }
  }
  return {static_cast<unsigned char>(s[last]), 1};
}

// ---------------- Numbers ----------------

// Digits that always fit in a uint64_t.
static size_t native_digit_limit(int base) { return base == 16 ? 16 : 21; }

static std::string digits_to_decimal(std::string_view digits, int base) {
  if (digits.empty()) return "0";

  if (digits.size() <= native_digit_limit(base)) {
    uint64_t value = 0;
    for (char c : digits) value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(hex_val(c));
    return std::to_string(value);
  }

  // Little-endian base 10^9 limbs.
  constexpr uint32_t kLimb = 1000000000u;
  std::vector<uint32_t> limbs{0};
  for (char c : digits) {
    uint64_t carry = static_cast<uint64_t>(hex_val(c));
    for (auto& limb : limbs) {
      const uint64_t cur = static_cast<uint64_t>(limb) * static_cast<uint64_t>(base) + carry;
      limb = static_cast<uint32_t>(cur % kLimb);
      carry = cur / kLimb;
    }
    while (carry != 0) {
      limbs.push_back(static_cast<uint32_t>(carry % kLimb));
      carry /= kLimb;
    }
  }

  std::string out = std::to_string(limbs.back());
  for (size_t i = limbs.size() - 1; i-- > 0;) {
    const std::string part = std::to_string(limbs[i]);
    out.append(9 - part.size(), '0');
    out += part;
  }
  return out;
}

// Longest fraction kept when a number is turned into a property name.
constexpr size_t kMaxCanonicalFractionDigits = 24;
// Exponents beyond this are left alone rather than expanded into zeros, so the
// output of a key stays linear in the length of its text.
constexpr int kMaxCanonicalExponent = 400;

// Rewrites a normalized JSON number into the plain decimal form used for
// property names: 1.50e1 -> 15, -0.0 -> 0, .5e-1 -> 0.05.
// Returns false, leaving `num` untouched, if the exponent is unusable.
static bool canonicalize_number_text(std::string& num) {
  size_t pos = 0;
  const bool negative = !num.empty() && num[0] == '-';
  if (negative) ++pos;

  const size_t int_start = pos;
  while (pos < num.size() && is_digit(num[pos])) ++pos;
  std::string digits = num.substr(int_start, pos - int_start);
  long point = static_cast<long>(digits.size());

  if (pos < num.size() && num[pos] == '.') {
    const size_t frac_start = ++pos;
    while (pos < num.size() && is_digit(num[pos])) ++pos;
    digits.append(num, frac_start, pos - frac_start);
  }

  if (pos < num.size() && (num[pos] == 'e' || num[pos] == 'E')) {
    ++pos;
    bool exp_negative = false;
    if (pos < num.size() && (num[pos] == '+' || num[pos] == '-')) {
      exp_negative = num[pos] == '-';
      ++pos;
    }
    int magnitude = 0;
    const char* first = num.data() + pos;
    const char* last = num.data() + num.size();
    auto [ptr, ec] = std::from_chars(first, last, magnitude);
    if (ec != std::errc() || ptr != last || magnitude > kMaxCanonicalExponent) return false;
    point += exp_negative ? -magnitude : magnitude;
  } else if (pos != num.size()) {
    return false;
  }

  if (point < 0) {
    digits.insert(0, static_cast<size_t>(-point), '0');
    point = 0;
  } else if (static_cast<size_t>(point) > digits.size()) {
    digits.append(static_cast<size_t>(point) - digits.size(), '0');
  }

  std::string int_part = digits.substr(0, static_cast<size_t>(point));
  std::string frac_part = digits.substr(static_cast<size_t>(point));

  const size_t first_nonzero = int_part.find_first_not_of('0');
  int_part = first_nonzero == std::string::npos ? "0" : int_part.substr(first_nonzero);

  if (frac_part.size() > kMaxCanonicalFractionDigits) frac_part.resize(kMaxCanonicalFractionDigits);
  const size_t last_nonzero = frac_part.find_last_not_of('0');
  frac_part.resize(last_nonzero == std::string::npos ? 0 : last_nonzero + 1);

  const bool zero = int_part == "0" && frac_part.empty();

  std::string out;
  out.reserve(int_part.size() + frac_part.size() + 2);
  if (negative && !zero) out.push_back('-');
  out += int_part;
  if (!frac_part.empty()) {
    out.push_back('.');
    out += frac_part;
  }
  num = std::move(out);
  return true;
}

// ---------------- Sanitizer ----------------

enum class State {
  StartArray,
  BeforeElement,
  AfterElement,
  StartMap,
  BeforeKey,
  AfterKey,
  BeforeValue,
  AfterValue,
};

// Outcome of one dispatch step.
enum class Step {
  Continue,
  // Everything from the current token on is dropped.
  Stop,
};

static size_t end_of_quoted_string(std::string_view s, size_t start) {
  const char quote = s[start];
  for (size_t i = start; (i = s.find(quote, i + 1)) != std::string_view::npos;) {
    // An even run of backslashes leaves the quote unescaped.
    if ((backslash_run(s, i) & 1) == 0) return i + 1;
  }
  return s.size();
}

struct Sanitizer {
  std::string_view s;
  size_t max_depth;
  SanitizeConfig::DepthLimitPolicy depth_limit_policy;

  // Output: s[0, cleaned) with edits applied lives in `out`; s[cleaned, ...) is not yet copied.
  std::string out;
  size_t cleaned{0};
  size_t edit_count{0};

  // true = map, false = array.
  std::vector<bool> brackets;
  size_t deepest{0};

  bool truncated{false};
  bool depth_limited{false};
  int closed_brackets{0};

  Sanitizer(std::string_view in, int max_nesting_depth, SanitizeConfig::DepthLimitPolicy policy)
      : s(in), max_depth(static_cast<size_t>(clamp_nesting_depth(max_nesting_depth))), depth_limit_policy(policy) {}

  bool modified() const { return edit_count != 0; }

  // ---- edit journal ----

  void flush_to(size_t pos) {
    if (edit_count == 0 && out.empty()) out.reserve(s.size() + 16);
    if (pos > cleaned) {
      out.append(s.data() + cleaned, pos - cleaned);
      cleaned = pos;
    }
  }

  void elide(size_t start, size_t end) {
    flush_to(start);
    if (end > cleaned) cleaned = end;
    ++edit_count;
  }

  void insert(size_t pos, std::string_view text) {
    flush_to(pos);
    out.append(text.data(), text.size());
    ++edit_count;
  }

  void insert(size_t pos, char c) {
    flush_to(pos);
    out.push_back(c);
    ++edit_count;
  }

  void replace(size_t start, size_t end, std::string_view text) {
    elide(start, end);
    out.append(text.data(), text.size());
  }

  void replace(size_t start, size_t end, char c) {
    elide(start, end);
    out.push_back(c);
  }

  Step truncate(size_t pos) {
    elide(pos, s.size());
    truncated = true;
    return Step::Stop;
  }

  // Drops the comma that precedes close_pos, looking first at input not yet
  // flushed and then at the output.
  void elide_trailing_comma(size_t close_pos) {
    for (size_t i = close_pos; i > cleaned;) {
      --i;
      switch (s[i]) {
        case '\t': case '\n': case '\r': case ' ':
          continue;
        case ',':
          elide(i, i + 1);
          return;
        default:
          return;
      }
    }
    for (size_t i = out.size(); i > 0;) {
      --i;
      switch (out[i]) {
        case '\t': case '\n': case '\r': case ' ':
          continue;
        case ',':
          out.resize(i);
          ++edit_count;
          return;
        default:
          return;
      }
    }
  }

  // ---- dispatcher ----

  // Moves to the state after a value-bearing token at pos, inserting whatever
  // punctuation the token needs in front of it.
  Step require_value_state(size_t pos, State& state, bool can_be_key) {
    switch (state) {
      case State::StartMap: case State::BeforeKey:
        if (can_be_key) {
          state = State::AfterKey;
        } else {
          insert(pos, "\"\":");
          state = State::AfterValue;
        }
        return Step::Continue;
      case State::AfterKey:
        insert(pos, ':');
        state = State::AfterValue;
        return Step::Continue;
      case State::BeforeValue:
        state = State::AfterValue;
        return Step::Continue;
      case State::AfterValue:
        if (can_be_key) {
          insert(pos, ',');
          state = State::AfterKey;
        } else {
          insert(pos, ",\"\":");
        }
        return Step::Continue;
      case State::StartArray: case State::BeforeElement:
        state = State::AfterElement;
        return Step::Continue;
      case State::AfterElement:
        // A second top-level value: treat like an unbracketed comma.
        if (brackets.empty()) return Step::Stop;
        insert(pos, ',');
        return Step::Continue;
    }
    return Step::Continue;
  }

  bool is_keyword(size_t start, size_t end) const {
    const std::string_view word = s.substr(start, end - start);
    return word == "true" || word == "false" || word == "null";
  }

  Step open_bracket(size_t i, State& state) {
    if (brackets.size() >= max_depth) {
      depth_limited = true;
      if (depth_limit_policy == SanitizeConfig::DepthLimitPolicy::Error) {
        throw SanitizeError("nesting depth exceeds " + std::to_string(max_depth) + " at offset " + std::to_string(i),
                            i, static_cast<int>(max_depth));
      }
      return truncate(i);
    }
    if (require_value_state(i, state, false) == Step::Stop) return truncate(i);

    const bool map = s[i] == '{';
    brackets.push_back(map);
    deepest = std::max(deepest, brackets.size());
    state = map ? State::StartMap : State::StartArray;
    return Step::Continue;
  }

  Step close_bracket(size_t i, State& state) {
    if (brackets.empty()) return truncate(i);

    switch (state) {
      case State::BeforeValue:
        insert(i, "null");
        break;
      case State::BeforeElement: case State::BeforeKey:
        elide_trailing_comma(i);
        break;
      case State::AfterKey:
        insert(i, ":null");
        break;
      default:
        break;
    }

    const bool map = brackets.back();
    brackets.pop_back();
    const char close = map ? '}' : ']';
    if (s[i] != close) replace(i, i + 1, close);
    state = brackets.empty() || !brackets.back() ? State::AfterElement : State::AfterValue;
    return Step::Continue;
  }

  Step comma(size_t i, State& state) {
    if (brackets.empty()) return truncate(i);

    switch (state) {
      case State::AfterElement:
        state = State::BeforeElement;
        break;
      case State::AfterValue:
        state = State::BeforeKey;
        break;
      // [1,,3] -> [1,null,3]
      case State::StartArray: case State::BeforeElement:
        insert(i, "null");
        state = State::BeforeElement;
        break;
      case State::StartMap: case State::BeforeKey: case State::AfterKey:
        elide(i, i + 1);
        break;
      case State::BeforeValue:
        insert(i, "null");
        state = State::BeforeKey;
        break;
    }
    return Step::Continue;
  }

  // Elides a // or /* comment starting at i, or a lone '/'. Returns the index of the last byte consumed.
  size_t comment(size_t i) {
    const size_t n = s.size();
    const size_t start = i;
    size_t stop = i + 1;
    if (i + 1 < n) {
      if (s[i + 1] == '/') {
        stop = n;
        for (size_t j = start + 2; j < n; ++j) {
          if (s[j] == '\n' || s[j] == '\r') {
            stop = j + 1;
            break;
          }
          if (is_line_or_paragraph_separator(s, j)) {
            stop = j + 3;
            break;
          }
        }
      } else if (s[i + 1] == '*') {
        const size_t close = s.find("*/", start + 2);
        stop = close == std::string_view::npos ? n : close + 2;
      }
    }
    elide(start, stop);
    return stop - 1;
  }

  // Keywords, numbers, unquoted property names and stray cruft.
  Step bare_token(size_t& i, State& state) {
    const size_t n = s.size();
    size_t run_end = i;
    while (run_end < n && is_run_char(s[run_end])) ++run_end;

    if (run_end == i) {
      elide(i, i + 1);
      return Step::Continue;
    }

    if (require_value_state(i, state, true) == Step::Stop) return truncate(i);

    const char ch = s[i];
    const bool is_number = is_digit(ch) || ch == '.' || ch == '+' || ch == '-';
    const bool keyword = !is_number && is_keyword(i, run_end);

    if (!is_number && !keyword) {
      // It will be quoted, so take in everything up to the next JSON delimiter.
      while (run_end < n && !is_json_special(s[run_end])) ++run_end;
      if (run_end < n && s[run_end] == '"') ++run_end;
    }

    if (state == State::AfterKey) {
      // Only strings can be property names; { .5e-1: 0 } means { "0.05": 0 }.
      insert(i, '"');
      if (is_number) {
        canonicalize_number(i, run_end);
        insert(run_end, '"');
      } else {
        sanitize_string(i, run_end);
      }
    } else if (is_number) {
      normalize_number(i, run_end);
    } else if (!keyword) {
      insert(i, '"');
      sanitize_string(i, run_end);
    }

    i = run_end - 1;
    return Step::Continue;
  }

  Step dispatch(size_t& i, State& state) {
    switch (s[i]) {
      case '\t': case '\n': case '\r': case ' ':
        return Step::Continue;

      case '"': case '\'': {
        if (require_value_state(i, state, true) == Step::Stop) return truncate(i);
        const size_t str_end = end_of_quoted_string(s, i);
        sanitize_string(i, str_end);
        i = str_end - 1;
        return Step::Continue;
      }

      // JSON-ish is often wrapped in parentheses to make it a JS expression.
      case '(': case ')':
        elide(i, i + 1);
        return Step::Continue;

      case '{': case '[':
        return open_bracket(i, state);

      case '}': case ']':
        return close_bracket(i, state);

      case ',':
        return comma(i, state);

      case ':':
        if (state == State::AfterKey) {
          state = State::BeforeValue;
        } else {
          elide(i, i + 1);
        }
        return Step::Continue;

      case '/':
        i = comment(i);
        return Step::Continue;

      default:
        return bare_token(i, state);
    }
  }

  void run() {
    const size_t n = s.size();
    State state = State::StartArray;

    for (size_t i = 0; i < n; ++i) {
      if (dispatch(i, state) == Step::Stop) break;
    }

    if (state == State::StartArray && brackets.empty()) {
      // Nothing but whitespace, comments or cruft: the document is just null.
      out.clear();
      cleaned = 0;
      replace(0, n, "null");
      state = State::AfterElement;
    }

    if (!modified() && brackets.empty()) return;

    flush_to(n);
    switch (state) {
      case State::BeforeElement: case State::BeforeKey:
        elide_trailing_comma(n);
        break;
      case State::AfterKey:
        insert(n, ":null");
        break;
      case State::BeforeValue:
        insert(n, "null");
        break;
      default:
        break;
    }

    closed_brackets = static_cast<int>(brackets.size());
    while (!brackets.empty()) {
      insert(n, brackets.back() ? '}' : ']');
      brackets.pop_back();
    }
  }

  // ---- strings ----

  // Normalizes the string token s[start, end). The token is either quoted
  // (s[start] is ' or ") or a bare word that the caller has already opened
  // with an inserted '"'.
  void sanitize_string(size_t start, size_t end) {
    bool closed = false;
    const char start_delim = s[start] == '\'' ? '\'' : '"';

    for (size_t i = start; i < end; ++i) {
      const char ch = s[i];
      switch (ch) {
        case '\t':
          replace(i, i + 1, "\\t");
          break;
        case '\n':
          replace(i, i + 1, "\\n");
          break;
        case '\r':
          replace(i, i + 1, "\\r");
          break;

        case '"': case '\'':
          if (i == start) {
            if (ch == '\'') replace(i, i + 1, '"');
          } else {
            if (i + 1 == end) closed = start_delim == ch;
            if (closed) {
              if (ch == '\'') replace(i, i + 1, '"');
            } else if (ch == '"') {
              insert(i, '\\');
            }
          }
          break;

        case '<': {
          // <!--, <script and </script
          if (i + 3 >= end) break;
          size_t la = i + 1;
          const LogicalChar c1 = logical_char_at(s, la);
          la += c1.width;
          const LogicalChar c2 = logical_char_at(s, la);
          la += c2.width;
          const LogicalChar c3 = logical_char_at(s, la);
          const uint32_t lc1 = c1.value | 32;
          const uint32_t lc2 = c2.value | 32;
          const uint32_t lc3 = c3.value | 32;
          if ((c1.value == '!' && c2.value == '-' && c3.value == '-') || (lc1 == 's' && lc2 == 'c' && lc3 == 'r') ||
              (c1.value == '/' && lc2 == 's' && lc3 == 'c')) {
            replace(i, i + 1, "\\u003c");
          }
          break;
        }

        case '>': {
          // -->
          if (i < start + 2) break;
          size_t lb = i;
          // An escaped '>' looks behind its backslash.
          if ((backslash_run(s, lb) & 1) == 1) --lb;
          const LogicalChar cm1 = logical_char_before(s, lb);
          if (cm1.value == '-') {
            lb -= cm1.width;
            const LogicalChar cm2 = logical_char_before(s, lb);
            if (cm2.value == '-') replace(i, i + 1, "\\u003e");
          }
          break;
        }

        case ']': {
          // ]]>
          if (i + 2 >= end) break;
          size_t la = i + 1;
          const LogicalChar c1 = logical_char_at(s, la);
          la += c1.width;
          const LogicalChar c2 = logical_char_at(s, la);
          if (c1.value == ']' && c2.value == '>') replace(i, i + 1, "\\u005d");
          break;
        }

        case '\\':
          i = sanitize_escape(i, end);
          break;

        default: {
          const auto b = static_cast<unsigned char>(ch);
          if (b < 0x20) {
            std::string esc = "\\u00";
            append_hex(esc, b, 2);
            replace(i, i + 1, esc);
          } else if (b >= 0x80) {
            const Utf8Char u = decode_utf8(s, i, end);
            if (u.width == 0) {
              replace(i, i + 1, "\\ufffd");
              break;
            }
            // Line/paragraph separators end JS string literals; surrogates
            // and U+FFFE/U+FFFF are not allowed in XML.
            if (u.value == 0x2028 || u.value == 0x2029 || (u.value >= 0xD800 && u.value <= 0xDFFF) ||
                u.value == 0xFFFE || u.value == 0xFFFF) {
              replace(i, i + u.width, unicode_escape(u.value));
            }
            i += u.width - 1;
          }
          break;
        }
      }
    }

    if (!closed) insert(end, '"');
  }

  // Handles the backslash at i. Returns the index of the last byte consumed.
  size_t sanitize_escape(size_t i, size_t end) {
    if (i + 1 == end) {
      elide(i, i + 1);
      return i;
    }

    const char sch = s[i + 1];
    switch (sch) {
      case 'b': case 'f': case 'n': case 'r': case 't': case '\\': case '/': case '"':
        return i + 1;

      // JS, not JSON.
      case 'v':
        replace(i, i + 2, "\\u0008");
        return i + 1;

      case 'x':
        if (i + 3 < end && is_hex(s[i + 2]) && is_hex(s[i + 3])) {
          replace(i, i + 2, "\\u00");
          return i + 3;
        }
        elide(i, i + 1);
        return i;

      case 'u':
        if (i + 5 < end && is_hex(s[i + 2]) && is_hex(s[i + 3]) && is_hex(s[i + 4]) && is_hex(s[i + 5])) {
          return i + 5;
        }
        elide(i, i + 1);
        return i;

      case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': {
        const size_t octal_start = i + 1;
        size_t octal_end = octal_start + 1;
        if (octal_end < end && is_oct(s[octal_end])) {
          ++octal_end;
          // At most one byte: \377.
          if (sch <= '3' && octal_end < end && is_oct(s[octal_end])) ++octal_end;
        }
        uint32_t value = 0;
        for (size_t j = octal_start; j < octal_end; ++j) value = (value << 3) | static_cast<uint32_t>(s[j] - '0');
        std::string esc = "u00";
        append_hex(esc, value, 2);
        replace(octal_start, octal_end, esc);
        return octal_end - 1;
      }

      default:
        // "\-" is valid JS but not JSON: keep the character, drop the backslash.
        elide(i, i + 1);
        return i;
    }
  }

  // ---- numbers ----

  size_t end_of_digit_run(size_t start, size_t limit) const {
    size_t end = start;
    while (end < limit && is_digit(s[end])) ++end;
    return end;
  }

  // Makes s[start, end) a JSON number: no '+' sign, hex and octal integers in
  // decimal, non-empty integer, fraction and exponent digits, no trailing junk.
  void normalize_number(size_t start, size_t end) {
    size_t pos = start;

    if (pos < end) {
      if (s[pos] == '+') {
        elide(pos, pos + 1);
        ++pos;
      } else if (s[pos] == '-') {
        ++pos;
      }
    }

    size_t int_end = end_of_digit_run(pos, end);
    if (pos == int_end) {
      insert(pos, '0');
    } else if (s[pos] == '0') {
      bool reencode = false;
      int base = 10;
      size_t digits_start = pos;
      int max_digit = 0;
      if (int_end - pos == 1 && int_end < end && (s[int_end] | 0x20) == 'x') {
        base = 16;
        digits_start = int_end + 1;
        for (int_end = digits_start; int_end < end; ++int_end) {
          const int d = hex_val(s[int_end]);
          if (d < 0) break;
          max_digit = std::max(max_digit, d);
        }
        reencode = true;
      } else if (int_end - pos > 1) {
        base = 8;
        for (size_t j = pos; j < int_end; ++j) max_digit = std::max(max_digit, s[j] - '0');
        reencode = true;
      }
      if (reencode) {
        // 08 and 09 cannot be octal; read the digits as hex rather than guess.
        if (base == 8 && max_digit > 7) base = 16;
        replace(pos, int_end, digits_to_decimal(s.substr(digits_start, int_end - digits_start), base));
      }
    }
    pos = int_end;

    if (pos < end && s[pos] == '.') {
      ++pos;
      const size_t fraction_end = end_of_digit_run(pos, end);
      if (fraction_end == pos) insert(fraction_end, '0');
      pos = fraction_end;
    }

    if (pos < end && (s[pos] | 0x20) == 'e') {
      ++pos;
      if (pos < end && (s[pos] == '+' || s[pos] == '-')) ++pos;
      const size_t exp_end = end_of_digit_run(pos, end);
      if (exp_end == pos) insert(exp_end, '0');
      pos = exp_end;
    }

    if (pos != end) elide(pos, end);
  }

  // Normalizes s[start, end) and rewrites the result in the output into the
  // decimal form JS uses when a number literal names a property.
  void canonicalize_number(size_t start, size_t end) {
    flush_to(start);
    const size_t san_start = out.size();
    normalize_number(start, end);
    flush_to(end);

    std::string num = out.substr(san_start);
    if (canonicalize_number_text(num)) out.replace(san_start, std::string::npos, num);
  }
};

int clamp_nesting_depth(int max_nesting_depth) {
  return std::min(std::max(1, max_nesting_depth), kMaximumNestingDepth);
}

SanitizeResult sanitize_ex(std::string text, const SanitizeConfig& config) {
  Sanitizer sanitizer(text, config.max_nesting_depth, config.depth_limit_policy);
  sanitizer.run();

  SanitizeResult result;
  result.metadata.modified = sanitizer.modified();
  result.metadata.truncated = sanitizer.truncated;
  result.metadata.depth_limited = sanitizer.depth_limited;
  result.metadata.closed_brackets = sanitizer.closed_brackets;
  result.metadata.max_depth = static_cast<int>(sanitizer.deepest);
  result.metadata.effective_max_nesting_depth = static_cast<int>(sanitizer.max_depth);
  result.metadata.edit_count = sanitizer.edit_count;

  if (sanitizer.modified()) {
    result.text = std::move(sanitizer.out);
  } else {
    result.text = std::move(text);
  }
  return result;
}

std::string sanitize(std::string text, const SanitizeConfig& config) {
  return sanitize_ex(std::move(text), config).text;
}

std::string sanitize(std::string text, int max_nesting_depth) {
  SanitizeConfig config;
  config.max_nesting_depth = max_nesting_depth;
  return sanitize_ex(std::move(text), config).text;
}

// ---------------- Escaping ----------------

std::string escape(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '<': out += "\\u003c"; break;
      case '>': out += "\\u003e"; break;
      default: {
        const auto b = static_cast<unsigned char>(c);
        if (b < 0x20) {
          out += unicode_escape(b);
        } else if (b < 0x80) {
          out.push_back(c);
        } else {
          const Utf8Char u = decode_utf8(text, i, text.size());
          if (u.width == 0) {
            out += "\\ufffd";
            break;
          }
          if (u.value == 0x2028 || u.value == 0x2029 || (u.value >= 0xD800 && u.value <= 0xDFFF)) {
            out += unicode_escape(u.value);
          } else {
            out.append(text.data() + i, u.width);
          }
          i += u.width - 1;
        }
      }
    }
  }
  return out;
}

}  // namespace json_sanitizer
