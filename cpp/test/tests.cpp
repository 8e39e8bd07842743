#include "json_sanitizer.hpp"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <iostream>
#include <random>
#include <string>
#include <string_view>

using namespace json_sanitizer;

// ---------------- Strict JSON checker ----------------

// Minimal RFC 8259 recognizer used to check sanitizer output.
struct StrictJson {
  std::string_view s;
  size_t i{0};

  void ws() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
  }

  bool lit(std::string_view word) {
    if (s.substr(i, word.size()) != word) return false;
    i += word.size();
    return true;
  }

  bool digits() {
    const size_t start = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    return i > start;
  }

  bool number() {
    if (i < s.size() && s[i] == '-') ++i;
    if (i < s.size() && s[i] == '0') {
      ++i;
    } else if (!digits()) {
      return false;
    }
    if (i < s.size() && s[i] == '.') {
      ++i;
      if (!digits()) return false;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (!digits()) return false;
    }
    return true;
  }

  bool string() {
    if (i >= s.size() || s[i] != '"') return false;
    ++i;
    while (i < s.size()) {
      const auto c = static_cast<unsigned char>(s[i]);
      if (c == '"') {
        ++i;
        return true;
      }
      if (c < 0x20) return false;
      if (c == '\\') {
        if (i + 1 >= s.size()) return false;
        const char e = s[i + 1];
        if (e == 'u') {
          if (i + 5 >= s.size()) return false;
          for (size_t k = i + 2; k < i + 6; ++k) {
            if (!std::isxdigit(static_cast<unsigned char>(s[k]))) return false;
          }
          i += 6;
          continue;
        }
        if (std::string_view("\"\\/bfnrt").find(e) == std::string_view::npos) return false;
        i += 2;
        continue;
      }
      ++i;
    }
    return false;
  }

  bool value() {
    ws();
    if (i >= s.size()) return false;
    switch (s[i]) {
      case '{': {
        ++i;
        ws();
        if (i < s.size() && s[i] == '}') {
          ++i;
          return true;
        }
        for (;;) {
          ws();
          if (!string()) return false;
          ws();
          if (i >= s.size() || s[i] != ':') return false;
          ++i;
          if (!value()) return false;
          ws();
          if (i < s.size() && s[i] == ',') {
            ++i;
            continue;
          }
          if (i < s.size() && s[i] == '}') {
            ++i;
            return true;
          }
          return false;
        }
      }
      case '[': {
        ++i;
        ws();
        if (i < s.size() && s[i] == ']') {
          ++i;
          return true;
        }
        for (;;) {
          if (!value()) return false;
          ws();
          if (i < s.size() && s[i] == ',') {
            ++i;
            continue;
          }
          if (i < s.size() && s[i] == ']') {
            ++i;
            return true;
          }
          return false;
        }
      }
      case '"':
        return string();
      case 't':
        return lit("true");
      case 'f':
        return lit("false");
      case 'n':
        return lit("null");
      default:
        return number();
    }
  }
};

static bool is_strict_json(std::string_view text) {
  StrictJson p{text};
  if (!p.value()) return false;
  p.ws();
  return p.i == text.size();
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Nothing that could end a <script> element, open or close an HTML comment,
// end a CDATA section or end a JS string literal.
static bool is_embeddable(const std::string& out) {
  const std::string l = lower(out);
  for (const char* bad : {"<script", "</script", "<!--", "-->", "]]>", "\xe2\x80\xa8", "\xe2\x80\xa9"}) {
    if (l.find(bad) != std::string::npos) return false;
  }
  return true;
}

static void expect(const std::string& in, const std::string& want) {
  const std::string got = sanitize(in);
  if (got != want) {
    std::cerr << "  input: " << in << "\n  want:  " << want << "\n  got:   " << got << "\n";
  }
  assert(got == want);
  assert(is_strict_json(got));
  assert(sanitize(got) == got);
}

// ---------------- Tests ----------------

static void test_strict_checker_sanity() {
  assert(is_strict_json("{\"a\":[1,-0.5e+3,true,null,\"x\\u0041\"]}"));
  assert(!is_strict_json("[1,]"));
  assert(!is_strict_json("{a:1}"));
  assert(!is_strict_json("01"));
  assert(!is_strict_json("1 2"));
}

static void test_valid_json_untouched() {
  for (const char* in : {"{}", "[]", "null", "true", "0", "-1.5e10", "\"\"", "{\"a\":[1,{\"b\":null}],\"c\":\"d\"}",
                         " [ 1 , 2 ] ", "\"caf\xc3\xa9\""}) {
    auto r = sanitize_ex(in);
    assert(r.text == in);
    assert(!r.metadata.modified);
    assert(r.metadata.edit_count == 0);
  }
}

static void test_zero_copy_on_valid_input() {
  std::string s = "{\"key\":[1,2,3],\"other\":\"a value long enough to live on the heap\"}";
  const char* p = s.data();
  std::string out = sanitize(std::move(s));
  assert(out.data() == p);
  assert(out == "{\"key\":[1,2,3],\"other\":\"a value long enough to live on the heap\"}");
}

static void test_empty_and_junk_become_null() {
  expect("", "null");
  expect("   ", "null");
  expect("\t\n", "null");
  expect(" /* c */ ", "null");
  expect("  ) ", "null");
  expect("/* nothing */", "null");
  expect("]", "null");
  expect(",", "null");

  auto r = sanitize_ex("  ");
  assert(r.text == "null");
  assert(r.metadata.modified);
}

static void test_quotes_and_unquoted_names() {
  expect("{foo:'bar'}", "{\"foo\":\"bar\"}");
  expect("{\"a\" \"b\"}", "{\"a\" :\"b\"}");
  expect("{a:1 b:2}", "{\"a\":1 ,\"b\":2}");
  expect("['it\"s']", "[\"it\\\"s\"]");
  expect("'a\\'b'", "\"a'b\"");
  expect("[True]", "[\"True\"]");
  expect("[true,false,null]", "[true,false,null]");
}

static void test_commas_and_missing_values() {
  expect("[1,2,3,]", "[1,2,3]");
  expect("[0,,2]", "[0,null,2]");
  expect("[,]", "[null]");
  expect("{\"a\":1,}", "{\"a\":1}");
  expect("{,}", "{}");
  expect("{\"a\":}", "{\"a\":null}");
  expect("{\"a\"}", "{\"a\":null}");
  expect("[1 2]", "[1 ,2]");
  expect("[1:2]", "[1,2]");
  expect("{[1]}", "{\"\":[1]}");
}

static void test_unclosed_brackets_and_strings() {
  expect("{a:1", "{\"a\":1}");
  expect("[1,[2", "[1,[2]]");
  expect("[\"abc", "[\"abc\"]");
  expect("{\"a\":", "{\"a\":null}");
  expect("{\"a\"", "{\"a\":null}");
  expect("[1,", "[1]");
  expect("[1}", "[1]");

  auto r = sanitize_ex("{\"a\":[1,{");
  assert(r.text == "{\"a\":[1,{}]}");
  assert(r.metadata.closed_brackets == 3);
  assert(r.metadata.max_depth == 3);
  assert(!r.metadata.truncated);
}

static void test_trailing_content_is_dropped() {
  {
    auto r = sanitize_ex("[1,2],3");
    assert(r.text == "[1,2]");
    assert(r.metadata.truncated);
  }
  {
    auto r = sanitize_ex("1 2");
    assert(is_strict_json(r.text));
    assert(r.text.find('2') == std::string::npos);
    assert(r.metadata.truncated);
  }
  expect("{}}", "{}");
}

static void test_numbers() {
  expect("+.5", "0.5");
  expect("[1.]", "[1.0]");
  expect("[1e]", "[1e0]");
  expect("[1e+]", "[1e+0]");
  expect("[-]", "[-0]");
  expect("[.e1]", "[0.0e1]");
  expect("[1.5x]", "[1.5]");
  expect("[00.5]", "[0.5]");
}

static void test_hex_and_octal() {
  expect("0x10", "16");
  expect("[0X1f,-0xff]", "[31,-255]");
  expect("[0x]", "[0]");
  expect("[010]", "[8]");
  expect("[0777]", "[511]");
  // 8 and 9 are not octal digits; the digits are read as hex.
  expect("[0789]", "[1929]");
  expect("[0xFFFFFFFFFFFFFFFF]", "[18446744073709551615]");
  expect("[0xFFFFFFFFFFFFFFFFF]", "[295147905179352825855]");
  expect("[01777777777777777777777]", "[18446744073709551615]");
}

static void test_number_keys_are_canonicalized() {
  expect("{.5e-1: 0}", "{\"0.05\": 0}");
  expect("{1.50e1: x}", "{\"15\": \"x\"}");
  expect("{-0: 1}", "{\"0\": 1}");
  expect("{0x10: 1}", "{\"16\": 1}");
  expect("{1e2:1}", "{\"100\":1}");
  expect("{-1.25:1}", "{\"-1.25\":1}");
  expect("{0.000:1}", "{\"0\":1}");
  // Exponents too large to expand are left alone.
  expect("{1e999:1}", "{\"1e999\":1}");
  expect("{1e401:1}", "{\"1e401\":1}");
  expect("{1e400:1}", "{\"1" + std::string(400, '0') + "\":1}");
}

static void test_comments_and_parens() {
  expect("// c\n{}", "{}");
  expect("[1/* x */,2]", "[1,2]");
  expect("[1 # x]", "[1  ,\"x\"]");
  expect("({\"a\":1})", "{\"a\":1}");
  expect("[1 /]", "[1 ]");
  expect("[1] // tail", "[1] ");
  expect("[1 /* open", "[1 ]");
}

static void test_string_escapes() {
  expect("[\"\\v\"]", "[\"\\u0008\"]");
  expect("[\"\\x41\"]", "[\"\\u0041\"]");
  expect("['\\101']", "[\"\\u0041\"]");
  expect("['\\0']", "[\"\\u0000\"]");
  // A third octal digit is only taken when the value still fits in a byte.
  expect("['\\377']", "[\"\\u00ff\"]");
  expect("['\\477']", "[\"\\u00277\"]");
  expect("['\\08']", "[\"\\u00008\"]");
  // A backslash with nothing after it is dropped.
  expect("['a\\", "[\"a\"]");
  expect("\"a\\", "\"a\"");
  expect("[\"\\-\"]", "[\"-\"]");
  expect("[\"\\u12\"]", "[\"u12\"]");
  expect("[\"\\x4\"]", "[\"x4\"]");
  expect("[\"\\uABCD\\n\\/\"]", "[\"\\uABCD\\n\\/\"]");
  expect("[\"tab\there\"]", "[\"tab\\there\"]");
  expect("[\"nl\nhere\"]", "[\"nl\\nhere\"]");
  expect(std::string("[\"a\x01") + "b\"]", "[\"a\\u0001b\"]");
}

static void test_embedding_safety() {
  expect("\"</script>\"", "\"\\u003c/script>\"");
  expect("[\"<ScRiPt>\"]", "[\"\\u003cScRiPt>\"]");
  expect("[\"<!--x-->\"]", "[\"\\u003c!--x--\\u003e\"]");
  expect("[\"]]>\"]", "[\"\\u005d]>\"]");
  expect("[\"a<b>c\"]", "[\"a<b>c\"]");
  // Escaped lookalikes count as the characters they stand for.
  expect("[\"<\\x73cript\"]", "[\"\\u003c\\u0073cript\"]");
  expect("[\"-\\x2d>\"]", "[\"-\\u002d\\u003e\"]");
  expect("[\"--\\>\"]", "[\"--\\u003e\"]");

  const std::string out = sanitize("[\"<script>alert(1)</script>\", '<!--', '-->', ']]>']");
  assert(is_strict_json(out));
  assert(is_embeddable(out));
}

static void test_unicode() {
  expect("[\"\xe2\x80\xa8\"]", "[\"\\u2028\"]");
  expect("[\"\xe2\x80\xa9\"]", "[\"\\u2029\"]");
  expect("[\"\xef\xbf\xbf\"]", "[\"\\uffff\"]");
  // An encoded surrogate half.
  expect("[\"\xed\xa0\x80\"]", "[\"\\ud800\"]");
  expect("[\"\xff\"]", "[\"\\ufffd\"]");
  expect("[\"\xc3\"]", "[\"\\ufffd\"]");
  expect("[\"\xf0\x9f\x98\x80\"]", "[\"\xf0\x9f\x98\x80\"]");
  // Stray bytes outside strings are dropped.
  expect("[1\xc3\xa9]", "[1]");
  // A line separator also ends a // comment.
  expect("[1 //x\xe2\x80\xa8" ",2]", "[1 ,2]");
}

static void test_depth_limit_error() {
  try {
    (void)sanitize("[[1]]", 1);
    assert(false && "expected SanitizeError");
  } catch (const SanitizeError& e) {
    assert(e.kind == "limit");
    assert(e.offset == 1);
    assert(e.max_depth == 1);
  }

  std::string deep(65, '[');
  try {
    (void)sanitize(deep);
    assert(false && "expected SanitizeError");
  } catch (const SanitizeError& e) {
    assert(e.offset == 64);
    assert(e.max_depth == kDefaultNestingDepth);
  }

  std::string ok(64, '[');
  std::string closed = sanitize(ok);
  assert(closed == ok + std::string(64, ']'));
}

static void test_depth_limit_truncate() {
  SanitizeConfig cfg;
  cfg.max_nesting_depth = 1;
  cfg.depth_limit_policy = SanitizeConfig::DepthLimitPolicy::Truncate;

  auto r = sanitize_ex("[[1]]", cfg);
  assert(r.text == "[]");
  assert(r.metadata.modified);
  assert(r.metadata.truncated);
  assert(r.metadata.depth_limited);
  assert(r.metadata.closed_brackets == 1);
  assert(r.metadata.max_depth == 1);
  assert(r.metadata.effective_max_nesting_depth == 1);

  cfg.max_nesting_depth = 2;
  assert(sanitize("{\"a\":[{\"b\":1}],\"c\":2}", cfg) == "{\"a\":[]}");
}

static void test_clamp_nesting_depth() {
  assert(clamp_nesting_depth(0) == 1);
  assert(clamp_nesting_depth(-5) == 1);
  assert(clamp_nesting_depth(10) == 10);
  assert(clamp_nesting_depth(1 << 20) == kMaximumNestingDepth);

  SanitizeConfig cfg;
  cfg.max_nesting_depth = 0;
  auto r = sanitize_ex("[1]", cfg);
  assert(r.text == "[1]");
  assert(r.metadata.effective_max_nesting_depth == 1);
}

static void test_sanitize_ex_metadata() {
  auto r = sanitize_ex("{foo:'bar'");
  assert(r.text == "{\"foo\":\"bar\"}");
  assert(r.metadata.modified);
  assert(!r.metadata.truncated);
  assert(!r.metadata.depth_limited);
  assert(r.metadata.closed_brackets == 1);
  assert(r.metadata.max_depth == 1);
  assert(r.metadata.effective_max_nesting_depth == kDefaultNestingDepth);
  assert(r.metadata.edit_count > 0);

  SanitizeConfig cfg;
  assert(sanitize("[1,]", cfg) == "[1]");
}

static void test_escape() {
  assert(escape("plain") == "plain");
  assert(escape("a\"b\\c\n\t\r\b\f") == "a\\\"b\\\\c\\n\\t\\r\\b\\f");
  assert(escape("<b>") == "\\u003cb\\u003e");
  assert(escape(std::string("\x01\x1f", 2)) == "\\u0001\\u001f");
  assert(escape(std::string(1, '\0')) == "\\u0000");
  assert(escape("caf\xc3\xa9") == "caf\xc3\xa9");
  assert(escape("\xe2\x80\xa8" "x") == "\\u2028x");
  assert(escape("\xed\xbf\xbf") == "\\udfff");
  assert(escape("\xff" "a") == "\\ufffda");

  // An escaped body always sanitizes to itself once quoted.
  const std::string quoted = "\"" + escape("</script><!-- \"x\" \xe2\x80\xa9") + "\"";
  assert(is_strict_json(quoted));
  assert(is_embeddable(quoted));
  assert(sanitize(quoted) == quoted);
}

static void test_fuzz_properties() {
  static const char* const kPieces[] = {
      "{", "}", "[", "]", ",", ":", "\"", "'", "\\", "/", "*", " ", "\n", "a", "x", "0", "1", "9", ".",
      "e", "-", "+", "<", ">", "!", "script", "true", "null", "(", ")", "\\u", "\\x", "#", "\t",
      "\xe2\x80\xa8", "\xff", "\xc3\xa9", "]]", "--",
  };
  constexpr size_t kPieceCount = sizeof(kPieces) / sizeof(kPieces[0]);

  std::mt19937 rng(12345);
  std::uniform_int_distribution<size_t> piece(0, kPieceCount - 1);
  std::uniform_int_distribution<int> length(0, 24);

  for (int iter = 0; iter < 5000; ++iter) {
    std::string in;
    const int n = length(rng);
    for (int k = 0; k < n; ++k) in += kPieces[piece(rng)];

    const std::string out = sanitize(in);
    if (!is_strict_json(out) || !is_embeddable(out) || sanitize(out) != out) {
      std::cerr << "  input: " << in << "\n  output: " << out << "\n";
    }
    assert(is_strict_json(out));
    assert(is_embeddable(out));
    assert(sanitize(out) == out);
  }
}

int main() {
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
    run("strict_checker_sanity", test_strict_checker_sanity);
    run("valid_json_untouched", test_valid_json_untouched);
    run("zero_copy_on_valid_input", test_zero_copy_on_valid_input);
    run("empty_and_junk_become_null", test_empty_and_junk_become_null);
    run("quotes_and_unquoted_names", test_quotes_and_unquoted_names);
    run("commas_and_missing_values", test_commas_and_missing_values);
    run("unclosed_brackets_and_strings", test_unclosed_brackets_and_strings);
    run("trailing_content_is_dropped", test_trailing_content_is_dropped);
    run("numbers", test_numbers);
    run("hex_and_octal", test_hex_and_octal);
    run("number_keys_are_canonicalized", test_number_keys_are_canonicalized);
    run("comments_and_parens", test_comments_and_parens);
    run("string_escapes", test_string_escapes);
    run("embedding_safety", test_embedding_safety);
    run("unicode", test_unicode);
    run("depth_limit_error", test_depth_limit_error);
    run("depth_limit_truncate", test_depth_limit_truncate);
    run("clamp_nesting_depth", test_clamp_nesting_depth);
    run("sanitize_ex_metadata", test_sanitize_ex_metadata);
    run("escape", test_escape);
    run("fuzz_properties", test_fuzz_properties);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception&) {
    return 1;
  }
}
