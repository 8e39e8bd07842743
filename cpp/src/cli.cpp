#include "json_sanitizer.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace json_sanitizer;

static std::string read_all_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

static std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static std::string bool_json(bool b) { return b ? "true" : "false"; }

static std::string metadata_json(const SanitizeMetadata& m) {
  std::ostringstream oss;
  oss << "{\"modified\":" << bool_json(m.modified) << ",\"truncated\":" << bool_json(m.truncated)
      << ",\"depthLimited\":" << bool_json(m.depth_limited) << ",\"closedBrackets\":" << m.closed_brackets
      << ",\"maxDepth\":" << m.max_depth << ",\"effectiveMaxNestingDepth\":" << m.effective_max_nesting_depth
      << ",\"editCount\":" << m.edit_count << "}";
  return oss.str();
}

static void usage() {
  std::cerr << "json_sanitizer_cli <sanitize|escape> [--input <file>] [--max-depth <n>] [--truncate-deep] [--stats]\n"
            << "  Reads input from --input or stdin, prints the sanitized JSON (or escaped string body) to stdout.\n"
            << "  --stats prints what was repaired as JSON to stderr.\n";
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage();
      return 2;
    }

    std::string mode = argv[1];
    std::string input_path;
    SanitizeConfig config;
    bool stats = false;

    for (int i = 2; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--input" && i + 1 < argc) {
        input_path = argv[++i];
      } else if (a == "--max-depth" && i + 1 < argc) {
        try {
          config.max_nesting_depth = std::stoi(argv[++i]);
        } catch (const std::exception&) {
          usage();
          return 2;
        }
      } else if (a == "--truncate-deep") {
        config.depth_limit_policy = SanitizeConfig::DepthLimitPolicy::Truncate;
      } else if (a == "--stats") {
        stats = true;
      } else {
        usage();
        return 2;
      }
    }

    std::string input = input_path.empty() ? read_all_stdin() : read_file(input_path);

    if (mode == "sanitize") {
      auto r = sanitize_ex(std::move(input), config);
      std::cout << r.text << "\n";
      if (stats) std::cerr << metadata_json(r.metadata) << "\n";
      return 0;
    }

    if (mode == "escape") {
      std::cout << escape(input) << "\n";
      return 0;
    }

    usage();
    return 2;
  } catch (const SanitizeError& e) {
    std::cout << "{\"error\":\"" << escape(e.what()) << "\",\"kind\":\"" << escape(e.kind) << "\",\"offset\":" << e.offset
              << ",\"maxDepth\":" << e.max_depth << "}\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
