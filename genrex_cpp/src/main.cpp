#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "error.hpp"
#include "generator.hpp"
#include "util.hpp"

using genrex::GenrexError;

namespace {

// Bad command line; exits with status 2.
struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Options {
  std::string pattern;
  uint64_t count = 1;
  std::optional<uint64_t> seed;
  std::optional<uint64_t> min_len;
  std::optional<uint64_t> max_len;
  std::optional<uint64_t> max_attempts;
  std::optional<uint64_t> timeout_ms;
  std::string strategy_name = "default";
  genrex::Strategy strategy = genrex::Strategy::Auto;
  bool multiline = false;
  bool allow_backrefs = false;
  bool strict_backrefs = false;
  bool verbose = false;
};

}  // namespace

static void print_usage(const char* argv0) {
  std::cerr
      << "Usage:\n"
      << "  " << argv0 << " <pattern> [options]\n"
      << "Options:\n"
      << "  --n <int>                       (strings to generate, default: 1)\n"
      << "  --seed <uint64>                 (random seed)\n"
      << "  --min <int>                     (minimum length, default: 0)\n"
      << "  --max <int>                     (maximum length, default: 64)\n"
      << "  --attempts <int>                (default: 10000)\n"
      << "  --timeout-ms <int>              (wall-clock budget per string)\n"
      << "  --strategy <default|token|legacy|rejection>\n"
      << "  --multiline\n"
      << "  --allow-backrefs                (accept patterns the validator cannot compile)\n"
      << "  --strict-backrefs               (retry when a back-reference stays empty)\n"
      << "  -v, --verbose                   (more debug output; also GENREX_VERBOSE=1)\n";
}

static uint64_t parse_u64(const std::string& name, const std::string& value) {
  if (value.empty() || value[0] == '-' || value[0] == '+') throw UsageError("invalid value for " + name + ": " + value);
  try {
    size_t used = 0;
    uint64_t v = (uint64_t)std::stoull(value, &used);
    if (used != value.size()) throw UsageError("invalid value for " + name + ": " + value);
    return v;
  } catch (const std::logic_error&) {
    throw UsageError("invalid value for " + name + ": " + value);
  }
}

static std::optional<Options> parse_args(int argc, char** argv) {
  Options opt;
  bool have_pattern = false;
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto need = [&](const char* name) -> std::string {
      if (i + 1 >= argc) throw UsageError(std::string("missing value for ") + name);
      return argv[++i];
    };
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      return std::nullopt;
    } else if (a == "--n") {
      opt.count = parse_u64(a, need("--n"));
    } else if (a == "--seed") {
      opt.seed = parse_u64(a, need("--seed"));
    } else if (a == "--min") {
      opt.min_len = parse_u64(a, need("--min"));
    } else if (a == "--max") {
      opt.max_len = parse_u64(a, need("--max"));
    } else if (a == "--attempts") {
      opt.max_attempts = parse_u64(a, need("--attempts"));
    } else if (a == "--timeout-ms") {
      opt.timeout_ms = parse_u64(a, need("--timeout-ms"));
    } else if (a == "--strategy") {
      opt.strategy_name = need("--strategy");
      try {
        opt.strategy = genrex::parse_strategy(opt.strategy_name);
      } catch (const GenrexError& e) {
        throw UsageError(e.what());
      }
    } else if (a == "--multiline") {
      opt.multiline = true;
    } else if (a == "--allow-backrefs") {
      opt.allow_backrefs = true;
    } else if (a == "--strict-backrefs") {
      opt.strict_backrefs = true;
    } else if (a == "--verbose" || a == "-v") {
      opt.verbose = true;
    } else if (!have_pattern && (a.empty() || a[0] != '-')) {
      opt.pattern = a;
      have_pattern = true;
    } else {
      throw UsageError("unknown arg: " + a);
    }
  }
  if (genrex::getenv_bool("GENREX_VERBOSE")) opt.verbose = true;
  if (!have_pattern) throw UsageError("missing <pattern>");
  if (opt.max_attempts && *opt.max_attempts < 1) opt.max_attempts = 1;
  return opt;
}

int main(int argc, char** argv) {
  std::optional<Options> parsed;
  try {
    parsed = parse_args(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    print_usage(argv[0]);
    return 2;
  }
  if (!parsed) return 0;
  const Options& opt = *parsed;

  try {
    genrex::GeneratorConfig cfg;
    if (opt.min_len) cfg.min_len = (size_t)*opt.min_len;
    if (opt.max_len) cfg.max_len = (size_t)*opt.max_len;
    if (opt.max_attempts) cfg.max_attempts = (size_t)*opt.max_attempts;
    if (opt.timeout_ms) cfg.timeout = std::chrono::milliseconds((int64_t)*opt.timeout_ms);
    cfg.strict_backrefs = opt.strict_backrefs;
    cfg.verbose = opt.verbose;

    auto builder = genrex::RegexGenerator::builder(opt.pattern);
    builder.config(cfg).multiline(opt.multiline).allow_backrefs(opt.allow_backrefs);
    if (opt.seed) builder.seed(*opt.seed);

    if (opt.verbose) {
      std::cerr << "[DEBUG] Options: pattern='" << genrex::preview_for_log(opt.pattern) << "' n=" << opt.count
                << " min=" << cfg.min_len << " max=" << cfg.max_len << " attempts=" << cfg.max_attempts
                << " strategy=" << opt.strategy_name << " allow_backrefs=" << (opt.allow_backrefs ? 1 : 0) << "\n";
    }

    genrex::RegexGenerator generator = builder.build();

    struct ValidatorStatsReporter {
      const genrex::Validator& validator;
      bool enabled = false;
      ~ValidatorStatsReporter() {
        if (!enabled) return;
        const auto& s = validator.stats();
        std::cerr << "[INFO] Validator stats: total=" << s.total << " accepted=" << s.accepted << " rejected=" << s.rejected
                  << " seconds_total=" << s.seconds_total << (validator.permissive() ? " (accept-all)" : "") << "\n";
      }
    } stats_reporter{generator.validator(), opt.verbose};

    for (uint64_t i = 0; i < opt.count; i++) {
      std::cout << generator.generate_with_strategy(opt.strategy) << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
}
