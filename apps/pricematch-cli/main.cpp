/**
 * pricematch-cli: match a primary store's catalogue against a competitor's.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/pricematch_cli --primary ours.json --competitor theirs.json [--validate]
 * Product files are JSON arrays of {id, name, price?, brand?, category?}.
 */

#include <pricematch/app/backend_factory.hpp>
#include <pricematch/app/batch_runner.hpp>
#include <pricematch/app/config.hpp>
#include <pricematch/app/logging.hpp>
#include <pricematch/app/product_loader.hpp>
#include <pricematch/core/product_match.hpp>
#include <pricematch/matching/match_finder.hpp>
#include <pricematch/matching/match_validator.hpp>
#include <pricematch/rules/rule_loader.hpp>
#ifdef PRICEMATCH_HAS_TBB
#include <pricematch/app/batch_runner_tbb.hpp>
#endif

#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: pricematch_cli --primary <file> --competitor <file> [options]\n"
            << "  --config <path>          Matcher config (key=value file); default: built-in (mock)\n"
            << "  --rules <dir>            Rule tables directory (overrides rules_dir)\n"
            << "  --backend <type>         Override embedding backend: mock | onnx\n"
            << "  --min-confidence <x>     Minimum confidence to keep a match (default 0.65)\n"
            << "  --max-matches <n>        Matches kept per primary product (default 3)\n"
            << "  --workers <n>            Worker threads; 0 = hardware concurrency\n"
            << "  --tbb                    Use the TBB runner (if built with TBB)\n"
            << "  --validate               Run price/size validation on the matches\n";
}

std::optional<double> parse_double(const std::string& s) {
  try {
    std::size_t pos = 0;
    const double v = std::stod(s, &pos);
    if (pos != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<std::size_t> parse_count(const std::string& s) {
  try {
    std::size_t pos = 0;
    const unsigned long v = std::stoul(s, &pos);
    if (pos != s.size()) return std::nullopt;
    return static_cast<std::size_t>(v);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

using NameIndex = std::unordered_map<std::int64_t, const std::string*>;

NameIndex index_names(const std::vector<pricematch::core::ProductRecord>& products) {
  NameIndex index;
  for (const auto& p : products) index.emplace(p.id, &p.name);
  return index;
}

std::string name_of(const NameIndex& index, std::int64_t id) {
  const auto it = index.find(id);
  return it == index.end() ? std::string("?") : *it->second;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string primary_path;
  std::string competitor_path;
  std::string rules_override;
  std::string backend_override;
  std::optional<double> min_confidence;
  std::optional<std::size_t> max_matches;
  std::optional<std::size_t> workers;
  bool validate = false;
  bool use_tbb = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--primary" && i + 1 < argc) {
      primary_path = argv[++i];
    } else if (arg == "--competitor" && i + 1 < argc) {
      competitor_path = argv[++i];
    } else if (arg == "--rules" && i + 1 < argc) {
      rules_override = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--min-confidence" && i + 1 < argc) {
      min_confidence = parse_double(argv[++i]);
      if (!min_confidence) {
        std::cerr << "Invalid --min-confidence " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--max-matches" && i + 1 < argc) {
      max_matches = parse_count(argv[++i]);
      if (!max_matches) {
        std::cerr << "Invalid --max-matches " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--workers" && i + 1 < argc) {
      workers = parse_count(argv[++i]);
      if (!workers) {
        std::cerr << "Invalid --workers " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--validate") {
      validate = true;
    } else if (arg == "--tbb") {
      use_tbb = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << "\n";
      print_usage();
      return 1;
    }
  }
  if (primary_path.empty() || competitor_path.empty()) {
    print_usage();
    return 1;
  }

  pricematch::app::MatcherConfig cfg = config_path.empty()
                                           ? pricematch::app::default_config()
                                           : pricematch::app::load_config(config_path);
  if (!rules_override.empty()) cfg.rules_dir = rules_override;
  if (min_confidence) cfg.min_confidence = *min_confidence;
  if (max_matches) cfg.max_matches = *max_matches;
  if (workers) cfg.num_workers = *workers;
  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = pricematch::app::EmbeddingBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = pricematch::app::EmbeddingBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  pricematch::app::init_logging(cfg.log_level);

  auto primaries = pricematch::app::load_products(primary_path);
  if (!primaries) {
    std::cerr << "Failed to load products: " << primary_path << "\n";
    return 1;
  }
  auto competitors = pricematch::app::load_products(competitor_path);
  if (!competitors) {
    std::cerr << "Failed to load products: " << competitor_path << "\n";
    return 1;
  }

  std::unique_ptr<pricematch::matching::IEmbeddingBackend> backend;
  try {
    backend = pricematch::app::make_embedding_backend(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Embedding backend error: " << e.what() << "\n";
    return 1;
  }

  pricematch::matching::MatchFinder finder(pricematch::rules::load_rule_set(cfg.rules_dir),
                                           std::move(backend));

  pricematch::matching::BatchResult batch;
#ifdef PRICEMATCH_HAS_TBB
  if (use_tbb) {
    batch = pricematch::app::batch_match_tbb(finder, *primaries, *competitors, cfg.min_confidence,
                                             cfg.max_matches);
  } else
#endif
  {
    if (use_tbb) std::cerr << "TBB runner not available; using thread pool\n";
    batch = pricematch::app::batch_match_parallel(finder, *primaries, *competitors,
                                                  cfg.min_confidence, cfg.max_matches,
                                                  cfg.num_workers);
  }

  const NameIndex primary_names = index_names(*primaries);
  const NameIndex competitor_names = index_names(*competitors);
  for (const auto& m : batch.matches) {
    std::cout << fmt::format("{} -> {} confidence={:.3f} type={} size={:.2f}  {} | {}\n",
                             m.primary_id, m.matched_id, m.confidence,
                             pricematch::core::to_string(m.match_type), m.size_similarity,
                             name_of(primary_names, m.primary_id),
                             name_of(competitor_names, m.matched_id));
    for (const auto& w : m.warnings) {
      std::cout << "    warning: " << w << "\n";
    }
  }
  std::cout << fmt::format("matches={} skipped={}\n", batch.matches.size(), batch.failures.size());

  if (validate) {
    const pricematch::matching::MatchValidator validator;
    const auto report = validator.validate(batch.matches, *primaries, *competitors);
    std::cout << fmt::format("validated={} rejected={} normalized={:.1f}%\n",
                             report.validated.size(), report.rejected.size(),
                             report.normalization_success_rate * 100.0);
    for (const auto& [reason, count] : report.rejection_reasons) {
      std::cout << "  " << count << "x " << reason << "\n";
    }
    for (const auto& cmp : report.size_analysis) {
      if (!cmp.can_compare_normalized) continue;
      std::cout << fmt::format("  {} vs {}: {:.2f} vs {:.2f} {} ({:+.1f}%, size {})\n",
                               cmp.primary_id, cmp.competitor_id, cmp.primary_per_unit,
                               cmp.competitor_per_unit, pricematch::matching::unit_label(cmp.basis),
                               cmp.savings_pct,
                               pricematch::matching::to_string(cmp.size_confidence));
    }
  }
  return 0;
}
