#include "catalog/term_catalog.hpp"
#include "config/app_config.hpp"
#include "match/fuzzy_matcher.hpp"
#include "match/masker.hpp"
#include "mute/mute_plan.hpp"
#include "storage/match_store.hpp"
#include "subtitle/subtitle_masking.hpp"
#include "subtitle/subtitle_verifier.hpp"
#include "text/normalizer.hpp"
#include "timing/interval_merger.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace redline;

namespace {

constexpr const char* DEFAULT_OUTPUT_DIR = "/tmp/redline";

struct Args {
    std::string command;
    std::string input;                 // positional argument of the command
    std::string config_path;
    AppConfig overrides;
    std::optional<double> duration;    // mute-plan: media length in seconds
};

void print_usage(std::ostream& out) {
    out << "redline: fuzzy term masking for subtitles\n"
        << "Usage: redline <command> <input> [options]\n"
        << "Commands:\n"
        << "  mask <input.srt>                   Mask subtitles, write masked SRT + match CSV\n"
        << "  verify <masked.srt>                Fail if any configured term survives\n"
        << "  match <text>                       Print normalized text and matches\n"
        << "  mute-plan <matches.csv|windows.json>\n"
        << "                                     Merge windows, write sidecar, print filter\n"
        << "Options:\n"
        << "      --catalog <path>               Term catalog (JSON or one word per line)\n"
        << "      --out <dir>                    Output directory (default /tmp/redline)\n"
        << "      --threshold <0-100>            Default fuzzy threshold (default 85)\n"
        << "      --db <path>                    Record runs and matches in SQLite\n"
        << "      --config <path>                Config file (default XDG redline.toml)\n"
        << "      --epsilon <s>                  Window merge tolerance (default 0.001)\n"
        << "      --duration <s>                 Media duration, enables control spans\n"
        << "      --sample-len <s>               Control span length (default 1.0)\n"
        << "      --max-samples <n>              Control span count (default 5)\n"
        << "  -v, --verbose                      Print every match\n"
        << "  -h, --help                         Show this help\n";
}

Args parse_args(int argc, char** argv) {
    Args a{};
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--catalog" && i + 1 < argc) a.overrides.catalog_path = argv[++i];
        else if (s == "--out" && i + 1 < argc) a.overrides.output_dir = argv[++i];
        else if (s == "--threshold" && i + 1 < argc) a.overrides.default_threshold = std::stod(argv[++i]);
        else if (s == "--db" && i + 1 < argc) a.overrides.db_path = argv[++i];
        else if (s == "--config" && i + 1 < argc) a.config_path = argv[++i];
        else if (s == "--epsilon" && i + 1 < argc) a.overrides.merge_epsilon = std::stod(argv[++i]);
        else if (s == "--duration" && i + 1 < argc) a.duration = std::stod(argv[++i]);
        else if (s == "--sample-len" && i + 1 < argc) a.overrides.control_sample_len = std::stod(argv[++i]);
        else if (s == "--max-samples" && i + 1 < argc) a.overrides.control_max_samples = static_cast<std::size_t>(std::stoul(argv[++i]));
        else if (s == "--verbose" || s == "-v") a.overrides.verbose = true;
        else if (s == "--help" || s == "-h") {
            print_usage(std::cout);
            std::exit(0);
        }
        else if (!s.empty() && s[0] == '-') throw std::invalid_argument("Unknown option: " + s);
        else if (a.command.empty()) a.command = s;
        else if (a.input.empty()) a.input = s;
        else throw std::invalid_argument("Unexpected argument: " + s);
    }
    return a;
}

TermCatalog load_catalog(const AppConfig& cfg) {
    if (!cfg.catalog_path) {
        throw std::runtime_error("No term catalog given (--catalog or 'catalog' in config)");
    }
    return TermCatalog::loadFromFile(*cfg.catalog_path, cfg.default_threshold.value_or(DEFAULT_THRESHOLD));
}

void print_summary(const MaskSummary& summary) {
    std::cout << "Masked " << summary.units << " events, " << summary.records.size() << " matches";
    if (summary.unredacted > 0) std::cout << " (" << summary.unredacted << " not redacted)";
    std::cout << "\n";
}

int run_mask(const Args& args, const AppConfig& cfg) {
    const TermCatalog catalog = load_catalog(cfg);
    if (catalog.empty()) {
        throw std::runtime_error("No terms configured in " + *cfg.catalog_path);
    }
    const std::string out_dir = cfg.output_dir.value_or(DEFAULT_OUTPUT_DIR);
    const bool verbose = cfg.verbose.value_or(false);

    if (!cfg.db_path) {
        MaskSummary summary = mask_subtitle_file(args.input, out_dir, catalog, verbose);
        print_summary(summary);
        return 0;
    }

    MatchStore store(*cfg.db_path);
    MaskSummary summary = mask_subtitle_file(args.input, out_dir, catalog, store, verbose);
    std::cout << "[store] Run " << summary.run_id << ": " << store.matchCount(summary.run_id)
              << " matches recorded in " << store.path() << "\n";
    print_summary(summary);
    return 0;
}

int run_verify(const Args& args, const AppConfig& cfg) {
    const TermCatalog catalog = load_catalog(cfg);
    verify_masked_file(args.input, catalog);
    return 0;
}

int run_match(const Args& args, const AppConfig& cfg) {
    const TermCatalog catalog = load_catalog(cfg);
    if (catalog.empty()) {
        throw std::runtime_error("No terms configured");
    }
    const FuzzyMatcher matcher(catalog);
    const auto matches = matcher.findMatches(args.input);

    std::cout << "normalized: \"" << normalize_text(args.input) << "\"\n";
    for (const auto& m : matches) {
        std::cout << "  '" << m.window_text << "' ~ '" << m.term.word << "' score " << m.score
                  << " (threshold " << m.term.threshold
                  << (m.term.aggressive ? ", aggressive" : "") << ")\n";
    }
    std::cout << "masked:     \"" << mask_text(args.input, matches) << "\"\n";
    return 0;
}

int run_mute_plan(const Args& args, const AppConfig& cfg) {
    const double epsilon = cfg.merge_epsilon.value_or(DEFAULT_MERGE_EPSILON);
    const auto windows = load_mute_windows(args.input, epsilon);
    if (windows.empty()) {
        throw std::runtime_error("No mute windows found in " + args.input);
    }

    const std::string sidecar = write_mute_windows(cfg.output_dir.value_or(DEFAULT_OUTPUT_DIR), windows);
    std::cout << "[mute] " << windows.size() << " windows written to " << sidecar << "\n";
    std::cout << build_volume_filter(windows) << "\n";

    if (args.duration) {
        const auto spans = select_control_spans(
            windows, *args.duration,
            cfg.control_sample_len.value_or(DEFAULT_CONTROL_SAMPLE_LEN),
            cfg.control_max_samples.value_or(DEFAULT_CONTROL_MAX_SAMPLES));
        if (spans.empty()) {
            std::cerr << "[mute] Warning: no control spans available outside the mute windows\n";
        }
        for (const auto& s : spans) {
            std::cout << "control " << s.start << " - " << s.end << "\n";
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }

    if (args.command.empty() || args.input.empty()) {
        print_usage(std::cerr);
        return 2;
    }

    const std::string config_path = args.config_path.empty() ? default_config_path()
                                                             : expand_path(args.config_path);
    const AppConfig cfg = merge_config(load_config_file(config_path), args.overrides);

    try {
        if (args.command == "mask") return run_mask(args, cfg);
        if (args.command == "verify") return run_verify(args, cfg);
        if (args.command == "match") return run_match(args, cfg);
        if (args.command == "mute-plan") return run_mute_plan(args, cfg);

        std::cerr << "Error: unknown command '" << args.command << "'\n";
        print_usage(std::cerr);
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
