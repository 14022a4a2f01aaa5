#include "layoutprep/featurizer.hpp"
#include "layoutprep/labeler.hpp"
#include "layoutprep/log.hpp"
#include "layoutprep/pipeline.hpp"
#include "layoutprep/settings.hpp"

#include <charconv>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace layoutprep;

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  layoutprep_cli warm [options] <bucket>...     build or reuse all artifacts of each bucket\n"
              << "  layoutprep_cli inspect [options] <bucket>...  one line per prepared document\n"
              << "  layoutprep_cli vocab [options]                 embedding table summary\n\n"
              << "Options:\n"
              << "  --env <path>              Path to .env (default: .env)\n"
              << "  --corpus-dir <dir>        Directory holding the buckets (overrides CORPUS_DIR)\n"
              << "  --token-stats <path>      Corpus statistics file, relative to the corpus dir\n"
              << "  --glove-vectors <path>    Pretrained vectors (.txt.gz)\n"
              << "  --min-token-freq <n>      Minimum corpus frequency for the vocabulary (default: 10)\n"
              << "  --font-hash-size <n>      Font hash buckets (default: 1024)\n"
              << "  --max-page-number <n>     Pages per document exposed to training (default: 3)\n"
              << "  --quiet                   Only log warnings and errors\n";
}

std::string detect_env_path_arg(int argc, char** argv, const std::string& default_path) {
    std::string path = default_path;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--env" && i + 1 < argc) {
            path = argv[i + 1];
            ++i;
        }
    }
    return path;
}

bool parse_size_value(const char* s, std::size_t& out) {
    std::string v(s);
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
    if (ec != std::errc() || ptr != v.data() + v.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parse_args(int argc, char** argv, Config& cfg, std::vector<std::string>& buckets, std::string& err) {
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto require_value = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--env") {
            if (!require_value(arg)) return false;
            continue;
        }
        if (arg == "--corpus-dir") {
            const char* v = require_value(arg);
            if (!v) return false;
            cfg.corpus_dir = v;
            continue;
        }
        if (arg == "--token-stats") {
            const char* v = require_value(arg);
            if (!v) return false;
            cfg.token_stats = v;
            continue;
        }
        if (arg == "--glove-vectors") {
            const char* v = require_value(arg);
            if (!v) return false;
            cfg.model.glove_vectors = v;
            continue;
        }
        if (arg == "--min-token-freq") {
            const char* v = require_value(arg);
            if (!v || !parse_size_value(v, cfg.model.minimum_token_frequency)) {
                err = "invalid --min-token-freq";
                return false;
            }
            continue;
        }
        if (arg == "--font-hash-size") {
            const char* v = require_value(arg);
            if (!v || !parse_size_value(v, cfg.model.font_hash_size) || cfg.model.font_hash_size == 0) {
                err = "invalid --font-hash-size";
                return false;
            }
            continue;
        }
        if (arg == "--max-page-number") {
            const char* v = require_value(arg);
            if (!v || !parse_size_value(v, cfg.model.max_page_number)) {
                err = "invalid --max-page-number";
                return false;
            }
            continue;
        }
        if (arg == "--quiet") {
            cfg.log_level = LogLevel::kWarning;
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            err = "unknown option: " + arg;
            return false;
        }
        buckets.push_back(arg);
    }
    return true;
}

std::size_t count_label(const Page& page, TokenLabel label) {
    std::size_t n = 0;
    for (auto v : page.labels) {
        if (v == static_cast<std::int8_t>(label)) ++n;
    }
    return n;
}

int run_warm(const Pipeline& pipeline, const std::vector<std::string>& buckets) {
    for (const auto& bucket : buckets) {
        auto featurized = pipeline.PrepareBucket(bucket);
        std::cout << bucket << "\t" << featurized->path().string() << "\t"
                  << featurized->Rows(kTokenHashedTextFeaturesDataset) << " tokens\n";
    }
    return 0;
}

int run_inspect(const Pipeline& pipeline, const std::vector<std::string>& buckets) {
    for (const auto& bucket : buckets) {
        pipeline.DocumentsForBucket(bucket).ForEach([&](const Document& doc) {
            std::size_t tokens = 0;
            std::size_t title = 0;
            std::size_t author = 0;
            for (const auto& page : doc.pages) {
                tokens += page.token_count();
                title += count_label(page, TokenLabel::kTitle);
                author += count_label(page, TokenLabel::kAuthor);
            }
            std::cout << doc.doc_id << "\tpages=" << doc.pages.size() << "\ttokens=" << tokens
                      << "\ttitle=" << title << "\tauthor=" << author << "\n";
        });
    }
    return 0;
}

int run_vocab(const Pipeline& pipeline) {
    const auto& embeddings = pipeline.embeddings();
    std::cout << "vocab_size=" << embeddings.VocabSize() << "\n"
              << "dimensions=" << embeddings.Dimensions() << "\n"
              << "pretrained=" << embeddings.PretrainedCount() << "\n"
              << "featurizing_key=" << FeaturizingKeyHex(pipeline.config().model) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    if (cmd != "warm" && cmd != "inspect" && cmd != "vocab") {
        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;
    }

    Config cfg;
    cfg.env_path = detect_env_path_arg(argc, argv, cfg.env_path);
    auto env = ReadEnvFile(cfg.env_path);
    ApplyEnvOverrides(cfg, env);

    std::vector<std::string> buckets;
    std::string err;
    if (!parse_args(argc, argv, cfg, buckets, err)) {
        std::cerr << err << "\n";
        print_usage();
        return 1;
    }
    SetLogLevel(cfg.log_level);

    try {
        Pipeline pipeline(cfg);
        if (cmd == "warm" || cmd == "inspect") {
            if (buckets.empty()) {
                std::cerr << "no buckets given\n";
                return 1;
            }
            return cmd == "warm" ? run_warm(pipeline, buckets) : run_inspect(pipeline, buckets);
        }
        return run_vocab(pipeline);
    } catch (const std::exception& e) {
        LogError(e.what());
        return 2;
    }
}
