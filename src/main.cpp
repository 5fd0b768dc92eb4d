#include "../include/config.hpp"
#include "../include/context_assembler.hpp"
#include "../include/errors.hpp"
#include "../include/index_bundle.hpp"
#include "../include/ingest.hpp"
#include "../include/intent_matcher.hpp"
#include "../include/logging.hpp"
#include "../include/query_json.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <optional>

using json = nlohmann::json;

static void usage() {
    std::cerr << "retrieval_cli usage:\n"
              << "  build --input <intents.json> [--output <dir>] [--model <id>] [--batch-size N] [--backend auto|scalar|avx2] [--test-query \"...\"]\n"
              << "  search --query \"...\" [--db <dir>] [--k N] [--min-score S]\n"
              << "  match --query \"...\" [--db <dir>] [--k N] [--threshold T]\n"
              << "  respond --query \"...\" [--db <dir>] [--no-random]\n"
              << "  context --query \"...\" [--db <dir>] [--prompt]\n"
              << "  stats [--db <dir>]\n";
}

static int run_build(RetrievalConfig& cfg, int argc, char** argv) {
    std::string input;
    std::string test_query;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--input" && i + 1 < argc) input = argv[++i];
        else if (a == "--output" && i + 1 < argc) cfg.bundle_dir = argv[++i];
        else if (a == "--model" && i + 1 < argc) cfg.embed.model = argv[++i];
        else if (a == "--batch-size" && i + 1 < argc) cfg.embed.batch_size = std::stoi(argv[++i]);
        else if (a == "--backend" && i + 1 < argc) cfg.backend = backend_preference_from_string(argv[++i]);
        else if (a == "--test-query" && i + 1 < argc) test_query = argv[++i];
        else { usage(); return 2; }
    }
    if (input.empty()) { usage(); return 2; }
    validate_config(cfg);

    spdlog::info("input file: {}", input);
    spdlog::info("output directory: {}", cfg.bundle_dir.string());
    spdlog::info("model: {}, batch size: {}", cfg.embed.model, cfg.embed.batch_size);

    auto records = load_intents_json(input);
    auto embedder = make_embedder(cfg.embed.model, cfg.embed);
    auto bundle = build_bundle(records, embedder, (std::size_t)cfg.embed.batch_size, cfg.backend);
    bundle->save(make_codec(cfg.embed, cfg.backend), cfg.bundle_dir);

    std::cout << "[OK] Indexed " << bundle->index().vector_count() << " patterns (dim "
              << bundle->config().dimension << ", model " << bundle->config().model_name << ") into "
              << cfg.bundle_dir.string() << "\n";

    if (!test_query.empty()) {
        for (const auto& h : bundle->search(test_query, 5)) {
            std::cout << "  Rank " << h.rank << ": " << h.record.tag << " | " << h.record.text
                      << " | score " << h.score << " | distance " << h.distance << "\n";
        }
    }
    return 0;
}

static int run_query(const std::string& cmd, RetrievalConfig& cfg, int argc, char** argv) {
    std::string query;
    std::optional<std::size_t> k;
    std::optional<float> min_score;
    std::optional<float> threshold;
    bool randomize = true;
    bool as_prompt = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--db" && i + 1 < argc) cfg.bundle_dir = argv[++i];
        else if (a == "--query" && i + 1 < argc) query = argv[++i];
        else if (a == "--k" && i + 1 < argc) k = (std::size_t)std::stoul(argv[++i]);
        else if (a == "--min-score" && i + 1 < argc) min_score = std::stof(argv[++i]);
        else if (a == "--threshold" && i + 1 < argc) threshold = std::stof(argv[++i]);
        else if (a == "--no-random") randomize = false;
        else if (a == "--prompt") as_prompt = true;
        else { usage(); return 2; }
    }

    IndexHandle handle(make_codec(cfg.embed, cfg.backend));
    IntentMatcher matcher(handle, cfg.intent_threshold, cfg.fallback_response);

    if (cmd == "stats") {
        handle.try_load(cfg.bundle_dir);
        std::cout << json(matcher.stats()).dump(2) << "\n";
        return 0;
    }

    // load failures propagate so the exit code says why
    handle.load(cfg.bundle_dir);
    if (cmd == "search") {
        json out = json::array();
        for (const auto& h : matcher.search_intents(query, k.value_or(10), min_score)) out.push_back(json(h));
        std::cout << out.dump(2) << "\n";
    } else if (cmd == "match") {
        std::cout << json(matcher.match(query, k.value_or(1), threshold)).dump(2) << "\n";
    } else if (cmd == "respond") {
        std::cout << matcher.get_response(query, randomize) << "\n";
    } else if (cmd == "context") {
        ContextAssembler assembler(handle, (std::size_t)cfg.context_top_k, cfg.context_threshold,
                                   cfg.direct_match_threshold);
        std::string context = assembler.build_context(query);
        if (as_prompt) context = ContextAssembler::render_system_prompt(cfg.system_prompt_template, context);
        std::cout << context << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    std::string cmd = argv[1];
    try {
        RetrievalConfig cfg = load_config_from_env();
        init_logging(cfg.log_level);
        if (cmd == "build") return run_build(cfg, argc, argv);
        if (cmd == "search" || cmd == "match" || cmd == "respond" || cmd == "context" || cmd == "stats") {
            return run_query(cmd, cfg, argc, argv);
        }
        usage();
        return 2;
    } catch (const NotLoadedError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const CorruptionError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const EmptyQueryError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 4;
    } catch (const EmbeddingError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 5;
    } catch (const std::logic_error& e) {
        // bad numeric flag or out-of-range threshold
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
