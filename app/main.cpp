#include "commands/analyze.hpp"
#include "commands/embedVocab.hpp"
#include "commands/vocabDump.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  skill-profiler analyze [args]\n"
        << "  skill-profiler embed-vocab [args]\n"
        << "  skill-profiler vocab dump [args]\n"
        << "  skill-profiler help\n";
    return 1;
}

static void print_shared_options() {
    std::cerr
        << "vocabulary / config:\n"
        << "  --vocab <path>               category vocabulary JSON (default: built-in)\n"
        << "  --config <path>              analyzer config JSON; flags below override it\n"
        << "\n"
        << "embedding provider:\n"
        << "  --provider <onnx|ollama|hash> default: onnx\n"
        << "  --emb_model <path>           default: models/emb/model.onnx\n"
        << "  --emb_vocab <path>           default: models/emb/vocab.txt\n"
        << "  --ollama_model <str>         default: all-minilm\n"
        << "  --ollama_endpoint <url>      default: http://127.0.0.1:11434/api/embeddings\n"
        << "  --hash_dim <n>               default: 256\n"
        << "  --centroid_cache <path>      reuse/store category centroids\n"
        << "\n"
        << "batching:\n"
        << "  --concurrency <n>            default: 4\n"
        << "  --max_attempts <n>           default: 3\n"
        << "  --timeout_ms <n>             default: 30000 (0 = no deadline)\n";
}

static int print_analyze_help() {
    std::cerr
        << "usage:\n"
        << "  skill-profiler analyze (--skills \"<a,b,c>\" | --input <request.json>) [options]\n"
        << "\n"
        << "input:\n"
        << "  --skills <csv>               comma separated skill list (may be empty)\n"
        << "  --input <path>               JSON request {\"skills\": [...]}\n"
        << "\n"
        << "scoring:\n"
        << "  --top_k <n>                  default: 3\n"
        << "  --moderate <f>               default: 0.50\n"
        << "  --strong <f>                 default: 0.75\n"
        << "  --max_recommendations <n>    default: 10\n"
        << "  --top <n>                    top categories to report, default: 3 (0 = all)\n"
        << "\n"
        << "output:\n"
        << "  --format <json|markdown>     default: json\n"
        << "  --outdir <dir>               default: out\n"
        << "  --out <path>                 optional: mirror console output to a file\n"
        << "\n";
    print_shared_options();
    return 0;
}

static int print_embed_vocab_help() {
    std::cerr
        << "usage:\n"
        << "  skill-profiler embed-vocab [options]\n"
        << "\n"
        << "  --centroid_cache <path>      default: data/embeddings/centroids.bin\n"
        << "  --force                      rebuild even if the cache matches\n"
        << "\n";
    print_shared_options();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "vocab") {
        if (argc >= 3 && std::string(argv[2]) == "dump") return cmd_vocab_dump(argc - 2, argv + 2);
        return print_usage();
    }

    // subcommand help
    if (cmd == "analyze"     && (argc >= 3 && std::string(argv[2]) == "--help")) return print_analyze_help();
    if (cmd == "embed-vocab" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_embed_vocab_help();

    if (cmd == "analyze")     return cmd_analyze(argc - 1, argv + 1);
    if (cmd == "embed-vocab") return cmd_embed_vocab(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
