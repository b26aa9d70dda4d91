#include "prune/caching_exclude_factory.hpp"
#include "prune/config.hpp"
#include "prune/exclude_notation.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {
enum class Mode { each, any, all };

struct Args {
    Mode mode{Mode::each};
    std::string input;       // empty => stdin
    bool no_normalize{false};
    bool no_cache{false};
    bool stats{false};
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "prune_simplify: print the simplified canonical form of exclusion rules\n"
              << "Usage: prune_simplify [--mode=each|any|all] [--input=path]\n"
              << "  [--no-normalize] [--no-cache] [--stats]\n"
              << "Input: one rule per line, e.g. 'org.foo:*', 'all(org.foo:bar, any(a:b, c:*))'.\n"
              << "Blank lines and '#' comments are skipped.\n"
              << "Environment: PRUNE_NORMALIZE, PRUNE_CACHE, PRUNE_CACHE_CAPACITY,\n"
              << "  PRUNE_CACHE_SHARDS, PRUNE_DEBUG\n";
}

static std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(std::move(line));
    return lines;
}
}

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--mode=")) {
            if (*v == "each") args.mode = Mode::each;
            else if (*v == "any") args.mode = Mode::any;
            else if (*v == "all") args.mode = Mode::all;
            else { std::cerr << "Unknown mode: " << *v << "\n"; print_usage(); return 1; }
        }
        else if (auto v = eat(a, "--input=")) args.input = *v;
        else if (a == "--no-normalize") args.no_normalize = true;
        else if (a == "--no-cache") args.no_cache = true;
        else if (a == "--stats") args.stats = true;
        else { std::cerr << "Unknown argument: " << a << "\n"; print_usage(); return 1; }
    }

    auto config = prune::load_config_from_env();
    if (!config) {
        std::cerr << "Configuration error [" << prune::core::to_string(config.error().code) << "] "
                  << config.error().message << "\n";
        return 2;
    }
    if (args.no_normalize) config->normalize = false;
    if (args.no_cache) config->cache = false;

    auto factory = prune::make_exclude_factory(*config);
    if (!factory) {
        std::cerr << "Configuration error [" << prune::core::to_string(factory.error().code) << "] "
                  << factory.error().message << "\n";
        return 2;
    }

    std::vector<std::string> lines;
    if (args.input.empty()) {
        lines = read_lines(std::cin);
    } else {
        std::ifstream file(args.input);
        if (!file.is_open()) {
            std::cerr << "Cannot open input: " << args.input << "\n";
            return 3;
        }
        lines = read_lines(file);
    }

    auto specs = prune::parse_exclude_lines(lines, **factory);
    if (!specs) {
        std::cerr << "Input error: " << specs.error().message << "\n";
        return 3;
    }

    switch (args.mode) {
        case Mode::each:
            for (const auto& s : *specs) std::cout << s << "\n";
            break;
        case Mode::any:
            std::cout << (*factory)->any_of(*specs) << "\n";
            break;
        case Mode::all:
            std::cout << (*factory)->all_of(*specs) << "\n";
            break;
    }

    if (config->debug) {
        const char* mode = args.mode == Mode::each ? "each" : args.mode == Mode::any ? "any" : "all";
        std::cerr << "[PRUNE][simplify] mode=" << mode << " rules=" << specs->size() << "\n";
    }

    if (args.stats) {
        if (auto caching = std::dynamic_pointer_cast<const prune::CachingExcludeFactory>(*factory)) {
            auto st = caching->stats();
            std::cout << "cache: entries=" << caching->size()
                      << " hits=" << st.hits.load()
                      << " misses=" << st.misses.load()
                      << " evictions=" << st.evictions.load()
                      << " hit_rate=" << st.hit_rate() << "\n";
        } else {
            std::cout << "cache: disabled\n";
        }
    }
    return 0;
}
