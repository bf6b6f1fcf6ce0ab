// WATSIM - corpus.cpp
// Corpus layout, item discovery and representation loading

#include "corpus.h"
#include "../algorithms/trimming.h"
#include "../io/text_io.h"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace watsim {

namespace fs = std::filesystem;

std::vector<CorpusItem> make_corpus(const std::vector<std::pair<std::string, std::string>>& targets) {
    std::vector<CorpusItem> items;
    items.reserve(targets.size());
    for (const auto& [algo, lang] : targets) {
        items.push_back({algo, lang});
    }
    return items;
}

CorpusItem parse_corpus_label(const std::string& label) {
    size_t sep = label.find('/');
    if (sep == std::string::npos) sep = label.rfind('_');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= label.size()) {
        throw std::invalid_argument("Invalid corpus label '" + label +
                                    "' (expected <algorithm>_<language>)");
    }
    return {label.substr(0, sep), label.substr(sep + 1)};
}

std::string item_dir(const std::string& root, const CorpusItem& item) {
    return (fs::path(root) / item.algorithm / item.language).string();
}

std::string wat_path(const std::string& root, const CorpusItem& item) {
    return (fs::path(item_dir(root, item)) / (item.algorithm + ".wat")).string();
}

std::vector<std::string> gram_path_candidates(const std::string& root, const CorpusItem& item, int n) {
    fs::path grams = fs::path(item_dir(root, item)) / "grams";
    return {
        (grams / gram_file_name(item.algorithm + "_bg", n)).string(),
        (grams / gram_file_name(item.algorithm, n)).string(),
    };
}

void validate_corpus_root(const std::string& root) {
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        throw std::runtime_error("Corpus root is not a readable directory: " + root);
    }
    fs::directory_iterator it(root, ec);
    if (ec) {
        throw std::runtime_error("Cannot read corpus root " + root + ": " + ec.message());
    }
}

std::string wat_stem(const std::string& path) {
    std::string name = fs::path(path).filename().string();
    for (const char* suffix : {".gz", ".wat"}) {
        const size_t len = std::char_traits<char>::length(suffix);
        if (name.size() > len && name.compare(name.size() - len, len, suffix) == 0) {
            name.erase(name.size() - len);
        }
    }
    return name;
}

std::vector<std::string> write_gram_files(const std::string& wat_path, const TokenSequence& tokens,
                                          int min_n, int max_n) {
    const fs::path grams = fs::path(wat_path).parent_path() / "grams";
    const std::string stem = wat_stem(wat_path);

    std::vector<std::string> written;
    for (const auto& table : build_ngram_tables(tokens, min_n, max_n)) {
        std::string out = (grams / gram_file_name(stem, table.n)).string();
        write_text_file(out, format_ngram_table(table));
        written.push_back(std::move(out));
    }
    return written;
}

namespace {

bool has_wat_extension(const fs::path& p) {
    const std::string name = p.filename().string();
    auto ends_with = [&name](const std::string& suffix) {
        return name.size() > suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".wat") || ends_with(".wat.gz");
}

}  // namespace

std::vector<WatFile> find_wat_files(const std::string& root,
                                    const std::vector<std::string>& algorithms,
                                    const std::vector<std::string>& languages,
                                    Logger& log) {
    std::vector<WatFile> files;
    for (const auto& algo : algorithms) {
        for (const auto& lang : languages) {
            fs::path dir = fs::path(root) / algo / lang;
            std::error_code ec;
            if (!fs::is_directory(dir, ec)) {
                log.detail("No directory for " + algo + "/" + lang + ": " + dir.string());
                continue;
            }

            fs::recursive_directory_iterator it(dir, ec), end;
            if (ec) {
                log.warn("Cannot read " + dir.string() + ": " + ec.message());
                continue;
            }
            for (; it != end; it.increment(ec)) {
                if (ec) {
                    log.warn("Error while scanning " + dir.string() + ": " + ec.message());
                    break;
                }
                std::error_code entry_ec;
                if (it->is_directory(entry_ec) && it->path().filename() == "grams") {
                    it.disable_recursion_pending();
                    continue;
                }
                if (!it->is_regular_file(entry_ec) || !has_wat_extension(it->path())) continue;

                WatFile wf;
                wf.algorithm = algo;
                wf.language = lang;
                wf.path = it->path().string();
                wf.relpath_after_lang = fs::relative(it->path(), dir).generic_string();
                files.push_back(std::move(wf));
            }
        }
    }

    std::sort(files.begin(), files.end(),
              [](const WatFile& a, const WatFile& b) { return a.path < b.path; });
    return files;
}

bool CorpusLoader::load_tokens(const CorpusItem& item, TokenSequence& tokens) const {
    tokens.clear();
    std::string path = wat_path(root_, item);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (fs::exists(path + ".gz", ec)) {
            path += ".gz";
        } else {
            log_.warn("File not found: " + path);
            return false;
        }
    }

    try {
        tokens = tokenize_instructions(read_text_file(path));
    } catch (const std::exception& e) {
        log_.warn(std::string(e.what()) + " (treated as empty)");
        return false;
    }
    return true;
}

ItemRepresentation CorpusLoader::load(const CorpusItem& item, const LoadOptions& opts) const {
    ItemRepresentation rep;
    rep.label = item.label();
    rep.min_n = opts.min_n;

    const bool tokens_needed = opts.need_tokens || (opts.need_tables && !opts.tables_from_grams);
    if (tokens_needed) {
        if (!load_tokens(item, rep.tokens)) {
            rep.missing = true;
        }
    }

    if (opts.need_tables) {
        if (opts.tables_from_grams) {
            size_t found = 0;
            for (int n = opts.min_n; n <= opts.max_n; ++n) {
                NGramTable table;
                table.n = n;
                bool loaded = false;
                bool present = false;
                std::error_code ec;
                for (const auto& candidate : gram_path_candidates(root_, item, n)) {
                    if (!fs::exists(candidate, ec)) continue;
                    present = true;
                    try {
                        table = parse_ngram_table(read_text_file(candidate), n);
                        loaded = true;
                    } catch (const std::exception& e) {
                        log_.warn(std::string(e.what()) + " (treated as empty)");
                    }
                    break;
                }
                if (loaded) {
                    ++found;
                } else if (!present) {
                    log_.warn("Gram file not found: " + gram_path_candidates(root_, item, n).front());
                }
                rep.tables.push_back(std::move(table));
            }
            if (found == 0) rep.missing = true;
        } else {
            rep.tables = build_ngram_tables(rep.tokens, opts.min_n, opts.max_n);
        }
    }

    // Instruction limit applies to the sequence metrics only; tables above
    // were built from the full sequence.
    if (opts.token_limit > 0 && rep.tokens.size() > opts.token_limit) {
        rep.tokens = apply_window(rep.tokens,
                                  select_window(rep.tokens.size(), opts.token_limit, TrimStrategy::Head));
    }
    if (!opts.need_tokens) {
        rep.tokens.clear();
        rep.tokens.shrink_to_fit();
    }
    return rep;
}

std::vector<ItemRepresentation> CorpusLoader::load_all(const std::vector<CorpusItem>& items,
                                                       const LoadOptions& opts) const {
    std::vector<ItemRepresentation> reps;
    reps.reserve(items.size());
    for (const auto& item : items) {
        reps.push_back(load(item, opts));
        const auto& rep = reps.back();
        log_.detail(rep.label + ": " + std::to_string(rep.tokens.size()) + " instructions" +
                    (rep.missing ? " (missing)" : ""));
    }
    return reps;
}

}  // namespace watsim
