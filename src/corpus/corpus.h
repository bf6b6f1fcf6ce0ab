// WATSIM - corpus.h
// Corpus layout, item discovery and representation loading

#pragma once

#include "../algorithms/instruction_tokenizer.h"
#include "../algorithms/ngram_table.h"
#include "../util/logger.h"
#include <string>
#include <utility>
#include <vector>

namespace watsim {

// One (algorithm, language) program in the corpus
struct CorpusItem {
    std::string algorithm;
    std::string language;

    std::string label() const { return algorithm + "_" + language; }
};

std::vector<CorpusItem> make_corpus(const std::vector<std::pair<std::string, std::string>>& targets);

// Parses "algo_lang" (split at the last underscore) or "algo/lang".
// Throws std::invalid_argument if neither separator is present.
CorpusItem parse_corpus_label(const std::string& label);

// <root>/<algorithm>/<language>
std::string item_dir(const std::string& root, const CorpusItem& item);
// <root>/<algorithm>/<language>/<algorithm>.wat
std::string wat_path(const std::string& root, const CorpusItem& item);
// <root>/<algorithm>/<language>/grams/<algorithm>_bg_<n>gram.txt, then <algorithm>_<n>gram.txt
std::vector<std::string> gram_path_candidates(const std::string& root, const CorpusItem& item, int n);

// Throws std::runtime_error if root is not a readable directory
void validate_corpus_root(const std::string& root);

// File name without ".wat" / ".wat.gz" ("pkg/bubsort_bg.wat" -> "bubsort_bg")
std::string wat_stem(const std::string& path);

// Writes <dir of wat_path>/grams/<stem>_<n>gram.txt for n in [min_n, max_n].
// Returns the written paths; throws std::runtime_error on write failure.
std::vector<std::string> write_gram_files(const std::string& wat_path, const TokenSequence& tokens,
                                          int min_n, int max_n);

// A WAT file found under <root>/<algorithm>/<language>/
struct WatFile {
    std::string algorithm;
    std::string language;
    std::string path;
    std::string relpath_after_lang;  // e.g. "bubsort.wat" or "pkg/bubsort_bg.wat"
};

// Recursively collects *.wat (and *.wat.gz) files for every algorithm x
// language directory, skipping grams/ directories. Sorted by path.
// Missing directories are reported through log.detail and skipped.
std::vector<WatFile> find_wat_files(const std::string& root,
                                    const std::vector<std::string>& algorithms,
                                    const std::vector<std::string>& languages,
                                    Logger& log);

// Everything a metric needs about one corpus item.
// Tables are aligned to [min_n, max_n]: tables[k] holds n = min_n + k.
struct ItemRepresentation {
    std::string label;
    TokenSequence tokens;
    std::vector<NGramTable> tables;
    int min_n = 1;
    bool missing = false;   // source (or every gram file) was not found

    const NGramTable* table(int n) const {
        int k = n - min_n;
        if (k < 0 || k >= (int)tables.size()) return nullptr;
        return &tables[k];
    }
};

struct LoadOptions {
    int min_n = 1;
    int max_n = 6;
    bool need_tokens = true;
    bool need_tables = true;
    bool tables_from_grams = false;  // read grams/ files instead of tokenizing
    size_t token_limit = 0;          // keep only the first N instructions (0 = all)
};

// Builds representations from a corpus root. Missing inputs are logged as
// warnings and produce empty tables/sequences rather than errors.
class CorpusLoader {
public:
    CorpusLoader(const std::string& root, Logger& log) : root_(root), log_(log) {}

    ItemRepresentation load(const CorpusItem& item, const LoadOptions& opts) const;
    std::vector<ItemRepresentation> load_all(const std::vector<CorpusItem>& items,
                                             const LoadOptions& opts) const;

    // Reads and tokenizes the item's WAT source; returns false if missing
    bool load_tokens(const CorpusItem& item, TokenSequence& tokens) const;

    const std::string& root() const { return root_; }

private:
    std::string root_;
    Logger& log_;
};

}  // namespace watsim
