#pragma once

#include "instruction_tokenizer.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace watsim {

// Frequency table of contiguous n-token windows.
// Keys are the window tokens joined with a single space.
struct NGramTable {
    int n = 0;
    std::unordered_map<std::string, uint64_t> counts;

    bool empty() const { return counts.empty(); }
    size_t size() const { return counts.size(); }

    // Sum of all counts (number of windows the table was built from)
    uint64_t total() const;

    uint64_t count(const std::string& key) const {
        auto it = counts.find(key);
        return it == counts.end() ? 0 : it->second;
    }

    void add(const std::string& key, uint64_t c) { counts[key] += c; }

    // Entries ordered by count (descending), ties by key (ascending)
    std::vector<std::pair<std::string, uint64_t>> sorted_entries() const;
};

// Slide a width-n window (stride 1) over the tokens and count each window.
// n > tokens.size() yields an empty table. Throws std::invalid_argument if n < 1.
NGramTable build_ngram_table(const TokenSequence& tokens, int n);

// Tables for every n in [min_n, max_n]; index 0 holds min_n.
std::vector<NGramTable> build_ngram_tables(const TokenSequence& tokens, int min_n, int max_n);

// Gram file format: one "<key>\t<count>" line per entry.
// Lines with a field count other than 2 or a count that is not a positive
// integer are skipped; repeated keys are summed.
NGramTable parse_ngram_table(const std::string& text, int n);

std::string format_ngram_table(const NGramTable& table);

// Gram file naming: <dir>/grams/<stem>_<n>gram.txt
std::string gram_file_name(const std::string& stem, int n);

}  // namespace watsim
