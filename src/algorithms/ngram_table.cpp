#include "ngram_table.h"
#include <algorithm>
#include <stdexcept>

namespace watsim {

uint64_t NGramTable::total() const {
    uint64_t sum = 0;
    for (const auto& kv : counts) sum += kv.second;
    return sum;
}

std::vector<std::pair<std::string, uint64_t>> NGramTable::sorted_entries() const {
    std::vector<std::pair<std::string, uint64_t>> entries(counts.begin(), counts.end());
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) {
                  if (a.second != b.second) return a.second > b.second;
                  return a.first < b.first;
              });
    return entries;
}

NGramTable build_ngram_table(const TokenSequence& tokens, int n) {
    if (n < 1) {
        throw std::invalid_argument("n-gram size must be >= 1, got " + std::to_string(n));
    }

    NGramTable table;
    table.n = n;
    const size_t k = static_cast<size_t>(n);
    if (tokens.size() < k) return table;

    table.counts.reserve(tokens.size() - k + 1);
    for (size_t i = 0; i + k <= tokens.size(); ++i) {
        ++table.counts[join_tokens(tokens, i, i + k)];
    }
    return table;
}

std::vector<NGramTable> build_ngram_tables(const TokenSequence& tokens, int min_n, int max_n) {
    if (min_n < 1 || max_n < min_n) {
        throw std::invalid_argument("invalid n-gram range " + std::to_string(min_n) +
                                    ".." + std::to_string(max_n));
    }
    std::vector<NGramTable> tables;
    tables.reserve(max_n - min_n + 1);
    for (int n = min_n; n <= max_n; ++n) {
        tables.push_back(build_ngram_table(tokens, n));
    }
    return tables;
}

namespace {

inline bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool parse_count(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;  // overflow
        v = v * 10 + d;
    }
    if (v == 0) return false;
    out = v;
    return true;
}

}  // namespace

NGramTable parse_ngram_table(const std::string& text, int n) {
    NGramTable table;
    table.n = n;

    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        start = end + 1;

        size_t first = 0;
        while (first < line.size() && is_blank(line[first])) ++first;
        size_t last = line.size();
        while (last > first && is_blank(line[last - 1])) --last;
        line = line.substr(first, last - first);
        if (line.empty()) continue;

        size_t tab = line.find('\t');
        if (tab == std::string::npos || line.find('\t', tab + 1) != std::string::npos) continue;

        std::string key = line.substr(0, tab);
        uint64_t count = 0;
        if (key.empty() || !parse_count(line.substr(tab + 1), count)) continue;

        table.add(key, count);
    }
    return table;
}

std::string format_ngram_table(const NGramTable& table) {
    std::string out;
    for (const auto& [key, count] : table.sorted_entries()) {
        out += key;
        out.push_back('\t');
        out += std::to_string(count);
        out.push_back('\n');
    }
    return out;
}

std::string gram_file_name(const std::string& stem, int n) {
    return stem + "_" + std::to_string(n) + "gram.txt";
}

}  // namespace watsim
