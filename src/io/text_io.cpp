#include "text_io.h"
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <zlib.h>

namespace watsim {

std::string read_text_file(const std::string& path) {
    // gzopen reads uncompressed files transparently
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    gzbuffer(gz, 262144);  // 256KB

    std::string text;
    char buffer[65536];
    while (true) {
        int n = gzread(gz, buffer, sizeof(buffer));
        if (n < 0) {
            int errnum = 0;
            std::string msg = gzerror(gz, &errnum);
            gzclose(gz);
            throw std::runtime_error("Failed to read " + path + ": " + msg);
        }
        if (n == 0) break;
        text.append(buffer, static_cast<size_t>(n));
    }
    gzclose(gz);
    return text;
}

void write_text_file(const std::string& path, const std::string& text) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    out << text;
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

std::vector<std::string> split_lines_keepends(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    size_t total = 0;
    for (const auto& l : lines) total += l.size();
    std::string out;
    out.reserve(total);
    for (const auto& l : lines) out += l;
    return out;
}

std::vector<std::string> split_list(const std::string& s, char delim) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(delim, start);
        if (end == std::string::npos) end = s.size();
        std::string field = s.substr(start, end - start);
        size_t b = field.find_first_not_of(" \t");
        size_t e = field.find_last_not_of(" \t");
        if (b != std::string::npos) {
            out.push_back(field.substr(b, e - b + 1));
        }
        start = end + 1;
    }
    return out;
}

size_t parse_count_arg(const std::string& value, const std::string& option) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(option + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(option + " value out of range: " + value);
    }
}

int parse_positive_int_arg(const std::string& value, const std::string& option) {
    size_t v = parse_count_arg(value, option);
    if (v < 1 || v > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument(option + " must be at least 1, got '" + value + "'");
    }
    return static_cast<int>(v);
}

}  // namespace watsim
