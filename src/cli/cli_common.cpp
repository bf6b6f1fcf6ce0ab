// WATSIM - cli_common.cpp
// Common CLI infrastructure implementation

#include "cli_common.h"
#include <iostream>
#include <algorithm>
#include <iomanip>

namespace watsim {

void CLICommand::print_help() const {
    std::cerr << "Usage: watsim " << name << " [options]\n\n";
    std::cerr << description << "\n";

    for (const auto& line : description_extra) {
        std::cerr << line << "\n";
    }
    std::cerr << "\n";

    // Collect required and optional options
    std::vector<const CLIOption*> required_opts;
    std::vector<const CLIOption*> optional_opts;

    for (const auto& opt : options) {
        if (opt.required) {
            required_opts.push_back(&opt);
        } else {
            optional_opts.push_back(&opt);
        }
    }

    // Calculate column width based on longest option/output
    const size_t MIN_COL = 21;
    size_t opt_col = MIN_COL;
    size_t out_col = MIN_COL;

    for (const auto& opt : options) {
        size_t len = 2 + opt.name.length();
        if (!opt.arg_name.empty()) len += 1 + opt.arg_name.length();
        if (len + 1 > opt_col) opt_col = len + 1;
    }
    for (const auto& out : outputs) {
        size_t len = 2 + out.filename.length();
        if (len + 1 > out_col) out_col = len + 1;
    }

    // Print required section
    if (!required_opts.empty()) {
        std::cerr << "Required:\n";
        for (const auto* opt : required_opts) {
            std::string opt_str = "  " + opt->name;
            if (!opt->arg_name.empty()) {
                opt_str += " " + opt->arg_name;
            }
            while (opt_str.length() < opt_col) opt_str += " ";
            std::cerr << opt_str << opt->description << "\n";
        }
        std::cerr << "\n";
    }

    // Print options section
    std::cerr << "Options:\n";
    for (const auto* opt : optional_opts) {
        std::string opt_str = "  " + opt->name;
        if (!opt->arg_name.empty()) {
            opt_str += " " + opt->arg_name;
        }
        while (opt_str.length() < opt_col) opt_str += " ";

        std::string desc = opt->description;
        if (!opt->default_value.empty()) {
            desc += " (default: " + opt->default_value + ")";
        }
        std::cerr << opt_str << desc << "\n";
    }
    std::cerr << "\n";

    // Print output section
    if (!outputs.empty()) {
        std::cerr << "Output:\n";
        for (const auto& out : outputs) {
            std::string out_str = "  " + out.filename;
            while (out_str.length() < out_col) out_str += " ";
            std::string desc = out.description;
            if (!out.condition.empty()) {
                desc += " " + out.condition;
            }
            std::cerr << out_str << desc << "\n";
        }
        std::cerr << "\n";
    }

    // Print note section
    if (!note.empty()) {
        std::cerr << "Note:\n  " << note << "\n\n";
    }

    // Print examples
    if (!examples.empty()) {
        std::cerr << "Example:\n";
        for (const auto& ex : examples) {
            std::cerr << "  " << ex << "\n";
        }
    }
}

bool CLICommand::has_help_flag(int argc, char** argv) const {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return true;
        }
    }
    return false;
}

std::vector<std::string> CLICommand::get_missing_required(int argc, char** argv) const {
    std::vector<std::string> missing;
    for (const auto& opt : options) {
        if (opt.required) {
            bool found = false;
            for (int i = 1; i < argc; ++i) {
                if (argv[i] == opt.name && i + 1 < argc) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                missing.push_back(opt.name);
            }
        }
    }
    return missing;
}

bool CLICommand::validate_required(int argc, char** argv) const {
    auto missing = get_missing_required(argc, argv);
    if (missing.empty()) {
        return true;
    }

    std::cerr << "Error: Missing required arguments.\n";
    std::cerr << "Required:";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) std::cerr << ",";
        std::cerr << " " << missing[i];
    }
    std::cerr << "\n\n";
    print_help();
    return false;
}

// Command definitions

CLICommand make_tokenize_command() {
    CLICommand cmd;
    cmd.name = "tokenize";
    cmd.description = "Print the instruction tokens of a WAT file, one per line.";
    cmd.description_extra = {
        "",
        "Numeric literals, hex immediates and declaration keywords (module, func, param, ...)",
        "are dropped; dotted instructions (i32.add, local.get) and control opcodes are kept.",
    };

    cmd.options = {
        {"--wat", "FILE", "Input WAT file (.wat or .wat.gz)", "", true},
        {"--count", "", "Print only the number of instructions"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.examples = {
        "watsim tokenize --wat data/bubsort/go/bubsort.wat",
        "watsim tokenize --wat data/bubsort/rust/pkg/bubsort_bg.wat --count",
    };

    return cmd;
}

CLICommand make_ngrams_command() {
    CLICommand cmd;
    cmd.name = "ngrams";
    cmd.description = "Write instruction n-gram frequency tables next to WAT files.";

    cmd.options = {
        {"--wat", "FILE", "Single WAT file"},
        {"--corpus", "DIR", "Corpus root laid out as <algo>/<lang>/**.wat"},
        {"--algos", "LIST", "Comma-separated algorithms (corpus mode)",
         "bubsort,collatz,fizzbuzz,helloworld,wordcount"},
        {"--langs", "LIST", "Comma-separated languages (corpus mode)", "c,go,js,rust,ts"},
        {"--min-n", "N", "Smallest n-gram width", "1"},
        {"--max-n", "N", "Largest n-gram width", "6"},
        {"-v, --verbose", "", "Enable verbose output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"grams/<stem>_<n>gram.txt", "\"<n-gram>\\t<count>\" lines, most frequent first"},
        {"ngrams_trace.log", "Trace log", "(corpus mode, in the corpus root)"},
    };

    cmd.note = "Exactly one of --wat or --corpus must be given.";

    cmd.examples = {
        "watsim ngrams --wat data/bubsort/go/bubsort.wat",
        "watsim ngrams --corpus trimmed/1 --min-n 1 --max-n 6",
    };

    return cmd;
}

CLICommand make_matrix_command() {
    CLICommand cmd;
    cmd.name = "matrix";
    cmd.description = "Build pairwise similarity matrices over a WAT corpus.";
    cmd.description_extra = {
        "",
        "N-gram metrics (cosine, jaccard, overlap, manhattan, kl) are averaged over",
        "n = min-n..max-n. LCS compares full instruction sequences.",
    };

    cmd.options = {
        {"--corpus", "DIR", "Corpus root laid out as <algo>/<lang>/<algo>.wat", "", true},
        {"--output", "DIR", "Output directory", "current directory"},
        {"--metrics", "LIST", "Comma-separated metrics", "cosine,jaccard,overlap,manhattan,kl,lcs"},
        {"--targets", "LIST", "Comma-separated <algo>_<lang> labels in matrix order",
         "15 study targets"},
        {"--source", "SRC", "Read n-grams from: wat (tokenize sources) or grams (gram files)", "wat"},
        {"--lcs-method", "M", "LCS normalization: min, avg or max", "min"},
        {"--lcs-limit", "N", "Compare only the first N instructions with LCS (0 = all)", "0"},
        {"--min-n", "N", "Smallest n-gram width", "1"},
        {"--max-n", "N", "Largest n-gram width", "6"},
        {"--threads", "N", "Number of threads", "1"},
        {"-v, --verbose", "", "Enable verbose output (per-pair scores)"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"<metric>_similarity_matrix.csv", "Labeled similarity matrix per n-gram metric"},
        {"lcs_instruction_similarity_matrix_<m>.csv", "LCS similarity matrix", "(with lcs)"},
        {"matrix_trace.log", "Detailed trace log"},
    };

    cmd.note = "Missing sources are reported as warnings and score 0 against every other item.";

    cmd.examples = {
        "watsim matrix --corpus data --output results/",
        "watsim matrix --corpus trimmed/3 --metrics lcs --lcs-method avg --threads 8",
    };

    return cmd;
}

CLICommand make_trim_command() {
    CLICommand cmd;
    cmd.name = "trim";
    cmd.description = "Produce trimmed variants of a WAT corpus.";
    cmd.description_extra = {
        "",
        "head/middle/tail keep a fixed window and write a single trial.",
        "random keeps a uniformly placed window per file and repeats for --trials.",
    };

    cmd.options = {
        {"--input", "DIR", "Corpus root laid out as <algo>/<lang>/**.wat", "", true},
        {"--output", "DIR", "Output root", "trimmed"},
        {"--method", "M", "Trim strategy: head, middle, tail or random", "random"},
        {"--unit", "U", "Trim unit: lines or tokens", "lines"},
        {"--lines", "N", "Number of units to keep", "500"},
        {"--trials", "N", "Number of random trials", "10"},
        {"--seed", "N", "Master random seed (random method)", "random_device"},
        {"--algos", "LIST", "Comma-separated algorithms",
         "bubsort,collatz,fizzbuzz,helloworld,wordcount"},
        {"--langs", "LIST", "Comma-separated languages", "c,go,js,rust,ts"},
        {"--write-grams", "", "Write n-gram tables next to each trimmed file"},
        {"--min-n", "N", "Smallest n-gram width for --write-grams", "1"},
        {"--max-n", "N", "Largest n-gram width for --write-grams", "6"},
        {"-v, --verbose", "", "Enable verbose output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"<trial>/<algo>/<lang>/<rel>", "Trimmed WAT files"},
        {"<trial>/trim_log.csv", "Per-file totals, kept counts and window start"},
        {"<trial>/.../grams/*_<n>gram.txt", "N-gram tables", "(with --write-grams)"},
        {"trim_trace.log", "Trace log with seeds and reduction statistics"},
    };

    cmd.note = "The same --seed reproduces every trial's window offsets.";

    cmd.examples = {
        "watsim trim --input data --output trimmed --method random --lines 1000 --trials 10 --seed 42",
        "watsim trim --input data --output trimmed-head --method head --lines 500 --write-grams",
    };

    return cmd;
}

CLICommand make_average_command() {
    CLICommand cmd;
    cmd.name = "average";
    cmd.description = "Average per-trial similarity matrices and compare with a baseline.";

    cmd.options = {
        {"--matrices", "LIST", "Comma-separated matrix CSV files (same labels, same order)", "", true},
        {"--output", "FILE", "Averaged matrix CSV", "similarity_matrix_avg.csv"},
        {"--baseline", "FILE", "Untrimmed matrix to correlate with the average"},
        {"-v, --verbose", "", "Enable verbose output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"<output>", "Element-wise mean matrix"},
        {"average_trace.log", "Trace log with Pearson r", "(next to <output>)"},
    };

    cmd.examples = {
        "watsim average --matrices r/1/cosine_similarity_matrix.csv,r/2/cosine_similarity_matrix.csv",
        "watsim average --matrices a.csv,b.csv --baseline base.csv --output avg.csv",
    };

    return cmd;
}

}  // namespace watsim
