#include <layout_chunker/document_chunker.h>
#include <layout_chunker/json_serializer.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <numeric>
#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <getopt.h>
#include <fstream>

namespace fs = std::filesystem;
using namespace layout_chunker;

struct CLIOptions {
    std::string input_file;
    std::string output_file;
    std::string config_file;
    std::string vocabulary_file;
    int from_page = 0;
    int to_page = 100000;
    std::string lang = "Chinese";
    std::optional<std::string> layout;
    std::optional<int> chunk_token_num;
    std::optional<std::string> delimiter;
    bool verbose = false;
    bool quiet = false;
    bool analyze = true;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input FILE           Input .pdf or .docx file\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output FILE          Output JSON file path (default: <input>_chunks.json)\n";
    std::cout << "  --from-page N              First page to process, 0-based (default: 0)\n";
    std::cout << "  --to-page N                Page to stop before (default: 100000)\n";
    std::cout << "  --lang LANG                Document language (default: Chinese)\n";
    std::cout << "  --layout NAME              Layout recognizer: DeepDOC, \"Plain Text\" or a vision model\n";
    std::cout << "  --chunk-token-num N        Advisory chunk size recorded in the config (default: 512)\n";
    std::cout << "  --delimiter STR            Delimiter characters recorded in the config\n";
    std::cout << "  --config FILE              Parser config JSON; flags above override it\n";
    std::cout << "  --vocab FILE               tiktoken vocabulary for token counts (default: estimate)\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  --no-analyze               Skip chunk distribution analysis\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i manual.pdf\n";
    std::cout << "  " << program_name << " -i manual.pdf -o chunks.json --from-page 2 --to-page 10\n";
    std::cout << "  " << program_name << " --input guide.docx --lang English --verbose\n";
}

void print_version() {
    std::cout << "layout_chunker chunk_cli version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF, nlohmann_json and RapidJSON\n";
}

int parse_int(const char* value, const char* name) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(name);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " expects an integer, got '" + value + "'");
    }
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"from-page", required_argument, nullptr, 1001},
        {"to-page", required_argument, nullptr, 1002},
        {"lang", required_argument, nullptr, 1003},
        {"layout", required_argument, nullptr, 1004},
        {"chunk-token-num", required_argument, nullptr, 1005},
        {"delimiter", required_argument, nullptr, 1006},
        {"config", required_argument, nullptr, 1007},
        {"vocab", required_argument, nullptr, 1008},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"no-analyze", no_argument, nullptr, 1009},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1010},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_file = optarg;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 1001:  // from-page
                options.from_page = parse_int(optarg, "from-page");
                if (options.from_page < 0) {
                    throw std::invalid_argument("from-page cannot be negative");
                }
                break;
            case 1002:  // to-page
                options.to_page = parse_int(optarg, "to-page");
                break;
            case 1003:  // lang
                options.lang = optarg;
                break;
            case 1004:  // layout
                options.layout = std::string(optarg);
                break;
            case 1005:  // chunk-token-num
                options.chunk_token_num = parse_int(optarg, "chunk-token-num");
                if (*options.chunk_token_num <= 0) {
                    throw std::invalid_argument("chunk-token-num must be positive");
                }
                break;
            case 1006:  // delimiter
                options.delimiter = std::string(optarg);
                break;
            case 1007:  // config
                options.config_file = optarg;
                break;
            case 1008:  // vocab
                options.vocabulary_file = optarg;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 1009:  // no-analyze
                options.analyze = false;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1010:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_file.empty()) {
        throw std::invalid_argument("Input file is required");
    }

    if (options.to_page <= options.from_page) {
        throw std::invalid_argument("to-page must be greater than from-page");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    if (options.output_file.empty()) {
        fs::path input_path(options.input_file);
        fs::path output_dir = input_path.parent_path();
        if (output_dir.empty()) {
            output_dir = ".";
        }
        std::string stem = input_path.stem().string();
        options.output_file = (output_dir / (stem + "_chunks.json")).string();
    }

    return options;
}

ParserConfig load_parser_config(const CLIOptions& options) {
    ParserConfig config;

    if (!options.config_file.empty()) {
        std::ifstream file(options.config_file);
        if (!file) {
            throw std::invalid_argument("Cannot open config file: " + options.config_file);
        }
        try {
            config = JsonSerializer::parse_config(nlohmann::json::parse(file));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument("Malformed config file " + options.config_file + ": " + e.what());
        }
    }

    if (options.layout) config.layout_recognize = *options.layout;
    if (options.chunk_token_num) config.chunk_token_num = *options.chunk_token_num;
    if (options.delimiter) config.delimiter = *options.delimiter;

    return config;
}

void analyze_chunk_distribution(const std::vector<IndexRecord>& records) {
    if (records.empty()) {
        std::cout << "\nNo records created\n";
        return;
    }

    std::map<std::string, int> kinds;
    std::vector<size_t> token_counts;
    for (const auto& record : records) {
        kinds[to_string(record.kind)]++;
        token_counts.push_back(record.token_count);
    }

    std::sort(token_counts.begin(), token_counts.end());

    double avg_tokens = std::accumulate(token_counts.begin(), token_counts.end(), 0.0) / token_counts.size();

    std::cout << "\n=== Chunk Distribution Analysis ===\n";
    std::cout << "Total records: " << records.size() << "\n";
    for (const auto& [kind, count] : kinds) {
        std::cout << "  " << kind << ": " << count << "\n";
    }
    std::cout << "Min tokens: " << token_counts.front() << "\n";
    std::cout << "Max tokens: " << token_counts.back() << "\n";
    std::cout << "Average tokens: " << static_cast<int>(avg_tokens) << "\n";

    std::cout << "\nQuintiles:\n";
    for (int p = 20; p <= 80; p += 20) {
        size_t idx = (token_counts.size() - 1) * p / 100;
        std::cout << "  " << p << "th percentile: " << token_counts[idx] << " tokens\n";
    }

    // Buckets around the 32 / 1024 merge thresholds
    std::vector<std::pair<std::string, int>> distribution = {
        {"1-31", 0}, {"32-127", 0}, {"128-511", 0}, {"512-1023", 0}, {"1024+", 0}
    };
    for (size_t tokens : token_counts) {
        if (tokens < 32) distribution[0].second++;
        else if (tokens < 128) distribution[1].second++;
        else if (tokens < 512) distribution[2].second++;
        else if (tokens < 1024) distribution[3].second++;
        else distribution[4].second++;
    }

    std::cout << "\nToken Range Distribution:\n";
    for (const auto& [range, count] : distribution) {
        double percentage = (count * 100.0) / records.size();
        std::cout << "  " << std::setw(10) << range << " tokens: "
                  << std::setw(5) << count << " records ("
                  << std::fixed << std::setprecision(1) << percentage << "%)\n";
    }
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        if (!fs::exists(options.input_file)) {
            throw std::runtime_error("Input file not found: " + options.input_file);
        }

        fs::path output_path(options.output_file);
        fs::path output_dir = output_path.parent_path();
        if (!output_dir.empty() && !fs::exists(output_dir)) {
            if (options.verbose) {
                std::cout << "Creating output directory: " << output_dir << "\n";
            }
            fs::create_directories(output_dir);
        }

        DocumentInput input;
        input.name = fs::path(options.input_file).filename().string();
        input.path = options.input_file;
        input.from_page = options.from_page;
        input.to_page = options.to_page;
        input.lang = options.lang;
        input.config = load_parser_config(options);

        ChunkerOptions chunker_opts;
        chunker_opts.thread_count = 1;
        chunker_opts.verbose = options.verbose;
        chunker_opts.vocabulary_path = options.vocabulary_file;

        DocumentChunker chunker(chunker_opts);

        if (!options.quiet) {
            std::cout << "Processing: " << options.input_file << "\n";
            std::cout << "Output: " << options.output_file << "\n";
            std::cout << "Configuration:\n";
            std::cout << "  Pages: [" << input.from_page << ", " << input.to_page << ")\n";
            std::cout << "  Language: " << input.lang << "\n";
            std::cout << "  Parser config: " << JsonSerializer::config_to_json(input.config).dump() << "\n";
            std::cout << "  Tokenizer: "
                      << (options.vocabulary_file.empty() ? "estimate" : options.vocabulary_file) << "\n";
            std::cout << "\n";
        }

        ProgressCallback progress;
        if (options.verbose) {
            progress = [](double value, const std::string& message) {
                if (value >= 0.0) {
                    std::cout << "[" << std::fixed << std::setprecision(2) << value << "] ";
                }
                std::cout << message << "\n";
            };
        }

        auto start = std::chrono::high_resolution_clock::now();

        auto records = chunker.chunk(input, progress);

        auto processing_end = std::chrono::high_resolution_clock::now();

        if (options.analyze && !options.quiet) {
            analyze_chunk_distribution(records);
        }

        if (options.verbose) {
            std::cout << "\nSaving records to JSON...\n";
        }

        std::ofstream out(options.output_file);
        if (!out) {
            throw std::runtime_error("Cannot open output file: " + options.output_file);
        }
        out << JsonSerializer::serialize_records(records, true);
        if (!out) {
            throw std::runtime_error("Failed to write JSON output");
        }
        out.close();

        auto end = std::chrono::high_resolution_clock::now();

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        auto processing_duration = std::chrono::duration_cast<std::chrono::milliseconds>(processing_end - start);

        if (!options.quiet) {
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Records created: " << records.size() << "\n";
            std::cout << "Processing time: " << processing_duration.count() << "ms\n";
            std::cout << "Total time: " << total_duration.count() << "ms\n";
            std::cout << "Output saved to: " << options.output_file << "\n";
        } else {
            // Parseable one-liner
            std::cout << "SUCCESS|" << options.input_file << "|"
                      << records.size() << "|"
                      << total_duration.count() << "\n";
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
