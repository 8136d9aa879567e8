#include "codequery_cli/cli_handler.hpp"

#include <iomanip>  // Required for std::fixed and std::setprecision
#include <iostream>

#include "codequery_cli/repository_reader.hpp"
#include "codequery_core/text_utils.hpp"

namespace codequery_cli {

namespace {

int parse_top_k(const std::string& value) {
    int top_k = 0;
    try {
        std::size_t consumed = 0;
        top_k = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Invalid --top-k value: " + value);
        }
    } catch (const std::logic_error&) {
        throw CliError("Invalid --top-k value: " + value);
    }
    if (top_k <= 0) {
        throw CliError("--top-k must be greater than 0");
    }
    return top_k;
}

void parse_query_flags(int argc, char* argv[], CliOptions& options) {
    for (int i = 2; i < argc; i += 2) {
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + std::string(argv[i]));
        }
        std::string flag = argv[i];
        std::string value = argv[i + 1];

        if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_top_k(value);
        } else if (flag == "--index" || flag == "-i") {
            options.index_path = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }
}

}  // namespace

CliHandler::CliHandler(codequery_core::Config config,
                       std::shared_ptr<codequery_core::LlmClient> llm_client)
    : config_(std::move(config)), llm_client_(std::move(llm_client)) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    options.command = Command::Help;
    options.top_k = 0;

    if (argc < 2) {
        return options;
    }

    std::string command = argv[1];

    if (command == "index" || command == "x") {
        options.command = Command::Index;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) {
                throw CliError("Missing value for " + std::string(argv[i]));
            }
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--dir" || flag == "-d") {
                options.directory = value;
            } else if (flag == "--out" || flag == "-o") {
                options.index_path = value;
            } else {
                throw CliError("Unknown option: " + flag);
            }
        }
        if (options.directory.empty()) {
            throw CliError("Index command requires a directory. Usage: index --dir <path>");
        }
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        parse_query_flags(argc, argv, options);
        if (options.query.empty()) {
            throw CliError("Search command requires a query. Usage: search --query <query>");
        }
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        parse_query_flags(argc, argv, options);
        if (options.query.empty()) {
            throw CliError("Ask command requires a query. Usage: ask --query <question>");
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Index:
            handle_index_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

void CliHandler::handle_index_command(const CliOptions& options) {
    std::cout << "Reading repository: " << options.directory << std::endl;
    RepositoryReader reader;
    auto documents = reader.read(options.directory);
    std::cout << "Found " << documents.size() << " files" << std::endl;

    codequery_core::RetrievalSession session(config_, llm_client_);
    std::size_t indexed = session.ingest(documents);

    const std::string index_path = resolve_index_path(options);
    session.save(index_path);
    std::cout << "Indexed " << indexed << " chunks from " << documents.size() << " files into "
              << index_path << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    const int top_k = resolve_top_k(options);
    std::cout << "Search for: " << options.query << " (top_k: " << top_k << ")" << std::endl;

    auto session = open_session(options);
    auto results = session->search(options.query, top_k);

    if (results.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    std::cout << "\n=== Matching Chunks ===" << std::endl;
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        std::cout << (i + 1) << ". " << result.chunk.filepath << " [chunk "
                  << (result.chunk.chunk_id + 1) << "/" << result.chunk.total_chunks
                  << "] (distance: " << std::fixed << std::setprecision(4) << result.distance
                  << ")" << std::endl;
        std::cout << "   " << codequery_core::text::prefix(result.chunk.content, 120) << "..."
                  << std::endl;
    }
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    const int top_k = resolve_top_k(options);
    auto session = open_session(options);
    auto result = session->ask(options.query, top_k);

    std::cout << "\n=== Answer ===\n" << result.answer << std::endl;
    if (!result.sources.empty()) {
        std::cout << "\n=== Sources ===" << std::endl;
        for (const auto& source : result.sources) {
            std::cout << "- " << source.filepath << " (distance: " << std::fixed
                      << std::setprecision(4) << source.score << ")" << std::endl;
        }
    }
    std::cout << "\nUsed " << result.chunks_used << " of " << result.chunks_retrieved
              << " retrieved chunks" << std::endl;
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

std::unique_ptr<codequery_core::RetrievalSession> CliHandler::open_session(const CliOptions& options) {
    auto session = std::make_unique<codequery_core::RetrievalSession>(config_, llm_client_);
    session->load(resolve_index_path(options));
    return session;
}

std::string CliHandler::resolve_index_path(const CliOptions& options) const {
    return options.index_path.empty() ? config_.index_directory : options.index_path;
}

int CliHandler::resolve_top_k(const CliOptions& options) const {
    return options.top_k > 0 ? options.top_k : config_.top_k;
}

void CliHandler::print_help() {
    std::cout << "CodeQuery - ask questions about a code repository\n\n";
    std::cout << "Usage: codequery <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  index, x     Index a repository\n";
    std::cout << "               --dir, -d <path>     Repository directory (required)\n";
    std::cout << "               --out, -o <dir>      Index directory (default: index_directory)\n\n";
    std::cout << "  search, s    Find the chunks most similar to a query\n";
    std::cout << "               --query, -q <text>   Search query (required)\n";
    std::cout << "               --top-k, -k <n>      Number of results (default: top_k)\n";
    std::cout << "               --index, -i <dir>    Index directory (default: index_directory)\n\n";
    std::cout << "  ask, a       Answer a question from the indexed code\n";
    std::cout << "               --query, -q <text>   Question (required)\n";
    std::cout << "               --top-k, -k <n>      Chunks to retrieve (default: top_k)\n";
    std::cout << "               --index, -i <dir>    Index directory (default: index_directory)\n\n";
    std::cout << "  help, h      Show this help message\n\n";
    std::cout << "Environment:\n";
    std::cout << "  CODEQUERY_CONFIG   Configuration file (default: codequeryrc.json)\n";
}

}  // namespace codequery_cli
