#include "codequery_cli/repository_reader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <unordered_set>

#include "codequery_cli/cli_handler.hpp"

namespace codequery_cli {

namespace {

const std::unordered_set<std::string> kCodeExtensions = {
    ".py",   ".js",  ".jsx",  ".ts",  ".tsx", ".java", ".cpp", ".c",  ".h",   ".cs",  ".go",
    ".rs",   ".php", ".rb",   ".swift", ".kt", ".scala", ".r",  ".m",  ".sh",  ".bash", ".sql",
    ".html", ".css", ".vue",  ".json", ".yaml", ".yml", ".xml", ".md", ".txt"};

const std::unordered_set<std::string> kSkippedDirectories = {
    ".git", "node_modules", "__pycache__", "venv", "env", "dist", "build"};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_blank(const std::string& content) {
    return std::all_of(content.begin(), content.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

RepositoryReader::RepositoryReader(std::size_t max_file_size) : max_file_size_(max_file_size) {}

bool RepositoryReader::is_supported_extension(const std::string& extension) {
    return kCodeExtensions.count(to_lower(extension)) > 0;
}

bool RepositoryReader::is_skipped_directory(const std::string& name) {
    return kSkippedDirectories.count(name) > 0;
}

bool RepositoryReader::should_skip(const std::filesystem::path& relative_path) const {
    const std::string filename = relative_path.filename().string();
    if (filename.empty() || filename.front() == '.') {
        return true;
    }
    for (const auto& part : relative_path.parent_path()) {
        if (is_skipped_directory(part.string())) {
            return true;
        }
    }
    return !is_supported_extension(relative_path.extension().string());
}

std::vector<codequery_core::Document> RepositoryReader::read(const std::filesystem::path& root) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw CliError("Not a directory: " + root.string());
    }

    std::vector<codequery_core::Document> documents;
    auto it = std::filesystem::recursive_directory_iterator(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw CliError("Cannot read directory " + root.string() + ": " + ec.message());
    }

    std::error_code walk_ec;
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(walk_ec)) {
        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            if (is_skipped_directory(entry.path().filename().string())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::filesystem::path relative = entry.path().lexically_relative(root);
        if (should_skip(relative)) {
            continue;
        }

        const auto size = entry.file_size(ec);
        if (ec || size > max_file_size_) {
            continue;
        }

        std::ifstream file(entry.path(), std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Error reading " << entry.path().string() << ": cannot open file" << std::endl;
            continue;
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (content.size() > max_file_size_ || is_blank(content)) {
            continue;
        }

        documents.push_back({std::move(content), relative.generic_string(),
                             relative.filename().string(), relative.extension().string()});
    }

    if (walk_ec) {
        throw CliError("Cannot read directory " + root.string() + ": " + walk_ec.message());
    }

    std::sort(documents.begin(), documents.end(),
              [](const auto& a, const auto& b) { return a.filepath < b.filepath; });
    return documents;
}

}  // namespace codequery_cli
