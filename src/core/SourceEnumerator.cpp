#include "SourceEnumerator.hpp"
#include "Language.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace cycle_mcp {

namespace fs = std::filesystem;

ScanError::ScanError(Reason reason, fs::path path, std::string detail)
    : std::runtime_error(format(reason, path.string(), detail)),
      reason_(reason),
      path_(std::move(path)),
      detail_(std::move(detail)) {}

std::string ScanError::describe(const std::string& shown_path) const {
    return format(reason_, shown_path, detail_);
}

std::string ScanError::format(Reason reason, const std::string& path, const std::string& detail) {
    switch (reason) {
        case Reason::NOT_FOUND:
            return "Path does not exist: " + path;
        case Reason::NOT_A_DIRECTORY:
            return "Path is not a directory: " + path;
        case Reason::UNRESOLVABLE:
            break;
    }
    return "Cannot resolve path " + path + ": " + detail;
}

bool SourceEnumerator::should_skip_directory(const std::string& name, bool include_node_modules) {
    static const std::set<std::string> skip_directories = {
        "node_modules", ".git", "dist", "build", "coverage", ".next", "out"
    };

    if (name == "node_modules") {
        return !include_node_modules;
    }
    return skip_directories.find(name) != skip_directories.end();
}

std::string SourceEnumerator::normalize(const fs::path& path) {
    std::string normalized = path.lexically_normal().generic_string();

    // "a/b/" and "a/b" must name the same node
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

fs::path SourceEnumerator::resolve_root(const fs::path& root) {
    std::error_code ec;

    if (!fs::exists(root, ec)) {
        throw ScanError(ScanError::Reason::NOT_FOUND, root);
    }
    if (!fs::is_directory(root, ec)) {
        throw ScanError(ScanError::Reason::NOT_A_DIRECTORY, root);
    }

    fs::path canonical = fs::canonical(root, ec);
    if (ec) {
        throw ScanError(ScanError::Reason::UNRESOLVABLE, root, ec.message());
    }
    return canonical;
}

std::vector<std::string> SourceEnumerator::enumerate(
    const fs::path& root,
    bool include_node_modules
) {
    fs::path base = resolve_root(root);

    std::set<std::string> unique_files;
    std::vector<fs::path> pending{base};

    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::debug("Skipping unreadable directory {}: {}", dir.string(), ec.message());
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            const fs::directory_entry& entry = *it;
            std::error_code status_ec;

            if (entry.is_symlink(status_ec)) {
                continue;
            }

            if (entry.is_directory(status_ec)) {
                if (!should_skip_directory(entry.path().filename().string(), include_node_modules)) {
                    pending.push_back(entry.path());
                }
            } else if (entry.is_regular_file(status_ec) &&
                       LanguageUtils::is_source_file(entry.path())) {
                unique_files.insert(normalize(entry.path()));
            }
        }

        if (ec) {
            spdlog::debug("Stopped listing {} early: {}", dir.string(), ec.message());
        }
    }

    std::vector<std::string> results(unique_files.begin(), unique_files.end());
    spdlog::debug("Enumerated {} source files under {}", results.size(), base.string());

    return results;
}

} // namespace cycle_mcp
