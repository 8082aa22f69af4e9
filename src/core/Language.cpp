#include "Language.hpp"
#include <algorithm>
#include <cctype>

namespace cycle_mcp {

bool LanguageUtils::is_source_file(const std::filesystem::path& filepath) {
    if (filepath.empty()) {
        return false;
    }

    std::string ext = filepath.extension().string();
    if (ext.empty()) {
        return false;
    }

    // Convert to lowercase for case-insensitive comparison
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    const auto& extensions = source_extensions();
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

const std::vector<std::string>& LanguageUtils::source_extensions() {
    static const std::vector<std::string> extensions = {
        ".ts", ".tsx", ".js", ".jsx", ".mts", ".mjs", ".cts", ".cjs"
    };
    return extensions;
}

std::string_view LanguageUtils::compiled_output_extension() {
    return ".js";
}

const std::vector<std::string>& LanguageUtils::compiled_source_extensions() {
    static const std::vector<std::string> extensions = {".ts", ".tsx"};
    return extensions;
}

std::string_view LanguageUtils::index_stem() {
    return "index";
}

std::string_view LanguageUtils::to_string(ReferenceKind kind) {
    switch (kind) {
        case ReferenceKind::IMPORT_FROM:
            return "import_from";
        case ReferenceKind::EXPORT_FROM:
            return "export_from";
        case ReferenceKind::DYNAMIC_IMPORT:
            return "dynamic_import";
        case ReferenceKind::REQUIRE:
            return "require";
        default:
            return "unknown";
    }
}

}  // namespace cycle_mcp
