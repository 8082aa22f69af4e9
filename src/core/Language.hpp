#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cycle_mcp {

/**
 * @brief Syntactic shape a module reference was found in
 *
 * Kept for diagnostics only; resolution treats all kinds alike.
 */
enum class ReferenceKind {
    IMPORT_FROM,     // import ... from '...'
    EXPORT_FROM,     // export ... from '...'
    DYNAMIC_IMPORT,  // import('...')
    REQUIRE          // require('...')
};

/**
 * @brief Language utilities for the TypeScript/JavaScript module ecosystem
 *
 * Centralizes the extension tables shared by the enumerator and the resolver
 * so both agree on what a source file is and in which order extensions are probed.
 */
class LanguageUtils {
public:
    /**
     * @brief Check if a path names a supported source file
     *
     * Comparison is case-insensitive on the extension.
     *
     * @param filepath Path to the file
     * @return true for .ts, .tsx, .js, .jsx, .mts, .mjs, .cts, .cjs
     */
    static bool is_source_file(const std::filesystem::path& filepath);

    /**
     * @brief Supported source extensions in probe order
     * @return Extensions including the leading dot
     */
    static const std::vector<std::string>& source_extensions();

    /**
     * @brief Extension of compiled output that may be written in references
     * @return ".js"
     */
    static std::string_view compiled_output_extension();

    /**
     * @brief Extensions tried when bridging a compiled-output reference back to source
     * @return Extensions including the leading dot
     */
    static const std::vector<std::string>& compiled_source_extensions();

    /**
     * @brief Stem of the file probed when a reference names a directory
     */
    static std::string_view index_stem();

    /**
     * @brief Convert ReferenceKind to string name
     *
     * @param kind Reference kind
     * @return String representation (e.g., "import_from", "require")
     */
    static std::string_view to_string(ReferenceKind kind);
};

}  // namespace cycle_mcp
