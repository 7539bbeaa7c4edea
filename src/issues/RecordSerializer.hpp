#pragma once

#include "IssueTypes.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace issues
{

// Metadata block and body of a persisted issue record
struct ParsedRecord
{
    FrontmatterFields fields;
    std::string body;

    [[nodiscard]] std::optional<std::string> field(std::string_view key) const;
};

/// Renders issues as markdown records with a "---" delimited metadata block:
///
///   ---
///   title: "Timeout"
///   group: "INFRA"
///   ...
///   ---
///
///   ## Timeout
///
/// Field order is fixed (title, group, category, priority, status, source,
/// issue_index, sequence) and followed by the issue's extra fields in order.
class RecordSerializer
{
public:
    [[nodiscard]] static FrontmatterFields buildFrontmatter(const Issue& issue, const std::string& source);

    [[nodiscard]] static std::string serialize(const Issue& issue, const std::string& source);

    /// Path of the source document relative to root, with forward slashes.
    /// Paths outside root are returned unchanged.
    [[nodiscard]] static std::string relativeSource(const std::filesystem::path& source,
                                                    const std::filesystem::path& root);

    /// Read back a serialized record. Returns nullopt when the text has no metadata block.
    [[nodiscard]] static std::optional<ParsedRecord> parse(std::string_view text);

    [[nodiscard]] static std::string escape(std::string_view value);
    [[nodiscard]] static std::string unescape(std::string_view value);
};

} // namespace issues
