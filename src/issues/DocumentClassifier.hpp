#pragma once

#include "IssueTypes.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace issues
{

struct Classification
{
    std::string group;
    Category category = Category::Monitoring;
};

/// Derives (group, category) from review document names such as
/// "INFRA_MONITORING" or "API_GATEWAY_PERFORMANCE".
class DocumentClassifier
{
public:
    static constexpr std::string_view kMonitoringSuffix = "_MONITORING";
    static constexpr std::string_view kPerformanceSuffix = "_PERFORMANCE";

    /// Classify a base name (filename without extension).
    /// Throws UnrecognizedCategoryError when neither suffix matches.
    [[nodiscard]] static Classification classify(std::string_view base_name);

    /// Read a document whose name has already been classified.
    /// Throws SplitterError when the file cannot be read.
    [[nodiscard]] static SourceDocument read(const std::filesystem::path& path, Classification classification);

    /// classify() the file stem, then read() the document.
    [[nodiscard]] static SourceDocument load(const std::filesystem::path& path);
};

} // namespace issues
