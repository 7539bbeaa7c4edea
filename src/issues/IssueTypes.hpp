#pragma once

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace issues
{

// Core data contracts for the issue splitting pipeline.

enum class Category
{
    Monitoring,
    Performance
};

[[nodiscard]] std::string_view category_name(Category category) noexcept;

// Insertion-ordered key/value list. Serialized output depends on this order.
using FrontmatterFields = std::vector<std::pair<std::string, std::string>>;

// A review document found in the source directory
struct SourceDocument
{
    std::filesystem::path path;
    std::string content;
    std::string group;
    Category category = Category::Monitoring;
};

struct Issue
{
    std::string title;
    long long source_issue_index = 0;            // numeric heading label, verbatim from the source
    std::string group;
    Category category = Category::Monitoring;
    std::filesystem::path source_path;
    int sequence = 0;                         // 0 until the sequencer runs
    std::optional<std::string> priority;
    std::string status = "pending";
    std::string body;                         // starts with "## <title>"
    FrontmatterFields extra_frontmatter;
};

// An issue whose destination has been decided
struct PlannedRecord
{
    Issue issue;
    std::filesystem::path destination;
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                              // The actual result payload
    bool succeeded = true;                   // Whether the stage completed successfully
    std::optional<std::string> error;        // Error message if stage failed
    std::exception_ptr exception;            // Original exception, for callers that rethrow
    std::chrono::microseconds duration{};    // How long the stage took to execute
    std::string stage_name;                  // Name of the stage (for logging)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::exception_ptr ex, std::chrono::microseconds time,
                               const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.exception = std::move(ex);
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace issues
