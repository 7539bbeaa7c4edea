#pragma once

#include "IssueSequencer.hpp"
#include "IssueTypes.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace issues
{

struct PipelineOptions
{
    std::filesystem::path source_dir;
    std::filesystem::path output_root;
    std::filesystem::path source_root;        // empty = current working directory
    std::string monitoring_dir = "monitoring";
    std::string performance_dir = "performance";

    bool dry_run = false;
    bool continue_on_error = false;
    bool write_index = true;
    int max_collision_suffix = FileNamer::kDefaultMaxSuffix;

    FrontmatterFields extra_frontmatter;
};

struct RunSummary
{
    std::vector<PlannedRecord> records;       // processing order
    std::vector<std::filesystem::path> documents;
    std::vector<std::filesystem::path> skipped_documents;
    std::map<Category, int> counts;
    bool dry_run = false;
};

/// Splits every review document of a source directory into issue records.
///
/// A run has two passes. The planning pass reads, classifies and extracts each
/// document in path order, assigns sequence numbers and reserves filenames; the
/// write pass then persists the records and the JSON index. If planning aborts,
/// nothing is written.
///
/// Errors:
///   MissingSourceDirectoryError  source_dir is missing (always fatal)
///   UnrecognizedCategoryError    document name has no known suffix (skipped when continue_on_error)
///   NamingExhaustedError         no free filename within max_collision_suffix (always fatal)
///   OutputWriteError             destination directory or file could not be written
class IssuePipeline
{
public:
    static constexpr const char* kIndexFileName = "index.json";

    explicit IssuePipeline(PipelineOptions options);

    [[nodiscard]] RunSummary run();

    /// Markdown files directly inside source_dir, sorted by path.
    [[nodiscard]] std::vector<std::filesystem::path> discoverDocuments() const;

    [[nodiscard]] std::filesystem::path destinationFor(Category category) const;

private:
    struct RunState;

    void planDocument(const std::filesystem::path& path, RunState& state, RunSummary& summary) const;
    std::string sourceField(const Issue& issue) const;
    void writeRecords(const RunSummary& summary) const;
    void writeIndex(const RunSummary& summary) const;

    PipelineOptions options_;
};

} // namespace issues
