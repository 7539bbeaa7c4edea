#include "IssuePipeline.hpp"
#include "Diagnostics.hpp"
#include "DocumentClassifier.hpp"
#include "IssueExtractor.hpp"
#include "RecordSerializer.hpp"
#include "SplitterErrors.hpp"
#include "StageRunner.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace issues
{

namespace
{

// Returns true when the stage succeeded. A failed stage either aborts the run by
// rethrowing its exception or, when continuing past bad documents, marks the
// document as skipped.
template<typename T>
bool accept_stage(const StageResult<T>& stage, const fs::path& path, bool continue_on_error, RunSummary& summary)
{
    if (stage.succeeded)
        return true;

    if (!continue_on_error && stage.exception)
        std::rethrow_exception(stage.exception);

    PLOG_WARNING << "[IssuePipeline] Skipping " << path.string() << ": " << stage.error.value_or("unknown error");
    summary.skipped_documents.push_back(path);
    return false;
}

void ensure_directory(const fs::path& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Output, "Unable to create destination directory",
                                          dir.string() + ": " + ec.message());
        throw OutputWriteError("Unable to create destination directory " + dir.string() + ": " + ec.message());
    }
}

void write_file(const fs::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Output, "Failed to open output file", path.string());
        throw OutputWriteError("Failed to open output file " + path.string());
    }

    out << content;
    out.close();
    if (!out)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Output, "Error writing output file", path.string());
        throw OutputWriteError("Error writing output file " + path.string());
    }
}

} // anonymous namespace

struct IssuePipeline::RunState
{
    explicit RunState(int max_collision_suffix)
        : namer(max_collision_suffix)
    {
    }

    IssueExtractor extractor;
    IssueSequencer sequencer;
    FileNamer namer;
};

IssuePipeline::IssuePipeline(PipelineOptions options)
    : options_(std::move(options))
{
}

RunSummary IssuePipeline::run()
{
    std::error_code ec;
    if (!fs::is_directory(options_.source_dir, ec))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::SourceDiscovery, "Source directory not found",
                                          options_.source_dir.string());
        throw MissingSourceDirectoryError(options_.source_dir);
    }

    RunSummary summary;
    summary.dry_run = options_.dry_run;

    // Counters and reserved names live for this run only
    RunState state(options_.max_collision_suffix);

    const auto documents = discoverDocuments();
    PLOG_INFO << "[IssuePipeline] " << documents.size() << " document(s) in " << options_.source_dir.string();

    for (const auto& path : documents)
        planDocument(path, state, summary);

    summary.counts[Category::Monitoring] = state.sequencer.count(Category::Monitoring);
    summary.counts[Category::Performance] = state.sequencer.count(Category::Performance);

    if (options_.dry_run)
    {
        for (const auto& record : summary.records)
            PLOG_INFO << "[IssuePipeline] dry-run: would write " << record.destination.string();
    }
    else
    {
        writeRecords(summary);
        if (options_.write_index)
            writeIndex(summary);
    }

    PLOG_INFO << "[IssuePipeline] " << (options_.dry_run ? "planned " : "wrote ") << summary.records.size()
              << " record(s): monitoring=" << summary.counts[Category::Monitoring]
              << " performance=" << summary.counts[Category::Performance]
              << " skipped_documents=" << summary.skipped_documents.size();
    return summary;
}

std::vector<fs::path> IssuePipeline::discoverDocuments() const
{
    std::vector<fs::path> documents;
    std::error_code ec;
    for (fs::directory_iterator it(options_.source_dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && entry.path().extension() == ".md")
            documents.push_back(entry.path());
    }

    if (ec)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::SourceDiscovery, "Unable to list source directory",
                                          options_.source_dir.string() + ": " + ec.message());
        throw SplitterError("Unable to list source directory " + options_.source_dir.string() + ": " + ec.message());
    }

    std::sort(documents.begin(), documents.end());
    return documents;
}

fs::path IssuePipeline::destinationFor(Category category) const
{
    return options_.output_root /
           (category == Category::Performance ? options_.performance_dir : options_.monitoring_dir);
}

void IssuePipeline::planDocument(const fs::path& path, RunState& state, RunSummary& summary) const
{
    auto classify_stage = run_stage<Classification>("classify", utils::ErrorCategory::Classification,
                                                    [&]()
                                                    {
                                                        return DocumentClassifier::classify(path.stem().string());
                                                    });
    if (!accept_stage(classify_stage, path, options_.continue_on_error, summary))
        return;

    auto read_stage = run_stage<SourceDocument>("read", utils::ErrorCategory::Extraction,
                                                [&]()
                                                {
                                                    return DocumentClassifier::read(path, classify_stage.result);
                                                });
    if (!accept_stage(read_stage, path, options_.continue_on_error, summary))
        return;

    auto extract_stage = run_stage<std::vector<Issue>>("extract", utils::ErrorCategory::Extraction,
                                                       [&]()
                                                       {
                                                           return state.extractor.extract(read_stage.result);
                                                       });
    if (!accept_stage(extract_stage, path, options_.continue_on_error, summary))
        return;

    for (auto& issue : extract_stage.result)
    {
        issue.extra_frontmatter = options_.extra_frontmatter;
        state.sequencer.assign(issue);

        fs::path destination = state.namer.resolve(destinationFor(issue.category), FileNamer::baseName(issue));
        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance) << "[IssuePipeline] sequence=" << issue.sequence
                                                  << " category=" << category_name(issue.category)
                                                  << " destination=" << destination.string();

        summary.records.push_back({ std::move(issue), std::move(destination) });
    }

    summary.documents.push_back(path);
}

std::string IssuePipeline::sourceField(const Issue& issue) const
{
    const fs::path root = options_.source_root.empty() ? fs::current_path() : fs::absolute(options_.source_root);
    return RecordSerializer::relativeSource(fs::absolute(issue.source_path), root);
}

void IssuePipeline::writeRecords(const RunSummary& summary) const
{
    std::set<fs::path> prepared;
    for (const auto& record : summary.records)
    {
        const fs::path dir = record.destination.parent_path();
        if (prepared.insert(dir).second)
            ensure_directory(dir);

        write_file(record.destination, RecordSerializer::serialize(record.issue, sourceField(record.issue)));
        PLOG_DEBUG << "[IssuePipeline] wrote " << record.destination.string();
    }
}

void IssuePipeline::writeIndex(const RunSummary& summary) const
{
    json index;
    index["generated_at"] = utils::ErrorReporter::GetTimestamp();
    index["dry_run"] = summary.dry_run;

    json counts = json::object();
    for (const auto& [category, count] : summary.counts)
        counts[std::string(category_name(category))] = count;
    index["counts"] = counts;

    json records = json::array();
    for (const auto& record : summary.records)
    {
        const Issue& issue = record.issue;
        json entry;
        entry["path"] = record.destination.lexically_relative(options_.output_root).generic_string();
        entry["title"] = issue.title;
        entry["group"] = issue.group;
        entry["category"] = std::string(category_name(issue.category));
        entry["priority"] = issue.priority ? json(*issue.priority) : json(nullptr);
        entry["sequence"] = issue.sequence;
        entry["issue_index"] = issue.source_issue_index;
        entry["source"] = sourceField(issue);
        records.push_back(std::move(entry));
    }
    index["records"] = std::move(records);

    ensure_directory(options_.output_root);
    const fs::path index_path = options_.output_root / kIndexFileName;
    // Titles are copied byte for byte from the source; bytes that are not UTF-8 become U+FFFD
    write_file(index_path, index.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
    PLOG_INFO << "[IssuePipeline] index written to " << index_path.string();
}

} // namespace issues
