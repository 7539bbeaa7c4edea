#include <catch2/catch_test_macros.hpp>
#include "issues/IssuePipeline.hpp"
#include "issues/RecordSerializer.hpp"
#include "issues/SplitterErrors.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/TempDirectory.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <set>

namespace fs = std::filesystem;
using issues::Category;
using issues::IssuePipeline;
using issues::PipelineOptions;
using test_utils::TempDirectory;

namespace
{
PipelineOptions make_options(const TempDirectory& dir)
{
    PipelineOptions options;
    options.source_dir = dir.path() / "reviews";
    options.output_root = dir.path() / "out";
    options.source_root = dir.path();
    return options;
}

std::size_t count_files(const fs::path& dir)
{
    if (!fs::exists(dir))
        return 0;
    std::size_t count = 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir))
    {
        if (entry.is_regular_file())
            ++count;
    }
    return count;
}

const char* kInfraMonitoring = "# Infra\n"
                               "\n"
                               "### 1. Leak\n"
                               "Heap grows.\n"
                               "\n"
                               "---\n"
                               "\n"
                               "### 2. Timeout\n"
                               "**Priority:** High\n"
                               "Cache calls time out.\n";
} // namespace

TEST_CASE("IssuePipeline splits a monitoring review into numbered records", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", kInfraMonitoring);

    IssuePipeline pipeline(make_options(dir));
    auto summary = pipeline.run();

    const fs::path monitoring = dir.path() / "out" / "monitoring";
    REQUIRE(summary.records.size() == 2);
    REQUIRE(summary.records[0].destination == monitoring / "001_INFRA_LEAK.md");
    REQUIRE(summary.records[1].destination == monitoring / "002_INFRA_TIMEOUT.md");
    REQUIRE(summary.counts[Category::Monitoring] == 2);
    REQUIRE(summary.counts[Category::Performance] == 0);

    auto leak = issues::RecordSerializer::parse(TempDirectory::readFile(monitoring / "001_INFRA_LEAK.md"));
    REQUIRE(leak.has_value());
    REQUIRE(leak->field("title") == "Leak");
    REQUIRE(leak->field("sequence") == "1");
    REQUIRE(leak->field("priority") == "");
    REQUIRE(leak->field("source") == "reviews/INFRA_MONITORING.md");
    REQUIRE(leak->body == "## Leak\n\nHeap grows.\n");

    auto timeout = issues::RecordSerializer::parse(TempDirectory::readFile(monitoring / "002_INFRA_TIMEOUT.md"));
    REQUIRE(timeout.has_value());
    REQUIRE(timeout->field("sequence") == "2");
    REQUIRE(timeout->field("issue_index") == "2");
    REQUIRE(timeout->field("priority") == "High");
    REQUIRE(timeout->field("category") == "monitoring");
}

TEST_CASE("IssuePipeline numbers categories across documents in path order", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/B_MONITORING.md", "### 1. Disk\nfull\n");
    dir.writeFile("reviews/A_MONITORING.md", "### 4. Cpu\nhot\n### 9. Mem\nlow\n");
    dir.writeFile("reviews/A_PERFORMANCE.md", "### 1. Latency\nslow\n");
    dir.writeFile("reviews/notes.txt", "### 1. Ignored\n");

    IssuePipeline pipeline(make_options(dir));
    auto summary = pipeline.run();

    REQUIRE(summary.documents.size() == 3);
    REQUIRE(summary.records.size() == 4);

    const fs::path out = dir.path() / "out";
    REQUIRE(fs::exists(out / "monitoring" / "001_A_CPU.md"));
    REQUIRE(fs::exists(out / "monitoring" / "002_A_MEM.md"));
    REQUIRE(fs::exists(out / "monitoring" / "003_B_DISK.md"));
    REQUIRE(fs::exists(out / "performance" / "001_A_LATENCY.md"));

    std::set<int> monitoring_sequences;
    for (const auto& record : summary.records)
    {
        if (record.issue.category == Category::Monitoring)
            monitoring_sequences.insert(record.issue.sequence);
    }
    REQUIRE(monitoring_sequences == std::set<int>{ 1, 2, 3 });
    REQUIRE(summary.records[1].issue.source_issue_index == 9);
}

TEST_CASE("IssuePipeline never overwrites existing records", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", "### 1. Leak\nfirst\n");
    dir.writeFile("out/monitoring/001_INFRA_LEAK.md", "keep me");

    IssuePipeline pipeline(make_options(dir));
    auto summary = pipeline.run();

    const fs::path monitoring = dir.path() / "out" / "monitoring";
    REQUIRE(TempDirectory::readFile(monitoring / "001_INFRA_LEAK.md") == "keep me");
    REQUIRE(summary.records.front().destination == monitoring / "001_INFRA_LEAK_1.md");
    REQUIRE(fs::exists(monitoring / "001_INFRA_LEAK_1.md"));
}

TEST_CASE("IssuePipeline keeps records left by an earlier run", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", "### 1. Leak!\nfirst\n");

    IssuePipeline first(make_options(dir));
    (void)first.run();
    IssuePipeline second(make_options(dir));
    auto summary = second.run();

    const fs::path monitoring = dir.path() / "out" / "monitoring";
    REQUIRE(summary.records.front().issue.sequence == 1);
    REQUIRE(summary.records.front().destination == monitoring / "001_INFRA_LEAK_1.md");
    REQUIRE(TempDirectory::readFile(monitoring / "001_INFRA_LEAK.md").find("first") != std::string::npos);
}

TEST_CASE("IssuePipeline aborts on an unrecognized document name", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", kInfraMonitoring);
    dir.writeFile("reviews/NOTES_UNKNOWN.md", "### 1. Stray\ntext\n");

    IssuePipeline pipeline(make_options(dir));
    REQUIRE_THROWS_AS(pipeline.run(), issues::UnrecognizedCategoryError);
    REQUIRE(count_files(dir.path() / "out") == 0);

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("IssuePipeline can skip bad documents and keep going", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", kInfraMonitoring);
    dir.writeFile("reviews/NOTES_UNKNOWN.md", "### 1. Stray\ntext\n");
    utils::ErrorReporter::ClearErrors();

    auto options = make_options(dir);
    options.continue_on_error = true;
    IssuePipeline pipeline(options);
    auto summary = pipeline.run();

    REQUIRE(summary.records.size() == 2);
    REQUIRE(summary.skipped_documents.size() == 1);
    REQUIRE(summary.skipped_documents.front().filename() == "NOTES_UNKNOWN.md");

    auto errors = utils::ErrorReporter::GetPendingErrors();
    REQUIRE_FALSE(errors.empty());
    REQUIRE(errors.front().category == utils::ErrorCategory::Classification);
}

TEST_CASE("IssuePipeline requires the source directory", "[pipeline]")
{
    TempDirectory dir;
    IssuePipeline pipeline(make_options(dir));
    REQUIRE_THROWS_AS(pipeline.run(), issues::MissingSourceDirectoryError);
    REQUIRE_FALSE(fs::exists(dir.path() / "out"));

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("IssuePipeline dry run plans without writing", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", kInfraMonitoring);

    auto options = make_options(dir);
    options.dry_run = true;
    IssuePipeline pipeline(options);
    auto summary = pipeline.run();

    REQUIRE(summary.dry_run);
    REQUIRE(summary.records.size() == 2);
    REQUIRE(summary.records[1].destination.filename() == "002_INFRA_TIMEOUT.md");
    REQUIRE_FALSE(fs::exists(dir.path() / "out"));
}

TEST_CASE("IssuePipeline documents without headings produce nothing", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/EMPTY_PERFORMANCE.md", "# Nothing to see\n");

    IssuePipeline pipeline(make_options(dir));
    auto summary = pipeline.run();

    REQUIRE(summary.records.empty());
    REQUIRE(summary.documents.size() == 1);
    REQUIRE(summary.skipped_documents.empty());
    REQUIRE_FALSE(fs::exists(dir.path() / "out" / "performance"));
}

TEST_CASE("IssuePipeline applies extra fields and custom destinations", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/DB_PERFORMANCE.md", "### 3. Slow join\n**Severity:** Medium\n");

    auto options = make_options(dir);
    options.performance_dir = "perf";
    options.extra_frontmatter = { { "reviewer", "dba" }, { "sprint", "12" } };
    IssuePipeline pipeline(options);
    auto summary = pipeline.run();

    const fs::path record = dir.path() / "out" / "perf" / "001_DB_SLOW_JOIN.md";
    REQUIRE(summary.records.front().destination == record);

    auto parsed = issues::RecordSerializer::parse(TempDirectory::readFile(record));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->fields.size() == 10);
    REQUIRE(parsed->fields[8].first == "reviewer");
    REQUIRE(parsed->fields[9] == std::make_pair(std::string("sprint"), std::string("12")));
    REQUIRE(parsed->field("priority") == "Medium");
    REQUIRE(parsed->field("issue_index") == "3");
}

TEST_CASE("IssuePipeline writes a JSON index of the run", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", kInfraMonitoring);

    SECTION("Index lists every record")
    {
        IssuePipeline pipeline(make_options(dir));
        (void)pipeline.run();

        auto index = nlohmann::json::parse(TempDirectory::readFile(dir.path() / "out" / IssuePipeline::kIndexFileName));
        REQUIRE(index["dry_run"] == false);
        REQUIRE(index["counts"]["monitoring"] == 2);
        REQUIRE(index["counts"]["performance"] == 0);
        REQUIRE(index["records"].size() == 2);
        REQUIRE(index["records"][0]["path"] == "monitoring/001_INFRA_LEAK.md");
        REQUIRE(index["records"][0]["priority"].is_null());
        REQUIRE(index["records"][1]["priority"] == "High");
        REQUIRE(index["records"][1]["sequence"] == 2);
        REQUIRE(index["records"][1]["source"] == "reviews/INFRA_MONITORING.md");
    }

    SECTION("Index can be disabled")
    {
        auto options = make_options(dir);
        options.write_index = false;
        IssuePipeline pipeline(options);
        (void)pipeline.run();
        REQUIRE_FALSE(fs::exists(dir.path() / "out" / IssuePipeline::kIndexFileName));
        REQUIRE(count_files(dir.path() / "out") == 2);
    }
}

TEST_CASE("IssuePipeline indexes titles that are not valid UTF-8", "[pipeline]")
{
    TempDirectory dir;
    dir.writeFile("reviews/CAFE_MONITORING.md", "### 1. Caf\xE9 timeout\n**Priority:** Hoch\xFC\n");

    IssuePipeline pipeline(make_options(dir));
    auto summary = pipeline.run();

    const fs::path record = dir.path() / "out" / "monitoring" / "001_CAFE_CAF_TIMEOUT.md";
    REQUIRE(summary.records.front().destination == record);
    REQUIRE(TempDirectory::readFile(record).find("title: \"Caf\xE9 timeout\"") != std::string::npos);

    auto index = nlohmann::json::parse(TempDirectory::readFile(dir.path() / "out" / IssuePipeline::kIndexFileName));
    REQUIRE(index["records"].size() == 1);
    REQUIRE(index["records"][0]["title"] == "Caf\xEF\xBF\xBD timeout");
    REQUIRE(index["records"][0]["priority"] == "Hoch\xEF\xBF\xBD");
}
