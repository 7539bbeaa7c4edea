#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "config/ConfigSerializer.hpp"
#include "issues/Diagnostics.hpp"
#include "issues/IssuePipeline.hpp"
#include "issues/SplitterErrors.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>

namespace
{

void PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "Split review documents (<GROUP>_MONITORING.md, <GROUP>_PERFORMANCE.md) into issue records\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE         Configuration file (default: issue_splitter.toml)\n";
    std::cout << "  --source DIR          Directory containing the review documents\n";
    std::cout << "  --output DIR          Root directory for the generated issue records\n";
    std::cout << "  --source-root DIR     Root the 'source' metadata field is relative to\n";
    std::cout << "  --dry-run             Plan file names without writing anything\n";
    std::cout << "  --continue-on-error   Skip documents that cannot be processed\n";
    std::cout << "  --no-index            Do not write index.json\n";
    std::cout << "  --verbose             Trace every pipeline stage to pipeline.log\n";
    std::cout << "  --version             Show version information\n";
    std::cout << "  --help                Show this help message\n";
}

void PrintVersion()
{
    std::cout << "issue_splitter " << ISSUE_SPLITTER_VERSION_STRING << "\n";
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    switch (parseCommandLineArgs())
    {
    case ParseResult::Exit:
        return kExitSuccess;
    case ParseResult::UsageError:
        return kExitUsage;
    case ParseResult::Run:
        break;
    }

    initializeConfig();
    applyCommandLineOverrides();

    if (!initializeLogging())
    {
        printPendingErrors();
        return kExitFailure;
    }

    int exit_code = runPipeline();
    printPendingErrors();
    return exit_code;
}

Application::ParseResult Application::parseCommandLineArgs()
{
    auto take_value = [this](int& i, std::optional<std::string>& target) -> bool
    {
        if (i + 1 >= argc_)
        {
            std::cerr << "Missing value for " << argv_[i] << "\n";
            return false;
        }
        target = argv_[++i];
        return true;
    };

    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        if (std::strcmp(arg, "--help") == 0)
        {
            PrintUsage(argv_[0]);
            return ParseResult::Exit;
        }
        else if (std::strcmp(arg, "--version") == 0)
        {
            PrintVersion();
            return ParseResult::Exit;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            std::optional<std::string> path;
            if (!take_value(i, path))
                return ParseResult::UsageError;
            cli_.config_path = *path;
        }
        else if (std::strcmp(arg, "--source") == 0)
        {
            if (!take_value(i, cli_.source_dir))
                return ParseResult::UsageError;
        }
        else if (std::strcmp(arg, "--output") == 0)
        {
            if (!take_value(i, cli_.output_root))
                return ParseResult::UsageError;
        }
        else if (std::strcmp(arg, "--source-root") == 0)
        {
            if (!take_value(i, cli_.source_root))
                return ParseResult::UsageError;
        }
        else if (std::strcmp(arg, "--dry-run") == 0)
        {
            cli_.dry_run = true;
        }
        else if (std::strcmp(arg, "--continue-on-error") == 0)
        {
            cli_.continue_on_error = true;
        }
        else if (std::strcmp(arg, "--no-index") == 0)
        {
            cli_.no_index = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            cli_.verbose = true;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n\n";
            PrintUsage(argv_[0]);
            return ParseResult::UsageError;
        }
    }

    return ParseResult::Run;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(cli_.config_path);
    ConfigSerializer::registerHandlers(*config_, settings_);

    if (!config_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
    }
}

void Application::applyCommandLineOverrides()
{
    if (cli_.source_dir)
        settings_.source_dir = *cli_.source_dir;
    if (cli_.output_root)
        settings_.output_root = *cli_.output_root;
    if (cli_.source_root)
        settings_.source_root = *cli_.source_root;
    if (cli_.dry_run)
        settings_.dry_run = true;
    if (cli_.continue_on_error)
        settings_.continue_on_error = true;
    if (cli_.no_index)
        settings_.write_index = false;
    if (cli_.verbose)
        settings_.logging.verbose = true;
}

bool Application::initializeLogging()
{
    const auto& logging = settings_.logging;
    if (!utils::LogManager::Initialize(logging.directory, logging.append_logs,
                                       utils::LogManager::SeverityFromInt(logging.level)))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                          logging.directory);
        return false;
    }
    logging_initialized_ = true;

    const bool main_ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                                .filename = "run.log",
                                                                .append_override = std::nullopt,
                                                                .level_override = std::nullopt,
                                                                .max_file_size = 10 * 1024 * 1024,
                                                                .backup_count = 3,
                                                                .add_console_appender = true });

    const bool diagnostics_ok = utils::LogManager::RegisterLogger<issues::Diagnostics::kLogInstance>(
        { .name = "diagnostics",
          .filename = "pipeline.log",
          .append_override = std::nullopt,
          .level_override = logging.verbose ? std::optional<plog::Severity>(plog::verbose) : std::nullopt,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });

    // RegisterLogger has already reported the failure
    if (!main_ok || !diagnostics_ok)
        return false;

    issues::Diagnostics::SetVerbose(logging.verbose);
    issues::Diagnostics::SetMaxPreview(static_cast<std::size_t>(logging.preview_bytes));

    PLOG_INFO << "issue_splitter " << ISSUE_SPLITTER_VERSION_STRING << " (config: " << config_->path()
              << ", logs: " << utils::LogManager::LogDirectory() << ")";
    return true;
}

issues::PipelineOptions Application::buildPipelineOptions() const
{
    issues::PipelineOptions options;
    options.source_dir = settings_.source_dir;
    options.output_root = settings_.output_root;
    options.source_root = settings_.source_root;
    options.monitoring_dir = settings_.monitoring_dir;
    options.performance_dir = settings_.performance_dir;
    options.dry_run = settings_.dry_run;
    options.continue_on_error = settings_.continue_on_error;
    options.write_index = settings_.write_index;
    options.max_collision_suffix = settings_.max_collision_suffix;
    options.extra_frontmatter = settings_.extra_frontmatter;
    return options;
}

int Application::runPipeline()
{
    try
    {
        issues::IssuePipeline pipeline(buildPipelineOptions());
        const auto summary = pipeline.run();
        printSummary(summary);
        return kExitSuccess;
    }
    catch (const issues::MissingSourceDirectoryError&)
    {
        // Already reported by the pipeline before any output was planned
        return kExitFailure;
    }
    catch (const issues::UnrecognizedCategoryError& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Classification,
                                          "Run aborted: document name does not end in _MONITORING or _PERFORMANCE",
                                          ex.baseName());
    }
    catch (const issues::SplitterError& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Run aborted", ex.what());
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Unexpected error", ex.what());
    }
    return kExitFailure;
}

void Application::printSummary(const issues::RunSummary& summary) const
{
    std::cout << (summary.dry_run ? "Planned " : "Wrote ") << summary.records.size() << " issue record(s) from "
              << summary.documents.size() << " document(s)\n";
    for (const auto& [category, count] : summary.counts)
        std::cout << "  " << issues::category_name(category) << ": " << count << "\n";
    for (const auto& skipped : summary.skipped_documents)
        std::cout << "  skipped: " << skipped.string() << "\n";
}

void Application::printPendingErrors() const
{
    const auto errors = utils::ErrorReporter::GetPendingErrors();
    if (errors.empty())
        return;

    std::cerr << errors.size() << " problem(s) reported:\n";
    for (const auto& report : errors)
    {
        std::cerr << "  [" << utils::ErrorReporter::SeverityToString(report.severity) << "] ["
                  << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " | " << report.technical_details;
        std::cerr << "\n";
    }
}

void Application::cleanup()
{
    if (logging_initialized_)
    {
        utils::LogManager::Shutdown();
        logging_initialized_ = false;
    }
}
