#pragma once

#include "config/SplitterConfig.hpp"

#include <memory>
#include <optional>
#include <string>

class ConfigManager;

namespace issues
{
struct PipelineOptions;
struct RunSummary;
}

class Application
{
public:
    // Process exit codes
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class ParseResult
    {
        Run,
        Exit,
        UsageError
    };

    struct CommandLine
    {
        std::string config_path = "issue_splitter.toml";
        std::optional<std::string> source_dir;
        std::optional<std::string> output_root;
        std::optional<std::string> source_root;
        bool dry_run = false;
        bool continue_on_error = false;
        bool no_index = false;
        bool verbose = false;
    };

    ParseResult parseCommandLineArgs();
    void initializeConfig();
    void applyCommandLineOverrides();
    bool initializeLogging();

    issues::PipelineOptions buildPipelineOptions() const;
    int runPipeline();
    void printSummary(const issues::RunSummary& summary) const;
    void printPendingErrors() const;
    void cleanup();

    std::unique_ptr<ConfigManager> config_;
    SplitterConfig settings_;
    CommandLine cli_;
    bool logging_initialized_ = false;

    int argc_ = 0;
    char** argv_ = nullptr;
};
