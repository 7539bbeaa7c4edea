#pragma once

#include "../issues/IssueTypes.hpp"

#include <string>

struct LoggingConfig
{
    std::string directory = "logs";
    bool append_logs = true;
    int level = 4;          // plog severity: 0 none ... 4 info ... 6 verbose
    bool verbose = false;   // per-stage traces in pipeline.log
    int preview_bytes = 120; // document text shown per trace record
};

struct SplitterConfig
{
    std::string source_dir = "reviews";
    std::string output_root = "issues";
    std::string source_root;                  // "source" field is relative to this; empty = working directory
    std::string monitoring_dir = "monitoring";
    std::string performance_dir = "performance";

    bool dry_run = false;
    bool continue_on_error = false;
    bool write_index = true;
    int max_collision_suffix = 10000;

    issues::FrontmatterFields extra_frontmatter;

    LoggingConfig logging;
};
