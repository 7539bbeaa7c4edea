#pragma once

#include "IssueTypes.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>

namespace issues
{

/// Per-category running counters. One instance per pipeline run, so repeated runs
/// in the same process start again at 1.
class IssueSequencer
{
public:
    /// Increment the issue's category counter and store the new value in issue.sequence.
    int assign(Issue& issue);

    [[nodiscard]] int count(Category category) const;

private:
    std::map<Category, int> counters_;
};

/// Produces unique destination filenames of the form "<seq3>_<GROUP>_<TITLE>.md".
class FileNamer
{
public:
    static constexpr int kDefaultMaxSuffix = 10000;

    using ExistsPredicate = std::function<bool(const std::filesystem::path&)>;

    explicit FileNamer(int max_suffix = kDefaultMaxSuffix, ExistsPredicate exists = nullptr);

    /// "001_INFRA_MEMORY_LEAK" for sequence 1, group INFRA, title "Memory leak"
    [[nodiscard]] static std::string baseName(const Issue& issue);

    /// First free "<base>.md", "<base>_1.md", "<base>_2.md", ... in dir.
    /// A name is taken if it exists on disk or was already handed out by this namer.
    /// Throws NamingExhaustedError past the suffix limit.
    std::filesystem::path resolve(const std::filesystem::path& dir, const std::string& base_name);

private:
    bool isTaken(const std::filesystem::path& candidate) const;

    int max_suffix_;
    ExistsPredicate exists_;
    std::set<std::filesystem::path> reserved_;
};

} // namespace issues
