#include "IssueSequencer.hpp"
#include "Sanitizer.hpp"
#include "SplitterErrors.hpp"

#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <plog/Log.h>

namespace fs = std::filesystem;

namespace issues
{

int IssueSequencer::assign(Issue& issue)
{
    issue.sequence = ++counters_[issue.category];
    return issue.sequence;
}

int IssueSequencer::count(Category category) const
{
    auto it = counters_.find(category);
    return it == counters_.end() ? 0 : it->second;
}

FileNamer::FileNamer(int max_suffix, ExistsPredicate exists)
    : max_suffix_(max_suffix)
    , exists_(std::move(exists))
{
    if (!exists_)
    {
        exists_ = [](const fs::path& p)
        {
            std::error_code ec;
            return fs::exists(p, ec);
        };
    }
}

std::string FileNamer::baseName(const Issue& issue)
{
    std::ostringstream oss;
    oss << std::setw(3) << std::setfill('0') << issue.sequence << '_' << issue.group << '_'
        << sanitize_title(issue.title);
    return oss.str();
}

bool FileNamer::isTaken(const fs::path& candidate) const
{
    return reserved_.count(candidate) > 0 || exists_(candidate);
}

fs::path FileNamer::resolve(const fs::path& dir, const std::string& base_name)
{
    fs::path candidate = dir / (base_name + ".md");
    for (int suffix = 1; isTaken(candidate); ++suffix)
    {
        if (suffix > max_suffix_)
            throw NamingExhaustedError(dir, base_name, max_suffix_);
        candidate = dir / (base_name + "_" + std::to_string(suffix) + ".md");
    }

    if (candidate.stem().string() != base_name)
        PLOG_WARNING << "[FileNamer] " << base_name << ".md is taken in " << dir.string() << ", using "
                     << candidate.filename().string();

    reserved_.insert(candidate);
    return candidate;
}

} // namespace issues
