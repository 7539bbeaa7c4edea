#pragma once

#include "IssueTypes.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/ErrorReporter.hpp"

namespace issues {

// Utility to run a stage (callable returning T) and produce StageResult<T>
// Measures duration and logs errors. The caught exception is kept in the
// result so the pipeline can rethrow it when the run must abort.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, utils::ErrorCategory category, Fn&& fn)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        if (Diagnostics::IsVerbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportError(category, "Pipeline stage failed", stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), std::current_exception(), dur, stage_name);
    }
}

} // namespace issues
