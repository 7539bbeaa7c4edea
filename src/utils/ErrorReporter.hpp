#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // logging, command line
    Configuration,    // TOML parsing, invalid config
    SourceDiscovery,  // missing or unreadable source directory
    Classification,   // document names without a known category suffix
    Extraction,       // unreadable documents, malformed headings
    Naming,           // filename collisions past the suffix limit
    Output,           // destination directories and record writes
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded result, but the run continues
    Error,   // Operation failed
    Fatal    // Run aborted
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short description for the run summary
    std::string technical_details; // Paths, exception text
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Collects errors from the pipeline stages for the end-of-run summary
 *
 * Every report is logged through plog immediately and queued.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Classification,
 *                              "Skipping document with unknown category",
 *                              "reviews/NOTES.md");
 *
 *   // After the run:
 *   for (const auto& report : ErrorReporter::GetPendingErrors()) { ... }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message Short description
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
