#include "IssueExtractor.hpp"
#include "Diagnostics.hpp"
#include "SplitterErrors.hpp"

#include <charconv>
#include <regex>
#include <plog/Log.h>

namespace issues
{

namespace
{

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim_view(std::string_view text)
{
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string_view rtrim_view(std::string_view text)
{
    const auto last = text.find_last_not_of(kWhitespace);
    if (last == std::string_view::npos)
        return {};
    return text.substr(0, last + 1);
}

bool is_horizontal_rule(std::string_view line)
{
    return line.size() >= 3 && line.find_first_not_of('-') == std::string_view::npos;
}

} // anonymous namespace

std::vector<IssueSection> IssueExtractor::locateSections(std::string_view text)
{
    // Only the heading prefix goes through the regex; the title is cut out by hand
    // so a very long line cannot exhaust the matcher's recursion.
    static const std::regex heading_pattern(R"(###[ \t]+([0-9]+)\.)");

    std::vector<IssueSection> sections;
    std::size_t pos = 0;
    while (pos <= text.size())
    {
        std::size_t line_end = text.find('\n', pos);
        if (line_end == std::string_view::npos)
            line_end = text.size();

        std::string line(text.substr(pos, line_end - pos));
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::smatch match;
        if (std::regex_search(line, match, heading_pattern, std::regex_constants::match_continuous))
        {
            if (!sections.empty())
                sections.back().span_end = pos;

            IssueSection section;
            section.heading_begin = pos;
            section.heading_end = pos + line.size();
            section.label = match[1].str();
            const auto prefix_length = static_cast<std::size_t>(match.length(0));
            section.title = std::string(trim_view(std::string_view(line).substr(prefix_length)));
            sections.push_back(std::move(section));
        }

        if (line_end == text.size())
            break;
        pos = line_end + 1;
    }

    if (!sections.empty())
        sections.back().span_end = text.size();
    return sections;
}

std::string IssueExtractor::trimSpan(std::string_view span)
{
    std::string_view body = rtrim_view(span);

    const auto last_newline = body.rfind('\n');
    const std::string_view last_line =
        last_newline == std::string_view::npos ? body : body.substr(last_newline + 1);
    if (is_horizontal_rule(last_line))
        body = last_newline == std::string_view::npos ? std::string_view{} : body.substr(0, last_newline);

    return std::string(trim_view(body));
}

std::optional<std::string> IssueExtractor::findPriority(const std::string& span)
{
    // Accepts "**Priority:** High" as well as "**Priority**: High". The value is
    // read up to the end of the line without the regex.
    static const std::regex priority_pattern(R"(\*\*(?:Priority|Severity)(?::\*\*|\*\*:))");

    std::smatch match;
    if (!std::regex_search(span, match, priority_pattern))
        return std::nullopt;

    const auto value_begin = static_cast<std::size_t>(match.position(0) + match.length(0));
    const std::string_view rest = std::string_view(span).substr(value_begin);
    std::string value(trim_view(rest.substr(0, rest.find_first_of("\r\n"))));
    if (value.empty())
        return std::nullopt;
    return value;
}

std::string IssueExtractor::buildBody(const std::string& title, const std::string& trimmed_span)
{
    std::string body = "## " + title + "\n\n";
    body += trimmed_span;
    return body;
}

long long IssueExtractor::parseLabel(const std::string& label)
{
    long long value = 0;
    const auto [ptr, ec] = std::from_chars(label.data(), label.data() + label.size(), value);
    if (ec != std::errc() || ptr != label.data() + label.size())
        throw SplitterError("Issue heading label is not a usable integer: " + label);
    return value;
}

std::vector<Issue> IssueExtractor::extract(const SourceDocument& document) const
{
    const std::string& text = document.content;
    const auto sections = locateSections(text);

    if (sections.empty())
    {
        PLOG_WARNING << "[IssueExtractor] No issue headings found in " << document.path.string();
        return {};
    }

    std::vector<Issue> extracted;
    extracted.reserve(sections.size());
    for (const auto& section : sections)
    {
        const std::string_view raw_span =
            std::string_view(text).substr(section.heading_end, section.span_end - section.heading_end);
        const std::string span = trimSpan(raw_span);

        Issue issue;
        issue.title = section.title;
        issue.source_issue_index = parseLabel(section.label);
        issue.group = document.group;
        issue.category = document.category;
        issue.source_path = document.path;
        issue.priority = findPriority(span);
        issue.body = buildBody(issue.title, span);

        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance)
                << "[IssueExtractor] issue=" << section.label << " title=" << Diagnostics::Preview(issue.title)
                << " priority=" << issue.priority.value_or("<none>") << " body=" << Diagnostics::Preview(span);

        extracted.push_back(std::move(issue));
    }

    PLOG_INFO << "[IssueExtractor] " << document.path.filename().string() << ": " << extracted.size() << " issue(s)";
    return extracted;
}

} // namespace issues
