#pragma once

#include "IssueTypes.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace issues
{

// One "### <n>. <title>" heading and the text it owns, as offsets into the document.
// The heading occupies [heading_begin, heading_end); its span runs from heading_end
// up to the next heading (or end of document).
struct IssueSection
{
    std::size_t heading_begin = 0;
    std::size_t heading_end = 0;
    std::size_t span_end = 0;
    std::string label;
    std::string title;
};

/// Splits a review document into issues.
///
/// Heading discovery and field extraction are separate matchers:
///   locateSections() finds "### 1. Title" lines,
///   findPriority() finds the first "**Priority:** ..." / "**Severity:** ..." field in a span.
class IssueExtractor
{
public:
    /// Extract every issue of a classified document, in document order.
    /// A document without headings yields an empty vector and a logged warning.
    [[nodiscard]] std::vector<Issue> extract(const SourceDocument& document) const;

    [[nodiscard]] static std::vector<IssueSection> locateSections(std::string_view text);

    /// Drop one trailing horizontal rule and surrounding whitespace from a section span.
    [[nodiscard]] static std::string trimSpan(std::string_view span);

    [[nodiscard]] static std::optional<std::string> findPriority(const std::string& span);

    /// "## <title>", a blank line, then the trimmed span.
    [[nodiscard]] static std::string buildBody(const std::string& title, const std::string& trimmed_span);

private:
    static long long parseLabel(const std::string& label);
};

} // namespace issues
