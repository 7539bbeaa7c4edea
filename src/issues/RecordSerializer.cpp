#include "RecordSerializer.hpp"

#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace issues
{

namespace
{

constexpr std::string_view kDelimiter = "---";

void set_field(FrontmatterFields& fields, const std::string& key, const std::string& value)
{
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const auto& entry)
                           {
                               return entry.first == key;
                           });
    if (it != fields.end())
        it->second = value;
    else
        fields.emplace_back(key, value);
}

std::string_view strip_cr(std::string_view line)
{
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

// Splits off the next line of text, advancing pos past its newline.
std::string_view next_line(std::string_view text, std::size_t& pos)
{
    std::size_t end = text.find('\n', pos);
    if (end == std::string_view::npos)
        end = text.size();
    std::string_view line = text.substr(pos, end - pos);
    pos = end < text.size() ? end + 1 : text.size();
    return strip_cr(line);
}

} // anonymous namespace

std::optional<std::string> ParsedRecord::field(std::string_view key) const
{
    for (const auto& [k, v] : fields)
    {
        if (k == key)
            return v;
    }
    return std::nullopt;
}

FrontmatterFields RecordSerializer::buildFrontmatter(const Issue& issue, const std::string& source)
{
    FrontmatterFields fields;
    fields.emplace_back("title", issue.title);
    fields.emplace_back("group", issue.group);
    fields.emplace_back("category", std::string(category_name(issue.category)));
    fields.emplace_back("priority", issue.priority.value_or(""));
    fields.emplace_back("status", issue.status);
    fields.emplace_back("source", source);
    fields.emplace_back("issue_index", std::to_string(issue.source_issue_index));
    fields.emplace_back("sequence", std::to_string(issue.sequence));

    // A caller-supplied key that names a built-in field replaces its value in place.
    for (const auto& [key, value] : issue.extra_frontmatter)
        set_field(fields, key, value);

    return fields;
}

std::string RecordSerializer::serialize(const Issue& issue, const std::string& source)
{
    std::ostringstream oss;
    oss << kDelimiter << '\n';
    for (const auto& [key, value] : buildFrontmatter(issue, source))
        oss << key << ": \"" << escape(value) << "\"\n";
    oss << kDelimiter << "\n\n";

    const auto last = issue.body.find_last_not_of(" \t\r\n");
    if (last != std::string::npos)
        oss << std::string_view(issue.body).substr(0, last + 1);
    oss << '\n';
    return oss.str();
}

std::string RecordSerializer::relativeSource(const fs::path& source, const fs::path& root)
{
    if (root.empty())
        return source.generic_string();

    const fs::path relative = source.lexically_normal().lexically_relative(root.lexically_normal());
    if (relative.empty() || *relative.begin() == "..")
        return source.generic_string();
    return relative.generic_string();
}

std::optional<ParsedRecord> RecordSerializer::parse(std::string_view text)
{
    std::size_t pos = 0;
    if (next_line(text, pos) != kDelimiter)
        return std::nullopt;

    ParsedRecord record;
    bool closed = false;
    while (pos < text.size())
    {
        const std::string_view line = next_line(text, pos);
        if (line == kDelimiter)
        {
            closed = true;
            break;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos)
            continue;

        std::string key(line.substr(0, colon));
        std::string_view value = line.substr(colon + 1);
        value.remove_prefix(std::min(value.find_first_not_of(' '), value.size()));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);

        record.fields.emplace_back(std::move(key), unescape(value));
    }

    if (!closed)
        return std::nullopt;

    // One blank separator line follows the block
    if (pos < text.size())
    {
        std::size_t peek = pos;
        if (next_line(text, peek).empty())
            pos = peek;
    }
    record.body = std::string(text.substr(pos));
    return record;
}

std::string RecordSerializer::escape(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value)
    {
        if (c == '"')
            out += "\\\"";
        else
            out.push_back(c);
    }
    return out;
}

std::string RecordSerializer::unescape(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == '"')
        {
            out.push_back('"');
            ++i;
        }
        else
        {
            out.push_back(value[i]);
        }
    }
    return out;
}

} // namespace issues
