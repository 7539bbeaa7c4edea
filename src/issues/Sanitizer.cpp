#include "Sanitizer.hpp"

namespace issues
{

namespace
{

bool is_ascii_alnum(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

char ascii_upper(char c)
{
    if (c >= 'a' && c <= 'z')
        return static_cast<char>(c - 'a' + 'A');
    return c;
}

} // anonymous namespace

std::string sanitize_title(std::string_view title)
{
    std::string result;
    result.reserve(title.size());

    // Any run of non-alphanumerics (underscores included) becomes one separator,
    // emitted only between two alphanumeric runs.
    bool pending_separator = false;
    for (char c : title)
    {
        if (!is_ascii_alnum(c))
        {
            pending_separator = true;
            continue;
        }

        if (pending_separator && !result.empty())
            result.push_back('_');
        pending_separator = false;
        result.push_back(ascii_upper(c));
    }

    if (result.empty())
        return std::string(kUntitled);
    return result;
}

} // namespace issues
