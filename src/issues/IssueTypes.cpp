#include "IssueTypes.hpp"

namespace issues
{

std::string_view category_name(Category category) noexcept
{
    switch (category)
    {
    case Category::Monitoring:
        return "monitoring";
    case Category::Performance:
        return "performance";
    default:
        return "monitoring";
    }
}

} // namespace issues
