#include "DocumentClassifier.hpp"
#include "Diagnostics.hpp"
#include "SplitterErrors.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <plog/Log.h>

namespace issues
{

namespace
{

bool ends_with(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

Classification DocumentClassifier::classify(std::string_view base_name)
{
    if (ends_with(base_name, kMonitoringSuffix))
        return { std::string(base_name.substr(0, base_name.size() - kMonitoringSuffix.size())), Category::Monitoring };

    if (ends_with(base_name, kPerformanceSuffix))
        return { std::string(base_name.substr(0, base_name.size() - kPerformanceSuffix.size())),
                 Category::Performance };

    throw UnrecognizedCategoryError(std::string(base_name));
}

SourceDocument DocumentClassifier::load(const std::filesystem::path& path)
{
    return read(path, classify(path.stem().string()));
}

SourceDocument DocumentClassifier::read(const std::filesystem::path& path, Classification classification)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw SplitterError("Failed to open source document: " + path.string());

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad())
        throw SplitterError("Failed to read source document: " + path.string());

    SourceDocument doc;
    doc.path = path;
    doc.content = oss.str();
    doc.group = std::move(classification.group);
    doc.category = classification.category;

    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[DocumentClassifier] path=" << path.string()
                                              << " group=" << doc.group
                                              << " category=" << category_name(doc.category)
                                              << " bytes=" << doc.content.size();
    return doc;
}

} // namespace issues
