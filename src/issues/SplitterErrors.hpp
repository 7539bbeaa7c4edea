#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace issues
{

// Base for every condition the splitting pipeline raises.
class SplitterError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Document base name does not end in a known category suffix.
class UnrecognizedCategoryError : public SplitterError
{
public:
    explicit UnrecognizedCategoryError(const std::string& base_name)
        : SplitterError("Unrecognized category suffix in document name: " + base_name)
        , base_name_(base_name)
    {
    }

    const std::string& baseName() const noexcept { return base_name_; }

private:
    std::string base_name_;
};

class MissingSourceDirectoryError : public SplitterError
{
public:
    explicit MissingSourceDirectoryError(const std::filesystem::path& dir)
        : SplitterError("Source directory does not exist: " + dir.string())
    {
    }
};

// No free filename within the configured suffix limit.
class NamingExhaustedError : public SplitterError
{
public:
    NamingExhaustedError(const std::filesystem::path& dir, const std::string& base_name, int limit)
        : SplitterError("No free filename for '" + base_name + "' in " + dir.string() + " after " +
                        std::to_string(limit) + " suffixes")
    {
    }
};

class OutputWriteError : public SplitterError
{
public:
    using SplitterError::SplitterError;
};

} // namespace issues
