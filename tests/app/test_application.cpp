#include <catch2/catch_test_macros.hpp>
#include "app/Application.hpp"
#include "issues/Diagnostics.hpp"
#include "issues/IssuePipeline.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/TempDirectory.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using test_utils::TempDirectory;

namespace
{
class ArgvBuilder
{
public:
    explicit ArgvBuilder(std::vector<std::string> args)
        : args_(std::move(args))
    {
        args_.insert(args_.begin(), "issue_splitter");
        for (auto& arg : args_)
            pointers_.push_back(arg.data());
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> pointers_;
};

int run_app(std::vector<std::string> args)
{
    ArgvBuilder builder(std::move(args));
    Application app(builder.argc(), builder.argv());
    return app.run();
}

// Quiet logging inside the temp directory
fs::path write_quiet_config(TempDirectory& dir, const std::string& extra = "")
{
    const std::string logs = (dir.path() / "logs").generic_string();
    return dir.writeFile("issue_splitter.toml", "[logging]\ndirectory = \"" + logs + "\"\nlevel = 0\n" + extra);
}
} // namespace

TEST_CASE("Application handles informational and invalid options", "[app]")
{
    REQUIRE(run_app({ "--help" }) == Application::kExitSuccess);
    REQUIRE(run_app({ "--version" }) == Application::kExitSuccess);
    REQUIRE(run_app({ "--frobnicate" }) == Application::kExitUsage);
    REQUIRE(run_app({ "--source" }) == Application::kExitUsage);
}

TEST_CASE("Application splits documents from the command line", "[app]")
{
    TempDirectory dir;
    auto config = write_quiet_config(dir);
    dir.writeFile("reviews/INFRA_MONITORING.md", "### 1. Leak\nbody\n### 2. Timeout\n**Priority:** High\n");
    const fs::path out = dir.path() / "out";

    SECTION("Normal run writes records and the index")
    {
        int code = run_app({ "--config", config.string(), "--source", (dir.path() / "reviews").string(), "--output",
                             out.string(), "--source-root", dir.path().string() });
        REQUIRE(code == Application::kExitSuccess);
        REQUIRE(fs::exists(out / "monitoring" / "001_INFRA_LEAK.md"));
        REQUIRE(fs::exists(out / "monitoring" / "002_INFRA_TIMEOUT.md"));
        REQUIRE(fs::exists(out / issues::IssuePipeline::kIndexFileName));
    }

    SECTION("Dry run and no-index flags override the config file")
    {
        int code = run_app({ "--config", config.string(), "--source", (dir.path() / "reviews").string(), "--output",
                             out.string(), "--dry-run" });
        REQUIRE(code == Application::kExitSuccess);
        REQUIRE_FALSE(fs::exists(out));

        code = run_app({ "--config", config.string(), "--source", (dir.path() / "reviews").string(), "--output",
                         out.string(), "--no-index" });
        REQUIRE(code == Application::kExitSuccess);
        REQUIRE(fs::exists(out / "monitoring" / "001_INFRA_LEAK.md"));
        REQUIRE_FALSE(fs::exists(out / issues::IssuePipeline::kIndexFileName));
    }
}

TEST_CASE("Application reports failed runs with a non-zero exit code", "[app]")
{
    TempDirectory dir;
    const fs::path out = dir.path() / "out";

    SECTION("Missing source directory")
    {
        auto config = write_quiet_config(dir);
        int code = run_app({ "--config", config.string(), "--source", (dir.path() / "nope").string(), "--output",
                             out.string() });
        REQUIRE(code == Application::kExitFailure);
    }

    SECTION("Unrecognized document aborts unless skipping is enabled")
    {
        auto config = write_quiet_config(dir, "\n[splitter]\nsource_dir = \"" +
                                                  (dir.path() / "reviews").generic_string() + "\"\noutput_root = \"" +
                                                  out.generic_string() + "\"\n");
        dir.writeFile("reviews/A_MONITORING.md", "### 1. Leak\nbody\n");
        dir.writeFile("reviews/B_UNKNOWN.md", "### 1. Stray\nbody\n");

        REQUIRE(run_app({ "--config", config.string() }) == Application::kExitFailure);
        REQUIRE_FALSE(fs::exists(out));

        REQUIRE(run_app({ "--config", config.string(), "--continue-on-error" }) == Application::kExitSuccess);
        REQUIRE(fs::exists(out / "monitoring" / "001_A_LEAK.md"));
    }

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Application logs again after an earlier run in the same process", "[app]")
{
    TempDirectory dir;
    dir.writeFile("reviews/INFRA_MONITORING.md", "### 1. Leak\nbody\n");
    const std::string source = (dir.path() / "reviews").string();

    auto quiet = write_quiet_config(dir);
    REQUIRE(run_app({ "--config", quiet.string(), "--source", source, "--dry-run" }) == Application::kExitSuccess);

    const fs::path logs = dir.path() / "second_logs";
    auto loud = dir.writeFile("loud.toml", "[logging]\ndirectory = \"" + logs.generic_string() +
                                               "\"\nappend_logs = false\nlevel = 4\npreview_bytes = 77\n");
    REQUIRE(run_app({ "--config", loud.string(), "--source", source, "--dry-run" }) == Application::kExitSuccess);

    const std::string log_text = TempDirectory::readFile(logs / "run.log");
    REQUIRE(log_text.find("issue_splitter") != std::string::npos);
    REQUIRE(log_text.find("001_INFRA_LEAK.md") != std::string::npos);
    REQUIRE(issues::Diagnostics::MaxPreview() == 77);

    issues::Diagnostics::SetMaxPreview(120);
}
