#include <doctest/doctest.h>

#include "FakeFileSystem.hpp"
#include "cli/PathKitTool.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using PK::Test::FakeFileSystem;

namespace {

struct ToolRun {
    int         status = -1;
    std::string out;
    std::string err;
};

auto run_tool(FakeFileSystem& fs, std::vector<std::string> const& args) -> ToolRun {
    std::ostringstream out;
    std::ostringstream err;
    ToolRun            result;
    result.status = PK::CLI::runPathKit(args, out, err, fs);
    result.out    = out.str();
    result.err    = err.str();
    return result;
}

} // namespace

TEST_SUITE("cli.pathkit_tool") {

TEST_CASE("path commands print canonical paths") {
    FakeFileSystem fs;

    SUBCASE("normalize collapses separators") {
        auto result = run_tool(fs, {"normalize", "a//b\\c/"});
        CHECK(result.status == 0);
        CHECK(result.out == "a/b/c\n");
        CHECK(result.err.empty());
    }
    SUBCASE("normalize keeps the drive letter") {
        auto result = run_tool(fs, {"normalize", "C:\\Users\\me"});
        CHECK(result.status == 0);
        CHECK(result.out == "C:/Users/me\n");
    }
    SUBCASE("relative strips the base") {
        auto result = run_tool(fs, {"relative", "/a/b/c", "/a"});
        CHECK(result.status == 0);
        CHECK(result.out == "b/c\n");
    }
    SUBCASE("combine appends a relative fragment") {
        auto result = run_tool(fs, {"combine", "/a", "b/c"});
        CHECK(result.status == 0);
        CHECK(result.out == "/a/b/c\n");
    }
}

TEST_CASE("failing commands exit 1 with the error description") {
    FakeFileSystem fs;

    SUBCASE("unrelated paths") {
        auto result = run_tool(fs, {"relative", "/a/b", "/c"});
        CHECK(result.status == 1);
        CHECK(result.out.empty());
        CHECK(result.err.starts_with("pathkit: unrelated_paths:"));
        CHECK(result.err.find("/a/b") != std::string::npos);
    }
    SUBCASE("absolute fragment") {
        auto result = run_tool(fs, {"combine", "/a", "/b"});
        CHECK(result.status == 1);
        CHECK(result.err.starts_with("pathkit: invalid_combination"));
    }
    SUBCASE("missing copy source") {
        auto result = run_tool(fs, {"copy", "/nope", "/dst"});
        CHECK(result.status == 1);
        CHECK(result.err.starts_with("pathkit: source_not_found"));
    }
}

TEST_CASE("copy honours --skip-ext") {
    FakeFileSystem fs;
    fs.addFile("/src/keep.txt", "k");
    fs.addFile("/src/drop.log", "d");
    fs.addFile("/src/sub/deep.log", "x");
    fs.addFile("/src/sub/deep.txt", "y");

    auto result = run_tool(fs, {"copy", "/src", "/dst", "--skip-ext", "log"});
    CHECK(result.status == 0);
    CHECK(result.err.empty());
    CHECK(fs.isFile("/dst/keep.txt"));
    CHECK(fs.isFile("/dst/sub/deep.txt"));
    CHECK_FALSE(fs.exists("/dst/drop.log"));
    CHECK_FALSE(fs.exists("/dst/sub/deep.log"));
}

TEST_CASE("delete --soft ignores a locked tree") {
    FakeFileSystem fs;
    fs.addFile("/work/busy.bin", "b");
    fs.locked.insert("/work/busy.bin");

    auto hard = run_tool(fs, {"delete", "/work"});
    CHECK(hard.status == 1);
    CHECK(hard.err.starts_with("pathkit: io_conflict"));

    auto soft = run_tool(fs, {"delete", "/work", "--soft"});
    CHECK(soft.status == 0);
    CHECK(soft.err.empty());
    CHECK(fs.isDir("/work"));

    auto missing = run_tool(fs, {"delete", "/gone"});
    CHECK(missing.status == 1);
    CHECK(missing.err.starts_with("pathkit: not_found"));
}

TEST_CASE("ls and mktemp") {
    FakeFileSystem fs;
    fs.addFile("/d/b.txt", "");
    fs.addFile("/d/a.txt", "");
    fs.addFile("/d/sub/c.txt", "");

    SUBCASE("top level contents list files then directories") {
        auto result = run_tool(fs, {"ls", "/d"});
        CHECK(result.status == 0);
        CHECK(result.out == "/d/a.txt\n/d/b.txt\n/d/sub\n");
    }
    SUBCASE("recursive files") {
        auto result = run_tool(fs, {"ls", "-r", "--files", "/d"});
        CHECK(result.status == 0);
        CHECK(result.out == "/d/a.txt\n/d/b.txt\n/d/sub/c.txt\n");
    }
    SUBCASE("--files with --dirs is a usage error") {
        auto result = run_tool(fs, {"ls", "--files", "--dirs", "/d"});
        CHECK(result.status == 2);
        CHECK(result.out.empty());
    }
    SUBCASE("mktemp creates a prefixed directory under the temp root") {
        auto result = run_tool(fs, {"mktemp", "--prefix", "job", "--seed", "7"});
        CHECK(result.status == 0);
        REQUIRE(result.out.starts_with("/tmp/job_"));
        REQUIRE(result.out.ends_with("\n"));
        CHECK(fs.isDir(result.out.substr(0, result.out.size() - 1)));
    }
}

TEST_CASE("usage errors exit 2") {
    FakeFileSystem fs;

    SUBCASE("no command") {
        auto result = run_tool(fs, {});
        CHECK(result.status == 2);
        CHECK(result.out.empty());
        CHECK(result.err.find("Usage: pathkit") != std::string::npos);
    }
    SUBCASE("unknown command") {
        auto result = run_tool(fs, {"frobnicate"});
        CHECK(result.status == 2);
        CHECK(result.err.starts_with("pathkit: unknown command 'frobnicate'"));
    }
    SUBCASE("wrong argument count") {
        auto result = run_tool(fs, {"relative", "/a"});
        CHECK(result.status == 2);
        CHECK(result.err.starts_with("pathkit: relative expects 2 argument(s), got 1"));
    }
    SUBCASE("unknown option") {
        auto result = run_tool(fs, {"normalize", "--bogus", "/a"});
        CHECK(result.status == 2);
        CHECK(result.err.starts_with("pathkit: unknown option '--bogus'"));
    }
    SUBCASE("help goes to stdout and succeeds") {
        auto result = run_tool(fs, {"--help"});
        CHECK(result.status == 0);
        CHECK(result.out.find("Usage: pathkit") != std::string::npos);
        CHECK(result.err.empty());
    }
}

#ifdef PK_LOG_DEBUG
TEST_CASE("commands leave logging switched off") {
    FakeFileSystem fs;
    fs.addFile("/src/a.txt", "a");
    PK::set_logging_enabled(false);

    std::ostringstream captured;
    std::streambuf*    previous = nullptr;
    {
        std::lock_guard<std::mutex> lock(PK::logger().coutMutex);
        previous = std::cerr.rdbuf(captured.rdbuf());
    }
    auto copied     = run_tool(fs, {"copy", "/src", "/dst"});
    auto normalized = run_tool(fs, {"normalize", "a//b"});
    {
        std::lock_guard<std::mutex> lock(PK::logger().coutMutex);
        std::cerr.rdbuf(previous);
    }

    CHECK(copied.status == 0);
    CHECK(copied.err.empty());
    CHECK(normalized.out == "a/b\n");
    CHECK(captured.str().empty());

    if (char const* env = std::getenv(PK::TaggedLogger::kEnableEnv); env && std::strcmp(env, "0") != 0)
        PK::set_logging_enabled(true);
}
#endif

} // TEST_SUITE
