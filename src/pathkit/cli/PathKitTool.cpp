#include "PathKitTool.hpp"
#include "cli/CommandLine.hpp"
#include "core/Error.hpp"
#include "fs/FileOps.hpp"
#include "fs/RandomSource.hpp"
#include "log/TaggedLogger.hpp"
#include "path/FilePath.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace PK::CLI {

namespace {

struct PathKitCliOptions {
    bool                         show_help  = false;
    bool                         soft       = false;
    bool                         recursive  = false;
    bool                         only_files = false;
    bool                         only_dirs  = false;
    std::string                  prefix     = "pathkit";
    std::optional<std::string>   skip_extension;
    std::optional<std::uint64_t> seed;
    std::vector<std::string>     args;
};

void print_usage(std::ostream& os) {
    os << "Usage: pathkit normalize <path>\n"
          "       pathkit relative <path> <base>\n"
          "       pathkit combine <base> <fragment>\n"
          "       pathkit copy <src> <dst> [--skip-ext <ext>]\n"
          "       pathkit delete <path> [--soft]\n"
          "       pathkit ls <dir> [--recursive] [--files|--dirs]\n"
          "       pathkit mktemp [--prefix <name>] [--seed <n>]\n"
          "       pathkit --help\n";
}

auto parse_cli(std::vector<std::string> const& tokens, std::ostream& err) -> std::optional<PathKitCliOptions> {
    PathKitCliOptions options{};

    CommandLine cli;
    cli.set_program_name("pathkit");
    cli.set_error_logger([&err](std::string const& message) { err << message << "\n"; });

    cli.add_flag("--help", {.on_set = [&] { options.show_help = true; }});
    cli.add_alias("-h", "--help");
    cli.add_flag("--soft", {.on_set = [&] { options.soft = true; }});
    cli.add_flag("--recursive", {.on_set = [&] { options.recursive = true; }});
    cli.add_alias("-r", "--recursive");
    cli.add_flag("--files", {.on_set = [&] { options.only_files = true; }});
    cli.add_flag("--dirs", {.on_set = [&] { options.only_dirs = true; }});
    cli.add_value("--prefix", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      if (value.empty()) {
                          return std::string{"--prefix requires a name"};
                      }
                      options.prefix.assign(value.begin(), value.end());
                      return std::nullopt;
                  }});
    cli.add_value("--skip-ext", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                      options.skip_extension = std::string{value};
                      return std::nullopt;
                  }});
    cli.add_unsigned("--seed", {.on_value = [&](std::uint64_t value) { options.seed = value; }});

    if (!cli.parse(tokens)) {
        return std::nullopt;
    }
    options.args = cli.positionals();
    return options;
}

auto report(std::ostream& err, Error const& error) -> int {
    err << "pathkit: " << describeError(error) << "\n";
    return 1;
}

auto print_paths(std::ostream& out, std::vector<FilePath> const& paths) -> void {
    for (auto const& path : paths)
        out << path << "\n";
}

auto run(PathKitCliOptions const& options, std::ostream& out, std::ostream& err, FileSystem& fs) -> int {
    auto const& command  = options.args.front();
    auto const  argCount = options.args.size() - 1;
    auto const  expected = [&](std::size_t count) {
        if (argCount == count)
            return true;
        err << "pathkit: " << command << " expects " << count << " argument(s), got " << argCount << "\n";
        print_usage(err);
        return false;
    };

    if (command == "normalize") {
        if (!expected(1))
            return 2;
        out << FilePath{options.args[1]} << "\n";
        return 0;
    }

    if (command == "relative") {
        if (!expected(2))
            return 2;
        auto relative = FilePath{options.args[1]}.relativeTo(FilePath{options.args[2]});
        if (!relative)
            return report(err, relative.error());
        out << *relative << "\n";
        return 0;
    }

    if (command == "combine") {
        if (!expected(2))
            return 2;
        auto combined = FilePath{options.args[1]}.combine(FilePath{options.args[2]});
        if (!combined)
            return report(err, combined.error());
        out << *combined << "\n";
        return 0;
    }

    if (command == "copy") {
        if (!expected(2))
            return 2;
        Fs::CopyFilter filter;
        if (options.skip_extension) {
            filter = [ext = *options.skip_extension](FilePath const& dst) { return !dst.hasExtension(ext); };
        }
        if (auto copied = Fs::copy(fs, FilePath{options.args[1]}, FilePath{options.args[2]}, filter); !copied)
            return report(err, copied.error());
        return 0;
    }

    if (command == "delete") {
        if (!expected(1))
            return 2;
        auto mode = options.soft ? Fs::DeleteMode::Soft : Fs::DeleteMode::Normal;
        if (auto removed = Fs::remove(fs, FilePath{options.args[1]}, mode); !removed)
            return report(err, removed.error());
        return 0;
    }

    if (command == "ls") {
        if (!expected(1))
            return 2;
        if (options.only_files && options.only_dirs) {
            err << "pathkit: --files and --dirs are exclusive\n";
            return 2;
        }
        FilePath const dir{options.args[1]};
        auto const     recursion = options.recursive ? Fs::Recursion::AllDirectories : Fs::Recursion::TopDirectoryOnly;
        auto listed = options.only_files  ? Fs::files(fs, dir, recursion)
                      : options.only_dirs ? Fs::directories(fs, dir, recursion)
                                          : Fs::contents(fs, dir, recursion);
        if (!listed)
            return report(err, listed.error());
        print_paths(out, *listed);
        return 0;
    }

    if (command == "mktemp") {
        if (!expected(0))
            return 2;
        auto random  = options.seed ? makeRandomSource(*options.seed) : makeRandomSource();
        auto created = Fs::createTempDirectory(fs, options.prefix, random);
        if (!created)
            return report(err, created.error());
        out << *created << "\n";
        return 0;
    }

    err << "pathkit: unknown command '" << command << "'\n";
    print_usage(err);
    return 2;
}

} // namespace

auto runPathKit(std::vector<std::string> const& args, std::ostream& out, std::ostream& err, FileSystem& fs) -> int {
    auto options = parse_cli(args, err);
    if (!options) {
        print_usage(err);
        return 2;
    }
    if (options->show_help) {
        print_usage(out);
        return 0;
    }
    if (options->args.empty()) {
        print_usage(err);
        return 2;
    }

    pk_log("Running command " + options->args.front(), "CLI", "INFO");
    return run(*options, out, err, fs);
}

} // namespace PK::CLI
