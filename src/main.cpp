#include "histop/Analyzer.hpp"
#include "histop/ArgParser.hpp"
#include "histop/Config.hpp"
#include "histop/HistFile.hpp"
#include "histop/Render.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>

#include <unistd.h>

using namespace histop;

namespace {

// Writes the report; a reader that went away (histop | head) is not an error.
Result<void> writeStdout(std::string_view text) {
  std::fwrite(text.data(), 1, text.size(), stdout);
  if (std::fflush(stdout) == 0 && !std::ferror(stdout)) {
    return {};
  }
  if (errno == EPIPE) {
    return {};
  }
  return fail(ErrorKind::Io, fmt::format("cannot write to standard output: {}", std::strerror(errno)));
}

Result<std::string> historyPath(RunConfig const& config) {
  if (config.file_) {
    return *config.file_;
  }
  if (config.raw_ && ::isatty(STDIN_FILENO) != 1) {
    return std::string{"-"};
  }
  return resolveHistoryPath(HistEnv::fromEnvironment());
}

void printStats(std::string const& path, Report const& report) {
  fmt::print(stderr, "{}: reading {}\n", EXE_NAME, path == "-" ? "standard input" : path);
  fmt::print(stderr, "{}: format {}\n", EXE_NAME, report.format_);
  fmt::print(
      stderr,
      "{}: {} entries, {} blank, {} skipped records, {} unmetafied lines, {} undecodable lines\n",
      EXE_NAME,
      report.stats_.entries_,
      report.stats_.blank_entries_,
      report.stats_.skipped_records_,
      report.stats_.unmetafied_,
      report.stats_.undecodable_lines_
  );
  fmt::print(
      stderr,
      "{}: {} commands counted, {} empty segments, {} distinct after filtering\n",
      EXE_NAME,
      report.segments_,
      report.empty_segments_,
      report.distinct_
  );
}

Result<void> run(Arguments const& args) {
  auto file_config = loadConfigOrDefault(args.get<std::string>("config"));
  if (!file_config) {
    return std::unexpected(file_config.error());
  }
  auto config = buildRunConfig(args, *file_config);
  if (!config) {
    return std::unexpected(config.error());
  }

  auto path = historyPath(*config);
  if (!path) {
    return std::unexpected(path.error());
  }

  auto report = analyzeFile(*path, analyzeOptions(*config));
  if (!report) {
    return std::unexpected(report.error());
  }
  if (config->verbose_) {
    printStats(*path, *report);
  }

  RenderOptions render_options;
  render_options.format_ = config->output_;
  render_options.bar_    = config->bar_;
  render_options.color_  = useColor(config->color_, stdoutIsTerminal(), noColorRequested(std::getenv("NO_COLOR")));

  auto written = writeStdout(render(report->entries_, render_options));
  if (!written) {
    return std::unexpected(written.error());
  }
  return {};
}

} // namespace

int main(int argc, char* argv[]) {
  // EPIPE instead of being killed
  std::signal(SIGPIPE, SIG_IGN);

  auto parser = createArgParser();
  auto args   = parser.parse(argc, argv);

  if (!args) {
    fmt::print(stderr, "Error: {}\n\n{}", args.error().message(), parser.help());
    return 1;
  }

  if (args->has("help")) {
    fmt::print("{}", parser.help());
    return 0;
  }
  if (args->has("version")) {
    printVersion();
    return 0;
  }

  if (auto result = run(*args); !result) {
    fmt::print(stderr, "Error: {}\n", result.error().message());
    if (args->has("verbose")) {
      fmt::print(stderr, "{}: failed with {}\n", EXE_NAME, errorKindName(result.error().kind()));
    }
    if (result.error().kind() == ErrorKind::UnknownFormat) {
      fmt::print(stderr, "Hint: force a format with --format plain|zsh|fish|tcsh|powershell\n");
    }
    return 1;
  }
  return 0;
}
