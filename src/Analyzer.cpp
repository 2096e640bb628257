#include "histop/Analyzer.hpp"
#include "histop/Constants.hpp"
#include "histop/LineReader.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>

namespace histop {

Result<Report> analyze(std::istream& in, AnalyzeOptions const& options) {
  LineReader lines{in};

  auto sample = lines.sample(DETECT_SAMPLE_LINES);
  if (!sample) {
    return std::unexpected(sample.error());
  }
  auto format = detectFormat(*sample, options.detect_);
  if (!format) {
    return std::unexpected(format.error());
  }

  Report         report;
  FrequencyTable table;
  EntryReader    entries{lines, *format};
  report.format_ = *format;

  while (true) {
    auto entry = entries.next();
    if (!entry) {
      return std::unexpected(entry.error());
    }
    if (!*entry) {
      break;
    }
    for (auto const& segment : tokenize((*entry)->text_, options.tokenize_)) {
      if (auto command = normalize(segment, options.normalize_)) {
        table.add(*command);
        ++report.segments_;
      } else {
        ++report.empty_segments_;
      }
    }
  }

  table.filter(options.ignore_, options.more_than_);
  report.entries_  = rank(table, options.rank_);
  report.total_    = table.total();
  report.distinct_ = table.size();
  report.stats_    = entries.stats();
  return report;
}

Result<Report> analyzeFile(std::string const& path, AnalyzeOptions options) {
  if (path == "-") {
    return analyze(std::cin, options);
  }

  std::ifstream file{path, std::ios::binary};
  if (!file) {
    return fail(ErrorKind::Io, fmt::format("cannot open {}: {}", path, std::strerror(errno)));
  }
  if (options.detect_.path_hint_.empty()) {
    options.detect_.path_hint_ = path;
  }
  return analyze(file, options);
}

} // namespace histop
