#pragma once

#include "histop/EntryReader.hpp"
#include "histop/Error.hpp"
#include "histop/Frequency.hpp"
#include "histop/HistoryFormat.hpp"
#include "histop/Normalizer.hpp"
#include "histop/Tokenizer.hpp"

#include <functional>
#include <istream>
#include <set>
#include <string>
#include <vector>

namespace histop {

struct AnalyzeOptions {
  DetectOptions                      detect_;
  TokenizeOptions                    tokenize_;
  NormalizeOptions                   normalize_;
  std::set<std::string, std::less<>> ignore_;
  size_t                             more_than_ = 0;
  RankOptions                        rank_;
};

struct Report {
  std::vector<RankedEntry> entries_;
  size_t                   total_    = 0; // sum of counts after filtering
  size_t                   distinct_ = 0; // commands after filtering
  HistoryFormat            format_   = HistoryFormat::PlainLines;
  EntryStats               stats_;
  size_t                   segments_       = 0; // segments that produced a command
  size_t                   empty_segments_ = 0; // segments without a command
};

// Runs detection, reconstruction, tokenization, normalization, counting and
// ranking over one history stream.
Result<Report> analyze(std::istream& in, AnalyzeOptions const& options);

// As analyze(), reading `path` ("-" for standard input). The path also
// serves as the detection hint unless one is set already.
Result<Report> analyzeFile(std::string const& path, AnalyzeOptions options);

} // namespace histop
