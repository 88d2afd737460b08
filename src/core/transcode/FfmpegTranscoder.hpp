#pragma once
#include <string>
#include <vector>

#include "Transcoder.hpp"

namespace recstore {

struct FfmpegOptions {
  std::string binary   = "ffmpeg";
  int         fps      = 10;
  int         crf      = 18;
  std::string preset   = "veryfast";
  std::string pixFmt   = "yuv420p";
};

// Runs the ffmpeg binary as a child process through the shell. Blocks until
// it exits; there is no timeout.
class FfmpegTranscoder : public Transcoder {
public:
  explicit FfmpegTranscoder(FfmpegOptions opts = {}) : opts_(std::move(opts)) {}

  bool available() override;
  bool transcode(const std::string& inputPath, const std::string& outputPath) override;

  // argv for a transcode run, binary first.
  std::vector<std::string> buildArgs(const std::string& inputPath,
                                     const std::string& outputPath) const;

  const FfmpegOptions& options() const { return opts_; }

private:
  struct RunResult {
    bool        started = false;
    int         exitCode = -1;
    std::string output;   // stdout+stderr
  };
  static RunResult run_(const std::vector<std::string>& argv);

  FfmpegOptions opts_;
};

// Wraps an argument in single quotes for /bin/sh.
std::string shell_quote(const std::string& s);

} // namespace recstore
