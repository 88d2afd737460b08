#include "FfmpegTranscoder.hpp"

#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <sys/wait.h>

namespace recstore {

std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

static std::string tail(const std::string& s, size_t n) {
  return s.size() <= n ? s : s.substr(s.size() - n);
}

FfmpegTranscoder::RunResult FfmpegTranscoder::run_(const std::vector<std::string>& argv) {
  std::ostringstream cmd;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i) cmd << ' ';
    cmd << shell_quote(argv[i]);
  }
  cmd << " 2>&1 </dev/null";

  RunResult rr;
  FILE* fp = popen(cmd.str().c_str(), "r");
  if (!fp) return rr;
  rr.started = true;

  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) {
    rr.output.append(buf, n);
  }

  int status = pclose(fp);
  if (status == -1) {
    rr.exitCode = -1;
  } else if (WIFEXITED(status)) {
    rr.exitCode = WEXITSTATUS(status);
  } else {
    rr.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
  }
  return rr;
}

bool FfmpegTranscoder::available() {
  if (opts_.binary.empty()) return false;
  auto rr = run_({opts_.binary, "-version"});
  // sh reports 127 when the binary cannot be found
  return rr.started && rr.exitCode == 0;
}

std::vector<std::string> FfmpegTranscoder::buildArgs(const std::string& inputPath,
                                                     const std::string& outputPath) const {
  return {
    opts_.binary, "-y",
    "-i", inputPath,
    "-r", std::to_string(opts_.fps),
    "-c:v", "libx264", "-preset", opts_.preset, "-crf", std::to_string(opts_.crf),
    "-pix_fmt", opts_.pixFmt,
    "-movflags", "+faststart",
    outputPath,
  };
}

bool FfmpegTranscoder::transcode(const std::string& inputPath, const std::string& outputPath) {
  namespace fs = std::filesystem;
  auto rr = run_(buildArgs(inputPath, outputPath));

  std::error_code ec;
  const bool produced = fs::is_regular_file(outputPath, ec);
  if (rr.started && rr.exitCode == 0 && produced) {
    spdlog::debug("ffmpeg wrote {}", outputPath);
    return true;
  }

  if (!rr.started) {
    spdlog::warn("ffmpeg could not be started for {}", inputPath);
  } else {
    spdlog::warn("ffmpeg failed for {} (exit {}): {}", inputPath, rr.exitCode, tail(rr.output, 512));
  }
  // don't leave a truncated mp4 behind to be advertised later
  if (produced) fs::remove(outputPath, ec);
  return false;
}

} // namespace recstore
