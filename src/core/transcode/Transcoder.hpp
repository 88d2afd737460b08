#pragma once
#include <string>

namespace recstore {

// Converts a finalized raw recording into a more widely playable file.
class Transcoder {
public:
  virtual ~Transcoder() = default;

  // Cheap availability check; false means transcoding is skipped entirely.
  virtual bool available() = 0;

  // Writes outputPath from inputPath. False on any failure; must not throw.
  virtual bool transcode(const std::string& inputPath, const std::string& outputPath) = 0;
};

} // namespace recstore
