#pragma once

#include "files/remote_fs.hpp"
#include "gphoto/error_mapper.hpp"

#include <optional>
#include <string>

namespace gpcam::camera {

class Camera;

// Scoped movie recording.
//
// `Start` points the capture target at the memory card (recording to RAM is
// not supported by drivers) and sets `actions/movie`. `Stop` clears it, waits
// for the recorded file and restores the previous capture target. A recording
// still running at destruction is stopped and its file discarded.
class VideoCapture {
public:
  explicit VideoCapture(Camera& camera);
  ~VideoCapture();

  VideoCapture(const VideoCapture&) = delete;
  VideoCapture& operator=(const VideoCapture&) = delete;

  bool Start(gphoto::Error& error);
  bool Stop(files::File& video, gphoto::Error& error);

  bool recording() const {
    return recording_;
  }

private:
  bool SetMovie(bool enabled, gphoto::Error& error);

  Camera& camera_;
  bool recording_ = false;
  // Capture target to restore on stop; unset when it was already the card.
  std::optional<std::string> previous_target_;
};

} // namespace gpcam::camera
