/**
 * @file keyframe_probe.cpp
 * @brief Video inspection utility
 *
 * @details Prints what the server would see for a video before extraction:
 *          container, codec, geometry, duration and the number of frames an
 *          extraction at the given interval is expected to yield.
 *
 * @usage
 *   keyframe_probe input.mp4 [interval_seconds]
 *
 */

#include <cstdlib>
#include <iostream>
#include <string>

extern "C" {
#include <libavutil/log.h>
}

#include <nlohmann/json.hpp>

#include "keyframe/media_probe.hpp"
#include "keyframe/pipeline.hpp"
#include "keyframe/types.hpp"

using json = nlohmann::json;

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " input.mp4 [interval_seconds]\n";
    return 1;
  }

  int interval = keyframe::DEFAULT_INTERVAL_SEC;
  if (argc >= 3) {
    keyframe::Error err =
        keyframe::PipelineCoordinator::parse_interval(std::string(argv[2]),
                                                      interval);
    if (!err.ok()) {
      std::cerr << err.message << " (" << err.detail << ")\n";
      return 1;
    }
  }

  av_log_set_level(AV_LOG_QUIET);

  keyframe::MediaProbe probe(argv[1]);
  std::string error;
  if (!probe.open(error)) {
    json out = {{"file", argv[1]}, {"ok", false}, {"error", error}};
    std::cout << out.dump(2) << std::endl;
    return 2;
  }

  const keyframe::VideoInfo &info = probe.info();
  json out = {
      {"file", argv[1]},
      {"ok", true},
      {"container", info.container},
      {"codec", info.codec},
      {"width", info.width},
      {"height", info.height},
      {"fps", info.fps},
      {"duration", info.duration},
      {"interval", interval},
      {"expectedFrames", keyframe::expected_frame_count(info.duration,
                                                        interval)}};
  std::cout << out.dump(2) << std::endl;
  return 0;
}
