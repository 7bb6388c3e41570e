#ifndef OVERLAY_HPP
#define OVERLAY_HPP

#include "types.hpp"
#include <string>

namespace vigil {

/**
 * @file overlay.hpp
 * @brief Detection annotation and snapshot persistence for events.
 */

/** @brief BGR box color: green above 0.8, yellow from 0.5, red below. */
cv::Scalar colorForConfidence(float confidence);

/**
 * @brief Draw boxes and "label 0.92" tags onto a BGR image in place.
 */
void annotateDetections(cv::Mat& frame_bgr, const DetectionSet& dets);

/**
 * @brief Writes annotated JPEG snapshots into date partitions.
 * @threading Pipeline consumer thread only.
 */
class SnapshotWriter {
public:
    explicit SnapshotWriter(std::string root, int jpeg_quality = 90);

    /** @brief `<root>/<YYYY-MM-DD>/<event_id>.jpg` for the given capture time. */
    std::string pathFor(const std::string& event_id, WallTime t) const;

    /**
     * @brief Annotate a copy of the frame and write it into the partition of @p t.
     * @param path_out Set to the written path on success.
     * @return False when the directory or the encoder fails.
     */
    bool save(const Frame& frame, const DetectionSet& dets, const std::string& event_id,
              WallTime t, std::string& path_out);

private:
    std::string root_;
    int jpeg_quality_;
};

} // namespace vigil

#endif // OVERLAY_HPP
