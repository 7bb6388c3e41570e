#include "motion_gate.hpp"
#include "log.hpp"
#include <stdexcept>

/**
 * @file motion_gate.cpp
 * @brief MOG2 foreground ratio computation.
 */

namespace vigil {

static cv::Ptr<cv::BackgroundSubtractorMOG2> make_model() {
    return cv::createBackgroundSubtractorMOG2(MotionGate::kHistory, MotionGate::kVarThreshold, true);
}

MotionGate::MotionGate(double threshold, int learning_frames)
    : model_(make_model()),
      threshold_(threshold),
      learning_frames_(learning_frames < 0 ? 0 : learning_frames),
      frames_seen_(0) {
    VIGIL_LOG_INFO("motion") << "threshold=" << threshold_
                             << " learning_frames=" << learning_frames_;
}

MotionResult MotionGate::evaluate(const Frame& frame) {
    if (frame.image.empty()) {
        throw std::invalid_argument("motion gate received empty frame " + std::to_string(frame.frame_id));
    }
    MotionResult r;
    r.frame_id = frame.frame_id;

    ++frames_seen_;
    model_->apply(frame.image, fg_mask_);

    if (isLearning()) {
        return r;
    }

    // Shadow pixels (127) count as foreground along with full motion (255).
    const double total = static_cast<double>(fg_mask_.rows) * fg_mask_.cols;
    const int moving = cv::countNonZero(fg_mask_);
    r.confidence = total > 0.0 ? moving / total : 0.0;
    r.has_motion = r.confidence >= threshold_;
    return r;
}

void MotionGate::resetBackground() {
    model_ = make_model();
    frames_seen_ = 0;
    VIGIL_LOG_INFO("motion") << "background model reset";
}

} // namespace vigil
