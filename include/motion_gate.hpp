#ifndef MOTION_GATE_HPP
#define MOTION_GATE_HPP

#include "types.hpp"
#include <opencv2/video/background_segm.hpp>

namespace vigil {

/**
 * @file motion_gate.hpp
 * @brief Adaptive background subtraction deciding which frames contain motion.
 */

/**
 * @brief Wraps an OpenCV MOG2 background model with a learning phase.
 * @threading Owned by the pipeline consumer thread; not thread safe.
 * @ownership Sole owner of the background model.
 * @lifecycle Construct → evaluate() per frame → resetBackground() on scene change.
 */
class MotionGate {
public:
    static constexpr int kDefaultLearningFrames = 100;
    static constexpr int kHistory = 500;
    static constexpr double kVarThreshold = 16.0;

    /**
     * @param threshold Foreground fraction at or above which a frame has motion.
     * @param learning_frames Frames consumed to learn the background before reporting.
     */
    explicit MotionGate(double threshold, int learning_frames = kDefaultLearningFrames);

    /**
     * @brief Update the model with @p frame and report motion.
     *
     * During the learning phase the model is updated and has_motion is false
     * with confidence 0.
     * @throws std::invalid_argument when the frame image is empty.
     */
    MotionResult evaluate(const Frame& frame);

    /**
     * @brief Discard the learned model and re-enter the learning phase.
     */
    void resetBackground();

    void setThreshold(double threshold) { threshold_ = threshold; }
    double threshold() const { return threshold_; }
    int learningFrames() const { return learning_frames_; }
    uint64_t framesSeen() const { return frames_seen_; }
    bool isLearning() const { return frames_seen_ <= static_cast<uint64_t>(learning_frames_); }

private:
    cv::Ptr<cv::BackgroundSubtractorMOG2> model_;
    cv::Mat fg_mask_;        //!< Reused foreground mask buffer.
    double threshold_;
    int learning_frames_;
    uint64_t frames_seen_;
};

} // namespace vigil

#endif // MOTION_GATE_HPP
