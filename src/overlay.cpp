#include "overlay.hpp"
#include "format.hpp"
#include "log.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <vector>

namespace vigil {

cv::Scalar colorForConfidence(float confidence) {
    if (confidence > 0.8f) return {0, 255, 0};
    if (confidence >= 0.5f) return {0, 255, 255};
    return {0, 0, 255};
}

void annotateDetections(cv::Mat& frame_bgr, const DetectionSet& dets) {
    const cv::Rect bounds(0, 0, frame_bgr.cols, frame_bgr.rows);
    for (const auto& d : dets) {
        cv::Rect r = cv::Rect(d.bbox.x, d.bbox.y, d.bbox.width, d.bbox.height) & bounds;
        if (r.empty()) continue;
        const cv::Scalar color = colorForConfidence(d.confidence);
        cv::rectangle(frame_bgr, r, color, 2);
        char buf[128];
        snprintf(buf, sizeof(buf), "%s %.2f", d.label.c_str(), d.confidence);
        int base=0; cv::Size ts = cv::getTextSize(buf, cv::FONT_HERSHEY_SIMPLEX, 0.6, 1, &base);
        const int top = std::max(0, r.y - ts.height - 4);
        cv::rectangle(frame_bgr, cv::Rect(r.x, top, ts.width + 6, ts.height + 4), color, -1);
        cv::putText(frame_bgr, buf, cv::Point(r.x + 3, top + ts.height + 1), cv::FONT_HERSHEY_SIMPLEX, 0.6, {0,0,0}, 1);
    }
}

SnapshotWriter::SnapshotWriter(std::string root, int jpeg_quality)
    : root_(std::move(root)), jpeg_quality_(std::clamp(jpeg_quality, 1, 100)) {}

std::string SnapshotWriter::pathFor(const std::string& event_id, WallTime t) const {
    return (std::filesystem::path(root_) / utcDate(t) / (event_id + ".jpg")).string();
}

bool SnapshotWriter::save(const Frame& frame, const DetectionSet& dets, const std::string& event_id,
                          WallTime t, std::string& path_out) {
    if (frame.image.empty()) return false;
    const std::string path = pathFor(event_id, t);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) {
        VIGIL_LOG_WARN("snapshot") << "cannot create directory for " << path << ": " << ec.message();
        return false;
    }
    cv::Mat annotated = frame.image.clone();
    annotateDetections(annotated, dets);
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
    try {
        if (!cv::imwrite(path, annotated, params)) {
            VIGIL_LOG_WARN("snapshot") << "imwrite failed for " << path;
            return false;
        }
    } catch (const cv::Exception& ex) {
        VIGIL_LOG_WARN("snapshot") << "imwrite failed for " << path << ": " << ex.what();
        return false;
    }
    path_out = path;
    return true;
}

} // namespace vigil
