#include "capture.hpp"
#include "log.hpp"
#include <chrono>
#include <cstring>

/**
 * @file capture_stream.cpp
 * @brief FFmpeg demux/decode with interrupt-driven read deadlines and BGR conversion.
 */

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace vigil {

const char* readStatusName(ReadStatus status) {
    switch (status) {
        case ReadStatus::Frame: return "frame";
        case ReadStatus::Timeout: return "timeout";
        case ReadStatus::Closed: return "closed";
    }
    return "closed";
}

std::string redactUrl(const std::string& url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos) return url;
    const auto at = url.find('@', scheme + 3);
    const auto slash = url.find('/', scheme + 3);
    if (at == std::string::npos || (slash != std::string::npos && at > slash)) return url;
    return url.substr(0, scheme + 3) + "***@" + url.substr(at + 1);
}

static std::string err2str(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

/**
 * @brief Wraps FFmpeg demux/decoder state for one stream URL.
 *
 * Blocking FFmpeg calls are bounded by an interrupt callback that compares
 * the steady clock against a per-call deadline. Decoded frames are converted
 * to BGR24 with swscale into freshly allocated cv::Mat buffers.
 */
class CaptureStream::Impl {
public:
    Impl(const std::string& url, std::chrono::milliseconds connect_timeout)
        : url_(url), connect_timeout_(connect_timeout) {
        if (url_.rfind("file:", 0) == 0) url_ = url_.substr(5);
    }

    ~Impl() {
        release();
    }

    static int interrupt_cb(void* opaque) {
        auto* self = static_cast<Impl*>(opaque);
        if (self->interrupt_ && self->interrupt_->load()) return 1;
        if (std::chrono::steady_clock::now() > self->deadline_) {
            self->timed_out_ = true;
            return 1;
        }
        return 0;
    }

    void arm(std::chrono::milliseconds timeout) {
        timed_out_ = false;
        deadline_ = std::chrono::steady_clock::now() + timeout;
    }

    bool connect() {
        release();
        format_ctx_ = avformat_alloc_context();
        if (!format_ctx_) {
            VIGIL_LOG_ERROR("capture") << "avformat_alloc_context failed";
            return false;
        }
        format_ctx_->interrupt_callback.callback = &Impl::interrupt_cb;
        format_ctx_->interrupt_callback.opaque = this;

        AVDictionary* opts = nullptr;
        if (url_.rfind("rtsp://", 0) == 0) {
            av_dict_set(&opts, "rtsp_transport", "tcp", 0);
        }
        arm(connect_timeout_);
        int ret = avformat_open_input(&format_ctx_, url_.c_str(), nullptr, &opts);
        av_dict_free(&opts);
        if (ret < 0) {
            // avformat_open_input frees the context on failure
            format_ctx_ = nullptr;
            VIGIL_LOG_WARN("capture") << "open failed for " << redactUrl(url_) << ": "
                                      << (timed_out_ ? "timed out" : err2str(ret));
            return false;
        }

        ret = avformat_find_stream_info(format_ctx_, nullptr);
        if (ret < 0) {
            VIGIL_LOG_WARN("capture") << "failed to find stream info: " << err2str(ret);
            release();
            return false;
        }

        video_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
        if (video_stream_index_ < 0) {
            VIGIL_LOG_WARN("capture") << "no video stream in " << redactUrl(url_);
            release();
            return false;
        }

        AVStream* video_stream = format_ctx_->streams[video_stream_index_];
        const AVCodec* codec = avcodec_find_decoder(video_stream->codecpar->codec_id);
        if (!codec) {
            VIGIL_LOG_WARN("capture") << "codec not found";
            release();
            return false;
        }
        codec_ctx_ = avcodec_alloc_context3(codec);
        if (!codec_ctx_) {
            VIGIL_LOG_WARN("capture") << "failed to allocate codec context";
            release();
            return false;
        }
        if (avcodec_parameters_to_context(codec_ctx_, video_stream->codecpar) < 0) {
            VIGIL_LOG_WARN("capture") << "failed to copy codec parameters";
            release();
            return false;
        }
        if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
            VIGIL_LOG_WARN("capture") << "failed to open codec";
            release();
            return false;
        }

        width_ = codec_ctx_->width;
        height_ = codec_ctx_->height;
        AVRational fps = av_guess_frame_rate(format_ctx_, video_stream, nullptr);
        fps_ = fps.den ? fps.num / (double)fps.den : 0.0;

        frame_ = av_frame_alloc();
        packet_ = av_packet_alloc();
        if (!frame_ || !packet_) {
            VIGIL_LOG_WARN("capture") << "failed to allocate frame buffers";
            release();
            return false;
        }
        VIGIL_LOG_INFO("capture") << "opened " << redactUrl(url_) << " " << width_ << "x" << height_
                                  << " @ " << fps_ << " fps codec=" << codec->name;
        return true;
    }

    /**
     * @brief Convert the decoded AVFrame into a BGR cv::Mat.
     */
    bool convert(Frame& frame) {
        const int w = frame_->width;
        const int h = frame_->height;
        if (w <= 0 || h <= 0) return false;
        sws_ = sws_getCachedContext(sws_, w, h, static_cast<AVPixelFormat>(frame_->format),
                                    w, h, AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr, nullptr, nullptr);
        if (!sws_) {
            VIGIL_LOG_WARN("capture") << "sws_getCachedContext failed";
            return false;
        }
        cv::Mat bgr(h, w, CV_8UC3);
        uint8_t* dst_data[4] = {bgr.data, nullptr, nullptr, nullptr};
        int dst_linesize[4] = {static_cast<int>(bgr.step[0]), 0, 0, 0};
        sws_scale(sws_, frame_->data, frame_->linesize, 0, h, dst_data, dst_linesize);

        frame.frame_id = ++frame_counter_;
        frame.image = bgr;
        frame.capture_time = std::chrono::system_clock::now();
        frame.mono_time = std::chrono::steady_clock::now();
        return true;
    }

    ReadStatus read(Frame& frame, std::chrono::milliseconds timeout) {
        if (!format_ctx_ || !codec_ctx_) return ReadStatus::Closed;
        arm(timeout);

        for (;;) {
            int ret = avcodec_receive_frame(codec_ctx_, frame_);
            if (ret == 0) {
                const bool ok = convert(frame);
                av_frame_unref(frame_);
                if (ok) return ReadStatus::Frame;
                continue;
            }
            if (ret == AVERROR_EOF) return ReadStatus::Closed;
            if (ret != AVERROR(EAGAIN)) {
                VIGIL_LOG_WARN("capture") << "decoder error: " << err2str(ret);
                return ReadStatus::Closed;
            }

            ret = av_read_frame(format_ctx_, packet_);
            if (ret < 0) {
                if (timed_out_ || ret == AVERROR_EXIT) return ReadStatus::Timeout;
                if (ret == AVERROR(EAGAIN)) continue;
                if (ret == AVERROR_EOF) {
                    // Drain buffered frames before reporting end of stream
                    ret = avcodec_send_packet(codec_ctx_, nullptr);
                    if (ret < 0 && ret != AVERROR_EOF) return ReadStatus::Closed;
                    continue;
                }
                VIGIL_LOG_WARN("capture") << "read error: " << err2str(ret);
                return ReadStatus::Closed;
            }
            if (packet_->stream_index == video_stream_index_) {
                ret = avcodec_send_packet(codec_ctx_, packet_);
                if (ret < 0 && ret != AVERROR(EAGAIN)) {
                    VIGIL_LOG_DEBUG("capture") << "send_packet: " << err2str(ret);
                }
            }
            av_packet_unref(packet_);
            if (std::chrono::steady_clock::now() > deadline_) return ReadStatus::Timeout;
        }
    }

    /**
     * @brief Tear down FFmpeg objects; the frame counter survives for reconnects.
     */
    void release() {
        if (sws_) {
            sws_freeContext(sws_);
            sws_ = nullptr;
        }
        if (packet_) {
            av_packet_free(&packet_);
        }
        if (frame_) {
            av_frame_free(&frame_);
        }
        if (codec_ctx_) {
            avcodec_free_context(&codec_ctx_);
        }
        if (format_ctx_) {
            avformat_close_input(&format_ctx_);
        }
        video_stream_index_ = -1;
    }

    void setInterrupt(const std::atomic<bool>* flag) { interrupt_ = flag; }
    const std::string& url() const { return url_; }
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    double getFPS() const { return fps_; }

private:
    std::string url_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::steady_clock::time_point deadline_;
    bool timed_out_ = false;
    const std::atomic<bool>* interrupt_ = nullptr;

    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* packet_ = nullptr;
    SwsContext* sws_ = nullptr;
    int video_stream_index_ = -1;
    uint64_t frame_counter_ = 0;
    int width_ = 0;
    int height_ = 0;
    double fps_ = 0.0;
};

CaptureStream::CaptureStream(const std::string& url, std::chrono::milliseconds connect_timeout)
    : pImpl(std::make_unique<Impl>(url, connect_timeout)) {}
CaptureStream::~CaptureStream() = default;

bool CaptureStream::connect() {
    return pImpl->connect();
}

ReadStatus CaptureStream::read(Frame& frame, std::chrono::milliseconds timeout) {
    return pImpl->read(frame, timeout);
}

void CaptureStream::close() {
    pImpl->release();
}

std::string CaptureStream::describe() const {
    return redactUrl(pImpl->url());
}

void CaptureStream::setInterrupt(const std::atomic<bool>* flag) {
    pImpl->setInterrupt(flag);
}

int CaptureStream::width() const {
    return pImpl->getWidth();
}

int CaptureStream::height() const {
    return pImpl->getHeight();
}

double CaptureStream::fps() const {
    return pImpl->getFPS();
}

std::unique_ptr<IFrameSource> createFrameSource(const std::string& url,
                                                std::chrono::milliseconds connect_timeout) {
    return std::make_unique<CaptureStream>(url, connect_timeout);
}

} // namespace vigil
