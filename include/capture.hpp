#ifndef CAPTURE_HPP
#define CAPTURE_HPP

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace vigil {

/**
 * @file capture.hpp
 * @brief Frame source contract and the FFmpeg stream adapter.
 *
 * Sources are driven by the acquisition thread through the reconnect
 * supervisor and never touched by the pipeline consumer. Implementations
 * assign monotonic frame ids that keep increasing across reconnects.
 */

/**
 * @brief Outcome of a bounded read.
 */
enum class ReadStatus {
    Frame,    //!< A decoded frame was produced.
    Timeout,  //!< Nothing arrived before the deadline.
    Closed    //!< End of stream or terminal error; reconnect required.
};

const char* readStatusName(ReadStatus status);

/**
 * @brief Abstract interface for camera and file sources.
 * @threading Owned and accessed exclusively by the acquisition thread.
 * @lifecycle connect() → repeated read() → close(); may reconnect after close().
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    /**
     * @brief Open the source and prepare decoding.
     * @return True when frames can be read.
     */
    virtual bool connect() = 0;

    /**
     * @brief Fetch the next decoded frame, waiting at most @p timeout.
     * @param frame Output frame populated on ReadStatus::Frame.
     */
    virtual ReadStatus read(Frame& frame, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Release all resources; connect() may be called again afterwards.
     */
    virtual void close() = 0;

    /** @brief Source description for logs, credentials stripped. */
    virtual std::string describe() const = 0;

    /**
     * @brief Flag that aborts blocking calls once set; null disables.
     * @threading Set before the acquisition thread starts.
     */
    virtual void setInterrupt(const std::atomic<bool>* flag) { (void)flag; }
};

/**
 * @brief FFmpeg-backed reader for rtsp://, http:// and file sources.
 * @threading Owned by the acquisition thread; FFmpeg contexts stay confined to it.
 * @ownership Holds demuxer, decoder and swscale state; output frames own their pixels.
 */
class CaptureStream : public IFrameSource {
public:
    /**
     * @param url Stream URL or file path (file: prefix accepted).
     * @param connect_timeout Bound on opening the stream and probing it.
     */
    explicit CaptureStream(const std::string& url,
                           std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000));
    ~CaptureStream() override;

    bool connect() override;
    ReadStatus read(Frame& frame, std::chrono::milliseconds timeout) override;
    void close() override;
    std::string describe() const override;
    void setInterrupt(const std::atomic<bool>* flag) override;

    int width() const;
    int height() const;
    double fps() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl; //!< Hidden FFmpeg state managed via PIMPL.
};

/** @brief Remove user:password@ from a URL for logging. */
std::string redactUrl(const std::string& url);

/**
 * @brief Factory selecting the capture backend for a configured URL.
 * @return Concrete source ready for connect().
 */
std::unique_ptr<IFrameSource> createFrameSource(const std::string& url,
                                                std::chrono::milliseconds connect_timeout);

} // namespace vigil

#endif // CAPTURE_HPP
