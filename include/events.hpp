#ifndef EVENTS_HPP
#define EVENTS_HPP

#include "types.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace vigil {

class MetricsAggregator;

/**
 * @file events.hpp
 * @brief Event identity, construction and durable sink fan-out.
 */

/**
 * @brief Produces evt_<unix-ms>_<4 hex> identifiers unique for the process lifetime.
 * @threading Safe for concurrent calls.
 */
class EventIdGenerator {
public:
    EventIdGenerator();
    std::string next(WallTime now);

private:
    std::mutex mu_;
    std::mt19937 rng_;
    int64_t last_ms_ = -1;
    std::set<uint16_t> used_;   //!< Suffixes issued during last_ms_.
};

/** @brief Identifier from the process-wide generator. */
std::string generateEventId(WallTime now);

/**
 * @brief Freeze a populated record into a shared immutable event.
 *
 * Assigns event_id when empty and stamps created_at.
 */
EventPtr makeEvent(Event draft, WallTime created_at);

/** @brief "Person detected (confidence: 92%)" style headline. */
std::string eventTitle(const Event& e);

/** @brief Single-line JSON rendering of an event. */
std::string eventToJson(const Event& e);

/**
 * @brief Durable destination for emitted events.
 * @threading Called from the pipeline consumer thread only.
 * @lifecycle open() → repeated write() → flush().
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /** @brief Prepare the destination; may be called again after a failure. */
    virtual bool open() = 0;

    /** @brief Persist one event; false on any write failure. */
    virtual bool write(const Event& e) = 0;

    /** @brief Push buffered data to durable storage. */
    virtual void flush() = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Appends text records to `<root>/<YYYY-MM-DD>/<filename>`.
 *
 * The stream follows the event's UTC date and is reopened when the date
 * changes, so each partition stays self-contained for rotation.
 */
class DatePartitionedFileSink : public IEventSink {
public:
    DatePartitionedFileSink(std::string root, std::string filename);

    bool open() override;
    bool write(const Event& e) override;
    void flush() override;

    /** @brief Path the record for @p e is appended to. */
    std::string pathFor(const Event& e) const;

protected:
    /** @brief Text appended for one event, newline-terminated. */
    virtual std::string render(const Event& e, bool file_has_content) const = 0;

private:
    bool ensureStream(const std::string& date);

    std::string root_;
    std::string filename_;
    std::string current_date_;
    std::ofstream ofs_;
    bool has_content_ = false;
};

/**
 * @brief One JSON object per line in events.json.
 */
class JsonlEventSink : public DatePartitionedFileSink {
public:
    explicit JsonlEventSink(std::string root);
    std::string name() const override { return "jsonl"; }

protected:
    std::string render(const Event& e, bool file_has_content) const override;
};

/**
 * @brief Human-readable blocks in events.log.
 */
class PlaintextEventSink : public DatePartitionedFileSink {
public:
    explicit PlaintextEventSink(std::string root);
    std::string name() const override { return "plaintext"; }

protected:
    std::string render(const Event& e, bool file_has_content) const override;
};

/**
 * @brief Calls every configured sink for each event.
 *
 * The first sink is primary: an event counts as emitted when the primary
 * write succeeds. Failures of other sinks are logged and counted.
 * @ownership Owns the sinks.
 */
class EventDispatcher {
public:
    explicit EventDispatcher(MetricsAggregator* metrics = nullptr);

    void addSink(std::unique_ptr<IEventSink> sink);
    size_t sinkCount() const { return sinks_.size(); }

    /**
     * @brief Open all sinks.
     * @param error Set when the primary sink cannot be opened.
     * @return False only when the primary sink failed or none is configured.
     */
    bool openAll(std::string& error);

    /**
     * @brief Write to every sink; true when the primary accepted the event.
     *
     * A sink that failed to open is reopened first and skipped for this
     * event if that fails again.
     */
    bool dispatch(const Event& e);

    void flushAll();

private:
    struct Slot {
        std::unique_ptr<IEventSink> sink;
        bool usable = true;
    };
    std::vector<Slot> sinks_;
    MetricsAggregator* metrics_;
};

} // namespace vigil

#endif // EVENTS_HPP
