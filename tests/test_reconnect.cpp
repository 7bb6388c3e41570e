#include "reconnect.hpp"
#include "metrics.hpp"
#include "test_support.hpp"
#include <cassert>
#include <functional>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

using namespace vigil;
using namespace vigil::testing;
using std::chrono::milliseconds;

namespace {

ReconnectPolicy make_policy(int max_failures, FatalPolicy fatal) {
    ReconnectPolicy p;
    p.initial_backoff = milliseconds(1000);
    p.max_backoff = milliseconds(8000);
    p.max_failures = max_failures;
    p.read_timeout = milliseconds(50);
    p.poll_interval = milliseconds(100);
    p.fatal_policy = fatal;
    return p;
}

/** @brief Source whose connect() blocks until released. */
class GatedSource : public FakeFrameSource {
public:
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};

    bool connect() override {
        entered = true;
        while (!release.load()) std::this_thread::sleep_for(milliseconds(1));
        return FakeFrameSource::connect();
    }
};

void wait_until(const std::function<bool()>& pred) {
    for (int i = 0; i < 5000 && !pred(); ++i) std::this_thread::sleep_for(milliseconds(1));
    assert(pred());
}

} // namespace

int main() {
    // Exponential delays capped at the maximum
    {
        ReconnectPolicy p = make_policy(5, FatalPolicy::Exit);
        assert(ReconnectSupervisor::backoffFor(1, p) == milliseconds(1000));
        assert(ReconnectSupervisor::backoffFor(2, p) == milliseconds(2000));
        assert(ReconnectSupervisor::backoffFor(3, p) == milliseconds(4000));
        assert(ReconnectSupervisor::backoffFor(4, p) == milliseconds(8000));
        assert(ReconnectSupervisor::backoffFor(5, p) == milliseconds(8000));
        assert(ReconnectSupervisor::backoffFor(0, p) == milliseconds(1000));
    }

    // Unreachable camera: 1s, 2s, 4s, 8s of backoff, then Fatal after the fifth failure
    {
        FakeFrameSource src;
        src.connect_script = {false};
        ManualClock clock;
        MetricsAggregator metrics;
        ReconnectSupervisor sup(src, make_policy(5, FatalPolicy::Exit), clock, &metrics);

        std::vector<std::pair<LinkState, LinkState>> transitions;
        int fatal_failures = 0;
        sup.setListener([&](LinkState from, LinkState to, int failures) {
            transitions.emplace_back(from, to);
            if (to == LinkState::Fatal) fatal_failures = failures;
        });

        BoundedFrameQueue q(10);
        std::atomic<bool> stop{false};
        sup.run(q, stop);

        assert(sup.state() == LinkState::Fatal);
        assert(sup.isFatal());
        assert(sup.consecutiveFailures() == 5);
        assert(fatal_failures == 5);
        assert(src.connects == 5);
        assert(metrics.reconnectAttempts() == 5);
        assert(clock.slept() == milliseconds(15000));
        assert(q.empty());

        assert(transitions.size() == 10);
        assert(transitions[0] == std::make_pair(LinkState::Disconnected, LinkState::Connecting));
        assert(transitions[1] == std::make_pair(LinkState::Connecting, LinkState::Disconnected));
        assert(transitions[8] == std::make_pair(LinkState::Disconnected, LinkState::Connecting));
        assert(transitions[9] == std::make_pair(LinkState::Connecting, LinkState::Fatal));
    }

    // Success resets the backoff and frames reset the failure count
    {
        FakeFrameSource src;
        src.connect_script = {false, false, true};
        src.read_script = {ReadStatus::Frame};
        ManualClock clock;
        ReconnectSupervisor sup(src, make_policy(5, FatalPolicy::Exit), clock);
        BoundedFrameQueue q(10);
        std::atomic<bool> stop{false};

        std::thread t([&]() { sup.run(q, stop); });
        wait_until([&]() { return src.frames_out.load() >= 5; });
        stop = true;
        t.join();

        assert(src.connects == 3);
        assert(clock.slept() == milliseconds(3000));
        assert(sup.consecutiveFailures() == 0);
        assert(sup.currentBackoff() == milliseconds(1000));
        assert(!q.empty());
        Frame f;
        assert(q.tryPop(f) && f.frame_id >= 1);
        assert(src.closes >= 1);
    }

    // Timeouts and closed streams count as failures and trigger a reconnect
    {
        FakeFrameSource src;
        src.connect_script = {true};
        src.read_script = {ReadStatus::Frame, ReadStatus::Timeout, ReadStatus::Closed, ReadStatus::Frame};
        ManualClock clock;
        MetricsAggregator metrics;
        ReconnectSupervisor sup(src, make_policy(5, FatalPolicy::Exit), clock, &metrics);
        BoundedFrameQueue q(10);
        std::atomic<bool> stop{false};

        std::thread t([&]() { sup.run(q, stop); });
        wait_until([&]() { return src.frames_out.load() >= 3; });
        stop = true;
        t.join();

        // Timeout then close: two failures, one reconnect after each
        assert(src.connects == 3);
        assert(metrics.reconnectAttempts() == 3);
        assert(clock.slept() == milliseconds(1000 + 1000));
        assert(sup.consecutiveFailures() == 0);
    }

    // Retry policy keeps trying at the capped interval
    {
        FakeFrameSource src;
        src.connect_script = {false};
        ManualClock clock;
        ReconnectSupervisor sup(src, make_policy(2, FatalPolicy::Retry), clock);
        int fatal_count = 0;
        sup.setListener([&](LinkState, LinkState to, int) {
            if (to == LinkState::Fatal) ++fatal_count;
        });
        BoundedFrameQueue q(10);
        std::atomic<bool> stop{false};

        std::thread t([&]() { sup.run(q, stop); });
        wait_until([&]() { return src.connects.load() >= 7; });
        stop = true;
        t.join();

        assert(sup.isFatal());
        assert(fatal_count >= 6);
        assert(sup.currentBackoff() == milliseconds(8000));
        assert(clock.slept() >= milliseconds(1000 + 2000 + 4000 + 8000 + 8000));
    }

    // Only one connection attempt at a time
    {
        GatedSource src;
        ManualClock clock;
        ReconnectSupervisor sup(src, make_policy(5, FatalPolicy::Exit), clock);

        bool first = false;
        std::thread t([&]() { first = sup.reconnect(); });
        wait_until([&]() { return src.entered.load(); });
        assert(!sup.reconnect());
        assert(sup.state() == LinkState::Connecting);
        src.release = true;
        t.join();

        assert(first);
        assert(src.connects == 1);
        assert(sup.state() == LinkState::Connected);
        assert(sup.reconnect());  // Already connected
        assert(src.connects == 1);
    }

    // Policy reads its values from the configuration
    {
        PipelineConfig c;
        c.backoff_initial_ms = 250;
        c.backoff_max_ms = 1000;
        c.max_reconnect_failures = 3;
        c.fatal_policy = FatalPolicy::Retry;
        ReconnectPolicy p = ReconnectPolicy::fromConfig(c);
        assert(p.initial_backoff == milliseconds(250));
        assert(p.max_backoff == milliseconds(1000));
        assert(p.max_failures == 3);
        assert(p.fatal_policy == FatalPolicy::Retry);
        assert(ReconnectSupervisor::backoffFor(4, p) == milliseconds(1000));
    }

    std::cout << "test_reconnect: OK" << std::endl;
    return 0;
}
