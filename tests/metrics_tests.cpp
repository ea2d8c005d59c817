#include <metrics_tracker.hpp>

#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    using framecast::MetricsTracker;
    using framecast::Timestamp;
    using std::chrono::microseconds;

    Timestamp t0() {
        return Timestamp(microseconds(1700000000000000LL));
    }

    void test_fps_is_zero_below_two_arrivals() {
        MetricsTracker m;
        check(m.current_fps() == 0.0, "fps should be 0 with no arrivals");
        m.record_arrival(t0());
        check(m.current_fps() == 0.0, "fps should be 0 with one arrival");
        check(m.arrival_count() == 1, "arrival count should be 1");
    }

    void test_fps_matches_fixed_interval() {
        MetricsTracker m;
        const microseconds delta(33333);
        for (int i = 0; i < 10; ++i) {
            m.record_arrival(t0() + delta * i);
        }
        const double expected = 1.0 / 0.033333;
        check(std::fabs(m.current_fps() - expected) < 1e-6,
              "fps should be 1/delta for a fixed interval");

        MetricsTracker two;
        two.record_arrival(t0());
        two.record_arrival(t0() + microseconds(50000));
        check(std::fabs(two.current_fps() - 20.0) < 1e-9, "two arrivals 50ms apart should give 20 fps");
    }

    void test_window_evicts_oldest_samples() {
        MetricsTracker m(30);
        Timestamp t = t0();
        m.record_arrival(t);
        for (int i = 0; i < 30; ++i) {
            t += microseconds(100000);  // 10 fps
            m.record_arrival(t);
        }
        check(std::fabs(m.current_fps() - 10.0) < 1e-9, "window full of 100ms gaps should read 10 fps");

        for (int i = 0; i < 30; ++i) {
            t += microseconds(20000);  // 50 fps
            m.record_arrival(t);
        }
        check(m.sample_count() == 30, "window should never grow past capacity");
        check(std::fabs(m.current_fps() - 50.0) < 1e-9, "old samples should be fully evicted");

        m.reset();
        check(m.current_fps() == 0.0 && m.arrival_count() == 0, "reset should clear the window");
    }

    void test_latency_is_monotonic_in_now() {
        const Timestamp captured = t0();
        check(MetricsTracker::latency(captured, captured).count() == 0, "latency at capture time is 0");

        microseconds previous(0);
        for (int ms = 1; ms <= 100; ms += 7) {
            const auto lat = MetricsTracker::latency(captured, captured + microseconds(ms * 1000));
            check(lat.count() >= 0, "latency should be non-negative when now >= captured_at");
            check(lat > previous, "latency should grow as now advances");
            previous = lat;
        }
        check(MetricsTracker::latency(captured, captured + microseconds(12500)) == microseconds(12500),
              "latency should be now - captured_at");
    }
}

int main() {
    test_fps_is_zero_below_two_arrivals();
    test_fps_matches_fixed_interval();
    test_window_evicts_oldest_samples();
    test_latency_is_monotonic_in_now();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all metrics tests passed\n";
    return 0;
}
