/// @file test_updater.cpp
/// @brief EphemerisUpdater refresh cycles against a scripted ephemeris source.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "ephemeris/updater.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace orrery;
using namespace orrery::ephemeris;
using solar::BodyId;

int main(int argc, char** argv)
{
    core::Logger::init(core::LoggerConfig{.file_path = "test_updater.log", .console = false});

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    const int result = context.run();

    core::Logger::shutdown();
    return result;
}

namespace
{

/// Returns a distinct vector per body unless told to fail it.
class ScriptedSource final : public EphemerisSource
{
public:
    FetchResult fetch_position(const solar::BodyInfo& body, const astro::TimeWindow& window) override
    {
        std::lock_guard lock(m_mutex);
        m_requested.emplace_back(body.name);
        m_windows.push_back(window);

        if (const auto it = m_failures.find(body.id); it != m_failures.end())
        {
            return it->second;
        }
        const f64 k = static_cast<f64>(solar::index_of(body.id)) + m_offset;
        return Vec3d{k, -k, k / 10.0};
    }

    void fail(BodyId id, FetchError error)
    {
        std::lock_guard lock(m_mutex);
        m_failures[id] = std::move(error);
    }

    void set_offset(f64 offset)
    {
        std::lock_guard lock(m_mutex);
        m_offset = offset;
    }

    std::vector<std::string> requested()
    {
        std::lock_guard lock(m_mutex);
        return m_requested;
    }

    std::vector<astro::TimeWindow> windows()
    {
        std::lock_guard lock(m_mutex);
        return m_windows;
    }

private:
    std::mutex m_mutex;
    std::map<BodyId, FetchError> m_failures;
    std::vector<std::string> m_requested;
    std::vector<astro::TimeWindow> m_windows;
    f64 m_offset = 0.0;
};

constexpr UpdaterConfig kNoDelays{
    .request_delay  = std::chrono::milliseconds{0},
    .cycle_interval = std::chrono::milliseconds{0},
};

f64 fixed_clock()
{
    return astro_constants::kJ2000;
}

Vec3d expected_position(BodyId id, f64 offset = 0.0)
{
    const f64 k = static_cast<f64>(solar::index_of(id)) + offset;
    return Vec3d{k, -k, k / 10.0};
}

} // anonymous namespace

// =================================================================
// One cycle
// =================================================================

TEST_CASE("A clean cycle fetches every planet once and reports OK")
{
    ScriptedSource source;
    solar::SharedViewState state;
    EphemerisUpdater updater(source, state, kNoDelays, fixed_clock);

    const auto update = updater.run_cycle();

    const auto requested = source.requested();
    REQUIRE(requested.size() == 8);
    CHECK(requested.front() == "Mercury");
    CHECK(requested.back() == "Neptune");

    CHECK(update.status == "OK");
    CHECK(update.timestamp_utc == "2000-01-01T12:00:00Z");

    const auto view = state.snapshot();
    CHECK(view.status == "OK");
    CHECK(view.last_update_utc == "2000-01-01T12:00:00Z");
    CHECK(*view.position(BodyId::Sun) == Vec3d{0.0});
    CHECK(*view.position(BodyId::Saturn) == expected_position(BodyId::Saturn));
    CHECK(updater.cycles_completed() == 1);
}

TEST_CASE("Requests use a one-minute window at the clock time")
{
    ScriptedSource source;
    solar::SharedViewState state;
    EphemerisUpdater updater(source, state, kNoDelays, fixed_clock);

    updater.run_cycle();

    const auto windows = source.windows();
    REQUIRE_FALSE(windows.empty());
    CHECK(windows.front().start == "2000-Jan-01 12:00:00");
    CHECK(windows.front().stop  == "2000-Jan-01 12:01:00");
}

// =================================================================
// A failed body keeps its last position
// =================================================================

TEST_CASE("Mars failure keeps the old Mars position and names Mars in the status")
{
    ScriptedSource source;
    solar::SharedViewState state;
    EphemerisUpdater updater(source, state, kNoDelays, fixed_clock);

    updater.run_cycle();
    const Vec3d mars_before = *state.snapshot().position(BodyId::Mars);

    source.set_offset(100.0);
    source.fail(BodyId::Mars, FetchError{FetchErrorKind::Network, "Timeout was reached"});
    const auto update = updater.run_cycle();

    CHECK(update.status == "Fetch error (Mars): Timeout was reached");

    const auto view = state.snapshot();
    CHECK(view.status == "Fetch error (Mars): Timeout was reached");
    CHECK(*view.position(BodyId::Mars) == mars_before);
    CHECK(*view.position(BodyId::Earth) == expected_position(BodyId::Earth, 100.0));
    CHECK(*view.position(BodyId::Jupiter) == expected_position(BodyId::Jupiter, 100.0));
}

TEST_CASE("Status names the last failing body in the cycle")
{
    ScriptedSource source;
    solar::SharedViewState state;
    EphemerisUpdater updater(source, state, kNoDelays, fixed_clock);

    source.fail(BodyId::Venus, FetchError{FetchErrorKind::HttpStatus, "HTTP status 503"});
    source.fail(BodyId::Uranus, FetchError{FetchErrorKind::MissingMarkers, "Missing $$SOE marker"});
    updater.run_cycle();

    const auto view = state.snapshot();
    CHECK(view.status == "Fetch error (Uranus): Missing $$SOE marker");
    CHECK_FALSE(view.position(BodyId::Venus).has_value());
    CHECK_FALSE(view.position(BodyId::Uranus).has_value());
    CHECK(view.position(BodyId::Neptune).has_value());
}

TEST_CASE("Refresh leaves zoom and focus alone")
{
    ScriptedSource source;
    solar::SharedViewState state;
    state.modify([](solar::ViewState& view) {
        view.set_zoom(3.0);
        view.focus_index = 2;
    });

    EphemerisUpdater updater(source, state, kNoDelays, fixed_clock);
    updater.run_cycle();

    const auto view = state.snapshot();
    CHECK(view.zoom == doctest::Approx(3.0));
    CHECK(view.focus_index == 2);
}

// =================================================================
// Worker thread
// =================================================================

TEST_CASE("Worker runs cycles until stopped")
{
    ScriptedSource source;
    solar::SharedViewState state;
    EphemerisUpdater updater(source, state,
                             UpdaterConfig{.request_delay = std::chrono::milliseconds{0},
                                           .cycle_interval = std::chrono::milliseconds{5}},
                             fixed_clock);

    updater.start();
    CHECK(updater.running());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (updater.cycles_completed() < 2 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }

    updater.stop();
    CHECK_FALSE(updater.running());
    CHECK(updater.cycles_completed() >= 2);
    CHECK(state.snapshot().status == "OK");
}

TEST_CASE("Stop interrupts a long inter-cycle sleep")
{
    ScriptedSource source;
    solar::SharedViewState state;
    EphemerisUpdater updater(source, state,
                             UpdaterConfig{.request_delay = std::chrono::milliseconds{0},
                                           .cycle_interval = std::chrono::hours{1}},
                             fixed_clock);

    updater.start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (updater.cycles_completed() < 1 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }

    const auto before = std::chrono::steady_clock::now();
    updater.stop();
    CHECK(std::chrono::steady_clock::now() - before < std::chrono::seconds{2});
    CHECK(updater.cycles_completed() == 1);
}
