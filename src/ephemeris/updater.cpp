/// @file updater.cpp
/// @brief EphemerisUpdater implementation.

#include "ephemeris/updater.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace orrery::ephemeris
{

EphemerisUpdater::EphemerisUpdater(EphemerisSource& source,
                                   solar::SharedViewState& state,
                                   UpdaterConfig config,
                                   Clock clock)
    : m_source(source)
    , m_state(state)
    , m_config(config)
    , m_clock(clock ? std::move(clock) : Clock{&astro::TimeSystem::now_as_jd})
{
}

EphemerisUpdater::~EphemerisUpdater()
{
    stop();
}

void EphemerisUpdater::start()
{
    if (m_worker.joinable())
    {
        return;
    }

    m_worker = std::jthread([this](std::stop_token stop) { worker_loop(stop); });
    ORR_CORE_INFO("Ephemeris updater started (request delay {} ms, interval {} ms)",
                  m_config.request_delay.count(), m_config.cycle_interval.count());
}

void EphemerisUpdater::stop()
{
    if (!m_worker.joinable())
    {
        return;
    }

    m_worker.request_stop();
    m_wake.notify_all();
    m_worker.join();
    ORR_CORE_INFO("Ephemeris updater stopped after {} cycles", cycles_completed());
}

u64 EphemerisUpdater::cycles_completed() const
{
    std::lock_guard lock(m_wait_mutex);
    return m_cycles;
}

// -----------------------------------------------------------------
// One refresh pass
// -----------------------------------------------------------------

solar::PositionUpdate EphemerisUpdater::run_cycle(std::stop_token stop)
{
    const f64 now_jd = m_clock();

    solar::PositionUpdate update;
    update.timestamp_utc = astro::TimeSystem::format_iso8601(now_jd);
    update.status = "OK";

    const astro::TimeWindow window = astro::TimeSystem::window_from(now_jd, m_config.window_minutes);

    u32 failures = 0;
    for (const auto& body : solar::BodyCatalog::all())
    {
        if (body.id == solar::BodyId::Sun)
        {
            continue;
        }

        FetchResult result = m_source.fetch_position(body, window);
        if (auto* position = std::get_if<Vec3d>(&result))
        {
            update.positions[solar::index_of(body.id)] = *position;
        }
        else
        {
            const auto& error = std::get<FetchError>(result);
            ORR_CORE_WARN("Fetch failed for {} [{}]: {}", body.name, to_string(error.kind), error.detail);
            update.status = fmt::format("Fetch error ({}): {}", body.name, error.detail);
            ++failures;
        }

        if (!sleep_for(stop, m_config.request_delay))
        {
            break;
        }
    }

    // Partial cycles (stop requested mid-pass) still publish what they got
    m_state.apply(update);

    {
        std::lock_guard lock(m_wait_mutex);
        ++m_cycles;
    }

    ORR_CORE_DEBUG("Ephemeris cycle at {}: {} failures", update.timestamp_utc, failures);
    return update;
}

// -----------------------------------------------------------------
// Worker
// -----------------------------------------------------------------

void EphemerisUpdater::worker_loop(std::stop_token stop)
{
    while (!stop.stop_requested())
    {
        run_cycle(stop);

        if (!sleep_for(stop, m_config.cycle_interval))
        {
            break;
        }
    }
}

bool EphemerisUpdater::sleep_for(std::stop_token stop, std::chrono::milliseconds duration)
{
    if (duration.count() <= 0)
    {
        return !stop.stop_requested();
    }

    std::unique_lock lock(m_wait_mutex);
    // Predicate never holds: only a stop request or the timeout ends the wait
    m_wake.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

} // namespace orrery::ephemeris
