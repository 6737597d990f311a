#pragma once

/// @file updater.hpp
/// @brief Background refresh of body positions into the shared view state.

#include "core/types.hpp"
#include "ephemeris/ephemeris_source.hpp"
#include "solar/view_state.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace orrery::ephemeris
{
    /// @brief Refresh cadence.
    struct UpdaterConfig
    {
        std::chrono::milliseconds request_delay{120};   ///< Pause after each body request
        std::chrono::milliseconds cycle_interval{5000}; ///< Pause after each full pass
        i32 window_minutes = 1;                         ///< Width of the query time window
    };

    /// @brief Periodically fetches every non-Sun body and merges the results.
    ///
    /// One cycle fetches bodies sequentially, then applies all results to the
    /// SharedViewState in a single short critical section. Failed bodies keep
    /// their previous position and the status names the last failure.
    ///
    /// The worker thread is started by start() and joined by stop() or the
    /// destructor. Stopping interrupts the sleeps; an in-flight request is
    /// allowed to finish.
    class EphemerisUpdater
    {
    public:
        /// @brief Clock returning the current time as a Julian Date.
        using Clock = std::function<f64()>;

        EphemerisUpdater(EphemerisSource& source,
                         solar::SharedViewState& state,
                         UpdaterConfig config = {},
                         Clock clock = {});
        ~EphemerisUpdater();

        EphemerisUpdater(const EphemerisUpdater&) = delete;
        EphemerisUpdater& operator=(const EphemerisUpdater&) = delete;

        /// @brief Launch the worker thread. No-op if already running.
        void start();

        /// @brief Request stop and join the worker.
        void stop();

        [[nodiscard]] bool running() const { return m_worker.joinable(); }

        /// @brief Run one full refresh pass on the calling thread and apply it.
        /// @return The update that was applied.
        solar::PositionUpdate run_cycle(std::stop_token stop = {});

        /// @brief Completed cycles since construction.
        [[nodiscard]] u64 cycles_completed() const;

    private:
        void worker_loop(std::stop_token stop);

        /// @brief Sleep for @p duration unless a stop is requested first.
        /// @return false if interrupted.
        bool sleep_for(std::stop_token stop, std::chrono::milliseconds duration);

        EphemerisSource& m_source;
        solar::SharedViewState& m_state;
        UpdaterConfig m_config;
        Clock m_clock;

        mutable std::mutex m_wait_mutex;
        std::condition_variable_any m_wake;
        u64 m_cycles = 0;

        std::jthread m_worker;
    };

} // namespace orrery::ephemeris
