#pragma once

/// @file view_state.hpp
/// @brief View state read by the renderer, and its lock-guarded shared holder.

#include "core/types.hpp"
#include "solar/body_catalog.hpp"

#include <array>
#include <mutex>
#include <optional>
#include <string>

namespace orrery::solar
{
    using PositionTable = std::array<std::optional<Vec3d>, kBodyCount>;

    /// @brief Result of one ephemeris refresh cycle.
    ///
    /// A body whose fetch failed is left as std::nullopt in @c positions, which
    /// means "keep whatever was known", not "forget it".
    struct PositionUpdate
    {
        PositionTable positions;
        std::string timestamp_utc;
        std::string status;
    };

    /// @brief Everything one frame needs: positions, zoom/focus, icon style, status text.
    ///
    /// A plain value type. The renderer receives a copy per frame; only input
    /// handling and the ephemeris updater mutate the shared instance.
    struct ViewState
    {
        static constexpr f64 kMinZoom     = 0.2;
        static constexpr f64 kMaxZoom     = 50.0;
        static constexpr f64 kZoomStep    = 1.25;
        static constexpr f64 kDefaultZoom = 1.0;

        PositionTable positions = initial_positions();
        std::optional<std::string> last_update_utc;
        std::string status = "Starting…";
        IconStyle icon_style = IconStyle::NerdFont;
        f64 zoom = kDefaultZoom;
        std::size_t focus_index = BodyCatalog::outermost_focus_index();

        [[nodiscard]] const FocusLevel& focus() const;
        [[nodiscard]] const std::optional<Vec3d>& position(BodyId id) const;

        /// @brief Set zoom, clamped to [kMinZoom, kMaxZoom].
        void set_zoom(f64 value);
        void zoom_in();
        void zoom_out();

        /// @brief Step focus by one level, clamped to the table bounds.
        void focus_in();
        void focus_out();

        /// @brief Zoom back to 1.0 and focus back to the outermost level.
        void reset_view();

        /// @brief Merge a refresh cycle: new vectors replace old ones, failures keep
        /// the old value, the Sun stays at the origin.
        void merge(const PositionUpdate& update);

        [[nodiscard]] static f64 clamp_zoom(f64 value);

        /// @brief All unknown except the Sun, which is fixed at the origin.
        [[nodiscard]] static PositionTable initial_positions();
    };

    /// @brief Mutex-guarded ViewState shared by the render loop and the updater.
    ///
    /// Readers only ever get a copy; writers pass a callable that runs inside
    /// the critical section. The lock never leaves this class.
    class SharedViewState
    {
    public:
        explicit SharedViewState(ViewState initial = {});

        SharedViewState(const SharedViewState&) = delete;
        SharedViewState& operator=(const SharedViewState&) = delete;

        [[nodiscard]] ViewState snapshot() const;

        /// @brief Run @p fn on the shared state under the lock. Keep @p fn short.
        template <typename Fn>
        void modify(Fn&& fn)
        {
            std::lock_guard lock(m_mutex);
            fn(m_state);
        }

        void apply(const PositionUpdate& update);

    private:
        mutable std::mutex m_mutex;
        ViewState m_state;
    };

} // namespace orrery::solar
