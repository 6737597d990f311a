/// @file application.cpp
/// @brief Application implementation: init, main loop, frame drawing, shutdown.

#include "core/application.hpp"

#include "core/logger.hpp"
#include "ephemeris/horizons_client.hpp"
#include "rendering/frame_composer.hpp"
#include "rendering/orbit_map.hpp"

#include <algorithm>
#include <utility>

namespace orrery::core
{

Application::Application(const AppConfig& config)
    : Application(config, std::make_unique<ephemeris::HorizonsClient>(config.horizons_config()))
{
}

Application::Application(const AppConfig& config, std::unique_ptr<ephemeris::EphemerisSource> source)
    : m_config{config}
    , m_source{std::move(source)}
{
    init();
}

Application::~Application()
{
    shutdown();
}

bool Application::ready() const
{
    return m_terminal && m_terminal->ready();
}

void Application::run()
{
    ORR_CORE_INFO("Entering main loop...");
    main_loop();
    ORR_CORE_INFO("Main loop exited");
}

// =================================================================
// Initialization
// =================================================================

void Application::init()
{
    // 1. Terminal
    m_terminal = std::make_unique<Terminal>(m_config.terminal_config());
    if (!m_terminal->ready())
    {
        return;
    }

    // 2. Input
    m_input = std::make_unique<Input>();

    // 3. Shared view state
    solar::ViewState initial;
    initial.icon_style = m_config.icon_style;
    m_state = std::make_unique<solar::SharedViewState>(std::move(initial));

    // 4. Background updater (first cycle starts immediately)
    m_updater = std::make_unique<ephemeris::EphemerisUpdater>(
        *m_source, *m_state, m_config.updater_config());
    m_updater->start();

    ORR_INFO("Orrery started ({} icons, refresh every {} s)",
             m_config.icon_style == solar::IconStyle::Unicode ? "unicode" : "nerd-font",
             m_config.refresh_interval.count());
}

// =================================================================
// Shutdown
// =================================================================

void Application::shutdown()
{
    // Join the worker before anything it references goes away
    if (m_updater)
    {
        m_updater->stop();
        m_updater.reset();
    }

    m_input.reset();
    m_terminal.reset();
    ORR_INFO("Orrery stopped");
}

// =================================================================
// Main loop
// =================================================================

void Application::main_loop()
{
    while (!m_terminal->should_close())
    {
        // -----------------------------------------------------------------
        // 1. Draw from a fresh snapshot
        // -----------------------------------------------------------------
        draw_frame();

        // -----------------------------------------------------------------
        // 2. Collect keys (first poll blocks up to the input timeout)
        // -----------------------------------------------------------------
        m_input->new_frame();
        while (auto key = m_terminal->poll_key())
        {
            m_input->process_key(*key);
        }

        if (m_terminal->was_resized())
        {
            ORR_CORE_DEBUG("Relayout at {}x{}", m_terminal->get_width(), m_terminal->get_height());
        }

        // -----------------------------------------------------------------
        // 3. Keys → view changes
        // -----------------------------------------------------------------
        process_input();
    }
}

// =================================================================
// Input processing — translates Input state to ViewState changes
// =================================================================

bool Application::apply_control(solar::ViewState& view, ControlAction action)
{
    switch (action)
    {
        case ControlAction::ZoomIn:    view.zoom_in();    return true;
        case ControlAction::ZoomOut:   view.zoom_out();   return true;
        case ControlAction::ResetView: view.reset_view(); return true;
        case ControlAction::FocusIn:   view.focus_in();   return true;
        case ControlAction::FocusOut:  view.focus_out();  return true;
        case ControlAction::Quit:      return false;
    }
    return false;
}

void Application::process_input()
{
    for (const ControlAction action : m_input->actions())
    {
        if (action == ControlAction::Quit)
        {
            m_terminal->request_close();
            ORR_INFO("Quit requested");
            return;
        }

        f64 zoom = 0.0;
        std::string_view focus;
        m_state->modify([&](solar::ViewState& view) {
            apply_control(view, action);
            zoom = view.zoom;
            focus = view.focus().name;
        });
        ORR_INFO("{}: zoom {:.2f}x, focus {}", to_string(action), zoom, focus);
    }
}

// =================================================================
// Frame drawing
// =================================================================

void Application::draw_frame()
{
    const solar::ViewState view = m_state->snapshot();
    const auto layout = rendering::FrameLayout::compute(m_terminal->get_width(),
                                                        m_terminal->get_height());

    m_terminal->begin_frame();
    draw_header(layout.header, view);
    draw_table(layout.table, view);
    draw_map(layout.map, view);
    m_terminal->present();
}

void Application::draw_header(const Rect& panel, const solar::ViewState& view)
{
    m_terminal->draw_box(panel, rendering::FrameComposer::kHeaderTitle);
    const Rect inside = rendering::FrameLayout::interior(panel);
    m_terminal->draw_text(inside.y, inside.x, rendering::FrameComposer::format_header(view),
                          std::nullopt, inside.width);
}

void Application::draw_table(const Rect& panel, const solar::ViewState& view)
{
    using rendering::FrameComposer;

    m_terminal->draw_box(panel, FrameComposer::kTableTitle);
    const Rect inside = rendering::FrameLayout::interior(panel);

    m_terminal->draw_text(inside.y, inside.x, FrameComposer::format_column_headers(),
                          std::nullopt, inside.width);

    i32 row = inside.y + 1;
    for (const auto& readout : FrameComposer::readout_rows(view))
    {
        if (row >= inside.y + inside.height)
        {
            break;
        }

        const auto cell = [&](std::size_t column, std::string_view text,
                              std::optional<rendering::Color> color = std::nullopt) {
            const i32 offset = FrameComposer::column_offset(column);
            const i32 room = std::min(FrameComposer::kColumnWidths[column], inside.width - offset);
            if (room > 0)
            {
                m_terminal->draw_text(row, inside.x + offset, text, color, room);
            }
        };

        cell(0, readout.icon, readout.color);
        cell(1, readout.name);
        cell(2, readout.x);
        cell(3, readout.y);
        cell(4, readout.z);
        cell(5, readout.r);
        ++row;
    }
}

void Application::draw_map(const Rect& panel, const solar::ViewState& view)
{
    m_terminal->draw_box(panel, rendering::FrameComposer::kMapTitle);
    const Rect inside = rendering::FrameLayout::interior(panel);

    const auto rows = rendering::OrbitMap::render_rows(inside.width, inside.height, view);
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        m_terminal->draw_spans(inside.y + static_cast<i32>(i), inside.x, rows[i]);
    }
}

} // namespace orrery::core
