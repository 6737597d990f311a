/// @file terminal.cpp
/// @brief ncursesw session implementation.

#include "core/terminal.hpp"

#include "core/logger.hpp"
#include "core/text.hpp"

// curses.h defines function-like macros (clear, erase, refresh, timeout)
// that collide with ordinary member names. Keep it out of headers.
#define NCURSES_NOMACROS
#include <curses.h>

#include <clocale>
#include <cstdio>

namespace orrery::core
{

namespace
{

/// Base curses color for each named color. Light variants add 8 on 16-color terminals.
struct ColorMapping
{
    rendering::Color color;
    short base;
    bool light;
};

constexpr std::array<ColorMapping, rendering::kColorCount - 1> kColorMappings = {{
    {rendering::Color::Red,          COLOR_RED,     false},
    {rendering::Color::Yellow,       COLOR_YELLOW,  false},
    {rendering::Color::Blue,         COLOR_BLUE,    false},
    {rendering::Color::Magenta,      COLOR_MAGENTA, false},
    {rendering::Color::Cyan,         COLOR_CYAN,    false},
    {rendering::Color::DarkGray,     COLOR_BLACK,   true},
    {rendering::Color::LightRed,     COLOR_RED,     true},
    {rendering::Color::LightYellow,  COLOR_YELLOW,  true},
    {rendering::Color::LightBlue,    COLOR_BLUE,    true},
    {rendering::Color::LightMagenta, COLOR_MAGENTA, true},
}};

} // anonymous namespace

Terminal::Terminal(const TerminalConfig& config)
    : m_config{config}
{
    // Wide-character output needs the user's locale before curses starts
    std::setlocale(LC_ALL, "");

    // newterm() reports failure instead of exiting like initscr()
    m_screen = newterm(nullptr, stdout, stdin);
    if (m_screen == nullptr)
    {
        ORR_CORE_CRITICAL("Terminal: newterm failed (TERM unset or not a tty?)");
        return;
    }
    set_term(m_screen);

    cbreak();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    curs_set(0);
    wtimeout(stdscr, static_cast<int>(m_config.input_timeout.count()));
    set_escdelay(25);

    init_colors();
    refresh_size();

    ORR_CORE_INFO("Terminal ready: {}x{} cells, {} colors", m_width, m_height, has_colors() ? COLORS : 0);
}

Terminal::~Terminal()
{
    if (m_screen == nullptr)
    {
        return;
    }

    curs_set(1);
    endwin();
    delscreen(m_screen);
    m_screen = nullptr;
    ORR_CORE_INFO("Terminal restored");
}

void Terminal::init_colors()
{
    if (!has_colors())
    {
        ORR_CORE_WARN("Terminal has no color support; drawing monochrome");
        return;
    }

    start_color();

    short background = COLOR_BLACK;
    if (m_config.use_default_background && use_default_colors() == OK)
    {
        background = -1;
    }

    const bool bright = COLORS >= 16;
    short pair = 1;
    for (const auto& mapping : kColorMappings)
    {
        const short fg = (mapping.light && bright) ? static_cast<short>(mapping.base + 8) : mapping.base;
        if (init_pair(pair, fg, background) == ERR)
        {
            ORR_CORE_WARN("init_pair failed for {}", rendering::color_name(mapping.color));
            continue;
        }

        auto& style = m_styles[static_cast<std::size_t>(mapping.color)];
        style.pair = pair;
        // 8-color fallback: bold for light colors, dim for gray
        style.bold = mapping.light && !bright && mapping.color != rendering::Color::DarkGray;
        style.dim = !bright && mapping.color == rendering::Color::DarkGray;
        ++pair;
    }
}

bool Terminal::should_close() const
{
    return m_should_close;
}

void Terminal::request_close()
{
    m_should_close = true;
}

std::optional<i32> Terminal::poll_key()
{
    if (m_screen == nullptr)
    {
        return std::nullopt;
    }

    const int ch = wgetch(stdscr);
    if (ch == ERR)
    {
        return std::nullopt;
    }

    if (ch == KEY_RESIZE)
    {
        refresh_size();
        m_was_resized = true;
        ORR_CORE_TRACE("Terminal resized: {}x{}", m_width, m_height);
        return std::nullopt;
    }

    return static_cast<i32>(ch);
}

i32 Terminal::get_width() const
{
    return m_width;
}

i32 Terminal::get_height() const
{
    return m_height;
}

bool Terminal::was_resized()
{
    bool resized = m_was_resized;
    m_was_resized = false;
    return resized;
}

void Terminal::refresh_size()
{
    m_width = getmaxx(stdscr);
    m_height = getmaxy(stdscr);
}

// =================================================================
// Drawing
// =================================================================

void Terminal::begin_frame()
{
    werase(stdscr);
}

void Terminal::present()
{
    wnoutrefresh(stdscr);
    doupdate();
}

void Terminal::set_style(std::optional<rendering::Color> color, bool enable)
{
    if (!color.has_value())
    {
        return;
    }

    const auto& style = m_styles[static_cast<std::size_t>(*color)];
    attr_t attrs = COLOR_PAIR(style.pair);
    if (style.bold)
    {
        attrs |= A_BOLD;
    }
    if (style.dim)
    {
        attrs |= A_DIM;
    }

    if (enable)
    {
        wattr_on(stdscr, attrs, nullptr);
    }
    else
    {
        wattr_off(stdscr, attrs, nullptr);
    }
}

void Terminal::draw_box(const Rect& area, std::string_view title)
{
    if (area.width < 2 || area.height < 2)
    {
        return;
    }

    const i32 right = area.x + area.width - 1;
    const i32 bottom = area.y + area.height - 1;

    mvwhline(stdscr, area.y, area.x + 1, ACS_HLINE, area.width - 2);
    mvwhline(stdscr, bottom, area.x + 1, ACS_HLINE, area.width - 2);
    mvwvline(stdscr, area.y + 1, area.x, ACS_VLINE, area.height - 2);
    mvwvline(stdscr, area.y + 1, right, ACS_VLINE, area.height - 2);
    mvwaddch(stdscr, area.y, area.x, ACS_ULCORNER);
    mvwaddch(stdscr, area.y, right, ACS_URCORNER);
    mvwaddch(stdscr, bottom, area.x, ACS_LLCORNER);
    mvwaddch(stdscr, bottom, right, ACS_LRCORNER);

    if (!title.empty())
    {
        draw_text(area.y, area.x + 1, title, std::nullopt, area.width - 2);
    }
}

void Terminal::draw_text(i32 row, i32 col, std::string_view text,
                         std::optional<rendering::Color> color, i32 max_columns)
{
    if (row < 0 || row >= m_height || col < 0 || col >= m_width)
    {
        return;
    }

    i32 limit = m_width - col;
    if (max_columns >= 0 && max_columns < limit)
    {
        limit = max_columns;
    }

    const std::string_view fitted = utf8_truncate(text, limit);
    if (fitted.empty())
    {
        return;
    }

    set_style(color, true);
    mvwaddnstr(stdscr, row, col, fitted.data(), static_cast<int>(fitted.size()));
    set_style(color, false);
}

void Terminal::draw_spans(i32 row, i32 col, const rendering::SpanRow& spans)
{
    i32 x = col;
    for (const auto& span : spans)
    {
        if (span.color.has_value())
        {
            draw_text(row, x, span.text, span.color, 1);
        }
        ++x;
    }
}

} // namespace orrery::core
