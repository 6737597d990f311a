/// @file horizons_parser.cpp
/// @brief Horizons JSON envelope and CSV vector-table parsing.

#include "ephemeris/horizons_parser.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <string>
#include <utility>

namespace orrery::ephemeris
{

namespace
{

constexpr std::string_view kStartMarker = "$$SOE";
constexpr std::string_view kEndMarker   = "$$EOE";
constexpr std::size_t kMinColumns = 5;

} // anonymous namespace

std::string_view to_string(FetchErrorKind kind)
{
    switch (kind)
    {
        case FetchErrorKind::Network:        return "network";
        case FetchErrorKind::HttpStatus:     return "http-status";
        case FetchErrorKind::MalformedJson:  return "malformed-json";
        case FetchErrorKind::ServiceError:   return "service-error";
        case FetchErrorKind::MissingMarkers: return "missing-markers";
        case FetchErrorKind::UnparseableRow: return "unparseable-row";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// Envelope: {"result": "<report>", "error": "<message>"}
// -----------------------------------------------------------------

FetchResult HorizonsParser::parse_response(std::string_view body, std::string_view command)
{
    // Non-throwing parse: a discarded value signals a syntax error
    const auto envelope = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (envelope.is_discarded() || !envelope.is_object())
    {
        return FetchError{FetchErrorKind::MalformedJson, "parse Horizons JSON: not a JSON object"};
    }

    if (const auto it = envelope.find("error"); it != envelope.end() && !it->is_null())
    {
        if (!it->is_string())
        {
            return FetchError{FetchErrorKind::MalformedJson,
                              "parse Horizons JSON: \"error\" is not a string"};
        }
        return FetchError{FetchErrorKind::ServiceError,
                          fmt::format("Horizons error: {}", it->get<std::string>())};
    }

    std::string result_text;
    if (const auto it = envelope.find("result"); it != envelope.end() && !it->is_null())
    {
        if (!it->is_string())
        {
            return FetchError{FetchErrorKind::MalformedJson,
                              "parse Horizons JSON: \"result\" is not a string"};
        }
        result_text = it->get<std::string>();
    }

    auto table = extract_table_lines(result_text);
    if (auto* error = std::get_if<FetchError>(&table))
    {
        return std::move(*error);
    }

    for (const std::string_view line : std::get<TableLines>(table))
    {
        if (auto xyz = parse_xyz_row(line))
        {
            return *xyz;
        }
    }

    return FetchError{FetchErrorKind::UnparseableRow,
                      fmt::format("No parseable vector row for body {}", command)};
}

// -----------------------------------------------------------------
// Table extraction between $$SOE and $$EOE
// -----------------------------------------------------------------

std::variant<TableLines, FetchError>
HorizonsParser::extract_table_lines(std::string_view result_text)
{
    const auto start = result_text.find(kStartMarker);
    if (start == std::string_view::npos)
    {
        return FetchError{FetchErrorKind::MissingMarkers, "Missing $$SOE marker"};
    }
    const auto end = result_text.find(kEndMarker);
    if (end == std::string_view::npos)
    {
        return FetchError{FetchErrorKind::MissingMarkers, "Missing $$EOE marker"};
    }
    if (end <= start)
    {
        return FetchError{FetchErrorKind::MissingMarkers, "$$EOE occurs before $$SOE"};
    }

    const auto body_start = start + kStartMarker.size();
    std::string_view table = result_text.substr(body_start, end - body_start);

    TableLines lines;
    while (!table.empty())
    {
        const auto newline = table.find('\n');
        const std::string_view line = trim(table.substr(0, newline));
        if (!line.empty())
        {
            lines.push_back(line);
        }
        if (newline == std::string_view::npos)
        {
            break;
        }
        table.remove_prefix(newline + 1);
    }

    return lines;
}

// -----------------------------------------------------------------
// CSV row: ..., X, Y, Z,  (trailing comma leaves an empty column)
// -----------------------------------------------------------------

std::optional<Vec3d> HorizonsParser::parse_xyz_row(std::string_view row)
{
    std::vector<std::string_view> columns;
    while (true)
    {
        const auto comma = row.find(',');
        const std::string_view column = trim(row.substr(0, comma));
        if (!column.empty())
        {
            columns.push_back(column);
        }
        if (comma == std::string_view::npos)
        {
            break;
        }
        row.remove_prefix(comma + 1);
    }

    if (columns.size() < kMinColumns)
    {
        return std::nullopt;
    }

    const std::size_t n = columns.size();
    const auto x = parse_f64(columns[n - 3]);
    const auto y = parse_f64(columns[n - 2]);
    const auto z = parse_f64(columns[n - 1]);
    if (!x || !y || !z)
    {
        return std::nullopt;
    }

    return Vec3d{*x, *y, *z};
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

std::string_view HorizonsParser::trim(std::string_view sv)
{
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = sv.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = sv.find_last_not_of(kWhitespace);
    return sv.substr(first, last - first + 1);
}

std::optional<f64> HorizonsParser::parse_f64(std::string_view sv)
{
    // Accept an explicit '+' sign, which from_chars rejects
    if (!sv.empty() && sv.front() == '+')
    {
        sv.remove_prefix(1);
    }
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace orrery::ephemeris
