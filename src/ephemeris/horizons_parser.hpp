#pragma once

/// @file horizons_parser.hpp
/// @brief Parsing of Horizons API vector-table responses.

#include "core/types.hpp"
#include "ephemeris/ephemeris_source.hpp"

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace orrery::ephemeris
{
    using TableLines = std::vector<std::string_view>;

    /// @brief Static helpers for the Horizons "format=json" + "CSV_FORMAT=YES" response.
    ///
    /// The response is a JSON envelope {"result": "...", "error": "..."} whose
    /// "result" string embeds a plain-text report. The vector table sits between
    /// the $$SOE and $$EOE markers, one CSV row per epoch:
    ///   JDTDB, Calendar Date (TDB), X, Y, Z,
    class HorizonsParser
    {
    public:
        HorizonsParser() = delete;

        /// @brief Full pipeline: envelope → table → first parseable row.
        /// @param body Raw HTTP response body.
        /// @param command Horizons COMMAND used for the request (for messages).
        [[nodiscard]] static FetchResult parse_response(std::string_view body,
                                                        std::string_view command);

        /// @brief Non-empty trimmed lines strictly between $$SOE and $$EOE.
        /// @return The lines (views into @p result_text), or a MissingMarkers error.
        [[nodiscard]] static std::variant<TableLines, FetchError>
            extract_table_lines(std::string_view result_text);

        /// @brief Take x, y, z from the last three non-empty columns of a CSV row.
        /// @return std::nullopt if there are fewer than 5 columns or a value fails to parse.
        [[nodiscard]] static std::optional<Vec3d> parse_xyz_row(std::string_view row);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a whole field as f64 (optional leading '+').
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace orrery::ephemeris
