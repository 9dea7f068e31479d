#pragma once

/// @file zero_point_loader.hpp
/// @brief Loads user-defined magnitude systems from CSV files.

#include "core/types.hpp"
#include "photometry/magnitude_system.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace fluxconv::photometry
{
    /// @brief Static utility class for loading zero-point tables.
    class ZeroPointLoader
    {
    public:
        ZeroPointLoader() = delete;

        /// @brief Load magnitude systems from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   name, zero_point, unit, ref_wavelength_um
        ///
        /// `unit` is a flux-density symbol accepted by units::parse_unit()
        /// ("Jy", "FNU", "FLAM", ...). `ref_wavelength_um` may be left empty
        /// for systems whose zero-point is not wavelength-specific.
        /// Lines that fail to parse are skipped with a warning.
        ///
        /// @param path Path to the CSV file.
        /// @return Parsed systems on success, std::nullopt if the file is
        ///         missing, empty, or contains no valid rows.
        [[nodiscard]] static std::optional<std::vector<MagnitudeSystem>>
            load_csv(const std::filesystem::path& path);

        /// @brief Register every system into @p registry.
        /// Duplicates and invalid zero-points are logged and skipped.
        /// @return Number of systems registered.
        static std::size_t register_all(const std::vector<MagnitudeSystem>& systems,
                                        MagnitudeSystemRegistry& registry);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace fluxconv::photometry
