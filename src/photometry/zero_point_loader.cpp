/// @file zero_point_loader.cpp
/// @brief Implementation of the CSV zero-point table loader.

#include "photometry/zero_point_loader.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "units/unit.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace fluxconv::photometry
{

using units::Unit;
using units::UnitValue;

// -----------------------------------------------------------------
// Load zero-point CSV: name,zero_point,unit,ref_wavelength_um
// -----------------------------------------------------------------

std::optional<std::vector<MagnitudeSystem>>
ZeroPointLoader::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        FCV_CORE_ERROR("ZeroPointLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::vector<MagnitudeSystem> systems;
    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        FCV_CORE_ERROR("ZeroPointLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty() || trim(line).front() == '#')
        {
            continue;
        }

        std::istringstream stream(line);
        std::string name_str;
        std::string zp_str;
        std::string unit_str;
        std::string ref_str;

        if (!std::getline(stream, name_str, ',') ||
            !std::getline(stream, zp_str, ',') ||
            !std::getline(stream, unit_str, ','))
        {
            FCV_CORE_WARN("ZeroPointLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }
        if (!std::getline(stream, ref_str))
        {
            ref_str.clear();  // optional trailing column
        }

        const std::string_view name = trim(name_str);
        const auto zero_point = parse_f64(trim(zp_str));
        const auto unit = units::parse_unit(trim(unit_str));

        if (name.empty() || !zero_point || !unit || !units::is_flux(units::kind_of(*unit)))
        {
            FCV_CORE_WARN("ZeroPointLoader: Failed to parse values on line {}: {}",
                          line_number, line);
            ++skipped;
            continue;
        }

        std::optional<UnitValue> reference;
        if (!trim(ref_str).empty())
        {
            const auto ref_um = parse_f64(trim(ref_str));
            if (!ref_um)
            {
                FCV_CORE_WARN("ZeroPointLoader: Bad reference wavelength on line {}: {}",
                              line_number, line);
                ++skipped;
                continue;
            }
            reference = units::microns(*ref_um);
        }

        systems.push_back(MagnitudeSystem{
            .name                 = std::string(name),
            .zero_point           = UnitValue(*zero_point, *unit),
            .reference_wavelength = reference,
        });
    }

    if (systems.empty())
    {
        FCV_CORE_ERROR("ZeroPointLoader: No valid systems found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        FCV_CORE_WARN("ZeroPointLoader: Skipped {} malformed lines", skipped);
    }

    FCV_CORE_INFO("ZeroPointLoader: Loaded {} systems from {}", systems.size(), path.string());

    return systems;
}

// -----------------------------------------------------------------
// Registration
// -----------------------------------------------------------------

std::size_t ZeroPointLoader::register_all(const std::vector<MagnitudeSystem>& systems,
                                          MagnitudeSystemRegistry& registry)
{
    std::size_t registered = 0;
    for (const auto& system : systems)
    {
        try
        {
            registry.register_system(system);
            ++registered;
        }
        catch (const FluxError& e)
        {
            FCV_CORE_WARN("ZeroPointLoader: Skipping '{}': {}", system.name, e.what());
        }
    }
    return registered;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view ZeroPointLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> ZeroPointLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace fluxconv::photometry
