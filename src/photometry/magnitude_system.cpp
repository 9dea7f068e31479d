/// @file magnitude_system.cpp
/// @brief MagnitudeSystemRegistry implementation.

#include "photometry/magnitude_system.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace fluxconv::photometry
{

using units::Unit;
using units::UnitKind;
using units::UnitValue;

MagnitudeSystemRegistry& MagnitudeSystemRegistry::global()
{
    static MagnitudeSystemRegistry instance = [] {
        MagnitudeSystemRegistry registry;
        registry.register_builtin_systems();
        return registry;
    }();
    return instance;
}

// -----------------------------------------------------------------
// AB: m = -2.5 log10(F_nu) - 48.60     (zero-point ~3631 Jy)
// ST: m = -2.5 log10(F_lambda) - 21.10
// -----------------------------------------------------------------

void MagnitudeSystemRegistry::register_builtin_systems()
{
    using namespace photometric_constants;

    register_system("AB", UnitValue(std::pow(10.0, -kAbMagOffset / kPogson), Unit::Fnu));
    register_system("ST", UnitValue(std::pow(10.0, -kStMagOffset / kPogson), Unit::Flam));
}

void MagnitudeSystemRegistry::register_system(const std::string& name,
                                              const UnitValue& zero_point,
                                              const std::optional<UnitValue>& reference_wavelength)
{
    if (m_systems.contains(name))
    {
        throw DuplicateSystemError(fmt::format("magnitude system '{}' is already registered", name));
    }
    if (!units::is_flux(zero_point.kind()))
    {
        throw IncompatibleUnitsError(fmt::format(
            "zero-point of '{}' must be a linear flux density, got {}", name, zero_point.to_string()));
    }
    if (!(zero_point.value() > 0.0))
    {
        throw NonPositiveFluxError(fmt::format(
            "zero-point of '{}' must be positive, got {}", name, zero_point.to_string()));
    }
    if (reference_wavelength && !units::is_spectral_coordinate(reference_wavelength->kind()))
    {
        throw IncompatibleUnitsError(fmt::format(
            "reference of '{}' must be a wavelength or frequency, got {}",
            name, reference_wavelength->to_string()));
    }
    if (reference_wavelength && !(reference_wavelength->value() > 0.0))
    {
        throw NonPositiveFluxError(fmt::format(
            "reference of '{}' must be positive, got {}", name, reference_wavelength->to_string()));
    }

    m_systems.emplace(name, MagnitudeSystem{name, zero_point, reference_wavelength});

    FCV_CORE_DEBUG("Registered magnitude system '{}': zero-point {}{}", name, zero_point.to_string(),
                   reference_wavelength ? fmt::format(" at {}", reference_wavelength->to_string()) : "");
}

void MagnitudeSystemRegistry::register_system(const MagnitudeSystem& system)
{
    register_system(system.name, system.zero_point, system.reference_wavelength);
}

// -----------------------------------------------------------------
// Conversions
// -----------------------------------------------------------------

UnitValue MagnitudeSystemRegistry::flux_to_magnitude(const std::string& name, const UnitValue& flux) const
{
    const MagnitudeSystem& system = at(name);
    const UnitValue converted = flux.convert_to(system.zero_point.unit(), system.reference_wavelength);
    return converted.to_magnitude(system.zero_point);
}

UnitValue MagnitudeSystemRegistry::magnitude_to_flux(const std::string& name, const UnitValue& magnitude) const
{
    const MagnitudeSystem& system = at(name);
    if (magnitude.unit() != Unit::Mag && magnitude.kind() != UnitKind::Dimensionless)
    {
        throw IncompatibleUnitsError(fmt::format(
            "expected a magnitude on '{}', got {}", name, magnitude.to_string()));
    }
    const f64 scale = std::pow(10.0, -magnitude.value() / photometric_constants::kPogson);
    return system.zero_point.multiply(scale);
}

// -----------------------------------------------------------------
// Lookup
// -----------------------------------------------------------------

const MagnitudeSystem* MagnitudeSystemRegistry::find(const std::string& name) const
{
    const auto it = m_systems.find(name);
    return (it != m_systems.end()) ? &it->second : nullptr;
}

const MagnitudeSystem& MagnitudeSystemRegistry::at(const std::string& name) const
{
    const MagnitudeSystem* system = find(name);
    if (system == nullptr)
    {
        throw UnknownSystemError(fmt::format("magnitude system '{}' is not registered", name));
    }
    return *system;
}

bool MagnitudeSystemRegistry::contains(const std::string& name) const
{
    return m_systems.contains(name);
}

std::vector<std::string> MagnitudeSystemRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(m_systems.size());
    for (const auto& [name, system] : m_systems)
    {
        result.push_back(name);
    }
    return result;
}

} // namespace fluxconv::photometry
