/// @file unit_value.cpp
/// @brief UnitValue conversions, magnitudes and dimensional arithmetic.

#include "units/unit_value.hpp"

#include "core/errors.hpp"
#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace fluxconv::units
{

namespace
{

using namespace physical_constants;
using namespace photometric_constants;

// -----------------------------------------------------------------
// Spectral coordinate helpers (canonical: Angstrom, Hz)
// -----------------------------------------------------------------

/// Wavelength in Angstrom of a wavelength or frequency value.
f64 spectral_to_angstrom(f64 value, Unit unit)
{
    const f64 canonical = value * to_canonical_factor(unit).value();
    if (kind_of(unit) == UnitKind::Wavelength)
    {
        return canonical;
    }
    if (!(canonical > 0.0))
    {
        throw NonPositiveFluxError(
            fmt::format("cannot invert non-positive frequency {} {}", value, symbol(unit)));
    }
    return kSpeedOfLightAng / canonical;
}

/// Express a wavelength in Angstrom as a value in a wavelength or frequency unit.
f64 angstrom_to_spectral(f64 angstrom, Unit target)
{
    if (kind_of(target) == UnitKind::Wavelength)
    {
        return angstrom / to_canonical_factor(target).value();
    }
    if (!(angstrom > 0.0))
    {
        throw NonPositiveFluxError(
            fmt::format("cannot invert non-positive wavelength {} Angstrom", angstrom));
    }
    return (kSpeedOfLightAng / angstrom) / to_canonical_factor(target).value();
}

/// Validated context wavelength in Angstrom.
f64 context_angstrom(const UnitValue& context)
{
    if (!is_spectral_coordinate(context.kind()))
    {
        throw IncompatibleUnitsError(fmt::format(
            "conversion context must be a wavelength or frequency, got {}", context.to_string()));
    }
    const f64 angstrom = spectral_to_angstrom(context.value(), context.unit());
    if (!(angstrom > 0.0) || !std::isfinite(angstrom))
    {
        throw NonPositiveFluxError(fmt::format(
            "conversion context must be a positive wavelength, got {}", context.to_string()));
    }
    return angstrom;
}

// -----------------------------------------------------------------
// Flux families: each linear flux kind plus the magnitude tied to it
// -----------------------------------------------------------------

std::optional<UnitKind> flux_family(Unit unit)
{
    if (unit == Unit::ABMag)
    {
        return UnitKind::FluxPerFrequency;
    }
    if (unit == Unit::STMag)
    {
        return UnitKind::FluxPerWavelength;
    }
    const UnitKind kind = kind_of(unit);
    if (is_flux(kind))
    {
        return kind;
    }
    return std::nullopt;
}

/// Value in the family's canonical unit (FNU, FLAM or PHOTLAM).
f64 to_family_canonical(f64 value, Unit unit)
{
    switch (unit)
    {
        case Unit::ABMag:
            return std::pow(10.0, -(value + kAbMagOffset) / kPogson);
        case Unit::STMag:
            return std::pow(10.0, -(value + kStMagOffset) / kPogson);
        default:
            return value * to_canonical_factor(unit).value();
    }
}

f64 from_family_canonical(f64 canonical, Unit target)
{
    if (target == Unit::ABMag || target == Unit::STMag)
    {
        if (!(canonical > 0.0))
        {
            throw NonPositiveFluxError(fmt::format(
                "cannot express non-positive flux {} as {}", canonical, symbol(target)));
        }
        const f64 offset = (target == Unit::ABMag) ? kAbMagOffset : kStMagOffset;
        return -kPogson * std::log10(canonical) - offset;
    }
    return canonical / to_canonical_factor(target).value();
}

// F_lambda = F_nu c / lambda^2 ; N_lambda = F_lambda lambda / (h c)
f64 family_to_flam(f64 canonical, UnitKind family, f64 lambda_ang)
{
    switch (family)
    {
        case UnitKind::FluxPerFrequency:
            return canonical * kSpeedOfLightAng / (lambda_ang * lambda_ang);
        case UnitKind::PhotonFlux:
            return canonical * kHcErgAng / lambda_ang;
        default:
            return canonical;
    }
}

f64 flam_to_family(f64 flam, UnitKind family, f64 lambda_ang)
{
    switch (family)
    {
        case UnitKind::FluxPerFrequency:
            return flam * (lambda_ang * lambda_ang) / kSpeedOfLightAng;
        case UnitKind::PhotonFlux:
            return flam * lambda_ang / kHcErgAng;
        default:
            return flam;
    }
}

} // anonymous namespace

// -----------------------------------------------------------------
// Conversion dispatch on (source, target)
// -----------------------------------------------------------------

UnitValue UnitValue::convert_to(Unit target, const std::optional<UnitValue>& context) const
{
    if (target == m_unit)
    {
        return *this;
    }

    const UnitKind source_kind = kind();
    const UnitKind target_kind = kind_of(target);

    // Same-kind linear rescale (also covers Scalar -> Scalar)
    if (source_kind == target_kind && source_kind != UnitKind::Magnitude)
    {
        const f64 factor = to_canonical_factor(m_unit).value() / to_canonical_factor(target).value();
        return {m_value * factor, target};
    }

    // Wavelength <-> frequency inversion
    if (is_spectral_coordinate(source_kind) && is_spectral_coordinate(target_kind))
    {
        return {angstrom_to_spectral(spectral_to_angstrom(m_value, m_unit), target), target};
    }

    const auto source_family = flux_family(m_unit);
    const auto target_family = flux_family(target);
    if (!source_family || !target_family)
    {
        throw IncompatibleUnitsError(fmt::format(
            "no conversion from {} ({}) to {} ({})",
            symbol(m_unit), kind_name(source_kind), symbol(target), kind_name(target_kind)));
    }

    f64 canonical = to_family_canonical(m_value, m_unit);

    if (*source_family != *target_family)
    {
        if (!context)
        {
            throw MissingContextError(fmt::format(
                "converting {} to {} requires a wavelength or frequency",
                symbol(m_unit), symbol(target)));
        }
        const f64 lambda_ang = context_angstrom(*context);
        canonical = flam_to_family(family_to_flam(canonical, *source_family, lambda_ang),
                                   *target_family, lambda_ang);
    }

    return {from_family_canonical(canonical, target), target};
}

// -----------------------------------------------------------------
// Magnitude against a zero-point
// -----------------------------------------------------------------

UnitValue UnitValue::to_magnitude(const UnitValue& zero_point) const
{
    if (!is_flux(zero_point.kind()))
    {
        throw IncompatibleUnitsError(fmt::format(
            "zero-point must be a flux density, got {}", zero_point.to_string()));
    }
    if (!(zero_point.value() > 0.0))
    {
        throw NonPositiveFluxError(fmt::format(
            "zero-point flux must be positive, got {}", zero_point.to_string()));
    }

    const UnitValue flux = convert_to(zero_point.unit());
    if (!(flux.value() > 0.0))
    {
        throw NonPositiveFluxError(fmt::format(
            "magnitude undefined for non-positive flux {}", to_string()));
    }

    return {-photometric_constants::kPogson * std::log10(flux.value() / zero_point.value()), Unit::Mag};
}

// -----------------------------------------------------------------
// Arithmetic
// -----------------------------------------------------------------

UnitValue UnitValue::multiply(const UnitValue& other) const
{
    const UnitKind lhs = kind();
    const UnitKind rhs = other.kind();

    if (rhs == UnitKind::Dimensionless && lhs != UnitKind::Magnitude)
    {
        return {m_value * other.m_value, m_unit};
    }
    if (lhs == UnitKind::Dimensionless && rhs != UnitKind::Magnitude)
    {
        return {m_value * other.m_value, other.m_unit};
    }
    if (is_flux(lhs) && is_flux(rhs))
    {
        throw IncompatibleUnitsError(fmt::format(
            "product of two flux densities is undefined: {} * {}", to_string(), other.to_string()));
    }
    throw IncompatibleUnitsError(fmt::format(
        "product {} * {} has no representable unit", to_string(), other.to_string()));
}

UnitValue UnitValue::multiply(f64 factor) const
{
    return multiply(scalar(factor));
}

UnitValue UnitValue::divide(const UnitValue& other) const
{
    const UnitKind lhs = kind();
    const UnitKind rhs = other.kind();

    if (rhs == UnitKind::Dimensionless && lhs != UnitKind::Magnitude)
    {
        if (other.m_value == 0.0)
        {
            throw NonPositiveFluxError(fmt::format("division of {} by zero", to_string()));
        }
        return {m_value / other.m_value, m_unit};
    }

    // Same kind, or wavelength over frequency (divisor inverted into our unit)
    const bool spectral_pair = is_spectral_coordinate(lhs) && is_spectral_coordinate(rhs);
    if ((lhs == rhs && lhs != UnitKind::Magnitude) || spectral_pair)
    {
        const UnitValue divisor = other.convert_to(m_unit);
        if (divisor.m_value == 0.0)
        {
            throw NonPositiveFluxError(fmt::format(
                "division of {} by zero {}", to_string(), other.to_string()));
        }
        return {m_value / divisor.m_value, Unit::Scalar};
    }

    throw IncompatibleUnitsError(fmt::format(
        "quotient {} / {} has no representable unit", to_string(), other.to_string()));
}

UnitValue UnitValue::divide(f64 divisor) const
{
    return divide(scalar(divisor));
}

std::string UnitValue::to_string() const
{
    if (m_unit == Unit::Scalar)
    {
        return fmt::format("{:.6g}", m_value);
    }
    return fmt::format("{:.6g} {}", m_value, symbol(m_unit));
}

} // namespace fluxconv::units
