/// @file spectral_model.cpp
/// @brief Planck, power-law and flat spectra; normalization against an observed flux.

#include "spectra/spectral_model.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <type_traits>
#include <utility>

namespace fluxconv::spectra
{

namespace
{

using units::Unit;
using units::UnitKind;
using units::UnitValue;

void require_spectral_coordinate(const UnitValue& at)
{
    if (!units::is_spectral_coordinate(at.kind()))
    {
        throw IncompatibleUnitsError(fmt::format(
            "spectral models are evaluated at a wavelength or frequency, got {}", at.to_string()));
    }
}

// -----------------------------------------------------------------
// Planck law, surface flux pi * B_lambda(T)
//
//   B_lambda = 2 h c^2 / lambda^5 / (exp(h c / (lambda k T)) - 1)
//
// evaluated in CGS per cm of wavelength, rescaled to per Angstrom
// (FLAM), then expressed as photons: N_lambda = F_lambda lambda / (h c).
// -----------------------------------------------------------------

f64 blackbody_photlam(f64 temperature_k, f64 lambda_ang)
{
    using namespace physical_constants;

    const f64 lambda_cm = lambda_ang * kAngstromToCm;
    const f64 x = (kPlanck * kSpeedOfLightCm) / (lambda_cm * kBoltzmann * temperature_k);

    // expm1 overflows to +inf deep in the Wien tail, giving exactly 0
    const f64 b_lambda_per_cm = 2.0 * kPlanck * kSpeedOfLightCm * kSpeedOfLightCm
                              / std::pow(lambda_cm, 5) / std::expm1(x);

    const f64 flam = kPi * b_lambda_per_cm * kAngstromToCm;
    return flam * lambda_ang / kHcErgAng;
}

f64 power_law_fnu(const PowerLaw& shape, const UnitValue& at)
{
    const f64 nu = at.convert_to(Unit::Hertz).value();
    if (nu < 0.0)
    {
        throw NonPositiveFluxError(fmt::format("power law evaluated at negative frequency {}", at.to_string()));
    }
    if (nu == 0.0 && shape.spectral_index < 0.0)
    {
        throw NonPositiveFluxError(fmt::format(
            "power law with index {} diverges at zero frequency", shape.spectral_index));
    }
    const f64 nu_ref = shape.reference_wavelength.convert_to(Unit::Hertz).value();
    return std::pow(nu / nu_ref, shape.spectral_index);
}

} // anonymous namespace

// =================================================================
// Construction
// =================================================================

SpectralModel::SpectralModel(SpectralShape shape, f64 normalization)
    : m_shape(std::move(shape))
    , m_normalization(normalization)
{
    std::visit([](const auto& s) {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, Blackbody>)
        {
            if (!(s.temperature_k > 0.0))
            {
                throw NonPositiveFluxError(fmt::format(
                    "blackbody temperature must be positive, got {} K", s.temperature_k));
            }
        }
        else if constexpr (std::is_same_v<T, PowerLaw>)
        {
            require_spectral_coordinate(s.reference_wavelength);
            if (!(s.reference_wavelength.value() > 0.0))
            {
                throw NonPositiveFluxError(fmt::format(
                    "power-law reference must be positive, got {}", s.reference_wavelength.to_string()));
            }
        }
    }, m_shape);
}

SpectralModel SpectralModel::blackbody(f64 temperature_k)
{
    return SpectralModel(Blackbody{temperature_k});
}

SpectralModel SpectralModel::power_law(f64 spectral_index, const UnitValue& reference_wavelength)
{
    return SpectralModel(PowerLaw{spectral_index, reference_wavelength});
}

SpectralModel SpectralModel::flat()
{
    return SpectralModel(FlatSpectrum{});
}

// =================================================================
// Evaluation
// =================================================================

Unit SpectralModel::natural_unit() const
{
    return std::holds_alternative<Blackbody>(m_shape) ? Unit::Photlam : Unit::Fnu;
}

UnitValue SpectralModel::evaluate_unnormalized(const UnitValue& at) const
{
    require_spectral_coordinate(at);

    const f64 value = std::visit([&at](const auto& s) -> f64 {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, Blackbody>)
        {
            const f64 lambda_ang = at.convert_to(Unit::Angstrom).value();
            if (!(lambda_ang > 0.0))
            {
                throw NonPositiveFluxError(fmt::format(
                    "blackbody evaluated at non-positive wavelength {}", at.to_string()));
            }
            return blackbody_photlam(s.temperature_k, lambda_ang);
        }
        else if constexpr (std::is_same_v<T, PowerLaw>)
        {
            return power_law_fnu(s, at);
        }
        else
        {
            return 1.0;
        }
    }, m_shape);

    return {value, natural_unit()};
}

UnitValue SpectralModel::evaluate(const UnitValue& at) const
{
    return evaluate_unnormalized(at).multiply(m_normalization);
}

UnitValue SpectralModel::evaluate(const UnitValue& at, Unit unit) const
{
    return evaluate(at).convert_to(unit, at);
}

// =================================================================
// Normalization
// =================================================================

SpectralModel SpectralModel::normalize_to(const UnitValue& target_flux, const UnitValue& at) const
{
    const UnitValue target = target_flux.convert_to(natural_unit(), at);
    if (!(target.value() > 0.0))
    {
        throw NonPositiveFluxError(fmt::format(
            "cannot normalize {} to non-positive flux {}", name(), target_flux.to_string()));
    }

    const UnitValue unscaled = evaluate_unnormalized(at);

    if (!(unscaled.value() > 0.0) || !std::isfinite(unscaled.value()))
    {
        throw NonPositiveFluxError(fmt::format(
            "cannot normalize {}: shape evaluates to {} at {}", name(), unscaled.to_string(), at.to_string()));
    }

    SpectralModel normalized(m_shape, target.divide(unscaled).value());

    FCV_CORE_DEBUG("Normalized {} to {} at {} (factor {:.6e})",
                   name(), target_flux.to_string(), at.to_string(), normalized.m_normalization);

    return normalized;
}

// =================================================================
// Diagnostics
// =================================================================

std::string_view SpectralModel::name() const
{
    return std::visit([](const auto& s) -> std::string_view {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, Blackbody>)
        {
            return "blackbody";
        }
        else if constexpr (std::is_same_v<T, PowerLaw>)
        {
            return "power-law";
        }
        else
        {
            static_assert(std::is_same_v<T, FlatSpectrum>, "unnamed spectral shape");
            return "flat";
        }
    }, m_shape);
}

std::string SpectralModel::describe() const
{
    return std::visit([this](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;

        if constexpr (std::is_same_v<T, Blackbody>)
        {
            return fmt::format("blackbody(T={} K, norm={:.6e})", s.temperature_k, m_normalization);
        }
        else if constexpr (std::is_same_v<T, PowerLaw>)
        {
            return fmt::format("power-law(alpha={}, ref={}, norm={:.6e})",
                               s.spectral_index, s.reference_wavelength.to_string(), m_normalization);
        }
        else
        {
            return fmt::format("flat(norm={:.6e})", m_normalization);
        }
    }, m_shape);
}

} // namespace fluxconv::spectra
