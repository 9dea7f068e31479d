#pragma once

/// @file spectral_model.hpp
/// @brief Spectral shapes (blackbody, power law, flat) with a separable normalization.

#include "core/types.hpp"
#include "units/unit_value.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace fluxconv::spectra
{
    /// @brief Thermal spectrum of an ideal radiator (Planck law).
    struct Blackbody
    {
        f64 temperature_k;  ///< Effective temperature [K], must be > 0
    };

    /// @brief F_nu proportional to (nu / nu_ref)^spectral_index.
    struct PowerLaw
    {
        f64 spectral_index;
        units::UnitValue reference_wavelength = units::microns(1.0);  ///< Pivot where the unscaled shape is 1
    };

    /// @brief Constant F_nu (flat in AB magnitude).
    struct FlatSpectrum
    {
    };

    /// @brief Closed set of spectral shapes; add a new alternative to support a new shape.
    using SpectralShape = std::variant<Blackbody, PowerLaw, FlatSpectrum>;

    /// @brief A spectral shape plus a unitless normalization factor.
    ///
    /// The shape is evaluated in a natural unit per alternative:
    /// - Blackbody: PHOTLAM (pi * B_lambda(T), surface flux)
    /// - PowerLaw, FlatSpectrum: FNU
    ///
    /// Instances are immutable; normalize_to() returns a new model that
    /// reproduces a given flux at a given wavelength, and can then be
    /// evaluated at any other wavelength.
    class SpectralModel
    {
    public:
        /// @throws NonPositiveFluxError   temperature or reference wavelength <= 0
        /// @throws IncompatibleUnitsError reference wavelength is not a wavelength/frequency
        explicit SpectralModel(SpectralShape shape, f64 normalization = 1.0);

        [[nodiscard]] static SpectralModel blackbody(f64 temperature_k);
        [[nodiscard]] static SpectralModel power_law(f64 spectral_index,
                                                     const units::UnitValue& reference_wavelength = units::microns(1.0));
        [[nodiscard]] static SpectralModel flat();

        [[nodiscard]] const SpectralShape& shape() const { return m_shape; }
        [[nodiscard]] f64 normalization() const { return m_normalization; }

        /// @brief Unit returned by evaluate(at).
        [[nodiscard]] units::Unit natural_unit() const;

        /// @brief Normalized flux density at a wavelength or frequency, in natural_unit().
        /// @throws IncompatibleUnitsError `at` is not a wavelength or frequency
        /// @throws NonPositiveFluxError   `at` is a non-positive wavelength or negative frequency,
        ///                                or zero frequency for a power law with negative index
        [[nodiscard]] units::UnitValue evaluate(const units::UnitValue& at) const;

        /// @brief evaluate(at) converted to @p unit, using @p at as the conversion context.
        [[nodiscard]] units::UnitValue evaluate(const units::UnitValue& at, units::Unit unit) const;

        /// @brief Shape alone, ignoring the normalization factor.
        [[nodiscard]] units::UnitValue evaluate_unnormalized(const units::UnitValue& at) const;

        /// @brief Copy of this model scaled so that evaluate(at) equals @p target_flux.
        /// @param target_flux Observed flux; converted to natural_unit() at @p at.
        /// @param at          Wavelength or frequency of the observation.
        /// @throws NonPositiveFluxError @p target_flux <= 0, or the unnormalized shape is zero
        ///                              (or not finite) at @p at
        [[nodiscard]] SpectralModel normalize_to(const units::UnitValue& target_flux,
                                                 const units::UnitValue& at) const;

        /// @brief "blackbody", "power-law" or "flat".
        [[nodiscard]] std::string_view name() const;

        /// @brief Name with parameters and normalization, for logs.
        [[nodiscard]] std::string describe() const;

    private:
        SpectralShape m_shape;
        f64 m_normalization;
    };

} // namespace fluxconv::spectra
