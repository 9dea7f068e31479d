#pragma once

/// @file flux_converter.hpp
/// @brief One-shot flux conversion: observed flux -> spectral model -> output flux -> magnitude.

#include "photometry/magnitude_system.hpp"
#include "spectra/spectral_model.hpp"
#include "units/unit_value.hpp"

#include <optional>
#include <string>

namespace fluxconv::conversion
{
    /// @brief Inputs of a single conversion.
    /// Use designated initializers:
    ///   convert({.input_flux = janskys(1e-13), .input_wavelength = microns(1.0), ...});
    struct ConversionRequest
    {
        units::UnitValue input_flux;
        units::UnitValue input_wavelength;
        std::optional<spectra::SpectralModel> model;         ///< Spectral shape; required when wavelengths differ
        std::optional<units::UnitValue> output_wavelength;   ///< Defaults to input_wavelength
        units::Unit output_unit = units::Unit::Fnu;
        std::optional<std::string> magnitude_system;         ///< Registry name, e.g. "AB"
    };

    /// @brief Outputs of a single conversion.
    struct ConversionResult
    {
        units::UnitValue output_flux;
        units::UnitValue output_wavelength;
        std::optional<units::UnitValue> magnitude;
        std::optional<spectra::SpectralModel> normalized_model;
    };

    /// @brief Runs the full conversion chain against a magnitude system registry.
    ///
    /// 1. Normalize the model (if any) to input_flux at input_wavelength.
    /// 2. Evaluate it at output_wavelength, or convert input_flux in place
    ///    when no model is given and the wavelengths coincide.
    /// 3. Express the result in output_unit and, if requested, as a magnitude.
    class FluxConverter
    {
    public:
        explicit FluxConverter(const photometry::MagnitudeSystemRegistry& registry =
                                   photometry::MagnitudeSystemRegistry::global())
            : m_registry(registry)
        {
        }

        /// @throws MissingContextError no model given but output_wavelength differs from input_wavelength
        /// @throws FluxError           any error from the underlying conversions
        [[nodiscard]] ConversionResult convert(const ConversionRequest& request) const;

    private:
        const photometry::MagnitudeSystemRegistry& m_registry;
    };

} // namespace fluxconv::conversion
