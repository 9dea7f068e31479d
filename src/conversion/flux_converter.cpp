/// @file flux_converter.cpp
/// @brief FluxConverter implementation.

#include "conversion/flux_converter.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace fluxconv::conversion
{

using units::Unit;
using units::UnitValue;

namespace
{

constexpr f64 kSameWavelengthTol = 1e-12;  // relative

bool same_wavelength(const UnitValue& a, const UnitValue& b)
{
    const f64 la = a.convert_to(Unit::Angstrom).value();
    const f64 lb = b.convert_to(Unit::Angstrom).value();
    return std::abs(la - lb) <= kSameWavelengthTol * std::max(std::abs(la), std::abs(lb));
}

} // anonymous namespace

ConversionResult FluxConverter::convert(const ConversionRequest& request) const
{
    const UnitValue output_wavelength = request.output_wavelength.value_or(request.input_wavelength);

    std::optional<spectra::SpectralModel> normalized;
    std::optional<UnitValue> output_flux;

    if (request.model)
    {
        normalized = request.model->normalize_to(request.input_flux, request.input_wavelength);
        output_flux = normalized->evaluate(output_wavelength, request.output_unit);
    }
    else
    {
        if (!same_wavelength(request.input_wavelength, output_wavelength))
        {
            throw MissingContextError(fmt::format(
                "moving flux from {} to {} needs a spectral model",
                request.input_wavelength.to_string(), output_wavelength.to_string()));
        }
        output_flux = request.input_flux.convert_to(request.output_unit, request.input_wavelength);
    }

    std::optional<UnitValue> magnitude;
    if (request.magnitude_system)
    {
        const auto& system = m_registry.at(*request.magnitude_system);
        const UnitValue in_zero_point_unit = output_flux->convert_to(system.zero_point.unit(), output_wavelength);
        magnitude = m_registry.flux_to_magnitude(system.name, in_zero_point_unit);
    }

    FCV_CORE_DEBUG("Converted {} at {} -> {} at {}{}{}",
                   request.input_flux.to_string(), request.input_wavelength.to_string(),
                   output_flux->to_string(), output_wavelength.to_string(),
                   normalized ? fmt::format(" via {}", normalized->describe()) : std::string(),
                   magnitude ? fmt::format(" = {:.4f} {}", magnitude->value(), *request.magnitude_system)
                             : std::string());

    return ConversionResult{
        .output_flux       = *output_flux,
        .output_wavelength = output_wavelength,
        .magnitude         = magnitude,
        .normalized_model  = normalized,
    };
}

} // namespace fluxconv::conversion
