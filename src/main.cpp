// src/main.cpp - FluxConv demo entry point
//
// Reproduces the worked examples of the flux conversion form:
//  1. Jy at 1 micron -> AB magnitude
//  2. Blackbody normalized to a photon flux -> FNU at another wavelength
//  3. Power law in W/m^2/Hz -> magnitude on a custom I-band system

#include "conversion/flux_converter.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "photometry/magnitude_system.hpp"
#include "photometry/zero_point_loader.hpp"
#include "spectra/spectral_model.hpp"
#include "units/unit_value.hpp"

#include <cstdlib>
#include <filesystem>

using namespace fluxconv;
using namespace fluxconv::units;

namespace
{

std::filesystem::path data_path()
{
    const char* env = std::getenv("FLUXCONV_DATA_PATH");
    return (env != nullptr) ? std::filesystem::path(env) : std::filesystem::path("data");
}

} // anonymous namespace

int main()
{
    core::Logger::init({.level = spdlog::level::info});

    // -----------------------------------------------------------------------
    // 1. Magnitude systems: AB/ST built in, custom systems from the data table
    // -----------------------------------------------------------------------
    auto& registry = photometry::MagnitudeSystemRegistry::global();

    const auto table = data_path() / "photometry" / "zero_points.csv";
    if (auto systems = photometry::ZeroPointLoader::load_csv(table))
    {
        photometry::ZeroPointLoader::register_all(*systems, registry);
    }
    else
    {
        FCV_WARN("No zero-point table at {}; registering the I system inline", table.string());
        registry.register_system("I", janskys(2250.0), microns(0.90));
    }

    const conversion::FluxConverter converter(registry);

    try
    {
        // -------------------------------------------------------------------
        // 2. 1e-13 Jy at 1 micron -> AB magnitude
        // -------------------------------------------------------------------
        const auto ab = converter.convert({
            .input_flux       = janskys(1.0e-13),
            .input_wavelength = microns(1.0),
            .output_unit      = Unit::Jansky,
            .magnitude_system = "AB",
        });
        FCV_INFO("Example 1: 1e-13 Jy at 1 um = {:.2f} AB mag", ab.magnitude->value());

        // -------------------------------------------------------------------
        // 3. 5500 K blackbody, 1 PHOTLAM at 0.5 um -> FNU at 0.6 um
        // -------------------------------------------------------------------
        const auto bb = converter.convert({
            .input_flux        = UnitValue(1.0, Unit::Photlam),
            .input_wavelength  = microns(0.5),
            .model             = spectra::SpectralModel::blackbody(5500.0),
            .output_wavelength = microns(0.6),
            .output_unit       = Unit::Fnu,
        });
        FCV_INFO("Example 2: {} -> {} at 0.6 um", bb.normalized_model->describe(), bb.output_flux.to_string());

        // -------------------------------------------------------------------
        // 4. Power law alpha = 0.25, 1e-23 W/m^2/Hz at 1 um -> I mag at 0.9 um
        // -------------------------------------------------------------------
        const auto pl = converter.convert({
            .input_flux        = UnitValue(1.0e-23, Unit::WattPerSqMeterPerHertz),
            .input_wavelength  = microns(1.0),
            .model             = spectra::SpectralModel::power_law(0.25),
            .output_wavelength = microns(0.9),
            .output_unit       = Unit::Jansky,
            .magnitude_system  = "I",
        });
        FCV_INFO("Example 3: {} at 0.9 um = {:.2f} I mag", pl.output_flux.to_string(), pl.magnitude->value());
    }
    catch (const FluxError& e)
    {
        FCV_ERROR("Conversion failed: {}", e.what());
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
