/// @file test_spectral_model.cpp
/// @brief Unit tests for fluxconv::spectra::SpectralModel.
///
/// Verifies normalization, Planck-law shape, power-law monotonicity and the
/// degenerate cases that must raise instead of dividing by zero.

#include <doctest/doctest.h>

#include "core/errors.hpp"
#include "core/types.hpp"
#include "spectra/spectral_model.hpp"
#include "units/unit_value.hpp"

#include <array>
#include <cmath>
#include <variant>

using namespace fluxconv;
using namespace fluxconv::spectra;
using namespace fluxconv::units;

static constexpr f64 kRelTol = 1e-9;

// =================================================================
// Natural units and construction
// =================================================================

TEST_CASE("Natural units per shape")
{
    CHECK(SpectralModel::blackbody(5500.0).natural_unit() == Unit::Photlam);
    CHECK(SpectralModel::power_law(-0.7).natural_unit() == Unit::Fnu);
    CHECK(SpectralModel::flat().natural_unit() == Unit::Fnu);

    CHECK(SpectralModel::blackbody(5500.0).normalization() == 1.0);
    CHECK(std::holds_alternative<PowerLaw>(SpectralModel::power_law(1.0).shape()));
    CHECK(SpectralModel::blackbody(5500.0).name() == "blackbody");
    CHECK(SpectralModel::power_law(1.0).name() == "power-law");
    CHECK(SpectralModel::flat().name() == "flat");
}

TEST_CASE("Invalid shape parameters are rejected")
{
    CHECK_THROWS_AS((void)SpectralModel::blackbody(0.0), NonPositiveFluxError);
    CHECK_THROWS_AS((void)SpectralModel::blackbody(-100.0), NonPositiveFluxError);
    CHECK_THROWS_AS((void)SpectralModel::power_law(1.0, microns(0.0)), NonPositiveFluxError);
    CHECK_THROWS_AS((void)SpectralModel::power_law(1.0, janskys(1.0)), IncompatibleUnitsError);
}

TEST_CASE("Evaluation needs a wavelength or frequency")
{
    const auto bb = SpectralModel::blackbody(5500.0);
    CHECK_THROWS_AS((void)bb.evaluate(janskys(1.0)), IncompatibleUnitsError);
    CHECK_THROWS_AS((void)bb.evaluate(microns(0.0)), NonPositiveFluxError);
    CHECK_THROWS_AS((void)SpectralModel::power_law(1.0).evaluate(microns(-1.0)), NonPositiveFluxError);
}

// =================================================================
// Normalization: m.normalize_to(f, w).evaluate(w) == f
// =================================================================

TEST_CASE("Normalized model reproduces the target flux at the target wavelength")
{
    const std::array models = {
        SpectralModel::blackbody(3000.0),
        SpectralModel::blackbody(20000.0),
        SpectralModel::power_law(0.25),
        SpectralModel::power_law(-2.0, angstroms(5500.0)),
        SpectralModel::flat(),
    };
    const std::array targets = {
        janskys(1.0e-13),
        UnitValue(3.2e-15, Unit::Flam),
        UnitValue(1.0, Unit::Photlam),
        UnitValue(1.0e-23, Unit::WattPerSqMeterPerHertz),
    };
    const std::array wavelengths = {
        microns(0.35),
        microns(1.0),
        UnitValue(230.0, Unit::Gigahertz),
    };

    for (const auto& model : models)
    {
        for (const auto& target : targets)
        {
            for (const auto& at : wavelengths)
            {
                CAPTURE(model.describe());
                CAPTURE(target.to_string());
                CAPTURE(at.to_string());

                const auto normalized = model.normalize_to(target, at);
                const auto flux = normalized.evaluate(at, target.unit());
                CHECK(flux.value() / target.value() == doctest::Approx(1.0).epsilon(kRelTol));
            }
        }
    }
}

TEST_CASE("Normalizing twice does not compound the factor")
{
    const auto once = SpectralModel::blackbody(5500.0).normalize_to(janskys(2.0), microns(0.8));
    const auto twice = once.normalize_to(janskys(2.0), microns(0.8));
    CHECK(twice.normalization() == doctest::Approx(once.normalization()).epsilon(kRelTol));
}

TEST_CASE("Normalizing to a non-positive flux is rejected")
{
    const auto model = SpectralModel::power_law(1.0);
    CHECK_THROWS_AS((void)model.normalize_to(janskys(-5.0), microns(2.0)), NonPositiveFluxError);
    CHECK_THROWS_AS((void)model.normalize_to(janskys(0.0), microns(2.0)), NonPositiveFluxError);
    CHECK_THROWS_AS((void)SpectralModel::blackbody(5500.0).normalize_to(UnitValue(-1.0, Unit::Flam), microns(0.5)),
                    NonPositiveFluxError);
}

TEST_CASE("normalize_to leaves the receiver untouched")
{
    const auto model = SpectralModel::power_law(1.0);
    const auto normalized = model.normalize_to(janskys(5.0), microns(2.0));
    CHECK(model.normalization() == 1.0);
    CHECK(normalized.normalization() != 1.0);
}

// =================================================================
// Blackbody shape
// =================================================================

TEST_CASE("Blackbody 5500 K, 1 PHOTLAM at 0.5 um -> 4.62e-23 FNU at 0.6 um")
{
    const auto model = SpectralModel::blackbody(5500.0)
                           .normalize_to(UnitValue(1.0, Unit::Photlam), microns(0.5));
    const auto fnu = model.evaluate(microns(0.6), Unit::Fnu);

    CHECK(fnu.unit() == Unit::Fnu);
    CHECK(fnu.value() / 4.62e-23 == doctest::Approx(1.0).epsilon(0.01));
}

TEST_CASE("Blackbody follows Rayleigh-Jeans F_nu ~ nu^2 at long wavelengths")
{
    const auto model = SpectralModel::blackbody(5500.0);
    const auto at_1cm = model.evaluate(UnitValue(1.0, Unit::Centimeter), Unit::Fnu);
    const auto at_2cm = model.evaluate(UnitValue(2.0, Unit::Centimeter), Unit::Fnu);
    CHECK(at_1cm.value() / at_2cm.value() == doctest::Approx(4.0).epsilon(1e-3));
}

TEST_CASE("Blackbody gives the same flux for a wavelength and its frequency")
{
    const auto model = SpectralModel::blackbody(8000.0);
    const auto by_wavelength = model.evaluate(microns(0.7));
    const auto by_frequency = model.evaluate(microns(0.7).convert_to(Unit::Terahertz));
    CHECK(by_frequency.value() / by_wavelength.value() == doctest::Approx(1.0).epsilon(kRelTol));
}

TEST_CASE("Hotter blackbody is brighter at every wavelength")
{
    const auto cool = SpectralModel::blackbody(4000.0);
    const auto hot = SpectralModel::blackbody(10000.0);
    for (const f64 um : {0.2, 0.5, 1.0, 5.0, 50.0})
    {
        CAPTURE(um);
        CHECK(hot.evaluate(microns(um)).value() > cool.evaluate(microns(um)).value());
    }
}

TEST_CASE("Blackbody deep in the Wien tail cannot be normalized")
{
    // h c / (lambda k T) ~ 1.4e5: the shape underflows to exactly zero
    const auto model = SpectralModel::blackbody(10.0);
    CHECK(model.evaluate(angstroms(100.0)).value() == 0.0);
    CHECK_THROWS_AS((void)model.normalize_to(janskys(1.0), angstroms(100.0)), NonPositiveFluxError);
}

// =================================================================
// Power law shape
// =================================================================

TEST_CASE("Power law is monotonic in frequency by sign of the index")
{
    constexpr std::array kFrequencies = {1.0e12, 1.0e13, 1.0e14, 1.0e15, 1.0e16};

    SUBCASE("positive index: strictly increasing")
    {
        const auto model = SpectralModel::power_law(1.5);
        for (std::size_t i = 1; i < kFrequencies.size(); ++i)
        {
            const auto lo = model.evaluate(UnitValue(kFrequencies[i - 1], Unit::Hertz));
            const auto hi = model.evaluate(UnitValue(kFrequencies[i], Unit::Hertz));
            CHECK(hi.value() > lo.value());
        }
    }

    SUBCASE("negative index: strictly decreasing")
    {
        const auto model = SpectralModel::power_law(-0.7);
        for (std::size_t i = 1; i < kFrequencies.size(); ++i)
        {
            const auto lo = model.evaluate(UnitValue(kFrequencies[i - 1], Unit::Hertz));
            const auto hi = model.evaluate(UnitValue(kFrequencies[i], Unit::Hertz));
            CHECK(hi.value() < lo.value());
        }
    }
}

TEST_CASE("Power law index 0.25 from 1 um to 0.9 um")
{
    const auto model = SpectralModel::power_law(0.25)
                           .normalize_to(UnitValue(1.0e-23, Unit::WattPerSqMeterPerHertz), microns(1.0));
    const auto jy = model.evaluate(microns(0.9), Unit::Jansky);
    CHECK(jy.value() == doctest::Approx(1000.0 * std::pow(1.0 / 0.9, 0.25)).epsilon(kRelTol));
}

TEST_CASE("Power law at zero frequency is degenerate")
{
    const UnitValue zero_hz(0.0, Unit::Hertz);

    SUBCASE("positive index vanishes")
    {
        const auto model = SpectralModel::power_law(2.0);
        CHECK(model.evaluate(zero_hz).value() == 0.0);
        CHECK_THROWS_AS((void)model.normalize_to(janskys(1.0), zero_hz), NonPositiveFluxError);
    }

    SUBCASE("negative index diverges")
    {
        const auto model = SpectralModel::power_law(-1.0);
        CHECK_THROWS_AS((void)model.evaluate(zero_hz), NonPositiveFluxError);
        CHECK_THROWS_AS((void)model.evaluate(zero_hz, Unit::Jansky), NonPositiveFluxError);
        CHECK_THROWS_AS((void)model.normalize_to(janskys(1.0), zero_hz), NonPositiveFluxError);
    }

    SUBCASE("zero index is flat")
    {
        CHECK(SpectralModel::power_law(0.0).evaluate(zero_hz).value() == 1.0);
    }
}

// =================================================================
// Flat spectrum
// =================================================================

TEST_CASE("Flat spectrum keeps F_nu (and the AB magnitude) constant")
{
    const auto model = SpectralModel::flat().normalize_to(janskys(3631.0), microns(0.5));
    const auto at_2um = model.evaluate(microns(2.0), Unit::Jansky);
    CHECK(at_2um.value() == doctest::Approx(3631.0).epsilon(kRelTol));

    const auto ab_near = model.evaluate(microns(0.5), Unit::ABMag);
    const auto ab_far = model.evaluate(microns(20.0), Unit::ABMag);
    CHECK(ab_near.value() == doctest::Approx(ab_far.value()).epsilon(kRelTol));
}
