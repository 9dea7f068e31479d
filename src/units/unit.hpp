#pragma once

/// @file unit.hpp
/// @brief Unit scales, their physical kinds, symbols and fixed rescaling factors.

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace fluxconv::units
{
    /// @brief Physical dimension of a quantity.
    enum class UnitKind : u8
    {
        FluxPerFrequency,   ///< Energy flux density per unit frequency
        FluxPerWavelength,  ///< Energy flux density per unit wavelength
        PhotonFlux,         ///< Photon flux density per unit wavelength
        Wavelength,
        Frequency,
        Magnitude,          ///< Logarithmic flux scale
        Dimensionless,
    };

    /// @brief Concrete unit scale. Each belongs to exactly one UnitKind.
    enum class Unit : u8
    {
        // FluxPerFrequency
        Fnu,                        ///< erg s^-1 cm^-2 Hz^-1 (canonical)
        Jansky,                     ///< 1e-23 FNU
        MilliJansky,
        MicroJansky,
        WattPerSqMeterPerHertz,     ///< W m^-2 Hz^-1 = 1e3 FNU

        // FluxPerWavelength
        Flam,                       ///< erg s^-1 cm^-2 A^-1 (canonical)
        WattPerSqMeterPerMicron,    ///< W m^-2 um^-1 = 0.1 FLAM

        // PhotonFlux
        Photlam,                    ///< photons s^-1 cm^-2 A^-1 (canonical)
        PhotonPerSqMeterPerMicron,  ///< photons s^-1 m^-2 um^-1 = 1e-8 PHOTLAM

        // Wavelength
        Angstrom,                   ///< canonical
        Nanometer,
        Micron,
        Centimeter,
        Meter,

        // Frequency
        Hertz,                      ///< canonical
        Gigahertz,
        Terahertz,

        // Magnitude
        ABMag,                      ///< AB magnitude, tied to FNU
        STMag,                      ///< ST magnitude, tied to FLAM
        Mag,                        ///< Magnitude on a registered system

        // Dimensionless
        Scalar,
    };

    /// @brief Physical kind of a unit scale.
    [[nodiscard]] UnitKind kind_of(Unit unit);

    /// @brief Short text symbol, e.g. "Jy", "FLAM", "um".
    [[nodiscard]] std::string_view symbol(Unit unit);

    /// @brief Human-readable name of a kind, for diagnostics.
    [[nodiscard]] std::string_view kind_name(UnitKind kind);

    /// @brief Parse a unit symbol as produced by symbol(). A few common
    /// aliases are accepted ("micron", "A", "W/m2/Hz").
    [[nodiscard]] std::optional<Unit> parse_unit(std::string_view text);

    /// @brief Canonical (linear) unit of a kind: FNU, FLAM, PHOTLAM, Angstrom, Hz, Scalar.
    /// std::nullopt for Magnitude, which has no linear canonical unit.
    [[nodiscard]] std::optional<Unit> canonical_unit(UnitKind kind);

    /// @brief Multiplicative factor from a linear unit to its kind's canonical unit.
    /// std::nullopt for logarithmic units (ABMag, STMag, Mag).
    [[nodiscard]] std::optional<f64> to_canonical_factor(Unit unit);

    /// @brief True for kinds that describe a flux density (energy or photon).
    [[nodiscard]] bool is_flux(UnitKind kind);

    /// @brief True for Wavelength and Frequency, the valid spectral contexts.
    [[nodiscard]] bool is_spectral_coordinate(UnitKind kind);

} // namespace fluxconv::units
