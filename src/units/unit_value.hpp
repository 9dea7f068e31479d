#pragma once

/// @file unit_value.hpp
/// @brief Immutable numeric quantity tagged with a physical unit.

#include "core/types.hpp"
#include "units/unit.hpp"

#include <optional>
#include <string>

namespace fluxconv::units
{
    /// @brief A floating-point value carrying a unit scale (and through it a UnitKind).
    ///
    /// Immutable: every conversion or arithmetic operation returns a new value.
    /// Conversions are dispatched on the (source, target) unit pair:
    /// - same kind: fixed multiplicative rescaling
    /// - wavelength <-> frequency: nu = c / lambda, no context needed
    /// - FNU family <-> FLAM family <-> PHOTLAM family: needs a wavelength or
    ///   frequency context, since the photon energy and the d(nu)/d(lambda)
    ///   Jacobian both depend on it
    /// - ABmag belongs to the FNU family, STmag to the FLAM family
    class UnitValue
    {
    public:
        UnitValue(f64 value, Unit unit) : m_value(value), m_unit(unit) {}

        [[nodiscard]] f64 value() const { return m_value; }
        [[nodiscard]] Unit unit() const { return m_unit; }
        [[nodiscard]] UnitKind kind() const { return kind_of(m_unit); }

        /// @brief Convert to another unit.
        /// @param target  Destination unit.
        /// @param context Wavelength or frequency at which a cross-family flux
        ///                conversion is evaluated. Ignored otherwise.
        /// @throws IncompatibleUnitsError no conversion path, or context is not a wavelength/frequency
        /// @throws MissingContextError    cross-family flux conversion without context
        /// @throws NonPositiveFluxError   flux <= 0 into a magnitude, or wavelength/frequency <= 0 inverted
        [[nodiscard]] UnitValue convert_to(Unit target,
                                           const std::optional<UnitValue>& context = std::nullopt) const;

        /// @brief Magnitude relative to a zero-point flux: -2.5 log10(value / zero_point).
        /// This value is first converted into the zero-point's unit.
        /// @return Value in Unit::Mag.
        /// @throws NonPositiveFluxError   value or zero-point <= 0
        /// @throws IncompatibleUnitsError zero-point is not a linear flux density
        [[nodiscard]] UnitValue to_magnitude(const UnitValue& zero_point) const;

        /// @brief Product. Defined for scalar operands only; flux x flux is rejected.
        [[nodiscard]] UnitValue multiply(const UnitValue& other) const;
        [[nodiscard]] UnitValue multiply(f64 factor) const;

        /// @brief Quotient. Same kind / same kind yields a Scalar ratio, as does
        /// wavelength / frequency (the divisor is inverted first);
        /// anything / Scalar keeps its unit.
        /// @throws NonPositiveFluxError on division by zero
        [[nodiscard]] UnitValue divide(const UnitValue& other) const;
        [[nodiscard]] UnitValue divide(f64 divisor) const;

        /// @brief "1.23e-13 Jy" style rendering for logs and diagnostics.
        [[nodiscard]] std::string to_string() const;

    private:
        f64 m_value;
        Unit m_unit;
    };

    // -----------------------------------------------------------------
    // Construction helpers
    // -----------------------------------------------------------------

    [[nodiscard]] inline UnitValue microns(f64 v) { return {v, Unit::Micron}; }
    [[nodiscard]] inline UnitValue angstroms(f64 v) { return {v, Unit::Angstrom}; }
    [[nodiscard]] inline UnitValue janskys(f64 v) { return {v, Unit::Jansky}; }
    [[nodiscard]] inline UnitValue scalar(f64 v) { return {v, Unit::Scalar}; }

} // namespace fluxconv::units
