#pragma once

/// @file magnitude_system.hpp
/// @brief Named photometric zero-points and flux <-> magnitude conversion.

#include "core/types.hpp"
#include "units/unit_value.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fluxconv::photometry
{
    /// @brief A photometric system: the flux density that defines magnitude 0.
    struct MagnitudeSystem
    {
        std::string name;
        units::UnitValue zero_point;                              ///< Linear flux density
        std::optional<units::UnitValue> reference_wavelength;     ///< Where the zero-point applies, if wavelength-specific
    };

    /// @brief Registry of magnitude systems keyed by name.
    ///
    /// Populated during single-threaded initialization and read-only
    /// afterwards, so concurrent lookups need no locking.
    class MagnitudeSystemRegistry
    {
    public:
        /// @brief Empty registry (no built-in systems).
        MagnitudeSystemRegistry() = default;

        /// @brief Process-wide registry, pre-populated with AB and ST on first use.
        [[nodiscard]] static MagnitudeSystemRegistry& global();

        /// @brief Add the AB (FNU) and ST (FLAM) systems.
        void register_builtin_systems();

        /// @brief Add a system.
        /// @throws DuplicateSystemError   @p name already registered
        /// @throws IncompatibleUnitsError zero-point is not a linear flux, or the
        ///                                reference is not a wavelength/frequency
        /// @throws NonPositiveFluxError   zero-point or reference <= 0
        void register_system(const std::string& name,
                             const units::UnitValue& zero_point,
                             const std::optional<units::UnitValue>& reference_wavelength = std::nullopt);

        void register_system(const MagnitudeSystem& system);

        /// @brief Magnitude of @p flux on the named system.
        /// The system's reference wavelength, if any, is the context used to
        /// bring @p flux into the zero-point's unit.
        /// @throws UnknownSystemError @p name is not registered
        [[nodiscard]] units::UnitValue flux_to_magnitude(const std::string& name,
                                                         const units::UnitValue& flux) const;

        /// @brief Inverse of flux_to_magnitude(): zero_point * 10^(-m / 2.5).
        /// @param magnitude Value in Unit::Mag (or a plain Scalar).
        /// @throws UnknownSystemError     @p name is not registered
        /// @throws IncompatibleUnitsError @p magnitude is neither Mag nor Scalar
        [[nodiscard]] units::UnitValue magnitude_to_flux(const std::string& name,
                                                         const units::UnitValue& magnitude) const;

        /// @brief Lookup without throwing.
        [[nodiscard]] const MagnitudeSystem* find(const std::string& name) const;

        /// @brief Lookup that throws UnknownSystemError.
        [[nodiscard]] const MagnitudeSystem& at(const std::string& name) const;

        [[nodiscard]] bool contains(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> names() const;
        [[nodiscard]] std::size_t size() const { return m_systems.size(); }

    private:
        std::map<std::string, MagnitudeSystem> m_systems;
    };

} // namespace fluxconv::photometry
