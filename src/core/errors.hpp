#pragma once

/// @file errors.hpp
/// @brief Exception taxonomy for flux conversions and registry misuse.

#include <stdexcept>
#include <string>

namespace fluxconv
{
    /// @brief Base class for every error raised by a conversion or registry operation.
    ///
    /// All operations are deterministic, so none of these are transient:
    /// callers either validate inputs up front or handle the error explicitly.
    class FluxError : public std::runtime_error
    {
    public:
        explicit FluxError(const std::string& what) : std::runtime_error(what) {}
    };

    /// @brief Dimensional mismatch: no conversion or arithmetic rule exists between the operands.
    class IncompatibleUnitsError : public FluxError
    {
    public:
        explicit IncompatibleUnitsError(const std::string& what) : FluxError(what) {}
    };

    /// @brief A wavelength-dependent conversion was requested without a wavelength/frequency.
    class MissingContextError : public FluxError
    {
    public:
        explicit MissingContextError(const std::string& what) : FluxError(what) {}
    };

    /// @brief Logarithm or division domain violation (flux, wavelength or divisor <= 0).
    class NonPositiveFluxError : public FluxError
    {
    public:
        explicit NonPositiveFluxError(const std::string& what) : FluxError(what) {}
    };

    /// @brief Lookup of a magnitude system that was never registered.
    class UnknownSystemError : public FluxError
    {
    public:
        explicit UnknownSystemError(const std::string& what) : FluxError(what) {}
    };

    /// @brief A magnitude system name was registered twice.
    class DuplicateSystemError : public FluxError
    {
    public:
        explicit DuplicateSystemError(const std::string& what) : FluxError(what) {}
    };

} // namespace fluxconv
