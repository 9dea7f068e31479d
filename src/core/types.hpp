#pragma once

#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace fluxconv
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Physical constants, CGS (CODATA 2018 exact values)
    namespace physical_constants
    {
        constexpr f64 kPi              = glm::pi<f64>();
        constexpr f64 kSpeedOfLightCm  = 2.99792458e10;   // cm / s
        constexpr f64 kSpeedOfLightAng = 2.99792458e18;   // Angstrom / s
        constexpr f64 kPlanck          = 6.62607015e-27;  // erg s
        constexpr f64 kBoltzmann       = 1.380649e-16;    // erg / K
        constexpr f64 kHcErgAng        = kPlanck * kSpeedOfLightAng;  // erg Angstrom
        constexpr f64 kAngstromToCm    = 1.0e-8;
    }

    // Photometric zero-points
    namespace photometric_constants
    {
        constexpr f64 kAbMagOffset = 48.60;  // m_AB = -2.5 log10(F_nu [FNU]) - 48.60
        constexpr f64 kStMagOffset = 21.10;  // m_ST = -2.5 log10(F_lambda [FLAM]) - 21.10
        constexpr f64 kPogson      = 2.5;
    }
}
