/// @file unit.cpp
/// @brief Unit tables: kinds, symbols, aliases and rescaling factors.

#include "units/unit.hpp"

#include <array>
#include <utility>

namespace fluxconv::units
{

UnitKind kind_of(Unit unit)
{
    switch (unit)
    {
        case Unit::Fnu:
        case Unit::Jansky:
        case Unit::MilliJansky:
        case Unit::MicroJansky:
        case Unit::WattPerSqMeterPerHertz:
            return UnitKind::FluxPerFrequency;
        case Unit::Flam:
        case Unit::WattPerSqMeterPerMicron:
            return UnitKind::FluxPerWavelength;
        case Unit::Photlam:
        case Unit::PhotonPerSqMeterPerMicron:
            return UnitKind::PhotonFlux;
        case Unit::Angstrom:
        case Unit::Nanometer:
        case Unit::Micron:
        case Unit::Centimeter:
        case Unit::Meter:
            return UnitKind::Wavelength;
        case Unit::Hertz:
        case Unit::Gigahertz:
        case Unit::Terahertz:
            return UnitKind::Frequency;
        case Unit::ABMag:
        case Unit::STMag:
        case Unit::Mag:
            return UnitKind::Magnitude;
        case Unit::Scalar:
            break;
    }
    return UnitKind::Dimensionless;
}

std::string_view symbol(Unit unit)
{
    switch (unit)
    {
        case Unit::Fnu:                       return "FNU";
        case Unit::Jansky:                    return "Jy";
        case Unit::MilliJansky:               return "mJy";
        case Unit::MicroJansky:               return "uJy";
        case Unit::WattPerSqMeterPerHertz:    return "W/m2/Hz";
        case Unit::Flam:                      return "FLAM";
        case Unit::WattPerSqMeterPerMicron:   return "W/m2/um";
        case Unit::Photlam:                   return "PHOTLAM";
        case Unit::PhotonPerSqMeterPerMicron: return "ph/s/m2/um";
        case Unit::Angstrom:                  return "Angstrom";
        case Unit::Nanometer:                 return "nm";
        case Unit::Micron:                    return "um";
        case Unit::Centimeter:                return "cm";
        case Unit::Meter:                     return "m";
        case Unit::Hertz:                     return "Hz";
        case Unit::Gigahertz:                 return "GHz";
        case Unit::Terahertz:                 return "THz";
        case Unit::ABMag:                     return "ABmag";
        case Unit::STMag:                     return "STmag";
        case Unit::Mag:                       return "mag";
        case Unit::Scalar:                    break;
    }
    return "";
}

std::string_view kind_name(UnitKind kind)
{
    switch (kind)
    {
        case UnitKind::FluxPerFrequency:  return "flux density per frequency";
        case UnitKind::FluxPerWavelength: return "flux density per wavelength";
        case UnitKind::PhotonFlux:        return "photon flux density";
        case UnitKind::Wavelength:        return "wavelength";
        case UnitKind::Frequency:         return "frequency";
        case UnitKind::Magnitude:         return "magnitude";
        case UnitKind::Dimensionless:     break;
    }
    return "dimensionless";
}

std::optional<Unit> parse_unit(std::string_view text)
{
    static constexpr std::array<std::pair<std::string_view, Unit>, 30> kTable{{
        {"FNU",        Unit::Fnu},
        {"Jy",         Unit::Jansky},
        {"mJy",        Unit::MilliJansky},
        {"uJy",        Unit::MicroJansky},
        {"W/m2/Hz",    Unit::WattPerSqMeterPerHertz},
        {"FLAM",       Unit::Flam},
        {"W/m2/um",    Unit::WattPerSqMeterPerMicron},
        {"PHOTLAM",    Unit::Photlam},
        {"ph/s/m2/um", Unit::PhotonPerSqMeterPerMicron},
        {"Angstrom",   Unit::Angstrom},
        {"AA",         Unit::Angstrom},
        {"A",          Unit::Angstrom},
        {"nm",         Unit::Nanometer},
        {"um",         Unit::Micron},
        {"micron",     Unit::Micron},
        {"cm",         Unit::Centimeter},
        {"m",          Unit::Meter},
        {"Hz",         Unit::Hertz},
        {"GHz",        Unit::Gigahertz},
        {"THz",        Unit::Terahertz},
        {"ABmag",      Unit::ABMag},
        {"STmag",      Unit::STMag},
        {"mag",        Unit::Mag},
        {"",           Unit::Scalar},
        {"erg/s/cm2/Hz",    Unit::Fnu},
        {"erg/s/cm2/A",     Unit::Flam},
        {"photon/s/cm2/A",  Unit::Photlam},
        {"W/m^2/Hz",        Unit::WattPerSqMeterPerHertz},
        {"W/m^2/um",        Unit::WattPerSqMeterPerMicron},
        {"Jansky",          Unit::Jansky},
    }};

    for (const auto& [name, unit] : kTable)
    {
        if (name == text)
        {
            return unit;
        }
    }
    return std::nullopt;
}

std::optional<Unit> canonical_unit(UnitKind kind)
{
    switch (kind)
    {
        case UnitKind::FluxPerFrequency:  return Unit::Fnu;
        case UnitKind::FluxPerWavelength: return Unit::Flam;
        case UnitKind::PhotonFlux:        return Unit::Photlam;
        case UnitKind::Wavelength:        return Unit::Angstrom;
        case UnitKind::Frequency:         return Unit::Hertz;
        case UnitKind::Dimensionless:     return Unit::Scalar;
        case UnitKind::Magnitude:         break;
    }
    return std::nullopt;
}

std::optional<f64> to_canonical_factor(Unit unit)
{
    switch (unit)
    {
        case Unit::Fnu:                       return 1.0;
        case Unit::Jansky:                    return 1.0e-23;
        case Unit::MilliJansky:               return 1.0e-26;
        case Unit::MicroJansky:               return 1.0e-29;
        case Unit::WattPerSqMeterPerHertz:    return 1.0e3;   // 1e7 erg/s per W, 1e-4 m2 per cm2
        case Unit::Flam:                      return 1.0;
        case Unit::WattPerSqMeterPerMicron:   return 0.1;     // 1e7 erg/s per W, 1e-4 m2 per cm2, 1e-4 um per A
        case Unit::Photlam:                   return 1.0;
        case Unit::PhotonPerSqMeterPerMicron: return 1.0e-8;
        case Unit::Angstrom:                  return 1.0;
        case Unit::Nanometer:                 return 10.0;
        case Unit::Micron:                    return 1.0e4;
        case Unit::Centimeter:                return 1.0e8;
        case Unit::Meter:                     return 1.0e10;
        case Unit::Hertz:                     return 1.0;
        case Unit::Gigahertz:                 return 1.0e9;
        case Unit::Terahertz:                 return 1.0e12;
        case Unit::Scalar:                    return 1.0;
        case Unit::ABMag:
        case Unit::STMag:
        case Unit::Mag:
            break;
    }
    return std::nullopt;
}

bool is_flux(UnitKind kind)
{
    return kind == UnitKind::FluxPerFrequency
        || kind == UnitKind::FluxPerWavelength
        || kind == UnitKind::PhotonFlux;
}

bool is_spectral_coordinate(UnitKind kind)
{
    return kind == UnitKind::Wavelength || kind == UnitKind::Frequency;
}

} // namespace fluxconv::units
