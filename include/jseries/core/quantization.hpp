#pragma once

#include <cmath>
#include <string_view>

#include <cstdint>

#include "result.hpp"

namespace jseries::quant {

// Field widths used by the geodetic codes
inline constexpr unsigned latitude_bits = 19;
inline constexpr unsigned longitude_bits = 19;
inline constexpr unsigned altitude_bits = 14;
inline constexpr unsigned track_number_bits = 12;

// Largest code of each field
inline constexpr uint32_t latitude_max_code = (1U << latitude_bits) - 1;   // 524287
inline constexpr uint32_t longitude_max_code = (1U << longitude_bits) - 1; // 524287
inline constexpr uint32_t altitude_max_code = (1U << altitude_bits) - 1;   // 16383
inline constexpr uint16_t track_number_mask = (1U << track_number_bits) - 1; // 0x0FFF

// Physical domains
inline constexpr double latitude_min_deg = -90.0;
inline constexpr double latitude_max_deg = 90.0;
inline constexpr double longitude_min_deg = -180.0;
inline constexpr double longitude_max_deg = 180.0;

// Altitude scaling: meters -> feet -> 25 ft steps
inline constexpr double feet_per_meter = 3.28084;
inline constexpr double altitude_step_ft = 25.0;
inline constexpr double altitude_min_m = 0.0;
inline constexpr double altitude_max_m =
    static_cast<double>(altitude_max_code) * altitude_step_ft / feet_per_meter; // ~124,828 m

// Heading is carried in hundredths of a degree
inline constexpr uint16_t centidegrees_per_turn = 36000;

// Field names reported in QuantizationOverflow
inline constexpr std::string_view latitude_field = "latitude";
inline constexpr std::string_view longitude_field = "longitude";
inline constexpr std::string_view altitude_field = "altitude";

namespace detail {

// Round half away from zero and range-check against [0, max_code].
// NaN and infinities never pass the range check.
inline bool round_to_code(double scaled, uint32_t max_code, uint32_t& out) noexcept {
    double rounded = std::round(scaled);
    if (!(rounded >= 0.0 && rounded <= static_cast<double>(max_code))) {
        return false;
    }
    out = static_cast<uint32_t>(rounded);
    return true;
}

inline bool in_domain(double value, double lo, double hi) noexcept {
    return value >= lo && value <= hi; // false for NaN
}

} // namespace detail

/**
 * @brief Latitude in degrees to its 19-bit code
 *
 * code = round((lat + 90) * 524287 / 180)
 *
 * @param lat_deg Latitude in degrees, [-90, 90]
 * @return Code in [0, 524287], or QuantizationOverflow("latitude")
 */
inline Result<uint32_t> quantize_latitude(double lat_deg) noexcept {
    uint32_t code = 0;
    if (!detail::in_domain(lat_deg, latitude_min_deg, latitude_max_deg) ||
        !detail::round_to_code((lat_deg + 90.0) * latitude_max_code / 180.0, latitude_max_code,
                               code)) {
        return CodecFailure::quantization_overflow(latitude_field);
    }
    return code;
}

/**
 * @brief Longitude in degrees to its 19-bit code
 *
 * code = round((lon + 180) * 524287 / 360)
 *
 * @param lon_deg Longitude in degrees, [-180, 180]
 * @return Code in [0, 524287], or QuantizationOverflow("longitude")
 */
inline Result<uint32_t> quantize_longitude(double lon_deg) noexcept {
    uint32_t code = 0;
    if (!detail::in_domain(lon_deg, longitude_min_deg, longitude_max_deg) ||
        !detail::round_to_code((lon_deg + 180.0) * longitude_max_code / 360.0,
                               longitude_max_code, code)) {
        return CodecFailure::quantization_overflow(longitude_field);
    }
    return code;
}

/**
 * @brief Altitude in meters to its 14-bit code of 25 ft steps
 *
 * code = round(alt_m * 3.28084 / 25)
 *
 * @param alt_m Altitude in meters, [0, altitude_max_m]
 * @return Code in [0, 16383], or QuantizationOverflow("altitude")
 */
inline Result<uint16_t> quantize_altitude(double alt_m) noexcept {
    uint32_t code = 0;
    if (!detail::in_domain(alt_m, altitude_min_m, altitude_max_m) ||
        !detail::round_to_code(alt_m * feet_per_meter / altitude_step_ft, altitude_max_code,
                               code)) {
        return CodecFailure::quantization_overflow(altitude_field);
    }
    return static_cast<uint16_t>(code);
}

/// Low 12 bits of a track identifier. Lossy: ids differing only above bit 11 alias.
constexpr uint16_t track_number_of(uint16_t track) noexcept {
    return static_cast<uint16_t>(track & track_number_mask);
}

/**
 * @brief Heading in degrees to centidegrees
 *
 * Wraps the input into [0, 360) first, so -90 becomes 27000. Values that
 * round up to a full turn come back as 0. Non-finite input yields 0.
 *
 * @param heading_deg Heading in degrees, any finite value
 * @return Heading in [0, 35999]
 */
inline uint16_t heading_to_centidegrees(double heading_deg) noexcept {
    if (!std::isfinite(heading_deg)) {
        return 0;
    }
    double wrapped = std::fmod(heading_deg, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    auto cdeg = static_cast<uint32_t>(std::round(wrapped * 100.0));
    return static_cast<uint16_t>(cdeg % centidegrees_per_turn);
}

// Approximate inverses, for display. Decode never goes through these.

inline double dequantize_latitude(uint32_t code) noexcept {
    return static_cast<double>(code) * 180.0 / latitude_max_code - 90.0;
}

inline double dequantize_longitude(uint32_t code) noexcept {
    return static_cast<double>(code) * 360.0 / longitude_max_code - 180.0;
}

inline double dequantize_altitude(uint16_t code) noexcept {
    return static_cast<double>(code) * altitude_step_ft / feet_per_meter;
}

} // namespace jseries::quant
