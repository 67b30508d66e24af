#pragma once

#include <array>
#include <span>
#include <string_view>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../core/bit_packer.hpp"
#include "../core/quantization.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"

namespace jseries {

/**
 * @brief J3.2 air track report body
 *
 * Holds the packed (quantized) representation of a track. Built once from
 * geodetic telemetry with from_geo() and treated as an immutable value after
 * that. Equality compares every packed field, so decode(encode(r)) == r.
 *
 * The floating-point inputs are not recoverable from this struct; see
 * quant::dequantize_* for approximate display values.
 */
struct AirTrackReport {
    static constexpr uint8_t kind = jseries::kind::air_track;
    static constexpr std::string_view name = "air_track";

    uint16_t track{0};            ///< Track identifier
    uint32_t latitude_packed{0};  ///< 19-bit latitude code
    uint32_t longitude_packed{0}; ///< 19-bit longitude code
    uint16_t track_number{0};     ///< 12-bit track number (track & 0xFFF)
    uint16_t altitude_packed{0};  ///< 14-bit altitude in 25 ft steps
    uint8_t parity{0};            ///< 5-bit reserved field, zero
    uint16_t speed_ms{0};         ///< Speed in whole m/s
    uint16_t heading_cdeg{0};     ///< Heading in centidegrees, expected 0..35999

    /**
     * @brief Build a report from geodetic telemetry
     *
     * Latitude, longitude and altitude are quantized and range-checked.
     * Speed and heading are copied verbatim; heading is expected in
     * centidegrees (use quant::heading_to_centidegrees() for degrees) and
     * is not range-checked. track_number is the low 12 bits of track and
     * parity is zero.
     *
     * @return The report, or QuantizationOverflow naming the first field out of domain
     */
    static Result<AirTrackReport> from_geo(uint16_t track, double lat_deg, double lon_deg,
                                           double alt_m, uint16_t speed_ms,
                                           uint16_t heading_cdeg) noexcept {
        auto lat = quant::quantize_latitude(lat_deg);
        if (!is_ok(lat)) {
            return failure_of(lat);
        }
        auto lon = quant::quantize_longitude(lon_deg);
        if (!is_ok(lon)) {
            return failure_of(lon);
        }
        auto alt = quant::quantize_altitude(alt_m);
        if (!is_ok(alt)) {
            return failure_of(alt);
        }

        AirTrackReport report;
        report.track = track;
        report.latitude_packed = std::get<uint32_t>(lat);
        report.longitude_packed = std::get<uint32_t>(lon);
        report.track_number = quant::track_number_of(track);
        report.altitude_packed = std::get<uint16_t>(alt);
        report.parity = 0;
        report.speed_ms = speed_ms;
        report.heading_cdeg = heading_cdeg;
        return report;
    }

    bool operator==(const AirTrackReport&) const = default;
};

// Field table for the J3.2 air track body, in wire order
inline constexpr std::array<FieldSpec, 8> air_track_layout = {{
    {"track", 16},
    {quant::latitude_field, quant::latitude_bits},
    {quant::longitude_field, quant::longitude_bits},
    {"track_number", quant::track_number_bits},
    {quant::altitude_field, quant::altitude_bits},
    {"parity", 5},
    {"speed_ms", 16},
    {"heading_cdeg", 16},
}};

inline constexpr size_t air_track_body_bits = layout_bits(air_track_layout);
inline constexpr size_t air_track_body_bytes = layout_bytes(air_track_layout);
inline constexpr size_t air_track_frame_bytes = kind_tag_bytes + air_track_body_bytes;

static_assert(is_valid_layout(air_track_layout), "Air track layout has an invalid width");
static_assert(air_track_body_bits == 117, "Air track body must be 117 bits");
static_assert(air_track_body_bytes == 15, "Air track body must pad to 15 bytes");

/**
 * @brief Body codec for AirTrackReport
 *
 * Drives the bit packer with air_track_layout. Used directly for bodies, or
 * through the envelope registry for tagged frames.
 */
struct AirTrackCodec {
    using message_type = AirTrackReport;

    static constexpr uint8_t kind = AirTrackReport::kind;

    /**
     * @brief Pack a report into its 15-byte body
     *
     * Every field is checked against its declared width before anything is
     * written, so a hand-built report with an oversized code fails as a
     * whole instead of producing a truncated body.
     *
     * @return Body bytes, or QuantizationOverflow naming the offending field
     */
    static Result<std::vector<uint8_t>> encode(const AirTrackReport& report) {
        const std::array<uint32_t, air_track_layout.size()> values = {
            report.track,         report.latitude_packed, report.longitude_packed,
            report.track_number,  report.altitude_packed, report.parity,
            report.speed_ms,      report.heading_cdeg,
        };

        for (size_t i = 0; i < values.size(); ++i) {
            if (values[i] > field_max(air_track_layout[i].width)) {
                return CodecFailure::quantization_overflow(air_track_layout[i].name);
            }
        }

        return pack(air_track_layout, values);
    }

    /**
     * @brief Unpack a report from a body buffer
     *
     * Fields are taken as found; a track_number that disagrees with the low
     * bits of track is returned unchanged.
     *
     * @param body At least 117 bits; trailing bytes are ignored
     * @return The report, or ShortBuffer(117, available_bits)
     */
    static Result<AirTrackReport> decode(std::span<const uint8_t> body) {
        auto unpacked = unpack(body, std::span<const FieldSpec>(air_track_layout));
        if (!is_ok(unpacked)) {
            return failure_of(unpacked);
        }
        const auto& v = std::get<std::vector<uint32_t>>(unpacked);

        AirTrackReport report;
        report.track = static_cast<uint16_t>(v[0]);
        report.latitude_packed = v[1];
        report.longitude_packed = v[2];
        report.track_number = static_cast<uint16_t>(v[3]);
        report.altitude_packed = static_cast<uint16_t>(v[4]);
        report.parity = static_cast<uint8_t>(v[5]);
        report.speed_ms = static_cast<uint16_t>(v[6]);
        report.heading_cdeg = static_cast<uint16_t>(v[7]);
        return report;
    }
};

} // namespace jseries
