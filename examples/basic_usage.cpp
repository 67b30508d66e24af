// Basic usage example for JSERIES

#include <iomanip>
#include <iostream>
#include <variant>
#include <vector>

#include <jseries.hpp>

namespace {

void print_hex(const std::vector<uint8_t>& bytes) {
    std::cout << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        std::cout << std::setw(2) << static_cast<int>(b) << ' ';
    }
    std::cout << std::dec << std::setfill(' ') << "\n";
}

} // namespace

int main() {
    std::cout << "JSERIES - Basic Usage Example\n";
    std::cout << "=============================\n\n";

    // Example 1: Building a report from telemetry
    jseries::AirTrackReport report;
    {
        std::cout << "Example 1: Building an air track report\n";

        auto built = jseries::AirTrackReport::from_geo(
            42, 45.1234567, -122.9876543, 1500.9, 220,
            jseries::quant::heading_to_centidegrees(271.5));
        if (!jseries::is_ok(built)) {
            std::cerr << "  Error: " << jseries::failure_of(built).error_message() << "\n";
            return 1;
        }
        report = std::get<jseries::AirTrackReport>(built);

        std::cout << "  Track: " << report.track << " (track number " << report.track_number
                  << ")\n";
        std::cout << "  Latitude code: " << report.latitude_packed << "\n";
        std::cout << "  Longitude code: " << report.longitude_packed << "\n";
        std::cout << "  Altitude code: " << report.altitude_packed << " (25 ft steps)\n";
        std::cout << "  Heading: " << report.heading_cdeg << " cdeg\n\n";
    }

    // Example 2: Encoding to a tagged frame
    std::vector<uint8_t> frame;
    {
        std::cout << "Example 2: Encoding\n";

        auto encoded = jseries::encode_message(jseries::Message{report});
        if (!jseries::is_ok(encoded)) {
            std::cerr << "  Error: " << jseries::failure_of(encoded).error_message() << "\n";
            return 1;
        }
        frame = std::get<std::vector<uint8_t>>(encoded);

        std::cout << "  Frame (" << frame.size() << " bytes): ";
        print_hex(frame);
        std::cout << "\n";
    }

    // Example 3: Decoding and approximate physical values
    {
        std::cout << "Example 3: Decoding\n";

        auto decoded = jseries::decode_message(frame);
        if (!jseries::is_ok(decoded)) {
            std::cerr << "  Error: " << jseries::failure_of(decoded).error_message() << "\n";
            return 1;
        }
        const auto& out = std::get<jseries::AirTrackReport>(std::get<jseries::Message>(decoded));

        std::cout << std::fixed << std::setprecision(5);
        std::cout << "  Latitude: ~" << jseries::quant::dequantize_latitude(out.latitude_packed)
                  << " deg\n";
        std::cout << "  Longitude: ~" << jseries::quant::dequantize_longitude(out.longitude_packed)
                  << " deg\n";
        std::cout << "  Altitude: ~" << jseries::quant::dequantize_altitude(out.altitude_packed)
                  << " m\n";
        std::cout << "  Matches input: " << (out == report ? "yes" : "no") << "\n\n";
    }

    // Example 4: Error values
    {
        std::cout << "Example 4: Errors are returned, not thrown\n";

        auto bad = jseries::AirTrackReport::from_geo(1, 91.0, 0.0, 0.0, 0, 0);
        std::cout << "  from_geo(lat=91): " << jseries::failure_of(bad).error_message() << "\n";

        const std::vector<uint8_t> truncated(frame.begin(), frame.begin() + 8);
        auto short_frame = jseries::decode_message(truncated);
        std::cout << "  8-byte frame: " << jseries::failure_of(short_frame).error_message()
                  << "\n";

        const std::vector<uint8_t> unknown = {0x99, 0x00};
        auto unknown_kind = jseries::decode_message(unknown);
        std::cout << "  Kind 0x99: " << jseries::failure_of(unknown_kind).error_message() << "\n";
    }

    return 0;
}
