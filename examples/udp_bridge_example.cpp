#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <variant>

#include <cstdlib>
#include <jseries/jseries_utils.hpp>

/**
 * @brief Telemetry sample as received from a vehicle feed
 */
struct Telemetry {
    uint16_t track = 42;
    double lat = 45.1234567;
    double lon = -122.9876543;
    double alt_m = 1500.0;
    uint16_t speed_ms = 220;
    double heading_deg = 271.5;
};

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0]
                  << " <host> <port> [track lat lon alt_m speed_ms heading_deg] [repeat] "
                     "[interval_ms]\n";
        std::cerr << "\n";
        std::cerr << "Example: " << argv[0] << " 127.0.0.1 5000 42 45.12 -122.98 1500 220 271.5 10\n";
        std::cerr << "  Encodes the telemetry as a J3.2 air track frame and sends it 10 times\n";
        return 1;
    }

    std::string host = argv[1];
    uint16_t port = static_cast<uint16_t>(std::atoi(argv[2]));

    Telemetry t;
    if (argc >= 9) {
        t.track = static_cast<uint16_t>(std::atoi(argv[3]));
        t.lat = std::atof(argv[4]);
        t.lon = std::atof(argv[5]);
        t.alt_m = std::atof(argv[6]);
        t.speed_ms = static_cast<uint16_t>(std::atoi(argv[7]));
        t.heading_deg = std::atof(argv[8]);
    }
    int repeat = (argc >= 10) ? std::atoi(argv[9]) : 1;
    int interval_ms = (argc >= 11) ? std::atoi(argv[10]) : 1000;

    auto built = jseries::AirTrackReport::from_geo(t.track, t.lat, t.lon, t.alt_m, t.speed_ms,
                                                   jseries::quant::heading_to_centidegrees(
                                                       t.heading_deg));
    if (!jseries::is_ok(built)) {
        std::cerr << "Error: " << jseries::failure_of(built).error_message() << "\n";
        return 1;
    }
    const auto& report = std::get<jseries::AirTrackReport>(built);

    try {
        jseries::UDPFrameWriter writer(host, port);

        for (int i = 0; i < repeat; ++i) {
            if (!writer.write_message(jseries::Message{report})) {
                const auto& status = writer.transport_status();
                std::cerr << "Send failed: " << jseries::utils::netio::transport_state_string(
                                                     status.state)
                          << " (errno: " << status.errno_value << ")\n";
                return 1;
            }
            std::cout << "sent [" << (i + 1) << "/" << repeat << "] track " << report.track
                      << " to " << host << ":" << port << "\n";

            if (i + 1 < repeat) {
                std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
            }
        }

        std::cout << "Frames sent: " << writer.frames_sent() << ", bytes: " << writer.bytes_sent()
                  << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
