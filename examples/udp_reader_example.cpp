#include <atomic>
#include <chrono>
#include <iostream>
#include <type_traits>
#include <variant>

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <jseries/jseries_utils.hpp>

using namespace jseries;

// Global flag for graceful shutdown
std::atomic<bool> keep_running{true};

void signal_handler(int) {
    keep_running.store(false);
}

/**
 * @brief Frame processor with internal state
 *
 * Prints each decoded air track report and counts codec failures.
 */
class FrameProcessor {
private:
    size_t frame_count_ = 0;
    size_t air_track_count_ = 0;
    size_t failed_count_ = 0;

public:
    void operator()(const Result<Message>& result) {
        frame_count_++;
        std::cout << "\n=== Frame " << frame_count_ << " ===\n";

        if (!is_ok(result)) {
            failed_count_++;
            std::cout << "Type: CODEC FAILURE\n";
            std::cout << "  Error: " << failure_of(result).error_message() << "\n";
            return;
        }

        std::visit(
            [this](const auto& body) {
                using Body = std::decay_t<decltype(body)>;
                if constexpr (std::is_same_v<Body, AirTrackReport>) {
                    air_track_count_++;
                    std::cout << "Type: Air Track (0x" << std::hex << static_cast<int>(Body::kind)
                              << std::dec << ")\n";
                    std::cout << "  Track: " << body.track << " / " << body.track_number << "\n";
                    std::cout << "  Position: " << quant::dequantize_latitude(body.latitude_packed)
                              << ", " << quant::dequantize_longitude(body.longitude_packed)
                              << "\n";
                    std::cout << "  Altitude: " << quant::dequantize_altitude(body.altitude_packed)
                              << " m\n";
                    std::cout << "  Speed: " << body.speed_ms << " m/s\n";
                    std::cout << "  Heading: " << body.heading_cdeg / 100.0 << " deg\n";
                }
            },
            std::get<Message>(result));
    }

    void print_summary() const {
        std::cout << "\n========== Summary ==========\n";
        std::cout << "Total frames received: " << frame_count_ << "\n";
        std::cout << "  Air track reports: " << air_track_count_ << "\n";
        std::cout << "  Codec failures: " << failed_count_ << "\n";
    }
};

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <udp_port> [max_frames]\n";
        std::cerr << "\n";
        std::cerr << "Example: " << argv[0] << " 5000 100\n";
        std::cerr << "  Listens on UDP port 5000 and decodes up to 100 frames\n";
        std::cerr << "  (Press Ctrl+C to stop early)\n";
        return 1;
    }

    uint16_t port = static_cast<uint16_t>(std::atoi(argv[1]));
    size_t max_frames = (argc >= 3) ? std::atoi(argv[2]) : SIZE_MAX;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "UDP Frame Reader Example\n";
    std::cout << "========================\n";
    std::cout << "Listening on UDP port: " << port << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    try {
        UDPFrameReader<> reader(port);

        // Timeout lets the loop notice keep_running
        reader.try_set_timeout(std::chrono::seconds(1));

        FrameProcessor processor;

        size_t count = 0;
        while (keep_running.load() && count < max_frames) {
            auto msg = reader.read_next_message();

            if (!msg) {
                const auto& status = reader.transport_status();
                if (status.is_terminal()) {
                    std::cerr << "\nSocket closed or error (errno: " << status.errno_value << ")\n";
                    break;
                }
                // Timeout - continue waiting
                continue;
            }

            processor(*msg);
            count++;
        }

        processor.print_summary();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nExiting...\n";
    return 0;
}
