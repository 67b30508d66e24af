#pragma once

#include <cstddef>
#include <cstdint>

namespace jseries::utils::netio {

/**
 * @brief Status information for the last UDP frame operation
 *
 * Shared by UDPFrameWriter and UDPFrameReader. Records the outcome of the
 * most recent send or receive, including errno for socket failures and
 * size information for truncated datagrams.
 */
struct UDPTransportStatus {
    /**
     * @brief State of the last UDP operation
     */
    enum class State : uint8_t {
        /** Frame sent, or received and ready for decoding */
        frame_ready,

        /** Socket has been closed (orderly shutdown) */
        socket_closed,

        /** Fatal socket error occurred */
        socket_error,

        /** Datagram exceeded buffer size and was truncated */
        datagram_truncated,

        /** Message could not be encoded; nothing was sent */
        encode_failed,

        /** Receive timeout (SO_RCVTIMEO expired) - non-terminal */
        timeout,

        /** Operation interrupted by signal (EINTR) - non-terminal */
        interrupted
    };

    /** Current state */
    State state{State::frame_ready};

    /** Number of bytes actually received (may be less than actual_size if truncated) */
    size_t bytes_received{0};

    /** Full datagram size when state == datagram_truncated */
    size_t actual_size{0};

    /** Kind tag of the last received frame; only valid if bytes_received >= 1 */
    uint8_t kind{0};

    /** Platform errno value for socket_error state */
    int errno_value{0};

    /**
     * @brief Check if the socket is in a terminal error state
     *
     * @return true if socket is closed or has a fatal error
     */
    bool is_terminal() const noexcept {
        return state == State::socket_closed || state == State::socket_error;
    }

    /**
     * @brief Check if the last datagram was truncated
     *
     * @return true if datagram exceeded buffer and was truncated
     */
    bool is_truncated() const noexcept { return state == State::datagram_truncated; }
};

/**
 * @brief Convert UDPTransportStatus::State to human-readable string
 *
 * @param state The transport state to convert
 * @return String representation of the state
 */
constexpr const char* transport_state_string(UDPTransportStatus::State state) noexcept {
    switch (state) {
        case UDPTransportStatus::State::frame_ready:
            return "frame_ready";
        case UDPTransportStatus::State::socket_closed:
            return "socket_closed";
        case UDPTransportStatus::State::socket_error:
            return "socket_error";
        case UDPTransportStatus::State::datagram_truncated:
            return "datagram_truncated";
        case UDPTransportStatus::State::encode_failed:
            return "encode_failed";
        case UDPTransportStatus::State::timeout:
            return "timeout";
        case UDPTransportStatus::State::interrupted:
            return "interrupted";
        default:
            return "unknown";
    }
}

} // namespace jseries::utils::netio
