// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <unistd.h>

#include "jseries/core/result.hpp"
#include "jseries/message/envelope.hpp"
#include "jseries/utils/netio/udp_transport_status.hpp"

// Linux/POSIX socket headers
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace jseries::utils::netio {

/**
 * @brief UDP frame writer (Linux/POSIX)
 *
 * Sends encoded frames as UDP datagrams, one frame per datagram. Frames are
 * plaintext envelope bytes; any sealing step happens before write_frame().
 *
 * Connection Modes:
 * - Bound mode: Connect to single endpoint, use send()
 * - Unbound mode: Specify destination per frame with sendto()
 *
 * MTU Enforcement:
 * - Default MTU: 1500 bytes
 * - Frames exceeding MTU are rejected (no fragmentation)
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 * - Safe to move between threads (move-only)
 *
 * Example usage:
 * @code
 * UDPFrameWriter writer("127.0.0.1", 5000);
 *
 * auto report = jseries::AirTrackReport::from_geo(42, 45.12, -122.98, 1500.0, 220, 27100);
 * if (jseries::is_ok(report)) {
 *     writer.write_message(std::get<jseries::AirTrackReport>(report));
 * }
 * @endcode
 */
class UDPFrameWriter {
public:
    static constexpr size_t default_mtu = 1500; ///< Default MTU in bytes

    /**
     * @brief Create writer in bound mode (single destination)
     *
     * @param host Destination hostname or IP address
     * @param port Destination UDP port
     * @throws std::runtime_error if socket creation or DNS resolution fails
     */
    explicit UDPFrameWriter(const std::string& host, uint16_t port)
        : socket_(-1),
          bound_mode_(true),
          dest_addr_{},
          mtu_(default_mtu),
          frames_sent_(0),
          bytes_sent_(0) {
        socket_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (socket_ < 0) {
            throw std::runtime_error("Failed to create UDP socket");
        }

        struct sockaddr_in addr {};
        if (!resolve_address(host, port, addr)) {
            ::close(socket_);
            throw std::runtime_error("Failed to resolve address: " + host);
        }

        if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(socket_);
            throw std::runtime_error("Failed to connect UDP socket to " + host + ":" +
                                     std::to_string(port));
        }

        dest_addr_ = addr;
        status_.state = UDPTransportStatus::State::frame_ready;
    }

    /**
     * @brief Create writer in unbound mode (per-frame destination)
     *
     * @param local_port Local port to bind (0 = any port)
     * @throws std::runtime_error if socket creation or binding fails
     */
    explicit UDPFrameWriter(uint16_t local_port = 0)
        : socket_(-1),
          bound_mode_(false),
          dest_addr_{},
          mtu_(default_mtu),
          frames_sent_(0),
          bytes_sent_(0) {
        socket_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (socket_ < 0) {
            throw std::runtime_error("Failed to create UDP socket");
        }

        struct sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(local_port);
        addr.sin_addr.s_addr = INADDR_ANY;

        if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(socket_);
            throw std::runtime_error("Failed to bind UDP socket to port " +
                                     std::to_string(local_port));
        }

        status_.state = UDPTransportStatus::State::frame_ready;
    }

    ~UDPFrameWriter() {
        if (socket_ >= 0) {
            ::close(socket_);
        }
    }

    // Move-only (socket ownership)
    UDPFrameWriter(const UDPFrameWriter&) = delete;
    UDPFrameWriter& operator=(const UDPFrameWriter&) = delete;

    UDPFrameWriter(UDPFrameWriter&& other) noexcept
        : socket_(other.socket_),
          bound_mode_(other.bound_mode_),
          dest_addr_(other.dest_addr_),
          mtu_(other.mtu_),
          frames_sent_(other.frames_sent_),
          bytes_sent_(other.bytes_sent_),
          status_(other.status_),
          last_failure_(other.last_failure_) {
        other.socket_ = -1;
        other.frames_sent_ = 0;
        other.bytes_sent_ = 0;
    }

    UDPFrameWriter& operator=(UDPFrameWriter&& other) noexcept {
        if (this != &other) {
            if (socket_ >= 0) {
                ::close(socket_);
            }

            socket_ = other.socket_;
            bound_mode_ = other.bound_mode_;
            dest_addr_ = other.dest_addr_;
            mtu_ = other.mtu_;
            frames_sent_ = other.frames_sent_;
            bytes_sent_ = other.bytes_sent_;
            status_ = other.status_;
            last_failure_ = other.last_failure_;

            other.socket_ = -1;
            other.frames_sent_ = 0;
            other.bytes_sent_ = 0;
        }
        return *this;
    }

    /**
     * @brief Write raw frame bytes (bound mode)
     *
     * @param frame Complete frame, sent as one datagram
     * @return true on success, false on error
     */
    bool write_frame(std::span<const uint8_t> frame) noexcept {
        if (!bound_mode_) {
            status_.state = UDPTransportStatus::State::socket_error;
            status_.errno_value = ENOTCONN;
            return false;
        }
        if (!check_mtu(frame)) {
            return false;
        }

        ssize_t sent = ::send(socket_, frame.data(), frame.size(), 0);
        return record_send(sent, frame.size());
    }

    /**
     * @brief Write raw frame bytes to a specific destination
     *
     * Usable in both modes; typically used in unbound mode.
     *
     * @param frame Complete frame, sent as one datagram
     * @param dest Destination address
     * @return true on success, false on error
     */
    bool write_frame(std::span<const uint8_t> frame, const struct sockaddr_in& dest) noexcept {
        if (!check_mtu(frame)) {
            return false;
        }

        ssize_t sent = ::sendto(socket_, frame.data(), frame.size(), 0,
                                reinterpret_cast<const struct sockaddr*>(&dest), sizeof(dest));
        return record_send(sent, frame.size());
    }

    /**
     * @brief Encode a message with the default registry and send it (bound mode)
     *
     * If encoding fails nothing is sent, state becomes encode_failed and the
     * failure is available from last_encode_failure().
     *
     * @param msg The message to send
     * @return true on success, false on encode or socket error
     */
    bool write_message(const Message& msg) {
        auto frame = encode_message(msg);
        if (!is_ok(frame)) {
            last_failure_ = failure_of(frame);
            status_.state = UDPTransportStatus::State::encode_failed;
            status_.errno_value = EINVAL;
            return false;
        }
        return write_frame(std::get<std::vector<uint8_t>>(frame));
    }

    void set_mtu(size_t mtu) noexcept { mtu_ = mtu; }

    /**
     * @brief Set send timeout (SO_SNDTIMEO)
     *
     * @param milliseconds Timeout in milliseconds (0 = infinite)
     * @return true on success, false on failure
     */
    bool set_send_timeout(int milliseconds) noexcept {
        struct timeval tv {};
        tv.tv_sec = milliseconds / 1000;
        tv.tv_usec = (milliseconds % 1000) * 1000;

        return ::setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) >= 0;
    }

    [[nodiscard]] size_t frames_sent() const noexcept { return frames_sent_; }

    /// Total bytes sent (UDP payload only)
    [[nodiscard]] size_t bytes_sent() const noexcept { return bytes_sent_; }

    [[nodiscard]] const UDPTransportStatus& transport_status() const noexcept { return status_; }

    /// Failure from the last write_message() that could not encode
    [[nodiscard]] const CodecFailure& last_encode_failure() const noexcept {
        return last_failure_;
    }

private:
    bool check_mtu(std::span<const uint8_t> frame) noexcept {
        if (frame.size() > mtu_) {
            status_.state = UDPTransportStatus::State::socket_error;
            status_.errno_value = EMSGSIZE;
            return false;
        }
        return true;
    }

    bool record_send(ssize_t sent, size_t expected) noexcept {
        if (sent < 0) {
            status_.state = map_errno_to_state(errno);
            status_.errno_value = errno;
            return false;
        }

        if (static_cast<size_t>(sent) != expected) {
            // Partial send (should not happen with UDP)
            status_.state = UDPTransportStatus::State::socket_error;
            status_.errno_value = EIO;
            return false;
        }

        frames_sent_++;
        bytes_sent_ += expected;
        status_.state = UDPTransportStatus::State::frame_ready;
        status_.errno_value = 0;
        return true;
    }

    static bool resolve_address(const std::string& host, uint16_t port,
                                struct sockaddr_in& out) noexcept {
        struct addrinfo hints {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;

        struct addrinfo* result = nullptr;
        int ret = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
        if (ret != 0 || result == nullptr) {
            return false;
        }

        // Use first result
        std::memcpy(&out, result->ai_addr, sizeof(struct sockaddr_in));
        out.sin_port = htons(port);

        ::freeaddrinfo(result);
        return true;
    }

    static UDPTransportStatus::State map_errno_to_state(int err) noexcept {
        switch (err) {
            case EAGAIN:
#if EAGAIN != EWOULDBLOCK
            case EWOULDBLOCK:
#endif
                return UDPTransportStatus::State::timeout;
            case EINTR:
                return UDPTransportStatus::State::interrupted;
            default:
                return UDPTransportStatus::State::socket_error;
        }
    }

    int socket_;                   ///< Socket file descriptor
    bool bound_mode_;              ///< True if connected to single destination
    struct sockaddr_in dest_addr_; ///< Destination address (bound mode)
    size_t mtu_;                   ///< Maximum transmission unit
    size_t frames_sent_;           ///< Total frames sent
    size_t bytes_sent_;            ///< Total bytes sent
    UDPTransportStatus status_{};  ///< Transport status
    CodecFailure last_failure_{};  ///< Last encode failure
};

} // namespace jseries::utils::netio
