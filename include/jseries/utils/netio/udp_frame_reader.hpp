#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <unistd.h>

#include "jseries/core/result.hpp"
#include "jseries/message/envelope.hpp"
#include "jseries/utils/netio/udp_transport_status.hpp"

// Linux/POSIX socket headers
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/uio.h>

namespace jseries::utils::netio {

/**
 * @brief Blocking UDP frame reader (Linux/POSIX)
 *
 * Receives one frame per UDP datagram and decodes it with the default codec
 * registry. The socket stays in blocking mode; use try_set_timeout() to bound
 * the wait.
 *
 * **Datagram Truncation**
 *
 * A datagram larger than MaxFrameBytes is detected via MSG_TRUNC and reported
 * as ShortBuffer(actual_bits, received_bits) from read_next_message(). The full
 * datagram size is available in transport_status().actual_size.
 *
 * @tparam MaxFrameBytes Size of the internal receive buffer
 *
 * Example usage:
 * @code
 * UDPFrameReader<> reader(5000);
 * reader.try_set_timeout(std::chrono::milliseconds(500));
 *
 * while (auto msg = reader.read_next_message()) {
 *     if (jseries::is_ok(*msg)) {
 *         const auto& report = std::get<jseries::AirTrackReport>(std::get<jseries::Message>(*msg));
 *         // ...
 *     }
 * }
 * @endcode
 */
template <size_t MaxFrameBytes = 1500>
class UDPFrameReader {
    static_assert(MaxFrameBytes > 0, "MaxFrameBytes must be positive");

public:
    /**
     * @brief Create UDP reader listening on specified port
     *
     * @param port UDP port to listen on (0 = ephemeral, see socket_port())
     * @throws std::runtime_error if socket creation or binding fails
     */
    explicit UDPFrameReader(uint16_t port) : socket_(-1), scratch_buffer_{}, status_{} {
        socket_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (socket_ < 0) {
            throw std::runtime_error("Failed to create UDP socket");
        }

        struct sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = INADDR_ANY;

        if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(socket_);
            throw std::runtime_error("Failed to bind UDP socket to port " + std::to_string(port));
        }
    }

    ~UDPFrameReader() noexcept {
        if (socket_ >= 0) {
            ::close(socket_);
        }
    }

    UDPFrameReader(const UDPFrameReader&) = delete;
    UDPFrameReader& operator=(const UDPFrameReader&) = delete;

    UDPFrameReader(UDPFrameReader&& other) noexcept
        : socket_(other.socket_),
          scratch_buffer_(other.scratch_buffer_),
          status_(other.status_) {
        other.socket_ = -1;
    }

    UDPFrameReader& operator=(UDPFrameReader&& other) noexcept {
        if (this != &other) {
            if (socket_ >= 0) {
                ::close(socket_);
            }
            socket_ = other.socket_;
            scratch_buffer_ = other.scratch_buffer_;
            status_ = other.status_;
            other.socket_ = -1;
        }
        return *this;
    }

    /**
     * @brief Receive the next datagram
     *
     * @return The datagram bytes (valid until the next read, empty for a
     *         zero-length datagram), or std::nullopt on timeout, truncation or
     *         error; see transport_status()
     */
    std::optional<std::span<const uint8_t>> read_next_frame() noexcept {
        return read_next_datagram();
    }

    /**
     * @brief Receive and decode the next frame
     *
     * @return Decoded message or codec failure, or std::nullopt on timeout,
     *         socket closure or error. Truncated datagrams yield ShortBuffer,
     *         and so do empty ones (ShortBuffer(8, 0)).
     */
    std::optional<Result<Message>> read_next_message() {
        auto bytes = read_next_datagram();

        if (!bytes) {
            if (status_.is_truncated()) {
                return Result<Message>{
                    CodecFailure::short_buffer(status_.actual_size * 8, status_.bytes_received * 8)};
            }
            return std::nullopt;
        }

        return decode_message(*bytes);
    }

    [[nodiscard]] const UDPTransportStatus& transport_status() const noexcept { return status_; }

    /**
     * @brief Set receive timeout for blocking operations (SO_RCVTIMEO)
     *
     * @param timeout Timeout duration (zero = infinite blocking)
     * @return true on success, false on failure
     */
    bool try_set_timeout(std::chrono::milliseconds timeout) noexcept {
        struct timeval tv {};
        tv.tv_sec = timeout.count() / 1000;
        tv.tv_usec = (timeout.count() % 1000) * 1000;

        return ::setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) >= 0;
    }

    bool is_open() const noexcept { return socket_ >= 0 && !status_.is_terminal(); }

    int socket_fd() const noexcept { return socket_; }

    /**
     * @brief Get the port the socket is bound to
     *
     * @return Port number, or 0 on error
     */
    uint16_t socket_port() const noexcept {
        struct sockaddr_in addr {};
        socklen_t addr_len = sizeof(addr);

        if (::getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) < 0) {
            return 0;
        }

        return ntohs(addr.sin_port);
    }

private:
    // Empty datagrams are valid frames; only failures return std::nullopt
    std::optional<std::span<const uint8_t>> read_next_datagram() noexcept {
        status_.bytes_received = 0;
        status_.actual_size = 0;
        status_.kind = 0;
        status_.errno_value = 0;

        struct iovec iov {};
        iov.iov_base = scratch_buffer_.data();
        iov.iov_len = scratch_buffer_.size();

        struct msghdr msg {};
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;

        // MSG_TRUNC makes recvmsg return the real datagram size even if truncated
        ssize_t bytes;
        while (true) {
            bytes = ::recvmsg(socket_, &msg, MSG_TRUNC);
            if (bytes >= 0) {
                break;
            }

            status_.errno_value = errno;
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                status_.state = UDPTransportStatus::State::timeout;
                return std::nullopt;
            }
            status_.state = UDPTransportStatus::State::socket_error;
            return std::nullopt;
        }

        if (bytes > 0) {
            status_.kind = scratch_buffer_[0];
        }

        if (msg.msg_flags & MSG_TRUNC) {
            status_.state = UDPTransportStatus::State::datagram_truncated;
            status_.actual_size = static_cast<size_t>(bytes);
            status_.bytes_received = std::min(scratch_buffer_.size(), static_cast<size_t>(bytes));
            return std::nullopt;
        }

        status_.state = UDPTransportStatus::State::frame_ready;
        status_.bytes_received = static_cast<size_t>(bytes);
        return std::span<const uint8_t>(scratch_buffer_.data(), static_cast<size_t>(bytes));
    }

    int socket_;                                    ///< UDP socket file descriptor
    std::array<uint8_t, MaxFrameBytes> scratch_buffer_; ///< Internal datagram buffer
    UDPTransportStatus status_;                     ///< Status of last receive operation
};

} // namespace jseries::utils::netio
