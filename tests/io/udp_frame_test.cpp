// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <array>
#include <chrono>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include <arpa/inet.h>
#include <cerrno>
#include <gtest/gtest.h>
#include <jseries/jseries_utils.hpp>
#include <netinet/in.h>

using namespace jseries;
using jseries::utils::netio::UDPTransportStatus;

// Test fixture for UDP frame transport tests
class UDPFrameTest : public ::testing::Test {
protected:
    static constexpr auto timeout = std::chrono::milliseconds(500);

    static AirTrackReport sample_report(uint16_t track = 42) {
        auto r = AirTrackReport::from_geo(track, 45.1234567, -122.9876543, 1500.9, 220, 27100);
        EXPECT_TRUE(is_ok(r));
        return std::get<AirTrackReport>(r);
    }

    static struct sockaddr_in loopback(uint16_t port) {
        struct sockaddr_in dest {};
        dest.sin_family = AF_INET;
        dest.sin_port = htons(port);
        dest.sin_addr.s_addr = inet_addr("127.0.0.1");
        return dest;
    }
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(UDPFrameTest, CreateWriters) {
    EXPECT_NO_THROW({
        UDPFrameWriter bound("127.0.0.1", 15100);
        EXPECT_EQ(bound.frames_sent(), 0u);
        EXPECT_EQ(bound.bytes_sent(), 0u);
    });
    EXPECT_NO_THROW({
        UDPFrameWriter unbound(0);
        EXPECT_EQ(unbound.frames_sent(), 0u);
    });
}

TEST_F(UDPFrameTest, ReaderEphemeralPort) {
    UDPFrameReader<> reader(uint16_t(0));
    EXPECT_TRUE(reader.is_open());
    EXPECT_GE(reader.socket_fd(), 0);
    EXPECT_GT(reader.socket_port(), 0);
}

// =============================================================================
// Send and receive
// =============================================================================

TEST_F(UDPFrameTest, MessageRoundTrip) {
    UDPFrameReader<> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(timeout));

    UDPFrameWriter writer("127.0.0.1", reader.socket_port());
    auto report = sample_report();
    ASSERT_TRUE(writer.write_message(Message{report}));
    EXPECT_EQ(writer.frames_sent(), 1u);
    EXPECT_EQ(writer.bytes_sent(), air_track_frame_bytes);

    auto received = reader.read_next_message();

    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(is_ok(*received));
    EXPECT_EQ(std::get<AirTrackReport>(std::get<Message>(*received)), report);
    EXPECT_EQ(reader.transport_status().state, UDPTransportStatus::State::frame_ready);
    EXPECT_EQ(reader.transport_status().kind, kind::air_track);
    EXPECT_EQ(reader.transport_status().bytes_received, air_track_frame_bytes);
}

TEST_F(UDPFrameTest, MultipleFramesInOrder) {
    UDPFrameReader<> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(timeout));

    UDPFrameWriter writer("127.0.0.1", reader.socket_port());
    for (uint16_t track = 1; track <= 5; ++track) {
        ASSERT_TRUE(writer.write_message(Message{sample_report(track)}));
    }
    EXPECT_EQ(writer.frames_sent(), 5u);
    EXPECT_EQ(writer.bytes_sent(), 5 * air_track_frame_bytes);

    for (uint16_t track = 1; track <= 5; ++track) {
        auto received = reader.read_next_message();
        ASSERT_TRUE(received.has_value());
        ASSERT_TRUE(is_ok(*received));
        EXPECT_EQ(std::get<AirTrackReport>(std::get<Message>(*received)).track, track);
    }
}

TEST_F(UDPFrameTest, UnboundWriterSendsToDestination) {
    UDPFrameReader<> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(timeout));

    UDPFrameWriter writer(0);
    auto frame = encode_message(Message{sample_report()});
    ASSERT_TRUE(is_ok(frame));
    const auto& bytes = std::get<std::vector<uint8_t>>(frame);

    ASSERT_TRUE(writer.write_frame(bytes, loopback(reader.socket_port())));

    auto received = reader.read_next_frame();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(std::vector<uint8_t>(received->begin(), received->end()), bytes);
}

TEST_F(UDPFrameTest, UnboundWriterNeedsDestination) {
    UDPFrameWriter writer(0);
    const std::array<uint8_t, 4> frame = {0x32, 0x00, 0x00, 0x00};

    EXPECT_FALSE(writer.write_frame(frame));
    EXPECT_EQ(writer.transport_status().errno_value, ENOTCONN);
    EXPECT_EQ(writer.frames_sent(), 0u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(UDPFrameTest, EncodeFailureSendsNothing) {
    UDPFrameWriter writer("127.0.0.1", 15100);
    auto report = sample_report();
    report.parity = 0xFF;

    EXPECT_FALSE(writer.write_message(Message{report}));
    EXPECT_EQ(writer.transport_status().state, UDPTransportStatus::State::encode_failed);
    EXPECT_EQ(writer.transport_status().errno_value, EINVAL);
    EXPECT_EQ(writer.last_encode_failure(), CodecFailure::quantization_overflow("parity"));
    EXPECT_EQ(writer.frames_sent(), 0u);
}

TEST_F(UDPFrameTest, EnforceMTU) {
    UDPFrameWriter writer("127.0.0.1", 15100);
    writer.set_mtu(8);

    EXPECT_FALSE(writer.write_message(Message{sample_report()}));
    EXPECT_EQ(writer.transport_status().errno_value, EMSGSIZE);
    EXPECT_EQ(writer.frames_sent(), 0u);
}

TEST_F(UDPFrameTest, TruncatedDatagramReportsShortBuffer) {
    UDPFrameReader<8> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(timeout));

    UDPFrameWriter writer("127.0.0.1", reader.socket_port());
    ASSERT_TRUE(writer.write_message(Message{sample_report()}));

    auto received = reader.read_next_message();

    ASSERT_TRUE(received.has_value());
    ASSERT_FALSE(is_ok(*received));
    EXPECT_EQ(failure_of(*received), CodecFailure::short_buffer(128, 64));
    EXPECT_TRUE(reader.transport_status().is_truncated());
    EXPECT_EQ(reader.transport_status().actual_size, air_track_frame_bytes);
    EXPECT_EQ(reader.transport_status().kind, kind::air_track);
}

TEST_F(UDPFrameTest, UnknownKindSurfacesAsCodecFailure) {
    UDPFrameReader<> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(timeout));

    UDPFrameWriter writer("127.0.0.1", reader.socket_port());
    std::vector<uint8_t> frame(16, 0x00);
    frame[0] = 0x99;
    ASSERT_TRUE(writer.write_frame(frame));

    auto received = reader.read_next_message();

    ASSERT_TRUE(received.has_value());
    ASSERT_FALSE(is_ok(*received));
    EXPECT_EQ(failure_of(*received), CodecFailure::unsupported_kind(0x99));
}

// A zero-length datagram is a malformed frame, not a closed socket
TEST_F(UDPFrameTest, EmptyDatagramReportsShortBuffer) {
    UDPFrameReader<> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(timeout));

    UDPFrameWriter writer("127.0.0.1", reader.socket_port());
    ASSERT_TRUE(writer.write_frame(std::span<const uint8_t>{}));
    ASSERT_TRUE(writer.write_message(Message{sample_report()}));

    auto empty = reader.read_next_message();

    ASSERT_TRUE(empty.has_value());
    ASSERT_FALSE(is_ok(*empty));
    EXPECT_EQ(failure_of(*empty), CodecFailure::short_buffer(8, 0));
    EXPECT_EQ(reader.transport_status().state, UDPTransportStatus::State::frame_ready);
    EXPECT_EQ(reader.transport_status().bytes_received, 0u);
    EXPECT_TRUE(reader.is_open());

    // The reader keeps going after the empty frame
    auto next = reader.read_next_message();
    ASSERT_TRUE(next.has_value());
    ASSERT_TRUE(is_ok(*next));
    EXPECT_EQ(std::get<AirTrackReport>(std::get<Message>(*next)), sample_report());
}

TEST_F(UDPFrameTest, ReadTimeout) {
    UDPFrameReader<> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(std::chrono::milliseconds(50)));

    auto received = reader.read_next_message();

    EXPECT_FALSE(received.has_value());
    EXPECT_EQ(reader.transport_status().state, UDPTransportStatus::State::timeout);
    EXPECT_TRUE(reader.is_open());
}

// =============================================================================
// Move Semantics
// =============================================================================

TEST_F(UDPFrameTest, WriterMoveKeepsCounters) {
    UDPFrameReader<> reader(uint16_t(0));
    ASSERT_TRUE(reader.try_set_timeout(timeout));

    UDPFrameWriter writer1("127.0.0.1", reader.socket_port());
    ASSERT_TRUE(writer1.write_message(Message{sample_report()}));

    UDPFrameWriter writer2(std::move(writer1));
    EXPECT_EQ(writer2.frames_sent(), 1u);
    EXPECT_TRUE(writer2.write_message(Message{sample_report()}));
    EXPECT_EQ(writer2.frames_sent(), 2u);

    for (int i = 0; i < 2; ++i) {
        auto received = reader.read_next_message();
        ASSERT_TRUE(received.has_value());
        EXPECT_TRUE(is_ok(*received));
    }
}
