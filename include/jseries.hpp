#pragma once

// JSERIES - Bit-packed tactical data-link message codec
//
// A header-only C++20 library for encoding and decoding J-series style
// messages into compact, fixed-size binary frames.
//
// Features:
// - Bit cursor for MSB-first fields that cross byte boundaries
// - Generic pack/unpack driven by constexpr field tables
// - Fixed-point quantization of geodetic inputs with overflow detection
// - J3.2 air track report (117-bit body, 15 bytes on the wire)
// - One-byte kind envelope with an extensible codec registry
// - Errors returned as values (Result<T>), no exceptions in the codec

// ====================
// Public API
// ====================

// Core types, error values and quantization policy
#include "jseries/core/types.hpp"
#include "jseries/core/result.hpp"
#include "jseries/core/quantization.hpp"

// Bit-level packing engine
#include "jseries/core/bit_cursor.hpp"
#include "jseries/core/bit_packer.hpp"

// Message kinds and envelope
#include "jseries/message/air_track.hpp"
#include "jseries/message/envelope.hpp"
