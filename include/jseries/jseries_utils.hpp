#pragma once

// JSERIES Utilities
// Optional transport utilities that may allocate memory and use exceptions

// Network I/O (Linux/POSIX)
#if defined(__linux__) || defined(__unix__) || defined(__APPLE__)
    #include "jseries/utils/netio/udp_frame_reader.hpp"
    #include "jseries/utils/netio/udp_frame_writer.hpp"
#endif

#include "jseries.hpp"

namespace jseries {
// Import utilities into main namespace for convenience
#if defined(__linux__) || defined(__unix__) || defined(__APPLE__)
template <size_t MaxFrameBytes = 1500>
using UDPFrameReader = utils::netio::UDPFrameReader<MaxFrameBytes>;

using UDPFrameWriter = utils::netio::UDPFrameWriter;
#endif
} // namespace jseries
