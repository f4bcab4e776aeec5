#pragma once

#include "types.hpp"

namespace mavftp {

    // ─── Packet layout (MAVLink FILE_TRANSFER_PROTOCOL payload) ──────────────────
    inline constexpr usize PACKET_HEADER_SIZE = 12;
    inline constexpr usize PACKET_DATA_CAPACITY = 239;
    inline constexpr usize PACKET_SIZE = PACKET_HEADER_SIZE + PACKET_DATA_CAPACITY; // 251

    // ─── Session ids ─────────────────────────────────────────────────────────────
    inline constexpr SessionId NO_SESSION = 0;

    // ─── Timing defaults (ms) ────────────────────────────────────────────────────
    inline constexpr u32 DEFAULT_REQUEST_TIMEOUT_MS = 1000;
    inline constexpr u32 DEFAULT_MAX_TIMEOUT_MS = 8000; // backoff cap
    inline constexpr u32 DEFAULT_POLL_INTERVAL_MS = 10;
    inline constexpr u32 DEFAULT_MAX_RETRIES = 5;
    inline constexpr u32 DEFAULT_CLOSE_RETRIES = 1; // TerminateSession is best-effort

    // ─── Transfer defaults ───────────────────────────────────────────────────────
    inline constexpr u8 DEFAULT_CHUNK_SIZE = static_cast<u8>(PACKET_DATA_CAPACITY);
    inline constexpr u32 DEFAULT_BURST_REORDER_WINDOW = 16; // parked out-of-order packets
    inline constexpr u32 DEFAULT_BURST_RESUME_LIMIT = 3;    // resumes without progress

} // namespace mavftp
