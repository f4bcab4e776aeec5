#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace transport {

        // ─── Message transport boundary ──────────────────────────────────────────────
        // One call carries one complete FTP payload. Framing, link checksums and
        // connection setup belong to the implementation.
        class Transport {
          public:
            virtual ~Transport() = default;

            virtual Result<void> send(const Bytes &payload) = 0;

            // Waits at most wait_ms. An empty optional means nothing arrived; an error
            // means the link itself failed.
            virtual Result<dp::Optional<Bytes>> recv(u32 wait_ms) = 0;

            virtual dp::String name() const { return "transport"; }
        };

    } // namespace transport
    using namespace transport;
} // namespace mavftp
