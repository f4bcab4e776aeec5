#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../session/retry.hpp"
#include "../transfer/machine.hpp"

namespace mavftp {
    namespace client {

        // ─── Client configuration ────────────────────────────────────────────────────
        // Chunk size and reorder window depend on what the remote implementation accepts;
        // both are tunable here rather than fixed in the protocol layer.
        struct ClientConfig {
            RetryPolicy retry;
            TransferOptions transfer;
            u32 poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
            u32 close_retries = DEFAULT_CLOSE_RETRIES;

            ClientConfig &timeout(u32 ms) {
                retry.timeout(ms);
                return *this;
            }
            ClientConfig &retries(u32 n) {
                retry.retries(n);
                return *this;
            }
            ClientConfig &backoff(Backoff b, u32 cap_ms = DEFAULT_MAX_TIMEOUT_MS) {
                retry.with_backoff(b, cap_ms);
                return *this;
            }
            ClientConfig &chunk_size(u8 bytes) {
                transfer.chunk(bytes);
                return *this;
            }
            ClientConfig &burst(bool enable) {
                transfer.use_burst(enable);
                return *this;
            }
            ClientConfig &reorder_window(u32 packets) {
                transfer.window(packets);
                return *this;
            }
            ClientConfig &resume_limit(u32 n) {
                transfer.resumes(n);
                return *this;
            }
            ClientConfig &poll_interval(u32 ms) {
                poll_interval_ms = ms;
                return *this;
            }
            ClientConfig &close_attempts(u32 retries_after_first) {
                close_retries = retries_after_first;
                return *this;
            }
        };

    } // namespace client
    using namespace client;
} // namespace mavftp
