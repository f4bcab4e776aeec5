#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/packet.hpp"
#include "../session/tracker.hpp"
#include "../util/event.hpp"
#include "../util/state_machine.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace mavftp {
    namespace transfer {

        // ─── Transfer states ─────────────────────────────────────────────────────────
        enum class TransferState : u8 { Idle, Opening, Reading, Writing, Listing, ComputingCrc, Closing, Done, Failed };

        inline const char *to_string(TransferState s) noexcept {
            switch (s) {
            case TransferState::Idle:
                return "Idle";
            case TransferState::Opening:
                return "Opening";
            case TransferState::Reading:
                return "Reading";
            case TransferState::Writing:
                return "Writing";
            case TransferState::Listing:
                return "Listing";
            case TransferState::ComputingCrc:
                return "ComputingCrc";
            case TransferState::Closing:
                return "Closing";
            case TransferState::Done:
                return "Done";
            case TransferState::Failed:
                return "Failed";
            }
            return "Unknown";
        }

        // ─── Tuning shared by all transfers ──────────────────────────────────────────
        struct TransferOptions {
            u8 chunk_size = DEFAULT_CHUNK_SIZE;                // bytes per ReadFile/WriteFile/burst packet
            bool burst = true;                                 // prefer BurstReadFile for reads
            u32 reorder_window = DEFAULT_BURST_REORDER_WINDOW; // parked out-of-order burst packets
            u32 resume_limit = DEFAULT_BURST_RESUME_LIMIT;     // burst resumes without progress

            TransferOptions &chunk(u8 bytes) {
                chunk_size = bytes;
                return *this;
            }
            TransferOptions &use_burst(bool enable) {
                burst = enable;
                return *this;
            }
            TransferOptions &window(u32 packets) {
                reorder_window = packets;
                return *this;
            }
            TransferOptions &resumes(u32 n) {
                resume_limit = n;
                return *this;
            }
        };

        // ─── What the engine should do next ──────────────────────────────────────────
        struct Step {
            enum class Kind : u8 {
                Send,     // new request, new sequence number
                Resend,   // same request again, same sequence number
                Wait,     // keep receiving
                Complete, // logical operation finished
                Fail      // abort with error
            };

            Kind kind = Kind::Wait;
            Packet packet;
            bool burst = false;
            Error error;

            static Step send(Packet p) {
                Step s;
                s.kind = Kind::Send;
                s.packet = std::move(p);
                return s;
            }
            static Step send_burst(Packet p) {
                Step s = send(std::move(p));
                s.burst = true;
                return s;
            }
            static Step resend() {
                Step s;
                s.kind = Kind::Resend;
                return s;
            }
            static Step wait() { return Step{}; }
            static Step complete() {
                Step s;
                s.kind = Kind::Complete;
                return s;
            }
            static Step fail(Error e) {
                Step s;
                s.kind = Kind::Fail;
                s.error = std::move(e);
                return s;
            }

            bool is(Kind k) const noexcept { return kind == k; }
        };

        // ─── Base for every multi-round-trip operation ───────────────────────────────
        // Machines never touch the transport: they turn responses into Steps and the engine
        // does the sending, matching and timing.
        class TransferMachine {
          protected:
            StateMachine<TransferState> sm_{TransferState::Idle};
            dp::String operation_;
            dp::String path_;
            u32 mismatches_ = 0;

            Step remote_failure(const Packet &nak) const {
                echo::category("mavftp.transfer")
                    .debug(operation_, " ", path_, ": nak ", to_string(nak.nak_code()), " for ",
                           to_string(nak.request_opcode));
                return Step::fail(Error::remote(nak.nak_code(), nak.nak_errno()));
            }

            Step violation(dp::String msg) const {
                echo::category("mavftp.transfer").warn(operation_, " ", path_, ": ", msg);
                return Step::fail(Error::protocol_violation(std::move(msg)));
            }

            // A response at the wrong offset may be a late duplicate, so the request is sent
            // once more; a second consecutive mismatch means the remote is inconsistent.
            Step offset_mismatch(u32 expected, u32 got) {
                ++mismatches_;
                dp::String detail = "offset mismatch: expected " + dp::String(std::to_string(expected)) + ", got " +
                                    dp::String(std::to_string(got));
                if (mismatches_ > 1)
                    return violation(std::move(detail));
                echo::category("mavftp.transfer").debug(operation_, " ", path_, ": ", detail, ", retrying once");
                return Step::resend();
            }

          public:
            TransferMachine(dp::String operation, dp::String path)
                : operation_(std::move(operation)), path_(std::move(path)) {}
            virtual ~TransferMachine() = default;

            TransferMachine(const TransferMachine &) = delete;
            TransferMachine &operator=(const TransferMachine &) = delete;

            // First request of the operation
            virtual Step begin() = 0;

            // Called only with responses the tracker accepted
            virtual Step on_response(const Packet &response) = 0;

            // The retry controller expired; default is to repeat the outstanding request
            virtual Step on_timeout() { return Step::resend(); }

            // Mode recorded for a session opened by this machine's first request
            virtual SessionMode session_mode() const noexcept { return SessionMode::Read; }

            void enter_closing() { sm_.transition(TransferState::Closing); }
            void finish(bool ok) { sm_.transition(ok ? TransferState::Done : TransferState::Failed); }

            TransferState state() const noexcept { return sm_.state(); }
            const dp::String &operation() const noexcept { return operation_; }
            const dp::String &path() const noexcept { return path_; }
            StateMachine<TransferState> &states() noexcept { return sm_; }

            Event<u32, u32> on_progress; // (bytes done, bytes expected or 0 if unknown)
        };

    } // namespace transfer
    using namespace transfer;
} // namespace mavftp
