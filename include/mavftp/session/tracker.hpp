#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/packet.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace mavftp {
    namespace session {

        // ─── Session mode ────────────────────────────────────────────────────────────
        enum class SessionMode : u8 { Read, Write, Create };

        inline const char *to_string(SessionMode mode) noexcept {
            switch (mode) {
            case SessionMode::Read:
                return "read";
            case SessionMode::Write:
                return "write";
            case SessionMode::Create:
                return "create";
            }
            return "unknown";
        }

        // ─── Open remote file ────────────────────────────────────────────────────────
        struct Session {
            SessionId id = NO_SESSION;
            dp::String path;
            SessionMode mode = SessionMode::Read;
            u32 current_offset = 0;
        };

        // ─── Sent but unanswered request ─────────────────────────────────────────────
        struct OutstandingRequest {
            SequenceNumber sequence = 0;
            u64 sent_at_ms = 0;
            u32 retry_count = 0;
            Packet packet;
            bool burst = false; // stays open across many responses until resolved
        };

        enum class MatchResult : u8 { Accepted, Stale, SessionMismatch };

        inline const char *to_string(MatchResult r) noexcept {
            switch (r) {
            case MatchResult::Accepted:
                return "accepted";
            case MatchResult::Stale:
                return "stale";
            case MatchResult::SessionMismatch:
                return "session mismatch";
            }
            return "unknown";
        }

        // Opcodes that act on the open session and therefore carry its id
        inline constexpr bool uses_session(Opcode op) noexcept {
            return op == Opcode::ReadFile || op == Opcode::BurstReadFile || op == Opcode::WriteFile ||
                   op == Opcode::TerminateSession;
        }

        // ─── Sequence & session tracker ──────────────────────────────────────────────
        // Owns the sequence counter, the single outstanding request and the open session.
        // One instance per engine; nothing here is global.
        class SessionTracker {
            SequenceNumber next_sequence_ = 0;
            dp::Optional<OutstandingRequest> outstanding_;
            dp::Optional<OutstandingRequest> last_answered_;
            dp::Optional<Session> session_;
            u32 stale_count_ = 0;
            u32 accepted_count_ = 0;

          public:
            explicit SessionTracker(SequenceNumber first_sequence = 0) : next_sequence_(first_sequence) {}

            // Stamps sequence number and session id, then registers the packet as outstanding.
            Result<OutstandingRequest> send_request(Packet packet, bool burst = false, u64 now_ms = 0) {
                if (outstanding_.has_value()) {
                    return Result<OutstandingRequest>::err(Error::request_in_flight(outstanding_->sequence));
                }

                packet.sequence = next_sequence_++;
                if (uses_session(packet.opcode)) {
                    packet.session = session_.has_value() ? session_->id : NO_SESSION;
                }

                OutstandingRequest req;
                req.sequence = packet.sequence;
                req.sent_at_ms = now_ms;
                req.packet = std::move(packet);
                req.burst = burst;
                outstanding_ = req;
                last_answered_ = dp::nullopt;

                echo::category("mavftp.tracker")
                    .trace("outstanding seq=", req.sequence, " op=", to_string(req.packet.opcode),
                           burst ? " (burst)" : "");
                return Result<OutstandingRequest>::ok(std::move(req));
            }

            // Classifies a decoded response against the outstanding request. A non-burst
            // request is retired on acceptance so that a duplicate answer reads as stale.
            MatchResult match_response(const Packet &response) {
                if (!outstanding_.has_value() || !response.is_response() ||
                    response.sequence != outstanding_->sequence ||
                    response.request_opcode != outstanding_->packet.opcode) {
                    ++stale_count_;
                    echo::category("mavftp.tracker")
                        .trace("dropping stale response seq=", response.sequence, " op=",
                               to_string(response.request_opcode));
                    return MatchResult::Stale;
                }

                // Session 0 is a real id, so the check keys off the tracked session, not the value.
                const Packet &request = outstanding_->packet;
                if (uses_session(request.opcode) && session_.has_value() && response.session != session_->id) {
                    echo::category("mavftp.tracker")
                        .warn("session mismatch: expected ", session_->id, " got ", response.session);
                    return MatchResult::SessionMismatch;
                }

                ++accepted_count_;
                if (!outstanding_->burst) {
                    last_answered_ = outstanding_;
                    outstanding_ = dp::nullopt;
                }
                return MatchResult::Accepted;
            }

            // Puts the most recent request back in flight with its original sequence number.
            Result<OutstandingRequest> reissue() {
                if (outstanding_.has_value()) {
                    outstanding_->retry_count++;
                    return Result<OutstandingRequest>::ok(*outstanding_);
                }
                if (!last_answered_.has_value()) {
                    return Result<OutstandingRequest>::err(Error::invalid_state("nothing to reissue"));
                }
                outstanding_ = last_answered_;
                outstanding_->retry_count++;
                last_answered_ = dp::nullopt;
                return Result<OutstandingRequest>::ok(*outstanding_);
            }

            void record_retry() noexcept {
                if (outstanding_.has_value())
                    outstanding_->retry_count++;
            }

            // Ends the outstanding request, e.g. a finished burst
            void resolve() noexcept {
                if (outstanding_.has_value())
                    last_answered_ = outstanding_;
                outstanding_ = dp::nullopt;
            }

            // Forget everything about the remote: used after retries are exhausted or a reset.
            void abandon() noexcept {
                outstanding_ = dp::nullopt;
                last_answered_ = dp::nullopt;
                if (session_.has_value()) {
                    echo::category("mavftp.tracker").debug("abandoning session ", session_->id);
                }
                session_ = dp::nullopt;
            }

            // ─── Session lifetime ────────────────────────────────────────────────────
            void open_session(SessionId id, dp::String path, SessionMode mode) {
                Session s;
                s.id = id;
                s.path = std::move(path);
                s.mode = mode;
                echo::category("mavftp.tracker").debug("session ", id, " opened (", to_string(mode), ") ", s.path);
                session_ = std::move(s);
            }

            void close_session() noexcept {
                if (session_.has_value()) {
                    echo::category("mavftp.tracker").debug("session ", session_->id, " released");
                }
                session_ = dp::nullopt;
            }

            void advance(u32 bytes) noexcept {
                if (session_.has_value())
                    session_->current_offset += bytes;
            }

            // ─── Accessors ───────────────────────────────────────────────────────────
            bool has_outstanding() const noexcept { return outstanding_.has_value(); }
            const dp::Optional<OutstandingRequest> &outstanding() const noexcept { return outstanding_; }
            bool has_session() const noexcept { return session_.has_value(); }
            const dp::Optional<Session> &session() const noexcept { return session_; }
            SequenceNumber next_sequence() const noexcept { return next_sequence_; }
            u32 stale_count() const noexcept { return stale_count_; }
            u32 accepted_count() const noexcept { return accepted_count_; }
        };

    } // namespace session
    using namespace session;
} // namespace mavftp
