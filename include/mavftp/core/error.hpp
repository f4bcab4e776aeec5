#pragma once

#include "../protocol/opcode.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace mavftp {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        Transport,
        Timeout,
        MalformedPacket,
        ProtocolViolation,
        RemoteError,
        Cancelled,
        InvalidState,
        InvalidArgument,
        RequestInFlight,
    };

    inline const char *to_string(ErrorCode code) noexcept {
        switch (code) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::Transport:
            return "transport failure";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::MalformedPacket:
            return "malformed packet";
        case ErrorCode::ProtocolViolation:
            return "protocol violation";
        case ErrorCode::RemoteError:
            return "remote error";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::InvalidState:
            return "invalid state";
        case ErrorCode::InvalidArgument:
            return "invalid argument";
        case ErrorCode::RequestInFlight:
            return "request already in flight";
        }
        return "unknown";
    }

    // ─── Error type ──────────────────────────────────────────────────────────────
    // operation/path are filled in by the engine once the failing call is known, so
    // a CLI can print "read /logs/a.bin: remote error: File/directory not found".
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;
        NakCode nak = NakCode::None;
        u8 remote_errno = 0;
        dp::String operation;
        dp::String path;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error transport(dp::String msg = "") noexcept { return Error(ErrorCode::Transport, std::move(msg)); }
        static Error timeout(dp::String msg = "") noexcept { return Error(ErrorCode::Timeout, std::move(msg)); }
        static Error malformed_packet(dp::String msg = "") noexcept {
            return Error(ErrorCode::MalformedPacket, std::move(msg));
        }
        static Error protocol_violation(dp::String msg = "") noexcept {
            return Error(ErrorCode::ProtocolViolation, std::move(msg));
        }
        static Error remote(NakCode nak, u8 err = 0) noexcept {
            Error e(ErrorCode::RemoteError, to_string(nak));
            e.nak = nak;
            e.remote_errno = err;
            if (nak == NakCode::FailErrno)
                e.message += " (errno " + dp::String(std::to_string(err)) + ")";
            return e;
        }
        static Error cancelled() noexcept { return Error(ErrorCode::Cancelled, "cancelled by caller"); }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error invalid_argument(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidArgument, std::move(msg));
        }
        // A second request while one is still unanswered
        static Error request_in_flight(SequenceNumber sequence) noexcept {
            return Error(ErrorCode::RequestInFlight, "seq " + dp::String(std::to_string(sequence)));
        }

        // Attach the user-level operation and remote path; the first context wins.
        Error &with_context(const dp::String &op, const dp::String &remote_path) {
            if (operation.empty()) {
                operation = op;
                path = remote_path;
            }
            return *this;
        }

        bool is_remote(NakCode expected) const noexcept { return code == ErrorCode::RemoteError && nak == expected; }

        dp::String describe() const {
            dp::String out;
            if (!operation.empty()) {
                out += operation;
                if (!path.empty()) {
                    out += " ";
                    out += path;
                }
                out += ": ";
            }
            out += to_string(code);
            if (!message.empty()) {
                out += ": ";
                out += message;
            }
            return out;
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace mavftp
