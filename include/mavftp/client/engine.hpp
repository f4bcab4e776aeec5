#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/packet.hpp"
#include "../session/retry.hpp"
#include "../session/tracker.hpp"
#include "../transfer/machine.hpp"
#include "../transport/transport.hpp"
#include "config.hpp"
#include <atomic>
#include <chrono>
#include <echo/echo.hpp>

namespace mavftp {
    namespace client {

        // ─── Protocol engine ─────────────────────────────────────────────────────────
        // Runs one TransferMachine to completion over the transport: stamps and sends its
        // requests, waits for matching responses, resends on timeout and closes whatever
        // session the operation opened. The engine is the only sender on the transport,
        // so sequence numbers never race.
        //
        // Waits happen in transport recv() calls of at most poll_interval_ms; every return
        // is a suspension point where cancellation and the retry timer are checked.
        class Engine {
            using Clock = std::chrono::steady_clock;

            struct Poll {
                dp::Optional<Packet> packet;
                u32 elapsed_ms = 0;
            };

            Transport &transport_;
            ClientConfig config_;
            SessionTracker tracker_;
            RetryController retry_;
            std::atomic<bool> cancel_{false};
            Clock::time_point created_ = Clock::now();
            Clock::time_point last_tick_ = Clock::now();
            u32 malformed_ = 0;
            u32 packets_sent_ = 0;

            u64 now_ms() const {
                return static_cast<u64>(
                    std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - created_).count());
            }

            void restart_clock() { last_tick_ = Clock::now(); }

            // Time charged to the retry timer since the last tick. A recv that came back
            // empty counts as a full poll interval even if the transport returned early.
            u32 tick(bool idle) {
                auto now = Clock::now();
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick_);
                if (idle && ms.count() < static_cast<i64>(config_.poll_interval_ms)) {
                    last_tick_ = now;
                    return config_.poll_interval_ms;
                }
                last_tick_ += ms;
                return static_cast<u32>(ms.count());
            }

            Result<void> send_packet(const Packet &packet) {
                echo::category("mavftp.engine")
                    .debug("-> seq=", packet.sequence, " ", to_string(packet.opcode), " session=", packet.session,
                           " offset=", packet.offset, " size=", packet.size);
                auto sent = transport_.send(packet.encode());
                if (sent.is_err())
                    return sent;
                ++packets_sent_;
                return {};
            }

            // New request: new sequence number and a fresh retry budget
            Result<void> transmit(Packet packet, bool burst) {
                if (tracker_.has_outstanding())
                    tracker_.resolve(); // a burst being replaced by its resume request

                auto req = tracker_.send_request(std::move(packet), burst, now_ms());
                if (req.is_err())
                    return Result<void>::err(req.error());

                retry_.arm();
                restart_clock();
                return send_packet(req.value().packet);
            }

            // Same request again with its original sequence number. A corrective resend
            // asked for by the machine draws on the retry budget; a timeout resend was
            // already counted by the retry controller.
            Result<void> retransmit(bool corrective) {
                if (corrective && !retry_.consume_retry())
                    return Result<void>::err(Error::timeout("retry budget exhausted by corrective resends"));

                auto req = tracker_.reissue();
                if (req.is_err())
                    return Result<void>::err(req.error());

                restart_clock();
                return send_packet(req.value().packet);
            }

            Result<Poll> poll() {
                auto rx = transport_.recv(config_.poll_interval_ms);
                if (rx.is_err()) {
                    echo::category("mavftp.engine").error("receive failed on ", transport_.name(), ": ",
                                                          rx.error().message);
                    return Result<Poll>::err(rx.error());
                }

                Poll out;
                const auto &raw = rx.value();
                out.elapsed_ms = tick(!raw.has_value());
                if (!raw.has_value())
                    return Result<Poll>::ok(std::move(out));

                auto decoded = Packet::decode(*raw);
                if (decoded.is_err()) {
                    ++malformed_;
                    echo::category("mavftp.engine").trace("dropping malformed packet: ", decoded.error().message);
                    return Result<Poll>::ok(std::move(out));
                }
                out.packet = std::move(decoded.value());
                return Result<Poll>::ok(std::move(out));
            }

            // Session bookkeeping that follows from an accepted Ack
            void note_accepted(const TransferMachine &machine, const Packet &response) {
                if (!response.is_ack())
                    return;
                if (opens_session(response.request_opcode)) {
                    tracker_.open_session(response.session, machine.path(), machine.session_mode());
                } else if (response.request_opcode == Opcode::ResetSessions) {
                    tracker_.close_session();
                } else if (response.request_opcode == Opcode::ReadFile ||
                           response.request_opcode == Opcode::BurstReadFile) {
                    tracker_.advance(static_cast<u32>(response.data.size()));
                }
            }

            Result<Step> await(TransferMachine &machine) {
                while (true) {
                    if (cancel_.load())
                        return Result<Step>::err(Error::cancelled());

                    auto polled = poll();
                    if (polled.is_err())
                        return Result<Step>::err(polled.error());

                    const auto &incoming = polled.value().packet;
                    if (incoming.has_value()) {
                        const Packet &response = *incoming;
                        echo::category("mavftp.engine")
                            .trace("<- seq=", response.sequence, " ", to_string(response.opcode), " for ",
                                   to_string(response.request_opcode), " offset=", response.offset,
                                   " size=", response.size);

                        switch (tracker_.match_response(response)) {
                        case MatchResult::Accepted:
                            retry_.progress();
                            restart_clock();
                            note_accepted(machine, response);
                            return Result<Step>::ok(machine.on_response(response));
                        case MatchResult::SessionMismatch:
                            return Result<Step>::err(Error::protocol_violation(
                                "response for session " + dp::String(std::to_string(response.session)) +
                                ", expected " +
                                dp::String(std::to_string(tracker_.outstanding()->packet.session))));
                        case MatchResult::Stale:
                            break;
                        }
                    }

                    switch (retry_.update(polled.value().elapsed_ms)) {
                    case RetryAction::None:
                        break;
                    case RetryAction::Resend: {
                        Step step = machine.on_timeout();
                        if (!step.is(Step::Kind::Resend))
                            return Result<Step>::ok(std::move(step));
                        auto sent = retransmit(false);
                        if (sent.is_err())
                            return Result<Step>::err(sent.error());
                        break;
                    }
                    case RetryAction::Exhausted: {
                        dp::String what = tracker_.has_outstanding()
                                              ? dp::String(to_string(tracker_.outstanding()->packet.opcode))
                                              : dp::String("request");
                        return Result<Step>::err(Error::timeout(
                            "no response to " + what + " after " +
                            dp::String(std::to_string(retry_.retries() + 1)) + " attempts"));
                    }
                    }
                }
            }

            Result<void> drive(TransferMachine &machine) {
                Step step = machine.begin();
                while (true) {
                    switch (step.kind) {
                    case Step::Kind::Send: {
                        auto sent = transmit(std::move(step.packet), step.burst);
                        if (sent.is_err())
                            return sent;
                        break;
                    }
                    case Step::Kind::Resend: {
                        auto sent = retransmit(true);
                        if (sent.is_err())
                            return sent;
                        break;
                    }
                    case Step::Kind::Wait:
                        break;
                    case Step::Kind::Complete:
                        return {};
                    case Step::Kind::Fail:
                        return Result<void>::err(std::move(step.error));
                    }

                    auto next = await(machine);
                    if (next.is_err())
                        return Result<void>::err(next.error());
                    step = std::move(next.value());
                }
            }

            // Best-effort TerminateSession. Cancellation is not checked here and the result
            // never changes the outcome already decided for the operation.
            void close_session() {
                if (!tracker_.has_session())
                    return;
                SessionId id = tracker_.session()->id;

                RetryController closer(RetryPolicy(config_.retry).retries(config_.close_retries));
                auto req = tracker_.send_request(Packet::terminate_session(), false, now_ms());
                if (req.is_err()) {
                    tracker_.abandon();
                    return;
                }

                closer.arm();
                restart_clock();
                bool acknowledged = false;
                auto sent = send_packet(req.value().packet);
                while (sent.is_ok() && !acknowledged) {
                    auto polled = poll();
                    if (polled.is_err())
                        break;
                    const auto &incoming = polled.value().packet;
                    if (incoming.has_value() && tracker_.match_response(*incoming) == MatchResult::Accepted) {
                        acknowledged = true;
                        break;
                    }
                    auto action = closer.update(polled.value().elapsed_ms);
                    if (action == RetryAction::Exhausted)
                        break;
                    if (action == RetryAction::Resend) {
                        auto again = tracker_.reissue();
                        if (again.is_err())
                            break;
                        sent = send_packet(again.value().packet);
                    }
                }

                if (tracker_.has_outstanding())
                    tracker_.resolve();
                tracker_.close_session();
                if (acknowledged)
                    echo::category("mavftp.engine").debug("session ", id, " terminated");
                else
                    echo::category("mavftp.engine").warn("session ", id, " not confirmed closed, released locally");
            }

            Result<void> finish(TransferMachine &machine, Result<void> outcome) {
                retry_.disarm();
                if (tracker_.has_outstanding())
                    tracker_.resolve();

                if (tracker_.has_session()) {
                    machine.enter_closing();
                    if (outcome.is_err() && outcome.error().code == ErrorCode::Transport)
                        tracker_.abandon(); // nothing can reach the remote
                    else
                        close_session();
                }
                machine.finish(outcome.is_ok());

                if (outcome.is_ok()) {
                    echo::category("mavftp.engine").debug(machine.operation(), " ", machine.path(), ": done");
                    return outcome;
                }

                Error error = outcome.error();
                error.with_context(machine.operation(), machine.path());
                if (error.code == ErrorCode::Cancelled)
                    echo::category("mavftp.engine").warn(error.describe());
                else
                    echo::category("mavftp.engine").error(error.describe());
                return Result<void>::err(std::move(error));
            }

          public:
            explicit Engine(Transport &transport, ClientConfig config = {})
                : transport_(transport), config_(config), retry_(config.retry) {}

            Engine(const Engine &) = delete;
            Engine &operator=(const Engine &) = delete;

            // Drives the machine from begin() to Done or Failed. Errors carry the
            // machine's operation name and path.
            Result<void> run(TransferMachine &machine) {
                echo::category("mavftp.engine").debug(machine.operation(), " ", machine.path(), ": start");
                if (tracker_.has_outstanding())
                    tracker_.resolve();
                return finish(machine, drive(machine));
            }

            // Safe from any thread; honoured at the next suspension point
            void cancel() noexcept { cancel_.store(true); }
            void clear_cancel() noexcept { cancel_.store(false); }
            bool cancel_requested() const noexcept { return cancel_.load(); }

            void set_config(ClientConfig config) {
                config_ = config;
                retry_.set_policy(config.retry);
            }

            const ClientConfig &config() const noexcept { return config_; }
            const SessionTracker &tracker() const noexcept { return tracker_; }
            const RetryController &retry() const noexcept { return retry_; }
            u32 malformed_count() const noexcept { return malformed_; }
            u32 packets_sent() const noexcept { return packets_sent_; }
        };

    } // namespace client
    using namespace client;
} // namespace mavftp
