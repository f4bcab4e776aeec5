#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "transport.hpp"
#include <chrono>
#include <echo/echo.hpp>
#include <memory>
#include <thread>
#include <wirebit/link.hpp>

namespace mavftp {
    namespace transport {

        // ─── Link transport configuration ────────────────────────────────────────────
        struct LinkTransportConfig {
            u32 poll_sleep_ms = 1; // pause between empty link reads while waiting

            LinkTransportConfig &poll_sleep(u32 ms) {
                poll_sleep_ms = ms;
                return *this;
            }
        };

        // ─── FTP over a wirebit link ─────────────────────────────────────────────────
        // Each link frame's payload is exactly one FTP packet; whatever frames the
        // payload (MAVLink, a PTY, shared memory) sits below the link.
        //
        // Usage:
        //   auto shm = wirebit::ShmLink::attach("vehicle_ftp");
        //   auto link = std::make_shared<wirebit::ShmLink>(std::move(shm.value()));
        //   LinkTransport transport(link, frame_type);
        //   Client client(transport);
        class LinkTransport : public Transport {
            std::shared_ptr<wirebit::Link> link_;
            wirebit::FrameType frame_type_;
            LinkTransportConfig config_;
            u32 frames_sent_ = 0;
            u32 frames_received_ = 0;

          public:
            LinkTransport(std::shared_ptr<wirebit::Link> link, wirebit::FrameType frame_type,
                          LinkTransportConfig config = {})
                : link_(std::move(link)), frame_type_(frame_type), config_(config) {}

            Result<void> send(const Bytes &payload) override {
                if (!link_)
                    return Result<void>::err(Error::transport("no link attached"));

                wirebit::Bytes frame_payload(payload.size());
                for (usize i = 0; i < payload.size(); ++i)
                    frame_payload[i] = payload[i];

                auto result = link_->send(wirebit::make_frame(frame_type_, std::move(frame_payload), 0, 0));
                if (!result.is_ok()) {
                    echo::category("mavftp.link").error("send failed on ", name());
                    return Result<void>::err(Error::transport("send failed on " + name()));
                }
                ++frames_sent_;
                return {};
            }

            Result<dp::Optional<Bytes>> recv(u32 wait_ms) override {
                if (!link_)
                    return Result<dp::Optional<Bytes>>::err(Error::transport("no link attached"));

                auto start = std::chrono::steady_clock::now();
                while (true) {
                    // Links report "nothing pending" as an error; treat it as an empty read
                    auto result = link_->recv();
                    if (result.is_ok()) {
                        const auto &frame = result.value();
                        Bytes out;
                        out.reserve(frame.payload.size());
                        for (usize i = 0; i < frame.payload.size(); ++i)
                            out.push_back(static_cast<u8>(frame.payload[i]));
                        ++frames_received_;
                        return Result<dp::Optional<Bytes>>::ok(dp::Optional<Bytes>(std::move(out)));
                    }

                    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - start)
                                      .count();
                    if (waited >= static_cast<i64>(wait_ms))
                        return Result<dp::Optional<Bytes>>::ok(dp::Optional<Bytes>());
                    std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_sleep_ms));
                }
            }

            dp::String name() const override {
                if (!link_)
                    return "link:<none>";
                return "link:" + dp::String(link_->name().c_str());
            }

            u32 frames_sent() const noexcept { return frames_sent_; }
            u32 frames_received() const noexcept { return frames_received_; }
        };

    } // namespace transport
    using namespace transport;
} // namespace mavftp
