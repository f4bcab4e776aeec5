#pragma once

#include "machine.hpp"

namespace mavftp {
    namespace transfer {

        // ─── Single request / response operations ────────────────────────────────────
        // create, mkdir, rmdir, remove, truncate, rename and reset-sessions. A CreateFile
        // Ack opens a session; the engine closes it once this machine completes.
        class CommandTransfer : public TransferMachine {
            Packet request_;
            SessionMode mode_;

          public:
            CommandTransfer(dp::String operation, dp::String path, Packet request,
                            SessionMode mode = SessionMode::Create)
                : TransferMachine(std::move(operation), std::move(path)), request_(std::move(request)), mode_(mode) {}

            Step begin() override {
                sm_.transition(TransferState::Opening);
                return Step::send(request_);
            }

            Step on_response(const Packet &response) override {
                if (response.is_nak())
                    return remote_failure(response);
                return Step::complete();
            }

            SessionMode session_mode() const noexcept override { return mode_; }
        };

        // ─── CalcFileCRC32 ───────────────────────────────────────────────────────────
        class CrcTransfer : public TransferMachine {
            u32 crc_ = 0;

          public:
            explicit CrcTransfer(dp::String path) : TransferMachine("crc", std::move(path)) {}

            Step begin() override {
                sm_.transition(TransferState::Opening);
                return Step::send(Packet::calc_crc32(path_));
            }

            Step on_response(const Packet &response) override {
                if (response.is_nak())
                    return remote_failure(response);

                sm_.transition(TransferState::ComputingCrc);
                auto value = response.data_u32();
                if (!value.has_value())
                    return violation("CRC response carries " + dp::String(std::to_string(response.size)) +
                                     " bytes, need 4");
                crc_ = *value;
                return Step::complete();
            }

            u32 crc() const noexcept { return crc_; }
        };

    } // namespace transfer
    using namespace transfer;
} // namespace mavftp
