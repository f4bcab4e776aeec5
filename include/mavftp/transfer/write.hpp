#pragma once

#include "machine.hpp"

namespace mavftp {
    namespace transfer {

        // ─── How the remote file is opened for writing ───────────────────────────────
        enum class WriteMode : u8 {
            Create,   // CreateFile: create, or truncate an existing file
            Overwrite // OpenFileWO: existing file, written from offset 0 without truncation
        };

        // ─── File write: open, then one acknowledged WriteFile per chunk ─────────────
        // Writes are never burst; the next chunk leaves only after the previous Ack.
        class WriteTransfer : public TransferMachine {
            TransferOptions opts_;
            Bytes content_;
            WriteMode mode_;
            u32 offset_ = 0;
            u32 chunk_len_ = 0;
            u32 chunks_ = 0;

            u32 total() const noexcept { return static_cast<u32>(content_.size()); }

            Step next_chunk() {
                u32 remaining = total() - offset_;
                chunk_len_ = remaining < opts_.chunk_size ? remaining : opts_.chunk_size;
                ++chunks_;
                return Step::send(Packet::write_file(offset_, content_.data() + offset_, chunk_len_));
            }

          public:
            WriteTransfer(dp::String path, Bytes content, WriteMode mode = WriteMode::Create, TransferOptions opts = {})
                : TransferMachine("write", std::move(path)), opts_(opts), content_(std::move(content)), mode_(mode) {
                if (opts_.chunk_size == 0 || opts_.chunk_size > PACKET_DATA_CAPACITY)
                    opts_.chunk_size = DEFAULT_CHUNK_SIZE;
            }

            Step begin() override {
                sm_.transition(TransferState::Opening);
                if (mode_ == WriteMode::Create)
                    return Step::send(Packet::create_file(path_));
                return Step::send(Packet::open_write(path_));
            }

            Step on_response(const Packet &response) override {
                if (response.is_nak())
                    return remote_failure(response);

                if (sm_.is(TransferState::Opening)) {
                    sm_.transition(TransferState::Writing);
                    on_progress.emit(0, total());
                    if (content_.empty())
                        return Step::complete();
                    return next_chunk();
                }

                if (response.offset != offset_)
                    return offset_mismatch(offset_, response.offset);
                mismatches_ = 0;

                // The Ack may report how many bytes the remote actually stored
                u32 written = chunk_len_;
                auto reported = response.data_u32();
                if (reported.has_value() && *reported < chunk_len_) {
                    if (*reported == 0)
                        return violation("remote stored 0 bytes at offset " + dp::String(std::to_string(offset_)));
                    written = *reported;
                }

                offset_ += written;
                on_progress.emit(offset_, total());
                if (offset_ >= total())
                    return Step::complete();
                return next_chunk();
            }

            SessionMode session_mode() const noexcept override {
                return mode_ == WriteMode::Create ? SessionMode::Create : SessionMode::Write;
            }

            u32 offset() const noexcept { return offset_; }
            u32 chunks() const noexcept { return chunks_; }
        };

    } // namespace transfer
    using namespace transfer;
} // namespace mavftp
