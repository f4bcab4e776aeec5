#pragma once

#include "machine.hpp"

namespace mavftp {
    namespace transfer {

        // ─── File read: OpenFileRO, then chunked ReadFile or BurstReadFile ───────────
        //
        // Chunked: one ReadFile per chunk, each answered before the next is sent.
        //
        // Burst: one BurstReadFile and the remote streams packets until one carries
        // burst_complete. Packets ahead of the contiguous offset are parked (at most
        // reorder_window of them) and drained as the gap fills. A gap that cannot be filled
        // turns into a fresh BurstReadFile from the contiguous offset, so progress already
        // made is kept.
        //
        // Both modes stop once the size reported by OpenFileRO is reached or on an EOF Nak
        // at the expected offset.
        class ReadTransfer : public TransferMachine {
            TransferOptions opts_;
            Bytes buffer_;
            u32 offset_ = 0;
            dp::Optional<u32> file_size_;

            bool burst_ = false;
            bool burst_data_seen_ = false;
            bool burst_ended_ = false;
            u32 burst_origin_ = 0;
            u32 resumes_without_progress_ = 0;
            u32 resumes_ = 0;
            dp::Map<u32, Bytes> parked_; // offset -> data

            bool reached_end() const noexcept { return file_size_.has_value() && offset_ >= *file_size_; }

            void append(const Bytes &data, usize skip = 0) {
                if (skip >= data.size())
                    return;
                buffer_.insert(buffer_.end(), data.begin() + static_cast<isize>(skip), data.end());
                offset_ += static_cast<u32>(data.size() - skip);
                on_progress.emit(offset_, file_size_.has_value() ? *file_size_ : 0);
            }

            // Feed parked packets that now touch the contiguous offset; discard stale ones.
            void drain_parked() {
                bool progressed = true;
                while (progressed && !parked_.empty()) {
                    progressed = false;
                    for (auto it = parked_.begin(); it != parked_.end(); ++it) {
                        u32 start = it->first;
                        u32 end = start + static_cast<u32>(it->second.size());
                        if (end <= offset_) {
                            parked_.erase(it);
                            progressed = true;
                            break;
                        }
                        if (start <= offset_) {
                            Bytes data = std::move(it->second);
                            parked_.erase(it);
                            append(data, offset_ - start);
                            progressed = true;
                            break;
                        }
                    }
                }
            }

            Step request_next() {
                if (!burst_)
                    return Step::send(Packet::read_file(offset_, opts_.chunk_size));
                burst_origin_ = offset_;
                burst_ended_ = false;
                parked_.clear();
                return Step::send_burst(Packet::burst_read(offset_, opts_.chunk_size));
            }

            Step resume_burst(const char *reason) {
                if (offset_ == burst_origin_) {
                    if (++resumes_without_progress_ > opts_.resume_limit)
                        return violation("burst stalled at offset " + dp::String(std::to_string(offset_)) + " (" +
                                         reason + ")");
                } else {
                    resumes_without_progress_ = 0;
                }
                ++resumes_;
                echo::category("mavftp.transfer").debug("read ", path_, ": resuming burst at ", offset_, " (", reason, ")");
                return request_next();
            }

            Step on_chunk(const Packet &response) {
                if (response.is_nak()) {
                    if (response.nak_code() == NakCode::EndOfFile)
                        return Step::complete();
                    return remote_failure(response);
                }
                if (response.offset != offset_)
                    return offset_mismatch(offset_, response.offset);
                mismatches_ = 0;

                if (response.data.empty())
                    return Step::complete();
                append(response.data);
                if (reached_end())
                    return Step::complete();
                return request_next();
            }

            // EOF ends the read only when nothing is missing below it: either the remote hit
            // the end exactly at our contiguous offset (a file that shrank counts), or the
            // advertised size is already covered. Anything else is a lost packet.
            Step on_burst_eof(const Packet &response) {
                if (reached_end())
                    return Step::complete();
                if (parked_.empty()) {
                    if (response.offset == offset_)
                        return Step::complete();
                    if (!file_size_.has_value() && response.offset < offset_)
                        return Step::complete();
                }
                return resume_burst("end of file reported past a gap");
            }

            Step on_burst(const Packet &response) {
                if (response.is_nak()) {
                    if (response.nak_code() == NakCode::EndOfFile)
                        return on_burst_eof(response);
                    if (!burst_data_seen_) {
                        echo::category("mavftp.transfer")
                            .info("read ", path_, ": burst rejected (", to_string(response.nak_code()),
                                  "), falling back to chunked reads");
                        burst_ = false;
                        return request_next();
                    }
                    return remote_failure(response);
                }

                burst_data_seen_ = true;
                u32 start = response.offset;
                u32 end = start + static_cast<u32>(response.data.size());

                if (start <= offset_) {
                    if (end > offset_)
                        append(response.data, offset_ - start);
                    drain_parked();
                } else if (parked_.find(start) == parked_.end()) {
                    if (parked_.size() >= opts_.reorder_window)
                        return resume_burst("reorder window full");
                    parked_[start] = response.data;
                }

                if (reached_end())
                    return Step::complete();
                if (response.burst_complete)
                    burst_ended_ = true;
                if (burst_ended_ && parked_.empty())
                    return resume_burst("burst ended before end of file");
                return Step::wait();
            }

          public:
            ReadTransfer(dp::String path, TransferOptions opts = {})
                : TransferMachine("read", std::move(path)), opts_(opts) {
                if (opts_.chunk_size == 0 || opts_.chunk_size > PACKET_DATA_CAPACITY)
                    opts_.chunk_size = DEFAULT_CHUNK_SIZE;
            }

            Step begin() override {
                sm_.transition(TransferState::Opening);
                return Step::send(Packet::open_read(path_));
            }

            Step on_response(const Packet &response) override {
                if (sm_.is(TransferState::Opening)) {
                    if (response.is_nak())
                        return remote_failure(response);
                    file_size_ = response.data_u32();
                    sm_.transition(TransferState::Reading);
                    burst_ = opts_.burst;
                    echo::category("mavftp.transfer")
                        .debug("read ", path_, ": opened session ", response.session, ", size ",
                               file_size_.has_value() ? *file_size_ : 0, burst_ ? " (burst)" : " (chunked)");
                    // A zero-length file still gets its first request; the EOF answer ends it.
                    return request_next();
                }
                if (!sm_.is(TransferState::Reading))
                    return Step::wait();
                return burst_ ? on_burst(response) : on_chunk(response);
            }

            Step on_timeout() override {
                // Data arrived since the last burst request: ask for the rest instead of
                // replaying the whole burst.
                if (burst_ && sm_.is(TransferState::Reading) && offset_ > burst_origin_)
                    return resume_burst("burst stalled");
                return Step::resend();
            }

            const Bytes &data() const noexcept { return buffer_; }
            Bytes take_data() { return std::move(buffer_); }
            u32 offset() const noexcept { return offset_; }
            const dp::Optional<u32> &file_size() const noexcept { return file_size_; }
            bool burst_active() const noexcept { return burst_; }
            u32 resumes() const noexcept { return resumes_; }
            usize parked() const noexcept { return parked_.size(); }
        };

    } // namespace transfer
    using namespace transfer;
} // namespace mavftp
