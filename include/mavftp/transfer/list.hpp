#pragma once

#include "directory.hpp"
#include "machine.hpp"

namespace mavftp {
    namespace transfer {

        // ─── Paginated ListDirectory ─────────────────────────────────────────────────
        // The offset of a ListDirectory request is an entry index, not a byte offset: every
        // page returns whole records and the next request starts after the last one counted.
        // The listing ends with an EOF Nak.
        class ListTransfer : public TransferMachine {
            Bytes buffer_;
            u32 entry_offset_ = 0;
            u32 pages_ = 0;
            dp::Vector<DirectoryEntry> entries_;

            Step finalize() {
                entries_ = parse_listing(buffer_);
                echo::category("mavftp.transfer")
                    .debug("list ", path_, ": ", entries_.size(), " entries in ", pages_, " pages");
                return Step::complete();
            }

          public:
            explicit ListTransfer(dp::String path) : TransferMachine("list", std::move(path)) {}

            Step begin() override {
                sm_.transition(TransferState::Opening);
                return Step::send(Packet::list_directory(path_, 0));
            }

            Step on_response(const Packet &response) override {
                if (response.is_nak()) {
                    if (response.nak_code() == NakCode::EndOfFile)
                        return finalize();
                    return remote_failure(response);
                }

                sm_.transition(TransferState::Listing);
                if (response.offset != entry_offset_)
                    return offset_mismatch(entry_offset_, response.offset);
                mismatches_ = 0;

                u32 records = count_fragments(response.data);
                if (records == 0)
                    return finalize(); // an empty page cannot advance the index

                buffer_.insert(buffer_.end(), response.data.begin(), response.data.end());
                buffer_.push_back(0); // keep the last record of this page separate from the next
                entry_offset_ += records;
                ++pages_;
                return Step::send(Packet::list_directory(path_, entry_offset_));
            }

            const dp::Vector<DirectoryEntry> &entries() const noexcept { return entries_; }
            dp::Vector<DirectoryEntry> take_entries() { return std::move(entries_); }
            u32 pages() const noexcept { return pages_; }
        };

    } // namespace transfer
    using namespace transfer;
} // namespace mavftp
