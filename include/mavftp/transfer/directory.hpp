#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <algorithm>
#include <echo/echo.hpp>

namespace mavftp {
    namespace transfer {

        // ─── Directory entries ───────────────────────────────────────────────────────
        enum class EntryKind : u8 { File, Directory };

        struct DirectoryEntry {
            dp::String name;
            EntryKind kind = EntryKind::File;
            u32 size = 0; // files only

            bool is_directory() const noexcept { return kind == EntryKind::Directory; }
            bool is_file() const noexcept { return kind == EntryKind::File; }

            dp::String full_path(const dp::String &dir) const {
                dp::String out = dir;
                if (out.empty() || out[out.size() - 1] != '/')
                    out += '/';
                out += name;
                return out;
            }
        };

        enum class EntryStatus : u8 { Ok, Skip, Malformed };

        // Remote: as the vehicle pages them out. ByName: byte-wise by name, kinds mixed.
        enum class ListOrder : u8 { Remote, ByName };

        struct ParsedEntry {
            EntryStatus status = EntryStatus::Malformed;
            DirectoryEntry entry;
        };

        // One listing record:
        //   F<name>\t<size>   regular file
        //   D<name>           directory
        //   S                 placeholder the remote could not stat
        inline ParsedEntry parse_entry(const dp::String &raw) {
            ParsedEntry out;
            if (raw.empty())
                return out;

            char type = raw[0];
            if (type == 'S') {
                out.status = EntryStatus::Skip;
                return out;
            }
            if (type != 'F' && type != 'D')
                return out;

            dp::String name;
            dp::String size_text;
            bool in_size = false;
            for (usize i = 1; i < raw.size(); ++i) {
                char c = raw[i];
                if (c == '\t' && !in_size) {
                    in_size = true;
                    continue;
                }
                if (in_size)
                    size_text += c;
                else
                    name += c;
            }
            if (name.empty())
                return out;

            u64 size = 0;
            if (type == 'F' && !size_text.empty()) {
                for (usize i = 0; i < size_text.size(); ++i) {
                    char c = size_text[i];
                    if (c < '0' || c > '9')
                        return out;
                    size = size * 10 + static_cast<u64>(c - '0');
                    if (size > 0xFFFFFFFFull)
                        return out;
                }
            }

            out.status = EntryStatus::Ok;
            out.entry.name = std::move(name);
            out.entry.kind = (type == 'D') ? EntryKind::Directory : EntryKind::File;
            out.entry.size = static_cast<u32>(size);
            return out;
        }

        // Splits a listing buffer on NUL or newline, dropping empty pieces
        inline dp::Vector<dp::String> split_fragments(const Bytes &buffer) {
            dp::Vector<dp::String> out;
            dp::String current;
            for (u8 b : buffer) {
                if (b == 0 || b == '\n') {
                    if (!current.empty()) {
                        out.push_back(current);
                        current.clear();
                    }
                } else {
                    current += static_cast<char>(b);
                }
            }
            if (!current.empty())
                out.push_back(current);
            return out;
        }

        // Records in one ListDirectory page; this is what advances the entry offset.
        inline u32 count_fragments(const Bytes &page) { return static_cast<u32>(split_fragments(page).size()); }

        // Entries in remote order. Skip markers vanish; malformed records are dropped one by
        // one so a damaged tail never costs the rest of the listing.
        inline dp::Vector<DirectoryEntry> parse_listing(const Bytes &buffer) {
            dp::Vector<DirectoryEntry> entries;
            for (const auto &fragment : split_fragments(buffer)) {
                auto parsed = parse_entry(fragment);
                switch (parsed.status) {
                case EntryStatus::Ok:
                    entries.push_back(std::move(parsed.entry));
                    break;
                case EntryStatus::Skip:
                    break;
                case EntryStatus::Malformed:
                    echo::category("mavftp.transfer").warn("skipping malformed listing record '", fragment, "'");
                    break;
                }
            }
            return entries;
        }

        inline bool name_before(const DirectoryEntry &a, const DirectoryEntry &b) noexcept {
            usize n = a.name.size() < b.name.size() ? a.name.size() : b.name.size();
            for (usize i = 0; i < n; ++i) {
                auto ca = static_cast<u8>(a.name[i]);
                auto cb = static_cast<u8>(b.name[i]);
                if (ca != cb)
                    return ca < cb;
            }
            return a.name.size() < b.name.size();
        }

        inline void sort_by_name(dp::Vector<DirectoryEntry> &entries) {
            std::sort(entries.begin(), entries.end(), name_before);
        }

    } // namespace transfer
    using namespace transfer;
} // namespace mavftp
