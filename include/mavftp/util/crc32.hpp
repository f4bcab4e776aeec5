#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace util {

        // ─── MAVLink FTP CRC32 ───────────────────────────────────────────────────────
        // Reflected polynomial 0xEDB88320, initial value 0 and no final xor; this is what
        // CalcFileCRC32 returns, so it differs from zlib's crc32 on purpose.
        namespace detail {
            struct Crc32Table {
                u32 entries[256];
            };

            inline constexpr Crc32Table make_crc32_table() noexcept {
                Crc32Table table{};
                for (u32 i = 0; i < 256; ++i) {
                    u32 c = i;
                    for (u8 bit = 0; bit < 8; ++bit)
                        c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
                    table.entries[i] = c;
                }
                return table;
            }

            inline constexpr Crc32Table CRC32_TABLE = make_crc32_table();
        } // namespace detail

        inline constexpr u32 crc32_update(u32 crc, const u8 *data, usize len) noexcept {
            for (usize i = 0; i < len; ++i)
                crc = detail::CRC32_TABLE.entries[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
            return crc;
        }

        inline u32 crc32(const Bytes &data) noexcept { return crc32_update(0, data.data(), data.size()); }

    } // namespace util
    using namespace util;
} // namespace mavftp
