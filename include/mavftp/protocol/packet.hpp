#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "opcode.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace protocol {

        // ─── FTP packet (payload of FILE_TRANSFER_PROTOCOL) ──────────────────────────
        // Layout, little-endian:
        //   [0-1] sequence  [2] session  [3] opcode  [4] size  [5] request opcode
        //   [6] burst complete  [7] padding  [8-11] offset  [12-250] data
        //
        // `size` is authoritative. For ReadFile/BurstReadFile requests it is the number of
        // bytes asked for while `data` stays empty, so the two are kept separately.
        struct Packet {
            SequenceNumber sequence = 0;
            SessionId session = NO_SESSION;
            Opcode opcode = Opcode::None;
            u8 size = 0;
            Opcode request_opcode = Opcode::None;
            bool burst_complete = false;
            u32 offset = 0;
            Bytes data;

            bool is_ack() const noexcept { return opcode == Opcode::Ack; }
            bool is_nak() const noexcept { return opcode == Opcode::Nak; }
            bool is_response() const noexcept { return is_ack() || is_nak(); }

            NakCode nak_code() const noexcept {
                if (!is_nak() || data.empty())
                    return NakCode::Unknown;
                return nak_from_raw(data[0]);
            }

            u8 nak_errno() const noexcept {
                if (!is_nak() || data.size() < 2)
                    return 0;
                return data[1];
            }

            dp::Optional<u32> data_u32(usize at = 0) const noexcept {
                if (at + 4 > data.size())
                    return dp::nullopt;
                return static_cast<u32>(data[at]) | (static_cast<u32>(data[at + 1]) << 8) |
                       (static_cast<u32>(data[at + 2]) << 16) | (static_cast<u32>(data[at + 3]) << 24);
            }

            // ─── Codec ───────────────────────────────────────────────────────────────
            Bytes encode() const {
                Bytes out(PACKET_SIZE, 0);
                out[0] = static_cast<u8>(sequence & 0xFF);
                out[1] = static_cast<u8>((sequence >> 8) & 0xFF);
                out[2] = session;
                out[3] = static_cast<u8>(opcode);
                out[4] = size;
                out[5] = static_cast<u8>(request_opcode);
                out[6] = burst_complete ? 1 : 0;
                out[7] = 0;
                out[8] = static_cast<u8>(offset & 0xFF);
                out[9] = static_cast<u8>((offset >> 8) & 0xFF);
                out[10] = static_cast<u8>((offset >> 16) & 0xFF);
                out[11] = static_cast<u8>((offset >> 24) & 0xFF);

                usize n = data.size() > PACKET_DATA_CAPACITY ? PACKET_DATA_CAPACITY : data.size();
                for (usize i = 0; i < n; ++i)
                    out[PACKET_HEADER_SIZE + i] = data[i];
                return out;
            }

            static Result<Packet> decode(const Bytes &raw) {
                if (raw.size() != PACKET_SIZE) {
                    return Result<Packet>::err(Error::malformed_packet(
                        "expected " + dp::String(std::to_string(PACKET_SIZE)) + " bytes, got " +
                        dp::String(std::to_string(raw.size()))));
                }
                if (raw[4] > PACKET_DATA_CAPACITY) {
                    return Result<Packet>::err(
                        Error::malformed_packet("declared size " + dp::String(std::to_string(raw[4])) +
                                                " exceeds data capacity"));
                }

                Packet p;
                p.sequence = static_cast<u16>(raw[0]) | (static_cast<u16>(raw[1]) << 8);
                p.session = raw[2];
                p.opcode = static_cast<Opcode>(raw[3]);
                p.size = raw[4];
                p.request_opcode = static_cast<Opcode>(raw[5]);
                p.burst_complete = raw[6] != 0;
                p.offset = static_cast<u32>(raw[8]) | (static_cast<u32>(raw[9]) << 8) |
                           (static_cast<u32>(raw[10]) << 16) | (static_cast<u32>(raw[11]) << 24);
                p.data.reserve(p.size);
                for (usize i = 0; i < p.size; ++i)
                    p.data.push_back(raw[PACKET_HEADER_SIZE + i]);
                return Result<Packet>::ok(std::move(p));
            }

            // ─── Request builders ────────────────────────────────────────────────────
            static bool fits(const dp::String &text) noexcept { return text.size() <= PACKET_DATA_CAPACITY; }

            static Packet command(Opcode op, u32 off = 0) {
                Packet p;
                p.opcode = op;
                p.offset = off;
                return p;
            }

            static Packet with_path(Opcode op, const dp::String &path, u32 off = 0) {
                Packet p = command(op, off);
                usize n = path.size() > PACKET_DATA_CAPACITY ? PACKET_DATA_CAPACITY : path.size();
                for (usize i = 0; i < n; ++i)
                    p.data.push_back(static_cast<u8>(path[i]));
                p.size = static_cast<u8>(n);
                return p;
            }

            static Packet terminate_session() { return command(Opcode::TerminateSession); }
            static Packet reset_sessions() { return command(Opcode::ResetSessions); }

            static Packet list_directory(const dp::String &path, u32 entry_offset) {
                return with_path(Opcode::ListDirectory, path, entry_offset);
            }

            static Packet open_read(const dp::String &path) { return with_path(Opcode::OpenFileRO, path); }
            static Packet open_write(const dp::String &path) { return with_path(Opcode::OpenFileWO, path); }
            static Packet create_file(const dp::String &path) { return with_path(Opcode::CreateFile, path); }
            static Packet remove_file(const dp::String &path) { return with_path(Opcode::RemoveFile, path); }
            static Packet create_directory(const dp::String &path) {
                return with_path(Opcode::CreateDirectory, path);
            }
            static Packet remove_directory(const dp::String &path) {
                return with_path(Opcode::RemoveDirectory, path);
            }
            static Packet calc_crc32(const dp::String &path) { return with_path(Opcode::CalcFileCRC32, path); }

            // Offset carries the new length
            static Packet truncate_file(const dp::String &path, u32 length) {
                return with_path(Opcode::TruncateFile, path, length);
            }

            static Packet rename(const dp::String &from, const dp::String &to) {
                dp::String joined = from;
                joined += '\0';
                joined += to;
                return with_path(Opcode::Rename, joined);
            }

            static Packet read_file(u32 off, u8 max_bytes) {
                Packet p = command(Opcode::ReadFile, off);
                p.size = max_bytes;
                return p;
            }

            static Packet burst_read(u32 off, u8 max_bytes_per_packet) {
                Packet p = command(Opcode::BurstReadFile, off);
                p.size = max_bytes_per_packet;
                return p;
            }

            static Packet write_file(u32 off, const u8 *chunk, usize len) {
                Packet p = command(Opcode::WriteFile, off);
                usize n = len > PACKET_DATA_CAPACITY ? PACKET_DATA_CAPACITY : len;
                p.data.reserve(n);
                for (usize i = 0; i < n; ++i)
                    p.data.push_back(chunk[i]);
                p.size = static_cast<u8>(n);
                return p;
            }

            // ─── Response builders ───────────────────────────────────────────────────
            static Packet ack_for(const Packet &request, Bytes payload = {}) {
                Packet p;
                p.sequence = request.sequence;
                p.session = request.session;
                p.opcode = Opcode::Ack;
                p.request_opcode = request.opcode;
                p.offset = request.offset;
                if (payload.size() > PACKET_DATA_CAPACITY)
                    payload.resize(PACKET_DATA_CAPACITY);
                p.size = static_cast<u8>(payload.size());
                p.data = std::move(payload);
                return p;
            }

            static Packet nak_for(const Packet &request, NakCode code, u8 err = 0) {
                Packet p;
                p.sequence = request.sequence;
                p.session = request.session;
                p.opcode = Opcode::Nak;
                p.request_opcode = request.opcode;
                p.offset = request.offset;
                p.data.push_back(static_cast<u8>(code));
                if (code == NakCode::FailErrno)
                    p.data.push_back(err);
                p.size = static_cast<u8>(p.data.size());
                return p;
            }
        };

        // Little-endian u32 as stored in Ack payloads (file size, CRC, bytes written)
        inline Bytes u32_payload(u32 value) {
            Bytes out(4, 0);
            out[0] = static_cast<u8>(value & 0xFF);
            out[1] = static_cast<u8>((value >> 8) & 0xFF);
            out[2] = static_cast<u8>((value >> 16) & 0xFF);
            out[3] = static_cast<u8>((value >> 24) & 0xFF);
            return out;
        }

    } // namespace protocol
    using namespace protocol;
} // namespace mavftp
