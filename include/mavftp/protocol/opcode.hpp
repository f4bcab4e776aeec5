#pragma once

#include "../core/types.hpp"

namespace mavftp {
    namespace protocol {

        // ─── MAVLink FTP opcodes ─────────────────────────────────────────────────────
        // Raw values outside this set survive decoding unchanged; is_known() tells them apart.
        enum class Opcode : u8 {
            None = 0,
            TerminateSession = 1,
            ResetSessions = 2,
            ListDirectory = 3,
            OpenFileRO = 4,
            ReadFile = 5,
            CreateFile = 6,
            WriteFile = 7,
            RemoveFile = 8,
            CreateDirectory = 9,
            RemoveDirectory = 10,
            OpenFileWO = 11,
            TruncateFile = 12,
            Rename = 13,
            CalcFileCRC32 = 14,
            BurstReadFile = 15,
            Ack = 128,
            Nak = 129
        };

        // ─── Nak error codes (first data byte of a Nak) ──────────────────────────────
        enum class NakCode : u8 {
            None = 0,
            Fail = 1,
            FailErrno = 2,
            InvalidDataSize = 3,
            InvalidSession = 4,
            NoSessionsAvailable = 5,
            EndOfFile = 6,
            UnknownCommand = 7,
            FileExists = 8,
            FileProtected = 9,
            FileNotFound = 10,
            Unknown = 0xFF
        };

        inline constexpr bool is_known(Opcode op) noexcept {
            auto raw = static_cast<u8>(op);
            return raw <= static_cast<u8>(Opcode::BurstReadFile) || op == Opcode::Ack || op == Opcode::Nak;
        }

        // Maps a raw Nak byte onto the closed set, folding anything unrecognised into Unknown
        inline constexpr NakCode nak_from_raw(u8 raw) noexcept {
            if (raw <= static_cast<u8>(NakCode::FileNotFound))
                return static_cast<NakCode>(raw);
            return NakCode::Unknown;
        }

        // Requests whose Ack carries a freshly assigned session id
        inline constexpr bool opens_session(Opcode op) noexcept {
            return op == Opcode::OpenFileRO || op == Opcode::OpenFileWO || op == Opcode::CreateFile;
        }

        inline const char *to_string(Opcode op) noexcept {
            switch (op) {
            case Opcode::None:
                return "None";
            case Opcode::TerminateSession:
                return "TerminateSession";
            case Opcode::ResetSessions:
                return "ResetSessions";
            case Opcode::ListDirectory:
                return "ListDirectory";
            case Opcode::OpenFileRO:
                return "OpenFileRO";
            case Opcode::ReadFile:
                return "ReadFile";
            case Opcode::CreateFile:
                return "CreateFile";
            case Opcode::WriteFile:
                return "WriteFile";
            case Opcode::RemoveFile:
                return "RemoveFile";
            case Opcode::CreateDirectory:
                return "CreateDirectory";
            case Opcode::RemoveDirectory:
                return "RemoveDirectory";
            case Opcode::OpenFileWO:
                return "OpenFileWO";
            case Opcode::TruncateFile:
                return "TruncateFile";
            case Opcode::Rename:
                return "Rename";
            case Opcode::CalcFileCRC32:
                return "CalcFileCRC32";
            case Opcode::BurstReadFile:
                return "BurstReadFile";
            case Opcode::Ack:
                return "Ack";
            case Opcode::Nak:
                return "Nak";
            }
            return "Unknown";
        }

        inline const char *to_string(NakCode code) noexcept {
            switch (code) {
            case NakCode::None:
                return "No error";
            case NakCode::Fail:
                return "Unknown failure";
            case NakCode::FailErrno:
                return "Command failed, errno sent back";
            case NakCode::InvalidDataSize:
                return "Payload size is invalid";
            case NakCode::InvalidSession:
                return "Session is not currently open";
            case NakCode::NoSessionsAvailable:
                return "All available sessions are already in use";
            case NakCode::EndOfFile:
                return "Offset past end of file";
            case NakCode::UnknownCommand:
                return "Unknown command";
            case NakCode::FileExists:
                return "File/directory already exists";
            case NakCode::FileProtected:
                return "File/directory is write protected";
            case NakCode::FileNotFound:
                return "File/directory not found";
            case NakCode::Unknown:
                break;
            }
            return "Unknown remote error";
        }

    } // namespace protocol
    using namespace protocol;
} // namespace mavftp
