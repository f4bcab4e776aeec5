#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/packet.hpp"
#include "../transfer/command.hpp"
#include "../transfer/directory.hpp"
#include "../transfer/list.hpp"
#include "../transfer/read.hpp"
#include "../transfer/write.hpp"
#include "../transport/transport.hpp"
#include "../util/event.hpp"
#include "config.hpp"
#include "engine.hpp"
#include <echo/echo.hpp>
#include <mutex>

namespace mavftp {
    namespace client {

        // ─── File transfer client ────────────────────────────────────────────────────
        // Filesystem operations on the remote. Calls are serialised behind one operation
        // lock; cancel() may be called from any thread, including a progress listener.
        //
        // Usage:
        //   Client ftp(transport, ClientConfig{}.timeout(500).retries(3));
        //   ftp.reset_sessions();
        //   auto entries = ftp.list("/fs/microsd");
        //   auto log = ftp.read("/fs/microsd/log/01.ulg");
        class Client {
            Engine engine_;
            std::mutex op_mutex_;

            static Result<void> check_path(const char *operation, const dp::String &path) {
                if (path.empty())
                    return Result<void>::err(Error::invalid_argument("empty path").with_context(operation, path));
                if (!Packet::fits(path))
                    return Result<void>::err(
                        Error::invalid_argument("path is " + dp::String(std::to_string(path.size())) +
                                                " bytes, limit is " + dp::String(std::to_string(PACKET_DATA_CAPACITY)))
                            .with_context(operation, path));
                return {};
            }

            Result<void> execute(TransferMachine &machine) {
                machine.on_progress.subscribe(
                    [this, &machine](u32 done, u32 total) { on_progress.emit(machine.operation(), done, total); });
                machine.states().on_transition.subscribe(
                    [this, &machine](TransferState, TransferState to) { on_state.emit(machine.operation(), to); });
                return engine_.run(machine);
            }

            Result<void> command(const char *operation, const dp::String &path, Packet request,
                                 SessionMode mode = SessionMode::Create) {
                std::lock_guard<std::mutex> lock(op_mutex_);
                engine_.clear_cancel();
                auto valid = check_path(operation, path);
                if (valid.is_err())
                    return valid;

                echo::category("mavftp.client").debug(operation, " ", path);
                CommandTransfer machine(operation, path, std::move(request), mode);
                return execute(machine);
            }

          public:
            explicit Client(Transport &transport, ClientConfig config = {}) : engine_(transport, config) {
                echo::category("mavftp.client").debug("client on ", transport.name());
            }

            Client(const Client &) = delete;
            Client &operator=(const Client &) = delete;

            // ─── Directory listing ───────────────────────────────────────────────────
            // Entries come back in the order the remote paged them out unless ByName is asked
            // for. Names are relative to path; DirectoryEntry::full_path joins them.
            Result<dp::Vector<DirectoryEntry>> list(const dp::String &path, ListOrder order = ListOrder::Remote) {
                std::lock_guard<std::mutex> lock(op_mutex_);
                engine_.clear_cancel();
                auto valid = check_path("list", path);
                if (valid.is_err())
                    return Result<dp::Vector<DirectoryEntry>>::err(valid.error());

                ListTransfer machine(path);
                auto result = execute(machine);
                if (result.is_err())
                    return Result<dp::Vector<DirectoryEntry>>::err(result.error());
                echo::category("mavftp.client").info("list ", path, ": ", machine.entries().size(), " entries");
                auto entries = machine.take_entries();
                if (order == ListOrder::ByName)
                    sort_by_name(entries);
                return Result<dp::Vector<DirectoryEntry>>::ok(std::move(entries));
            }

            // ─── File contents ───────────────────────────────────────────────────────
            // Burst by default; falls back to chunked reads if the remote refuses bursts.
            Result<Bytes> read(const dp::String &path) {
                std::lock_guard<std::mutex> lock(op_mutex_);
                engine_.clear_cancel();
                auto valid = check_path("read", path);
                if (valid.is_err())
                    return Result<Bytes>::err(valid.error());

                ReadTransfer machine(path, engine_.config().transfer);
                auto result = execute(machine);
                if (result.is_err())
                    return Result<Bytes>::err(result.error());
                echo::category("mavftp.client").info("read ", path, ": ", machine.offset(), " bytes");
                return Result<Bytes>::ok(machine.take_data());
            }

            Result<void> write(const dp::String &path, Bytes content, WriteMode mode = WriteMode::Create) {
                std::lock_guard<std::mutex> lock(op_mutex_);
                engine_.clear_cancel();
                auto valid = check_path("write", path);
                if (valid.is_err())
                    return valid;

                WriteTransfer machine(path, std::move(content), mode, engine_.config().transfer);
                auto result = execute(machine);
                if (result.is_ok())
                    echo::category("mavftp.client").info("write ", path, ": ", machine.offset(), " bytes");
                return result;
            }

            Result<u32> crc(const dp::String &path) {
                std::lock_guard<std::mutex> lock(op_mutex_);
                engine_.clear_cancel();
                auto valid = check_path("crc", path);
                if (valid.is_err())
                    return Result<u32>::err(valid.error());

                CrcTransfer machine(path);
                auto result = execute(machine);
                if (result.is_err())
                    return Result<u32>::err(result.error());
                return Result<u32>::ok(machine.crc());
            }

            // ─── Single round trip commands ──────────────────────────────────────────
            // Creates (or truncates) an empty file
            Result<void> create(const dp::String &path) {
                return command("create", path, Packet::create_file(path), SessionMode::Create);
            }
            Result<void> mkdir(const dp::String &path) { return command("mkdir", path, Packet::create_directory(path)); }
            Result<void> rmdir(const dp::String &path) { return command("rmdir", path, Packet::remove_directory(path)); }
            Result<void> remove(const dp::String &path) { return command("remove", path, Packet::remove_file(path)); }

            Result<void> truncate(const dp::String &path, u32 length) {
                return command("truncate", path, Packet::truncate_file(path, length));
            }

            Result<void> rename(const dp::String &from, const dp::String &to) {
                if (from.empty() || to.empty() || from.size() + 1 + to.size() > PACKET_DATA_CAPACITY)
                    return Result<void>::err(
                        Error::invalid_argument("rename paths must be non-empty and fit one packet together")
                            .with_context("rename", from));
                return command("rename", from, Packet::rename(from, to));
            }

            // Drops every session on the remote, including ones left by an earlier run
            Result<void> reset_sessions() {
                std::lock_guard<std::mutex> lock(op_mutex_);
                engine_.clear_cancel();
                CommandTransfer machine("reset-sessions", "", Packet::reset_sessions());
                return execute(machine);
            }

            // Aborts the running operation at its next wait; it returns Cancelled after a
            // best-effort TerminateSession. A cancel with nothing running is discarded.
            void cancel() noexcept { engine_.cancel(); }

            const Engine &engine() const noexcept { return engine_; }
            const ClientConfig &config() const noexcept { return engine_.config(); }

            Event<dp::String, u32, u32> on_progress;      // (operation, bytes done, bytes expected or 0)
            Event<dp::String, TransferState> on_state;    // (operation, new state)
        };

    } // namespace client
    using namespace client;
} // namespace mavftp
