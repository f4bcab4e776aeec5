#include <echo/echo.hpp>
#include <mavftp.hpp>
#include <wirebit/shm/shm_link.hpp>

using namespace mavftp;

// Browses a vehicle filesystem over a shared-memory link whose frames carry
// FILE_TRANSFER_PROTOCOL payloads (for example a SITL bridge).
//
//   ftp_browse [link_name] [directory] [file_to_fetch]
int main(int argc, char **argv) {
    const char *link_name = argc > 1 ? argv[1] : "mavftp_link";
    dp::String directory = argc > 2 ? argv[2] : "/";

    echo::info("=== MAVLink FTP browse ===");

    auto link_result = wirebit::ShmLink::attach(link_name);
    if (!link_result.is_ok()) {
        echo::error("Failed to attach ShmLink '", link_name, "'");
        return 1;
    }
    auto link = std::make_shared<wirebit::ShmLink>(std::move(link_result.value()));
    LinkTransport transport(std::static_pointer_cast<wirebit::Link>(link), wirebit::FrameType::CAN);

    Client ftp(transport, ClientConfig{}.timeout(500).retries(4).backoff(Backoff::Linear, 2000));

    ftp.on_progress.subscribe([](dp::String op, u32 done, u32 total) {
        if (total > 0)
            echo::debug(op, ": ", done, "/", total);
    });

    auto reset = ftp.reset_sessions();
    if (reset.is_err()) {
        echo::error(reset.error().describe());
        return 1;
    }

    auto listing = ftp.list(directory);
    if (listing.is_err()) {
        echo::error(listing.error().describe());
        return 1;
    }
    for (const auto &entry : listing.value()) {
        if (entry.is_directory())
            echo::info("  [dir]  ", entry.full_path(directory));
        else
            echo::info("  ", entry.size, "\t", entry.full_path(directory));
    }

    if (argc > 3) {
        dp::String path = argv[3];
        auto data = ftp.read(path);
        if (data.is_err()) {
            echo::error(data.error().describe());
            return 1;
        }
        auto remote_crc = ftp.crc(path);
        if (remote_crc.is_err()) {
            echo::error(remote_crc.error().describe());
            return 1;
        }
        u32 local_crc = crc32(data.value());
        echo::info(path, ": ", data.value().size(), " bytes, crc ", local_crc,
                   local_crc == remote_crc.value() ? " (verified)" : " (MISMATCH)");
    }

    echo::info("Transfer engine sent ", ftp.engine().packets_sent(), " packets");
    return 0;
}
