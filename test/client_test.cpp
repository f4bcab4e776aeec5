#include "sim_remote.hpp"
#include <doctest/doctest.h>

// Short timeouts keep fault tests quick; the simulated link answers instantly
static ClientConfig quick() { return ClientConfig{}.timeout(30).retries(3); }

TEST_CASE("Client - list (scenario A)") {
    SimRemote sim;
    sim.add_file("/a.txt", pattern(10));
    sim.add_directory("/sub");
    sim.add_file("/sub/inner.bin", pattern(3));
    SimTransport link(sim);
    Client ftp(link);

    SUBCASE("single page") {
        auto r = ftp.list("/");
        REQUIRE(r.is_ok());
        const auto &entries = r.value();
        REQUIRE(entries.size() == 2);
        CHECK(entries[0].name == "a.txt");
        CHECK(entries[0].is_file());
        CHECK(entries[0].size == 10);
        CHECK(entries[1].name == "sub");
        CHECK(entries[1].is_directory());
        CHECK(sim.count(Opcode::ListDirectory) == 2);
    }

    SUBCASE("one entry per page") {
        sim.list_page_entries = 1;
        auto r = ftp.list("/");
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 2);
        CHECK(r.value()[0].name == "a.txt");
        CHECK(r.value()[0].size == 10);
        CHECK(r.value()[1].is_directory());
        CHECK(sim.count(Opcode::ListDirectory) == 3);
    }

    SUBCASE("subdirectory") {
        auto r = ftp.list("/sub");
        REQUIRE(r.is_ok());
        REQUIRE(r.value().size() == 1);
        CHECK(r.value()[0].full_path("/sub") == "/sub/inner.bin");
    }

    SUBCASE("skip markers and broken records are left out") {
        sim.raw_records.push_back("S");
        sim.raw_records.push_back("Zbroken");
        auto r = ftp.list("/");
        REQUIRE(r.is_ok());
        CHECK(r.value().size() == 2);
    }

    SUBCASE("sorted by name on request") {
        sim.add_file("/B.txt", pattern(1));
        auto remote = ftp.list("/");
        REQUIRE(remote.is_ok());
        REQUIRE(remote.value().size() == 3);
        CHECK(remote.value()[2].name == "B.txt");

        auto sorted = ftp.list("/", ListOrder::ByName);
        REQUIRE(sorted.is_ok());
        REQUIRE(sorted.value().size() == 3);
        CHECK(sorted.value()[0].name == "B.txt");
        CHECK(sorted.value()[1].name == "a.txt");
        CHECK(sorted.value()[2].name == "sub");
    }

    SUBCASE("missing directory") {
        auto r = ftp.list("/nope");
        REQUIRE(r.is_err());
        CHECK(r.error().is_remote(NakCode::FileNotFound));
        CHECK(r.error().operation == "list");
    }

    SUBCASE("listing opens no session") {
        REQUIRE(ftp.list("/").is_ok());
        CHECK(sim.count(Opcode::TerminateSession) == 0);
    }
}

TEST_CASE("Client - read") {
    SimRemote sim;
    Bytes content = pattern(5000);
    sim.add_file("/data.bin", content);
    sim.add_file("/empty.bin", Bytes{});
    SimTransport link(sim);

    SUBCASE("burst by default") {
        Client ftp(link);
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 1);
        CHECK(sim.count(Opcode::ReadFile) == 0);
        CHECK(sim.open_sessions() == 0);
        CHECK(sim.count(Opcode::TerminateSession) == 1);
    }

    SUBCASE("chunked") {
        Client ftp(link, ClientConfig{}.burst(false));
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::ReadFile) == 21); // 20 full chunks and a 220 byte tail
        CHECK(sim.open_sessions() == 0);
    }

    SUBCASE("zero length file") {
        Client ftp(link);
        auto r = ftp.read("/empty.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value().empty());
        CHECK(sim.count(Opcode::BurstReadFile) == 1);
    }

    SUBCASE("missing file") {
        Client ftp(link);
        auto r = ftp.read("/nope.bin");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::RemoteError);
        CHECK(r.error().nak == NakCode::FileNotFound);
        CHECK(r.error().path == "/nope.bin");
        CHECK(sim.count(Opcode::TerminateSession) == 0);
    }

    SUBCASE("rejected burst falls back to chunked reads") {
        sim.faults().reject_burst = true;
        Client ftp(link);
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 1);
        CHECK(sim.count(Opcode::ReadFile) > 0);
    }

    SUBCASE("short bursts are resumed until the end") {
        sim.burst_max_packets = 3;
        Client ftp(link);
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 7); // 21 packets, 3 per burst
    }

    SUBCASE("lost burst packet is fetched by a resumed burst") {
        sim.faults().drop_burst_packet = 2;
        Client ftp(link, quick().reorder_window(32)); // everything after the gap fits in the window
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 2);
        CHECK(ftp.engine().retry().total_resends() == 1);
        CHECK(sim.requests().back().opcode == Opcode::TerminateSession);
    }

    SUBCASE("small reorder window resumes without waiting for a timeout") {
        sim.faults().drop_burst_packet = 2;
        Client ftp(link, quick().reorder_window(2));
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 2);
        CHECK(ftp.engine().retry().total_resends() == 0);
        CHECK(ftp.engine().tracker().stale_count() > 0); // rest of the abandoned burst
    }

    SUBCASE("burst ended by EOF after its last packet was lost") {
        sim.burst_eof_nak = true;
        sim.faults().drop_burst_packet = 20;
        Client ftp(link, quick());
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 2);
        CHECK(sim.requests()[sim.requests().size() - 2].offset == 4780);
        CHECK(ftp.engine().retry().total_resends() == 0);
    }

    SUBCASE("burst ended by EOF with a gap in the middle") {
        sim.burst_eof_nak = true;
        sim.faults().drop_burst_packet = 2;
        Client ftp(link, quick().reorder_window(32));
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 2);
        CHECK(ftp.engine().retry().total_resends() == 0);
    }

    SUBCASE("burst ended by EOF with nothing lost") {
        sim.burst_eof_nak = true;
        Client ftp(link);
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::BurstReadFile) == 1);

        auto empty = ftp.read("/empty.bin");
        REQUIRE(empty.is_ok());
        CHECK(empty.value().empty());
    }

    SUBCASE("non-default chunk size") {
        Client ftp(link, ClientConfig{}.chunk_size(64).burst(false));
        auto r = ftp.read("/data.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::ReadFile) == 79); // 78 * 64 = 4992, then 8
        for (const auto &req : sim.requests()) {
            if (req.opcode == Opcode::ReadFile)
                CHECK(req.size == 64);
        }
    }
}

TEST_CASE("Client - large burst with reordering (scenario B)") {
    SimRemote sim;
    Bytes content = pattern(600000, 42);
    sim.add_file("/big.bin", content);
    sim.faults().reorder_bursts = true;
    SimTransport link(sim);
    Client ftp(link);

    auto r = ftp.read("/big.bin");
    REQUIRE(r.is_ok());
    CHECK(r.value().size() == content.size());
    CHECK(r.value() == content);
    CHECK(sim.open_sessions() == 0);
}

TEST_CASE("Client - remove of a missing file (scenario C)") {
    SimRemote sim;
    SimTransport link(sim);
    Client ftp(link);

    auto r = ftp.remove("/missing.txt");
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::RemoteError);
    CHECK(r.error().is_remote(NakCode::FileNotFound));
    CHECK(r.error().operation == "remove");
    CHECK(r.error().path == "/missing.txt");
    CHECK(r.error().describe().find("remove /missing.txt") == 0);
    CHECK(sim.count(Opcode::RemoveFile) == 1); // a definitive nak is not retried
}

TEST_CASE("Client - reset after an aborted run (scenario D)") {
    SimRemote sim;
    sim.max_sessions = 1;
    Bytes content = pattern(2000);
    sim.add_file("/data.bin", content);
    SimTransport link(sim);

    {
        Client first(link, ClientConfig{}.timeout(20).retries(1).burst(false));
        sim.faults().drop_after = 3; // open and two chunks, then the vehicle goes quiet
        auto r = first.read("/data.bin");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::Timeout);
        CHECK_FALSE(first.engine().tracker().has_session());
    }
    CHECK(sim.open_sessions() == 1);
    sim.heal();

    Client second(link);
    auto blocked = second.read("/data.bin");
    REQUIRE(blocked.is_err());
    CHECK(blocked.error().is_remote(NakCode::NoSessionsAvailable));

    REQUIRE(second.reset_sessions().is_ok());
    CHECK(sim.open_sessions() == 0);
    auto r = second.read("/data.bin");
    REQUIRE(r.is_ok());
    CHECK(r.value() == content);
}

TEST_CASE("Client - write") {
    SimRemote sim;
    SimTransport link(sim);

    SUBCASE("round trip") {
        Client ftp(link);
        Bytes content = pattern(5000, 9);
        REQUIRE(ftp.write("/up.bin", content).is_ok());
        CHECK(sim.content("/up.bin") == content);
        CHECK(sim.open_sessions() == 0);

        auto r = ftp.read("/up.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
    }

    SUBCASE("crc after write matches a local crc") {
        Client ftp(link);
        Bytes content = pattern(1234, 3);
        REQUIRE(ftp.write("/c.bin", content).is_ok());
        auto crc = ftp.crc("/c.bin");
        REQUIRE(crc.is_ok());
        CHECK(crc.value() == crc32(content));
    }

    SUBCASE("create truncates an existing file") {
        sim.add_file("/cfg", pattern(100));
        Client ftp(link);
        REQUIRE(ftp.write("/cfg", Bytes{1, 2, 3}).is_ok());
        CHECK(sim.content("/cfg") == Bytes{1, 2, 3});
    }

    SUBCASE("overwrite keeps the tail") {
        Bytes original = pattern(10);
        sim.add_file("/cfg", original);
        Client ftp(link);
        REQUIRE(ftp.write("/cfg", Bytes{9, 9, 9, 9}, WriteMode::Overwrite).is_ok());
        Bytes expected = original;
        for (usize i = 0; i < 4; ++i)
            expected[i] = 9;
        CHECK(sim.content("/cfg") == expected);
        CHECK(sim.count(Opcode::OpenFileWO) == 1);
    }

    SUBCASE("overwrite of a missing file") {
        Client ftp(link);
        auto r = ftp.write("/none", Bytes{1}, WriteMode::Overwrite);
        REQUIRE(r.is_err());
        CHECK(r.error().is_remote(NakCode::FileNotFound));
        CHECK(r.error().operation == "write");
    }

    SUBCASE("empty content creates an empty file") {
        Client ftp(link);
        REQUIRE(ftp.write("/zero", Bytes{}).is_ok());
        CHECK(sim.exists("/zero"));
        CHECK(sim.count(Opcode::WriteFile) == 0);
    }

    SUBCASE("non-default chunk size") {
        Client ftp(link, ClientConfig{}.chunk_size(64));
        Bytes content = pattern(1000);
        REQUIRE(ftp.write("/w.bin", content).is_ok());
        CHECK(sim.count(Opcode::WriteFile) == 16);
        CHECK(sim.content("/w.bin") == content);
    }

    SUBCASE("progress reaches the total") {
        Client ftp(link);
        u32 last_done = 0;
        u32 last_total = 0;
        dp::String last_op;
        ftp.on_progress.subscribe([&](dp::String op, u32 done, u32 total) {
            CHECK(done >= last_done);
            last_done = done;
            last_total = total;
            last_op = op;
        });
        REQUIRE(ftp.write("/p.bin", pattern(700)).is_ok());
        CHECK(last_op == "write");
        CHECK(last_done == 700);
        CHECK(last_total == 700);
    }
}

TEST_CASE("Client - single round trip commands") {
    SimRemote sim;
    SimTransport link(sim);
    Client ftp(link);

    SUBCASE("mkdir, create inside, rmdir") {
        REQUIRE(ftp.mkdir("/logs").is_ok());
        CHECK(sim.directory_exists("/logs"));

        auto again = ftp.mkdir("/logs");
        REQUIRE(again.is_err());
        CHECK(again.error().is_remote(NakCode::FileExists));

        REQUIRE(ftp.create("/logs/new.bin").is_ok());
        CHECK(sim.exists("/logs/new.bin"));
        CHECK(sim.open_sessions() == 0);

        auto listing = ftp.list("/logs");
        REQUIRE(listing.is_ok());
        REQUIRE(listing.value().size() == 1);
        CHECK(listing.value()[0].size == 0);

        REQUIRE(ftp.remove("/logs/new.bin").is_ok());
        REQUIRE(ftp.rmdir("/logs").is_ok());
        CHECK_FALSE(sim.exists("/logs"));
    }

    SUBCASE("rmdir of a missing directory") {
        auto r = ftp.rmdir("/none");
        REQUIRE(r.is_err());
        CHECK(r.error().is_remote(NakCode::FileNotFound));
    }

    SUBCASE("rename") {
        Bytes content = pattern(300);
        sim.add_file("/a.txt", content);
        sim.add_file("/taken", Bytes{});
        REQUIRE(ftp.rename("/a.txt", "/b.txt").is_ok());

        auto moved = ftp.read("/b.txt");
        REQUIRE(moved.is_ok());
        CHECK(moved.value() == content);
        CHECK(ftp.read("/a.txt").error().is_remote(NakCode::FileNotFound));

        auto clash = ftp.rename("/b.txt", "/taken");
        REQUIRE(clash.is_err());
        CHECK(clash.error().is_remote(NakCode::FileExists));
    }

    SUBCASE("truncate") {
        Bytes content = pattern(100);
        sim.add_file("/t.bin", content);
        REQUIRE(ftp.truncate("/t.bin", 40).is_ok());
        auto r = ftp.read("/t.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == Bytes(content.begin(), content.begin() + 40));

        CHECK(ftp.truncate("/none", 0).error().is_remote(NakCode::FileNotFound));
    }

    SUBCASE("crc of a missing file") {
        auto r = ftp.crc("/none");
        REQUIRE(r.is_err());
        CHECK(r.error().is_remote(NakCode::FileNotFound));
        CHECK(r.error().operation == "crc");
    }

    SUBCASE("reset sessions") {
        sim.occupy_sessions(3);
        REQUIRE(ftp.reset_sessions().is_ok());
        CHECK(sim.open_sessions() == 0);
    }
}

TEST_CASE("Client - argument validation") {
    SimRemote sim;
    SimTransport link(sim);
    Client ftp(link);

    SUBCASE("path longer than one packet") {
        auto r = ftp.read(dp::String(240, 'a'));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK(r.error().operation == "read");
    }

    SUBCASE("longest path that fits is sent") {
        auto r = ftp.remove(dp::String(239, 'a'));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::RemoteError);
    }

    SUBCASE("empty path") { CHECK(ftp.mkdir("").error().code == ErrorCode::InvalidArgument); }

    SUBCASE("rename pair must fit together") {
        auto r = ftp.rename(dp::String(120, 'a'), dp::String(119, 'b'));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SUBCASE("nothing is sent for rejected arguments") {
        auto w = ftp.write(dp::String(300, 'x'), Bytes{1});
        auto l = ftp.list("");
        CHECK(w.is_err());
        CHECK(l.is_err());
        CHECK(link.sent().empty());
    }
}

TEST_CASE("Client - stale responses are ignored") {
    SimRemote sim;
    Bytes content = pattern(3000);
    sim.add_file("/s.bin", content);
    sim.add_directory("/d");
    sim.faults().stale_before_each = true;
    SimTransport link(sim);

    SUBCASE("chunked read") {
        Client ftp(link, ClientConfig{}.burst(false));
        auto r = ftp.read("/s.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(ftp.engine().tracker().stale_count() > 0);
        for (const auto &req : sim.requests()) {
            if (req.opcode == Opcode::ReadFile)
                CHECK(req.session == 1);
        }
    }

    SUBCASE("burst read") {
        Client ftp(link);
        auto r = ftp.read("/s.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
    }

    SUBCASE("listing") {
        Client ftp(link);
        auto r = ftp.list("/");
        REQUIRE(r.is_ok());
        CHECK(r.value().size() == 2);
    }
}

TEST_CASE("Client - duplicated responses") {
    SimRemote sim;
    Bytes content = pattern(2000);
    sim.add_file("/dup.bin", content);
    sim.faults().duplicate = true;
    SimTransport link(sim);
    Client ftp(link, ClientConfig{}.burst(false));

    auto r = ftp.read("/dup.bin");
    REQUIRE(r.is_ok());
    CHECK(r.value() == content);

    Bytes upload = pattern(1000, 5);
    REQUIRE(ftp.write("/up.bin", upload).is_ok());
    CHECK(sim.content("/up.bin") == upload);
}

TEST_CASE("Client - offset mismatch") {
    SimRemote sim;
    Bytes content = pattern(1000);
    sim.add_file("/o.bin", content);
    SimTransport link(sim);
    Client ftp(link, ClientConfig{}.burst(false));

    SUBCASE("one mismatch costs one corrective resend") {
        sim.faults().tamper_offsets = 1;
        auto r = ftp.read("/o.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == content);
        CHECK(sim.count(Opcode::ReadFile) == 6); // five chunks plus the resend

        dp::Vector<SequenceNumber> reads;
        for (const auto &req : sim.requests()) {
            if (req.opcode == Opcode::ReadFile)
                reads.push_back(req.sequence);
        }
        CHECK(reads[0] == reads[1]);
        CHECK(reads[2] == reads[1] + 1);
    }

    SUBCASE("repeated mismatch aborts") {
        sim.faults().tamper_offsets = 2;
        auto r = ftp.read("/o.bin");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::ProtocolViolation);
        CHECK(r.error().operation == "read");
        CHECK(sim.count(Opcode::ReadFile) == 2);
        CHECK(sim.open_sessions() == 0);
    }

    SUBCASE("listing pages are checked too") {
        sim.faults().tamper_offsets = 2;
        auto r = ftp.list("/");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::ProtocolViolation);
    }
}

TEST_CASE("Client - packet loss") {
    SimRemote sim;
    sim.add_file("/a.txt", pattern(10));
    SimTransport link(sim);
    Client ftp(link, quick());

    SUBCASE("identical resends then timeout") {
        sim.faults().drop_all = true;
        auto r = ftp.remove("/a.txt");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::Timeout);
        CHECK(r.error().operation == "remove");
        REQUIRE(link.sent().size() == 4); // first send plus three retries
        for (const auto &raw : link.sent())
            CHECK(raw == link.sent()[0]);
        CHECK(ftp.engine().retry().total_resends() == 3);
    }

    SUBCASE("a dropped response is recovered by a resend") {
        sim.faults().drop_next = 1;
        auto r = ftp.crc("/a.txt");
        REQUIRE(r.is_ok());
        CHECK(r.value() == crc32(sim.content("/a.txt")));
        CHECK(sim.count(Opcode::CalcFileCRC32) == 2);
    }

    SUBCASE("malformed responses count as lost") {
        sim.faults().corrupt_next = 2;
        auto r = ftp.read("/a.txt");
        REQUIRE(r.is_ok());
        CHECK(r.value() == sim.content("/a.txt"));
        CHECK(ftp.engine().malformed_count() == 2);
    }

    SUBCASE("loss mid-transfer still tries to close the session") {
        sim.faults().drop_after = 1; // the open is answered, nothing after it
        auto r = ftp.read("/a.txt");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::Timeout);
        CHECK(sim.count(Opcode::TerminateSession) == 2); // one attempt plus one close retry
        CHECK_FALSE(ftp.engine().tracker().has_session());
    }
}

TEST_CASE("Client - session mismatch aborts") {
    SimRemote sim;
    sim.add_file("/m.bin", pattern(500));
    sim.faults().wrong_session = true;
    SimTransport link(sim);
    Client ftp(link, ClientConfig{}.burst(false));

    auto r = ftp.read("/m.bin");
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::ProtocolViolation);
    CHECK(sim.open_sessions() == 0);
}

TEST_CASE("Client - session id zero") {
    SimRemote sim;
    sim.first_session(0);
    sim.add_file("/z.bin", pattern(500));
    SimTransport link(sim);

    SUBCASE("read works and the session is closed") {
        Client ftp(link, ClientConfig{}.burst(false));
        auto r = ftp.read("/z.bin");
        REQUIRE(r.is_ok());
        CHECK(r.value() == pattern(500));
        CHECK(sim.requests().back().opcode == Opcode::TerminateSession);
        CHECK(sim.requests().back().session == 0);
        CHECK(sim.open_sessions() == 0);
    }

    SUBCASE("a response for another session aborts") {
        sim.faults().wrong_session = true;
        Client ftp(link, ClientConfig{}.burst(false));
        auto r = ftp.read("/z.bin");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::ProtocolViolation);
        CHECK(sim.open_sessions() == 0);
    }

    SUBCASE("writes are checked too") {
        sim.faults().wrong_session = true;
        Client ftp(link);
        auto w = ftp.write("/new.bin", pattern(300));
        REQUIRE(w.is_err());
        CHECK(w.error().code == ErrorCode::ProtocolViolation);
    }
}

TEST_CASE("Client - transport failure") {
    SimRemote sim;
    SimTransport link(sim);
    Client ftp(link);
    link.fail_sends = true;

    auto r = ftp.mkdir("/x");
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::Transport);
    CHECK(r.error().operation == "mkdir");
}

TEST_CASE("Client - cancellation") {
    SimRemote sim;
    Bytes content = pattern(5000);
    sim.add_file("/c.bin", content);
    SimTransport link(sim);
    Client ftp(link, ClientConfig{}.burst(false));

    SUBCASE("from a progress listener") {
        auto token = ftp.on_progress.subscribe([&](dp::String, u32 done, u32) {
            if (done >= 1000)
                ftp.cancel();
        });
        auto r = ftp.read("/c.bin");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::Cancelled);
        CHECK(r.error().operation == "read");
        CHECK(sim.requests().back().opcode == Opcode::TerminateSession);
        CHECK(sim.open_sessions() == 0);

        ftp.on_progress.unsubscribe(token);
        auto again = ftp.read("/c.bin");
        REQUIRE(again.is_ok());
        CHECK(again.value() == content);
    }

    SUBCASE("cancel with nothing running is discarded") {
        ftp.cancel();
        auto r = ftp.read("/c.bin");
        REQUIRE(r.is_ok());
    }
}

TEST_CASE("Client - state events") {
    SimRemote sim;
    sim.add_file("/e.bin", pattern(100));
    SimTransport link(sim);
    Client ftp(link);

    dp::Vector<TransferState> states;
    ftp.on_state.subscribe([&](dp::String, TransferState s) { states.push_back(s); });
    REQUIRE(ftp.read("/e.bin").is_ok());

    REQUIRE(states.size() == 4);
    CHECK(states[0] == TransferState::Opening);
    CHECK(states[1] == TransferState::Reading);
    CHECK(states[2] == TransferState::Closing);
    CHECK(states[3] == TransferState::Done);
}
