// Copyright (c) 2025 The ircguard developers
// Unit tests for the session manager: dial, two pumps, first-error teardown
#include <catch2/catch_test_macros.hpp>
#include "network/infra/mock_connection.hpp"
#include "relay/error.hpp"
#include "relay/session.hpp"
#include <boost/asio/io_context.hpp>
#include <optional>

using namespace ircguard;
using namespace ircguard::relay;
using ircguard::network::MockConnection;
using ircguard::network::MockDialer;
using ircguard::network::run_until_idle;

namespace {

struct SessionFixture {
    boost::asio::io_context io;
    std::shared_ptr<MockConnection> client = std::make_shared<MockConnection>(io, "192.0.2.10", 40000, 1);
    std::shared_ptr<MockConnection> upstream = std::make_shared<MockConnection>(io, "198.51.100.1", 6697, 2);
    std::shared_ptr<MockDialer> dialer = std::make_shared<MockDialer>(io);
    SessionPtr session = Session::create(client, dialer, "irc.example.net:6697");
    std::optional<boost::system::error_code> result;
    int completions = 0;

    SessionFixture() { dialer->succeed_with(upstream); }

    ~SessionFixture() {
        client->close();
        upstream->close();
        run_until_idle(io);
    }

    void start() {
        session->start([this](const boost::system::error_code& ec) {
            result = ec;
            ++completions;
        });
    }
};

} // namespace

TEST_CASE("Session relays both directions", "[relay][session]") {
    SessionFixture f;
    f.start();
    CHECK(f.session->state() == SessionState::ESTABLISHING);

    run_until_idle(f.io);
    REQUIRE(f.session->state() == SessionState::RELAYING);
    CHECK(f.dialer->dial_count() == 1);
    CHECK(f.dialer->last_address() == "irc.example.net:6697");
    CHECK(f.session->upstream_address() == "irc.example.net:6697");

    f.client->inject("NICK :ni ck\r\nUSER u 0 * :Real Name\r\n");
    f.upstream->inject(":irc.example.net 001 ni_ck :Welcome\r\n");
    run_until_idle(f.io);

    auto to_upstream = f.upstream->written_lines();
    REQUIRE(to_upstream.size() == 2);
    CHECK(to_upstream[0] == "NICK ni_ck");
    CHECK(to_upstream[1] == "USER u 0 * :Real Name");

    auto to_client = f.client->written_lines();
    REQUIRE(to_client.size() == 1);
    CHECK(to_client[0] == ":irc.example.net 001 ni_ck Welcome");

    CHECK(f.session->messages_to_upstream() == 2);
    CHECK(f.session->messages_to_client() == 1);
    CHECK_FALSE(f.result.has_value());
}

TEST_CASE("Session sanitizes end to end", "[relay][session]") {
    SessionFixture f;
    f.start();
    run_until_idle(f.io);

    SECTION("Sender identifier and command target") {
        f.upstream->inject(":nick!ni~ck@host INVITE :tar get\r\n");
        run_until_idle(f.io);
        auto lines = f.client->written_lines();
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == ":nick!ni_ck@host INVITE tar_get");
    }

    SECTION("600-byte body truncated to 512 with sender normalized") {
        f.upstream->inject(":nick!a.b@host PRIVMSG #chan :" + std::string(600, 'q') + "\r\n");
        run_until_idle(f.io);
        auto lines = f.client->written_lines();
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == ":nick!a_b@host PRIVMSG #chan " + std::string(512, 'q'));
    }

    SECTION("Client body truncated") {
        f.client->inject("PRIVMSG #chan :" + std::string(600, 'z') + "\r\n");
        run_until_idle(f.io);
        auto lines = f.upstream->written_lines();
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == "PRIVMSG #chan " + std::string(512, 'z'));
    }
}

TEST_CASE("Session teardown on the first error", "[relay][session]") {
    SessionFixture f;
    f.start();
    run_until_idle(f.io);
    REQUIRE(f.session->state() == SessionState::RELAYING);

    // Both pumps are parked in a read
    REQUIRE(f.client->has_pending_read());
    REQUIRE(f.upstream->has_pending_read());

    SECTION("Client disconnect unblocks the upstream direction") {
        f.client->inject_eof();
        run_until_idle(f.io);

        REQUIRE(f.result.has_value());
        CHECK(*f.result == boost::asio::error::eof);
        CHECK(f.completions == 1);
        CHECK(f.session->state() == SessionState::CLOSED);
        CHECK(f.session->result() == boost::asio::error::eof);

        // The other direction was woken and both connections closed once
        CHECK_FALSE(f.upstream->has_pending_read());
        CHECK(f.client->close_count() == 1);
        CHECK(f.upstream->close_count() == 1);
        CHECK_FALSE(f.client->is_open());
        CHECK_FALSE(f.upstream->is_open());
    }

    SECTION("Malformed message from upstream") {
        f.upstream->inject("NICK\r\n");
        run_until_idle(f.io);

        REQUIRE(f.result.has_value());
        CHECK(*f.result == make_error_code(Errc::not_enough_params));
        CHECK(f.client->written().empty());
        CHECK(f.client->close_count() == 1);
        CHECK(f.upstream->close_count() == 1);
        CHECK_FALSE(f.client->has_pending_read());
    }

    SECTION("Write failure toward the client") {
        f.client->fail_writes(boost::asio::error::broken_pipe);
        f.upstream->inject("PING :x\r\n");
        run_until_idle(f.io);

        REQUIRE(f.result.has_value());
        CHECK(*f.result == boost::asio::error::broken_pipe);
        CHECK(f.client->close_count() == 1);
        CHECK(f.upstream->close_count() == 1);
    }

    SECTION("Later errors are discarded") {
        f.client->inject_error(boost::asio::error::connection_reset);
        f.upstream->inject_eof();
        run_until_idle(f.io);

        REQUIRE(f.result.has_value());
        CHECK(f.completions == 1);
        CHECK(*f.result == boost::asio::error::connection_reset);
        CHECK(f.client->close_count() == 1);
        CHECK(f.upstream->close_count() == 1);
    }
}

TEST_CASE("Session dial failure", "[relay][session]") {
    SessionFixture f;
    f.dialer->fail_with(boost::asio::error::connection_refused);
    f.start();
    run_until_idle(f.io);

    REQUIRE(f.result.has_value());
    CHECK(*f.result == boost::asio::error::connection_refused);
    CHECK(f.session->state() == SessionState::CLOSED);

    // No pump ever started: nothing was read from either side
    CHECK(f.client->read_count() == 0);
    CHECK(f.upstream->read_count() == 0);
    CHECK(f.session->messages_to_upstream() == 0);

    // The client is still closed
    CHECK(f.client->close_count() == 1);
    CHECK_FALSE(f.client->is_open());
    CHECK(f.upstream->close_count() == 0);
}

TEST_CASE("Session close", "[relay][session]") {
    SessionFixture f;

    SECTION("While relaying") {
        f.start();
        run_until_idle(f.io);
        f.session->close();
        run_until_idle(f.io);

        REQUIRE(f.result.has_value());
        CHECK(*f.result == boost::asio::error::operation_aborted);
        CHECK(f.completions == 1);
        CHECK(f.client->close_count() == 1);
        CHECK(f.upstream->close_count() == 1);

        // Idempotent
        f.session->close();
        run_until_idle(f.io);
        CHECK(f.completions == 1);
        CHECK(f.client->close_count() == 1);
    }

    SECTION("While dialing: the late upstream is closed") {
        f.dialer->hold();
        f.start();
        run_until_idle(f.io);
        REQUIRE(f.session->state() == SessionState::ESTABLISHING);

        f.session->close();
        REQUIRE(f.result.has_value());
        CHECK(*f.result == boost::asio::error::operation_aborted);
        CHECK(f.client->close_count() == 1);

        f.dialer->complete();
        run_until_idle(f.io);
        CHECK(f.upstream->close_count() == 1);
        CHECK(f.upstream->read_count() == 0);
        CHECK(f.completions == 1);
    }
}

TEST_CASE("Session start is single-use", "[relay][session]") {
    SessionFixture f;
    f.start();
    f.start();
    run_until_idle(f.io);
    CHECK(f.dialer->dial_count() == 1);
}

TEST_CASE("Session state names and disconnect classification", "[relay][session]") {
    CHECK(SessionStateName(SessionState::ESTABLISHING) == "establishing");
    CHECK(SessionStateName(SessionState::RELAYING) == "relaying");
    CHECK(SessionStateName(SessionState::CLOSED) == "closed");

    CHECK(IsDisconnect(boost::asio::error::eof));
    CHECK(IsDisconnect(boost::asio::error::operation_aborted));
    CHECK(IsDisconnect(boost::asio::error::connection_reset));
    CHECK_FALSE(IsDisconnect(make_error_code(Errc::not_enough_params)));
    CHECK_FALSE(IsDisconnect(boost::asio::error::timed_out));
}
