// Copyright (c) 2025 The ircguard developers
// Unit tests for the line decoder/encoder over an in-memory connection
#include <catch2/catch_test_macros.hpp>
#include "irc/codec.hpp"
#include "irc/error.hpp"
#include "network/infra/mock_connection.hpp"
#include <boost/asio/io_context.hpp>
#include <optional>
#include <vector>

using namespace ircguard;
using namespace ircguard::irc;
using ircguard::network::MockConnection;
using ircguard::network::run_until_idle;

namespace {

struct DecodeResult {
    boost::system::error_code ec;
    Message msg;
};

// Issue one decode and drain the io_context
std::optional<DecodeResult> DecodeOne(boost::asio::io_context& io, Decoder& decoder) {
    std::optional<DecodeResult> result;
    decoder.async_decode([&](const boost::system::error_code& ec, Message msg) {
        result = DecodeResult{ec, std::move(msg)};
    });
    run_until_idle(io);
    return result;
}

} // namespace

TEST_CASE("Decoder - complete frames", "[irc][codec]") {
    boost::asio::io_context io;
    auto conn = std::make_shared<MockConnection>(io);
    Decoder decoder(conn);

    SECTION("CRLF terminated") {
        conn->inject("NICK foo\r\n");
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK_FALSE(r->ec);
        CHECK(r->msg.command == "NICK");
        REQUIRE(r->msg.params.size() == 1);
        CHECK(r->msg.params[0] == "foo");
    }

    SECTION("Bare LF terminated") {
        conn->inject("PING :x\n");
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK_FALSE(r->ec);
        CHECK(r->msg.command == "PING");
    }

    SECTION("Several frames in one read are returned in order") {
        conn->inject("NICK a\r\nNICK b\r\nNICK c\r\n");
        std::vector<std::string> seen;
        for (int i = 0; i < 3; ++i) {
            auto r = DecodeOne(io, decoder);
            REQUIRE(r.has_value());
            REQUIRE_FALSE(r->ec);
            seen.push_back(r->msg.params.at(0));
        }
        CHECK(seen == std::vector<std::string>{"a", "b", "c"});
        // Only one read was needed
        CHECK(conn->read_count() == 1);
        CHECK(decoder.buffered_bytes() == 0);
    }

    SECTION("Buffered frame is delivered before async_decode returns") {
        conn->inject("NICK a\r\nNICK b\r\n");
        REQUIRE(DecodeOne(io, decoder).has_value());
        bool called = false;
        decoder.async_decode([&](const boost::system::error_code&, Message) { called = true; });
        CHECK(called);
    }
}

TEST_CASE("Decoder - partial frames", "[irc][codec]") {
    boost::asio::io_context io;
    auto conn = std::make_shared<MockConnection>(io);
    Decoder decoder(conn);

    std::optional<DecodeResult> result;
    decoder.async_decode([&](const boost::system::error_code& ec, Message msg) {
        result = DecodeResult{ec, std::move(msg)};
    });

    conn->inject("PRIVMSG #chan :hel");
    run_until_idle(io);
    CHECK_FALSE(result.has_value());
    CHECK(conn->has_pending_read());

    conn->inject("lo\r");
    run_until_idle(io);
    CHECK_FALSE(result.has_value());

    conn->inject("\nNICK x");
    run_until_idle(io);
    REQUIRE(result.has_value());
    CHECK_FALSE(result->ec);
    CHECK(result->msg.params.at(1) == "hello");

    // Remainder stays buffered
    CHECK(decoder.buffered_bytes() == 6);
}

TEST_CASE("Decoder - blank lines are skipped", "[irc][codec]") {
    boost::asio::io_context io;
    auto conn = std::make_shared<MockConnection>(io);
    Decoder decoder(conn);

    conn->inject("\r\n\n   \r\nQUIT\r\n");
    auto r = DecodeOne(io, decoder);
    REQUIRE(r.has_value());
    CHECK_FALSE(r->ec);
    CHECK(r->msg.command == "QUIT");
}

TEST_CASE("Decoder - errors", "[irc][codec]") {
    boost::asio::io_context io;
    auto conn = std::make_shared<MockConnection>(io);

    SECTION("Clean end of stream") {
        Decoder decoder(conn);
        conn->inject_eof();
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK(r->ec == boost::asio::error::eof);
    }

    SECTION("Unterminated data before end of stream is discarded") {
        Decoder decoder(conn);
        conn->inject("NICK half");
        conn->inject_eof();
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK(r->ec == boost::asio::error::eof);
    }

    SECTION("Frame without a command") {
        Decoder decoder(conn);
        conn->inject(":prefix.only\r\n");
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK(r->ec == make_error_code(Errc::malformed_frame));
        CHECK(std::string(r->ec.category().name()) == "irc.codec");
    }

    SECTION("No delimiter within the frame limit") {
        Decoder decoder(conn, 64);
        conn->inject(std::string(100, 'a'));
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK(r->ec == make_error_code(Errc::frame_too_long));
    }

    SECTION("Complete frame over the limit") {
        Decoder decoder(conn, 16);
        conn->inject("PRIVMSG #c :" + std::string(40, 'x') + "\r\n");
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK(r->ec == make_error_code(Errc::frame_too_long));
    }

    SECTION("Transport error") {
        Decoder decoder(conn);
        conn->inject_error(boost::asio::error::connection_reset);
        auto r = DecodeOne(io, decoder);
        REQUIRE(r.has_value());
        CHECK(r->ec == boost::asio::error::connection_reset);
    }

    SECTION("Connection closed while waiting") {
        Decoder decoder(conn);
        std::optional<DecodeResult> result;
        decoder.async_decode([&](const boost::system::error_code& ec, Message msg) {
            result = DecodeResult{ec, std::move(msg)};
        });
        run_until_idle(io);
        CHECK_FALSE(result.has_value());
        conn->close();
        run_until_idle(io);
        REQUIRE(result.has_value());
        CHECK(result->ec == boost::asio::error::operation_aborted);
    }
}

TEST_CASE("Encoder writes the serialized message plus CRLF", "[irc][codec]") {
    boost::asio::io_context io;
    auto conn = std::make_shared<MockConnection>(io);
    Encoder encoder(conn);

    Message msg;
    msg.prefix = Prefix{"nick", "user", "host"};
    msg.command = "PRIVMSG";
    msg.params = {"#chan", "hello world"};

    std::optional<boost::system::error_code> done;
    encoder.async_encode(msg, [&](const boost::system::error_code& ec) { done = ec; });
    run_until_idle(io);

    REQUIRE(done.has_value());
    CHECK_FALSE(*done);
    CHECK(conn->written() == ":nick!user@host PRIVMSG #chan :hello world\r\n");

    SECTION("Write failure is reported") {
        conn->fail_writes(boost::asio::error::broken_pipe);
        std::optional<boost::system::error_code> failed;
        encoder.async_encode(msg, [&](const boost::system::error_code& ec) { failed = ec; });
        run_until_idle(io);
        REQUIRE(failed.has_value());
        CHECK(*failed == boost::asio::error::broken_pipe);
    }
}
