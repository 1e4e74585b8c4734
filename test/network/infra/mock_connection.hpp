// Copyright (c) 2025 The ircguard developers
// In-memory Connection and Dialer doubles driven from the test thread
#pragma once

#include "network/connection.hpp"
#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ircguard {
namespace network {

// Run every ready handler until the context goes idle
inline size_t run_until_idle(boost::asio::io_context &io) {
    size_t total = 0;
    for (;;) {
        io.restart();
        size_t n = io.poll();
        if (n == 0) break;
        total += n;
    }
    return total;
}

// In-memory Connection for unit tests
//
// Handlers are posted to the io_context, never invoked inline. Inbound bytes
// come from inject(); everything written is recorded. A read with nothing
// to deliver stays pending until inject(), inject_eof() or close().
class MockConnection : public Connection {
public:
    explicit MockConnection(boost::asio::io_context &io, std::string address = "127.0.0.1",
                            uint16_t port = 6667, uint64_t id = 1)
        : io_(io), address_(std::move(address)), port_(port), id_(id) {}

    void async_read_some(boost::asio::mutable_buffer buffer, ReadHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++read_count_;
        if (!open_) {
            post_read(std::move(handler), boost::asio::error::not_connected);
            return;
        }
        pending_buffer_ = buffer;
        pending_read_ = std::move(handler);
        deliver_locked();
    }

    void async_write(std::string data, WriteHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++write_count_;
        boost::system::error_code ec;
        if (!open_) {
            ec = boost::asio::error::not_connected;
        } else if (write_error_) {
            ec = write_error_;
        } else {
            written_ += data;
        }
        boost::asio::post(io_, [handler = std::move(handler), ec]() { handler(ec); });
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++close_count_;
        if (!open_) return;
        open_ = false;
        if (pending_read_) {
            post_read(std::move(*pending_read_), boost::asio::error::operation_aborted);
            pending_read_.reset();
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }
    std::string remote_address() const override { return address_; }
    uint16_t remote_port() const override { return port_; }
    uint64_t connection_id() const override { return id_; }

    // Test controls
    void inject(const std::string &data) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_ += data;
        deliver_locked();
    }

    void inject_eof() {
        std::lock_guard<std::mutex> lock(mutex_);
        eof_ = true;
        deliver_locked();
    }

    // Complete a pending read (or the next read) with an arbitrary error
    void inject_error(boost::system::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_error_ = ec;
        deliver_locked();
    }

    void fail_writes(boost::system::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_error_ = ec;
    }

    std::string written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    // Written data split on CRLF (terminators removed)
    std::vector<std::string> written_lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> lines;
        size_t pos = 0;
        while (pos < written_.size()) {
            size_t end = written_.find("\r\n", pos);
            if (end == std::string::npos) {
                lines.push_back(written_.substr(pos));
                break;
            }
            lines.push_back(written_.substr(pos, end - pos));
            pos = end + 2;
        }
        return lines;
    }

    bool has_pending_read() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_read_.has_value();
    }

    int close_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }
    int read_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return read_count_;
    }
    int write_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return write_count_;
    }

private:
    void post_read(ReadHandler handler, boost::system::error_code ec, size_t n = 0) {
        boost::asio::post(io_, [handler = std::move(handler), ec, n]() { handler(ec, n); });
    }

    // Must hold mutex_
    void deliver_locked() {
        if (!pending_read_) return;
        if (!inbound_.empty()) {
            size_t n = std::min(inbound_.size(), pending_buffer_.size());
            std::memcpy(pending_buffer_.data(), inbound_.data(), n);
            inbound_.erase(0, n);
            post_read(std::move(*pending_read_), {}, n);
            pending_read_.reset();
        } else if (read_error_) {
            post_read(std::move(*pending_read_), read_error_);
            pending_read_.reset();
        } else if (eof_) {
            post_read(std::move(*pending_read_), boost::asio::error::eof);
            pending_read_.reset();
        }
    }

    boost::asio::io_context &io_;
    std::string address_;
    uint16_t port_;
    uint64_t id_;

    mutable std::mutex mutex_;
    bool open_ = true;
    bool eof_ = false;
    boost::system::error_code read_error_;
    boost::system::error_code write_error_;
    std::string inbound_;
    std::string written_;
    boost::asio::mutable_buffer pending_buffer_;
    std::optional<ReadHandler> pending_read_;
    int close_count_ = 0;
    int read_count_ = 0;
    int write_count_ = 0;
};

// Dialer that hands out a prepared connection or fails with a prepared error
//
// With hold() the dial stays pending until complete() is called.
class MockDialer : public Dialer {
public:
    explicit MockDialer(boost::asio::io_context &io) : io_(io) {}

    void succeed_with(ConnectionPtr conn) {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = std::move(conn);
        error_ = {};
    }

    void fail_with(boost::system::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
        error_ = ec;
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_ = true;
    }

    void async_dial(const std::string &address, DialHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++dial_count_;
        last_address_ = address;
        if (hold_) {
            held_ = std::move(handler);
            return;
        }
        post_result(std::move(handler));
    }

    // Deliver a held dial
    void complete() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (held_) {
            post_result(std::move(*held_));
            held_.reset();
        }
    }

    int dial_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dial_count_;
    }
    std::string last_address() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_address_;
    }

private:
    // Must hold mutex_
    void post_result(DialHandler handler) {
        auto ec = error_;
        auto conn = error_ ? ConnectionPtr{} : connection_;
        boost::asio::post(io_, [handler = std::move(handler), ec, conn]() { handler(ec, conn); });
    }

    boost::asio::io_context &io_;
    mutable std::mutex mutex_;
    ConnectionPtr connection_;
    boost::system::error_code error_ = boost::asio::error::connection_refused;
    bool hold_ = false;
    std::optional<DialHandler> held_;
    int dial_count_ = 0;
    std::string last_address_;
};

} // namespace network
} // namespace ircguard
