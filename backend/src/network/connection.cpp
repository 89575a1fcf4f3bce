/**
 * Connection — Per-client session.
 *
 * The read loop decodes one line at a time and hands each message to the
 * owner. Outgoing frames are queued and written one after another, so
 * frames reach the client in the order deliver() was called.
 *
 * The streambuf is capped at max_message_bytes plus room for CRLF; a line
 * that does not fit surfaces as asio::error::not_found. A line that fits
 * only by using the CR slot for payload is caught by the explicit length
 * check.
 */

#include "network/connection.h"

#include <spdlog/spdlog.h>

#include "codec/line_codec.h"

Connection::Connection(asio::ip::tcp::socket socket, Id id,
                       std::size_t max_message_bytes)
    : socket_(std::move(socket)),
      strand_(asio::make_strand(socket_.get_executor())),
      read_buffer_(max_message_bytes + 2),
      max_message_bytes_(max_message_bytes),
      id_(id) {
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    peer_ = ec ? std::string("unknown")
               : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void Connection::set_on_message(MessageHandler cb) {
    on_message_ = std::move(cb);
}

void Connection::set_on_close(CloseHandler cb) {
    on_close_ = std::move(cb);
}

void Connection::start() {
    asio::dispatch(strand_, [self = shared_from_this()] { self->do_read(); });
}

bool Connection::deliver(Frame frame) {
    if (!open_.load())
        return false;

    asio::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
        if (!self->open_.load())
            return;
        bool idle = self->write_queue_.empty();
        self->write_queue_.push_back(std::move(frame));
        if (idle)
            self->do_write();
    });
    return true;
}

void Connection::close() {
    asio::dispatch(strand_, [self = shared_from_this()] { self->do_close(); });
}

void Connection::do_read() {
    asio::async_read_until(
        socket_, read_buffer_, LineCodec::delimiter,
        asio::bind_executor(strand_,
            [self = shared_from_this()](const asio::error_code& ec, std::size_t length) {
                self->on_read(ec, length);
            }));
}

void Connection::on_read(const asio::error_code& ec, std::size_t length) {
    if (ec) {
        if (ec == asio::error::eof) {
            spdlog::info("[conn {}] {} disconnected", id_, peer_);
        } else if (ec == asio::error::not_found) {
            spdlog::warn("[conn {}] {} sent a frame over {} bytes, closing",
                         id_, peer_, max_message_bytes_);
        } else if (ec != asio::error::operation_aborted) {
            spdlog::warn("[conn {}] read error from {}: {}", id_, peer_, ec.message());
        }
        do_close();
        return;
    }

    auto begin = asio::buffers_begin(read_buffer_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 1));
    read_buffer_.consume(length);

    std::size_t payload_bytes = line.size();
    if (payload_bytes > 0 && line.back() == '\r')
        --payload_bytes;
    if (payload_bytes > max_message_bytes_) {
        spdlog::warn("[conn {}] {} sent a frame over {} bytes, closing",
                     id_, peer_, max_message_bytes_);
        do_close();
        return;
    }

    auto message = LineCodec::decode(line);
    if (!message) {
        spdlog::warn("[conn {}] malformed frame from {}, closing", id_, peer_);
        do_close();
        return;
    }

    spdlog::debug("[conn {}] received {} bytes", id_, message->size());
    if (on_message_)
        on_message_(std::move(*message));

    do_read();
}

void Connection::do_write() {
    Frame frame = write_queue_.front();
    asio::async_write(
        socket_, asio::buffer(*frame),
        asio::bind_executor(strand_,
            [self = shared_from_this(), frame](const asio::error_code& ec, std::size_t) {
                if (ec) {
                    if (ec != asio::error::operation_aborted)
                        spdlog::warn("[conn {}] write error to {}: {}",
                                     self->id_, self->peer_, ec.message());
                    self->do_close();
                    return;
                }
                if (!self->open_.load())
                    return;
                self->write_queue_.pop_front();
                if (!self->write_queue_.empty())
                    self->do_write();
            }));
}

void Connection::do_close() {
    if (!open_.exchange(false))
        return;

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected)
        spdlog::debug("[conn {}] shutdown: {}", id_, ec.message());
    socket_.close(ec);
    if (ec)
        spdlog::debug("[conn {}] close: {}", id_, ec.message());

    write_queue_.clear();
    spdlog::info("[conn {}] closed", id_);

    if (on_close_)
        on_close_(id_);
}
