#include "mogilefs/client/tracker_transport.hpp"

#include <asio/connect.hpp>
#include <asio/write.hpp>

#include <array>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "mogilefs/error_codes.hpp"
#include "mogilefs/framing.hpp"

namespace mogilefs::client
{

    std::string to_string(const TrackerAddress &address)
    {
        return address.host + ":" + std::to_string(address.port);
    }

    TrackerAddress parse_tracker_address(const std::string &text)
    {
        const auto colon_pos = text.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == text.size())
        {
            throw std::runtime_error("Expected tracker address format host:port, got '" + text + "'");
        }
        const auto port_string = text.substr(colon_pos + 1);
        const auto port = std::stoul(port_string);
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Tracker port out of range: " + port_string);
        }
        return TrackerAddress{
            .host = text.substr(0, colon_pos),
            .port = static_cast<std::uint16_t>(port),
        };
    }

    AsioTrackerTransport::AsioTrackerTransport(Logger logger)
        : logger_(std::move(logger)),
          socket_(io_context_),
          resolver_(io_context_) {}

    AsioTrackerTransport::~AsioTrackerTransport()
    {
        disconnect();
    }

    std::string AsioTrackerTransport::exchange(const TrackerAddress &endpoint, std::string_view request_line,
                                               std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!connected_ || *connected_ != endpoint)
        {
            disconnect();
            connect(endpoint, deadline);
        }

        std::error_code write_ec;
        bool written = false;
        asio::async_write(socket_, asio::buffer(request_line.data(), request_line.size()),
                          [&write_ec, &written](const std::error_code &ec, std::size_t /*bytes*/)
                          {
                              write_ec = ec;
                              written = true;
                          });
        run_until(deadline, written, endpoint, "write");
        if (write_ec)
        {
            fail(endpoint, "write", write_ec.message());
        }

        std::array<char, 4096> chunk{};
        for (;;)
        {
            std::optional<protocol::DecodedLine> decoded;
            try
            {
                decoded = protocol::try_decode_line(read_buffer_);
            }
            catch (const Error &)
            {
                disconnect();
                throw;
            }
            if (decoded)
            {
                read_buffer_.erase(0, decoded->bytes_consumed);
                return std::move(decoded->line);
            }

            std::error_code read_ec;
            std::size_t received = 0;
            bool read_done = false;
            socket_.async_read_some(asio::buffer(chunk),
                                    [&read_ec, &received, &read_done](const std::error_code &ec, std::size_t bytes)
                                    {
                                        read_ec = ec;
                                        received = bytes;
                                        read_done = true;
                                    });
            run_until(deadline, read_done, endpoint, "read");
            if (read_ec)
            {
                fail(endpoint, "read", read_ec == asio::error::eof ? "connection closed by tracker" : read_ec.message());
            }
            read_buffer_.append(chunk.data(), received);
        }
    }

    void AsioTrackerTransport::disconnect() noexcept
    {
        std::error_code ignored;
        if (socket_.is_open())
        {
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        }
        connected_.reset();
        read_buffer_.clear();
    }

    void AsioTrackerTransport::connect(const TrackerAddress &endpoint, std::chrono::steady_clock::time_point deadline)
    {
        struct Resolution
        {
            bool done{false};
            std::error_code ec;
            asio::ip::tcp::resolver::results_type results;
        };

        // A lookup cannot be interrupted once the resolver thread has started it, so the
        // handler owns its result and may complete after this call has given up.
        auto resolution = std::make_shared<Resolution>();
        resolver_.async_resolve(endpoint.host, std::to_string(endpoint.port),
                                [resolution](const std::error_code &ec, asio::ip::tcp::resolver::results_type results)
                                {
                                    resolution->ec = ec;
                                    resolution->results = std::move(results);
                                    resolution->done = true;
                                });
        if (!wait_for(deadline, resolution->done))
        {
            resolver_.cancel();
            time_out(endpoint, "resolve");
        }
        if (resolution->ec)
        {
            fail(endpoint, "resolve", resolution->ec.message());
        }

        std::error_code connect_ec;
        bool connected = false;
        asio::async_connect(socket_, resolution->results,
                            [&connect_ec, &connected](const std::error_code &ec, const asio::ip::tcp::endpoint & /*endpoint*/)
                            {
                                connect_ec = ec;
                                connected = true;
                            });
        run_until(deadline, connected, endpoint, "connect");
        if (connect_ec)
        {
            fail(endpoint, "connect", connect_ec.message());
        }

        std::error_code ignored;
        socket_.set_option(asio::ip::tcp::no_delay(true), ignored);
        connected_ = endpoint;
        read_buffer_.clear();
        logger_.debug(LogSource::Tracker, "connected to ", to_string(endpoint));
    }

    bool AsioTrackerTransport::wait_for(std::chrono::steady_clock::time_point deadline, const bool &done)
    {
        io_context_.restart();
        while (!done && std::chrono::steady_clock::now() < deadline)
        {
            if (io_context_.run_one_until(deadline) == 0 && io_context_.stopped())
            {
                io_context_.restart();
            }
        }
        return done;
    }

    void AsioTrackerTransport::run_until(std::chrono::steady_clock::time_point deadline, const bool &done,
                                         const TrackerAddress &endpoint, std::string_view stage)
    {
        if (wait_for(deadline, done))
        {
            return;
        }

        // Deadline hit with the socket operation still pending: closing the socket aborts
        // it, then its handler has to run before the locals it refers to go away.
        std::error_code ignored;
        socket_.close(ignored);
        io_context_.restart();
        while (!done)
        {
            io_context_.run_one();
        }
        time_out(endpoint, stage);
    }

    void AsioTrackerTransport::time_out(const TrackerAddress &endpoint, std::string_view stage)
    {
        disconnect();
        throw Error(ErrorKind::Connectivity, std::string(codes::kTimeout),
                    "tracker " + to_string(endpoint) + " timed out during " + std::string(stage));
    }

    void AsioTrackerTransport::fail(const TrackerAddress &endpoint, std::string_view stage, const std::string &detail)
    {
        disconnect();
        throw Error(ErrorKind::Connectivity, std::string(codes::kTransport),
                    "tracker " + to_string(endpoint) + " " + std::string(stage) + " failed: " + detail);
    }

} // namespace mogilefs::client
