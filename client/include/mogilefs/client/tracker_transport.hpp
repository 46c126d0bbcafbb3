#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "mogilefs/client/logger.hpp"

namespace mogilefs::client
{

    struct TrackerAddress
    {
        std::string host;
        std::uint16_t port{};

        bool operator==(const TrackerAddress &other) const = default;
    };

    std::string to_string(const TrackerAddress &address);

    // Parses "host:port". Throws std::runtime_error on malformed input.
    TrackerAddress parse_tracker_address(const std::string &text);

    // One blocking request/response exchange with a single tracker endpoint.
    // Implementations throw mogilefs::Error with ErrorKind::Connectivity on any
    // transport failure and must leave themselves disconnected in that case.
    class TrackerTransport
    {
    public:
        virtual ~TrackerTransport() = default;

        virtual std::string exchange(const TrackerAddress &endpoint, std::string_view request_line,
                                     std::chrono::milliseconds timeout) = 0;

        virtual void disconnect() noexcept = 0;
    };

    // Keeps a socket to the most recent endpoint open between exchanges. Every
    // resolve, connect, write and read is bounded by the per-attempt timeout by running
    // the io_context for at most that long.
    class AsioTrackerTransport : public TrackerTransport
    {
    public:
        explicit AsioTrackerTransport(Logger logger = Logger{});
        ~AsioTrackerTransport() override;

        AsioTrackerTransport(const AsioTrackerTransport &) = delete;
        AsioTrackerTransport &operator=(const AsioTrackerTransport &) = delete;

        std::string exchange(const TrackerAddress &endpoint, std::string_view request_line,
                             std::chrono::milliseconds timeout) override;

        void disconnect() noexcept override;

    private:
        void connect(const TrackerAddress &endpoint, std::chrono::steady_clock::time_point deadline);
        bool wait_for(std::chrono::steady_clock::time_point deadline, const bool &done);
        void run_until(std::chrono::steady_clock::time_point deadline, const bool &done,
                       const TrackerAddress &endpoint, std::string_view stage);
        [[noreturn]] void time_out(const TrackerAddress &endpoint, std::string_view stage);
        [[noreturn]] void fail(const TrackerAddress &endpoint, std::string_view stage, const std::string &detail);

        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        asio::ip::tcp::resolver resolver_;
        std::optional<TrackerAddress> connected_;
        std::string read_buffer_;
    };

} // namespace mogilefs::client
