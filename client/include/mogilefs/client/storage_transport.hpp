#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <curl/curl.h>

#include "mogilefs/client/logger.hpp"

namespace mogilefs::client
{

    // Byte transfer against storage nodes. Failures are thrown as mogilefs::Error with
    // ErrorKind::Connectivity so file handles can fail over to another replica.
    class StorageTransport
    {
    public:
        virtual ~StorageTransport() = default;

        // Uploads the whole body to url. Any non-2xx status is a failure.
        virtual void put(const std::string &url, std::string_view body) = 0;

        // Appends bytes starting at offset to out, at most length bytes when given.
        // Reaching the end of the object appends nothing. On failure, bytes already
        // appended stay in out so the caller can resume after them.
        virtual void get(const std::string &url, std::uint64_t offset, std::optional<std::uint64_t> length,
                         std::string &out) = 0;
    };

    // Each file handle gets its own transport instance.
    using StorageTransportFactory = std::function<std::unique_ptr<StorageTransport>()>;

    struct CurlOptions
    {
        std::chrono::milliseconds connect_timeout{std::chrono::milliseconds{3000}};
        std::chrono::milliseconds transfer_timeout{std::chrono::milliseconds{10000}};
    };

    class CurlStorageTransport : public StorageTransport
    {
    public:
        explicit CurlStorageTransport(CurlOptions options = CurlOptions{}, Logger logger = Logger{});
        ~CurlStorageTransport() override;

        CurlStorageTransport(const CurlStorageTransport &) = delete;
        CurlStorageTransport &operator=(const CurlStorageTransport &) = delete;

        void put(const std::string &url, std::string_view body) override;

        void get(const std::string &url, std::uint64_t offset, std::optional<std::uint64_t> length,
                 std::string &out) override;

    private:
        CURL *prepare(const std::string &url);

        CurlOptions options_;
        Logger logger_;
        CURL *curl_{nullptr};
    };

    StorageTransportFactory make_curl_transport_factory(CurlOptions options, Logger logger);

} // namespace mogilefs::client
