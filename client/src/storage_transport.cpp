#include "mogilefs/client/storage_transport.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "mogilefs/error_codes.hpp"

namespace mogilefs::client
{

    namespace
    {

        constexpr long kRangeNotSatisfiable = 416;

        std::once_flag &curl_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_curl_global_init()
        {
            std::call_once(curl_once_flag(), []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw std::runtime_error("libcurl initialization failed");
                } });
        }

        bool is_success(long status) noexcept
        {
            return status >= 200 && status < 300;
        }

        struct UploadCursor
        {
            std::string_view body;
            std::size_t position{};
        };

        std::size_t read_body(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *cursor = static_cast<UploadCursor *>(userdata);
            const auto capacity = size * nitems;
            const auto count = std::min(capacity, cursor->body.size() - cursor->position);
            std::copy_n(cursor->body.data() + cursor->position, count, buffer);
            cursor->position += count;
            return count;
        }

        std::size_t discard_body(char * /*ptr*/, std::size_t size, std::size_t nmemb, void * /*userdata*/)
        {
            return size * nmemb;
        }

        struct DownloadSink
        {
            CURL *curl{};
            std::string *out{};
            std::uint64_t offset{};
            std::optional<std::uint64_t> remaining;
            long status{};
            std::uint64_t skip{};
            bool checked{};
            bool complete{};
        };

        std::size_t write_body(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *sink = static_cast<DownloadSink *>(userdata);
            const auto total = size * nmemb;
            if (!sink->checked)
            {
                curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &sink->status);
                // A 200 means the node ignored the Range header and sent the whole object.
                sink->skip = sink->status == 200 ? sink->offset : 0;
                sink->checked = true;
            }
            if (sink->status != 200 && sink->status != 206)
            {
                return total;
            }

            std::string_view chunk(ptr, total);
            const auto skipped = std::min<std::uint64_t>(sink->skip, chunk.size());
            chunk.remove_prefix(static_cast<std::size_t>(skipped));
            sink->skip -= skipped;

            if (sink->remaining)
            {
                const auto take = std::min<std::uint64_t>(*sink->remaining, chunk.size());
                chunk = chunk.substr(0, static_cast<std::size_t>(take));
                *sink->remaining -= take;
            }
            sink->out->append(chunk.data(), chunk.size());

            if (sink->remaining && *sink->remaining == 0)
            {
                // Stop the transfer; perform() reports a write error that the caller
                // treats as completion.
                sink->complete = true;
                return 0;
            }
            return total;
        }

    } // namespace

    CurlStorageTransport::CurlStorageTransport(CurlOptions options, Logger logger)
        : options_(options),
          logger_(std::move(logger))
    {
        ensure_curl_global_init();
    }

    CurlStorageTransport::~CurlStorageTransport()
    {
        if (curl_ != nullptr)
        {
            curl_easy_cleanup(curl_);
        }
    }

    CURL *CurlStorageTransport::prepare(const std::string &url)
    {
        if (curl_ == nullptr)
        {
            curl_ = curl_easy_init();
            if (curl_ == nullptr)
            {
                throw std::runtime_error("curl_easy_init failed");
            }
        }
        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.transfer_timeout.count()));
        return curl_;
    }

    void CurlStorageTransport::put(const std::string &url, std::string_view body)
    {
        auto *curl = prepare(url);
        UploadCursor cursor{.body = body};
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, &read_body);
        curl_easy_setopt(curl, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &discard_body);

        const auto code = curl_easy_perform(curl);
        if (code != CURLE_OK)
        {
            logger_.warn(LogSource::Storage, "PUT ", url, " failed: ", curl_easy_strerror(code));
            throw Error(ErrorKind::Connectivity, std::string(codes::kTransport),
                        "PUT " + url + " failed: " + curl_easy_strerror(code));
        }
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (!is_success(status))
        {
            logger_.warn(LogSource::Storage, "PUT ", url, " returned HTTP ", status);
            throw Error(ErrorKind::Connectivity, std::string(codes::kHttpStatus),
                        "PUT " + url + " returned HTTP " + std::to_string(status));
        }
        logger_.debug(LogSource::Storage, "PUT ", url, " stored ", body.size(), " bytes");
    }

    void CurlStorageTransport::get(const std::string &url, std::uint64_t offset, std::optional<std::uint64_t> length,
                                   std::string &out)
    {
        if (length && *length == 0)
        {
            return;
        }
        auto *curl = prepare(url);

        auto range = std::to_string(offset) + "-";
        if (length)
        {
            range += std::to_string(offset + *length - 1);
        }
        DownloadSink sink{
            .curl = curl,
            .out = &out,
            .offset = offset,
            .remaining = length,
        };
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);

        const auto code = curl_easy_perform(curl);
        if (code != CURLE_OK && !(code == CURLE_WRITE_ERROR && sink.complete))
        {
            logger_.warn(LogSource::Storage, "GET ", url, " at ", offset, " failed: ", curl_easy_strerror(code));
            throw Error(ErrorKind::Connectivity, std::string(codes::kTransport),
                        "GET " + url + " failed: " + curl_easy_strerror(code));
        }
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (status == kRangeNotSatisfiable)
        {
            return;
        }
        if (status != 200 && status != 206)
        {
            logger_.warn(LogSource::Storage, "GET ", url, " returned HTTP ", status);
            throw Error(ErrorKind::Connectivity, std::string(codes::kHttpStatus),
                        "GET " + url + " returned HTTP " + std::to_string(status));
        }
    }

    StorageTransportFactory make_curl_transport_factory(CurlOptions options, Logger logger)
    {
        return [options, logger]()
        {
            return std::make_unique<CurlStorageTransport>(options, logger);
        };
    }

} // namespace mogilefs::client
