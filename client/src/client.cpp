#include "mogilefs/client/client.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include "mogilefs/error_codes.hpp"
#include "mogilefs/protocol.hpp"

namespace mogilefs::client
{

    namespace
    {

        constexpr std::size_t kStoreChunkSize = 16 * 1024;

        struct HookPointMapping
        {
            HookPoint point;
            std::string_view label;
        };

        constexpr std::array<HookPointMapping, 8> kHookPointMappings{{
            {HookPoint::NewFileStart, "new_file_start"},
            {HookPoint::NewFileEnd, "new_file_end"},
            {HookPoint::GetPathsStart, "get_paths_start"},
            {HookPoint::GetPathsEnd, "get_paths_end"},
            {HookPoint::StoreFileStart, "store_file_start"},
            {HookPoint::StoreFileEnd, "store_file_end"},
            {HookPoint::StoreContentStart, "store_content_start"},
            {HookPoint::StoreContentEnd, "store_content_end"},
        }};

    } // namespace

    std::string_view to_string(HookPoint point) noexcept
    {
        for (const auto &mapping : kHookPointMappings)
        {
            if (mapping.point == point)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    Client::Client(ClientOptions options, std::shared_ptr<Backend> backend, StorageTransportFactory storage_factory,
                   Logger logger, std::vector<Observer> observers)
        : options_(std::move(options)),
          backend_(std::move(backend)),
          storage_factory_(std::move(storage_factory)),
          logger_(std::move(logger)),
          observers_(std::move(observers))
    {
        if (!backend_ || !storage_factory_)
        {
            throw std::invalid_argument("Client requires a backend and a storage transport factory");
        }
    }

    Client Client::from_config(const ClientConfig &config, std::vector<Observer> observers)
    {
        Logger logger(config.logging);
        auto backend = std::make_shared<Backend>(config.trackers, BackendOptions{.timeout = config.timeout},
                                                 std::make_unique<AsioTrackerTransport>(logger), logger);
        for (const auto &[standard, preferred] : config.preferred_addresses)
        {
            backend->set_preferred_address(standard, preferred);
        }
        auto storage_factory = make_curl_transport_factory(
            CurlOptions{.connect_timeout = config.timeout, .transfer_timeout = config.http_timeout}, logger);
        return Client(ClientOptions{.domain = config.domain, .readonly = config.readonly}, std::move(backend),
                      std::move(storage_factory), logger, std::move(observers));
    }

    std::optional<TrackerAddress> Client::last_tracker() const
    {
        return backend_->last_tracker();
    }

    void Client::set_preferred_address(const std::string &standard_host, const std::string &preferred_host)
    {
        backend_->set_preferred_address(standard_host, preferred_host);
    }

    std::unique_ptr<WriteHandle> Client::new_file(const std::string &key, const NewFileOptions &options)
    {
        ensure_writable("new_file");
        run_hook(HookPoint::NewFileStart, key, options.storage_class);
        auto handle = WriteHandle::open(backend_, storage_factory_(), logger_, options_.domain, key, options);
        run_hook(HookPoint::NewFileEnd, key, options.storage_class);
        return handle;
    }

    std::uint64_t Client::store_content(const std::string &key, std::string_view content,
                                        const NewFileOptions &options)
    {
        ensure_writable("store_content");
        run_hook(HookPoint::StoreContentStart, key, options.storage_class);

        auto sized = options;
        if (sized.size_hint == 0)
        {
            sized.size_hint = content.size();
        }
        auto handle = new_file(key, sized);
        handle->write(content);
        const auto stored = finish_store(*handle, key);

        run_hook(HookPoint::StoreContentEnd, key, options.storage_class);
        return stored;
    }

    std::uint64_t Client::store_file(const std::string &key, std::istream &input, const NewFileOptions &options)
    {
        ensure_writable("store_file");
        run_hook(HookPoint::StoreFileStart, key, options.storage_class);

        auto handle = new_file(key, options);
        std::string chunk(kStoreChunkSize, '\0');
        while (input)
        {
            input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            const auto count = static_cast<std::size_t>(input.gcount());
            if (count == 0)
            {
                break;
            }
            handle->write(std::string_view(chunk.data(), count));
        }
        if (input.bad())
        {
            throw std::runtime_error("Failed reading input for key '" + key + "'");
        }
        const auto stored = finish_store(*handle, key);

        run_hook(HookPoint::StoreFileEnd, key, options.storage_class);
        return stored;
    }

    std::vector<std::string> Client::get_paths(const std::string &key, const GetPathsOptions &options)
    {
        run_hook(HookPoint::GetPathsStart, key);
        auto paths = request_paths(*backend_, options_.domain, key, options);
        run_hook(HookPoint::GetPathsEnd, key);
        return paths;
    }

    std::unique_ptr<ReadHandle> Client::read_file(const std::string &key, const GetPathsOptions &options)
    {
        run_hook(HookPoint::GetPathsStart, key);
        auto handle = ReadHandle::open(*backend_, storage_factory_(), logger_, options_.domain, key, options);
        run_hook(HookPoint::GetPathsEnd, key);
        return handle;
    }

    std::optional<std::string> Client::get_file_data(const std::string &key)
    {
        auto handle = read_file(key, GetPathsOptions{.noverify = true});
        if (!handle)
        {
            return std::nullopt;
        }
        auto content = handle->read_all();
        handle->close();
        return content;
    }

    void Client::rename(const std::string &from_key, const std::string &to_key)
    {
        ensure_writable("rename");
        backend_->do_request(protocol::Command::Rename,
                             {{"domain", options_.domain}, {"from_key", from_key}, {"to_key", to_key}});
    }

    void Client::remove(const std::string &key)
    {
        ensure_writable("delete");
        backend_->do_request(protocol::Command::Delete, {{"domain", options_.domain}, {"key", key}});
    }

    std::vector<std::string> Client::list_keys(const ListKeysOptions &options)
    {
        protocol::Params params{{"domain", options_.domain}};
        if (options.prefix && !options.prefix->empty())
        {
            params["prefix"] = *options.prefix;
        }
        if (options.after && !options.after->empty())
        {
            params["after"] = *options.after;
        }
        if (options.limit && *options.limit > 0)
        {
            params["limit"] = std::to_string(*options.limit);
        }

        try
        {
            return protocol::parse_keys(backend_->do_request(protocol::Command::ListKeys, params));
        }
        catch (const Error &ex)
        {
            if (ex.kind() == ErrorKind::Application && ex.code() == codes::kNoneMatch)
            {
                return {};
            }
            throw;
        }
    }

    void Client::sleep(std::uint32_t seconds)
    {
        backend_->do_request(protocol::Command::Sleep, {{"duration", std::to_string(seconds)}});
    }

    void Client::ensure_writable(std::string_view operation) const
    {
        if (options_.readonly)
        {
            throw Error(ErrorKind::ReadOnly, std::string(codes::kReadOnly),
                        std::string(operation) + " on read-only client");
        }
    }

    void Client::run_hook(HookPoint point, const std::string &key,
                          const std::optional<std::string> &storage_class) const
    {
        if (observers_.empty())
        {
            return;
        }
        const HookContext context{.key = key, .storage_class = storage_class};
        for (const auto &observer : observers_)
        {
            observer(point, context);
        }
    }

    std::uint64_t Client::finish_store(WriteHandle &handle, const std::string &key)
    {
        const auto size = handle.tell();
        if (!handle.close())
        {
            if (const auto &error = handle.error())
            {
                throw *error;
            }
            throw Error(ErrorKind::InvalidState, "close_failed", "close failed for key '" + key + "'");
        }
        logger_.info(LogSource::Client, "stored key=", key, " bytes=", size);
        return size;
    }

} // namespace mogilefs::client
