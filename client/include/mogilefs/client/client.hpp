#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mogilefs/client/backend.hpp"
#include "mogilefs/client/config.hpp"
#include "mogilefs/client/file_handle.hpp"
#include "mogilefs/client/logger.hpp"
#include "mogilefs/client/storage_transport.hpp"

namespace mogilefs::client
{

    enum class HookPoint : std::uint8_t
    {
        NewFileStart,
        NewFileEnd,
        GetPathsStart,
        GetPathsEnd,
        StoreFileStart,
        StoreFileEnd,
        StoreContentStart,
        StoreContentEnd
    };

    std::string_view to_string(HookPoint point) noexcept;

    struct HookContext
    {
        std::string key;
        std::optional<std::string> storage_class;
    };

    using Observer = std::function<void(HookPoint, const HookContext &)>;

    struct ListKeysOptions
    {
        std::optional<std::string> prefix;
        std::optional<std::string> after;
        std::optional<std::uint32_t> limit;
    };

    struct ClientOptions
    {
        std::string domain;
        bool readonly{};
    };

    class Client
    {
    public:
        Client(ClientOptions options, std::shared_ptr<Backend> backend, StorageTransportFactory storage_factory,
               Logger logger = Logger{}, std::vector<Observer> observers = {});

        // Wires asio tracker transport, curl storage transport and the configured logger.
        static Client from_config(const ClientConfig &config, std::vector<Observer> observers = {});

        std::optional<TrackerAddress> last_tracker() const;
        void set_preferred_address(const std::string &standard_host, const std::string &preferred_host);

        // The returned handle must be closed and its result checked; an unclosed or
        // failed handle leaves the key unchanged.
        std::unique_ptr<WriteHandle> new_file(const std::string &key, const NewFileOptions &options = {});

        std::uint64_t store_content(const std::string &key, std::string_view content,
                                    const NewFileOptions &options = {});
        std::uint64_t store_file(const std::string &key, std::istream &input, const NewFileOptions &options = {});

        std::vector<std::string> get_paths(const std::string &key, const GetPathsOptions &options = {});
        std::unique_ptr<ReadHandle> read_file(const std::string &key, const GetPathsOptions &options = {});
        std::optional<std::string> get_file_data(const std::string &key);

        void rename(const std::string &from_key, const std::string &to_key);
        void remove(const std::string &key);

        // One page of keys. Pass the last key of a page as `after` to fetch the next;
        // an empty page marks the end.
        std::vector<std::string> list_keys(const ListKeysOptions &options = {});

        void sleep(std::uint32_t seconds);

        const std::string &domain() const noexcept { return options_.domain; }
        bool readonly() const noexcept { return options_.readonly; }

    private:
        void ensure_writable(std::string_view operation) const;
        void run_hook(HookPoint point, const std::string &key,
                      const std::optional<std::string> &storage_class = std::nullopt) const;
        std::uint64_t finish_store(WriteHandle &handle, const std::string &key);

        ClientOptions options_;
        std::shared_ptr<Backend> backend_;
        StorageTransportFactory storage_factory_;
        Logger logger_;
        std::vector<Observer> observers_;
    };

} // namespace mogilefs::client
