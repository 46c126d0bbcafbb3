#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mogilefs/client/backend.hpp"
#include "mogilefs/client/logger.hpp"
#include "mogilefs/client/storage_transport.hpp"
#include "mogilefs/error_codes.hpp"
#include "mogilefs/protocol.hpp"

namespace mogilefs::client
{

    struct NewFileOptions
    {
        std::optional<std::string> storage_class;
        // Expected object size; only used to size the upload buffer.
        std::uint64_t size_hint{};
        protocol::Params create_open_args;
        protocol::Params create_close_args;
    };

    enum class Zone : std::uint8_t
    {
        Default,
        Alt
    };

    std::string_view to_string(Zone zone) noexcept;

    struct GetPathsOptions
    {
        // Skip the tracker's existence check on each path.
        bool noverify{true};
        Zone zone{Zone::Alt};
        std::uint32_t pathcount{2};
    };

    // Issues get_paths. An unknown key yields an empty list; other failures propagate.
    std::vector<std::string> request_paths(Backend &backend, const std::string &domain, const std::string &key,
                                           const GetPathsOptions &options);

    // Common surface of upload and download handles.
    class FileHandle
    {
    public:
        virtual ~FileHandle() = default;

        virtual std::uint64_t tell() const noexcept = 0;
        virtual bool is_open() const noexcept = 0;
        virtual bool close() = 0;
    };

    enum class WriteState : std::uint8_t
    {
        Open,
        Closing,
        Closed,
        Failed
    };

    std::string_view to_string(WriteState state) noexcept;

    struct WriteContext
    {
        std::string domain;
        std::string key;
        std::string fid;
        std::vector<protocol::Destination> destinations;
        std::uint64_t size_hint{};
        protocol::Params create_close_args;
    };

    /**
     * Buffered upload of one new file.
     *
     * Bytes written are held in memory. close() uploads the whole buffer to the
     * destinations in plan order, moving to the next destination when a transfer
     * fails, then commits through create_close naming the destination that took it.
     * Until that commit is acknowledged the key keeps its previous content.
     */
    class WriteHandle : public FileHandle
    {
    public:
        static std::unique_ptr<WriteHandle> open(std::shared_ptr<Backend> backend,
                                                 std::unique_ptr<StorageTransport> storage, Logger logger,
                                                 const std::string &domain, const std::string &key,
                                                 const NewFileOptions &options);

        WriteHandle(std::shared_ptr<Backend> backend, std::unique_ptr<StorageTransport> storage, WriteContext context,
                    Logger logger);
        ~WriteHandle() override;

        WriteHandle(const WriteHandle &) = delete;
        WriteHandle &operator=(const WriteHandle &) = delete;

        std::size_t write(std::string_view bytes);

        // Returns false when no destination accepted the upload or the tracker refused
        // the commit; error() then describes why. Repeated calls return the first result.
        // Any other transport failure marks the handle failed and propagates.
        bool close() override;

        std::uint64_t tell() const noexcept override { return buffer_.size(); }
        bool is_open() const noexcept override { return state_ == WriteState::Open; }

        WriteState state() const noexcept { return state_; }
        const std::optional<Error> &error() const noexcept { return error_; }
        const std::string &fid() const noexcept { return context_.fid; }
        const std::vector<protocol::Destination> &destinations() const noexcept { return context_.destinations; }

    private:
        std::optional<std::size_t> upload();
        bool fail(Error error);

        std::shared_ptr<Backend> backend_;
        std::unique_ptr<StorageTransport> storage_;
        WriteContext context_;
        Logger logger_;
        std::string buffer_;
        WriteState state_{WriteState::Open};
        std::optional<Error> error_;
    };

    /**
     * Download of an existing key from an ordered list of replica URLs.
     *
     * A transport failure moves to the next source and continues from the current
     * offset, so callers see one contiguous stream. Closing needs no tracker contact.
     */
    class ReadHandle : public FileHandle
    {
    public:
        // Returns nullptr when the tracker knows no paths for the key.
        static std::unique_ptr<ReadHandle> open(Backend &backend, std::unique_ptr<StorageTransport> storage,
                                                Logger logger, const std::string &domain, const std::string &key,
                                                const GetPathsOptions &options);

        ReadHandle(std::vector<std::string> sources, std::unique_ptr<StorageTransport> storage, Logger logger);

        ReadHandle(const ReadHandle &) = delete;
        ReadHandle &operator=(const ReadHandle &) = delete;

        // Returns up to max_bytes; an empty result means end of object.
        std::string read(std::size_t max_bytes);
        std::string read_all();

        void seek(std::uint64_t offset);

        bool close() override;

        std::uint64_t tell() const noexcept override { return offset_; }
        bool is_open() const noexcept override { return open_; }

        const std::vector<std::string> &sources() const noexcept { return sources_; }
        std::size_t current_source() const noexcept { return current_; }

    private:
        std::string fetch(std::optional<std::uint64_t> limit);

        std::vector<std::string> sources_;
        std::unique_ptr<StorageTransport> storage_;
        Logger logger_;
        std::size_t current_{0};
        std::uint64_t offset_{0};
        bool open_{true};
    };

} // namespace mogilefs::client
