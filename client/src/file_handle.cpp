#include "mogilefs/client/file_handle.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace mogilefs::client
{

    namespace
    {

        struct WriteStateMapping
        {
            WriteState state;
            std::string_view label;
        };

        constexpr std::array<WriteStateMapping, 4> kWriteStateMappings{{
            {WriteState::Open, "open"},
            {WriteState::Closing, "closing"},
            {WriteState::Closed, "closed"},
            {WriteState::Failed, "failed"},
        }};

        Error invalid_state(const std::string &message)
        {
            return Error(ErrorKind::InvalidState, "invalid_state", message);
        }

    } // namespace

    std::string_view to_string(Zone zone) noexcept
    {
        return zone == Zone::Alt ? "alt" : "";
    }

    std::string_view to_string(WriteState state) noexcept
    {
        for (const auto &mapping : kWriteStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::vector<std::string> request_paths(Backend &backend, const std::string &domain, const std::string &key,
                                           const GetPathsOptions &options)
    {
        const protocol::Params params{
            {"domain", domain},
            {"key", key},
            {"noverify", options.noverify ? "1" : "0"},
            {"zone", std::string(to_string(options.zone))},
            {"pathcount", std::to_string(options.pathcount == 0 ? 2 : options.pathcount)},
        };
        try
        {
            return protocol::parse_paths(backend.do_request(protocol::Command::GetPaths, params));
        }
        catch (const Error &ex)
        {
            if (ex.kind() == ErrorKind::Application && ex.code() == codes::kUnknownKey)
            {
                return {};
            }
            throw;
        }
    }

    std::unique_ptr<WriteHandle> WriteHandle::open(std::shared_ptr<Backend> backend,
                                                   std::unique_ptr<StorageTransport> storage, Logger logger,
                                                   const std::string &domain, const std::string &key,
                                                   const NewFileOptions &options)
    {
        protocol::Params params = options.create_open_args;
        params["domain"] = domain;
        params["key"] = key;
        params["fid"] = "0";
        params["multi_dest"] = "1";
        if (options.storage_class)
        {
            params["class"] = *options.storage_class;
        }

        auto response = protocol::parse_create_open(backend->do_request(protocol::Command::CreateOpen, params));
        logger.info(LogSource::Write, "opened fid=", response.fid, " key=", key, " destinations=", response.destinations.size());

        WriteContext context{
            .domain = domain,
            .key = key,
            .fid = std::move(response.fid),
            .destinations = std::move(response.destinations),
            .size_hint = options.size_hint,
            .create_close_args = options.create_close_args,
        };
        return std::make_unique<WriteHandle>(std::move(backend), std::move(storage), std::move(context),
                                             std::move(logger));
    }

    WriteHandle::WriteHandle(std::shared_ptr<Backend> backend, std::unique_ptr<StorageTransport> storage,
                             WriteContext context, Logger logger)
        : backend_(std::move(backend)),
          storage_(std::move(storage)),
          context_(std::move(context)),
          logger_(std::move(logger))
    {
        if (!backend_ || !storage_)
        {
            throw std::invalid_argument("WriteHandle requires a backend and a storage transport");
        }
        if (context_.destinations.empty())
        {
            throw Error(ErrorKind::InvalidArgument, "no_destinations", "write plan has no destinations");
        }
        buffer_.reserve(static_cast<std::size_t>(context_.size_hint));
    }

    WriteHandle::~WriteHandle()
    {
        if (state_ == WriteState::Open)
        {
            logger_.warn(LogSource::Write, "fid=", context_.fid, " key=", context_.key, " dropped without close, ",
                         buffer_.size(), " bytes discarded");
        }
    }

    std::size_t WriteHandle::write(std::string_view bytes)
    {
        if (state_ != WriteState::Open)
        {
            throw invalid_state("write on a " + std::string(to_string(state_)) + " file handle");
        }
        buffer_.append(bytes.data(), bytes.size());
        return bytes.size();
    }

    bool WriteHandle::close()
    {
        if (state_ != WriteState::Open)
        {
            return state_ == WriteState::Closed;
        }
        state_ = WriteState::Closing;

        if (context_.size_hint != 0 && context_.size_hint != buffer_.size())
        {
            logger_.warn(LogSource::Write, "fid=", context_.fid, " size hint ", context_.size_hint, " but wrote ",
                         buffer_.size(), " bytes");
        }

        std::optional<std::size_t> winner;
        try
        {
            winner = upload();
        }
        catch (const Error &ex)
        {
            fail(ex);
            throw;
        }
        catch (const std::exception &ex)
        {
            fail(Error(ErrorKind::StorageWriteExhausted, "storage_failure",
                       "storage transport failed for fid " + context_.fid + ": " + ex.what()));
            throw;
        }
        if (!winner)
        {
            return fail(Error(ErrorKind::StorageWriteExhausted, "all_destinations_failed",
                              "no destination accepted fid " + context_.fid + " for key '" + context_.key + "'"));
        }

        const auto &destination = context_.destinations[*winner];
        protocol::Params params = context_.create_close_args;
        params["fid"] = context_.fid;
        params["domain"] = context_.domain;
        params["key"] = context_.key;
        params["devid"] = destination.devid;
        params["path"] = destination.path;
        params["size"] = std::to_string(buffer_.size());
        params["overwrite"] = "1";

        try
        {
            backend_->do_request(protocol::Command::CreateClose, params);
        }
        catch (const Error &ex)
        {
            return fail(ex);
        }

        state_ = WriteState::Closed;
        logger_.info(LogSource::Write, "committed fid=", context_.fid, " key=", context_.key, " devid=", destination.devid,
                     " size=", buffer_.size());
        buffer_.clear();
        buffer_.shrink_to_fit();
        return true;
    }

    std::optional<std::size_t> WriteHandle::upload()
    {
        for (std::size_t i = 0; i < context_.destinations.size(); ++i)
        {
            const auto &destination = context_.destinations[i];
            try
            {
                storage_->put(destination.path, buffer_);
                return i;
            }
            catch (const Error &ex)
            {
                if (!ex.is_connectivity())
                {
                    throw;
                }
                logger_.warn(LogSource::Write, "fid=", context_.fid, " devid=", destination.devid, " failed, ", ex.what());
            }
        }
        return std::nullopt;
    }

    bool WriteHandle::fail(Error error)
    {
        logger_.warn(LogSource::Write, "fid=", context_.fid, " key=", context_.key, " not committed: ", to_string(error.kind()),
                     "/", error.code(), " ", error.what());
        state_ = WriteState::Failed;
        error_ = std::move(error);
        buffer_.clear();
        return false;
    }

    std::unique_ptr<ReadHandle> ReadHandle::open(Backend &backend, std::unique_ptr<StorageTransport> storage,
                                                 Logger logger, const std::string &domain, const std::string &key,
                                                 const GetPathsOptions &options)
    {
        auto paths = request_paths(backend, domain, key, options);
        if (paths.empty())
        {
            return nullptr;
        }
        logger.info(LogSource::Read, "key=", key, " sources=", paths.size());
        return std::make_unique<ReadHandle>(std::move(paths), std::move(storage), std::move(logger));
    }

    ReadHandle::ReadHandle(std::vector<std::string> sources, std::unique_ptr<StorageTransport> storage, Logger logger)
        : sources_(std::move(sources)),
          storage_(std::move(storage)),
          logger_(std::move(logger))
    {
        if (!storage_)
        {
            throw std::invalid_argument("ReadHandle requires a storage transport");
        }
    }

    std::string ReadHandle::read(std::size_t max_bytes)
    {
        return fetch(static_cast<std::uint64_t>(max_bytes));
    }

    std::string ReadHandle::read_all()
    {
        return fetch(std::nullopt);
    }

    void ReadHandle::seek(std::uint64_t offset)
    {
        if (!open_)
        {
            throw invalid_state("seek on a closed file handle");
        }
        offset_ = offset;
    }

    bool ReadHandle::close()
    {
        open_ = false;
        return true;
    }

    std::string ReadHandle::fetch(std::optional<std::uint64_t> limit)
    {
        if (!open_)
        {
            throw invalid_state("read on a closed file handle");
        }

        std::string out;
        while (current_ < sources_.size())
        {
            const auto before = out.size();
            std::optional<std::uint64_t> remaining;
            if (limit)
            {
                remaining = *limit - out.size();
            }
            try
            {
                storage_->get(sources_[current_], offset_, remaining, out);
                offset_ += out.size() - before;
                return out;
            }
            catch (const Error &ex)
            {
                if (!ex.is_connectivity())
                {
                    throw;
                }
                offset_ += out.size() - before;
                logger_.warn(LogSource::Read, "source ", current_ + 1, "/", sources_.size(), " failed at offset ", offset_,
                             ", ", ex.what());
                ++current_;
            }
        }

        // A bounded read may hand back what it got; a whole-object read never returns a truncated object.
        if (limit && !out.empty())
        {
            return out;
        }
        throw Error(ErrorKind::StorageReadExhausted, "all_sources_failed",
                    "every source failed at offset " + std::to_string(offset_));
    }

} // namespace mogilefs::client
