#include "mogilefs/client/backend.hpp"

#include <stdexcept>
#include <utility>

#include "mogilefs/error_codes.hpp"

namespace mogilefs::client
{

    Backend::Backend(std::vector<TrackerAddress> trackers, BackendOptions options,
                     std::unique_ptr<TrackerTransport> transport, Logger logger)
        : trackers_(std::move(trackers)),
          options_(options),
          transport_(std::move(transport)),
          logger_(std::move(logger))
    {
        if (trackers_.empty())
        {
            throw Error(ErrorKind::InvalidArgument, std::string(codes::kNoTrackers), "no tracker addresses configured");
        }
        if (!transport_)
        {
            throw std::invalid_argument("Backend requires a tracker transport");
        }
    }

    protocol::FieldMap Backend::do_request(protocol::Command command, const protocol::Params &params)
    {
        return do_request(protocol::to_string(command), params);
    }

    protocol::FieldMap Backend::do_request(std::string_view command, const protocol::Params &params)
    {
        const auto line = protocol::encode_request(command, params);

        for (const auto index : candidate_order())
        {
            const auto &tracker = trackers_[index];
            auto response = try_tracker(tracker, line);
            if (!response)
            {
                continue;
            }

            if (response->kind == protocol::ResponseKind::Error)
            {
                logger_.info(LogSource::Tracker, command, " -> ERR ", response->error_code, " ", response->message);
                throw Error(ErrorKind::Application, response->error_code, response->message);
            }
            last_tracker_ = index;
            logger_.debug(LogSource::Tracker, command, " -> OK via ", to_string(tracker));
            return std::move(response->fields);
        }

        logger_.warn(LogSource::Tracker, command, " failed: no tracker reachable");
        throw Error(ErrorKind::Connectivity, std::string(codes::kNoTrackers),
                    "unable to reach any tracker for '" + std::string(command) + "'");
    }

    std::optional<TrackerAddress> Backend::last_tracker() const
    {
        if (!last_tracker_)
        {
            return std::nullopt;
        }
        return trackers_[*last_tracker_];
    }

    void Backend::set_preferred_address(const std::string &standard_host, const std::string &preferred_host)
    {
        if (standard_host == preferred_host)
        {
            preferred_hosts_.erase(standard_host);
            return;
        }
        preferred_hosts_[standard_host] = preferred_host;
    }

    std::vector<std::size_t> Backend::candidate_order() const
    {
        std::vector<std::size_t> order;
        order.reserve(trackers_.size());
        if (last_tracker_)
        {
            order.push_back(*last_tracker_);
        }
        for (std::size_t i = 0; i < trackers_.size(); ++i)
        {
            if (!last_tracker_ || i != *last_tracker_)
            {
                order.push_back(i);
            }
        }
        return order;
    }

    std::vector<TrackerAddress> Backend::connect_addresses(const TrackerAddress &tracker) const
    {
        std::vector<TrackerAddress> addresses;
        if (const auto it = preferred_hosts_.find(tracker.host); it != preferred_hosts_.end())
        {
            addresses.push_back(TrackerAddress{.host = it->second, .port = tracker.port});
        }
        addresses.push_back(tracker);
        return addresses;
    }

    std::optional<protocol::TrackerResponse> Backend::try_tracker(const TrackerAddress &tracker, const std::string &line)
    {
        for (const auto &address : connect_addresses(tracker))
        {
            try
            {
                const auto reply = transport_->exchange(address, line, options_.timeout);
                return protocol::decode_response(reply);
            }
            catch (const Error &ex)
            {
                if (!ex.is_connectivity())
                {
                    throw;
                }
                transport_->disconnect();
                logger_.warn(LogSource::Tracker, "skipping ", to_string(address), ": ", ex.what());
            }
        }
        return std::nullopt;
    }

} // namespace mogilefs::client
