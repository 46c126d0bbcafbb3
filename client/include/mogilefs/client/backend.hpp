#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mogilefs/client/logger.hpp"
#include "mogilefs/client/tracker_transport.hpp"
#include "mogilefs/protocol.hpp"

namespace mogilefs::client
{

    struct BackendOptions
    {
        std::chrono::milliseconds timeout{std::chrono::milliseconds{3000}};
    };

    // Issues one tracker request at a time against the configured tracker fleet.
    //
    // Candidate order is the last tracker that answered, then the remaining trackers
    // in configured order, each at most once per request. A transport failure moves on
    // to the next candidate; an ERR response is authoritative and is thrown at once as
    // ErrorKind::Application. When every candidate fails the request throws
    // ErrorKind::Connectivity.
    //
    // Not safe for concurrent use. Callers needing parallelism use separate instances.
    class Backend
    {
    public:
        Backend(std::vector<TrackerAddress> trackers, BackendOptions options,
                std::unique_ptr<TrackerTransport> transport, Logger logger = Logger{});

        protocol::FieldMap do_request(protocol::Command command, const protocol::Params &params);
        protocol::FieldMap do_request(std::string_view command, const protocol::Params &params);

        std::optional<TrackerAddress> last_tracker() const;

        // Hosts are remapped by name; the port of the configured tracker is kept.
        void set_preferred_address(const std::string &standard_host, const std::string &preferred_host);

        const std::vector<TrackerAddress> &trackers() const noexcept { return trackers_; }

    private:
        std::vector<std::size_t> candidate_order() const;
        std::vector<TrackerAddress> connect_addresses(const TrackerAddress &tracker) const;
        std::optional<protocol::TrackerResponse> try_tracker(const TrackerAddress &tracker, const std::string &line);

        std::vector<TrackerAddress> trackers_;
        BackendOptions options_;
        std::unique_ptr<TrackerTransport> transport_;
        Logger logger_;
        std::map<std::string, std::string> preferred_hosts_;
        std::optional<std::size_t> last_tracker_;
    };

} // namespace mogilefs::client
