#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mogilefs/client/logger.hpp"
#include "mogilefs/client/tracker_transport.hpp"

namespace mogilefs::client
{

    struct ClientConfig
    {
        std::string domain;
        std::vector<TrackerAddress> trackers;
        bool readonly{};
        std::chrono::milliseconds timeout{std::chrono::milliseconds{3000}};
        std::chrono::milliseconds http_timeout{std::chrono::milliseconds{10000}};
        LogSettings logging;
        // standard host -> preferred host
        std::map<std::string, std::string> preferred_addresses;
    };

    struct CommandLine
    {
        ClientConfig config;
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> options;
    };

    // Reads a JSON configuration file into config, overriding the fields it names.
    void load_config_file(const std::filesystem::path &path, ClientConfig &config);

    CommandLine parse_arguments(int argc, char *argv[]);

} // namespace mogilefs::client
