#include "mogilefs/client/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace mogilefs::client
{

    namespace
    {

        constexpr const char *kUsage =
            "Usage: mogilefs [--config <file>] [--tracker <host:port>]... [--domain <domain>] [--readonly] "
            "[--timeout <ms>] [--log <file>] [--log-level <level>] [--prefer <standard>=<preferred>] <command> [args...]";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        void add_preference(const std::string &mapping, ClientConfig &config)
        {
            const auto eq = mapping.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == mapping.size())
            {
                throw std::runtime_error("--prefer expects <standard>=<preferred>, got '" + mapping + "'");
            }
            config.preferred_addresses[mapping.substr(0, eq)] = mapping.substr(eq + 1);
        }

        spdlog::level::level_enum require_log_level(const std::string &text)
        {
            const auto level = parse_log_level(text);
            if (!level)
            {
                throw std::runtime_error("Unknown log level '" + text + "', expected trace, debug, info, warn, error or off");
            }
            return *level;
        }

    } // namespace

    void load_config_file(const std::filesystem::path &path, ClientConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open config file " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Config file " + path.string() + " must hold a JSON object");
        }

        config.domain = json.value("domain", config.domain);
        config.readonly = json.value("readonly", config.readonly);
        if (auto it = json.find("trackers"); it != json.end())
        {
            config.trackers.clear();
            for (const auto &entry : *it)
            {
                config.trackers.push_back(parse_tracker_address(entry.get<std::string>()));
            }
        }
        if (auto it = json.find("timeout_ms"); it != json.end())
        {
            config.timeout = std::chrono::milliseconds{it->get<std::int64_t>()};
        }
        if (auto it = json.find("http_timeout_ms"); it != json.end())
        {
            config.http_timeout = std::chrono::milliseconds{it->get<std::int64_t>()};
        }
        if (auto it = json.find("log"); it != json.end())
        {
            config.logging.file = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("log_level"); it != json.end())
        {
            config.logging.level = require_log_level(it->get<std::string>());
        }
        if (auto it = json.find("preferred_addresses"); it != json.end())
        {
            for (const auto &[standard, preferred] : it->items())
            {
                config.preferred_addresses[standard] = preferred.get<std::string>();
            }
        }
    }

    CommandLine parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(kUsage);
        }

        CommandLine result;
        // The config file is applied first so explicit flags override it.
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                load_config_file(std::filesystem::path(argv[i + 1]), result.config);
                break;
            }
        }

        std::vector<TrackerAddress> flag_trackers;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                require_value(index, argc, argv, arg);
            }
            else if (arg == "--tracker")
            {
                flag_trackers.push_back(parse_tracker_address(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--domain")
            {
                result.config.domain = require_value(index, argc, argv, arg);
            }
            else if (arg == "--readonly")
            {
                result.config.readonly = true;
            }
            else if (arg == "--timeout")
            {
                result.config.timeout = std::chrono::milliseconds{std::stoll(require_value(index, argc, argv, arg))};
            }
            else if (arg == "--log")
            {
                result.config.logging.file = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                result.config.logging.level = require_log_level(require_value(index, argc, argv, arg));
            }
            else if (arg == "--prefer")
            {
                add_preference(require_value(index, argc, argv, arg), result.config);
            }
            else if (arg.starts_with("--"))
            {
                if (result.command.empty())
                {
                    throw std::runtime_error("Unknown argument: " + arg);
                }
                result.options[arg.substr(2)] = require_value(index, argc, argv, arg);
            }
            else if (result.command.empty())
            {
                result.command = arg;
            }
            else
            {
                result.args.push_back(arg);
            }
        }

        if (!flag_trackers.empty())
        {
            result.config.trackers = std::move(flag_trackers);
        }
        if (result.command.empty())
        {
            throw std::runtime_error(kUsage);
        }
        if (result.config.trackers.empty())
        {
            throw std::runtime_error("At least one --tracker <host:port> is required");
        }
        if (result.config.domain.empty())
        {
            throw std::runtime_error("--domain is required");
        }
        return result;
    }

} // namespace mogilefs::client
