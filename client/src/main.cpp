#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "mogilefs/client/client.hpp"
#include "mogilefs/client/config.hpp"
#include "mogilefs/error_codes.hpp"
#include "mogilefs/version.hpp"

namespace
{

    using mogilefs::client::Client;
    using mogilefs::client::CommandLine;

    void print_help()
    {
        std::cout << "mogilefs " << mogilefs::version() << "\n"
                  << "Commands:\n"
                  << "  put <key> <file> [--class <class>]   Store a local file under key\n"
                  << "  get <key> [<file>]                   Fetch key to file or stdout\n"
                  << "  paths <key> [--pathcount <n>]        Show replica locations\n"
                  << "  delete <key>                         Delete key\n"
                  << "  rename <from> <to>                   Rename key\n"
                  << "  list [--prefix <p>] [--limit <n>]    List all keys, page by page\n"
                  << "  sleep <seconds>                      Ask a tracker worker to sleep\n"
                  << "\nFlags:\n"
                  << "  --config <file>                      JSON configuration file\n"
                  << "  --tracker <host:port>                Tracker address, repeatable\n"
                  << "  --domain <domain>                    Domain to operate in\n"
                  << "  --readonly                           Refuse mutating commands\n"
                  << "  --timeout <ms>                       Per-attempt tracker timeout\n"
                  << "  --log <file>                         Append logs to file\n"
                  << "  --log-level <level>                  trace, debug, info (default), warn, error or off\n"
                  << "  --prefer <standard>=<preferred>      Preferred tracker host\n";
    }

    bool expect_args(const CommandLine &line, std::size_t min, std::size_t max)
    {
        if (line.args.size() < min || line.args.size() > max)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            print_help();
            return false;
        }
        return true;
    }

    std::optional<std::string> option(const CommandLine &line, const std::string &name)
    {
        if (const auto it = line.options.find(name); it != line.options.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    int handle_put(Client &client, const CommandLine &line)
    {
        if (!expect_args(line, 2, 2))
        {
            return EXIT_FAILURE;
        }
        std::ifstream in(line.args[1], std::ios::binary);
        if (!in.is_open())
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            return EXIT_FAILURE;
        }
        mogilefs::client::NewFileOptions options;
        options.storage_class = option(line, "class");
        const auto stored = client.store_file(line.args[0], in, options);
        std::cout << "Stored " << stored << " bytes as " << line.args[0] << std::endl;
        return EXIT_SUCCESS;
    }

    int handle_get(Client &client, const CommandLine &line)
    {
        if (!expect_args(line, 1, 2))
        {
            return EXIT_FAILURE;
        }
        auto handle = client.read_file(line.args[0]);
        if (!handle)
        {
            std::cout << "ERROR: unknown_key" << std::endl;
            return EXIT_FAILURE;
        }

        std::ofstream file;
        if (line.args.size() == 2)
        {
            file.open(line.args[1], std::ios::binary | std::ios::trunc);
            if (!file.is_open())
            {
                std::cout << "ERROR: file_io" << std::endl;
                return EXIT_FAILURE;
            }
        }
        std::ostream &out = file.is_open() ? static_cast<std::ostream &>(file) : std::cout;

        constexpr std::size_t kChunkSize = 64 * 1024;
        for (;;)
        {
            const auto chunk = handle->read(kChunkSize);
            if (chunk.empty())
            {
                break;
            }
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        }
        handle->close();
        out.flush();
        return out ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    int handle_paths(Client &client, const CommandLine &line)
    {
        if (!expect_args(line, 1, 1))
        {
            return EXIT_FAILURE;
        }
        mogilefs::client::GetPathsOptions options;
        if (const auto count = option(line, "pathcount"))
        {
            options.pathcount = static_cast<std::uint32_t>(std::stoul(*count));
        }
        for (const auto &path : client.get_paths(line.args[0], options))
        {
            std::cout << path << std::endl;
        }
        return EXIT_SUCCESS;
    }

    int handle_list(Client &client, const CommandLine &line)
    {
        if (!expect_args(line, 0, 0))
        {
            return EXIT_FAILURE;
        }
        mogilefs::client::ListKeysOptions options;
        options.prefix = option(line, "prefix");
        if (const auto limit = option(line, "limit"))
        {
            options.limit = static_cast<std::uint32_t>(std::stoul(*limit));
        }
        for (;;)
        {
            const auto keys = client.list_keys(options);
            if (keys.empty())
            {
                break;
            }
            for (const auto &key : keys)
            {
                std::cout << key << std::endl;
            }
            options.after = keys.back();
        }
        return EXIT_SUCCESS;
    }

    int dispatch(Client &client, const CommandLine &line)
    {
        if (line.command == "put")
        {
            return handle_put(client, line);
        }
        if (line.command == "get")
        {
            return handle_get(client, line);
        }
        if (line.command == "paths")
        {
            return handle_paths(client, line);
        }
        if (line.command == "delete")
        {
            if (!expect_args(line, 1, 1))
            {
                return EXIT_FAILURE;
            }
            client.remove(line.args[0]);
            std::cout << "OK" << std::endl;
            return EXIT_SUCCESS;
        }
        if (line.command == "rename")
        {
            if (!expect_args(line, 2, 2))
            {
                return EXIT_FAILURE;
            }
            client.rename(line.args[0], line.args[1]);
            std::cout << "OK" << std::endl;
            return EXIT_SUCCESS;
        }
        if (line.command == "list")
        {
            return handle_list(client, line);
        }
        if (line.command == "sleep")
        {
            if (!expect_args(line, 1, 1))
            {
                return EXIT_FAILURE;
            }
            client.sleep(static_cast<std::uint32_t>(std::stoul(line.args[0])));
            std::cout << "OK" << std::endl;
            return EXIT_SUCCESS;
        }
        if (line.command == "help")
        {
            print_help();
            return EXIT_SUCCESS;
        }
        std::cout << "ERROR: unsupported_command" << std::endl;
        return EXIT_FAILURE;
    }

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto line = mogilefs::client::parse_arguments(argc, argv);
        auto client = Client::from_config(line.config);
        const int status = dispatch(client, line);
        if (const auto tracker = client.last_tracker())
        {
            std::cerr << "tracker: " << mogilefs::client::to_string(*tracker) << std::endl;
        }
        return status;
    }
    catch (const mogilefs::Error &ex)
    {
        std::cerr << "ERROR: " << mogilefs::to_string(ex.kind()) << "/" << ex.code() << std::endl;
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
