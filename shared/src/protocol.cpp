#include "mogilefs/protocol.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <string>

#include "mogilefs/error_codes.hpp"

namespace mogilefs::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 8> kCommandMappings{{
            {Command::CreateOpen, "create_open"},
            {Command::CreateClose, "create_close"},
            {Command::GetPaths, "get_paths"},
            {Command::Rename, "rename"},
            {Command::Delete, "delete"},
            {Command::ListKeys, "list_keys"},
            {Command::Sleep, "sleep"},
            {Command::Noop, "noop"},
        }};

        [[noreturn]] void protocol_violation(const std::string &message)
        {
            throw Error(ErrorKind::Connectivity, std::string(codes::kProtocolViolation), message);
        }

        int hex_value(char ch) noexcept
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

        bool is_unreserved(unsigned char ch) noexcept
        {
            return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
        }

        std::string_view strip_terminator(std::string_view line)
        {
            if (line.empty() || line.back() != '\n')
            {
                protocol_violation("unterminated tracker response");
            }
            line.remove_suffix(1);
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            return line;
        }

        const std::string &required_field(const FieldMap &fields, const std::string &name)
        {
            const auto it = fields.find(name);
            if (it == fields.end())
            {
                protocol_violation("tracker response is missing field '" + name + "'");
            }
            return it->second;
        }

        std::size_t required_count(const FieldMap &fields, const std::string &name)
        {
            const auto &text = required_field(fields, name);
            std::size_t value = 0;
            const auto *begin = text.data();
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc{} || ptr != end)
            {
                protocol_violation("tracker field '" + name + "' is not a count: " + text);
            }
            // Every counted entry is carried by at least one field of its own.
            if (value > fields.size())
            {
                protocol_violation("tracker field '" + name + "' claims " + text + " entries in a response of " +
                                   std::to_string(fields.size()) + " fields");
            }
            return value;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string url_escape(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string result;
        result.reserve(value.size());
        for (const char raw : value)
        {
            const auto ch = static_cast<unsigned char>(raw);
            if (is_unreserved(ch))
            {
                result.push_back(raw);
            }
            else if (ch == ' ')
            {
                result.push_back('+');
            }
            else
            {
                result.push_back('%');
                result.push_back(kHexDigits[(ch >> 4) & 0x0F]);
                result.push_back(kHexDigits[ch & 0x0F]);
            }
        }
        return result;
    }

    std::string url_unescape(std::string_view value)
    {
        std::string result;
        result.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            const char ch = value[i];
            if (ch == '+')
            {
                result.push_back(' ');
            }
            else if (ch == '%')
            {
                if (i + 2 >= value.size())
                {
                    protocol_violation("truncated percent escape");
                }
                const int high = hex_value(value[i + 1]);
                const int low = hex_value(value[i + 2]);
                if (high < 0 || low < 0)
                {
                    protocol_violation("invalid percent escape");
                }
                result.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            }
            else
            {
                result.push_back(ch);
            }
        }
        return result;
    }

    std::string encode_params(const Params &params)
    {
        std::string encoded;
        for (const auto &[key, value] : params)
        {
            if (!encoded.empty())
            {
                encoded.push_back('&');
            }
            encoded.append(url_escape(key));
            encoded.push_back('=');
            encoded.append(url_escape(value));
        }
        return encoded;
    }

    FieldMap decode_fields(std::string_view encoded)
    {
        FieldMap fields;
        while (!encoded.empty())
        {
            const auto amp = encoded.find('&');
            const auto pair = encoded.substr(0, amp);
            encoded = amp == std::string_view::npos ? std::string_view{} : encoded.substr(amp + 1);
            if (pair.empty())
            {
                continue;
            }
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos)
            {
                fields[url_unescape(pair)] = std::string{};
            }
            else
            {
                fields[url_unescape(pair.substr(0, eq))] = url_unescape(pair.substr(eq + 1));
            }
        }
        return fields;
    }

    std::string encode_request(Command command, const Params &params)
    {
        return encode_request(to_string(command), params);
    }

    std::string encode_request(std::string_view command, const Params &params)
    {
        if (command.empty() || command.find_first_of(" \r\n") != std::string_view::npos)
        {
            throw Error(ErrorKind::InvalidArgument, "invalid_command",
                        "invalid tracker command: '" + std::string(command) + "'");
        }
        std::string line(command);
        line.push_back(' ');
        line.append(encode_params(params));
        line.push_back('\n');
        return line;
    }

    TrackerResponse decode_response(std::string_view line)
    {
        const auto body = strip_terminator(line);
        TrackerResponse response;

        if (body == "OK" || body.starts_with("OK "))
        {
            response.kind = ResponseKind::Ok;
            auto rest = body.size() > 2 ? body.substr(3) : std::string_view{};
            // Older trackers prefix the field string with a numeric token.
            const auto space = rest.find(' ');
            if (space != std::string_view::npos)
            {
                const auto head = rest.substr(0, space);
                const bool numeric = !head.empty() &&
                                     head.find_first_not_of("0123456789") == std::string_view::npos;
                if (!numeric)
                {
                    protocol_violation("unexpected whitespace in OK response");
                }
                rest = rest.substr(space + 1);
            }
            response.fields = decode_fields(rest);
            return response;
        }

        if (body.starts_with("ERR "))
        {
            response.kind = ResponseKind::Error;
            auto rest = body.substr(4);
            const auto space = rest.find(' ');
            const auto code = rest.substr(0, space);
            if (code.empty())
            {
                protocol_violation("ERR response without error code");
            }
            response.error_code = std::string(code);
            if (space != std::string_view::npos)
            {
                response.message = url_unescape(rest.substr(space + 1));
            }
            if (response.message.empty())
            {
                response.message = response.error_code;
            }
            return response;
        }

        protocol_violation("unrecognized tracker response: '" + std::string(body.substr(0, 64)) + "'");
    }

    CreateOpenResponse parse_create_open(const FieldMap &fields)
    {
        CreateOpenResponse response;
        response.fid = required_field(fields, "fid");

        if (fields.find("dev_count") == fields.end())
        {
            response.destinations.push_back(Destination{
                .devid = required_field(fields, "devid"),
                .path = required_field(fields, "path"),
            });
        }
        else
        {
            const auto count = required_count(fields, "dev_count");
            response.destinations.reserve(count);
            for (std::size_t i = 1; i <= count; ++i)
            {
                const auto suffix = std::to_string(i);
                response.destinations.push_back(Destination{
                    .devid = required_field(fields, "devid_" + suffix),
                    .path = required_field(fields, "path_" + suffix),
                });
            }
        }

        if (response.destinations.empty())
        {
            protocol_violation("create_open returned no destinations");
        }
        return response;
    }

    std::vector<std::string> parse_paths(const FieldMap &fields)
    {
        const auto count = required_count(fields, "paths");
        std::vector<std::string> paths;
        paths.reserve(count);
        for (std::size_t i = 1; i <= count; ++i)
        {
            paths.push_back(required_field(fields, "path" + std::to_string(i)));
        }
        return paths;
    }

    std::vector<std::string> parse_keys(const FieldMap &fields)
    {
        const auto count = required_count(fields, "key_count");
        std::vector<std::string> keys;
        keys.reserve(count);
        for (std::size_t i = 1; i <= count; ++i)
        {
            keys.push_back(required_field(fields, "key_" + std::to_string(i)));
        }
        return keys;
    }

} // namespace mogilefs::protocol
