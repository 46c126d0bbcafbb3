/**
 * MogileFS client - Tracker protocol schema and line codec.
 *
 * Requests travel as "<command> <form-urlencoded-params>\n". Responses come back as
 * "OK <form-urlencoded-fields>\n" or "ERR <code> <description>\n".
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mogilefs::protocol
{

    enum class Command : std::uint8_t
    {
        CreateOpen,
        CreateClose,
        GetPaths,
        Rename,
        Delete,
        ListKeys,
        Sleep,
        Noop
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    // Ordered maps keep the encoded parameter order deterministic.
    using Params = std::map<std::string, std::string>;
    using FieldMap = std::map<std::string, std::string>;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    struct TrackerResponse
    {
        ResponseKind kind{ResponseKind::Ok};
        FieldMap fields{};
        std::string error_code{};
        std::string message{};
    };

    std::string url_escape(std::string_view value);
    std::string url_unescape(std::string_view value);

    std::string encode_params(const Params &params);
    FieldMap decode_fields(std::string_view encoded);

    std::string encode_request(Command command, const Params &params);
    std::string encode_request(std::string_view command, const Params &params);

    // Throws mogilefs::Error (Connectivity, protocol_violation) for anything that is
    // neither a well-formed OK nor ERR line, including a missing terminator.
    TrackerResponse decode_response(std::string_view line);

    struct Destination
    {
        std::string devid;
        std::string path;
    };

    struct CreateOpenResponse
    {
        std::string fid;
        std::vector<Destination> destinations;
    };

    // Accepts both response shapes: a single devid/path pair, or dev_count numbered
    // devid_N/path_N pairs. The shape is chosen by the presence of dev_count.
    CreateOpenResponse parse_create_open(const FieldMap &fields);

    std::vector<std::string> parse_paths(const FieldMap &fields);

    std::vector<std::string> parse_keys(const FieldMap &fields);

} // namespace mogilefs::protocol
