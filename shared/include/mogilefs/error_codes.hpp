/**
 * MogileFS client - Failure taxonomy shared by the codec, backend and file handles.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mogilefs
{

    enum class ErrorKind : std::uint8_t
    {
        Connectivity = 0,
        Application = 1,
        ReadOnly = 2,
        StorageWriteExhausted = 3,
        StorageReadExhausted = 4,
        InvalidArgument = 5,
        InvalidState = 6
    };

    std::string_view to_string(ErrorKind kind) noexcept;

    // Well-known codes produced on the client side. Application errors carry the
    // tracker's own code instead.
    namespace codes
    {
        inline constexpr std::string_view kProtocolViolation = "protocol_violation";
        inline constexpr std::string_view kNoTrackers = "no_trackers";
        inline constexpr std::string_view kTimeout = "timeout";
        inline constexpr std::string_view kTransport = "transport";
        inline constexpr std::string_view kHttpStatus = "http_status";
        inline constexpr std::string_view kReadOnly = "readonly";
        inline constexpr std::string_view kUnknownKey = "unknown_key";
        inline constexpr std::string_view kNoneMatch = "none_match";
    } // namespace codes

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorKind kind, std::string code, const std::string &message);

        ErrorKind kind() const noexcept { return kind_; }
        const std::string &code() const noexcept { return code_; }

        bool is_connectivity() const noexcept { return kind_ == ErrorKind::Connectivity; }

    private:
        ErrorKind kind_;
        std::string code_;
    };

} // namespace mogilefs
