#include "mogilefs/error_codes.hpp"

#include <array>
#include <utility>

namespace mogilefs
{

    namespace
    {
        struct ErrorKindDescription
        {
            ErrorKind kind;
            std::string_view description;
        };

        constexpr std::array<ErrorKindDescription, 7> kDescriptions{{
            {ErrorKind::Connectivity, "connectivity"},
            {ErrorKind::Application, "application"},
            {ErrorKind::ReadOnly, "readonly"},
            {ErrorKind::StorageWriteExhausted, "storage_write_exhausted"},
            {ErrorKind::StorageReadExhausted, "storage_read_exhausted"},
            {ErrorKind::InvalidArgument, "invalid_argument"},
            {ErrorKind::InvalidState, "invalid_state"},
        }};
    } // namespace

    std::string_view to_string(ErrorKind kind) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.kind == kind)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    Error::Error(ErrorKind kind, std::string code, const std::string &message)
        : std::runtime_error(message),
          kind_(kind),
          code_(std::move(code))
    {
    }

} // namespace mogilefs
