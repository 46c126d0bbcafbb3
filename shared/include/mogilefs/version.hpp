/**
 * MogileFS client - Library version.
 */
#pragma once

#include <string_view>

namespace mogilefs
{

    constexpr std::string_view version() noexcept
    {
        return "1.0.0";
    }

} // namespace mogilefs
