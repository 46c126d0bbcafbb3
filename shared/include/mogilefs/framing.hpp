/**
 * MogileFS client - Newline-terminated line framing for the tracker protocol.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mogilefs::protocol
{

    struct DecodedLine
    {
        std::string line;
        std::size_t bytes_consumed{};
    };

    // Upper bound for a single tracker line. A buffer that grows past this without a
    // newline is treated as a protocol violation.
    inline constexpr std::size_t kMaxLineLength = 1024 * 1024;

    std::string encode_line(std::string_view body);

    // Returns the first complete line (terminator included) or nullopt when the buffer
    // does not hold one yet. Throws mogilefs::Error when the buffer exceeds kMaxLineLength.
    std::optional<DecodedLine> try_decode_line(std::string_view buffer);

} // namespace mogilefs::protocol
