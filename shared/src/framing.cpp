#include "mogilefs/framing.hpp"

#include <string>

#include "mogilefs/error_codes.hpp"

namespace mogilefs::protocol
{

    std::string encode_line(std::string_view body)
    {
        if (body.find('\n') != std::string_view::npos)
        {
            throw Error(ErrorKind::InvalidArgument, std::string(codes::kProtocolViolation),
                        "request line must not contain a newline");
        }
        std::string line;
        line.reserve(body.size() + 1);
        line.append(body);
        line.push_back('\n');
        return line;
    }

    std::optional<DecodedLine> try_decode_line(std::string_view buffer)
    {
        const auto newline = buffer.find('\n');
        if (newline == std::string_view::npos)
        {
            if (buffer.size() > kMaxLineLength)
            {
                throw Error(ErrorKind::Connectivity, std::string(codes::kProtocolViolation),
                            "tracker response line exceeds " + std::to_string(kMaxLineLength) + " bytes");
            }
            return std::nullopt;
        }
        DecodedLine result{
            .line = std::string(buffer.substr(0, newline + 1)),
            .bytes_consumed = newline + 1,
        };
        return result;
    }

} // namespace mogilefs::protocol
