#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "mogilefs/error_codes.hpp"
#include "mogilefs/framing.hpp"
#include "mogilefs/protocol.hpp"

using namespace mogilefs;
using namespace mogilefs::protocol;

void run_client_component_tests();
void run_client_config_tests();
void run_tracker_transport_tests();

namespace
{

    template <typename Fn>
    std::optional<Error> capture_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const Error &ex)
        {
            return ex;
        }
        return std::nullopt;
    }

    void test_encode_request()
    {
        const Params params{
            {"key", "photos/cat 1.jpg"},
            {"domain", "media"},
            {"fid", "0"},
        };
        const auto line = encode_request(Command::CreateOpen, params);
        assert(line == "create_open domain=media&fid=0&key=photos%2Fcat+1.jpg\n");
        // Same parameters, same bytes.
        assert(encode_request(Command::CreateOpen, params) == line);

        assert(encode_request(Command::Noop, {}) == "noop \n");

        const auto bad = capture_error([]
                                       { encode_request("two words", {}); });
        assert(bad && bad->kind() == ErrorKind::InvalidArgument);
    }

    void test_escaping()
    {
        assert(url_escape("a-b_c.d~e") == "a-b_c.d~e");
        assert(url_escape("x=1&y=2") == "x%3D1%26y%3D2");
        assert(url_escape("\xff\n") == "%FF%0A");
        assert(url_unescape("hello+world%21") == "hello world!");
        assert(url_unescape("%e4%bd%a0") == "\xe4\xbd\xa0");

        const std::string tricky = "key with spaces/&=+%\x01";
        assert(url_unescape(url_escape(tricky)) == tricky);

        const auto truncated = capture_error([]
                                             { url_unescape("abc%4"); });
        assert(truncated && truncated->code() == codes::kProtocolViolation);
        const auto invalid = capture_error([]
                                           { url_unescape("%zz"); });
        assert(invalid && invalid->kind() == ErrorKind::Connectivity);
    }

    void test_decode_ok()
    {
        const auto response = decode_response("OK fid=42&devid=7&path=http%3A%2F%2F10.0.0.5%3A7500%2Fdev7%2F42.fid\r\n");
        assert(response.kind == ResponseKind::Ok);
        assert(response.fields.at("fid") == "42");
        assert(response.fields.at("devid") == "7");
        assert(response.fields.at("path") == "http://10.0.0.5:7500/dev7/42.fid");

        const auto bare = decode_response("OK\n");
        assert(bare.kind == ResponseKind::Ok);
        assert(bare.fields.empty());

        const auto numbered = decode_response("OK 3 key_count=0\n");
        assert(numbered.fields.at("key_count") == "0");

        const auto empty_value = decode_response("OK prefix=&after=x\n");
        assert(empty_value.fields.at("prefix").empty());
        assert(empty_value.fields.at("after") == "x");
    }

    void test_decode_err()
    {
        const auto response = decode_response("ERR unknown_key unknown+key+%27a%27\r\n");
        assert(response.kind == ResponseKind::Error);
        assert(response.error_code == "unknown_key");
        assert(response.message == "unknown key 'a'");

        const auto code_only = decode_response("ERR domain_not_found\n");
        assert(code_only.error_code == "domain_not_found");
        assert(code_only.message == "domain_not_found");
    }

    void test_decode_violations()
    {
        const std::vector<std::string> bad_lines = {
            "OK fid=1",
            "",
            "ERR \n",
            "HTTP/1.1 200 OK\r\n",
            "OKAY fid=1\n",
            "OK a b c\n",
        };
        for (const auto &line : bad_lines)
        {
            const auto error = capture_error([&]
                                             { decode_response(line); });
            assert(error.has_value());
            assert(error->kind() == ErrorKind::Connectivity);
            assert(error->code() == codes::kProtocolViolation);
        }
    }

    void test_create_open_shapes()
    {
        const auto legacy = parse_create_open({{"fid", "9"}, {"devid", "3"}, {"path", "http://a/dev3/9.fid"}});
        assert(legacy.fid == "9");
        assert(legacy.destinations.size() == 1);
        assert(legacy.destinations[0].devid == "3");

        const auto multi = parse_create_open({
            {"fid", "10"},
            {"dev_count", "2"},
            {"devid_1", "5"},
            {"path_1", "http://b/dev5/10.fid"},
            {"devid_2", "6"},
            {"path_2", "http://c/dev6/10.fid"},
            // dev_count wins over the legacy pair when both appear
            {"devid", "1"},
            {"path", "http://ignored"},
        });
        assert(multi.destinations.size() == 2);
        assert(multi.destinations[0].devid == "5");
        assert(multi.destinations[1].path == "http://c/dev6/10.fid");

        const auto missing = capture_error([]
                                           { parse_create_open({{"fid", "1"}, {"dev_count", "2"}, {"devid_1", "1"}, {"path_1", "p"}}); });
        assert(missing && missing->code() == codes::kProtocolViolation);

        const auto none = capture_error([]
                                        { parse_create_open({{"fid", "1"}, {"dev_count", "0"}}); });
        assert(none.has_value());

        const auto bad_count = capture_error([]
                                             { parse_create_open({{"fid", "1"}, {"dev_count", "two"}}); });
        assert(bad_count.has_value());

        const auto huge_count = capture_error([]
                                              { parse_create_open({{"fid", "1"}, {"dev_count", "18446744073709551615"}}); });
        assert(huge_count && huge_count->kind() == ErrorKind::Connectivity);
        assert(huge_count->code() == codes::kProtocolViolation);

        const auto overflowing = capture_error([]
                                               { parse_create_open({{"fid", "1"}, {"dev_count", "99999999999999999999999"}}); });
        assert(overflowing && overflowing->code() == codes::kProtocolViolation);
    }

    void test_paths_and_keys()
    {
        const auto paths = parse_paths({{"paths", "2"}, {"path1", "http://a/1.fid"}, {"path2", "http://b/1.fid"}});
        assert((paths == std::vector<std::string>{"http://a/1.fid", "http://b/1.fid"}));
        assert(parse_paths({{"paths", "0"}}).empty());

        const auto keys = parse_keys({{"key_count", "3"}, {"key_1", "a"}, {"key_2", "b"}, {"key_3", "c"}, {"next_after", "c"}});
        assert((keys == std::vector<std::string>{"a", "b", "c"}));

        const auto huge_paths = capture_error([]
                                              { parse_paths({{"paths", "4000000000000000000"}}); });
        assert(huge_paths && huge_paths->code() == codes::kProtocolViolation);
        const auto huge_keys = capture_error([]
                                             { parse_keys({{"key_count", "3"}, {"key_1", "a"}}); });
        assert(huge_keys && huge_keys->kind() == ErrorKind::Connectivity);
    }

    void test_framing()
    {
        assert(encode_line("noop ") == "noop \n");
        assert(capture_error([]
                             { encode_line("a\nb"); })
                   .has_value());

        assert(!try_decode_line("OK fid=1").has_value());
        const auto decoded = try_decode_line("OK fid=1\r\nOK fid=2\n");
        assert(decoded.has_value());
        assert(decoded->line == "OK fid=1\r\n");
        assert(decoded->bytes_consumed == 10);

        const std::string oversized(kMaxLineLength + 1, 'x');
        const auto error = capture_error([&]
                                         { try_decode_line(oversized); });
        assert(error && error->kind() == ErrorKind::Connectivity);
    }

    void test_error_kinds()
    {
        assert(to_string(ErrorKind::Connectivity) == "connectivity");
        assert(to_string(ErrorKind::StorageReadExhausted) == "storage_read_exhausted");
        assert(to_string(Command::ListKeys) == "list_keys");
        assert(command_from_string("create_close") == Command::CreateClose);
        assert(!command_from_string("store").has_value());

        const Error error(ErrorKind::Application, "key_exists", "Target key name already exists");
        assert(error.kind() == ErrorKind::Application);
        assert(error.code() == "key_exists");
        assert(std::string(error.what()) == "Target key name already exists");
        assert(!error.is_connectivity());
    }

} // namespace

int main()
{
    try
    {
        test_encode_request();
        test_escaping();
        test_decode_ok();
        test_decode_err();
        test_decode_violations();
        test_create_open_shapes();
        test_paths_and_keys();
        test_framing();
        test_error_kinds();
        run_client_component_tests();
        run_client_config_tests();
        run_tracker_transport_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
