#include <cassert>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mogilefs/client/backend.hpp"
#include "mogilefs/client/client.hpp"
#include "mogilefs/client/file_handle.hpp"
#include "mogilefs/error_codes.hpp"
#include "test_support.hpp"

using namespace mogilefs;
using namespace mogilefs::client;
using namespace mogilefs::testing;

namespace
{

    const TrackerAddress kTrackerA{.host = "10.0.0.1", .port = 7001};
    const TrackerAddress kTrackerB{.host = "10.0.0.2", .port = 7001};
    const TrackerAddress kTrackerC{.host = "10.0.0.3", .port = 7001};

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

    struct Fixture
    {
        std::shared_ptr<FakeTrackerNetwork> network = std::make_shared<FakeTrackerNetwork>();
        std::shared_ptr<InMemoryTracker> tracker = std::make_shared<InMemoryTracker>(std::vector<InMemoryTracker::Device>{
            {.devid = "11", .host = "store1:7500"},
            {.devid = "12", .host = "store2:7500"},
        });
        std::shared_ptr<FakeStorageState> storage = std::make_shared<FakeStorageState>();
        std::shared_ptr<Backend> backend;

        explicit Fixture(std::vector<TrackerAddress> trackers = {kTrackerA, kTrackerB})
        {
            auto model = tracker;
            network->responder = [model](const std::string &line)
            { return (*model)(line); };
            backend = std::make_shared<Backend>(std::move(trackers), BackendOptions{},
                                                std::make_unique<FakeTrackerTransport>(network));
        }

        Client make_client(bool readonly = false, std::vector<Observer> observers = {}) const
        {
            return Client(ClientOptions{.domain = "testdomain", .readonly = readonly}, backend,
                          fake_storage_factory(storage), Logger{}, std::move(observers));
        }

        std::string primary_url(const std::string &fid) const { return "http://store1:7500/dev11/" + fid + ".fid"; }
        std::string backup_url(const std::string &fid) const { return "http://store2:7500/dev12/" + fid + ".fid"; }
    };

    void test_backend_failover_order()
    {
        Fixture fx({kTrackerA, kTrackerB, kTrackerC});
        fx.network->unreachable.insert(to_string(kTrackerA));

        const auto fields = fx.backend->do_request(protocol::Command::Noop, {});
        assert(fields.empty());
        assert((fx.network->attempts == std::vector<std::string>{"10.0.0.1:7001", "10.0.0.2:7001"}));
        assert(fx.backend->last_tracker() == kTrackerB);

        // The tracker that answered last is tried first next time.
        fx.network->attempts.clear();
        fx.backend->do_request(protocol::Command::Noop, {});
        assert((fx.network->attempts == std::vector<std::string>{"10.0.0.2:7001"}));

        // When it goes away the remaining trackers follow in configured order.
        fx.network->attempts.clear();
        fx.network->unreachable.insert(to_string(kTrackerB));
        fx.backend->do_request(protocol::Command::Noop, {});
        assert((fx.network->attempts == std::vector<std::string>{"10.0.0.2:7001", "10.0.0.1:7001", "10.0.0.3:7001"}));
        assert(fx.backend->last_tracker() == kTrackerC);
    }

    void test_backend_all_trackers_down()
    {
        Fixture fx;
        fx.network->unreachable = {to_string(kTrackerA), to_string(kTrackerB)};
        assert(!fx.backend->last_tracker().has_value());

        const auto error = capture_error([&]
                                         { fx.backend->do_request(protocol::Command::Noop, {}); });
        assert(error.has_value());
        assert(error->kind() == ErrorKind::Connectivity);
        // Each tracker is tried exactly once per request.
        assert(fx.network->attempts.size() == 2);
        assert(!fx.backend->last_tracker().has_value());
    }

    void test_backend_application_error_is_final()
    {
        Fixture fx({kTrackerA, kTrackerB, kTrackerC});
        const auto error = capture_error([&]
                                         { fx.backend->do_request(protocol::Command::GetPaths,
                                                                  {{"domain", "testdomain"}, {"key", "missing"}}); });
        assert(error.has_value());
        assert(error->kind() == ErrorKind::Application);
        assert(error->code() == "unknown_key");
        assert(fx.network->attempts.size() == 1);
        // Only a successful answer makes a tracker the preferred first candidate.
        assert(!fx.backend->last_tracker().has_value());

        fx.network->unreachable.insert(to_string(kTrackerA));
        fx.backend->do_request(protocol::Command::Noop, {});
        assert(fx.backend->last_tracker() == kTrackerB);
        const auto refused = capture_error([&]
                                           { fx.backend->do_request(protocol::Command::Rename,
                                                                    {{"domain", "testdomain"}, {"from_key", "x"}, {"to_key", "y"}}); });
        assert(refused && refused->kind() == ErrorKind::Application);
        assert(fx.backend->last_tracker() == kTrackerB);
    }

    void test_backend_malformed_response_skips_tracker()
    {
        Fixture fx;
        fx.network->garbled.insert(to_string(kTrackerA));
        fx.backend->do_request(protocol::Command::Noop, {});
        assert(fx.backend->last_tracker() == kTrackerB);
        assert(fx.network->attempts.size() == 2);
    }

    void test_backend_preferred_address()
    {
        Fixture fx;
        fx.backend->set_preferred_address("10.0.0.1", "192.168.0.1");

        fx.backend->do_request(protocol::Command::Noop, {});
        assert((fx.network->attempts == std::vector<std::string>{"192.168.0.1:7001"}));
        // Recorded under the configured address.
        assert(fx.backend->last_tracker() == kTrackerA);

        fx.network->attempts.clear();
        fx.network->unreachable.insert("192.168.0.1:7001");
        fx.backend->do_request(protocol::Command::Noop, {});
        assert((fx.network->attempts == std::vector<std::string>{"192.168.0.1:7001", "10.0.0.1:7001"}));

        fx.network->attempts.clear();
        fx.backend->set_preferred_address("10.0.0.1", "10.0.0.1");
        fx.backend->do_request(protocol::Command::Noop, {});
        assert((fx.network->attempts == std::vector<std::string>{"10.0.0.1:7001"}));
    }

    void test_backend_requires_trackers()
    {
        auto network = std::make_shared<FakeTrackerNetwork>();
        const auto error = capture_error([&]
                                         { Backend backend({}, BackendOptions{}, std::make_unique<FakeTrackerTransport>(network)); });
        assert(error && error->kind() == ErrorKind::InvalidArgument);
    }

    void test_write_round_trip()
    {
        Fixture fx;
        auto client = fx.make_client();

        auto handle = client.new_file("greeting", NewFileOptions{.storage_class = std::string("small")});
        assert(handle->state() == WriteState::Open);
        assert(handle->destinations().size() == 2);
        assert(handle->write("hello, ") == 7);
        assert(handle->write("world") == 5);
        assert(handle->tell() == 12);

        // Nothing is visible before the commit.
        assert(!client.get_file_data("greeting").has_value());

        assert(handle->close());
        assert(handle->state() == WriteState::Closed);
        assert(!handle->error().has_value());

        const auto open = fx.tracker->last("create_open");
        assert(open && open->params.at("class") == "small");
        assert(open->params.at("fid") == "0");
        assert(open->params.at("multi_dest") == "1");

        const auto close = fx.tracker->last("create_close");
        assert(close.has_value());
        assert(close->params.at("devid") == "11");
        assert(close->params.at("size") == "12");
        assert(close->params.at("overwrite") == "1");
        assert(close->params.at("domain") == "testdomain");
        assert(close->params.at("key") == "greeting");

        assert(client.get_file_data("greeting") == std::string("hello, world"));

        // Closing twice reports the first outcome without another commit.
        assert(handle->close());
        assert(fx.tracker->count("create_close") == 1);
        const auto late_write = capture_error([&]
                                              { handle->write("more"); });
        assert(late_write && late_write->kind() == ErrorKind::InvalidState);
    }

    void test_write_fails_over_to_backup()
    {
        Fixture fx;
        auto client = fx.make_client();

        auto handle = client.new_file("report");
        fx.storage->unreachable.insert(fx.primary_url(handle->fid()));
        handle->write("quarterly numbers");
        assert(handle->close());

        const auto close = fx.tracker->last("create_close");
        assert(close->params.at("devid") == "12");
        assert(close->params.at("path") == fx.backup_url(handle->fid()));
        assert(close->params.at("size") == "17");
        assert((fx.storage->puts == std::vector<std::string>{fx.primary_url(handle->fid()), fx.backup_url(handle->fid())}));
        assert(client.get_file_data("report") == std::string("quarterly numbers"));
    }

    void test_write_exhaustion_keeps_prior_content()
    {
        Fixture fx;
        auto client = fx.make_client();
        assert(client.store_content("config", "v1") == 2);

        auto handle = client.new_file("config");
        fx.storage->unreachable = {fx.primary_url(handle->fid()), fx.backup_url(handle->fid())};
        handle->write("v2 is longer");
        assert(!handle->close());
        assert(handle->state() == WriteState::Failed);
        assert(handle->error() && handle->error()->kind() == ErrorKind::StorageWriteExhausted);
        // No commit was attempted for the failed upload.
        assert(fx.tracker->count("create_close") == 1);
        assert(client.get_file_data("config") == std::string("v1"));

        // store_content surfaces the same failure as an exception.
        fx.storage->unreachable.clear();
        fx.storage->unreachable.insert("http://store1:7500/dev11/3.fid");
        fx.storage->unreachable.insert("http://store2:7500/dev12/3.fid");
        const auto error = capture_error([&]
                                         { client.store_content("config", "v3"); });
        assert(error && error->kind() == ErrorKind::StorageWriteExhausted);
        assert(client.get_file_data("config") == std::string("v1"));
    }

    void test_write_rejected_commit()
    {
        Fixture fx;
        auto client = fx.make_client();
        auto handle = client.new_file("doc");
        handle->write("body");

        auto model = fx.tracker;
        fx.network->responder = [model](const std::string &line)
        {
            if (line.starts_with("create_close "))
            {
                return err_line("size_mismatch", "Expected 5 bytes but got 4");
            }
            return (*model)(line);
        };
        assert(!handle->close());
        assert(handle->state() == WriteState::Failed);
        assert(handle->error()->kind() == ErrorKind::Application);
        assert(handle->error()->code() == "size_mismatch");
        assert(!client.get_file_data("doc").has_value());
    }

    void test_write_transport_fault_fails_handle()
    {
        Fixture fx;
        auto client = fx.make_client();
        auto handle = client.new_file("doc");
        handle->write("body");
        fx.storage->faulty.insert(fx.primary_url(handle->fid()));

        bool threw = false;
        try
        {
            handle->close();
        }
        catch (const std::runtime_error &ex)
        {
            threw = std::string(ex.what()).find("cannot set up") != std::string::npos;
        }
        assert(threw);
        assert(handle->state() == WriteState::Failed);
        assert(handle->error().has_value());
        assert(handle->error()->kind() == ErrorKind::StorageWriteExhausted);
        assert(handle->error()->code() == "storage_failure");
        // The cause stays available and later closes report the same failure.
        assert(!handle->close());
        assert(fx.tracker->count("create_close") == 0);
    }

    void test_write_abandoned_handle()
    {
        Fixture fx;
        auto client = fx.make_client();
        client.store_content("draft", "committed");
        {
            auto handle = client.new_file("draft");
            handle->write("never committed");
        }
        assert(fx.tracker->count("create_close") == 1);
        assert(client.get_file_data("draft") == std::string("committed"));
    }

    void test_write_legacy_create_open()
    {
        Fixture fx;
        fx.tracker->legacy_create_open = true;
        auto client = fx.make_client();

        auto handle = client.new_file("legacy");
        assert(handle->destinations().size() == 1);
        assert(handle->destinations()[0].devid == "11");
        handle->write("old tracker");
        assert(handle->close());
        assert(client.get_file_data("legacy") == std::string("old tracker"));
    }

    void test_store_file_and_options()
    {
        Fixture fx;
        auto client = fx.make_client();

        std::string big(40 * 1024 + 17, '\0');
        for (std::size_t i = 0; i < big.size(); ++i)
        {
            big[i] = static_cast<char>('a' + i % 26);
        }
        std::istringstream input(big);
        NewFileOptions options;
        options.create_open_args["checksumverify"] = "1";
        options.create_close_args["checksum"] = "MD5:abc";
        assert(client.store_file("big", input, options) == big.size());

        assert(fx.tracker->last("create_open")->params.at("checksumverify") == "1");
        const auto close = fx.tracker->last("create_close");
        assert(close->params.at("checksum") == "MD5:abc");
        assert(close->params.at("size") == std::to_string(big.size()));
        assert(client.get_file_data("big") == big);
    }

    void test_read_failover_preserves_offset()
    {
        Fixture fx;
        std::string content;
        for (int i = 0; i < 1000; ++i)
        {
            content += std::to_string(i) + ",";
        }
        const std::string first = "http://store1:7500/dev11/77.fid";
        const std::string second = "http://store2:7500/dev12/77.fid";
        fx.storage->objects[first] = content;
        fx.storage->objects[second] = content;
        fx.storage->break_at[first] = 1234;
        fx.tracker->publish("numbers", {first, second});

        auto client = fx.make_client();
        auto handle = client.read_file("numbers");
        assert(handle);
        const auto data = handle->read_all();
        assert(data == content);
        assert(handle->tell() == content.size());
        assert(handle->current_source() == 1);
        assert(fx.storage->gets.size() == 2);
        assert(fx.storage->gets[1].first == second);
        assert(fx.storage->gets[1].second == 1234);
        assert(handle->close());
    }

    void test_read_chunks_and_seek()
    {
        Fixture fx;
        const std::string url_a = "http://store1:7500/dev11/5.fid";
        const std::string url_b = "http://store2:7500/dev12/5.fid";
        fx.storage->objects[url_a] = "0123456789abcdef";
        fx.storage->objects[url_b] = "0123456789abcdef";
        fx.tracker->publish("hex", {url_a, url_b});

        auto client = fx.make_client();
        auto handle = client.read_file("hex", GetPathsOptions{.noverify = false, .zone = Zone::Default, .pathcount = 3});
        const auto request = fx.tracker->last("get_paths");
        assert(request->params.at("noverify") == "0");
        assert(request->params.at("zone").empty());
        assert(request->params.at("pathcount") == "3");

        assert(handle->read(4) == "0123");
        assert(handle->read(4) == "4567");
        assert(handle->tell() == 8);

        // Primary drops mid-chunk; the chunk completes from the backup.
        fx.storage->break_at[url_a] = 10;
        assert(handle->read(4) == "89ab");
        assert(handle->current_source() == 1);

        handle->seek(2);
        assert(handle->read(3) == "234");
        handle->seek(14);
        assert(handle->read(10) == "ef");
        assert(handle->read(10).empty());

        handle->close();
        assert(!handle->is_open());
        const auto closed = capture_error([&]
                                          { handle->read(1); });
        assert(closed && closed->kind() == ErrorKind::InvalidState);
    }

    void test_read_exhaustion()
    {
        Fixture fx;
        const std::string url_a = "http://store1:7500/dev11/8.fid";
        const std::string url_b = "http://store2:7500/dev12/8.fid";
        fx.storage->objects[url_a] = "abcdef";
        fx.storage->break_at[url_a] = 3;
        fx.tracker->publish("flaky", {url_a, url_b});

        auto client = fx.make_client();
        auto handle = client.read_file("flaky");
        // Running out of sources partway through a whole-object read is an error, not a short object.
        const auto whole = capture_error([&]
                                         { handle->read_all(); });
        assert(whole && whole->kind() == ErrorKind::StorageReadExhausted);
        assert(handle->tell() == 3);
        const auto again = capture_error([&]
                                         { handle->read(10); });
        assert(again && again->kind() == ErrorKind::StorageReadExhausted);

        // A bounded read still hands back what arrived before the last source broke.
        auto bounded = client.read_file("flaky");
        assert(bounded->read(5) == "abc");
        assert(bounded->tell() == 3);

        const auto data = capture_error([&]
                                        { client.get_file_data("flaky"); });
        assert(data && data->kind() == ErrorKind::StorageReadExhausted);
        assert(data->code() == "all_sources_failed");
    }

    void test_read_missing_key()
    {
        Fixture fx;
        auto client = fx.make_client();
        assert(client.read_file("nope") == nullptr);
        assert(client.get_paths("nope").empty());
        assert(!client.get_file_data("nope").has_value());

        const auto request = fx.tracker->last("get_paths");
        assert(request->params.at("noverify") == "1");
        assert(request->params.at("zone") == "alt");
        assert(request->params.at("pathcount") == "2");
    }

    void test_readonly_client()
    {
        Fixture fx;
        auto client = fx.make_client(true);
        assert(client.readonly());

        const auto store = capture_error([&]
                                         { client.store_content("k", "v"); });
        std::istringstream input("v");
        const auto store_file = capture_error([&]
                                              { client.store_file("k", input); });
        const auto remove = capture_error([&]
                                          { client.remove("k"); });
        const auto rename = capture_error([&]
                                          { client.rename("k", "j"); });
        const auto new_file = capture_error([&]
                                            { client.new_file("k"); });
        for (const auto &error : {store, store_file, remove, rename, new_file})
        {
            assert(error && error->kind() == ErrorKind::ReadOnly);
        }
        assert(fx.network->attempts.empty());

        // Reads are still allowed.
        assert(client.get_paths("k").empty());
        assert(fx.network->attempts.size() == 1);
    }

    void test_list_keys_pagination()
    {
        Fixture fx;
        auto client = fx.make_client();
        std::set<std::string> expected;
        for (const auto *key : {"img/a", "img/b", "img/c", "img/d", "img/e", "img/f", "img/g", "txt/readme"})
        {
            fx.tracker->publish(key, {"http://store1:7500/dev11/x.fid"});
            if (std::string_view(key).starts_with("img/"))
            {
                expected.insert(key);
            }
        }

        ListKeysOptions options{.prefix = std::string("img/"), .limit = 3u};
        std::vector<std::string> seen;
        std::vector<std::size_t> page_sizes;
        for (;;)
        {
            const auto page = client.list_keys(options);
            page_sizes.push_back(page.size());
            if (page.empty())
            {
                break;
            }
            seen.insert(seen.end(), page.begin(), page.end());
            options.after = page.back();
        }
        assert((page_sizes == std::vector<std::size_t>{3, 3, 1, 0}));
        assert(seen.size() == expected.size());
        assert((std::set<std::string>(seen.begin(), seen.end()) == expected));

        const auto request = fx.tracker->last("list_keys");
        assert(request->params.at("limit") == "3");
        assert(request->params.at("after") == "img/g");
        assert(request->params.at("prefix") == "img/");
    }

    void test_rename_and_delete()
    {
        Fixture fx;
        auto client = fx.make_client();
        client.store_content("old", "payload");
        client.store_content("taken", "other");

        const auto clash = capture_error([&]
                                         { client.rename("old", "taken"); });
        assert(clash && clash->kind() == ErrorKind::Application && clash->code() == "key_exists");

        client.rename("old", "new");
        assert(!client.get_file_data("old").has_value());
        assert(client.get_file_data("new") == std::string("payload"));

        client.remove("new");
        assert(!client.get_file_data("new").has_value());
        const auto gone = capture_error([&]
                                        { client.remove("new"); });
        assert(gone && gone->code() == "unknown_key");

        client.sleep(1);
        assert(fx.tracker->last("sleep")->params.at("duration") == "1");
        assert(client.last_tracker() == kTrackerA);
    }

    void test_lifecycle_observers()
    {
        Fixture fx;
        std::vector<std::string> events;
        auto client = fx.make_client(false, {
                                                [&events](HookPoint point, const HookContext &context)
                                                {
                                                    events.push_back(std::string(to_string(point)) + ":" + context.key +
                                                                     ":" + context.storage_class.value_or("-"));
                                                },
                                                [&events](HookPoint point, const HookContext &)
                                                {
                                                    events.push_back("second:" + std::string(to_string(point)));
                                                },
                                            });

        client.store_content("k", "v", NewFileOptions{.storage_class = std::string("c")});
        const std::vector<std::string> expected = {
            "store_content_start:k:c",
            "second:store_content_start",
            "new_file_start:k:c",
            "second:new_file_start",
            "new_file_end:k:c",
            "second:new_file_end",
            "store_content_end:k:c",
            "second:store_content_end",
        };
        assert(events == expected);

        events.clear();
        client.get_paths("k");
        assert((events == std::vector<std::string>{"get_paths_start:k:-", "second:get_paths_start",
                                                   "get_paths_end:k:-", "second:get_paths_end"}));

        // No observers is a no-op.
        auto quiet = fx.make_client();
        quiet.store_content("q", "v");
    }

} // namespace

void run_client_component_tests()
{
    test_backend_failover_order();
    test_backend_all_trackers_down();
    test_backend_application_error_is_final();
    test_backend_malformed_response_skips_tracker();
    test_backend_preferred_address();
    test_backend_requires_trackers();
    test_write_round_trip();
    test_write_fails_over_to_backup();
    test_write_exhaustion_keeps_prior_content();
    test_write_rejected_commit();
    test_write_transport_fault_fails_handle();
    test_write_abandoned_handle();
    test_write_legacy_create_open();
    test_store_file_and_options();
    test_read_failover_preserves_offset();
    test_read_chunks_and_seek();
    test_read_exhaustion();
    test_read_missing_key();
    test_readonly_client();
    test_list_keys_pagination();
    test_rename_and_delete();
    test_lifecycle_observers();
}
