#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fake_authority.hpp"
#include "nimbus/client/chunk_plan.hpp"
#include "nimbus/client/config.hpp"
#include "nimbus/client/crypto_context.hpp"
#include "nimbus/client/errors.hpp"
#include "nimbus/client/network_authority.hpp"
#include "nimbus/client/retry.hpp"
#include "nimbus/client/session_manager.hpp"
#include "nimbus/client/single_flight.hpp"
#include "nimbus/client/transfer_state_store.hpp"
#include "nimbus/client/transfer_engine.hpp"
#include "nimbus/client/tree_cache.hpp"
#include "nimbus/framing.hpp"

using namespace nimbus;
using namespace nimbus::client;

namespace
{

    RetryPolicy fast_retry()
    {
        return RetryPolicy{
            .max_attempts = 3,
            .base_delay = std::chrono::milliseconds{1},
            .max_delay = std::chrono::milliseconds{5},
        };
    }

    struct Harness
    {
        testing::FakeAuthority authority;
        SessionManager sessions{authority, Logger{}, fast_retry(), std::chrono::seconds{60}};

        Session register_alice()
        {
            return sessions.register_account(Credentials{.username = "alice", .password = "wonderland"},
                                             crypto::KdfLimits::minimum());
        }
    };

    template <typename Fn>
    bool throws_auth(Fn &&fn, AuthError::Reason reason)
    {
        try
        {
            fn();
        }
        catch (const AuthError &ex)
        {
            return ex.reason() == reason;
        }
        return false;
    }

    void test_chunk_plan()
    {
        const auto plan = make_chunk_plan(10, 4);
        assert(plan.size() == 3);
        assert(plan[0].offset == 0 && plan[0].length == 4);
        assert(plan[2].offset == 8 && plan[2].length == 2);
        assert(plan[1].nonce == crypto::chunk_nonce(4));
        assert(plan_is_valid(plan, 10));
        assert(!plan_is_valid(plan, 11));

        auto gapped = plan;
        gapped.erase(gapped.begin() + 1);
        assert(!plan_is_valid(gapped, 10));

        assert(make_chunk_plan(0, 4).empty());
        assert(plan_is_valid(make_chunk_plan(0, 4), 0));

        bool caught = false;
        try
        {
            (void)make_chunk_plan(10, 0);
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_encrypted_layout()
    {
        constexpr auto tag = crypto::kChunkTagBytes;
        assert(encrypted_size(10, 4) == 10 + 3 * tag);
        assert(encrypted_size(0, 4) == 0);
        assert(encrypted_size(8, 4) == 8 + 2 * tag);

        const auto last = encrypted_range(ChunkSpec{.index = 2, .offset = 8, .length = 2}, 4);
        assert(last.offset == 8 + 2 * tag);
        assert(last.length == 2 + tag);

        // A download chunk may cover several encryption segments.
        const auto wide = encrypted_range(ChunkSpec{.index = 0, .offset = 0, .length = 8}, 4);
        assert(wide.offset == 0);
        assert(wide.length == 8 + 2 * tag);

        bool caught = false;
        try
        {
            (void)encrypted_range(ChunkSpec{.index = 0, .offset = 3, .length = 4}, 4);
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_backoff()
    {
        const RetryPolicy policy{
            .max_attempts = 5,
            .base_delay = std::chrono::milliseconds{100},
            .max_delay = std::chrono::milliseconds{1000},
        };
        assert(backoff_delay(policy, 0).count() == 0);
        assert(backoff_delay(policy, 1).count() == 100);
        assert(backoff_delay(policy, 2).count() == 200);
        assert(backoff_delay(policy, 3).count() == 400);
        assert(backoff_delay(policy, 5).count() == 1000);
        assert(backoff_delay(policy, 64).count() == 1000);
    }

    void test_with_retry()
    {
        std::size_t calls = 0;
        std::size_t retries = 0;
        const auto value = with_retry(
            fast_retry(), [&]()
            {
                if (++calls < 3)
                {
                    throw NetworkError("flaky");
                }
                return 7; },
            [&](std::size_t, const NetworkError &)
            { ++retries; });
        assert(value == 7);
        assert(calls == 3);
        assert(retries == 2);

        calls = 0;
        bool caught = false;
        try
        {
            with_retry(
                fast_retry(), [&]() -> int
                { ++calls; throw NetworkError("down"); },
                [](std::size_t, const NetworkError &) {});
        }
        catch (const NetworkError &)
        {
            caught = true;
        }
        assert(caught);
        assert(calls == 3);

        // Only transport failures are retried.
        calls = 0;
        caught = false;
        try
        {
            with_retry(
                fast_retry(), [&]() -> int
                { ++calls; throw NotFoundError("gone"); },
                [](std::size_t, const NetworkError &) {});
        }
        catch (const NotFoundError &)
        {
            caught = true;
        }
        assert(caught);
        assert(calls == 1);
    }

    void test_single_flight()
    {
        SingleFlight<std::string, int> flight;
        std::atomic<int> executions{0};
        std::promise<void> gate;
        auto opened = gate.get_future().share();

        std::vector<std::future<int>> callers;
        for (int i = 0; i < 6; ++i)
        {
            callers.push_back(std::async(std::launch::async, [&]()
                                         { return flight.run("key", [&]()
                                                             {
                                                                 executions.fetch_add(1);
                                                                 opened.wait();
                                                                 return 42; }); }));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        assert(flight.in_flight() == 1);
        gate.set_value();
        for (auto &caller : callers)
        {
            assert(caller.get() == 42);
        }
        assert(executions.load() == 1);
        assert(flight.in_flight() == 0);

        // Failures reach every caller, and the key is released afterwards.
        bool caught = false;
        try
        {
            flight.run("key", []() -> int
                       { throw NetworkError("down"); });
        }
        catch (const NetworkError &)
        {
            caught = true;
        }
        assert(caught);
        assert(flight.run("key", []()
                          { return 1; }) == 1);
    }

    void test_crypto_context()
    {
        CryptoContext context(crypto::SecretKey::random());
        const auto file_key = context.generate_file_key();
        assert(context.unwrap_file_key(file_key.wrapped) == file_key.key);

        const std::vector<std::byte> plaintext{std::byte{1}, std::byte{2}, std::byte{3}};
        const auto sealed = context.encrypt_chunk(file_key.key, 64, plaintext);
        assert(context.decrypt_chunk(file_key.key, 64, sealed) == plaintext);

        bool caught = false;
        try
        {
            (void)context.decrypt_chunk(file_key.key, 0, sealed);
        }
        catch (const IntegrityError &)
        {
            caught = true;
        }
        assert(caught);

        // An empty segment still carries a tag and still authenticates its offset.
        const auto empty = context.encrypt_chunk(file_key.key, 128, {});
        assert(empty.size() == crypto::kChunkTagBytes);
        assert(context.decrypt_chunk(file_key.key, 128, empty).empty());
        caught = false;
        try
        {
            (void)context.decrypt_chunk(file_key.key, 0, empty);
        }
        catch (const IntegrityError &)
        {
            caught = true;
        }
        assert(caught);

        // The largest segment a transfer may use still fits one frame once sealed.
        std::vector<std::byte> largest(protocol::kMaxChunkSize);
        for (std::size_t i = 0; i < largest.size(); i += 4096)
        {
            largest[i] = static_cast<std::byte>(i / 4096);
        }
        const auto sealed_largest = context.encrypt_chunk(file_key.key, 0, largest);
        assert(sealed_largest.size() == protocol::kMaxChunkSize + crypto::kChunkTagBytes);
        assert(sealed_largest.size() <= protocol::kMaxChunkPayload);
        assert(context.decrypt_chunk(file_key.key, 0, sealed_largest) == largest);

        CryptoContext stranger(crypto::SecretKey::random());
        caught = false;
        try
        {
            (void)stranger.unwrap_file_key(file_key.wrapped);
        }
        catch (const IntegrityError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_chunk_size_limits()
    {
        const auto parse = [](std::vector<std::string> args)
        {
            std::vector<char *> argv;
            for (auto &arg : args)
            {
                argv.push_back(arg.data());
            }
            return parse_arguments(static_cast<int>(argv.size()), argv.data());
        };
        const auto max = std::to_string(protocol::kMaxChunkSize);
        assert(parse({"nimbus", "alice@localhost:9000", "--chunk-size", max}).transfers.chunk_size ==
               protocol::kMaxChunkSize);

        bool caught = false;
        try
        {
            (void)parse({"nimbus", "localhost:9000", "--chunk-size", std::to_string(protocol::kMaxChunkSize + 1)});
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);

        const auto path = std::filesystem::temp_directory_path() / "nimbus_chunk_limit_config.json";
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"transfers": {"chunk_size": 0}})";
        }
        ClientConfig config;
        caught = false;
        try
        {
            apply_config_file(path, config);
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
        std::filesystem::remove(path);

        // A request too large to frame fails before any connection is attempted.
        NetworkAuthority authority(NetworkOptions{.host = "127.0.0.1", .port = 9}, Logger{});
        const std::vector<std::byte> oversized(protocol::kMaxFramePayload);
        caught = false;
        try
        {
            authority.upload_chunk("token", "upload", 0, oversized, std::chrono::milliseconds{100});
        }
        catch (const RequestError &ex)
        {
            caught = ex.code() == ErrorCode::InvalidPayload;
        }
        assert(caught);
    }

    void test_session_login_states()
    {
        Harness harness;
        assert(!harness.sessions.logged_in());
        assert(throws_auth([&]()
                           { (void)harness.sessions.current(); },
                           AuthError::Reason::NotAuthenticated));

        const auto registered = harness.register_alice();
        assert(harness.sessions.logged_in());
        assert(!registered.token.empty());
        assert(registered.crypto);

        assert(throws_auth([&]()
                           { (void)harness.sessions.login(Credentials{.username = "alice", .password = "wonderland"}); },
                           AuthError::Reason::AlreadyAuthenticated));

        harness.sessions.logout();
        assert(!harness.sessions.logged_in());
        assert(harness.authority.active_tokens() == 0);
        // A second logout is a no-op.
        harness.sessions.logout();

        assert(throws_auth([&]()
                           { (void)harness.sessions.login(Credentials{.username = "alice", .password = "nope"}); },
                           AuthError::Reason::InvalidCredentials));
        assert(!harness.sessions.logged_in());

        const auto session = harness.sessions.login(Credentials{.username = "alice", .password = "wonderland"});
        assert(session.user_id == registered.user_id);

        // The master key unwrapped at login opens keys wrapped in the earlier session.
        const auto wrapped = registered.crypto->generate_file_key();
        assert(session.crypto->unwrap_file_key(wrapped.wrapped) == wrapped.key);
    }

    void test_session_refresh()
    {
        Harness harness;
        harness.authority.set_token_lifetime(std::chrono::seconds{30});
        const auto session = harness.register_alice();

        // Lifetime below the refresh margin: every token() call refreshes first.
        const auto token = harness.sessions.token();
        assert(harness.authority.refresh_calls() == 1);
        assert(token != session.token);
        assert(harness.sessions.current().token == token);

        harness.authority.revoke_all_tokens();
        assert(throws_auth([&]()
                           { (void)harness.sessions.refresh(); },
                           AuthError::Reason::SessionExpired));
        assert(!harness.sessions.logged_in());
    }

    void test_concurrent_refresh_issues_one_token()
    {
        Harness harness;
        harness.authority.set_token_lifetime(std::chrono::seconds{30});
        harness.register_alice();
        harness.authority.set_token_lifetime(std::chrono::seconds{3600});

        std::promise<void> gate;
        auto opened = gate.get_future().share();
        std::vector<std::future<std::string>> callers;
        for (int i = 0; i < 8; ++i)
        {
            callers.push_back(std::async(std::launch::async, [&, opened]()
                                         {
                                             opened.wait();
                                             return harness.sessions.token(); }));
        }
        gate.set_value();
        std::vector<std::string> tokens;
        for (auto &caller : callers)
        {
            tokens.push_back(caller.get());
        }
        assert(harness.authority.refresh_calls() == 1);
        for (const auto &token : tokens)
        {
            assert(token == tokens.front());
        }
        // The token every caller holds is still accepted.
        (void)harness.authority.fetch_root(tokens.front());
        assert(harness.sessions.current().token == tokens.front());
    }

    void test_tree_cache_resolution()
    {
        Harness harness;
        const auto session = harness.register_alice();
        auto &authority = harness.authority;
        const auto root = authority.fetch_root(session.token);
        const auto docs = authority.create_folder(session.token, root.id, "docs");
        const auto reports = authority.create_folder(session.token, docs.id, "reports");

        RemoteTreeCache cache(authority, [&]()
                              { return harness.sessions.token(); }, Logger{}, std::chrono::seconds{300});
        assert(cache.resolve("/").id == root.id);
        assert(cache.resolve("/docs/reports").id == reports.id);
        assert(cache.resolve("docs/./reports/").id == reports.id);
        const auto calls = authority.listing_calls();
        assert(cache.resolve("/docs/reports").id == reports.id);
        assert(authority.listing_calls() == calls);

        bool caught = false;
        try
        {
            (void)cache.resolve("/docs/missing");
        }
        catch (const NotFoundError &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            (void)cache.resolve("../outside");
        }
        catch (const NotFoundError &)
        {
            caught = true;
        }
        assert(caught);

        // A folder created behind the cache's back shows up after a refresh.
        authority.create_folder(session.token, root.id, "photos");
        assert(cache.list(cache.root()).size() == 1);
        cache.refresh("/");
        assert(cache.list(cache.root()).size() == 2);

        const auto segments = RemoteTreeCache::split_path("/a//b/./c/");
        assert((segments == std::vector<std::string>{"a", "b", "c"}));
    }

    void test_tree_cache_events()
    {
        Harness harness;
        const auto session = harness.register_alice();
        auto &authority = harness.authority;
        const auto root = authority.fetch_root(session.token);
        const auto docs = authority.create_folder(session.token, root.id, "docs");
        const auto inner = authority.create_folder(session.token, docs.id, "inner");

        RemoteTreeCache cache(authority, [&]()
                              { return harness.sessions.token(); }, Logger{}, std::chrono::seconds{0});
        assert(cache.resolve("/docs/inner").id == inner.id);

        // Moving a folder below its own descendant is refused.
        auto cyclic = docs;
        cyclic.parent_id = inner.id;
        bool caught = false;
        try
        {
            cache.apply(NodeEvent{.kind = NodeEventKind::Updated, .node = cyclic});
        }
        catch (const RequestError &ex)
        {
            caught = ex.code() == ErrorCode::Conflict;
        }
        assert(caught);
        assert(cache.find(docs.id)->parent_id == root.id);

        Node added{.id = "local-1", .parent_id = docs.id, .name = "a.txt", .type = NodeType::File, .size = 3};
        cache.apply(NodeEvent{.kind = NodeEventKind::Added, .node = added});
        assert(cache.list(*cache.find(docs.id)).size() == 2);

        auto renamed = inner;
        renamed.name = "renamed";
        renamed.parent_id = root.id;
        cache.apply(NodeEvent{.kind = NodeEventKind::Updated, .node = renamed});
        assert(cache.list(*cache.find(docs.id)).size() == 1);

        cache.apply(NodeEvent{.kind = NodeEventKind::Removed, .node = docs});
        assert(!cache.find(docs.id));
        assert(!cache.find(added.id));
        assert(cache.find(inner.id));
    }

    void test_tree_cache_remove_without_cascade()
    {
        Harness harness;
        const auto session = harness.register_alice();
        auto &authority = harness.authority;
        const auto root = authority.fetch_root(session.token);
        const auto docs = authority.create_folder(session.token, root.id, "docs");
        const auto inner = authority.create_folder(session.token, docs.id, "inner");

        RemoteTreeCache cache(authority, [&]()
                              { return harness.sessions.token(); }, Logger{}, std::chrono::seconds{0});
        assert(cache.resolve("/docs/inner").id == inner.id);

        cache.apply(NodeEvent{.kind = NodeEventKind::Removed, .node = docs, .cascade = false});
        assert(!cache.find(docs.id));
        assert(cache.list(cache.root()).empty());

        // The child stays cached under a parent the cache no longer knows.
        const auto orphan = cache.find(inner.id);
        assert(orphan);
        assert(orphan->parent_id == docs.id);

        bool caught = false;
        try
        {
            (void)cache.resolve("/docs/inner");
        }
        catch (const NotFoundError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_tree_cache_cold_resolve_is_shared()
    {
        Harness harness;
        const auto session = harness.register_alice();
        auto &authority = harness.authority;
        const auto root = authority.fetch_root(session.token);
        const auto docs = authority.create_folder(session.token, root.id, "docs");
        const auto reports = authority.create_folder(session.token, docs.id, "reports");

        RemoteTreeCache cache(authority, [&]()
                              { return harness.sessions.token(); }, Logger{}, std::chrono::seconds{300});
        authority.set_listing_delay(std::chrono::milliseconds{200});
        const auto roots = authority.root_calls();
        const auto listings = authority.listing_calls();

        std::promise<void> gate;
        auto opened = gate.get_future().share();
        std::vector<std::future<std::string>> resolvers;
        for (int i = 0; i < 4; ++i)
        {
            resolvers.push_back(std::async(std::launch::async, [&, opened]()
                                           {
                                               opened.wait();
                                               return cache.resolve("/docs/reports").id; }));
        }
        gate.set_value();
        for (auto &resolver : resolvers)
        {
            assert(resolver.get() == reports.id);
        }
        assert(authority.root_calls() == roots + 1);
        assert(authority.listing_calls() == listings + 2);
        authority.set_listing_delay(std::chrono::milliseconds{0});
    }

    void test_tree_cache_listing_expires()
    {
        Harness harness;
        harness.register_alice();
        auto &authority = harness.authority;
        RemoteTreeCache cache(authority, [&]()
                              { return harness.sessions.token(); }, Logger{}, std::chrono::seconds{1});
        const auto root = cache.root();

        const auto before = authority.listing_calls();
        (void)cache.list(root);
        (void)cache.list(root);
        assert(authority.listing_calls() == before + 1);

        std::this_thread::sleep_for(std::chrono::milliseconds{1100});
        (void)cache.list(root);
        assert(authority.listing_calls() == before + 2);
    }

    void test_rate_limiter()
    {
        using Clock = std::chrono::steady_clock;

        RateLimiter unlimited(std::nullopt);
        auto start = Clock::now();
        unlimited.acquire(1 << 30);
        assert(Clock::now() - start < std::chrono::milliseconds{50});

        // Two half-second budgets at 1000 B/s: the second caller waits for the first.
        RateLimiter limited(1000);
        start = Clock::now();
        limited.acquire(500);
        limited.acquire(500);
        const auto elapsed = Clock::now() - start;
        assert(elapsed >= std::chrono::milliseconds{900});
        assert(elapsed < std::chrono::milliseconds{3000});

        start = Clock::now();
        limited.acquire(0);
        assert(Clock::now() - start < std::chrono::milliseconds{50});
    }

    void test_tree_cache_coalesces_listings()
    {
        Harness harness;
        const auto session = harness.register_alice();
        auto &authority = harness.authority;
        RemoteTreeCache cache(authority, [&]()
                              { return harness.sessions.token(); }, Logger{}, std::chrono::seconds{300});
        const auto root = cache.root();
        authority.set_listing_delay(std::chrono::milliseconds{300});

        const auto before = authority.listing_calls();
        std::vector<std::future<std::size_t>> readers;
        for (int i = 0; i < 4; ++i)
        {
            readers.push_back(std::async(std::launch::async, [&]()
                                         { return cache.list(root).size(); }));
        }
        for (auto &reader : readers)
        {
            assert(reader.get() == 0);
        }
        assert(authority.listing_calls() == before + 1);
        (void)session;
    }

    void test_transfer_state_store()
    {
        const auto path = std::filesystem::temp_directory_path() / "nimbus_state_store_test.json";
        std::filesystem::remove(path);
        {
            TransferStateStore store(path);
            store.upsert(TransferStateStore::Record{
                .direction = "download",
                .identity = "user-1",
                .local_path = "/tmp/out.bin",
                .remote = "node-1",
                .fingerprint = "mac",
                .total_size = 100,
                .chunk_size = 10,
            });
            store.mark_chunk("download", "user-1", "/tmp/out.bin", "node-1", 3, "abcd");
            store.mark_chunk("download", "user-1", "/tmp/other.bin", "node-1", 4, "ffff");
        }

        TransferStateStore reloaded(path);
        const auto record = reloaded.find("download", "user-1", "/tmp/out.bin", "node-1");
        assert(record);
        assert(record->fingerprint == "mac");
        assert(record->completed.size() == 1);
        assert(record->completed.at(3) == "abcd");
        assert(!reloaded.find("upload", "user-1", "/tmp/out.bin", "node-1"));
        assert(reloaded.pending_for_identity("user-1").size() == 1);
        assert(reloaded.pending_for_identity("user-2").empty());

        reloaded.discard_identity("user-1");
        assert(TransferStateStore(path).pending_for_identity("user-1").empty());
        std::filesystem::remove(path);
    }

    void test_transfer_state_store_batches_chunks()
    {
        const auto path = std::filesystem::temp_directory_path() / "nimbus_state_batch_test.json";
        std::filesystem::remove(path);
        const auto completed_on_disk = [&]()
        {
            return TransferStateStore(path).find("upload", "user-1", "/tmp/in.bin", "parent/in.bin")->completed.size();
        };

        TransferStateStore store(path);
        store.upsert(TransferStateStore::Record{
            .direction = "upload",
            .identity = "user-1",
            .local_path = "/tmp/in.bin",
            .remote = "parent/in.bin",
            .fingerprint = "100:1",
            .total_size = 100,
            .chunk_size = 1,
            .upload_id = "up-1",
        });
        for (std::uint64_t index = 0; index < 10; ++index)
        {
            store.mark_chunk("upload", "user-1", "/tmp/in.bin", "parent/in.bin", index, "aa");
        }
        assert(store.find("upload", "user-1", "/tmp/in.bin", "parent/in.bin")->completed.size() == 10);
        assert(completed_on_disk() == 0);

        store.flush();
        assert(completed_on_disk() == 10);

        for (std::uint64_t index = 10; index < 10 + TransferStateStore::kFlushEvery; ++index)
        {
            store.mark_chunk("upload", "user-1", "/tmp/in.bin", "parent/in.bin", index, "aa");
        }
        assert(completed_on_disk() == 10 + TransferStateStore::kFlushEvery);
        std::filesystem::remove(path);
    }

    void test_transfer_state_store_skips_malformed_records()
    {
        const auto path = std::filesystem::temp_directory_path() / "nimbus_state_malformed_test.json";
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"([
                {"direction": "download", "identity": "user-1", "local": "/tmp/good.bin", "remote": "n1",
                 "total": 10, "chunk_size": 5, "completed": {"0": "ab"}},
                {"direction": "download", "identity": "user-1", "local": "/tmp/index.bin", "remote": "n2",
                 "completed": {"abc": "00"}},
                {"direction": "download", "identity": "user-1", "local": "/tmp/tag.bin", "remote": "n3",
                 "completed": {"1": 5}},
                {"direction": "download", "identity": "user-1", "local": "/tmp/size.bin", "remote": "n4",
                 "total": "ten"},
                42
            ])";
        }

        TransferStateStore store(path);
        const auto pending = store.pending_for_identity("user-1");
        assert(pending.size() == 1);
        assert(pending.front().remote == "n1");
        assert(pending.front().completed.at(0) == "ab");

        // A ledger that is not JSON at all loads empty.
        {
            std::ofstream out(path, std::ios::trunc);
            out << "{ not json";
        }
        assert(TransferStateStore(path).pending_for_identity("user-1").empty());
        std::filesystem::remove(path);
    }

} // namespace

void run_client_core_tests()
{
    test_chunk_plan();
    test_encrypted_layout();
    test_backoff();
    test_with_retry();
    test_single_flight();
    test_crypto_context();
    test_chunk_size_limits();
    test_session_login_states();
    test_session_refresh();
    test_concurrent_refresh_issues_one_token();
    test_tree_cache_resolution();
    test_tree_cache_events();
    test_tree_cache_remove_without_cascade();
    test_tree_cache_cold_resolve_is_shared();
    test_tree_cache_coalesces_listings();
    test_tree_cache_listing_expires();
    test_rate_limiter();
    test_transfer_state_store();
    test_transfer_state_store_batches_chunks();
    test_transfer_state_store_skips_malformed_records();
}
