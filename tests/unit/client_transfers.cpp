#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_authority.hpp"
#include "nimbus/client/client.hpp"
#include "nimbus/client/errors.hpp"
#include "nimbus/client/session_manager.hpp"
#include "nimbus/client/transfer_engine.hpp"

using namespace nimbus;
using namespace nimbus::client;

namespace
{

    std::filesystem::path scratch_dir(const std::string &name)
    {
        const auto dir = std::filesystem::temp_directory_path() / ("nimbus_" + name + "_" + crypto::random_id(4));
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::string pattern(std::size_t size)
    {
        std::string data(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            data[i] = static_cast<char>((i * 31 + 7) % 251);
        }
        return data;
    }

    void write_file(const std::filesystem::path &path, const std::string &data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    RetryPolicy fast_retry()
    {
        return RetryPolicy{
            .max_attempts = 3,
            .base_delay = std::chrono::milliseconds{1},
            .max_delay = std::chrono::milliseconds{5},
        };
    }

    // Last progress notification seen by a transfer.
    struct ProgressLog
    {
        std::mutex mutex;
        std::uint64_t transferred{0};
        std::uint64_t total{0};
        std::size_t calls{0};
        bool monotonic{true};

        ProgressCallback callback()
        {
            return [this](std::uint64_t done, std::uint64_t all, double)
            {
                std::lock_guard lock(mutex);
                if (calls > 0 && done < transferred)
                {
                    monotonic = false;
                }
                transferred = done;
                total = all;
                ++calls;
            };
        }
    };

    struct EngineHarness
    {
        explicit EngineHarness(std::size_t parallelism = 2, std::shared_ptr<TransferStateStore> store = nullptr)
            : sessions(authority, Logger{}, fast_retry(), std::chrono::seconds{60}),
              engine(authority, sessions,
                     TransferOptions{
                         .chunk_size = 1024,
                         .parallelism = parallelism,
                         .chunk_retry = fast_retry(),
                     },
                     Logger{}, std::move(store))
        {
            const auto session = sessions.register_account(Credentials{.username = "bob", .password = "builder"},
                                                           crypto::KdfLimits::minimum());
            root = authority.fetch_root(session.token);
        }

        Node upload(const std::filesystem::path &local, std::uint64_t chunk = 1024)
        {
            auto transfer = engine.upload(local, root, {}, chunk);
            assert(transfer->wait() == TransferState::Completed);
            return *transfer->result();
        }

        testing::FakeAuthority authority;
        SessionManager sessions;
        TransferEngine engine;
        Node root;
    };

    template <typename Ex>
    bool fails_with(const std::shared_ptr<Transfer> &transfer)
    {
        try
        {
            transfer->wait();
        }
        catch (const Ex &)
        {
            return transfer->state() == TransferState::Failed;
        }
        return false;
    }

    void test_upload_download_roundtrip()
    {
        const auto dir = scratch_dir("roundtrip");
        const auto content = pattern(10000);
        write_file(dir / "source.bin", content);

        EngineHarness harness;
        ProgressLog upload_progress;
        auto upload = harness.engine.upload(dir / "source.bin", harness.root, upload_progress.callback(), 1024);
        assert(upload->wait() == TransferState::Completed);
        assert(upload->plan().size() == 10);
        assert(upload->transferred_bytes() == content.size());
        assert(upload_progress.transferred == content.size());
        assert(upload_progress.total == content.size());
        assert(upload_progress.monotonic);

        const auto node = *upload->result();
        assert(node.name == "source.bin");
        assert(node.size == content.size());
        assert(upload->node_ref() == node.id);

        // The requested chunk is rounded up to whole encryption segments.
        ProgressLog download_progress;
        auto download = harness.engine.download(node, dir / "copy.bin", download_progress.callback(), 3000);
        assert(download->wait() == TransferState::Completed);
        assert(download->plan().size() == 4);
        assert(download->plan().front().length == 3072);
        assert(read_file(dir / "copy.bin") == content);
        assert(download_progress.transferred == content.size());
        assert(download_progress.monotonic);
        assert(harness.engine.active() == 0);

        std::filesystem::remove_all(dir);
    }

    void test_upload_replaces_same_name()
    {
        const auto dir = scratch_dir("replace");
        write_file(dir / "notes.txt", "first version");
        EngineHarness harness;
        const auto first = harness.upload(dir / "notes.txt");

        write_file(dir / "notes.txt", "second, longer version");
        const auto second = harness.upload(dir / "notes.txt");
        assert(second.id != first.id);

        const auto children = harness.authority.fetch_children(harness.sessions.token(), harness.root.id);
        assert(children.size() == 1);
        assert(children.front().id == second.id);

        auto download = harness.engine.download(second, dir / "back.txt", {});
        assert(download->wait() == TransferState::Completed);
        assert(read_file(dir / "back.txt") == "second, longer version");
        std::filesystem::remove_all(dir);
    }

    void test_integrity_failures()
    {
        const auto dir = scratch_dir("integrity");
        write_file(dir / "data.bin", pattern(5000));
        EngineHarness harness;
        const auto node = harness.upload(dir / "data.bin");

        harness.authority.set_declared_mac(node.id, std::string(64, '0'));
        assert(fails_with<IntegrityError>(harness.engine.download(node, dir / "a.bin", {})));

        const auto fresh = harness.upload(dir / "data.bin");
        harness.authority.corrupt(fresh.id, 1024 + crypto::kChunkTagBytes + 3);
        assert(fails_with<IntegrityError>(harness.engine.download(fresh, dir / "b.bin", {})));

        // A stale cached size is caught before any chunk is requested.
        auto stale = harness.upload(dir / "data.bin");
        const auto calls = harness.authority.download_chunk_calls();
        stale.size += 1;
        assert(fails_with<IntegrityError>(harness.engine.download(stale, dir / "c.bin", {})));
        assert(harness.authority.download_chunk_calls() == calls);

        std::filesystem::remove_all(dir);
    }

    void test_cancel_mid_transfer()
    {
        const auto dir = scratch_dir("cancel");
        write_file(dir / "big.bin", pattern(8 * 1024));
        EngineHarness harness(1);
        const auto node = harness.upload(dir / "big.bin");

        std::promise<std::shared_ptr<Transfer>> handle;
        auto pending = handle.get_future().share();
        harness.authority.on_download_chunk([pending](std::size_t served)
                                            {
                                                if (served == 2)
                                                {
                                                    pending.get()->cancel();
                                                } });
        auto transfer = harness.engine.download(node, dir / "partial.bin", {});
        handle.set_value(transfer);

        assert(transfer->wait() == TransferState::Cancelled);
        assert(transfer->cancel_requested());
        assert(transfer->chunks_completed() < transfer->plan().size());
        assert(transfer->transferred_bytes() < transfer->total_bytes());
        assert(harness.authority.download_chunk_calls() <= 3);
        harness.authority.on_download_chunk({});

        std::filesystem::remove_all(dir);
    }

    void test_transient_failures_are_retried()
    {
        const auto dir = scratch_dir("retry");
        const auto content = pattern(4096);
        write_file(dir / "flaky.bin", content);
        EngineHarness harness(1);

        harness.authority.fail_next_chunks(2);
        const auto node = harness.upload(dir / "flaky.bin");
        assert(harness.authority.upload_chunk_calls() == 4 + 2);

        harness.authority.fail_next_chunks(2);
        auto download = harness.engine.download(node, dir / "copy.bin", {});
        assert(download->wait() == TransferState::Completed);
        assert(read_file(dir / "copy.bin") == content);

        // Three failures in a row exhaust the policy.
        harness.authority.fail_next_chunks(3);
        assert(fails_with<NetworkError>(harness.engine.download(node, dir / "lost.bin", {})));
        harness.authority.fail_next_chunks(0);

        std::filesystem::remove_all(dir);
    }

    void test_zero_byte_file()
    {
        const auto dir = scratch_dir("empty");
        write_file(dir / "empty.txt", "");
        EngineHarness harness;

        ProgressLog upload_progress;
        auto upload = harness.engine.upload(dir / "empty.txt", harness.root, upload_progress.callback());
        assert(upload->wait() == TransferState::Completed);
        assert(upload->plan().empty());
        assert(upload_progress.calls == 1);
        assert(upload_progress.total == 0);
        assert(harness.authority.upload_chunk_calls() == 0);

        ProgressLog download_progress;
        auto download = harness.engine.download(*upload->result(), dir / "back.txt", download_progress.callback());
        assert(download->wait() == TransferState::Completed);
        assert(download_progress.calls == 1);
        assert(std::filesystem::exists(dir / "back.txt"));
        assert(std::filesystem::file_size(dir / "back.txt") == 0);
        assert(harness.authority.download_chunk_calls() == 0);

        std::filesystem::remove_all(dir);
    }

    void test_quota_is_enforced()
    {
        const auto dir = scratch_dir("quota");
        write_file(dir / "large.bin", pattern(4096));
        EngineHarness harness;
        harness.authority.set_quota(1024);
        assert(fails_with<QuotaError>(harness.engine.upload(dir / "large.bin", harness.root, {})));
        std::filesystem::remove_all(dir);
    }

    void test_parallel_progress_ends_at_total()
    {
        const auto dir = scratch_dir("progress");
        const auto content = pattern(64 * 1024);
        write_file(dir / "wide.bin", content);
        auto store = std::make_shared<TransferStateStore>(dir / "state.json");
        EngineHarness harness(4, store);

        for (int round = 0; round < 4; ++round)
        {
            ProgressLog upload_progress;
            auto upload = harness.engine.upload(dir / "wide.bin", harness.root, upload_progress.callback());
            assert(upload->wait() == TransferState::Completed);
            assert(upload_progress.calls == upload->plan().size());
            assert(upload_progress.transferred == content.size());
            assert(upload_progress.total == content.size());
            assert(upload_progress.monotonic);

            ProgressLog download_progress;
            auto download = harness.engine.download(*upload->result(), dir / "back.bin", download_progress.callback());
            assert(download->wait() == TransferState::Completed);
            assert(download_progress.transferred == content.size());
            assert(download_progress.monotonic);
            assert(read_file(dir / "back.bin") == content);
        }
        assert(store->pending_for_identity(harness.sessions.current().user_id).empty());
        std::filesystem::remove_all(dir);
    }

    void test_interrupted_download_resumes()
    {
        const auto dir = scratch_dir("resume_down");
        const auto content = pattern(8 * 1024);
        write_file(dir / "big.bin", content);
        auto store = std::make_shared<TransferStateStore>(dir / "state.json");
        EngineHarness harness(1, store);
        const auto node = harness.upload(dir / "big.bin");

        std::promise<std::shared_ptr<Transfer>> handle;
        auto pending = handle.get_future().share();
        harness.authority.on_download_chunk([pending](std::size_t served)
                                            {
                                                if (served == 3)
                                                {
                                                    pending.get()->cancel();
                                                } });
        auto first = harness.engine.download(node, dir / "copy.bin", {});
        handle.set_value(first);
        assert(first->wait() == TransferState::Cancelled);
        harness.authority.on_download_chunk({});

        const auto identity = harness.sessions.current().user_id;
        const auto record = store->find("download", identity, dir / "copy.bin", node.id);
        assert(record);
        assert(record->completed.size() == 3);

        // A fresh store reads the same ledger back from disk.
        auto reloaded = std::make_shared<TransferStateStore>(dir / "state.json");
        assert(reloaded->find("download", identity, dir / "copy.bin", node.id)->completed.size() == 3);

        const auto calls = harness.authority.download_chunk_calls();
        ProgressLog progress;
        auto second = harness.engine.download(node, dir / "copy.bin", progress.callback());
        assert(second->wait() == TransferState::Completed);
        assert(harness.authority.download_chunk_calls() - calls == 5);
        assert(progress.transferred == content.size());
        assert(read_file(dir / "copy.bin") == content);
        assert(!store->find("download", identity, dir / "copy.bin", node.id));

        std::filesystem::remove_all(dir);
    }

    void test_interrupted_upload_resumes()
    {
        const auto dir = scratch_dir("resume_up");
        const auto content = pattern(8 * 1024);
        write_file(dir / "big.bin", content);
        auto store = std::make_shared<TransferStateStore>(dir / "state.json");
        EngineHarness harness(1, store);

        std::promise<std::shared_ptr<Transfer>> handle;
        auto pending = handle.get_future().share();
        harness.authority.on_upload_chunk([pending](std::size_t stored)
                                          {
                                              if (stored == 3)
                                              {
                                                  pending.get()->cancel();
                                              } });
        auto first = harness.engine.upload(dir / "big.bin", harness.root, {});
        handle.set_value(first);
        assert(first->wait() == TransferState::Cancelled);
        harness.authority.on_upload_chunk({});
        assert(!first->result());

        const auto identity = harness.sessions.current().user_id;
        const auto record = store->find("upload", identity, dir / "big.bin", harness.root.id + "/big.bin");
        assert(record);
        assert(record->completed.size() == 3);
        assert(!record->upload_id.empty());

        // The server kept the partial upload, so only the missing chunks are sent.
        const auto calls = harness.authority.upload_chunk_calls();
        auto second = harness.engine.upload(dir / "big.bin", harness.root, {});
        assert(second->wait() == TransferState::Completed);
        assert(harness.authority.upload_chunk_calls() - calls == 5);
        assert(second->transferred_bytes() == content.size());

        // Restored tags produce the same content MAC the download verifies.
        auto download = harness.engine.download(*second->result(), dir / "back.bin", {});
        assert(download->wait() == TransferState::Completed);
        assert(read_file(dir / "back.bin") == content);

        std::filesystem::remove_all(dir);
    }

    void test_stream_ranges()
    {
        const auto dir = scratch_dir("stream");
        const auto content = pattern(10000);
        write_file(dir / "media.bin", content);
        EngineHarness harness;
        const auto node = harness.upload(dir / "media.bin");

        std::mutex mutex;
        std::string received;
        const auto sink = [&](std::span<const std::byte> bytes)
        {
            std::lock_guard lock(mutex);
            received.append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        };

        ProgressLog whole_progress;
        auto whole = harness.engine.stream(node, sink, 0, std::nullopt, whole_progress.callback());
        assert(whole->wait() == TransferState::Completed);
        assert(received == content);
        assert(whole_progress.transferred == content.size());
        assert(whole_progress.monotonic);

        // A range inside the file is served from the segments covering it, in one request.
        received.clear();
        auto calls = harness.authority.download_chunk_calls();
        auto range = harness.engine.stream(node, sink, 1500, 2000, {}, 4096);
        assert(range->wait() == TransferState::Completed);
        assert(received == content.substr(1500, 2000));
        assert(range->total_bytes() == 2000);
        assert(harness.authority.download_chunk_calls() - calls == 1);

        // The limit is clipped to the end of the file.
        received.clear();
        auto tail = harness.engine.stream(node, sink, 9000, 5000);
        assert(tail->wait() == TransferState::Completed);
        assert(received == content.substr(9000));

        received.clear();
        ProgressLog empty_progress;
        calls = harness.authority.download_chunk_calls();
        auto empty = harness.engine.stream(node, sink, 4000, 0, empty_progress.callback());
        assert(empty->wait() == TransferState::Completed);
        assert(received.empty());
        assert(empty_progress.calls == 1);
        assert(empty_progress.total == 0);
        assert(harness.authority.download_chunk_calls() == calls);

        bool rejected = false;
        try
        {
            harness.engine.stream(node, sink, content.size() + 1);
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        assert(rejected);

        std::filesystem::remove_all(dir);
    }

    void test_stream_integrity()
    {
        const auto dir = scratch_dir("stream_integrity");
        write_file(dir / "data.bin", pattern(5000));
        EngineHarness harness;
        const auto sink = [](std::span<const std::byte>) {};

        // The declared MAC is only checked when the whole file is read.
        const auto node = harness.upload(dir / "data.bin");
        harness.authority.set_declared_mac(node.id, std::string(64, '0'));
        assert(harness.engine.stream(node, sink, 100, 1000)->wait() == TransferState::Completed);
        assert(fails_with<IntegrityError>(harness.engine.stream(node, sink)));

        const auto fresh = harness.upload(dir / "data.bin");
        harness.authority.corrupt(fresh.id, 3);
        assert(fails_with<IntegrityError>(harness.engine.stream(fresh, sink, 0, 10)));

        std::filesystem::remove_all(dir);
    }

    void test_non_standard_sink_failure()
    {
        const auto dir = scratch_dir("sink_failure");
        write_file(dir / "data.bin", pattern(3000));
        EngineHarness harness;
        const auto node = harness.upload(dir / "data.bin");

        auto transfer = harness.engine.stream(node, [](std::span<const std::byte>)
                                              { throw 7; });
        bool caught = false;
        try
        {
            transfer->wait();
        }
        catch (int code)
        {
            caught = code == 7;
        }
        assert(caught);
        assert(transfer->state() == TransferState::Failed);
        assert(harness.engine.active() == 0);

        std::filesystem::remove_all(dir);
    }

    ClientConfig facade_config()
    {
        ClientConfig config;
        config.host = "fake";
        config.io_threads = 2;
        config.session_retry = fast_retry();
        config.transfers.chunk_size = 1024;
        config.transfers.parallelism = 2;
        config.transfers.chunk_retry = fast_retry();
        config.transfers.resume = false;
        return config;
    }

    void test_client_facade()
    {
        const auto dir = scratch_dir("facade");
        const auto content = pattern(6000);
        write_file(dir / "report.pdf", content);

        auto owned = std::make_unique<testing::FakeAuthority>();
        auto &authority = *owned;
        Client client(facade_config(), std::move(owned), Logger{});
        ClientScope scope(client);

        client.register_account(Credentials{.username = "carol", .password = "secret"}, crypto::KdfLimits::minimum())
            .get();
        assert(client.is_logged_in());
        client.ready().get();

        client.create_folder("/reports").get();
        auto upload = client.upload_file(dir / "report.pdf", "/reports/q3.pdf").get();
        assert(upload->wait() == TransferState::Completed);

        // The committed node reaches the cache without another listing.
        const auto listing = client.list("/reports").get();
        assert(listing.size() == 1);
        assert(listing.front().name == "q3.pdf");
        assert(client.stat("/reports/q3.pdf").get().size == content.size());

        ProgressLog progress;
        auto download = client.download_file("/reports/q3.pdf", dir, progress.callback()).get();
        assert(download->wait() == TransferState::Completed);
        assert(read_file(dir / "q3.pdf") == content);
        assert(progress.transferred == content.size());
        assert(progress.total == content.size());

        std::string streamed;
        auto stream = client
                          .stream_file(
                              "/reports/q3.pdf", [&](std::span<const std::byte> bytes)
                              { streamed.append(reinterpret_cast<const char *>(bytes.data()), bytes.size()); },
                              100, 50)
                          .get();
        assert(stream->wait() == TransferState::Completed);
        assert(streamed == content.substr(100, 50));

        const auto duplicate = client.copy("/reports/q3.pdf", "/reports", std::string("q3-copy.pdf")).get();
        assert(duplicate.name == "q3-copy.pdf");
        assert(duplicate.size == content.size());
        assert(client.list("/reports").get().size() == 2);
        auto copy_download = client.download_file("/reports/q3-copy.pdf", dir / "copy.pdf").get();
        assert(copy_download->wait() == TransferState::Completed);
        assert(read_file(dir / "copy.pdf") == content);

        const auto archive = client.copy("/reports", "/", std::string("archive")).get();
        assert(archive.is_folder());
        const auto archived = client.list("/archive").get();
        assert(archived.size() == 2);
        assert(client.stat("/archive/q3.pdf").get().id != client.stat("/reports/q3.pdf").get().id);
        client.remove("/archive").get();

        const auto moved = client.move("/reports/q3.pdf", "/", std::string("final.pdf")).get();
        assert(moved.name == "final.pdf");
        assert(client.list("/reports").get().size() == 1);
        client.remove("/reports/q3-copy.pdf").get();
        assert(client.list("/reports").get().empty());

        const auto quota = client.account_details().get();
        assert(quota.used_bytes == encrypted_size(content.size(), 1024));
        assert(client.free_space().get() == quota.total_bytes - quota.used_bytes);

        client.remove("/reports").get();
        bool caught = false;
        try
        {
            client.stat("/reports").get();
        }
        catch (const NotFoundError &)
        {
            caught = true;
        }
        assert(caught);

        client.logout().get();
        assert(!client.is_logged_in());
        assert(authority.active_tokens() == 0);
        std::filesystem::remove_all(dir);
    }

    void test_client_rejects_bad_login()
    {
        auto owned = std::make_unique<testing::FakeAuthority>();
        auto &authority = *owned;
        Client client(facade_config(), std::move(owned), Logger{});
        ClientScope scope(client);

        client.register_account(Credentials{.username = "dave", .password = "right"}, crypto::KdfLimits::minimum())
            .get();
        client.ready().get();
        client.logout().get();
        const auto listings = authority.listing_calls();

        bool caught = false;
        try
        {
            client.login(Credentials{.username = "dave", .password = "wrong"}).get();
        }
        catch (const AuthError &ex)
        {
            caught = ex.reason() == AuthError::Reason::InvalidCredentials;
        }
        assert(caught);
        assert(!client.is_logged_in());
        assert(authority.listing_calls() == listings);

        caught = false;
        try
        {
            client.list("/").get();
        }
        catch (const AuthError &ex)
        {
            caught = ex.reason() == AuthError::Reason::NotAuthenticated;
        }
        assert(caught);
        assert(authority.listing_calls() == listings);
    }

} // namespace

void run_client_transfer_tests()
{
    test_upload_download_roundtrip();
    test_upload_replaces_same_name();
    test_integrity_failures();
    test_cancel_mid_transfer();
    test_transient_failures_are_retried();
    test_zero_byte_file();
    test_quota_is_enforced();
    test_parallel_progress_ends_at_total();
    test_interrupted_download_resumes();
    test_interrupted_upload_resumes();
    test_stream_ranges();
    test_stream_integrity();
    test_non_standard_sink_failure();
    test_client_facade();
    test_client_rejects_bad_login();
}
