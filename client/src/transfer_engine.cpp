#include "nimbus/client/transfer_engine.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <utility>

#include "nimbus/client/errors.hpp"
#include "nimbus/client/local_file.hpp"
#include "nimbus/client/retry.hpp"
#include "nimbus/encoding/base64.hpp"
#include "nimbus/framing.hpp"

namespace nimbus::client
{

    namespace
    {
        constexpr const char *kUpload = "upload";
        constexpr const char *kDownload = "download";

        std::string upload_fingerprint(const std::filesystem::path &path, std::uint64_t size)
        {
            const auto mtime = std::filesystem::last_write_time(path).time_since_epoch().count();
            return std::to_string(size) + ":" + std::to_string(mtime);
        }

        std::uint64_t round_up(std::uint64_t value, std::uint64_t multiple)
        {
            return std::max<std::uint64_t>(1, (value + multiple - 1) / multiple) * multiple;
        }

        // Largest multiple of segment_size whose sealed form fits one chunk request.
        std::uint64_t clamp_to_payload(std::uint64_t chunk, std::uint64_t segment_size)
        {
            const auto per_segment = segment_size + crypto::kChunkTagBytes;
            const auto fitting = std::max<std::uint64_t>(1, protocol::kMaxChunkPayload / per_segment);
            return std::min(chunk, fitting * segment_size);
        }

        std::string tags_to_hex(std::span<const crypto::ChunkTag> tags)
        {
            std::string hex;
            for (const auto &tag : tags)
            {
                hex += encoding::encode_hex(tag);
            }
            return hex;
        }
    } // namespace

    RateLimiter::RateLimiter(std::optional<std::size_t> bytes_per_second)
        : rate_(bytes_per_second) {}

    void RateLimiter::acquire(std::uint64_t bytes)
    {
        if (!rate_ || *rate_ == 0 || bytes == 0)
        {
            return;
        }
        const auto cost = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(static_cast<double>(bytes) / static_cast<double>(*rate_)));
        std::chrono::steady_clock::time_point wake;
        {
            std::lock_guard lock(mutex_);
            next_free_ = std::max(next_free_, std::chrono::steady_clock::now()) + cost;
            wake = next_free_;
        }
        std::this_thread::sleep_until(wake);
    }

    struct TransferEngine::Job
    {
        std::shared_ptr<Transfer> transfer;
        ProgressCallback progress;
        std::shared_ptr<const CryptoContext> crypto;
        std::string identity;
        std::string remote_key;
        crypto::SecretKey file_key;
        std::string wrapped_key;
        std::string remote_id; // upload id or download id
        std::string expected_mac;
        std::uint64_t segment_size{};
        std::optional<LocalFile> file;
        ChunkPlan plan;
        std::vector<crypto::ChunkTag> tags; // one per encryption segment
        std::vector<ChunkSpec> pending;
        bool tracked{false};

        std::atomic<std::size_t> remaining{0};
        std::atomic<bool> failed{false};
        std::atomic<std::uint64_t> session_bytes{0};
        std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};

        std::mutex error_mutex;
        std::exception_ptr error;

        bool stop_requested() const noexcept { return transfer->cancel_requested() || failed.load(); }
        bool is_upload() const noexcept { return transfer->direction() == TransferDirection::Upload; }

        // Fills the tag slots of an already completed chunk. False when the recorded tags do not fit.
        bool restore_tags(const ChunkSpec &chunk, const std::string &hex)
        {
            std::vector<std::byte> bytes;
            try
            {
                bytes = encoding::decode_hex(hex);
            }
            catch (const std::invalid_argument &)
            {
                return false;
            }
            const auto first = chunk.offset / segment_size;
            const auto count = (chunk.length + segment_size - 1) / segment_size;
            if (bytes.size() != count * crypto::kChunkTagBytes || first + count > tags.size())
            {
                return false;
            }
            for (std::uint64_t i = 0; i < count; ++i)
            {
                std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(i * crypto::kChunkTagBytes),
                            crypto::kChunkTagBytes, tags[first + i].begin());
            }
            return true;
        }
    };

    TransferEngine::TransferEngine(RemoteAuthority &authority, SessionManager &sessions, TransferOptions options,
                                   Logger logger, std::shared_ptr<TransferStateStore> state_store)
        : authority_(authority),
          sessions_(sessions),
          options_(options),
          logger_(logger),
          state_store_(std::move(state_store)),
          upload_limiter_(options.max_upload_rate),
          download_limiter_(options.max_download_rate),
          dispatcher_(logger),
          workers_(options.parallelism == 0 ? std::max(1u, std::thread::hardware_concurrency())
                                            : options.parallelism)
    {
        if (options_.chunk_retry.max_attempts == 0)
        {
            options_.chunk_retry.max_attempts = 1;
        }
    }

    TransferEngine::~TransferEngine()
    {
        cancel_all();
        wait_all();
        workers_.join();
        dispatcher_.drain();
    }

    std::shared_ptr<Transfer> TransferEngine::download(const Node &node, const std::filesystem::path &destination,
                                                       ProgressCallback progress,
                                                       std::optional<std::uint64_t> chunk_size)
    {
        if (node.type != NodeType::File)
        {
            throw std::invalid_argument("Only files can be downloaded: " + node.name);
        }
        const auto requested = chunk_size_or_default(chunk_size);
        auto job = std::make_shared<Job>();
        job->transfer = track(std::make_shared<Transfer>(crypto::random_id(8), TransferDirection::Download,
                                                         destination, node.id, node.size));
        job->progress = std::move(progress);
        logger_.log("transfer", "queued download ", job->transfer->id(), " of ", node.name, " (", node.size,
                    " bytes) to ", destination.string());
        asio::post(workers_, [this, job, node, requested]()
                   { start_download(job, node, requested); });
        return job->transfer;
    }

    std::shared_ptr<Transfer> TransferEngine::upload(const std::filesystem::path &local_path,
                                                     const Node &destination_folder, ProgressCallback progress,
                                                     std::optional<std::uint64_t> chunk_size, std::string name)
    {
        if (!destination_folder.is_folder())
        {
            throw std::invalid_argument("Upload destination is not a folder: " + destination_folder.name);
        }
        if (!std::filesystem::is_regular_file(local_path))
        {
            throw std::invalid_argument("Not a regular file: " + local_path.string());
        }
        if (name.empty())
        {
            name = local_path.filename().string();
        }
        const auto size = std::filesystem::file_size(local_path);
        const auto chunk = chunk_size_or_default(chunk_size);

        auto job = std::make_shared<Job>();
        job->transfer = track(std::make_shared<Transfer>(crypto::random_id(8), TransferDirection::Upload, local_path,
                                                         destination_folder.id, size));
        job->transfer->set_plan(make_chunk_plan(size, chunk));
        job->segment_size = chunk;
        job->progress = std::move(progress);
        logger_.log("transfer", "queued upload ", job->transfer->id(), " of ", local_path.string(), " (", size,
                    " bytes) as ", name);
        asio::post(workers_, [this, job, parent = destination_folder.id, name = std::move(name)]()
                   { start_upload(job, parent, name); });
        return job->transfer;
    }

    std::shared_ptr<Transfer> TransferEngine::stream(const Node &node, StreamSink sink, std::uint64_t offset,
                                                     std::optional<std::uint64_t> limit, ProgressCallback progress,
                                                     std::optional<std::uint64_t> chunk_size)
    {
        if (node.type != NodeType::File)
        {
            throw std::invalid_argument("Only files can be streamed: " + node.name);
        }
        if (!sink)
        {
            throw std::invalid_argument("A stream needs a sink");
        }
        if (offset > node.size)
        {
            throw std::invalid_argument("Offset " + std::to_string(offset) + " is beyond the end of " + node.name);
        }
        const auto requested = chunk_size_or_default(chunk_size);
        const auto length = std::min(limit.value_or(node.size - offset), node.size - offset);
        auto job = std::make_shared<Job>();
        job->transfer = track(std::make_shared<Transfer>(crypto::random_id(8), TransferDirection::Download,
                                                         std::filesystem::path{}, node.id, length));
        job->progress = std::move(progress);
        logger_.log("transfer", "queued stream ", job->transfer->id(), " of ", node.name, " bytes ", offset, "+",
                    length);
        asio::post(workers_, [this, job, node, sink = std::move(sink), offset, length, requested]()
                   { run_stream(job, node, sink, offset, length, requested); });
        return job->transfer;
    }

    void TransferEngine::on_upload_committed(UploadCommitted hook)
    {
        std::lock_guard lock(mutex_);
        commit_hooks_.push_back(std::move(hook));
    }

    void TransferEngine::cancel_all()
    {
        std::vector<std::shared_ptr<Transfer>> transfers;
        {
            std::lock_guard lock(mutex_);
            transfers = transfers_;
        }
        for (const auto &transfer : transfers)
        {
            transfer->cancel();
        }
    }

    void TransferEngine::wait_all()
    {
        std::vector<std::shared_ptr<Transfer>> transfers;
        {
            std::lock_guard lock(mutex_);
            transfers = transfers_;
        }
        for (const auto &transfer : transfers)
        {
            transfer->wait_settled();
        }
    }

    std::size_t TransferEngine::active() const
    {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(transfers_.begin(), transfers_.end(), [](const auto &transfer)
                                                      {
            const auto state = transfer->state();
            return state == TransferState::Pending || state == TransferState::Running; }));
    }

    std::shared_ptr<Transfer> TransferEngine::track(std::shared_ptr<Transfer> transfer)
    {
        std::lock_guard lock(mutex_);
        transfers_.erase(std::remove_if(transfers_.begin(), transfers_.end(), [](const auto &existing)
                                        {
            const auto state = existing->state();
            return state != TransferState::Pending && state != TransferState::Running; }),
                         transfers_.end());
        transfers_.push_back(transfer);
        return transfer;
    }

    void TransferEngine::start_download(const std::shared_ptr<Job> &job, Node node, std::uint64_t requested_chunk)
    {
        auto &transfer = *job->transfer;
        if (!transfer.start())
        {
            return;
        }
        try
        {
            if (transfer.cancel_requested())
            {
                settle(job, TransferState::Cancelled, nullptr);
                return;
            }
            const auto session = sessions_.current();
            job->identity = session.user_id;
            job->crypto = session.crypto;

            const auto ticket = open_ticket(job, node, requested_chunk);
            job->remote_key = node.id;

            const auto chunk = clamp_to_payload(round_up(requested_chunk, job->segment_size), job->segment_size);
            job->plan = make_chunk_plan(ticket.size, chunk);
            transfer.set_plan(job->plan);

            std::optional<TransferStateStore::Record> record;
            if (state_store_ && options_.resume)
            {
                record = state_store_->find(kDownload, job->identity, transfer.local_path(), job->remote_key);
                const bool usable = record && record->fingerprint == ticket.content_mac && record->chunk_size == chunk &&
                                    record->total_size == ticket.size && std::filesystem::exists(transfer.local_path());
                if (!usable)
                {
                    record.reset();
                }
            }

            job->file.emplace(transfer.local_path(), LocalFile::Mode::Write);
            if (!record)
            {
                job->file->resize(0);
            }
            job->file->resize(ticket.size);

            for (const auto &spec : job->plan)
            {
                if (record)
                {
                    auto done = record->completed.find(spec.index);
                    if (done != record->completed.end() && job->restore_tags(spec, done->second))
                    {
                        transfer.add_transferred(spec.length);
                        continue;
                    }
                }
                job->pending.push_back(spec);
            }
            if (record)
            {
                logger_.log("transfer", transfer.id(), " resuming download, ",
                            job->plan.size() - job->pending.size(), " of ", job->plan.size(), " chunks present");
            }
            else if (state_store_)
            {
                state_store_->upsert(TransferStateStore::Record{
                    .direction = kDownload,
                    .identity = job->identity,
                    .local_path = transfer.local_path(),
                    .remote = job->remote_key,
                    .fingerprint = ticket.content_mac,
                    .total_size = ticket.size,
                    .chunk_size = chunk,
                    .upload_id = {},
                    .wrapped_key = {},
                    .completed = {},
                });
            }
            schedule(job);
        }
        catch (...)
        {
            fail(job, std::current_exception());
            settle(job, TransferState::Failed, job->error);
        }
    }

    void TransferEngine::start_upload(const std::shared_ptr<Job> &job, std::string parent_id, std::string name)
    {
        auto &transfer = *job->transfer;
        if (!transfer.start())
        {
            return;
        }
        try
        {
            if (transfer.cancel_requested())
            {
                settle(job, TransferState::Cancelled, nullptr);
                return;
            }
            const auto session = sessions_.current();
            job->identity = session.user_id;
            job->crypto = session.crypto;
            job->plan = transfer.plan();
            job->tags.resize(job->plan.size());
            job->file.emplace(transfer.local_path(), LocalFile::Mode::Read);
            job->remote_key = parent_id + "/" + name;

            const auto size = transfer.total_bytes();
            const auto fingerprint = upload_fingerprint(transfer.local_path(), size);

            std::optional<TransferStateStore::Record> record;
            if (state_store_ && options_.resume)
            {
                record = state_store_->find(kUpload, job->identity, transfer.local_path(), job->remote_key);
                if (record && (record->fingerprint != fingerprint || record->chunk_size != job->segment_size ||
                               record->total_size != size))
                {
                    record.reset();
                }
            }
            if (record)
            {
                try
                {
                    job->file_key = job->crypto->unwrap_file_key(record->wrapped_key);
                    job->wrapped_key = record->wrapped_key;
                }
                catch (const IntegrityError &ex)
                {
                    logger_.warn("transfer", transfer.id(), " discarding resume state: ", ex.what());
                    record.reset();
                }
            }
            if (!record)
            {
                auto key = job->crypto->generate_file_key();
                job->file_key = std::move(key.key);
                job->wrapped_key = std::move(key.wrapped);
            }

            UploadRequest request{
                .parent_id = parent_id,
                .name = name,
                .size = size,
                .encrypted_size = encrypted_size(size, job->segment_size),
                .chunk_size = job->segment_size,
                .resume_id = record ? std::optional<std::string>(record->upload_id) : std::nullopt,
            };
            const auto target = with_retry(
                options_.chunk_retry, [&]()
                { return authority_.request_upload_target(sessions_.token(), request); },
                [&](std::size_t attempt, const NetworkError &error)
                { logger_.warn("transfer", transfer.id(), " upload target attempt ", attempt, " failed: ", error.what()); });
            job->remote_id = target.upload_id;

            std::map<std::uint64_t, std::string> completed;
            if (record && target.resumed)
            {
                completed = record->completed;
            }
            for (const auto &spec : job->plan)
            {
                auto done = completed.find(spec.index);
                if (done != completed.end() && job->restore_tags(spec, done->second))
                {
                    transfer.add_transferred(spec.length);
                    continue;
                }
                completed.erase(spec.index);
                job->pending.push_back(spec);
            }
            if (target.resumed)
            {
                logger_.log("transfer", transfer.id(), " resuming upload ", target.upload_id, ", ",
                            job->plan.size() - job->pending.size(), " of ", job->plan.size(), " chunks present");
            }
            if (state_store_)
            {
                state_store_->upsert(TransferStateStore::Record{
                    .direction = kUpload,
                    .identity = job->identity,
                    .local_path = transfer.local_path(),
                    .remote = job->remote_key,
                    .fingerprint = fingerprint,
                    .total_size = size,
                    .chunk_size = job->segment_size,
                    .upload_id = target.upload_id,
                    .wrapped_key = job->wrapped_key,
                    .completed = std::move(completed),
                });
            }
            schedule(job);
        }
        catch (...)
        {
            fail(job, std::current_exception());
            settle(job, TransferState::Failed, job->error);
        }
    }

    DownloadTicket TransferEngine::open_ticket(const std::shared_ptr<Job> &job, const Node &node,
                                               std::uint64_t requested_chunk)
    {
        auto &transfer = *job->transfer;
        const auto ticket = with_retry(
            options_.chunk_retry, [&]()
            { return authority_.request_download(sessions_.token(), node.id); },
            [&](std::size_t attempt, const NetworkError &error)
            { logger_.warn("transfer", transfer.id(), " download ticket attempt ", attempt, " failed: ", error.what()); });

        if (ticket.size != node.size)
        {
            throw IntegrityError("Remote size " + std::to_string(ticket.size) + " differs from the cached size " +
                                 std::to_string(node.size));
        }
        if (ticket.size > 0 && ticket.chunk_size == 0)
        {
            throw IntegrityError("Download ticket does not declare the encryption segment size");
        }
        if (ticket.chunk_size > protocol::kMaxChunkSize)
        {
            throw IntegrityError("Encryption segment size " + std::to_string(ticket.chunk_size) +
                                 " exceeds the transfer limit");
        }
        job->remote_id = ticket.download_id;
        job->expected_mac = ticket.content_mac;
        job->file_key = job->crypto->unwrap_file_key(ticket.content_key);
        job->segment_size = ticket.chunk_size == 0 ? requested_chunk : ticket.chunk_size;
        job->tags.resize(static_cast<std::size_t>((ticket.size + job->segment_size - 1) / job->segment_size));
        return ticket;
    }

    void TransferEngine::run_stream(const std::shared_ptr<Job> &job, Node node, StreamSink sink, std::uint64_t offset,
                                    std::uint64_t length, std::uint64_t requested_chunk)
    {
        auto &transfer = *job->transfer;
        if (!transfer.start())
        {
            return;
        }
        try
        {
            if (transfer.cancel_requested())
            {
                settle(job, TransferState::Cancelled, nullptr);
                return;
            }
            const auto session = sessions_.current();
            job->identity = session.user_id;
            job->crypto = session.crypto;
            const auto ticket = open_ticket(job, node, requested_chunk);

            const auto end = offset + length;
            const auto segment = job->segment_size;
            const auto chunk = clamp_to_payload(round_up(requested_chunk, segment), segment);
            // Whole segments covering [offset, end), clipped to the file.
            const auto aligned_end = std::min(ticket.size, round_up(end, segment));
            std::uint64_t index = 0;
            for (auto position = offset / segment * segment; position < aligned_end; position += chunk, ++index)
            {
                if (transfer.cancel_requested())
                {
                    settle(job, TransferState::Cancelled, nullptr);
                    return;
                }
                const ChunkSpec spec{
                    .index = index,
                    .offset = position,
                    .length = std::min(chunk, aligned_end - position),
                    .nonce = crypto::chunk_nonce(position),
                };
                const auto ciphertext = fetch_range(job, spec);
                if (!ciphertext)
                {
                    settle(job, TransferState::Cancelled, nullptr);
                    return;
                }
                download_limiter_.acquire(ciphertext->size());
                const auto plaintext = open_segments(job, spec, *ciphertext);

                const auto from = std::max(offset, position) - position;
                const auto to = std::min(end, position + spec.length) - position;
                sink(std::span<const std::byte>(plaintext).subspan(static_cast<std::size_t>(from),
                                                                   static_cast<std::size_t>(to - from)));
                transfer.add_transferred(to - from);
                job->session_bytes.fetch_add(to - from);
                report_progress(job);
            }

            if (offset == 0 && end == ticket.size &&
                !crypto::constant_time_equals(crypto::aggregate_mac(job->file_key, job->tags), job->expected_mac))
            {
                throw IntegrityError("Content MAC of " + node.name + " does not match the declared value");
            }
            if (end == offset)
            {
                report_progress(job);
            }
            settle(job, TransferState::Completed, nullptr);
        }
        catch (...)
        {
            fail(job, std::current_exception());
            settle(job, TransferState::Failed, job->error);
        }
    }

    void TransferEngine::schedule(const std::shared_ptr<Job> &job)
    {
        job->remaining.store(job->pending.size());
        if (job->pending.empty())
        {
            finalize(job);
            return;
        }
        for (const auto &chunk : job->pending)
        {
            asio::post(workers_, [this, job, chunk]()
                       { run_chunk(job, chunk); });
        }
    }

    void TransferEngine::run_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk)
    {
        if (!job->stop_requested())
        {
            try
            {
                if (job->is_upload())
                {
                    run_upload_chunk(job, chunk);
                }
                else
                {
                    run_download_chunk(job, chunk);
                }
            }
            catch (...)
            {
                fail(job, std::current_exception());
            }
        }
        finish_task(job);
    }

    std::optional<std::vector<std::byte>> TransferEngine::fetch_range(const std::shared_ptr<Job> &job,
                                                                     const ChunkSpec &chunk)
    {
        const auto range = encrypted_range(chunk, job->segment_size);
        std::vector<std::byte> ciphertext;
        for (std::size_t attempt = 1;; ++attempt)
        {
            if (job->stop_requested())
            {
                return std::nullopt;
            }
            try
            {
                ciphertext = authority_.download_chunk(sessions_.token(), job->remote_id, range.offset, range.length,
                                                       options_.chunk_timeout);
                break;
            }
            catch (const NetworkError &ex)
            {
                if (attempt >= options_.chunk_retry.max_attempts)
                {
                    throw;
                }
                logger_.warn("transfer", job->transfer->id(), " chunk ", chunk.index, " attempt ", attempt,
                             " failed: ", ex.what());
                std::this_thread::sleep_for(backoff_delay(options_.chunk_retry, attempt));
            }
        }
        if (ciphertext.size() != range.length)
        {
            throw IntegrityError("Chunk " + std::to_string(chunk.index) + " arrived with " +
                                 std::to_string(ciphertext.size()) + " bytes, expected " +
                                 std::to_string(range.length));
        }
        return ciphertext;
    }

    std::vector<std::byte> TransferEngine::open_segments(const std::shared_ptr<Job> &job, const ChunkSpec &chunk,
                                                         std::span<const std::byte> ciphertext)
    {
        std::vector<std::byte> plaintext;
        plaintext.reserve(static_cast<std::size_t>(chunk.length));
        std::size_t position = 0;
        std::uint64_t offset = chunk.offset;
        const auto end = chunk.offset + chunk.length;
        while (offset < end)
        {
            const auto length = std::min(job->segment_size, end - offset);
            const auto sealed = ciphertext.subspan(position, static_cast<std::size_t>(length + crypto::kChunkTagBytes));
            const auto opened = job->crypto->decrypt_chunk(job->file_key, offset, sealed);
            job->tags[static_cast<std::size_t>(offset / job->segment_size)] = crypto::tag_of(sealed);
            plaintext.insert(plaintext.end(), opened.begin(), opened.end());
            position += sealed.size();
            offset += length;
        }
        return plaintext;
    }

    void TransferEngine::run_download_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk)
    {
        const auto ciphertext = fetch_range(job, chunk);
        if (!ciphertext)
        {
            return;
        }
        download_limiter_.acquire(ciphertext->size());
        const auto plaintext = open_segments(job, chunk, *ciphertext);

        FileRegion(*job->file, chunk.offset, chunk.length).write(plaintext);
        const auto first_segment = chunk.offset / job->segment_size;
        const auto segments = static_cast<std::size_t>((chunk.length + job->segment_size - 1) / job->segment_size);
        complete_chunk(job, chunk,
                       tags_to_hex(std::span<const crypto::ChunkTag>(job->tags).subspan(
                           static_cast<std::size_t>(first_segment), segments)));
    }

    void TransferEngine::run_upload_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk)
    {
        const auto plaintext = FileRegion(*job->file, chunk.offset, chunk.length).read();
        const auto ciphertext = job->crypto->encrypt_chunk(job->file_key, chunk.offset, plaintext);
        const auto range = encrypted_range(chunk, job->segment_size);
        for (std::size_t attempt = 1;; ++attempt)
        {
            if (job->stop_requested())
            {
                return;
            }
            try
            {
                authority_.upload_chunk(sessions_.token(), job->remote_id, range.offset, ciphertext,
                                        options_.chunk_timeout);
                break;
            }
            catch (const NetworkError &ex)
            {
                if (attempt >= options_.chunk_retry.max_attempts)
                {
                    throw;
                }
                logger_.warn("transfer", job->transfer->id(), " chunk ", chunk.index, " attempt ", attempt,
                             " failed: ", ex.what());
                std::this_thread::sleep_for(backoff_delay(options_.chunk_retry, attempt));
            }
        }
        upload_limiter_.acquire(ciphertext.size());
        const auto tag = crypto::tag_of(ciphertext);
        job->tags[static_cast<std::size_t>(chunk.index)] = tag;
        complete_chunk(job, chunk, encoding::encode_hex(tag));
    }

    void TransferEngine::complete_chunk(const std::shared_ptr<Job> &job, const ChunkSpec &chunk,
                                        const std::string &tags_hex)
    {
        job->transfer->add_transferred(chunk.length);
        job->session_bytes.fetch_add(chunk.length);
        if (state_store_)
        {
            state_store_->mark_chunk(job->is_upload() ? kUpload : kDownload, job->identity,
                                     job->transfer->local_path(), job->remote_key, chunk.index, tags_hex);
        }
        report_progress(job);
    }

    void TransferEngine::finish_task(const std::shared_ptr<Job> &job)
    {
        if (job->remaining.fetch_sub(1) == 1)
        {
            finalize(job);
        }
    }

    void TransferEngine::finalize(const std::shared_ptr<Job> &job)
    {
        if (job->failed.load())
        {
            std::lock_guard lock(job->error_mutex);
            settle(job, TransferState::Failed, job->error);
            return;
        }
        if (job->transfer->cancel_requested())
        {
            settle(job, TransferState::Cancelled, nullptr);
            return;
        }
        try
        {
            if (job->is_upload())
            {
                finalize_upload(job);
            }
            else
            {
                finalize_download(job);
            }
        }
        catch (...)
        {
            fail(job, std::current_exception());
            settle(job, TransferState::Failed, job->error);
        }
    }

    void TransferEngine::finalize_download(const std::shared_ptr<Job> &job)
    {
        job->file->sync();
        const auto mac = crypto::aggregate_mac(job->file_key, job->tags);
        if (state_store_)
        {
            state_store_->remove(kDownload, job->identity, job->transfer->local_path(), job->remote_key);
        }
        if (!crypto::constant_time_equals(mac, job->expected_mac))
        {
            throw IntegrityError("Content MAC of " + job->transfer->local_path().string() +
                                 " does not match the declared value");
        }
        if (job->plan.empty())
        {
            report_progress(job);
        }
        settle(job, TransferState::Completed, nullptr);
    }

    void TransferEngine::finalize_upload(const std::shared_ptr<Job> &job)
    {
        const auto mac = crypto::aggregate_mac(job->file_key, job->tags);
        auto node = with_retry(
            options_.chunk_retry, [&]()
            { return authority_.commit_upload(sessions_.token(), job->remote_id, job->wrapped_key, mac); },
            [&](std::size_t attempt, const NetworkError &error)
            { logger_.warn("transfer", job->transfer->id(), " commit attempt ", attempt, " failed: ", error.what()); });
        if (state_store_)
        {
            state_store_->remove(kUpload, job->identity, job->transfer->local_path(), job->remote_key);
        }

        std::vector<UploadCommitted> hooks;
        {
            std::lock_guard lock(mutex_);
            hooks = commit_hooks_;
        }
        for (const auto &hook : hooks)
        {
            try
            {
                hook(node);
            }
            catch (const std::exception &ex)
            {
                logger_.warn("transfer", "commit hook failed for ", node.name, ": ", ex.what());
            }
        }
        if (job->plan.empty())
        {
            report_progress(job);
        }
        settle(job, TransferState::Completed, nullptr, std::move(node));
    }

    void TransferEngine::fail(const std::shared_ptr<Job> &job, std::exception_ptr error)
    {
        std::lock_guard lock(job->error_mutex);
        if (!job->error)
        {
            job->error = std::move(error);
            try
            {
                std::rethrow_exception(job->error);
            }
            catch (const std::exception &ex)
            {
                logger_.error("transfer", job->transfer->id(), " failed: ", ex.what());
            }
            catch (...)
            {
                logger_.error("transfer", job->transfer->id(), " failed with a non-standard exception");
            }
        }
        job->failed.store(true);
    }

    void TransferEngine::settle(const std::shared_ptr<Job> &job, TransferState state, std::exception_ptr error,
                                std::optional<Node> result)
    {
        logger_.log("transfer", job->transfer->id(), " ", to_string(job->transfer->direction()), " ",
                    to_string(state), " after ", job->transfer->transferred_bytes(), "/",
                    job->transfer->total_bytes(), " bytes");
        job->file.reset();
        if (state_store_ && state != TransferState::Completed)
        {
            try
            {
                state_store_->flush();
            }
            catch (const std::exception &ex)
            {
                logger_.warn("transfer", job->transfer->id(), " could not save resume state: ", ex.what());
            }
        }
        dispatcher_.post([transfer = job->transfer, state, error = std::move(error), result = std::move(result)]()
                         { transfer->settle(state, error, result); });
    }

    // The byte count is read when the notification runs, so notifications that
    // run in posting order never report a smaller count than an earlier one.
    void TransferEngine::report_progress(const std::shared_ptr<Job> &job)
    {
        if (!job->progress)
        {
            return;
        }
        dispatcher_.post([job]()
                         {
            const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - job->started).count();
            const auto rate = elapsed > 0.0 ? static_cast<double>(job->session_bytes.load()) / elapsed : 0.0;
            job->progress(job->transfer->transferred_bytes(), job->transfer->total_bytes(), rate); });
    }

    std::uint64_t TransferEngine::chunk_size_or_default(std::optional<std::uint64_t> chunk_size) const
    {
        const auto value = chunk_size.value_or(options_.chunk_size);
        if (value == 0 || value > protocol::kMaxChunkSize)
        {
            throw std::invalid_argument("Chunk size must be between 1 and " + std::to_string(protocol::kMaxChunkSize) +
                                        " bytes");
        }
        return value;
    }

} // namespace nimbus::client
