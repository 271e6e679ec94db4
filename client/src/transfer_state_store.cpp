#include "nimbus/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace nimbus::client
{

    namespace
    {
        // Throws nlohmann::json::exception or std::logic_error on a malformed record.
        TransferStateStore::Record parse_record(const nlohmann::json &item)
        {
            TransferStateStore::Record record;
            record.direction = item.value("direction", std::string{});
            record.identity = item.value("identity", std::string{});
            record.local_path = std::filesystem::path(item.value("local", std::string{}));
            record.remote = item.value("remote", std::string{});
            record.fingerprint = item.value("fingerprint", std::string{});
            record.total_size = item.value("total", 0ULL);
            record.chunk_size = item.value("chunk_size", 0ULL);
            record.upload_id = item.value("upload_id", std::string{});
            record.wrapped_key = item.value("key", std::string{});
            if (auto chunks = item.find("completed"); chunks != item.end() && chunks->is_object())
            {
                for (const auto &[index, tags] : chunks->items())
                {
                    std::size_t consumed = 0;
                    const auto value = std::stoull(index, &consumed);
                    if (consumed != index.size())
                    {
                        throw std::invalid_argument("bad chunk index " + index);
                    }
                    record.completed[value] = tags.get<std::string>();
                }
            }
            return record;
        }
    } // namespace

    TransferStateStore::TransferStateStore(std::optional<std::filesystem::path> state_path, Logger logger)
        : state_path_(state_path ? std::move(*state_path) : default_state_path()),
          logger_(std::move(logger))
    {
        load();
    }

    TransferStateStore::~TransferStateStore()
    {
        try
        {
            flush();
        }
        catch (const std::exception &ex)
        {
            logger_.warn("state", "could not save transfer state to ", state_path_.string(), ": ", ex.what());
        }
    }

    std::optional<TransferStateStore::Record> TransferStateStore::find(const std::string &direction,
                                                                       const std::string &identity,
                                                                       const std::filesystem::path &local_path,
                                                                       const std::string &remote) const
    {
        std::lock_guard lock(mutex_);
        const auto normalized = normalize_path(local_path);
        auto it = std::find_if(records_.begin(), records_.end(), [&](const Record &record)
                               { return record.direction == direction && record.identity == identity &&
                                        record.local_path == normalized && record.remote == remote; });
        if (it == records_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::vector<TransferStateStore::Record> TransferStateStore::pending_for_identity(const std::string &identity) const
    {
        std::lock_guard lock(mutex_);
        std::vector<Record> result;
        for (const auto &record : records_)
        {
            if (record.identity == identity)
            {
                result.push_back(record);
            }
        }
        return result;
    }

    void TransferStateStore::upsert(Record record)
    {
        std::unique_lock lock(mutex_);
        record.local_path = normalize_path(record.local_path);
        auto it = find_record(record.direction, record.identity, record.local_path, record.remote);
        if (it == records_.end())
        {
            records_.push_back(std::move(record));
        }
        else
        {
            *it = std::move(record);
        }
        ++unflushed_;
        lock.unlock();
        flush();
    }

    void TransferStateStore::mark_chunk(const std::string &direction, const std::string &identity,
                                        const std::filesystem::path &local_path, const std::string &remote,
                                        std::uint64_t index, const std::string &tags_hex)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = find_record(direction, identity, normalize_path(local_path), remote);
            if (it == records_.end())
            {
                return;
            }
            it->completed[index] = tags_hex;
            ++unflushed_;
            if (unflushed_ < kFlushEvery && std::chrono::steady_clock::now() - last_flush_ < kFlushInterval)
            {
                return;
            }
        }
        flush();
    }

    void TransferStateStore::remove(const std::string &direction, const std::string &identity,
                                    const std::filesystem::path &local_path, const std::string &remote)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = find_record(direction, identity, normalize_path(local_path), remote);
            if (it == records_.end())
            {
                return;
            }
            records_.erase(it);
            ++unflushed_;
        }
        flush();
    }

    void TransferStateStore::discard_identity(const std::string &identity)
    {
        {
            std::lock_guard lock(mutex_);
            records_.erase(std::remove_if(records_.begin(), records_.end(), [&](const Record &record)
                                          { return record.identity == identity; }),
                           records_.end());
            ++unflushed_;
        }
        flush();
    }

    void TransferStateStore::flush()
    {
        nlohmann::json snapshot;
        std::uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            if (unflushed_ == 0)
            {
                return;
            }
            snapshot = snapshot_locked();
            generation = ++generation_;
            unflushed_ = 0;
            last_flush_ = std::chrono::steady_clock::now();
        }
        write(snapshot, generation);
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".nimbus" / "transfers.json";
        }
        return std::filesystem::path(".nimbus") / "transfers.json";
    }

    void TransferStateStore::load()
    {
        records_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &)
        {
            // A torn write leaves nothing worth resuming.
            return;
        }
        if (!json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            try
            {
                auto record = parse_record(item);
                if (!record.direction.empty() && !record.identity.empty())
                {
                    record.local_path = normalize_path(record.local_path);
                    records_.push_back(std::move(record));
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                logger_.warn("state", "skipping malformed transfer record: ", ex.what());
            }
            catch (const std::logic_error &ex)
            {
                logger_.warn("state", "skipping malformed transfer record: ", ex.what());
            }
        }
    }

    nlohmann::json TransferStateStore::snapshot_locked() const
    {
        nlohmann::json json = nlohmann::json::array();
        for (const auto &record : records_)
        {
            nlohmann::json completed = nlohmann::json::object();
            for (const auto &[index, tags] : record.completed)
            {
                completed[std::to_string(index)] = tags;
            }
            json.push_back({{"direction", record.direction},
                            {"identity", record.identity},
                            {"local", record.local_path.generic_string()},
                            {"remote", record.remote},
                            {"fingerprint", record.fingerprint},
                            {"total", record.total_size},
                            {"chunk_size", record.chunk_size},
                            {"upload_id", record.upload_id},
                            {"key", record.wrapped_key},
                            {"completed", completed}});
        }
        return json;
    }

    void TransferStateStore::write(const nlohmann::json &snapshot, std::uint64_t generation)
    {
        std::lock_guard lock(file_mutex_);
        if (generation < written_generation_)
        {
            return;
        }
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        const auto temp = state_path_.string() + ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot write transfer state to " + temp);
            }
            out << snapshot.dump();
        }
        std::filesystem::rename(temp, state_path_);
        written_generation_ = generation;
    }

    std::vector<TransferStateStore::Record>::iterator TransferStateStore::find_record(
        const std::string &direction, const std::string &identity, const std::filesystem::path &local_path,
        const std::string &remote)
    {
        return std::find_if(records_.begin(), records_.end(), [&](const Record &record)
                            { return record.direction == direction && record.identity == identity &&
                                     record.local_path == local_path && record.remote == remote; });
    }

    std::filesystem::path TransferStateStore::normalize_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace nimbus::client
