#include "nimbus/client/shell.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <span>

#include "nimbus/client/errors.hpp"

namespace nimbus::client
{

    namespace
    {
        std::string node_label(const Node &node)
        {
            return node.is_folder() ? "[DIR ] " : "[FILE] ";
        }
    } // namespace

    bool Shell::handle_list(const std::vector<std::string> &args)
    {
        const auto path = resolve_remote_path(args.empty() ? std::string{} : args[0]);
        const auto entries = client_.list(path).get();
        std::cout << "OK" << std::endl;
        for (const auto &entry : entries)
        {
            std::cout << node_label(entry) << entry.name;
            if (!entry.is_folder())
            {
                std::cout << "  (" << entry.size << " bytes)";
            }
            std::cout << std::endl;
        }
        return true;
    }

    bool Shell::handle_stat(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage("STAT <path>");
            return true;
        }
        const auto node = client_.stat(resolve_remote_path(args[0])).get();
        std::cout << "OK" << std::endl;
        std::cout << "Name: " << node.name << std::endl;
        std::cout << "Id:   " << node.id << std::endl;
        std::cout << "Type: " << to_string(node.type) << std::endl;
        if (!node.is_folder())
        {
            std::cout << "Size: " << node.size << " bytes" << std::endl;
        }
        std::cout << "Modified: " << node.modification_time << std::endl;
        return true;
    }

    bool Shell::handle_cd(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage("CD <path>");
            return true;
        }
        const auto path = resolve_remote_path(args[0]);
        const auto node = client_.stat(path).get();
        if (!node.is_folder())
        {
            std::cout << "ERROR: invalid_target" << std::endl;
            std::cout << "Remote path is not a folder." << std::endl;
            return true;
        }
        remote_cwd_ = path;
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_mkdir(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage("MKDIR <path>");
            return true;
        }
        client_.create_folder(resolve_remote_path(args[0])).get();
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_remove(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            print_usage("DELETE <path>");
            return true;
        }
        client_.remove(resolve_remote_path(args[0])).get();
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::handle_move(const std::vector<std::string> &args)
    {
        if (args.size() != 2 && args.size() != 3)
        {
            print_usage("MOVE <src> <folder> [new name]");
            return true;
        }
        std::optional<std::string> name;
        if (args.size() == 3)
        {
            name = args[2];
        }
        const auto moved = client_.move(resolve_remote_path(args[0]), resolve_remote_path(args[1]), name).get();
        std::cout << "OK" << std::endl;
        std::cout << node_label(moved) << moved.name << std::endl;
        return true;
    }

    bool Shell::handle_copy(const std::vector<std::string> &args)
    {
        if (args.size() != 2 && args.size() != 3)
        {
            print_usage("COPY <src> <folder> [new name]");
            return true;
        }
        std::optional<std::string> name;
        if (args.size() == 3)
        {
            name = args[2];
        }
        const auto copied = client_.copy(resolve_remote_path(args[0]), resolve_remote_path(args[1]), name).get();
        std::cout << "OK" << std::endl;
        std::cout << node_label(copied) << copied.name << std::endl;
        return true;
    }

    bool Shell::handle_cat(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 3)
        {
            print_usage("CAT <remote> [offset] [length]");
            return true;
        }
        const std::uint64_t offset = args.size() >= 2 ? std::stoull(args[1]) : 0;
        std::optional<std::uint64_t> limit;
        if (args.size() == 3)
        {
            limit = std::stoull(args[2]);
        }
        auto transfer = client_.stream_file(resolve_remote_path(args[0]), [](std::span<const std::byte> data)
                                            { std::cout.write(reinterpret_cast<const char *>(data.data()),
                                                              static_cast<std::streamsize>(data.size())); },
                                            offset, limit)
                            .get();
        return run_transfer(transfer);
    }

    bool Shell::handle_upload(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            print_usage("UPLOAD <local> [remote]");
            return true;
        }
        const std::filesystem::path local(args[0]);
        const auto remote = resolve_remote_path(args.size() == 2 ? args[1] : std::string{});
        auto transfer = client_.upload_file(local, remote, [](std::uint64_t done, std::uint64_t total, double rate)
                                            { std::cout << "\rUploaded " << done << " / " << total << " bytes ("
                                                        << std::fixed << std::setprecision(1) << rate / 1024.0
                                                        << " KiB/s)" << std::flush; })
                            .get();
        return run_transfer(transfer);
    }

    bool Shell::handle_download(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            print_usage("DOWNLOAD <remote> [local]");
            return true;
        }
        const auto remote = resolve_remote_path(args[0]);
        const std::filesystem::path local = args.size() == 2 ? std::filesystem::path(args[1])
                                                             : std::filesystem::current_path();
        auto transfer = client_.download_file(remote, local, [](std::uint64_t done, std::uint64_t total, double rate)
                                              { std::cout << "\rDownloaded " << done << " / " << total << " bytes ("
                                                          << std::fixed << std::setprecision(1) << rate / 1024.0
                                                          << " KiB/s)" << std::flush; })
                            .get();
        return run_transfer(transfer);
    }

    bool Shell::handle_free(const std::vector<std::string> &args)
    {
        if (!args.empty())
        {
            print_usage("FREE");
            return true;
        }
        const auto quota = client_.account_details().get();
        std::cout << "OK" << std::endl;
        std::cout << "Used:  " << quota.used_bytes << " bytes" << std::endl;
        std::cout << "Total: " << quota.total_bytes << " bytes" << std::endl;
        std::cout << "Free:  " << quota.free_bytes() << " bytes" << std::endl;
        return true;
    }

    bool Shell::handle_refresh(const std::vector<std::string> &args)
    {
        client_.refresh(resolve_remote_path(args.empty() ? std::string{} : args[0])).get();
        std::cout << "OK" << std::endl;
        return true;
    }

    bool Shell::run_transfer(const std::shared_ptr<Transfer> &transfer)
    {
        const auto state = transfer->wait_settled();
        std::cout << std::endl;
        if (state == TransferState::Completed)
        {
            std::cout << "OK" << std::endl;
            if (auto node = transfer->result())
            {
                std::cout << node_label(*node) << node->name << "  (" << node->size << " bytes)" << std::endl;
            }
            return true;
        }
        if (state == TransferState::Cancelled)
        {
            std::cout << "ERROR: cancelled" << std::endl;
            return true;
        }
        // Failed: surface the original error through the shell's handler.
        transfer->wait();
        return true;
    }

} // namespace nimbus::client
