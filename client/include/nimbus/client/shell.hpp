#pragma once

#include <memory>
#include <string>
#include <vector>

#include "nimbus/client/client.hpp"
#include "nimbus/client/config.hpp"

namespace nimbus::client
{

    // Interactive command shell over a Client.
    class Shell
    {
    public:
        explicit Shell(ClientConfig config);

        int run();

    private:
        void authenticate();
        void offer_pending_transfers();
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_list(const std::vector<std::string> &args);
        bool handle_stat(const std::vector<std::string> &args);
        bool handle_cd(const std::vector<std::string> &args);
        bool handle_mkdir(const std::vector<std::string> &args);
        bool handle_remove(const std::vector<std::string> &args);
        bool handle_move(const std::vector<std::string> &args);
        bool handle_copy(const std::vector<std::string> &args);
        bool handle_cat(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_download(const std::vector<std::string> &args);
        bool handle_free(const std::vector<std::string> &args);
        bool handle_refresh(const std::vector<std::string> &args);

        bool run_transfer(const std::shared_ptr<Transfer> &transfer);

        std::string prompt_password(const std::string &username) const;
        bool ask_yes_no(const std::string &question) const;
        void print_help() const;
        void print_usage(const std::string &usage) const;

        std::string resolve_remote_path(const std::string &input) const;

        ClientConfig config_;
        Client client_;
        std::string identity_;
        std::string remote_cwd_{"/"};
    };

} // namespace nimbus::client
