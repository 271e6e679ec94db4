#include "nimbus/client/shell.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "nimbus/client/errors.hpp"

namespace nimbus::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    Shell::Shell(ClientConfig config)
        : config_(config),
          client_(std::move(config)) {}

    int Shell::run()
    {
        try
        {
            ClientScope scope(client_);
            authenticate();
            offer_pending_transfers();
            interactive_shell();
        }
        catch (const Error &ex)
        {
            std::cerr << "ERROR: " << to_string(ex.code()) << std::endl;
            std::cerr << ex.what() << std::endl;
            client_.logger().error("shell", "fatal: ", ex.what());
            return 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            client_.logger().error("shell", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    std::string Shell::prompt_password(const std::string &username) const
    {
        std::string password;
        std::cout << "Password for " << username << ": " << std::flush;
        std::getline(std::cin, password);
        return password;
    }

    bool Shell::ask_yes_no(const std::string &question) const
    {
        while (true)
        {
            std::cout << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return false;
            }
            answer = trim(to_upper(answer));
            if (answer == "Y" || answer == "YES")
            {
                return true;
            }
            if (answer == "N" || answer == "NO")
            {
                return false;
            }
            std::cout << "Please answer y or n." << std::endl;
        }
    }

    void Shell::authenticate()
    {
        if (!config_.username)
        {
            throw std::runtime_error("A username is required: use user@host:port");
        }
        Credentials credentials{.username = *config_.username, .password = prompt_password(*config_.username)};
        try
        {
            client_.login(credentials).get();
        }
        catch (const AuthError &ex)
        {
            if (ex.reason() != AuthError::Reason::InvalidCredentials)
            {
                throw;
            }
            std::cout << "Authentication failed: " << ex.what() << std::endl;
            if (!ask_yes_no("User " + credentials.username + " not found. Register?"))
            {
                throw;
            }
            credentials.password = prompt_password(credentials.username);
            client_.register_account(credentials).get();
        }
        identity_ = credentials.username;
        std::cout << "Logged as " << identity_ << std::endl;
        try
        {
            client_.ready().get();
        }
        catch (const Error &ex)
        {
            std::cout << "[warning] remote tree not loaded yet: " << ex.what() << std::endl;
        }
    }

    void Shell::offer_pending_transfers()
    {
        const auto pending = client_.pending_transfers();
        if (pending.empty())
        {
            return;
        }
        std::cout << "Incomplete transfers:" << std::endl;
        for (const auto &record : pending)
        {
            std::cout << "  " << record.direction << ' ' << record.local_path.generic_string() << " ("
                      << record.completed.size() << " chunks done)" << std::endl;
        }
        if (ask_yes_no("Keep them so the same UPLOAD/DOWNLOAD continues where it stopped?"))
        {
            return;
        }
        client_.discard_pending_transfers();
    }

    void Shell::interactive_shell()
    {
        while (true)
        {
            std::cout << identity_ << ":" << remote_cwd_ << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            client_.logger().log("cmd", line);

            const auto tokens = split_tokens(line);
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (command == "HELP")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                }
            }
            catch (const Error &ex)
            {
                std::cout << "ERROR: " << to_string(ex.code()) << std::endl;
                std::cout << ex.what() << std::endl;
                client_.logger().warn("shell", "command failed: ", ex.what());
                if (!client_.is_logged_in())
                {
                    throw;
                }
            }
            catch (const std::invalid_argument &ex)
            {
                std::cout << "ERROR: invalid_usage" << std::endl;
                std::cout << ex.what() << std::endl;
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: internal_error" << std::endl;
                std::cout << ex.what() << std::endl;
                client_.logger().error("shell", "command failed: ", ex.what());
            }
        }
    }

    bool Shell::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "LIST")
        {
            return handle_list(args);
        }
        if (command == "STAT")
        {
            return handle_stat(args);
        }
        if (command == "CD")
        {
            return handle_cd(args);
        }
        if (command == "MKDIR")
        {
            return handle_mkdir(args);
        }
        if (command == "DELETE" || command == "RMDIR")
        {
            return handle_remove(args);
        }
        if (command == "MOVE")
        {
            return handle_move(args);
        }
        if (command == "COPY")
        {
            return handle_copy(args);
        }
        if (command == "CAT")
        {
            return handle_cat(args);
        }
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "DOWNLOAD")
        {
            return handle_download(args);
        }
        if (command == "FREE")
        {
            return handle_free(args);
        }
        if (command == "REFRESH")
        {
            return handle_refresh(args);
        }
        return false;
    }

    void Shell::print_help() const
    {
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                        Show this help" << std::endl;
        std::cout << "  EXIT                        Log out and exit" << std::endl;
        std::cout << "  LIST [path]                 List folder contents" << std::endl;
        std::cout << "  STAT <path>                 Show metadata for a path" << std::endl;
        std::cout << "  CD <path>                   Change current remote folder" << std::endl;
        std::cout << "  MKDIR <path>                Create a folder" << std::endl;
        std::cout << "  DELETE <path>               Delete a file or folder" << std::endl;
        std::cout << "  MOVE <src> <folder> [name]  Move or rename an entry" << std::endl;
        std::cout << "  COPY <src> <folder> [name]  Copy a file or folder" << std::endl;
        std::cout << "  CAT <remote> [offset] [len] Print a file, or a byte range of it" << std::endl;
        std::cout << "  UPLOAD <local> [remote]     Encrypt and upload a file" << std::endl;
        std::cout << "  DOWNLOAD <remote> [local]   Download and decrypt a file" << std::endl;
        std::cout << "  FREE                        Show used and free storage" << std::endl;
        std::cout << "  REFRESH [path]              Reload a cached folder listing" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --config <file>             Read settings from a JSON file\n";
        std::cout << "  --log <file>                Append structured logs to file\n";
        std::cout << "  --verbose                   Also log to stderr\n";
        std::cout << "  --chunk-size <bytes>        Transfer chunk size\n";
        std::cout << "  --parallelism <n>           Concurrent chunk workers\n";
        std::cout << "  --max-upload-rate <bps>     Throttle uploads (bytes per second)\n";
        std::cout << "  --max-download-rate <bps>   Throttle downloads (bytes per second)\n";
        std::cout << "  --state-file <file>         Resume ledger location\n";
    }

    void Shell::print_usage(const std::string &usage) const
    {
        std::cout << "ERROR: invalid_usage" << std::endl;
        std::cout << "Usage: " << usage << std::endl;
    }

    std::string Shell::resolve_remote_path(const std::string &input) const
    {
        if (input.empty())
        {
            return remote_cwd_;
        }
        std::filesystem::path path(input);
        if (path.is_relative())
        {
            path = std::filesystem::path(remote_cwd_) / path;
        }
        auto normalized = path.lexically_normal().generic_string();
        if (normalized.size() > 1 && normalized.back() == '/')
        {
            normalized.pop_back();
        }
        return normalized.empty() ? "/" : normalized;
    }

} // namespace nimbus::client
