#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>

#include <thread>
#include <vector>

#include "nimbus/server/config.hpp"
#include "nimbus/server/node_store.hpp"
#include "nimbus/server/token_registry.hpp"
#include "nimbus/server/transfer_registry.hpp"
#include "nimbus/server/user_store.hpp"

namespace nimbus::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        void stop();

        // Port actually bound; differs from the configured one when that was 0.
        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_cleanup();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer cleanup_timer_;

        NodeStore nodes_;
        TokenRegistry tokens_;
        UserStore users_;
        TransferRegistry transfers_;

        std::vector<std::thread> workers_;
    };

} // namespace nimbus::server
