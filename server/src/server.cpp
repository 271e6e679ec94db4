#include "nimbus/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "nimbus/server/session.hpp"

namespace nimbus::server
{

    namespace
    {

        constexpr std::chrono::seconds kCleanupInterval{60};

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          cleanup_timer_(io_context_),
          nodes_(config_.root, config_.quota_bytes),
          tokens_(config_.session_ttl),
          users_(config_.root),
          transfers_(config_.root)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_cleanup();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void Server::stop()
    {
        asio::post(io_context_, [this]
                   {
            std::error_code ec;
            acceptor_.close(ec);
            cleanup_timer_.cancel();
            signals_.cancel(ec);
            io_context_.stop(); });
    }

    std::uint16_t Server::port() const
    {
        std::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{nodes_, tokens_, users_, transfers_, config_.upload_timeout};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
        }
        if (ec == asio::error::operation_aborted || !acceptor_.is_open())
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

    void Server::schedule_cleanup()
    {
        cleanup_timer_.expires_after(kCleanupInterval);
        cleanup_timer_.async_wait([this](const std::error_code &ec)
                                  {
            if (ec)
            {
                return;
            }
            try
            {
                transfers_.cleanup_expired(config_.upload_timeout);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Transfer cleanup failed: {}", ex.what());
            }
            schedule_cleanup(); });
    }

    void Server::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        stop();
    }

} // namespace nimbus::server
