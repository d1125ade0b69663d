#include "vaultdrop/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/strand.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "upload_common.hpp"
#include "vaultdrop/server/session.hpp"

namespace vaultdrop::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::shared_ptr<ProgressObserver> make_observer(const ServerConfig &config)
        {
            if (!config.mirror_dir)
            {
                return nullptr;
            }
            spdlog::info("Mirroring upload progress to {}", config.mirror_dir->string());
            return std::make_shared<JsonFileProgressMirror>(*config.mirror_dir);
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          expiry_timer_(io_context_),
          uploads_(config_.upload, make_observer(config_)),
          files_(config_.root, config_.upload.kdf_iterations)
    {
        for (const auto &warning : validate_config(config_.upload))
        {
            spdlog::warn("Configuration: {}", warning);
        }

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, config_.port, config_.root.string());
        spdlog::info("Chunk size {}{}, max file size {}, compression {}",
                     upload_common::format_size(config_.upload.chunk_size),
                     config_.upload.dynamic_chunk_size ? " (dynamic)" : "",
                     upload_common::format_size(config_.upload.max_file_size),
                     config_.upload.enable_compression ? "on" : "off");

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
        schedule_expiry();

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
    }

    void Server::accept_next()
    {
        // Each connection gets its own strand so its handlers never run concurrently.
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{uploads_, files_, config_};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_expiry()
    {
        expiry_timer_.expires_after(config_.expiry_interval);
        expiry_timer_.async_wait([this](const std::error_code &ec)
                                 {
            if (ec)
            {
                return;
            }
            const auto removed = uploads_.expire_older_than(config_.upload.session_timeout);
            spdlog::debug("Expiry sweep removed {} session(s)", removed);
            schedule_expiry(); });
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        expiry_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace vaultdrop::server
