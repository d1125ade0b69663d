#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "vaultdrop/server/config.hpp"
#include "vaultdrop/server/file_store.hpp"
#include "vaultdrop/server/upload_manager.hpp"

namespace vaultdrop::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_expiry();
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer expiry_timer_;

        UploadManager uploads_;
        FileStore files_;

        std::vector<std::thread> workers_;
    };

} // namespace vaultdrop::server
