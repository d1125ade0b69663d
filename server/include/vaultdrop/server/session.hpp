#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vaultdrop/error_codes.hpp"
#include "vaultdrop/framing.hpp"
#include "vaultdrop/protocol.hpp"
#include "vaultdrop/server/config.hpp"
#include "vaultdrop/server/file_store.hpp"
#include "vaultdrop/server/upload_manager.hpp"

namespace vaultdrop::server
{

    struct ServerServices
    {
        UploadManager &uploads;
        FileStore &files;
        const ServerConfig &config;
    };

    /// One client connection. Requests are handled in order; responses are queued so that
    /// at most one write is outstanding on the socket.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        using Handler = std::function<nlohmann::json()>;

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void respond(const protocol::RequestEnvelope &envelope, const Handler &handler);
        void send_response(const protocol::ResponseEnvelope &envelope);
        void send_error(ErrorCode code, std::string message, std::optional<std::string> request_id = std::nullopt);
        void write_next();

        // Command handlers
        nlohmann::json handle_ping(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_server_info(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_upload_init(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_upload_chunk(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_upload_progress(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_upload_assemble(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_upload_cancel(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_upload_list(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_file_list(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_file_stat(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_file_download(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_file_delete(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_file_lock(const protocol::RequestEnvelope &envelope);
        nlohmann::json handle_file_unlock(const protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> outbox_;
        bool closed_{false};
    };

} // namespace vaultdrop::server
