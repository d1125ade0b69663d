#include "vaultdrop/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace vaultdrop::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Session::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Session::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = protocol::frame_payload_size(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("Dropping {}: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), protocol::to_string(envelope.command));

        using protocol::Command;
        switch (envelope.command)
        {
        case Command::Ping:
            respond(envelope, [&]
                    { return handle_ping(envelope); });
            break;
        case Command::ServerInfo:
            respond(envelope, [&]
                    { return handle_server_info(envelope); });
            break;
        case Command::UploadInit:
            respond(envelope, [&]
                    { return handle_upload_init(envelope); });
            break;
        case Command::UploadChunk:
            respond(envelope, [&]
                    { return handle_upload_chunk(envelope); });
            break;
        case Command::UploadProgress:
            respond(envelope, [&]
                    { return handle_upload_progress(envelope); });
            break;
        case Command::UploadAssemble:
            respond(envelope, [&]
                    { return handle_upload_assemble(envelope); });
            break;
        case Command::UploadCancel:
            respond(envelope, [&]
                    { return handle_upload_cancel(envelope); });
            break;
        case Command::UploadList:
            respond(envelope, [&]
                    { return handle_upload_list(envelope); });
            break;
        case Command::FileList:
            respond(envelope, [&]
                    { return handle_file_list(envelope); });
            break;
        case Command::FileStat:
            respond(envelope, [&]
                    { return handle_file_stat(envelope); });
            break;
        case Command::FileDownload:
            respond(envelope, [&]
                    { return handle_file_download(envelope); });
            break;
        case Command::FileDelete:
            respond(envelope, [&]
                    { return handle_file_delete(envelope); });
            break;
        case Command::FileLock:
            respond(envelope, [&]
                    { return handle_file_lock(envelope); });
            break;
        case Command::FileUnlock:
            respond(envelope, [&]
                    { return handle_file_unlock(envelope); });
            break;
        default:
            send_error(ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::respond(const protocol::RequestEnvelope &envelope, const Handler &handler)
    {
        try
        {
            send_response(session_common::make_ok_response(handler(), envelope.request_id));
        }
        catch (const OperationError &error)
        {
            send_error(error.code(), error.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed for {}: {}", protocol::to_string(envelope.command), remote_endpoint(), ex.what());
            send_error(ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::send_response(const protocol::ResponseEnvelope &envelope)
    {
        if (closed_)
        {
            return;
        }
        outbox_.push_back(protocol::encode_frame(nlohmann::json(envelope)));
        if (outbox_.size() == 1)
        {
            write_next();
        }
    }

    void Session::send_error(ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbox_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  outbox_.clear();
                                  stop();
                                  return;
                              }
                              outbox_.pop_front();
                              if (!outbox_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace vaultdrop::server
