#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "vaultdrop/protocol.hpp"
#include "vaultdrop/server/file_store.hpp"
#include "vaultdrop/server/progress.hpp"
#include "vaultdrop/server/upload_manager.hpp"

namespace vaultdrop::server::session_common
{

    protocol::ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id);

    protocol::ProgressMessage to_message(const ProgressReport &report);

    protocol::SessionSummaryMessage to_message(const SessionSummary &summary);

    protocol::FileMetadata to_message(const FileRecord &record);

} // namespace vaultdrop::server::session_common
