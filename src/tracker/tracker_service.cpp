#include "chunkswarm/tracker/tracker_service.hpp"
#include "chunkswarm/core/logger.hpp"

namespace chunkswarm::tracker {

namespace {

StatusMessage status_of(const core::Result& result) {
    StatusMessage reply;
    reply.status = result.error;
    reply.message = result.message;
    return reply;
}

}

TrackerService::TrackerService(Tracker& tracker)
    : tracker_(tracker) {
}

std::optional<TrackerMessage> TrackerService::handle(const core::DeviceKey& session_device, const TrackerMessage& request) {
    if (auto* msg = std::get_if<AnnounceMessage>(&request)) {
        return on_announce(session_device, *msg);
    }
    if (auto* msg = std::get_if<ReannounceMessage>(&request)) {
        return on_reannounce(session_device, *msg);
    }
    if (auto* msg = std::get_if<CheckExistsMessage>(&request)) {
        auto report = tracker_.check_exists(msg->file_ids);
        CheckExistsResultMessage reply;
        reply.exists = std::move(report.exists);
        reply.missing = std::move(report.missing);
        return reply;
    }
    if (auto* msg = std::get_if<GetAvailableChunksMessage>(&request)) {
        return on_get_available_chunks(session_device, *msg);
    }
    if (auto* msg = std::get_if<DeleteShareMessage>(&request)) {
        return status_of(tracker_.delete_share(msg->file_id, session_device));
    }
    if (auto* msg = std::get_if<UnannounceMessage>(&request)) {
        return status_of(tracker_.unannounce(msg->file_id, session_device));
    }
    if (auto* msg = std::get_if<RegisterLeecherMessage>(&request)) {
        return status_of(tracker_.register_leecher(msg->file_id, session_device, msg->requested));
    }
    if (auto* msg = std::get_if<UnregisterLeecherMessage>(&request)) {
        return status_of(tracker_.unregister_leecher(msg->file_id, session_device));
    }
    if (auto* msg = std::get_if<RecordActivityMessage>(&request)) {
        return status_of(tracker_.record_activity(msg->file_id, session_device));
    }
    if (auto* msg = std::get_if<UpdateShareScopeMessage>(&request)) {
        ShareScopeResultMessage reply;
        auto result = tracker_.update_share_scope(msg->file_id, session_device, msg->add, msg->remove,
                                                  reply.share_scope);
        reply.status = result.error;
        reply.message = result.message;
        return reply;
    }

    LOG_DEBUG("Ignoring {} from {}", network::message_type_name(message_type_of(request)),
              session_device.to_string());
    return std::nullopt;
}

TrackerMessage TrackerService::on_announce(const core::DeviceKey& session_device, const AnnounceMessage& msg) {
    FileSummaryMessage reply;
    if (!(msg.device == session_device)) {
        reply.status = core::ErrorCode::UNAUTHORIZED;
        reply.message = "device does not match the session";
        return reply;
    }

    Announcement announcement;
    announcement.file_id = msg.file_id;
    announcement.device = msg.device;
    announcement.metadata.total_size = msg.total_size;
    announcement.metadata.checksum = msg.checksum;
    announcement.metadata.chunk_count = msg.chunk_count;
    announcement.bitmap = msg.bitmap;
    announcement.share_scope = msg.share_scope;
    announcement.upload_capacity = msg.upload_capacity;

    auto result = tracker_.announce(announcement, reply.summary);
    reply.status = result.error;
    reply.message = result.message;
    return reply;
}

TrackerMessage TrackerService::on_reannounce(const core::DeviceKey& session_device, const ReannounceMessage& msg) {
    FileSummaryMessage reply;
    if (!(msg.device == session_device)) {
        reply.status = core::ErrorCode::UNAUTHORIZED;
        reply.message = "device does not match the session";
        return reply;
    }

    auto result = tracker_.reannounce(msg.file_id, msg.device, msg.bitmap, msg.download_complete, reply.summary);
    reply.status = result.error;
    reply.message = result.message;
    return reply;
}

TrackerMessage TrackerService::on_get_available_chunks(const core::DeviceKey& session_device,
                                                       const GetAvailableChunksMessage& msg) {
    AvailableChunksMessage reply;
    auto result = tracker_.get_available_chunks(msg.file_id, session_device, reply.seeders);
    reply.status = result.error;
    reply.message = result.message;
    return reply;
}

}
