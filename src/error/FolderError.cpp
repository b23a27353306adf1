#include "error/FolderError.hpp"

#include <fmt/core.h>

using namespace fl::error;

QuotaExceededError::QuotaExceededError(const Kind kind, const int32_t limit, const int32_t premiumLimit)
    : FolderError(fmt::format("Quota exceeded: {} (limit {}, premium limit {})", to_string(kind), limit, premiumLimit)),
      kind_(kind), limit_(limit), premiumLimit_(premiumLimit) {}

std::string fl::error::to_string(const QuotaExceededError::Kind kind) {
    switch (kind) {
    case QuotaExceededError::Kind::DialogFilterCount: return "dialog_filter_count";
    case QuotaExceededError::Kind::SharedFolderJoinCount: return "shared_folder_join_count";
    case QuotaExceededError::Kind::SharedFolderInviteLinkCount: return "shared_folder_invite_link_count";
    case QuotaExceededError::Kind::ChannelCount: return "channel_count";
    }
    return "unknown";
}
