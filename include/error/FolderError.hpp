#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fl::error {

// Generic failure of a folder operation. Remote detail is not carried.
class FolderError : public std::runtime_error {
public:
    explicit FolderError(const std::string& what = "Folder operation failed") : std::runtime_error(what) {}
};

class QuotaExceededError : public FolderError {
public:
    enum class Kind : uint8_t {
        DialogFilterCount,
        SharedFolderJoinCount,
        SharedFolderInviteLinkCount,
        ChannelCount
    };

    QuotaExceededError(Kind kind, int32_t limit, int32_t premiumLimit);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] int32_t limit() const { return limit_; }
    [[nodiscard]] int32_t premiumLimit() const { return premiumLimit_; }

private:
    Kind kind_;
    int32_t limit_;
    int32_t premiumLimit_;
};

class CancelledError : public FolderError {
public:
    explicit CancelledError(const std::string& what = "Folder operation cancelled") : FolderError(what) {}
};

std::string to_string(QuotaExceededError::Kind kind);

}
