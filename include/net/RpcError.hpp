#pragma once

#include <stdexcept>
#include <string>

namespace fl::net {

// Failure reported by the remote folder-invite service.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, std::string description)
        : std::runtime_error("RPC error " + std::to_string(code) + ": " + description),
          code_(code), description_(std::move(description)) {}

    [[nodiscard]] int code() const { return code_; }
    [[nodiscard]] const std::string& description() const { return description_; }

private:
    int code_;
    std::string description_;
};

}
