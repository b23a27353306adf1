#pragma once

#include "net/Payloads.hpp"

#include <memory>

namespace fl::store { class FilterStore; }

namespace fl::folder {

// Receives update batches returned by the remote side and folds them into local state.
class UpdateSink {
public:
    virtual ~UpdateSink() = default;

    virtual void apply(const net::Updates& updates) = 0;
};

// Applies every batch synchronously, in a single store transaction.
class StoreUpdateSink final : public UpdateSink {
public:
    explicit StoreUpdateSink(std::shared_ptr<store::FilterStore> store);

    void apply(const net::Updates& updates) override;

private:
    std::shared_ptr<store::FilterStore> store_;
};

}
