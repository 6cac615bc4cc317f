#pragma once

#include <courier/transfer/batch_orchestrator.hpp>
#include <courier/transfer/transfer.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace courier::transfer {

/**
 * One file handed to a delivery channel.
 * partIndex/partCount are 1/1 for an unsplit file.
 */
struct DeliveryItem {
    std::filesystem::path path;
    std::string displayName;
    std::string caption;
    std::size_t partIndex{1};
    std::size_t partCount{1};
};

/**
 * Channel that carries finished files to the requester (chat upload, outbox, ...).
 */
class IDeliverySink {
public:
    virtual ~IDeliverySink() = default;
    virtual Expected<void> deliver(const DeliveryItem& item) = 0;
};

/**
 * Delivery items for a finished batch item: the file itself, or its parts captioned
 * "(Part i of N)" in index order.
 */
[[nodiscard]] std::vector<DeliveryItem> deliveryItemsFor(const BatchItem& item);

/**
 * Delivers completed batch items and removes local copies afterwards.
 *
 * Each part is removed right after it is delivered; the downloaded source file is removed once
 * every item for it has gone out. A failed delivery stops at that item and leaves the
 * remaining files in place.
 */
class DeliveryPipeline {
public:
    explicit DeliveryPipeline(IDeliverySink& sink) : sink_(sink) {}

    /// Returns the number of items delivered.
    Expected<std::size_t> deliver(const BatchItem& item);

private:
    IDeliverySink& sink_;
};

/**
 * Copies delivered files into an outbox directory under their display names.
 */
class DirectoryDeliverySink final : public IDeliverySink {
public:
    explicit DirectoryDeliverySink(std::filesystem::path outbox) : outbox_(std::move(outbox)) {}

    Expected<void> deliver(const DeliveryItem& item) override;

    [[nodiscard]] const std::filesystem::path& outbox() const noexcept { return outbox_; }

private:
    std::filesystem::path outbox_;
};

} // namespace courier::transfer
