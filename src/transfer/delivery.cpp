#include <courier/transfer/delivery.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <system_error>
#include <utility>

namespace courier::transfer {

namespace fs = std::filesystem;

std::vector<DeliveryItem> deliveryItemsFor(const BatchItem& item) {
    std::vector<DeliveryItem> out;
    if (!item.result)
        return out;

    const auto& fileName = item.result->fileName;
    if (item.parts.empty()) {
        out.push_back(DeliveryItem{item.result->filePath, fileName, fileName, 1, 1});
        return out;
    }

    const auto total = item.parts.size();
    out.reserve(total);
    for (const auto& part : item.parts) {
        DeliveryItem d;
        d.path = part.path;
        d.displayName = fileName + ".part" + std::to_string(part.index);
        d.caption = fileName + " (Part " + std::to_string(part.index) + " of " +
                    std::to_string(total) + ")";
        d.partIndex = part.index;
        d.partCount = total;
        out.push_back(std::move(d));
    }
    return out;
}

Expected<std::size_t> DeliveryPipeline::deliver(const BatchItem& item) {
    if (!item.succeeded() || !item.result) {
        return Error{ErrorCode::InvalidArgument, "Nothing to deliver for " + item.url};
    }
    if (item.splitError) {
        // Oversized and unsplit: the channel would reject it
        return *item.splitError;
    }

    std::size_t delivered = 0;
    for (const auto& d : deliveryItemsFor(item)) {
        auto r = sink_.deliver(d);
        if (!r.ok()) {
            spdlog::warn("Delivery of {} failed: {}", d.displayName, r.error().message);
            return r.error();
        }
        ++delivered;
        if (d.partCount > 1) {
            std::error_code ec;
            fs::remove(d.path, ec);
            if (ec)
                spdlog::warn("Could not remove delivered part {}: {}", d.path.string(),
                             ec.message());
        }
    }

    std::error_code ec;
    fs::remove(item.result->filePath, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", item.result->filePath.string(), ec.message());
    }
    spdlog::debug("Delivered {} item(s) for {}", delivered, item.url);
    return delivered;
}

Expected<void> DirectoryDeliverySink::deliver(const DeliveryItem& item) {
    std::error_code ec;
    fs::create_directories(outbox_, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create outbox " + outbox_.string() + ": " + ec.message()};
    }

    const auto target = outbox_ / sanitizeFileName(item.displayName);
    fs::copy_file(item.path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to copy " + item.path.string() + " to " +
                                             target.string() + ": " + ec.message()};
    }
    spdlog::info("Delivered {} -> {}", item.caption, target.string());
    return Expected<void>{};
}

} // namespace courier::transfer
