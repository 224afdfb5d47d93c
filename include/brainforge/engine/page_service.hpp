#pragma once

#include "brainforge/brain/brain.hpp"
#include "brainforge/storage/blob_store.hpp"
#include "brainforge/storage/monitor_store.hpp"

namespace brainforge {

/// Stores generated HTML under `pages/{slug}.html` and records the page
/// against its run so cleanup can find it.
class PageService final : public PagePublisher {
public:
  PageService(RunId run_id, storage::BlobStore &blobs,
              storage::MonitorStore &monitor)
      : run_id_(std::move(run_id)), blobs_(&blobs), monitor_(&monitor) {}

  auto publish(std::string slug, std::string html, bool persist)
      -> task<Result<std::string>> override;

private:
  RunId run_id_;
  storage::BlobStore *blobs_;
  storage::MonitorStore *monitor_;
};

} // namespace brainforge
