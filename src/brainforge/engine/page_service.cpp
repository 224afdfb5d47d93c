#include "brainforge/engine/page_service.hpp"

#include "brainforge/engine/adapters.hpp"
#include "brainforge/util/log.hpp"

namespace brainforge {

auto PageService::publish(std::string slug, std::string html, bool persist)
    -> task<Result<std::string>> {
  if (slug.empty() || slug.find('/') != std::string::npos) {
    co_return fail(Error::InvalidArgument);
  }
  auto key = page_blob_key(slug);
  if (auto r = co_await blobs_->put(key, std::move(html)); !r) {
    co_return fail(r.error());
  }
  if (auto r = co_await monitor_->register_page(storage::PageRecord{
          .slug = slug, .run_id = run_id_, .persist = persist});
      !r) {
    co_return fail(r.error());
  }
  log::debug("Run {} published page {} (persist={})", run_id_, slug, persist);
  co_return ok(std::move(key));
}

} // namespace brainforge
