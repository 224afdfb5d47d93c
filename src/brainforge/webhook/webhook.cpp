#include "brainforge/webhook/webhook.hpp"

#include <algorithm>

namespace brainforge::webhook {

auto WebhookRegistry::insert(Table &table, WebhookDefinition definition)
    -> Result<void> {
  if (definition.slug.empty() || !definition.handler ||
      definition.slug.find('/') != std::string::npos) {
    return fail(Error::InvalidArgument);
  }
  std::lock_guard lock(mu_);
  auto slug = definition.slug;
  auto [it, inserted] = table.try_emplace(
      std::move(slug),
      std::make_shared<const WebhookDefinition>(std::move(definition)));
  if (!inserted) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto WebhookRegistry::add(WebhookDefinition definition) -> Result<void> {
  return insert(user_, std::move(definition));
}

auto WebhookRegistry::add_system(WebhookDefinition definition)
    -> Result<void> {
  return insert(system_, std::move(definition));
}

auto WebhookRegistry::find(std::string_view slug, bool system) const
    -> std::shared_ptr<const WebhookDefinition> {
  std::lock_guard lock(mu_);
  const auto &table = system ? system_ : user_;
  auto it = table.find(slug);
  return it == table.end() ? nullptr : it->second;
}

auto WebhookRegistry::list() const
    -> std::vector<std::shared_ptr<const WebhookDefinition>> {
  std::vector<std::shared_ptr<const WebhookDefinition>> out;
  {
    std::lock_guard lock(mu_);
    out.reserve(user_.size());
    for (const auto &[slug, definition] : user_) {
      out.push_back(definition);
    }
  }
  std::ranges::sort(out, {}, &WebhookDefinition::slug);
  return out;
}

} // namespace brainforge::webhook
