#include "brainforge/util/json_patch.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <format>
#include <optional>
#include <ranges>

namespace brainforge {

namespace {

using Tokens = std::vector<std::string>;

// Array index token: "0" or digits without a leading zero.
[[nodiscard]] auto parse_index(std::string_view token)
    -> std::optional<std::size_t> {
  if (token.empty() || (token.size() > 1 && token.front() == '0')) {
    return std::nullopt;
  }
  std::size_t idx = 0;
  const auto *end = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(token.data(), end, idx);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return idx;
}

[[nodiscard]] auto child(JsonValue &parent, const std::string &token)
    -> JsonValue * {
  if (parent.is_object()) {
    auto &obj = parent.get_object();
    auto it = obj.find(token);
    return it == obj.end() ? nullptr : &it->second;
  }
  if (parent.is_array()) {
    auto &arr = parent.get_array();
    auto idx = parse_index(token);
    if (!idx || *idx >= arr.size()) {
      return nullptr;
    }
    return &arr[*idx];
  }
  return nullptr;
}

[[nodiscard]] auto resolve(JsonValue &root, std::span<const std::string> tokens)
    -> JsonValue * {
  JsonValue *cur = &root;
  for (const auto &token : tokens) {
    cur = child(*cur, token);
    if (cur == nullptr) {
      return nullptr;
    }
  }
  return cur;
}

auto add_at(JsonValue &root, const Tokens &tokens, JsonValue value)
    -> Result<void> {
  if (tokens.empty()) {
    root = std::move(value);
    return ok();
  }
  auto *parent = resolve(root, std::span{tokens}.first(tokens.size() - 1));
  if (parent == nullptr) {
    return fail(Error::PatchPathNotFound);
  }
  const auto &last = tokens.back();
  if (parent->is_object()) {
    parent->get_object().insert_or_assign(last, std::move(value));
    return ok();
  }
  if (parent->is_array()) {
    auto &arr = parent->get_array();
    if (last == "-") {
      arr.push_back(std::move(value));
      return ok();
    }
    auto idx = parse_index(last);
    if (!idx) {
      return fail(Error::InvalidPatch);
    }
    if (*idx > arr.size()) {
      return fail(Error::PatchPathNotFound);
    }
    arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(*idx),
               std::move(value));
    return ok();
  }
  return fail(Error::PatchPathNotFound);
}

auto remove_at(JsonValue &root, const Tokens &tokens) -> Result<JsonValue> {
  if (tokens.empty()) {
    return fail(Error::InvalidPatch);
  }
  auto *parent = resolve(root, std::span{tokens}.first(tokens.size() - 1));
  if (parent == nullptr) {
    return fail(Error::PatchPathNotFound);
  }
  const auto &last = tokens.back();
  if (parent->is_object()) {
    auto &obj = parent->get_object();
    auto it = obj.find(last);
    if (it == obj.end()) {
      return fail(Error::PatchPathNotFound);
    }
    auto removed = std::move(it->second);
    obj.erase(it);
    return removed;
  }
  if (parent->is_array()) {
    auto &arr = parent->get_array();
    auto idx = parse_index(last);
    if (!idx || *idx >= arr.size()) {
      return fail(Error::PatchPathNotFound);
    }
    auto pos = arr.begin() + static_cast<std::ptrdiff_t>(*idx);
    auto removed = std::move(*pos);
    arr.erase(pos);
    return removed;
  }
  return fail(Error::PatchPathNotFound);
}

[[nodiscard]] auto is_prefix_of(const Tokens &prefix, const Tokens &tokens)
    -> bool {
  return prefix.size() < tokens.size() &&
         std::ranges::equal(prefix, tokens | std::views::take(prefix.size()));
}

auto apply_operation(JsonValue &doc, const PatchOperation &op)
    -> Result<void> {
  auto path = parse_json_pointer(op.path);
  if (!path) {
    return fail(path.error());
  }

  switch (op.op) {
  case PatchOpKind::Add:
    return add_at(doc, *path, op.value);

  case PatchOpKind::Remove:
    if (auto removed = remove_at(doc, *path); !removed) {
      return fail(removed.error());
    }
    return ok();

  case PatchOpKind::Replace: {
    auto *target = resolve(doc, *path);
    if (target == nullptr) {
      return fail(Error::PatchPathNotFound);
    }
    *target = op.value;
    return ok();
  }

  case PatchOpKind::Move: {
    auto from = parse_json_pointer(op.from);
    if (!from) {
      return fail(from.error());
    }
    if (*from == *path) {
      return resolve(doc, *from) ? ok() : fail(Error::PatchPathNotFound);
    }
    if (is_prefix_of(*from, *path)) {
      return fail(Error::InvalidPatch);
    }
    auto moved = remove_at(doc, *from);
    if (!moved) {
      return fail(moved.error());
    }
    return add_at(doc, *path, std::move(*moved));
  }

  case PatchOpKind::Copy: {
    auto from = parse_json_pointer(op.from);
    if (!from) {
      return fail(from.error());
    }
    auto *source = resolve(doc, *from);
    if (source == nullptr) {
      return fail(Error::PatchPathNotFound);
    }
    JsonValue copy = *source;
    return add_at(doc, *path, std::move(copy));
  }

  case PatchOpKind::Test: {
    auto *target = resolve(doc, *path);
    if (target == nullptr) {
      return fail(Error::PatchPathNotFound);
    }
    if (!json_equal(*target, op.value)) {
      return fail(Error::PatchTestFailed);
    }
    return ok();
  }
  }
  return fail(Error::InvalidPatch);
}

auto append_token(const std::string &base, std::string_view token)
    -> std::string {
  return std::format("{}/{}", base, escape_pointer_token(token));
}

auto diff_into(const std::string &path, const JsonValue &from,
               const JsonValue &to, JsonPatch &out) -> void {
  if (json_equal(from, to)) {
    return;
  }

  if (from.is_object() && to.is_object()) {
    const auto &a = from.get_object();
    const auto &b = to.get_object();
    for (const auto &[key, value] : a) {
      if (!b.contains(key)) {
        out.push_back({.op = PatchOpKind::Remove,
                       .path = append_token(path, key)});
      }
    }
    for (const auto &[key, value] : b) {
      auto it = a.find(key);
      if (it == a.end()) {
        out.push_back({.op = PatchOpKind::Add,
                       .path = append_token(path, key),
                       .value = value});
      } else {
        diff_into(append_token(path, key), it->second, value, out);
      }
    }
    return;
  }

  if (from.is_array() && to.is_array()) {
    const auto &a = from.get_array();
    const auto &b = to.get_array();
    const auto common = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < common; ++i) {
      diff_into(std::format("{}/{}", path, i), a[i], b[i], out);
    }
    // Remove from the tail so earlier indices stay valid.
    for (std::size_t i = a.size(); i > b.size(); --i) {
      out.push_back({.op = PatchOpKind::Remove,
                     .path = std::format("{}/{}", path, i - 1)});
    }
    for (std::size_t i = a.size(); i < b.size(); ++i) {
      out.push_back({.op = PatchOpKind::Add,
                     .path = std::format("{}/{}", path, i),
                     .value = b[i]});
    }
    return;
  }

  out.push_back({.op = PatchOpKind::Replace, .path = path, .value = to});
}

} // namespace

auto parse_json_pointer(std::string_view pointer)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> tokens;
  if (pointer.empty()) {
    return tokens;
  }
  if (pointer.front() != '/') {
    return fail(Error::InvalidPatch);
  }

  for (auto part : pointer.substr(1) | std::views::split('/')) {
    std::string token;
    const std::string_view raw(part.begin(), part.end());
    for (std::size_t i = 0; i < raw.size(); ++i) {
      if (raw[i] != '~') {
        token.push_back(raw[i]);
        continue;
      }
      if (i + 1 >= raw.size()) {
        return fail(Error::InvalidPatch);
      }
      const char next = raw[++i];
      if (next == '0') {
        token.push_back('~');
      } else if (next == '1') {
        token.push_back('/');
      } else {
        return fail(Error::InvalidPatch);
      }
    }
    tokens.push_back(std::move(token));
  }
  return tokens;
}

auto escape_pointer_token(std::string_view token) -> std::string {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

auto apply_patch(const JsonValue &document, const JsonPatch &patch)
    -> Result<JsonValue> {
  JsonValue working = document;
  for (const auto &op : patch) {
    if (auto r = apply_operation(working, op); !r) {
      return fail(r.error());
    }
  }
  return working;
}

auto apply_patches(const JsonValue &document,
                   std::span<const JsonPatch> patches) -> Result<JsonValue> {
  JsonValue working = document;
  for (const auto &patch : patches) {
    for (const auto &op : patch) {
      if (auto r = apply_operation(working, op); !r) {
        return fail(r.error());
      }
    }
  }
  return working;
}

auto create_patch(const JsonValue &from, const JsonValue &to) -> JsonPatch {
  JsonPatch out;
  diff_into("", from, to, out);
  return out;
}

auto patch_to_json(const JsonPatch &patch) -> JsonValue {
  JsonValue arr = JsonValue::array_t{};
  auto &items = arr.get_array();
  items.reserve(patch.size());
  for (const auto &op : patch) {
    JsonValue entry = JsonValue::object_t{};
    entry["op"] = std::string(to_string_view(op.op));
    entry["path"] = op.path;
    switch (op.op) {
    case PatchOpKind::Move:
    case PatchOpKind::Copy:
      entry["from"] = op.from;
      break;
    case PatchOpKind::Remove:
      break;
    case PatchOpKind::Add:
    case PatchOpKind::Replace:
    case PatchOpKind::Test:
      entry["value"] = op.value;
      break;
    }
    items.push_back(std::move(entry));
  }
  return arr;
}

auto patch_from_json(const JsonValue &json) -> Result<JsonPatch> {
  if (!json.is_array()) {
    return fail(Error::InvalidPatch);
  }
  JsonPatch patch;
  patch.reserve(json.get_array().size());
  for (const auto &entry : json.get_array()) {
    auto op_name = json_string_field(entry, "op");
    auto path = json_string_field(entry, "path");
    if (!op_name || !path) {
      return fail(Error::InvalidPatch);
    }
    auto kind = util::try_parse_enum<PatchOpKind>(*op_name);
    if (!kind) {
      return fail(Error::InvalidPatch);
    }

    PatchOperation op{.op = *kind, .path = std::move(*path)};
    switch (*kind) {
    case PatchOpKind::Move:
    case PatchOpKind::Copy: {
      auto from = json_string_field(entry, "from");
      if (!from) {
        return fail(Error::InvalidPatch);
      }
      op.from = std::move(*from);
      break;
    }
    case PatchOpKind::Add:
    case PatchOpKind::Replace:
    case PatchOpKind::Test:
      if (!entry.contains("value")) {
        return fail(Error::InvalidPatch);
      }
      op.value = json_field(entry, "value");
      break;
    case PatchOpKind::Remove:
      break;
    }
    patch.push_back(std::move(op));
  }
  return patch;
}

} // namespace brainforge
