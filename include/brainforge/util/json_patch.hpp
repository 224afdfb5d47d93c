#pragma once

#include "brainforge/core/error.hpp"
#include "brainforge/util/enum.hpp"
#include "brainforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace brainforge {

enum class PatchOpKind : std::uint8_t {
  Add,
  Remove,
  Replace,
  Move,
  Copy,
  Test,
};
BOOST_DESCRIBE_ENUM(PatchOpKind, Add, Remove, Replace, Move, Copy, Test)
BRAINFORGE_DEFINE_ENUM_SERDE(PatchOpKind, PatchOpKind::Add)

struct PatchOperation {
  PatchOpKind op{PatchOpKind::Add};
  std::string path;
  // Source pointer of move/copy.
  std::string from;
  JsonValue value;
};

using JsonPatch = std::vector<PatchOperation>;

/// RFC 6901 pointer split into unescaped reference tokens.
[[nodiscard]] auto parse_json_pointer(std::string_view pointer)
    -> Result<std::vector<std::string>>;

[[nodiscard]] auto escape_pointer_token(std::string_view token) -> std::string;

/// Applies an RFC 6902 patch to a copy of `document`. Either every operation
/// applies or the input is left untouched and an error is returned.
[[nodiscard]] auto apply_patch(const JsonValue &document,
                               const JsonPatch &patch) -> Result<JsonValue>;

[[nodiscard]] auto apply_patches(const JsonValue &document,
                                 std::span<const JsonPatch> patches)
    -> Result<JsonValue>;

/// Patch that turns `from` into `to`.
[[nodiscard]] auto create_patch(const JsonValue &from, const JsonValue &to)
    -> JsonPatch;

[[nodiscard]] auto patch_to_json(const JsonPatch &patch) -> JsonValue;

[[nodiscard]] auto patch_from_json(const JsonValue &json) -> Result<JsonPatch>;

} // namespace brainforge
