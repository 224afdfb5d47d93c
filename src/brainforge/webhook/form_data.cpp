#include "brainforge/webhook/form_data.hpp"

#include <boost/url/encoding_opts.hpp>
#include <boost/url/params_view.hpp>
#include <boost/url/parse_query.hpp>

namespace brainforge::webhook {

namespace {

auto append(JsonValue &slot, std::string value) -> void {
  if (!slot.is_array()) {
    JsonValue first = std::move(slot);
    slot = JsonValue::array_t{};
    if (!first.is_null()) {
      slot.get_array().push_back(std::move(first));
    }
  }
  slot.get_array().emplace_back(std::move(value));
}

} // namespace

auto parse_form_data(std::string_view body) -> Result<FormData> {
  FormData out{.data = make_json_object(), .token = std::nullopt};
  if (body.empty()) {
    return out;
  }
  auto parsed = boost::urls::parse_query(body);
  if (!parsed) {
    return fail(Error::ParseError);
  }

  auto &fields = out.data.get_object();
  boost::urls::params_view decoded(*parsed, boost::urls::encoding_opts{true});
  for (const auto &param : decoded) {
    if (param.key == kFormTokenField) {
      out.token = param.value;
      continue;
    }
    if (param.key.ends_with("[]")) {
      auto base = param.key.substr(0, param.key.size() - 2);
      auto &slot = fields[base];
      if (!slot.is_array()) {
        slot = JsonValue::array_t{};
      }
      slot.get_array().emplace_back(param.value);
      continue;
    }
    if (auto it = fields.find(param.key); it != fields.end()) {
      append(it->second, param.value);
    } else {
      fields.emplace(param.key, param.value);
    }
  }
  return out;
}

} // namespace brainforge::webhook
