#include "brainforge/app/http/http_types.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/params_view.hpp>
#include <boost/url/parse_query.hpp>

#include <utility>

namespace brainforge::http {

auto HttpRequest::header(std::string_view key) const -> Result<std::string> {
  auto it = headers.find(boost::algorithm::to_lower_copy(std::string(key)));
  if (it != headers.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto HttpRequest::path_param(std::string_view key) const
    -> Result<std::string> {
  auto it = path_params.find(key);
  if (it != path_params.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto HttpRequest::content_type() const -> std::string {
  auto value = header("content-type");
  if (!value) {
    return {};
  }
  std::string media = value->substr(0, value->find(';'));
  boost::algorithm::trim(media);
  boost::algorithm::to_lower(media);
  return media;
}

QueryParams::QueryParams(std::string_view query_string) {
  if (query_string.empty()) {
    return;
  }
  auto parsed = boost::urls::parse_query(query_string);
  if (!parsed) {
    return;
  }
  boost::urls::params_view decoded(*parsed, boost::urls::encoding_opts{true});
  for (const auto &param : decoded) {
    params_.insert_or_assign(param.key, param.value);
  }
}

auto QueryParams::get(std::string_view key) const -> Result<std::string> {
  auto it = params_.find(key);
  if (it != params_.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto QueryParams::has(std::string_view key) const -> bool {
  return params_.find(key) != params_.end();
}

auto HttpResponse::ok() -> HttpResponse {
  return {.status = HttpStatus::Ok, .headers = {}, .body = {}};
}

auto HttpResponse::json(std::string_view json_str, HttpStatus status)
    -> HttpResponse {
  HttpResponse resp{.status = status, .headers = {}, .body = {}};
  resp.headers["content-type"] = "application/json";
  resp.body.assign(json_str);
  return resp;
}

auto HttpResponse::json(const JsonValue &value, HttpStatus status)
    -> HttpResponse {
  return json(dump_json(value), status);
}

auto HttpResponse::error(HttpStatus status, std::string_view message)
    -> HttpResponse {
  auto body = make_json_object();
  body["error"] = std::string(message);
  return json(body, status);
}

auto HttpResponse::not_found() -> HttpResponse {
  return error(HttpStatus::NotFound, "Not found");
}

auto HttpResponse::bad_request() -> HttpResponse {
  return error(HttpStatus::BadRequest, "Bad request");
}

auto HttpResponse::internal_error() -> HttpResponse {
  return error(HttpStatus::InternalServerError, "Internal server error");
}

auto HttpResponse::set_header(std::string key, std::string value)
    -> HttpResponse & {
  boost::algorithm::to_lower(key);
  headers[std::move(key)] = std::move(value);
  return *this;
}

auto HttpResponse::set_body(std::string body_str) -> HttpResponse & {
  body = std::move(body_str);
  return *this;
}

auto status_reason_phrase(HttpStatus status) -> std::string_view {
  namespace beast_http = boost::beast::http;
  return beast_http::obsolete_reason(static_cast<beast_http::status>(status));
}

} // namespace brainforge::http
