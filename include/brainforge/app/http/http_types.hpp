#pragma once

#include "brainforge/core/error.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/string_hash.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>

namespace brainforge::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
  PATCH,
  OPTIONS,
  HEAD
};

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,

  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  Conflict = 409,

  InternalServerError = 500,
  ServiceUnavailable = 503
};

/// Header names are stored lower-cased.
using HttpHeaders =
    std::unordered_map<std::string, std::string, brainforge::StringHash,
                       brainforge::StringEqual>;

class QueryParams {
public:
  QueryParams() = default;
  explicit QueryParams(std::string_view query_string);

  [[nodiscard]] auto get(std::string_view key) const -> Result<std::string>;
  [[nodiscard]] auto has(std::string_view key) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t { return params_.size(); }

private:
  std::unordered_map<std::string, std::string, brainforge::StringHash,
                     brainforge::StringEqual>
      params_;
};

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  std::string query_string;
  HttpHeaders headers;
  std::string body;
  // Populated by the Router when a pattern matches.
  std::unordered_map<std::string, std::string, brainforge::StringHash,
                     brainforge::StringEqual>
      path_params;

  [[nodiscard]] auto header(std::string_view key) const -> Result<std::string>;
  [[nodiscard]] auto path_param(std::string_view key) const
      -> Result<std::string>;
  [[nodiscard]] auto query() const -> QueryParams {
    return QueryParams(query_string);
  }
  /// Media type of the body without parameters, lower-cased.
  [[nodiscard]] auto content_type() const -> std::string;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::string body;

  [[nodiscard]] static auto ok() -> HttpResponse;
  [[nodiscard]] static auto json(std::string_view json_str,
                                 HttpStatus status = HttpStatus::Ok)
      -> HttpResponse;
  [[nodiscard]] static auto json(const JsonValue &value,
                                 HttpStatus status = HttpStatus::Ok)
      -> HttpResponse;
  /// `{"error": message}` with the given status.
  [[nodiscard]] static auto error(HttpStatus status, std::string_view message)
      -> HttpResponse;
  [[nodiscard]] static auto not_found() -> HttpResponse;
  [[nodiscard]] static auto bad_request() -> HttpResponse;
  [[nodiscard]] static auto internal_error() -> HttpResponse;

  auto set_header(std::string key, std::string value) -> HttpResponse &;
  auto set_body(std::string body_str) -> HttpResponse &;
};

[[nodiscard]] auto status_reason_phrase(HttpStatus status) -> std::string_view;

} // namespace brainforge::http

template <>
struct std::formatter<brainforge::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(brainforge::http::HttpMethod method, auto &ctx) const {
    using enum brainforge::http::HttpMethod;
    std::string_view name = [method] {
      switch (method) {
      case GET:
        return "GET";
      case POST:
        return "POST";
      case PUT:
        return "PUT";
      case DELETE:
        return "DELETE";
      case PATCH:
        return "PATCH";
      case OPTIONS:
        return "OPTIONS";
      case HEAD:
        return "HEAD";
      }
      return "UNKNOWN";
    }();
    return std::formatter<std::string_view>::format(name, ctx);
  }
};

template <>
struct std::formatter<brainforge::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(brainforge::http::HttpStatus status, auto &ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
