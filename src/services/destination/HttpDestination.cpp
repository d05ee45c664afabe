#include "HttpDestination.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <utility>

#include "core/Errors.hpp"

using nlohmann::json;

namespace mmig {

namespace {

constexpr time_t kConnectTimeoutSec = 10;
constexpr time_t kTransferTimeoutSec = 300;

httplib::Client makeClient(const std::string& baseUrl) {
  httplib::Client cli(baseUrl);
  cli.set_connection_timeout(kConnectTimeoutSec, 0);
  cli.set_read_timeout(kTransferTimeoutSec, 0);
  cli.set_write_timeout(kTransferTimeoutSec, 0);
  return cli;
}

json parseBody(const std::string& body, const std::string& what) {
  try {
    return json::parse(body);
  } catch (const json::exception& e) {
    throw TransientAdapterError(what + ": malformed response: " + e.what());
  }
}

bool isTransientStatus(int status) {
  return status == 401 || status == 403 || status == 408 || status == 429 || status >= 500;
}

} // namespace

HttpDestination::HttpDestination(std::string baseUrl, CredentialProvider& credentials)
  : baseUrl_(std::move(baseUrl)), credentials_(credentials) {}

std::string HttpDestination::checked(const httplib::Result& res, const std::string& what) {
  if (!res) {
    throw TransientAdapterError(what + ": " + httplib::to_string(res.error()));
  }
  const int status = res->status;
  if (status / 100 == 2) return res->body;

  if (status == 401) credentials_.invalidate();
  const std::string msg = what + ": HTTP " + std::to_string(status) + " " + res->body;
  if (isTransientStatus(status)) throw TransientAdapterError(msg);
  throw PermanentAdapterError(msg);
}

std::string HttpDestination::upload(std::string_view bytes, const UploadMetadata& meta) {
  auto cli = makeClient(baseUrl_);
  cli.set_bearer_token_auth(credentials_.accessToken());

  httplib::Headers headers = {
    {"X-Goog-Upload-File-Name", meta.file_name},
    {"X-Goog-Upload-Protocol", "raw"},
  };
  auto res = cli.Post("/v1/uploads", headers, bytes.data(), bytes.size(), "application/octet-stream");
  const std::string token = checked(res, "upload of " + meta.source_id);
  if (token.empty()) throw TransientAdapterError("upload of " + meta.source_id + ": empty upload token");

  json body = {
    {"newMediaItems", json::array({
      {
        {"description", meta.file_name},
        {"simpleMediaItem", {{"uploadToken", token}, {"fileName", meta.file_name}}},
      },
    })},
  };
  // filed into the album by the create call itself
  if (meta.collection) body["albumId"] = meta.collection->id;
  auto created = cli.Post("/v1/mediaItems:batchCreate", body.dump(), "application/json");
  json out = parseBody(checked(created, "create of " + meta.source_id), "create of " + meta.source_id);

  if (!out.contains("newMediaItemResults") || !out["newMediaItemResults"].is_array() ||
      out["newMediaItemResults"].empty())
    throw TransientAdapterError("create of " + meta.source_id + ": no result returned");

  const json& result = out["newMediaItemResults"][0];
  std::string message = "OK";
  if (result.contains("status") && result["status"].is_object())
    message = result["status"].value("message", message);
  if (message != "OK" && message != "Success")
    throw PermanentAdapterError("create of " + meta.source_id + " rejected: " + message);
  if (!result.contains("mediaItem") || !result["mediaItem"].contains("id"))
    throw TransientAdapterError("create of " + meta.source_id + ": result carries no media item id");
  return result["mediaItem"]["id"].get<std::string>();
}

CollectionHandle HttpDestination::ensureCollection(const std::string& name) {
  auto cli = makeClient(baseUrl_);
  cli.set_bearer_token_auth(credentials_.accessToken());

  std::string pageToken;
  do {
    std::string path = "/v1/albums?pageSize=50";
    if (!pageToken.empty()) path += "&pageToken=" + httplib::detail::encode_query_param(pageToken);
    json page = parseBody(checked(cli.Get(path), "album listing"), "album listing");
    for (const auto& album : page.value("albums", json::array())) {
      if (album.value("title", std::string()) == name) {
        spdlog::info("Found album '{}' ({})", name, album.value("id", std::string()));
        return CollectionHandle{album.at("id").get<std::string>(), name};
      }
    }
    pageToken = page.value("nextPageToken", std::string());
  } while (!pageToken.empty());

  json body = {{"album", {{"title", name}}}};
  json album = parseBody(checked(cli.Post("/v1/albums", body.dump(), "application/json"),
                                 "album creation"), "album creation");
  if (!album.contains("id")) throw TransientAdapterError("album creation: no id returned");
  spdlog::info("Created album '{}' ({})", name, album["id"].get<std::string>());
  return CollectionHandle{album["id"].get<std::string>(), name};
}

void HttpDestination::addToCollection(const std::string& destinationId,
                                      const CollectionHandle& collection) {
  auto cli = makeClient(baseUrl_);
  cli.set_bearer_token_auth(credentials_.accessToken());

  json body = {{"mediaItemIds", json::array({destinationId})}};
  checked(cli.Post("/v1/albums/" + collection.id + ":batchAddMediaItems", body.dump(), "application/json"),
          "adding " + destinationId + " to album " + collection.name);
}

} // namespace mmig
