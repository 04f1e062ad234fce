#include "key_directory.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

#include "base64_utils.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kLogTag[] = "directory";
constexpr int kStatusOk = 200;
constexpr int kStatusUnauthorized = 401;
constexpr int kStatusNotFound = 404;

std::string TrimBody(const std::string& body) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(body.begin(), body.end(), is_space);
  auto e = std::find_if_not(body.rbegin(), body.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

// Maps a non-success response to the error taxonomy. A rejected credential
// is kNotAuthenticated; 404 is handled by callers because its meaning depends
// on the endpoint.
bool FailFromResponse(const TransportResponse& resp,
                      const char* what,
                      Error& error) {
  std::string msg = std::string(what) + " failed";
  if (resp.status == 0) {
    msg += ": network unreachable";
  } else {
    msg += ": status " + std::to_string(resp.status);
  }
  if (!resp.error.empty()) {
    msg += " (" + resp.error + ")";
  }
  platform::log::Log(platform::log::Level::kWarn, kLogTag, msg);
  if (resp.status == kStatusUnauthorized) {
    return Fail(error, ErrorCode::kNotAuthenticated, msg);
  }
  return Fail(error, ErrorCode::kTransientNetworkFailure, msg);
}

bool DecodeKey32(const std::string& body,
                 std::array<std::uint8_t, 32>& out,
                 Error& error) {
  std::vector<std::uint8_t> raw;
  if (!common::Base64Decode(TrimBody(body), raw) || raw.size() != out.size()) {
    common::SecureWipe(raw);
    return Fail(error, ErrorCode::kMalformedPayload, "key material invalid");
  }
  std::memcpy(out.data(), raw.data(), out.size());
  common::SecureWipe(raw);
  return true;
}

}  // namespace

KeyDirectoryClient::KeyDirectoryClient(DirectoryTransport& transport,
                                       AuthProvider& auth)
    : transport_(transport), auth_(auth) {}

bool KeyDirectoryClient::RequireToken(std::string& out_token, Error& error) {
  out_token.clear();
  if (!auth_.GetToken(out_token) || out_token.empty()) {
    out_token.clear();
    return Fail(error, ErrorCode::kNotAuthenticated, "no session token");
  }
  return true;
}

bool KeyDirectoryClient::Publish(const PublicKey& own_public_key,
                                 Error& error) {
  error.Clear();
  std::string token;
  if (!RequireToken(token, error)) {
    return false;
  }
  const std::string b64 =
      common::Base64Encode(own_public_key.data(), own_public_key.size());
  const TransportResponse resp = transport_.UploadKey(token, b64);
  if (resp.status != kStatusOk) {
    return FailFromResponse(resp, "publish key", error);
  }
  return true;
}

bool KeyDirectoryClient::Fetch(const std::string& user_id,
                               PublicKey& out,
                               Error& error) {
  error.Clear();
  if (user_id.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "user id empty");
  }
  std::string token;
  if (!RequireToken(token, error)) {
    return false;
  }
  const TransportResponse resp = transport_.FetchKey(token, user_id);
  if (resp.status == kStatusNotFound) {
    return Fail(error, ErrorCode::kPeerKeyNotFound,
                "no published key for " + user_id);
  }
  if (resp.status != kStatusOk) {
    return FailFromResponse(resp, "fetch key", error);
  }
  return DecodeKey32(resp.body, out, error);
}

bool KeyDirectoryClient::CheckBackup(bool& out_has_backup, Error& error) {
  error.Clear();
  out_has_backup = false;
  std::string token;
  if (!RequireToken(token, error)) {
    return false;
  }
  const TransportResponse resp = transport_.CheckBackup(token);
  if (resp.status != kStatusOk) {
    return FailFromResponse(resp, "check backup", error);
  }
  const std::string body = TrimBody(resp.body);
  if (body == "true" || body == "1") {
    out_has_backup = true;
    return true;
  }
  if (body == "false" || body == "0") {
    return true;
  }
  return Fail(error, ErrorCode::kMalformedPayload, "backup check body invalid");
}

bool KeyDirectoryClient::UploadBackup(const std::string& blob_b64,
                                      Error& error) {
  error.Clear();
  if (blob_b64.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "backup blob empty");
  }
  std::string token;
  if (!RequireToken(token, error)) {
    return false;
  }
  const TransportResponse resp = transport_.UploadBackup(token, blob_b64);
  if (resp.status != kStatusOk) {
    return FailFromResponse(resp, "upload backup", error);
  }
  return true;
}

bool KeyDirectoryClient::FetchBackup(std::string& out_blob_b64,
                                     bool& found,
                                     Error& error) {
  error.Clear();
  out_blob_b64.clear();
  found = false;
  std::string token;
  if (!RequireToken(token, error)) {
    return false;
  }
  const TransportResponse resp = transport_.FetchBackup(token);
  if (resp.status == kStatusNotFound) {
    return true;
  }
  if (resp.status != kStatusOk) {
    return FailFromResponse(resp, "fetch backup", error);
  }
  out_blob_b64 = TrimBody(resp.body);
  found = !out_blob_b64.empty();
  return true;
}

bool KeyDirectoryClient::FetchMessageKey(const std::string& conversation_id,
                                         const std::string& message_id,
                                         std::array<std::uint8_t, 32>& out_key,
                                         Error& error) {
  error.Clear();
  if (conversation_id.empty() || message_id.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "message id empty");
  }
  std::string token;
  if (!RequireToken(token, error)) {
    return false;
  }
  const TransportResponse resp =
      transport_.FetchMessageKey(token, conversation_id, message_id);
  if (resp.status == kStatusNotFound) {
    return Fail(error, ErrorCode::kMissingKey, "message key not found");
  }
  if (resp.status != kStatusOk) {
    return FailFromResponse(resp, "fetch message key", error);
  }
  return DecodeKey32(resp.body, out_key, error);
}

}  // namespace lipseal::client
