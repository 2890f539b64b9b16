#include "session_tokens.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "internal/auth/crypto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"

namespace sitestore::auth {

namespace {

constexpr std::size_t kSecretBytes = 32;
constexpr const char* kHeaderJson  = R"({"alg":"HS256","typ":"JWT"})";

kv::Value NewSecretRecord(const std::string& secret, util::TimePoint now) {
  return kv::MakeObject({
      {"secret", kv::MakeString(util::HexEncode(secret))},
      {"created_at", kv::MakeString(util::ToIso8601(now))},
  });
}

std::string SecretFromRecord(const kv::Value& record) {
  const auto hex = kv::GetString(record, "secret");
  if (!hex) throw util::BackendError("session secret record has no secret");

  auto secret = util::HexDecode(*hex);
  if (!secret || secret->size() != kSecretBytes) throw util::BackendError("session secret record is malformed");
  return *secret;
}

std::vector<std::string> SplitToken(const std::string& token) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    const auto dot = token.find('.', start);
    if (dot == std::string::npos) {
      parts.push_back(token.substr(start));
      return parts;
    }
    parts.push_back(token.substr(start, dot - start));
    start = dot + 1;
  }
}

std::optional<google::protobuf::Struct> ParseObject(const std::string& b64) {
  const auto json = util::Base64UrlDecode(b64);
  if (!json) return std::nullopt;

  google::protobuf::Struct object;
  if (!google::protobuf::util::JsonStringToMessage(*json, &object).ok()) return std::nullopt;
  return object;
}

std::optional<std::string> ClaimString(const google::protobuf::Struct& object, const std::string& name) {
  auto it = object.fields().find(name);
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return std::nullopt;
  return it->second.string_value();
}

// Whole numbers only; a fractional or out-of-range timestamp is not a claim we issued.
std::optional<int64_t> ClaimInteger(const google::protobuf::Struct& object, const std::string& name) {
  auto it = object.fields().find(name);
  if (it == object.fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) return std::nullopt;

  const double n = it->second.number_value();
  if (!std::isfinite(n) || std::floor(n) != n || std::fabs(n) > 9.0e15) return std::nullopt;
  return static_cast<int64_t>(n);
}

} // namespace

SessionTokenService::SessionTokenService(std::shared_ptr<kv::KvStore> store, util::ClockFn clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
}

std::string SessionTokenService::GetOrCreateSecret() {
  if (auto existing = store_->Get(kSessionSecretKey)) {
    return SecretFromRecord(*existing);
  }

  const auto candidate = RandomBytes(kSecretBytes);
  auto       secret    = SecretFromRecord(store_->PutIfAbsent(kSessionSecretKey, NewSecretRecord(candidate, clock_())));
  if (secret == candidate) {
    SITESTORE_LOG_INFO("session secret created");
  }
  return secret;
}

std::string SessionTokenService::Issue(const std::string& sub, std::chrono::milliseconds ttl) {
  if (ttl <= std::chrono::milliseconds::zero() || ttl > kMaxTokenTtl) {
    throw std::invalid_argument("session ttl must be in (0, " + std::to_string(kMaxTokenTtl.count()) + "] ms");
  }

  const auto secret = GetOrCreateSecret();
  const auto iat    = util::ToUnixMillis(clock_());

  google::protobuf::Struct claims;
  auto&                    fields = *claims.mutable_fields();
  fields["sub"].set_string_value(sub);
  fields["iat"].set_number_value(static_cast<double>(iat));
  fields["exp"].set_number_value(static_cast<double>(iat + ttl.count()));
  fields["ver"].set_number_value(kTokenVersion);

  std::string payload_json;
  auto        status = google::protobuf::util::MessageToJsonString(claims, &payload_json);
  if (!status.ok()) {
    throw std::runtime_error("encode session claims: " + status.ToString());
  }

  const auto signing_input = util::Base64UrlEncode(kHeaderJson) + "." + util::Base64UrlEncode(payload_json);
  return signing_input + "." + util::Base64UrlEncode(HmacSha256(secret, signing_input));
}

std::optional<SessionClaims> SessionTokenService::Verify(const std::string& token) {
  const auto parts = SplitToken(token);
  if (parts.size() != 3) return std::nullopt;

  const auto& header_b64    = parts[0];
  const auto& payload_b64   = parts[1];
  const auto& signature_b64 = parts[2];

  const auto signature = util::Base64UrlDecode(signature_b64);
  if (!signature || signature->size() != kSha256Bytes) return std::nullopt;

  const auto expected = HmacSha256(GetOrCreateSecret(), header_b64 + "." + payload_b64);
  if (!ConstantTimeEquals(*signature, expected)) return std::nullopt;

  const auto header = ParseObject(header_b64);
  if (!header || header->fields_size() != 2 || ClaimString(*header, "alg") != "HS256" || ClaimString(*header, "typ") != "JWT") {
    return std::nullopt;
  }

  const auto payload = ParseObject(payload_b64);
  if (!payload) return std::nullopt;

  const auto sub = ClaimString(*payload, "sub");
  const auto iat = ClaimInteger(*payload, "iat");
  const auto exp = ClaimInteger(*payload, "exp");
  const auto ver = ClaimInteger(*payload, "ver");
  if (!sub || !iat || !exp || ver != kTokenVersion) return std::nullopt;

  if (*exp <= util::ToUnixMillis(clock_())) return std::nullopt;

  SessionClaims claims;
  claims.sub    = *sub;
  claims.iat_ms = *iat;
  claims.exp_ms = *exp;
  claims.ver    = kTokenVersion;
  return claims;
}

void SessionTokenService::RotateSecret() {
  store_->Put(kSessionSecretKey, NewSecretRecord(RandomBytes(kSecretBytes), clock_()));
  SITESTORE_LOG_INFO("session secret rotated");
}

} // namespace sitestore::auth
