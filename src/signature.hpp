#pragma once
#include <string>
#include <optional>

namespace hookdeploy {

// Placeholder secret shipped in sample configuration. When the configured
// secret equals this value the webhook endpoint performs no signature check
// at all, which makes it an open endpoint. Operators are warned at startup.
inline constexpr const char* kUnconfiguredSecret = "your-webhook-secret-here";

inline constexpr const char* kSignaturePrefix = "sha256=";

// "sha256=" + lowercase hex HMAC-SHA256 of body keyed with secret,
// as sent by GitHub in X-Hub-Signature-256.
std::string compute_signature(const std::string& body, const std::string& secret);

// Authenticate a raw request body against a presented signature.
// Absent or mismatching signatures yield false; the comparison runs in
// constant time over the expected digest length.
bool verify_signature(const std::string& body,
                      const std::optional<std::string>& presented,
                      const std::string& secret);

// Length-independent constant-time string comparison.
bool constant_time_equals(const std::string& a, const std::string& b);

} // namespace hookdeploy
