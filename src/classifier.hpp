#pragma once
#include <string>
#include <optional>
#include <stdexcept>

namespace hookdeploy {

// Raised when a webhook body cannot be decoded into the expected shape.
class PayloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct HeadCommit {
    std::string id;
    std::string message;
};

// Typed view of the fields of a GitHub push event that drive deployment.
struct PushPayload {
    std::optional<std::string> ref;        // "refs/heads/<branch>"
    std::optional<HeadCommit> head_commit; // null when a branch is deleted

    // Branch name after "refs/heads/", or "" when ref is absent or is not a
    // branch ref (tags, malformed values).
    std::string branch() const;

    // First 7 characters of the head commit id ("" without a head commit).
    std::string short_id() const;
};

// Decode a push payload. Throws PayloadError when the body is not a JSON
// object, or when head_commit is present but its id/message are not strings.
// A missing or non-string ref is tolerated (ref stays empty).
PushPayload decode_push_payload(const std::string& body);

struct Decision {
    enum class Kind { Deploy, Pong, Ignored, Malformed };

    Kind kind = Kind::Ignored;
    std::string event;
    std::string branch;
    std::string commit_id;
    std::string commit_message;
    std::string reason;
    std::string detail; // decoder message for Malformed

    bool should_deploy() const { return kind == Kind::Deploy; }
    std::string short_id() const { return commit_id.substr(0, 7); }
};

// Decides whether an incoming GitHub event warrants a deployment.
class EventClassifier {
public:
    explicit EventClassifier(std::string target_branch = "main");

    Decision classify(const std::string& event_type, const std::string& body) const;

    const std::string& target_branch() const { return target_branch_; }

private:
    std::string target_branch_;
};

} // namespace hookdeploy
