#include "classifier.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace hookdeploy {

static constexpr const char* kBranchRefPrefix = "refs/heads/";

std::string PushPayload::branch() const {
    if (!ref || !starts_with(*ref, kBranchRefPrefix)) return "";
    return ref->substr(std::char_traits<char>::length(kBranchRefPrefix));
}

std::string PushPayload::short_id() const {
    if (!head_commit) return "";
    return head_commit->id.substr(0, 7);
}

PushPayload decode_push_payload(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw PayloadError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw PayloadError("payload is not a JSON object");
    }

    PushPayload payload;
    if (j.contains("ref") && j["ref"].is_string()) {
        payload.ref = j["ref"].get<std::string>();
    }

    if (j.contains("head_commit") && !j["head_commit"].is_null()) {
        const auto& hc = j["head_commit"];
        if (!hc.is_object()) {
            throw PayloadError("head_commit is not an object");
        }
        if (!hc.contains("id") || !hc["id"].is_string()) {
            throw PayloadError("head_commit.id missing or not a string");
        }
        if (!hc.contains("message") || !hc["message"].is_string()) {
            throw PayloadError("head_commit.message missing or not a string");
        }
        payload.head_commit = HeadCommit{hc["id"].get<std::string>(),
                                         hc["message"].get<std::string>()};
    }
    return payload;
}

EventClassifier::EventClassifier(std::string target_branch)
    : target_branch_(std::move(target_branch))
{}

Decision EventClassifier::classify(const std::string& event_type,
                                   const std::string& body) const {
    Decision d;
    d.event = event_type;

    if (event_type == "ping") {
        d.kind = Decision::Kind::Pong;
        return d;
    }

    if (event_type != "push") {
        d.kind = Decision::Kind::Ignored;
        d.reason = event_type.empty() ? "missing event type"
                                      : "event " + event_type + " not handled";
        return d;
    }

    PushPayload payload;
    try {
        payload = decode_push_payload(body);
    } catch (const PayloadError& e) {
        d.kind = Decision::Kind::Malformed;
        d.reason = "malformed payload";
        d.detail = e.what();
        return d;
    }

    d.branch = payload.branch();
    if (d.branch.empty()) {
        d.kind = Decision::Kind::Ignored;
        d.reason = "no branch reference";
        return d;
    }
    if (d.branch != target_branch_) {
        d.kind = Decision::Kind::Ignored;
        d.reason = "not " + target_branch_ + " branch";
        return d;
    }
    if (!payload.head_commit) {
        d.kind = Decision::Kind::Ignored;
        d.reason = "no head commit";
        return d;
    }

    d.kind = Decision::Kind::Deploy;
    d.commit_id = payload.head_commit->id;
    d.commit_message = payload.head_commit->message;
    return d;
}

} // namespace hookdeploy
