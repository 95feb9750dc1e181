#pragma once

#include <string>
#include <utility>

namespace bountygate {

struct AdvisoryRequest {
    std::string prompt;
    std::string system_context;
    int max_tokens = 500;
    double temperature = 0.1;
};

// Outcome of one advisory round trip. `ok == false` carries the reason in
// `error`; `text` is then empty.
struct AdvisoryReply {
    bool ok = false;
    std::string text;
    std::string error;

    static AdvisoryReply success(std::string t) {
        AdvisoryReply r;
        r.ok = true;
        r.text = std::move(t);
        return r;
    }
    static AdvisoryReply failure(std::string e) {
        AdvisoryReply r;
        r.error = std::move(e);
        return r;
    }
};

// Raw text-in / text-out channel to the external advisory model.
// Implementations must not throw; every failure becomes an AdvisoryReply.
class AdvisoryTransport {
public:
    virtual ~AdvisoryTransport() = default;

    virtual AdvisoryReply ask(const AdvisoryRequest& request) = 0;
    virtual std::string model_name() const = 0;
};

} // namespace bountygate
