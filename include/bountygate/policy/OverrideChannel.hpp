#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace bountygate {

// Exact token an operator must type to accept an unresolved scope.
constexpr const char* kOverrideToken = "I_ACCEPT_RISK";

// Interactive confirmation source for manual overrides.
class OverrideChannel {
public:
    virtual ~OverrideChannel() = default;

    // Shows `prompt` and returns the operator's reply, or nullopt on end of
    // input.
    virtual std::optional<std::string> ask(const std::string& prompt) = 0;
};

// Reads one line from a stream pair (stdin/stdout in the CLI).
class ConsoleOverrideChannel : public OverrideChannel {
public:
    ConsoleOverrideChannel(std::istream& in, std::ostream& out);

    std::optional<std::string> ask(const std::string& prompt) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace bountygate
