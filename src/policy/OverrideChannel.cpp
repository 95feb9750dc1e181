#include "bountygate/policy/OverrideChannel.hpp"

namespace bountygate {

ConsoleOverrideChannel::ConsoleOverrideChannel(std::istream& in, std::ostream& out)
    : in_(in),
      out_(out) {}

std::optional<std::string> ConsoleOverrideChannel::ask(const std::string& prompt) {
    out_ << prompt << std::flush;

    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;

    // Strip trailing CR from terminals that send CRLF.
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace bountygate
