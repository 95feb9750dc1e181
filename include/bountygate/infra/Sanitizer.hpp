#pragma once

#include <optional>
#include <string>

namespace bountygate {

// Path separators and anything outside [A-Za-z0-9_.-] become '_';
// truncated to 200 characters.
std::string sanitize_filename(const std::string& name);

// Strips scheme and port, then accepts a DNS host name (letters, digits,
// hyphens, alphabetic TLD) or a dotted IPv4 address. Host names come back
// lower-cased.
std::optional<std::string> sanitize_domain(const std::string& input);

// Accepts only http/https URLs that carry a host.
std::optional<std::string> sanitize_url(const std::string& url);

// True when base/path stays inside base after normalisation.
bool is_safe_path(const std::string& path, const std::string& base_dir = ".");

} // namespace bountygate
