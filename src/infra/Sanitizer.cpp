#include "bountygate/infra/Sanitizer.hpp"

#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace bountygate {

std::string sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '_' || c == '-' || c == '.') {
            out += c;
        } else {
            out += '_';
        }
    }
    if (out.size() > 200) out.resize(200);
    return out;
}

std::optional<std::string> sanitize_domain(const std::string& input) {
    std::string host = input;

    size_t scheme = host.find("://");
    if (scheme != std::string::npos) {
        host = host.substr(scheme + 3);
        size_t end = host.find_first_of("/?#");
        if (end != std::string::npos) host = host.substr(0, end);
        size_t at = host.rfind('@');
        if (at != std::string::npos) host = host.substr(at + 1);
    }

    size_t colon = host.find(':');
    if (colon != std::string::npos) host = host.substr(0, colon);

    static const std::regex domain_re(
        R"(^(?:[a-zA-Z0-9](?:[a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}$)");
    static const std::regex ipv4_re(
        R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)");

    if (host.size() <= 253 && std::regex_match(host, domain_re)) {
        for (auto& c : host) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return host;
    }
    if (std::regex_match(host, ipv4_re)) {
        return host;
    }
    return std::nullopt;
}

std::optional<std::string> sanitize_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    std::string scheme = url.substr(0, scheme_end);
    for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (scheme != "http" && scheme != "https") return std::nullopt;

    std::string rest = url.substr(scheme_end + 3);
    size_t host_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, host_end);
    if (authority.empty()) return std::nullopt;

    for (char c : url) {
        if (std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return url;
}

bool is_safe_path(const std::string& path, const std::string& base_dir) {
    std::error_code ec;
    fs::path base = fs::weakly_canonical(fs::absolute(base_dir, ec), ec);
    if (ec) return false;

    fs::path p(path);
    fs::path target = p.is_absolute() ? p : base / p;
    target = fs::weakly_canonical(target, ec);
    if (ec) return false;

    auto rel = target.lexically_relative(base);
    if (rel.empty()) return false;
    auto first = *rel.begin();
    return first != "..";
}

} // namespace bountygate
