#include "bountygate/pipeline/CommandAdapters.hpp"

#include <future>
#include <set>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/process.hpp>

#include "bountygate/infra/Config.hpp"
#include "bountygate/infra/Logger.hpp"
#include "bountygate/infra/Sanitizer.hpp"

namespace bp = boost::process;

namespace bountygate {

// ---------------------------------------------------------------------------
// Command line helpers
// ---------------------------------------------------------------------------

std::vector<std::string> split_command(const std::string& cmd) {
    std::vector<std::string> argv;
    std::string cur;
    bool in_word = false;
    char quote = 0;

    for (char c : cmd) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                cur += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (in_word) {
                argv.push_back(cur);
                cur.clear();
                in_word = false;
            }
        } else {
            cur += c;
            in_word = true;
        }
    }
    if (quote) {
        throw ConfigError("unterminated quote in command: " + cmd);
    }
    if (in_word) argv.push_back(cur);
    return argv;
}

std::vector<std::string> expand_placeholders(const std::vector<std::string>& argv,
                                             const std::map<std::string, std::string>& vars) {
    std::vector<std::string> out;
    out.reserve(argv.size());
    for (const auto& arg : argv) {
        std::string a = arg;
        for (const auto& [name, value] : vars) {
            const std::string key = "{" + name + "}";
            size_t pos = 0;
            while ((pos = a.find(key, pos)) != std::string::npos) {
                a.replace(pos, key.size(), value);
                pos += value.size();
            }
        }
        out.push_back(std::move(a));
    }
    return out;
}

CommandOutput run_command(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    CommandOutput r;
    if (argv.empty()) {
        r.error = "empty command";
        return r;
    }

    boost::filesystem::path exe;
    if (argv[0].find('/') != std::string::npos) {
        exe = argv[0];
    } else {
        exe = bp::search_path(argv[0]);
    }
    if (exe.empty()) {
        r.error = argv[0] + ": not found on PATH";
        return r;
    }

    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    boost::asio::io_context ios;
    std::future<std::string> out;
    std::error_code ec;
    bp::child child(exe, bp::args(args),
                    bp::std_in < bp::null,
                    bp::std_out > out,
                    bp::std_err > bp::null,
                    ios, ec);
    if (ec) {
        r.error = "cannot start " + argv[0] + ": " + ec.message();
        return r;
    }
    r.launched = true;

    ios.run_for(timeout);
    if (!ios.stopped()) {
        r.timed_out = true;
        r.error = argv[0] + " timed out after " + std::to_string(timeout.count()) + "s";
        child.terminate(ec);
        // Drain what the child wrote before it was killed.
        ios.run_for(std::chrono::seconds(1));
    }

    child.wait(ec);
    r.exit_code = child.exit_code();

    if (out.valid() && out.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        try {
            r.out = out.get();
        } catch (const std::exception& e) {
            if (r.error.empty()) r.error = std::string("reading output failed: ") + e.what();
        }
    }
    if (!r.timed_out && r.exit_code != 0 && r.error.empty()) {
        r.error = argv[0] + " exited with status " + std::to_string(r.exit_code);
    }
    return r;
}

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

std::vector<std::string> parse_or_empty(const std::string& cmd) {
    return cmd.empty() ? std::vector<std::string>() : split_command(cmd);
}

} // namespace

// ---------------------------------------------------------------------------
// Recon
// ---------------------------------------------------------------------------

CommandReconAdapter::CommandReconAdapter(std::string enumerate_cmd, std::string probe_cmd,
                                         std::chrono::seconds timeout, Logger& log)
    : enumerate_argv_(parse_or_empty(enumerate_cmd)),
      probe_argv_(parse_or_empty(probe_cmd)),
      timeout_(timeout),
      log_(log) {}

ReconResult CommandReconAdapter::enumerate(const std::string& domain) {
    ReconResult r;
    if (enumerate_argv_.empty()) {
        r.ok = true;
        r.hosts.push_back(domain);
        return r;
    }

    const auto out = run_command(expand_placeholders(enumerate_argv_, {{"target", domain}}), timeout_);
    if (!out.ok()) {
        r.error = out.error;
        return r;
    }

    std::set<std::string> seen;
    for (const auto& line : lines_of(out.out)) {
        auto host = sanitize_domain(line);
        if (!host) {
            log_.debug("RECON", "dropping invalid host line: " + line.substr(0, 120));
            continue;
        }
        if (seen.insert(*host).second) r.hosts.push_back(*host);
    }
    if (seen.insert(domain).second) r.hosts.insert(r.hosts.begin(), domain);

    r.ok = true;
    return r;
}

ReconResult CommandReconAdapter::probe(const std::vector<std::string>& hosts) {
    ReconResult r;
    r.ok = true;
    if (probe_argv_.empty()) {
        r.hosts = hosts;
        return r;
    }

    size_t failures = 0;
    for (const auto& host : hosts) {
        const auto out = run_command(expand_placeholders(probe_argv_, {{"target", host}}), timeout_);
        if (out.ok()) {
            r.hosts.push_back(host);
        } else if (!out.launched) {
            // Tool missing or broken: every host would fail the same way.
            r.ok = false;
            r.error = out.error;
            return r;
        } else {
            ++failures;
        }
    }
    log_.debug("RECON", std::to_string(r.hosts.size()) + " live, " +
                        std::to_string(failures) + " unreachable");
    return r;
}

// ---------------------------------------------------------------------------
// Crawl
// ---------------------------------------------------------------------------

CommandCrawlAdapter::CommandCrawlAdapter(std::string cmd, std::chrono::seconds timeout, Logger& log)
    : argv_(parse_or_empty(cmd)),
      timeout_(timeout),
      log_(log) {}

CrawlResult CommandCrawlAdapter::crawl(const std::string& seed) {
    CrawlResult r;
    if (argv_.empty()) {
        r.error = "no crawl command configured";
        return r;
    }

    const auto out = run_command(expand_placeholders(argv_, {{"target", seed}}), timeout_);
    if (!out.ok()) {
        r.error = out.error;
        return r;
    }
    for (const auto& line : lines_of(out.out)) {
        if (auto url = sanitize_url(line)) r.urls.push_back(*url);
    }
    log_.debug("CRAWL", seed + ": " + std::to_string(r.urls.size()) + " urls");
    r.ok = true;
    return r;
}

// ---------------------------------------------------------------------------
// Scan
// ---------------------------------------------------------------------------

CommandScanAdapter::CommandScanAdapter(std::string cmd, std::string template_id, Logger& log)
    : argv_(parse_or_empty(cmd)),
      template_id_(std::move(template_id)),
      log_(log)
{
    if (argv_.empty()) {
        throw ConfigError("scan command is empty");
    }
    kind_ = boost::filesystem::path(argv_[0]).filename().string();
}

std::vector<FindingRecord> CommandScanAdapter::parse_findings(const std::string& output,
                                                              const std::string& target,
                                                              const std::string& kind,
                                                              size_t* rejected) {
    std::vector<FindingRecord> findings;
    size_t bad = 0;

    for (const auto& line : lines_of(output)) {
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            ++bad;
            continue;
        }
        if (!j.contains("target")) j["target"] = target;
        try {
            FindingRecord f = finding_from_json(j);
            if (f.scanner_kind.empty()) f.scanner_kind = kind;
            findings.push_back(std::move(f));
        } catch (const std::invalid_argument&) {
            ++bad;
        }
    }
    if (rejected) *rejected = bad;
    return findings;
}

ScanResult CommandScanAdapter::run(const std::string& target, const ScanConstraints& constraints) {
    ScanResult r;

    const auto argv = expand_placeholders(argv_, {
        {"target", target},
        {"severity", constraints.severity},
        {"template", constraints.template_id.empty() ? template_id_ : constraints.template_id}
    });

    const auto out = run_command(argv, constraints.timeout);
    if (!out.ok()) {
        r.error = out.error;
        return r;
    }

    size_t rejected = 0;
    r.findings = parse_findings(out.out, target, kind_, &rejected);
    if (rejected > 0) {
        log_.warn("SCAN", target + ": skipped " + std::to_string(rejected) + " malformed output lines");
    }
    r.ok = true;
    return r;
}

} // namespace bountygate
