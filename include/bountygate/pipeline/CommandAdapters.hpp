#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "bountygate/pipeline/Collaborators.hpp"

namespace bountygate {

class Logger;

struct CommandOutput {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string out;
    std::string error;

    bool ok() const { return launched && !timed_out && exit_code == 0; }
};

// Splits an operator command line into argv. Single and double quotes group
// words; there is no shell expansion. Throws ConfigError on an unterminated
// quote.
std::vector<std::string> split_command(const std::string& cmd);

// Replaces {name} placeholders in every argument.
std::vector<std::string> expand_placeholders(const std::vector<std::string>& argv,
                                             const std::map<std::string, std::string>& vars);

// Spawns argv[0] (searched on PATH when it has no '/') without a shell,
// collects stdout, discards stderr, and terminates the child on timeout.
CommandOutput run_command(const std::vector<std::string>& argv, std::chrono::seconds timeout);

// ---------------------------------------------------------------------------
// Operator-configured external tools. Placeholders:
//   {target}    sanitised host name
//   {severity}  SCAN_SEVERITY       (scan only)
//   {template}  SCAN_TEMPLATE       (scan only)
//
// Output contracts:
//   enumerate : one host per line; invalid host names are dropped
//   probe     : exit status 0 means the host is live (one call per host)
//   crawl     : one URL per line; non-http(s) lines are dropped
//   scan      : JSON lines in the FindingRecord schema
// ---------------------------------------------------------------------------

// Empty commands degrade: enumerate returns the root domain, probe keeps
// every host.
class CommandReconAdapter : public ReconAdapter {
public:
    CommandReconAdapter(std::string enumerate_cmd, std::string probe_cmd,
                        std::chrono::seconds timeout, Logger& log);

    ReconResult enumerate(const std::string& domain) override;
    ReconResult probe(const std::vector<std::string>& hosts) override;

private:
    std::vector<std::string> enumerate_argv_;
    std::vector<std::string> probe_argv_;
    std::chrono::seconds timeout_;
    Logger& log_;
};

class CommandCrawlAdapter : public CrawlAdapter {
public:
    CommandCrawlAdapter(std::string cmd, std::chrono::seconds timeout, Logger& log);

    CrawlResult crawl(const std::string& seed) override;

private:
    std::vector<std::string> argv_;
    std::chrono::seconds timeout_;
    Logger& log_;
};

class CommandScanAdapter : public ScanAdapter {
public:
    // The scanner kind is the basename of the command's executable.
    CommandScanAdapter(std::string cmd, std::string template_id, Logger& log);

    std::string scanner_kind() const override { return kind_; }
    std::string template_id() const override { return template_id_; }
    ScanResult run(const std::string& target, const ScanConstraints& constraints) override;

    // Parses JSON-lines scanner output. Malformed lines are counted in
    // `*rejected` and skipped; missing target and scanner_kind are filled in.
    static std::vector<FindingRecord> parse_findings(const std::string& output,
                                                     const std::string& target,
                                                     const std::string& kind,
                                                     size_t* rejected);

private:
    std::vector<std::string> argv_;
    std::string kind_;
    std::string template_id_;
    Logger& log_;
};

} // namespace bountygate
