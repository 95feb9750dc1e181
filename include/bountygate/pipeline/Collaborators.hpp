#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "bountygate/core/Types.hpp"

namespace bountygate {

// ---------------------------------------------------------------------------
// External tool boundary. Adapters return result values and never throw;
// the orchestrator isolates a failing call to its host or sub-step.
// ---------------------------------------------------------------------------

struct ReconResult {
    bool ok = false;
    std::vector<std::string> hosts;
    std::string error;
};

struct CrawlResult {
    bool ok = false;
    std::vector<std::string> urls;
    std::string error;
};

struct ScanConstraints {
    std::string severity;
    std::string template_id;
    std::chrono::seconds timeout{20};
};

struct ScanResult {
    bool ok = false;
    std::vector<FindingRecord> findings;
    std::string error;
};

class ReconAdapter {
public:
    virtual ~ReconAdapter() = default;

    // Passive subdomain enumeration for a root domain.
    virtual ReconResult enumerate(const std::string& domain) = 0;
    // Keeps the hosts that answer.
    virtual ReconResult probe(const std::vector<std::string>& hosts) = 0;
};

class CrawlAdapter {
public:
    virtual ~CrawlAdapter() = default;

    virtual CrawlResult crawl(const std::string& seed) = 0;
};

class ScanAdapter {
public:
    virtual ~ScanAdapter() = default;

    virtual std::string scanner_kind() const = 0;
    virtual std::string template_id() const = 0;
    virtual ScanResult run(const std::string& target, const ScanConstraints& constraints) = 0;
};

class Reporter {
public:
    virtual ~Reporter() = default;

    // Returns the report location, or nullopt when publishing failed.
    virtual std::optional<std::string> publish(const std::string& run_id,
                                               const std::string& target,
                                               const std::vector<FindingRecord>& findings) = 0;
};

} // namespace bountygate
