#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "bountygate/infra/Logger.hpp"

namespace bountygate {

// Fatal at startup. Raised before any external side effect.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// .env loader: KEY=VALUE per line, '#' comments, optional "export " prefix,
// single or double quotes stripped. Variables already present in the
// environment are never overwritten. Returns false when the file is absent.
// ---------------------------------------------------------------------------
bool load_dotenv(const std::string& path);

struct Config {
    // Advisory service
    bool advisory_enabled = true;
    std::string gemini_api_key;
    std::string gemini_model = "gemini-1.5-flash";
    std::string gemini_endpoint = "https://generativelanguage.googleapis.com/v1beta";

    // Rate limits
    int scan_rate = 5;            // requests per minute
    int max_concurrency = 4;
    int timeout_sec = 20;
    int run_timeout_sec = 0;      // 0 = no run-level deadline

    // Policy controls
    bool allow_manual_unblock = false;
    bool store_llm_responses = true;
    std::string rule_manifest_path;

    // Logging
    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Json;
    std::string log_dir = "./logs";

    // Output and persistence
    std::string output_dir = "./outputs";
    std::string db_path = "./db/scanner.db";

    // Triage
    double ml_weight = 0.4;
    double llm_weight = 0.6;
    std::string model_path = "models/triage_model.json";
    double min_report_score = 0.5;

    // Pipeline
    int crawl_seed_limit = 5;
    std::string scan_severity = "low,medium";
    std::string scan_template = "http-missing-security-headers";
    std::string recon_cmd;
    std::string probe_cmd;
    std::string crawl_cmd;
    std::string scan_cmd;

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Builds a validated configuration from an arbitrary key lookup.
    // Throws ConfigError on malformed or out-of-range values.
    static Config from_lookup(const Lookup& lookup);

    // from_lookup() over the process environment.
    static Config from_env();

    // Non-fatal observations (e.g. weights not summing to 1.0).
    void report_warnings(Logger& log) const;
};

} // namespace bountygate
