#include "bountygate/infra/Config.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace bountygate {

bool load_dotenv(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;
        line = line.substr(first);

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key.compare(0, 7, "export ") == 0) {
            key = key.substr(7);
        }
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();
        if (key.empty()) continue;

        size_t vs = value.find_first_not_of(" \t");
        value = (vs == std::string::npos) ? std::string() : value.substr(vs);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q) {
                value = value.substr(1, value.size() - 2);
            }
        }

        // Environment takes precedence.
        if (!std::getenv(key.c_str())) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
    return true;
}

namespace {

class Reader {
public:
    explicit Reader(const Config::Lookup& lookup) : lookup_(lookup) {}

    std::string str(const std::string& key, const std::string& def) const {
        auto v = lookup_(key);
        return (v && !v->empty()) ? *v : def;
    }

    bool flag(const std::string& key, bool def) const {
        auto v = lookup_(key);
        if (!v || v->empty()) return def;
        std::string s;
        for (char c : *v) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
        throw ConfigError(key + " must be true or false, got '" + *v + "'");
    }

    int integer(const std::string& key, int def) const {
        auto v = lookup_(key);
        if (!v || v->empty()) return def;
        try {
            size_t pos = 0;
            int out = std::stoi(*v, &pos);
            if (pos != v->size()) throw std::invalid_argument(*v);
            return out;
        } catch (const std::exception&) {
            throw ConfigError(key + " must be an integer, got '" + *v + "'");
        }
    }

    double real(const std::string& key, double def) const {
        auto v = lookup_(key);
        if (!v || v->empty()) return def;
        try {
            size_t pos = 0;
            double out = std::stod(*v, &pos);
            if (pos != v->size() || !std::isfinite(out)) throw std::invalid_argument(*v);
            return out;
        } catch (const std::exception&) {
            throw ConfigError(key + " must be a number, got '" + *v + "'");
        }
    }

private:
    const Config::Lookup& lookup_;
};

void require_range(const std::string& key, double v, double lo, double hi) {
    if (v < lo || v > hi) {
        std::ostringstream os;
        os << key << " out of range [" << lo << ", " << hi << "]: " << v;
        throw ConfigError(os.str());
    }
}

} // namespace

Config Config::from_lookup(const Lookup& lookup) {
    Reader r(lookup);
    Config c;

    c.advisory_enabled = r.flag("ADVISORY_ENABLED", c.advisory_enabled);
    c.gemini_api_key   = r.str("GEMINI_API_KEY", "");
    c.gemini_model     = r.str("GEMINI_MODEL", c.gemini_model);
    c.gemini_endpoint  = r.str("GEMINI_ENDPOINT", c.gemini_endpoint);

    c.scan_rate       = r.integer("SCAN_RATE", c.scan_rate);
    c.max_concurrency = r.integer("MAX_CONCURRENCY", c.max_concurrency);
    c.timeout_sec     = r.integer("TIMEOUT", c.timeout_sec);
    c.run_timeout_sec = r.integer("RUN_TIMEOUT", c.run_timeout_sec);

    c.allow_manual_unblock = r.flag("ALLOW_MANUAL_UNBLOCK", c.allow_manual_unblock);
    c.store_llm_responses  = r.flag("STORE_LLM_RESPONSES", c.store_llm_responses);
    c.rule_manifest_path   = r.str("RULE_MANIFEST", "");

    std::string level = r.str("LOG_LEVEL", "INFO");
    auto parsed_level = log_level_from_string(level);
    if (!parsed_level) throw ConfigError("LOG_LEVEL must be DEBUG, INFO, WARNING or ERROR, got '" + level + "'");
    c.log_level = *parsed_level;

    std::string format = r.str("LOG_FORMAT", "json");
    if (format == "json") c.log_format = LogFormat::Json;
    else if (format == "text") c.log_format = LogFormat::Text;
    else throw ConfigError("LOG_FORMAT must be json or text, got '" + format + "'");
    c.log_dir = r.str("LOG_DIR", c.log_dir);

    c.output_dir = r.str("OUTPUT_DIR", c.output_dir);
    c.db_path    = r.str("DB_PATH", c.db_path);

    c.ml_weight        = r.real("ML_WEIGHT", c.ml_weight);
    c.llm_weight       = r.real("LLM_WEIGHT", c.llm_weight);
    c.model_path       = r.str("MODEL_PATH", c.model_path);
    c.min_report_score = r.real("MIN_REPORT_SCORE", c.min_report_score);

    c.crawl_seed_limit = r.integer("CRAWL_SEED_LIMIT", c.crawl_seed_limit);
    c.scan_severity    = r.str("SCAN_SEVERITY", c.scan_severity);
    c.scan_template    = r.str("SCAN_TEMPLATE", c.scan_template);
    c.recon_cmd        = r.str("RECON_CMD", "");
    c.probe_cmd        = r.str("PROBE_CMD", "");
    c.crawl_cmd        = r.str("CRAWL_CMD", "");
    c.scan_cmd         = r.str("SCAN_CMD", "");

    // Conservative ceilings: aggressive settings are refused, not clamped.
    if (c.scan_rate > 100) throw ConfigError("SCAN_RATE too high (max 100 req/min for safety)");
    if (c.max_concurrency > 20) throw ConfigError("MAX_CONCURRENCY too high (max 20 for safety)");
    require_range("SCAN_RATE", c.scan_rate, 1, 100);
    require_range("MAX_CONCURRENCY", c.max_concurrency, 1, 20);
    require_range("TIMEOUT", c.timeout_sec, 1, 3600);
    require_range("RUN_TIMEOUT", c.run_timeout_sec, 0, 7 * 24 * 3600);
    require_range("ML_WEIGHT", c.ml_weight, 0.0, 1.0);
    require_range("LLM_WEIGHT", c.llm_weight, 0.0, 1.0);
    require_range("MIN_REPORT_SCORE", c.min_report_score, 0.0, 1.0);
    require_range("CRAWL_SEED_LIMIT", c.crawl_seed_limit, 0, 1000);

    if (c.advisory_enabled && c.gemini_api_key.empty()) {
        throw ConfigError("GEMINI_API_KEY not set (set ADVISORY_ENABLED=false to run without the advisory service)");
    }
    return c;
}

Config Config::from_env() {
    return from_lookup([](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    });
}

void Config::report_warnings(Logger& log) const {
    if (std::fabs(ml_weight + llm_weight - 1.0) > 1e-9) {
        std::ostringstream os;
        os << "ML_WEIGHT + LLM_WEIGHT = " << (ml_weight + llm_weight) << " (expected 1.0)";
        log.warn("CONFIG", os.str());
    }
    if (!advisory_enabled) {
        log.warn("CONFIG", "advisory service disabled; ambiguous scope resolves to UNKNOWN "
                           "and validation-flagged scans are skipped");
    }
}

} // namespace bountygate
