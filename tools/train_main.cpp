// ---------------------------------------------------------------------------
// bountygate_train - offline training of the triage model.
//
// Usage:
//   bountygate_train --data labeled_findings.json [--output models/triage_model.json]
//                    [--max-features N] [--iterations N]
// ---------------------------------------------------------------------------
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "bountygate/triage/ModelTrainer.hpp"

using namespace bountygate;

namespace {

void usage() {
    std::cerr << "Usage: bountygate_train --data <labeled.json> [--output <model.json>]\n"
              << "                        [--max-features N] [--iterations N]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string data_path;
    std::string output_path = "models/triage_model.json";
    TrainerOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        const bool has_value = i + 1 < argc;
        try {
            if (a == "--data" && has_value) {
                data_path = argv[++i];
            } else if (a == "--output" && has_value) {
                output_path = argv[++i];
            } else if (a == "--max-features" && has_value) {
                opts.max_features = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (a == "--iterations" && has_value) {
                opts.iterations = std::stoi(argv[++i]);
            } else {
                usage();
                return 2;
            }
        } catch (const std::logic_error&) {
            std::cerr << "[TRAIN] bad numeric value for " << a << "\n";
            return 2;
        }
    }
    if (data_path.empty() || opts.max_features == 0 || opts.iterations <= 0) {
        usage();
        return 2;
    }

    try {
        const auto examples = load_labeled_examples(data_path);
        std::cout << "[TRAIN] loaded " << examples.size() << " labeled findings\n";

        TrainingReport report;
        const TriageModel model = ModelTrainer(opts).train(examples, report);

        std::printf("[TRAIN] train=%zu test=%zu features=%zu\n",
                    report.train_size, report.test_size, report.features);
        std::printf("[TRAIN] train accuracy %.3f\n", report.train_accuracy);
        if (report.test_size > 0) {
            std::printf("[TRAIN] test accuracy  %.3f\n", report.test_accuracy);
        }

        const std::filesystem::path out(output_path);
        if (out.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(out.parent_path(), ec);
        }
        if (!model.save_file(output_path)) {
            std::cerr << "[TRAIN] cannot write model to " << output_path << "\n";
            return 1;
        }
        std::cout << "[TRAIN] model written to " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[TRAIN] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
