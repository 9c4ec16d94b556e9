#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "app_context.hpp"
#include "infer_format.hpp"
#include "logging.hpp"
#include "text_utils.hpp"

namespace {

struct InferOptions {
    std::string question;
    campus_rag::ChatMode mode = campus_rag::ChatMode::kStudent;
    std::string locale = "IE";
    std::optional<std::string> config_path;
    campus_rag::InferDisplay display;
};

void print_usage() {
    std::cout << "Usage: campus_rag_infer [--mode student|staff] [--locale IE] [--config settings.json]\n"
                 "                        [--no-citations] [--show-plan] [--show-meta] [--question] \"question\"\n";
}

} // namespace

int main(int argc, char* argv[]) {
    InferOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            auto parsed = campus_rag::chat_mode_from_string(argv[++i]);
            if (!parsed) {
                print_usage();
                return EXIT_FAILURE;
            }
            options.mode = *parsed;
        } else if (arg == "--locale" && i + 1 < argc) {
            options.locale = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--question" && i + 1 < argc) {
            options.question = argv[++i];
        } else if (arg == "--no-citations") {
            options.display.citations = false;
        } else if (arg == "--show-plan") {
            options.display.plan = true;
        } else if (arg == "--show-meta") {
            options.display.meta = true;
        } else if (!arg.empty() && arg[0] != '-' && options.question.empty()) {
            options.question = arg;
        } else {
            print_usage();
            return arg == "--help" ? EXIT_SUCCESS : EXIT_FAILURE;
        }
    }

    options.question = campus_rag::trim(options.question);
    if (options.question.empty()) {
        print_usage();
        return EXIT_FAILURE;
    }

    try {
        auto settings = campus_rag::load_settings(options.config_path);
        campus_rag::init_logging(settings);
        auto ctx = campus_rag::build_app_context(settings);

        const auto result = ctx.pipeline->run(options.question, options.mode, options.locale);
        std::cout << campus_rag::format_inference(result, options.display) << std::flush;
    } catch (const std::exception& e) {
        spdlog::critical("Inference failed: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
