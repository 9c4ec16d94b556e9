#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "app_context.hpp"
#include "logging.hpp"
#include "session/chat_session.hpp"
#include "text_utils.hpp"

namespace {

void print_usage() {
    std::cout << "Usage: campus_rag_chat [--mode student|staff] [--locale IE] [--config settings.json]\n";
}

void print_turn(const campus_rag::ChatTurn& turn) {
    std::cout << "\nAssistant: " << turn.content << "\n";
    if (!turn.citations.empty()) {
        std::cout << "\nSources:\n";
        for (const auto& c : turn.citations) {
            std::cout << "  [" << c.n << "] " << c.source << "\n";
        }
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    campus_rag::ChatMode mode = campus_rag::ChatMode::kStudent;
    std::string locale = "IE";
    std::optional<std::string> config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            auto parsed = campus_rag::chat_mode_from_string(argv[++i]);
            if (!parsed) {
                print_usage();
                return EXIT_FAILURE;
            }
            mode = *parsed;
        } else if (arg == "--locale" && i + 1 < argc) {
            locale = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            print_usage();
            return arg == "--help" ? EXIT_SUCCESS : EXIT_FAILURE;
        }
    }

    try {
        auto settings = campus_rag::load_settings(config_path);
        campus_rag::init_logging(settings);
        auto ctx = campus_rag::build_app_context(settings);
        campus_rag::ChatSession session(ctx.pipeline, mode, locale, "cli");

        std::cout << "University of Limerick assistant (" << campus_rag::to_string(mode)
                  << " mode). Type 'quit' or 'exit' to leave.\n";

        std::string line;
        while (true) {
            std::cout << "You: " << std::flush;
            if (!std::getline(std::cin, line)) break;
            const std::string input = campus_rag::trim(line);
            if (input.empty()) continue;
            const std::string command = campus_rag::to_lower(input);
            if (command == "quit" || command == "exit") break;

            try {
                print_turn(session.ask(input));
            } catch (const std::exception& e) {
                spdlog::error("Chat turn failed: {}", e.what());
                std::cout << "\nAssistant: Something went wrong while answering. Please try again.\n\n";
            }
        }
    } catch (const std::exception& e) {
        spdlog::critical("campus_rag_chat failed to start: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
