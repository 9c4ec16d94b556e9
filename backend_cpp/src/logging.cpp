#include "logging.hpp"
#include "text_utils.hpp"
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace campus_rag {

namespace fs = std::filesystem;

void init_logging(const Settings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    try {
        fs::create_directories(settings.log_dir);
        auto log_file = (fs::path(settings.log_dir) / "campus_rag.log").string();
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    } catch (const std::exception& e) {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("campus_rag", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(to_lower(settings.log_level)));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled ({}), console only", file_error);
    }
}

} // namespace campus_rag
