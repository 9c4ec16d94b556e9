#include "infer_format.hpp"
#include <sstream>

namespace campus_rag {

namespace {

std::string pretty(const nlohmann::json& value) {
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

std::string format_inference(const PipelineResult& result, const InferDisplay& display) {
    std::ostringstream out;
    out << "=== ANSWER ===\n" << (result.answer.empty() ? "(no answer)" : result.answer) << "\n\n";

    if (display.citations) {
        out << "=== CITATIONS ===\n";
        if (result.citations.empty()) out << "(no citations)\n";
        for (const auto& c : result.citations) {
            out << "[" << c.n << "] " << c.source << "\n";
        }
        out << "\n";
    }

    if (display.plan) {
        out << "=== ROUTER PLAN ===\n";
        out << (result.plan ? pretty(result.plan->to_json()) : "(no plan or router disabled)") << "\n\n";
    }

    if (display.meta) {
        out << "=== META ===\n" << pretty(result.meta) << "\n\n";
    }
    return out.str();
}

} // namespace campus_rag
