#pragma once
#include <string>
#include "graph/pipeline.hpp"

namespace campus_rag {

struct InferDisplay {
    bool citations = true;
    bool plan = false;
    bool meta = false;
};

// Plain-text report of one pipeline answer: an ANSWER section, then the
// CITATIONS, ROUTER PLAN and META sections the display asks for.
std::string format_inference(const PipelineResult& result, const InferDisplay& display);

} // namespace campus_rag
