#include "graph/safety.hpp"
#include <spdlog/spdlog.h>
#include "text_utils.hpp"

namespace campus_rag {

namespace {

const char* const kCrisisPhrases[] = {"suicide", "kill myself", "self-harm", "end my life"};

} // namespace

SafetyResult SafetyGate::check(const std::string& question) const {
    const std::string lowered = to_lower(question);
    for (const char* phrase : kCrisisPhrases) {
        if (lowered.find(phrase) != std::string::npos) {
            spdlog::warn("Safety: escalation triggered");
            return {true, std::string("crisis")};
        }
    }
    return {};
}

std::string SafetyGate::escalation_message(const std::string& /*locale*/) const {
    return "I'm really sorry you're feeling this way. I'm not able to provide the help you deserve. "
           "If you are at risk / suicidal please immediately contact either the crisis liaison mental "
           "health team at the University Hospital Limerick (061 301111) or your local hospital, "
           "or your GP immediately.";
}

} // namespace campus_rag
