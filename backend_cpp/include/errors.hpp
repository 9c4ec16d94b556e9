#pragma once
#include <stdexcept>
#include <string>

namespace campus_rag {

// Index artifact missing on disk. Fatal at startup.
class IndexNotFound : public std::runtime_error {
public:
    explicit IndexNotFound(const std::string& what) : std::runtime_error(what) {}
};

// Index artifact present but unreadable or internally inconsistent. Fatal at startup.
class IndexCorrupt : public std::runtime_error {
public:
    explicit IndexCorrupt(const std::string& what) : std::runtime_error(what) {}
};

// An external model service (LLM, embedding, rerank) could not produce a result.
// Call sites recover locally with a fallback.
class ModelServiceUnavailable : public std::runtime_error {
public:
    explicit ModelServiceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Classifier output that does not contain a usable JSON plan. Recovered by the Router.
class RouterParseError : public std::runtime_error {
public:
    explicit RouterParseError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace campus_rag
