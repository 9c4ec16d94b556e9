#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "embedding_service.hpp"
#include "ingest/index_builder.hpp"
#include "logging.hpp"
#include "settings.hpp"

namespace {

void print_usage() {
    std::cout << "Usage: campus_rag_build_index [--input corpus.jsonl] [--md-dir dir] [--pdf-dir dir] "
                 "[--index-path dir] [--config settings.json]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string input = "data/ul/ul_data.jsonl";
    std::string md_dir = "data/ul/md";
    std::string pdf_dir = "data/ul/pdf";
    std::optional<std::string> index_path;
    std::optional<std::string> config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            input = argv[++i];
        } else if (arg == "--md-dir" && i + 1 < argc) {
            md_dir = argv[++i];
        } else if (arg == "--pdf-dir" && i + 1 < argc) {
            pdf_dir = argv[++i];
        } else if (arg == "--index-path" && i + 1 < argc) {
            index_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            print_usage();
            return arg == "--help" ? EXIT_SUCCESS : EXIT_FAILURE;
        }
    }

    try {
        auto settings = campus_rag::load_settings(config_path);
        if (index_path) settings.index_path = *index_path;
        campus_rag::init_logging(settings);

        auto web_docs = campus_rag::IndexBuilder::load_jsonl(input);
        auto md_docs = campus_rag::IndexBuilder::load_markdown_dir(md_dir);
        auto pdf_docs = campus_rag::IndexBuilder::load_pdf_dir(pdf_dir);

        std::vector<campus_rag::SourceDocument> docs;
        docs.reserve(web_docs.size() + md_docs.size() + pdf_docs.size());
        for (auto* part : {&web_docs, &md_docs, &pdf_docs}) {
            docs.insert(docs.end(), std::make_move_iterator(part->begin()), std::make_move_iterator(part->end()));
        }

        auto embedder = std::make_shared<campus_rag::HttpEmbeddingService>(
            settings.embed_url, settings.embed_model, settings.request_timeout_ms, 0);
        campus_rag::IndexBuilder builder(embedder);

        campus_rag::BuildStats stats;
        auto index = builder.build(docs, &stats);
        index->save(settings.index_path);

        spdlog::info("Index stats: {} chunks, {} source docs (web={}, md={}, pdf={}), {} duplicates dropped",
                     stats.chunks, stats.documents, web_docs.size(), md_docs.size(), pdf_docs.size(),
                     stats.duplicates);
    } catch (const std::exception& e) {
        spdlog::critical("Index build failed: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
