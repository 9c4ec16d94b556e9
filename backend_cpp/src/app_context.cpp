#include "app_context.hpp"
#include <spdlog/spdlog.h>
#include "graph/router.hpp"
#include "graph/safety.hpp"

namespace campus_rag {

std::shared_ptr<const CorpusIndex> load_index_checked(const Settings& settings) {
    auto index = CorpusIndex::load(settings.index_path);
    if (!index->embed_model().empty() && index->embed_model() != settings.embed_model) {
        spdlog::warn("Index was embedded with '{}' but EMBED_MODEL is '{}'; dense scores may be meaningless",
                     index->embed_model(), settings.embed_model);
    }
    return index;
}

AppContext build_app_context(const Settings& settings) {
    AppContext ctx;
    ctx.settings = settings;

    ctx.key_manager = std::make_shared<KeyManager>(settings.keys_path);
    ctx.llm = make_llm_client(ctx.key_manager, settings.llm_base_url, settings.gen_model, settings.request_timeout_ms);
    if (ctx.llm) {
        spdlog::info("LLM client ready: {} ({} keys)", ctx.llm->model_name(), ctx.key_manager->get_active_key_count());
    } else {
        spdlog::warn("No API key configured; router and generator will use their fallbacks.");
    }

    ctx.embedder = std::make_shared<HttpEmbeddingService>(settings.embed_url, settings.embed_model,
                                                          settings.request_timeout_ms, settings.embedding_cache_size);
    ctx.cross_encoder = std::make_shared<HttpCrossEncoder>(settings.rerank_url, settings.rerank_model,
                                                           settings.request_timeout_ms);

    RetrieverConfig retriever_config;
    retriever_config.rrf_k = settings.rrf_k;
    retriever_config.candidate_multiplier = settings.candidate_multiplier;
    retriever_config.domain_bias = settings.domain_bias;
    ctx.retriever = std::make_shared<Retriever>(load_index_checked(settings), ctx.embedder,
                                                ctx.cross_encoder, retriever_config);

    RouterConfig router_config;
    router_config.default_max_chunks = settings.default_max_chunks;
    router_config.max_chunks_cap = settings.max_chunks_cap;
    router_config.staff_directory_domain = settings.staff_directory_domain;
    router_config.main_site_domain = settings.main_site_domain;

    ctx.pipeline = std::make_shared<Pipeline>(std::make_shared<SafetyGate>(),
                                              std::make_shared<Router>(ctx.llm, router_config),
                                              ctx.retriever,
                                              std::make_shared<Generator>(ctx.llm));
    return ctx;
}

} // namespace campus_rag
