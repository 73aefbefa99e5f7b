#include "provider_chain.hpp"
#include "provider.hpp"
#include "utils.hpp"
#include <iostream>
#include <stdexcept>

namespace orga {

ProviderChain::ProviderChain(std::vector<NamedProvider> providers, FallbackConfig cfg)
    : providers_(std::move(providers)), config_(std::move(cfg)) {
    if (providers_.empty()) throw std::invalid_argument("ProviderChain needs at least one provider");
    last_active_ = providers_.front().first;
}

std::shared_ptr<InferenceProvider> ProviderChain::from_config(const Config& cfg) {
    std::vector<NamedProvider> providers;
    if (cfg.fallback.enabled) {
        for (auto& name : cfg.fallback.provider_order) {
            auto it = cfg.providers.find(name);
            if (it == cfg.providers.end()) {
                std::cerr << "[config] Warning: fallback provider '" << name << "' not found, skipping\n";
                continue;
            }
            providers.emplace_back(name, std::make_shared<HttpInferenceProvider>(it->second, name));
        }
    }

    if (providers.size() > 1) {
        return std::make_shared<ProviderChain>(std::move(providers), cfg.fallback);
    }
    if (providers.size() == 1) return providers.front().second;

    std::string name = cfg.provider.empty() ? "default" : cfg.provider;
    return std::make_shared<HttpInferenceProvider>(cfg.resolve_provider(), name);
}

int ProviderChain::cooldown_for(InferenceErrorKind kind) const {
    switch (kind) {
    case InferenceErrorKind::rate_limited:     return config_.rate_limit_cooldown;
    case InferenceErrorKind::unauthorized:     return config_.auth_cooldown;
    case InferenceErrorKind::transient:        return config_.transient_cooldown;
    case InferenceErrorKind::invalid_response: return config_.transient_cooldown;
    }
    return 30;
}

void ProviderChain::mark_cooldown(const std::string& name, InferenceErrorKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    cooldowns_[name] = ProviderCooldown{epoch_now() + cooldown_for(kind), kind};
}

bool ProviderChain::in_cooldown(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cooldowns_.find(name);
    if (it == cooldowns_.end()) return false;
    return epoch_now() < it->second.until;
}

std::string ProviderChain::active_provider_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_active_;
}

std::string ProviderChain::name() const {
    return "chain:" + active_provider_name();
}

InferenceResponse ProviderChain::complete(const Conversation& conversation,
                                          const InferenceOptions& options) {
    std::optional<InferenceError> last_error;

    for (auto& [name, provider] : providers_) {
        if (in_cooldown(name)) continue;

        try {
            auto resp = provider->complete(conversation, options);
            std::lock_guard<std::mutex> lock(mutex_);
            last_active_ = name;
            return resp;
        } catch (const InferenceError& e) {
            std::cerr << "[fallback] Provider '" << name << "' failed ("
                      << inference_error_name(e.kind()) << "): " << e.what() << ", trying next\n";
            mark_cooldown(name, e.kind());
            last_error = e;
        }
    }

    if (last_error) throw *last_error;
    throw InferenceError(InferenceErrorKind::transient, "All providers are cooling down");
}

} // namespace orga
