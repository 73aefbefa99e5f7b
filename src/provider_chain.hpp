#pragma once
#include "config.hpp"
#include "inference.hpp"
#include <vector>
#include <map>
#include <mutex>
#include <string>
#include <memory>

namespace orga {

struct ProviderCooldown {
    int64_t until = 0;  // epoch seconds
    InferenceErrorKind reason = InferenceErrorKind::transient;
};

// Tries providers in order, skipping those cooling down after a failure.
class ProviderChain : public InferenceProvider {
public:
    using NamedProvider = std::pair<std::string, std::shared_ptr<InferenceProvider>>;

    ProviderChain(std::vector<NamedProvider> providers, FallbackConfig cfg);

    // A single HTTP provider, or a chain when fallback is enabled.
    static std::shared_ptr<InferenceProvider> from_config(const Config& cfg);

    InferenceResponse complete(const Conversation& conversation,
                               const InferenceOptions& options) override;

    std::string name() const override;
    std::string active_provider_name() const;
    size_t provider_count() const { return providers_.size(); }
    bool in_cooldown(const std::string& name) const;

private:
    std::vector<NamedProvider> providers_;
    FallbackConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, ProviderCooldown> cooldowns_;
    std::string last_active_;

    int cooldown_for(InferenceErrorKind kind) const;
    void mark_cooldown(const std::string& name, InferenceErrorKind kind);
};

} // namespace orga
