#include "trace/tracer.hpp"

#include "common/logger.hpp"
#include "config/scope.hpp"

#include <format>
#include <utility>

namespace cfgstore::trace {

namespace {

bool has_prefix(const std::string& name, const std::string& prefix) {
    return name.compare(0, prefix.size(), prefix) == 0;
}

std::string format_list(const std::vector<Descriptor>& descs) {
    std::string out = "[";
    for (std::size_t i = 0; i < descs.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += descs[i].to_string();
    }
    out += "]";
    return out;
}

std::string format_value(const nlohmann::json& value) {
    if (value.is_discarded()) {
        return "<empty>";
    }
    return value.dump();
}

// ── TracedStore ──────────────────────────────────────────────────────────────

class TracedStore final : public Store {
public:
    TracedStore(std::string name, std::unique_ptr<Store> store,
                std::shared_ptr<spdlog::logger> logger, bool log_responses)
        : name_(std::move(name)),
          store_(std::move(store)),
          logger_(std::move(logger)),
          log_responses_(log_responses) {}

    std::vector<Descriptor> list() const override {
        logger_->info("config store {}: List()", name_);
        std::vector<Descriptor> descs;
        try {
            descs = store_->list();
        } catch (const std::exception& e) {
            logger_->info("config store {}: List() error: {}", name_, e.what());
            throw;
        }
        if (log_responses_) {
            logger_->info("config store {}: List() -> {}", name_, format_list(descs));
        }
        return descs;
    }

    void marshal(const Descriptor& desc, const nlohmann::json& value) override {
        const auto d = desc.to_string();
        logger_->info("config store {}: Marshal({})", name_, d);
        if (log_responses_) {
            logger_->info("config store {}: Marshal({}) value={}", name_, d, format_value(value));
        }
        try {
            store_->marshal(desc, value);
        } catch (const std::exception& e) {
            logger_->info("config store {}: Marshal({}) error: {}", name_, d, e.what());
            throw;
        }
    }

    Descriptor unmarshal(const Descriptor& desc, nlohmann::json& value) const override {
        const auto d = desc.to_string();
        logger_->info("config store {}: Unmarshal({})", name_, d);
        Descriptor found;
        try {
            found = store_->unmarshal(desc, value);
        } catch (const std::exception& e) {
            logger_->info("config store {}: Unmarshal({}) error: {}", name_, d, e.what());
            throw;
        }
        if (log_responses_) {
            logger_->info("config store {}: Unmarshal({}) -> {}", name_, d, format_value(value));
        }
        return found;
    }

    void del(const Descriptor& desc) override {
        const auto d = desc.to_string();
        logger_->info("config store {}: Delete({})", name_, d);
        try {
            store_->del(desc);
        } catch (const std::exception& e) {
            logger_->info("config store {}: Delete({}) error: {}", name_, d, e.what());
            throw;
        }
    }

private:
    const std::string name_;
    std::unique_ptr<Store> store_;
    std::shared_ptr<spdlog::logger> logger_;
    const bool log_responses_;
};

} // anonymous namespace

// ── Tracer ───────────────────────────────────────────────────────────────────

Tracer::Tracer(TraceOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)),
      logger_(logger_or_default(std::move(logger))) {}

bool Tracer::enabled_for(const std::string& name) const {
    if (!options_.enabled && !options_.log_responses) {
        return false;
    }
    for (const auto& prefix : options_.exclude) {
        if (has_prefix(name, prefix)) {
            return false;
        }
    }
    if (options_.include.empty()) {
        return true;
    }
    for (const auto& prefix : options_.include) {
        if (has_prefix(name, prefix)) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<Store> Tracer::wrap_store(const std::string& name,
                                          std::unique_ptr<Store> store) const {
    if (!store || !enabled_for(name)) {
        return store;
    }
    return std::make_unique<TracedStore>(name, std::move(store), logger_,
                                         options_.log_responses);
}

Opener Tracer::wrap_opener(Opener opener) const {
    if (!opener) {
        return opener;
    }
    // Copy the tracer so the opener outlives it.
    return [tracer = *this, opener = std::move(opener)](
               const std::string& app, const std::vector<std::string>& namespaces) {
        auto store = opener(app, namespaces);
        return tracer.wrap_store(store_scope(app, namespaces), std::move(store));
    };
}

} // namespace cfgstore::trace
