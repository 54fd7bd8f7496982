#include <docsync-cpp/log.hpp>

#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace docsync_cpp {

namespace {

struct VerboseConfig {
    std::mutex mutex;
    std::atomic<std::uint64_t> generation{1};
    bool loaded = false;
    std::optional<bool> all;
    std::map<std::string, bool, std::less<>> flags;

    // Requires mutex held.
    void load_environment() {
        all.reset();
        flags.clear();
        loaded = true;

        const char* env = std::getenv("DOCSYNC_VERBOSE_LOGGING");
        if (!env) return;

        auto list = std::string_view{env};
        auto pos = std::size_t{0};
        while (pos <= list.size()) {
            auto next = list.find(',', pos);
            auto name = list.substr(pos, next - pos);
            if (name == "all") {
                all = true;
            } else if (!name.empty()) {
                flags.insert_or_assign(std::string{name}, true);
            }
            if (next == std::string_view::npos) break;
            pos = next + 1;
        }
    }

    // Requires mutex held.
    auto lookup(std::string_view name) -> bool {
        if (!loaded) load_environment();
        if (auto it = flags.find(name); it != flags.end()) return it->second;
        return all.value_or(false);
    }
};

auto config() -> VerboseConfig& {
    static auto instance = VerboseConfig{};
    return instance;
}

}  // anonymous namespace

auto VerboseFlag::enabled() const -> bool {
    auto& cfg = config();
    const auto generation = cfg.generation.load(std::memory_order_acquire);
    const auto cached = cached_.load(std::memory_order_relaxed);
    if ((cached >> 1) == generation) return (cached & 1) != 0;

    auto lock = std::scoped_lock{cfg.mutex};
    const auto value = cfg.lookup(name_);
    cached_.store((generation << 1) | (value ? 1u : 0u), std::memory_order_relaxed);
    return value;
}

void set_verbose_logging(std::string_view name, bool enabled) {
    auto& cfg = config();
    auto lock = std::scoped_lock{cfg.mutex};
    if (!cfg.loaded) cfg.load_environment();
    if (name == "all") {
        cfg.all = enabled;
        cfg.flags.clear();
    } else {
        cfg.flags.insert_or_assign(std::string{name}, enabled);
    }
    cfg.generation.fetch_add(1, std::memory_order_acq_rel);
}

void reset_verbose_logging() {
    auto& cfg = config();
    auto lock = std::scoped_lock{cfg.mutex};
    cfg.load_environment();
    cfg.generation.fetch_add(1, std::memory_order_acq_rel);
}

}  // namespace docsync_cpp
