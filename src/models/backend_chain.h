#ifndef FACESIFT_BACKEND_CHAIN_H
#define FACESIFT_BACKEND_CHAIN_H

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace facesift {

// Where ncnn runs a network
struct ComputeBackend {
    enum class Kind {
        CPU,
        VULKAN
    };

    Kind kind = Kind::CPU;
    int device = 0;  // Vulkan device index

    static ComputeBackend cpu() { return ComputeBackend{}; }
    static ComputeBackend vulkan(int device) { return ComputeBackend{Kind::VULKAN, device}; }

    // "cpu", "vulkan", "vulkan:N" or "gpu" (= vulkan:0), case-insensitive
    static std::optional<ComputeBackend> parse(const std::string& text);

    std::string name() const;

    bool operator==(const ComputeBackend& other) const {
        return kind == other.kind && (kind == Kind::CPU || device == other.device);
    }
};

// Parses a provider list; unknown entries are dropped with a warning and
// "cpu" is appended as the last resort when missing.
std::vector<ComputeBackend> parseBackendList(const std::vector<std::string>& names);

struct BackendAttempt {
    std::string backend;
    bool ok = false;
    std::string error;
};

// Outcome of trying the backends in order
struct InitReport {
    std::vector<BackendAttempt> attempts;
    std::optional<ComputeBackend> active;

    bool ok() const { return active.has_value(); }

    // "vulkan:0 failed (no device), cpu ok"
    std::string summary() const;
};

// Ordered fallback over compute backends. The loader returns false (with a
// reason) or throws to move on to the next backend.
class BackendChain {
public:
    using Loader = std::function<bool(const ComputeBackend& backend, std::string& error)>;

    explicit BackendChain(std::vector<ComputeBackend> backends);

    InitReport run(const Loader& loader) const;

    const std::vector<ComputeBackend>& backends() const { return backends_; }

private:
    std::vector<ComputeBackend> backends_;
};

} // namespace facesift

#endif // FACESIFT_BACKEND_CHAIN_H
