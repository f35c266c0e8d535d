#include "backend_chain.h"
#include "../logger.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace facesift {

std::optional<ComputeBackend> ComputeBackend::parse(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "cpu") {
        return ComputeBackend::cpu();
    }
    if (lower == "gpu" || lower == "vulkan") {
        return ComputeBackend::vulkan(0);
    }

    const std::string prefix = "vulkan:";
    if (lower.compare(0, prefix.size(), prefix) == 0 && lower.size() > prefix.size()) {
        std::string index = lower.substr(prefix.size());
        bool digits = std::all_of(index.begin(), index.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!digits || index.size() > 3) {
            return std::nullopt;
        }
        return ComputeBackend::vulkan(std::stoi(index));
    }

    return std::nullopt;
}

std::string ComputeBackend::name() const {
    if (kind == Kind::VULKAN) {
        return "vulkan:" + std::to_string(device);
    }
    return "cpu";
}

std::vector<ComputeBackend> parseBackendList(const std::vector<std::string>& names) {
    std::vector<ComputeBackend> backends;
    for (const auto& name : names) {
        auto backend = ComputeBackend::parse(name);
        if (!backend) {
            Logger::getInstance().warning("Ignoring unknown compute backend: " + name);
            continue;
        }
        if (std::find(backends.begin(), backends.end(), *backend) == backends.end()) {
            backends.push_back(*backend);
        }
    }

    if (std::find(backends.begin(), backends.end(), ComputeBackend::cpu()) == backends.end()) {
        backends.push_back(ComputeBackend::cpu());
    }
    return backends;
}

std::string InitReport::summary() const {
    std::string text;
    for (const auto& attempt : attempts) {
        if (!text.empty()) {
            text += ", ";
        }
        text += attempt.backend;
        if (attempt.ok) {
            text += " ok";
        } else {
            text += " failed";
            if (!attempt.error.empty()) {
                text += " (" + attempt.error + ")";
            }
        }
    }
    return text.empty() ? "no backends tried" : text;
}

BackendChain::BackendChain(std::vector<ComputeBackend> backends)
    : backends_(std::move(backends)) {
    if (backends_.empty()) {
        throw std::invalid_argument("BackendChain needs at least one backend");
    }
}

InitReport BackendChain::run(const Loader& loader) const {
    InitReport report;

    for (const auto& backend : backends_) {
        BackendAttempt attempt;
        attempt.backend = backend.name();

        try {
            attempt.ok = loader(backend, attempt.error);
        } catch (const std::exception& e) {
            attempt.ok = false;
            attempt.error = e.what();
        }

        report.attempts.push_back(attempt);

        if (attempt.ok) {
            Logger::getInstance().info("Compute backend " + attempt.backend + " initialized");
            report.active = backend;
            break;
        }
        Logger::getInstance().warning("Compute backend " + attempt.backend + " failed: " +
            (attempt.error.empty() ? std::string("unknown error") : attempt.error));
    }

    if (!report.ok()) {
        Logger::getInstance().error("No compute backend available: " + report.summary());
    }
    return report;
}

} // namespace facesift
