// Compute backend parsing, fallback order, and model-unavailable handling

#include "test_common.h"
#include "../src/models/backend_chain.h"
#include "../src/models/ncnn_embedder.h"

using namespace facesift;
using facesift::test::check;

static void testParse() {
    facesift::test::section("ComputeBackend::parse");

    auto cpu = ComputeBackend::parse("CPU");
    check(cpu && cpu->kind == ComputeBackend::Kind::CPU, "cpu (case-insensitive)");

    auto vk1 = ComputeBackend::parse("vulkan:1");
    check(vk1 && vk1->kind == ComputeBackend::Kind::VULKAN && vk1->device == 1, "vulkan:1");

    auto gpu = ComputeBackend::parse("gpu");
    check(gpu && *gpu == ComputeBackend::vulkan(0), "gpu is vulkan:0");

    check(!ComputeBackend::parse("cuda"), "unknown provider rejected");
    check(!ComputeBackend::parse("vulkan:"), "missing device index rejected");
    check(!ComputeBackend::parse("vulkan:-1"), "negative device index rejected");
    check(!ComputeBackend::parse("vulkan:\xB9"), "non-ASCII device index rejected");
    check(!ComputeBackend::parse("\xC3\x87PU"), "non-ASCII provider name rejected");
    check(ComputeBackend::vulkan(2).name() == "vulkan:2" && ComputeBackend::cpu().name() == "cpu", "names");

    auto list = parseBackendList({"vulkan:0", "bogus", "vulkan:0", "vulkan:1"});
    check(list.size() == 3, "duplicates and unknown entries dropped, cpu appended");
    check(list.size() == 3 && list[0] == ComputeBackend::vulkan(0) && list[1] == ComputeBackend::vulkan(1) &&
          list[2] == ComputeBackend::cpu(), "order preserved with cpu last");

    auto explicit_cpu = parseBackendList({"cpu", "vulkan:0"});
    check(explicit_cpu.size() == 2 && explicit_cpu[0] == ComputeBackend::cpu(), "explicit cpu position kept");
}

static void testChain() {
    facesift::test::section("BackendChain");

    BackendChain chain({ComputeBackend::vulkan(0), ComputeBackend::vulkan(1), ComputeBackend::cpu()});

    std::vector<std::string> tried;
    InitReport report = chain.run([&tried](const ComputeBackend& backend, std::string& error) {
        tried.push_back(backend.name());
        if (backend.kind == ComputeBackend::Kind::CPU) {
            return true;
        }
        if (backend.device == 0) {
            error = "no device";
            return false;
        }
        throw std::runtime_error("driver crashed");
    });

    check(report.ok() && *report.active == ComputeBackend::cpu(), "falls back to cpu");
    check(tried.size() == 3, "every backend tried in order");
    check(report.attempts.size() == 3 && !report.attempts[0].ok && report.attempts[0].error == "no device",
          "failure reason recorded");
    check(report.attempts.size() == 3 && report.attempts[1].error == "driver crashed", "exception recorded as failure");
    check(report.summary() == "vulkan:0 failed (no device), vulkan:1 failed (driver crashed), cpu ok", "summary text");

    int calls = 0;
    InitReport first = chain.run([&calls](const ComputeBackend&, std::string&) {
        calls++;
        return true;
    });
    check(first.ok() && calls == 1 && *first.active == ComputeBackend::vulkan(0), "stops at the first success");

    InitReport none = chain.run([](const ComputeBackend&, std::string& error) {
        error = "nope";
        return false;
    });
    check(!none.ok() && none.attempts.size() == 3, "exhausted chain reports failure");

    bool threw = false;
    try {
        BackendChain empty{std::vector<ComputeBackend>()};
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "empty chain rejected");
}

static void testModelUnavailable() {
    facesift::test::section("model unavailable");

    NcnnEmbedderOptions options;
    options.recognition_model = "/nonexistent/facesift/recognition";
    options.detection_model = "/nonexistent/facesift/detection";
    options.backends = {ComputeBackend::cpu()};

    NcnnEmbedder embedder(options);
    InitReport report = embedder.initialize();
    check(!report.ok() && !embedder.available(), "missing model files leave the embedder unavailable");
    check(report.attempts.size() == 1 && !report.attempts[0].error.empty(), "load failure reason recorded");

    Image frame(32, 32, 3);
    bool threw = false;
    try {
        embedder.embed(frame.view());
    } catch (const ModelUnavailableError&) {
        threw = true;
    }
    check(threw, "embed throws ModelUnavailableError");

    auto factory = ncnnEmbedderFactory(options);
    auto model = factory();
    check(model && !model->available(), "factory returns an unavailable model instead of throwing");
}

int main() {
    std::cout << "Backend chain tests" << std::endl;
    testParse();
    testChain();
    testModelUnavailable();
    return facesift::test::finish("test_backend_chain");
}
