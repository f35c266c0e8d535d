// Face service (detect-or-identify) and directory enrollment checks

#include "test_common.h"
#include "../src/enrollment.h"
#include "../src/face_service.h"
#include "../src/image_decoder.h"
#include <cstdio>
#include <fstream>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>

using namespace facesift;
using facesift::test::axis;
using facesift::test::check;
using facesift::test::FakeDetector;
using facesift::test::FakeEmbeddingModel;

namespace {

constexpr size_t DIM = 8;

// Returns two faces per image: a small distractor and a large face whose
// embedding is chosen by the image's first blue value
class ColorKeyedModel : public EmbeddingModel {
public:
    std::vector<FaceEmbedding> embed(const ImageView& bgr) override {
        size_t key = bgr.data()[0] / 50;   // 10 -> 0, 60 -> 1, 200 -> 4
        return {
            {Rect(0, 0, 5, 5), axis(DIM, 7)},
            {Rect(0, 0, 20, 20), axis(DIM, key)},
        };
    }
    bool available() const override { return true; }
    std::string name() const override { return "color-keyed"; }
};

void writeBmp(const std::string& path, int width, int height, uint8_t b, uint8_t g, uint8_t r) {
    const int row_size = (width * 3 + 3) & ~3;
    const uint32_t pixel_bytes = row_size * height;
    const uint32_t file_size = 54 + pixel_bytes;

    auto u16 = [](std::ofstream& out, uint16_t v) {
        out.put(static_cast<char>(v & 0xFF));
        out.put(static_cast<char>(v >> 8));
    };
    auto u32 = [](std::ofstream& out, uint32_t v) {
        for (int i = 0; i < 4; i++) out.put(static_cast<char>((v >> (8 * i)) & 0xFF));
    };

    std::ofstream out(path, std::ios::binary);
    out.put('B');
    out.put('M');
    u32(out, file_size);
    u32(out, 0);
    u32(out, 54);
    u32(out, 40);
    u32(out, static_cast<uint32_t>(width));
    u32(out, static_cast<uint32_t>(height));
    u16(out, 1);
    u16(out, 24);
    u32(out, 0);
    u32(out, pixel_bytes);
    u32(out, 2835);
    u32(out, 2835);
    u32(out, 0);
    u32(out, 0);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            out.put(static_cast<char>(b));
            out.put(static_cast<char>(g));
            out.put(static_cast<char>(r));
        }
        for (int p = width * 3; p < row_size; p++) out.put(0);
    }
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::unique_ptr<DetectionPipeline> makePipeline(std::vector<Rect> rects, int width, FakeDetector** out) {
    auto backend = std::make_unique<FakeDetector>(std::move(rects), width);
    *out = backend.get();
    return std::make_unique<DetectionPipeline>(std::move(backend));
}

Identity makeIdentity(const std::string& name, Embedding embedding) {
    Identity identity;
    identity.name = name;
    identity.mean_embedding = std::move(embedding);
    identity.sample_count = 1;
    return identity;
}

} // namespace

static void testNoGallery() {
    facesift::test::section("no gallery");

    FakeDetector* detector = nullptr;
    auto pipeline = makePipeline({Rect(10, 10, 60, 60), Rect(120, 10, 60, 60)}, 200, &detector);
    FakeEmbeddingModel model({{Rect(10, 10, 60, 60), axis(DIM, 0)}});
    GalleryRegistry registry;
    FaceService service(*pipeline, &model, registry);

    Image frame(200, 100, 4);
    FrameFaces result = service.locate(frame.view(), DetectionOptions::accurate());
    check(result.status == MatchStatus::NO_GALLERY, "empty gallery reports NO_GALLERY");
    check(result.faces.size() == 2, "all detections returned");
    check(model.calls == 0, "embedding model not consulted");

    Gallery gallery;
    gallery["alice"] = makeIdentity("alice", axis(DIM, 0));
    registry.replace(gallery);
    FaceService without_model(*pipeline, nullptr, registry);
    check(without_model.locate(frame.view(), DetectionOptions::accurate()).status == MatchStatus::NO_GALLERY,
          "no model behaves like an empty gallery");

    GalleryRegistry empty_registry;
    detector->throw_on_detect = true;
    FaceService failing(*pipeline, &model, empty_registry);
    FrameFaces failed = failing.locate(frame.view(), DetectionOptions::accurate());
    check(failed.status == MatchStatus::NO_GALLERY && failed.faces.empty(), "pipeline failure yields no faces");
}

static void testIdentify() {
    facesift::test::section("identify");

    FakeDetector* detector = nullptr;
    auto pipeline = makePipeline({Rect(10, 10, 60, 60)}, 200, &detector);

    Gallery gallery;
    gallery["alice"] = makeIdentity("alice", axis(DIM, 0));
    gallery["bob"] = makeIdentity("bob", axis(DIM, 1));
    GalleryRegistry registry(gallery);

    Image frame(200, 100, 4);

    FakeEmbeddingModel hit({{Rect(5, 5, 30, 30), axis(DIM, 7)}, {Rect(100, 20, 40, 40), axis(DIM, 1)}});
    FaceService service(*pipeline, &hit, registry);
    FrameFaces matched = service.locate(frame.view(), DetectionOptions::accurate());
    check(matched.status == MatchStatus::MATCHED && matched.identity == "bob", "best identity matched");
    check(matched.faces.size() == 1 && matched.faces[0] == Rect(100, 20, 40, 40), "only the matched box returned");
    check(hit.last_channels == 3, "model receives a BGR frame");
    check(detector->calls == 0, "cascade not run when identifying");

    FakeEmbeddingModel overhang({{Rect(180, 80, 50, 50), axis(DIM, 0)}});
    FaceService clamped(*pipeline, &overhang, registry);
    FrameFaces trimmed = clamped.locate(frame.view(), DetectionOptions::accurate());
    check(trimmed.faces.size() == 1 && trimmed.faces[0] == Rect(180, 80, 20, 20), "matched box clamped to frame");

    Embedding weak(DIM, 0.0f);
    weak[0] = 0.2f;
    weak[2] = std::sqrt(1.0f - 0.04f);
    FakeEmbeddingModel miss({{Rect(10, 10, 60, 60), weak}});
    FaceService rejecting(*pipeline, &miss, registry);
    FrameFaces none = rejecting.locate(frame.view(), DetectionOptions::accurate());
    check(none.status == MatchStatus::NO_MATCH && none.faces.empty(), "below-threshold match returns nothing");

    RecognitionOptions lenient;
    lenient.threshold = 0.1f;
    FaceService accepting(*pipeline, &miss, registry, lenient);
    check(accepting.locate(frame.view(), DetectionOptions::accurate()).status == MatchStatus::MATCHED,
          "threshold comes from RecognitionOptions");

    FakeEmbeddingModel broken{std::vector<FaceEmbedding>()};
    broken.throw_on_embed = true;
    FaceService erroring(*pipeline, &broken, registry);
    check(erroring.locate(frame.view(), DetectionOptions::accurate()).status == MatchStatus::NO_MATCH,
          "inference error degrades to NO_MATCH");

    FakeEmbeddingModel unavailable(std::vector<FaceEmbedding>(), false);
    FaceService unloaded(*pipeline, &unavailable, registry);
    bool threw = false;
    try {
        unloaded.locate(frame.view(), DetectionOptions::accurate());
    } catch (const ModelUnavailableError&) {
        threw = true;
    }
    check(threw, "unavailable model raises ModelUnavailableError");
}

static void testEnrollment() {
    facesift::test::section("enrollment");

    std::string root = "/tmp/facesift_test_faces_" + std::to_string(getpid());
    mkdir(root.c_str(), 0755);
    mkdir((root + "/alice").c_str(), 0755);
    mkdir((root + "/bob").c_str(), 0755);
    mkdir((root + "/carol").c_str(), 0755);
    writeFile(root + "/notes.txt", "not an identity");

    for (int i = 0; i < 4; i++) {
        writeBmp(root + "/alice/img" + std::to_string(i) + ".bmp", 8, 6, 10, 20, 30);
    }
    writeBmp(root + "/alice/outlier.BMP", 8, 6, 200, 20, 30);
    writeFile(root + "/alice/readme.txt", "ignored");
    writeBmp(root + "/bob/a.bmp", 5, 5, 60, 0, 0);
    writeBmp(root + "/bob/b.bmp", 5, 5, 60, 0, 0);
    writeFile(root + "/bob/broken.jpg", "definitely not a jpeg");
    writeFile(root + "/carol/empty.png", "");

    auto sources = Enrollment::scanSource(root);
    check(sources.size() == 3, "three identity directories found");
    check(sources.size() == 3 && sources[0].name == "alice" && sources[2].name == "carol", "identities sorted");
    check(sources.size() == 3 && sources[0].images.size() == 5, "only image extensions kept");
    check(sources.size() == 3 && sources[1].images.size() == 3, "undecodable files still listed");

    Image decoded;
    check(decodeImageFile(root + "/bob/a.bmp", decoded) && decoded.channels() == 3 && decoded.data()[0] == 60,
          "BMP decoded to BGR");
    check(!decodeImageFile(root + "/bob/broken.jpg", decoded), "garbage file fails to decode");

    check(isSupportedImageFile("/faces/ALICE/Photo.JPEG"), "extension match ignores case");
    check(!isSupportedImageFile("/faces/alice/photo.j\xC3\xA9pg"), "non-ASCII extension rejected");
    check(!isSupportedImageFile("/faces/al.ice/photo"), "dot in a directory is not an extension");

    EnrollmentOptions options;
    options.threads = 2;
    Enrollment enrollment([]() { return std::make_unique<ColorKeyedModel>(); }, options);

    ColorKeyedModel model;
    auto alice = enrollment.enrollIdentity("alice", sources[0].images, model);
    check(alice.has_value() && alice->sample_count == 4, "outlier image rejected");
    check(alice.has_value() && facesift::test::near(dot(alice->mean_embedding, axis(DIM, 0)), 1.0f),
          "largest face used for each image");

    GalleryRegistry registry;
    size_t loaded = enrollment.rebuild(registry, root);
    auto gallery = registry.snapshot();
    check(loaded == 2 && gallery->size() == 2, "identities without samples omitted");
    check(gallery->count("bob") == 1 && gallery->at("bob").sample_count == 2, "broken image skipped");

    check(enrollment.buildGallery(root + "/missing").empty(), "missing directory gives an empty gallery");

    Enrollment unavailable([]() { return std::make_unique<FakeEmbeddingModel>(std::vector<FaceEmbedding>(), false); });
    bool threw = false;
    try {
        unavailable.buildGallery(root);
    } catch (const ModelUnavailableError&) {
        threw = true;
    }
    check(threw, "unavailable model aborts enrollment");
    check(registry.size() == 2, "registry unchanged after a failed rebuild attempt");

    for (const auto& source : sources) {
        for (const auto& image : source.images) std::remove(image.c_str());
        std::remove((root + "/" + source.name + "/readme.txt").c_str());
        rmdir((root + "/" + source.name).c_str());
    }
    std::remove((root + "/notes.txt").c_str());
    rmdir(root.c_str());
}

int main() {
    std::cout << "Face service tests" << std::endl;
    testNoGallery();
    testIdentify();
    testEnrollment();
    return facesift::test::finish("test_face_service");
}
