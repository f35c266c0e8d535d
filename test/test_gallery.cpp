// Gallery registry and binary gallery file checks

#include "test_common.h"
#include "../src/gallery.h"
#include "../src/models/gallery_store.h"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <thread>
#include <unistd.h>

using namespace facesift;
using facesift::test::axis;
using facesift::test::check;

static Identity makeIdentity(const std::string& name, Embedding embedding, size_t samples) {
    Identity identity;
    identity.name = name;
    identity.mean_embedding = std::move(embedding);
    identity.sample_count = samples;
    return identity;
}

static std::string tempPath(const std::string& tag) {
    return "/tmp/facesift_test_" + tag + "_" + std::to_string(getpid()) + ".bin";
}

static void testRegistry() {
    facesift::test::section("GalleryRegistry");

    GalleryRegistry registry;
    check(registry.snapshot() != nullptr && registry.snapshot()->empty(), "starts with an empty gallery");

    Gallery first;
    first["alice"] = makeIdentity("alice", axis(4, 0), 3);
    registry.replace(first);

    auto before = registry.snapshot();
    check(before->size() == 1 && before->count("alice") == 1, "replace publishes the new gallery");

    Gallery second;
    second["bob"] = makeIdentity("bob", axis(4, 1), 2);
    second["carol"] = makeIdentity("carol", axis(4, 2), 5);
    registry.replace(second);

    check(before->size() == 1 && before->count("alice") == 1, "earlier snapshot unaffected by replace");
    check(registry.size() == 2 && registry.snapshot()->count("alice") == 0, "new snapshot sees the swap");

    // Readers and a writer at the same time
    GalleryRegistry shared;
    bool consistent = true;
    std::thread writer([&shared]() {
        for (int i = 0; i < 200; i++) {
            Gallery g;
            for (int k = 0; k <= i % 5; k++) {
                std::string name = "id" + std::to_string(k);
                g[name] = makeIdentity(name, axis(2, 0), k + 1);
            }
            shared.replace(std::move(g));
        }
    });
    for (int i = 0; i < 2000; i++) {
        auto snap = shared.snapshot();
        size_t n = 0;
        for (const auto& entry : *snap) {
            if (entry.second.sample_count != ++n) consistent = false;
        }
    }
    writer.join();
    check(consistent, "snapshots are never partially updated");
}

static void testStore() {
    facesift::test::section("GalleryStore");

    Gallery gallery;
    gallery["alice"] = makeIdentity("alice", {0.6f, 0.8f, 0.0f}, 4);
    gallery["bob"] = makeIdentity("bob", axis(3, 2), 7);

    std::string path = tempPath("gallery");
    check(GalleryStore::save(path, gallery), "save succeeds");

    std::ifstream size_check(path, std::ios::binary | std::ios::ate);
    check(static_cast<size_t>(size_check.tellg()) == GalleryStore::fileSize(gallery), "file size matches layout");
    size_check.close();

    Gallery loaded;
    check(GalleryStore::load(path, loaded), "load succeeds");
    check(loaded.size() == 2 && loaded.count("alice") && loaded.count("bob"), "all identities loaded");
    if (loaded.count("alice")) {
        const Identity& alice = loaded.at("alice");
        check(alice.sample_count == 4 && alice.mean_embedding == gallery.at("alice").mean_embedding,
              "identity fields preserved");
    }

    Gallery empty;
    std::string empty_path = tempPath("empty");
    Gallery reloaded_empty;
    reloaded_empty["stale"] = makeIdentity("stale", axis(2, 0), 1);
    check(GalleryStore::save(empty_path, empty) && GalleryStore::load(empty_path, reloaded_empty) &&
          reloaded_empty.empty(), "empty gallery round trip");

    Gallery bad_name;
    bad_name[std::string(64, 'x')] = makeIdentity(std::string(64, 'x'), axis(2, 0), 1);
    check(!GalleryStore::save(tempPath("badname"), bad_name), "64-byte name rejected");
    std::remove(tempPath("badname").c_str());

    std::remove(path.c_str());
    std::remove(empty_path.c_str());
}

static void testCorruptFiles() {
    facesift::test::section("corrupt gallery files");

    Gallery gallery;
    gallery["alice"] = makeIdentity("alice", axis(8, 1), 2);
    std::string good = tempPath("good");
    GalleryStore::save(good, gallery);

    std::ifstream in(good, std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    Gallery sentinel;
    sentinel["keep"] = makeIdentity("keep", axis(2, 0), 1);

    auto writeAndLoad = [&sentinel](const std::string& tag, const std::string& content) {
        std::string path = tempPath(tag);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), content.size());
        out.close();
        Gallery target = sentinel;
        bool ok = GalleryStore::load(path, target);
        std::remove(path.c_str());
        return ok || target.count("keep") == 0;
    };

    std::string bad_magic = bytes;
    bad_magic[0] = 'X';
    check(!writeAndLoad("magic", bad_magic), "wrong magic rejected, target untouched");

    check(!writeAndLoad("truncated", bytes.substr(0, bytes.size() - 5)), "truncated embedding rejected");
    check(!writeAndLoad("header", bytes.substr(0, 10)), "truncated header rejected");

    // Dimension field sits after the 16-byte header, 64-byte name and sample count
    std::string zero_dim = bytes;
    for (int i = 0; i < 4; i++) zero_dim[16 + 64 + 4 + i] = 0;
    check(!writeAndLoad("zerodim", zero_dim), "zero dimension rejected");

    std::string huge_dim = bytes;
    huge_dim[16 + 64 + 4 + 0] = 0x01;
    huge_dim[16 + 64 + 4 + 1] = 0x08;   // 2049
    check(!writeAndLoad("hugedim", huge_dim), "dimension above 2048 rejected");

    std::string bad_version = bytes;
    bad_version[8] = 9;
    check(!writeAndLoad("version", bad_version), "unknown version rejected");

    Gallery missing;
    check(!GalleryStore::load("/nonexistent/facesift/gallery.bin", missing), "missing file rejected");

    Gallery scaled;
    scaled["dave"] = makeIdentity("dave", {3.0f, 0.0f, 4.0f}, 2);
    std::string scaled_path = tempPath("scaled");
    GalleryStore::save(scaled_path, scaled);
    Gallery rescaled;
    check(GalleryStore::load(scaled_path, rescaled) && rescaled.count("dave") == 1, "non-unit embedding loads");
    if (rescaled.count("dave")) {
        const Embedding& mean = rescaled.at("dave").mean_embedding;
        check(facesift::test::near(l2Norm(mean), 1.0f) && facesift::test::near(mean[0], 0.6f) &&
              facesift::test::near(mean[2], 0.8f), "non-unit embedding re-normalized on load");
    }
    std::remove(scaled_path.c_str());

    Gallery zero;
    zero["erin"] = makeIdentity("erin", Embedding(4, 0.0f), 1);
    std::string zero_path = tempPath("zeronorm");
    GalleryStore::save(zero_path, zero);
    Gallery zero_target = sentinel;
    check(!GalleryStore::load(zero_path, zero_target) && zero_target.count("keep") == 1,
          "zero embedding rejected, target untouched");
    std::remove(zero_path.c_str());

    Gallery not_finite;
    not_finite["finn"] = makeIdentity("finn", {std::nanf(""), 1.0f}, 1);
    std::string nan_path = tempPath("nan");
    GalleryStore::save(nan_path, not_finite);
    Gallery nan_target;
    check(!GalleryStore::load(nan_path, nan_target), "non-finite embedding rejected");
    std::remove(nan_path.c_str());

    std::remove(good.c_str());
}

int main() {
    std::cout << "Gallery tests" << std::endl;
    testRegistry();
    testStore();
    testCorruptFiles();
    return facesift::test::finish("test_gallery");
}
