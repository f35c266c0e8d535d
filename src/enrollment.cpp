#include "enrollment.h"
#include "config.h"
#include "image_decoder.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <dirent.h>
#include <exception>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>

namespace facesift {

namespace {

bool isDirectory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool isRegularFile(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::vector<std::string> listEntries(const std::string& dir_path) {
    std::vector<std::string> entries;
    DIR* dir = opendir(dir_path.c_str());
    if (!dir) {
        return entries;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == ".." || name[0] == '.') {
            continue;
        }
        entries.push_back(name);
    }
    closedir(dir);

    std::sort(entries.begin(), entries.end());
    return entries;
}

const FaceEmbedding* largestFace(const std::vector<FaceEmbedding>& faces) {
    const FaceEmbedding* largest = nullptr;
    long long largest_area = -1;
    for (const auto& face : faces) {
        long long area = static_cast<long long>(face.box.width) * face.box.height;
        if (area > largest_area) {
            largest_area = area;
            largest = &face;
        }
    }
    return largest;
}

} // namespace

EnrollmentOptions EnrollmentOptions::fromConfig(const Config& config) {
    EnrollmentOptions options;
    if (auto threshold = config.getDouble("enrollment", "outlier_threshold")) {
        options.outlier_threshold = static_cast<float>(*threshold);
    }
    if (auto iterations = config.getInt("enrollment", "outlier_iterations")) {
        options.outlier_iterations = *iterations;
    }
    if (auto threads = config.getInt("enrollment", "threads")) {
        options.threads = *threads;
    }
    return options;
}

Enrollment::Enrollment(EmbeddingModelFactory factory, EnrollmentOptions options)
    : factory_(std::move(factory)), options_(options) {
    if (!factory_) {
        throw std::invalid_argument("Enrollment requires an embedding model factory");
    }
    if (options_.threads < 1) {
        options_.threads = 1;
    }
}

std::vector<EnrollmentSource> Enrollment::scanSource(const std::string& faces_dir) {
    std::vector<EnrollmentSource> sources;
    if (!isDirectory(faces_dir)) {
        Logger::getInstance().warning("Faces directory not found: " + faces_dir);
        return sources;
    }

    for (const auto& name : listEntries(faces_dir)) {
        std::string person_dir = faces_dir + "/" + name;
        if (!isDirectory(person_dir)) {
            continue;
        }

        EnrollmentSource source;
        source.name = name;
        for (const auto& file : listEntries(person_dir)) {
            std::string path = person_dir + "/" + file;
            if (isSupportedImageFile(file) && isRegularFile(path)) {
                source.images.push_back(path);
            }
        }
        sources.push_back(std::move(source));
    }

    return sources;
}

std::optional<Identity> Enrollment::enrollIdentity(const std::string& name,
                                                   const std::vector<std::string>& images,
                                                   EmbeddingModel& model) const {
    std::vector<Embedding> samples;
    samples.reserve(images.size());

    for (const auto& path : images) {
        Image bgr;
        if (!decodeImageFile(path, bgr)) {
            continue;
        }

        std::vector<FaceEmbedding> faces;
        try {
            faces = model.embed(bgr.view());
        } catch (const ModelUnavailableError&) {
            throw;
        } catch (const std::exception& e) {
            Logger::getInstance().warning("Skipping " + path + ": " + e.what());
            continue;
        }
        const FaceEmbedding* face = largestFace(faces);
        if (face == nullptr) {
            Logger::getInstance().debug("No face in " + path);
            continue;
        }
        samples.push_back(face->embedding);
    }

    std::vector<Embedding> kept = filterOutliers(samples, options_.outlier_threshold,
                                                 options_.outlier_iterations);
    if (kept.empty()) {
        Logger::getInstance().warning("No usable samples for " + name + " (" +
                                      std::to_string(images.size()) + " images)");
        return std::nullopt;
    }

    Identity identity;
    identity.name = name;
    identity.mean_embedding = meanEmbedding(kept);
    identity.sample_count = kept.size();

    Logger::getInstance().info("Enrolled " + name + ": " + std::to_string(kept.size()) + "/" +
                               std::to_string(samples.size()) + " samples kept from " +
                               std::to_string(images.size()) + " images");
    return identity;
}

Gallery Enrollment::buildGallery(const std::string& faces_dir) const {
    auto start = std::chrono::steady_clock::now();
    std::vector<EnrollmentSource> sources = scanSource(faces_dir);
    if (sources.empty()) {
        Logger::getInstance().info("No identities found in " + faces_dir);
        return Gallery();
    }

    const int num_threads = std::min<int>(options_.threads, static_cast<int>(sources.size()));
    std::vector<std::optional<Identity>> results(sources.size());
    std::vector<std::exception_ptr> errors(num_threads);

    // Round-robin split of identities over threads
    std::vector<std::vector<size_t>> chunks(num_threads);
    for (size_t i = 0; i < sources.size(); ++i) {
        chunks[i % num_threads].push_back(i);
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, &sources, &results, &chunks, &errors, t]() {
            try {
                std::unique_ptr<EmbeddingModel> model = factory_();
                if (!model || !model->available()) {
                    throw ModelUnavailableError("Embedding model unavailable for enrollment");
                }
                for (size_t idx : chunks[t]) {
                    results[idx] = enrollIdentity(sources[idx].name, sources[idx].images, *model);
                }
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    Gallery gallery;
    for (auto& result : results) {
        if (result) {
            std::string name = result->name;
            gallery[name] = std::move(*result);
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    Logger::getInstance().info("Enrollment: " + std::to_string(gallery.size()) + " of " +
                               std::to_string(sources.size()) + " identities loaded in " +
                               std::to_string(elapsed) + "ms (" + std::to_string(num_threads) + " threads)");
    return gallery;
}

size_t Enrollment::rebuild(GalleryRegistry& registry, const std::string& faces_dir) const {
    Gallery gallery = buildGallery(faces_dir);
    size_t count = gallery.size();
    registry.replace(std::move(gallery));
    return count;
}

} // namespace facesift
