#include "ncnn_embedder.h"
#include "../config.h"
#include "config_paths.h"
#include "../frame_converter.h"
#include "../geometry.h"
#include "../logger.h"
#include "retinaface.h"
#include <algorithm>
#include <fstream>
#include <regex>
#if NCNN_VULKAN
#include <ncnn/gpu.h>
#endif

namespace facesift {

namespace {

constexpr int ALIGNED_FACE_SIZE = 112;

bool fileExists(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

// base.param/base.bin, falling back to base.ncnn.param/base.ncnn.bin
void resolveModelFiles(const std::string& base, std::string& param, std::string& bin) {
    param = base + ".param";
    bin = base + ".bin";
    if (!fileExists(param)) {
        param = base + ".ncnn.param";
        bin = base + ".ncnn.bin";
    }
}

std::string baseName(const std::string& path) {
    size_t last_slash = path.find_last_of("/\\");
    return last_slash != std::string::npos ? path.substr(last_slash + 1) : path;
}

} // namespace

NcnnEmbedderOptions NcnnEmbedderOptions::fromConfig(const Config& config) {
    NcnnEmbedderOptions options;

    if (auto providers = config.getList("recognition", "providers")) {
        options.backends = parseBackendList(*providers);
    }
    if (auto model = config.getString("recognition", "model")) {
        options.recognition_model = *model;
    }
    if (auto model = config.getString("recognition", "detection_model")) {
        options.detection_model = *model;
    }
    if (auto threads = config.getInt("recognition", "num_threads")) {
        options.num_threads = *threads;
    }
    if (auto confidence = config.getDouble("recognition", "detection_confidence")) {
        options.detection_confidence = static_cast<float>(*confidence);
    }
    return options;
}

NcnnEmbedder::NcnnEmbedder(NcnnEmbedderOptions options)
    : options_(std::move(options)) {
    std::string recognition_base = options_.recognition_model.empty()
        ? std::string(MODELS_DIR) + "/recognition" : options_.recognition_model;
    std::string detection_base = options_.detection_model.empty()
        ? std::string(MODELS_DIR) + "/detection" : options_.detection_model;

    resolveModelFiles(recognition_base, recognition_param_, recognition_bin_);
    resolveModelFiles(detection_base, detection_param_, detection_bin_);
    model_name_ = baseName(recognition_base);
}

size_t NcnnEmbedder::parseModelOutputDim(const std::string& param_path) {
    std::ifstream file(param_path);
    if (!file.is_open()) {
        Logger::getInstance().debug("Failed to open param file: " + param_path);
        return 0;
    }

    // InnerProduct <name> <in> <out> <input> out0 0=<dimension>
    std::regex output_pattern("InnerProduct\\s+\\S+\\s+\\d+\\s+\\d+\\s+\\S+\\s+out0\\s+0=(\\d+)");

    std::string line;
    while (std::getline(file, line)) {
        std::smatch match;
        if (std::regex_search(line, match, output_pattern)) {
            size_t dim = std::stoull(match[1].str());
            Logger::getInstance().debug("Detected output dimension: " + std::to_string(dim) + "D from " + param_path);
            return dim;
        }
    }

    return 0;
}

bool NcnnEmbedder::loadOn(const ComputeBackend& backend, std::string& error) {
    auto recognition = std::make_unique<ncnn::Net>();
    auto detection = std::make_unique<ncnn::Net>();

    for (ncnn::Net* net : {recognition.get(), detection.get()}) {
        net->opt.num_threads = options_.num_threads;
        net->opt.use_fp16_packed = false;
        net->opt.use_fp16_storage = false;
        net->opt.use_vulkan_compute = false;
    }

    if (backend.kind == ComputeBackend::Kind::VULKAN) {
#if NCNN_VULKAN
        int gpu_count = ncnn::get_gpu_count();
        if (backend.device < 0 || backend.device >= gpu_count) {
            error = "no Vulkan device " + std::to_string(backend.device) +
                    " (" + std::to_string(gpu_count) + " available)";
            return false;
        }
        for (ncnn::Net* net : {recognition.get(), detection.get()}) {
            net->opt.use_vulkan_compute = true;
            net->set_vulkan_device(backend.device);
        }
#else
        error = "ncnn built without Vulkan";
        return false;
#endif
    }

    int ret = recognition->load_param(recognition_param_.c_str());
    if (ret != 0) {
        error = "failed to load " + recognition_param_ + " (ret=" + std::to_string(ret) + ")";
        return false;
    }
    ret = recognition->load_model(recognition_bin_.c_str());
    if (ret != 0) {
        error = "failed to load " + recognition_bin_ + " (ret=" + std::to_string(ret) + ")";
        return false;
    }

    ret = detection->load_param(detection_param_.c_str());
    if (ret != 0) {
        error = "failed to load " + detection_param_ + " (ret=" + std::to_string(ret) + ")";
        return false;
    }
    ret = detection->load_model(detection_bin_.c_str());
    if (ret != 0) {
        error = "failed to load " + detection_bin_ + " (ret=" + std::to_string(ret) + ")";
        return false;
    }

    recognition_net_ = std::move(recognition);
    detection_net_ = std::move(detection);
    return true;
}

InitReport NcnnEmbedder::initialize() {
    Logger::getInstance().debug("Loading recognition model: " + recognition_param_);
    Logger::getInstance().debug("Loading detection model: " + detection_param_);

    BackendChain chain(options_.backends);
    report_ = chain.run([this](const ComputeBackend& backend, std::string& error) {
        return loadOn(backend, error);
    });

    loaded_ = report_.ok();
    if (loaded_) {
        encoding_dim_ = parseModelOutputDim(recognition_param_);
        Logger::getInstance().info("Embedding model " + model_name_ + " ready on " +
            report_.active->name() +
            (encoding_dim_ > 0 ? " (" + std::to_string(encoding_dim_) + "D)" : std::string()));
    }
    return report_;
}

std::string NcnnEmbedder::name() const {
    if (loaded_ && report_.active) {
        return "ncnn:" + model_name_ + "@" + report_.active->name();
    }
    return "ncnn:" + model_name_;
}

std::vector<Rect> NcnnEmbedder::detectFaces(const ImageView& bgr) {
    ncnn::Mat in = ncnn::Mat::from_pixels(bgr.data(), ncnn::Mat::PIXEL_BGR2RGB,
                                          bgr.width(), bgr.height(), bgr.stride());

    std::vector<DetectionCandidate> found = detectWithRetinaFace(
        *detection_net_, in, bgr.width(), bgr.height(), options_.detection_confidence);

    std::vector<Rect> faces;
    faces.reserve(found.size());
    for (const auto& candidate : found) {
        faces.push_back(candidate.rect);
    }
    return faces;
}

// Bounding-box crop resized to the network input
Image NcnnEmbedder::alignFace(const ImageView& bgr, const Rect& face_rect) {
    Rect rect = clampToFrame(face_rect, bgr.width(), bgr.height());
    ImageView face_roi = bgr.roi(rect);
    return resizeImage(face_roi, ALIGNED_FACE_SIZE, ALIGNED_FACE_SIZE);
}

bool NcnnEmbedder::encodeFace(const Image& aligned, Embedding& encoding) {
    ncnn::Mat in = ncnn::Mat::from_pixels(aligned.data(), ncnn::Mat::PIXEL_BGR,
                                          aligned.width(), aligned.height(), aligned.stride());

    ncnn::Extractor ex = recognition_net_->create_extractor();
    ex.set_light_mode(true);
    ex.input("in0", in);

    ncnn::Mat out;
    int ret = ex.extract("out0", out);
    if (ret != 0) {
        Logger::getInstance().debug("Recognition inference failed, ret=" + std::to_string(ret));
        return false;
    }

    if (out.h != 1 || out.c != 1 || out.w <= 0) {
        Logger::getInstance().debug("Unexpected recognition output: w=" + std::to_string(out.w) +
            " h=" + std::to_string(out.h) + " c=" + std::to_string(out.c));
        return false;
    }
    if (encoding_dim_ != 0 && static_cast<size_t>(out.w) != encoding_dim_) {
        Logger::getInstance().debug("Recognition output is " + std::to_string(out.w) +
            "D, expected " + std::to_string(encoding_dim_) + "D");
        return false;
    }
    encoding_dim_ = static_cast<size_t>(out.w);

    encoding.assign(out.w, 0.0f);
    for (int i = 0; i < out.w; i++) {
        encoding[i] = out[i];
    }
    l2Normalize(encoding);
    return true;
}

std::vector<FaceEmbedding> NcnnEmbedder::embed(const ImageView& bgr) {
    if (!loaded_) {
        throw ModelUnavailableError("Embedding model unavailable: " + report_.summary());
    }
    if (bgr.empty()) {
        return {};
    }

    Image converted;
    ImageView frame(bgr.data(), bgr.width(), bgr.height(), bgr.channels(), bgr.stride());
    if (bgr.channels() != 3) {
        converted = toBGR(bgr);
        frame = converted.view();
    }

    std::vector<Rect> faces = detectFaces(frame);

    std::vector<FaceEmbedding> results;
    results.reserve(faces.size());
    for (const auto& face : faces) {
        Image aligned = alignFace(frame, face);

        FaceEmbedding result;
        result.box = face;
        if (encodeFace(aligned, result.embedding)) {
            results.push_back(std::move(result));
        }
    }

    Logger::getInstance().debug("Embedded " + std::to_string(results.size()) + " of " +
                                std::to_string(faces.size()) + " face(s)");
    return results;
}

EmbeddingModelFactory ncnnEmbedderFactory(const NcnnEmbedderOptions& options) {
    return [options]() -> std::unique_ptr<EmbeddingModel> {
        auto embedder = std::make_unique<NcnnEmbedder>(options);
        embedder->initialize();
        return embedder;
    };
}

} // namespace facesift
