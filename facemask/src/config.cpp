#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

namespace facemask {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static MaskTransform transform_from_string(const std::string& s) {
    if (s == "blur") return MaskTransform::BLUR;
    if (s == "stamp") return MaskTransform::STAMP;
    if (s != "pixelate" && s != "mosaic") {
        std::cerr << "[WARN] Unknown transform '" << s << "', using pixelate" << std::endl;
    }
    return MaskTransform::PIXELATE;
}

static RegionStrategyKind strategy_from_string(const std::string& s) {
    if (s == "classify") return RegionStrategyKind::CLASSIFY;
    if (s != "crop_redetect") {
        std::cerr << "[WARN] Unknown region strategy '" << s << "', using crop_redetect" << std::endl;
    }
    return RegionStrategyKind::CROP_REDETECT;
}

static DetectorBackend backend_from_string(const std::string& s) {
    if (s == "yunet") return DetectorBackend::YUNET;
    if (s != "ultraface") {
        std::cerr << "[WARN] Unknown detector backend '" << s << "', using ultraface" << std::endl;
    }
    return DetectorBackend::ULTRAFACE;
}

SelectionPolygon parse_polygon(const std::string& text) {
    SelectionPolygon poly;
    std::stringstream ss(text);
    std::string pair;
    while (std::getline(ss, pair, ';')) {
        auto comma = pair.find(',');
        if (comma == std::string::npos) continue;
        try {
            float x = std::stof(pair.substr(0, comma));
            float y = std::stof(pair.substr(comma + 1));
            poly.points.emplace_back(x, y);
        } catch (const std::exception&) {
            std::cerr << "[WARN] Skipping malformed polygon point: " << pair << std::endl;
        }
    }
    // Command line polygons are always treated as closed paths.
    poly.closed = true;
    return poly;
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* env_model = std::getenv("FACEMASK_MODEL")) cfg.model_path = env_model;
    if (const char* env_backend = std::getenv("FACEMASK_BACKEND")) cfg.backend = backend_from_string(env_backend);
    if (const char* env_conf = std::getenv("FACEMASK_CONF"))
        cfg.detection.auto_confidence_threshold = static_cast<float>(std::atof(env_conf));
    if (const char* env_manual = std::getenv("FACEMASK_MANUAL_CONF"))
        cfg.detection.manual_confidence_threshold = static_cast<float>(std::atof(env_manual));
    if (const char* env_timeout = std::getenv("FACEMASK_TIMEOUT_MS"))
        cfg.detection.inference_timeout_ms = std::atoi(env_timeout);
    if (const char* env_strategy = std::getenv("FACEMASK_STRATEGY"))
        cfg.detection.region_strategy = strategy_from_string(env_strategy);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--image") && next()) {
            cfg.image_path = next();
            i++;
        } else if (arg_eq(arg, "--out") && next()) {
            cfg.output_path = next();
            i++;
        } else if (arg_eq(arg, "--transform") && next()) {
            cfg.transform = transform_from_string(next());
            i++;
        } else if (arg_eq(arg, "--intensity") && next()) {
            cfg.intensity = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--stamp") && next()) {
            cfg.stamp_path = next();
            i++;
        } else if (arg_eq(arg, "--polygon") && next()) {
            cfg.polygon = next();
            i++;
        } else if (arg_eq(arg, "--exclude")) {
            cfg.region_mode = RegionMode::EXCLUDE;
        } else if (arg_eq(arg, "--strategy") && next()) {
            cfg.detection.region_strategy = strategy_from_string(next());
            i++;
        } else if (arg_eq(arg, "--backend") && next()) {
            cfg.backend = backend_from_string(next());
            i++;
        } else if (arg_eq(arg, "--model") && next()) {
            cfg.model_path = next();
            i++;
        } else if (arg_eq(arg, "--conf") && next()) {
            cfg.detection.auto_confidence_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--manual-conf") && next()) {
            cfg.detection.manual_confidence_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--timeout-ms") && next()) {
            cfg.detection.inference_timeout_ms = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--margin") && next()) {
            cfg.detection.margin_ratio = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--strict-merge")) {
            cfg.detection.strict_merge = true;
        } else if (arg_eq(arg, "--post-filter")) {
            cfg.detection.post_filter = true;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--highlight")) {
            cfg.highlight = true;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: facemask --image <file> [--out <file>] [--transform pixelate|blur|stamp]\n"
                      << "                [--intensity 1-5] [--stamp <file>] [--polygon \"x,y;x,y;...\"] [--exclude]\n"
                      << "                [--strategy crop_redetect|classify] [--backend ultraface|yunet]\n"
                      << "                [--model <onnx>] [--conf <thresh>] [--manual-conf <thresh>]\n"
                      << "                [--timeout-ms <int>] [--margin <ratio>] [--post-filter] [--strict-merge]\n"
                      << "                [--use-ort|--no-ort] [--highlight]\n";
            std::exit(0);
        }
    }

    return cfg;
}

}  // namespace facemask
