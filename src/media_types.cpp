#include "media_types.hpp"

std::string mediaTypeToString(MediaType type) {
    return type == MediaType::VIDEO ? "video" : "image";
}

std::string frameKindToString(FrameKind kind) {
    switch (kind) {
        case FrameKind::FACE: return "face";
        case FrameKind::FACE_FFT: return "face_fft";
        case FrameKind::FACE_COLOR: return "face_color";
        case FrameKind::FACE_NOISE: return "face_noise";
        case FrameKind::EYES: return "eyes";
        case FrameKind::EYES_EDGE: return "eyes_edge";
        case FrameKind::MOUTH: return "mouth";
        case FrameKind::FACE_EDGES: return "face_edges";
        case FrameKind::FACE_SHARP: return "face_sharp";
        case FrameKind::FULL: return "full";
        case FrameKind::FULL_FFT: return "full_fft";
        case FrameKind::CENTER: return "center";
        case FrameKind::CENTER_FFT: return "center_fft";
        case FrameKind::EDGES: return "edges";
        case FrameKind::CONTRAST: return "contrast";
        case FrameKind::MIRROR: return "mirror";
        case FrameKind::VIDEO_FRAME: return "video_frame";
        default: return "unknown";
    }
}

bool isFrequencyFrame(FrameKind kind) {
    return kind == FrameKind::FACE_FFT || kind == FrameKind::FULL_FFT || kind == FrameKind::CENTER_FFT;
}

bool isEyeFrame(FrameKind kind) {
    return kind == FrameKind::EYES || kind == FrameKind::EYES_EDGE;
}

bool isFaceAppearanceFrame(FrameKind kind) {
    switch (kind) {
        case FrameKind::FACE:
        case FrameKind::FACE_COLOR:
        case FrameKind::FACE_NOISE:
        case FrameKind::MOUTH:
        case FrameKind::FACE_EDGES:
        case FrameKind::FACE_SHARP:
            return true;
        default:
            return false;
    }
}

std::string classificationToString(Classification classification) {
    switch (classification) {
        case Classification::FAKE: return "fake";
        case Classification::SUSPICIOUS: return "suspicious";
        default: return "real";
    }
}
