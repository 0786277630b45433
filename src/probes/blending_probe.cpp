#include "blending_probe.hpp"
#include "image_stats.hpp"

namespace probes {

cv::Mat BlendingProbe::boundaryMask(const cv::Size& image_size, const cv::Rect& bbox) {
    cv::Mat mask = cv::Mat::zeros(image_size, CV_8U);
    cv::rectangle(mask, bbox, cv::Scalar(255), 2);

    int kernel = std::max(3, static_cast<int>(bbox.width * MARGIN_FRACTION));
    if (kernel % 2 == 0) {
        kernel++;
    }
    cv::dilate(mask, mask, cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kernel, kernel)));
    return mask;
}

bool BlendingProbe::isSeamRatio(double sharp_edge_ratio) {
    return sharp_edge_ratio >= SEAM_RATIO_MIN && sharp_edge_ratio <= SEAM_RATIO_MAX;
}

ProbeResult BlendingProbe::analyze(const ProbeInput& input) const {
    if (input.image.empty()) {
        return neutral("empty_input");
    }
    if (!input.face) {
        return neutral("no_face");
    }

    cv::Rect bbox = input.face->bbox & cv::Rect(0, 0, input.image.cols, input.image.rows);
    if (bbox.area() == 0) {
        return neutral("face_outside_image");
    }

    cv::Mat gray = toGray(input.image);
    cv::Mat edges;
    cv::Canny(gray, edges, CANNY_LOW, CANNY_HIGH);

    cv::Mat mask = boundaryMask(gray.size(), bbox);
    int margin_pixels = cv::countNonZero(mask);
    if (margin_pixels == 0) {
        return neutral("empty_margin");
    }

    cv::Mat margin_edges;
    cv::bitwise_and(edges, mask, margin_edges);
    double ratio = static_cast<double>(cv::countNonZero(margin_edges)) / margin_pixels;
    bool seam = isSeamRatio(ratio);

    ProbeResult result;
    result.score = seam ? 0.6f : (ratio > SEAM_RATIO_MAX ? 0.15f : 0.0f);
    result.details = {
        {"sharp_edge_ratio", ratio},
        {"margin_pixels", margin_pixels},
        {"blending_detected", seam}
    };
    return result;
}

} // namespace probes
