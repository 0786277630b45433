#include "image_stats.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace probes {

float clamp01(float value) {
    if (std::isnan(value)) {
        return 0.0f;
    }
    return std::max(0.0f, std::min(1.0f, value));
}

double clamp01(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::max(0.0, std::min(1.0, value));
}

cv::Mat toGray(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }
    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }
    return gray;
}

void fftShift(cv::Mat& magnitude) {
    magnitude = magnitude(cv::Rect(0, 0, magnitude.cols & -2, magnitude.rows & -2));
    int cx = magnitude.cols / 2;
    int cy = magnitude.rows / 2;

    cv::Mat q0(magnitude, cv::Rect(0, 0, cx, cy));
    cv::Mat q1(magnitude, cv::Rect(cx, 0, cx, cy));
    cv::Mat q2(magnitude, cv::Rect(0, cy, cx, cy));
    cv::Mat q3(magnitude, cv::Rect(cx, cy, cx, cy));

    cv::Mat tmp;
    q0.copyTo(tmp);
    q3.copyTo(q0);
    tmp.copyTo(q3);
    q1.copyTo(tmp);
    q2.copyTo(q1);
    tmp.copyTo(q2);
}

cv::Mat logMagnitudeSpectrum(const cv::Mat& gray) {
    cv::Mat float_img;
    gray.convertTo(float_img, CV_32F);

    cv::Mat planes[] = {float_img, cv::Mat::zeros(float_img.size(), CV_32F)};
    cv::Mat complex_img;
    cv::merge(planes, 2, complex_img);
    cv::dft(complex_img, complex_img, cv::DFT_COMPLEX_OUTPUT);
    cv::split(complex_img, planes);

    cv::Mat magnitude;
    cv::magnitude(planes[0], planes[1], magnitude);
    magnitude += cv::Scalar::all(1);
    cv::log(magnitude, magnitude);

    fftShift(magnitude);
    return magnitude.clone();
}

double percentile(std::vector<double> values, double p) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    double rank = (p / 100.0) * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = std::min(lower + 1, values.size() - 1);
    double fraction = rank - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * fraction;
}

double percentile(const cv::Mat& values, double p) {
    cv::Mat as_double;
    values.reshape(1, 1).convertTo(as_double, CV_64F);
    std::vector<double> flat(as_double.begin<double>(), as_double.end<double>());
    return percentile(std::move(flat), p);
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double populationVariance(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double m = mean(values);
    double sum = 0.0;
    for (double v : values) {
        sum += (v - m) * (v - m);
    }
    return sum / static_cast<double>(values.size());
}

double correlation(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat da, db;
    a.reshape(1, 1).convertTo(da, CV_64F);
    b.reshape(1, 1).convertTo(db, CV_64F);
    if (da.total() != db.total() || da.total() < 2) {
        return 0.0;
    }

    cv::Scalar mean_a, std_a, mean_b, std_b;
    cv::meanStdDev(da, mean_a, std_a);
    cv::meanStdDev(db, mean_b, std_b);
    if (std_a[0] < 1e-9 || std_b[0] < 1e-9) {
        return 0.0;
    }

    cv::Mat centered_a = da - mean_a[0];
    cv::Mat centered_b = db - mean_b[0];
    double covariance = centered_a.dot(centered_b) / static_cast<double>(da.total());
    return covariance / (std_a[0] * std_b[0]);
}

double normalizedEntropy(const std::vector<double>& histogram) {
    if (histogram.size() < 2) {
        return 0.0;
    }
    double total = std::accumulate(histogram.begin(), histogram.end(), 0.0);
    if (total <= 0.0) {
        return 0.0;
    }
    double entropy = 0.0;
    for (double count : histogram) {
        if (count > 0.0) {
            double p = count / total;
            entropy -= p * std::log(p);
        }
    }
    return entropy / std::log(static_cast<double>(histogram.size()));
}

double edgeDensity(const cv::Mat& gray, double low, double high) {
    if (gray.empty()) {
        return 0.0;
    }
    cv::Mat edges;
    cv::Canny(gray, edges, low, high);
    return static_cast<double>(cv::countNonZero(edges)) / static_cast<double>(edges.total());
}

cv::Mat localVariance(const cv::Mat& gray, int ksize) {
    cv::Mat float_img;
    gray.convertTo(float_img, CV_32F);

    cv::Mat local_mean, local_sq_mean;
    cv::blur(float_img, local_mean, cv::Size(ksize, ksize));
    cv::blur(float_img.mul(float_img), local_sq_mean, cv::Size(ksize, ksize));

    cv::Mat variance = local_sq_mean - local_mean.mul(local_mean);
    cv::max(variance, 0.0, variance);
    return variance;
}

double brightnessDistanceCorrelation(const cv::Mat& gray) {
    cv::Mat distance(gray.size(), CV_32F);
    float cy = static_cast<float>(gray.rows) / 2.0f;
    float cx = static_cast<float>(gray.cols) / 2.0f;
    for (int y = 0; y < gray.rows; y++) {
        float* row = distance.ptr<float>(y);
        for (int x = 0; x < gray.cols; x++) {
            row[x] = std::sqrt((x - cx) * (x - cx) + (y - cy) * (y - cy));
        }
    }
    return correlation(distance, gray);
}

double laplacianVariance(const cv::Mat& gray) {
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar mean_val, stddev;
    cv::meanStdDev(laplacian, mean_val, stddev);
    return stddev[0] * stddev[0];
}

} // namespace probes
