#ifndef IMAGE_STATS_HPP
#define IMAGE_STATS_HPP

#include <opencv2/opencv.hpp>
#include <vector>

namespace probes {

// NaN maps to 0
float clamp01(float value);
double clamp01(double value);

// 8-bit single channel copy of a BGR, BGRA or gray image
cv::Mat toGray(const cv::Mat& image);

// Swaps quadrants so the zero frequency sits in the centre
void fftShift(cv::Mat& magnitude);

// Centred log(1 + |F|) spectrum of a gray image, CV_32F
cv::Mat logMagnitudeSpectrum(const cv::Mat& gray);

// Linear-interpolated percentile, p in [0,100]
double percentile(std::vector<double> values, double p);
double percentile(const cv::Mat& values, double p);

double mean(const std::vector<double>& values);
double populationVariance(const std::vector<double>& values);

// Pearson correlation of two equally sized single channel images, 0 when degenerate
double correlation(const cv::Mat& a, const cv::Mat& b);

// Shannon entropy of a histogram normalized by log(bins)
double normalizedEntropy(const std::vector<double>& histogram);

// Fraction of Canny edge pixels
double edgeDensity(const cv::Mat& gray, double low, double high);

// Per-pixel variance over a ksize x ksize box, CV_32F
cv::Mat localVariance(const cv::Mat& gray, int ksize);

// Correlation between brightness and distance from the image centre
double brightnessDistanceCorrelation(const cv::Mat& gray);

double laplacianVariance(const cv::Mat& gray);

} // namespace probes

#endif // IMAGE_STATS_HPP
