#include "video_consistency.hpp"
#include "probes/image_stats.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

void to_json(json& j, const MotionBlurResult& r) {
    j = json{
        {"frame_index", r.frame_index},
        {"blur_score", r.blur_score},
        {"blur_direction", r.blur_direction ? json(*r.blur_direction) : json(nullptr)},
        {"is_natural", r.is_natural},
        {"issues", r.issues}
    };
}

void to_json(json& j, const FaceTrackResult& r) {
    j = json{
        {"face_id", r.face_id},
        {"samples", r.sample_indices},
        {"consistency_score", r.consistency_score},
        {"velocity_variance", r.velocity_variance},
        {"issues", r.issues}
    };
}

void to_json(json& j, const LipActivityResult& r) {
    j = json{
        {"sync_score", r.sync_score},
        {"is_synced", r.is_synced},
        {"openness_variance", r.openness_variance},
        {"activity_variance", r.activity_variance},
        {"issues", r.issues}
    };
}

void to_json(json& j, const VideoConsistencyReport& report) {
    j = json{
        {"motion_score", report.motion_score},
        {"face_score", report.face_score},
        {"lip_score", report.lip_score},
        {"consistency_score", report.overall},
        {"is_consistent", report.is_consistent},
        {"motion_analysis", report.motion},
        {"face_tracking", report.face_tracks},
        {"lip_sync", report.lip_activity ? json(*report.lip_activity) : json(nullptr)},
        {"issues", report.issues}
    };
}

float VideoConsistencyAnalyzer::blurScore(const cv::Mat& frame) {
    double variance = probes::laplacianVariance(probes::toGray(frame));
    return static_cast<float>(std::min(variance / 1000.0, 1.0));
}

std::optional<float> VideoConsistencyAnalyzer::blurDirection(const cv::Mat& frame) {
    cv::Mat magnitude = probes::logMagnitudeSpectrum(probes::toGray(frame));
    const int cx = magnitude.cols / 2;
    const int cy = magnitude.rows / 2;

    const int bins = 36;
    std::vector<double> histogram(bins, 0.0);
    int counted = 0;

    for (int y = 0; y < magnitude.rows; ++y) {
        const float* row = magnitude.ptr<float>(y);
        for (int x = 0; x < magnitude.cols; ++x) {
            double dx = x - cx;
            double dy = y - cy;
            if (std::sqrt(dx * dx + dy * dy) <= 10.0) {
                continue;
            }
            ++counted;
            // Magnitude-weighted angle, histogrammed over [-pi, pi]
            double weighted = std::atan2(dy, dx) * row[x];
            if (weighted < -CV_PI || weighted > CV_PI) {
                continue;
            }
            int bin = static_cast<int>((weighted + CV_PI) / (2.0 * CV_PI) * bins);
            histogram[std::min(bin, bins - 1)] += 1.0;
        }
    }

    if (counted == 0) {
        return std::nullopt;
    }

    int dominant = static_cast<int>(std::max_element(histogram.begin(), histogram.end()) - histogram.begin());
    double bin_width = 2.0 * CV_PI / bins;
    double angle = -CV_PI + (dominant + 0.5) * bin_width;
    return static_cast<float>(angle * 180.0 / CV_PI);
}

std::vector<MotionBlurResult> VideoConsistencyAnalyzer::analyzeMotionBlur(const std::vector<cv::Mat>& frames) const {
    std::vector<MotionBlurResult> results;
    std::optional<float> prev_score;
    std::optional<float> prev_direction;

    for (size_t i = 0; i < frames.size(); ++i) {
        MotionBlurResult result;
        result.frame_index = static_cast<int>(i);
        result.blur_score = blurScore(frames[i]);
        result.blur_direction = blurDirection(frames[i]);

        if (prev_score) {
            if (std::abs(result.blur_score - *prev_score) > SUDDEN_BLUR_CHANGE) {
                result.issues.push_back("sudden_blur_change");
                result.is_natural = false;
            }
            if (prev_direction && result.blur_direction) {
                float change = std::abs(*result.blur_direction - *prev_direction);
                if (change > 180.0f) {
                    change = 360.0f - change;
                }
                if (change > 90.0f && result.blur_score < 0.7f) {
                    result.issues.push_back("inconsistent_blur_direction");
                    result.is_natural = false;
                }
            }
        }

        if (result.blur_score < 0.3f && !result.blur_direction) {
            result.issues.push_back("unnatural_uniform_blur");
            result.is_natural = false;
        }

        prev_score = result.blur_score;
        prev_direction = result.blur_direction;
        results.push_back(result);
    }

    return results;
}

std::vector<FaceTrackResult> VideoConsistencyAnalyzer::trackFaces(
    const std::vector<std::vector<FaceInfo>>& faces) const {
    std::map<int, FaceTrackResult> tracks;

    for (size_t sample = 0; sample < faces.size(); ++sample) {
        std::vector<FaceInfo> ranked = faces[sample];
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const FaceInfo& a, const FaceInfo& b) { return a.size() > b.size(); });

        for (int id = 0; id < static_cast<int>(ranked.size()) && id < MAX_TRACKED_FACES; ++id) {
            FaceTrackResult& track = tracks[id];
            track.face_id = id;
            track.positions.push_back(ranked[id].bbox);
            track.sample_indices.push_back(static_cast<int>(sample));
        }
    }

    std::vector<FaceTrackResult> results;
    for (auto& entry : tracks) {
        FaceTrackResult& track = entry.second;
        if (static_cast<int>(track.positions.size()) < MIN_TRACK_LENGTH) {
            continue;
        }

        std::vector<double> velocities;
        for (size_t i = 1; i < track.positions.size(); ++i) {
            int sample_gap = track.sample_indices[i] - track.sample_indices[i - 1];
            if (sample_gap <= 0) {
                continue;
            }
            const cv::Rect& prev = track.positions[i - 1];
            const cv::Rect& curr = track.positions[i];
            double dx = (curr.x + curr.width / 2.0) - (prev.x + prev.width / 2.0);
            double dy = (curr.y + curr.height / 2.0) - (prev.y + prev.height / 2.0);
            velocities.push_back(std::sqrt(dx * dx + dy * dy) / sample_gap);
        }
        if (velocities.empty()) {
            continue;
        }

        double velocity_var = probes::populationVariance(velocities);
        double velocity_mean = probes::mean(velocities);
        double max_velocity = *std::max_element(velocities.begin(), velocities.end());

        if (velocity_var > 100.0 && velocity_mean > 5.0) {
            track.issues.push_back("jittery_movement");
        }
        if (max_velocity > POSITION_JUMP) {
            track.issues.push_back("sudden_position_jump");
        }

        std::vector<double> sizes;
        for (const cv::Rect& r : track.positions) {
            sizes.push_back(static_cast<double>(r.area()));
        }
        double mean_size = probes::mean(sizes);
        double size_var = probes::populationVariance(sizes) / (mean_size * mean_size + 1.0);
        if (size_var > 0.2) {
            track.issues.push_back("inconsistent_face_size");
        }

        double score = 1.0;
        if (velocity_var > 50.0) score -= 0.2;
        if (max_velocity > 30.0) score -= 0.2;
        if (size_var > 0.1) score -= 0.2;
        score -= 0.1 * static_cast<double>(track.issues.size());

        track.consistency_score = static_cast<float>(std::max(0.0, score));
        track.velocity_variance = static_cast<float>(velocity_var);
        results.push_back(track);
    }

    return results;
}

cv::Rect VideoConsistencyAnalyzer::lipRect(const cv::Rect& face) {
    int top = static_cast<int>(face.height * 0.55);
    int bottom = static_cast<int>(face.height * 0.95);
    int left = static_cast<int>(face.width * 0.25);
    int right = static_cast<int>(face.width * 0.75);
    return cv::Rect(face.x + left, face.y + top, right - left, bottom - top);
}

std::optional<LipActivityResult> VideoConsistencyAnalyzer::analyzeLipActivity(
    const std::vector<cv::Mat>& frames, const FaceTrackResult& track) const {
    std::vector<double> openness;
    std::vector<double> activity;

    for (size_t i = 0; i < track.positions.size(); ++i) {
        int sample = track.sample_indices[i];
        if (sample < 0 || sample >= static_cast<int>(frames.size())) {
            continue;
        }
        const cv::Mat& frame = frames[sample];
        cv::Rect mouth_rect = lipRect(track.positions[i]) & cv::Rect(0, 0, frame.cols, frame.rows);
        if (mouth_rect.width < 2 || mouth_rect.height < 2) {
            continue;
        }

        cv::Mat gray = probes::toGray(frame(mouth_rect));
        cv::Mat edges;
        cv::Canny(gray, edges, 50, 150);
        int half = edges.rows / 2;
        cv::Mat upper_half = edges.rowRange(0, half);
        cv::Mat lower_half = edges.rowRange(half, edges.rows);
        double upper = upper_half.empty() ? 0.0 : static_cast<double>(cv::countNonZero(upper_half)) / upper_half.total();
        double lower = lower_half.empty() ? 0.0 : static_cast<double>(cv::countNonZero(lower_half)) / lower_half.total();

        openness.push_back(std::abs(upper - lower));
        activity.push_back(probes::laplacianVariance(gray));
    }

    if (static_cast<int>(openness.size()) < MIN_MOUTH_SAMPLES) {
        return std::nullopt;
    }

    LipActivityResult result;
    double openness_var = probes::populationVariance(openness);
    double activity_var = probes::populationVariance(activity);

    if (openness_var < 0.001) {
        result.issues.push_back("static_mouth");
    }
    if (activity_var < 100.0) {
        result.issues.push_back("uniform_mouth_activity");
    }

    double score = 1.0;
    if (openness_var < 0.005) score -= 0.3;
    if (activity_var < 500.0) score -= 0.2;
    score -= 0.15 * static_cast<double>(result.issues.size());

    result.sync_score = static_cast<float>(std::max(0.0, score));
    result.is_synced = result.sync_score > 0.6f;
    result.openness_variance = static_cast<float>(openness_var);
    result.activity_variance = static_cast<float>(activity_var);
    return result;
}

VideoConsistencyReport VideoConsistencyAnalyzer::analyze(const std::vector<cv::Mat>& frames,
                                                         const std::vector<std::vector<FaceInfo>>& faces) const {
    VideoConsistencyReport report;
    std::vector<std::string> all_issues;

    report.motion = analyzeMotionBlur(frames);
    for (const MotionBlurResult& r : report.motion) {
        all_issues.insert(all_issues.end(), r.issues.begin(), r.issues.end());
    }

    if (frames.size() >= 2) {
        report.face_tracks = trackFaces(faces);
    }
    for (const FaceTrackResult& r : report.face_tracks) {
        all_issues.insert(all_issues.end(), r.issues.begin(), r.issues.end());
    }

    if (!report.face_tracks.empty()) {
        report.lip_activity = analyzeLipActivity(frames, report.face_tracks.front());
        if (report.lip_activity) {
            all_issues.insert(all_issues.end(), report.lip_activity->issues.begin(),
                              report.lip_activity->issues.end());
        }
    }

    if (!report.motion.empty()) {
        std::vector<double> scores;
        for (const MotionBlurResult& r : report.motion) scores.push_back(r.blur_score);
        report.motion_score = probes::mean(scores);
    }
    if (!report.face_tracks.empty()) {
        std::vector<double> scores;
        for (const FaceTrackResult& r : report.face_tracks) scores.push_back(r.consistency_score);
        report.face_score = probes::mean(scores);
    }
    if (report.lip_activity) {
        report.lip_score = report.lip_activity->sync_score;
    }

    double overall = report.motion_score * MOTION_WEIGHT + report.face_score * FACE_WEIGHT +
                     report.lip_score * LIP_WEIGHT;
    double penalty = std::min(static_cast<double>(all_issues.size()) * ISSUE_PENALTY, MAX_ISSUE_PENALTY);
    report.overall = std::max(0.0, overall - penalty);
    report.is_consistent = report.overall > 0.6 && all_issues.size() < 5;

    std::set<std::string> unique(all_issues.begin(), all_issues.end());
    report.issues.assign(unique.begin(), unique.end());
    return report;
}
