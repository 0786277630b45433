#include "deepfake_analyzer.hpp"
#include "fakescan_errors.hpp"
#include <algorithm>
#include <future>
#include <iostream>

json AnalysisResult::toJson() const {
    return json{
        {"fake_score", scores.fake},
        {"real_score", scores.real},
        {"classification", classificationToString(classification)},
        {"confidence", confidence},
        {"details", details}
    };
}

DeepfakeAnalyzer::DeepfakeAnalyzer(DetectorContext& context)
    : context_(context),
      builder_(context.config(), context.extractor()),
      aggregator_(context.config()),
      finalizer_(context.config()) {
}

std::vector<FaceRegion> DeepfakeAnalyzer::extractFaceRegions(const cv::Mat& image,
                                                             const std::vector<FaceInfo>& faces) const {
    const probes::ProbeSet& probe_set = context_.probes();
    std::vector<FaceRegion> regions;

    for (size_t i = 0; i < faces.size(); ++i) {
        const FaceInfo& face = faces[i];
        FaceRegion region;
        region.face = face;
        region.rank = static_cast<int>(i);
        region.crop = context_.extractor().cropFace(image, face);
        if (region.crop.empty()) {
            std::cerr << "Deepfake analyzer: empty crop for face " << face.index << std::endl;
            continue;
        }

        probes::ProbeInput input;
        input.image = image;
        input.face_crop = region.crop;
        input.face = face;

        auto color = std::async(std::launch::async, [&probe_set, &input]() { return probe_set.color.evaluate(input); });
        auto noise = std::async(std::launch::async, [&probe_set, &input]() { return probe_set.noise.evaluate(input); });
        region.color_suspicion = color.get().score;
        region.noise_suspicion = noise.get().score;
        regions.push_back(region);
    }
    return regions;
}

std::map<std::string, probes::ProbeResult> DeepfakeAnalyzer::runProbes(
    const std::vector<const probes::Probe*>& probe_list, const probes::ProbeInput& input) const {
    std::vector<std::pair<std::string, std::future<probes::ProbeResult>>> pending;
    for (const probes::Probe* probe : probe_list) {
        pending.emplace_back(probe->name(), std::async(std::launch::async, [probe, &input]() {
            return probe->evaluate(input);
        }));
    }

    std::map<std::string, probes::ProbeResult> results;
    for (auto& entry : pending) {
        results[entry.first] = entry.second.get();
    }
    return results;
}

probes::ProbeResult DeepfakeAnalyzer::runPerFace(const probes::Probe& probe, const cv::Mat& image,
                                                 const std::vector<FaceRegion>& regions,
                                                 const std::vector<unsigned char>* raw_bytes) const {
    std::optional<probes::ProbeResult> worst;
    int worst_index = -1;
    for (const FaceRegion& region : regions) {
        probes::ProbeInput input;
        input.image = image;
        input.face_crop = region.crop;
        input.face = region.face;
        input.raw_bytes = raw_bytes;

        probes::ProbeResult result = probe.evaluate(input);
        if (!worst || result.score > worst->score) {
            worst = result;
            worst_index = region.rank;
        }
    }

    if (!worst) {
        return probes::Probe::neutral("no_face");
    }
    worst->details["face_index"] = worst_index;
    return *worst;
}

void DeepfakeAnalyzer::scoreFrames(const std::vector<AnalysisFrame>& frames, AggregationContext& aggregation) {
    std::vector<cv::Mat> images;
    images.reserve(frames.size());
    for (const AnalysisFrame& frame : frames) {
        images.push_back(frame.image);
    }

    std::vector<FrameScore> scores = context_.classifier().classifyBatch(images);
    if (scores.size() != frames.size()) {
        throw ClassifierError("classifier returned " + std::to_string(scores.size()) +
                              " scores for " + std::to_string(frames.size()) + " frames");
    }

    for (size_t i = 0; i < frames.size(); ++i) {
        ScoredFrame scored;
        scored.name = frames[i].name;
        scored.kind = frames[i].kind;
        scored.weight = frames[i].weight;
        scored.face_index = frames[i].face_index;
        scored.video_frame = frames[i].video_frame;
        scored.score = scores[i];
        aggregation.frames.push_back(scored);
    }
}

AggregationContext DeepfakeAnalyzer::analyzeImage(const DecodedMedia& media) {
    const cv::Mat& image = media.frames.front();
    const probes::ProbeSet& probe_set = context_.probes();

    std::vector<FaceInfo> faces = context_.faceLocator().detectFaces(image);
    std::cout << "Deepfake analyzer: " << faces.size() << " face(s) in "
              << image.cols << "x" << image.rows << " image" << std::endl;

    std::vector<FaceRegion> regions = extractFaceRegions(image, faces);

    probes::ProbeInput primary;
    primary.image = image;
    primary.raw_bytes = media.raw_bytes.empty() ? nullptr : &media.raw_bytes;
    if (!regions.empty()) {
        primary.face_crop = regions.front().crop;
        primary.face = regions.front().face;
    }

    std::vector<const probes::Probe*> image_probes = {
        &probe_set.frequency, &probe_set.color, &probe_set.noise, &probe_set.compression,
        &probe_set.exif, &probe_set.filter, &probe_set.screen, &probe_set.stylization
    };
    if (faces.empty()) {
        image_probes.push_back(&probe_set.scene);
    }

    auto blending = std::async(std::launch::async, [&]() {
        return runPerFace(probe_set.blending, image, regions, primary.raw_bytes);
    });
    auto landmark = std::async(std::launch::async, [&]() {
        return runPerFace(probe_set.landmark, image, regions, primary.raw_bytes);
    });

    AggregationContext aggregation;
    aggregation.media_type = MediaType::IMAGE;
    aggregation.faces_detected = static_cast<int>(faces.size());
    aggregation.probe_results = runProbes(image_probes, primary);
    aggregation.probe_results["blending"] = blending.get();
    aggregation.probe_results["landmark"] = landmark.get();

    std::vector<AnalysisFrame> frames = builder_.buildImageFrames(image, regions);
    std::cout << "Deepfake analyzer: classifying " << frames.size() << " analysis frames" << std::endl;
    scoreFrames(frames, aggregation);
    return aggregation;
}

AggregationContext DeepfakeAnalyzer::analyzeVideo(const DecodedMedia& media) {
    const probes::ProbeSet& probe_set = context_.probes();

    std::vector<VideoSample> samples;
    std::vector<std::vector<FaceInfo>> faces_per_sample;
    int max_faces = 0;
    int total_faces = 0;

    for (size_t j = 0; j < media.frames.size(); ++j) {
        VideoSample sample;
        sample.frame = media.frames[j];
        sample.frame_index = j < media.frame_indices.size() ? media.frame_indices[j] : static_cast<int>(j);
        sample.faces = context_.faceLocator().detectFaces(sample.frame);
        for (const FaceInfo& face : sample.faces) {
            sample.crops.push_back(context_.extractor().cropFace(sample.frame, face));
        }
        max_faces = std::max(max_faces, static_cast<int>(sample.faces.size()));
        total_faces += static_cast<int>(sample.faces.size());
        faces_per_sample.push_back(sample.faces);
        samples.push_back(sample);
    }
    std::cout << "Deepfake analyzer: " << total_faces << " face(s) across "
              << samples.size() << " video samples" << std::endl;

    probes::ProbeInput primary;
    primary.image = media.frames.front();
    for (const VideoSample& sample : samples) {
        if (!sample.crops.empty() && !sample.crops.front().empty()) {
            primary.face_crop = sample.crops.front();
            primary.face = sample.faces.front();
            break;
        }
    }

    std::vector<const probes::Probe*> video_probes = {
        &probe_set.frequency, &probe_set.color, &probe_set.noise, &probe_set.filter, &probe_set.screen
    };
    if (max_faces == 0) {
        video_probes.push_back(&probe_set.scene);
    }

    auto consistency = std::async(std::launch::async, [&]() {
        return video_analyzer_.analyze(media.frames, faces_per_sample);
    });

    AggregationContext aggregation;
    aggregation.media_type = MediaType::VIDEO;
    aggregation.faces_detected = max_faces;
    aggregation.probe_results = runProbes(video_probes, primary);
    aggregation.video_consistency = consistency.get();

    std::vector<AnalysisFrame> frames = builder_.buildVideoFrames(samples);
    std::cout << "Deepfake analyzer: classifying " << frames.size() << " video analysis frames" << std::endl;
    scoreFrames(frames, aggregation);
    return aggregation;
}

AnalysisResult DeepfakeAnalyzer::analyze(const DecodedMedia& media) {
    if (media.frames.empty() || media.frames.front().empty()) {
        throw MediaDecodeError("no decoded frames to analyze");
    }
    if (!context_.isReady()) {
        throw ClassifierError("detector context is not initialized");
    }

    AggregationContext aggregation = media.type == MediaType::VIDEO ? analyzeVideo(media) : analyzeImage(media);
    AggregationResult aggregated = aggregator_.aggregate(aggregation);
    Verdict verdict = finalizer_.finalize(aggregated.scores);

    std::cout << "Deepfake analyzer: " << classificationToString(verdict.classification)
              << " (fake " << aggregated.scores.fake << ", confidence " << verdict.confidence << ")" << std::endl;

    AnalysisResult result;
    result.scores = aggregated.scores;
    result.classification = verdict.classification;
    result.confidence = verdict.confidence;
    result.details = std::move(aggregated.details);
    return result;
}
