#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include <common/config.hpp>
#include <pipeline/types.hpp>

namespace tp {
    // A hypothesized physical vehicle carried across frames.
    struct Track {
        int64_t id = -1;
        Box last_box;
        int age = 0;                  // frames in which the track was matched
        int64_t last_seen_bucket = 0;
        bool confirmed = false;
    };

    // Counts unique vehicles over a run. Adapter track ids are trusted when
    // present; otherwise detections are chained frame to frame by IoU.
    // Owned by exactly one analysis run or stream session.
    class VehicleDeduplicator {
    public:
        explicit VehicleDeduplicator(TrackerConfig cfg = {});

        // Feeds one frame. Returns how many tracks became confirmed by it.
        int observe(const DetectionSet& detections, int64_t bucket_index);

        int64_t unique_count() const { return unique_count_; }
        const std::vector<Track>& active_tracks() const { return tracks_; }

        void reset();

    private:
        int observe_untracked_(const std::vector<UntrackedDetection>& dets, int64_t bucket);
        int observe_tracked_(const std::vector<TrackedDetection>& dets, int64_t bucket);

        // extend an existing track; returns 1 if this match confirmed it
        int extend_(Track& t, const Box& box, int64_t bucket);
        int open_(int64_t id, const Box& box, int64_t bucket);
        void prune_(int64_t bucket);

        TrackerConfig cfg_;
        std::vector<Track> tracks_;
        int64_t next_track_id_ = 1;
        int64_t unique_count_ = 0;
    };
}
