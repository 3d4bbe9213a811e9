#include <tracking/vehicle_deduplicator.hpp>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace tp {
    VehicleDeduplicator::VehicleDeduplicator(TrackerConfig cfg)
        : cfg_(std::move(cfg)) {
        cfg_.confirm_hits = std::max(1, cfg_.confirm_hits);
        cfg_.stale_buckets = std::max<int64_t>(0, cfg_.stale_buckets);
    }

    int VehicleDeduplicator::observe(const DetectionSet& detections, int64_t bucket_index) {
        prune_(bucket_index);

        if (const auto* tracked = std::get_if<std::vector<TrackedDetection>>(&detections)) {
            return observe_tracked_(*tracked, bucket_index);
        }
        return observe_untracked_(std::get<std::vector<UntrackedDetection>>(detections), bucket_index);
    }

    void VehicleDeduplicator::reset() {
        tracks_.clear();
        next_track_id_ = 1;
        unique_count_ = 0;
    }

    int VehicleDeduplicator::observe_tracked_(const std::vector<TrackedDetection>& dets, int64_t bucket) {
        std::unordered_map<int64_t, size_t> by_id;
        by_id.reserve(tracks_.size());
        for (size_t i = 0; i < tracks_.size(); ++i) by_id[tracks_[i].id] = i;

        std::unordered_set<int64_t> seen_this_frame;
        int confirmed = 0;
        for (const auto& d : dets) {
            if (d.track_id < 0) continue;
            // one sighting per id per frame
            if (!seen_this_frame.insert(d.track_id).second) continue;

            auto it = by_id.find(d.track_id);
            if (it != by_id.end()) {
                confirmed += extend_(tracks_[it->second], d.box, bucket);
                continue;
            }

            confirmed += open_(d.track_id, d.box, bucket);
            by_id[d.track_id] = tracks_.size() - 1;
        }
        return confirmed;
    }

    int VehicleDeduplicator::observe_untracked_(const std::vector<UntrackedDetection>& dets, int64_t bucket) {
        struct PairScore {
            size_t ti = 0;
            size_t di = 0;
            float iou = 0.0f;
        };

        std::vector<PairScore> candidates;
        candidates.reserve(tracks_.size() * dets.size());
        for (size_t ti = 0; ti < tracks_.size(); ++ti) {
            for (size_t di = 0; di < dets.size(); ++di) {
                const float iou = iou_of(tracks_[ti].last_box, dets[di].box);
                if (iou > cfg_.iou_threshold) {
                    candidates.push_back(PairScore{ti, di, iou});
                }
            }
        }

        // best overlaps claim their partners first
        std::stable_sort(candidates.begin(),
                         candidates.end(),
                         [](const PairScore& a, const PairScore& b) { return a.iou > b.iou; });

        std::vector<char> track_taken(tracks_.size(), 0);
        std::vector<char> det_taken(dets.size(), 0);

        int confirmed = 0;
        for (const auto& c : candidates) {
            if (track_taken[c.ti] || det_taken[c.di]) continue;
            track_taken[c.ti] = 1;
            det_taken[c.di] = 1;
            confirmed += extend_(tracks_[c.ti], dets[c.di].box, bucket);
        }

        for (size_t di = 0; di < dets.size(); ++di) {
            if (det_taken[di]) continue;
            confirmed += open_(next_track_id_++, dets[di].box, bucket);
        }
        return confirmed;
    }

    int VehicleDeduplicator::extend_(Track& t, const Box& box, int64_t bucket) {
        t.last_box = box;
        t.age += 1;
        t.last_seen_bucket = std::max(t.last_seen_bucket, bucket);

        if (!t.confirmed && t.age >= cfg_.confirm_hits) {
            t.confirmed = true;
            ++unique_count_;
            return 1;
        }
        return 0;
    }

    int VehicleDeduplicator::open_(int64_t id, const Box& box, int64_t bucket) {
        Track t;
        t.id = id;
        t.last_box = box;
        t.age = 0;
        t.last_seen_bucket = bucket;
        tracks_.push_back(t);
        return extend_(tracks_.back(), box, bucket);
    }

    void VehicleDeduplicator::prune_(int64_t bucket) {
        // confirmed tracks leave the active set but stay in unique_count_
        tracks_.erase(
            std::remove_if(tracks_.begin(),
                           tracks_.end(),
                           [this, bucket](const Track& t) {
                               return bucket - t.last_seen_bucket > cfg_.stale_buckets;
                           }),
            tracks_.end());
    }
}
