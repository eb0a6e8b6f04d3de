/**
 * @file StopSequenceDetector.hpp
 * @brief Trailing-text matcher for configured stop strings
 *
 * Keeps the last 2 * longest_stop characters of decoded output in a fixed
 * circular buffer. Each decoded fragment is searched together with the
 * buffered tail, so a stop string split across fragments is still found.
 */

#ifndef TL_STOP_SEQUENCE_DETECTOR_HPP
#define TL_STOP_SEQUENCE_DETECTOR_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tl {

class StopSequenceDetector {
public:
    StopSequenceDetector() = default;

    void configure(const std::vector<std::string>& stops) {
        stops_ = stops;
        size_t longest = 0;
        for (const auto& s : stops_) longest = std::max(longest, s.size());
        ring_.assign(longest * 2, '\0');
        window_.clear();
        window_.reserve(longest * 4);
        head_ = 0;
        filled_ = 0;
    }

    bool enabled() const { return !ring_.empty(); }

    void reset() {
        head_ = 0;
        filled_ = 0;
    }

    /**
     * Feeds one decoded fragment. Returns the index of the first configured
     * stop string now present in the trailing text, or -1.
     */
    int append(std::string_view fragment) {
        if (!enabled() || fragment.empty()) return -1;

        /* Reconstruct the tail in order, then add the new fragment. */
        linearize(window_);
        window_.append(fragment.data(), fragment.size());

        int hit = -1;
        for (size_t i = 0; i < stops_.size(); ++i) {
            if (window_.find(stops_[i]) != std::string::npos) {
                hit = static_cast<int>(i);
                break;
            }
        }

        for (char c : fragment) push(c);
        return hit;
    }

    const std::string& stop(int index) const { return stops_[static_cast<size_t>(index)]; }
    size_t capacity() const { return ring_.size(); }

    /** Current buffered tail, oldest first. */
    std::string tail() const {
        std::string out;
        linearize(out);
        return out;
    }

private:
    void push(char c) {
        ring_[head_] = c;
        head_ = (head_ + 1) % ring_.size();
        if (filled_ < ring_.size()) ++filled_;
    }

    void linearize(std::string& out) const {
        out.clear();
        if (filled_ < ring_.size()) {
            out.append(ring_.data(), filled_);
        } else {
            /* Wrapped: oldest byte sits at head_. */
            out.append(ring_.data() + head_, ring_.size() - head_);
            out.append(ring_.data(), head_);
        }
    }

    std::vector<std::string> stops_;
    std::vector<char>        ring_;
    std::string              window_;
    size_t                   head_   = 0;
    size_t                   filled_ = 0;
};

} // namespace tl

#endif // TL_STOP_SEQUENCE_DETECTOR_HPP
