#pragma once

namespace repatcher {

// Linear map from [src_beg, src_end] onto [dst_beg, dst_end].
// Inputs outside the source range extrapolate; nothing is clamped.
class Scaler {
public:
    // Throws std::invalid_argument when the source range has zero width.
    Scaler(double src_beg, double src_end, double dst_beg, double dst_end);

    double operator()(double v) const;

    double src_beg() const { return src_beg_; }
    double src_end() const { return src_beg_ + src_rng_; }
    double dst_beg() const { return dst_beg_; }
    double dst_end() const { return dst_beg_ + dst_rng_; }

private:
    double src_beg_;
    double src_rng_;
    double dst_beg_;
    double dst_rng_;
};

} // namespace repatcher
