#include "scaler.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace repatcher {

Scaler::Scaler(double src_beg, double src_end, double dst_beg, double dst_end)
    : src_beg_(src_beg),
      src_rng_(src_end - src_beg),
      dst_beg_(dst_beg),
      dst_rng_(dst_end - dst_beg)
{
    if (!std::isfinite(src_rng_) || !std::isfinite(dst_rng_) || src_rng_ == 0.0) {
        std::ostringstream os;
        os << "degenerate scaler range [" << src_beg << ", " << src_end
           << "] -> [" << dst_beg << ", " << dst_end << "]";
        throw std::invalid_argument(os.str());
    }
}

double Scaler::operator()(double v) const {
    return ((v - src_beg_) / src_rng_) * dst_rng_ + dst_beg_;
}

} // namespace repatcher
