#include "reference_frame.hpp"
#include <cmath>
#include <stdexcept>

ReferenceFrame::ReferenceFrame(double anchor0, double anchor1)
    : anchor0_(anchor0), anchor1_(anchor1) {
    if (anchor0 == anchor1) {
        throw std::invalid_argument("Reference frame anchors must differ");
    }
}

double ReferenceFrame::ratio(double price) const {
    return (price - anchor0_) / (anchor1_ - anchor0_);
}

double ReferenceFrame::price(double ratio) const {
    return anchor0_ + ratio * (anchor1_ - anchor0_);
}

bool ReferenceFrame::is_violated(double price, double tolerance) const {
    return ratio(price) < -tolerance;
}

double ReferenceFrame::range() const {
    return std::fabs(anchor1_ - anchor0_);
}
