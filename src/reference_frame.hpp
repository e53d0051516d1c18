#pragma once

// Oriented price coordinates for a leg.
//
//   ratio 0 = anchor0, the defended level (leg origin)
//   ratio 1 = anchor1, the far extreme (leg pivot)
//   ratio 2 = target, one full range beyond the pivot
//
// The sign of (anchor1 - anchor0) carries the direction, so the same
// arithmetic serves bull and bear legs. Negative ratios are beyond the
// defended level.
class ReferenceFrame {
public:
    // Throws std::invalid_argument when the anchors coincide
    ReferenceFrame(double anchor0, double anchor1);

    double ratio(double price) const;
    double price(double ratio) const;
    bool is_violated(double price, double tolerance = 0.0) const;

    double anchor0() const { return anchor0_; }
    double anchor1() const { return anchor1_; }
    double range() const;

private:
    double anchor0_;
    double anchor1_;
};
