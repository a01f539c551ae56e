#pragma once

#include <cmath>
#include <limits>

//closed range [min, max] of reals
//used for ray parameter windows (t) and for the slabs of a bounding box
class interval {
public:
	double min, max;

	//default range is empty, min above max
	interval()
		: min(+std::numeric_limits<double>::infinity())
		, max(-std::numeric_limits<double>::infinity())
	{}

	interval(double min, double max)
		: min(min)
		, max(max)
	{}

	//smallest range enclosing both a and b
	interval(const interval& a, const interval& b)
		: min(std::fmin(a.min, b.min))
		, max(std::fmax(a.max, b.max))
	{}

	double size() const { return max - min; }

	//closed test, used for clamping and texture lookups
	bool contains(double x) const { return min <= x && x <= max; }
	//ray hit window, open at min and closed at max
	bool admits(double t) const { return min < t && t <= max; }

	double clamp(double x) const {
		if (x < min) return min;
		if (x > max) return max;
		return x;
	}

	//grow by delta in total, half on each side
	interval expand(double delta) const {
		auto half = delta / 2;
		return interval(min - half, max + half);
	}

	static const interval empty, universe;
};

inline const interval interval::empty = interval();
inline const interval interval::universe = interval(-std::numeric_limits<double>::infinity(), +std::numeric_limits<double>::infinity());

//shift both ends by displacement
inline interval operator+(const interval& ival, double displacement) {
	return interval(ival.min + displacement, ival.max + displacement);
}

inline interval operator+(double displacement, const interval& ival) {
	return ival + displacement;
}
