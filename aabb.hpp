#pragma once

#include "interval.hpp"
#include "ray.hpp"

#include <utility>

//axis-aligned bounding box, one interval per axis
class aabb {
public:
	interval x, y, z;

	//default box is empty (contains nothing)
	aabb() {}

	aabb(const interval& x, const interval& y, const interval& z)
		: x(x)
		, y(y)
		, z(z)
	{
		pad_to_minimums();
	}

	//treat the two points a and b as extrema of the box, in any order
	aabb(const point3& a, const point3& b) {
		x = (a[0] <= b[0]) ? interval(a[0], b[0]) : interval(b[0], a[0]);
		y = (a[1] <= b[1]) ? interval(a[1], b[1]) : interval(b[1], a[1]);
		z = (a[2] <= b[2]) ? interval(a[2], b[2]) : interval(b[2], a[2]);

		pad_to_minimums();
	}

	//union of two boxes
	aabb(const aabb& box0, const aabb& box1)
		: x(box0.x, box1.x)
		, y(box0.y, box1.y)
		, z(box0.z, box1.z)
	{}

	point3 min() const { return point3(x.min, y.min, z.min); }
	point3 max() const { return point3(x.max, y.max, z.max); }

	const interval& axis_interval(int n) const {
		if (n == 1) return y;
		if (n == 2) return z;
		return x;
	}

	bool is_empty() const {
		return x.min > x.max || y.min > y.max || z.min > z.max;
	}

	//slab test, shrinks [ray_t.min, ray_t.max] axis by axis
	bool hit(const ray& r, interval ray_t) const {
		const point3& ray_orig = r.origin();
		const vec3& ray_dir = r.direction();

		for (int axis = 0; axis < 3; axis++) {
			const interval& ax = axis_interval(axis);
			const double adinv = 1.0 / ray_dir[axis];

			auto t0 = (ax.min - ray_orig[axis]) * adinv;
			auto t1 = (ax.max - ray_orig[axis]) * adinv;

			if (adinv < 0.0) {
				std::swap(t0, t1);
			}
			if (t0 > ray_t.min) ray_t.min = t0;
			if (t1 < ray_t.max) ray_t.max = t1;

			if (ray_t.max <= ray_t.min) {
				return false;
			}
		}
		return true;
	}

	static const aabb empty, universe;

private:
	//no side narrower than delta, so slab tests never divide a zero width
	void pad_to_minimums() {
		double delta = 0.0001;
		if (x.size() < delta) x = x.expand(delta);
		if (y.size() < delta) y = y.expand(delta);
		if (z.size() < delta) z = z.expand(delta);
	}
};

inline const aabb aabb::empty = aabb(interval::empty, interval::empty, interval::empty);
inline const aabb aabb::universe = aabb(interval::universe, interval::universe, interval::universe);

//smallest box enclosing both boxes
inline aabb surrounding_box(const aabb& box0, const aabb& box1) {
	return aabb(box0, box1);
}

//aabb translation by offset
inline aabb operator+(const aabb& bbox, const vec3& offset) {
	return aabb(bbox.x + offset.x(), bbox.y + offset.y(), bbox.z + offset.z());
}
