#pragma once

#include "hittable.hpp"
#include "vec3.hpp"

class translate : public hittable {
public:
	translate(shared_ptr<hittable> p, const vec3& displacement)
		: ptr(p)
		, offset(displacement)
	{
	}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {

		//world -> local(move ray in opposite direction of offset)
		ray moved_r(
			r.origin() - offset,
			r.direction(),
			r.time()
		);

		auto rec = ptr->hit(moved_r, ray_t, gen);
		if (!rec)
			return std::nullopt;
		//local -> world(move intersection point back)
		//normal and front_face remain the same (no rotation applied)
		rec->p += offset;

		return rec;
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		auto bbox = ptr->bounding_box(time0, time1);
		if (!bbox) {
			return std::nullopt;
		}
		return *bbox + offset;
	}

private:
	shared_ptr<hittable> ptr;
	vec3 offset;

};
