#pragma once

#include "hittable.hpp"

//swaps which side of the wrapped object counts as its front face
class flip_face : public hittable {
public:
	flip_face(shared_ptr<hittable> p)
		: ptr(p)
	{}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		auto rec = ptr->hit(r, ray_t, gen);
		if (!rec) {
			return std::nullopt;
		}

		rec->front_face = !rec->front_face;
		return rec;
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		return ptr->bounding_box(time0, time1);
	}

	double pdf_value(const point3& origin, const vec3& direction) const override {
		return ptr->pdf_value(origin, direction);
	}

	vec3 random(const point3& origin, rng& gen) const override {
		return ptr->random(origin, gen);
	}

private:
	shared_ptr<hittable> ptr;
};
