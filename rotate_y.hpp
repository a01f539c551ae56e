#pragma once

#include "hittable.hpp"
#include "vec3.hpp"
#include <cmath>

//rotation of the wrapped object around the Y axis, angle in degrees
class rotate_y : public hittable {
public:
	rotate_y(shared_ptr<hittable> p, double angle)
		: ptr(p)
	{
		auto radians = degrees_to_radians(angle);
		sin_theta = std::sin(radians);
		cos_theta = std::cos(radians);
	}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {

		//world -> local (rotate by -theta)
		point3 origin = r.origin();
		vec3 dir = r.direction();

		origin[0] = cos_theta * r.origin()[0] - sin_theta * r.origin()[2];
		origin[2] = sin_theta * r.origin()[0] + cos_theta * r.origin()[2];

		dir[0] = cos_theta * r.direction()[0] - sin_theta * r.direction()[2];
		dir[2] = sin_theta * r.direction()[0] + cos_theta * r.direction()[2];

		ray rotated_r(origin, dir, r.time());

		auto rec = ptr->hit(rotated_r, ray_t, gen);
		if (!rec)
			return std::nullopt;

		//local -> world (rotate back by +theta)
		point3 p = rec->p;
		vec3 normal = rec->normal;

		p[0] = cos_theta * rec->p[0] + sin_theta * rec->p[2];
		p[2] = -sin_theta * rec->p[0] + cos_theta * rec->p[2];

		normal[0] = cos_theta * rec->normal[0] + sin_theta * rec->normal[2];
		normal[2] = -sin_theta * rec->normal[0] + cos_theta * rec->normal[2];

		//rotation keeps the normal facing against the ray, front_face is unchanged
		rec->p = p;
		rec->normal = normal;

		return rec;
	}

	//box around the 8 rotated corners of the wrapped object's box
	std::optional<aabb> bounding_box(double time0, double time1) const override {
		auto bbox = ptr->bounding_box(time0, time1);
		if (!bbox) {
			return std::nullopt;
		}
		//nothing inside, corners would be infinite
		if (bbox->is_empty()) {
			return aabb::empty;
		}

		point3 min(infinity, infinity, infinity);
		point3 max(-infinity, -infinity, -infinity);

		for (int i = 0; i < 2; i++) {
			for (int j = 0; j < 2; j++) {
				for (int k = 0; k < 2; k++) {
					auto x = i * bbox->x.max + (1 - i) * bbox->x.min;
					auto y = j * bbox->y.max + (1 - j) * bbox->y.min;
					auto z = k * bbox->z.max + (1 - k) * bbox->z.min;

					auto newx = cos_theta * x + sin_theta * z;
					auto newz = -sin_theta * x + cos_theta * z;

					vec3 tester(newx, y, newz);

					for (int c = 0; c < 3; c++) {
						min[c] = std::fmin(min[c], tester[c]);
						max[c] = std::fmax(max[c], tester[c]);
					}
				}
			}
		}
		return aabb(min, max);
	}

private:
	shared_ptr<hittable> ptr;
	double sin_theta;
	double cos_theta;
};
