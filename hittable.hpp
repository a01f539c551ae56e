#pragma once

#include "rtweekend.hpp"
#include "aabb.hpp"

#include <optional>

class material; //forward declaration to avoid circular dependency
//holds information about the intersection between a ray and an object
class hit_record {
public:
	point3 p;         //intersection point
	vec3 normal;      //normal vector at the intersection point, always against the ray
	shared_ptr<material> mat; //shared_ptr on material
	double t = 0.0;   //distance along the ray to the intersection point
	bool front_face = false; //flag for front/back face hit;
	double u = 0.0;   //u texture coordinate
	double v = 0.0;   //v texture coordinate


	//sets the hit record normal vector, 'outward_normal' is assumed to have unit length
	void set_face_normal(const ray& r, const vec3& outward_normal) {
		front_face = dot(r.direction(), outward_normal) < 0;
		normal = front_face ? outward_normal : -outward_normal;
	}
};

//virtual abstract class for hittable objects
//implementers: sphere, moving_sphere, aa_rect, box, constant_medium,
//translate, rotate_y, flip_face, hittable_list, bvh_node
class hittable {
public:
	virtual ~hittable() = default;

	//nearest intersection with t inside the open interval ray_t, if any
	//gen is only consumed by primitives that hit probabilistically (fog)
	virtual std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const = 0;

	//box enclosing the object over [time0, time1], none for unbounded objects
	virtual std::optional<aabb> bounding_box(double time0, double time1) const = 0;

	//solid angle density of sampling `direction` from `origin` towards this object
	//objects which cannot be used as light sampling targets keep the defaults
	virtual double pdf_value(const point3& origin, const vec3& direction) const {
		return 0.0;
	}

	//random direction from origin towards this object
	virtual vec3 random(const point3& origin, rng& gen) const {
		return vec3(1, 0, 0);
	}
};
