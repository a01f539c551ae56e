#pragma once

#include "rtweekend.hpp"
#include "hittable.hpp"
#include "material.hpp"
#include "texture.hpp"

//homogeneous participating medium (fog) filling the boundary shape
class constant_medium : public hittable {
public:
	//boundary: fog shape (box or sphere) density: d, tex: color/texture
	constant_medium(shared_ptr<hittable> boundary, double density, shared_ptr<texture> tex)
		: boundary(boundary)
		, neg_inv_density(-1.0 / density)
		, phase_function(make_shared<isotropic>(tex))
	{}

	constant_medium(shared_ptr<hittable> boundary, double density, color c)
		: boundary(boundary)
		, neg_inv_density(-1.0 / density)
		, phase_function(make_shared<isotropic>(c))
	{}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		//entry and exit through the boundary
		auto rec1 = boundary->hit(r, interval::universe, gen);
		if (!rec1) return std::nullopt;
		auto rec2 = boundary->hit(r, interval(rec1->t + 0.0001, infinity), gen);
		if (!rec2) return std::nullopt;

		auto t_enter = rec1->t;
		auto t_exit = rec2->t;

		if (t_enter < ray_t.min) t_enter = ray_t.min;
		if (t_exit > ray_t.max) t_exit = ray_t.max;

		if (t_enter >= t_exit) return std::nullopt;
		if (t_enter < 0) t_enter = 0;

		//random free flight distance
		auto ray_length = r.direction().length();
		auto distance_inside_boundary = (t_exit - t_enter) * ray_length;
		auto hit_distance = neg_inv_density * std::log(random_double(gen));

		if (hit_distance > distance_inside_boundary) return std::nullopt;

		hit_record rec;
		rec.t = t_enter + hit_distance / ray_length;
		rec.p = r.at(rec.t);
		rec.normal = vec3(1, 0, 0);  //arbitrary, irrelevant when dispersed
		rec.front_face = true;
		rec.mat = phase_function;

		return rec;
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		return boundary->bounding_box(time0, time1);
	}

private:
	shared_ptr<hittable> boundary;
	double neg_inv_density;
	shared_ptr<material> phase_function;
};
