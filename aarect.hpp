#pragma once

#include "hittable.hpp"

//plane an axis-aligned rectangle lies in
enum class plane {
	xy, //constant z
	xz, //constant y
	yz  //constant x
};

//axis-aligned rectangle [a0,a1] x [b0,b1] at coordinate k on the remaining axis
//outward normal points along +k axis
class aa_rect : public hittable {
public:
	aa_rect(plane orientation, double a0, double a1, double b0, double b1, double k, shared_ptr<material> mat)
		: a0(a0)
		, a1(a1)
		, b0(b0)
		, b1(b1)
		, k(k)
		, mat(mat)
	{
		switch (orientation) {
		case plane::xy: a_axis = 0; b_axis = 1; k_axis = 2; break;
		case plane::xz: a_axis = 0; b_axis = 2; k_axis = 1; break;
		case plane::yz: a_axis = 1; b_axis = 2; k_axis = 0; break;
		}
	}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		return intersect(r, ray_t);
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		//aabb pads the zero width k dimension
		point3 p0, p1;
		p0[a_axis] = a0; p0[b_axis] = b0; p0[k_axis] = k;
		p1[a_axis] = a1; p1[b_axis] = b1; p1[k_axis] = k;
		return aabb(p0, p1);
	}

	//area light density converted to solid angle
	double pdf_value(const point3& origin, const vec3& direction) const override {
		auto rec = intersect(ray(origin, direction), interval(ray_epsilon, infinity));
		if (!rec) {
			return 0.0;
		}

		auto area = (a1 - a0) * (b1 - b0);
		auto distance_squared = rec->t * rec->t * direction.length_squared();
		auto cosine = std::fabs(dot(direction, outward_normal()) / direction.length());
		//grazing directions carry no measurable density
		if (cosine < 1e-8 || area <= 0) {
			return 0.0;
		}

		return distance_squared / (cosine * area);
	}

	vec3 random(const point3& origin, rng& gen) const override {
		point3 p;
		p[a_axis] = random_double(gen, a0, a1);
		p[b_axis] = random_double(gen, b0, b1);
		p[k_axis] = k;
		return p - origin;
	}

private:
	double a0, a1, b0, b1, k;
	shared_ptr<material> mat;
	int a_axis = 0, b_axis = 1, k_axis = 2;

	vec3 outward_normal() const {
		vec3 n;
		n[k_axis] = 1.0;
		return n;
	}

	std::optional<hit_record> intersect(const ray& r, interval ray_t) const {
		//parameter where the ray crosses the rectangle plane
		auto t = (k - r.origin()[k_axis]) / r.direction()[k_axis];
		if (!ray_t.admits(t)) {
			return std::nullopt;
		}

		auto a = r.origin()[a_axis] + t * r.direction()[a_axis];
		auto b = r.origin()[b_axis] + t * r.direction()[b_axis];
		if (a < a0 || a > a1 || b < b0 || b > b1) {
			return std::nullopt;
		}

		hit_record rec;
		rec.u = (a - a0) / (a1 - a0);
		rec.v = (b - b0) / (b1 - b0);
		rec.t = t;
		rec.set_face_normal(r, outward_normal());
		rec.mat = mat;
		rec.p = r.at(t);

		return rec;
	}
};
