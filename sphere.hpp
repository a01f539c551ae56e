#pragma once

#include "hittable.hpp"
#include "onb.hpp"

#include <algorithm>

//p: point on the unit sphere centered at the origin
//u: [0,1] angle around the Y axis, v: [0,1] angle from Y=-1 to Y=+1
inline void get_sphere_uv(const point3& p, double& u, double& v) {
	auto phi = std::atan2(p.z(), p.x());
	auto theta = std::asin(std::clamp(p.y(), -1.0, 1.0));
	u = 1 - (phi + pi) / (2 * pi);
	v = (theta + pi / 2) / pi;
}

//ray-sphere intersection logic shared by static and moving spheres
inline std::optional<hit_record> hit_sphere(
	const point3& center, double radius, const shared_ptr<material>& mat, const ray& r, interval ray_t
) {
	vec3 oc = r.origin() - center;
	auto a = r.direction().length_squared();
	auto half_b = dot(oc, r.direction());
	auto c = oc.length_squared() - radius * radius;
	auto discriminant = half_b * half_b - a * c;

	//check if ray hits the sphere
	if (discriminant <= 0) {
		return std::nullopt; //no intersections
	}
	auto sqrtd = std::sqrt(discriminant);

	//find the nearest root that lies in the acceptable range
	auto root = (-half_b - sqrtd) / a;
	if (!ray_t.admits(root)) {
		root = (-half_b + sqrtd) / a;
		if (!ray_t.admits(root)) {
			return std::nullopt;
		}
	}
	//save the record
	hit_record rec;
	rec.t = root;
	rec.p = r.at(rec.t);
	vec3 outward_normal = (rec.p - center) / radius;
	rec.set_face_normal(r, outward_normal);
	get_sphere_uv(outward_normal, rec.u, rec.v);
	rec.mat = mat;

	return rec;
}

class sphere : public hittable {
public:
	sphere(const point3& center, double radius, shared_ptr<material> mat)
		: center(center)
		, radius(std::fmax(0, radius)) //prevent from negative radius
		, mat(mat)
	{}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		return hit_sphere(center, radius, mat, r, ray_t);
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		auto rvec = vec3(radius, radius, radius);
		return aabb(center - rvec, center + rvec);
	}

	//uniform over the cone of directions subtended by the sphere
	double pdf_value(const point3& origin, const vec3& direction) const override {
		if (!hit_sphere(center, radius, mat, ray(origin, direction), interval(ray_epsilon, infinity))) {
			return 0.0;
		}

		auto distance_squared = (center - origin).length_squared();
		if (distance_squared <= radius * radius) {
			return 1.0 / (4 * pi); //origin inside the sphere, every direction hits it
		}

		auto cos_theta_max = std::sqrt(1 - radius * radius / distance_squared);
		auto solid_angle = 2 * pi * (1 - cos_theta_max);
		if (solid_angle < 1e-12) {
			return 0.0;
		}
		return 1.0 / solid_angle;
	}

	vec3 random(const point3& origin, rng& gen) const override {
		vec3 direction = center - origin;
		auto distance_squared = direction.length_squared();
		if (distance_squared <= radius * radius) {
			return random_unit_vector(gen);
		}
		onb uvw(direction);
		return uvw.local(random_to_sphere(gen, radius, distance_squared));
	}

private:
	point3 center; //sphere center
	double radius; //sphere radius
	shared_ptr<material> mat; //material pointer
};

//sphere moving linearly from center0 at time0 to center1 at time1
class moving_sphere : public hittable {
public:
	moving_sphere(
		const point3& center0, const point3& center1, double time0, double time1,
		double radius, shared_ptr<material> mat
	)
		: center0(center0)
		, center1(center1)
		, time0(time0)
		, time1(time1)
		, radius(std::fmax(0, radius))
		, mat(mat)
	{}

	point3 center(double time) const {
		if (time1 == time0) {
			return center0;
		}
		return center0 + ((time - time0) / (time1 - time0)) * (center1 - center0);
	}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		return hit_sphere(center(r.time()), radius, mat, r, ray_t);
	}

	//box swept over the requested time interval
	std::optional<aabb> bounding_box(double t0, double t1) const override {
		auto rvec = vec3(radius, radius, radius);
		aabb box0(center(t0) - rvec, center(t0) + rvec);
		aabb box1(center(t1) - rvec, center(t1) + rvec);
		return surrounding_box(box0, box1);
	}

private:
	point3 center0, center1;
	double time0, time1;
	double radius;
	shared_ptr<material> mat;
};
