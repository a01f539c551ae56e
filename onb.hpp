#pragma once

#include "vec3.hpp"

#include <cmath>

//orthonormal basis built around a normal w
class onb {
public:
	onb(const vec3& n) {
		axis[2] = unit_vector(n);
		//helper axis must not be parallel to w
		vec3 a = (std::fabs(axis[2].x()) > 0.9) ? vec3(0, 1, 0) : vec3(1, 0, 0);
		axis[1] = unit_vector(cross(axis[2], a));
		axis[0] = cross(axis[2], axis[1]);
	}

	const vec3& u() const { return axis[0]; }
	const vec3& v() const { return axis[1]; }
	const vec3& w() const { return axis[2]; }

	//local (a, b, c) -> world
	vec3 local(double a, double b, double c) const {
		return a * axis[0] + b * axis[1] + c * axis[2];
	}
	vec3 local(const vec3& v) const {
		return local(v.x(), v.y(), v.z());
	}

private:
	vec3 axis[3];
};
