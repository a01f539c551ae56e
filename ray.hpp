#pragma once

#include "vec3.hpp"

class ray {
public:
	//default constructor
	ray() {}

	//parametric constructor, creates the object with initial values
	ray(const point3& origin, const vec3& direction, double time = 0.0)
		: orig(origin)
		, dir(direction)
		, tm(time) {}

	//getters
	const point3& origin() const { return orig; }
	const vec3& direction() const { return dir; }
	double time() const { return tm; }

	//return the point at radius for parameter t
	point3 at(double t) const { return orig + t * dir; }

private:
	point3 orig;
	vec3 dir;
	double tm = 0.0; //moment the ray exists at (motion blur)
};
