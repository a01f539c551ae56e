#pragma once

#include <cmath>
#include <random>
#include <iostream>
#include <limits>
#include <memory>

//c++ std usings
using std::make_shared;
using std::shared_ptr;

//constants
constexpr double infinity = std::numeric_limits<double>::infinity();
constexpr double pi = 3.14159265358979323846;

//min ray distance used by the integrator (avoid self intersection / shadow acne)
constexpr double ray_epsilon = 0.001;

//random number stream, owned by exactly one worker and passed down the call chain
using rng = std::mt19937;

//utility functions

//convert degrees to radians
inline double degrees_to_radians(double degrees) {
	return degrees * pi / 180.0;
}

//generates a random double between 0 and 1
inline double random_double(rng& gen) {
	std::uniform_real_distribution<double> dis(0.0, 1.0); //uniform distribution [0,1)
	return dis(gen);
}

//generates a random double between `min` and `max`
inline double random_double(rng& gen, double min, double max) {
	return min + (max - min) * random_double(gen);
}

//generates a random integer in [min, max]
inline int random_int(rng& gen, int min, int max) {
	std::uniform_int_distribution<int> dis(min, max);
	return dis(gen);
}

//common headers
#include "color.hpp"
#include "interval.hpp"
#include "ray.hpp"

//cosine weighted direction around +z
inline vec3 random_cosine_direction(rng& gen) {
	auto r1 = random_double(gen);
	auto r2 = random_double(gen);

	auto phi = 2 * pi * r1;
	auto x = std::cos(phi) * std::sqrt(r2);
	auto y = std::sin(phi) * std::sqrt(r2);
	auto z = std::sqrt(1 - r2);

	return vec3(x, y, z);
}

//direction around +z towards a sphere of `radius` seen from `distance_squared` away
inline vec3 random_to_sphere(rng& gen, double radius, double distance_squared) {
	auto r1 = random_double(gen);
	auto r2 = random_double(gen);
	auto z = 1 + r2 * (std::sqrt(1 - radius * radius / distance_squared) - 1);

	auto phi = 2 * pi * r1;
	auto x = std::cos(phi) * std::sqrt(1 - z * z);
	auto y = std::sin(phi) * std::sqrt(1 - z * z);

	return vec3(x, y, z);
}
