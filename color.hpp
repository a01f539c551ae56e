#pragma once

#include "interval.hpp"
#include "vec3.hpp"

#include <cmath>
#include <vector>

//color is allias for vec3, but useful for clarity in the code
using color = vec3;

//gamma correction
inline double linear_to_gamma(double linear_component) {
	if (linear_component > 0) {
		return std::sqrt(linear_component);
	}
	return 0;
}

//replace NaN components with zero so one bad sample does not poison a pixel
inline color de_nan(const color& c) {
	return color(
		std::isnan(c.x()) ? 0.0 : c.x(),
		std::isnan(c.y()) ? 0.0 : c.y(),
		std::isnan(c.z()) ? 0.0 : c.z()
	);
}

//save averaged linear pixel_color to the byte buffer at idx (8 bits per channel)
inline void write_color(std::vector<unsigned char>& image, int idx, const color& pixel_color) {
	//gamma correction
	double r = linear_to_gamma(pixel_color.x());
	double g = linear_to_gamma(pixel_color.y());
	double b = linear_to_gamma(pixel_color.z());

	//translate the [0,1] component values to the byte range [0,255]
	static const interval intensity(0.000, 0.999);
	image[idx + 0] = static_cast<unsigned char>(256 * intensity.clamp(r));
	image[idx + 1] = static_cast<unsigned char>(256 * intensity.clamp(g));
	image[idx + 2] = static_cast<unsigned char>(256 * intensity.clamp(b));
}
