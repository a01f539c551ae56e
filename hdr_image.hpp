#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "rtweekend.hpp"
#include "stb_image.h"

//equirectangular high dynamic range image (linear float RGB)
class hdr_image {
public:
	int width = 0;
	int height = 0;
	std::vector<vec3> data;

	//loading HDR file using stb_image
	bool load(const std::string& filename) {
		float* pixels = stbi_loadf(filename.c_str(), &width, &height, nullptr, 3);
		if (!pixels) {
			std::cerr << "[Warning] Failed to load HDR image: " << filename << "\n";
			width = height = 0;
			return false;
		}

		data.resize(static_cast<size_t>(width) * height);

		for (size_t i = 0; i < data.size(); i++) {
			data[i] = vec3(
				pixels[i * 3 + 0],
				pixels[i * 3 + 1],
				pixels[i * 3 + 2]
			);
		}

		stbi_image_free(pixels);
		return true;
	}

	bool empty() const { return width == 0 || height == 0; }

	//sample pixel (u,v in [0..1])
	vec3 sample(double u, double v) const {
		if (empty()) {
			return vec3(0, 0, 0);
		}

		//wrap around
		u = u - std::floor(u);
		v = v - std::floor(v);

		int x = std::clamp(int(u * width), 0, width - 1);
		int y = std::clamp(int(v * height), 0, height - 1);

		return data[static_cast<size_t>(y) * width + x];
	}

	//converts ray direction -> spherical coords -> HDR sample, yaw in radians
	vec3 environment(const vec3& d, double yaw) const {
		vec3 nd = unit_vector(d);

		//azimuth around Y
		double phi = std::atan2(nd.z(), nd.x()) + pi + yaw;
		//polar angle from +Y
		double theta = std::acos(std::clamp(nd.y(), -1.0, 1.0));

		//uv mapping
		double u = phi / (2.0 * pi);
		double v = theta / pi;

		return sample(u, v);
	}
};
