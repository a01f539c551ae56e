#pragma once

#include "rtweekend.hpp"
#include "hdr_image.hpp"

#include <string>

//what a ray that misses every object sees
struct environment_settings {
	enum Mode {
		SOLID_COLOR,
		SKY_GRADIENT,
		HDR_MAP
	};
	Mode mode = SOLID_COLOR;

	color background_color = color(0.0, 0.0, 0.0);

	//GENERAL settings
	double intensity = 1.0; // overall intensity multiplier

	//HDRI map settings
	double hdri_rotation = 0.0; //yaw rotation in radians
	shared_ptr<hdr_image> hdr = nullptr;

	static environment_settings solid(const color& c) {
		environment_settings env;
		env.mode = SOLID_COLOR;
		env.background_color = c;
		return env;
	}

	static environment_settings sky() {
		environment_settings env;
		env.mode = SKY_GRADIENT;
		return env;
	}

	//loading hdr maps, on failure falls back to a black solid background
	bool load_hdr(const std::string& path) {
		auto image = make_shared<hdr_image>();
		if (path.empty() || !image->load(path)) {
			mode = SOLID_COLOR;
			background_color = color(0.0, 0.0, 0.0);
			std::cerr << "[Warning] Could not load HDR '" << path << "'. Falling back to black.\n";
			return false;
		}

		hdr = image;
		//after succesful loading switch mode to HDR
		mode = HDR_MAP;
		return true;
	}

	//background radiance along direction
	color value(const vec3& direction) const {
		switch (mode) {
		case SKY_GRADIENT: {
			vec3 unit_direction = unit_vector(direction);
			auto a = 0.5 * (unit_direction.y() + 1.0);
			return intensity * ((1.0 - a) * color(1.0, 1.0, 1.0) + a * color(0.5, 0.7, 1.0));
		}
		case HDR_MAP:
			if (hdr) {
				return intensity * hdr->environment(direction, hdri_rotation);
			}
			return color(0, 0, 0);
		case SOLID_COLOR:
		default:
			return intensity * background_color;
		}
	}
};
