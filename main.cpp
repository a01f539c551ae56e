#include "rtweekend.hpp"
#include "scenes.hpp"
#include "bvh.hpp"
#include "image_output.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

//usage: pathtracer_app [scene] [output.png|output.ppm] [samples] [width] [seed] [map.hdr]
static void print_usage() {
	std::cerr << "usage: pathtracer_app [scene] [output] [samples] [width] [seed] [hdr]\nscenes:";
	for (const auto& [name, builder] : scene_registry()) {
		std::cerr << " " << name;
	}
	std::cerr << "\n";
}

//positive integer argument, throws std::invalid_argument / std::out_of_range
static int parse_positive(const std::string& text, const char* what) {
	size_t used = 0;
	int value = std::stoi(text, &used);
	if (used != text.size() || value <= 0) {
		throw std::invalid_argument(std::string(what) + " must be a positive integer, got '" + text + "'");
	}
	return value;
}

int main(int argc, char** argv) {
	std::string scene_name = (argc > 1) ? argv[1] : "cornell_box";
	std::string output = (argc > 2) ? argv[2] : "image.png";

	auto it = scene_registry().find(scene_name);
	if (it == scene_registry().end()) {
		std::cerr << "[Error] Unknown scene '" << scene_name << "'\n";
		print_usage();
		return 1;
	}

	try {
		std::uint32_t seed = (argc > 5) ? static_cast<std::uint32_t>(parse_positive(argv[5], "seed")) : 1u;

		//scene construction randomness comes from its own stream
		rng scene_gen(seed);
		scene s = it->second(scene_gen);

		if (argc > 3) s.cam.samples_per_pixel = parse_positive(argv[3], "samples");
		if (argc > 4) s.cam.image_width = parse_positive(argv[4], "width");
		s.cam.seed = seed;
		//replaces the scene background, a missing map leaves it black
		if (argc > 6 && s.env.load_hdr(argv[6])) {
			std::cerr << "[Info] Environment map '" << argv[6] << "'\n";
		}

		std::cerr << "[Info] Scene '" << scene_name << "': " << s.world.objects.size() << " objects, "
			<< s.cam.samples_per_pixel << " samples per pixel, max depth " << s.cam.max_depth << "\n";

		//wrap the whole scene into a BVH
		auto world = make_shared<bvh_node>(s.world, s.cam.time0, s.cam.time1, scene_gen);
		if (world->degraded_nodes() > 0) {
			std::cerr << "[Warning] " << world->degraded_nodes() << " BVH node(s) dropped, parts of the scene are missing\n";
		}

		auto start = std::chrono::steady_clock::now();
		auto framebuffer = s.cam.render(*world, s.lights.get(), s.env);
		std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
		std::cerr << "[Info] Done in " << elapsed.count() << " s\n";

		save_image(output, s.cam.image_width, s.cam.height(), framebuffer);
	}
	catch (const std::exception& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return 1;
	}

	return 0;
}
