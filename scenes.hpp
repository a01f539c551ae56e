#pragma once

//basic types
#include "rtweekend.hpp"
#include "camera.hpp"
#include "environment.hpp"
#include "material.hpp"
#include "texture.hpp"
//geometry (shapes)
#include "hittable_list.hpp"
#include "sphere.hpp"
#include "aarect.hpp"
#include "box.hpp"
#include "flip_face.hpp"
#include "constant_medium.hpp" //fog
#include "bvh.hpp"
//transformations
#include "translate.hpp"
#include "rotate_y.hpp"

//headers
#include <functional>
#include <map>
#include <memory>
#include <string>

//everything a render needs besides the output settings
struct scene {
	hittable_list world;
	shared_ptr<hittable> lights; //light sampling target, nullptr when the scene has none
	camera cam;
	environment_settings env;
};

//path of the globe texture used by several scenes
inline const std::string EARTH_TEXTURE = "assets/textures/earthmap.jpg";

//book one cover: many small spheres, diffuse ones bounce during the shutter interval
inline scene random_spheres(rng& gen) {
	scene s;

	auto checker = make_shared<checker_texture>(0.32, color(0.2, 0.3, 0.1), color(0.9, 0.9, 0.9));
	s.world.add(make_shared<sphere>(point3(0, -1000, 0), 1000, make_shared<lambertian>(checker)));

	for (int a = -11; a < 11; a++) {
		for (int b = -11; b < 11; b++) {
			auto choose_mat = random_double(gen);
			point3 center(a + 0.9 * random_double(gen), 0.2, b + 0.9 * random_double(gen));

			if ((center - point3(4, 0.2, 0)).length() <= 0.9) {
				continue;
			}

			if (choose_mat < 0.8) {
				//diffuse
				auto albedo = color::random(gen) * color::random(gen);
				auto center2 = center + vec3(0, random_double(gen, 0, 0.5), 0);
				s.world.add(make_shared<moving_sphere>(center, center2, 0.0, 1.0, 0.2, make_shared<lambertian>(albedo)));
			}
			else if (choose_mat < 0.95) {
				//metal
				auto albedo = color::random(gen, 0.5, 1);
				auto fuzz = random_double(gen, 0, 0.5);
				s.world.add(make_shared<sphere>(center, 0.2, make_shared<metal>(albedo, fuzz)));
			}
			else {
				//glass
				s.world.add(make_shared<sphere>(center, 0.2, make_shared<dielectric>(1.5)));
			}
		}
	}

	s.world.add(make_shared<sphere>(point3(0, 1, 0), 1.0, make_shared<dielectric>(1.5)));
	s.world.add(make_shared<sphere>(point3(-4, 1, 0), 1.0, make_shared<lambertian>(color(0.4, 0.2, 0.1))));
	s.world.add(make_shared<sphere>(point3(4, 1, 0), 1.0, make_shared<metal>(color(0.7, 0.6, 0.5), 0.0)));

	s.cam.aspect_ratio = 16.0 / 9.0;
	s.cam.image_width = 400;
	s.cam.samples_per_pixel = 100;
	s.cam.max_depth = 50;
	s.cam.vfov = 20;
	s.cam.lookfrom = point3(13, 2, 3);
	s.cam.lookat = point3(0, 0, 0);
	s.cam.defocus_angle = 0.6;
	s.cam.focus_dist = 10.0;
	s.cam.time0 = 0.0;
	s.cam.time1 = 1.0;

	s.env = environment_settings::sky();
	return s;
}

inline scene two_perlin_spheres(rng& gen) {
	scene s;

	auto pertext = make_shared<noise_texture>(4, gen);
	s.world.add(make_shared<sphere>(point3(0, -1000, 0), 1000, make_shared<lambertian>(pertext)));
	s.world.add(make_shared<sphere>(point3(0, 2, 0), 2, make_shared<lambertian>(pertext)));

	s.cam.aspect_ratio = 16.0 / 9.0;
	s.cam.image_width = 400;
	s.cam.samples_per_pixel = 100;
	s.cam.max_depth = 50;
	s.cam.vfov = 20;
	s.cam.lookfrom = point3(13, 2, 3);
	s.cam.lookat = point3(0, 0, 0);

	s.env = environment_settings::sky();
	return s;
}

inline scene earth(rng& gen) {
	scene s;

	auto earth_texture = make_shared<image_texture>(EARTH_TEXTURE);
	s.world.add(make_shared<sphere>(point3(0, 0, 0), 2, make_shared<lambertian>(earth_texture)));

	s.cam.aspect_ratio = 16.0 / 9.0;
	s.cam.image_width = 400;
	s.cam.samples_per_pixel = 100;
	s.cam.max_depth = 50;
	s.cam.vfov = 20;
	s.cam.lookfrom = point3(0, 0, 12);
	s.cam.lookat = point3(0, 0, 0);

	s.env = environment_settings::sky();
	return s;
}

//perlin spheres lit by a rectangle and a glowing sphere in the dark
inline scene simple_light(rng& gen) {
	scene s;

	auto pertext = make_shared<noise_texture>(4, gen);
	s.world.add(make_shared<sphere>(point3(0, -1000, 0), 1000, make_shared<lambertian>(pertext)));
	s.world.add(make_shared<sphere>(point3(0, 2, 0), 2, make_shared<lambertian>(pertext)));

	auto difflight = make_shared<diffuse_light>(color(4, 4, 4));
	s.world.add(make_shared<aa_rect>(plane::xy, 3, 5, 1, 3, -2, difflight));
	s.world.add(make_shared<sphere>(point3(0, 7, 0), 2, difflight));

	auto lights = make_shared<hittable_list>();
	lights->add(make_shared<aa_rect>(plane::xy, 3, 5, 1, 3, -2, nullptr));
	lights->add(make_shared<sphere>(point3(0, 7, 0), 2, nullptr));
	s.lights = lights;

	s.cam.aspect_ratio = 16.0 / 9.0;
	s.cam.image_width = 400;
	s.cam.samples_per_pixel = 100;
	s.cam.max_depth = 50;
	s.cam.vfov = 20;
	s.cam.lookfrom = point3(26, 3, 6);
	s.cam.lookat = point3(0, 2, 0);

	s.env = environment_settings::solid(color(0, 0, 0));
	return s;
}

//walls of the 555 x 555 x 555 cornell room, light opening excluded
inline void add_cornell_walls(hittable_list& world) {
	auto red = make_shared<lambertian>(color(0.65, 0.05, 0.05));
	auto white = make_shared<lambertian>(color(0.73, 0.73, 0.73));
	auto green = make_shared<lambertian>(color(0.12, 0.45, 0.15));

	world.add(make_shared<flip_face>(make_shared<aa_rect>(plane::yz, 0, 555, 0, 555, 555, green)));
	world.add(make_shared<aa_rect>(plane::yz, 0, 555, 0, 555, 0, red));
	world.add(make_shared<flip_face>(make_shared<aa_rect>(plane::xz, 0, 555, 0, 555, 555, white)));
	world.add(make_shared<aa_rect>(plane::xz, 0, 555, 0, 555, 0, white));
	world.add(make_shared<flip_face>(make_shared<aa_rect>(plane::xy, 0, 555, 0, 555, 555, white)));
}

inline void set_cornell_camera(camera& cam) {
	cam.aspect_ratio = 1.0;
	cam.image_width = 600;
	cam.samples_per_pixel = 100;
	cam.max_depth = 50;
	cam.vfov = 40;
	cam.lookfrom = point3(278, 278, -800);
	cam.lookat = point3(278, 278, 0);
	cam.defocus_angle = 0;
}

//ceiling light facing down, emitting material for the world, bare shape for sampling
inline void add_ceiling_light(scene& s, double x0, double x1, double z0, double z1, const color& emission) {
	auto light = make_shared<diffuse_light>(emission);
	s.world.add(make_shared<flip_face>(make_shared<aa_rect>(plane::xz, x0, x1, z0, z1, 554, light)));
	s.lights = make_shared<aa_rect>(plane::xz, x0, x1, z0, z1, 554, nullptr);
}

inline scene cornell_box(rng& gen) {
	scene s;

	add_cornell_walls(s.world);
	add_ceiling_light(s, 213, 343, 227, 332, color(15, 15, 15));

	auto white = make_shared<lambertian>(color(0.73, 0.73, 0.73));

	shared_ptr<hittable> box1 = make_shared<box>(point3(0, 0, 0), point3(165, 330, 165), white);
	box1 = make_shared<rotate_y>(box1, 15);
	box1 = make_shared<translate>(box1, vec3(265, 0, 295));
	s.world.add(box1);

	shared_ptr<hittable> box2 = make_shared<box>(point3(0, 0, 0), point3(165, 165, 165), white);
	box2 = make_shared<rotate_y>(box2, -18);
	box2 = make_shared<translate>(box2, vec3(130, 0, 65));
	s.world.add(box2);

	set_cornell_camera(s.cam);
	s.env = environment_settings::solid(color(0, 0, 0));
	return s;
}

//cornell box with the two blocks replaced by smoke
inline scene cornell_smoke(rng& gen) {
	scene s;

	add_cornell_walls(s.world);
	add_ceiling_light(s, 113, 443, 127, 432, color(7, 7, 7));

	auto white = make_shared<lambertian>(color(0.73, 0.73, 0.73));

	shared_ptr<hittable> box1 = make_shared<box>(point3(0, 0, 0), point3(165, 330, 165), white);
	box1 = make_shared<rotate_y>(box1, 15);
	box1 = make_shared<translate>(box1, vec3(265, 0, 295));

	shared_ptr<hittable> box2 = make_shared<box>(point3(0, 0, 0), point3(165, 165, 165), white);
	box2 = make_shared<rotate_y>(box2, -18);
	box2 = make_shared<translate>(box2, vec3(130, 0, 65));

	s.world.add(make_shared<constant_medium>(box1, 0.01, color(0, 0, 0)));
	s.world.add(make_shared<constant_medium>(box2, 0.01, color(1, 1, 1)));

	set_cornell_camera(s.cam);
	s.cam.samples_per_pixel = 200;
	s.env = environment_settings::solid(color(0, 0, 0));
	return s;
}

//cornell box with an aluminium block and a glass sphere, both the light and the sphere are sampled
inline scene cornell_glass(rng& gen) {
	scene s;

	add_cornell_walls(s.world);
	add_ceiling_light(s, 213, 343, 227, 332, color(15, 15, 15));

	auto aluminum = make_shared<metal>(color(0.8, 0.85, 0.88), 0.0);
	shared_ptr<hittable> box1 = make_shared<box>(point3(0, 0, 0), point3(165, 330, 165), aluminum);
	box1 = make_shared<rotate_y>(box1, 15);
	box1 = make_shared<translate>(box1, vec3(265, 0, 295));
	s.world.add(box1);

	auto glass = make_shared<dielectric>(1.5);
	s.world.add(make_shared<sphere>(point3(190, 90, 190), 90, glass));

	auto lights = make_shared<hittable_list>();
	lights->add(make_shared<aa_rect>(plane::xz, 213, 343, 227, 332, 554, nullptr));
	lights->add(make_shared<sphere>(point3(190, 90, 190), 90, nullptr));
	s.lights = lights;

	set_cornell_camera(s.cam);
	s.cam.samples_per_pixel = 1000;
	s.env = environment_settings::solid(color(0, 0, 0));
	return s;
}

//book two cover: ground of random boxes, fog, motion blur and a cluster of spheres
inline scene final_scene(rng& gen) {
	scene s;

	hittable_list boxes1;
	auto ground = make_shared<lambertian>(color(0.48, 0.83, 0.53));

	int boxes_per_side = 20;
	for (int i = 0; i < boxes_per_side; i++) {
		for (int j = 0; j < boxes_per_side; j++) {
			auto w = 100.0;
			auto x0 = -1000.0 + i * w;
			auto z0 = -1000.0 + j * w;
			auto y0 = 0.0;
			auto x1 = x0 + w;
			auto y1 = random_double(gen, 1, 101);
			auto z1 = z0 + w;

			boxes1.add(make_shared<box>(point3(x0, y0, z0), point3(x1, y1, z1), ground));
		}
	}
	s.world.add(make_shared<bvh_node>(boxes1, 0.0, 1.0, gen));

	auto light = make_shared<diffuse_light>(color(7, 7, 7));
	s.world.add(make_shared<flip_face>(make_shared<aa_rect>(plane::xz, 123, 423, 147, 412, 554, light)));
	s.lights = make_shared<aa_rect>(plane::xz, 123, 423, 147, 412, 554, nullptr);

	auto center1 = point3(400, 400, 200);
	auto center2 = center1 + vec3(30, 0, 0);
	auto moving_sphere_material = make_shared<lambertian>(color(0.7, 0.3, 0.1));
	s.world.add(make_shared<moving_sphere>(center1, center2, 0.0, 1.0, 50, moving_sphere_material));

	s.world.add(make_shared<sphere>(point3(260, 150, 45), 50, make_shared<dielectric>(1.5)));
	s.world.add(make_shared<sphere>(point3(0, 150, 145), 50, make_shared<metal>(color(0.8, 0.8, 0.9), 1.0)));

	//glass ball filled with blue fog
	auto boundary = make_shared<sphere>(point3(360, 150, 145), 70, make_shared<dielectric>(1.5));
	s.world.add(boundary);
	s.world.add(make_shared<constant_medium>(boundary, 0.2, color(0.2, 0.4, 0.9)));
	//thin mist over the whole scene
	boundary = make_shared<sphere>(point3(0, 0, 0), 5000, make_shared<dielectric>(1.5));
	s.world.add(make_shared<constant_medium>(boundary, 0.0001, color(1, 1, 1)));

	auto emat = make_shared<lambertian>(make_shared<image_texture>(EARTH_TEXTURE));
	s.world.add(make_shared<sphere>(point3(400, 200, 400), 100, emat));
	auto pertext = make_shared<noise_texture>(0.1, gen);
	s.world.add(make_shared<sphere>(point3(220, 280, 300), 80, make_shared<lambertian>(pertext)));

	hittable_list boxes2;
	auto white = make_shared<lambertian>(color(0.73, 0.73, 0.73));
	int ns = 1000;
	for (int j = 0; j < ns; j++) {
		boxes2.add(make_shared<sphere>(point3::random(gen, 0, 165), 10, white));
	}

	s.world.add(make_shared<translate>(
		make_shared<rotate_y>(make_shared<bvh_node>(boxes2, 0.0, 1.0, gen), 15),
		vec3(-100, 270, 395)
	));

	s.cam.aspect_ratio = 1.0;
	s.cam.image_width = 800;
	s.cam.samples_per_pixel = 1000;
	s.cam.max_depth = 40;
	s.cam.vfov = 40;
	s.cam.lookfrom = point3(478, 278, -600);
	s.cam.lookat = point3(278, 278, 0);
	s.cam.defocus_angle = 0;
	s.cam.time0 = 0.0;
	s.cam.time1 = 1.0;

	s.env = environment_settings::solid(color(0, 0, 0));
	return s;
}

//scene builders by command line name
inline const std::map<std::string, std::function<scene(rng&)>>& scene_registry() {
	static const std::map<std::string, std::function<scene(rng&)>> registry = {
		{ "random_spheres", random_spheres },
		{ "two_perlin_spheres", two_perlin_spheres },
		{ "earth", earth },
		{ "simple_light", simple_light },
		{ "cornell_box", cornell_box },
		{ "cornell_smoke", cornell_smoke },
		{ "cornell_glass", cornell_glass },
		{ "final_scene", final_scene },
	};
	return registry;
}
