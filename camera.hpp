#pragma once

#include "rtweekend.hpp"
#include "hittable.hpp"
#include "integrator.hpp"
#include "environment.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

class camera {
public:
	//image settings
	double aspect_ratio = 1.0;  //ratio of image width over height
	int image_width = 100;      //rendered image width in pixel count
	int samples_per_pixel = 10; //count of random samples for each pixel
	int max_depth = 10;         //max recursion depth

	//camera settings
	double vfov = 90; //vertical view angle (field of view)
	point3 lookfrom = point3(0, 0, 0); //point where camera is looking from
	point3 lookat = point3(0, 0, -1); //point where camera is looking at
	vec3 vup = vec3(0, 1, 0); //camera-relative "up" direction

	//defocus blur
	double defocus_angle = 0; //variation angle of rays through each pixel
	double focus_dist = 10; //distance from camera lookfrom point to plane of perfect focus

	//shutter interval, every ray gets a random time inside it (motion blur)
	double time0 = 0.0;
	double time1 = 0.0;

	//render settings
	std::uint32_t seed = 1; //base seed, each image row derives its own stream from it
	int num_threads = 0;    //0 = number of cores
	bool show_progress = true;

	//render the scene, returns the averaged linear color of every pixel (row major, top row first)
	std::vector<color> render(const hittable& world, const hittable* lights, const environment_settings& env) {
		initialize();

		std::vector<color> framebuffer(static_cast<size_t>(image_width) * image_height);
		std::atomic<int> lines_done{ 0 };

		//number of threads = number of cores
		int thread_count = num_threads > 0
			? num_threads
			: static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
		thread_count = std::min(thread_count, image_height);
		std::vector<std::thread> threads;

		auto render_rows = [&](int start_y, int end_y) {
			for (int j = start_y; j < end_y; ++j) {
				//private random stream per row, independent of the thread layout
				std::seed_seq seq{ seed, static_cast<std::uint32_t>(j) };
				rng gen(seq);

				for (int i = 0; i < image_width; ++i) {
					color pixel_color(0, 0, 0);
					for (int s = 0; s < samples_per_pixel; s++) {
						ray r = get_ray(i, j, gen);
						pixel_color += de_nan(ray_color(r, max_depth, world, lights, env, gen));
					}

					framebuffer[static_cast<size_t>(j) * image_width + i] = pixel_samples_scale * pixel_color;
				}

				lines_done++;
			}
		};

		//split lines between threads
		int rows_per_thread = image_height / thread_count;
		int extra = image_height % thread_count;
		int start = 0;

		for (int t = 0; t < thread_count; t++) {
			int end = start + rows_per_thread + (t < extra ? 1 : 0);
			threads.emplace_back(render_rows, start, end);
			start = end;
		}

		//progress bar
		while (show_progress && lines_done < image_height) {
			print_progress(lines_done.load());
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
		}

		//join threads
		for (auto& th : threads)
			th.join();

		if (show_progress) {
			print_progress(image_height);
			std::cerr << "\n";
		}

		return framebuffer;
	}

	//derive image height and the viewport from the settings above
	void initialize() {
		//calculate the image height , and ensure that it's at least 1
		image_height = int(image_width / aspect_ratio);
		image_height = (image_height < 1) ? 1 : image_height;

		pixel_samples_scale = 1.0 / samples_per_pixel;

		center = lookfrom; //center of the camera source

		//determine viewport dimensions
		auto theta = degrees_to_radians(vfov);
		auto h = std::tan(theta / 2);
		auto viewport_height = 2 * h * focus_dist;
		auto viewport_width = viewport_height * (double(image_width) / image_height);

		//calculate the u,v,w unit basis vectors for the camera coordinate frame
		w = unit_vector(lookfrom - lookat);
		u = unit_vector(cross(vup, w));
		v = cross(w, u);

		//calculate the vectors across the horizontal and down the vertical viewport edges
		vec3 viewport_u = viewport_width * u; //vector across viewport horizontal edge
		vec3 viewport_v = viewport_height * -v; //vector down viewport vertical edge

		//calculate the horizontal and vertical delta vectors from pixel to pixel
		pixel_delta_u = viewport_u / image_width;
		pixel_delta_v = viewport_v / image_height;

		//calculate the location of the upper left pixel
		auto viewport_upper_left = center - (focus_dist * w) - viewport_u / 2 - viewport_v / 2;
		pixel00_loc = viewport_upper_left + 0.5 * (pixel_delta_u + pixel_delta_v);

		//calculate the camera defocus disk basis vectors
		auto defocus_radius = focus_dist * std::tan(degrees_to_radians(defocus_angle / 2));
		defocus_disk_u = u * defocus_radius;
		defocus_disk_v = v * defocus_radius;
	}

	//construct a camera ray originating from the defocus disk and directed at randomly sampled
	//point around the pixel location i, j
	ray get_ray(int i, int j, rng& gen) const {
		auto offset = sample_square(gen);
		auto pixel_sample = pixel00_loc
			+ ((i + offset.x()) * pixel_delta_u)
			+ ((j + offset.y()) * pixel_delta_v);

		auto ray_origin = (defocus_angle <= 0) ? center : defocus_disk_sample(gen);
		auto ray_direction = pixel_sample - ray_origin;
		auto ray_time = (time1 > time0) ? random_double(gen, time0, time1) : time0;

		return ray(ray_origin, ray_direction, ray_time);
	}

	int height() const { return image_height; }

private:
	int image_height = 1; //rendered image height
	double pixel_samples_scale = 1.0; //color scale factor for a sum of pixel samples
	point3 center; //camera center
	point3 pixel00_loc; //location of pixel 0, 0
	vec3 pixel_delta_u; //offset to pixel to the right
	vec3 pixel_delta_v; //offset to pixel below
	vec3 u, v, w; //camera frame basis vectors
	vec3 defocus_disk_u; //defocus disk horizontal radius
	vec3 defocus_disk_v; //defocus disk vertical radius

	//returns the vector to a random point in the [-.5, -.5]-[+.5,+.5] unit square
	vec3 sample_square(rng& gen) const {
		return vec3(random_double(gen) - 0.5, random_double(gen) - 0.5, 0);
	}
	//returns a random point in the camera defocus disk
	point3 defocus_disk_sample(rng& gen) const {
		auto p = random_in_unit_disk(gen);
		return center + (p[0] * defocus_disk_u) + (p[1] * defocus_disk_v);
	}

	void print_progress(int done) const {
		double percent = double(done) / image_height;

		int barWidth = 40;
		int filled = int(percent * barWidth);

		std::cerr << "\r[";
		for (int i = 0; i < filled; i++) {
			std::cerr << "#"; //fill of the bar
		}
		for (int i = filled; i < barWidth; i++) {
			std::cerr << "."; //empty space of the bar
		}
		std::cerr << "] ";

		std::cerr << std::fixed << std::setprecision(1)
			<< (percent * 100.0) << "% (" << done << "/" << image_height << " lines)"
			<< std::flush;
	}
};
