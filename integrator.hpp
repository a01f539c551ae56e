#pragma once

#include "rtweekend.hpp"
#include "hittable.hpp"
#include "material.hpp"
#include "pdf.hpp"
#include "environment.hpp"

//mixture densities below this are treated as grazing, no reflected light gathered
constexpr double min_pdf_value = 1e-8;

//outgoing radiance along r
//  world:  scene root (bvh_node or hittable_list)
//  lights: light sampling target, nullptr samples the material lobe only
//  depth:  remaining bounces
inline color ray_color(
	const ray& r, int depth, const hittable& world, const hittable* lights,
	const environment_settings& env, rng& gen
) {
	//out of bounces, no more light is gathered
	if (depth <= 0) {
		return color(0, 0, 0);
	}

	auto rec = world.hit(r, interval(ray_epsilon, infinity), gen);
	//hit onto background
	if (!rec) {
		return env.value(r.direction());
	}
	//geometry without a material (light sampling shapes) absorbs everything
	if (!rec->mat) {
		return color(0, 0, 0);
	}

	color emitted = rec->mat->emitted(r, *rec);

	auto srec = rec->mat->scatter(r, *rec, gen);
	if (!srec) {
		//light source or absorbed ray
		return emitted;
	}

	//deterministic ray, no density involved
	if (srec->skip_pdf) {
		return emitted + srec->attenuation * ray_color(srec->skip_pdf_ray, depth - 1, world, lights, env, gen);
	}

	const pdf& material_pdf = *srec->pdf_ptr;
	ray scattered;
	double pdf_val;
	if (lights) {
		hittable_pdf light_pdf(*lights, rec->p);
		mixture_pdf sampling(light_pdf, material_pdf);
		scattered = ray(rec->p, sampling.generate(gen), r.time());
		pdf_val = sampling.value(scattered.direction());
	}
	else {
		scattered = ray(rec->p, material_pdf.generate(gen), r.time());
		pdf_val = material_pdf.value(scattered.direction());
	}

	//also rejects NaN densities
	if (!(pdf_val > min_pdf_value)) {
		return emitted;
	}

	double scattering_pdf = rec->mat->scattering_pdf(r, *rec, scattered);
	color sample_color = ray_color(scattered, depth - 1, world, lights, env, gen);
	color color_from_scatter = (srec->attenuation * scattering_pdf * sample_color) / pdf_val;

	return emitted + color_from_scatter;
}
