#pragma once

#include "hittable.hpp"
#include "pdf.hpp"
#include "texture.hpp"

#include <optional>

//result of a scatter event
//skip_pdf: deterministic ray (specular / fog), pdf_ptr unused
//otherwise: the integrator samples pdf_ptr mixed with the lights
class scatter_record {
public:
	color attenuation;
	shared_ptr<pdf> pdf_ptr;
	bool skip_pdf = false;
	ray skip_pdf_ray;
};

//abstract class material
//implementers: lambertian, metal, dielectric, diffuse_light, isotropic
class material {
public:
	virtual ~material() = default;

	//no emission by default black color material
	virtual color emitted(const ray& r_in, const hit_record& rec) const {
		return color(0, 0, 0); //default no emission
	}

	//   @brief Scatter the incoming ray according to the material's properties.
	//
	//   @param r_in The incoming ray.
	//   @param rec The hit record containing information about the hit point.
	//   @param gen Random stream of the calling worker.
	//   @return scatter record, or nothing if the ray is absorbed.
	virtual std::optional<scatter_record> scatter(const ray& r_in, const hit_record& rec, rng& gen) const {
		return std::nullopt;
	}

	//density of scattering r_in into `scattered`, only for materials with a pdf_ptr
	virtual double scattering_pdf(const ray& r_in, const hit_record& rec, const ray& scattered) const {
		return 0;
	}
};

//class for lambertian material
class lambertian : public material {
public:
	//constructor for solid color albedo
	lambertian(const color& albedo)
		: tex(make_shared<solid_color>(albedo))
	{}
	//constructor for texture albedo
	lambertian(shared_ptr<texture> tex)
		: tex(tex)
	{}

	std::optional<scatter_record> scatter(const ray& r_in, const hit_record& rec, rng& gen) const override {
		scatter_record srec;
		//get albedo from texture
		srec.attenuation = tex->value(rec.u, rec.v, rec.p);
		srec.pdf_ptr = make_shared<cosine_pdf>(rec.normal);
		srec.skip_pdf = false;
		return srec;
	}

	double scattering_pdf(const ray& r_in, const hit_record& rec, const ray& scattered) const override {
		auto cos_theta = dot(rec.normal, unit_vector(scattered.direction()));
		return cos_theta < 0 ? 0 : cos_theta / pi;
	}

private:
	shared_ptr<texture> tex;
};

//class for metal material with reflections
class metal : public material {
public:
	//constructor for texture albedo
	metal(shared_ptr<texture> a, double f = 0.0)
		: albedo(a)
		, fuzz(f < 1 ? f : 1) //condition for fuzziness
	{}
	//constructor for solid color albedo(user friendly)
	metal(const color& a, double f = 0.0)
		: albedo(make_shared<solid_color>(a))
		, fuzz(f < 1 ? f : 1) //condition for fuzziness
	{}

	std::optional<scatter_record> scatter(const ray& r_in, const hit_record& rec, rng& gen) const override {
		vec3 reflected = reflect(unit_vector(r_in.direction()), rec.normal);
		reflected = reflected + fuzz * random_in_unit_sphere(gen);

		//fuzzed into the surface, absorbed
		if (dot(reflected, rec.normal) <= 0) {
			return std::nullopt;
		}

		scatter_record srec;
		//use .value(u, v, p) from texture instead of solid color
		srec.attenuation = albedo->value(rec.u, rec.v, rec.p);
		srec.skip_pdf = true;
		srec.skip_pdf_ray = ray(rec.p, reflected, r_in.time());
		return srec;
	}

private:
	shared_ptr<texture> albedo;
	double fuzz;
};

//class for dielectric material, refracts or reflects
class dielectric : public material {
public:
	dielectric(double refraction_index) : refraction_index(refraction_index) {}

	std::optional<scatter_record> scatter(const ray& r_in, const hit_record& rec, rng& gen) const override {
		scatter_record srec;
		srec.attenuation = color(1.0, 1.0, 1.0); //always white, because translucent doesnt change color
		srec.skip_pdf = true;
		double ri = rec.front_face ? (1.0 / refraction_index) : refraction_index; //calculation of the refractive index

		vec3 unit_direction = unit_vector(r_in.direction()); //the unit direction vector of the incoming ray.
		double cos_theta = std::fmin(dot(-unit_direction, rec.normal), 1.0); //cos of the angle of incidence
		double sin_theta = std::sqrt(1.0 - cos_theta * cos_theta); //sin of the angle of incidence(Pythagoras)

		vec3 direction;

		//direction of the angle of incidence
		if (cannot_refract(sin_theta, ri) || reflectance(cos_theta, ri) > random_double(gen)) {
			direction = reflect(unit_direction, rec.normal);
		}
		else {
			direction = refract(unit_direction, rec.normal, ri);
		}

		srec.skip_pdf_ray = ray(rec.p, direction, r_in.time());
		return srec;
	}

	//total internal reflection
	static bool cannot_refract(double sin_theta, double ri) {
		return ri * sin_theta > 1.0;
	}

	//Schlick's approximation for reflectance
	static double reflectance(double cosine, double refraction_index) {
		auto r0 = (1 - refraction_index) / (1 + refraction_index);
		r0 = r0 * r0;
		return r0 + (1 - r0) * std::pow((1 - cosine), 5);
	}

private:
	//refractive index - n
	double refraction_index;
};

//class for diffuse light-emitting material
class diffuse_light : public material {
public:
	diffuse_light(shared_ptr<texture> a)
		: emit(a)
	{}
	diffuse_light(color c)
		: emit(make_shared<solid_color>(c))
	{}

	//one sided, only the front face emits
	color emitted(const ray& r_in, const hit_record& rec) const override {
		if (!rec.front_face) {
			return color(0, 0, 0);
		}
		return emit->value(rec.u, rec.v, rec.p);
	}

private:
	shared_ptr<texture> emit;
};

//fog material, disperses the rays in each direction equally
class isotropic : public material {
public:
	isotropic(color c) : tex(make_shared<solid_color>(c)) {}
	isotropic(shared_ptr<texture> tex) : tex(tex) {}

	std::optional<scatter_record> scatter(const ray& r_in, const hit_record& rec, rng& gen) const override {
		scatter_record srec;
		srec.attenuation = tex->value(rec.u, rec.v, rec.p);
		srec.skip_pdf = true;
		srec.skip_pdf_ray = ray(rec.p, random_in_unit_sphere(gen), r_in.time());
		return srec;
	}

private:
	shared_ptr<texture> tex;
};
