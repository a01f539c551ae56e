#include <gtest/gtest.h>

#include "material.hpp"
#include "sphere.hpp"

namespace {

//hit record on a surface facing +z at the origin, seen from the front
hit_record surface_hit(const ray& r, shared_ptr<material> mat) {
	hit_record rec;
	rec.t = 1.0;
	rec.p = point3(0, 0, 0);
	rec.set_face_normal(r, vec3(0, 0, 1));
	rec.mat = mat;
	return rec;
}

} //namespace

TEST(dielectric, schlick_reflectance_stays_in_unit_range) {
	for (double ri : { 0.1, 0.5, 1.0 / 1.5, 1.0, 1.33, 1.5, 2.4, 5.0 }) {
		for (int i = 0; i <= 100; i++) {
			double cosine = i / 100.0;
			double r = dielectric::reflectance(cosine, ri);
			EXPECT_GE(r, 0.0) << "ri " << ri << " cos " << cosine;
			EXPECT_LE(r, 1.0) << "ri " << ri << " cos " << cosine;
		}
	}
}

TEST(dielectric, schlick_reflectance_limits) {
	//normal incidence gives r0, grazing incidence reflects everything
	EXPECT_NEAR(dielectric::reflectance(1.0, 1.5), 0.04, 1e-12);
	EXPECT_NEAR(dielectric::reflectance(0.0, 1.5), 1.0, 1e-12);
	EXPECT_NEAR(dielectric::reflectance(1.0, 1.0), 0.0, 1e-12);
}

TEST(dielectric, total_internal_reflection_threshold) {
	EXPECT_FALSE(dielectric::cannot_refract(0.0, 1.5));
	EXPECT_FALSE(dielectric::cannot_refract(0.6, 1.5));
	EXPECT_TRUE(dielectric::cannot_refract(0.7, 1.5));
	EXPECT_FALSE(dielectric::cannot_refract(1.0, 1.0 / 1.5));
}

TEST(dielectric, head_on_ray_mostly_refracts_straight_through) {
	rng gen(42);
	auto glass = make_shared<dielectric>(1.5);
	ray r_in(point3(0, 0, 5), vec3(0, 0, -1));
	auto rec = surface_hit(r_in, glass);
	ASSERT_TRUE(rec.front_face);

	int forward = 0;
	const int n = 2000;
	for (int i = 0; i < n; i++) {
		auto srec = glass->scatter(r_in, rec, gen);
		ASSERT_TRUE(srec.has_value());
		EXPECT_TRUE(srec->skip_pdf);
		EXPECT_DOUBLE_EQ(srec->attenuation.x(), 1.0);

		vec3 d = unit_vector(srec->skip_pdf_ray.direction());
		if (d.z() < 0) {
			forward++;
			//no bending at normal incidence
			EXPECT_NEAR(d.x(), 0.0, 1e-9);
			EXPECT_NEAR(d.y(), 0.0, 1e-9);
		}
		else {
			EXPECT_NEAR(d.z(), 1.0, 1e-9);
		}
	}
	EXPECT_GT(forward, n * 9 / 10);
}

TEST(dielectric, grazing_exit_is_totally_reflected) {
	rng gen(42);
	auto glass = make_shared<dielectric>(1.5);
	//from inside the glass the surface is hit on its back side
	ray r_in(point3(-5, 0, -1), vec3(1, 0, 0.2));
	auto rec = surface_hit(r_in, glass);
	ASSERT_FALSE(rec.front_face);

	for (int i = 0; i < 100; i++) {
		auto srec = glass->scatter(r_in, rec, gen);
		ASSERT_TRUE(srec.has_value());
		//reflected back into the glass
		EXPECT_LT(srec->skip_pdf_ray.direction().z(), 0.0);
	}
}

TEST(metal, polished_metal_is_a_perfect_mirror) {
	rng gen(42);
	auto mirror = make_shared<metal>(color(0.9, 0.8, 0.7), 0.0);
	ray r_in(point3(-1, 0, 1), vec3(1, 0, -1));
	auto rec = surface_hit(r_in, mirror);

	auto srec = mirror->scatter(r_in, rec, gen);
	ASSERT_TRUE(srec.has_value());
	EXPECT_TRUE(srec->skip_pdf);
	EXPECT_DOUBLE_EQ(srec->attenuation.y(), 0.8);

	vec3 d = unit_vector(srec->skip_pdf_ray.direction());
	EXPECT_NEAR(d.x(), 1.0 / std::sqrt(2.0), 1e-12);
	EXPECT_NEAR(d.y(), 0.0, 1e-12);
	EXPECT_NEAR(d.z(), 1.0 / std::sqrt(2.0), 1e-12);
}

TEST(metal, fuzzed_reflections_never_enter_the_surface) {
	rng gen(42);
	auto brushed = make_shared<metal>(color(1, 1, 1), 1.0);
	//grazing incidence, fuzz pushes some reflections below the surface
	ray r_in(point3(-1, 0, 0.05), vec3(1, 0, -0.05));
	auto rec = surface_hit(r_in, brushed);

	int absorbed = 0;
	for (int i = 0; i < 2000; i++) {
		auto srec = brushed->scatter(r_in, rec, gen);
		if (!srec) {
			absorbed++;
			continue;
		}
		EXPECT_GT(dot(srec->skip_pdf_ray.direction(), rec.normal), 0.0);
	}
	EXPECT_GT(absorbed, 0);
}

TEST(metal, fuzz_is_capped_at_one) {
	rng gen(42);
	auto rough = make_shared<metal>(color(1, 1, 1), 10.0);
	ray r_in(point3(0, 0, 1), vec3(0, 0, -1));
	auto rec = surface_hit(r_in, rough);

	for (int i = 0; i < 500; i++) {
		auto srec = rough->scatter(r_in, rec, gen);
		if (srec) {
			//reflected (0,0,1) plus a vector inside the unit sphere
			vec3 offset = srec->skip_pdf_ray.direction() - vec3(0, 0, 1);
			EXPECT_LT(offset.length(), 1.0 + 1e-12);
		}
	}
}

TEST(lambertian, scatters_with_cosine_density) {
	rng gen(42);
	auto matte = make_shared<lambertian>(color(0.2, 0.4, 0.6));
	ray r_in(point3(0, 0, 1), vec3(0, 0, -1));
	auto rec = surface_hit(r_in, matte);

	auto srec = matte->scatter(r_in, rec, gen);
	ASSERT_TRUE(srec.has_value());
	EXPECT_FALSE(srec->skip_pdf);
	ASSERT_NE(srec->pdf_ptr, nullptr);
	EXPECT_DOUBLE_EQ(srec->attenuation.z(), 0.6);

	ray straight_up(rec.p, vec3(0, 0, 1));
	ray tilted(rec.p, vec3(1, 0, 1));
	ray below(rec.p, vec3(0, 0, -1));

	EXPECT_NEAR(matte->scattering_pdf(r_in, rec, straight_up), 1.0 / pi, 1e-12);
	EXPECT_NEAR(matte->scattering_pdf(r_in, rec, tilted), std::sqrt(0.5) / pi, 1e-12);
	EXPECT_DOUBLE_EQ(matte->scattering_pdf(r_in, rec, below), 0.0);

	//material density and sampling density agree
	EXPECT_NEAR(srec->pdf_ptr->value(tilted.direction()), matte->scattering_pdf(r_in, rec, tilted), 1e-12);

	for (int i = 0; i < 500; i++) {
		EXPECT_GE(dot(srec->pdf_ptr->generate(gen), rec.normal), 0.0);
	}
}

TEST(diffuse_light, emits_from_front_face_only) {
	rng gen(42);
	auto lamp = make_shared<diffuse_light>(color(4, 4, 4));

	ray from_front(point3(0, 0, 1), vec3(0, 0, -1));
	auto front = surface_hit(from_front, lamp);
	ASSERT_TRUE(front.front_face);
	EXPECT_DOUBLE_EQ(lamp->emitted(from_front, front).x(), 4.0);

	ray from_back(point3(0, 0, -1), vec3(0, 0, 1));
	auto back = surface_hit(from_back, lamp);
	ASSERT_FALSE(back.front_face);
	EXPECT_DOUBLE_EQ(lamp->emitted(from_back, back).x(), 0.0);

	//lights never scatter
	EXPECT_FALSE(lamp->scatter(from_front, front, gen).has_value());
}

TEST(isotropic, scatters_deterministically_in_any_direction) {
	rng gen(42);
	auto fog = make_shared<isotropic>(color(0.3, 0.3, 0.3));
	ray r_in(point3(0, 0, 1), vec3(0, 0, -1));
	auto rec = surface_hit(r_in, fog);

	int backwards = 0;
	for (int i = 0; i < 1000; i++) {
		auto srec = fog->scatter(r_in, rec, gen);
		ASSERT_TRUE(srec.has_value());
		EXPECT_TRUE(srec->skip_pdf);
		EXPECT_DOUBLE_EQ(srec->attenuation.x(), 0.3);
		if (srec->skip_pdf_ray.direction().z() > 0) {
			backwards++;
		}
	}
	//roughly half of the directions point back
	EXPECT_GT(backwards, 400);
	EXPECT_LT(backwards, 600);
}

TEST(material, base_material_neither_emits_nor_scatters) {
	rng gen(42);
	auto plain = make_shared<material>();
	ray r_in(point3(0, 0, 1), vec3(0, 0, -1));
	auto rec = surface_hit(r_in, plain);

	EXPECT_DOUBLE_EQ(plain->emitted(r_in, rec).length(), 0.0);
	EXPECT_FALSE(plain->scatter(r_in, rec, gen).has_value());
}
