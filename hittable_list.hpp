#pragma once

#include "hittable.hpp"

#include <vector>

class hittable_list : public hittable {
public:
	std::vector<shared_ptr<hittable>> objects;

	//default constructor
	hittable_list() {}
	//constructor with one argument added to the list
	hittable_list(shared_ptr<hittable> object) {
		add(object);
	}
	//add new object to the list
	void add(shared_ptr<hittable> object) {
		objects.push_back(object);
	}

	//go through the objects on the list, keep the closest hit
	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		std::optional<hit_record> closest;
		auto closest_so_far = ray_t.max;

		for (const auto& object : objects) {
			if (auto rec = object->hit(r, interval(ray_t.min, closest_so_far), gen)) {
				closest_so_far = rec->t;
				closest = rec;
			}
		}
		return closest;
	}

	//union of all object boxes; none if the list is empty or any object is unbounded
	std::optional<aabb> bounding_box(double time0, double time1) const override {
		if (objects.empty()) {
			return std::nullopt;
		}

		aabb output_box;
		for (const auto& object : objects) {
			auto box = object->bounding_box(time0, time1);
			if (!box) {
				return std::nullopt;
			}
			output_box = surrounding_box(output_box, *box);
		}
		return output_box;
	}

	//equal weight mixture of the members' densities
	double pdf_value(const point3& origin, const vec3& direction) const override {
		if (objects.empty()) {
			return 0.0;
		}

		auto weight = 1.0 / objects.size();
		auto sum = 0.0;

		for (const auto& object : objects) {
			sum += weight * object->pdf_value(origin, direction);
		}
		return sum;
	}

	vec3 random(const point3& origin, rng& gen) const override {
		if (objects.empty()) {
			return vec3(1, 0, 0);
		}
		auto int_size = static_cast<int>(objects.size());
		return objects[random_int(gen, 0, int_size - 1)]->random(origin, gen);
	}
};
