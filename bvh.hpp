#pragma once

#include "hittable.hpp"
#include "hittable_list.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

//bounding volume hierarchy node, built once for a static scene
class bvh_node : public hittable {
public:
	//build over a copy of the list's objects, the list itself is left untouched
	bvh_node(hittable_list list, double time0, double time1, rng& gen)
		: bvh_node(list.objects, 0, list.objects.size(), time0, time1, gen)
	{}

	//build over objects[start, end), reorders that range
	bvh_node(std::vector<shared_ptr<hittable>>& objects, size_t start, size_t end,
		double time0, double time1, rng& gen)
	{
		if (end <= start) {
			throw std::invalid_argument("bvh_node: cannot build a hierarchy from 0 objects");
		}
		size_t object_span = end - start;

		int axis = random_int(gen, 0, 2);
		auto comparator = [axis, time0, time1](const shared_ptr<hittable>& a, const shared_ptr<hittable>& b) {
			return box_compare(a, b, axis, time0, time1);
		};

		if (object_span == 1) {
			//degenerate leaf, both slots reference the same child
			left = right = objects[start];
		}
		else if (object_span == 2) {
			if (comparator(objects[start], objects[start + 1])) {
				left = objects[start];
				right = objects[start + 1];
			}
			else {
				left = objects[start + 1];
				right = objects[start];
			}
		}
		else {
			std::sort(objects.begin() + start, objects.begin() + end, comparator);

			auto mid = start + object_span / 2;
			auto left_node = make_shared<bvh_node>(objects, start, mid, time0, time1, gen);
			auto right_node = make_shared<bvh_node>(objects, mid, end, time0, time1, gen);
			degraded = left_node->degraded_nodes() + right_node->degraded_nodes();
			left = left_node;
			right = right_node;
		}

		auto box_left = left->bounding_box(time0, time1);
		auto box_right = right->bounding_box(time0, time1);

		if (!box_left || !box_right) {
			//missing geometry, this node becomes a no-op
			std::cerr << "[Warning] bvh_node: primitive without bounding box, "
				<< object_span << " object(s) dropped from the hierarchy\n";
			left = right = nullptr;
			bbox = aabb::empty;
			degraded += 1;
			return;
		}

		bbox = surrounding_box(*box_left, *box_right);
	}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		if (!left || !bbox.hit(r, ray_t)) {
			return std::nullopt;
		}

		auto hit_left = left->hit(r, ray_t, gen);
		if (right == left) {
			return hit_left;
		}
		//right subtree only needs to beat the left hit
		auto hit_right = right->hit(r, interval(ray_t.min, hit_left ? hit_left->t : ray_t.max), gen);

		return hit_right ? hit_right : hit_left;
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		return bbox;
	}

	//number of nodes in this subtree that lost their children to a missing bounding box
	int degraded_nodes() const { return degraded; }

private:
	shared_ptr<hittable> left;
	shared_ptr<hittable> right;
	aabb bbox;
	int degraded = 0;

	//orders by the min coordinate on axis, unbounded objects sort last
	static bool box_compare(
		const shared_ptr<hittable>& a, const shared_ptr<hittable>& b, int axis, double time0, double time1
	) {
		auto box_a = a->bounding_box(time0, time1);
		auto box_b = b->bounding_box(time0, time1);
		auto a_min = box_a ? box_a->axis_interval(axis).min : infinity;
		auto b_min = box_b ? box_b->axis_interval(axis).min : infinity;
		return a_min < b_min;
	}
};
