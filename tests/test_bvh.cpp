#include <gtest/gtest.h>

#include "bvh.hpp"
#include "sphere.hpp"
#include "box.hpp"
#include "rotate_y.hpp"
#include "material.hpp"

#include <optional>
#include <stdexcept>

namespace {

//infinite plane y = 0, has no bounding box
class ground_plane : public hittable {
public:
	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		auto t = -r.origin().y() / r.direction().y();
		if (!ray_t.admits(t)) {
			return std::nullopt;
		}
		hit_record rec;
		rec.t = t;
		rec.p = r.at(t);
		rec.set_face_normal(r, vec3(0, 1, 0));
		return rec;
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		return std::nullopt;
	}
};

hittable_list random_scene(rng& gen, int count) {
	hittable_list list;
	auto mat = make_shared<lambertian>(color(0.5, 0.5, 0.5));
	for (int i = 0; i < count; i++) {
		point3 center = vec3::random(gen, -10, 10);
		if (i % 3 == 0) {
			point3 corner = center + vec3::random(gen, 0.1, 1.5);
			list.add(make_shared<box>(center, corner, mat));
		}
		else {
			list.add(make_shared<sphere>(center, random_double(gen, 0.1, 1.5), mat));
		}
	}
	return list;
}

} //namespace

TEST(bvh_node, empty_list_is_rejected) {
	rng gen(42);
	hittable_list empty;
	EXPECT_THROW(bvh_node(empty, 0, 1, gen), std::invalid_argument);
}

TEST(bvh_node, single_object_behaves_like_the_object) {
	rng gen(42);
	auto s = make_shared<sphere>(point3(0, 0, -5), 1.0, make_shared<lambertian>(color(1, 1, 1)));
	bvh_node tree(hittable_list(s), 0, 1, gen);

	auto rec = tree.hit(ray(point3(0, 0, 0), vec3(0, 0, -1)), interval(ray_epsilon, infinity), gen);
	ASSERT_TRUE(rec.has_value());
	EXPECT_NEAR(rec->t, 4.0, 1e-9);
	EXPECT_EQ(tree.degraded_nodes(), 0);
}

TEST(bvh_node, root_box_is_union_of_object_boxes) {
	rng gen(42);
	auto list = random_scene(gen, 57);
	bvh_node tree(list, 0, 1, gen);

	auto expected = list.bounding_box(0, 1);
	auto actual = tree.bounding_box(0, 1);
	ASSERT_TRUE(expected.has_value());
	ASSERT_TRUE(actual.has_value());
	for (int axis = 0; axis < 3; axis++) {
		EXPECT_DOUBLE_EQ(actual->axis_interval(axis).min, expected->axis_interval(axis).min);
		EXPECT_DOUBLE_EQ(actual->axis_interval(axis).max, expected->axis_interval(axis).max);
	}
}

TEST(bvh_node, building_leaves_the_source_list_untouched) {
	rng gen(42);
	auto list = random_scene(gen, 20);
	auto before = list.objects;
	bvh_node tree(list, 0, 1, gen);
	EXPECT_EQ(list.objects, before);
}

TEST(bvh_node, nearest_hit_matches_linear_scan) {
	rng gen(42);
	auto list = random_scene(gen, 200);
	bvh_node tree(list, 0, 1, gen);

	int hits = 0;
	for (int i = 0; i < 5000; i++) {
		point3 origin = vec3::random(gen, -15, 15);
		vec3 dir = random_unit_vector(gen);
		ray r(origin, dir);
		interval ray_t(ray_epsilon, infinity);

		auto expected = list.hit(r, ray_t, gen);
		auto actual = tree.hit(r, ray_t, gen);

		ASSERT_EQ(expected.has_value(), actual.has_value()) << "ray " << i;
		if (expected) {
			hits++;
			EXPECT_DOUBLE_EQ(actual->t, expected->t);
			EXPECT_EQ(actual->front_face, expected->front_face);
		}
	}
	EXPECT_GT(hits, 100);
}

TEST(bvh_node, respects_interval_upper_bound) {
	rng gen(42);
	auto list = random_scene(gen, 50);
	bvh_node tree(list, 0, 1, gen);

	for (int i = 0; i < 1000; i++) {
		ray r(vec3::random(gen, -15, 15), random_unit_vector(gen));
		auto rec = tree.hit(r, interval(ray_epsilon, 3.0), gen);
		if (rec) {
			EXPECT_LE(rec->t, 3.0);
			EXPECT_GT(rec->t, ray_epsilon);
		}
	}
}

TEST(bvh_node, unbounded_object_degrades_its_node_only) {
	rng gen(42);
	auto mat = make_shared<lambertian>(color(0.5, 0.5, 0.5));
	auto a = make_shared<sphere>(point3(-3, 0, -5), 1.0, mat);
	auto b = make_shared<sphere>(point3(3, 0, -5), 1.0, mat);

	hittable_list list;
	list.add(make_shared<ground_plane>());
	list.add(a);
	list.add(b);

	//unbounded objects sort last, so one sphere shares a node with the plane
	std::optional<bvh_node> tree;
	ASSERT_NO_THROW(tree.emplace(list, 0, 1, gen));
	EXPECT_EQ(tree->degraded_nodes(), 1);
	EXPECT_TRUE(tree->bounding_box(0, 1).has_value());

	interval ray_t(ray_epsilon, infinity);
	bool hit_a = tree->hit(ray(point3(-3, 0, 0), vec3(0, 0, -1)), ray_t, gen).has_value();
	bool hit_b = tree->hit(ray(point3(3, 0, 0), vec3(0, 0, -1)), ray_t, gen).has_value();
	EXPECT_NE(hit_a, hit_b);

	//plane is gone as well
	EXPECT_FALSE(tree->hit(ray(point3(0, 5, 0), vec3(0, -1, 0)), ray_t, gen).has_value());
}

TEST(bvh_node, only_unbounded_objects_give_an_inert_tree) {
	rng gen(42);
	hittable_list list;
	list.add(make_shared<ground_plane>());
	list.add(make_shared<ground_plane>());

	bvh_node tree(list, 0, 1, gen);
	EXPECT_EQ(tree.degraded_nodes(), 1);
	EXPECT_FALSE(tree.hit(ray(point3(0, 5, 0), vec3(0, -1, 0)), interval(ray_epsilon, infinity), gen).has_value());
}

TEST(bvh_node, rotated_inert_tree_keeps_an_empty_box) {
	rng gen(42);
	hittable_list planes;
	planes.add(make_shared<ground_plane>());
	planes.add(make_shared<ground_plane>());
	auto tree = make_shared<bvh_node>(planes, 0, 1, gen);
	ASSERT_EQ(tree->degraded_nodes(), 1);

	rotate_y rotated(tree, 15);
	auto box = rotated.bounding_box(0, 1);
	ASSERT_TRUE(box.has_value());
	EXPECT_TRUE(box->is_empty());

	//a parent hierarchy only bounds the real geometry
	auto s = make_shared<sphere>(point3(0, 0, -5), 1.0, make_shared<lambertian>(color(1, 1, 1)));
	hittable_list scene;
	scene.add(make_shared<rotate_y>(tree, 15));
	scene.add(s);
	bvh_node parent(scene, 0, 1, gen);
	EXPECT_EQ(parent.degraded_nodes(), 0);

	auto root = parent.bounding_box(0, 1);
	ASSERT_TRUE(root.has_value());
	EXPECT_DOUBLE_EQ(root->min().x(), -1.0);
	EXPECT_DOUBLE_EQ(root->max().z(), -4.0);
	EXPECT_FALSE(root->hit(ray(point3(10, 10, 10), vec3(1, 0, 0)), interval(ray_epsilon, infinity)));
}
