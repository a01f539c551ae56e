#include <gtest/gtest.h>

#include "rtweekend.hpp"
#include "aabb.hpp"

TEST(aabb, corners_in_any_order_give_the_same_box) {
	aabb a(point3(0, 0, 0), point3(1, 2, 3));
	aabb b(point3(1, 2, 3), point3(0, 0, 0));

	for (int axis = 0; axis < 3; axis++) {
		EXPECT_DOUBLE_EQ(a.axis_interval(axis).min, b.axis_interval(axis).min);
		EXPECT_DOUBLE_EQ(a.axis_interval(axis).max, b.axis_interval(axis).max);
		EXPECT_LE(a.axis_interval(axis).min, a.axis_interval(axis).max);
	}
	EXPECT_DOUBLE_EQ(a.max().z(), 3.0);
	EXPECT_DOUBLE_EQ(a.min().y(), 0.0);
}

TEST(aabb, zero_width_dimension_is_padded) {
	aabb flat(point3(0, 0, 5), point3(1, 1, 5));

	EXPECT_GT(flat.z.size(), 0.00009);
	EXPECT_LT(flat.z.min, 5.0);
	EXPECT_GT(flat.z.max, 5.0);
	//other axes untouched
	EXPECT_DOUBLE_EQ(flat.x.min, 0.0);
	EXPECT_DOUBLE_EQ(flat.x.max, 1.0);
}

TEST(aabb, surrounding_box_is_tightest_box_containing_both) {
	aabb a(point3(0, 0, 0), point3(1, 2, 3));
	aabb b(point3(-1, 1, 2), point3(0.5, 4, 5));

	aabb s = surrounding_box(a, b);

	EXPECT_DOUBLE_EQ(s.min().x(), -1.0);
	EXPECT_DOUBLE_EQ(s.min().y(), 0.0);
	EXPECT_DOUBLE_EQ(s.min().z(), 0.0);
	EXPECT_DOUBLE_EQ(s.max().x(), 1.0);
	EXPECT_DOUBLE_EQ(s.max().y(), 4.0);
	EXPECT_DOUBLE_EQ(s.max().z(), 5.0);

	for (const aabb* box : { &a, &b }) {
		for (int axis = 0; axis < 3; axis++) {
			EXPECT_LE(s.axis_interval(axis).min, box->axis_interval(axis).min);
			EXPECT_GE(s.axis_interval(axis).max, box->axis_interval(axis).max);
		}
	}
}

TEST(aabb, surrounding_box_with_empty_box_is_the_other_box) {
	aabb a(point3(-1, -2, -3), point3(1, 2, 3));
	aabb s = surrounding_box(aabb::empty, a);

	EXPECT_TRUE(aabb::empty.is_empty());
	EXPECT_FALSE(s.is_empty());
	EXPECT_DOUBLE_EQ(s.min().x(), -1.0);
	EXPECT_DOUBLE_EQ(s.max().z(), 3.0);
}

TEST(aabb, slab_test_hits_box_in_front_of_ray) {
	aabb box(point3(-1, -1, -6), point3(1, 1, -4));
	ray r(point3(0, 0, 0), vec3(0, 0, -1));

	EXPECT_TRUE(box.hit(r, interval(0.001, infinity)));
}

TEST(aabb, slab_test_handles_negative_direction_components) {
	aabb box(point3(-3, -3, -3), point3(-2, -2, -2));
	ray r(point3(0, 0, 0), vec3(-1, -1, -1));

	EXPECT_TRUE(box.hit(r, interval(0.001, infinity)));
	EXPECT_FALSE(box.hit(ray(point3(0, 0, 0), vec3(1, 1, 1)), interval(0.001, infinity)));
}

TEST(aabb, slab_test_rejects_misses_and_out_of_range_intervals) {
	aabb box(point3(-1, -1, -6), point3(1, 1, -4));

	//passes beside the box
	EXPECT_FALSE(box.hit(ray(point3(5, 0, 0), vec3(0, 0, -1)), interval(0.001, infinity)));
	//box is behind the allowed interval
	EXPECT_FALSE(box.hit(ray(point3(0, 0, 0), vec3(0, 0, -1)), interval(0.001, 3.0)));
	//box is before the allowed interval
	EXPECT_FALSE(box.hit(ray(point3(0, 0, 0), vec3(0, 0, -1)), interval(7.0, infinity)));
}

TEST(aabb, slab_test_with_direction_parallel_to_a_slab) {
	aabb box(point3(0, 0, 0), point3(1, 1, 1));

	//direction has zero y and z components, origin inside those slabs
	EXPECT_TRUE(box.hit(ray(point3(-5, 0.5, 0.5), vec3(1, 0, 0)), interval(0.001, infinity)));
	//origin outside the y slab
	EXPECT_FALSE(box.hit(ray(point3(-5, 2.0, 0.5), vec3(1, 0, 0)), interval(0.001, infinity)));
}

TEST(aabb, translation_moves_both_corners) {
	aabb box(point3(0, 0, 0), point3(1, 1, 1));
	aabb moved = box + vec3(10, -2, 3);

	EXPECT_DOUBLE_EQ(moved.min().x(), 10.0);
	EXPECT_DOUBLE_EQ(moved.min().y(), -2.0);
	EXPECT_DOUBLE_EQ(moved.max().z(), 4.0);
}
