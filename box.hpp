#pragma once

#include "hittable_list.hpp"
#include "aarect.hpp"
#include "flip_face.hpp"

//axis-aligned box made of six rectangles, faces at the min corner are flipped
//so every face reports its outward side as front
class box : public hittable {
public:
	box(const point3& p0, const point3& p1, shared_ptr<material> mat)
		: box_min(p0)
		, box_max(p1)
	{
		//front/back (constant z)
		sides.add(make_shared<aa_rect>(plane::xy, p0.x(), p1.x(), p0.y(), p1.y(), p1.z(), mat));
		sides.add(make_shared<flip_face>(make_shared<aa_rect>(plane::xy, p0.x(), p1.x(), p0.y(), p1.y(), p0.z(), mat)));

		//top/bottom (constant y)
		sides.add(make_shared<aa_rect>(plane::xz, p0.x(), p1.x(), p0.z(), p1.z(), p1.y(), mat));
		sides.add(make_shared<flip_face>(make_shared<aa_rect>(plane::xz, p0.x(), p1.x(), p0.z(), p1.z(), p0.y(), mat)));

		//right/left (constant x)
		sides.add(make_shared<aa_rect>(plane::yz, p0.y(), p1.y(), p0.z(), p1.z(), p1.x(), mat));
		sides.add(make_shared<flip_face>(make_shared<aa_rect>(plane::yz, p0.y(), p1.y(), p0.z(), p1.z(), p0.x(), mat)));
	}

	std::optional<hit_record> hit(const ray& r, interval ray_t, rng& gen) const override {
		return sides.hit(r, ray_t, gen);
	}

	std::optional<aabb> bounding_box(double time0, double time1) const override {
		return aabb(box_min, box_max);
	}

private:
	point3 box_min;
	point3 box_max;
	hittable_list sides;
};
