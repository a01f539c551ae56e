#pragma once

#include "hittable.hpp"
#include "onb.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

//direction sampling strategy together with its density
class pdf {
public:
	virtual ~pdf() = default;

	//solid angle density of `direction`
	virtual double value(const vec3& direction) const = 0;
	//sample a direction
	virtual vec3 generate(rng& gen) const = 0;
};

//cos(theta)/pi around the normal w
class cosine_pdf : public pdf {
public:
	cosine_pdf(const vec3& w) : uvw(w) {}

	double value(const vec3& direction) const override {
		auto cosine_theta = dot(unit_vector(direction), uvw.w());
		return std::fmax(0, cosine_theta / pi);
	}

	vec3 generate(rng& gen) const override {
		return uvw.local(random_cosine_direction(gen));
	}

private:
	onb uvw;
};

//samples directions from origin towards a target shape (usually a light)
class hittable_pdf : public pdf {
public:
	hittable_pdf(const hittable& objects, const point3& origin)
		: objects(objects)
		, origin(origin)
	{}

	double value(const vec3& direction) const override {
		return objects.pdf_value(origin, direction);
	}

	vec3 generate(rng& gen) const override {
		return objects.random(origin, gen);
	}

private:
	const hittable& objects;
	point3 origin;
};

//equal weight mixture of N >= 1 strategies
//components are borrowed and must outlive the mixture
class mixture_pdf : public pdf {
public:
	mixture_pdf(std::vector<const pdf*> components)
		: components(std::move(components))
	{
		if (this->components.empty()) {
			throw std::invalid_argument("mixture_pdf needs at least one component");
		}
	}

	mixture_pdf(const pdf& p0, const pdf& p1)
		: mixture_pdf(std::vector<const pdf*>{ &p0, &p1 })
	{}

	//arithmetic mean of the component densities
	double value(const vec3& direction) const override {
		auto sum = 0.0;
		for (const auto* p : components) {
			sum += p->value(direction);
		}
		return sum / components.size();
	}

	//pick one component uniformly and sample it
	vec3 generate(rng& gen) const override {
		auto last = static_cast<int>(components.size()) - 1;
		return components[random_int(gen, 0, last)]->generate(gen);
	}

	std::size_t size() const { return components.size(); }

private:
	std::vector<const pdf*> components;
};
