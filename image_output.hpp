#pragma once

#include "color.hpp"
#include "stb_image_write.h"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

//gamma corrected 8 bit RGB rows from the averaged linear framebuffer
inline std::vector<unsigned char> to_rgb8(const std::vector<color>& framebuffer) {
	std::vector<unsigned char> image(framebuffer.size() * 3);
	for (size_t i = 0; i < framebuffer.size(); i++) {
		write_color(image, static_cast<int>(i * 3), framebuffer[i]);
	}
	return image;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

//write the framebuffer as .ppm (plain text P3) or .png, chosen by extension
//throws std::runtime_error if the file cannot be written
inline void save_image(const std::string& filename, int width, int height, const std::vector<color>& framebuffer) {
	auto image = to_rgb8(framebuffer);

	if (ends_with(filename, ".ppm")) {
		std::ofstream out(filename);
		if (!out) {
			throw std::runtime_error("cannot open '" + filename + "' for writing");
		}
		out << "P3\n" << width << ' ' << height << "\n255\n";
		for (size_t i = 0; i < image.size(); i += 3) {
			out << int(image[i]) << ' ' << int(image[i + 1]) << ' ' << int(image[i + 2]) << '\n';
		}
		if (!out) {
			throw std::runtime_error("failed writing '" + filename + "'");
		}
	}
	else {
		//save to .png
		if (!stbi_write_png(filename.c_str(), width, height, 3, image.data(), width * 3)) {
			throw std::runtime_error("stbi_write_png failed for '" + filename + "'");
		}
	}

	std::cerr << "[Info] Image saved to " << filename << "\n";
}
