#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "CMYKAImage.hpp"
#include "ImageConverter.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"


// ── Mean ink coverage per channel, 0..255 ────────────────────────────────────
static void printInkCoverage(const CMYKAImage& img) {
    Rectangle b = img.bounds();
    double sumC = 0, sumM = 0, sumY = 0, sumK = 0;
    for (int y = b.min.y; y < b.max.y; ++y) {
        for (int x = b.min.x; x < b.max.x; ++x) {
            CMYKA c = img.cmykAt(x, y);
            sumC += c.C;
            sumM += c.M;
            sumY += c.Y;
            sumK += c.K;
        }
    }
    double n = static_cast<double>(b.dx()) * b.dy();

    std::cout << "\n--- Ink Coverage (mean, 0-255) ---" << std::endl;
    std::cout << "Cyan:    " << sumC / n << std::endl;
    std::cout << "Magenta: " << sumM / n << std::endl;
    std::cout << "Yellow:  " << sumY / n << std::endl;
    std::cout << "Black:   " << sumK / n << std::endl;
}


int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <input> [output.png] [x0 y0 x1 y1]" << std::endl;
        std::cout << "Example: " << argv[0] << " photo.jpg preview.png 0 0 64 64" << std::endl;
        return 1;
    }

    std::string inPath = argv[1];
    std::string outPath = argc > 2 ? argv[2] : inPath + "_cmyka.png";

    bool crop = argc > 6;
    Rectangle cropRect;
    if (crop) {
        try {
            cropRect = Rectangle::rect(std::stoi(argv[3]), std::stoi(argv[4]),
                                       std::stoi(argv[5]), std::stoi(argv[6]));
        } catch (const std::exception& e) {
            std::cerr << "Invalid crop rectangle: " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "Loading: " << inPath << "\n";

    int width, height, channels;
    // Always ask stb for RGBA so the converter sees a fixed layout
    unsigned char* imgData = stbi_load(inPath.c_str(), &width, &height, &channels, 4);
    if (!imgData) {
        std::cerr << "Failed to load image: " << stbi_failure_reason() << "\n";
        return 1;
    }

    CMYKAImage img;
    try {
        img = ImageConverter::RGBtoCMYKA(imgData, width, height, 4);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Conversion failed: " << e.what() << "\n";
        stbi_image_free(imgData);
        return 1;
    }
    stbi_image_free(imgData);

    if (crop) {
        img = img.subImage(cropRect);
        if (img.bounds().empty()) {
            std::cerr << "Crop rectangle does not overlap the image.\n";
            return 1;
        }
    }

    Rectangle b = img.bounds();
    std::cout << "\n--- CMYKA Image ---" << std::endl;
    std::cout << "Source channels: " << channels << std::endl;
    std::cout << "Bounds:          (" << b.min.x << "," << b.min.y << ")-("
              << b.max.x << "," << b.max.y << ")" << std::endl;
    std::cout << "Size:            " << b.dx() << "x" << b.dy() << std::endl;
    std::cout << "Stride:          " << img.stride() << " bytes" << std::endl;

    printInkCoverage(img);

    std::vector<unsigned char> pixels = ImageConverter::CMYKAtoRGBA(img);
    int success = stbi_write_png(outPath.c_str(), b.dx(), b.dy(), 4,
                                 pixels.data(), b.dx() * 4);
    if (success)
        std::cout << "\n[SUCCESS] Saved to: " << outPath << "\n";
    else {
        std::cerr << "Failed to write PNG.\n";
        return 1;
    }

    return 0;
}
