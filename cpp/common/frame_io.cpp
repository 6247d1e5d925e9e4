#include "ncaplay/frame_io.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>
#include "ncaplay/nca_stepper.hpp"

namespace ncaplay {

static std::uint8_t to_byte(float v) {
    return static_cast<std::uint8_t>(std::lround(clamp_unit(v) * 255.0f));
}

std::vector<std::uint8_t> to_rgb8(const CellGrid& grid) {
    std::vector<std::uint8_t> pixels(grid.size() * 3);
    const auto& cells = grid.raw();
    for (std::size_t i = 0; i < cells.size(); ++i) {
        pixels[i * 3 + 0] = to_byte(cells[i][0]);
        pixels[i * 3 + 1] = to_byte(cells[i][1]);
        pixels[i * 3 + 2] = to_byte(cells[i][2]);
    }
    return pixels;
}

void write_ppm(const std::string& filename, const CellGrid& grid) {
    std::ofstream ofs(filename, std::ios::binary);
    if (!ofs) {
        throw std::runtime_error("cannot open " + filename + " for writing");
    }
    ofs << "P6\n" << grid.width() << " " << grid.height() << "\n255\n";

    const auto pixels = to_rgb8(grid);
    ofs.write(reinterpret_cast<const char*>(pixels.data()), static_cast<std::streamsize>(pixels.size()));
    if (!ofs) {
        throw std::runtime_error("failed writing " + filename);
    }
}

}
