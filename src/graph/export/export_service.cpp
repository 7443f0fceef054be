#include <socialgraph/graph/export/export_service.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace socialgraph {
namespace graph {

namespace {
void AppendToBuffer(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<unsigned char>*>(context);
    const auto* bytes = static_cast<const unsigned char*>(data);
    out->insert(out->end(), bytes, bytes + size);
}
} // namespace

std::vector<unsigned char> ExportService::EncodePng(const PixelBuffer& pixels) const {
    if (pixels.width <= 0 || pixels.height <= 0) {
        throw ExportError("Nothing has been rendered yet");
    }
    const size_t expected = static_cast<size_t>(pixels.width) * static_cast<size_t>(pixels.height) * 4;
    if (pixels.rgba.size() != expected) {
        throw ExportError("Pixel buffer size " + std::to_string(pixels.rgba.size()) +
                          " does not match " + std::to_string(pixels.width) + "x" +
                          std::to_string(pixels.height) + " RGBA");
    }

    std::vector<unsigned char> png;
    png.reserve(expected / 2);
    const int ok = stbi_write_png_to_func(AppendToBuffer, &png, pixels.width, pixels.height, 4,
                                          pixels.rgba.data(), pixels.width * 4);
    if (!ok || png.empty()) {
        throw ExportError("PNG encoding failed");
    }
    return png;
}

std::filesystem::path ExportService::Export(PixelSource& source, const std::filesystem::path& directory) const {
    std::optional<PixelBuffer> pixels = source.ReadPixels();
    if (!pixels) {
        throw ExportError("The drawing surface has no rendered frame to export");
    }
    std::vector<unsigned char> png = EncodePng(*pixels);

    std::filesystem::path target = directory / kExportFileName;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ExportError("Cannot open " + target.string() + " for writing");
    }
    out.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
    if (!out) {
        throw ExportError("Failed to write " + target.string());
    }
    return target;
}

std::filesystem::path ExportService::DefaultDownloadDirectory() {
    const char* home_env = std::getenv("HOME");
    if (home_env) {
        std::filesystem::path downloads = std::filesystem::path(home_env) / "Downloads";
        std::error_code ec;
        if (std::filesystem::is_directory(downloads, ec)) {
            return downloads;
        }
    }
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        std::cerr << "Warning: Could not determine working directory: " << ec.message() << std::endl;
        return std::filesystem::path(".");
    }
    return cwd;
}

} // namespace graph
} // namespace socialgraph
