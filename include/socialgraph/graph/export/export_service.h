#pragma once

#include <socialgraph/graph/render/draw_surface.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace socialgraph {
namespace graph {

class ExportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*
 * Saves the currently rendered frame as a PNG under a fixed file name.
 * The pixels are taken verbatim from the surface; nothing is re-rendered.
 */
class ExportService {
public:
    static constexpr const char* kExportFileName = "social-graph.png";

    // Encodes top-down RGBA rows. Throws ExportError on invalid input.
    std::vector<unsigned char> EncodePng(const PixelBuffer& pixels) const;

    // Reads the source, encodes it and writes <directory>/social-graph.png,
    // replacing an existing file. Returns the written path.
    std::filesystem::path Export(PixelSource& source, const std::filesystem::path& directory) const;

    // $HOME/Downloads when it exists, the working directory otherwise.
    static std::filesystem::path DefaultDownloadDirectory();
};

} // namespace graph
} // namespace socialgraph
