#ifndef CLIMEXTRACT_WRITER_OVERLAY_PLOT_HPP
#define CLIMEXTRACT_WRITER_OVERLAY_PLOT_HPP

#include <string>
#include <vector>
#include "extract/common.hpp"

namespace climextract {
namespace io {

/**
 * Configuration for the diagnostic overlay image
 */
struct OverlayPlotWriterConfig {
    std::string output_file_path;   // Image path (.png, .jpg or .tif)
    int marker_radius;              // Half-size of the square point marker in pixels

    OverlayPlotWriterConfig() : marker_radius(1) {}
};

/**
 * Renders one raster band as a grayscale image with the sampled points drawn
 * as black markers. Purely diagnostic.
 */
class OverlayPlotWriter {
public:
    OverlayPlotWriter();
    ~OverlayPlotWriter() = default;

    // Disable copy constructor and assignment
    OverlayPlotWriter(const OverlayPlotWriter&) = delete;
    OverlayPlotWriter& operator=(const OverlayPlotWriter&) = delete;

    /**
     * Write the overlay image
     * @param config Writer configuration
     * @param band Band to render
     * @param addresses Cell addresses of the points; out-of-grid points are not drawn
     * @return true if successful, false otherwise
     */
    bool writeOverlay(const OverlayPlotWriterConfig& config, const extract::BandGrid& band,
                      const std::vector<extract::CellAddress>& addresses);

    std::string getLastError() const { return last_error_; }

    /**
     * Stretch band values linearly to 1..255; invalid cells become 255
     */
    static std::vector<unsigned char> renderGrayscale(const extract::BandGrid& band);

private:
    std::string last_error_;
};

} // namespace io
} // namespace climextract

#endif // CLIMEXTRACT_WRITER_OVERLAY_PLOT_HPP
