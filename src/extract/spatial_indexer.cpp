#include "extract/spatial_indexer.hpp"
#include <gdal.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace climextract {
namespace extract {

SpatialIndexer::SpatialIndexer(const GeoTransform& geo_transform)
    : geo_transform_(geo_transform) {
    if (!GDALInvGeoTransform(geo_transform_.data(), inverse_transform_.data())) {
        throw std::invalid_argument("Raster geotransform is not invertible");
    }
}

CellAddress SpatialIndexer::locate(const Point& point) const {
    double x = bg::get<0>(point);
    double y = bg::get<1>(point);

    // Non-finite coordinates can never fall inside the grid
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return CellAddress(-1, -1);
    }

    double pixel = 0.0;
    double line = 0.0;
    GDALApplyGeoTransform(inverse_transform_.data(), x, y, &pixel, &line);

    double row = std::floor(line);
    double col = std::floor(pixel);

    // Keep far-away points representable
    const double limit = static_cast<double>(std::numeric_limits<long>::max() / 2);
    row = std::max(-limit, std::min(limit, row));
    col = std::max(-limit, std::min(limit, col));

    return CellAddress(static_cast<long>(row), static_cast<long>(col));
}

std::vector<CellAddress> SpatialIndexer::locateAll(const std::vector<PointFeature>& points) const {
    std::vector<CellAddress> addresses;
    addresses.reserve(points.size());
    for (const auto& point : points) {
        addresses.push_back(locate(point.geometry));
    }
    return addresses;
}

} // namespace extract
} // namespace climextract
