#ifndef CLIMEXTRACT_SPATIAL_INDEXER_HPP
#define CLIMEXTRACT_SPATIAL_INDEXER_HPP

#include <vector>
#include "extract/common.hpp"

namespace climextract {
namespace extract {

/**
 * Maps geographic coordinates to raster cell addresses using the raster's
 * affine geotransform. Points and raster must share a coordinate system;
 * no reprojection is performed.
 */
class SpatialIndexer {
public:
    /**
     * @param geo_transform GDAL geotransform of the raster
     * @throws std::invalid_argument if the transform cannot be inverted
     */
    explicit SpatialIndexer(const GeoTransform& geo_transform);
    ~SpatialIndexer() = default;

    /**
     * Locate the cell containing a point (floor of the fractional pixel/line)
     * @param point Point with x = longitude, y = latitude
     * @return Cell address, not clamped to the grid
     */
    CellAddress locate(const Point& point) const;

    /**
     * Locate every point feature, preserving input order
     * @param points Point features
     * @return One address per point
     */
    std::vector<CellAddress> locateAll(const std::vector<PointFeature>& points) const;

    const GeoTransform& getGeoTransform() const { return geo_transform_; }

private:
    GeoTransform geo_transform_;
    GeoTransform inverse_transform_;
};

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_SPATIAL_INDEXER_HPP
