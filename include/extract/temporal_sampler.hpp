#ifndef CLIMEXTRACT_TEMPORAL_SAMPLER_HPP
#define CLIMEXTRACT_TEMPORAL_SAMPLER_HPP

#include <string>
#include <vector>
#include <optional>
#include "extract/common.hpp"
#include "extract/period.hpp"
#include "io/raster_reader.hpp"

namespace climextract {
namespace extract {

// Per-point time series, indexed like the point vector
using TimeSeriesSet = std::vector<std::vector<TimeSeriesEntry>>;

/**
 * Walks the raster bands in order, one calendar month per band, and builds
 * the converted time series of every point.
 */
class TemporalSampler {
public:
    TemporalSampler(VariableKind kind, const gregorian::date& start_period);
    ~TemporalSampler() = default;

    // Disable copy constructor and assignment
    TemporalSampler(const TemporalSampler&) = delete;
    TemporalSampler& operator=(const TemporalSampler&) = delete;

    /**
     * Sample every band of the raster at the given cell addresses.
     * Each band is read into memory once. A band that cannot be read yields
     * null for all points in that period.
     * @param raster Open raster reader
     * @param addresses One cell address per point
     * @return One time series per point, periods in chronological order
     */
    TimeSeriesSet sample(io::RasterReader& raster, const std::vector<CellAddress>& addresses);

    /**
     * Append one period to every point's series from an in-memory band.
     * @param period_label "YYYY-MM" label of the band
     * @param grid Band values, or nullptr if the band could not be decoded
     * @param addresses One cell address per point
     * @param series Series to append to (same size as addresses)
     */
    void sampleBand(const std::string& period_label, const BandGrid* grid,
                    const std::vector<CellAddress>& addresses, TimeSeriesSet& series);

    /**
     * Number of (point, band) cells nulled because the value could not be decoded
     */
    size_t getDecodeFailureCount() const { return decode_failure_count_; }

    /**
     * First band read during the last sample() call, kept for the overlay plot
     */
    const std::optional<BandGrid>& getFirstBand() const { return first_band_; }

private:
    VariableKind kind_;
    gregorian::date start_period_;
    size_t decode_failure_count_;
    std::optional<BandGrid> first_band_;

    /**
     * Read and convert one cell; nullopt for NoData or non-finite values
     */
    std::optional<double> readCell(const BandGrid& grid, const CellAddress& address) const;
};

} // namespace extract
} // namespace climextract

#endif // CLIMEXTRACT_TEMPORAL_SAMPLER_HPP
