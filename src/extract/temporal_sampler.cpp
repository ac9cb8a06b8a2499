#include "extract/temporal_sampler.hpp"
#include "extract/unit_converter.hpp"
#include <cmath>
#include <iostream>

namespace climextract {
namespace extract {

TemporalSampler::TemporalSampler(VariableKind kind, const gregorian::date& start_period)
    : kind_(kind), start_period_(start_period), decode_failure_count_(0) {}

TimeSeriesSet TemporalSampler::sample(io::RasterReader& raster, const std::vector<CellAddress>& addresses) {
    TimeSeriesSet series(addresses.size());
    decode_failure_count_ = 0;
    first_band_.reset();

    int band_count = raster.getBandCount();
    if (band_count <= 0) {
        std::cerr << "Warning: Raster has no bands; every time series will be empty" << std::endl;
        return series;
    }

    for (auto& entries : series) {
        entries.reserve(static_cast<size_t>(band_count));
    }

    std::vector<std::string> labels = buildPeriodLabels(start_period_, static_cast<size_t>(band_count));

    BandGrid grid;
    for (int band_index = 1; band_index <= band_count; ++band_index) {
        const std::string& label = labels[static_cast<size_t>(band_index - 1)];

        if (raster.readBand(band_index, grid)) {
            sampleBand(label, &grid, addresses, series);
            if (band_index == 1) {
                first_band_ = grid;
            }
        } else {
            std::cerr << "Warning: " << raster.getLastError() << ". Period " << label
                      << " is null for every point." << std::endl;
            sampleBand(label, nullptr, addresses, series);
            for (const auto& address : addresses) {
                if (address.isWithin(raster.getHeight(), raster.getWidth())) {
                    ++decode_failure_count_;
                }
            }
        }
    }

    std::cout << "Sampled " << band_count << " bands from " << labels.front()
              << " to " << labels.back() << std::endl;

    return series;
}

void TemporalSampler::sampleBand(const std::string& period_label, const BandGrid* grid,
                                 const std::vector<CellAddress>& addresses, TimeSeriesSet& series) {
    size_t band_failures = 0;
    for (size_t i = 0; i < addresses.size(); ++i) {
        const CellAddress& address = addresses[i];
        std::optional<double> value;

        if (grid && address.isWithin(grid->height, grid->width)) {
            value = readCell(*grid, address);
            if (!value) {
                ++band_failures;
            }
        }

        series[i].emplace_back(period_label, value);
    }

    if (band_failures > 0) {
        decode_failure_count_ += band_failures;
        std::cerr << "Warning: " << band_failures << " cells in period " << period_label
                  << " could not be decoded; recorded as null" << std::endl;
    }
}

std::optional<double> TemporalSampler::readCell(const BandGrid& grid, const CellAddress& address) const {
    double raw = grid.at(address.row, address.col);

    if (!std::isfinite(raw)) {
        return std::nullopt;
    }
    if (grid.nodata_value && raw == *grid.nodata_value) {
        return std::nullopt;
    }

    // Values beyond the double range after conversion are undecodable too
    double converted = roundToDecimals(convertUnits(kind_, raw), STORED_DECIMALS);
    if (!std::isfinite(converted)) {
        return std::nullopt;
    }
    return converted;
}

} // namespace extract
} // namespace climextract
