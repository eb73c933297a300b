#pragma once

#include "tile_segment/io/raster_io.hpp"

#include <filesystem>

typedef struct fitsfile fitsfile;

namespace tile_segment::io {

namespace fs = std::filesystem;

bool is_fits_image_path(const fs::path& path);

// Windowed reader over a 2D image or a 3D cube (NAXIS3 = bands) in the
// primary HDU. Georeferencing is read from GEOCRS and GEOTRN1..6.
class FitsRasterReader : public RasterReader {
public:
    explicit FitsRasterReader(const fs::path& path);
    ~FitsRasterReader() override;

    FitsRasterReader(const FitsRasterReader&) = delete;
    FitsRasterReader& operator=(const FitsRasterReader&) = delete;

    const RasterInfo& info() const override { return info_; }

    BandStack read_window(const Window& window,
                          const std::vector<int>& band_order = {},
                          bool boundless = true,
                          float fill_value = 0.0f) override;

private:
    fs::path path_;
    fitsfile* fptr_ = nullptr;
    RasterInfo info_;
};

// Single band BYTE_IMG label raster. Pixels start at the nodata value.
class FitsRasterWriter : public RasterWriter {
public:
    FitsRasterWriter(const fs::path& path, const WriterOptions& options);
    ~FitsRasterWriter() override;

    FitsRasterWriter(const FitsRasterWriter&) = delete;
    FitsRasterWriter& operator=(const FitsRasterWriter&) = delete;

    int height() const override { return height_; }
    int width() const override { return width_; }

    void write(const LabelMap& data, const Window& window) override;
    LabelMap read_window(const Window& window) override;
    void close() override;

private:
    fs::path path_;
    fitsfile* fptr_ = nullptr;
    int height_ = 0;
    int width_ = 0;
};

// Writes bands as a 2D image (one band) or a 3D cube, storing samples as
// pixel_type. Used to prepare inputs and by tests.
void write_fits_bands(const fs::path& path, const BandStack& bands, PixelType pixel_type,
                      const RasterMetadata& metadata = {},
                      const std::optional<std::string>& crs = std::nullopt,
                      const std::optional<GeoTransform>& transform = std::nullopt);

} // namespace tile_segment::io
