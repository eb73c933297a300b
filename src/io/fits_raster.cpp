#include "tile_segment/io/fits_raster.hpp"
#include "tile_segment/core/errors.hpp"
#include "tile_segment/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <set>
#include <vector>

namespace tile_segment::io {

namespace {

const std::set<std::string> kStructuralKeys = {
    "SIMPLE", "BITPIX", "NAXIS", "NAXIS1", "NAXIS2", "NAXIS3", "EXTEND", "BZERO",
    "BSCALE", "BLANK", "PCOUNT", "GCOUNT", "XTENSION", "END", "COMMENT", "HISTORY",
    "CONTINUE", "LONGSTRN", "GEOCRS", "NODATA",
};

bool is_reserved_key(const std::string& key) {
    return kStructuralKeys.count(key) > 0 || core::starts_with(key, "GEOTRN");
}

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text) + " (status " + std::to_string(status) + ")";
}

PixelType pixel_type_from_bitpix(int bitpix) {
    switch (bitpix) {
        case BYTE_IMG:
            return PixelType::UINT8;
        case USHORT_IMG:
            return PixelType::UINT16;
        case FLOAT_IMG:
        case DOUBLE_IMG:
            return PixelType::FLOAT32;
        default:
            return PixelType::UNSUPPORTED;
    }
}

RasterMetadata read_header_cards(fitsfile* fptr) {
    RasterMetadata metadata;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return metadata;
    }

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || is_reserved_key(key)) {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype = 'C';
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'L':
                metadata.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    metadata.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    metadata.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    metadata.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    metadata.set(key, val_str);
                }
                break;
            default:
                metadata.set(key, val_str);
                break;
        }
    }
    return metadata;
}

std::optional<std::string> read_long_string(fitsfile* fptr, const char* key) {
    int status = 0;
    char* value = nullptr;
    fits_read_key_longstr(fptr, key, &value, nullptr, &status);
    if (status || value == nullptr) {
        return std::nullopt;
    }
    std::string out(value);
    fits_free_memory(value, &status);
    return out;
}

std::optional<GeoTransform> read_geotransform(fitsfile* fptr) {
    GeoTransform transform{};
    for (int i = 0; i < 6; ++i) {
        int status = 0;
        std::string key = "GEOTRN" + std::to_string(i + 1);
        double v = 0.0;
        fits_read_key(fptr, TDOUBLE, key.c_str(), &v, nullptr, &status);
        if (status) {
            return std::nullopt;
        }
        transform[static_cast<size_t>(i)] = v;
    }
    return transform;
}

void write_header(fitsfile* fptr, const RasterMetadata& metadata,
                  const std::optional<std::string>& crs,
                  const std::optional<GeoTransform>& transform, int* status) {
    for (const auto& [key, value] : metadata.string_values) {
        if (is_reserved_key(key)) continue;
        fits_update_key(fptr, TSTRING, key.c_str(), const_cast<char*>(value.c_str()), nullptr, status);
    }
    for (const auto& [key, value] : metadata.numeric_values) {
        if (is_reserved_key(key)) continue;
        double v = value;
        fits_update_key(fptr, TDOUBLE, key.c_str(), &v, nullptr, status);
    }
    for (const auto& [key, value] : metadata.int_values) {
        if (is_reserved_key(key)) continue;
        int v = value;
        fits_update_key(fptr, TINT, key.c_str(), &v, nullptr, status);
    }
    for (const auto& [key, value] : metadata.bool_values) {
        if (is_reserved_key(key)) continue;
        int v = value ? 1 : 0;
        fits_update_key(fptr, TLOGICAL, key.c_str(), &v, nullptr, status);
    }
    if (crs) {
        fits_write_key_longstr(fptr, "GEOCRS", crs->c_str(), "coordinate reference system", status);
    }
    if (transform) {
        for (size_t i = 0; i < transform->size(); ++i) {
            std::string key = "GEOTRN" + std::to_string(i + 1);
            double v = (*transform)[i];
            fits_update_key(fptr, TDOUBLE, key.c_str(), &v, "geotransform coefficient", status);
        }
    }
}

} // namespace

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

FitsRasterReader::FitsRasterReader(const fs::path& path) : path_(path) {
    int status = 0;
    if (fits_open_file(&fptr_, path.string().c_str(), READONLY, &status)) {
        fptr_ = nullptr;
        throw FitsError("Cannot open FITS file: " + path.string() + ": " + fits_status_text(status));
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    fits_get_img_param(fptr_, 3, &bitpix, &naxis, naxes, &status);
    int equiv_bitpix = bitpix;
    fits_get_img_equivtype(fptr_, &equiv_bitpix, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr_, &close_status);
        fptr_ = nullptr;
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2 || naxis > 3) {
        int close_status = 0;
        fits_close_file(fptr_, &close_status);
        fptr_ = nullptr;
        throw FitsError("FITS image must have 2 or 3 axes, got " + std::to_string(naxis) + ": " +
                        path.string());
    }

    info_.width = static_cast<int>(naxes[0]);
    info_.height = static_cast<int>(naxes[1]);
    info_.band_count = naxis == 3 ? static_cast<int>(naxes[2]) : 1;
    info_.pixel_type = pixel_type_from_bitpix(equiv_bitpix);
    info_.metadata = read_header_cards(fptr_);
    info_.crs = read_long_string(fptr_, "GEOCRS");
    info_.transform = read_geotransform(fptr_);

    int nodata_status = 0;
    double nodata = 0.0;
    fits_read_key(fptr_, TDOUBLE, "NODATA", &nodata, nullptr, &nodata_status);
    if (!nodata_status) {
        info_.metadata.set("NODATA", nodata);
    }
}

FitsRasterReader::~FitsRasterReader() {
    if (fptr_) {
        int status = 0;
        fits_close_file(fptr_, &status);
    }
}

BandStack FitsRasterReader::read_window(const Window& window, const std::vector<int>& band_order,
                                        bool boundless, float fill_value) {
    if (window.height < 1 || window.width < 1) {
        throw IOError("Cannot read empty window from " + path_.string());
    }
    if (!boundless) {
        require_window_in_bounds(window, info_.height, info_.width, path_.string());
    }

    std::vector<int> bands = band_order;
    if (bands.empty()) {
        for (int b = 1; b <= info_.band_count; ++b) bands.push_back(b);
    }
    for (int b : bands) {
        if (b < 1 || b > info_.band_count) {
            throw ConfigError("band index " + std::to_string(b) + " is outside 1.." +
                              std::to_string(info_.band_count) + " for " + path_.string());
        }
    }

    const int r0 = std::max(window.row_off, 0);
    const int c0 = std::max(window.col_off, 0);
    const int r1 = std::min(window.row_off + window.height, info_.height);
    const int c1 = std::min(window.col_off + window.width, info_.width);

    BandStack out;
    out.reserve(bands.size());
    for (int b : bands) {
        Matrix2Df plane = Matrix2Df::Constant(window.height, window.width, fill_value);
        if (r1 > r0 && c1 > c0) {
            Matrix2Df part(r1 - r0, c1 - c0);
            long fpixel[3] = {c0 + 1, r0 + 1, b};
            long lpixel[3] = {c1, r1, b};
            long inc[3] = {1, 1, 1};
            int anynul = 0;
            int status = 0;
            fits_read_subset(fptr_, TFLOAT, fpixel, lpixel, inc, nullptr, part.data(), &anynul, &status);
            if (status) {
                throw FitsError("Cannot read band " + std::to_string(b) + " of " + path_.string() +
                                ": " + fits_status_text(status));
            }
            plane.block(r0 - window.row_off, c0 - window.col_off, r1 - r0, c1 - c0) = part;
        }
        out.push_back(std::move(plane));
    }
    return out;
}

FitsRasterWriter::FitsRasterWriter(const fs::path& path, const WriterOptions& options)
    : path_(path), height_(options.height), width_(options.width) {
    if (height_ < 1 || width_ < 1) {
        throw IOError("Output raster must be at least 1x1: " + path.string());
    }

    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr_, filepath.c_str(), &status)) {
        fptr_ = nullptr;
        throw FitsError("Cannot create FITS file: " + path.string() + ": " + fits_status_text(status));
    }

    long naxes[2] = {width_, height_};
    fits_create_img(fptr_, BYTE_IMG, 2, naxes, &status);
    write_header(fptr_, options.metadata, options.crs, options.transform, &status);
    int nodata = options.nodata;
    fits_update_key(fptr_, TINT, "NODATA", &nodata, "label written where no class applies", &status);
    if (status) {
        std::string msg = fits_status_text(status);
        int close_status = 0;
        fits_close_file(fptr_, &close_status);
        fptr_ = nullptr;
        throw FitsError("Cannot create FITS image: " + path.string() + ": " + msg);
    }

    // Fill in row chunks so read_window sees nodata before the first write.
    const int chunk_rows = std::max(1, std::min(height_, (1 << 22) / width_));
    std::vector<uint8_t> fill(static_cast<size_t>(chunk_rows) * width_, options.nodata);
    for (int row = 0; row < height_; row += chunk_rows) {
        const int rows = std::min(chunk_rows, height_ - row);
        long fpixel[2] = {1, row + 1};
        fits_write_pix(fptr_, TBYTE, fpixel, static_cast<LONGLONG>(rows) * width_, fill.data(), &status);
        if (status) {
            std::string msg = fits_status_text(status);
            int close_status = 0;
            fits_close_file(fptr_, &close_status);
            fptr_ = nullptr;
            throw FitsError("Cannot initialize FITS image: " + path.string() + ": " + msg);
        }
    }
}

FitsRasterWriter::~FitsRasterWriter() {
    if (fptr_) {
        int status = 0;
        fits_close_file(fptr_, &status);
    }
}

void FitsRasterWriter::write(const LabelMap& data, const Window& window) {
    if (!fptr_) {
        throw IOError("Write to closed raster: " + path_.string());
    }
    require_window_in_bounds(window, height_, width_, path_.string());
    if (data.rows() != window.height || data.cols() != window.width) {
        throw IOError("Label block " + std::to_string(data.rows()) + "x" + std::to_string(data.cols()) +
                      " does not match window " + std::to_string(window.height) + "x" +
                      std::to_string(window.width));
    }

    LabelMap block = data;
    long fpixel[2] = {window.col_off + 1, window.row_off + 1};
    long lpixel[2] = {window.col_off + window.width, window.row_off + window.height};
    int status = 0;
    fits_write_subset(fptr_, TBYTE, fpixel, lpixel, block.data(), &status);
    if (status) {
        throw FitsError("Cannot write labels to " + path_.string() + ": " + fits_status_text(status));
    }
}

LabelMap FitsRasterWriter::read_window(const Window& window) {
    if (!fptr_) {
        throw IOError("Read from closed raster: " + path_.string());
    }
    require_window_in_bounds(window, height_, width_, path_.string());

    LabelMap block(window.height, window.width);
    long fpixel[2] = {window.col_off + 1, window.row_off + 1};
    long lpixel[2] = {window.col_off + window.width, window.row_off + window.height};
    long inc[2] = {1, 1};
    int anynul = 0;
    int status = 0;
    fits_read_subset(fptr_, TBYTE, fpixel, lpixel, inc, nullptr, block.data(), &anynul, &status);
    if (status) {
        throw FitsError("Cannot read labels from " + path_.string() + ": " + fits_status_text(status));
    }
    return block;
}

void FitsRasterWriter::close() {
    if (!fptr_) {
        return;
    }
    int status = 0;
    fits_close_file(fptr_, &status);
    fptr_ = nullptr;
    if (status) {
        throw FitsError("Cannot close FITS file: " + path_.string() + ": " + fits_status_text(status));
    }
}

void write_fits_bands(const fs::path& path, const BandStack& bands, PixelType pixel_type,
                      const RasterMetadata& metadata, const std::optional<std::string>& crs,
                      const std::optional<GeoTransform>& transform) {
    if (bands.empty()) {
        throw IOError("No bands to write: " + path.string());
    }
    const long height = bands[0].rows();
    const long width = bands[0].cols();
    for (const auto& b : bands) {
        if (b.rows() != height || b.cols() != width) {
            throw IOError("Band planes differ in size: " + path.string());
        }
    }

    int bitpix = FLOAT_IMG;
    switch (pixel_type) {
        case PixelType::UINT8:
            bitpix = BYTE_IMG;
            break;
        case PixelType::UINT16:
            bitpix = USHORT_IMG;
            break;
        case PixelType::FLOAT32:
            bitpix = FLOAT_IMG;
            break;
        default:
            throw IOError("Cannot write pixel type " + pixel_type_to_string(pixel_type));
    }

    fitsfile* fptr = nullptr;
    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    const int naxis = bands.size() == 1 ? 2 : 3;
    long naxes[3] = {width, height, static_cast<long>(bands.size())};
    fits_create_img(fptr, bitpix, naxis, naxes, &status);
    write_header(fptr, metadata, crs, transform, &status);

    for (size_t b = 0; b < bands.size() && !status; ++b) {
        Matrix2Df plane = bands[b];
        long fpixel[3] = {1, 1, static_cast<long>(b) + 1};
        fits_write_pix(fptr, TFLOAT, fpixel, height * width, plane.data(), &status);
    }

    if (status) {
        std::string msg = fits_status_text(status);
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write FITS image: " + path.string() + ": " + msg);
    }
    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace tile_segment::io
