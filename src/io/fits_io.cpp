#include "rangeshift/io/fits_io.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace rangeshift::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto iit = int_values.find(key);
    if (iit != int_values.end()) {
        return static_cast<double>(iit->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

namespace {

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

fitsfile* open_readonly(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string() + " (" + fits_status_text(status) + ")");
    }
    return fptr;
}

void close_quietly(fitsfile* fptr) {
    int status = 0;
    if (fptr) fits_close_file(fptr, &status);
}

bool parse_int(const std::string& s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_double(const std::string& s, double& out) {
    std::string t = s;
    std::replace(t.begin(), t.end(), 'D', 'E');
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return header;
    }

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        if (fits_read_record(fptr, i, card, &status)) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        if (fits_get_keyname(card, keyname, &keylen, &status)) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        if (fits_parse_value(card, value, comment, &status)) continue;

        char dtype = 'C';
        if (fits_get_keytype(value, &dtype, &status)) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        int ival = 0;
        double dval = 0.0;
        switch (dtype) {
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                if (parse_int(val_str, ival)) header.set(key, ival);
                else header.set(key, val_str);
                break;
            case 'F':
                if (parse_double(val_str, dval)) header.set(key, dval);
                else header.set(key, val_str);
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

FitsImageInfo read_image_info(fitsfile* fptr, const fs::path& path) {
    int status = 0;
    int naxis = 0;
    int bitpix = 0;
    long naxes[3] = {0, 0, 1};

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }
    if (naxis < 2 || naxis > 3) {
        throw FitsError("Expected a 2-D or 3-D image, got NAXIS=" + std::to_string(naxis) +
                        ": " + path.string());
    }

    FitsImageInfo info;
    info.width = static_cast<int>(naxes[0]);
    info.height = static_cast<int>(naxes[1]);
    info.planes = naxis == 3 ? static_cast<int>(naxes[2]) : 1;
    info.header = read_header(fptr);
    return info;
}

} // namespace

FitsImageInfo read_fits_info(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    try {
        FitsImageInfo info = read_image_info(fptr, path);
        close_quietly(fptr);
        return info;
    } catch (const FitsError&) {
        close_quietly(fptr);
        throw;
    }
}

Matrix2Df read_fits_plane(const fs::path& path) {
    FitsCubeReader reader(path);
    const auto& info = reader.info();
    auto planes = reader.read_region(0, 0, info.width, info.height);
    return planes.front();
}

Grid grid_from_header(const FitsHeader& header, int width, int height, const Grid& fallback) {
    Grid grid = fallback;
    grid.width = width;
    grid.height = height;
    if (auto v = header.get_double("GRDX0")) grid.origin_x = *v;
    if (auto v = header.get_double("GRDY0")) grid.origin_y = *v;
    if (auto v = header.get_double("GRDDX")) grid.pixel_width = *v;
    if (auto v = header.get_double("GRDDY")) grid.pixel_height = *v;
    if (auto v = header.get_string("GRDCRS")) grid.crs = *v;
    if (auto v = header.get_bool("GEOGRAPH")) grid.geographic = *v;
    return grid;
}

void grid_to_header(const Grid& grid, FitsHeader& header) {
    header.set("GRDX0", grid.origin_x);
    header.set("GRDY0", grid.origin_y);
    header.set("GRDDX", grid.pixel_width);
    header.set("GRDDY", grid.pixel_height);
    if (!grid.crs.empty()) header.set("GRDCRS", grid.crs);
    header.set("GEOGRAPH", grid.geographic);
}

FitsCubeReader::FitsCubeReader(const fs::path& path) : path_(path) {
    fptr_ = open_readonly(path_);
    try {
        info_ = read_image_info(fptr_, path_);
    } catch (const FitsError&) {
        close_quietly(fptr_);
        fptr_ = nullptr;
        throw;
    }
}

FitsCubeReader::~FitsCubeReader() {
    close_quietly(fptr_);
}

std::vector<Matrix2Df> FitsCubeReader::read_region(int x, int y, int width, int height) {
    if (x < 0 || y < 0 || width <= 0 || height <= 0 ||
        x + width > info_.width || y + height > info_.height) {
        throw ShapeError("region " + std::to_string(width) + "x" + std::to_string(height) +
                         "+" + std::to_string(x) + "+" + std::to_string(y) +
                         " outside image " + std::to_string(info_.width) + "x" +
                         std::to_string(info_.height) + ": " + path_.string());
    }

    const size_t plane_size = static_cast<size_t>(width) * static_cast<size_t>(height);
    std::vector<float> buffer(plane_size * static_cast<size_t>(info_.planes));

    long fpixel[3] = {x + 1, y + 1, 1};
    long lpixel[3] = {x + width, y + height, info_.planes};
    long inc[3] = {1, 1, 1};
    // BLANK (integer) and NaN (float) pixels both arrive as NaN.
    float nulval = std::numeric_limits<float>::quiet_NaN();
    int anynul = 0;
    int status = 0;

    fits_read_subset(fptr_, TFLOAT, fpixel, lpixel, inc, &nulval, buffer.data(), &anynul, &status);
    if (status) {
        throw FitsError("Cannot read FITS region: " + path_.string() + " (" + fits_status_text(status) + ")");
    }

    std::vector<Matrix2Df> planes;
    planes.reserve(static_cast<size_t>(info_.planes));
    for (int p = 0; p < info_.planes; ++p) {
        Matrix2Df plane(height, width);
        std::memcpy(plane.data(), buffer.data() + static_cast<size_t>(p) * plane_size,
                    plane_size * sizeof(float));
        planes.push_back(std::move(plane));
    }
    return planes;
}

void FitsCubeReader::read_pixel(int x, int y, float* out) {
    if (x < 0 || y < 0 || x >= info_.width || y >= info_.height) {
        throw ShapeError("pixel (" + std::to_string(x) + "," + std::to_string(y) +
                         ") outside image: " + path_.string());
    }

    long fpixel[3] = {x + 1, y + 1, 1};
    long lpixel[3] = {x + 1, y + 1, info_.planes};
    long inc[3] = {1, 1, 1};
    float nulval = std::numeric_limits<float>::quiet_NaN();
    int anynul = 0;
    int status = 0;

    fits_read_subset(fptr_, TFLOAT, fpixel, lpixel, inc, &nulval, out, &anynul, &status);
    if (status) {
        throw FitsError("Cannot read FITS pixel: " + path_.string() + " (" + fits_status_text(status) + ")");
    }
}

namespace {

void write_header_keys(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
}

} // namespace

FitsCubeWriter::FitsCubeWriter(const fs::path& path, int width, int height, int planes,
                               FitsPixelType type, const FitsHeader& header)
    : path_(path), width_(width), height_(height), planes_(planes) {
    if (width <= 0 || height <= 0 || planes <= 0) {
        throw ShapeError("invalid cube dimensions for " + path.string());
    }

    int status = 0;
    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr_, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string() + " (" + fits_status_text(status) + ")");
    }

    int bitpix = FLOAT_IMG;
    switch (type) {
        case FitsPixelType::INT16: bitpix = SHORT_IMG; break;
        case FitsPixelType::INT32: bitpix = LONG_IMG; break;
        case FitsPixelType::FLOAT32: bitpix = FLOAT_IMG; break;
    }

    long naxes[3] = {width, height, planes};
    const int naxis = planes > 1 ? 3 : 2;
    fits_create_img(fptr_, bitpix, naxis, naxes, &status);
    if (!status) {
        write_header_keys(fptr_, header, status);
    }
    if (status) {
        close_quietly(fptr_);
        fptr_ = nullptr;
        throw FitsError("Cannot create FITS image: " + path.string() + " (" + fits_status_text(status) + ")");
    }
}

FitsCubeWriter::~FitsCubeWriter() {
    close_quietly(fptr_);
}

void FitsCubeWriter::close() {
    if (!fptr_) return;
    int status = 0;
    fits_close_file(fptr_, &status);
    fptr_ = nullptr;
    if (status) {
        throw FitsError("Cannot close FITS file: " + path_.string() + " (" + fits_status_text(status) + ")");
    }
}

void FitsCubeWriter::write_subset(int plane, int x, int y, int w, int h, int datatype, void* buffer) {
    if (!fptr_) {
        throw FitsError("write after close: " + path_.string());
    }
    if (plane < 0 || plane >= planes_ || x < 0 || y < 0 || w <= 0 || h <= 0 ||
        x + w > width_ || y + h > height_) {
        throw ShapeError("region outside output cube " + path_.string());
    }

    long fpixel[3] = {x + 1, y + 1, plane + 1};
    long lpixel[3] = {x + w, y + h, plane + 1};
    int status = 0;
    fits_write_subset(fptr_, datatype, fpixel, lpixel, buffer, &status);
    if (status) {
        throw FitsError("Cannot write FITS region: " + path_.string() + " (" + fits_status_text(status) + ")");
    }
}

void FitsCubeWriter::write_region(int plane, int x, int y, const Matrix2Df& data) {
    std::vector<float> buffer(data.data(), data.data() + data.size());
    write_subset(plane, x, y, static_cast<int>(data.cols()), static_cast<int>(data.rows()),
                 TFLOAT, buffer.data());
}

void FitsCubeWriter::write_region(int plane, int x, int y, const LabelMatrix& data) {
    std::vector<int> buffer(data.data(), data.data() + data.size());
    write_subset(plane, x, y, static_cast<int>(data.cols()), static_cast<int>(data.rows()),
                 TINT, buffer.data());
}

void FitsCubeWriter::write_region(int plane, int x, int y, const IndicatorMatrix& data) {
    std::vector<short> buffer(data.data(), data.data() + data.size());
    write_subset(plane, x, y, static_cast<int>(data.cols()), static_cast<int>(data.rows()),
                 TSHORT, buffer.data());
}

} // namespace rangeshift::io
