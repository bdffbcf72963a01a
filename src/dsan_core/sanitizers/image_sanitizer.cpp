#include "dsan_core/sanitizers/image_sanitizer.hpp"

// libjpeg needs size_t and FILE declared before its header
#include <cstdio>
#include <jpeglib.h>
#include <png.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csetjmp>
#include <cstring>
#include <fstream>
#include <vector>

namespace dsan_core {

namespace {

constexpr std::array<unsigned char, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
constexpr std::array<unsigned char, 3> kJpegSignature = {0xFF, 0xD8, 0xFF};

struct FileCloser {
  void operator()(FILE* file) const {
    if (file) std::fclose(file);
  }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

FilePtr open_file(const fs::path& path, const char* mode) {
  FilePtr file(std::fopen(path.string().c_str(), mode));
  if (!file) {
    throw SanitizerError("Cannot open " + path.string() + ": " + std::strerror(errno));
  }
  return file;
}

// ---------- libpng ----------

struct PngErrorState {
  std::string message;
  size_t warnings = 0;
};

void png_error_handler(png_structp png, png_const_charp message) {
  auto* state = static_cast<PngErrorState*>(png_get_error_ptr(png));
  state->message = message ? message : "unknown libpng error";
  png_longjmp(png, 1);
}

void png_warning_handler(png_structp png, png_const_charp) {
  auto* state = static_cast<PngErrorState*>(png_get_error_ptr(png));
  state->warnings++;
}

// Everything needed to write the same pixels back: header, palette, transparency, rows
struct PngRaster {
  png_uint_32 width = 0;
  png_uint_32 height = 0;
  int bit_depth = 0;
  int color_type = 0;
  std::vector<png_color> palette;
  bool has_transparency = false;
  std::vector<png_byte> transparency_alpha;
  png_color_16 transparency_color{};
  size_t row_bytes = 0;
  std::vector<png_byte> pixels;
};

void read_png(FILE* input, PngRaster& raster, PngErrorState& state) {
  std::vector<png_bytep> rows;

  png_structp png =
      png_create_read_struct(PNG_LIBPNG_VER_STRING, &state, png_error_handler, png_warning_handler);
  if (!png) {
    throw SanitizerError("png_create_read_struct failed");
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_read_struct(&png, nullptr, nullptr);
    throw SanitizerError("png_create_info_struct failed");
  }

  if (setjmp(png_jmpbuf(png))) {
    png_destroy_read_struct(&png, &info, nullptr);
    throw SanitizerError("libpng read error: " + state.message);
  }

  png_init_io(png, input);
  png_read_info(png, info);

  int interlace_type = 0;
  png_get_IHDR(png, info, &raster.width, &raster.height, &raster.bit_depth, &raster.color_type,
               &interlace_type, nullptr, nullptr);

  if (png_get_valid(png, info, PNG_INFO_PLTE)) {
    png_colorp palette = nullptr;
    int palette_size = 0;
    png_get_PLTE(png, info, &palette, &palette_size);
    raster.palette.assign(palette, palette + palette_size);
  }

  if (png_get_valid(png, info, PNG_INFO_tRNS)) {
    png_bytep alpha = nullptr;
    int alpha_count = 0;
    png_color_16p color = nullptr;
    png_get_tRNS(png, info, &alpha, &alpha_count, &color);
    raster.has_transparency = true;
    if (raster.color_type == PNG_COLOR_TYPE_PALETTE && alpha) {
      raster.transparency_alpha.assign(alpha, alpha + alpha_count);
    }
    if (color) {
      raster.transparency_color = *color;
    }
  }

  // No colour transforms: rows come back in the file's own format.
  // Interlaced images are assembled into full rows.
  if (interlace_type != PNG_INTERLACE_NONE) {
    png_set_interlace_handling(png);
  }
  png_read_update_info(png, info);

  raster.row_bytes = png_get_rowbytes(png, info);
  raster.pixels.resize(raster.row_bytes * raster.height);
  rows.resize(raster.height);
  for (png_uint_32 y = 0; y < raster.height; ++y) {
    rows[y] = raster.pixels.data() + y * raster.row_bytes;
  }

  png_read_image(png, rows.data());
  png_read_end(png, nullptr);
  png_destroy_read_struct(&png, &info, nullptr);
}

void write_png(FILE* output, PngRaster& raster, PngErrorState& state) {
  std::vector<png_bytep> rows(raster.height);
  for (png_uint_32 y = 0; y < raster.height; ++y) {
    rows[y] = raster.pixels.data() + y * raster.row_bytes;
  }

  png_structp png =
      png_create_write_struct(PNG_LIBPNG_VER_STRING, &state, png_error_handler, png_warning_handler);
  if (!png) {
    throw SanitizerError("png_create_write_struct failed");
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_write_struct(&png, nullptr);
    throw SanitizerError("png_create_info_struct failed");
  }

  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    throw SanitizerError("libpng write error: " + state.message);
  }

  png_init_io(png, output);
  png_set_IHDR(png, info, raster.width, raster.height, raster.bit_depth, raster.color_type,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

  if (!raster.palette.empty()) {
    png_set_PLTE(png, info, raster.palette.data(), static_cast<int>(raster.palette.size()));
  }
  if (raster.has_transparency) {
    png_set_tRNS(png, info,
                 raster.transparency_alpha.empty() ? nullptr : raster.transparency_alpha.data(),
                 static_cast<int>(raster.transparency_alpha.size()), &raster.transparency_color);
  }

  png_write_info(png, info);
  png_write_image(png, rows.data());
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);
}

// ---------- libjpeg ----------

struct JpegErrorManager {
  jpeg_error_mgr pub;
  std::jmp_buf jump;
  char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
  auto* manager = reinterpret_cast<JpegErrorManager*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, manager->message);
  std::longjmp(manager->jump, 1);
}

// Warnings are counted in num_warnings instead of printed
void jpeg_quiet_output(j_common_ptr) {}

}  // namespace

ImageSanitizer::ImageSanitizer(std::shared_ptr<Logger> logger)
    : MetadataSanitizer(std::move(logger)) {}

bool ImageSanitizer::can_handle(const fs::path& file_path) const {
  const std::string extension = normalized_extension(file_path);
  return extension == ".jpg" || extension == ".jpeg" || extension == ".png";
}

ImageCodec ImageSanitizer::detect_codec(const fs::path& file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw SanitizerError("Could not open file: " + file_path.string());
  }

  std::array<unsigned char, 8> header{};
  file_stream.read(reinterpret_cast<char*>(header.data()), header.size());
  const auto header_size = static_cast<size_t>(file_stream.gcount());

  if (header_size >= kPngSignature.size() &&
      std::equal(kPngSignature.begin(), kPngSignature.end(), header.begin())) {
    return ImageCodec::PNG;
  }
  if (header_size >= kJpegSignature.size() &&
      std::equal(kJpegSignature.begin(), kJpegSignature.end(), header.begin())) {
    return ImageCodec::JPEG;
  }
  return ImageCodec::Unknown;
}

void ImageSanitizer::sanitize(const fs::path& source, const fs::path& destination) const {
  const ImageCodec codec = detect_codec(source);
  if (codec == ImageCodec::Unknown) {
    throw SanitizerError("Unrecognized image signature: " + source.string());
  }

  FilePtr input = open_file(source, "rb");
  try {
    FilePtr output = open_file(destination, "wb");

    if (codec == ImageCodec::PNG) {
      rebuild_png(input.get(), output.get(), source);
    } else {
      rebuild_jpeg(input.get(), output.get(), source);
    }

    if (std::fclose(output.release()) != 0) {
      throw SanitizerError("Cannot finish writing " + destination.string() + ": " +
                           std::strerror(errno));
    }
  } catch (const SanitizerError&) {
    remove_partial_output(destination);
    throw;
  }
}

/**
 * @brief Decodes the PNG rows untransformed and writes them into a fresh file.
 *
 * The new file carries IHDR, PLTE and tRNS (when present), IDAT and IEND. Text,
 * time, EXIF, ICC and every other ancillary chunk of the source are not carried over.
 */
void ImageSanitizer::rebuild_png(FILE* input, FILE* output, const fs::path& source) const {
  PngErrorState state;
  PngRaster raster;
  read_png(input, raster, state);
  write_png(output, raster, state);

  logger_->debug("Rebuilt PNG " + source.string() + " (" + std::to_string(raster.width) + "x" +
                 std::to_string(raster.height) + ", color type " +
                 std::to_string(raster.color_type) + ", " + std::to_string(raster.bit_depth) +
                 "-bit, " + std::to_string(state.warnings) + " libpng warning(s))");
}

/**
 * @brief Moves the DCT coefficients into a fresh JPEG stream.
 *
 * No markers are saved on the read side, so APPn and COM segments never reach the
 * writer. The coefficients are copied as-is, which keeps decoded pixels identical.
 */
void ImageSanitizer::rebuild_jpeg(FILE* input, FILE* output, const fs::path& source) const {
  jpeg_decompress_struct source_info;
  jpeg_compress_struct output_info;
  JpegErrorManager errors;
  std::memset(&source_info, 0, sizeof(source_info));
  std::memset(&output_info, 0, sizeof(output_info));
  std::memset(&errors, 0, sizeof(errors));

  source_info.err = jpeg_std_error(&errors.pub);
  output_info.err = &errors.pub;
  errors.pub.error_exit = jpeg_error_exit;
  errors.pub.output_message = jpeg_quiet_output;

  if (setjmp(errors.jump)) {
    jpeg_destroy_compress(&output_info);
    jpeg_destroy_decompress(&source_info);
    throw SanitizerError(std::string("libjpeg error: ") + errors.message);
  }

  jpeg_create_decompress(&source_info);
  jpeg_create_compress(&output_info);

  jpeg_stdio_src(&source_info, input);
  jpeg_read_header(&source_info, TRUE);
  jvirt_barray_ptr* coefficients = jpeg_read_coefficients(&source_info);

  jpeg_copy_critical_parameters(&source_info, &output_info);
  jpeg_stdio_dest(&output_info, output);
  jpeg_write_coefficients(&output_info, coefficients);

  jpeg_finish_compress(&output_info);
  jpeg_finish_decompress(&source_info);

  const unsigned int width = source_info.image_width;
  const unsigned int height = source_info.image_height;
  const int components = source_info.num_components;
  const long warnings = errors.pub.num_warnings;

  jpeg_destroy_compress(&output_info);
  jpeg_destroy_decompress(&source_info);

  logger_->debug("Rebuilt JPEG " + source.string() + " (" + std::to_string(width) + "x" +
                 std::to_string(height) + ", " + std::to_string(components) + " component(s), " +
                 std::to_string(warnings) + " libjpeg warning(s))");
}

}  // namespace dsan_core
