#include "image.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <new>
#include <jpeglib.h>

namespace photolink {

namespace {

// libjpeg's default error_exit calls exit(); jump back to the caller instead.
struct JpegErrorMgr {
  jpeg_error_mgr pub;
  std::jmp_buf jump;
};

void on_jpeg_error(j_common_ptr cinfo) {
  auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
  char msg[JMSG_LENGTH_MAX];
  (*cinfo->err->format_message)(cinfo, msg);
  Logger::instance().log(LogLevel::DEBUG, "libjpeg: %s", msg);
  std::longjmp(err->jump, 1);
}

// Owned by the caller of setjmp through a pointer, so nothing it holds is an
// automatic object modified between setjmp and longjmp.
struct MemDest {
  unsigned char *buf = nullptr;
  unsigned long size = 0;
  ~MemDest() { std::free(buf); }
};

void on_jpeg_message(j_common_ptr cinfo) {
  char msg[JMSG_LENGTH_MAX];
  (*cinfo->err->format_message)(cinfo, msg);
  Logger::instance().log(LogLevel::TRACE, "libjpeg: %s", msg);
}

} // namespace

std::error_code decode_jpeg(const std::vector<uint8_t> &data, Bitmap &out) {
  if (data.empty())
    return TransferErrc::decode_error;

  jpeg_decompress_struct cinfo;
  JpegErrorMgr jerr;
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = on_jpeg_error;
  jerr.pub.output_message = on_jpeg_message;
  if (setjmp(jerr.jump)) {
    jpeg_destroy_decompress(&cinfo);
    out.release();
    return TransferErrc::decode_error;
  }

  jpeg_create_decompress(&cinfo);
  jpeg_mem_src(&cinfo, const_cast<unsigned char *>(data.data()),
               (unsigned long)data.size());
  jpeg_read_header(&cinfo, TRUE);
  if ((uint64_t)cinfo.image_width * cinfo.image_height > kMaxDecodedPixels) {
    Logger::instance().log(LogLevel::WARN, "refusing %ux%u image",
                           (unsigned)cinfo.image_width,
                           (unsigned)cinfo.image_height);
    jpeg_destroy_decompress(&cinfo);
    return TransferErrc::decode_error;
  }
  cinfo.out_color_space = JCS_RGB;
  jpeg_start_decompress(&cinfo);

  out.width = (int)cinfo.output_width;
  out.height = (int)cinfo.output_height;
  const size_t stride = (size_t)out.width * 3;
  try {
    out.rgb.resize(stride * out.height);
  } catch (const std::bad_alloc &) {
    Logger::instance().log(LogLevel::ERROR, "no memory for %dx%d image",
                           out.width, out.height);
    jpeg_destroy_decompress(&cinfo);
    out.release();
    return TransferErrc::decode_error;
  }
  while (cinfo.output_scanline < cinfo.output_height) {
    JSAMPROW row[1];
    row[0] = out.rgb.data() + cinfo.output_scanline * stride;
    jpeg_read_scanlines(&cinfo, row, 1);
  }
  jpeg_finish_decompress(&cinfo);
  jpeg_destroy_decompress(&cinfo);
  return {};
}

std::error_code encode_jpeg(const Bitmap &bmp, int quality, ImageBuffer &out) {
  if (bmp.empty() || bmp.rgb.size() < (size_t)bmp.width * bmp.height * 3)
    return TransferErrc::decode_error;

  jpeg_compress_struct cinfo;
  JpegErrorMgr jerr;
  std::unique_ptr<MemDest> dest(new MemDest());
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = on_jpeg_error;
  jerr.pub.output_message = on_jpeg_message;
  if (setjmp(jerr.jump)) {
    jpeg_destroy_compress(&cinfo);
    return TransferErrc::decode_error;
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, &dest->buf, &dest->size);
  cinfo.image_width = (JDIMENSION)bmp.width;
  cinfo.image_height = (JDIMENSION)bmp.height;
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  jpeg_start_compress(&cinfo, TRUE);
  const size_t stride = (size_t)bmp.width * 3;
  while (cinfo.next_scanline < cinfo.image_height) {
    JSAMPROW row[1];
    row[0] = const_cast<JSAMPLE *>(bmp.rgb.data() + cinfo.next_scanline * stride);
    jpeg_write_scanlines(&cinfo, row, 1);
  }
  jpeg_finish_compress(&cinfo);
  out.assign(dest->buf, dest->buf + dest->size);
  jpeg_destroy_compress(&cinfo);
  return {};
}

Bitmap scale_to_width(const Bitmap &src, int width) {
  Bitmap dst;
  if (src.empty() || width <= 0)
    return dst;
  double ratio = (double)width / src.width;
  dst.width = width;
  dst.height = std::max(1, (int)(src.height * ratio));
  dst.rgb.resize((size_t)dst.width * dst.height * 3);

  const double sx = (double)src.width / dst.width;
  const double sy = (double)src.height / dst.height;
  const size_t sstride = (size_t)src.width * 3;
  for (int y = 0; y < dst.height; y++) {
    double fy = (y + 0.5) * sy - 0.5;
    if (fy < 0)
      fy = 0;
    int y0 = std::min((int)fy, src.height - 1);
    int y1 = std::min(y0 + 1, src.height - 1);
    double wy = fy - y0;
    const uint8_t *r0 = src.rgb.data() + y0 * sstride;
    const uint8_t *r1 = src.rgb.data() + y1 * sstride;
    uint8_t *out = dst.rgb.data() + (size_t)y * dst.width * 3;
    for (int x = 0; x < dst.width; x++) {
      double fx = (x + 0.5) * sx - 0.5;
      if (fx < 0)
        fx = 0;
      int x0 = std::min((int)fx, src.width - 1);
      int x1 = std::min(x0 + 1, src.width - 1);
      double wx = fx - x0;
      for (int c = 0; c < 3; c++) {
        double top = r0[x0 * 3 + c] * (1 - wx) + r0[x1 * 3 + c] * wx;
        double bot = r1[x0 * 3 + c] * (1 - wx) + r1[x1 * 3 + c] * wx;
        out[x * 3 + c] = (uint8_t)(top * (1 - wy) + bot * wy + 0.5);
      }
    }
  }
  return dst;
}

std::error_code normalize_bitmap(Bitmap &&bmp, ImageBuffer &out,
                                 const NormalizeOptions &opts) {
  Bitmap source = std::move(bmp);
  bmp.release();
  if (source.empty())
    return TransferErrc::decode_error;

  std::error_code ec;
  if (source.width > opts.max_width) {
    Bitmap scaled = scale_to_width(source, opts.max_width);
    Logger::instance().log(LogLevel::DEBUG, "scaled %dx%d -> %dx%d",
                           source.width, source.height, scaled.width,
                           scaled.height);
    source.release();
    ec = encode_jpeg(scaled, opts.quality, out);
    scaled.release();
  } else {
    ec = encode_jpeg(source, opts.quality, out);
  }
  source.release();
  return ec;
}

std::error_code normalize_image(const std::vector<uint8_t> &source,
                                ImageBuffer &out,
                                const NormalizeOptions &opts) {
  Bitmap bmp;
  if (auto ec = decode_jpeg(source, bmp))
    return ec;
  return normalize_bitmap(std::move(bmp), out, opts);
}

} // namespace photolink
