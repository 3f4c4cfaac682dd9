#include "ortho_stitch/image/compositing.hpp"
#include "ortho_stitch/core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <cstdint>

namespace ortho_stitch::image {

namespace {

constexpr std::uint32_t kPrecisionBits = 7;

inline std::uint32_t shift_for_div255(std::uint32_t a) {
    return ((a >> 8) + a) >> 8;
}

} // namespace

Image make_transparent_canvas(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw ValidationError("canvas size must be positive, got " +
                              std::to_string(width) + "x" + std::to_string(height));
    }
    return Image(height, width, CV_8UC4, cv::Scalar(0, 0, 0, 0));
}

cv::Vec4b alpha_over(const cv::Vec4b& dst, const cv::Vec4b& src) {
    const std::uint32_t src_a = src[3];
    if (src_a == 0) {
        return dst;
    }

    const std::uint32_t blend = static_cast<std::uint32_t>(dst[3]) * (255u - src_a);
    const std::uint32_t outa255 = src_a * 255u + blend;
    const std::uint32_t coef1 = src_a * 255u * 255u * (1u << kPrecisionBits) / outa255;
    const std::uint32_t coef2 = 255u * (1u << kPrecisionBits) - coef1;

    cv::Vec4b out;
    for (int c = 0; c < 3; ++c) {
        const std::uint32_t t = static_cast<std::uint32_t>(src[c]) * coef1 +
                                static_cast<std::uint32_t>(dst[c]) * coef2;
        out[c] = static_cast<std::uint8_t>(
            shift_for_div255(t + (0x80u << kPrecisionBits)) >> kPrecisionBits);
    }
    out[3] = static_cast<std::uint8_t>(shift_for_div255(outa255 + 0x80u));
    return out;
}

void alpha_composite(Image& dst, const Image& src, cv::Point offset) {
    CV_Assert(dst.type() == CV_8UC4);
    CV_Assert(src.type() == CV_8UC4);

    const cv::Rect dst_rect = cv::Rect(offset, src.size()) & cv::Rect(0, 0, dst.cols, dst.rows);
    if (dst_rect.empty()) {
        return;
    }
    const cv::Rect src_rect(dst_rect.x - offset.x, dst_rect.y - offset.y,
                            dst_rect.width, dst_rect.height);

    for (int y = 0; y < dst_rect.height; ++y) {
        cv::Vec4b* d = dst.ptr<cv::Vec4b>(dst_rect.y + y) + dst_rect.x;
        const cv::Vec4b* s = src.ptr<cv::Vec4b>(src_rect.y + y) + src_rect.x;
        for (int x = 0; x < dst_rect.width; ++x) {
            d[x] = alpha_over(d[x], s[x]);
        }
    }
}

Image to_bgra8(const cv::Mat& decoded) {
    CV_Assert(!decoded.empty());

    cv::Mat depth8;
    switch (decoded.depth()) {
        case CV_8U:
            depth8 = decoded;
            break;
        case CV_16U:
            decoded.convertTo(depth8, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            decoded.convertTo(depth8, CV_8U, 255.0);
            break;
        default:
            decoded.convertTo(depth8, CV_8U);
            break;
    }

    Image out;
    switch (depth8.channels()) {
        case 1:
            cv::cvtColor(depth8, out, cv::COLOR_GRAY2BGRA);
            break;
        case 3:
            cv::cvtColor(depth8, out, cv::COLOR_BGR2BGRA);
            break;
        case 4:
            out = depth8.clone();
            break;
        default:
            throw ValidationError("unsupported channel count: " + std::to_string(depth8.channels()));
    }
    return out;
}

Image resample_nearest(const Image& img, int size) {
    if (img.cols == size && img.rows == size) {
        return img;
    }
    // INTER_NEAREST_EXACT samples pixel centres, matching PIL's NEAREST filter.
    Image out;
    cv::resize(img, out, cv::Size(size, size), 0, 0, cv::INTER_NEAREST_EXACT);
    return out;
}

} // namespace ortho_stitch::image
