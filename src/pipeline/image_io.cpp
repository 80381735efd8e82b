#include "pipeline/image_io.hpp"

#include <cctype>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace cascii {

namespace {

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

}

bool is_image_path(const std::string& path) {
    std::string lower = to_lower_copy(path);
    return lower.ends_with(".png") || lower.ends_with(".jpg") ||
           lower.ends_with(".jpeg") || lower.ends_with(".bmp") ||
           lower.ends_with(".gif") || lower.ends_with(".tga");
}

Result probe_image(const std::string& path, Size& size) {
    int w = 0, h = 0, channels = 0;
    if (!stbi_info(path.c_str(), &w, &h, &channels)) {
        return Result::fail(ErrorCode::DECODE_ERROR, "cannot read image header of " + path);
    }
    size.width = w;
    size.height = h;
    return Result::ok();
}

Result load_image(const std::string& path, FrameBuffer& out) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 3);
    if (!data) {
        const char* reason = stbi_failure_reason();
        return Result::fail(ErrorCode::DECODE_ERROR,
            "cannot decode " + path + (reason ? std::string(": ") + reason : std::string()));
    }

    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return Result::fail(ErrorCode::DECODE_ERROR, "image has no pixels: " + path);
    }

    out = FrameBuffer::from_rgb(data, w, h, w * 3);
    stbi_image_free(data);
    return Result::ok();
}

Result save_png(const std::string& path, const FrameBuffer& image) {
    if (image.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "refusing to write empty image " + path);
    }
    if (!stbi_write_png(path.c_str(), image.width(), image.height(), 4, image.data(), image.width() * 4)) {
        return Result::fail(ErrorCode::IO_ERROR, "failed to write " + path);
    }
    return Result::ok();
}

Result resample(const FrameBuffer& input, Size target, FrameBuffer& output) {
    if (input.empty() || target.width <= 0 || target.height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "cannot resample an empty image");
    }
    if (input.size() == target) {
        output = input;
        return Result::ok();
    }

    SwsContext* sws = sws_getContext(
        input.width(), input.height(), AV_PIX_FMT_RGBA,
        target.width, target.height, AV_PIX_FMT_RGBA,
        SWS_LANCZOS, nullptr, nullptr, nullptr);
    if (!sws) {
        return Result::fail(ErrorCode::PROCESSING_ERROR,
            "cannot create scaler " + std::to_string(input.width()) + "x" + std::to_string(input.height()) +
            " -> " + std::to_string(target.width) + "x" + std::to_string(target.height));
    }

    FrameBuffer scaled(target.width, target.height);
    const uint8_t* src_data[1] = { input.data() };
    int src_linesize[1] = { input.width() * 4 };
    uint8_t* dst_data[1] = { scaled.data() };
    int dst_linesize[1] = { target.width * 4 };

    int rows = sws_scale(sws, src_data, src_linesize, 0, input.height(), dst_data, dst_linesize);
    sws_freeContext(sws);
    if (rows != target.height) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "scaler produced " + std::to_string(rows) + " rows");
    }

    output = std::move(scaled);
    return Result::ok();
}

}
