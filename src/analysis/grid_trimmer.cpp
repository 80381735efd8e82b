#include "analysis/grid_trimmer.hpp"
#include <filesystem>
#include <system_error>

namespace cascii {

namespace fs = std::filesystem;

static Result check_margins(Size size, const TrimMargins& m) {
    if (m.left < 0 || m.right < 0 || m.top < 0 || m.bottom < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "trim margins must be non-negative");
    }
    if (m.left + m.right >= size.width) {
        return Result::fail(ErrorCode::DIMENSION_MISMATCH,
            "trim columns (" + std::to_string(m.left) + " left + " + std::to_string(m.right) +
            " right) must be less than the frame width " + std::to_string(size.width));
    }
    if (m.top + m.bottom >= size.height) {
        return Result::fail(ErrorCode::DIMENSION_MISMATCH,
            "trim rows (" + std::to_string(m.top) + " top + " + std::to_string(m.bottom) +
            " bottom) must be less than the frame height " + std::to_string(size.height));
    }
    return Result::ok();
}

Result trim(const Frame& frame, const TrimMargins& margins, Frame& out) {
    Result r = check_margins(frame.size(), margins);
    if (r.failure()) return r;

    const int w = frame.width() - margins.left - margins.right;
    const int h = frame.height() - margins.top - margins.bottom;
    Frame result(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            result.set(x, y, frame.at(x + margins.left, y + margins.top));
        }
    }
    out = std::move(result);
    return Result::ok();
}

Result trim_sequence(const FrameSequence& sequence, const TrimMargins& margins, FrameSequence& out) {
    Result r = check_uniform_size(sequence);
    if (r.failure()) return r;

    FrameSequence result;
    result.reserve(sequence.size());
    for (const IndexedFrame& item : sequence) {
        IndexedFrame trimmed;
        trimmed.index = item.index;
        r = trim(item.frame, margins, trimmed.frame);
        if (r.failure()) {
            return Result::fail(r.error, "frame " + std::to_string(item.index) + ": " + r.message);
        }
        result.push_back(std::move(trimmed));
    }
    out = std::move(result);
    return Result::ok();
}

Result trim_directory(const FrameStore& store, const TrimMargins& margins,
                      TrimTarget target, const std::string& output_dir, TrimReport& report) {
    report = TrimReport{};
    if (target == TrimTarget::Directory) {
        if (output_dir.empty()) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "trim to a directory needs an output directory");
        }
        std::error_code ec;
        if (fs::equivalent(fs::path(output_dir), fs::path(store.directory()), ec)) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                "output directory " + output_dir + " is the source directory; trim in place instead");
        }
    }
    const FrameStore destination(target == TrimTarget::InPlace ? store.directory() : output_dir);

    // Both forms are loaded and validated before anything is written.
    FrameSequence trimmed[2];
    const FrameFormat formats[2] = {FrameFormat::Plain, FrameFormat::Color};
    for (int f = 0; f < 2; ++f) {
        std::vector<int> indices;
        Result r = store.scan(formats[f], indices);
        if (r.failure()) return r;
        if (indices.empty()) continue;

        FrameSequence sequence;
        r = store.load_sequence(formats[f], sequence);
        if (r.failure()) return r;
        r = trim_sequence(sequence, margins, trimmed[f]);
        if (r.failure()) return Result::fail(r.error, store.directory() + ": " + r.message);
    }
    if (trimmed[0].empty() && trimmed[1].empty()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "no frame_*.txt or frame_*.cframe files in " + store.directory());
    }

    Result r = destination.prepare();
    if (r.failure()) return r;

    for (int f = 0; f < 2; ++f) {
        for (const IndexedFrame& item : trimmed[f]) {
            r = destination.write_format(item.index, item.frame, formats[f]);
            if (r.failure()) return r;
            std::error_code ec;
            const auto bytes = fs::file_size(destination.frame_path(item.index, formats[f]), ec);
            if (!ec) report.bytes_written += bytes;
        }
    }

    const FrameSequence& primary = trimmed[0].empty() ? trimmed[1] : trimmed[0];
    report.frame_count = primary.size();
    report.trimmed_size = primary.front().frame.size();
    report.output_dir = destination.directory();
    return Result::ok();
}

Result trim_file(const std::string& path, const TrimMargins& margins,
                 TrimTarget target, const std::string& output_dir, TrimReport& report) {
    report = TrimReport{};
    const fs::path source(path);
    const fs::path parent = source.has_parent_path() ? source.parent_path() : fs::path(".");
    if (target == TrimTarget::Directory) {
        if (output_dir.empty()) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "trim to a directory needs an output directory");
        }
        std::error_code ec;
        if (fs::equivalent(fs::path(output_dir), parent, ec)) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                "output directory " + output_dir + " holds " + path + "; trim in place instead");
        }
    }

    std::string data;
    Result r = FrameStore::read_file(path, data);
    if (r.failure()) return r;

    Frame frame;
    r = decode(data, frame);
    if (r.failure()) return Result::fail(r.error, path + ": " + r.message);

    Frame trimmed;
    r = trim(frame, margins, trimmed);
    if (r.failure()) return Result::fail(r.error, path + ": " + r.message);

    const fs::path dest_dir = target == TrimTarget::InPlace ? parent : fs::path(output_dir);
    const FrameStore destination(dest_dir.string());
    r = destination.prepare();
    if (r.failure()) return r;

    const std::string out = is_color_form(data) ? encode_color(trimmed) : encode_plain(trimmed);
    const std::string dest = (dest_dir / source.filename()).string();
    r = FrameStore::write_file(dest, out);
    if (r.failure()) return r;

    report.frame_count = 1;
    report.trimmed_size = trimmed.size();
    report.bytes_written = out.size();
    report.output_dir = destination.directory();
    return Result::ok();
}

}
