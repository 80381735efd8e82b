#include "codec/frame_store.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace cascii {

namespace fs = std::filesystem;

namespace {

constexpr const char* FRAME_PREFIX = "frame_";
constexpr const char* IMAGE_EXTENSION = ".png";

}

FrameStore::FrameStore(std::string directory) : directory_(std::move(directory)) {}

std::string FrameStore::frame_name(int index, const char* extension) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "frame_%04d", index);
    return std::string(buf) + extension;
}

bool FrameStore::parse_frame_name(const std::string& filename, const char* extension, int& index) {
    const std::string prefix = FRAME_PREFIX;
    const std::string ext = extension;
    if (filename.size() <= prefix.size() + ext.size()) return false;
    if (!filename.starts_with(prefix) || !filename.ends_with(ext)) return false;

    const std::string digits = filename.substr(prefix.size(), filename.size() - prefix.size() - ext.size());
    if (digits.empty() || digits.size() > 9) return false;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    // Only the exact frame_name spelling counts, so no two files share an index.
    const int parsed = std::stoi(digits);
    if (frame_name(parsed, extension) != filename) return false;
    index = parsed;
    return true;
}

std::string FrameStore::frame_path(int index, FrameFormat format) const {
    return (fs::path(directory_) / frame_name(index, extension_for(format))).string();
}

std::string FrameStore::image_path(int index) const {
    return (fs::path(directory_) / frame_name(index, IMAGE_EXTENSION)).string();
}

Result FrameStore::prepare() const {
    std::error_code ec;
    fs::create_directories(fs::path(directory_), ec);
    if (ec) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot create directory " + directory_ + ": " + ec.message());
    }
    return Result::ok();
}

bool FrameStore::has_color_frames() const {
    std::vector<int> indices;
    return scan_extension(COLOR_EXTENSION, indices).success() && !indices.empty();
}

FrameFormat FrameStore::preferred_format() const {
    return has_color_frames() ? FrameFormat::Color : FrameFormat::Plain;
}

Result FrameStore::read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open " + path);
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result::fail(ErrorCode::IO_ERROR, "failed to read " + path);
    }
    return Result::ok();
}

Result FrameStore::write_file(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot open " + path + " for writing");
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return Result::fail(ErrorCode::IO_ERROR, "failed to write " + path);
    }
    return Result::ok();
}

Result FrameStore::write_format(int index, const Frame& frame, FrameFormat format) const {
    const std::string data = format == FrameFormat::Color ? encode_color(frame) : encode_plain(frame);
    return write_file(frame_path(index, format), data);
}

Result FrameStore::write(int index, const Frame& frame, bool text_companion) const {
    const FrameFormat format = cascii::preferred_format(frame);
    Result r = write_format(index, frame, format);
    if (r.failure()) return r;
    if (format == FrameFormat::Color && text_companion) {
        return write_format(index, frame, FrameFormat::Plain);
    }
    return Result::ok();
}

Result FrameStore::read(int index, FrameFormat format, Frame& out) const {
    const std::string path = frame_path(index, format);
    std::string data;
    Result r = read_file(path, data);
    if (r.failure()) return r;

    r = format == FrameFormat::Color ? decode_color(data, out) : decode_plain(data, out);
    if (r.failure()) {
        return Result::fail(r.error, path + ": " + r.message);
    }
    return Result::ok();
}

Result FrameStore::scan_extension(const char* extension, std::vector<int>& indices) const {
    indices.clear();
    std::error_code ec;
    fs::directory_iterator it(fs::path(directory_), ec);
    if (ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot read directory " + directory_ + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        int index = 0;
        if (parse_frame_name(entry.path().filename().string(), extension, index)) {
            indices.push_back(index);
        }
    }
    std::sort(indices.begin(), indices.end());
    return Result::ok();
}

Result FrameStore::scan(FrameFormat format, std::vector<int>& indices) const {
    return scan_extension(extension_for(format), indices);
}

Result FrameStore::scan_images(std::vector<int>& indices) const {
    return scan_extension(IMAGE_EXTENSION, indices);
}

Result FrameStore::load_sequence(FrameSequence& out) const {
    return load_sequence(preferred_format(), out);
}

Result FrameStore::load_sequence(FrameFormat format, FrameSequence& out) const {
    std::vector<int> indices;
    Result r = scan(format, indices);
    if (r.failure()) return r;
    if (indices.empty()) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND,
            std::string("no frame_*") + extension_for(format) + " files in " + directory_);
    }
    r = check_contiguous(indices, directory_);
    if (r.failure()) return r;

    FrameSequence sequence;
    sequence.reserve(indices.size());
    for (int index : indices) {
        IndexedFrame item;
        item.index = index;
        r = read(index, format, item.frame);
        if (r.failure()) return r;
        sequence.push_back(std::move(item));
    }

    r = check_uniform_size(sequence);
    if (r.failure()) {
        return Result::fail(r.error, directory_ + ": " + r.message);
    }
    out = std::move(sequence);
    return Result::ok();
}

Result FrameStore::write_sequence(const FrameSequence& sequence, bool text_companion) const {
    Result r = prepare();
    if (r.failure()) return r;
    for (const IndexedFrame& item : sequence) {
        r = write(item.index, item.frame, text_companion);
        if (r.failure()) return r;
    }
    return Result::ok();
}

Result FrameStore::remove_extension(const char* extension) const {
    std::vector<int> indices;
    Result r = scan_extension(extension, indices);
    if (r.failure()) return r;
    for (int index : indices) {
        std::error_code ec;
        fs::remove(fs::path(directory_) / frame_name(index, extension), ec);
        if (ec) {
            return Result::fail(ErrorCode::IO_ERROR,
                "cannot remove " + frame_name(index, extension) + ": " + ec.message());
        }
    }
    return Result::ok();
}

Result FrameStore::clear_frames() const {
    Result r = remove_extension(PLAIN_EXTENSION);
    if (r.failure()) return r;
    return remove_extension(COLOR_EXTENSION);
}

Result FrameStore::clear() const {
    Result r = clear_frames();
    if (r.failure()) return r;
    return remove_extension(IMAGE_EXTENSION);
}

Result FrameStore::remove_images(const std::vector<int>& indices) const {
    for (int index : indices) {
        std::error_code ec;
        fs::remove(fs::path(image_path(index)), ec);
        if (ec) {
            return Result::fail(ErrorCode::IO_ERROR, "cannot remove " + image_path(index) + ": " + ec.message());
        }
    }
    return Result::ok();
}

Result check_contiguous(const std::vector<int>& indices, const std::string& where) {
    for (size_t i = 1; i < indices.size(); ++i) {
        if (indices[i] != indices[i - 1] + 1) {
            return Result::fail(ErrorCode::INDEX_GAP,
                where + ": frame index " + std::to_string(indices[i - 1] + 1) +
                " missing (found " + std::to_string(indices[i - 1]) + " then " +
                std::to_string(indices[i]) + ")");
        }
    }
    return Result::ok();
}

}
