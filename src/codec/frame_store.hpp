#pragma once

#include "core/types.hpp"
#include "core/frame.hpp"
#include "codec/frame_codec.hpp"
#include <string>
#include <vector>

namespace cascii {

// Directory of per-index frame files: frame_0001.txt, frame_0001.cframe, frame_0001.png.
class FrameStore {
public:
    explicit FrameStore(std::string directory);

    const std::string& directory() const { return directory_; }

    static std::string frame_name(int index, const char* extension);
    static bool parse_frame_name(const std::string& filename, const char* extension, int& index);

    std::string frame_path(int index, FrameFormat format) const;
    std::string image_path(int index) const;

    Result prepare() const;
    bool has_color_frames() const;
    FrameFormat preferred_format() const;

    // Writes the frame in its preferred form; color frames also get a plain
    // .txt companion when text_companion is set.
    Result write(int index, const Frame& frame, bool text_companion) const;
    Result write_format(int index, const Frame& frame, FrameFormat format) const;
    Result read(int index, FrameFormat format, Frame& out) const;

    Result scan(FrameFormat format, std::vector<int>& indices) const;
    Result scan_images(std::vector<int>& indices) const;

    Result load_sequence(FrameSequence& out) const;
    Result load_sequence(FrameFormat format, FrameSequence& out) const;
    Result write_sequence(const FrameSequence& sequence, bool text_companion) const;

    // Removes frame_* text, color and image files.
    Result clear() const;
    // Removes frame_* text and color files only.
    Result clear_frames() const;
    Result remove_images(const std::vector<int>& indices) const;

    static Result read_file(const std::string& path, std::string& out);
    static Result write_file(const std::string& path, const std::string& data);

private:
    Result scan_extension(const char* extension, std::vector<int>& indices) const;
    Result remove_extension(const char* extension) const;

    std::string directory_;
};

Result check_contiguous(const std::vector<int>& indices, const std::string& where);

}
