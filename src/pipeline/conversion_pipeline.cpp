#include "pipeline/conversion_pipeline.hpp"
#include "pipeline/image_io.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <thread>

namespace cascii {

size_t PipelineReport::converted() const {
    size_t n = 0;
    for (const FrameSlot& s : slots) {
        if (s.status.success()) ++n;
    }
    return n;
}

size_t PipelineReport::failed() const {
    return slots.size() - converted();
}

std::vector<const FrameSlot*> PipelineReport::failures() const {
    std::vector<const FrameSlot*> out;
    for (const FrameSlot& s : slots) {
        if (s.status.failure()) out.push_back(&s);
    }
    return out;
}

ConversionPipeline::ConversionPipeline(const Config& config) : config_(config) {}

int ConversionPipeline::worker_count(size_t jobs) const {
    int workers = config_.workers;
    if (workers <= 0) {
        workers = static_cast<int>(std::thread::hardware_concurrency());
        if (workers <= 0) workers = 4;
    }
    if (jobs < static_cast<size_t>(workers)) {
        workers = static_cast<int>(jobs);
    }
    return std::max(1, workers);
}

Result ConversionPipeline::convert_one(const SourceFrame& source, const ConversionOptions& options, Frame& out) {
    FrameBuffer decoded;
    const FrameBuffer* pixels = &source.pixels;
    if (source.pixels.empty()) {
        if (source.path.empty()) {
            return Result::fail(ErrorCode::DECODE_ERROR, "frame has neither pixels nor a source path");
        }
        Result r = load_image(source.path, decoded);
        if (r.failure()) return r;
        pixels = &decoded;
    }

    const Size grid = target_grid_size(pixels->width(), pixels->height(), options);
    FrameBuffer sampled;
    Result r = resample(*pixels, grid, sampled);
    if (r.failure()) return r;

    out = map_image(sampled, options);
    return Result::ok();
}

PipelineReport ConversionPipeline::run(const std::vector<SourceFrame>& sources,
                                       const ConversionOptions& options,
                                       const FrameStore* store,
                                       std::optional<Size> expected_grid,
                                       const ProgressCallback& progress) const {
    PipelineReport report;
    report.slots.resize(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        report.slots[i].index = sources[i].index;
    }
    if (sources.empty()) {
        report.status = Result::ok();
        return report;
    }

    Result valid = options.validate();
    if (valid.failure()) {
        for (FrameSlot& slot : report.slots) slot.status = valid;
        report.status = valid;
        return report;
    }

    std::vector<std::promise<void>> done(sources.size());
    std::vector<std::future<void>> ready;
    ready.reserve(sources.size());
    for (auto& p : done) ready.push_back(p.get_future());

    std::mutex queue_mutex;
    size_t next = 0;
    std::atomic<bool> cancelled{false};

    auto process = [&](size_t pos) {
        FrameSlot& slot = report.slots[pos];
        const SourceFrame& source = sources[pos];
        Frame frame;
        Result r = convert_one(source, options, frame);
        if (r.success() && expected_grid && frame.size() != *expected_grid) {
            r = Result::fail(ErrorCode::DIMENSION_MISMATCH,
                "grid is " + std::to_string(frame.width()) + "x" + std::to_string(frame.height()) +
                ", expected " + std::to_string(expected_grid->width) + "x" + std::to_string(expected_grid->height));
        }
        if (r.success() && store) {
            r = store->write(source.index, frame, config_.text_companion);
        }
        if (r.failure()) {
            std::string where = "frame " + std::to_string(source.index);
            if (!source.path.empty()) where += " (" + source.path + ")";
            r.message = where + ": " + r.message;
        } else if (config_.keep_frames) {
            slot.frame = std::move(frame);
        }
        slot.status = r;
        return r.success();
    };

    auto worker = [&]() {
        while (true) {
            size_t pos;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (next >= sources.size()) return;
                pos = next++;
            }

            if (cancelled.load(std::memory_order_acquire)) {
                report.slots[pos].status = Result::fail(ErrorCode::CANCELLED,
                    "frame " + std::to_string(sources[pos].index) + ": cancelled after an earlier failure");
                done[pos].set_value();
                continue;
            }

            bool ok = false;
            try {
                ok = process(pos);
            } catch (const std::exception& e) {
                report.slots[pos].status = Result::fail(ErrorCode::PROCESSING_ERROR,
                    "frame " + std::to_string(sources[pos].index) + ": " + e.what());
            }
            if (!ok && config_.strict) {
                cancelled.store(true, std::memory_order_release);
            }
            done[pos].set_value();
        }
    };

    const int workers = worker_count(sources.size());
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }

    for (size_t i = 0; i < ready.size(); ++i) {
        ready[i].wait();
        if (progress) progress(i + 1, sources.size());
    }

    for (auto& t : threads) t.join();

    report.status = Result::ok();
    for (const FrameSlot& slot : report.slots) {
        if (slot.status.failure() && slot.status.error != ErrorCode::CANCELLED) {
            if (config_.strict) {
                report.status = slot.status;
            } else {
                report.status = Result::fail(slot.status.error,
                    std::to_string(report.failed()) + " of " + std::to_string(report.slots.size()) +
                    " frames failed; first: " + slot.status.message);
            }
            break;
        }
    }
    return report;
}

}
