#include "zonal_join/stream/cell_value_stream.hpp"
#include "zonal_join/core/errors.hpp"

#include <algorithm>
#include <limits>

namespace zonal_join::stream {

CellValueStream::CellValueStream(std::unique_ptr<io::RasterReader> reader,
                                 std::vector<PixelRange> ranges,
                                 CancelCheck should_stop,
                                 int check_every_rows)
    : reader_(std::move(reader)),
      ranges_(std::move(ranges)),
      should_stop_(std::move(should_stop)),
      check_every_rows_(std::max(1, check_every_rows)) {
    if (!reader_) {
        throw IOError("CellValueStream requires an open raster reader");
    }
    grid_ = reader_->grid();

    std::stable_sort(ranges_.begin(), ranges_.end(),
                     [](const PixelRange& a, const PixelRange& b) {
                         if (a.row != b.row) return a.row < b.row;
                         return a.col_start < b.col_start;
                     });
    range_idx_ = group_end_ = 0;
    if (ranges_.empty()) {
        finish();
    }
}

void CellValueStream::finish() {
    done_ = true;
    if (reader_) {
        reader_->close();
        reader_.reset();
    }
}

bool CellValueStream::load_next_row() {
    if (group_end_ >= ranges_.size()) return false;

    if (should_stop_ && rows_loaded_ % check_every_rows_ == 0 && should_stop_()) {
        cancelled_ = true;
        return false;
    }

    const size_t group_begin = group_end_;
    const int row = ranges_[group_begin].row;
    int lo = std::numeric_limits<int>::max();
    int hi = std::numeric_limits<int>::min();
    while (group_end_ < ranges_.size() && ranges_[group_end_].row == row) {
        lo = std::min(lo, ranges_[group_end_].col_start);
        hi = std::max(hi, ranges_[group_end_].col_end);
        ++group_end_;
    }

    buffer_.resize(static_cast<size_t>(hi - lo));
    reader_->read_row(row, lo, hi, buffer_.data());
    buffer_col0_ = lo;

    range_idx_ = group_begin;
    col_ = ranges_[group_begin].col_start;
    ++rows_loaded_;
    return true;
}

bool CellValueStream::next(ValueSample& out) {
    if (done_) return false;

    try {
        while (true) {
            if (range_idx_ < group_end_) {
                const PixelRange& r = ranges_[range_idx_];
                while (col_ < r.col_end) {
                    const float v = buffer_[static_cast<size_t>(col_ - buffer_col0_)];
                    ++col_;
                    if (!grid_.is_nodata(v)) {
                        out = {r.feature, v};
                        ++emitted_;
                        return true;
                    }
                }
                ++range_idx_;
                if (range_idx_ < group_end_) {
                    col_ = ranges_[range_idx_].col_start;
                }
                continue;
            }

            if (!load_next_row()) {
                finish();
                return false;
            }
        }
    } catch (...) {
        finish();
        throw;
    }
}

ChainedSampleStream::ChainedSampleStream(std::vector<StreamFactory> parts,
                                         CancelCheck should_stop,
                                         PartDone on_part_done)
    : parts_(std::move(parts)),
      should_stop_(std::move(should_stop)),
      on_part_done_(std::move(on_part_done)) {}

bool ChainedSampleStream::next(ValueSample& out) {
    while (true) {
        if (current_) {
            if (current_->next(out)) {
                ++emitted_;
                return true;
            }
            const bool part_cancelled = current_->cancelled();
            const std::int64_t part_emitted = current_->emitted();
            current_.reset();
            if (on_part_done_) {
                on_part_done_(next_part_ - 1, part_emitted, part_cancelled);
            }
            if (part_cancelled) {
                cancelled_ = true;
                return false;
            }
        }

        if (cancelled_ || next_part_ >= parts_.size()) return false;

        if (should_stop_ && should_stop_()) {
            cancelled_ = true;
            return false;
        }
        current_ = parts_[next_part_++]();
    }
}

} // namespace zonal_join::stream
