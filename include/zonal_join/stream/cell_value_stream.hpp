#pragma once

#include "zonal_join/core/types.hpp"
#include "zonal_join/io/raster_reader.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace zonal_join::stream {

// Single-pass source of (feature, value) samples
class SampleStream {
public:
    virtual ~SampleStream() = default;

    // False once the stream is exhausted or was cancelled
    virtual bool next(ValueSample& out) = 0;

    virtual bool cancelled() const = 0;
    virtual std::int64_t emitted() const = 0;
};

// Values of one raster under a set of pixel ranges. Each raster row is read
// once, spanning all ranges on that row; nodata and NaN cells are skipped.
// The reader is released as soon as the stream ends, is cancelled, or a read
// throws.
class CellValueStream : public SampleStream {
public:
    CellValueStream(std::unique_ptr<io::RasterReader> reader,
                    std::vector<PixelRange> ranges,
                    CancelCheck should_stop = nullptr,
                    int check_every_rows = 1);

    CellValueStream(const CellValueStream&) = delete;
    CellValueStream& operator=(const CellValueStream&) = delete;

    bool next(ValueSample& out) override;
    bool cancelled() const override { return cancelled_; }
    std::int64_t emitted() const override { return emitted_; }

    bool holds_reader() const { return reader_ != nullptr; }

private:
    bool load_next_row();
    void finish();

    std::unique_ptr<io::RasterReader> reader_;
    RasterGrid grid_;
    std::vector<PixelRange> ranges_;
    CancelCheck should_stop_;
    int check_every_rows_ = 1;

    size_t group_end_ = 0;
    size_t range_idx_ = 0;
    int col_ = 0;
    int buffer_col0_ = 0;
    std::vector<float> buffer_;
    int rows_loaded_ = 0;

    bool cancelled_ = false;
    bool done_ = false;
    std::int64_t emitted_ = 0;
};

using StreamFactory = std::function<std::unique_ptr<SampleStream>()>;

// Flattens a sequence of streams. Part k + 1 is only created once part k has
// been drained and destroyed, so at most one part is alive at a time.
class ChainedSampleStream : public SampleStream {
public:
    using PartDone = std::function<void(size_t part, std::int64_t emitted, bool cancelled)>;

    explicit ChainedSampleStream(std::vector<StreamFactory> parts,
                                 CancelCheck should_stop = nullptr,
                                 PartDone on_part_done = nullptr);

    bool next(ValueSample& out) override;
    bool cancelled() const override { return cancelled_; }
    std::int64_t emitted() const override { return emitted_; }

private:
    std::vector<StreamFactory> parts_;
    CancelCheck should_stop_;
    PartDone on_part_done_;

    size_t next_part_ = 0;
    std::unique_ptr<SampleStream> current_;
    bool cancelled_ = false;
    std::int64_t emitted_ = 0;
};

} // namespace zonal_join::stream
