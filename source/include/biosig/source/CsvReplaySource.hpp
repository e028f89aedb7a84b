/**
 * @file CsvReplaySource.hpp
 * @brief Plays back a recorded session stored as CSV.
 * @author MasterLaplace
 *
 * One row per sample, one column per channel. An optional first line of
 * non-numeric cells names the channels; lines starting with '#' or '%'
 * are comments. Timestamps are regenerated from the POSIX time of start()
 * and the configured sampling rate.
 */

#pragma once

#include "biosig/source/ISource.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace biosig::source {

struct CsvReplayConfig {
    std::filesystem::path filePath;
    double sampleRate = 1000.0;
    bool loop = false;
};

class CsvReplaySource final : public ISource {
public:
    explicit CsvReplaySource(CsvReplayConfig config);

    [[nodiscard]] core::ExpectedVoid start() override;
    [[nodiscard]] core::Expected<dsp::SampleFrame> read(std::size_t maxSamples) override;
    void stop() noexcept override;
    [[nodiscard]] SourceInfo info() const override;

    [[nodiscard]] std::size_t totalSamples() const noexcept { return static_cast<std::size_t>(_data.cols()); }
    [[nodiscard]] std::size_t cursor() const noexcept { return _cursor; }

private:
    [[nodiscard]] core::ExpectedVoid loadCsv();

    CsvReplayConfig _config;
    dsp::SampleMatrix _data;
    std::vector<std::string> _labels;
    bool _loaded = false;
    bool _running = false;
    std::size_t _cursor = 0;
    std::uint64_t _emitted = 0;
    double _startPosix = 0.0;
};

} // namespace biosig::source
