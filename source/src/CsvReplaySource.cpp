/**
 * @file CsvReplaySource.cpp
 * @brief Implementation of the CSV file replay acquisition source.
 * @author MasterLaplace
 */

#include "biosig/source/CsvReplaySource.hpp"

#include "biosig/core/Log.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <format>
#include <fstream>
#include <optional>
#include <string_view>
#include <sstream>

namespace biosig::source {

namespace {

std::string_view trim(std::string_view cell)
{
    while (!cell.empty() && (cell.front() == ' ' || cell.front() == '\t'))
        cell.remove_prefix(1);
    while (!cell.empty() && (cell.back() == ' ' || cell.back() == '\t' || cell.back() == '\r'))
        cell.remove_suffix(1);
    return cell;
}

std::optional<double> parseCell(std::string_view cell)
{
    cell = trim(cell);
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
    if (ec != std::errc{} || ptr != cell.data() + cell.size() || cell.empty())
        return std::nullopt;
    return value;
}

std::vector<std::string> splitCells(const std::string &line)
{
    std::vector<std::string> cells;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ','))
        cells.push_back(token);
    return cells;
}

} // anonymous namespace

CsvReplaySource::CsvReplaySource(CsvReplayConfig config)
    : _config(std::move(config))
{
}

core::ExpectedVoid CsvReplaySource::start()
{
    if (_running) {
        return std::unexpected(
            core::Error::make(core::ErrorCode::kAlreadyRunning, "CsvReplaySource already running"));
    }
    if (!(_config.sampleRate > 0.0)) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kInvalidConfiguration,
            std::format("CsvReplaySource: sampling rate must be > 0, got {}", _config.sampleRate)));
    }

    if (!_loaded) {
        auto loadResult = loadCsv();
        if (!loadResult)
            return std::unexpected(loadResult.error());
        _loaded = true;
    }

    _cursor = 0;
    _emitted = 0;
    _startPosix = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    _running = true;
    return {};
}

core::Expected<dsp::SampleFrame> CsvReplaySource::read(std::size_t maxSamples)
{
    if (!_running) {
        return std::unexpected(
            core::Error::make(core::ErrorCode::kNotInitialized, "CsvReplaySource not started"));
    }

    if (_cursor >= totalSamples() && _config.loop)
        _cursor = 0;

    const std::size_t count = std::min(maxSamples, totalSamples() - _cursor);

    dsp::SampleFrame frame;
    frame.sampleRate = _config.sampleRate;
    frame.samples = _data.middleCols(static_cast<Eigen::Index>(_cursor), static_cast<Eigen::Index>(count));
    frame.timestamps.resize(count);
    for (std::size_t i = 0; i < count; ++i)
        frame.timestamps[i] = _startPosix + static_cast<double>(_emitted + i) / _config.sampleRate;

    _cursor += count;
    _emitted += count;
    return frame;
}

void CsvReplaySource::stop() noexcept
{
    _running = false;
    _cursor = 0;
}

SourceInfo CsvReplaySource::info() const
{
    return SourceInfo{
        .name = std::format("CSV Replay ({})", _config.filePath.string()),
        .channelLabels = _labels,
        .sampleRate = _config.sampleRate
    };
}

core::ExpectedVoid CsvReplaySource::loadCsv()
{
    std::ifstream file(_config.filePath);
    if (!file.is_open()) {
        return std::unexpected(
            core::Error::make(core::ErrorCode::kFileNotFound, _config.filePath.string()));
    }

    std::vector<std::vector<double>> rows;
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(file, line)) {
        ++lineNumber;
        if (line.empty() || line[0] == '#' || line[0] == '%' || line == "\r")
            continue;

        const auto cells = splitCells(line);
        std::vector<double> row;
        row.reserve(cells.size());
        bool numeric = true;
        for (const auto &cell : cells) {
            const auto value = parseCell(cell);
            if (!value) {
                numeric = false;
                break;
            }
            row.push_back(*value);
        }

        if (!numeric) {
            if (rows.empty() && _labels.empty()) {
                for (const auto &cell : cells)
                    _labels.emplace_back(trim(cell));
                continue;
            }
            return std::unexpected(core::Error::make(
                core::ErrorCode::kFileParseError,
                std::format("{}:{}: invalid numeric value", _config.filePath.string(), lineNumber)));
        }

        if (!rows.empty() && row.size() != rows.front().size()) {
            return std::unexpected(core::Error::make(
                core::ErrorCode::kFileParseError,
                std::format("{}:{}: expected {} columns, got {}",
                    _config.filePath.string(), lineNumber, rows.front().size(), row.size())));
        }
        rows.push_back(std::move(row));
    }

    if (rows.empty()) {
        return std::unexpected(core::Error::make(
            core::ErrorCode::kEmptyInput, std::format("CSV file is empty: {}", _config.filePath.string())));
    }

    const auto channels = rows.front().size();
    _data.resize(static_cast<Eigen::Index>(channels), static_cast<Eigen::Index>(rows.size()));
    for (std::size_t t = 0; t < rows.size(); ++t) {
        for (std::size_t ch = 0; ch < channels; ++ch)
            _data(static_cast<Eigen::Index>(ch), static_cast<Eigen::Index>(t)) = rows[t][ch];
    }

    if (_labels.size() != channels) {
        _labels.clear();
        for (std::size_t ch = 0; ch < channels; ++ch)
            _labels.push_back(std::format("ch{}", ch));
    }

    core::Log::info("source", std::format("loaded {} samples x {} channels from {}",
        rows.size(), channels, _config.filePath.string()));
    return {};
}

} // namespace biosig::source
