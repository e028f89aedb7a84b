/**
 * @file Pipeline.hpp
 * @brief Fluent Builder for composing sequential preprocessing operators.
 * @author MasterLaplace
 *
 * The Pipeline chains IOperator instances sequentially: each operator
 * receives the output frame of the previous one, including the sampling
 * rate a Resample may have changed. Processing short-circuits on the first
 * error, propagating the std::unexpected through the chain.
 *
 * @code
 *   auto pipeline = Pipeline::builder()
 *       .add<NotchFilter>(50.0, 30.0)
 *       .add<BandpassFilter>(1.0, 100.0, 4)
 *       .add<ArtifactDetector>()
 *       .build(1000.0);
 *
 *   if (pipeline) {
 *       auto result = pipeline->run(std::move(frame));
 *   }
 * @endcode
 *
 * @see IOperator
 */

#pragma once

#include "biosig/dsp/IOperator.hpp"

#include <concepts>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace biosig::dsp {

class Pipeline;

/**
 * @brief One operator application recorded by Pipeline::run().
 */
struct HistoryEntry {
    std::string operatorName;
    Json::Value config;
    Annotation annotation;
};

/**
 * @brief Result of a pipeline run: the final frame plus every operator's
 *        annotation keyed by operator name.
 *
 * When two operators share a name the later annotation wins.
 */
struct PipelineOutput {
    SampleFrame frame;
    std::map<std::string, Annotation> annotations;
};

/**
 * @brief Fluent builder that accumulates IOperator instances for a Pipeline.
 */
class PipelineBuilder {
public:
    /**
     * @brief Constructs and appends an operator of type T.
     *
     * @tparam T    A concrete class derived from IOperator
     * @tparam Args Constructor argument types for T
     * @param args  Arguments forwarded to T's constructor
     * @return Reference to this builder (for chaining)
     */
    template <typename T, typename... Args>
        requires std::derived_from<T, IOperator>
    PipelineBuilder &add(Args &&...args)
    {
        _operators.push_back(std::make_unique<T>(std::forward<Args>(args)...));
        return *this;
    }

    /**
     * @brief Appends an already constructed operator (e.g. from JSON).
     */
    PipelineBuilder &add(std::unique_ptr<IOperator> op);

    /**
     * @brief Validates every operator against the sampling rate flowing
     *        into it and returns the Pipeline.
     *
     * @param inputRate Sampling rate of the frames fed to run()
     * @return The Pipeline, or the first kInvalidConfiguration found
     */
    [[nodiscard]] core::Expected<Pipeline> build(double inputRate);

private:
    std::vector<std::unique_ptr<IOperator>> _operators;
};

/**
 * @brief An ordered, immutable chain of operators with a run history.
 *
 * Operators never change after build(). The history is the only state
 * run() mutates, so a Pipeline must not be run from two threads at once.
 */
class Pipeline {
public:
    /**
     * @brief Returns a PipelineBuilder for fluent operator composition.
     */
    [[nodiscard]] static PipelineBuilder builder();

    /**
     * @brief Runs the frame through every operator in order.
     *
     * Appends one HistoryEntry per operator. An empty pipeline returns the
     * frame as is and records nothing.
     *
     * @param frame Input samples; frame.sampleRate must equal inputRate()
     * @return The processed frame and annotations, or the first Error
     */
    [[nodiscard]] core::Expected<PipelineOutput> run(SampleFrame frame);

    /**
     * @brief Same processing as run() without touching the history.
     *
     * Used to check a window shape against the chain before streaming.
     */
    [[nodiscard]] core::Expected<PipelineOutput> dryRun(SampleFrame frame) const;

    /**
     * @brief Ordered configuration: {"version": 1, "operators": [...]}.
     */
    [[nodiscard]] Json::Value toJson() const;

    /**
     * @brief Rebuilds a pipeline from toJson() output via the OperatorRegistry.
     */
    [[nodiscard]] static core::Expected<Pipeline> fromJson(const Json::Value &config, double inputRate);

    [[nodiscard]] const std::deque<HistoryEntry> &history() const noexcept { return _history; }

    /**
     * @brief Bounds the history to the @p limit most recent entries.
     *
     * Opt-in: a pipeline keeps every entry unless this is called with a
     * non-zero limit. 0 restores the unbounded log.
     */
    void setHistoryLimit(std::size_t limit);

    [[nodiscard]] std::vector<std::string> operatorNames() const;
    [[nodiscard]] std::size_t stageCount() const noexcept { return _operators.size(); }
    [[nodiscard]] bool empty() const noexcept { return _operators.empty(); }
    [[nodiscard]] double inputRate() const noexcept { return _inputRate; }
    [[nodiscard]] double outputRate() const noexcept { return _outputRate; }

    static constexpr int kConfigVersion = 1;

private:
    friend class PipelineBuilder;

    Pipeline(std::vector<std::unique_ptr<IOperator>> operators, double inputRate, double outputRate);

    [[nodiscard]] core::Expected<PipelineOutput> apply(SampleFrame frame, std::vector<HistoryEntry> *entries) const;
    void record(HistoryEntry entry);

    std::vector<std::unique_ptr<IOperator>> _operators;
    double _inputRate;
    double _outputRate;
    std::deque<HistoryEntry> _history;
    std::size_t _historyLimit = 0;
};

} // namespace biosig::dsp
