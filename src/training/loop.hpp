#ifndef SYNAPSE_TRAINING_LOOP_HPP
#define SYNAPSE_TRAINING_LOOP_HPP

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "metrics_log.hpp"
#include "../core.hpp"
#include "../loss/loss.hpp"
#include "../metric/metric.hpp"
#include "../utils/terminal.hpp"

namespace Synapse::Training {
    enum class Task {
        Reconstruction,
        Classification
    };

    struct TrainOptions {
        std::size_t max_epochs{20};
        std::size_t log_every{5};
        Task task{Task::Reconstruction};
        std::ostream* stream{&std::cout};
        bool color{true};
        bool use_gpu{false};
    };

    namespace Details {
        struct PhaseTotals {
            double loss{0.0};
            double accuracy{0.0};
            std::size_t batches{0};

            [[nodiscard]] double mean_loss() const { return loss / static_cast<double>(batches); }
            [[nodiscard]] double mean_accuracy() const { return accuracy / static_cast<double>(batches); }
        };

        inline void validate(const TrainOptions& options)
        {
            if (options.log_every == 0) {
                throw InvalidConfiguration("log_every must be at least 1.");
            }
        }

        // One pass over a range. Parameters are updated only when an optimizer is given; the caller
        // decides the module mode and the grad guard.
        template <class Range>
        PhaseTotals run_phase(Core::Network& model,
                              torch::optim::Optimizer* optimizer,
                              const Loss::Descriptor& loss,
                              Range& range,
                              const TrainOptions& options,
                              const torch::Device& device)
        {
            PhaseTotals totals{};
            for (auto&& batch : range) {
                auto inputs = batch.inputs.to(device);
                auto targets = batch.targets.to(device);

                auto prediction = model.predict(inputs);
                auto value = Loss::Compute(loss, prediction.output, targets);

                if (optimizer != nullptr) {
                    value.backward();
                    optimizer->step();
                    optimizer->zero_grad();
                }

                totals.loss += value.detach().item<double>();
                if (options.task == Task::Classification) {
                    totals.accuracy += Metric::Classification::Accuracy(prediction.output, targets);
                }
                ++totals.batches;
            }
            return totals;
        }

        inline void log_epoch(std::ostream& stream,
                              std::size_t epoch_index,
                              std::size_t total_epochs,
                              const PhaseTotals& train,
                              const PhaseTotals& validation,
                              bool with_accuracy,
                              bool color,
                              double duration_seconds)
        {
            using Utils::Terminal::Paint;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightMagenta;
            using Utils::Terminal::Colors::kBrightYellow;

            std::ostringstream line;
            line << std::fixed << std::setprecision(6);
            line << "Epoch [" << epoch_index << "/" << total_epochs << "] | ";
            line << Paint("Train", kBrightYellow, color) << " loss: " << train.mean_loss() << " | ";
            line << Paint("Validation", kBrightBlue, color) << " loss: " << validation.mean_loss();
            if (with_accuracy) {
                line << std::setprecision(4);
                line << " | " << Paint("Train", kBrightYellow, color) << " acc: " << train.mean_accuracy();
                line << " | " << Paint("Validation", kBrightMagenta, color) << " acc: " << validation.mean_accuracy();
            }

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << duration_seconds << "sec";
            line << " | " << Paint("duration: " + duration_stream.str(), kBrightBlack, color);

            stream << line.str() << '\n';
        }
    }

    // Trains for options.max_epochs epochs, evaluating after each one, and appends that epoch's
    // means to `log`. Calling again with the same model, optimizer and log continues from the
    // current parameters and keeps appending.
    template <class TrainRange, class EvalRange>
    MetricsLog& Run(Core::Network& model,
                    torch::optim::Optimizer& optimizer,
                    const Loss::Descriptor& loss,
                    TrainRange& train_range,
                    EvalRange& eval_range,
                    const TrainOptions& options,
                    MetricsLog& log)
    {
        if (options.max_epochs == 0) {
            return log;
        }
        Details::validate(options);

        const auto device = Core::DevicePolicy::select(options.use_gpu);
        model.to(device);
        optimizer.zero_grad();
        const bool classification = options.task == Task::Classification;

        for (std::size_t epoch = 0; epoch < options.max_epochs; ++epoch) {
            const auto start = std::chrono::steady_clock::now();

            model.train();
            const auto train = Details::run_phase(model, &optimizer, loss, train_range, options, device);
            if (train.batches == 0) {
                throw EmptyIterator("Training range yielded no batches in epoch " + std::to_string(epoch + 1) + '.');
            }

            model.eval();
            Details::PhaseTotals validation{};
            {
                torch::NoGradGuard no_grad;
                validation = Details::run_phase(model, nullptr, loss, eval_range, options, device);
            }
            if (validation.batches == 0) {
                throw EmptyIterator("Evaluation range yielded no batches in epoch " + std::to_string(epoch + 1) + '.');
            }

            std::vector<MetricsLog::Entry> entries{
                {"train_loss", train.mean_loss()},
                {"validation_loss", validation.mean_loss()}};
            if (classification) {
                entries.emplace_back("train_acc", train.mean_accuracy());
                entries.emplace_back("validation_acc", validation.mean_accuracy());
            }
            log.append_epoch(entries);

            const bool should_log = (epoch + 1) % options.log_every == 0 || epoch + 1 == options.max_epochs;
            if (options.stream != nullptr && should_log) {
                const auto duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
                Details::log_epoch(*options.stream, epoch + 1, options.max_epochs, train, validation,
                                   classification, options.color, duration);
            }
        }

        return log;
    }
}

#endif // SYNAPSE_TRAINING_LOOP_HPP
