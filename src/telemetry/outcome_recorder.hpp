/**
 * @file outcome_recorder.hpp
 * @brief IResultObserver that writes one NDJSON event per observed Result.
 */

#pragma once

#include "core/logger.hpp"
#include "core/observer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace railway {

/**
 * @brief Counts outcomes and emits them as structured events.
 *
 * Event layout:
 * {"event":"result","op":..,"outcome":"failure","kind":..,"code":..,"msg":..}
 * with a trailing "instance" when the error carries one. A write that
 * throws anything is counted in dropped() instead of propagating.
 */
class OutcomeRecorder : public IResultObserver {
public:
    explicit OutcomeRecorder(std::unique_ptr<ILogSink> sink);

    void record(std::string_view operation, Outcome outcome, const Error* error) noexcept override;

    void flush();

    [[nodiscard]] uint64_t successes() const noexcept { return successes_.load(); }
    [[nodiscard]] uint64_t failures() const noexcept { return failures_.load(); }
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_.load(); }

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace railway
