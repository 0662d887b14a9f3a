/**
 * @file outcome_recorder.cpp
 * @brief OutcomeRecorder implementation.
 */

#include "telemetry/outcome_recorder.hpp"

#include <sstream>

namespace railway {

OutcomeRecorder::OutcomeRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void OutcomeRecorder::record(std::string_view operation, Outcome outcome,
                             const Error* error) noexcept {
    if (outcome == Outcome::Success) {
        ++successes_;
    } else {
        ++failures_;
    }

    try {
        std::ostringstream oss;
        oss << R"({"event":"result")"
            << R"(,"op":")" << json_escape(operation) << "\""
            << R"(,"outcome":")" << to_string(outcome) << "\"";
        if (error != nullptr) {
            oss << R"(,"kind":")" << to_string(error->kind()) << "\""
                << R"(,"code":")" << json_escape(error->code()) << "\""
                << R"(,"msg":")" << json_escape(error->message()) << "\"";
            if (auto instance = error->instance()) {
                oss << R"(,"instance":")" << json_escape(*instance) << "\"";
            }
        }
        oss << "}";
        emit(oss.str());
    } catch (...) {
        ++dropped_;
    }
}

void OutcomeRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void OutcomeRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace railway
