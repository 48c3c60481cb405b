/**
 * \file pipeline/WorkerState.hpp
 * \brief Lifecycle shared by the transmit and receive workers.
 * \ingroup pipeline_module
 */
#pragma once

namespace takclient::pipeline {

/** \brief Idle until `run()` starts, Running until the loop exits, then Stopped for good. */
enum class WorkerState { Idle, Running, Stopped };

inline const char* to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Idle:    return "idle";
        case WorkerState::Running: return "running";
        case WorkerState::Stopped: return "stopped";
    }
    return "unknown";
}

} // namespace takclient::pipeline
